#pragma once
#ifndef CONFIGMANAGER_HPP
#define CONFIGMANAGER_HPP

#include <unordered_map>
#include <vector>
#include <string>
#include <fstream>
#include <iostream>
#include <sstream>
#include <filesystem>

/// @brief Configurazione JSON a chiavi piatte. I valori sono memorizzati come stringhe.
class ConfigManager {
private:
    std::unordered_map<std::string, std::string> mConfigValues;
    std::unordered_map<std::string, std::string> mDefaultConfigValues;
    std::vector<std::string> mConfigKeys;
    std::string mDefaultConfigPath;
    bool mCreated;

public:
    /// @brief Carica la configurazione. Se il file non esiste viene creato copiando quello di default.
    /// @param configPath il file di configurazione dell'utente
    /// @param configKeys le chiavi obbligatorie
    /// @param defaultConfigPath il file di configurazione di default
    /// @throws std::runtime_error se la configurazione è assente, non valida o di una versione diversa
    ConfigManager(const std::string& configPath, const std::vector<std::string>& configKeys,
                  const std::string& defaultConfigPath = "libs/default-config.json");

    bool loadConfig(const std::string& configPath, std::unordered_map<std::string, std::string>& storage);
    int checkVersion();

    /// @brief TRUE se il file di configurazione è stato appena creato dal default
    bool wasCreated() const { return mCreated; }

    bool hasKey(const std::string& key) const;
    std::string getString(const std::string& key) const;
    int getInt(const std::string& key) const;
    long long getLong(const std::string& key) const;
    bool getBool(const std::string& key) const;
};

#endif
