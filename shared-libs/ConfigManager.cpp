#include "ConfigManager.hpp"

#include <iomanip>
#include <limits>
#include <utility>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

ConfigManager::ConfigManager(const std::string& configPath, const std::vector<std::string>& configKeys, const std::string& defaultConfigPath)
    : mConfigKeys(configKeys), mDefaultConfigPath(defaultConfigPath), mCreated(false) {
    if (!loadConfig(mDefaultConfigPath, mDefaultConfigValues)) {
        throw std::runtime_error("Installazione corrotta: la configurazione di default al percorso " + mDefaultConfigPath + " non esiste o non è valida.");
    }

    if (!fs::exists(configPath)) {
        fs::copy(mDefaultConfigPath, configPath, fs::copy_options::overwrite_existing);
        std::cout << "> File di configurazione creato. Modifica " << configPath << " se necessario." << std::endl;
        mCreated = true;
    }

    const bool complete = loadConfig(configPath, mConfigValues);

    // la versione si controlla prima delle chiavi: un file vecchio può non averle tutte
    switch (checkVersion()) {
        case 1:
            throw std::runtime_error("Impossibile ottenere i dati sulla versione. Cancella l'attuale configurazione e ri-esegui questo programma per generare quella nuova.");
        case 2:
            throw std::runtime_error("E' disponibile una nuova versione del file di configurazione. Cancella l'attuale configurazione e ri-esegui questo programma per generare quella nuova.");
        case 3:
            throw std::runtime_error("Il tuo file di configurazione è più recente del default. Scarica gli aggiornamenti di questo programma e ri-eseguilo.");
        default: {}
    }

    if (!complete) {
        throw std::runtime_error("File di configurazione " + configPath + " non valido. Eliminalo e riesegui il programma per continuare.");
    }
}

bool ConfigManager::loadConfig(const std::string& configPath, std::unordered_map<std::string, std::string>& storage) {
    std::ifstream input(configPath);
    if (!input) return false;

    const json document = json::parse(input, nullptr, false);
    if (document.is_discarded() || !document.is_object()) return false;

    bool complete = true;
    for (const std::string& key : mConfigKeys) {
        auto it = document.find(key);
        if (it == document.end()) {
            complete = false;
            continue;
        }

        const json& value = *it;
        if (value.is_string()) {
            storage[key] = value.get<std::string>();
        } else if (value.is_boolean()) {
            storage[key] = value.get<bool>() ? "true" : "false";
        } else if (value.is_number_integer()) {
            storage[key] = std::to_string(value.get<long long>());
        } else if (value.is_number_float()) {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(1) << value.get<double>();
            storage[key] = oss.str();
        } else {
            complete = false; // array, oggetto o null
        }
    }

    // le chiavi opzionali possono essere stringhe vuote, ma devono esserci
    return complete;
}

// "major.minor" -> {major, minor}. FALSE se il formato non è valido
static bool parseVersion(const std::string& text, std::pair<long, long>& version) {
    std::istringstream iss(text);
    char dot = 0;
    long major = 0;
    long minor = 0;
    if (!(iss >> major)) return false;
    if (iss >> dot) {
        if (dot != '.' || !(iss >> minor)) return false;
    }
    version = std::make_pair(major, minor);
    return true;
}

/**
 * 0 ok
 * 1 impossibile ottenere versione utente
 * 2 versione utente più vecchia
 * 3 versione utente più recente
 */
int ConfigManager::checkVersion() {
    std::pair<long, long> defaultVersion;
    std::pair<long, long> userVersion;

    if (!parseVersion(mConfigValues["configVersion"], userVersion)) return 1;
    if (!parseVersion(mDefaultConfigValues["configVersion"], defaultVersion)) return 1;

    if (userVersion > defaultVersion) return 3;
    if (userVersion < defaultVersion) return 2;
    return 0;
}

bool ConfigManager::hasKey(const std::string& key) const {
    auto it = mConfigValues.find(key);
    return it != mConfigValues.end() && !it->second.empty();
}

std::string ConfigManager::getString(const std::string& key) const {
    auto it = mConfigValues.find(key);
    if (it == mConfigValues.end()) {
        throw std::runtime_error("Chiave di configurazione '" + key + "' non presente.");
    }
    return it->second;
}

int ConfigManager::getInt(const std::string& key) const {
    const long long value = getLong(key);
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw std::runtime_error("La chiave di configurazione '" + key + "' è fuori dall'intervallo consentito.");
    }
    return static_cast<int>(value);
}

long long ConfigManager::getLong(const std::string& key) const {
    const std::string value = getString(key);
    std::size_t parsed = 0;
    long long result = 0;
    try {
        result = std::stoll(value, &parsed);
    } catch (const std::logic_error&) { // invalid_argument oppure out_of_range
        parsed = 0;
    }
    if (parsed == 0 || parsed != value.size()) {
        throw std::runtime_error("La chiave di configurazione '" + key + "' deve essere un numero intero, trovato '" + value + "'.");
    }
    return result;
}

bool ConfigManager::getBool(const std::string& key) const {
    const std::string value = getString(key);
    if (value == "true") return true;
    if (value == "false") return false;
    throw std::runtime_error("La chiave di configurazione '" + key + "' deve essere true o false.");
}
