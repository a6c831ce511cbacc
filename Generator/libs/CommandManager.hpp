#pragma once
#ifndef COMMANDMANAGER_HPP
#define COMMANDMANAGER_HPP

#include "../../shared-libs/UUID.hpp"
#include "../../shared-libs/Generator.hpp"

#include <cstdint>
#include <iostream>
#include <map>
#include <string>
#include <vector>

enum Command {
    CMD_V1,
    CMD_V2,
    CMD_V3,
    CMD_V4,
    CMD_V5,
    CMD_PARSE,
    CMD_BENCH,
    CMD_HELP,
    CMD_UNKNOWN
};

/// @brief Opzioni lette dal file di configurazione
struct CommandOptions {
    unik::Case mCase = unik::Case::LOWER;
    unik::UUID mDefaultNamespace = unik::UUID::NAMESPACE_DNS;
};

/// @brief Converte il testo del comando nel valore Command
Command getCommand(const std::string& command);

/// @brief Risolve un namespace: "dns", "url", "oid", "x500" oppure un UUID in forma testuale
/// @throws unik::ParseError se il testo non è né un nome noto né un UUID valido
unik::UUID resolveNamespace(const std::string& name);

/// @brief Converte "person", "group" o "org" nel dominio DCE
/// @throws std::invalid_argument per nomi sconosciuti
unik::Domain resolveDomain(const std::string& name);

/// @brief Legge un intero senza segno composto solo da cifre decimali
/// @param what nome del valore, usato nei messaggi di errore
/// @throws std::invalid_argument se il testo non è un numero, std::out_of_range se supera maximum
std::uint64_t parseUnsigned(const std::string& text, std::uint64_t maximum, const std::string& what);

/// @brief Id a 32 bit per la versione 2
std::uint32_t parseId(const std::string& text, const std::string& what);

/// @brief Stampa versione, variante e campi di un UUID
void printLayout(std::ostream& os, const unik::UUID& uuid);

/// @brief Esegue il comando indicato da args[0], scrivendo i risultati su os
/// @return il codice di uscita del programma
int runCommand(const std::vector<std::string>& args, unik::UUIDGenerator& generator, const CommandOptions& options, std::ostream& os);

void printHelp(std::ostream& os);

#endif
