#pragma once
#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstdint>
#include <cstddef>
#include <string>

namespace unik {
    /// @brief Converte un nibble (0-15) nella cifra esadecimale corrispondente
    /// @param nibble il valore da convertire, i bit oltre il quarto vengono ignorati
    /// @param upper TRUE per le lettere maiuscole
    char hexDigit(std::uint8_t nibble, bool upper);

    /// @brief Valore di una cifra esadecimale (maiuscola o minuscola)
    /// @return il valore tra 0 e 15, oppure -1 se il carattere non è una cifra esadecimale
    int hexValue(char c);

    /// @brief Converte un buffer in stringa esadecimale, due cifre per byte
    std::string bytesToHex(const std::uint8_t* data, std::size_t length, bool upper);

    /// @brief TRUE per gli spazi ASCII (spazio, \t, \n, \v, \f, \r)
    bool isAsciiWhitespace(char c);

    /// @brief Rimuove gli spazi ASCII iniziali e finali
    std::string trimWhitespace(const std::string& input);

    /// @brief Verifica la validità di un uuid (forma canonica o compatta) senza lanciare eccezioni
    bool isValidUUID(const std::string& uuid);
}

#endif
