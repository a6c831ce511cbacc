#pragma once
#ifndef CRYPTO_HPP
#define CRYPTO_HPP

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace unik {
    /// @brief Sorgente di byte casuali. Usata dalla versione 4, dal seed della sequenza di clock e dai nodi casuali
    class EntropySource {
    public:
        virtual ~EntropySource() {}

        /// @brief Riempie il buffer con byte casuali
        /// @throws GenerationError (EntropySourceUnavailable) se la sorgente non è leggibile
        virtual void fill(std::uint8_t* buffer, std::size_t length) = 0;
    };

    /// @brief Generatore crittograficamente sicuro di OpenSSL (RAND_bytes)
    class OpenSSLEntropySource : public EntropySource {
    public:
        void fill(std::uint8_t* buffer, std::size_t length) override;
    };

    /// @brief Digest usati dalle versioni basate su nome
    class Crypto {
    private:
        /// @brief (privata) Esegue EVP_Digest con l'algoritmo dato
        static std::vector<std::uint8_t> digest(const EVP_MD* algorithm, const std::string& data);

    public:
        static constexpr std::size_t SHA1_SIZE = 20;
        static constexpr std::size_t MD5_SIZE = 16;

        /// @brief SHA-1 (160 bit) del dato
        /// @throws GenerationError (DigestFailure)
        static std::vector<std::uint8_t> sha1(const std::string& data);

        /// @brief MD5 (128 bit) del dato
        /// @throws GenerationError (DigestFailure)
        static std::vector<std::uint8_t> md5(const std::string& data);
    };
}

#endif
