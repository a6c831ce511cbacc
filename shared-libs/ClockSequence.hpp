#pragma once
#ifndef CLOCKSEQUENCE_HPP
#define CLOCKSEQUENCE_HPP

#include "crypto.hpp"

#include <atomic>
#include <cstdint>

namespace unik {
    /// @brief Contatore a 14 bit che distingue UUID generati nello stesso tick o dopo un arretramento dell'orologio.
    /// È l'unico stato condiviso tra le generazioni: viene modificato con un solo fetch_add atomico.
    class ClockSequence {
    private:
        std::atomic<std::uint16_t> mCounter;

        static std::uint16_t randomSeed(EntropySource& entropy);

    public:
        static constexpr std::uint16_t MASK = 0x3FFF;

        /// @brief Seed casuale a 16 bit letto dalla sorgente di entropia
        /// @throws GenerationError (EntropySourceUnavailable)
        explicit ClockSequence(EntropySource& entropy);

        /// @brief Seed esplicito, utile per rendere deterministici i test
        explicit ClockSequence(std::uint16_t seed);

        ClockSequence(const ClockSequence&) = delete;
        ClockSequence& operator=(const ClockSequence&) = delete;

        /// @brief Restituisce il valore corrente (14 bit) e incrementa. L'overflow riparte da zero.
        std::uint16_t next();

        /// @brief Riposiziona il contatore
        void reseed(std::uint16_t seed);
    };
}

#endif
