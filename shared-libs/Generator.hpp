#pragma once
#ifndef GENERATOR_HPP
#define GENERATOR_HPP

#include "UUID.hpp"
#include "Layout.hpp"
#include "ClockSequence.hpp"
#include "Platform.hpp"
#include "crypto.hpp"

#include <cstdint>
#include <string>

namespace unik {
    /// @brief Le cinque strategie di generazione RFC 4122.
    /// Le dipendenze (orologio, nodo, identità, entropia, sequenza di clock) sono passate per riferimento
    /// e devono sopravvivere al generatore. L'unico stato modificato è la ClockSequence.
    class UUIDGenerator {
    private:
        ClockSequence& mClockSequence;
        TimeSource& mTimeSource;
        NodeProvider& mNodeProvider;
        IdentityProvider& mIdentityProvider;
        EntropySource& mEntropy;
        std::uint32_t mOrgId;
        bool mHasOrgId;

        /// @brief (privata) Layout della versione 1, senza il tag di versione
        Layout timeLayout(Timestamp timestamp, const Node& node);

        /// @brief (privata) Hash di "namespace in forma canonica minuscola" + name
        static std::string nameInput(const UUID& ns, const std::string& name);

    public:
        UUIDGenerator(ClockSequence& clockSequence, TimeSource& timeSource, NodeProvider& nodeProvider,
                      IdentityProvider& identityProvider, EntropySource& entropy);

        /// @brief Id organizzazione usato da v2(Domain::ORG)
        void setOrgId(std::uint32_t orgId);

        /// @brief Versione 1: timestamp corrente e nodo del NodeProvider
        UUID v1();

        /// @brief Versione 1 con timestamp e nodo scelti dal chiamante
        UUID v1(Timestamp timestamp, const Node& node);

        /// @brief Versione 2: l'id è l'UID (PERSON), il GID (GROUP) o l'id organizzazione configurato (ORG)
        /// @throws GenerationError (UnsupportedPlatform) se l'id non è disponibile
        UUID v2(Domain domain);

        /// @brief Versione 2 con id fornito dal chiamante
        UUID v2(Domain domain, std::uint32_t id);

        /// @brief Versione 2 completamente deterministica (a parte la sequenza di clock)
        UUID v2(Timestamp timestamp, const Node& node, Domain domain, std::uint32_t id);

        /// @brief Versione 3: SHA-1 di namespace + name, troncato ai primi 16 byte
        static UUID v3(const UUID& ns, const std::string& name);

        /// @brief Versione 4: 122 bit casuali
        /// @throws GenerationError (EntropySourceUnavailable)
        UUID v4();

        /// @brief Versione 5: MD5 di namespace + name
        static UUID v5(const UUID& ns, const std::string& name);
    };
}

#endif
