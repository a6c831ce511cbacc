#pragma once
#ifndef PLATFORM_HPP
#define PLATFORM_HPP

#include "UUID.hpp"
#include "crypto.hpp"

#include <cstdint>

namespace unik {
    // -------- orologio --------

    /// @brief Sorgente del timestamp RFC 4122
    class TimeSource {
    public:
        virtual ~TimeSource() {}
        virtual Timestamp now() = 0;
    };

    /// @brief Orologio di sistema (std::chrono::system_clock) convertito in tick da 100ns dall'epoca gregoriana
    class SystemTimeSource : public TimeSource {
    public:
        Timestamp now() override;

        /// @brief Converte nanosecondi dall'epoca UNIX in timestamp RFC 4122 (60 bit)
        static Timestamp fromUnixNanos(std::uint64_t unixNanos);
    };

    /// @brief Restituisce sempre lo stesso timestamp
    class FixedTimeSource : public TimeSource {
    private:
        Timestamp mTimestamp;

    public:
        explicit FixedTimeSource(Timestamp timestamp) : mTimestamp(timestamp) {}
        Timestamp now() override { return mTimestamp; }
    };

    // -------- indirizzo di rete --------

    /// @brief Fornisce il campo node delle versioni 1 e 2
    class NodeProvider {
    public:
        virtual ~NodeProvider() {}

        /// @throws GenerationError (UnsupportedPlatform) se l'indirizzo non è disponibile
        virtual Node getNode() = 0;
    };

    /// @brief Indirizzo MAC della prima interfaccia Ethernet non di loopback con indirizzo non nullo.
    /// L'indirizzo viene letto alla prima richiesta e poi riutilizzato.
    class SystemNodeProvider : public NodeProvider {
    private:
        Node mNode;
        bool mLoaded;

    public:
        SystemNodeProvider() : mNode(), mLoaded(false) {}
        Node getNode() override;
    };

    /// @brief Indirizzo casuale con il bit multicast impostato (RFC 4122, sezione 4.5),
    /// così non può coincidere con una scheda di rete reale. Generato una volta sola.
    class RandomNodeProvider : public NodeProvider {
    private:
        Node mNode;

    public:
        explicit RandomNodeProvider(EntropySource& entropy);
        Node getNode() override { return mNode; }
    };

    class FixedNodeProvider : public NodeProvider {
    private:
        Node mNode;

    public:
        explicit FixedNodeProvider(const Node& node) : mNode(node) {}
        Node getNode() override { return mNode; }
    };

    // -------- identità POSIX --------

    /// @brief Id utente e gruppo incorporati dalla versione 2
    class IdentityProvider {
    public:
        virtual ~IdentityProvider() {}

        /// @throws GenerationError (UnsupportedPlatform)
        virtual std::uint32_t currentUserId() = 0;

        /// @throws GenerationError (UnsupportedPlatform)
        virtual std::uint32_t currentGroupId() = 0;
    };

    /// @brief getuid() / getgid()
    class PosixIdentityProvider : public IdentityProvider {
    public:
        std::uint32_t currentUserId() override;
        std::uint32_t currentGroupId() override;
    };

    /// @brief Per le piattaforme senza UID/GID: ogni richiesta fallisce
    class UnsupportedIdentityProvider : public IdentityProvider {
    public:
        std::uint32_t currentUserId() override;
        std::uint32_t currentGroupId() override;
    };

#if defined(__unix__) || defined(__APPLE__)
    typedef PosixIdentityProvider SystemIdentityProvider;
#else
    typedef UnsupportedIdentityProvider SystemIdentityProvider;
#endif
}

#endif
