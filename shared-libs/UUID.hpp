#pragma once
#ifndef UUID_HPP
#define UUID_HPP

#include <array>
#include <cstdint>
#include <cstddef>
#include <iostream>
#include <string>

namespace unik {
    /// @brief Numero di intervalli da 100ns tra l'epoca gregoriana (1582-10-15) e l'epoca UNIX (1970-01-01)
    const std::uint64_t GREGORIAN_OFFSET = 0x01B21DD213814000ULL;

    /// @brief Il timestamp RFC 4122 occupa solo i 60 bit meno significativi
    const std::uint64_t TIMESTAMP_MASK = 0x0FFFFFFFFFFFFFFFULL;

    /// @brief Conteggio a 60 bit di intervalli da 100ns dall'epoca gregoriana
    typedef std::uint64_t Timestamp;

    /// @brief Il numero di versione occupa il nibble alto di time_hi_and_version.
    /// La numerazione segue la tabella RFC 4122; gli algoritmi di hash sono quelli di questa libreria.
    enum class Version : std::uint8_t {
        TIME = 1,                /* basato su timestamp e indirizzo di rete */
        DCE = 2,                 /* DCE security, con UID/GID POSIX incorporato */
        NAME_SHA1_TRUNCATED = 3, /* basato su nome, SHA-1 troncato a 16 byte */
        RANDOM = 4,              /* casuale */
        NAME_MD5 = 5             /* basato su nome, MD5 */
    };

    enum class Variant : std::uint8_t {
        NCS,       /* 0xx: riservato, compatibilità NCS */
        RFC4122,   /* 10x: l'unica variante prodotta da questa libreria */
        MICROSOFT, /* 110: riservato, compatibilità Microsoft */
        FUTURE     /* 111: riservato per usi futuri */
    };

    enum class Domain : std::uint8_t {
        PERSON = 0,
        GROUP = 1,
        ORG = 2
    };

    enum class Case {
        LOWER,
        UPPER
    };

    std::string versionToString(Version version);
    std::string variantToString(Variant variant);
    std::string domainToString(Domain domain);

    /// @brief Indirizzo IEEE-802 a 48 bit (campo node)
    struct Node {
        static constexpr std::size_t LENGTH = 6;
        std::array<std::uint8_t, LENGTH> mBytes;

        Node() : mBytes{} {}
        explicit Node(const std::array<std::uint8_t, LENGTH>& bytes) : mBytes(bytes) {}

        /// @brief Interpreta l'indirizzo come intero big-endian (byte 0 più significativo)
        std::uint64_t toU64() const;

        /// @brief Rappresentazione esadecimale a 12 cifre, senza separatori
        std::string toString(Case letterCase = Case::LOWER) const;

        /// @brief Legge 12 cifre esadecimali, eventualmente separate da ':' o '-' ("00:1a:2b:3c:4d:5e")
        /// @throws ParseError se la stringa non è un indirizzo valido
        static Node fromString(const std::string& address);

        friend bool operator==(const Node& lhs, const Node& rhs) { return lhs.mBytes == rhs.mBytes; }
        friend bool operator!=(const Node& lhs, const Node& rhs) { return !(lhs == rhs); }
    };

    /// @brief Identificatore a 128 bit. Immutabile: i campi si costruiscono tramite Layout
    class UUID {
    public:
        static constexpr std::size_t SIZE = 16;
        typedef std::array<std::uint8_t, SIZE> Bytes;

        // namespace RFC 4122, appendice C
        static const UUID NAMESPACE_DNS;
        static const UUID NAMESPACE_URL;
        static const UUID NAMESPACE_OID;
        static const UUID NAMESPACE_X500;

        UUID() : mBytes{} {} // UUID nil
        explicit UUID(const Bytes& bytes) : mBytes(bytes) {}

        const Bytes& getBytes() const { return mBytes; }
        bool isNil() const;

        /// @throws DecodeError (UnrecognizedVersion) se il nibble di versione non è tra 1 e 5
        Version getVersion() const;
        Variant getVariant() const;
        /// @brief Ha senso solo per UUID di versione 2
        /// @throws DecodeError (UnrecognizedDomain)
        Domain getDomain() const;

        /// @brief Forma canonica "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx" (36 caratteri)
        std::string toString(Case letterCase = Case::LOWER) const;

        /// @brief Forma compatta a 32 cifre esadecimali
        std::string toHexString(Case letterCase = Case::LOWER) const;

        /// @brief Legge la forma canonica a 36 caratteri oppure quella compatta a 32.
        /// Gli spazi ASCII iniziali e finali vengono ignorati.
        /// @throws ParseError con il tipo di controllo fallito (lunghezza, carattere, cifra esadecimale)
        static UUID parse(const std::string& text);

        friend bool operator==(const UUID& lhs, const UUID& rhs) { return lhs.mBytes == rhs.mBytes; }
        friend bool operator!=(const UUID& lhs, const UUID& rhs) { return lhs.mBytes != rhs.mBytes; }
        friend bool operator<(const UUID& lhs, const UUID& rhs) { return lhs.mBytes < rhs.mBytes; }
        friend bool operator<=(const UUID& lhs, const UUID& rhs) { return lhs.mBytes <= rhs.mBytes; }
        friend bool operator>(const UUID& lhs, const UUID& rhs) { return lhs.mBytes > rhs.mBytes; }
        friend bool operator>=(const UUID& lhs, const UUID& rhs) { return lhs.mBytes >= rhs.mBytes; }

    private:
        Bytes mBytes;
    };

    std::ostream& operator<<(std::ostream& os, const UUID& uuid);
    std::ostream& operator<<(std::ostream& os, const Node& node);
    std::ostream& operator<<(std::ostream& os, Version version);
    std::ostream& operator<<(std::ostream& os, Variant variant);
    std::ostream& operator<<(std::ostream& os, Domain domain);
}

#endif
