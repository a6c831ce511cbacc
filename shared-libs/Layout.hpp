#pragma once
#ifndef LAYOUT_HPP
#define LAYOUT_HPP

#include "UUID.hpp"

#include <cstdint>

namespace unik {
    /// @brief Vista a cinque campi di un UUID (RFC 4122, sezione 4.1.2).
    /// Ogni campo multi-byte è scritto in ordine big-endian (network byte order).
    ///
    ///  byte   0-3     4-5        6-7               8            9         10-15
    ///       time_low time_mid time_hi_and_version clock_seq_hi clock_seq_low node
    struct Layout {
        std::uint32_t mTimeLow;
        std::uint16_t mTimeMid;
        std::uint16_t mTimeHiAndVersion;
        std::uint16_t mClockSeq; // clock_seq_hi_and_reserved << 8 | clock_seq_low
        Node mNode;

        Layout() : mTimeLow(0), mTimeMid(0), mTimeHiAndVersion(0), mClockSeq(0), mNode() {}

        Layout(std::uint32_t timeLow, std::uint16_t timeMid, std::uint16_t timeHiAndVersion, std::uint16_t clockSeq, const Node& node)
            : mTimeLow(timeLow), mTimeMid(timeMid), mTimeHiAndVersion(timeHiAndVersion), mClockSeq(clockSeq), mNode(node) {}

        /// @brief Scrive i campi nei 16 byte dell'identificatore
        UUID pack() const;

        /// @brief Ricostruisce i campi da un identificatore esistente. Qualsiasi valore è accettato.
        static Layout unpack(const UUID& uuid);

        std::uint8_t getClockSeqHiAndReserved() const { return static_cast<std::uint8_t>(mClockSeq >> 8); }
        std::uint8_t getClockSeqLow() const { return static_cast<std::uint8_t>(mClockSeq & 0xFF); }

        /// @brief Imposta il nibble di versione e la variante RFC 4122, lasciando intatti gli altri bit
        void tag(Version version);

        Version getVersion() const;
        Variant getVariant() const;
        Domain getDomain() const;

        /// @brief Timestamp a 60 bit ricomposto da time_low, time_mid e time_hi.
        /// Per la versione 2 i 32 bit bassi contengono l'id di dominio.
        Timestamp getTimestamp() const;

        /// @brief Sequenza di clock a 14 bit, senza i bit di variante
        std::uint16_t getClockSequence() const { return mClockSeq & 0x3FFF; }

        friend bool operator==(const Layout& lhs, const Layout& rhs) {
            return lhs.mTimeLow == rhs.mTimeLow && lhs.mTimeMid == rhs.mTimeMid && lhs.mTimeHiAndVersion == rhs.mTimeHiAndVersion &&
                   lhs.mClockSeq == rhs.mClockSeq && lhs.mNode == rhs.mNode;
        }
        friend bool operator!=(const Layout& lhs, const Layout& rhs) { return !(lhs == rhs); }
    };

    /// @brief Azzera i 4 bit alti di time_hi_and_version e ci scrive la versione
    std::uint16_t setVersion(std::uint16_t timeHiAndVersion, Version version);

    /// @throws DecodeError (UnrecognizedVersion) se il nibble non è tra 1 e 5
    Version getVersion(std::uint16_t timeHiAndVersion);

    /// @brief Azzera i 2 bit alti di clock_seq_hi_and_reserved e ci scrive il pattern 10 (RFC 4122)
    std::uint8_t setVariant(std::uint8_t clockSeqHi);

    /// @brief Classifica la variante dai bit alti: 0xx NCS, 10x RFC 4122, 110 Microsoft, 111 futuro
    Variant getVariant(std::uint8_t clockSeqHi);

    /// @throws DecodeError (UnrecognizedDomain) per valori maggiori di 2
    Domain getDomain(std::uint8_t clockSeqLow);
}

#endif
