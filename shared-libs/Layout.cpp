#include "Layout.hpp"
#include "Errors.hpp"

namespace unik {
    UUID Layout::pack() const {
        UUID::Bytes bytes;

        bytes[0] = static_cast<std::uint8_t>(mTimeLow >> 24);
        bytes[1] = static_cast<std::uint8_t>(mTimeLow >> 16);
        bytes[2] = static_cast<std::uint8_t>(mTimeLow >> 8);
        bytes[3] = static_cast<std::uint8_t>(mTimeLow);

        bytes[4] = static_cast<std::uint8_t>(mTimeMid >> 8);
        bytes[5] = static_cast<std::uint8_t>(mTimeMid);

        bytes[6] = static_cast<std::uint8_t>(mTimeHiAndVersion >> 8);
        bytes[7] = static_cast<std::uint8_t>(mTimeHiAndVersion);

        bytes[8] = static_cast<std::uint8_t>(mClockSeq >> 8);
        bytes[9] = static_cast<std::uint8_t>(mClockSeq);

        for (std::size_t i = 0; i < Node::LENGTH; ++i) {
            bytes[10 + i] = mNode.mBytes[i];
        }

        return UUID(bytes);
    }

    Layout Layout::unpack(const UUID& uuid) {
        const UUID::Bytes& bytes = uuid.getBytes();
        Layout layout;

        layout.mTimeLow = (static_cast<std::uint32_t>(bytes[0]) << 24) | (static_cast<std::uint32_t>(bytes[1]) << 16) |
                          (static_cast<std::uint32_t>(bytes[2]) << 8) | static_cast<std::uint32_t>(bytes[3]);
        layout.mTimeMid = static_cast<std::uint16_t>((bytes[4] << 8) | bytes[5]);
        layout.mTimeHiAndVersion = static_cast<std::uint16_t>((bytes[6] << 8) | bytes[7]);
        layout.mClockSeq = static_cast<std::uint16_t>((bytes[8] << 8) | bytes[9]);

        for (std::size_t i = 0; i < Node::LENGTH; ++i) {
            layout.mNode.mBytes[i] = bytes[10 + i];
        }

        return layout;
    }

    void Layout::tag(Version version) {
        mTimeHiAndVersion = setVersion(mTimeHiAndVersion, version);
        mClockSeq = static_cast<std::uint16_t>((setVariant(getClockSeqHiAndReserved()) << 8) | getClockSeqLow());
    }

    Version Layout::getVersion() const {
        return unik::getVersion(mTimeHiAndVersion);
    }

    Variant Layout::getVariant() const {
        return unik::getVariant(getClockSeqHiAndReserved());
    }

    Domain Layout::getDomain() const {
        return unik::getDomain(getClockSeqLow());
    }

    Timestamp Layout::getTimestamp() const {
        return static_cast<Timestamp>(mTimeLow) |
               (static_cast<Timestamp>(mTimeMid) << 32) |
               (static_cast<Timestamp>(mTimeHiAndVersion & 0x0FFF) << 48);
    }

    std::uint16_t setVersion(std::uint16_t timeHiAndVersion, Version version) {
        return static_cast<std::uint16_t>((timeHiAndVersion & 0x0FFF) | (static_cast<std::uint16_t>(version) << 12));
    }

    Version getVersion(std::uint16_t timeHiAndVersion) {
        const unsigned nibble = (timeHiAndVersion >> 12) & 0x0F;
        switch (nibble) {
            case 1: return Version::TIME;
            case 2: return Version::DCE;
            case 3: return Version::NAME_SHA1_TRUNCATED;
            case 4: return Version::RANDOM;
            case 5: return Version::NAME_MD5;
            default:
                throw DecodeError(DecodeErrorKind::UnrecognizedVersion, "Unrecognized UUID version " + std::to_string(nibble) + ".");
        }
    }

    std::uint8_t setVariant(std::uint8_t clockSeqHi) {
        return static_cast<std::uint8_t>((clockSeqHi & 0x3F) | 0x80);
    }

    Variant getVariant(std::uint8_t clockSeqHi) {
        if ((clockSeqHi & 0x80) == 0x00) return Variant::NCS;       // 0xx
        if ((clockSeqHi & 0xC0) == 0x80) return Variant::RFC4122;   // 10x
        if ((clockSeqHi & 0xE0) == 0xC0) return Variant::MICROSOFT; // 110
        return Variant::FUTURE;                                     // 111
    }

    Domain getDomain(std::uint8_t clockSeqLow) {
        switch (clockSeqLow) {
            case 0: return Domain::PERSON;
            case 1: return Domain::GROUP;
            case 2: return Domain::ORG;
            default:
                throw DecodeError(DecodeErrorKind::UnrecognizedDomain, "Unrecognized DCE domain " + std::to_string(clockSeqLow) + ".");
        }
    }
}
