#include "UUID.hpp"
#include "Layout.hpp"
#include "Errors.hpp"
#include "Utils.hpp"

namespace unik {
    const UUID UUID::NAMESPACE_DNS(UUID::Bytes{0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1, 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8});
    const UUID UUID::NAMESPACE_URL(UUID::Bytes{0x6b, 0xa7, 0xb8, 0x11, 0x9d, 0xad, 0x11, 0xd1, 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8});
    const UUID UUID::NAMESPACE_OID(UUID::Bytes{0x6b, 0xa7, 0xb8, 0x12, 0x9d, 0xad, 0x11, 0xd1, 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8});
    const UUID UUID::NAMESPACE_X500(UUID::Bytes{0x6b, 0xa7, 0xb8, 0x14, 0x9d, 0xad, 0x11, 0xd1, 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8});

    std::string versionToString(Version version) {
        switch (version) {
            case Version::TIME: return "1 (time-based)";
            case Version::DCE: return "2 (DCE security)";
            case Version::NAME_SHA1_TRUNCATED: return "3 (name-based, SHA-1)";
            case Version::RANDOM: return "4 (random)";
            case Version::NAME_MD5: return "5 (name-based, MD5)";
        }
        return "unknown";
    }

    std::string variantToString(Variant variant) {
        switch (variant) {
            case Variant::NCS: return "NCS";
            case Variant::RFC4122: return "RFC 4122";
            case Variant::MICROSOFT: return "Microsoft";
            case Variant::FUTURE: return "future";
        }
        return "unknown";
    }

    std::string domainToString(Domain domain) {
        switch (domain) {
            case Domain::PERSON: return "person";
            case Domain::GROUP: return "group";
            case Domain::ORG: return "org";
        }
        return "unknown";
    }

    /*Node*/
    std::uint64_t Node::toU64() const {
        std::uint64_t value = 0;
        for (std::uint8_t b : mBytes) {
            value = (value << 8) | b;
        }
        return value;
    }

    std::string Node::toString(Case letterCase) const {
        return bytesToHex(mBytes.data(), mBytes.size(), letterCase == Case::UPPER);
    }

    Node Node::fromString(const std::string& address) {
        std::string digits;
        for (char c : trimWhitespace(address)) {
            if (c == ':' || c == '-') continue;
            if (hexValue(c) < 0) {
                throw ParseError(ParseErrorKind::InvalidHexDigit, "Invalid character '" + std::string(1, c) + "' in node address.");
            }
            digits += c;
        }
        if (digits.size() != 2 * LENGTH) {
            throw ParseError(ParseErrorKind::InvalidLength, "Node address must have 12 hex digits, got " + std::to_string(digits.size()) + ".");
        }

        Node node;
        for (std::size_t i = 0; i < LENGTH; ++i) {
            node.mBytes[i] = static_cast<std::uint8_t>((hexValue(digits[2 * i]) << 4) | hexValue(digits[2 * i + 1]));
        }
        return node;
    }

    /*UUID*/
    bool UUID::isNil() const {
        for (std::uint8_t b : mBytes) {
            if (b != 0) return false;
        }
        return true;
    }

    Version UUID::getVersion() const {
        return Layout::unpack(*this).getVersion();
    }

    Variant UUID::getVariant() const {
        return Layout::unpack(*this).getVariant();
    }

    Domain UUID::getDomain() const {
        return Layout::unpack(*this).getDomain();
    }

    std::string UUID::toString(Case letterCase) const {
        const bool upper = letterCase == Case::UPPER;
        std::string result;
        result.reserve(36);
        for (std::size_t i = 0; i < SIZE; ++i) {
            result += hexDigit(mBytes[i] >> 4, upper);
            result += hexDigit(mBytes[i], upper);
            if (i == 3 || i == 5 || i == 7 || i == 9) {
                result += '-';
            }
        }
        return result;
    }

    std::string UUID::toHexString(Case letterCase) const {
        return bytesToHex(mBytes.data(), mBytes.size(), letterCase == Case::UPPER);
    }

    UUID UUID::parse(const std::string& text) {
        const std::string s = trimWhitespace(text);

        bool hyphenated;
        if (s.size() == 36) {
            hyphenated = true;
        } else if (s.size() == 32) {
            hyphenated = false;
        } else {
            throw ParseError(ParseErrorKind::InvalidLength, "Invalid UUID length " + std::to_string(s.size()) + ": expected 36 or 32 characters.");
        }

        Bytes bytes{};
        std::size_t nibbles = 0;
        for (std::size_t i = 0; i < s.size(); ++i) {
            const char c = s[i];

            if (hyphenated && (i == 8 || i == 13 || i == 18 || i == 23)) {
                if (c != '-') {
                    throw ParseError(ParseErrorKind::InvalidCharacter, "Expected '-' at position " + std::to_string(i) + ".");
                }
                continue;
            }

            const int value = hexValue(c);
            if (value < 0) {
                const bool asciiLetter = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
                if (asciiLetter) {
                    throw ParseError(ParseErrorKind::InvalidHexDigit, "Invalid hex digit '" + std::string(1, c) + "' at position " + std::to_string(i) + ".");
                }
                throw ParseError(ParseErrorKind::InvalidCharacter, "Invalid character at position " + std::to_string(i) + ".");
            }

            // cifra alta nei nibble pari, bassa in quelli dispari
            std::uint8_t& b = bytes[nibbles / 2];
            b = static_cast<std::uint8_t>((nibbles % 2 == 0) ? (value << 4) : (b | value));
            ++nibbles;
        }

        return UUID(bytes);
    }

    std::ostream& operator<<(std::ostream& os, const UUID& uuid) {
        return os << uuid.toString();
    }

    std::ostream& operator<<(std::ostream& os, const Node& node) {
        return os << node.toString();
    }

    std::ostream& operator<<(std::ostream& os, Version version) {
        return os << versionToString(version);
    }

    std::ostream& operator<<(std::ostream& os, Variant variant) {
        return os << variantToString(variant);
    }

    std::ostream& operator<<(std::ostream& os, Domain domain) {
        return os << domainToString(domain);
    }
}
