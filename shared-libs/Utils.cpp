#include "Utils.hpp"
#include "UUID.hpp"
#include "Errors.hpp"

#include <iomanip>
#include <sstream>

namespace unik {
    char hexDigit(std::uint8_t nibble, bool upper) {
        static const char lowerDigits[] = "0123456789abcdef";
        static const char upperDigits[] = "0123456789ABCDEF";
        return upper ? upperDigits[nibble & 0x0F] : lowerDigits[nibble & 0x0F];
    }

    int hexValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    std::string bytesToHex(const std::uint8_t* data, std::size_t length, bool upper) {
        std::ostringstream oss;
        if (upper) oss << std::uppercase;
        for (std::size_t i = 0; i < length; ++i) {
            oss << std::setw(2) << std::setfill('0') << std::hex << static_cast<int>(data[i]);
        }
        return oss.str();
    }

    bool isAsciiWhitespace(char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
    }

    std::string trimWhitespace(const std::string& input) {
        std::size_t first = 0;
        std::size_t last = input.size();
        while (first < last && isAsciiWhitespace(input[first])) ++first;
        while (last > first && isAsciiWhitespace(input[last - 1])) --last;
        return input.substr(first, last - first);
    }

    bool isValidUUID(const std::string& uuid) {
        try {
            UUID::parse(uuid);
        } catch (const ParseError&) {
            return false;
        }
        return true;
    }
}
