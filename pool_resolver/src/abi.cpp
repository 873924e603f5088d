#include "abi.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

namespace abi {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    throw std::runtime_error(std::string("invalid hex digit '") + c + "'");
}

constexpr size_t WORD_HEX = 64;

} // namespace

std::string strip_0x(const std::string& hex) {
    if (hex.rfind("0x", 0) == 0 || hex.rfind("0X", 0) == 0) return hex.substr(2);
    return hex;
}

std::string ensure_0x(const std::string& hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) return hex;
    return "0x" + hex;
}

std::string pad32(const std::string& hex_no_prefix) {
    if (hex_no_prefix.size() >= WORD_HEX) return hex_no_prefix.substr(hex_no_prefix.size() - WORD_HEX);
    return std::string(WORD_HEX - hex_no_prefix.size(), '0') + hex_no_prefix;
}

std::string encode_address(const std::string& address) {
    return pad32(util::to_lower(strip_0x(address)));
}

std::string encode_uint(uint64_t value) {
    static const char* digits = "0123456789abcdef";
    std::string hex;
    do {
        hex.insert(hex.begin(), digits[value & 0xf]);
        value >>= 4;
    } while (value != 0);
    return pad32(hex);
}

std::string call_data(const std::string& selector, const std::string& encoded_args) {
    return ensure_0x(strip_0x(selector) + encoded_args);
}

std::string word(const std::string& result, size_t index) {
    std::string hex = strip_0x(result);
    size_t start = index * WORD_HEX;
    if (hex.size() < start + WORD_HEX) {
        throw std::runtime_error("ABI result too short: expected word " + std::to_string(index) +
                                 ", got " + std::to_string(hex.size() / 2) + " bytes");
    }
    return hex.substr(start, WORD_HEX);
}

std::string decode_address(const std::string& word_hex) {
    std::string hex = strip_0x(word_hex);
    if (hex.size() < 40) {
        throw std::runtime_error("ABI word too short for an address");
    }
    return "0x" + util::to_lower(hex.substr(hex.size() - 40));
}

uint64_t decode_uint64(const std::string& word_hex) {
    std::string hex = strip_0x(word_hex);
    size_t first = hex.find_first_not_of('0');
    if (first == std::string::npos) {
        return 0;
    }
    if (hex.size() - first > 16) {
        throw std::runtime_error("ABI value does not fit in 64 bits");
    }

    uint64_t value = 0;
    for (size_t i = first; i < hex.size(); ++i) {
        value = (value << 4) | static_cast<uint64_t>(hex_digit(hex[i]));
    }
    return value;
}

int32_t decode_int24(const std::string& word_hex) {
    std::string hex = strip_0x(word_hex);
    if (hex.size() < 6) {
        throw std::runtime_error("ABI word too short for int24");
    }

    uint32_t raw = 0;
    for (size_t i = hex.size() - 6; i < hex.size(); ++i) {
        raw = (raw << 4) | static_cast<uint32_t>(hex_digit(hex[i]));
    }

    if (raw & 0x800000u) {
        return static_cast<int32_t>(raw) - 0x1000000;
    }
    return static_cast<int32_t>(raw);
}

std::string hex_to_decimal(const std::string& hex) {
    std::string digits_hex = strip_0x(hex);

    // Little-endian base 10^9 limbs
    std::vector<uint32_t> limbs{0};
    for (char c : digits_hex) {
        uint64_t carry = static_cast<uint64_t>(hex_digit(c));
        for (auto& limb : limbs) {
            uint64_t cur = static_cast<uint64_t>(limb) * 16 + carry;
            limb = static_cast<uint32_t>(cur % 1000000000u);
            carry = cur / 1000000000u;
        }
        if (carry) {
            limbs.push_back(static_cast<uint32_t>(carry));
        }
    }

    std::string out = std::to_string(limbs.back());
    for (auto it = limbs.rbegin() + 1; it != limbs.rend(); ++it) {
        std::string part = std::to_string(*it);
        out += std::string(9 - part.size(), '0') + part;
    }
    return out;
}

std::string decode_string(const std::string& result) {
    std::string hex = strip_0x(result);

    std::string raw;
    if (hex.size() == WORD_HEX) {
        // bytes32, right-padded with zeros
        for (size_t i = 0; i + 1 < hex.size(); i += 2) {
            char c = static_cast<char>(hex_digit(hex[i]) * 16 + hex_digit(hex[i + 1]));
            if (c == '\0') break;
            raw.push_back(c);
        }
        return raw;
    }

    uint64_t offset = decode_uint64(word(hex, 0));
    if (offset % 32 != 0) {
        throw std::runtime_error("ABI string offset is not word aligned");
    }
    size_t length_word = static_cast<size_t>(offset / 32);
    uint64_t length = decode_uint64(word(hex, length_word));

    size_t data_start = (length_word + 1) * WORD_HEX;
    if (hex.size() < data_start + length * 2) {
        throw std::runtime_error("ABI string data truncated");
    }

    raw.reserve(static_cast<size_t>(length));
    for (uint64_t i = 0; i < length; ++i) {
        size_t pos = data_start + static_cast<size_t>(i) * 2;
        raw.push_back(static_cast<char>(hex_digit(hex[pos]) * 16 + hex_digit(hex[pos + 1])));
    }
    return raw;
}

bool is_zero_address(const std::string& address) {
    std::string hex = strip_0x(address);
    return hex.empty() || hex.find_first_not_of('0') == std::string::npos;
}

} // namespace abi
