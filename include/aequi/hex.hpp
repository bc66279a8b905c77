#ifndef AEQUI_HEX_HPP
#define AEQUI_HEX_HPP

#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>

#include "types.hpp"

namespace aequi::hex {

inline std::string_view strip_0x(std::string_view s) {
    if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        return s.substr(2);
    }
    return s;
}

inline std::string encode(const uint8_t* data, size_t size) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(2 + size * 2);
    out += "0x";
    for (size_t i = 0; i < size; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0xF];
    }
    return out;
}

inline std::string encode(const Bytes& data) {
    return encode(data.data(), data.size());
}

inline std::string encode(const Address& addr) {
    return encode(addr.data(), addr.size());
}

inline std::string encode_selector(Selector selector) {
    const uint8_t raw[4] = {
        static_cast<uint8_t>(selector >> 24),
        static_cast<uint8_t>(selector >> 16),
        static_cast<uint8_t>(selector >> 8),
        static_cast<uint8_t>(selector)};
    return encode(raw, 4);
}

inline int nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + c - 'a';
    if (c >= 'A' && c <= 'F') return 10 + c - 'A';
    throw std::invalid_argument(std::string("invalid hex digit: ") + c);
}

inline Bytes decode(std::string_view input) {
    std::string_view digits = strip_0x(input);
    if (digits.size() % 2 != 0) {
        throw std::invalid_argument("odd-length hex string");
    }
    Bytes out;
    out.reserve(digits.size() / 2);
    for (size_t i = 0; i < digits.size(); i += 2) {
        out.push_back(static_cast<uint8_t>((nibble(digits[i]) << 4) | nibble(digits[i + 1])));
    }
    return out;
}

inline Address decode_address(std::string_view input) {
    Bytes raw = decode(input);
    if (raw.size() != 20) {
        throw std::invalid_argument("address must be 20 bytes: " + std::string(input));
    }
    Address addr;
    std::copy(raw.begin(), raw.end(), addr.begin());
    return addr;
}

inline Selector decode_selector(std::string_view input) {
    Bytes raw = decode(input);
    if (raw.size() != 4) {
        throw std::invalid_argument("selector must be 4 bytes: " + std::string(input));
    }
    return (static_cast<Selector>(raw[0]) << 24) |
           (static_cast<Selector>(raw[1]) << 16) |
           (static_cast<Selector>(raw[2]) << 8) |
           static_cast<Selector>(raw[3]);
}

} // namespace aequi::hex

#endif // AEQUI_HEX_HPP
