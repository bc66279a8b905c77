#ifndef AEQUI_ABI_HPP
#define AEQUI_ABI_HPP

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "types.hpp"

namespace aequi::abi {

// =============================================================================
// Layout Constants
// =============================================================================

constexpr size_t SELECTOR_SIZE = 4;
constexpr size_t WORD_SIZE = 32;

using Word = std::array<uint8_t, WORD_SIZE>;

// Malformed or truncated ABI data
class AbiError : public std::runtime_error {
public:
    explicit AbiError(const std::string& msg) : std::runtime_error(msg) {}
};

// =============================================================================
// Fixed-Width Codecs
// =============================================================================

// Selector: first 4 bytes of calldata, big-endian
Selector load_selector(const Bytes& data);
void store_selector(uint8_t* out, Selector selector);

// uint256 word carrying a U128 (upper 16 bytes zero)
Word encode_uint(U128 value);
U128 decode_uint(const uint8_t* word);

// address word (upper 12 bytes zero)
Word encode_address(const Address& addr);
Address decode_address(const uint8_t* word);

// bool word (0 or 1)
Word encode_bool(bool value);
bool decode_bool(const uint8_t* word);

// bytes4 word (left-aligned)
Word encode_selector_word(Selector selector);

// `bytes` body: length word followed by the data zero-padded to a word boundary
Bytes encode_bytes(const Bytes& data);

// Read/overwrite a uint256 field at an absolute byte offset of a payload.
// Throws AbiError unless offset + WORD_SIZE <= payload.size().
U128 read_uint_at(const Bytes& payload, size_t offset);
void write_uint_at(Bytes& payload, size_t offset, U128 value);

// =============================================================================
// Encoder (head/tail layout of one tuple)
// =============================================================================

class Encoder {
public:
    Encoder& add_uint(U128 value);
    Encoder& add_address(const Address& addr);
    Encoder& add_bool(bool value);
    Encoder& add_selector(Selector selector);

    // Dynamic `bytes`: offset in head, length + padded data in tail
    Encoder& add_bytes(const Bytes& data);

    // Already-encoded static value (static tuple) placed inline in the head
    Encoder& add_static(const Bytes& encoded);

    // Already-encoded dynamic value (array, dynamic tuple) placed in the tail
    Encoder& add_dynamic(const Bytes& encoded);

    Bytes finish() const;

    // finish() prefixed with a selector
    Bytes finish_with_selector(Selector selector) const;

private:
    struct Item {
        bool dynamic;
        Bytes data;
    };
    std::vector<Item> items_;
};

// Array encodings: length word followed by the elements
Bytes encode_static_array(const std::vector<Bytes>& elements);
Bytes encode_dynamic_array(const std::vector<Bytes>& elements);

// =============================================================================
// Decoder (bounds-checked view over one tuple)
// =============================================================================

class Decoder {
public:
    Decoder(const uint8_t* data, size_t size);
    explicit Decoder(const Bytes& data);

    U128 uint_at(size_t slot) const;
    uint64_t uint64_at(size_t slot) const;
    Address address_at(size_t slot) const;
    bool bool_at(size_t slot) const;

    // Dynamic `bytes` referenced by the offset stored in `slot`
    Bytes bytes_at(size_t slot) const;

    // Dynamic value referenced by the offset stored in `slot`
    Decoder dynamic_at(size_t slot) const;

    // Static value laid out inline starting at `slot`
    Decoder inline_at(size_t slot) const;

    // Array referenced by `slot`: returns element count and a decoder over
    // the element area (offsets of dynamic elements are relative to it)
    std::pair<size_t, Decoder> array_at(size_t slot) const;

    size_t size() const { return size_; }

private:
    const uint8_t* word(size_t slot) const;

    const uint8_t* data_;
    size_t size_;
};

} // namespace aequi::abi

#endif // AEQUI_ABI_HPP
