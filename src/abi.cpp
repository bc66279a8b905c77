// =============================================================================
// abi.cpp - Contract ABI Encoding/Decoding
// =============================================================================

#include "aequi/abi.hpp"
#include <algorithm>
#include <cstring>
#include <limits>

namespace aequi::abi {

// =============================================================================
// Fixed-Width Codecs
// =============================================================================

Selector load_selector(const Bytes& data) {
    if (data.size() < SELECTOR_SIZE) {
        throw AbiError("calldata shorter than a selector");
    }
    return (static_cast<Selector>(data[0]) << 24) |
           (static_cast<Selector>(data[1]) << 16) |
           (static_cast<Selector>(data[2]) << 8) |
           static_cast<Selector>(data[3]);
}

void store_selector(uint8_t* out, Selector selector) {
    out[0] = static_cast<uint8_t>((selector >> 24) & 0xFF);
    out[1] = static_cast<uint8_t>((selector >> 16) & 0xFF);
    out[2] = static_cast<uint8_t>((selector >> 8) & 0xFF);
    out[3] = static_cast<uint8_t>(selector & 0xFF);
}

Word encode_uint(U128 value) {
    Word out{};
    for (int i = 31; i >= 16; --i) {
        out[i] = static_cast<uint8_t>(value & 0xFF);
        value >>= 8;
    }
    return out;
}

U128 decode_uint(const uint8_t* word) {
    for (int i = 0; i < 16; ++i) {
        if (word[i] != 0) {
            throw AbiError("uint256 value does not fit in 128 bits");
        }
    }
    U128 result = 0;
    for (int i = 16; i < 32; ++i) {
        result = (result << 8) | word[i];
    }
    return result;
}

Word encode_address(const Address& addr) {
    Word out{};
    std::memcpy(out.data() + 12, addr.data(), 20);
    return out;
}

Address decode_address(const uint8_t* word) {
    for (int i = 0; i < 12; ++i) {
        if (word[i] != 0) {
            throw AbiError("dirty address padding");
        }
    }
    Address addr;
    std::memcpy(addr.data(), word + 12, 20);
    return addr;
}

Word encode_bool(bool value) {
    Word out{};
    out[31] = value ? 1 : 0;
    return out;
}

bool decode_bool(const uint8_t* word) {
    for (int i = 0; i < 31; ++i) {
        if (word[i] != 0) {
            throw AbiError("invalid bool encoding");
        }
    }
    if (word[31] > 1) {
        throw AbiError("invalid bool encoding");
    }
    return word[31] == 1;
}

Word encode_selector_word(Selector selector) {
    Word out{};
    store_selector(out.data(), selector);
    return out;
}

U128 read_uint_at(const Bytes& payload, size_t offset) {
    if (offset > payload.size() || payload.size() - offset < WORD_SIZE) {
        throw AbiError("word read out of bounds");
    }
    return decode_uint(payload.data() + offset);
}

void write_uint_at(Bytes& payload, size_t offset, U128 value) {
    if (offset > payload.size() || payload.size() - offset < WORD_SIZE) {
        throw AbiError("word write out of bounds");
    }
    Word word = encode_uint(value);
    std::copy(word.begin(), word.end(), payload.begin() + static_cast<std::ptrdiff_t>(offset));
}

namespace {

void append(Bytes& out, const uint8_t* data, size_t size) {
    out.insert(out.end(), data, data + size);
}

void append_word(Bytes& out, const Word& word) {
    append(out, word.data(), word.size());
}

Bytes word_bytes(const Word& word) {
    return Bytes(word.begin(), word.end());
}

} // namespace

Bytes encode_bytes(const Bytes& data) {
    Bytes encoded;
    append_word(encoded, encode_uint(data.size()));
    encoded.insert(encoded.end(), data.begin(), data.end());
    size_t pad = (WORD_SIZE - (data.size() % WORD_SIZE)) % WORD_SIZE;
    encoded.insert(encoded.end(), pad, 0);
    return encoded;
}

// =============================================================================
// Encoder
// =============================================================================

Encoder& Encoder::add_uint(U128 value) {
    items_.push_back({false, word_bytes(encode_uint(value))});
    return *this;
}

Encoder& Encoder::add_address(const Address& addr) {
    items_.push_back({false, word_bytes(encode_address(addr))});
    return *this;
}

Encoder& Encoder::add_bool(bool value) {
    items_.push_back({false, word_bytes(encode_bool(value))});
    return *this;
}

Encoder& Encoder::add_selector(Selector selector) {
    items_.push_back({false, word_bytes(encode_selector_word(selector))});
    return *this;
}

Encoder& Encoder::add_bytes(const Bytes& data) {
    items_.push_back({true, encode_bytes(data)});
    return *this;
}

Encoder& Encoder::add_static(const Bytes& encoded) {
    items_.push_back({false, encoded});
    return *this;
}

Encoder& Encoder::add_dynamic(const Bytes& encoded) {
    items_.push_back({true, encoded});
    return *this;
}

Bytes Encoder::finish() const {
    size_t head_size = 0;
    for (const auto& item : items_) {
        head_size += item.dynamic ? WORD_SIZE : item.data.size();
    }

    Bytes head;
    Bytes tail;
    head.reserve(head_size);
    for (const auto& item : items_) {
        if (item.dynamic) {
            append_word(head, encode_uint(head_size + tail.size()));
            tail.insert(tail.end(), item.data.begin(), item.data.end());
        } else {
            head.insert(head.end(), item.data.begin(), item.data.end());
        }
    }

    head.insert(head.end(), tail.begin(), tail.end());
    return head;
}

Bytes Encoder::finish_with_selector(Selector selector) const {
    Bytes body = finish();
    Bytes out(SELECTOR_SIZE);
    store_selector(out.data(), selector);
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

Bytes encode_static_array(const std::vector<Bytes>& elements) {
    Bytes out;
    append_word(out, encode_uint(elements.size()));
    for (const auto& element : elements) {
        out.insert(out.end(), element.begin(), element.end());
    }
    return out;
}

Bytes encode_dynamic_array(const std::vector<Bytes>& elements) {
    Encoder body;
    for (const auto& element : elements) {
        body.add_dynamic(element);
    }
    Bytes out;
    append_word(out, encode_uint(elements.size()));
    Bytes encoded = body.finish();
    out.insert(out.end(), encoded.begin(), encoded.end());
    return out;
}

// =============================================================================
// Decoder
// =============================================================================

Decoder::Decoder(const uint8_t* data, size_t size) : data_(data), size_(size) {}

Decoder::Decoder(const Bytes& data) : data_(data.data()), size_(data.size()) {}

const uint8_t* Decoder::word(size_t slot) const {
    size_t offset = slot * WORD_SIZE;
    if (offset > size_ || size_ - offset < WORD_SIZE) {
        throw AbiError("ABI data truncated");
    }
    return data_ + offset;
}

U128 Decoder::uint_at(size_t slot) const {
    return decode_uint(word(slot));
}

uint64_t Decoder::uint64_at(size_t slot) const {
    U128 value = uint_at(slot);
    if (value > std::numeric_limits<uint64_t>::max()) {
        throw AbiError("ABI integer does not fit in 64 bits");
    }
    return static_cast<uint64_t>(value);
}

Address Decoder::address_at(size_t slot) const {
    return decode_address(word(slot));
}

bool Decoder::bool_at(size_t slot) const {
    return decode_bool(word(slot));
}

Bytes Decoder::bytes_at(size_t slot) const {
    Decoder body = dynamic_at(slot);
    uint64_t length = body.uint64_at(0);
    if (length > body.size_ - WORD_SIZE) {
        throw AbiError("bytes length exceeds ABI data");
    }
    const uint8_t* begin = body.data_ + WORD_SIZE;
    return Bytes(begin, begin + length);
}

Decoder Decoder::dynamic_at(size_t slot) const {
    uint64_t offset = uint64_at(slot);
    if (offset > size_) {
        throw AbiError("ABI offset out of bounds");
    }
    return Decoder(data_ + offset, size_ - static_cast<size_t>(offset));
}

Decoder Decoder::inline_at(size_t slot) const {
    size_t offset = slot * WORD_SIZE;
    if (offset > size_) {
        throw AbiError("ABI data truncated");
    }
    return Decoder(data_ + offset, size_ - offset);
}

std::pair<size_t, Decoder> Decoder::array_at(size_t slot) const {
    Decoder array = dynamic_at(slot);
    uint64_t length = array.uint64_at(0);
    Decoder elements = array.inline_at(1);
    // Every element occupies at least one word
    if (length > elements.size_ / WORD_SIZE) {
        throw AbiError("array length exceeds ABI data");
    }
    return {static_cast<size_t>(length), elements};
}

} // namespace aequi::abi
