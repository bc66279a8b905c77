#ifndef AEQUI_TYPES_HPP
#define AEQUI_TYPES_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace aequi {

// =============================================================================
// EVM 20-byte addresses
// =============================================================================

using Address = std::array<uint8_t, 20>;

// The zero address is the null token: "no injection", "native currency".
constexpr Address NULL_ADDRESS = {};

namespace addresses {

// Helper to create a low address from an integer (0x00..00NNNN)
constexpr Address from_u64(uint64_t value) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFF);
    }
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (size_t i = 0; i < addr.size(); ++i) {
        if (addr[i] != 0) return false;
    }
    return true;
}

} // namespace addresses

struct AddressHash {
    size_t operator()(const Address& a) const noexcept {
        uint64_t h = 0;
        for (uint8_t b : a) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

// =============================================================================
// Amounts
// =============================================================================

// Token and native amounts. ABI words carry them in their low 16 bytes.
using U128 = unsigned __int128;

constexpr U128 U128_MAX = ~U128(0);

inline bool add_overflows(U128 a, U128 b) {
    return a > U128_MAX - b;
}

inline std::string to_string(U128 value) {
    if (value == 0) return "0";
    std::string out;
    while (value != 0) {
        out.insert(out.begin(), static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    return out;
}

// =============================================================================
// Payloads
// =============================================================================

using Bytes = std::vector<uint8_t>;

// 4-byte function identifier, big-endian as it appears in calldata
using Selector = uint32_t;

// =============================================================================
// Batch Instructions
// =============================================================================

// Transfer-in of caller funds. Zero amounts are no-ops.
struct TokenPull {
    Address token;
    U128 amount;
};

// Temporary spending right for a whitelisted counterparty
struct Approval {
    Address token;
    Address spender;
    U128 amount;
    bool revoke_after;   // reset to zero once the call stage is done
};

// External call against a whitelisted target.
// inject_token == NULL_ADDRESS disables injection.
struct Call {
    Address target;
    U128 value;
    Bytes payload;
    Address inject_token;
    uint64_t inject_offset;
};

struct Batch {
    std::vector<TokenPull> pulls;
    std::vector<Approval> approvals;
    std::vector<Call> calls;
    std::vector<Address> tokens_to_flush;
};

} // namespace aequi

#endif // AEQUI_TYPES_HPP
