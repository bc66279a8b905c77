#ifndef AEQUI_INJECTOR_HPP
#define AEQUI_INJECTOR_HPP

#include <optional>
#include <unordered_map>
#include <vector>

#include "erc20.hpp"
#include "registry.hpp"

namespace aequi {

// =============================================================================
// PulledLedger - summed pull amount per distinct token, first-seen order
// =============================================================================

class PulledLedger {
public:
    PulledLedger() = default;

    // Zero-amount pulls are skipped. Throws ArithmeticOverflow when a sum overflows.
    static PulledLedger build(const std::vector<TokenPull>& pulls);

    // Summed pull amount, none when the token was not pulled
    std::optional<U128> pulled(const Address& token) const;

    const std::vector<TokenPull>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<TokenPull> entries_;
    std::unordered_map<Address, size_t, AddressHash> index_;
};

// =============================================================================
// Injection validation
// =============================================================================

// Cross-checks `offset` against the offset registered for the payload's
// selector. Returns the selector.
Selector validate_selector_offset(const Registry& registry, const Bytes& payload, uint64_t offset);

// Throws InvalidInjectionOffset unless a full word fits at `offset`
void check_injection_bounds(const Bytes& payload, uint64_t offset);

// Both checks above, for dry runs
Selector validate_injection(const Registry& registry, const Bytes& payload, uint64_t offset);

// =============================================================================
// Injector - patches live balances into outgoing call payloads
// =============================================================================

class Injector {
public:
    Injector(const Registry& registry, const PulledLedger& pulled, const erc20::TokenClient& tokens)
        : registry_(registry), pulled_(pulled), tokens_(tokens) {}

    // min(balance held, summed pull amount); unbounded by pulls for tokens
    // that were not pulled
    U128 injectable_amount(const Address& token) const;

    // Payload to send for `call`: unchanged when injection is disabled,
    // otherwise a copy with the amount word overwritten. Selector and offset
    // are checked before the balance read, the word bounds after the
    // zero-amount check.
    Bytes prepare(const Call& call) const;

private:
    const Registry& registry_;
    const PulledLedger& pulled_;
    const erc20::TokenClient& tokens_;
};

} // namespace aequi

#endif // AEQUI_INJECTOR_HPP
