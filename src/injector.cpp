// =============================================================================
// injector.cpp - Pulled-Amount Ledger and Payload Injection
// =============================================================================

#include "aequi/injector.hpp"
#include "aequi/abi.hpp"
#include "aequi/errors.hpp"
#include "aequi/hex.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace aequi {

// =============================================================================
// PulledLedger
// =============================================================================

PulledLedger PulledLedger::build(const std::vector<TokenPull>& pulls) {
    PulledLedger ledger;
    for (const auto& pull : pulls) {
        if (pull.amount == 0) continue;

        auto it = ledger.index_.find(pull.token);
        if (it == ledger.index_.end()) {
            ledger.index_.emplace(pull.token, ledger.entries_.size());
            ledger.entries_.push_back(pull);
            continue;
        }
        TokenPull& entry = ledger.entries_[it->second];
        if (add_overflows(entry.amount, pull.amount)) {
            throw ArithmeticOverflow();
        }
        entry.amount += pull.amount;
    }
    return ledger;
}

std::optional<U128> PulledLedger::pulled(const Address& token) const {
    auto it = index_.find(token);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return entries_[it->second].amount;
}

// =============================================================================
// Injection validation
// =============================================================================

Selector validate_selector_offset(const Registry& registry, const Bytes& payload, uint64_t offset) {
    if (payload.size() < abi::SELECTOR_SIZE) {
        throw InvalidInjectionOffset(offset, payload.size());
    }
    Selector selector = abi::load_selector(payload);

    auto expected = registry.expected_offset(selector);
    if (!expected) {
        throw InvalidSelectorForInjection(selector);
    }
    if (offset != *expected) {
        throw OffsetMismatchForSelector(selector, *expected, offset);
    }
    return selector;
}

void check_injection_bounds(const Bytes& payload, uint64_t offset) {
    if (offset > payload.size() || payload.size() - offset < abi::WORD_SIZE) {
        throw InvalidInjectionOffset(offset, payload.size());
    }
}

Selector validate_injection(const Registry& registry, const Bytes& payload, uint64_t offset) {
    Selector selector = validate_selector_offset(registry, payload, offset);
    check_injection_bounds(payload, offset);
    return selector;
}

// =============================================================================
// Injector
// =============================================================================

U128 Injector::injectable_amount(const Address& token) const {
    U128 balance = tokens_.balance_of(token, tokens_.self());
    auto ceiling = pulled_.pulled(token);
    return ceiling ? std::min(balance, *ceiling) : balance;
}

Bytes Injector::prepare(const Call& call) const {
    if (addresses::is_zero(call.inject_token)) {
        return call.payload;
    }

    Selector selector = validate_selector_offset(registry_, call.payload, call.inject_offset);

    U128 amount = injectable_amount(call.inject_token);
    if (amount == 0) {
        throw ZeroAmountNotAllowed();
    }
    check_injection_bounds(call.payload, call.inject_offset);

    Bytes payload = call.payload;
    abi::write_uint_at(payload, static_cast<size_t>(call.inject_offset), amount);

    spdlog::debug("injector: {} of {} at offset {} for {}", to_string(amount),
                  hex::encode(call.inject_token), call.inject_offset, hex::encode_selector(selector));
    return payload;
}

} // namespace aequi
