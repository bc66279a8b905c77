// =============================================================================
// token.cpp - Reference ERC-20 Token Contract
// =============================================================================

#include "aequi/token.hpp"
#include "aequi/abi.hpp"
#include "aequi/erc20.hpp"

#include <stdexcept>

namespace aequi {

namespace {

// Storage layout: tag byte followed by the account address(es)
constexpr uint8_t BALANCE_TAG = 0x01;
constexpr uint8_t ALLOWANCE_TAG = 0x02;
constexpr uint8_t SUPPLY_TAG = 0x03;

Bytes balance_key(const Address& owner) {
    Bytes key{BALANCE_TAG};
    key.insert(key.end(), owner.begin(), owner.end());
    return key;
}

Bytes allowance_key(const Address& owner, const Address& spender) {
    Bytes key{ALLOWANCE_TAG};
    key.insert(key.end(), owner.begin(), owner.end());
    key.insert(key.end(), spender.begin(), spender.end());
    return key;
}

Bytes supply_key() {
    return Bytes{SUPPLY_TAG};
}

Bytes word(const abi::Word& w) {
    return Bytes(w.begin(), w.end());
}

} // namespace

// =============================================================================
// Direct state access
// =============================================================================

void Erc20Token::mint(Host& host, const Address& to, U128 amount) const {
    U128 supply = total_supply(host);
    if (add_overflows(supply, amount)) {
        throw std::overflow_error("Erc20Token: total supply overflow");
    }
    host.store(address_, supply_key(), supply + amount);
    host.store(address_, balance_key(to), balance_of(host, to) + amount);
}

U128 Erc20Token::balance_of(const Host& host, const Address& owner) const {
    return host.load(address_, balance_key(owner));
}

U128 Erc20Token::allowance(const Host& host, const Address& owner, const Address& spender) const {
    return host.load(address_, allowance_key(owner, spender));
}

U128 Erc20Token::total_supply(const Host& host) const {
    return host.load(address_, supply_key());
}

// =============================================================================
// Contract entry
// =============================================================================

CallResult Erc20Token::on_call(Host& host, const Message& msg, const Bytes& input) {
    if (msg.value != 0) {
        return fail("ERC20: non-payable");
    }
    try {
        return dispatch(host, msg, input);
    } catch (const abi::AbiError&) {
        return CallResult::revert();
    }
}

CallResult Erc20Token::dispatch(Host& host, const Message& msg, const Bytes& input) {
    Selector selector = abi::load_selector(input);
    abi::Decoder args(input.data() + abi::SELECTOR_SIZE, input.size() - abi::SELECTOR_SIZE);
    std::string reason;

    switch (selector) {
        case erc20::selectors::TRANSFER: {
            if (!do_transfer(host, msg.sender, args.address_at(0), args.uint_at(1), reason)) {
                return fail(reason);
            }
            return succeed();
        }
        case erc20::selectors::TRANSFER_FROM: {
            Address from = args.address_at(0);
            Address to = args.address_at(1);
            U128 amount = args.uint_at(2);
            U128 allowed = allowance(host, from, msg.sender);
            if (allowed < amount) {
                return fail("ERC20: insufficient allowance");
            }
            if (!do_transfer(host, from, to, amount, reason)) {
                return fail(reason);
            }
            if (allowed != U128_MAX) {
                host.store(address_, allowance_key(from, msg.sender), allowed - amount);
            }
            return succeed();
        }
        case erc20::selectors::APPROVE: {
            if (!do_approve(host, msg.sender, args.address_at(0), args.uint_at(1), reason)) {
                return fail(reason);
            }
            return succeed();
        }
        case erc20::selectors::BALANCE_OF:
            return CallResult::ok(word(abi::encode_uint(balance_of(host, args.address_at(0)))));
        case erc20::selectors::ALLOWANCE:
            return CallResult::ok(
                word(abi::encode_uint(allowance(host, args.address_at(0), args.address_at(1)))));
        case erc20::selectors::TOTAL_SUPPLY:
            return CallResult::ok(word(abi::encode_uint(total_supply(host))));
        default:
            return CallResult::revert();
    }
}

// =============================================================================
// State transitions
// =============================================================================

bool Erc20Token::do_transfer(Host& host, const Address& from, const Address& to, U128 amount,
                             std::string& reason) const {
    if (addresses::is_zero(to)) {
        reason = "ERC20: transfer to the zero address";
        return false;
    }
    if (blocked_.count(from) > 0 || blocked_.count(to) > 0) {
        reason = "ERC20: account blocked";
        return false;
    }
    U128 from_balance = balance_of(host, from);
    if (from_balance < amount) {
        reason = "ERC20: transfer amount exceeds balance";
        return false;
    }
    host.store(address_, balance_key(from), from_balance - amount);
    host.store(address_, balance_key(to), balance_of(host, to) + amount);
    return true;
}

bool Erc20Token::do_approve(Host& host, const Address& owner, const Address& spender, U128 amount,
                            std::string& reason) const {
    if (addresses::is_zero(spender)) {
        reason = "ERC20: approve to the zero address";
        return false;
    }
    if (blocked_.count(owner) > 0 || blocked_.count(spender) > 0) {
        reason = "ERC20: account blocked";
        return false;
    }
    if (approve_requires_zero_ && amount != 0 && allowance(host, owner, spender) != 0) {
        reason = "ERC20: approve from non-zero to non-zero allowance";
        return false;
    }
    host.store(address_, allowance_key(owner, spender), amount);
    return true;
}

CallResult Erc20Token::succeed() const {
    if (style_ == ReturnStyle::None) {
        return CallResult::ok();
    }
    return CallResult::ok(word(abi::encode_bool(true)));
}

CallResult Erc20Token::fail(const std::string& reason) const {
    if (style_ == ReturnStyle::FalseOnFailure) {
        return CallResult::ok(word(abi::encode_bool(false)));
    }
    Bytes message(reason.begin(), reason.end());
    return CallResult::revert(abi::Encoder().add_bytes(message).finish_with_selector(ERROR_STRING_SELECTOR));
}

} // namespace aequi
