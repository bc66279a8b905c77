// =============================================================================
// erc20.cpp - ERC-20 Token Client
// =============================================================================

#include "aequi/erc20.hpp"
#include "aequi/abi.hpp"
#include "aequi/errors.hpp"

namespace aequi::erc20 {

using abi::Encoder;

// =============================================================================
// Calldata Builders
// =============================================================================

Bytes encode_transfer(const Address& to, U128 amount) {
    return Encoder().add_address(to).add_uint(amount).finish_with_selector(selectors::TRANSFER);
}

Bytes encode_transfer_from(const Address& from, const Address& to, U128 amount) {
    return Encoder().add_address(from).add_address(to).add_uint(amount)
        .finish_with_selector(selectors::TRANSFER_FROM);
}

Bytes encode_approve(const Address& spender, U128 amount) {
    return Encoder().add_address(spender).add_uint(amount).finish_with_selector(selectors::APPROVE);
}

Bytes encode_balance_of(const Address& owner) {
    return Encoder().add_address(owner).finish_with_selector(selectors::BALANCE_OF);
}

Bytes encode_allowance(const Address& owner, const Address& spender) {
    return Encoder().add_address(owner).add_address(spender).finish_with_selector(selectors::ALLOWANCE);
}

Bytes encode_total_supply() {
    return Encoder().finish_with_selector(selectors::TOTAL_SUPPLY);
}

bool call_succeeded(const Host& host, const Address& token, const CallResult& result) {
    if (!result.success) {
        return false;
    }
    if (result.output.empty()) {
        // Calls to accounts without code "succeed" vacuously
        return host.has_code(token);
    }
    if (result.output.size() < abi::WORD_SIZE) {
        return false;
    }
    try {
        return abi::decode_bool(result.output.data());
    } catch (const abi::AbiError&) {
        return false;
    }
}

// =============================================================================
// TokenClient
// =============================================================================

bool TokenClient::call_optional_return(const Address& token, const Bytes& input) {
    CallResult result = host_.call(self_, token, 0, input);
    return call_succeeded(host_, token, result);
}

bool TokenClient::transfer(const Address& token, const Address& to, U128 amount) {
    return call_optional_return(token, encode_transfer(to, amount));
}

bool TokenClient::transfer_from(const Address& token, const Address& from, const Address& to,
                                U128 amount) {
    return call_optional_return(token, encode_transfer_from(from, to, amount));
}

bool TokenClient::approve(const Address& token, const Address& spender, U128 amount) {
    return call_optional_return(token, encode_approve(spender, amount));
}

bool TokenClient::force_approve(const Address& token, const Address& spender, U128 amount) {
    if (!approve(token, spender, 0)) {
        return false;
    }
    return approve(token, spender, amount);
}

U128 TokenClient::balance_of(const Address& token, const Address& account) const {
    CallResult result = host_.static_call(self_, token, encode_balance_of(account));
    if (!result.success) {
        throw CallFailed(token, std::move(result.output));
    }
    if (result.output.size() < abi::WORD_SIZE) {
        throw CallFailed(token, Bytes{});
    }
    try {
        return abi::decode_uint(result.output.data());
    } catch (const abi::AbiError&) {
        throw CallFailed(token, Bytes{});
    }
}

} // namespace aequi::erc20
