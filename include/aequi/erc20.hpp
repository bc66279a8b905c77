#ifndef AEQUI_ERC20_HPP
#define AEQUI_ERC20_HPP

#include "host.hpp"

namespace aequi::erc20 {

// =============================================================================
// ERC-20 Function Selectors
// =============================================================================

namespace selectors {
constexpr Selector TRANSFER = 0xa9059cbb;        // transfer(address,uint256)
constexpr Selector TRANSFER_FROM = 0x23b872dd;   // transferFrom(address,address,uint256)
constexpr Selector APPROVE = 0x095ea7b3;         // approve(address,uint256)
constexpr Selector BALANCE_OF = 0x70a08231;      // balanceOf(address)
constexpr Selector ALLOWANCE = 0xdd62ed3e;       // allowance(address,address)
constexpr Selector TOTAL_SUPPLY = 0x18160ddd;    // totalSupply()
}

// =============================================================================
// Calldata Builders
// =============================================================================

Bytes encode_transfer(const Address& to, U128 amount);
Bytes encode_transfer_from(const Address& from, const Address& to, U128 amount);
Bytes encode_approve(const Address& spender, U128 amount);
Bytes encode_balance_of(const Address& owner);
Bytes encode_allowance(const Address& owner, const Address& spender);
Bytes encode_total_supply();

// A token call succeeded iff the call itself succeeded and the return data is
// either empty (no-return tokens, provided the address has code) or a word
// decoding to true.
bool call_succeeded(const Host& host, const Address& token, const CallResult& result);

// =============================================================================
// TokenClient - token operations issued on behalf of one account
// =============================================================================

class TokenClient {
public:
    TokenClient(Host& host, const Address& self) : host_(host), self_(self) {}

    bool transfer(const Address& token, const Address& to, U128 amount);
    bool transfer_from(const Address& token, const Address& from, const Address& to, U128 amount);
    bool approve(const Address& token, const Address& spender, U128 amount);

    // approve(spender, 0) followed by approve(spender, amount)
    bool force_approve(const Address& token, const Address& spender, U128 amount);

    // Throws CallFailed on revert or malformed return data
    U128 balance_of(const Address& token, const Address& account) const;

    const Address& self() const { return self_; }

private:
    bool call_optional_return(const Address& token, const Bytes& input);

    Host& host_;
    Address self_;
};

} // namespace aequi::erc20

#endif // AEQUI_ERC20_HPP
