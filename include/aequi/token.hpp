#ifndef AEQUI_TOKEN_HPP
#define AEQUI_TOKEN_HPP

#include <string>
#include <unordered_set>

#include "host.hpp"

namespace aequi {

// =============================================================================
// Erc20Token - reference ERC-20 contract running on a Host
// =============================================================================

// Error(string) selector used for revert reasons
constexpr Selector ERROR_STRING_SELECTOR = 0x08c379a0;

enum class ReturnStyle {
    Bool,             // returns true, reverts on failure
    None,             // returns nothing, reverts on failure (USDT-style)
    FalseOnFailure,   // returns false instead of reverting
};

class Erc20Token : public Contract {
public:
    explicit Erc20Token(const Address& address, ReturnStyle style = ReturnStyle::Bool)
        : address_(address), style_(style) {}

    CallResult on_call(Host& host, const Message& msg, const Bytes& input) override;

    // Reject approve() changing a non-zero allowance to another non-zero value
    void set_approve_requires_zero(bool enabled) { approve_requires_zero_ = enabled; }

    // Every transfer or approval touching a blocked account fails
    void block(const Address& account) { blocked_.insert(account); }
    void unblock(const Address& account) { blocked_.erase(account); }

    // =========================================================================
    // Direct state access (setup and assertions)
    // =========================================================================

    void mint(Host& host, const Address& to, U128 amount) const;

    U128 balance_of(const Host& host, const Address& owner) const;
    U128 allowance(const Host& host, const Address& owner, const Address& spender) const;
    U128 total_supply(const Host& host) const;

    const Address& address() const { return address_; }

private:
    CallResult dispatch(Host& host, const Message& msg, const Bytes& input);

    bool do_transfer(Host& host, const Address& from, const Address& to, U128 amount,
                     std::string& reason) const;
    bool do_approve(Host& host, const Address& owner, const Address& spender, U128 amount,
                    std::string& reason) const;

    CallResult succeed() const;
    CallResult fail(const std::string& reason) const;

    Address address_;
    ReturnStyle style_;
    bool approve_requires_zero_{false};
    std::unordered_set<Address, AddressHash> blocked_;
};

} // namespace aequi

#endif // AEQUI_TOKEN_HPP
