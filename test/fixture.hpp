#ifndef AEQUI_TEST_FIXTURE_HPP
#define AEQUI_TEST_FIXTURE_HPP

#include <aequi/aequi.hpp>
#include <catch2/catch_tostring.hpp>

#include "mock_router.hpp"

namespace Catch {
template <>
struct StringMaker<unsigned __int128> {
    static std::string convert(unsigned __int128 value) { return aequi::to_string(value); }
};
} // namespace Catch

namespace aequi::test {

inline Bytes word_bytes(U128 value) {
    abi::Word word = abi::encode_uint(value);
    return Bytes(word.begin(), word.end());
}

// One ledger with two tokens, a whitelisted router and an executor.
// The user holds 1000 A and has approved the executor for all of it;
// the router holds inventory of both tokens.
struct Env {
    Ledger ledger;
    Address owner = addresses::from_u64(0x0A);
    Address user = addresses::from_u64(0x0B);
    Erc20Token token_a{addresses::from_u64(0xA000)};
    Erc20Token token_b{addresses::from_u64(0xB000)};
    MockRouter router{addresses::from_u64(0x5000)};
    Registry registry{owner, Registry::DEFAULT_MAX_ADMIN_BATCH, {router.address()}};
    Executor executor{addresses::from_u64(0xE000), registry};

    Env() {
        ledger.deploy(token_a.address(), &token_a);
        ledger.deploy(token_b.address(), &token_b);
        ledger.deploy(router.address(), &router);
        ledger.deploy(executor.address(), &executor);

        token_a.mint(ledger, user, 1000);
        token_a.mint(ledger, router.address(), 1'000'000);
        token_b.mint(ledger, router.address(), 1'000'000);
        ledger.call(user, token_a.address(), 0, erc20::encode_approve(executor.address(), U128_MAX));
    }

    const Address& a() const { return token_a.address(); }
    const Address& b() const { return token_b.address(); }
    const Address& exec() const { return executor.address(); }

    U128 balance_a(const Address& who) const { return token_a.balance_of(ledger, who); }
    U128 balance_b(const Address& who) const { return token_b.balance_of(ledger, who); }

    // Direct entry, no attached value
    std::vector<Bytes> execute(const Batch& batch) {
        return executor.execute(ledger, Message{user, exec(), 0}, batch);
    }

    // ABI entry through the host
    CallResult execute_call(const Batch& batch, U128 value = 0) {
        return ledger.call(user, exec(), value, encode_execute(batch));
    }

    // A -> B swap through the router, amount injected from the A balance
    Call swap_a_to_b(U128 placeholder = 1) const {
        Call call;
        call.target = router.address();
        call.value = 0;
        call.payload = encode_swap(placeholder, 0, {a(), b()}, exec());
        call.inject_token = a();
        call.inject_offset = 4;
        return call;
    }
};

} // namespace aequi::test

#endif // AEQUI_TEST_FIXTURE_HPP
