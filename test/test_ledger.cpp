// Host ledger, reference token and token client

#include <catch2/catch_test_macros.hpp>

#include "fixture.hpp"

#include <algorithm>
#include <stdexcept>

using namespace aequi;
using namespace aequi::test;

namespace {

const Address ALICE = addresses::from_u64(0x1);
const Address BOB = addresses::from_u64(0x2);
const Address TOKEN = addresses::from_u64(0x7000);

class Thrower : public Contract {
public:
    CallResult on_call(Host& host, const Message& msg, const Bytes&) override {
        host.emit_log(LogEntry{msg.recipient, "BeforeThrow", {}});
        throw std::runtime_error("boom");
    }
};

class Recurser : public Contract {
public:
    explicit Recurser(Ledger& ledger) : ledger_(ledger) {}

    CallResult on_call(Host& host, const Message& msg, const Bytes& input) override {
        deepest = std::max(deepest, ledger_.depth());
        CallResult inner = host.call(msg.recipient, msg.recipient, 0, input);
        if (!inner.success) {
            ++failures;
        }
        return CallResult::ok();
    }

    size_t deepest = 0;
    size_t failures = 0;

private:
    Ledger& ledger_;
};

// Changes state in one of three ways, chosen by the first input byte
class Writer : public Contract {
public:
    CallResult on_call(Host& host, const Message& msg, const Bytes& input) override {
        switch (input.empty() ? 0 : input[0]) {
        case 0:
            host.store(msg.recipient, Bytes{1}, 7);
            break;
        case 1:
            host.emit_log(LogEntry{msg.recipient, "Written", {}});
            break;
        default:
            return host.call(msg.recipient, ALICE, 1, {});
        }
        return CallResult::ok();
    }
};

} // namespace

TEST_CASE("Ledger value transfers", "[ledger]") {
    Ledger ledger;
    ledger.fund(ALICE, 100);

    SECTION("plain accounts receive value") {
        CallResult result = ledger.call(ALICE, BOB, 40, {});
        REQUIRE(result.success);
        REQUIRE(result.output.empty());
        REQUIRE(ledger.native_balance(ALICE) == U128(60));
        REQUIRE(ledger.native_balance(BOB) == U128(40));
    }

    SECTION("insufficient balance fails without effects") {
        CallResult result = ledger.call(ALICE, BOB, 101, {});
        REQUIRE_FALSE(result.success);
        REQUIRE(ledger.native_balance(ALICE) == U128(100));
        REQUIRE(ledger.native_balance(BOB) == U128(0));
    }

    SECTION("no checkpoint stays open") {
        REQUIRE(ledger.call(ALICE, BOB, 1, {}).success);
        REQUIRE(ledger.open_checkpoints() == 0);
    }

    SECTION("a credit that would overflow the recipient fails without effects") {
        ledger.fund(BOB, U128_MAX);
        CallResult result = ledger.call(ALICE, BOB, 1, {});
        REQUIRE_FALSE(result.success);
        REQUIRE(ledger.native_balance(ALICE) == U128(100));
        REQUIRE(ledger.native_balance(BOB) == U128_MAX);
        REQUIRE(ledger.open_checkpoints() == 0);
    }

    SECTION("sending to oneself keeps the balance") {
        REQUIRE(ledger.call(ALICE, ALICE, 100, {}).success);
        REQUIRE(ledger.native_balance(ALICE) == U128(100));
    }
}

TEST_CASE("Ledger journaling", "[ledger]") {
    Ledger ledger;
    ledger.fund(ALICE, 100);
    ledger.store(TOKEN, Bytes{1}, 5);

    SECTION("rollback restores balances, storage and logs") {
        auto cp = ledger.checkpoint();
        REQUIRE(ledger.call(ALICE, BOB, 30, {}).success);
        ledger.store(TOKEN, Bytes{1}, 9);
        ledger.emit_log(LogEntry{TOKEN, "Touched", {}});
        ledger.rollback(cp);

        REQUIRE(ledger.native_balance(ALICE) == U128(100));
        REQUIRE(ledger.load(TOKEN, Bytes{1}) == U128(5));
        REQUIRE(ledger.logs().empty());
    }

    SECTION("nested checkpoints unwind innermost first") {
        auto outer = ledger.checkpoint();
        ledger.store(TOKEN, Bytes{1}, 6);
        auto inner = ledger.checkpoint();
        ledger.store(TOKEN, Bytes{1}, 7);

        REQUIRE_THROWS_AS(ledger.rollback(outer), std::logic_error);

        ledger.rollback(inner);
        REQUIRE(ledger.load(TOKEN, Bytes{1}) == U128(6));
        ledger.commit(outer);
        REQUIRE(ledger.load(TOKEN, Bytes{1}) == U128(6));
        REQUIRE(ledger.open_checkpoints() == 0);
    }

    SECTION("a throwing contract is rolled back and the exception propagates") {
        Thrower thrower;
        ledger.deploy(BOB, &thrower);
        REQUIRE_THROWS_AS(ledger.call(ALICE, BOB, 10, {}), std::runtime_error);
        REQUIRE(ledger.native_balance(ALICE) == U128(100));
        REQUIRE(ledger.logs().empty());
        REQUIRE(ledger.depth() == 0);
        REQUIRE(ledger.open_checkpoints() == 0);
    }
}

TEST_CASE("Ledger call depth limit", "[ledger]") {
    Ledger ledger;
    Recurser recurser(ledger);
    ledger.deploy(BOB, &recurser);

    REQUIRE(ledger.call(ALICE, BOB, 0, Bytes{0x01}).success);
    REQUIRE(recurser.deepest == Ledger::MAX_CALL_DEPTH);
    REQUIRE(recurser.failures == 1);
    REQUIRE(ledger.depth() == 0);
}

TEST_CASE("Ledger static calls", "[ledger]") {
    Ledger ledger;
    Writer writer;
    ledger.deploy(BOB, &writer);
    ledger.fund(BOB, 10);

    SECTION("a state change fails the frame without effects") {
        for (uint8_t mode : {0, 1, 2}) {
            REQUIRE_FALSE(ledger.static_call(ALICE, BOB, Bytes{mode}).success);
        }
        REQUIRE(ledger.load(BOB, Bytes{1}) == U128(0));
        REQUIRE(ledger.logs().empty());
        REQUIRE(ledger.native_balance(BOB) == U128(10));
        REQUIRE(ledger.native_balance(ALICE) == U128(0));
        REQUIRE_FALSE(ledger.in_static_call());
        REQUIRE(ledger.depth() == 0);
        REQUIRE(ledger.open_checkpoints() == 0);
    }

    SECTION("the same calls succeed outside a static frame") {
        REQUIRE(ledger.call(ALICE, BOB, 0, Bytes{0}).success);
        REQUIRE(ledger.call(ALICE, BOB, 0, Bytes{2}).success);
        REQUIRE(ledger.load(BOB, Bytes{1}) == U128(7));
        REQUIRE(ledger.native_balance(ALICE) == U128(1));
    }

    SECTION("token views are read-only") {
        Erc20Token token(TOKEN);
        ledger.deploy(TOKEN, &token);
        token.mint(ledger, ALICE, 500);

        CallResult result = ledger.static_call(BOB, TOKEN, erc20::encode_balance_of(ALICE));
        REQUIRE(result.success);
        REQUIRE(abi::read_uint_at(result.output, 0) == U128(500));

        REQUIRE_FALSE(ledger.static_call(ALICE, TOKEN, erc20::encode_transfer(BOB, 1)).success);
        REQUIRE(token.balance_of(ledger, ALICE) == U128(500));
        REQUIRE(token.balance_of(ledger, BOB) == U128(0));
    }

    SECTION("a write ahead of a throw is reported as a failed frame") {
        Thrower thrower;
        ledger.deploy(TOKEN, &thrower);
        REQUIRE_FALSE(ledger.static_call(ALICE, TOKEN, {}).success);
        REQUIRE_THROWS_AS(ledger.call(ALICE, TOKEN, 0, {}), std::runtime_error);
        REQUIRE_FALSE(ledger.in_static_call());
        REQUIRE(ledger.open_checkpoints() == 0);
    }
}

TEST_CASE("Erc20Token", "[token]") {
    Ledger ledger;
    Erc20Token token(TOKEN);
    ledger.deploy(TOKEN, &token);
    token.mint(ledger, ALICE, 500);

    SECTION("transfer moves balance and returns true") {
        CallResult result = ledger.call(ALICE, TOKEN, 0, erc20::encode_transfer(BOB, 200));
        REQUIRE(result.success);
        REQUIRE(result.output == word_bytes(1));
        REQUIRE(token.balance_of(ledger, ALICE) == U128(300));
        REQUIRE(token.balance_of(ledger, BOB) == U128(200));
        REQUIRE(token.total_supply(ledger) == U128(500));
    }

    SECTION("transferFrom consumes allowance") {
        REQUIRE(ledger.call(ALICE, TOKEN, 0, erc20::encode_approve(BOB, 150)).success);
        REQUIRE(ledger.call(BOB, TOKEN, 0, erc20::encode_transfer_from(ALICE, BOB, 100)).success);
        REQUIRE(token.allowance(ledger, ALICE, BOB) == U128(50));
        REQUIRE_FALSE(ledger.call(BOB, TOKEN, 0, erc20::encode_transfer_from(ALICE, BOB, 51)).success);
    }

    SECTION("overdraft reverts with a reason") {
        CallResult result = ledger.call(ALICE, TOKEN, 0, erc20::encode_transfer(BOB, 501));
        REQUIRE_FALSE(result.success);
        REQUIRE(abi::load_selector(result.output) == ERROR_STRING_SELECTOR);
    }

    SECTION("view functions") {
        CallResult result = ledger.call(BOB, TOKEN, 0, erc20::encode_balance_of(ALICE));
        REQUIRE(result.success);
        REQUIRE(abi::read_uint_at(result.output, 0) == U128(500));
        result = ledger.call(BOB, TOKEN, 0, erc20::encode_total_supply());
        REQUIRE(abi::read_uint_at(result.output, 0) == U128(500));
    }

    SECTION("unknown selectors and value are rejected") {
        REQUIRE_FALSE(ledger.call(ALICE, TOKEN, 0, Bytes{0xde, 0xad, 0xbe, 0xef}).success);
        ledger.fund(ALICE, 1);
        REQUIRE_FALSE(ledger.call(ALICE, TOKEN, 1, erc20::encode_transfer(BOB, 1)).success);
        REQUIRE(ledger.native_balance(ALICE) == U128(1));
    }
}

TEST_CASE("TokenClient return conventions", "[erc20]") {
    Ledger ledger;
    erc20::TokenClient client(ledger, ALICE);

    SECTION("strict bool token") {
        Erc20Token token(TOKEN, ReturnStyle::Bool);
        ledger.deploy(TOKEN, &token);
        token.mint(ledger, ALICE, 10);
        REQUIRE(client.transfer(TOKEN, BOB, 10));
        REQUIRE_FALSE(client.transfer(TOKEN, BOB, 1));
    }

    SECTION("token without return value") {
        Erc20Token token(TOKEN, ReturnStyle::None);
        ledger.deploy(TOKEN, &token);
        token.mint(ledger, ALICE, 10);
        REQUIRE(client.transfer(TOKEN, BOB, 10));
        REQUIRE(token.balance_of(ledger, BOB) == U128(10));
        REQUIRE_FALSE(client.transfer(TOKEN, BOB, 1));
    }

    SECTION("token returning false is a failure") {
        Erc20Token token(TOKEN, ReturnStyle::FalseOnFailure);
        ledger.deploy(TOKEN, &token);
        token.mint(ledger, ALICE, 10);
        REQUIRE_FALSE(client.transfer(TOKEN, BOB, 11));
        REQUIRE(client.transfer(TOKEN, BOB, 10));
    }

    SECTION("address without code is a failure") {
        REQUIRE_FALSE(client.transfer(TOKEN, BOB, 1));
        REQUIRE_FALSE(client.approve(TOKEN, BOB, 1));
        REQUIRE_THROWS_AS(client.balance_of(TOKEN, ALICE), CallFailed);
    }

    SECTION("force approve passes through zero") {
        Erc20Token token(TOKEN);
        token.set_approve_requires_zero(true);
        ledger.deploy(TOKEN, &token);

        REQUIRE(client.approve(TOKEN, BOB, 5));
        REQUIRE_FALSE(client.approve(TOKEN, BOB, 7));
        REQUIRE(client.force_approve(TOKEN, BOB, 7));
        REQUIRE(token.allowance(ledger, ALICE, BOB) == U128(7));
    }

    SECTION("balance query") {
        Erc20Token token(TOKEN);
        ledger.deploy(TOKEN, &token);
        token.mint(ledger, BOB, 42);
        REQUIRE(client.balance_of(TOKEN, BOB) == U128(42));
    }
}
