// ABI codec, hex helpers and error revert data

#include <catch2/catch_test_macros.hpp>

#include "fixture.hpp"

using namespace aequi;
using namespace aequi::test;

TEST_CASE("Word codecs", "[abi]") {
    SECTION("uint is big-endian in the low 16 bytes") {
        abi::Word word = abi::encode_uint(0x0102);
        REQUIRE(word[30] == 0x01);
        REQUIRE(word[31] == 0x02);
        for (size_t i = 0; i < 30; ++i) {
            REQUIRE(word[i] == 0);
        }
        REQUIRE(abi::decode_uint(word.data()) == U128(0x0102));
    }

    SECTION("uint above 128 bits is rejected") {
        abi::Word word{};
        word[15] = 1;
        REQUIRE_THROWS_AS(abi::decode_uint(word.data()), abi::AbiError);
    }

    SECTION("address with dirty padding is rejected") {
        abi::Word word = abi::encode_address(addresses::from_u64(0xBEEF));
        REQUIRE(abi::decode_address(word.data()) == addresses::from_u64(0xBEEF));
        word[0] = 0xFF;
        REQUIRE_THROWS_AS(abi::decode_address(word.data()), abi::AbiError);
    }

    SECTION("bool is strict") {
        REQUIRE(abi::decode_bool(abi::encode_bool(true).data()));
        REQUIRE_FALSE(abi::decode_bool(abi::encode_bool(false).data()));
        abi::Word two{};
        two[31] = 2;
        REQUIRE_THROWS_AS(abi::decode_bool(two.data()), abi::AbiError);
    }

    SECTION("selector round trip") {
        Bytes data(4);
        abi::store_selector(data.data(), 0x38ed1739);
        REQUIRE(data == Bytes{0x38, 0xed, 0x17, 0x39});
        REQUIRE(abi::load_selector(data) == 0x38ed1739u);
        REQUIRE_THROWS_AS(abi::load_selector(Bytes{0x38, 0xed}), abi::AbiError);
    }
}

TEST_CASE("Patching a word inside a payload", "[abi]") {
    Bytes payload(4 + 64, 0xAA);

    SECTION("only the addressed 32 bytes change") {
        abi::write_uint_at(payload, 4, 100);
        REQUIRE(abi::read_uint_at(payload, 4) == U128(100));
        for (size_t i = 0; i < 4; ++i) REQUIRE(payload[i] == 0xAA);
        for (size_t i = 36; i < payload.size(); ++i) REQUIRE(payload[i] == 0xAA);
    }

    SECTION("last full word is writable") {
        REQUIRE_NOTHROW(abi::write_uint_at(payload, 36, 7));
    }

    SECTION("writes past the end are rejected") {
        REQUIRE_THROWS_AS(abi::write_uint_at(payload, 37, 7), abi::AbiError);
        REQUIRE_THROWS_AS(abi::write_uint_at(payload, 1000, 7), abi::AbiError);
    }
}

TEST_CASE("Encoder head/tail layout", "[abi]") {
    SECTION("dynamic bytes") {
        Bytes encoded = abi::Encoder().add_bytes(Bytes{'a', 'b', 'c'}).finish();
        REQUIRE(encoded.size() == 96);
        REQUIRE(abi::Decoder(encoded).uint_at(0) == U128(32));
        REQUIRE(abi::Decoder(encoded).uint_at(1) == U128(3));
        REQUIRE(encoded[64] == 'a');
        REQUIRE(encoded[66] == 'c');
        REQUIRE(encoded[67] == 0);
        REQUIRE(abi::Decoder(encoded).bytes_at(0) == Bytes{'a', 'b', 'c'});
    }

    SECTION("static values stay in the head") {
        Bytes encoded = abi::Encoder()
                            .add_uint(1)
                            .add_bytes(Bytes{0x01})
                            .add_address(addresses::from_u64(2))
                            .finish();
        abi::Decoder decoder(encoded);
        REQUIRE(decoder.uint_at(0) == U128(1));
        REQUIRE(decoder.uint_at(1) == U128(96));
        REQUIRE(decoder.address_at(2) == addresses::from_u64(2));
        REQUIRE(decoder.bytes_at(1) == Bytes{0x01});
    }

    SECTION("truncated data is rejected") {
        Bytes encoded = abi::Encoder().add_bytes(Bytes(40, 0x11)).finish();
        encoded.resize(encoded.size() - 32);
        REQUIRE_THROWS_AS(abi::Decoder(encoded).bytes_at(0), abi::AbiError);
    }

    SECTION("array length larger than the data is rejected") {
        Bytes encoded = abi::Encoder().add_dynamic(abi::encode_static_array({})).finish();
        abi::write_uint_at(encoded, 32, 1'000'000);
        REQUIRE_THROWS_AS(abi::Decoder(encoded).array_at(0), abi::AbiError);
    }
}

TEST_CASE("execute() calldata", "[abi][codec]") {
    Batch batch;
    batch.pulls = {{addresses::from_u64(0xA), 100}, {addresses::from_u64(0xB), 0}};
    batch.approvals = {{addresses::from_u64(0xA), addresses::from_u64(0x5), 100, true}};
    Call call;
    call.target = addresses::from_u64(0x5);
    call.value = 3;
    call.payload = encode_swap(1, 0, {addresses::from_u64(0xA), addresses::from_u64(0xB)},
                               addresses::from_u64(0xE));
    call.inject_token = addresses::from_u64(0xA);
    call.inject_offset = 4;
    batch.calls = {call, Call{addresses::from_u64(0x6), 0, Bytes{}, NULL_ADDRESS, 0}};
    batch.tokens_to_flush = {addresses::from_u64(0xB), NULL_ADDRESS};

    Bytes calldata = encode_execute(batch);
    REQUIRE(abi::load_selector(calldata) == EXECUTE_SELECTOR);

    Batch decoded = decode_execute(calldata);
    REQUIRE(decoded.pulls.size() == 2);
    REQUIRE(decoded.pulls[0].amount == U128(100));
    REQUIRE(decoded.approvals.size() == 1);
    REQUIRE(decoded.approvals[0].revoke_after);
    REQUIRE(decoded.calls.size() == 2);
    REQUIRE(decoded.calls[0].payload == call.payload);
    REQUIRE(decoded.calls[0].value == U128(3));
    REQUIRE(decoded.calls[0].inject_offset == 4);
    REQUIRE(decoded.calls[1].payload.empty());
    REQUIRE(decoded.tokens_to_flush == batch.tokens_to_flush);

    SECTION("wrong selector") {
        calldata[0] ^= 0xFF;
        REQUIRE_THROWS_AS(decode_execute(calldata), abi::AbiError);
    }

    SECTION("results round trip") {
        std::vector<Bytes> results = {Bytes{}, Bytes(33, 0x7F), word_bytes(5)};
        REQUIRE(decode_results(encode_results(results)) == results);
    }
}

TEST_CASE("Hex helpers", "[abi][hex]") {
    REQUIRE(hex::encode(Bytes{0x00, 0xAB}) == "0x00ab");
    REQUIRE(hex::decode("0x00AB") == Bytes{0x00, 0xAB});
    REQUIRE(hex::decode_selector("0x38ed1739") == 0x38ed1739u);
    REQUIRE(hex::encode_selector(0x04e45aaf) == "0x04e45aaf");
    REQUIRE(hex::decode_address("0x000000000000000000000000000000000000beef") == addresses::from_u64(0xBEEF));
    REQUIRE_THROWS_AS(hex::decode("0x123"), std::invalid_argument);
    REQUIRE_THROWS_AS(hex::decode("0xzz"), std::invalid_argument);
    REQUIRE_THROWS_AS(hex::decode_address("0x1234"), std::invalid_argument);
}

TEST_CASE("Error revert data", "[abi][errors]") {
    SECTION("selector followed by the arguments") {
        OffsetMismatchForSelector error(0x38ed1739, 4, 68);
        const Bytes& data = error.revert_data();
        REQUIRE(data.size() == 4 + 3 * 32);
        REQUIRE(abi::load_selector(data) == error_selectors::OFFSET_MISMATCH_FOR_SELECTOR);
        REQUIRE(data[4] == 0x38);
        REQUIRE(data[7] == 0x39);
        REQUIRE(abi::read_uint_at(data, 36) == U128(4));
        REQUIRE(abi::read_uint_at(data, 68) == U128(68));
    }

    SECTION("argument-less errors are the bare selector") {
        REQUIRE(ZeroAmountNotAllowed().revert_data() == Bytes{0x0f, 0x43, 0x95, 0x6a});
        REQUIRE(ReentrantCall().revert_data() == Bytes{0x3e, 0xe5, 0xae, 0xb5});
    }

    SECTION("overflow is Panic(0x11)") {
        ArithmeticOverflow error;
        const Bytes& data = error.revert_data();
        REQUIRE(abi::load_selector(data) == error_selectors::PANIC);
        REQUIRE(abi::read_uint_at(data, 4) == U128(0x11));
    }

    SECTION("call failures forward the callee data") {
        Bytes raw{0xde, 0xad};
        CallFailed error(addresses::from_u64(1), raw);
        REQUIRE(error.revert_data() == raw);
        REQUIRE(error.target() == addresses::from_u64(1));
    }
}
