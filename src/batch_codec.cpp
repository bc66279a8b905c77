// =============================================================================
// batch_codec.cpp - execute() Calldata and Return Data
// =============================================================================

#include "aequi/batch_codec.hpp"
#include "aequi/abi.hpp"

namespace aequi {

using abi::Decoder;
using abi::Encoder;

namespace {

constexpr size_t PULL_WORDS = 2;
constexpr size_t APPROVAL_WORDS = 4;

} // namespace

Bytes encode_execute(const Batch& batch) {
    std::vector<Bytes> pulls;
    for (const auto& pull : batch.pulls) {
        pulls.push_back(Encoder().add_address(pull.token).add_uint(pull.amount).finish());
    }

    std::vector<Bytes> approvals;
    for (const auto& approval : batch.approvals) {
        approvals.push_back(Encoder()
                                .add_address(approval.token)
                                .add_address(approval.spender)
                                .add_uint(approval.amount)
                                .add_bool(approval.revoke_after)
                                .finish());
    }

    // Call tuples are dynamic (they carry `bytes`)
    std::vector<Bytes> calls;
    for (const auto& call : batch.calls) {
        calls.push_back(Encoder()
                            .add_address(call.target)
                            .add_uint(call.value)
                            .add_bytes(call.payload)
                            .add_address(call.inject_token)
                            .add_uint(call.inject_offset)
                            .finish());
    }

    std::vector<Bytes> flush;
    for (const auto& token : batch.tokens_to_flush) {
        flush.push_back(Encoder().add_address(token).finish());
    }

    return Encoder()
        .add_dynamic(abi::encode_static_array(pulls))
        .add_dynamic(abi::encode_static_array(approvals))
        .add_dynamic(abi::encode_dynamic_array(calls))
        .add_dynamic(abi::encode_static_array(flush))
        .finish_with_selector(EXECUTE_SELECTOR);
}

Batch decode_execute(const Bytes& calldata) {
    if (abi::load_selector(calldata) != EXECUTE_SELECTOR) {
        throw abi::AbiError("not an execute() call");
    }
    Decoder args(calldata.data() + abi::SELECTOR_SIZE, calldata.size() - abi::SELECTOR_SIZE);
    Batch batch;

    auto [pull_count, pulls] = args.array_at(0);
    for (size_t i = 0; i < pull_count; ++i) {
        Decoder tuple = pulls.inline_at(i * PULL_WORDS);
        batch.pulls.push_back({tuple.address_at(0), tuple.uint_at(1)});
    }

    auto [approval_count, approvals] = args.array_at(1);
    for (size_t i = 0; i < approval_count; ++i) {
        Decoder tuple = approvals.inline_at(i * APPROVAL_WORDS);
        batch.approvals.push_back(
            {tuple.address_at(0), tuple.address_at(1), tuple.uint_at(2), tuple.bool_at(3)});
    }

    auto [call_count, calls] = args.array_at(2);
    for (size_t i = 0; i < call_count; ++i) {
        Decoder tuple = calls.dynamic_at(i);
        Call call;
        call.target = tuple.address_at(0);
        call.value = tuple.uint_at(1);
        call.payload = tuple.bytes_at(2);
        call.inject_token = tuple.address_at(3);
        call.inject_offset = tuple.uint64_at(4);
        batch.calls.push_back(std::move(call));
    }

    auto [flush_count, flush] = args.array_at(3);
    for (size_t i = 0; i < flush_count; ++i) {
        batch.tokens_to_flush.push_back(flush.address_at(i));
    }

    return batch;
}

Bytes encode_results(const std::vector<Bytes>& results) {
    std::vector<Bytes> elements;
    elements.reserve(results.size());
    for (const auto& result : results) {
        elements.push_back(abi::encode_bytes(result));
    }
    return Encoder().add_dynamic(abi::encode_dynamic_array(elements)).finish();
}

std::vector<Bytes> decode_results(const Bytes& output) {
    Decoder decoder(output);
    auto [count, elements] = decoder.array_at(0);
    std::vector<Bytes> results;
    results.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        results.push_back(elements.bytes_at(i));
    }
    return results;
}

} // namespace aequi
