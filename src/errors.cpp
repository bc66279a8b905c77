// =============================================================================
// errors.cpp - Executor Error Taxonomy and Revert Data
// =============================================================================

#include "aequi/errors.hpp"
#include "aequi/abi.hpp"
#include "aequi/hex.hpp"

namespace aequi {

namespace {

using abi::Encoder;

Bytes encode_error(Selector selector, const Encoder& args = Encoder{}) {
    return args.finish_with_selector(selector);
}

std::string amount_str(U128 amount) {
    return to_string(amount);
}

} // namespace

// =============================================================================
// Configuration errors
// =============================================================================

InvalidOffset::InvalidOffset(uint64_t offset)
    : ExecutorError("invalid selector offset " + std::to_string(offset),
                    encode_error(error_selectors::INVALID_OFFSET, Encoder().add_uint(offset))) {}

InvalidSelectorForInjection::InvalidSelectorForInjection(Selector selector)
    : ExecutorError("selector " + hex::encode_selector(selector) + " is not registered for injection",
                    encode_error(error_selectors::INVALID_SELECTOR_FOR_INJECTION,
                                Encoder().add_selector(selector))) {}

OffsetMismatchForSelector::OffsetMismatchForSelector(Selector selector, uint64_t expected, uint64_t provided)
    : ExecutorError("injection offset " + std::to_string(provided) + " does not match offset " +
                        std::to_string(expected) + " registered for " + hex::encode_selector(selector),
                    encode_error(error_selectors::OFFSET_MISMATCH_FOR_SELECTOR,
                                Encoder().add_selector(selector).add_uint(expected).add_uint(provided))) {}

InvalidInjectionOffset::InvalidInjectionOffset(uint64_t offset, size_t payload_size)
    : ExecutorError("injection offset " + std::to_string(offset) + " out of bounds for payload of " +
                        std::to_string(payload_size) + " bytes",
                    encode_error(error_selectors::INVALID_INJECTION_OFFSET,
                                Encoder().add_uint(offset).add_uint(payload_size))) {}

// =============================================================================
// Precondition / authorization errors
// =============================================================================

BatchTooLarge::BatchTooLarge(size_t length, size_t maximum)
    : ExecutorError("batch of " + std::to_string(length) + " exceeds limit " + std::to_string(maximum),
                    encode_error(error_selectors::BATCH_TOO_LARGE,
                                Encoder().add_uint(length).add_uint(maximum))) {}

DuplicateTokenInFlush::DuplicateTokenInFlush(const Address& token)
    : ExecutorError("duplicate flush token " + hex::encode(token),
                    encode_error(error_selectors::DUPLICATE_TOKEN_IN_FLUSH, Encoder().add_address(token))) {}

TargetNotWhitelisted::TargetNotWhitelisted(const Address& target)
    : ExecutorError("target not whitelisted: " + hex::encode(target),
                    encode_error(error_selectors::TARGET_NOT_WHITELISTED, Encoder().add_address(target))) {}

SpenderNotWhitelisted::SpenderNotWhitelisted(const Address& spender)
    : ExecutorError("spender not whitelisted: " + hex::encode(spender),
                    encode_error(error_selectors::SPENDER_NOT_WHITELISTED, Encoder().add_address(spender))) {}

Unauthorized::Unauthorized(const Address& account)
    : ExecutorError("unauthorized account: " + hex::encode(account),
                    encode_error(error_selectors::UNAUTHORIZED_ACCOUNT, Encoder().add_address(account))) {}

InvalidOwner::InvalidOwner(const Address& owner)
    : ExecutorError("invalid owner: " + hex::encode(owner),
                    encode_error(error_selectors::INVALID_OWNER, Encoder().add_address(owner))) {}

ZeroAddress::ZeroAddress()
    : ExecutorError("zero address", encode_error(error_selectors::ZERO_ADDRESS)) {}

EnforcedPause::EnforcedPause()
    : ExecutorError("executor is paused", encode_error(error_selectors::ENFORCED_PAUSE)) {}

ExpectedPause::ExpectedPause()
    : ExecutorError("executor is not paused", encode_error(error_selectors::EXPECTED_PAUSE)) {}

// =============================================================================
// External-interaction errors
// =============================================================================

TokenPullFailed::TokenPullFailed(const Address& token, U128 amount)
    : ExecutorError("pull of " + amount_str(amount) + " " + hex::encode(token) + " failed",
                    encode_error(error_selectors::TOKEN_PULL_FAILED,
                                Encoder().add_address(token).add_uint(amount))) {}

TokenApprovalFailed::TokenApprovalFailed(const Address& token, const Address& spender, U128 amount)
    : ExecutorError("approval of " + amount_str(amount) + " " + hex::encode(token) + " to " +
                        hex::encode(spender) + " failed",
                    encode_error(error_selectors::TOKEN_APPROVAL_FAILED,
                                Encoder().add_address(token).add_address(spender).add_uint(amount))) {}

TokenFlushFailed::TokenFlushFailed(const Address& token, U128 amount)
    : ExecutorError("flush of " + amount_str(amount) + " " + hex::encode(token) + " failed",
                    encode_error(error_selectors::TOKEN_FLUSH_FAILED,
                                Encoder().add_address(token).add_uint(amount))) {}

NativeFlushFailed::NativeFlushFailed(U128 amount)
    : ExecutorError("native flush of " + amount_str(amount) + " failed",
                    encode_error(error_selectors::NATIVE_FLUSH_FAILED, Encoder().add_uint(amount))) {}

RescueFailed::RescueFailed(const Address& token, U128 amount)
    : ExecutorError("rescue of " + amount_str(amount) + " " + hex::encode(token) + " failed",
                    encode_error(error_selectors::RESCUE_FAILED,
                                Encoder().add_address(token).add_uint(amount))) {}

CallFailed::CallFailed(const Address& target, Bytes revert_data)
    : ExecutorError("call to " + hex::encode(target) + " failed", std::move(revert_data))
    , target_(target) {}

// =============================================================================
// Invariant errors
// =============================================================================

ZeroAmountNotAllowed::ZeroAmountNotAllowed()
    : ExecutorError("zero injectable amount", encode_error(error_selectors::ZERO_AMOUNT_NOT_ALLOWED)) {}

ReentrantCall::ReentrantCall()
    : ExecutorError("reentrant call", encode_error(error_selectors::REENTRANT_CALL)) {}

ArithmeticOverflow::ArithmeticOverflow()
    : ExecutorError("arithmetic overflow",
                    encode_error(error_selectors::PANIC, Encoder().add_uint(PANIC_ARITHMETIC_OVERFLOW))) {}

} // namespace aequi
