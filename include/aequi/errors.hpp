#ifndef AEQUI_ERRORS_HPP
#define AEQUI_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

#include "types.hpp"

namespace aequi {

// =============================================================================
// Custom Error Selectors (keccak256 of the error signature, first 4 bytes)
// =============================================================================

namespace error_selectors {
constexpr Selector TARGET_NOT_WHITELISTED = 0x47ccabe7;           // TargetNotWhitelisted(address)
constexpr Selector SPENDER_NOT_WHITELISTED = 0xf1883d21;          // SpenderNotWhitelisted(address)
constexpr Selector TOKEN_PULL_FAILED = 0x376ecff8;                // TokenPullFailed(address,uint256)
constexpr Selector TOKEN_APPROVAL_FAILED = 0x3337e731;            // TokenApprovalFailed(address,address,uint256)
constexpr Selector INVALID_INJECTION_OFFSET = 0xce1957cf;         // InvalidInjectionOffset(uint256,uint256)
constexpr Selector INVALID_SELECTOR_FOR_INJECTION = 0xcbf81ed4;   // InvalidSelectorForInjection(bytes4)
constexpr Selector OFFSET_MISMATCH_FOR_SELECTOR = 0x90e4ee26;     // OffsetMismatchForSelector(bytes4,uint256,uint256)
constexpr Selector ZERO_AMOUNT_NOT_ALLOWED = 0x0f43956a;          // ZeroAmountNotAllowed()
constexpr Selector DUPLICATE_TOKEN_IN_FLUSH = 0xadf769cd;         // DuplicateTokenInFlush(address)
constexpr Selector TOKEN_FLUSH_FAILED = 0x8fff75f3;               // TokenFlushFailed(address,uint256)
constexpr Selector NATIVE_FLUSH_FAILED = 0xaaa300cc;              // NativeFlushFailed(uint256)
constexpr Selector BATCH_TOO_LARGE = 0xbb1cb70b;                  // BatchTooLarge(uint256,uint256)
constexpr Selector REENTRANT_CALL = 0x3ee5aeb5;                   // ReentrancyGuardReentrantCall()
constexpr Selector ENFORCED_PAUSE = 0xd93c0665;                   // EnforcedPause()
constexpr Selector EXPECTED_PAUSE = 0x8dfc202b;                   // ExpectedPause()
constexpr Selector UNAUTHORIZED_ACCOUNT = 0x118cdaa7;             // OwnableUnauthorizedAccount(address)
constexpr Selector INVALID_OWNER = 0x1e4fbdf7;                    // OwnableInvalidOwner(address)
constexpr Selector INVALID_OFFSET = 0x6115f2de;                   // InvalidOffset(uint256)
constexpr Selector ZERO_ADDRESS = 0xd92e233d;                     // ZeroAddress()
constexpr Selector RESCUE_FAILED = 0xd68f8239;                    // RescueFailed(address,uint256)
constexpr Selector PANIC = 0x4e487b71;                            // Panic(uint256)
}

// Panic code for checked arithmetic overflow
constexpr uint8_t PANIC_ARITHMETIC_OVERFLOW = 0x11;

// =============================================================================
// ExecutorError - every failure aborts the enclosing unit of execution
// =============================================================================

// Carries the ABI-encoded revert data surfaced to the caller.
class ExecutorError : public std::runtime_error {
public:
    ExecutorError(const std::string& msg, Bytes revert_data)
        : std::runtime_error(msg), revert_data_(std::move(revert_data)) {}

    const Bytes& revert_data() const noexcept { return revert_data_; }

private:
    Bytes revert_data_;
};

// -----------------------------------------------------------------------------
// Configuration errors
// -----------------------------------------------------------------------------

class InvalidOffset : public ExecutorError {
public:
    explicit InvalidOffset(uint64_t offset);
};

class InvalidSelectorForInjection : public ExecutorError {
public:
    explicit InvalidSelectorForInjection(Selector selector);
};

class OffsetMismatchForSelector : public ExecutorError {
public:
    OffsetMismatchForSelector(Selector selector, uint64_t expected, uint64_t provided);
};

class InvalidInjectionOffset : public ExecutorError {
public:
    InvalidInjectionOffset(uint64_t offset, size_t payload_size);
};

// -----------------------------------------------------------------------------
// Precondition / authorization errors
// -----------------------------------------------------------------------------

class BatchTooLarge : public ExecutorError {
public:
    BatchTooLarge(size_t length, size_t maximum);
};

class DuplicateTokenInFlush : public ExecutorError {
public:
    explicit DuplicateTokenInFlush(const Address& token);
};

class TargetNotWhitelisted : public ExecutorError {
public:
    explicit TargetNotWhitelisted(const Address& target);
};

class SpenderNotWhitelisted : public ExecutorError {
public:
    explicit SpenderNotWhitelisted(const Address& spender);
};

class Unauthorized : public ExecutorError {
public:
    explicit Unauthorized(const Address& account);
};

class InvalidOwner : public ExecutorError {
public:
    explicit InvalidOwner(const Address& owner);
};

class ZeroAddress : public ExecutorError {
public:
    ZeroAddress();
};

class EnforcedPause : public ExecutorError {
public:
    EnforcedPause();
};

class ExpectedPause : public ExecutorError {
public:
    ExpectedPause();
};

// -----------------------------------------------------------------------------
// External-interaction errors
// -----------------------------------------------------------------------------

class TokenPullFailed : public ExecutorError {
public:
    TokenPullFailed(const Address& token, U128 amount);
};

class TokenApprovalFailed : public ExecutorError {
public:
    TokenApprovalFailed(const Address& token, const Address& spender, U128 amount);
};

class TokenFlushFailed : public ExecutorError {
public:
    TokenFlushFailed(const Address& token, U128 amount);
};

class NativeFlushFailed : public ExecutorError {
public:
    explicit NativeFlushFailed(U128 amount);
};

class RescueFailed : public ExecutorError {
public:
    RescueFailed(const Address& token, U128 amount);
};

// A callee failed: its raw revert data is forwarded unmodified.
class CallFailed : public ExecutorError {
public:
    CallFailed(const Address& target, Bytes revert_data);

    const Address& target() const noexcept { return target_; }

private:
    Address target_;
};

// -----------------------------------------------------------------------------
// Invariant errors
// -----------------------------------------------------------------------------

class ZeroAmountNotAllowed : public ExecutorError {
public:
    ZeroAmountNotAllowed();
};

class ReentrantCall : public ExecutorError {
public:
    ReentrantCall();
};

class ArithmeticOverflow : public ExecutorError {
public:
    ArithmeticOverflow();
};

} // namespace aequi

#endif // AEQUI_ERRORS_HPP
