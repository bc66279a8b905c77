#ifndef AEQUI_EXECUTOR_HPP
#define AEQUI_EXECUTOR_HPP

#include <atomic>
#include <utility>
#include <vector>

#include "erc20.hpp"
#include "host.hpp"
#include "injector.hpp"
#include "registry.hpp"

namespace aequi {

// =============================================================================
// Batch Limits
// =============================================================================

struct ExecutorLimits {
    size_t max_pulls = 16;
    size_t max_approvals = 16;
    size_t max_calls = 32;
    size_t max_flush_tokens = 16;
};

// =============================================================================
// ReentrancyGuard - non-blocking two-state lock
// =============================================================================

class ReentrancyGuard {
public:
    enum class Status : uint8_t { Idle, Busy };

    // Holds the guard for its lifetime. Throws ReentrantCall when already held.
    class Scope {
    public:
        explicit Scope(ReentrancyGuard& guard);
        ~Scope();

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        ReentrancyGuard& guard_;
    };

    Status status() const { return status_.load(); }
    bool busy() const { return status() == Status::Busy; }

private:
    std::atomic<Status> status_{Status::Idle};
};

// Balances captured before the pull stage
struct BalanceSnapshot {
    std::vector<std::pair<Address, U128>> tokens;   // one per non-null flush token
    U128 native;                                    // net of the attached value
};

// =============================================================================
// Executor - atomic pull / approve / call / revoke / flush
// =============================================================================

class Executor : public Contract {
public:
    Executor(const Address& self, Registry& registry, ExecutorLimits limits = {});

    // Non-copyable
    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    // ABI entry: execute() calldata, or empty calldata to receive native value.
    // Engine errors become failed calls carrying the error's revert data.
    CallResult on_call(Host& host, const Message& msg, const Bytes& input) override;

    // Runs one batch for msg.sender. msg.value must already be credited to
    // this contract. Returns the raw output of every call, in order.
    // Throws ExecutorError; the host is left as it was on entry.
    std::vector<Bytes> execute(Host& host, const Message& msg, const Batch& batch);

    // =========================================================================
    // Administration (owner only)
    // =========================================================================

    void pause(Host& host, const Address& caller);
    void unpause(Host& host, const Address& caller);

    void rescue_token(Host& host, const Address& caller, const Address& token,
                      const Address& to, U128 amount);
    void rescue_native(Host& host, const Address& caller, const Address& to, U128 amount);

    // =========================================================================
    // Queries
    // =========================================================================

    const Address& address() const { return self_; }
    bool paused() const { return paused_.load(); }
    const ExecutorLimits& limits() const { return limits_; }
    const Registry& registry() const { return registry_; }
    const ReentrancyGuard& guard() const { return guard_; }

private:
    // Preconditions, checked before any state change
    void check_limits(const Batch& batch) const;
    void check_flush_tokens(const std::vector<Address>& tokens) const;
    void check_whitelist(const Batch& batch) const;

    std::vector<Bytes> run(Host& host, const Message& msg, const Batch& batch);

    // Stages
    BalanceSnapshot take_snapshot(Host& host, const erc20::TokenClient& tokens, U128 attached,
                                  const std::vector<Address>& flush_tokens) const;
    void pull_stage(erc20::TokenClient& tokens, const Address& caller, const PulledLedger& pulled) const;
    void approve_stage(erc20::TokenClient& tokens, const std::vector<Approval>& approvals) const;
    std::vector<Bytes> call_stage(Host& host, const Injector& injector, const std::vector<Call>& calls) const;
    void revoke_stage(erc20::TokenClient& tokens, const std::vector<Approval>& approvals) const;
    U128 flush_stage(Host& host, erc20::TokenClient& tokens, const Address& caller,
                     const BalanceSnapshot& snapshot) const;

    void emit(Host& host, const std::string& name, std::vector<std::string> args) const;

    Address self_;
    Registry& registry_;
    ExecutorLimits limits_;
    ReentrancyGuard guard_;
    std::atomic<bool> paused_{false};
};

} // namespace aequi

#endif // AEQUI_EXECUTOR_HPP
