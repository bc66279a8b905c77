// =============================================================================
// executor.cpp - Multicall Execution Engine
// =============================================================================

#include "aequi/executor.hpp"
#include "aequi/abi.hpp"
#include "aequi/batch_codec.hpp"
#include "aequi/errors.hpp"
#include "aequi/hex.hpp"

#include <spdlog/spdlog.h>
#include <unordered_set>

namespace aequi {

// =============================================================================
// ReentrancyGuard
// =============================================================================

ReentrancyGuard::Scope::Scope(ReentrancyGuard& guard) : guard_(guard) {
    Status expected = Status::Idle;
    if (!guard_.status_.compare_exchange_strong(expected, Status::Busy)) {
        throw ReentrantCall();
    }
}

ReentrancyGuard::Scope::~Scope() {
    guard_.status_.store(Status::Idle);
}

// =============================================================================
// Executor
// =============================================================================

Executor::Executor(const Address& self, Registry& registry, ExecutorLimits limits)
    : self_(self), registry_(registry), limits_(limits) {
    if (addresses::is_zero(self)) {
        throw ZeroAddress();
    }
}

CallResult Executor::on_call(Host& host, const Message& msg, const Bytes& input) {
    if (input.empty()) {
        return CallResult::ok();
    }
    try {
        if (abi::load_selector(input) != EXECUTE_SELECTOR) {
            return CallResult::revert();
        }
        Batch batch = decode_execute(input);
        return CallResult::ok(encode_results(execute(host, msg, batch)));
    } catch (const ExecutorError& e) {
        return CallResult::revert(e.revert_data());
    } catch (const abi::AbiError& e) {
        spdlog::warn("executor: malformed calldata from {}: {}", hex::encode(msg.sender), e.what());
        return CallResult::revert();
    }
}

std::vector<Bytes> Executor::execute(Host& host, const Message& msg, const Batch& batch) {
    ReentrancyGuard::Scope scope(guard_);

    if (paused_) {
        throw EnforcedPause();
    }
    check_limits(batch);
    check_flush_tokens(batch.tokens_to_flush);
    check_whitelist(batch);

    Host::Checkpoint cp = host.checkpoint();
    try {
        std::vector<Bytes> results = run(host, msg, batch);
        host.commit(cp);
        return results;
    } catch (const std::exception& e) {
        host.rollback(cp);
        spdlog::warn("executor: batch from {} reverted: {}", hex::encode(msg.sender), e.what());
        throw;
    } catch (...) {
        host.rollback(cp);
        throw;
    }
}

// =============================================================================
// Preconditions
// =============================================================================

void Executor::check_limits(const Batch& batch) const {
    const std::pair<size_t, size_t> bounds[] = {
        {batch.pulls.size(), limits_.max_pulls},
        {batch.approvals.size(), limits_.max_approvals},
        {batch.calls.size(), limits_.max_calls},
        {batch.tokens_to_flush.size(), limits_.max_flush_tokens},
    };
    for (const auto& [length, maximum] : bounds) {
        if (length > maximum) {
            throw BatchTooLarge(length, maximum);
        }
    }
}

void Executor::check_flush_tokens(const std::vector<Address>& tokens) const {
    std::unordered_set<Address, AddressHash> seen;
    for (const auto& token : tokens) {
        if (!seen.insert(token).second) {
            throw DuplicateTokenInFlush(token);
        }
    }
}

void Executor::check_whitelist(const Batch& batch) const {
    for (const auto& approval : batch.approvals) {
        if (approval.amount != 0 && !registry_.is_whitelisted(approval.spender)) {
            throw SpenderNotWhitelisted(approval.spender);
        }
    }
    for (const auto& call : batch.calls) {
        if (!registry_.is_whitelisted(call.target)) {
            throw TargetNotWhitelisted(call.target);
        }
    }
}

// =============================================================================
// Orchestration
// =============================================================================

std::vector<Bytes> Executor::run(Host& host, const Message& msg, const Batch& batch) {
    erc20::TokenClient tokens(host, self_);

    BalanceSnapshot snapshot = take_snapshot(host, tokens, msg.value, batch.tokens_to_flush);
    PulledLedger pulled = PulledLedger::build(batch.pulls);

    pull_stage(tokens, msg.sender, pulled);
    approve_stage(tokens, batch.approvals);

    Injector injector(registry_, pulled, tokens);
    std::vector<Bytes> results = call_stage(host, injector, batch.calls);

    revoke_stage(tokens, batch.approvals);
    U128 native_returned = flush_stage(host, tokens, msg.sender, snapshot);

    emit(host, "Executed",
         {hex::encode(msg.sender), std::to_string(batch.pulls.size()), std::to_string(batch.calls.size()),
          to_string(native_returned)});
    spdlog::info("executor: batch from {} done: {} pulls, {} calls, {} native returned",
                 hex::encode(msg.sender), batch.pulls.size(), batch.calls.size(), to_string(native_returned));
    return results;
}

BalanceSnapshot Executor::take_snapshot(Host& host, const erc20::TokenClient& tokens, U128 attached,
                                        const std::vector<Address>& flush_tokens) const {
    BalanceSnapshot snapshot;

    // The attached value is already part of the balance
    U128 balance = host.native_balance(self_);
    snapshot.native = balance > attached ? balance - attached : 0;

    for (const auto& token : flush_tokens) {
        if (addresses::is_zero(token)) continue;
        snapshot.tokens.emplace_back(token, tokens.balance_of(token, self_));
    }
    return snapshot;
}

void Executor::pull_stage(erc20::TokenClient& tokens, const Address& caller, const PulledLedger& pulled) const {
    for (const auto& entry : pulled.entries()) {
        if (!tokens.transfer_from(entry.token, caller, self_, entry.amount)) {
            throw TokenPullFailed(entry.token, entry.amount);
        }
        spdlog::debug("executor: pulled {} of {}", to_string(entry.amount), hex::encode(entry.token));
    }
}

void Executor::approve_stage(erc20::TokenClient& tokens, const std::vector<Approval>& approvals) const {
    for (const auto& approval : approvals) {
        if (approval.amount == 0) continue;

        if (!registry_.is_whitelisted(approval.spender)) {
            throw SpenderNotWhitelisted(approval.spender);
        }
        if (!tokens.force_approve(approval.token, approval.spender, approval.amount)) {
            throw TokenApprovalFailed(approval.token, approval.spender, approval.amount);
        }
        spdlog::debug("executor: approved {} of {} to {}", to_string(approval.amount),
                      hex::encode(approval.token), hex::encode(approval.spender));
    }
}

std::vector<Bytes> Executor::call_stage(Host& host, const Injector& injector,
                                        const std::vector<Call>& calls) const {
    std::vector<Bytes> results;
    results.reserve(calls.size());

    for (const auto& call : calls) {
        if (!registry_.is_whitelisted(call.target)) {
            throw TargetNotWhitelisted(call.target);
        }

        Bytes payload = injector.prepare(call);

        CallResult result = host.call(self_, call.target, call.value, payload);
        if (!result.success) {
            throw CallFailed(call.target, std::move(result.output));
        }
        spdlog::debug("executor: call to {} returned {} bytes", hex::encode(call.target),
                      result.output.size());
        results.push_back(std::move(result.output));
    }
    return results;
}

void Executor::revoke_stage(erc20::TokenClient& tokens, const std::vector<Approval>& approvals) const {
    for (const auto& approval : approvals) {
        if (!approval.revoke_after || approval.amount == 0) continue;

        if (!tokens.approve(approval.token, approval.spender, 0)) {
            throw TokenApprovalFailed(approval.token, approval.spender, 0);
        }
    }
}

U128 Executor::flush_stage(Host& host, erc20::TokenClient& tokens, const Address& caller,
                           const BalanceSnapshot& snapshot) const {
    for (const auto& [token, before] : snapshot.tokens) {
        U128 current = tokens.balance_of(token, self_);
        if (current <= before) continue;

        U128 delta = current - before;
        if (!tokens.transfer(token, caller, delta)) {
            throw TokenFlushFailed(token, delta);
        }
        spdlog::debug("executor: flushed {} of {}", to_string(delta), hex::encode(token));
    }

    U128 current = host.native_balance(self_);
    if (current <= snapshot.native) {
        return 0;
    }
    U128 delta = current - snapshot.native;
    CallResult result = host.call(self_, caller, delta, {});
    if (!result.success) {
        throw NativeFlushFailed(delta);
    }
    return delta;
}

// =============================================================================
// Administration
// =============================================================================

void Executor::pause(Host& host, const Address& caller) {
    registry_.require_owner(caller);
    if (paused_) {
        throw EnforcedPause();
    }
    paused_ = true;
    emit(host, "Paused", {hex::encode(caller)});
    spdlog::info("executor: paused by {}", hex::encode(caller));
}

void Executor::unpause(Host& host, const Address& caller) {
    registry_.require_owner(caller);
    if (!paused_) {
        throw ExpectedPause();
    }
    paused_ = false;
    emit(host, "Unpaused", {hex::encode(caller)});
    spdlog::info("executor: unpaused by {}", hex::encode(caller));
}

void Executor::rescue_token(Host& host, const Address& caller, const Address& token,
                            const Address& to, U128 amount) {
    ReentrancyGuard::Scope scope(guard_);
    registry_.require_owner(caller);
    if (addresses::is_zero(to)) {
        throw ZeroAddress();
    }

    erc20::TokenClient tokens(host, self_);
    if (!tokens.transfer(token, to, amount)) {
        throw RescueFailed(token, amount);
    }
    emit(host, "FundsRescued", {hex::encode(token), hex::encode(to), to_string(amount)});
    spdlog::info("executor: rescued {} of {} to {}", to_string(amount), hex::encode(token), hex::encode(to));
}

void Executor::rescue_native(Host& host, const Address& caller, const Address& to, U128 amount) {
    ReentrancyGuard::Scope scope(guard_);
    registry_.require_owner(caller);
    if (addresses::is_zero(to)) {
        throw ZeroAddress();
    }

    CallResult result = host.call(self_, to, amount, {});
    if (!result.success) {
        throw RescueFailed(NULL_ADDRESS, amount);
    }
    emit(host, "FundsRescued", {hex::encode(NULL_ADDRESS), hex::encode(to), to_string(amount)});
    spdlog::info("executor: rescued {} native to {}", to_string(amount), hex::encode(to));
}

void Executor::emit(Host& host, const std::string& name, std::vector<std::string> args) const {
    host.emit_log(LogEntry{self_, name, std::move(args)});
}

} // namespace aequi
