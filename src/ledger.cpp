// =============================================================================
// ledger.cpp - In-Memory Host Ledger
// =============================================================================

#include "aequi/ledger.hpp"
#include "aequi/hex.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace aequi {

// =============================================================================
// Setup
// =============================================================================

void Ledger::deploy(const Address& addr, Contract* contract) {
    if (contract == nullptr) {
        code_.erase(addr);
        return;
    }
    code_[addr] = contract;
}

void Ledger::fund(const Address& account, U128 amount) {
    U128& balance = state_.balances[account];
    if (add_overflows(balance, amount)) {
        throw std::overflow_error("Ledger: native balance overflow");
    }
    balance += amount;
}

// =============================================================================
// Calls
// =============================================================================

CallResult Ledger::call(const Address& from, const Address& to, U128 value,
                        const Bytes& input) {
    if (depth_ >= MAX_CALL_DEPTH) {
        spdlog::warn("ledger: call depth limit reached calling {}", hex::encode(to));
        return CallResult::revert();
    }

    if (value > 0) {
        require_writable("value transfer");
    }

    Checkpoint cp = checkpoint();

    if (value > 0) {
        U128 available = native_balance(from);
        U128& received = state_.balances[to];
        if (available < value || (from != to && add_overflows(received, value))) {
            rollback(cp);
            return CallResult::revert();
        }
        state_.balances[from] = available - value;
        state_.balances[to] += value;
    }

    auto it = code_.find(to);
    if (it == code_.end()) {
        // Plain account: only the value moves
        commit(cp);
        return CallResult::ok();
    }

    ++depth_;
    try {
        CallResult result = it->second->on_call(*this, Message{from, to, value}, input);
        --depth_;
        if (result.success) {
            commit(cp);
        } else {
            rollback(cp);
        }
        return result;
    } catch (...) {
        --depth_;
        rollback(cp);
        throw;
    }
}

CallResult Ledger::static_call(const Address& from, const Address& to, const Bytes& input) {
    ++static_depth_;
    try {
        CallResult result = call(from, to, 0, input);
        --static_depth_;
        return result;
    } catch (const StaticCallViolation& e) {
        --static_depth_;
        spdlog::warn("ledger: static call to {} failed: {}", hex::encode(to), e.what());
        return CallResult::revert();
    } catch (...) {
        --static_depth_;
        throw;
    }
}

U128 Ledger::native_balance(const Address& account) const {
    auto it = state_.balances.find(account);
    return it != state_.balances.end() ? it->second : 0;
}

bool Ledger::has_code(const Address& account) const {
    return code_.count(account) > 0;
}

// =============================================================================
// Storage and Logs
// =============================================================================

U128 Ledger::load(const Address& contract, const Bytes& key) const {
    auto it = state_.storage.find({contract, key});
    return it != state_.storage.end() ? it->second : 0;
}

void Ledger::store(const Address& contract, const Bytes& key, U128 value) {
    require_writable("storage write");
    if (value == 0) {
        state_.storage.erase({contract, key});
        return;
    }
    state_.storage[{contract, key}] = value;
}

void Ledger::emit_log(LogEntry entry) {
    require_writable("log");
    state_.logs.push_back(std::move(entry));
}

std::vector<LogEntry> Ledger::logs_named(const std::string& name) const {
    std::vector<LogEntry> result;
    for (const auto& entry : state_.logs) {
        if (entry.name == name) {
            result.push_back(entry);
        }
    }
    return result;
}

// =============================================================================
// Journal
// =============================================================================

Host::Checkpoint Ledger::checkpoint() {
    journal_.push_back(state_);
    return journal_.size() - 1;
}

void Ledger::require_top(Checkpoint cp) const {
    if (journal_.empty() || cp != journal_.size() - 1) {
        throw std::logic_error("Ledger: checkpoint is not the innermost open checkpoint");
    }
}

void Ledger::require_writable(const char* what) const {
    if (static_depth_ > 0) {
        throw StaticCallViolation(std::string(what) + " in a static call");
    }
}

void Ledger::rollback(Checkpoint cp) {
    require_top(cp);
    state_ = std::move(journal_.back());
    journal_.pop_back();
}

void Ledger::commit(Checkpoint cp) {
    require_top(cp);
    journal_.pop_back();
}

} // namespace aequi
