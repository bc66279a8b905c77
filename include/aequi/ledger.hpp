#ifndef AEQUI_LEDGER_HPP
#define AEQUI_LEDGER_HPP

#include <map>
#include <unordered_map>
#include <utility>
#include <vector>

#include "host.hpp"

namespace aequi {

// =============================================================================
// Ledger - in-memory Host with serial execution and full-state journaling
// =============================================================================

class Ledger : public Host {
public:
    static constexpr size_t MAX_CALL_DEPTH = 1024;

    Ledger() = default;

    // Non-copyable
    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    // =========================================================================
    // Setup
    // =========================================================================

    // Attach contract code to an address (non-owning)
    void deploy(const Address& addr, Contract* contract);

    // Credit native currency out of thin air (genesis allocation)
    void fund(const Address& account, U128 amount);

    // =========================================================================
    // Host
    // =========================================================================

    CallResult call(const Address& from, const Address& to, U128 value,
                    const Bytes& input) override;
    CallResult static_call(const Address& from, const Address& to, const Bytes& input) override;

    U128 native_balance(const Address& account) const override;
    bool has_code(const Address& account) const override;

    U128 load(const Address& contract, const Bytes& key) const override;
    void store(const Address& contract, const Bytes& key, U128 value) override;

    void emit_log(LogEntry entry) override;

    Checkpoint checkpoint() override;
    void rollback(Checkpoint cp) override;
    void commit(Checkpoint cp) override;

    // =========================================================================
    // Inspection
    // =========================================================================

    const std::vector<LogEntry>& logs() const { return state_.logs; }
    std::vector<LogEntry> logs_named(const std::string& name) const;

    size_t depth() const { return depth_; }
    bool in_static_call() const { return static_depth_ > 0; }
    size_t open_checkpoints() const { return journal_.size(); }

private:
    struct State {
        std::unordered_map<Address, U128, AddressHash> balances;
        std::map<std::pair<Address, Bytes>, U128> storage;
        std::vector<LogEntry> logs;
    };

    void require_top(Checkpoint cp) const;
    void require_writable(const char* what) const;

    State state_;
    std::vector<State> journal_;    // snapshot per open checkpoint
    std::unordered_map<Address, Contract*, AddressHash> code_;
    size_t depth_{0};
    size_t static_depth_{0};
};

} // namespace aequi

#endif // AEQUI_LEDGER_HPP
