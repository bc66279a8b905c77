#ifndef AEQUI_HOST_HPP
#define AEQUI_HOST_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "types.hpp"

namespace aequi {

// =============================================================================
// Call Frames
// =============================================================================

// Outcome of one synchronous call. On failure `output` is the revert data.
struct CallResult {
    bool success;
    Bytes output;

    static CallResult ok(Bytes output = {}) { return CallResult{true, std::move(output)}; }
    static CallResult revert(Bytes data = {}) { return CallResult{false, std::move(data)}; }
};

// Context of the frame a contract is executing in
struct Message {
    Address sender;
    Address recipient;   // the executing contract itself
    U128 value;
};

// Audit record: emitter, event name, ordered arguments
struct LogEntry {
    Address emitter;
    std::string name;
    std::vector<std::string> args;
};

// A static frame tried to move value, write storage or emit a log
class StaticCallViolation : public std::runtime_error {
public:
    explicit StaticCallViolation(const std::string& msg) : std::runtime_error(msg) {}
};

// =============================================================================
// Host Interface
// =============================================================================

// The environment contracts run in. Value transfers, storage writes and logs
// are journaled: everything after a checkpoint is discarded by rollback().
class Host {
public:
    using Checkpoint = size_t;

    virtual ~Host() = default;

    // Synchronous call: moves `value` from `from` to `to`, then runs the code
    // at `to` (if any). A failed call leaves no effects of its own frame.
    virtual CallResult call(const Address& from, const Address& to, U128 value,
                            const Bytes& input) = 0;

    // Read-only call without value. Any state change attempted in the frame
    // or below it fails the whole frame, which then has no effects.
    virtual CallResult static_call(const Address& from, const Address& to, const Bytes& input) = 0;

    virtual U128 native_balance(const Address& account) const = 0;
    virtual bool has_code(const Address& account) const = 0;

    // Per-contract storage, zero when never written
    virtual U128 load(const Address& contract, const Bytes& key) const = 0;
    virtual void store(const Address& contract, const Bytes& key, U128 value) = 0;

    virtual void emit_log(LogEntry entry) = 0;

    // Nested journaling (LIFO): every checkpoint is either rolled back or committed
    virtual Checkpoint checkpoint() = 0;
    virtual void rollback(Checkpoint cp) = 0;
    virtual void commit(Checkpoint cp) = 0;
};

// =============================================================================
// Contract Interface
// =============================================================================

class Contract {
public:
    virtual ~Contract() = default;

    virtual CallResult on_call(Host& host, const Message& msg, const Bytes& input) = 0;
};

} // namespace aequi

#endif // AEQUI_HOST_HPP
