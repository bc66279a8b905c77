#ifndef AEQUI_REGISTRY_HPP
#define AEQUI_REGISTRY_HPP

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "types.hpp"

namespace aequi {

// =============================================================================
// Router Selectors registered for injection by default
// =============================================================================

namespace router_selectors {
constexpr Selector V2_SWAP_EXACT_TOKENS_FOR_TOKENS = 0x38ed1739;
constexpr Selector V3_EXACT_INPUT_SINGLE = 0x04e45aaf;               // SwapRouter02, no deadline
constexpr Selector V3_EXACT_INPUT = 0xc04b8d59;
constexpr Selector V3_EXACT_INPUT_SINGLE_DEADLINE = 0x414bf389;
}

// selector -> byte offset of the amount-in word
std::map<Selector, uint32_t> default_selector_offsets();

// =============================================================================
// Registry - call-target whitelist and selector offset table
// =============================================================================

class Registry {
public:
    // Smallest valid offset: anything lower would overwrite the selector
    static constexpr uint32_t MIN_OFFSET = 4;
    static constexpr size_t DEFAULT_MAX_ADMIN_BATCH = 100;

    // Audit sink: event name and ordered arguments
    using EventCallback = std::function<void(const std::string&, const std::vector<std::string>&)>;

    explicit Registry(const Address& owner,
                      size_t max_admin_batch = DEFAULT_MAX_ADMIN_BATCH,
                      const std::vector<Address>& initial_targets = {},
                      const std::map<Selector, uint32_t>& initial_offsets = default_selector_offsets());

    // Non-copyable
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // =========================================================================
    // Queries
    // =========================================================================

    bool is_whitelisted(const Address& target) const;

    // Registered injection offset, none when the selector is not registered
    std::optional<uint32_t> expected_offset(Selector selector) const;

    Address owner() const;
    void require_owner(const Address& caller) const;

    std::vector<Address> targets() const;
    std::map<Selector, uint32_t> selector_offsets() const;
    size_t max_admin_batch() const { return max_admin_batch_; }

    // =========================================================================
    // Administration (owner only)
    // =========================================================================

    void set_target(const Address& caller, const Address& target, bool allowed);
    void set_targets(const Address& caller, const std::vector<Address>& targets, bool allowed);

    // offset 0 removes the selector
    void set_selector_offset(const Address& caller, Selector selector, uint32_t offset);

    void transfer_ownership(const Address& caller, const Address& new_owner);

    void set_event_callback(EventCallback callback);

private:
    // Callers hold mutex_ exclusively
    void check_owner(const Address& caller) const;
    void apply_target(const Address& target, bool allowed);
    void apply_offset(Selector selector, uint32_t offset);

    void emit(const std::string& name, const std::vector<std::string>& args) const;

    Address owner_;
    size_t max_admin_batch_;
    std::unordered_set<Address, AddressHash> whitelist_;
    std::map<Selector, uint32_t> offsets_;
    mutable std::shared_mutex mutex_;

    EventCallback event_callback_;
};

} // namespace aequi

#endif // AEQUI_REGISTRY_HPP
