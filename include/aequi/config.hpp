#ifndef AEQUI_CONFIG_HPP
#define AEQUI_CONFIG_HPP

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "executor.hpp"
#include "registry.hpp"

namespace aequi {

// =============================================================================
// ExecutorConfig - deployment parameters of one executor
// =============================================================================

class ExecutorConfig {
public:
    Address owner{};
    std::string log_level = "info";
    ExecutorLimits limits;
    size_t max_admin_batch = Registry::DEFAULT_MAX_ADMIN_BATCH;
    std::vector<Address> targets;
    std::map<Selector, uint32_t> selector_offsets;   // applied over the defaults
    bool use_default_selectors = true;

    ExecutorConfig() = default;

    // Load from JSON file
    static ExecutorConfig from_file(std::string_view path);

    // Load from JSON string
    static ExecutorConfig from_json(std::string_view content);

    // Builder methods
    ExecutorConfig& with_owner(const Address& addr) {
        owner = addr;
        return *this;
    }

    ExecutorConfig& with_target(const Address& target) {
        targets.push_back(target);
        return *this;
    }

    ExecutorConfig& with_selector_offset(Selector selector, uint32_t offset) {
        selector_offsets[selector] = offset;
        return *this;
    }

    ExecutorConfig& with_limits(ExecutorLimits value) {
        limits = value;
        return *this;
    }

    ExecutorConfig& set_log_level(std::string_view level) {
        log_level = std::string(level);
        return *this;
    }

    ExecutorConfig& disable_default_selectors() {
        use_default_selectors = false;
        return *this;
    }

    // Defaults (when enabled) overlaid with the configured offsets.
    // An offset of 0 drops a default selector.
    [[nodiscard]] std::map<Selector, uint32_t> effective_selector_offsets() const;

    // Sets the spdlog default logger level. Throws std::runtime_error on an
    // unknown level name.
    void apply_log_level() const;

    // Throws ExecutorError subclasses for an invalid owner, target or offset
    [[nodiscard]] std::unique_ptr<Registry> make_registry() const;
};

} // namespace aequi

#endif // AEQUI_CONFIG_HPP
