// =============================================================================
// config.cpp - Executor Configuration
// =============================================================================

#include "aequi/config.hpp"
#include "aequi/hex.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>

namespace aequi {

using json = nlohmann::json;

namespace {

void read_limits(const json& j, ExecutorConfig& config) {
    config.limits.max_pulls = j.value("max_pulls", config.limits.max_pulls);
    config.limits.max_approvals = j.value("max_approvals", config.limits.max_approvals);
    config.limits.max_calls = j.value("max_calls", config.limits.max_calls);
    config.limits.max_flush_tokens = j.value("max_flush_tokens", config.limits.max_flush_tokens);
    config.max_admin_batch = j.value("max_admin_batch", config.max_admin_batch);
}

}  // namespace

ExecutorConfig ExecutorConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

ExecutorConfig ExecutorConfig::from_json(std::string_view content) {
    ExecutorConfig config;
    try {
        json j = json::parse(content);

        if (j.contains("owner")) {
            config.owner = hex::decode_address(j["owner"].get<std::string>());
        }
        config.log_level = j.value("log_level", config.log_level);
        config.use_default_selectors = j.value("use_default_selectors", config.use_default_selectors);

        if (j.contains("limits")) {
            read_limits(j["limits"], config);
        }

        if (j.contains("targets")) {
            for (const auto& target : j["targets"]) {
                config.targets.push_back(hex::decode_address(target.get<std::string>()));
            }
        }

        if (j.contains("selector_offsets")) {
            for (const auto& [selector, offset] : j["selector_offsets"].items()) {
                config.selector_offsets[hex::decode_selector(selector)] = offset.get<uint32_t>();
            }
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid config: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid config: ") + e.what());
    }
    return config;
}

std::map<Selector, uint32_t> ExecutorConfig::effective_selector_offsets() const {
    std::map<Selector, uint32_t> offsets;
    if (use_default_selectors) {
        offsets = default_selector_offsets();
    }
    for (const auto& [selector, offset] : selector_offsets) {
        if (offset == 0) {
            offsets.erase(selector);
        } else {
            offsets[selector] = offset;
        }
    }
    return offsets;
}

void ExecutorConfig::apply_log_level() const {
    auto level = spdlog::level::from_str(log_level);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && log_level != "off") {
        throw std::runtime_error("Unknown log level: " + log_level);
    }
    spdlog::set_level(level);
}

std::unique_ptr<Registry> ExecutorConfig::make_registry() const {
    return std::make_unique<Registry>(owner, max_admin_batch, targets, effective_selector_offsets());
}

}  // namespace aequi
