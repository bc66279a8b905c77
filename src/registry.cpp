// =============================================================================
// registry.cpp - Call-Target Whitelist and Selector Offset Table
// =============================================================================

#include "aequi/registry.hpp"
#include "aequi/errors.hpp"
#include "aequi/hex.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace aequi {

std::map<Selector, uint32_t> default_selector_offsets() {
    return {
        {router_selectors::V2_SWAP_EXACT_TOKENS_FOR_TOKENS, 4},
        {router_selectors::V3_EXACT_INPUT_SINGLE, 132},
        {router_selectors::V3_EXACT_INPUT, 100},
        {router_selectors::V3_EXACT_INPUT_SINGLE_DEADLINE, 164},
    };
}

Registry::Registry(const Address& owner, size_t max_admin_batch,
                   const std::vector<Address>& initial_targets,
                   const std::map<Selector, uint32_t>& initial_offsets)
    : owner_(owner), max_admin_batch_(max_admin_batch) {
    if (addresses::is_zero(owner)) {
        throw InvalidOwner(owner);
    }
    for (const auto& target : initial_targets) {
        apply_target(target, true);
    }
    for (const auto& [selector, offset] : initial_offsets) {
        apply_offset(selector, offset);
    }
}

// =============================================================================
// Queries
// =============================================================================

bool Registry::is_whitelisted(const Address& target) const {
    std::shared_lock lock(mutex_);
    return whitelist_.count(target) > 0;
}

std::optional<uint32_t> Registry::expected_offset(Selector selector) const {
    std::shared_lock lock(mutex_);
    auto it = offsets_.find(selector);
    if (it == offsets_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Address Registry::owner() const {
    std::shared_lock lock(mutex_);
    return owner_;
}

void Registry::require_owner(const Address& caller) const {
    std::shared_lock lock(mutex_);
    check_owner(caller);
}

std::vector<Address> Registry::targets() const {
    std::shared_lock lock(mutex_);
    std::vector<Address> result(whitelist_.begin(), whitelist_.end());
    std::sort(result.begin(), result.end());
    return result;
}

std::map<Selector, uint32_t> Registry::selector_offsets() const {
    std::shared_lock lock(mutex_);
    return offsets_;
}

// =============================================================================
// Administration
// =============================================================================

void Registry::set_target(const Address& caller, const Address& target, bool allowed) {
    {
        std::unique_lock lock(mutex_);
        check_owner(caller);
        apply_target(target, allowed);
    }
    emit("TargetWhitelisted", {hex::encode(target), allowed ? "true" : "false"});
}

void Registry::set_targets(const Address& caller, const std::vector<Address>& targets, bool allowed) {
    {
        std::unique_lock lock(mutex_);
        check_owner(caller);
        if (targets.size() > max_admin_batch_) {
            throw BatchTooLarge(targets.size(), max_admin_batch_);
        }
        // Validate the whole batch before touching the whitelist
        for (const auto& target : targets) {
            if (addresses::is_zero(target)) {
                throw ZeroAddress();
            }
        }
        for (const auto& target : targets) {
            apply_target(target, allowed);
        }
    }
    for (const auto& target : targets) {
        emit("TargetWhitelisted", {hex::encode(target), allowed ? "true" : "false"});
    }
}

void Registry::set_selector_offset(const Address& caller, Selector selector, uint32_t offset) {
    {
        std::unique_lock lock(mutex_);
        check_owner(caller);
        apply_offset(selector, offset);
    }
    emit("SelectorOffsetSet", {hex::encode_selector(selector), std::to_string(offset)});
}

void Registry::transfer_ownership(const Address& caller, const Address& new_owner) {
    Address previous;
    {
        std::unique_lock lock(mutex_);
        check_owner(caller);
        if (addresses::is_zero(new_owner)) {
            throw InvalidOwner(new_owner);
        }
        previous = owner_;
        owner_ = new_owner;
    }
    emit("OwnershipTransferred", {hex::encode(previous), hex::encode(new_owner)});
}

void Registry::set_event_callback(EventCallback callback) {
    std::unique_lock lock(mutex_);
    event_callback_ = std::move(callback);
}

// =============================================================================
// Internal
// =============================================================================

void Registry::check_owner(const Address& caller) const {
    if (caller != owner_) {
        throw Unauthorized(caller);
    }
}

void Registry::apply_target(const Address& target, bool allowed) {
    if (addresses::is_zero(target)) {
        throw ZeroAddress();
    }
    if (allowed) {
        whitelist_.insert(target);
    } else {
        whitelist_.erase(target);
    }
}

void Registry::apply_offset(Selector selector, uint32_t offset) {
    if (offset == 0) {
        offsets_.erase(selector);
        return;
    }
    if (offset < MIN_OFFSET) {
        throw InvalidOffset(offset);
    }
    offsets_[selector] = offset;
}

void Registry::emit(const std::string& name, const std::vector<std::string>& args) const {
    std::string joined;
    for (const auto& arg : args) {
        if (!joined.empty()) joined += ", ";
        joined += arg;
    }
    spdlog::info("registry: {}({})", name, joined);

    EventCallback callback;
    {
        std::shared_lock lock(mutex_);
        callback = event_callback_;
    }
    if (callback) {
        callback(name, args);
    }
}

} // namespace aequi
