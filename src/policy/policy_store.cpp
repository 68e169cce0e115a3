// ---------------------------------------------------------------------------
// policy_store.cpp
// ---------------------------------------------------------------------------

#include "policy/policy_store.hpp"

#include "policy/policy_validator.hpp"

#include <algorithm>
#include <iterator>
#include <mutex>
#include <string>
#include <unordered_set>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

[[nodiscard]] auto find_by_name(const std::vector<Policy>& policies, std::string_view name) {
    return std::find_if(policies.begin(), policies.end(),
                        [name](const Policy& p) { return p.name == name; });
}

[[nodiscard]] PolicyError duplicate_error(std::string_view name) {
    return PolicyError{PolicyErrorCode::kDuplicateName,
                       fmt::format("Policy '{}' already exists", name), "name"};
}

[[nodiscard]] PolicyError not_found_error(std::string_view name) {
    return PolicyError{PolicyErrorCode::kNotFound,
                       fmt::format("Policy '{}' not found", name), "name"};
}

}  // namespace

PolicyStore::PolicyStore()
    : policies_(std::make_shared<const std::vector<Policy>>())
{}

std::expected<void, PolicyError> PolicyStore::create(Policy policy) {
    if (auto valid = validate_policy(policy); !valid) {
        return std::unexpected(valid.error());
    }

    std::unique_lock lock(mutex_);
    if (find_by_name(*policies_, policy.name) != policies_->end()) {
        return std::unexpected(duplicate_error(policy.name));
    }

    auto next = std::make_shared<std::vector<Policy>>(*policies_);
    spdlog::info("policy_store: created policy '{}' (priority={}, enabled={})",
                 policy.name, policy.priority, policy.enabled);
    next->push_back(std::move(policy));
    policies_ = std::move(next);
    return {};
}

std::expected<void, PolicyError> PolicyStore::update(std::string_view name, Policy policy) {
    if (auto valid = validate_policy(policy); !valid) {
        return std::unexpected(valid.error());
    }

    std::unique_lock lock(mutex_);
    const auto current = find_by_name(*policies_, name);
    if (current == policies_->end()) {
        return std::unexpected(not_found_error(name));
    }
    if (policy.name != name && find_by_name(*policies_, policy.name) != policies_->end()) {
        return std::unexpected(duplicate_error(policy.name));
    }

    const auto index = static_cast<std::size_t>(current - policies_->begin());
    auto next = std::make_shared<std::vector<Policy>>(*policies_);
    spdlog::info("policy_store: updated policy '{}'", name);
    (*next)[index] = std::move(policy);
    policies_ = std::move(next);
    return {};
}

std::expected<void, PolicyError> PolicyStore::remove(std::string_view name) {
    std::unique_lock lock(mutex_);
    const auto current = find_by_name(*policies_, name);
    if (current == policies_->end()) {
        return std::unexpected(not_found_error(name));
    }

    const auto index = current - policies_->begin();
    auto next = std::make_shared<std::vector<Policy>>(*policies_);
    next->erase(next->begin() + index);
    policies_ = std::move(next);
    spdlog::info("policy_store: removed policy '{}'", name);
    return {};
}

std::optional<Policy> PolicyStore::get(std::string_view name) const {
    const auto snap = snapshot();
    const auto it = find_by_name(*snap, name);
    if (it == snap->end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<Policy> PolicyStore::list(bool enabled_only) const {
    const auto snap = snapshot();
    if (!enabled_only) {
        return *snap;
    }
    std::vector<Policy> result;
    std::copy_if(snap->begin(), snap->end(), std::back_inserter(result),
                 [](const Policy& p) { return p.enabled; });
    return result;
}

std::expected<void, PolicyError> PolicyStore::replace_all(std::vector<Policy> policies) {
    std::unordered_set<std::string> seen;
    for (const auto& policy : policies) {
        if (auto valid = validate_policy(policy); !valid) {
            return std::unexpected(valid.error());
        }
        if (!seen.insert(policy.name).second) {
            return std::unexpected(duplicate_error(policy.name));
        }
    }

    auto next = std::make_shared<const std::vector<Policy>>(std::move(policies));
    std::unique_lock lock(mutex_);
    policies_ = std::move(next);
    spdlog::info("policy_store: replaced policy set ({} policies)", policies_->size());
    return {};
}

PolicyStore::Snapshot PolicyStore::snapshot() const {
    std::shared_lock lock(mutex_);
    return policies_;
}

std::size_t PolicyStore::size() const {
    std::shared_lock lock(mutex_);
    return policies_->size();
}
