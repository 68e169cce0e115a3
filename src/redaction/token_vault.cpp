// ---------------------------------------------------------------------------
// token_vault.cpp
// ---------------------------------------------------------------------------

#include "redaction/token_vault.hpp"

#include <mutex>
#include <utility>

bool TokenVault::insert(std::string token, std::string original) {
    std::unique_lock lock(mutex_);
    return entries_.emplace(std::move(token), std::move(original)).second;
}

bool TokenVault::contains(std::string_view token) const {
    std::shared_lock lock(mutex_);
    return entries_.find(token) != entries_.end();
}

std::optional<std::string> TokenVault::find(std::string_view token) const {
    std::shared_lock lock(mutex_);
    const auto it = entries_.find(token);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

TokenVault::Map TokenVault::snapshot() const {
    std::shared_lock lock(mutex_);
    return entries_;
}

std::size_t TokenVault::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

void TokenVault::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}
