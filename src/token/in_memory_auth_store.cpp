#include "token/in_memory_auth_store.hpp"

#include <algorithm>

std::expected<void, StorageError> InMemoryAuthStore::persist(const TokenRecord& record) {
    std::lock_guard lock(mutex_);
    tokens_[record.jti] = record;
    return {};
}

std::expected<std::optional<TokenRecord>, StorageError> InMemoryAuthStore::find(const std::string& jti) {
    std::lock_guard lock(mutex_);
    const auto it = tokens_.find(jti);
    if (it == tokens_.end()) {
        return std::optional<TokenRecord>{};
    }
    return std::optional<TokenRecord>{it->second};
}

std::expected<bool, StorageError> InMemoryAuthStore::is_revoked(const std::string& jti) {
    std::lock_guard lock(mutex_);
    return revoked_.contains(jti);
}

std::expected<void, StorageError>
InMemoryAuthStore::revoke(const std::string& jti, TokenStorage::TimePoint expires_at) {
    std::lock_guard lock(mutex_);
    revoked_.try_emplace(jti, expires_at);
    return {};
}

std::expected<std::size_t, StorageError> InMemoryAuthStore::cleanup_expired(TokenStorage::TimePoint now) {
    std::lock_guard lock(mutex_);
    const std::size_t removed = std::erase_if(revoked_, [now](const auto& e) { return e.second <= now; }) +
                                std::erase_if(tokens_, [now](const auto& e) { return e.second.expires_at <= now; });
    return removed;
}

std::expected<std::vector<StoredSigningKey>, StorageError> InMemoryAuthStore::load_keys() {
    std::lock_guard lock(mutex_);
    return keys_;
}

std::expected<void, StorageError>
InMemoryAuthStore::insert_key_as_current(const StoredSigningKey& key,
                                         SigningKeyStorage::TimePoint previous_retire_after) {
    std::lock_guard lock(mutex_);
    for (auto& existing : keys_) {
        if (existing.current) {
            existing.current      = false;
            existing.retire_after = previous_retire_after;
        }
    }
    StoredSigningKey inserted = key;
    inserted.current      = true;
    inserted.retire_after = std::nullopt;
    keys_.push_back(std::move(inserted));
    return {};
}

std::expected<std::size_t, StorageError> InMemoryAuthStore::remove_retired(SigningKeyStorage::TimePoint now) {
    std::lock_guard lock(mutex_);
    return std::erase_if(keys_, [now](const StoredSigningKey& k) {
        return !k.current && k.retire_after && *k.retire_after <= now;
    });
}

std::size_t InMemoryAuthStore::revoked_count() const {
    std::lock_guard lock(mutex_);
    return revoked_.size();
}
