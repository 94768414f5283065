#pragma once

// ---------------------------------------------------------------------------
// in_memory_auth_store.hpp
//
// 단일 프로세스용 TokenStorage + SigningKeyStorage 구현.
// 테스트와 단일 노드 배포에 사용한다. 재시작 시 상태가 사라지므로
// 운영 환경에서는 FileAuthStore 또는 외부 저장소를 사용해야 한다.
//
// [스레드 안전성]
// 모든 메서드는 내부 mutex 로 직렬화되며 read-after-write 를 보장한다.
// ---------------------------------------------------------------------------

#include "token/token_storage.hpp"

#include <mutex>
#include <unordered_map>

class InMemoryAuthStore final : public TokenStorage, public SigningKeyStorage {
public:
    InMemoryAuthStore()  = default;
    ~InMemoryAuthStore() override = default;

    InMemoryAuthStore(const InMemoryAuthStore&)            = delete;
    InMemoryAuthStore& operator=(const InMemoryAuthStore&) = delete;

    // TokenStorage
    [[nodiscard]] std::expected<void, StorageError> persist(const TokenRecord& record) override;
    [[nodiscard]] std::expected<std::optional<TokenRecord>, StorageError>
    find(const std::string& jti) override;
    [[nodiscard]] std::expected<bool, StorageError> is_revoked(const std::string& jti) override;
    [[nodiscard]] std::expected<void, StorageError>
    revoke(const std::string& jti, TokenStorage::TimePoint expires_at) override;
    [[nodiscard]] std::expected<std::size_t, StorageError>
    cleanup_expired(TokenStorage::TimePoint now) override;

    // SigningKeyStorage
    [[nodiscard]] std::expected<std::vector<StoredSigningKey>, StorageError> load_keys() override;
    [[nodiscard]] std::expected<void, StorageError>
    insert_key_as_current(const StoredSigningKey& key,
                          SigningKeyStorage::TimePoint previous_retire_after) override;
    [[nodiscard]] std::expected<std::size_t, StorageError>
    remove_retired(SigningKeyStorage::TimePoint now) override;

    // 테스트 진단용
    [[nodiscard]] std::size_t revoked_count() const;

private:
    mutable std::mutex                                             mutex_;
    std::unordered_map<std::string, TokenRecord>                   tokens_;
    std::unordered_map<std::string, TokenStorage::TimePoint>       revoked_;
    std::vector<StoredSigningKey>                                  keys_;
};
