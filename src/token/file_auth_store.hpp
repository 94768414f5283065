#pragma once

// ---------------------------------------------------------------------------
// file_auth_store.hpp
//
// YAML 스냅샷 파일 기반 TokenStorage + SigningKeyStorage.
//
// [원자성]
// 모든 변경은 flock(LOCK_EX) 하에서 read → modify → 임시 파일 기록 →
// fsync → rename(2) 순서로 수행한다. rename 은 같은 파일시스템에서 원자적이므로
// 중간 실패/취소 시에도 이전 스냅샷 또는 새 스냅샷 중 하나만 관찰된다.
// 여러 프로세스가 같은 경로를 공유해도 advisory lock 으로 직렬화된다.
//
// [보안 주의]
// 스냅샷에는 서명 개인키(PEM)가 포함된다. 파일은 0600 으로 생성한다.
// ---------------------------------------------------------------------------

#include "token/token_storage.hpp"

#include <filesystem>

class FileAuthStore final : public TokenStorage, public SigningKeyStorage {
public:
    // path: 스냅샷 파일 경로. 없으면 첫 쓰기 때 생성된다.
    explicit FileAuthStore(std::filesystem::path path);
    ~FileAuthStore() override = default;

    FileAuthStore(const FileAuthStore&)            = delete;
    FileAuthStore& operator=(const FileAuthStore&) = delete;

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

private:
    std::filesystem::path path_;
    std::filesystem::path lock_path_;
};
