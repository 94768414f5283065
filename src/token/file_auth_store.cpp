// ---------------------------------------------------------------------------
// file_auth_store.cpp
//
// 스냅샷 형식:
//   tokens:  [{jti, sub, client_id, scope, kind, iat, exp}]
//   revoked: [{jti, exp}]
//   keys:    [{kid, alg, pem, created_at, retire_after?, current}]
// 시각은 모두 Unix epoch 초.
// ---------------------------------------------------------------------------

#include "token/file_auth_store.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <map>
#include <sstream>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

using TimePoint = std::chrono::system_clock::time_point;

struct Snapshot {
    std::map<std::string, TokenRecord> tokens;
    std::map<std::string, TimePoint>   revoked;
    std::vector<StoredSigningKey>      keys;
};

[[nodiscard]] std::int64_t to_epoch(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

[[nodiscard]] TimePoint from_epoch(std::int64_t secs) {
    return TimePoint{std::chrono::seconds{secs}};
}

[[nodiscard]] StorageError io_error(StorageErrorCode code, std::string_view what) {
    return StorageError{code, fmt::format("{}: {}", what, std::strerror(errno))};
}

// ---------------------------------------------------------------------------
// FileLock
//   lock 파일에 대한 flock RAII. 스냅샷 파일 자체는 rename 으로 교체되므로
//   별도의 안정적인 inode 에 lock 을 건다.
// ---------------------------------------------------------------------------
class FileLock {
public:
    FileLock(const std::filesystem::path& lock_path, int operation) {
        fd_ = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
        if (fd_ < 0) {
            return;
        }
        while (::flock(fd_, operation) != 0) {
            if (errno != EINTR) {
                ::close(fd_);
                fd_ = -1;
                return;
            }
        }
    }

    ~FileLock() {
        if (fd_ >= 0) {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
        }
    }

    FileLock(const FileLock&)            = delete;
    FileLock& operator=(const FileLock&) = delete;

    [[nodiscard]] bool locked() const noexcept { return fd_ >= 0; }

private:
    int fd_{-1};
};

[[nodiscard]] std::expected<Snapshot, StorageError> read_snapshot(const std::filesystem::path& path) {
    Snapshot snap;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return snap;
    }

    try {
        const YAML::Node root = YAML::LoadFile(path.string());

        for (const auto& node : root["tokens"]) {
            TokenRecord rec;
            rec.jti        = node["jti"].as<std::string>();
            rec.subject    = node["sub"].as<std::string>("");
            rec.client_id  = node["client_id"].as<std::string>("");
            rec.scopes     = node["scope"].as<std::string>("");
            rec.kind       = parse_token_kind(node["kind"].as<std::string>("access")).value_or(TokenKind::kAccess);
            rec.issued_at  = from_epoch(node["iat"].as<std::int64_t>());
            rec.expires_at = from_epoch(node["exp"].as<std::int64_t>());
            snap.tokens.emplace(rec.jti, std::move(rec));
        }
        for (const auto& node : root["revoked"]) {
            snap.revoked.emplace(node["jti"].as<std::string>(), from_epoch(node["exp"].as<std::int64_t>()));
        }
        for (const auto& node : root["keys"]) {
            StoredSigningKey key;
            key.kid        = node["kid"].as<std::string>();
            key.algorithm  = node["alg"].as<std::string>();
            key.private_pem = node["pem"].as<std::string>();
            key.created_at = from_epoch(node["created_at"].as<std::int64_t>());
            if (node["retire_after"]) {
                key.retire_after = from_epoch(node["retire_after"].as<std::int64_t>());
            }
            key.current = node["current"].as<bool>(false);
            snap.keys.push_back(std::move(key));
        }
    } catch (const YAML::Exception& e) {
        return std::unexpected(StorageError{StorageErrorCode::kCorrupted,
                                            fmt::format("cannot read store '{}': {}", path.string(), e.what())});
    }
    return snap;
}

[[nodiscard]] std::expected<void, StorageError>
write_snapshot(const std::filesystem::path& path, const Snapshot& snap) {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "tokens" << YAML::Value << YAML::BeginSeq;
    for (const auto& [jti, rec] : snap.tokens) {
        out << YAML::BeginMap
            << YAML::Key << "jti" << YAML::Value << jti
            << YAML::Key << "sub" << YAML::Value << rec.subject
            << YAML::Key << "client_id" << YAML::Value << rec.client_id
            << YAML::Key << "scope" << YAML::Value << rec.scopes
            << YAML::Key << "kind" << YAML::Value << std::string(to_string(rec.kind))
            << YAML::Key << "iat" << YAML::Value << to_epoch(rec.issued_at)
            << YAML::Key << "exp" << YAML::Value << to_epoch(rec.expires_at)
            << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "revoked" << YAML::Value << YAML::BeginSeq;
    for (const auto& [jti, exp] : snap.revoked) {
        out << YAML::BeginMap
            << YAML::Key << "jti" << YAML::Value << jti
            << YAML::Key << "exp" << YAML::Value << to_epoch(exp)
            << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "keys" << YAML::Value << YAML::BeginSeq;
    for (const auto& key : snap.keys) {
        out << YAML::BeginMap
            << YAML::Key << "kid" << YAML::Value << key.kid
            << YAML::Key << "alg" << YAML::Value << key.algorithm
            << YAML::Key << "pem" << YAML::Value << YAML::Literal << key.private_pem
            << YAML::Key << "created_at" << YAML::Value << to_epoch(key.created_at);
        if (key.retire_after) {
            out << YAML::Key << "retire_after" << YAML::Value << to_epoch(*key.retire_after);
        }
        out << YAML::Key << "current" << YAML::Value << key.current << YAML::EndMap;
    }
    out << YAML::EndSeq << YAML::EndMap;

    const std::filesystem::path tmp = path.string() + ".tmp";
    const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        return std::unexpected(io_error(StorageErrorCode::kUnavailable, "open temp snapshot"));
    }

    const char*       data      = out.c_str();
    std::size_t       remaining = out.size();
    while (remaining > 0) {
        const ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            auto err = io_error(StorageErrorCode::kUnavailable, "write snapshot");
            ::close(fd);
            return std::unexpected(std::move(err));
        }
        data      += n;
        remaining -= static_cast<std::size_t>(n);
    }
    if (::fsync(fd) != 0) {
        auto err = io_error(StorageErrorCode::kUnavailable, "fsync snapshot");
        ::close(fd);
        return std::unexpected(std::move(err));
    }
    ::close(fd);

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        return std::unexpected(StorageError{StorageErrorCode::kUnavailable,
                                            fmt::format("rename snapshot: {}", ec.message())});
    }
    return {};
}

// read-modify-write 를 배타 lock 하에서 수행한다.
// fn 이 오류를 반환하면 스냅샷을 기록하지 않는다.
template <typename Result, typename Fn>
[[nodiscard]] std::expected<Result, StorageError>
mutate(const std::filesystem::path& path, const std::filesystem::path& lock_path, Fn&& fn) {
    FileLock lock(lock_path, LOCK_EX);
    if (!lock.locked()) {
        return std::unexpected(io_error(StorageErrorCode::kUnavailable, "lock store"));
    }
    auto snap = read_snapshot(path);
    if (!snap) {
        return std::unexpected(snap.error());
    }
    Result result = fn(*snap);
    if (auto written = write_snapshot(path, *snap); !written) {
        return std::unexpected(written.error());
    }
    return result;
}

template <typename Result, typename Fn>
[[nodiscard]] std::expected<Result, StorageError>
inspect(const std::filesystem::path& path, const std::filesystem::path& lock_path, Fn&& fn) {
    FileLock lock(lock_path, LOCK_SH);
    if (!lock.locked()) {
        return std::unexpected(io_error(StorageErrorCode::kUnavailable, "lock store"));
    }
    auto snap = read_snapshot(path);
    if (!snap) {
        return std::unexpected(snap.error());
    }
    return fn(*snap);
}

}  // namespace

FileAuthStore::FileAuthStore(std::filesystem::path path)
    : path_(std::move(path))
    , lock_path_(path_.string() + ".lock")
{
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            spdlog::warn("file_auth_store: cannot create directory '{}': {}",
                         path_.parent_path().string(), ec.message());
        }
    }
}

std::expected<void, StorageError> FileAuthStore::persist(const TokenRecord& record) {
    auto r = mutate<bool>(path_, lock_path_, [&record](Snapshot& snap) {
        snap.tokens[record.jti] = record;
        return true;
    });
    if (!r) {
        return std::unexpected(r.error());
    }
    return {};
}

std::expected<std::optional<TokenRecord>, StorageError> FileAuthStore::find(const std::string& jti) {
    return inspect<std::optional<TokenRecord>>(path_, lock_path_, [&jti](const Snapshot& snap) {
        const auto it = snap.tokens.find(jti);
        return it == snap.tokens.end() ? std::optional<TokenRecord>{} : std::optional<TokenRecord>{it->second};
    });
}

std::expected<bool, StorageError> FileAuthStore::is_revoked(const std::string& jti) {
    return inspect<bool>(path_, lock_path_, [&jti](const Snapshot& snap) {
        return snap.revoked.contains(jti);
    });
}

std::expected<void, StorageError>
FileAuthStore::revoke(const std::string& jti, TokenStorage::TimePoint expires_at) {
    auto r = mutate<bool>(path_, lock_path_, [&](Snapshot& snap) {
        snap.revoked.try_emplace(jti, expires_at);
        return true;
    });
    if (!r) {
        return std::unexpected(r.error());
    }
    return {};
}

std::expected<std::size_t, StorageError> FileAuthStore::cleanup_expired(TokenStorage::TimePoint now) {
    return mutate<std::size_t>(path_, lock_path_, [now](Snapshot& snap) {
        return std::erase_if(snap.revoked, [now](const auto& e) { return e.second <= now; }) +
               std::erase_if(snap.tokens, [now](const auto& e) { return e.second.expires_at <= now; });
    });
}

std::expected<std::vector<StoredSigningKey>, StorageError> FileAuthStore::load_keys() {
    return inspect<std::vector<StoredSigningKey>>(path_, lock_path_, [](const Snapshot& snap) {
        return snap.keys;
    });
}

std::expected<void, StorageError>
FileAuthStore::insert_key_as_current(const StoredSigningKey& key,
                                     SigningKeyStorage::TimePoint previous_retire_after) {
    auto r = mutate<bool>(path_, lock_path_, [&](Snapshot& snap) {
        for (auto& existing : snap.keys) {
            if (existing.current) {
                existing.current      = false;
                existing.retire_after = previous_retire_after;
            }
        }
        StoredSigningKey inserted = key;
        inserted.current      = true;
        inserted.retire_after = std::nullopt;
        snap.keys.push_back(std::move(inserted));
        return true;
    });
    if (!r) {
        return std::unexpected(r.error());
    }
    return {};
}

std::expected<std::size_t, StorageError> FileAuthStore::remove_retired(SigningKeyStorage::TimePoint now) {
    return mutate<std::size_t>(path_, lock_path_, [now](Snapshot& snap) {
        return std::erase_if(snap.keys, [now](const StoredSigningKey& k) {
            return !k.current && k.retire_after && *k.retire_after <= now;
        });
    });
}
