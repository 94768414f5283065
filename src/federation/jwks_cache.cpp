// ---------------------------------------------------------------------------
// jwks_cache.cpp
//
// [lock 순서]
// inflight_mutex_ → cache_mutex_ 순서로만 중첩한다. 역순 중첩 금지.
//
// [single-flight 경쟁 조건]
// get_key 가 캐시 miss 를 관찰한 뒤 다른 스레드의 fetch 가 끝나 inflight_ 에서
// 제거될 수 있다. load(force=false) 는 inflight_mutex_ 를 잡은 상태에서 캐시를
// 다시 확인하므로 이 경우 추가 fetch 가 발생하지 않는다.
// (캐시 기록은 inflight_ 제거보다 먼저 일어난다)
// ---------------------------------------------------------------------------

#include "federation/jwks_cache.hpp"

#include "common/json_util.hpp"
#include "common/types.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <exception>
#include <thread>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

std::string_view to_string(JwksErrorCode code) noexcept {
    switch (code) {
        case JwksErrorCode::kKeyNotFound:      return "key-not-found";
        case JwksErrorCode::kFetchFailed:      return "jwks-fetch-failed";
        case JwksErrorCode::kHttpStatus:       return "jwks-http-status";
        case JwksErrorCode::kParse:            return "jwks-parse-error";
        case JwksErrorCode::kNoSigningKeys:    return "jwks-no-signing-keys";
        case JwksErrorCode::kInvalidKey:       return "jwks-invalid-key";
        case JwksErrorCode::kInvalidScheme:    return "jwks-invalid-scheme";
        case JwksErrorCode::kResponseTooLarge: return "jwks-response-too-large";
        case JwksErrorCode::kStale:            return "jwks-stale";
    }
    return "jwks-fetch-failed";
}

JwksCache::JwksCache(JwksCacheConfig config, std::shared_ptr<JwksFetcher> fetcher, NowFn now)
    : config_(std::move(config))
    , fetcher_(std::move(fetcher))
    , now_(std::move(now))
{
    if (!fetcher_) {
        throw ConfigurationError("jwks_cache: fetcher is required");
    }
    if (config_.min_ttl > config_.max_ttl) {
        throw ConfigurationError("jwks_cache: min_ttl must not exceed max_ttl");
    }
    if (!now_) {
        now_ = &Clock::now;
    }
}

// ---------------------------------------------------------------------------
// normalize_uri
// ---------------------------------------------------------------------------
std::expected<std::string, JwksError> JwksCache::normalize_uri(std::string_view uri) const {
    while (!uri.empty() && std::isspace(static_cast<unsigned char>(uri.back()))) {
        uri.remove_suffix(1);
    }
    while (!uri.empty() && uri.back() == '/') {
        uri.remove_suffix(1);
    }

    std::string lowered(uri.substr(0, std::min<std::size_t>(uri.size(), 8)));
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::size_t host_start = 0;
    if (lowered.starts_with("https://")) {
        host_start = 8;
    } else if (lowered.starts_with("http://") && config_.allow_http) {
        host_start = 7;
    } else {
        return std::unexpected(JwksError{JwksErrorCode::kInvalidScheme,
                                         fmt::format("jwks uri '{}' must use https", uri), 0});
    }
    if (uri.size() <= host_start) {
        return std::unexpected(JwksError{JwksErrorCode::kInvalidScheme,
                                         fmt::format("jwks uri '{}' has no host", uri), 0});
    }
    return std::string(uri);
}

// ---------------------------------------------------------------------------
// ttl_from_cache_control
// ---------------------------------------------------------------------------
std::chrono::seconds JwksCache::ttl_from_cache_control(std::string_view header) const {
    std::string lowered(header);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered.find("no-store") != std::string::npos || lowered.find("no-cache") != std::string::npos) {
        return config_.min_ttl;
    }

    std::chrono::seconds ttl = config_.default_ttl;
    if (const auto pos = lowered.find("max-age="); pos != std::string::npos) {
        const char* begin = lowered.data() + pos + 8;
        const char* end   = lowered.data() + lowered.size();
        std::int64_t value{0};
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec == std::errc{} && value >= 0) {
            ttl = std::chrono::seconds{value};
        }
    }
    return std::clamp(ttl, config_.min_ttl, config_.max_ttl);
}

// ---------------------------------------------------------------------------
// parse_key_set
// ---------------------------------------------------------------------------
JwksCache::FetchResult JwksCache::parse_key_set(const JwksHttpResponse& response) const {
    if (response.body.size() > config_.max_response_size) {
        return std::unexpected(JwksError{JwksErrorCode::kResponseTooLarge,
                                         fmt::format("jwks body {} bytes exceeds limit", response.body.size()), 0});
    }
    auto doc = parse_json(response.body);
    if (!doc) {
        return std::unexpected(JwksError{JwksErrorCode::kParse, doc.error(), 0});
    }
    if (!doc->isObject() || !(*doc)["keys"].isArray()) {
        return std::unexpected(JwksError{JwksErrorCode::kParse, "jwks document has no 'keys' array", 0});
    }

    auto set = std::make_shared<JwksKeySet>();
    for (const auto& jwk : (*doc)["keys"]) {
        if (jwk.isObject() && json_string_member(jwk, "use") == "enc") {
            continue;
        }
        auto key = SigningKey::from_jwk(jwk);
        if (!key) {
            spdlog::warn("jwks_cache: skipping unusable key: {}", key.error());
            continue;
        }
        set->keys.push_back(std::move(*key));
    }
    if (set->keys.empty()) {
        return std::unexpected(JwksError{JwksErrorCode::kNoSigningKeys, "jwks contains no usable signing keys", 0});
    }

    set->fetched_at = now_();
    set->expires_at = set->fetched_at + ttl_from_cache_control(response.cache_control);
    return KeySetPtr(std::move(set));
}

// ---------------------------------------------------------------------------
// fetch_with_retries
// ---------------------------------------------------------------------------
JwksCache::FetchResult JwksCache::fetch_with_retries(const std::string& uri) {
    using Steady = std::chrono::steady_clock;
    const auto deadline = Steady::now() + config_.request_timeout;
    auto       backoff  = config_.retry_backoff;

    JwksError last{JwksErrorCode::kFetchFailed, "jwks fetch timed out", 0};
    for (std::uint32_t attempt = 0; attempt <= config_.max_retries; ++attempt) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Steady::now());
        if (remaining.count() <= 0) {
            break;
        }

        auto response = fetcher_->fetch(uri, remaining, config_.max_response_size);
        if (response) {
            return parse_key_set(*response);
        }

        last = response.error();
        spdlog::warn("jwks_cache: fetch attempt {} for '{}' failed: {}", attempt + 1, uri, last.message);
        if (!last.retryable() || attempt == config_.max_retries) {
            break;
        }
        if (Steady::now() + backoff >= deadline) {
            break;
        }
        std::this_thread::sleep_for(backoff);
        backoff *= 2;
    }
    return std::unexpected(last);
}

// ---------------------------------------------------------------------------
// load (single-flight)
// ---------------------------------------------------------------------------
JwksCache::FetchResult JwksCache::load(const std::string& uri, bool force) {
    std::promise<FetchResult>       promise;
    std::shared_future<FetchResult> future;
    bool                            owner = false;
    {
        std::lock_guard lock(inflight_mutex_);
        if (const auto it = inflight_.find(uri); it != inflight_.end()) {
            future = it->second;
        } else {
            if (!force) {
                if (auto entry = cached(uri); entry && now_() < entry->expires_at) {
                    return entry;
                }
            }
            future = promise.get_future().share();
            inflight_.emplace(uri, future);
            owner = true;
        }
    }
    if (!owner) {
        return future.get();
    }

    FetchResult result = std::unexpected(JwksError{JwksErrorCode::kFetchFailed, "jwks fetch failed", 0});
    try {
        result = fetch_with_retries(uri);
    } catch (const std::exception& e) {
        result = std::unexpected(JwksError{JwksErrorCode::kFetchFailed, e.what(), 0});
    }

    if (result) {
        std::unique_lock lock(cache_mutex_);
        entries_[uri] = *result;
        spdlog::debug("jwks_cache: cached {} keys for '{}'", (*result)->keys.size(), uri);
    }

    promise.set_value(result);
    {
        std::lock_guard lock(inflight_mutex_);
        inflight_.erase(uri);
    }
    return result;
}

JwksCache::KeySetPtr JwksCache::cached(const std::string& uri) const {
    std::shared_lock lock(cache_mutex_);
    const auto it = entries_.find(uri);
    return it == entries_.end() ? nullptr : it->second;
}

JwksCache::FetchResult JwksCache::stale_or_error(const std::string& uri, const JwksError& error) const {
    auto entry = cached(uri);
    if (!entry) {
        return std::unexpected(error);
    }
    const TimePoint now = now_();
    if (now < entry->expires_at) {
        return entry;
    }
    if (now < entry->expires_at + config_.max_staleness) {
        spdlog::warn("jwks_cache: serving stale keys for '{}' after refresh failure: {}", uri, error.message);
        return entry;
    }
    spdlog::error("jwks_cache: keys for '{}' exceeded staleness bound, refusing", uri);
    return std::unexpected(JwksError{JwksErrorCode::kStale,
                                     fmt::format("cached keys are stale and refresh failed: {}", error.message), 0});
}

// ---------------------------------------------------------------------------
// get_key
// ---------------------------------------------------------------------------
std::expected<SigningKey, JwksError> JwksCache::get_key(const std::string& jwks_uri, const std::string& kid) {
    auto uri = normalize_uri(jwks_uri);
    if (!uri) {
        return std::unexpected(uri.error());
    }

    const auto find_kid = [&kid](const JwksKeySet& set) -> const SigningKey* {
        for (const auto& key : set.keys) {
            if (key.kid() == kid) {
                return &key;
            }
        }
        return nullptr;
    };

    auto entry = cached(*uri);
    bool force = false;
    if (entry && now_() < entry->expires_at) {
        if (const auto* key = find_kid(*entry)) {
            return *key;
        }
        // IdP 가 키를 교체했을 수 있다. 최근에 받은 집합이면 다시 받지 않는다.
        if (now_() - entry->fetched_at < config_.min_ttl) {
            return std::unexpected(JwksError{JwksErrorCode::kKeyNotFound,
                                             fmt::format("kid '{}' not found in jwks", kid), 0});
        }
        force = true;
    }

    auto loaded = load(*uri, force);
    if (!loaded) {
        loaded = stale_or_error(*uri, loaded.error());
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
    }
    if (const auto* key = find_kid(**loaded)) {
        return *key;
    }
    return std::unexpected(JwksError{JwksErrorCode::kKeyNotFound,
                                     fmt::format("kid '{}' not found in jwks", kid), 0});
}

// ---------------------------------------------------------------------------
// find_signing_keys
// ---------------------------------------------------------------------------
std::expected<std::vector<SigningKey>, JwksError> JwksCache::find_signing_keys(const std::string& jwks_uri) {
    auto uri = normalize_uri(jwks_uri);
    if (!uri) {
        return std::unexpected(uri.error());
    }
    auto loaded = load(*uri, false);
    if (!loaded) {
        loaded = stale_or_error(*uri, loaded.error());
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
    }
    return (*loaded)->keys;
}

// ---------------------------------------------------------------------------
// refresh
// ---------------------------------------------------------------------------
std::expected<std::size_t, JwksError> JwksCache::refresh(const std::string& jwks_uri) {
    auto uri = normalize_uri(jwks_uri);
    if (!uri) {
        return std::unexpected(uri.error());
    }
    auto loaded = load(*uri, true);
    if (!loaded) {
        return std::unexpected(loaded.error());
    }
    return (*loaded)->keys.size();
}

void JwksCache::invalidate(const std::string& jwks_uri) {
    auto uri = normalize_uri(jwks_uri);
    if (!uri) {
        return;
    }
    std::unique_lock lock(cache_mutex_);
    entries_.erase(*uri);
}

std::size_t JwksCache::cleanup() {
    const TimePoint now = now_();
    std::unique_lock lock(cache_mutex_);
    return std::erase_if(entries_, [&](const auto& e) {
        return now >= e.second->expires_at + config_.max_staleness;
    });
}

void JwksCache::clear() {
    std::unique_lock lock(cache_mutex_);
    entries_.clear();
}
