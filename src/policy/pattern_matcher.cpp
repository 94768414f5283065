// ---------------------------------------------------------------------------
// pattern_matcher.cpp
//
// [CIDR 매칭]
// ip_in_cidr() 는 IPv4 / IPv6 를 모두 처리한다. 주소 패밀리가 다르면
// 불일치 (IPv4-mapped IPv6 "::ffff:10.0.0.1" 은 IPv6 로 취급).
//
// [정규식 캐시]
// 키는 최종 regex 문자열이다 (glob 은 변환 후 캐시).
// 잘못된 패턴도 nullptr 로 캐시하여 매 요청 재컴파일/재경고를 막는다.
// ---------------------------------------------------------------------------

#include "policy/pattern_matcher.hpp"

#include <algorithm>
#include <arpa/inet.h>      // inet_pton, AF_INET, AF_INET6
#include <array>
#include <cctype>
#include <cstdint>
#include <cstring>         // memcpy
#include <mutex>
#include <netinet/in.h>     // in_addr, in6_addr

#include <spdlog/spdlog.h>

namespace {

// ---------------------------------------------------------------------------
// 내부 헬퍼: 주소 문자열 → 바이트 배열
//   반환: 유효 바이트 수 (4 또는 16), 실패 시 0
// ---------------------------------------------------------------------------
std::size_t parse_address(const std::string& text, std::array<std::uint8_t, 16>& out) {
    struct in_addr  v4{};
    struct in6_addr v6{};
    if (inet_pton(AF_INET, text.c_str(), &v4) == 1) {
        std::memcpy(out.data(), &v4, 4);
        return 4;
    }
    if (inet_pton(AF_INET6, text.c_str(), &v6) == 1) {
        std::memcpy(out.data(), &v6, 16);
        return 16;
    }
    return 0;
}

struct ParsedCidr {
    std::array<std::uint8_t, 16> network{};
    std::size_t                  length{0};
    int                          prefix_len{0};
};

std::optional<ParsedCidr> parse_cidr(const std::string& cidr) {
    const auto slash_pos = cidr.find('/');
    ParsedCidr parsed;

    const std::string network_str = cidr.substr(0, slash_pos);
    parsed.length = parse_address(network_str, parsed.network);
    if (parsed.length == 0) {
        return std::nullopt;
    }

    // '/' 없는 단일 주소는 /32, /128 로 취급
    if (slash_pos == std::string::npos) {
        parsed.prefix_len = static_cast<int>(parsed.length * 8);
        return parsed;
    }

    const std::string prefix_str = cidr.substr(slash_pos + 1);
    if (prefix_str.empty() || prefix_str.size() > 3 ||
        !std::all_of(prefix_str.begin(), prefix_str.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    parsed.prefix_len = std::stoi(prefix_str);
    if (parsed.prefix_len < 0 || parsed.prefix_len > static_cast<int>(parsed.length * 8)) {
        return std::nullopt;
    }
    return parsed;
}

// "Patient/123" 또는 ".../123" 으로 끝나는 참조
bool reference_matches(const std::optional<std::string>& reference,
                       std::string_view type, std::string_view id) {
    if (!reference) {
        return false;
    }
    const std::string_view ref = *reference;
    if (ref.size() == type.size() + 1 + id.size() && ref.starts_with(type) &&
        ref[type.size()] == '/' && ref.ends_with(id)) {
        return true;
    }
    return ref.size() > id.size() && ref.ends_with(id) && ref[ref.size() - id.size() - 1] == '/';
}

std::string escape_regex_char(char c) {
    static constexpr std::string_view kSpecial = R"(\^$.|?*+()[]{}/)";
    if (kSpecial.find(c) != std::string_view::npos) {
        return std::string{'\\', c};
    }
    return std::string(1, c);
}

}  // namespace

// ---------------------------------------------------------------------------
// 정적 헬퍼
// ---------------------------------------------------------------------------
bool PatternMatcher::ip_in_cidr(const std::string& ip, const std::string& cidr) {
    const auto net = parse_cidr(cidr);
    if (!net) {
        spdlog::warn("pattern_matcher: invalid CIDR '{}'", cidr);
        return false;
    }

    std::array<std::uint8_t, 16> addr{};
    const std::size_t addr_len = parse_address(ip, addr);
    if (addr_len == 0) {
        spdlog::debug("pattern_matcher: cannot parse source IP '{}'", ip);
        return false;
    }
    if (addr_len != net->length) {
        return false;
    }

    // prefix_len 비트까지 바이트 단위 비교 후 남은 비트는 마스크
    const int full_bytes = net->prefix_len / 8;
    const int rest_bits  = net->prefix_len % 8;
    for (int i = 0; i < full_bytes; ++i) {
        if (addr[i] != net->network[i]) {
            return false;
        }
    }
    if (rest_bits == 0) {
        return true;
    }
    const auto mask = static_cast<std::uint8_t>(0xFFu << (8 - rest_bits));
    return (addr[full_bytes] & mask) == (net->network[full_bytes] & mask);
}

bool PatternMatcher::is_valid_cidr(const std::string& cidr) {
    return parse_cidr(cidr).has_value();
}

std::string PatternMatcher::wildcard_to_regex(std::string_view glob) {
    std::string out = "^";
    for (const char c : glob) {
        out += (c == '*') ? std::string(".*") : escape_regex_char(c);
    }
    out += '$';
    return out;
}

std::string PatternMatcher::path_glob_to_regex(std::string_view glob) {
    std::string out = "^";
    for (std::size_t i = 0; i < glob.size(); ++i) {
        const char c = glob[i];
        if (c == '*') {
            if (i + 1 < glob.size() && glob[i + 1] == '*') {
                out += ".*";
                ++i;
            } else {
                out += "[^/]*";
            }
        } else if (c == '?') {
            out += '.';
        } else {
            out += escape_regex_char(c);
        }
    }
    out += '$';
    return out;
}

// ---------------------------------------------------------------------------
// 정규식 캐시
// ---------------------------------------------------------------------------
std::shared_ptr<const std::regex> PatternMatcher::compiled(const std::string& pattern) const {
    {
        std::shared_lock lock(cache_mutex_);
        if (const auto it = cache_.find(pattern); it != cache_.end()) {
            return it->second;
        }
    }

    std::shared_ptr<const std::regex> re;
    try {
        re = std::make_shared<const std::regex>(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        spdlog::warn("pattern_matcher: invalid regex '{}': {}", pattern, e.what());
    }

    std::unique_lock lock(cache_mutex_);
    const auto [it, inserted] = cache_.emplace(pattern, std::move(re));
    return it->second;
}

std::size_t PatternMatcher::cache_size() const {
    std::shared_lock lock(cache_mutex_);
    return cache_.size();
}

bool PatternMatcher::regex_match(const std::string& pattern, std::string_view value) const {
    const auto re = compiled(pattern);
    if (!re) {
        return false;
    }
    return std::regex_search(value.begin(), value.end(), *re);
}

// ---------------------------------------------------------------------------
// 개별 술어
// ---------------------------------------------------------------------------
bool PatternMatcher::match_pattern(const MatchPattern& pattern, std::string_view value) const {
    switch (pattern.kind) {
        case MatchPattern::Kind::kExact:    return value == pattern.value;
        case MatchPattern::Kind::kPrefix:   return value.starts_with(pattern.value);
        case MatchPattern::Kind::kSuffix:   return value.ends_with(pattern.value);
        case MatchPattern::Kind::kRegex:    return regex_match(pattern.value, value);
        case MatchPattern::Kind::kWildcard: return regex_match(wildcard_to_regex(pattern.value), value);
    }
    return false;
}

bool PatternMatcher::match_path(std::string_view glob, std::string_view path) const {
    return regex_match(path_glob_to_regex(glob), path);
}

bool PatternMatcher::match_compartment(const CompartmentMatcher& matcher,
                                       const PolicyContext&      ctx) const {
    // 1. compartment ID 해석 (설정된 source 하나만 사용)
    std::optional<std::string> compartment_id;
    switch (matcher.source) {
        case CompartmentSource::kLaunchContext:
            if (matcher.compartment_type == "Patient") {
                compartment_id = ctx.environment.patient_context;
            } else if (matcher.compartment_type == "Encounter") {
                compartment_id = ctx.environment.encounter_context;
            }
            break;
        case CompartmentSource::kUserResource:
            if (ctx.user && ctx.user->fhir_user_type == matcher.compartment_type) {
                compartment_id = ctx.user->fhir_user_id;
            }
            break;
        case CompartmentSource::kFixed:
            compartment_id = matcher.value;
            break;
        case CompartmentSource::kRequestParam:
            if (const auto it = ctx.request.query_params.find(matcher.value);
                it != ctx.request.query_params.end()) {
                compartment_id = it->second;
            }
            break;
    }
    if (!compartment_id || compartment_id->empty()) {
        return false;
    }
    const std::string& id   = *compartment_id;
    const std::string& type = matcher.compartment_type;

    // 2. 소속 판정
    // 2-1. compartment 리소스 자체 (/Patient/123)
    if (ctx.request.resource_type == type && ctx.request.resource_id == id) {
        return true;
    }
    // 2-2. 같은 compartment 로 한정된 요청 (/Patient/123/Observation)
    if (ctx.request.compartment_type == type && ctx.request.compartment_id == id) {
        return true;
    }
    // 2-3. 리소스 참조
    if (ctx.resource) {
        if (type == "Patient" && reference_matches(ctx.resource->subject, type, id)) {
            return true;
        }
        if (type == "Practitioner" && reference_matches(ctx.resource->author, type, id)) {
            return true;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// matches
// ---------------------------------------------------------------------------
bool PatternMatcher::matches(const std::optional<PolicyMatcher>& matcher,
                             const PolicyContext&                ctx) const {
    return !matcher || matches(*matcher, ctx);
}

bool PatternMatcher::matches(const PolicyMatcher& m, const PolicyContext& ctx) const {
    if (m.clients &&
        std::none_of(m.clients->begin(), m.clients->end(),
                     [&](const MatchPattern& p) { return match_pattern(p, ctx.client.id); })) {
        return false;
    }

    if (m.roles) {
        if (!ctx.user) {
            return false;
        }
        if (std::none_of(m.roles->begin(), m.roles->end(),
                         [&](const std::string& r) { return ctx.user->has_role(r); })) {
            return false;
        }
    }

    if (m.user_types) {
        if (!ctx.user || !ctx.user->fhir_user_type) {
            return false;
        }
        if (std::find(m.user_types->begin(), m.user_types->end(), *ctx.user->fhir_user_type) ==
            m.user_types->end()) {
            return false;
        }
    }

    if (m.resource_types &&
        std::none_of(m.resource_types->begin(), m.resource_types->end(), [&](const std::string& t) {
            return t == "*" || t == ctx.request.resource_type;
        })) {
        return false;
    }

    if (m.operations &&
        std::find(m.operations->begin(), m.operations->end(), ctx.request.operation) ==
            m.operations->end()) {
        return false;
    }

    if (m.operation_ids) {
        if (!ctx.request.operation_id) {
            return false;
        }
        const std::string& op_id = *ctx.request.operation_id;
        const bool hit = std::any_of(m.operation_ids->begin(), m.operation_ids->end(),
                                     [&](const std::string& p) {
            if (p == "*") {
                return true;
            }
            if (p.size() >= 2 && p.ends_with(".*")) {
                return op_id.starts_with(std::string_view(p).substr(0, p.size() - 1));
            }
            return p == op_id;
        });
        if (!hit) {
            return false;
        }
    }

    if (m.paths &&
        std::none_of(m.paths->begin(), m.paths->end(),
                     [&](const std::string& g) { return match_path(g, ctx.request.path); })) {
        return false;
    }

    if (m.source_ips) {
        if (!ctx.environment.source_ip) {
            return false;
        }
        const std::string& ip = *ctx.environment.source_ip;
        if (std::none_of(m.source_ips->begin(), m.source_ips->end(),
                         [&](const std::string& cidr) { return ip_in_cidr(ip, cidr); })) {
            return false;
        }
    }

    if (m.required_scopes &&
        !std::all_of(m.required_scopes->begin(), m.required_scopes->end(),
                     [&](const std::string& s) { return ctx.scopes.contains(s); })) {
        return false;
    }

    if (m.compartments &&
        !std::all_of(m.compartments->begin(), m.compartments->end(),
                     [&](const CompartmentMatcher& c) { return match_compartment(c, ctx); })) {
        return false;
    }

    return true;
}
