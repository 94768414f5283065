// ---------------------------------------------------------------------------
// smart_scopes.cpp
//
// SMART scope 파서 구현.
//
// [권한 ↔ 오퍼레이션 매핑]
//   read/vread/history-*        → r
//   search-type/search-system   → s
//   create                      → c
//   update/patch                → u
//   delete                      → d
//   capabilities                → 항상 허용 (scope 검사 대상 아님)
//   batch/transaction/operation → 개별 엔트리 단위로 재검사되어야 하므로
//                                 여기서는 허용하지 않는다 (fail-close)
// ---------------------------------------------------------------------------

#include "smart/smart_scopes.hpp"

#include <array>
#include <cctype>

#include <fmt/format.h>

namespace {

constexpr std::string_view kPermissionOrder = "cruds";

struct SpecialScope {
    std::string_view   name;
    SmartScope::Kind   kind;
};

constexpr std::array<SpecialScope, 7> kSpecialScopes{{
    {"launch",           SmartScope::Kind::kLaunch},
    {"launch/patient",   SmartScope::Kind::kLaunchPatient},
    {"launch/encounter", SmartScope::Kind::kLaunchEncounter},
    {"openid",           SmartScope::Kind::kOpenId},
    {"fhirUser",         SmartScope::Kind::kFhirUser},
    {"offline_access",   SmartScope::Kind::kOfflineAccess},
    {"online_access",    SmartScope::Kind::kOnlineAccess},
}};

[[nodiscard]] bool valid_resource_type(std::string_view type) {
    if (type == "*") {
        return true;
    }
    if (type.empty() || !std::isupper(static_cast<unsigned char>(type.front()))) {
        return false;
    }
    for (const char ch : type) {
        if (!std::isalnum(static_cast<unsigned char>(ch))) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::string_view to_string(ScopeContext context) noexcept {
    switch (context) {
        case ScopeContext::kPatient: return "patient";
        case ScopeContext::kUser:    return "user";
        case ScopeContext::kSystem:  return "system";
    }
    return "patient";
}

// ---------------------------------------------------------------------------
// ScopePermissions::parse
// ---------------------------------------------------------------------------
std::expected<ScopePermissions, std::string> ScopePermissions::parse(std::string_view text) {
    ScopePermissions perms{};

    // SMART v1 표기
    if (text == "read") {
        perms.read   = true;
        perms.search = true;
        return perms;
    }
    if (text == "write") {
        perms.create = true;
        perms.update = true;
        perms.remove = true;
        return perms;
    }
    if (text == "*") {
        return ScopePermissions{true, true, true, true, true};
    }

    if (text.empty()) {
        return std::unexpected(std::string("empty permission set"));
    }

    std::size_t last_index = 0;
    bool        first      = true;
    for (const char ch : text) {
        const auto index = kPermissionOrder.find(ch);
        if (index == std::string_view::npos) {
            return std::unexpected(fmt::format("unknown permission '{}' in '{}'", ch, text));
        }
        if (!first && index <= last_index) {
            return std::unexpected(
                fmt::format("permissions '{}' must appear in c<r<u<d<s order without repeats", text));
        }
        first      = false;
        last_index = index;

        switch (ch) {
            case 'c': perms.create = true; break;
            case 'r': perms.read   = true; break;
            case 'u': perms.update = true; break;
            case 'd': perms.remove = true; break;
            case 's': perms.search = true; break;
            default: break;
        }
    }
    return perms;
}

bool ScopePermissions::allows(FhirOperation op) const noexcept {
    switch (op) {
        case FhirOperation::kRead:
        case FhirOperation::kVRead:
        case FhirOperation::kHistoryInstance:
        case FhirOperation::kHistoryType:
        case FhirOperation::kHistorySystem:
            return read;
        case FhirOperation::kSearchType:
        case FhirOperation::kSearchSystem:
            return search;
        case FhirOperation::kCreate:
            return create;
        case FhirOperation::kUpdate:
        case FhirOperation::kPatch:
            return update;
        case FhirOperation::kDelete:
            return remove;
        case FhirOperation::kCapabilities:
            return true;
        case FhirOperation::kBatch:
        case FhirOperation::kTransaction:
        case FhirOperation::kOperation:
            return false;
    }
    return false;
}

std::string ScopePermissions::to_string() const {
    std::string out;
    if (create) out += 'c';
    if (read)   out += 'r';
    if (update) out += 'u';
    if (remove) out += 'd';
    if (search) out += 's';
    return out;
}

// ---------------------------------------------------------------------------
// SmartScope::parse
// ---------------------------------------------------------------------------
std::expected<SmartScope, std::string> SmartScope::parse(std::string_view token) {
    SmartScope scope{};
    scope.raw = std::string(token);

    for (const auto& special : kSpecialScopes) {
        if (special.name == token) {
            scope.kind = special.kind;
            return scope;
        }
    }

    const auto slash = token.find('/');
    if (slash == std::string_view::npos) {
        return std::unexpected(fmt::format("unknown scope '{}'", token));
    }

    const std::string_view context = token.substr(0, slash);
    if (context == "patient") {
        scope.context = ScopeContext::kPatient;
    } else if (context == "user") {
        scope.context = ScopeContext::kUser;
    } else if (context == "system") {
        scope.context = ScopeContext::kSystem;
    } else {
        return std::unexpected(fmt::format("unknown scope context '{}' in '{}'", context, token));
    }

    std::string_view rest = token.substr(slash + 1);
    std::string_view query{};
    if (const auto qpos = rest.find('?'); qpos != std::string_view::npos) {
        query = rest.substr(qpos + 1);
        rest  = rest.substr(0, qpos);
    }

    const auto dot = rest.rfind('.');
    if (dot == std::string_view::npos) {
        return std::unexpected(fmt::format("scope '{}' has no permission suffix", token));
    }
    const std::string_view type  = rest.substr(0, dot);
    const std::string_view perms = rest.substr(dot + 1);

    if (!valid_resource_type(type)) {
        return std::unexpected(fmt::format("invalid resource type '{}' in '{}'", type, token));
    }
    scope.resource_type = std::string(type);

    auto parsed = ScopePermissions::parse(perms);
    if (!parsed) {
        return std::unexpected(fmt::format("scope '{}': {}", token, parsed.error()));
    }
    scope.permissions = *parsed;

    while (!query.empty()) {
        const auto amp = query.find('&');
        const std::string_view pair = query.substr(0, amp);
        const auto eq = pair.find('=');
        if (eq == std::string_view::npos || eq == 0) {
            return std::unexpected(fmt::format("malformed filter '{}' in '{}'", pair, token));
        }
        scope.filters.emplace_back(std::string(pair.substr(0, eq)), std::string(pair.substr(eq + 1)));
        if (amp == std::string_view::npos) {
            break;
        }
        query = query.substr(amp + 1);
    }

    return scope;
}

bool SmartScope::permits(std::string_view type, FhirOperation op) const noexcept {
    if (kind != Kind::kResource) {
        return false;
    }
    if (resource_type != "*" && resource_type != type) {
        return false;
    }
    return permissions.allows(op);
}

// ---------------------------------------------------------------------------
// SmartScopes
// ---------------------------------------------------------------------------
std::expected<SmartScopes, std::string> SmartScopes::parse(std::string_view scope_string) {
    SmartScopes result;

    std::size_t pos = 0;
    while (pos < scope_string.size()) {
        while (pos < scope_string.size() &&
               std::isspace(static_cast<unsigned char>(scope_string[pos]))) {
            ++pos;
        }
        std::size_t end = pos;
        while (end < scope_string.size() &&
               !std::isspace(static_cast<unsigned char>(scope_string[end]))) {
            ++end;
        }
        if (end > pos) {
            auto scope = SmartScope::parse(scope_string.substr(pos, end - pos));
            if (!scope) {
                return std::unexpected(scope.error());
            }
            result.scopes_.push_back(std::move(*scope));
        }
        pos = end;
    }
    return result;
}

bool SmartScopes::permits(ScopeContext context,
                          std::string_view resource_type,
                          FhirOperation op) const noexcept {
    for (const auto& scope : scopes_) {
        if (scope.kind == SmartScope::Kind::kResource && scope.context == context &&
            scope.permits(resource_type, op)) {
            return true;
        }
    }
    return false;
}

bool SmartScopes::permits_any(std::string_view resource_type, FhirOperation op) const noexcept {
    if (op == FhirOperation::kCapabilities) {
        return true;
    }
    for (const auto& scope : scopes_) {
        if (scope.permits(resource_type, op)) {
            return true;
        }
    }
    return false;
}

bool SmartScopes::has(SmartScope::Kind kind) const noexcept {
    for (const auto& scope : scopes_) {
        if (scope.kind == kind) {
            return true;
        }
    }
    return false;
}

std::string SmartScopes::to_string() const {
    std::string out;
    for (const auto& scope : scopes_) {
        if (!out.empty()) {
            out += ' ';
        }
        out += scope.raw;
    }
    return out;
}
