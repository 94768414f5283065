// ---------------------------------------------------------------------------
// policy_loader.cpp
//
// YAML 정책 파일을 AccessPolicy 목록으로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱/검증 실패 시 부분 정책을 반환하지 않는다.
// - 필드 누락 시 구조체 기본값을 적용한다 (priority 100, active true).
// - 스크립트 본문은 로그에 출력하지 않는다.
//
// [matcher 필드 해석]
// - 키가 없으면 std::nullopt (조건 없음).
// - 키가 있으면 빈 sequence 라도 설정된 것으로 본다. any-of 필드의 빈 목록은
//   어떤 요청과도 일치하지 않는다.
// - clients 항목: 문자열은 '*' 포함 시 wildcard, 아니면 exact.
//   {exact|prefix|suffix|regex|wildcard: "..."} 맵으로 명시할 수 있다.
// ---------------------------------------------------------------------------

#include "policy/policy_loader.hpp"

#include <algorithm>
#include <regex>
#include <set>
#include <string>
#include <filesystem>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

#include "policy/pattern_matcher.hpp"

namespace {

// 정책 1건 파싱 중 발생한 검증 오류
struct PolicyValidationError {
    std::string message;
};

const std::set<std::string, std::less<>> kKnownUserTypes = {
    "Patient", "Practitioner", "PractitionerRole", "RelatedPerson", "Person",
};

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 벡터를 읽는다.
// 노드가 없으면 std::nullopt, sequence 가 아니면 검증 오류.
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<std::vector<std::string>>
read_string_sequence(const YAML::Node& node, std::string_view field) {
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    if (!node.IsSequence()) {
        throw PolicyValidationError{fmt::format("'{}' must be a sequence", field)};
    }
    std::vector<std::string> result;
    result.reserve(node.size());
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            throw PolicyValidationError{fmt::format("'{}' items must be strings", field)};
        }
        result.push_back(item.as<std::string>());
    }
    return result;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 bool 값을 읽는다. 없으면 fallback 반환.
// ---------------------------------------------------------------------------
[[nodiscard]] bool read_bool(const YAML::Node& node, bool fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 값을 읽는다. 없으면 fallback 반환.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::string>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

[[nodiscard]] std::optional<std::string> read_optional_string(const YAML::Node& node) {
    if (!node || !node.IsScalar()) {
        return std::nullopt;
    }
    return node.as<std::string>();
}

void validate_regex(const std::string& pattern) {
    try {
        std::regex re(pattern, std::regex::ECMAScript);
        (void)re;  // 컴파일만 확인
    } catch (const std::regex_error& e) {
        throw PolicyValidationError{fmt::format("invalid regex '{}': {}", pattern, e.what())};
    }
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: clients 항목 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] MatchPattern parse_match_pattern(const YAML::Node& node) {
    if (node.IsScalar()) {
        const auto value = node.as<std::string>();
        return MatchPattern{value.find('*') != std::string::npos ? MatchPattern::Kind::kWildcard
                                                                   : MatchPattern::Kind::kExact,
                            value};
    }
    if (!node.IsMap() || node.size() != 1) {
        throw PolicyValidationError{"client pattern must be a string or a single-key map"};
    }

    const auto it   = node.begin();
    const auto kind = it->first.as<std::string>();
    const auto val  = it->second.as<std::string>();
    if (kind == "exact")    return MatchPattern{MatchPattern::Kind::kExact, val};
    if (kind == "prefix")   return MatchPattern{MatchPattern::Kind::kPrefix, val};
    if (kind == "suffix")   return MatchPattern{MatchPattern::Kind::kSuffix, val};
    if (kind == "wildcard") return MatchPattern{MatchPattern::Kind::kWildcard, val};
    if (kind == "regex") {
        validate_regex(val);
        return MatchPattern{MatchPattern::Kind::kRegex, val};
    }
    throw PolicyValidationError{fmt::format("unknown client pattern kind '{}'", kind)};
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: compartments 항목 파싱
//   {type: Patient, source: launch_context}
//   {type: Patient, source: fixed, value: "123"}
//   {type: Patient, source: request_param, param: patient}
// ---------------------------------------------------------------------------
[[nodiscard]] CompartmentMatcher parse_compartment(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw PolicyValidationError{"compartment entry must be a map"};
    }
    CompartmentMatcher cm;
    cm.compartment_type = read_string(node["type"], "");
    if (cm.compartment_type.empty()) {
        throw PolicyValidationError{"compartment entry requires 'type'"};
    }

    const auto source = read_string(node["source"], "launch_context");
    if (source == "launch_context") {
        cm.source = CompartmentSource::kLaunchContext;
    } else if (source == "user_resource") {
        cm.source = CompartmentSource::kUserResource;
    } else if (source == "fixed") {
        cm.source = CompartmentSource::kFixed;
        cm.value  = read_string(node["value"], "");
        if (cm.value.empty()) {
            throw PolicyValidationError{"fixed compartment requires 'value'"};
        }
    } else if (source == "request_param") {
        cm.source = CompartmentSource::kRequestParam;
        cm.value  = read_string(node["param"], "");
        if (cm.value.empty()) {
            throw PolicyValidationError{"request_param compartment requires 'param'"};
        }
    } else {
        throw PolicyValidationError{fmt::format("unknown compartment source '{}'", source)};
    }
    return cm;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: PolicyMatcher 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<PolicyMatcher> parse_matcher(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    if (!node.IsMap()) {
        throw PolicyValidationError{"'matcher' must be a map"};
    }

    PolicyMatcher m;

    if (const auto& clients = node["clients"]; clients && !clients.IsNull()) {
        if (!clients.IsSequence()) {
            throw PolicyValidationError{"'clients' must be a sequence"};
        }
        std::vector<MatchPattern> patterns;
        for (const auto& item : clients) {
            patterns.push_back(parse_match_pattern(item));
        }
        m.clients = std::move(patterns);
    }

    m.roles = read_string_sequence(node["roles"], "roles");

    m.user_types = read_string_sequence(node["user_types"], "user_types");
    if (m.user_types) {
        for (const auto& t : *m.user_types) {
            if (!kKnownUserTypes.contains(t)) {
                throw PolicyValidationError{fmt::format("unknown user type '{}'", t)};
            }
        }
    }

    m.resource_types = read_string_sequence(node["resource_types"], "resource_types");

    if (const auto names = read_string_sequence(node["operations"], "operations")) {
        std::vector<FhirOperation> ops;
        for (const auto& name : *names) {
            const auto expanded = expand_operation_alias(name);
            if (!expanded) {
                throw PolicyValidationError{fmt::format("unknown operation '{}'", name)};
            }
            for (const auto op : *expanded) {
                if (std::find(ops.begin(), ops.end(), op) == ops.end()) {
                    ops.push_back(op);
                }
            }
        }
        m.operations = std::move(ops);
    }

    m.operation_ids = read_string_sequence(node["operation_ids"], "operation_ids");

    m.paths = read_string_sequence(node["paths"], "paths");
    if (m.paths) {
        for (const auto& glob : *m.paths) {
            validate_regex(PatternMatcher::path_glob_to_regex(glob));
        }
    }

    m.source_ips = read_string_sequence(node["source_ips"], "source_ips");
    if (m.source_ips) {
        for (const auto& cidr : *m.source_ips) {
            if (!PatternMatcher::is_valid_cidr(cidr)) {
                throw PolicyValidationError{fmt::format("invalid CIDR '{}'", cidr)};
            }
        }
    }

    m.required_scopes = read_string_sequence(node["required_scopes"], "required_scopes");

    if (const auto& comps = node["compartments"]; comps && !comps.IsNull()) {
        if (!comps.IsSequence()) {
            throw PolicyValidationError{"'compartments' must be a sequence"};
        }
        std::vector<CompartmentMatcher> list;
        for (const auto& item : comps) {
            list.push_back(parse_compartment(item));
        }
        m.compartments = std::move(list);
    }

    return m;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: engine 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] PolicyEngineSpec parse_engine(const YAML::Node& node) {
    if (!node || !node.IsMap()) {
        throw PolicyValidationError{"'engine' map is required"};
    }

    const auto type = read_string(node["type"], "");
    if (type == "allow") {
        return AllowEngine{};
    }
    if (type == "deny") {
        return DenyEngine{};
    }
    if (type != "script") {
        throw PolicyValidationError{fmt::format("unknown engine type '{}'", type)};
    }

    ScriptEngineSpec spec;
    const auto language = read_string(node["language"], "lightweight");
    if (language == "lightweight") {
        spec.language = ScriptLanguage::kLightweight;
    } else if (language == "javascript" || language == "quickjs") {
        spec.language = ScriptLanguage::kJavaScript;
    } else {
        throw PolicyValidationError{fmt::format("unknown script language '{}'", language)};
    }

    spec.source = read_string(node["script"], "");
    if (spec.source.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw PolicyValidationError{"script engine requires a non-empty 'script'"};
    }
    return spec;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: AccessPolicy 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] AccessPolicy parse_policy(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw PolicyValidationError{"policy entry must be a map"};
    }

    AccessPolicy policy;
    policy.id = read_string(node["id"], "");
    if (policy.id.empty()) {
        throw PolicyValidationError{"policy 'id' is required"};
    }
    policy.name        = read_string(node["name"], policy.id);
    policy.description = read_optional_string(node["description"]);

    if (const auto& prio = node["priority"]; prio && prio.IsScalar()) {
        try {
            policy.priority = prio.as<std::int32_t>();
        } catch (const YAML::Exception&) {
            throw PolicyValidationError{fmt::format("priority '{}' is not an integer",
                                                    prio.as<std::string>())};
        }
    }
    if (policy.priority < PolicyLoader::kMinPriority || policy.priority > PolicyLoader::kMaxPriority) {
        throw PolicyValidationError{fmt::format("priority {} out of range [{}, {}]", policy.priority,
                                                PolicyLoader::kMinPriority, PolicyLoader::kMaxPriority)};
    }

    policy.active       = read_bool(node["active"], true);
    policy.matcher      = parse_matcher(node["matcher"]);
    policy.engine       = parse_engine(node["engine"]);
    policy.deny_message = read_optional_string(node["deny_message"]);
    return policy;
}

[[nodiscard]] std::expected<std::vector<AccessPolicy>, std::string>
parse_root(const YAML::Node& root, const std::string& origin) {
    if (!root || !root.IsMap()) {
        const std::string err =
            fmt::format("policy_loader: '{}' is not a valid YAML map (top-level)", origin);
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    const YAML::Node& list = root["policies"];
    if (list && !list.IsNull() && !list.IsSequence()) {
        const std::string err = fmt::format("policy_loader: 'policies' in '{}' must be a sequence", origin);
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    std::vector<AccessPolicy> policies;
    std::set<std::string>     seen_ids;
    std::size_t               index = 0;

    if (list && list.IsSequence()) {
        policies.reserve(list.size());
        for (const auto& node : list) {
            try {
                auto policy = parse_policy(node);
                if (!seen_ids.insert(policy.id).second) {
                    throw PolicyValidationError{fmt::format("duplicate policy id '{}'", policy.id)};
                }
                policies.push_back(std::move(policy));
            } catch (const PolicyValidationError& e) {
                const std::string err =
                    fmt::format("policy_loader: policy #{} in '{}': {}", index, origin, e.message);
                spdlog::error("{}", err);
                return std::unexpected(err);
            } catch (const YAML::Exception& e) {
                const std::string err =
                    fmt::format("policy_loader: policy #{} in '{}': {}", index, origin, e.what());
                spdlog::error("{}", err);
                return std::unexpected(err);
            }
            ++index;
        }
    }

    spdlog::info("policy_loader: {} policies loaded from '{}'", policies.size(), origin);
    return policies;
}

}  // namespace

// ---------------------------------------------------------------------------
// PolicyLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<std::vector<AccessPolicy>, std::string>
PolicyLoader::load(const std::filesystem::path& policy_path) {
    // 1. 경로 정규화
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(policy_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "policy_loader: cannot resolve policy path '{}': {}",
            policy_path.string(), ec.message()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("policy_loader: loading policies from '{}'", canonical_path.string());

    // 2. YAML 파일 로드 (yaml-cpp 예외 처리)
    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format(
            "policy_loader: cannot open file '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "policy_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(),
            e.mark.line + 1,   // yaml-cpp는 0-based
            e.mark.column + 1,
            e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "policy_loader: YAML error in '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    return parse_root(root, canonical_path.string());
}

std::expected<std::vector<AccessPolicy>, std::string>
PolicyLoader::parse(std::string_view yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml_text));
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "policy_loader: YAML parse error at line {}, col {}: {}",
            e.mark.line + 1, e.mark.column + 1, e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format("policy_loader: YAML error: {}", e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    return parse_root(root, "<inline>");
}
