// ---------------------------------------------------------------------------
// policy_context.cpp
// ---------------------------------------------------------------------------

#include "policy/policy_context.hpp"

#include "common/time_util.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace {

// "/fhir/Patient/123?x=1" → ["Patient", "123"]
std::vector<std::string_view> split_segments(std::string_view path) {
    if (const auto q = path.find('?'); q != std::string_view::npos) {
        path = path.substr(0, q);
    }

    std::vector<std::string_view> segments;
    std::size_t pos = 0;
    while (pos <= path.size()) {
        const auto slash = path.find('/', pos);
        const auto end   = slash == std::string_view::npos ? path.size() : slash;
        if (end > pos) {
            segments.push_back(path.substr(pos, end - pos));
        }
        if (slash == std::string_view::npos) {
            break;
        }
        pos = slash + 1;
    }

    if (!segments.empty() && segments.front() == "fhir") {
        segments.erase(segments.begin());
    }
    return segments;
}

bool is_special(std::string_view segment) noexcept {
    return !segment.empty() && (segment.front() == '_' || segment.front() == '$');
}

bool is_operation(std::string_view segment) noexcept {
    return !segment.empty() && segment.front() == '$';
}

std::string to_upper(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

// 첫 번째로 `.reference` 문자열을 가진 경로를 반환한다.
std::optional<std::string> first_reference(std::initializer_list<const Json::Value*> candidates) {
    for (const Json::Value* node : candidates) {
        if (node != nullptr && node->isObject() && (*node)["reference"].isString()) {
            return (*node)["reference"].asString();
        }
    }
    return std::nullopt;
}

const Json::Value* member(const Json::Value& obj, const char* key) {
    if (!obj.isObject() || !obj.isMember(key)) {
        return nullptr;
    }
    return &obj[key];
}

const Json::Value* element(const Json::Value* arr, Json::ArrayIndex index) {
    if (arr == nullptr || !arr->isArray() || arr->size() <= index) {
        return nullptr;
    }
    return &(*arr)[index];
}

Json::Value optional_string(const std::optional<std::string>& value) {
    return value ? Json::Value(*value) : Json::Value(Json::nullValue);
}

Json::Value string_array(const std::vector<std::string>& values) {
    Json::Value arr(Json::arrayValue);
    for (const auto& v : values) {
        arr.append(v);
    }
    return arr;
}

std::optional<std::string> read_optional(const Json::Value& obj, const char* key) {
    if (!obj.isObject() || !obj[key].isString()) {
        return std::nullopt;
    }
    return obj[key].asString();
}

std::vector<std::string> read_string_array(const Json::Value& obj, const char* key) {
    std::vector<std::string> out;
    if (!obj.isObject() || !obj[key].isArray()) {
        return out;
    }
    for (const auto& item : obj[key]) {
        if (item.isString()) {
            out.push_back(item.asString());
        }
    }
    return out;
}

}  // namespace

// ---------------------------------------------------------------------------
// UserIdentity / ClientType
// ---------------------------------------------------------------------------
void UserIdentity::set_fhir_user(std::string_view reference) {
    fhir_user = std::string(reference);
    fhir_user_type.reset();
    fhir_user_id.reset();
    if (auto parts = split_reference(reference)) {
        fhir_user_type = std::move(parts->first);
        fhir_user_id   = std::move(parts->second);
    }
}

bool UserIdentity::has_role(std::string_view role) const noexcept {
    return std::find(roles.begin(), roles.end(), role) != roles.end();
}

std::string_view to_string(ClientType type) noexcept {
    switch (type) {
        case ClientType::kPublic:                 return "public";
        case ClientType::kConfidentialSymmetric:  return "confidential_symmetric";
        case ClientType::kConfidentialAsymmetric: return "confidential_asymmetric";
    }
    return "public";
}

std::optional<ClientType> parse_client_type(std::string_view name) noexcept {
    if (name == "public")                  return ClientType::kPublic;
    if (name == "confidential_symmetric")  return ClientType::kConfidentialSymmetric;
    if (name == "confidential_asymmetric") return ClientType::kConfidentialAsymmetric;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// ScopeSummary
// ---------------------------------------------------------------------------
ScopeSummary ScopeSummary::from_scope_string(std::string_view raw) {
    ScopeSummary summary;
    summary.raw = std::string(raw);

    std::size_t pos = 0;
    while (pos < raw.size()) {
        while (pos < raw.size() && raw[pos] == ' ') {
            ++pos;
        }
        const auto end = std::min(raw.find(' ', pos), raw.size());
        if (end <= pos) {
            break;
        }
        const std::string_view token = raw.substr(pos, end - pos);
        pos = end;

        if (token == "launch" || token.starts_with("launch/")) {
            summary.launch = true;
        } else if (token == "openid") {
            summary.openid = true;
        } else if (token == "fhirUser") {
            summary.fhir_user = true;
        } else if (token == "offline_access") {
            summary.offline_access = true;
        } else if (token.starts_with("patient/")) {
            summary.patient_scopes.emplace_back(token);
        } else if (token.starts_with("user/")) {
            summary.user_scopes.emplace_back(token);
        } else if (token.starts_with("system/")) {
            summary.system_scopes.emplace_back(token);
        } else {
            continue;
        }

        // "patient/*.read" 형태: 리소스 타입 자리에 '*'
        const auto slash = token.find('/');
        if (slash != std::string_view::npos && !token.starts_with("launch/") &&
            token.substr(slash + 1).starts_with("*.")) {
            summary.has_wildcard = true;
        }
    }
    return summary;
}

bool ScopeSummary::contains(std::string_view scope) const noexcept {
    std::size_t pos = 0;
    while (pos <= raw.size()) {
        const auto end = std::min(raw.find(' ', pos), raw.size());
        if (std::string_view(raw).substr(pos, end - pos) == scope) {
            return true;
        }
        if (end == raw.size()) {
            break;
        }
        pos = end + 1;
    }
    return false;
}

// ---------------------------------------------------------------------------
// ResourceContext
// ---------------------------------------------------------------------------
ResourceContext ResourceContext::from_resource(const Json::Value& resource) {
    ResourceContext rc;
    rc.resource = resource;
    if (!resource.isObject()) {
        return rc;
    }

    rc.resource_type = resource["resourceType"].isString() ? resource["resourceType"].asString() : "";
    rc.id            = resource["id"].isString() ? resource["id"].asString() : "";
    if (const auto* meta = member(resource, "meta")) {
        rc.version_id   = read_optional(*meta, "versionId");
        rc.last_updated = read_optional(*meta, "lastUpdated");
    }

    rc.subject = first_reference({member(resource, "subject"), member(resource, "patient")});
    if (!rc.subject && rc.resource_type == "Patient" && !rc.id.empty()) {
        rc.subject = "Patient/" + rc.id;
    }

    const Json::Value* performer = member(resource, "performer");
    const Json::Value* first_performer = element(performer, 0);
    rc.author = first_reference({
        member(resource, "author"),
        element(member(resource, "author"), 0),
        performer,
        first_performer,
        first_performer != nullptr ? member(*first_performer, "actor") : nullptr,
        member(resource, "recorder"),
        member(resource, "asserter"),
        member(resource, "requester"),
    });
    return rc;
}

// ---------------------------------------------------------------------------
// 경로 분석
// ---------------------------------------------------------------------------
std::optional<std::pair<std::string, std::string>> split_reference(std::string_view reference) {
    if (const auto hash = reference.find('#'); hash != std::string_view::npos) {
        return std::nullopt;  // contained 참조는 대상 외
    }
    auto segments = split_segments(reference);

    // ".../Patient/123/_history/2" → Patient/123
    if (segments.size() >= 4 && segments[segments.size() - 2] == "_history") {
        segments.resize(segments.size() - 2);
    }
    if (segments.size() < 2) {
        return std::nullopt;
    }
    const auto type = segments[segments.size() - 2];
    const auto id   = segments.back();
    if (type.empty() || id.empty() || std::isupper(static_cast<unsigned char>(type.front())) == 0 ||
        is_special(id)) {
        return std::nullopt;
    }
    return std::make_pair(std::string(type), std::string(id));
}

ParsedFhirPath parse_fhir_path(std::string_view path) {
    ParsedFhirPath parsed;
    const auto segs = split_segments(path);
    if (segs.empty()) {
        return parsed;
    }

    // 시스템 레벨: "/_history", "/_search", "/$op", "/metadata"
    if (is_special(segs[0])) {
        parsed.history = segs[0] == "_history";
        parsed.search  = segs[0] == "_search";
        if (is_operation(segs[0])) {
            parsed.operation_id = std::string(segs[0].substr(1));
        }
        return parsed;
    }

    parsed.resource_type = std::string(segs[0]);
    if (segs.size() == 1) {
        return parsed;
    }

    if (is_special(segs[1])) {
        parsed.history = segs[1] == "_history";
        parsed.search  = segs[1] == "_search";
        if (is_operation(segs[1])) {
            parsed.operation_id = std::string(segs[1].substr(1));
        }
        return parsed;
    }

    parsed.resource_id = std::string(segs[1]);
    if (segs.size() == 2) {
        return parsed;
    }

    if (segs[2] == "_history") {
        parsed.history = true;
        if (segs.size() >= 4) {
            parsed.version_id = std::string(segs[3]);
        }
        return parsed;
    }
    if (is_operation(segs[2])) {
        parsed.operation_id = std::string(segs[2].substr(1));
        return parsed;
    }
    if (is_special(segs[2])) {
        return parsed;
    }

    // 컴파트먼트 검색: /Patient/123/Observation
    parsed.compartment_type = parsed.resource_type;
    parsed.compartment_id   = parsed.resource_id;
    parsed.resource_type    = segs[2] == "*" ? "" : std::string(segs[2]);
    parsed.resource_id.reset();
    if (segs.size() >= 4 && segs[3] == "_search") {
        parsed.search = true;
    }
    return parsed;
}

std::optional<FhirOperation> detect_operation(std::string_view method, std::string_view path,
                                              const Json::Value* body) {
    const std::string verb = to_upper(method);
    const auto        segs = split_segments(path);
    const auto        p    = parse_fhir_path(path);

    if (verb == "GET" || verb == "HEAD") {
        if (segs.size() == 1 && segs[0] == "metadata") {
            return FhirOperation::kCapabilities;
        }
        if (p.operation_id) {
            return FhirOperation::kOperation;
        }
        if (p.history) {
            if (p.version_id) return FhirOperation::kVRead;
            if (p.resource_id) return FhirOperation::kHistoryInstance;
            if (!p.resource_type.empty()) return FhirOperation::kHistoryType;
            return FhirOperation::kHistorySystem;
        }
        if (p.compartment_type) {
            return p.resource_type.empty() ? FhirOperation::kSearchSystem : FhirOperation::kSearchType;
        }
        if (p.resource_id) {
            return FhirOperation::kRead;
        }
        return p.resource_type.empty() ? FhirOperation::kSearchSystem : FhirOperation::kSearchType;
    }

    if (verb == "POST") {
        if (p.operation_id) {
            return FhirOperation::kOperation;
        }
        if (p.search) {
            return (p.resource_type.empty() && !p.compartment_type) ? FhirOperation::kSearchSystem
                                                                     : FhirOperation::kSearchType;
        }
        if (segs.empty()) {
            const auto type = body != nullptr ? read_optional(*body, "type") : std::nullopt;
            if (type == "batch") return FhirOperation::kBatch;
            if (type == "transaction") return FhirOperation::kTransaction;
            return std::nullopt;
        }
        if (!p.resource_type.empty() && !p.resource_id && !p.compartment_type) {
            return FhirOperation::kCreate;
        }
        return std::nullopt;
    }

    if (p.resource_type.empty() || p.operation_id || p.history) {
        return std::nullopt;
    }
    // 조건부 update/delete (/Patient?identifier=...) 도 type 레벨로 허용
    if (verb == "PUT")    return FhirOperation::kUpdate;
    if (verb == "PATCH")  return FhirOperation::kPatch;
    if (verb == "DELETE") return FhirOperation::kDelete;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// JSON 변환
// ---------------------------------------------------------------------------
Json::Value to_json(const PolicyContext& ctx) {
    Json::Value root(Json::objectValue);

    if (ctx.user) {
        const auto& u = *ctx.user;
        Json::Value user(Json::objectValue);
        user["id"]           = u.id;
        user["fhirUser"]     = optional_string(u.fhir_user);
        user["fhirUserType"] = optional_string(u.fhir_user_type);
        user["fhirUserId"]   = optional_string(u.fhir_user_id);
        user["roles"]        = string_array(u.roles);
        user["attributes"]   = u.attributes;
        root["user"] = std::move(user);
    } else {
        root["user"] = Json::Value(Json::nullValue);
    }

    Json::Value client(Json::objectValue);
    client["id"]         = ctx.client.id;
    client["name"]       = ctx.client.name;
    client["trusted"]    = ctx.client.trusted;
    client["clientType"] = std::string(to_string(ctx.client.client_type));
    root["client"] = std::move(client);

    Json::Value scopes(Json::objectValue);
    scopes["raw"]           = ctx.scopes.raw;
    scopes["patientScopes"] = string_array(ctx.scopes.patient_scopes);
    scopes["userScopes"]    = string_array(ctx.scopes.user_scopes);
    scopes["systemScopes"]  = string_array(ctx.scopes.system_scopes);
    scopes["hasWildcard"]   = ctx.scopes.has_wildcard;
    scopes["launch"]        = ctx.scopes.launch;
    scopes["openid"]        = ctx.scopes.openid;
    scopes["fhirUser"]      = ctx.scopes.fhir_user;
    scopes["offlineAccess"] = ctx.scopes.offline_access;
    root["scopes"] = std::move(scopes);

    const auto& r = ctx.request;
    Json::Value request(Json::objectValue);
    request["operation"]       = std::string(to_string(r.operation));
    request["operationId"]     = optional_string(r.operation_id);
    request["resourceType"]    = r.resource_type;
    request["resourceId"]      = optional_string(r.resource_id);
    request["compartmentType"] = optional_string(r.compartment_type);
    request["compartmentId"]   = optional_string(r.compartment_id);
    request["body"]            = r.body ? *r.body : Json::Value(Json::nullValue);
    Json::Value query(Json::objectValue);
    for (const auto& [k, v] : r.query_params) {
        query[k] = v;
    }
    request["queryParams"] = std::move(query);
    request["path"]        = r.path;
    request["method"]      = r.method;
    root["request"] = std::move(request);

    if (ctx.resource) {
        const auto& rc = *ctx.resource;
        Json::Value resource(Json::objectValue);
        resource["resource"]     = rc.resource;
        resource["id"]           = rc.id;
        resource["resourceType"] = rc.resource_type;
        resource["versionId"]    = optional_string(rc.version_id);
        resource["lastUpdated"]  = optional_string(rc.last_updated);
        resource["subject"]      = optional_string(rc.subject);
        resource["author"]       = optional_string(rc.author);
        root["resource"] = std::move(resource);
    } else {
        root["resource"] = Json::Value(Json::nullValue);
    }

    const auto& e = ctx.environment;
    Json::Value env(Json::objectValue);
    env["requestTime"]      = format_iso8601(e.request_time);
    env["sourceIp"]         = optional_string(e.source_ip);
    env["requestId"]        = e.request_id;
    env["patientContext"]   = optional_string(e.patient_context);
    env["encounterContext"] = optional_string(e.encounter_context);
    root["environment"] = std::move(env);

    return root;
}

std::expected<PolicyContext, std::string> policy_context_from_json(const Json::Value& value) {
    if (!value.isObject()) {
        return std::unexpected("context: root must be an object");
    }

    PolicyContext ctx;

    if (const auto& u = value["user"]; u.isObject()) {
        UserIdentity user;
        user.id = u["id"].isString() ? u["id"].asString() : "";
        if (u["fhirUser"].isString()) {
            user.set_fhir_user(u["fhirUser"].asString());
        }
        if (u["fhirUserType"].isString()) user.fhir_user_type = u["fhirUserType"].asString();
        if (u["fhirUserId"].isString())   user.fhir_user_id   = u["fhirUserId"].asString();
        user.roles = read_string_array(u, "roles");
        if (u["attributes"].isObject()) {
            user.attributes = u["attributes"];
        }
        ctx.user = std::move(user);
    }

    if (const auto& c = value["client"]; c.isObject()) {
        ctx.client.id      = c["id"].isString() ? c["id"].asString() : "";
        ctx.client.name    = c["name"].isString() ? c["name"].asString() : ctx.client.id;
        ctx.client.trusted = c["trusted"].isBool() && c["trusted"].asBool();
        if (c["clientType"].isString()) {
            auto type = parse_client_type(c["clientType"].asString());
            if (!type) {
                return std::unexpected("context: unknown clientType '" + c["clientType"].asString() + "'");
            }
            ctx.client.client_type = *type;
        }
    }

    if (const auto& s = value["scopes"]; s.isString()) {
        ctx.scopes = ScopeSummary::from_scope_string(s.asString());
    } else if (s.isObject() && s["raw"].isString()) {
        ctx.scopes = ScopeSummary::from_scope_string(s["raw"].asString());
    }

    const auto& r = value["request"];
    if (!r.isObject()) {
        return std::unexpected("context: 'request' object is required");
    }
    ctx.request.method = r["method"].isString() ? r["method"].asString() : "GET";
    ctx.request.path   = r["path"].isString() ? r["path"].asString() : "";
    if (r.isMember("body") && !r["body"].isNull()) {
        ctx.request.body = r["body"];
    }
    if (r["queryParams"].isObject()) {
        for (const auto& key : r["queryParams"].getMemberNames()) {
            if (r["queryParams"][key].isString()) {
                ctx.request.query_params[key] = r["queryParams"][key].asString();
            }
        }
    }

    const auto parsed = parse_fhir_path(ctx.request.path);
    if (r["operation"].isString()) {
        auto op = parse_fhir_operation(r["operation"].asString());
        if (!op) {
            return std::unexpected("context: unknown operation '" + r["operation"].asString() + "'");
        }
        ctx.request.operation = *op;
    } else {
        const Json::Value* body = ctx.request.body ? &*ctx.request.body : nullptr;
        auto op = detect_operation(ctx.request.method, ctx.request.path, body);
        if (!op) {
            return std::unexpected("context: cannot detect operation for " + ctx.request.method + " " +
                                   ctx.request.path);
        }
        ctx.request.operation = *op;
    }
    ctx.request.resource_type =
        r["resourceType"].isString() ? r["resourceType"].asString() : parsed.resource_type;
    ctx.request.resource_id      = r["resourceId"].isString() ? read_optional(r, "resourceId") : parsed.resource_id;
    ctx.request.operation_id     = r["operationId"].isString() ? read_optional(r, "operationId") : parsed.operation_id;
    ctx.request.compartment_type = r["compartmentType"].isString() ? read_optional(r, "compartmentType")
                                                                   : parsed.compartment_type;
    ctx.request.compartment_id   = r["compartmentId"].isString() ? read_optional(r, "compartmentId")
                                                                 : parsed.compartment_id;

    if (const auto& res = value["resource"]; res.isObject()) {
        // {"resource": {...FHIR...}} 래퍼 또는 FHIR 리소스 자체
        ctx.resource = ResourceContext::from_resource(res["resource"].isObject() ? res["resource"] : res);
    }

    const auto& e = value["environment"];
    ctx.environment.request_time = std::chrono::system_clock::now();
    if (e.isObject()) {
        if (e["requestTime"].isString()) {
            auto tp = parse_iso8601(e["requestTime"].asString());
            if (!tp) {
                return std::unexpected("context: invalid requestTime '" + e["requestTime"].asString() + "'");
            }
            ctx.environment.request_time = *tp;
        }
        ctx.environment.source_ip         = read_optional(e, "sourceIp");
        ctx.environment.request_id        = e["requestId"].isString() ? e["requestId"].asString() : "";
        ctx.environment.patient_context   = read_optional(e, "patientContext");
        ctx.environment.encounter_context = read_optional(e, "encounterContext");
    }

    return ctx;
}
