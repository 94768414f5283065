// ---------------------------------------------------------------------------
// expr_interpreter.cpp
// ---------------------------------------------------------------------------

#include "script/expr/expr_interpreter.hpp"

#include <cmath>
#include <limits>
#include <utility>

#include <fmt/format.h>

namespace {

constexpr std::uint64_t kDeadlineCheckInterval = 64;

constexpr std::string_view kGlobalNames[] = {
    "user", "client", "scopes", "request", "resource", "environment",
};

ExprMap decision_map(std::string_view decision) {
    ExprMap map;
    map.emplace("decision", ExprValue(std::string(decision)));
    return map;
}

// 맵의 문자열 멤버. 없거나 문자열이 아니면 빈 문자열.
std::string string_member(const ExprValue& value, std::string_view key) {
    if (!value.is_map()) {
        return {};
    }
    const auto& map = value.as_map();
    const auto  it  = map.find(key);
    if (it == map.end() || !it->second.is_string()) {
        return {};
    }
    return it->second.as_string();
}

bool user_has_role(const ExprValue& user, const std::string& role) {
    if (!user.is_map()) {
        return false;
    }
    const auto& map = user.as_map();
    const auto  it  = map.find("roles");
    if (it == map.end() || !it->second.is_array()) {
        return false;
    }
    for (const auto& r : it->second.as_array()) {
        if (r.is_string() && r.as_string() == role) {
            return true;
        }
    }
    return false;
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

}  // namespace

// ---------------------------------------------------------------------------
// 생성 / 실행
// ---------------------------------------------------------------------------
ExprInterpreter::ExprInterpreter(const Program& program, const LightweightLimits& limits,
                                 ExecutionDeadline deadline)
    : program_(program), limits_(limits), deadline_(deadline) {}

ExprValue ExprInterpreter::run(const Json::Value& context) {
    const ExprValue ctx = ExprValue::from_json(context);
    globals_.emplace("ctx", ctx);
    for (const auto name : kGlobalNames) {
        ExprValue member;
        if (ctx.is_map()) {
            const auto& map = ctx.as_map();
            if (const auto it = map.find(name); it != map.end()) {
                member = it->second;
            }
        }
        globals_.emplace(std::string(name), std::move(member));
    }

    if (deadline_.expired()) {
        throw ScriptAbort(ScriptFault::kTimeout, "deadline passed before execution");
    }

    frames_.emplace_back();
    frames_.back().emplace_back();

    const Flow flow = exec_block(program_.statements);
    switch (flow) {
        case Flow::kReturn:
            return return_value_;
        case Flow::kBreak:
        case Flow::kContinue:
            throw ScriptAbort(ScriptFault::kError, "break/continue outside of a loop");
        case Flow::kNormal:
            break;
    }
    return last_value_;
}

// ---------------------------------------------------------------------------
// 상한 검사
// ---------------------------------------------------------------------------
void ExprInterpreter::tick() {
    if (++operations_ > limits_.max_operations) {
        throw ScriptAbort(ScriptFault::kResourceExceeded,
                          fmt::format("operation limit {} exceeded", limits_.max_operations));
    }
    if (operations_ % kDeadlineCheckInterval == 0 && deadline_.expired()) {
        throw ScriptAbort(ScriptFault::kTimeout, "script execution timed out");
    }
}

const ExprValue& ExprInterpreter::checked(const ExprValue& value, std::size_t line) const {
    if (value.is_string() && value.as_string().size() > limits_.max_string_size) {
        throw ScriptAbort(ScriptFault::kResourceExceeded,
                          fmt::format("line {}: string length exceeds {}", line,
                                      limits_.max_string_size));
    }
    if (value.is_array() && value.as_array().size() > limits_.max_array_size) {
        throw ScriptAbort(ScriptFault::kResourceExceeded,
                          fmt::format("line {}: array size exceeds {}", line,
                                      limits_.max_array_size));
    }
    if (value.is_map() && value.as_map().size() > limits_.max_map_size) {
        throw ScriptAbort(ScriptFault::kResourceExceeded,
                          fmt::format("line {}: map size exceeds {}", line, limits_.max_map_size));
    }
    return value;
}

void ExprInterpreter::error(std::size_t line, const std::string& message) {
    throw ScriptAbort(ScriptFault::kError, fmt::format("line {}: {}", line, message));
}

// ---------------------------------------------------------------------------
// 변수
// ---------------------------------------------------------------------------
const ExprValue* ExprInterpreter::lookup(std::string_view name) const {
    const Frame& frame = frames_.back();
    for (auto scope = frame.rbegin(); scope != frame.rend(); ++scope) {
        if (const auto it = scope->find(name); it != scope->end()) {
            return &it->second;
        }
    }
    if (const auto it = globals_.find(name); it != globals_.end()) {
        return &it->second;
    }
    return nullptr;
}

void ExprInterpreter::declare(const std::string& name, ExprValue value) {
    frames_.back().back().insert_or_assign(name, std::move(value));
}

void ExprInterpreter::assign(const std::string& name, ExprValue value, std::size_t line) {
    Frame& frame = frames_.back();
    for (auto scope = frame.rbegin(); scope != frame.rend(); ++scope) {
        if (const auto it = scope->find(name); it != scope->end()) {
            it->second = std::move(value);
            return;
        }
    }
    if (globals_.contains(name)) {
        error(line, fmt::format("'{}' is read-only", name));
    }
    error(line, fmt::format("assignment to undeclared variable '{}'", name));
}

// ---------------------------------------------------------------------------
// 문장
// ---------------------------------------------------------------------------
ExprInterpreter::Flow ExprInterpreter::exec_block(const std::vector<StmtPtr>& body) {
    last_value_ = ExprValue{};
    for (const auto& stmt : body) {
        const Flow flow = exec_stmt(*stmt);
        if (flow != Flow::kNormal) {
            return flow;
        }
    }
    return Flow::kNormal;
}

ExprInterpreter::Flow ExprInterpreter::exec_stmt(const Stmt& stmt) {
    tick();

    switch (stmt.kind) {
        case StmtKind::kLet:
            declare(stmt.name, eval(*stmt.expr));
            last_value_ = ExprValue{};
            return Flow::kNormal;

        case StmtKind::kAssign:
            assign(stmt.name, eval(*stmt.expr), stmt.line);
            last_value_ = ExprValue{};
            return Flow::kNormal;

        case StmtKind::kExpr:
            last_value_ = eval(*stmt.expr);
            return Flow::kNormal;

        case StmtKind::kIf: {
            const bool taken = eval_condition(*stmt.expr, "if");
            const auto& branch = taken ? stmt.body : stmt.else_body;
            frames_.back().emplace_back();
            const Flow flow = exec_block(branch);
            frames_.back().pop_back();
            return flow;
        }

        case StmtKind::kWhile: {
            ++loop_depth_;
            Flow result = Flow::kNormal;
            while (eval_condition(*stmt.expr, "while")) {
                frames_.back().emplace_back();
                const Flow flow = exec_block(stmt.body);
                frames_.back().pop_back();
                if (flow == Flow::kBreak) {
                    break;
                }
                if (flow == Flow::kReturn) {
                    result = flow;
                    break;
                }
            }
            --loop_depth_;
            if (result == Flow::kNormal) {
                last_value_ = ExprValue{};
            }
            return result;
        }

        case StmtKind::kFor:
            return exec_for(stmt);

        case StmtKind::kReturn:
            return_value_ = stmt.expr ? eval(*stmt.expr) : ExprValue{};
            return Flow::kReturn;

        case StmtKind::kBreak:
        case StmtKind::kContinue:
            if (loop_depth_ == 0) {
                error(stmt.line, stmt.kind == StmtKind::kBreak ? "'break' outside of a loop"
                                                              : "'continue' outside of a loop");
            }
            return stmt.kind == StmtKind::kBreak ? Flow::kBreak : Flow::kContinue;

        case StmtKind::kBlock: {
            frames_.back().emplace_back();
            const Flow flow = exec_block(stmt.body);
            frames_.back().pop_back();
            return flow;
        }
    }
    error(stmt.line, "unknown statement");
}

ExprInterpreter::Flow ExprInterpreter::exec_for(const Stmt& stmt) {
    const ExprValue iterable = eval(*stmt.expr);

    // map 은 키를 순회한다
    ExprArray keys;
    const ExprArray* items = nullptr;
    if (iterable.is_array()) {
        items = &iterable.as_array();
    } else if (iterable.is_map()) {
        for (const auto& [key, _] : iterable.as_map()) {
            keys.emplace_back(key);
        }
        items = &keys;
    } else {
        error(stmt.line, fmt::format("cannot iterate over {}", iterable.type_name()));
    }

    ++loop_depth_;
    Flow result = Flow::kNormal;
    for (const auto& item : *items) {
        tick();
        frames_.back().emplace_back();
        declare(stmt.name, item);
        const Flow flow = exec_block(stmt.body);
        frames_.back().pop_back();
        if (flow == Flow::kBreak) {
            break;
        }
        if (flow == Flow::kReturn) {
            result = flow;
            break;
        }
    }
    --loop_depth_;
    if (result == Flow::kNormal) {
        last_value_ = ExprValue{};
    }
    return result;
}

bool ExprInterpreter::eval_condition(const Expr& expr, std::string_view what) {
    const ExprValue cond = eval(expr);
    if (!cond.is_bool()) {
        error(expr.line, fmt::format("{} condition must be bool, got {}", what, cond.type_name()));
    }
    return cond.as_bool();
}

// ---------------------------------------------------------------------------
// 식
// ---------------------------------------------------------------------------
ExprValue ExprInterpreter::eval(const Expr& expr) {
    tick();

    switch (expr.kind) {
        case ExprKind::kLiteral:
            return expr.literal;

        case ExprKind::kVariable: {
            const ExprValue* value = lookup(expr.name);
            if (value == nullptr) {
                error(expr.line, fmt::format("unknown variable '{}'", expr.name));
            }
            return *value;
        }

        case ExprKind::kArray: {
            if (expr.children.size() > limits_.max_array_size) {
                throw ScriptAbort(ScriptFault::kResourceExceeded,
                                  fmt::format("line {}: array size exceeds {}", expr.line,
                                              limits_.max_array_size));
            }
            ExprArray items;
            items.reserve(expr.children.size());
            for (const auto& child : expr.children) {
                items.push_back(eval(*child));
            }
            return ExprValue(std::move(items));
        }

        case ExprKind::kMap: {
            ExprMap map;
            for (std::size_t i = 0; i < expr.children.size(); ++i) {
                map.insert_or_assign(expr.keys[i], eval(*expr.children[i]));
            }
            ExprValue value(std::move(map));
            checked(value, expr.line);
            return value;
        }

        case ExprKind::kUnary:
            return eval_unary(expr);

        case ExprKind::kBinary:
            return eval_binary(expr);

        case ExprKind::kAnd:
        case ExprKind::kOr: {
            const bool lhs = eval_condition(*expr.children[0], expr.kind == ExprKind::kAnd ? "&&" : "||");
            if (expr.kind == ExprKind::kAnd && !lhs) {
                return ExprValue(false);
            }
            if (expr.kind == ExprKind::kOr && lhs) {
                return ExprValue(true);
            }
            return ExprValue(eval_condition(*expr.children[1], expr.kind == ExprKind::kAnd ? "&&" : "||"));
        }

        case ExprKind::kMember:
            return eval_member(eval(*expr.children[0]), expr.name, expr.line);

        case ExprKind::kIndex: {
            const ExprValue target = eval(*expr.children[0]);
            return eval_index(target, eval(*expr.children[1]), expr.line);
        }

        case ExprKind::kCall:
        case ExprKind::kMethodCall: {
            // 메서드 호출 x.f(a) 는 f(x, a) 와 같다
            std::vector<ExprValue> args;
            args.reserve(expr.children.size());
            for (const auto& child : expr.children) {
                args.push_back(eval(*child));
            }
            return eval_call(expr.name, std::move(args), expr.line);
        }
    }
    error(expr.line, "unknown expression");
}

ExprValue ExprInterpreter::eval_unary(const Expr& expr) {
    const ExprValue operand = eval(*expr.children[0]);
    if (expr.op == TokenKind::kBang) {
        if (!operand.is_bool()) {
            error(expr.line, fmt::format("'!' expects bool, got {}", operand.type_name()));
        }
        return ExprValue(!operand.as_bool());
    }
    if (operand.is_int()) {
        if (operand.as_int() == std::numeric_limits<std::int64_t>::min()) {
            error(expr.line, "integer overflow");
        }
        return ExprValue(-operand.as_int());
    }
    if (operand.is_float()) {
        return ExprValue(-operand.as_number());
    }
    error(expr.line, fmt::format("'-' expects a number, got {}", operand.type_name()));
}

ExprValue ExprInterpreter::eval_binary(const Expr& expr) {
    const ExprValue lhs = eval(*expr.children[0]);
    const ExprValue rhs = eval(*expr.children[1]);
    const auto      line = expr.line;

    // + 는 문자열 연결과 배열 연결도 맡는다
    if (expr.op == TokenKind::kPlus && (lhs.is_string() || rhs.is_string())) {
        ExprValue value(lhs.to_display_string() + rhs.to_display_string());
        return checked(value, line);
    }
    if (expr.op == TokenKind::kPlus && lhs.is_array() && rhs.is_array()) {
        if (lhs.as_array().size() + rhs.as_array().size() > limits_.max_array_size) {
            throw ScriptAbort(ScriptFault::kResourceExceeded,
                              fmt::format("line {}: array size exceeds {}", line,
                                          limits_.max_array_size));
        }
        ExprArray joined = lhs.as_array();
        joined.insert(joined.end(), rhs.as_array().begin(), rhs.as_array().end());
        return ExprValue(std::move(joined));
    }

    switch (expr.op) {
        case TokenKind::kEq:
            return ExprValue(lhs.equals(rhs));
        case TokenKind::kNe:
            return ExprValue(!lhs.equals(rhs));

        case TokenKind::kLt:
        case TokenKind::kLe:
        case TokenKind::kGt:
        case TokenKind::kGe: {
            int cmp = 0;
            if (lhs.is_number() && rhs.is_number()) {
                if (lhs.is_int() && rhs.is_int()) {
                    cmp = lhs.as_int() < rhs.as_int() ? -1 : (lhs.as_int() > rhs.as_int() ? 1 : 0);
                } else {
                    const double a = lhs.as_number();
                    const double b = rhs.as_number();
                    cmp = a < b ? -1 : (a > b ? 1 : 0);
                }
            } else if (lhs.is_string() && rhs.is_string()) {
                cmp = lhs.as_string().compare(rhs.as_string());
            } else {
                error(line, fmt::format("cannot compare {} with {}", lhs.type_name(), rhs.type_name()));
            }
            switch (expr.op) {
                case TokenKind::kLt: return ExprValue(cmp < 0);
                case TokenKind::kLe: return ExprValue(cmp <= 0);
                case TokenKind::kGt: return ExprValue(cmp > 0);
                default:             return ExprValue(cmp >= 0);
            }
        }

        case TokenKind::kPlus:
        case TokenKind::kMinus:
        case TokenKind::kStar:
        case TokenKind::kSlash:
        case TokenKind::kPercent: {
            if (!lhs.is_number() || !rhs.is_number()) {
                error(line, fmt::format("invalid operands {} and {} for arithmetic",
                                        lhs.type_name(), rhs.type_name()));
            }
            if (lhs.is_int() && rhs.is_int()) {
                const std::int64_t a = lhs.as_int();
                const std::int64_t b = rhs.as_int();
                std::int64_t       r = 0;
                bool overflow = false;
                switch (expr.op) {
                    case TokenKind::kPlus:  overflow = __builtin_add_overflow(a, b, &r); break;
                    case TokenKind::kMinus: overflow = __builtin_sub_overflow(a, b, &r); break;
                    case TokenKind::kStar:  overflow = __builtin_mul_overflow(a, b, &r); break;
                    default:
                        if (b == 0) {
                            error(line, "division by zero");
                        }
                        if (a == std::numeric_limits<std::int64_t>::min() && b == -1) {
                            overflow = true;
                            break;
                        }
                        r = expr.op == TokenKind::kSlash ? a / b : a % b;
                        break;
                }
                if (overflow) {
                    error(line, "integer overflow");
                }
                return ExprValue(r);
            }
            const double a = lhs.as_number();
            const double b = rhs.as_number();
            switch (expr.op) {
                case TokenKind::kPlus:  return ExprValue(a + b);
                case TokenKind::kMinus: return ExprValue(a - b);
                case TokenKind::kStar:  return ExprValue(a * b);
                default:
                    if (b == 0.0) {
                        error(line, "division by zero");
                    }
                    return ExprValue(expr.op == TokenKind::kSlash ? a / b : std::fmod(a, b));
            }
        }

        default:
            error(line, "unsupported binary operator");
    }
}

ExprValue ExprInterpreter::eval_member(const ExprValue& target, const std::string& name,
                                       std::size_t line) {
    // null 의 멤버는 null (resource 가 없는 요청 등)
    if (target.is_null()) {
        return ExprValue{};
    }
    if (!target.is_map()) {
        error(line, fmt::format("cannot read property '{}' of {}", name, target.type_name()));
    }
    const auto& map = target.as_map();
    const auto  it  = map.find(name);
    return it == map.end() ? ExprValue{} : it->second;
}

ExprValue ExprInterpreter::eval_index(const ExprValue& target, const ExprValue& key,
                                      std::size_t line) {
    if (target.is_map()) {
        if (!key.is_string()) {
            error(line, fmt::format("map index must be a string, got {}", key.type_name()));
        }
        return eval_member(target, key.as_string(), line);
    }
    if (target.is_array() || target.is_string()) {
        if (!key.is_int()) {
            error(line, fmt::format("index must be an int, got {}", key.type_name()));
        }
        const std::int64_t idx  = key.as_int();
        const std::size_t  size = target.is_array() ? target.as_array().size() : target.as_string().size();
        if (idx < 0 || static_cast<std::size_t>(idx) >= size) {
            error(line, fmt::format("index {} out of bounds (size {})", idx, size));
        }
        if (target.is_array()) {
            return target.as_array()[static_cast<std::size_t>(idx)];
        }
        return ExprValue(std::string(1, target.as_string()[static_cast<std::size_t>(idx)]));
    }
    if (target.is_null()) {
        return ExprValue{};
    }
    error(line, fmt::format("cannot index into {}", target.type_name()));
}

// ---------------------------------------------------------------------------
// 호출
// ---------------------------------------------------------------------------
ExprValue ExprInterpreter::eval_call(const std::string& name, std::vector<ExprValue> args,
                                     std::size_t line) {
    if (const auto it = program_.functions.find(name); it != program_.functions.end()) {
        return call_function(it->second, std::move(args), line);
    }
    ExprValue out;
    if (call_builtin(name, args, line, out)) {
        return out;
    }
    error(line, fmt::format("unknown function '{}'", name));
}

ExprValue ExprInterpreter::call_function(const FunctionDef& fn, std::vector<ExprValue> args,
                                         std::size_t line) {
    if (args.size() != fn.params.size()) {
        error(line, fmt::format("function '{}' expects {} argument(s), got {}", fn.name,
                                fn.params.size(), args.size()));
    }
    if (call_depth_ >= limits_.max_call_levels) {
        throw ScriptAbort(ScriptFault::kResourceExceeded,
                          fmt::format("line {}: call depth exceeds {}", line, limits_.max_call_levels));
    }

    Frame frame;
    frame.emplace_back();
    for (std::size_t i = 0; i < args.size(); ++i) {
        frame.back().insert_or_assign(fn.params[i], std::move(args[i]));
    }

    frames_.push_back(std::move(frame));
    ++call_depth_;
    const std::uint32_t saved_loop_depth = loop_depth_;
    loop_depth_ = 0;

    const Flow flow = exec_block(fn.body);

    loop_depth_ = saved_loop_depth;
    --call_depth_;
    frames_.pop_back();

    if (flow == Flow::kReturn) {
        ExprValue value = std::move(return_value_);
        return_value_   = ExprValue{};
        return value;
    }
    return last_value_;
}

// ---------------------------------------------------------------------------
// 내장 함수
//   has_role / has_any_role / is_*_user 는 첫 인자로 user 맵을 받을 수도 있다
//   (user.has_role("x") 형태).
// ---------------------------------------------------------------------------
bool ExprInterpreter::call_builtin(const std::string& name, const std::vector<ExprValue>& args,
                                   std::size_t line, ExprValue& out) {
    auto expect_args = [&](std::size_t min, std::size_t max) {
        if (args.size() < min || args.size() > max) {
            error(line, fmt::format("'{}' expects {} argument(s), got {}", name,
                                    min == max ? fmt::format("{}", min)
                                               : fmt::format("{}..{}", min, max),
                                    args.size()));
        }
    };
    auto string_arg = [&](std::size_t i) -> const std::string& {
        if (!args[i].is_string()) {
            error(line, fmt::format("'{}' argument {} must be a string, got {}", name, i + 1,
                                    args[i].type_name()));
        }
        return args[i].as_string();
    };
    auto global = [&](std::string_view key) -> const ExprValue& {
        return globals_.find(key)->second;
    };

    if (name == "len") {
        expect_args(1, 1);
        const auto& v = args[0];
        if (v.is_string()) {
            out = ExprValue(static_cast<std::int64_t>(v.as_string().size()));
        } else if (v.is_array()) {
            out = ExprValue(static_cast<std::int64_t>(v.as_array().size()));
        } else if (v.is_map()) {
            out = ExprValue(static_cast<std::int64_t>(v.as_map().size()));
        } else if (v.is_null()) {
            out = ExprValue(std::int64_t{0});
        } else {
            error(line, fmt::format("len() not supported for {}", v.type_name()));
        }
        return true;
    }

    if (name == "contains") {
        expect_args(2, 2);
        const auto& container = args[0];
        if (container.is_string()) {
            out = ExprValue(container.as_string().find(string_arg(1)) != std::string::npos);
        } else if (container.is_array()) {
            bool found = false;
            for (const auto& item : container.as_array()) {
                if (item.equals(args[1])) {
                    found = true;
                    break;
                }
            }
            out = ExprValue(found);
        } else if (container.is_map()) {
            out = ExprValue(container.as_map().contains(string_arg(1)));
        } else if (container.is_null()) {
            out = ExprValue(false);
        } else {
            error(line, fmt::format("contains() not supported for {}", container.type_name()));
        }
        return true;
    }

    if (name == "starts_with" || name == "ends_with") {
        expect_args(2, 2);
        const std::string& s      = string_arg(0);
        const std::string& affix  = string_arg(1);
        out = ExprValue(name == "starts_with" ? s.starts_with(affix) : ends_with(s, affix));
        return true;
    }

    if (name == "allow" || name == "abstain") {
        expect_args(0, 0);
        out = ExprValue(decision_map(name));
        return true;
    }

    if (name == "deny") {
        expect_args(0, 1);
        ExprMap map = decision_map("deny");
        map.emplace("reason", args.empty() ? ExprValue("Access denied")
                                           : ExprValue(args[0].to_display_string()));
        out = ExprValue(std::move(map));
        return true;
    }

    if (name == "has_role") {
        expect_args(1, 2);
        const bool explicit_user = args.size() == 2;
        const auto& user = explicit_user ? args[0] : global("user");
        out = ExprValue(user_has_role(user, string_arg(explicit_user ? 1 : 0)));
        return true;
    }

    if (name == "has_any_role") {
        std::size_t first = 0;
        const ExprValue* user = &global("user");
        if (!args.empty() && args[0].is_map()) {
            user  = &args[0];
            first = 1;
        }
        bool any = false;
        for (std::size_t i = first; i < args.size() && !any; ++i) {
            if (args[i].is_array()) {
                for (const auto& role : args[i].as_array()) {
                    if (role.is_string() && user_has_role(*user, role.as_string())) {
                        any = true;
                        break;
                    }
                }
            } else {
                any = user_has_role(*user, string_arg(i));
            }
        }
        out = ExprValue(any);
        return true;
    }

    if (name == "is_patient_user" || name == "is_practitioner_user") {
        expect_args(0, 1);
        const auto& user = args.empty() ? global("user") : args[0];
        const std::string wanted = name == "is_patient_user" ? "Patient" : "Practitioner";
        out = ExprValue(string_member(user, "fhirUserType") == wanted);
        return true;
    }

    if (name == "get_patient_context" || name == "get_encounter_context") {
        expect_args(0, 0);
        out = eval_member(global("environment"),
                          name == "get_patient_context" ? "patientContext" : "encounterContext", line);
        return true;
    }

    if (name == "in_patient_compartment") {
        expect_args(0, 0);
        const std::string patient = string_member(global("environment"), "patientContext");
        if (patient.empty()) {
            out = ExprValue(false);
            return true;
        }
        const auto& request = global("request");
        if (string_member(request, "compartmentType") == "Patient") {
            const std::string comp_id = string_member(request, "compartmentId");
            if (comp_id == patient || "Patient/" + comp_id == patient) {
                out = ExprValue(true);
                return true;
            }
        }
        const std::string subject = string_member(global("resource"), "subject");
        out = ExprValue(!subject.empty() &&
                        (subject == "Patient/" + patient || ends_with(subject, "/" + patient)));
        return true;
    }

    return false;
}
