// ---------------------------------------------------------------------------
// quickjs_engine.cpp
// ---------------------------------------------------------------------------

#include "script/quickjs_engine.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <quickjs.h>
#include <spdlog/spdlog.h>

#include "common/json_util.hpp"

namespace {

// ---------------------------------------------------------------------------
// 스크립트 래퍼
//   user/client/... 는 클로저 지역 상수. ctx 는 깊게 동결된다.
//   사용자 스크립트는 함수 본문으로 삽입되므로 return 으로 결과를 낸다.
// ---------------------------------------------------------------------------
constexpr std::string_view kPrologue = R"JS((function (ctx) {
    "use strict";
    delete globalThis.__authgate_ctx;
    const freeze = (o) => {
        if (o !== null && typeof o === "object" && !Object.isFrozen(o)) {
            Object.freeze(o);
            Object.getOwnPropertyNames(o).forEach((k) => freeze(o[k]));
        }
        return o;
    };
    freeze(ctx);
    const user = ctx.user || null;
    const client = ctx.client;
    const scopes = ctx.scopes;
    const request = ctx.request;
    const resource = ctx.resource || null;
    const environment = ctx.environment;

    const allow = () => ({ decision: "allow" });
    const deny = (reason) => ({ decision: "deny", reason: reason || "Access denied" });
    const abstain = () => ({ decision: "abstain" });

    const hasRole = (role) => !!(user && Array.isArray(user.roles) && user.roles.includes(role));
    const hasAnyRole = (...roles) => roles.flat().some((r) => hasRole(r));
    const isPatientUser = () => !!user && user.fhirUserType === "Patient";
    const isPractitionerUser = () => !!user && user.fhirUserType === "Practitioner";
    const getPatientContext = () => environment.patientContext;
    const getEncounterContext = () => environment.encounterContext;
    const inPatientCompartment = () => {
        const patientId = environment.patientContext;
        if (!patientId) return false;
        if (request.compartmentType === "Patient" && request.compartmentId &&
            (request.compartmentId === patientId || `Patient/${request.compartmentId}` === patientId)) {
            return true;
        }
        if (!resource || typeof resource.subject !== "string") return false;
        const ref = resource.subject;
        return ref === `Patient/${patientId}` || ref.endsWith(`/${patientId}`);
    };

    return (function () {
)JS";

constexpr std::string_view kEpilogue = R"JS(
    })();
})(globalThis.__authgate_ctx);
)JS";

// 실행 1회의 상태. interrupt handler 와 console 함수가 opaque 로 받는다.
struct RunState {
    ExecutionDeadline deadline{ExecutionDeadline::Clock::time_point::max()};
    const std::string* policy_id{nullptr};
    bool               interrupted{false};
};

int interrupt_handler(JSRuntime* /*rt*/, void* opaque) {
    auto* state = static_cast<RunState*>(opaque);
    if (state->deadline.expired()) {
        state->interrupted = true;
        return 1;
    }
    return 0;
}

std::string to_std_string(JSContext* ctx, JSValueConst value) {
    const char* str = JS_ToCString(ctx, value);
    if (str == nullptr) {
        return {};
    }
    std::string result(str);
    JS_FreeCString(ctx, str);
    return result;
}

// console.log / warn / error → spdlog (magic: 0 log, 1 warn, 2 error)
JSValue js_console(JSContext* ctx, JSValueConst /*this_val*/, int argc, JSValueConst* argv, int magic) {
    std::string line;
    for (int i = 0; i < argc; ++i) {
        if (i > 0) {
            line.push_back(' ');
        }
        line += to_std_string(ctx, argv[i]);
    }
    const auto*        state     = static_cast<const RunState*>(JS_GetContextOpaque(ctx));
    const std::string& policy_id = state->policy_id != nullptr ? *state->policy_id : std::string();
    switch (magic) {
        case 1:  spdlog::warn("quickjs: [{}] {}", policy_id, line); break;
        case 2:  spdlog::error("quickjs: [{}] {}", policy_id, line); break;
        default: spdlog::debug("quickjs: [{}] {}", policy_id, line); break;
    }
    return JS_UNDEFINED;
}

// JSContext RAII
class ContextHandle {
public:
    explicit ContextHandle(JSRuntime* rt) : ctx_(JS_NewContext(rt)) {}
    ~ContextHandle() {
        if (ctx_ != nullptr) {
            JS_FreeContext(ctx_);
        }
    }
    ContextHandle(const ContextHandle&)            = delete;
    ContextHandle& operator=(const ContextHandle&) = delete;

    [[nodiscard]] JSContext* get() const noexcept { return ctx_; }

private:
    JSContext* ctx_;
};

// JSValue RAII
class ValueHandle {
public:
    ValueHandle(JSContext* ctx, JSValue value) : ctx_(ctx), value_(value) {}
    ~ValueHandle() { JS_FreeValue(ctx_, value_); }
    ValueHandle(const ValueHandle&)            = delete;
    ValueHandle& operator=(const ValueHandle&) = delete;

    [[nodiscard]] JSValueConst get() const noexcept { return value_; }

private:
    JSContext* ctx_;
    JSValue    value_;
};

bool install_console(JSContext* ctx) {
    ValueHandle global(ctx, JS_GetGlobalObject(ctx));
    JSValue     console = JS_NewObject(ctx);
    if (JS_IsException(console)) {
        return false;
    }
    JS_SetPropertyStr(ctx, console, "log",
                      JS_NewCFunctionMagic(ctx, js_console, "log", 1, JS_CFUNC_generic_magic, 0));
    JS_SetPropertyStr(ctx, console, "warn",
                      JS_NewCFunctionMagic(ctx, js_console, "warn", 1, JS_CFUNC_generic_magic, 1));
    JS_SetPropertyStr(ctx, console, "error",
                      JS_NewCFunctionMagic(ctx, js_console, "error", 1, JS_CFUNC_generic_magic, 2));
    return JS_SetPropertyStr(ctx, global.get(), "console", console) >= 0;
}

// 보류 중인 예외 메시지를 꺼낸다
std::string take_exception(JSContext* ctx) {
    ValueHandle exc(ctx, JS_GetException(ctx));
    std::string message = to_std_string(ctx, exc.get());
    if (JS_IsObject(exc.get())) {
        ValueHandle stack(ctx, JS_GetPropertyStr(ctx, exc.get(), "stack"));
        if (JS_IsString(stack.get())) {
            const std::string trace = to_std_string(ctx, stack.get());
            if (!trace.empty()) {
                message += "\n" + trace;
            }
        }
    }
    return message;
}

bool is_resource_error(const std::string& message) {
    return message.find("out of memory") != std::string::npos ||
           message.find("stack overflow") != std::string::npos ||
           message.find("Maximum call stack size exceeded") != std::string::npos;
}

}  // namespace

// ---------------------------------------------------------------------------
// Impl: 슬롯 풀
// ---------------------------------------------------------------------------
class QuickJsEngine::Impl {
public:
    struct Slot {
        JSRuntime* rt{nullptr};
        RunState   state{};

        Slot() = default;
        ~Slot() {
            if (rt != nullptr) {
                JS_FreeRuntime(rt);
            }
        }
        Slot(const Slot&)            = delete;
        Slot& operator=(const Slot&) = delete;
    };

    explicit Impl(const QuickJsPoolConfig& config) : config_(config) {
        std::size_t size = config.pool_size;
        if (size == 0) {
            size = std::max(1U, std::thread::hardware_concurrency());
        }
        slots_.reserve(size);
        for (std::size_t i = 0; i < size; ++i) {
            auto slot = std::make_unique<Slot>();
            slot->rt  = JS_NewRuntime();
            if (slot->rt == nullptr) {
                throw ConfigurationError("quickjs: failed to create runtime");
            }
            JS_SetMemoryLimit(slot->rt, config.memory_limit);
            JS_SetMaxStackSize(slot->rt, config.max_stack_size);
            JS_SetInterruptHandler(slot->rt, interrupt_handler, &slot->state);
            free_.push_back(slot.get());
            slots_.push_back(std::move(slot));
        }
        spdlog::info("quickjs: pool ready (slots={}, memory_limit={}, max_stack={})",
                     size, config.memory_limit, config.max_stack_size);
    }

    Impl(const Impl&)            = delete;
    Impl& operator=(const Impl&) = delete;

    // bounded wait. 호출자 deadline 이 더 이르면 그만큼만 기다린다.
    Slot* checkout(const ExecutionDeadline& deadline) {
        const auto wait = std::min<ExecutionDeadline::Clock::duration>(
            config_.checkout_timeout, deadline.remaining());
        std::unique_lock lock(mutex_);
        if (!cv_.wait_for(lock, wait, [this] { return !free_.empty(); })) {
            return nullptr;
        }
        Slot* slot = free_.back();
        free_.pop_back();
        return slot;
    }

    void checkin(Slot* slot) {
        {
            std::lock_guard lock(mutex_);
            free_.push_back(slot);
        }
        cv_.notify_one();
    }

    [[nodiscard]] std::size_t size() const noexcept { return slots_.size(); }

    [[nodiscard]] std::size_t available() const {
        std::lock_guard lock(mutex_);
        return free_.size();
    }

    // 슬롯 반납 RAII
    class Lease {
    public:
        Lease(Impl& pool, Slot* slot) : pool_(pool), slot_(slot) {}
        ~Lease() { pool_.checkin(slot_); }
        Lease(const Lease&)            = delete;
        Lease& operator=(const Lease&) = delete;

    private:
        Impl& pool_;
        Slot* slot_;
    };

    std::expected<AccessDecision, ScriptFailure> run(Slot& slot, const ScriptInvocation& inv);

private:
    QuickJsPoolConfig                  config_;
    std::vector<std::unique_ptr<Slot>> slots_;
    std::vector<Slot*>                 free_;
    mutable std::mutex                 mutex_;
    std::condition_variable            cv_;
};

std::expected<AccessDecision, ScriptFailure>
QuickJsEngine::Impl::run(Slot& slot, const ScriptInvocation& inv) {
    slot.state.deadline    = inv.deadline;
    slot.state.policy_id   = &inv.policy_id;
    slot.state.interrupted = false;

    // 슬롯은 여러 스레드에서 번갈아 쓰인다
    JS_UpdateStackTop(slot.rt);

    std::expected<AccessDecision, ScriptFailure> outcome =
        std::unexpected(ScriptFailure{ScriptFault::kError, "not executed"});
    {
        ContextHandle context(slot.rt);
        JSContext*    ctx = context.get();
        if (ctx == nullptr) {
            return std::unexpected(ScriptFailure{ScriptFault::kResourceExceeded,
                                                 "failed to create JS context"});
        }
        JS_SetContextOpaque(ctx, &slot.state);

        if (!install_console(ctx)) {
            return std::unexpected(ScriptFailure{ScriptFault::kResourceExceeded,
                                                 "failed to install console: " + take_exception(ctx)});
        }

        const std::string context_json = to_compact_json(inv.context);
        JSValue parsed = JS_ParseJSON(ctx, context_json.c_str(), context_json.size(), "<context>");
        if (JS_IsException(parsed)) {
            const std::string message = take_exception(ctx);
            return std::unexpected(ScriptFailure{is_resource_error(message) ? ScriptFault::kResourceExceeded
                                                                            : ScriptFault::kError,
                                                 "failed to inject context: " + message});
        }
        {
            ValueHandle global(ctx, JS_GetGlobalObject(ctx));
            JS_SetPropertyStr(ctx, global.get(), "__authgate_ctx", parsed);
        }

        std::string wrapped;
        wrapped.reserve(kPrologue.size() + inv.source.size() + kEpilogue.size());
        wrapped.append(kPrologue).append(inv.source).append(kEpilogue);

        const std::string filename = "policy:" + inv.policy_id;
        ValueHandle result(ctx, JS_Eval(ctx, wrapped.c_str(), wrapped.size(), filename.c_str(),
                                        JS_EVAL_TYPE_GLOBAL));

        if (JS_IsException(result.get())) {
            const std::string message = take_exception(ctx);
            if (slot.state.interrupted) {
                outcome = std::unexpected(ScriptFailure{ScriptFault::kTimeout, "script execution timed out"});
            } else if (is_resource_error(message)) {
                outcome = std::unexpected(ScriptFailure{ScriptFault::kResourceExceeded, message});
            } else {
                outcome = std::unexpected(ScriptFailure{ScriptFault::kError, message});
            }
        } else {
            ValueHandle json(ctx, JS_JSONStringify(ctx, result.get(), JS_UNDEFINED, JS_UNDEFINED));
            if (JS_IsException(json.get())) {
                outcome = std::unexpected(ScriptFailure{ScriptFault::kError,
                                                        "result not serializable: " + take_exception(ctx)});
            } else if (!JS_IsString(json.get())) {
                // undefined, 함수 등 → Abstain
                outcome = decision_from_script_result(Json::Value(Json::nullValue));
            } else {
                auto value = parse_json(to_std_string(ctx, json.get()));
                if (!value) {
                    outcome = std::unexpected(ScriptFailure{ScriptFault::kError,
                                                            "invalid script result: " + value.error()});
                } else {
                    outcome = decision_from_script_result(*value);
                }
            }
        }
    }

    // 컨텍스트 해제 후 순환 참조까지 정리
    JS_RunGC(slot.rt);
    slot.state.policy_id = nullptr;
    return outcome;
}

// ---------------------------------------------------------------------------
// QuickJsEngine
// ---------------------------------------------------------------------------
QuickJsEngine::QuickJsEngine(QuickJsPoolConfig config) {
    if (config.memory_limit == 0 || config.max_stack_size == 0) {
        throw ConfigurationError("quickjs: memory_limit and max_stack_size must be positive");
    }
    impl_ = std::make_unique<Impl>(config);
}

QuickJsEngine::~QuickJsEngine() = default;

std::size_t QuickJsEngine::pool_size() const noexcept {
    return impl_->size();
}

std::size_t QuickJsEngine::available_slots() const {
    return impl_->available();
}

std::expected<AccessDecision, ScriptFailure>
QuickJsEngine::execute(const ScriptInvocation& invocation) {
    if (invocation.deadline.expired()) {
        return std::unexpected(ScriptFailure{ScriptFault::kTimeout, "deadline passed before execution"});
    }

    Impl::Slot* slot = impl_->checkout(invocation.deadline);
    if (slot == nullptr) {
        spdlog::warn("quickjs: no free slot for policy '{}' (pool size {})",
                     invocation.policy_id, impl_->size());
        return std::unexpected(ScriptFailure{ScriptFault::kPoolExhausted,
                                             "timed out waiting for a script interpreter"});
    }
    Impl::Lease lease(*impl_, slot);

    try {
        auto outcome = impl_->run(*slot, invocation);
        if (!outcome) {
            spdlog::warn("quickjs: policy '{}' failed ({}): {}", invocation.policy_id,
                         script_fault_code(outcome.error().fault), outcome.error().details);
        }
        return outcome;
    } catch (const std::bad_alloc&) {
        return std::unexpected(ScriptFailure{ScriptFault::kResourceExceeded, "out of memory"});
    } catch (const std::exception& e) {
        spdlog::error("quickjs: policy '{}' internal error: {}", invocation.policy_id, e.what());
        return std::unexpected(ScriptFailure{ScriptFault::kError, e.what()});
    }
}
