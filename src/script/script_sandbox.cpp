#include "script/script_sandbox.hpp"

#include <exception>
#include <new>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "script/lightweight_engine.hpp"
#ifdef AUTHGATE_WITH_QUICKJS
#include "script/quickjs_engine.hpp"
#endif

const char* to_string(ScriptLanguage language) noexcept {
    switch (language) {
        case ScriptLanguage::kLightweight: return "lightweight";
        case ScriptLanguage::kJavaScript:  return "javascript";
    }
    return "unknown";
}

ScriptSandbox::ScriptSandbox(std::shared_ptr<ScriptEngine> lightweight,
                             std::shared_ptr<ScriptEngine> javascript,
                             std::chrono::milliseconds     timeout)
    : lightweight_(std::move(lightweight)), javascript_(std::move(javascript)), timeout_(timeout) {
    if (timeout_ <= std::chrono::milliseconds::zero()) {
        throw ConfigurationError("script timeout must be positive");
    }
}

std::unique_ptr<ScriptSandbox> ScriptSandbox::create(const ScriptSandboxConfig& config) {
    auto lightweight = std::make_shared<LightweightEngine>(config.lightweight);

    std::shared_ptr<ScriptEngine> javascript;
#ifdef AUTHGATE_WITH_QUICKJS
    javascript = std::make_shared<QuickJsEngine>(config.quickjs);
#else
    spdlog::warn("script_sandbox: built without QuickJS, javascript policies will be denied");
#endif

    return std::make_unique<ScriptSandbox>(std::move(lightweight), std::move(javascript),
                                           config.timeout);
}

ScriptEngine* ScriptSandbox::engine_for(ScriptLanguage language) const noexcept {
    switch (language) {
        case ScriptLanguage::kLightweight: return lightweight_.get();
        case ScriptLanguage::kJavaScript:  return javascript_.get();
    }
    return nullptr;
}

bool ScriptSandbox::has_engine(ScriptLanguage language) const noexcept {
    return engine_for(language) != nullptr;
}

AccessDecision ScriptSandbox::evaluate(
    const ScriptEngineSpec& spec, const std::string& policy_id, const Json::Value& context,
    std::optional<std::chrono::steady_clock::time_point> caller_deadline) const noexcept {
    ScriptEngine* engine = engine_for(spec.language);
    if (engine == nullptr) {
        spdlog::error("script_sandbox: no {} engine for policy '{}'", to_string(spec.language), policy_id);
        return Deny::script_fault(ScriptFault::kError,
                                  fmt::format("{} engine unavailable", to_string(spec.language)));
    }

    try {
        const auto budget_end = ExecutionDeadline::Clock::now() + timeout_;
        const auto deadline   = caller_deadline
                                    ? ExecutionDeadline::earliest(*caller_deadline, budget_end)
                                    : ExecutionDeadline(budget_end);

        const ScriptInvocation invocation{policy_id, spec.source, context, deadline};
        auto result = engine->execute(invocation);
        if (!result) {
            return Deny::script_fault(result.error().fault, std::move(result.error().details));
        }
        return *result;
    } catch (const std::bad_alloc&) {
        return Deny::script_fault(ScriptFault::kResourceExceeded, "out of memory");
    } catch (const std::exception& e) {
        spdlog::error("script_sandbox: engine '{}' threw for policy '{}': {}", engine->name(), policy_id, e.what());
        return Deny::script_fault(ScriptFault::kError, e.what());
    }
}
