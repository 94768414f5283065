#include "script/script_engine.hpp"

AccessDecision decision_from_script_result(const Json::Value& result) {
    if (result.isBool()) {
        if (result.asBool()) {
            return Allow{};
        }
        return Deny::script_denied("Policy script returned false");
    }

    if (result.isObject() && result["decision"].isString()) {
        const std::string decision = result["decision"].asString();
        if (decision == "allow") {
            return Allow{};
        }
        if (decision == "deny") {
            const std::string reason =
                result["reason"].isString() ? result["reason"].asString() : "Denied by policy script";
            return Deny::script_denied(reason);
        }
        if (decision == "abstain") {
            return Abstain{};
        }
    }
    return Abstain{};
}
