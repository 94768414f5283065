#include "common/fhir_operation.hpp"

#include <array>
#include <utility>

namespace {

constexpr std::array<std::pair<FhirOperation, std::string_view>, 15> kOperationNames{{
    {FhirOperation::kRead,            "read"},
    {FhirOperation::kVRead,           "vread"},
    {FhirOperation::kUpdate,          "update"},
    {FhirOperation::kPatch,           "patch"},
    {FhirOperation::kDelete,          "delete"},
    {FhirOperation::kHistoryInstance, "history-instance"},
    {FhirOperation::kHistoryType,     "history-type"},
    {FhirOperation::kHistorySystem,   "history-system"},
    {FhirOperation::kCreate,          "create"},
    {FhirOperation::kSearchType,      "search-type"},
    {FhirOperation::kSearchSystem,    "search-system"},
    {FhirOperation::kCapabilities,    "capabilities"},
    {FhirOperation::kBatch,           "batch"},
    {FhirOperation::kTransaction,     "transaction"},
    {FhirOperation::kOperation,       "operation"},
}};

}  // namespace

std::string_view to_string(FhirOperation op) noexcept {
    for (const auto& [value, name] : kOperationNames) {
        if (value == op) {
            return name;
        }
    }
    return "unknown";
}

std::optional<FhirOperation> parse_fhir_operation(std::string_view name) noexcept {
    for (const auto& [value, text] : kOperationNames) {
        if (text == name) {
            return value;
        }
    }
    return std::nullopt;
}

const std::vector<FhirOperation>& all_fhir_operations() {
    static const std::vector<FhirOperation> all = [] {
        std::vector<FhirOperation> ops;
        ops.reserve(kOperationNames.size());
        for (const auto& entry : kOperationNames) {
            ops.push_back(entry.first);
        }
        return ops;
    }();
    return all;
}

std::optional<std::vector<FhirOperation>> expand_operation_alias(std::string_view name) {
    if (name == "*") {
        return all_fhir_operations();
    }
    if (name == "history") {
        return std::vector<FhirOperation>{FhirOperation::kHistoryInstance,
                                          FhirOperation::kHistoryType,
                                          FhirOperation::kHistorySystem};
    }
    if (name == "search") {
        return std::vector<FhirOperation>{FhirOperation::kSearchType,
                                          FhirOperation::kSearchSystem};
    }
    if (auto op = parse_fhir_operation(name)) {
        return std::vector<FhirOperation>{*op};
    }
    return std::nullopt;
}
