#include "drift/drift_types.h"

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace drifter::drift {

std::string_view ColumnKindToString(ColumnKind kind) {
    switch (kind) {
        case ColumnKind::kContinuous: return "continuous";
        case ColumnKind::kDiscrete: return "discrete";
        case ColumnKind::kCategorical: return "categorical";
    }
    return "unknown";
}

std::string_view DeclaredTypeToString(DeclaredType type) {
    switch (type) {
        case DeclaredType::kNumeric: return "numeric";
        case DeclaredType::kCategorical: return "categorical";
    }
    return "unknown";
}

std::string_view ColumnStatusToString(ColumnStatus status) {
    switch (status) {
        case ColumnStatus::kDrifted: return "drifted";
        case ColumnStatus::kNotDrifted: return "not_drifted";
        case ColumnStatus::kNotEvaluated: return "not_evaluated";
    }
    return "unknown";
}

std::string_view SeverityToString(Severity severity) {
    switch (severity) {
        case Severity::kNone: return "none";
        case Severity::kLow: return "low";
        case Severity::kMedium: return "medium";
        case Severity::kHigh: return "high";
    }
    return "unknown";
}

std::string_view AggregationRuleToString(AggregationRule rule) {
    switch (rule) {
        case AggregationRule::kAnyColumn: return "any";
        case AggregationRule::kFractionOfColumns: return "fraction";
    }
    return "unknown";
}

absl::StatusOr<DeclaredType> ParseDeclaredType(std::string_view name) {
    if (name == "numeric" || name == "numerical") {
        return DeclaredType::kNumeric;
    }
    if (name == "categorical") {
        return DeclaredType::kCategorical;
    }
    return ConfigurationError(absl::StrCat("Unknown column type '", std::string(name), "'"));
}

absl::StatusOr<AggregationRule> ParseAggregationRule(std::string_view name) {
    if (name == "any") {
        return AggregationRule::kAnyColumn;
    }
    if (name == "fraction") {
        return AggregationRule::kFractionOfColumns;
    }
    return ConfigurationError(absl::StrCat("Unknown aggregation rule '", std::string(name), "'"));
}

}  // namespace drifter::drift
