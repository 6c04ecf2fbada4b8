#pragma once

/// @file drift_types.h
/// @brief Enumerations shared across the drift-check pipeline

#include <string_view>

#include <absl/status/statusor.h>

namespace drifter::drift {

/// @brief Inferred classification of a column
enum class ColumnKind {
    kContinuous,   ///< Numeric with many distinct values
    kDiscrete,     ///< Numeric with few distinct values
    kCategorical,  ///< Non-numeric values
};

/// @brief Caller-declared column type, overriding inference
enum class DeclaredType {
    kNumeric,
    kCategorical,
};

/// @brief Final verdict for a requested column
enum class ColumnStatus {
    kDrifted,
    kNotDrifted,
    kNotEvaluated,
};

/// @brief How far a drifted score exceeds its threshold
enum class Severity {
    kNone,
    kLow,
    kMedium,
    kHigh,
};

/// @brief Dataset-level drift decision rule
enum class AggregationRule {
    kAnyColumn,          ///< Overall drift if any evaluated column drifted
    kFractionOfColumns,  ///< Overall drift if drifted share exceeds a limit
};

std::string_view ColumnKindToString(ColumnKind kind);
std::string_view DeclaredTypeToString(DeclaredType type);
std::string_view ColumnStatusToString(ColumnStatus status);
std::string_view SeverityToString(Severity severity);
std::string_view AggregationRuleToString(AggregationRule rule);

absl::StatusOr<DeclaredType> ParseDeclaredType(std::string_view name);
absl::StatusOr<AggregationRule> ParseAggregationRule(std::string_view name);

}  // namespace drifter::drift
