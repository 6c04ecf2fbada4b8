#pragma once

/// @file drift_report.h
/// @brief Per-column test results and the aggregate drift report
///
/// All fields are plain strings, numbers and booleans so any renderer can
/// consume a report without depending on engine internals.

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "common/error.h"
#include "drift/drift_types.h"
#include "drift/test_kind.h"

namespace drifter::drift {

/// @brief Per-dataset summary carried into the report
struct SampleSummary {
    size_t count = 0;
    size_t null_count = 0;
    size_t distinct_count = 0;
    std::optional<double> mean;
    std::optional<double> std_dev;
    std::optional<double> min;
    std::optional<double> max;
};

/// @brief Outcome for one column present in both datasets
struct TestResult {
    std::string column;
    ColumnStatus status = ColumnStatus::kNotEvaluated;

    /// Resolved classification of the column pair
    ColumnKind kind = ColumnKind::kCategorical;

    /// Unset when the column was not evaluated before a test was chosen
    std::optional<TestKind> test;

    double statistic = 0.0;
    std::optional<double> p_value;

    /// Larger = more drift, for every test
    double score = 0.0;
    double threshold = 0.0;
    bool drifted = false;
    Severity severity = Severity::kNone;

    /// Why the column was not evaluated (kOk otherwise)
    ErrorCode reason_code = ErrorCode::kOk;
    std::string reason;

    SampleSummary reference;
    SampleSummary current;

    /// Numeric [min, max] ranges of the two samples intersect
    bool ranges_overlap = true;

    bool IsEvaluated() const { return status != ColumnStatus::kNotEvaluated; }
};

/// @brief A requested column missing from one of the datasets
struct SchemaMismatch {
    std::string column;
    bool in_reference = false;
    bool in_current = false;
    ErrorCode reason_code = ErrorCode::kSchemaMismatch;
    std::string reason;
};

/// @brief Aggregate result of one comparison run
struct DriftReport {
    std::string reference_name;
    std::string current_name;
    size_t reference_rows = 0;
    size_t current_rows = 0;

    /// ISO-8601 UTC time of the run
    std::string run_timestamp;

    /// Every requested column, in request order
    std::vector<std::string> requested_columns;

    /// Columns present in both datasets, in request order
    std::vector<TestResult> results;

    /// Requested columns absent from one dataset, in request order
    std::vector<SchemaMismatch> schema_mismatches;

    AggregationRule rule = AggregationRule::kFractionOfColumns;
    double fraction_limit = 0.0;
    bool include_not_evaluated = false;

    size_t evaluated_count = 0;
    size_t drifted_count = 0;

    /// Skipped results plus schema mismatches
    size_t not_evaluated_count = 0;

    /// drifted_count / denominator (0 when the denominator is 0)
    double drifted_fraction = 0.0;
    bool overall_drift = false;

    /// @brief Find a column's result; nullptr if not present in both datasets
    const TestResult* FindResult(const std::string& column) const {
        for (const auto& result : results) {
            if (result.column == column) {
                return &result;
            }
        }
        return nullptr;
    }
};

}  // namespace drifter::drift
