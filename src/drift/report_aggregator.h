#pragma once

/// @file report_aggregator.h
/// @brief Gathers per-column results into a DriftReport

#include <cstddef>
#include <string>
#include <vector>

#include "drift/drift_config.h"
#include "drift/drift_report.h"

namespace drifter::drift {

/// @brief Dataset-level metadata of a run
struct RunMetadata {
    std::string reference_name;
    std::string current_name;
    size_t reference_rows = 0;
    size_t current_rows = 0;
    std::string run_timestamp;
    std::vector<std::string> requested_columns;
};

/// @brief Builds the final report
///
/// Deterministic given identical inputs. Result order is the input order;
/// nothing is re-sorted. Not-evaluated columns (skipped results and schema
/// mismatches) stay out of the drifted-fraction denominator unless
/// include_not_evaluated is set.
class ReportAggregator {
public:
    explicit ReportAggregator(DriftConfig::AggregationConfig config);

    DriftReport Aggregate(RunMetadata metadata,
                          std::vector<TestResult> results,
                          std::vector<SchemaMismatch> schema_mismatches) const;

    /// @brief Apply the aggregation rule to counted verdicts
    bool OverallDrift(size_t drifted_count, size_t denominator) const;

private:
    DriftConfig::AggregationConfig config_;
};

}  // namespace drifter::drift
