/// @file report_aggregator.cpp
/// @brief Report aggregation

#include "drift/report_aggregator.h"

namespace drifter::drift {

ReportAggregator::ReportAggregator(DriftConfig::AggregationConfig config)
    : config_(config) {}

bool ReportAggregator::OverallDrift(size_t drifted_count, size_t denominator) const {
    switch (config_.rule) {
        case AggregationRule::kAnyColumn:
            return drifted_count > 0;
        case AggregationRule::kFractionOfColumns:
            if (denominator == 0) {
                return false;
            }
            return static_cast<double>(drifted_count) / static_cast<double>(denominator) >
                   config_.fraction;
    }
    return false;
}

DriftReport ReportAggregator::Aggregate(RunMetadata metadata,
                                        std::vector<TestResult> results,
                                        std::vector<SchemaMismatch> schema_mismatches) const {
    DriftReport report;
    report.reference_name = std::move(metadata.reference_name);
    report.current_name = std::move(metadata.current_name);
    report.reference_rows = metadata.reference_rows;
    report.current_rows = metadata.current_rows;
    report.run_timestamp = std::move(metadata.run_timestamp);
    report.requested_columns = std::move(metadata.requested_columns);
    report.rule = config_.rule;
    report.fraction_limit = config_.fraction;
    report.include_not_evaluated = config_.include_not_evaluated;

    for (const auto& result : results) {
        if (!result.IsEvaluated()) {
            ++report.not_evaluated_count;
            continue;
        }
        ++report.evaluated_count;
        if (result.status == ColumnStatus::kDrifted) {
            ++report.drifted_count;
        }
    }
    report.not_evaluated_count += schema_mismatches.size();

    size_t denominator = report.evaluated_count;
    if (config_.include_not_evaluated) {
        denominator += report.not_evaluated_count;
    }
    report.drifted_fraction = denominator == 0
        ? 0.0
        : static_cast<double>(report.drifted_count) / static_cast<double>(denominator);
    report.overall_drift = OverallDrift(report.drifted_count, denominator);

    report.results = std::move(results);
    report.schema_mismatches = std::move(schema_mismatches);
    return report;
}

}  // namespace drifter::drift
