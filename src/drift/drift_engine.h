#pragma once

/// @file drift_engine.h
/// @brief Column-by-column drift check between a reference and a current dataset

#include <chrono>
#include <memory>
#include <string>

#include <absl/status/statusor.h>

#include "common/thread_pool.h"
#include "drift/column_profiler.h"
#include "drift/dataset.h"
#include "drift/drift_config.h"
#include "drift/drift_report.h"
#include "drift/report_aggregator.h"
#include "drift/test_executor.h"
#include "drift/test_selector.h"
#include "drift/threshold_evaluator.h"

namespace drifter::drift {

/// @brief Runs the profile -> select -> test -> threshold chain per column
///        and aggregates the results
///
/// Each column's chain reads only its own two columns and writes only its
/// own TestResult, so columns run as independent tasks on a thread pool and
/// are gathered back in request order. Per-column data problems mark that
/// column not-evaluated; they never abort the run.
///
/// Without an explicit column list every reference column is checked, and
/// columns only the current dataset has are reported as schema mismatches.
///
/// Example usage:
/// @code
///   auto engine = DriftEngine::Create(DriftConfig::Default());
///   if (!engine.ok()) { ... }
///   auto report = (*engine)->Compare(reference, current);
///   if (report.ok() && report->overall_drift) {
///       // investigate drifted columns
///   }
/// @endcode
class DriftEngine {
    /// Only Create() can make one, so every engine holds a validated config
    class Passkey {
        friend class DriftEngine;
        Passkey() = default;
    };

public:
    /// @brief Validate the configuration and build an engine
    /// @return kConfigurationError status for invalid configuration
    static absl::StatusOr<std::unique_ptr<DriftEngine>> Create(DriftConfig config);

    DriftEngine(Passkey, DriftConfig config);

    ~DriftEngine();

    DriftEngine(const DriftEngine&) = delete;
    DriftEngine& operator=(const DriftEngine&) = delete;

    /// @brief Compare two datasets, stamping the report with the current time
    absl::StatusOr<DriftReport> Compare(const Dataset& reference, const Dataset& current) const;

    /// @brief Compare two datasets with an explicit run time
    ///
    /// Identical datasets, configuration and run time yield identical reports.
    absl::StatusOr<DriftReport> Compare(const Dataset& reference,
                                        const Dataset& current,
                                        std::chrono::system_clock::time_point run_time) const;

    /// @brief Evaluate a single column pair; never fails, problems are
    ///        recorded as a not-evaluated result
    TestResult EvaluateColumn(const Column& reference, const Column& current) const;

    const DriftConfig& GetConfig() const { return config_; }

private:
    DriftConfig config_;
    ColumnProfiler profiler_;
    TestSelector selector_;
    TestExecutor executor_;
    ThresholdEvaluator evaluator_;
    ReportAggregator aggregator_;

    /// Null when running inline (num_threads == 1)
    std::unique_ptr<ThreadPool> pool_;
};

/// @brief Format a time point as RFC 3339 UTC with second precision
std::string FormatRunTimestamp(std::chrono::system_clock::time_point time);

}  // namespace drifter::drift
