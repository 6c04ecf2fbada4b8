#pragma once

/// @file drift_config.h
/// @brief Immutable per-run configuration for a drift check

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "drift/drift_types.h"
#include "drift/test_kind.h"

namespace drifter::drift {

/// @brief Configuration for one comparison run
///
/// Thresholds are expressed in score space, where a larger score always
/// means more drift. For p-value tests the score is 1 - p, so a threshold
/// of 0.95 corresponds to a significance level of 0.05.
///
/// Example YAML:
/// @code
///   thresholds:
///     global: 0.2            # optional, replaces per-test defaults
///     per_test: {psi: 0.25}
///     per_column: {age: 0.3}
///   tests:
///     continuous: ks
///     discrete: chi_squared
///     categorical: psi
///     per_column: {income: wasserstein}
///   profiling:
///     cardinality_cutoff: 20
///     discrete_ratio: 0.05
///     column_types: {zip_code: categorical}
///   aggregation: {rule: fraction, fraction: 0.5}
///   severity: {medium_ratio: 2.0, high_ratio: 5.0}
///   min_sample_size: 5
/// @endcode
struct DriftConfig {
    struct ThresholdConfig {
        /// Applies to every column without a per-column override
        std::optional<double> global;

        /// Per-test defaults; tests missing here use DefaultThreshold()
        std::map<TestKind, double> per_test;

        std::map<std::string, double> per_column;
    };
    ThresholdConfig thresholds;

    struct TestSelectionConfig {
        TestKind continuous = TestKind::kKolmogorovSmirnov;
        TestKind discrete = TestKind::kChiSquared;
        TestKind categorical = TestKind::kChiSquared;

        /// Explicit override, wins over classification
        std::map<std::string, TestKind> per_column;
    };
    TestSelectionConfig tests;

    struct ProfilingConfig {
        /// Numeric columns with at most this many distinct values are discrete
        size_t cardinality_cutoff = 20;

        /// Numeric columns whose distinct/non-null ratio is below this are discrete
        double discrete_ratio = 0.05;

        /// Declared types skip inference
        std::map<std::string, DeclaredType> column_types;
    };
    ProfilingConfig profiling;

    struct BinningConfig {
        /// Quantile bins for PSI on continuous columns
        size_t psi_bins = 10;

        /// Floor substituted for empty PSI bins
        double psi_epsilon = 1e-4;

        size_t kl_bins = 50;
        double kl_epsilon = 1e-8;
    };
    BinningConfig binning;

    struct AggregationConfig {
        AggregationRule rule = AggregationRule::kFractionOfColumns;

        /// Overall drift when drifted / denominator > fraction
        double fraction = 0.5;

        /// Count not-evaluated columns in the denominator
        bool include_not_evaluated = false;
    };
    AggregationConfig aggregation;

    struct SeverityConfig {
        /// Exceedance ratio at which severity becomes medium
        double medium_ratio = 2.0;

        /// Exceedance ratio at which severity becomes high
        double high_ratio = 5.0;
    };
    SeverityConfig severity;

    /// Minimum non-null values per sample for any test
    size_t min_sample_size = 5;

    /// Drop values above this quantile before numeric tests (unset = keep all)
    std::optional<double> trim_quantile;

    /// Floor for the reference std that normalizes the Wasserstein distance
    double wasserstein_min_std = 1e-3;

    /// Columns to compare, in report order (empty = reference column order)
    std::vector<std::string> columns;

    /// Worker threads for per-column tasks (0 = hardware concurrency, 1 = inline)
    size_t num_threads = 0;

    /// Log a warning when either dataset has fewer rows than this
    size_t small_sample_warning_rows = 1000;

    /// @brief Default configuration
    static DriftConfig Default();

    /// @brief Load configuration from a YAML file
    static absl::StatusOr<DriftConfig> LoadFromFile(const std::string& path);

    /// @brief Load configuration from YAML content
    static absl::StatusOr<DriftConfig> LoadFromString(std::string_view yaml_content);

    /// @brief Load from a YAML file, then apply environment overrides
    static absl::StatusOr<DriftConfig> LoadWithEnv(
        const std::string& path,
        const std::string& env_prefix = "DRIFTER_");

    /// @brief Apply overrides from environment variables
    ///
    /// Recognized (after the prefix): GLOBAL_THRESHOLD, MIN_SAMPLE_SIZE,
    /// NUM_THREADS, AGGREGATION_RULE, AGGREGATION_FRACTION.
    absl::Status ApplyEnvironment(const std::string& env_prefix = "DRIFTER_");

    /// @brief Check every field; returns a configuration error on the first
    ///        invalid value
    absl::Status Validate() const;
};

}  // namespace drifter::drift
