#pragma once

/// @file column_profiler.h
/// @brief Per-column classification and summary statistics

#include <cstddef>
#include <map>
#include <optional>
#include <string>

#include "drift/dataset.h"
#include "drift/drift_config.h"
#include "drift/drift_types.h"

namespace drifter::drift {

/// @brief Summary of one column in one dataset
struct ColumnProfile {
    std::string column;
    ColumnKind kind = ColumnKind::kCategorical;

    /// Kind came from a declared column type rather than inference
    bool declared = false;

    /// Declared numeric, but some values were not numbers
    bool type_conflict = false;

    size_t count = 0;
    size_t null_count = 0;

    /// Distinct non-null values
    size_t distinct_count = 0;

    /// All non-null values are numbers (false for all-null columns)
    bool numeric = false;

    /// Numeric and every value is a whole number
    bool integral = false;

    // Numeric summary, set when numeric
    std::optional<double> mean;
    std::optional<double> std_dev;
    std::optional<double> min;
    std::optional<double> max;

    /// Category frequencies, set for categorical and discrete columns
    std::map<std::string, size_t> frequencies;

    size_t NonNullCount() const { return count - null_count; }

    /// No usable values at all
    bool AllNull() const { return NonNullCount() == 0; }

    /// A single distinct value
    bool ZeroVariance() const { return distinct_count == 1; }
};

/// @brief Whether two numeric profiles' [min, max] ranges intersect.
///        Non-numeric profiles always overlap.
bool RangesOverlap(const ColumnProfile& reference, const ColumnProfile& current);

/// @brief Classifies columns and computes their summaries
///
/// Classification: non-numeric values make a column categorical. A numeric
/// column is discrete when its distinct/non-null ratio is below the discrete
/// ratio, or when its distinct count is at most the cardinality cutoff and
/// its values are whole numbers or repeat (ratio at most one half).
/// Otherwise it is continuous, so a short sample of distinct measurements
/// never becomes a set of categories. A declared type overrides inference
/// (numeric -> continuous, categorical -> categorical).
class ColumnProfiler {
public:
    explicit ColumnProfiler(DriftConfig::ProfilingConfig config);

    /// @brief Profile one column; pure function of its values
    ColumnProfile Profile(const Column& column) const;

    const DriftConfig::ProfilingConfig& GetConfig() const { return config_; }

private:
    ColumnKind Classify(const ColumnProfile& profile) const;

    DriftConfig::ProfilingConfig config_;
};

}  // namespace drifter::drift
