/// @file column_profiler.cpp
/// @brief Column profiler implementation

#include "drift/column_profiler.h"

#include <algorithm>
#include <cmath>
#include <unordered_set>
#include <utility>
#include <vector>

#include "drift/statistics.h"

namespace drifter::drift {

namespace {

// Below the cardinality cutoff, fractional values must repeat at least
// twice on average to count as discrete levels
constexpr double kRepeatedValueRatio = 0.5;

}  // namespace

bool RangesOverlap(const ColumnProfile& reference, const ColumnProfile& current) {
    if (!reference.min || !reference.max || !current.min || !current.max) {
        return true;
    }
    return *reference.min <= *current.max && *current.min <= *reference.max;
}

ColumnProfiler::ColumnProfiler(DriftConfig::ProfilingConfig config)
    : config_(std::move(config)) {}

ColumnProfile ColumnProfiler::Profile(const Column& column) const {
    ColumnProfile profile;
    profile.column = column.name;
    profile.count = column.values.size();

    std::vector<double> numbers;
    numbers.reserve(column.values.size());
    std::unordered_set<std::string> distinct;
    bool has_text = false;

    for (const auto& value : column.values) {
        if (IsMissing(value)) {
            ++profile.null_count;
            continue;
        }
        if (const auto* number = std::get_if<double>(&value)) {
            numbers.push_back(*number);
        } else {
            has_text = true;
        }
        distinct.insert(ValueToKey(value));
    }

    profile.distinct_count = distinct.size();
    profile.numeric = !has_text && !numbers.empty();

    if (profile.numeric) {
        const auto [lo, hi] = std::minmax_element(numbers.begin(), numbers.end());
        profile.min = *lo;
        profile.max = *hi;
        profile.mean = stats::Mean(numbers);
        profile.std_dev = stats::StdDev(numbers);
        profile.integral = std::all_of(numbers.begin(), numbers.end(),
                                       [](double v) { return std::floor(v) == v; });
    }

    auto declared = config_.column_types.find(column.name);
    if (declared != config_.column_types.end()) {
        profile.declared = true;
        if (declared->second == DeclaredType::kCategorical) {
            profile.kind = ColumnKind::kCategorical;
        } else if (profile.numeric || profile.AllNull()) {
            profile.kind = ColumnKind::kContinuous;
        } else {
            profile.type_conflict = true;
            profile.kind = ColumnKind::kCategorical;
        }
    } else {
        profile.kind = Classify(profile);
    }

    if (profile.kind != ColumnKind::kContinuous) {
        for (const auto& value : column.values) {
            if (!IsMissing(value)) {
                ++profile.frequencies[ValueToKey(value)];
            }
        }
    }

    return profile;
}

ColumnKind ColumnProfiler::Classify(const ColumnProfile& profile) const {
    if (!profile.numeric) {
        return profile.AllNull() ? ColumnKind::kContinuous : ColumnKind::kCategorical;
    }

    const double ratio = static_cast<double>(profile.distinct_count) /
                         static_cast<double>(profile.NonNullCount());
    if (ratio < config_.discrete_ratio) {
        return ColumnKind::kDiscrete;
    }
    if (profile.distinct_count <= config_.cardinality_cutoff &&
        (profile.integral || ratio <= kRepeatedValueRatio)) {
        return ColumnKind::kDiscrete;
    }
    return ColumnKind::kContinuous;
}

}  // namespace drifter::drift
