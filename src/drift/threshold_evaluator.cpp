/// @file threshold_evaluator.cpp
/// @brief Threshold evaluator implementation

#include "drift/threshold_evaluator.h"

#include <algorithm>
#include <limits>
#include <utility>

namespace drifter::drift {

namespace {

// Smallest p-value used when computing alpha / p
constexpr double kMinPValue = 1e-300;

}  // namespace

ThresholdEvaluator::ThresholdEvaluator(DriftConfig config)
    : config_(std::move(config)) {}

double ThresholdEvaluator::ResolveThreshold(const std::string& column, TestKind test) const {
    auto column_it = config_.thresholds.per_column.find(column);
    if (column_it != config_.thresholds.per_column.end()) {
        return column_it->second;
    }
    if (config_.thresholds.global.has_value()) {
        return *config_.thresholds.global;
    }
    auto test_it = config_.thresholds.per_test.find(test);
    if (test_it != config_.thresholds.per_test.end()) {
        return test_it->second;
    }
    return DefaultThreshold(test);
}

double ThresholdEvaluator::ExceedanceRatio(TestKind test, double score, double threshold) {
    if (ScoreKindOf(test) == ScoreKind::kPValue) {
        const double alpha = 1.0 - threshold;
        const double p_value = std::max(1.0 - score, kMinPValue);
        return alpha / p_value;
    }
    if (threshold <= 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    return score / threshold;
}

Severity ThresholdEvaluator::Classify(TestKind test, double score, double threshold) const {
    if (!(score > threshold)) {
        return Severity::kNone;
    }
    const double ratio = ExceedanceRatio(test, score, threshold);
    if (ratio < config_.severity.medium_ratio) {
        return Severity::kLow;
    }
    if (ratio < config_.severity.high_ratio) {
        return Severity::kMedium;
    }
    return Severity::kHigh;
}

TestResult ThresholdEvaluator::Evaluate(const std::string& column,
                                        const TestOutcome& outcome) const {
    TestResult result;
    result.column = column;
    result.test = outcome.test;
    result.statistic = outcome.statistic;
    result.p_value = outcome.p_value;
    result.score = outcome.score;
    result.threshold = ResolveThreshold(column, outcome.test);
    result.drifted = result.score > result.threshold;
    result.severity = Classify(outcome.test, result.score, result.threshold);
    result.status = result.drifted ? ColumnStatus::kDrifted : ColumnStatus::kNotDrifted;
    return result;
}

}  // namespace drifter::drift
