#pragma once

/// @file threshold_evaluator.h
/// @brief Drift verdict and severity from a test outcome

#include <string>

#include "drift/drift_config.h"
#include "drift/drift_report.h"
#include "drift/test_executor.h"

namespace drifter::drift {

/// @brief Turns a TestOutcome into a finalized verdict
///
/// Threshold resolution order: per-column override, global threshold,
/// per-test default from the configuration, built-in DefaultThreshold().
/// A column is drifted when its score is strictly above the threshold.
///
/// Severity is bucketed on the exceedance ratio: score / threshold for
/// distance tests and alpha / p for p-value tests (alpha = 1 - threshold).
class ThresholdEvaluator {
public:
    explicit ThresholdEvaluator(DriftConfig config);

    /// @brief Threshold in effect for a column and test
    double ResolveThreshold(const std::string& column, TestKind test) const;

    /// @brief Finalize a result: threshold, drifted flag, severity and status
    TestResult Evaluate(const std::string& column, const TestOutcome& outcome) const;

    /// @brief Exceedance ratio of a score over its threshold (> 1 when drifted)
    static double ExceedanceRatio(TestKind test, double score, double threshold);

    /// @brief Severity bucket for a score
    Severity Classify(TestKind test, double score, double threshold) const;

private:
    DriftConfig config_;
};

}  // namespace drifter::drift
