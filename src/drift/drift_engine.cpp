/// @file drift_engine.cpp
/// @brief Drift engine orchestration

#include "drift/drift_engine.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <absl/strings/str_cat.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

#include "common/error.h"
#include "common/logging.h"

namespace drifter::drift {

namespace {

SampleSummary Summarize(const ColumnProfile& profile) {
    SampleSummary summary;
    summary.count = profile.count;
    summary.null_count = profile.null_count;
    summary.distinct_count = profile.distinct_count;
    summary.mean = profile.mean;
    summary.std_dev = profile.std_dev;
    summary.min = profile.min;
    summary.max = profile.max;
    return summary;
}

TestResult NotEvaluated(const std::string& column, ErrorCode code, std::string reason) {
    TestResult result;
    result.column = column;
    result.status = ColumnStatus::kNotEvaluated;
    result.reason_code = code;
    result.reason = std::move(reason);
    return result;
}

}  // namespace

std::string FormatRunTimestamp(std::chrono::system_clock::time_point time) {
    return absl::FormatTime("%Y-%m-%dT%H:%M:%SZ", absl::FromChrono(time), absl::UTCTimeZone());
}

absl::StatusOr<std::unique_ptr<DriftEngine>> DriftEngine::Create(DriftConfig config) {
    DRIFTER_RETURN_IF_ERROR(config.Validate());
    return std::make_unique<DriftEngine>(Passkey(), std::move(config));
}

DriftEngine::DriftEngine(Passkey, DriftConfig config)
    : config_(std::move(config)),
      profiler_(config_.profiling),
      selector_(config_.tests),
      executor_(config_),
      evaluator_(config_),
      aggregator_(config_.aggregation) {
    if (config_.num_threads != 1) {
        pool_ = std::make_unique<ThreadPool>(config_.num_threads);
    }
}

DriftEngine::~DriftEngine() = default;

absl::StatusOr<DriftReport> DriftEngine::Compare(const Dataset& reference,
                                                 const Dataset& current) const {
    return Compare(reference, current, std::chrono::system_clock::now());
}

absl::StatusOr<DriftReport> DriftEngine::Compare(
    const Dataset& reference,
    const Dataset& current,
    std::chrono::system_clock::time_point run_time) const {

    std::vector<std::string> requested = config_.columns;
    if (requested.empty()) {
        requested = reference.ColumnNames();
        for (const auto& name : current.ColumnNames()) {
            if (reference.FindColumn(name) == nullptr) {
                requested.push_back(name);
            }
        }
    }

    DRIFTER_LOG_INFO("Drift check '{}' ({} rows) vs '{}' ({} rows), {} columns",
                     reference.Name(), reference.RowCount(),
                     current.Name(), current.RowCount(), requested.size());

    if (reference.RowCount() < config_.small_sample_warning_rows ||
        current.RowCount() < config_.small_sample_warning_rows) {
        DRIFTER_LOG_WARN("Small datasets (reference={}, current={}, recommended >= {}); "
                         "some statistics may be unreliable",
                         reference.RowCount(), current.RowCount(),
                         config_.small_sample_warning_rows);
    }

    std::vector<SchemaMismatch> mismatches;
    std::vector<std::pair<const Column*, const Column*>> pairs;

    for (const auto& name : requested) {
        const Column* ref_column = reference.FindColumn(name);
        const Column* cur_column = current.FindColumn(name);

        if (ref_column == nullptr || cur_column == nullptr) {
            absl::Status status;
            if (ref_column == nullptr && cur_column == nullptr) {
                status = SchemaMismatchError("column is missing from both datasets");
            } else if (ref_column == nullptr) {
                status = SchemaMismatchError(absl::StrCat(
                    "column is missing from reference dataset '", reference.Name(), "'"));
            } else {
                status = SchemaMismatchError(absl::StrCat(
                    "column is missing from current dataset '", current.Name(), "'"));
            }

            SchemaMismatch mismatch;
            mismatch.column = name;
            mismatch.in_reference = ref_column != nullptr;
            mismatch.in_current = cur_column != nullptr;
            mismatch.reason_code = GetErrorCode(status);
            mismatch.reason = std::string(status.message());
            DRIFTER_LOG_WARN("Column '{}' not evaluated: {}", name, mismatch.reason);
            mismatches.push_back(std::move(mismatch));
            continue;
        }
        pairs.emplace_back(ref_column, cur_column);
    }

    // Scatter one task per column pair, gather in request order
    auto evaluate = [this](const std::pair<const Column*, const Column*>& pair) {
        return EvaluateColumn(*pair.first, *pair.second);
    };
    std::vector<TestResult> results;
    if (pool_) {
        results = pool_->MapOrdered(pairs, evaluate);
    } else {
        results.reserve(pairs.size());
        for (const auto& pair : pairs) {
            results.push_back(evaluate(pair));
        }
    }

    RunMetadata metadata;
    metadata.reference_name = reference.Name();
    metadata.current_name = current.Name();
    metadata.reference_rows = reference.RowCount();
    metadata.current_rows = current.RowCount();
    metadata.run_timestamp = FormatRunTimestamp(run_time);
    metadata.requested_columns = std::move(requested);

    DriftReport report = aggregator_.Aggregate(std::move(metadata), std::move(results),
                                               std::move(mismatches));

    DRIFTER_LOG_INFO("Drift check finished: {}/{} evaluated columns drifted, "
                     "{} not evaluated, overall drift={}",
                     report.drifted_count, report.evaluated_count,
                     report.not_evaluated_count, report.overall_drift);
    return report;
}

TestResult DriftEngine::EvaluateColumn(const Column& reference, const Column& current) const {
    const ColumnProfile ref_profile = profiler_.Profile(reference);
    const ColumnProfile cur_profile = profiler_.Profile(current);

    if (ref_profile.type_conflict || cur_profile.type_conflict) {
        DRIFTER_LOG_WARN("Column '{}' is declared numeric but holds non-numeric values; "
                         "treating it as categorical", reference.name);
    }

    const TestPlan plan = selector_.Select(ref_profile, cur_profile);

    TestResult result;
    if (plan.IsSkip()) {
        result = NotEvaluated(reference.name, plan.skip_code, plan.skip_reason);
        result.test = plan.test;
    } else {
        auto outcome = executor_.Run(plan, reference, current);
        if (outcome.ok()) {
            result = evaluator_.Evaluate(reference.name, *outcome);
        } else {
            result = NotEvaluated(reference.name, GetErrorCode(outcome.status()),
                                  std::string(outcome.status().message()));
            result.test = plan.test;
        }
    }

    result.kind = plan.kind;
    result.reference = Summarize(ref_profile);
    result.current = Summarize(cur_profile);
    result.ranges_overlap = RangesOverlap(ref_profile, cur_profile);

    if (result.IsEvaluated()) {
        DRIFTER_LOG_DEBUG("Column '{}': {} score={:.4f} threshold={:.4f} drifted={} severity={}",
                          result.column, TestKindToString(*result.test), result.score,
                          result.threshold, result.drifted, SeverityToString(result.severity));
    } else {
        DRIFTER_LOG_WARN("Column '{}' not evaluated ({}): {}", result.column,
                         ErrorCodeToString(result.reason_code), result.reason);
    }
    return result;
}

}  // namespace drifter::drift
