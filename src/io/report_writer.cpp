/// @file report_writer.cpp
/// @brief Report rendering implementation

#include "io/report_writer.h"

#include <fstream>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

#include "common/error.h"
#include "common/logging.h"

namespace drifter::io {

namespace {

template <typename T>
nlohmann::json OptionalToJson(const std::optional<T>& value) {
    if (value.has_value()) {
        return *value;
    }
    return nullptr;
}

nlohmann::json SummaryToJson(const drift::SampleSummary& summary) {
    nlohmann::json j;
    j["count"] = summary.count;
    j["null_count"] = summary.null_count;
    j["distinct_count"] = summary.distinct_count;
    j["mean"] = OptionalToJson(summary.mean);
    j["std_dev"] = OptionalToJson(summary.std_dev);
    j["min"] = OptionalToJson(summary.min);
    j["max"] = OptionalToJson(summary.max);
    return j;
}

nlohmann::json ResultToJson(const drift::TestResult& result) {
    nlohmann::json j;
    j["column"] = result.column;
    j["status"] = std::string(drift::ColumnStatusToString(result.status));
    j["kind"] = std::string(drift::ColumnKindToString(result.kind));
    if (result.test.has_value()) {
        j["test"] = std::string(drift::TestKindToString(*result.test));
    } else {
        j["test"] = nullptr;
    }

    if (result.IsEvaluated()) {
        j["statistic"] = result.statistic;
        j["p_value"] = OptionalToJson(result.p_value);
        j["score"] = result.score;
        j["threshold"] = result.threshold;
        j["drifted"] = result.drifted;
        j["severity"] = std::string(drift::SeverityToString(result.severity));
    } else {
        j["reason_code"] = std::string(ErrorCodeToString(result.reason_code));
        j["reason"] = result.reason;
    }

    j["reference"] = SummaryToJson(result.reference);
    j["current"] = SummaryToJson(result.current);
    j["ranges_overlap"] = result.ranges_overlap;
    return j;
}

std::string FormatNumber(double value) {
    return absl::StrFormat("%.4f", value);
}

}  // namespace

nlohmann::json ReportToJson(const drift::DriftReport& report) {
    nlohmann::json j;
    j["reference"]["name"] = report.reference_name;
    j["reference"]["rows"] = report.reference_rows;
    j["current"]["name"] = report.current_name;
    j["current"]["rows"] = report.current_rows;
    j["run_timestamp"] = report.run_timestamp;
    j["requested_columns"] = report.requested_columns;

    j["columns"] = nlohmann::json::array();
    for (const auto& result : report.results) {
        j["columns"].push_back(ResultToJson(result));
    }

    j["schema_mismatches"] = nlohmann::json::array();
    for (const auto& mismatch : report.schema_mismatches) {
        nlohmann::json m;
        m["column"] = mismatch.column;
        m["in_reference"] = mismatch.in_reference;
        m["in_current"] = mismatch.in_current;
        m["reason_code"] = std::string(ErrorCodeToString(mismatch.reason_code));
        m["reason"] = mismatch.reason;
        j["schema_mismatches"].push_back(m);
    }

    auto& summary = j["summary"];
    summary["rule"] = std::string(drift::AggregationRuleToString(report.rule));
    summary["fraction_limit"] = report.fraction_limit;
    summary["include_not_evaluated"] = report.include_not_evaluated;
    summary["evaluated_count"] = report.evaluated_count;
    summary["drifted_count"] = report.drifted_count;
    summary["not_evaluated_count"] = report.not_evaluated_count;
    summary["drifted_fraction"] = report.drifted_fraction;
    summary["overall_drift"] = report.overall_drift;
    return j;
}

std::string ReportToJsonString(const drift::DriftReport& report, int indent) {
    return ReportToJson(report).dump(indent);
}

absl::Status WriteJsonReport(const drift::DriftReport& report, const std::string& path) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        return NotFoundError(absl::StrCat("Cannot open report file for writing: ", path));
    }

    file << ReportToJsonString(report) << '\n';
    file.flush();
    if (!file.good()) {
        return MakeError(ErrorCode::kDataLoss, absl::StrCat("Failed writing report file: ", path));
    }

    DRIFTER_LOG_INFO("Wrote drift report to {}", path);
    return absl::OkStatus();
}

std::string RenderTable(const drift::DriftReport& report) {
    std::string out = absl::StrFormat("Drift report: %s (%d rows) vs %s (%d rows) at %s\n\n",
                                      report.reference_name, report.reference_rows,
                                      report.current_name, report.current_rows,
                                      report.run_timestamp);

    absl::StrAppendFormat(&out, "%-24s %-14s %-14s %10s %10s %10s  %-8s %s\n",
                          "column", "kind", "test", "score", "threshold", "p_value",
                          "severity", "status");

    for (const auto& column : report.requested_columns) {
        if (const auto* result = report.FindResult(column)) {
            const std::string test =
                result->test ? std::string(drift::TestKindToString(*result->test)) : "-";
            if (result->IsEvaluated()) {
                absl::StrAppendFormat(
                    &out, "%-24s %-14s %-14s %10s %10s %10s  %-8s %s\n",
                    result->column, drift::ColumnKindToString(result->kind), test,
                    FormatNumber(result->score), FormatNumber(result->threshold),
                    result->p_value ? FormatNumber(*result->p_value) : "-",
                    drift::SeverityToString(result->severity),
                    drift::ColumnStatusToString(result->status));
            } else {
                absl::StrAppendFormat(
                    &out, "%-24s %-14s %-14s %10s %10s %10s  %-8s %s (%s: %s)\n",
                    result->column, drift::ColumnKindToString(result->kind), test,
                    "-", "-", "-", "-", drift::ColumnStatusToString(result->status),
                    ErrorCodeToString(result->reason_code), result->reason);
            }
            continue;
        }
        for (const auto& mismatch : report.schema_mismatches) {
            if (mismatch.column == column) {
                absl::StrAppendFormat(&out, "%-24s %-14s %-14s %10s %10s %10s  %-8s %s (%s)\n",
                                      column, "-", "-", "-", "-", "-", "-",
                                      ErrorCodeToString(mismatch.reason_code), mismatch.reason);
                break;
            }
        }
    }

    absl::StrAppendFormat(&out,
                          "\n%d of %d evaluated columns drifted (%.1f%%), %d not evaluated, "
                          "rule=%s\n",
                          report.drifted_count, report.evaluated_count,
                          report.drifted_fraction * 100.0, report.not_evaluated_count,
                          drift::AggregationRuleToString(report.rule));
    absl::StrAppendFormat(&out, "Overall drift: %s\n", report.overall_drift ? "YES" : "no");
    return out;
}

}  // namespace drifter::io
