#pragma once

/// @file report_writer.h
/// @brief JSON and plain-text rendering of drift reports

#include <string>

#include <absl/status/status.h>
#include <nlohmann/json.hpp>

#include "drift/drift_report.h"

namespace drifter::io {

/// @brief Convert a report to JSON
///
/// Column order follows the report. Absent optional values are null.
nlohmann::json ReportToJson(const drift::DriftReport& report);

/// @brief Serialize a report; indent < 0 produces a single line
std::string ReportToJsonString(const drift::DriftReport& report, int indent = 2);

/// @brief Write the JSON form of a report to a file
absl::Status WriteJsonReport(const drift::DriftReport& report, const std::string& path);

/// @brief Render a fixed-width table with one line per requested column
///        followed by the overall verdict
std::string RenderTable(const drift::DriftReport& report);

}  // namespace drifter::io
