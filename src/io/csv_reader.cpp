/// @file csv_reader.cpp
/// @brief CSV loading implementation

#include "io/csv_reader.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace drifter::io {

CsvReader::CsvReader(CsvOptions options)
    : options_(std::move(options)) {}

absl::StatusOr<drift::Dataset> CsvReader::ReadFile(const std::string& path,
                                                   std::string name) const {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return NotFoundError(absl::StrCat("Cannot open CSV file: ", path));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return MakeError(ErrorCode::kDataLoss, absl::StrCat("Failed reading CSV file: ", path));
    }

    if (name.empty()) {
        name = std::filesystem::path(path).stem().string();
    }

    DRIFTER_LOG_DEBUG("Loading dataset '{}' from {}", name, path);
    return ReadString(buffer.str(), std::move(name));
}

absl::StatusOr<drift::Dataset> CsvReader::ReadString(std::string_view text,
                                                     std::string name) const {
    DRIFTER_ASSIGN_OR_RETURN(auto records, Tokenize(text));
    if (records.empty()) {
        return InvalidArgumentError(absl::StrCat("Dataset '", name, "': CSV has no header row"));
    }

    const auto& header = records.front();
    std::vector<drift::Column> columns(header.size());
    for (size_t i = 0; i < header.size(); ++i) {
        columns[i].name = header[i].quoted
            ? header[i].text
            : std::string(absl::StripAsciiWhitespace(header[i].text));
        columns[i].values.reserve(records.size() - 1);
    }

    for (size_t row = 1; row < records.size(); ++row) {
        const auto& record = records[row];
        if (record.size() != header.size()) {
            return InvalidArgumentError(
                absl::StrCat("Dataset '", name, "': data row ", row, " has ", record.size(),
                             " cells, header has ", header.size()));
        }
        for (size_t i = 0; i < record.size(); ++i) {
            columns[i].values.push_back(ParseCell(record[i].text, record[i].quoted));
        }
    }

    DRIFTER_LOG_DEBUG("Parsed dataset '{}': {} columns, {} rows",
                      name, columns.size(), records.size() - 1);
    return drift::Dataset::Create(std::move(name), std::move(columns));
}

drift::Value CsvReader::ParseCell(std::string_view cell, bool quoted) const {
    std::string_view text = cell;
    if (!quoted && options_.trim_whitespace) {
        const absl::string_view stripped =
            absl::StripAsciiWhitespace(absl::string_view(text.data(), text.size()));
        text = std::string_view(stripped.data(), stripped.size());
    }

    if (IsMissingMarker(text)) {
        return std::monostate{};
    }

    double number = 0.0;
    if (absl::SimpleAtod(absl::string_view(text.data(), text.size()), &number)) {
        if (!std::isfinite(number)) {
            return std::monostate{};
        }
        return number;
    }
    return std::string(text);
}

bool CsvReader::IsMissingMarker(std::string_view cell) const {
    return std::find(options_.missing_markers.begin(), options_.missing_markers.end(), cell) !=
           options_.missing_markers.end();
}

absl::StatusOr<std::vector<std::vector<CsvReader::RawCell>>> CsvReader::Tokenize(
    std::string_view text) const {

    std::vector<std::vector<RawCell>> records;
    std::vector<RawCell> record;
    RawCell cell;
    bool in_quotes = false;
    size_t line = 1;
    size_t quote_line = 0;

    auto finish_record = [&]() {
        record.push_back(std::move(cell));
        cell = RawCell{};
        // Blank lines are skipped
        bool blank = record.size() == 1 && !record[0].quoted &&
                     absl::StripAsciiWhitespace(record[0].text).empty();
        if (!blank) {
            records.push_back(std::move(record));
        }
        record.clear();
    };

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];

        if (in_quotes) {
            if (c == options_.quote) {
                if (i + 1 < text.size() && text[i + 1] == options_.quote) {
                    cell.text.push_back(c);
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n') {
                    ++line;
                }
                cell.text.push_back(c);
            }
            continue;
        }

        if (c == options_.quote && !cell.quoted &&
            absl::StripAsciiWhitespace(cell.text).empty()) {
            cell.text.clear();
            cell.quoted = true;
            in_quotes = true;
            quote_line = line;
        } else if (c == options_.delimiter) {
            record.push_back(std::move(cell));
            cell = RawCell{};
        } else if (c == '\n') {
            finish_record();
            ++line;
        } else if (c != '\r') {
            cell.text.push_back(c);
        }
    }

    if (in_quotes) {
        return MakeError(ErrorCode::kParseError,
                         absl::StrCat("Unterminated quoted field starting on line ", quote_line));
    }
    if (!record.empty() || !cell.text.empty() || cell.quoted) {
        finish_record();
    }
    return records;
}

}  // namespace drifter::io
