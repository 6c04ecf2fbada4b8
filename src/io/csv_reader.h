#pragma once

/// @file csv_reader.h
/// @brief Loads delimited text files into drift datasets

#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

#include "drift/dataset.h"

namespace drifter::io {

/// @brief CSV parsing options
struct CsvOptions {
    char delimiter = ',';
    char quote = '"';

    /// Cells equal to one of these (after trimming) are missing
    std::vector<std::string> missing_markers = {"", "NA", "NaN", "nan", "null", "None"};

    /// Strip surrounding whitespace from unquoted cells
    bool trim_whitespace = true;
};

/// @brief Reads a header row plus data rows into a Dataset
///
/// Cells that parse completely as finite numbers become numeric values;
/// everything else is kept as text. Quoted cells may contain the delimiter,
/// doubled quotes and line breaks. Rows with a different cell count than
/// the header are rejected.
class CsvReader {
public:
    explicit CsvReader(CsvOptions options = {});

    /// @brief Read a file; the dataset is named after the file name unless
    ///        a name is given
    absl::StatusOr<drift::Dataset> ReadFile(const std::string& path,
                                            std::string name = "") const;

    /// @brief Parse in-memory CSV text
    absl::StatusOr<drift::Dataset> ReadString(std::string_view text, std::string name) const;

    /// @brief Convert one raw cell to a value
    drift::Value ParseCell(std::string_view cell, bool quoted) const;

    const CsvOptions& GetOptions() const { return options_; }

private:
    struct RawCell {
        std::string text;
        bool quoted = false;
    };

    /// Splits text into records, honoring quotes
    absl::StatusOr<std::vector<std::vector<RawCell>>> Tokenize(std::string_view text) const;

    bool IsMissingMarker(std::string_view cell) const;

    CsvOptions options_;
};

}  // namespace drifter::io
