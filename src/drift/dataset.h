#pragma once

/// @file dataset.h
/// @brief Immutable columnar dataset compared by the drift engine

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <absl/status/statusor.h>

namespace drifter::drift {

/// @brief A single cell: missing, numeric, or free-form text
using Value = std::variant<std::monostate, double, std::string>;

/// @brief Missing marker
inline bool IsMissing(const Value& value) {
    return std::holds_alternative<std::monostate>(value);
}

inline bool IsNumber(const Value& value) {
    return std::holds_alternative<double>(value);
}

/// @brief Render a cell as a category key. Numbers use the shortest
///        round-trip form so that 1 and 1.0 share a category.
std::string ValueToKey(const Value& value);

/// @brief A named column of cells
struct Column {
    std::string name;
    std::vector<Value> values;
};

/// @brief An immutable, named collection of equal-length columns
///
/// Column order is the insertion order given to Create() and is preserved
/// by every accessor.
class Dataset {
public:
    /// @brief Build a dataset, validating unique names and equal lengths
    static absl::StatusOr<Dataset> Create(std::string name, std::vector<Column> columns);

    const std::string& Name() const { return name_; }

    size_t RowCount() const { return row_count_; }

    size_t ColumnCount() const { return columns_.size(); }

    /// @brief Column names in insertion order
    std::vector<std::string> ColumnNames() const;

    /// @brief Whether a column with the given name exists
    bool HasColumn(std::string_view name) const;

    /// @brief Find a column by name; nullptr if absent
    const Column* FindColumn(std::string_view name) const;

    const std::vector<Column>& Columns() const { return columns_; }

private:
    Dataset() = default;

    std::string name_;
    size_t row_count_ = 0;
    std::vector<Column> columns_;
    std::unordered_map<std::string, size_t> index_;
};

}  // namespace drifter::drift
