/// @file dataset.cpp
/// @brief Dataset construction and lookup

#include "drift/dataset.h"

#include <charconv>

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace drifter::drift {

std::string ValueToKey(const Value& value) {
    if (const auto* number = std::get_if<double>(&value)) {
        char buffer[64];
        auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), *number);
        if (ec == std::errc()) {
            return std::string(buffer, end);
        }
        return std::to_string(*number);
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        return *text;
    }
    return {};
}

absl::StatusOr<Dataset> Dataset::Create(std::string name, std::vector<Column> columns) {
    Dataset dataset;
    dataset.name_ = std::move(name);

    for (size_t i = 0; i < columns.size(); ++i) {
        const auto& column = columns[i];
        if (column.name.empty()) {
            return InvalidArgumentError(
                absl::StrCat("Dataset '", dataset.name_, "': column ", i, " has an empty name"));
        }
        if (!dataset.index_.emplace(column.name, i).second) {
            return InvalidArgumentError(
                absl::StrCat("Dataset '", dataset.name_, "': duplicate column '", column.name, "'"));
        }
        if (i == 0) {
            dataset.row_count_ = column.values.size();
        } else if (column.values.size() != dataset.row_count_) {
            return InvalidArgumentError(
                absl::StrCat("Dataset '", dataset.name_, "': column '", column.name, "' has ",
                             column.values.size(), " rows, expected ", dataset.row_count_));
        }
    }

    dataset.columns_ = std::move(columns);
    return dataset;
}

std::vector<std::string> Dataset::ColumnNames() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& column : columns_) {
        names.push_back(column.name);
    }
    return names;
}

bool Dataset::HasColumn(std::string_view name) const {
    return index_.find(std::string(name)) != index_.end();
}

const Column* Dataset::FindColumn(std::string_view name) const {
    auto it = index_.find(std::string(name));
    if (it == index_.end()) {
        return nullptr;
    }
    return &columns_[it->second];
}

}  // namespace drifter::drift
