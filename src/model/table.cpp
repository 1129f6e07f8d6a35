#include "model/table.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

namespace plotwise::model {

std::string ToString(DataType dtype) {
    switch (dtype) {
        case DataType::kInt64: return "int64";
        case DataType::kFloat64: return "float64";
        case DataType::kBool: return "bool";
        case DataType::kString: return "string";
    }
    return "string";
}

absl::StatusOr<DataType> ParseDataType(std::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(name);
    if (lowered == "int64") return DataType::kInt64;
    if (lowered == "float64") return DataType::kFloat64;
    if (lowered == "bool") return DataType::kBool;
    if (lowered == "string" || lowered == "object") return DataType::kString;
    return absl::InvalidArgumentError(absl::StrCat("Unknown column dtype: ", name));
}

bool IsNumeric(DataType dtype) {
    return dtype != DataType::kString;
}

Value DefaultValueFor(DataType dtype) {
    switch (dtype) {
        case DataType::kInt64: return int64_t{0};
        case DataType::kFloat64: return 0.0;
        case DataType::kBool: return false;
        case DataType::kString: return std::string();
    }
    return std::monostate{};
}

DataType InferDataType(const Value& value) {
    if (std::holds_alternative<int64_t>(value)) return DataType::kInt64;
    if (std::holds_alternative<bool>(value)) return DataType::kBool;
    if (std::holds_alternative<std::string>(value)) return DataType::kString;
    return DataType::kFloat64;
}

bool IsMissing(const Value& value) {
    return std::holds_alternative<std::monostate>(value);
}

std::string FormatValue(const Value& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "NaN";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            return absl::StrCat(v);
        }
    }, value);
}

bool operator==(const Column& lhs, const Column& rhs) {
    if (lhs.name != rhs.name || lhs.dtype != rhs.dtype ||
        lhs.values.size() != rhs.values.size()) {
        return false;
    }
    for (size_t i = 0; i < lhs.values.size(); ++i) {
        const auto* a = std::get_if<double>(&lhs.values[i]);
        const auto* b = std::get_if<double>(&rhs.values[i]);
        if (a && b && std::isnan(*a) && std::isnan(*b)) {
            continue;
        }
        if (lhs.values[i] != rhs.values[i]) {
            return false;
        }
    }
    return true;
}

// =============================================================================
// Table
// =============================================================================

size_t Table::RowCount() const {
    return columns_.empty() ? 0 : columns_.front().values.size();
}

std::vector<std::string> Table::ColumnNames() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& column : columns_) {
        names.push_back(column.name);
    }
    return names;
}

bool Table::HasColumn(std::string_view name) const {
    return GetColumn(name) != nullptr;
}

const Column* Table::GetColumn(std::string_view name) const {
    auto it = std::find_if(columns_.begin(), columns_.end(),
                           [name](const Column& c) { return c.name == name; });
    return it == columns_.end() ? nullptr : &*it;
}

std::vector<Column>::iterator Table::Find(std::string_view name) {
    return std::find_if(columns_.begin(), columns_.end(),
                        [name](const Column& c) { return c.name == name; });
}

absl::Status Table::AddColumn(Column column) {
    if (column.name.empty()) {
        return absl::InvalidArgumentError("Column name cannot be empty");
    }
    if (HasColumn(column.name)) {
        return absl::AlreadyExistsError(
            absl::StrCat("Column '", column.name, "' already exists"));
    }
    if (!columns_.empty() && column.values.size() != RowCount()) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Column '", column.name, "' has ", column.values.size(),
            " values, table has ", RowCount(), " rows"));
    }
    columns_.push_back(std::move(column));
    return absl::OkStatus();
}

absl::Status Table::SetColumn(Column column) {
    auto it = Find(column.name);
    if (it == columns_.end()) {
        return AddColumn(std::move(column));
    }
    if (column.values.size() != RowCount()) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Column '", column.name, "' has ", column.values.size(),
            " values, table has ", RowCount(), " rows"));
    }
    *it = std::move(column);
    return absl::OkStatus();
}

absl::Status Table::DropColumn(std::string_view name) {
    auto it = Find(name);
    if (it == columns_.end()) {
        return absl::NotFoundError(absl::StrCat("Column '", name, "' not found"));
    }
    columns_.erase(it);
    return absl::OkStatus();
}

absl::Status Table::InsertRow(size_t position, std::vector<Value> row) {
    if (row.size() != columns_.size()) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Row has ", row.size(), " values, table has ", columns_.size(), " columns"));
    }
    const size_t at = std::min(position, RowCount());
    for (size_t c = 0; c < columns_.size(); ++c) {
        auto& values = columns_[c].values;
        values.insert(values.begin() + static_cast<std::ptrdiff_t>(at), std::move(row[c]));
    }
    return absl::OkStatus();
}

absl::StatusOr<std::vector<double>> Table::NumericValues(std::string_view name) const {
    const Column* column = GetColumn(name);
    if (column == nullptr) {
        return absl::NotFoundError(absl::StrCat("Column '", name, "' not found"));
    }
    if (!IsNumeric(column->dtype)) {
        return absl::InvalidArgumentError(
            absl::StrCat("Column '", name, "' is not numeric"));
    }

    std::vector<double> result;
    result.reserve(column->values.size());
    for (const auto& value : column->values) {
        if (const auto* i = std::get_if<int64_t>(&value)) {
            result.push_back(static_cast<double>(*i));
        } else if (const auto* d = std::get_if<double>(&value)) {
            result.push_back(*d);
        } else if (const auto* b = std::get_if<bool>(&value)) {
            result.push_back(*b ? 1.0 : 0.0);
        } else {
            result.push_back(std::numeric_limits<double>::quiet_NaN());
        }
    }
    return result;
}

bool Table::HasNumericColumn() const {
    return std::any_of(columns_.begin(), columns_.end(),
                       [](const Column& c) { return IsNumeric(c.dtype); });
}

bool Table::operator==(const Table& other) const {
    return columns_ == other.columns_;
}

}  // namespace plotwise::model
