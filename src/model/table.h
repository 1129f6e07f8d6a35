#pragma once

/// @file table.h
/// @brief In-memory tabular data: typed, equal-length named columns

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

namespace plotwise::model {

/// @brief A single cell; std::monostate marks a missing value
using Value = std::variant<std::monostate, int64_t, double, bool, std::string>;

/// @brief Column element type
enum class DataType {
    kInt64,
    kFloat64,
    kBool,
    kString
};

std::string ToString(DataType dtype);
absl::StatusOr<DataType> ParseDataType(std::string_view name);

/// @brief True for int64, float64 and bool columns
bool IsNumeric(DataType dtype);

/// @brief Default cell for a new row: 0, 0.0, false or ""
Value DefaultValueFor(DataType dtype);

/// @brief Infer a column type from a single value (missing infers float64)
DataType InferDataType(const Value& value);

bool IsMissing(const Value& value);

/// @brief Render a cell for display; missing renders as "NaN"
std::string FormatValue(const Value& value);

/// @brief Named, typed column
struct Column {
    std::string name;
    DataType dtype = DataType::kFloat64;
    std::vector<Value> values;
};

/// @brief Ordered collection of equal-length columns
///
/// Tables are plain values: copying one is how commands snapshot state.
class Table {
public:
    Table() = default;

    size_t RowCount() const;
    size_t ColumnCount() const { return columns_.size(); }
    bool Empty() const { return columns_.empty() || RowCount() == 0; }

    std::vector<std::string> ColumnNames() const;
    bool HasColumn(std::string_view name) const;

    /// @brief Column by name, or nullptr
    const Column* GetColumn(std::string_view name) const;
    const std::vector<Column>& Columns() const { return columns_; }

    /// @brief Append a column; fails on a duplicate name or a length mismatch
    absl::Status AddColumn(Column column);

    /// @brief Replace the named column in place, or append it if absent
    absl::Status SetColumn(Column column);

    /// @brief Remove a column; NotFound if absent
    absl::Status DropColumn(std::string_view name);

    /// @brief Insert a row before position (appends when position >= RowCount)
    ///
    /// row must hold one value per column, in column order.
    absl::Status InsertRow(size_t position, std::vector<Value> row);

    /// @brief Column values as doubles; missing and non-finite cells become NaN
    ///
    /// Fails with InvalidArgument for a string column.
    absl::StatusOr<std::vector<double>> NumericValues(std::string_view name) const;

    /// @brief True if any column holds numeric data
    bool HasNumericColumn() const;

    bool operator==(const Table& other) const;
    bool operator!=(const Table& other) const { return !(*this == other); }

private:
    std::vector<Column>::iterator Find(std::string_view name);

    std::vector<Column> columns_;
};

bool operator==(const Column& lhs, const Column& rhs);

}  // namespace plotwise::model
