#pragma once

/// @file csv_reader.h
/// @brief Delimited text import with per-column type inference

#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

#include "model/table.h"

namespace plotwise::services {

/// @brief CSV reader configuration
struct CsvOptions {
    char delimiter = ',';
    char quote = '"';
    /// Strip spaces and tabs around unquoted fields
    bool trim_whitespace = true;
};

/// @brief Reads a header line plus data rows into a typed table
///
/// Each column is typed by the narrowest type that fits every non-empty
/// cell, tried in the order int64, float64, bool ("true"/"false", any case),
/// string. Empty cells are missing values.
class CsvReader {
public:
    explicit CsvReader(CsvOptions options = {});

    /// @brief Read a file; NotFound if it does not exist
    absl::StatusOr<model::Table> Read(const std::string& path) const;

    /// @brief Parse CSV text from a stream
    ///
    /// InvalidArgument for a missing header, duplicate or empty column
    /// names, ragged rows or an unterminated quote.
    absl::StatusOr<model::Table> Parse(std::istream& input) const;

    /// @brief Split one record into fields, honouring quotes
    absl::StatusOr<std::vector<std::string>> SplitRecord(std::string_view line) const;

private:
    CsvOptions options_;
};

/// @brief Narrowest type accepting every non-empty cell
model::DataType InferColumnType(const std::vector<std::string>& cells);

/// @brief Convert one cell to a value of dtype; empty cells become missing
absl::StatusOr<model::Value> ParseCell(std::string_view cell, model::DataType dtype);

}  // namespace plotwise::services
