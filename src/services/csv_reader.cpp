/// @file csv_reader.cpp
/// @brief CSV reader implementation

#include "services/csv_reader.h"

#include <filesystem>
#include <fstream>
#include <unordered_set>

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace plotwise::services {

namespace {

// Reads one logical record; a quoted field may span physical lines
bool ReadRecord(std::istream& input, char quote, std::string* record) {
    record->clear();
    std::string line;
    bool in_quotes = false;
    bool any = false;

    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (any) {
            record->push_back('\n');
        }
        record->append(line);
        any = true;

        for (char c : line) {
            if (c == quote) {
                in_quotes = !in_quotes;
            }
        }
        if (!in_quotes) {
            break;
        }
    }
    return any;
}

bool ParseBool(std::string_view cell, bool* out) {
    std::string lower = absl::AsciiStrToLower(cell);
    if (lower == "true") {
        *out = true;
        return true;
    }
    if (lower == "false") {
        *out = false;
        return true;
    }
    return false;
}

}  // namespace

// ============================================================================
// Type inference
// ============================================================================

model::DataType InferColumnType(const std::vector<std::string>& cells) {
    bool all_int = true;
    bool all_float = true;
    bool all_bool = true;
    bool any_value = false;

    for (const auto& cell : cells) {
        if (cell.empty()) {
            continue;
        }
        any_value = true;

        int64_t i = 0;
        double d = 0.0;
        bool b = false;
        if (all_int && !absl::SimpleAtoi(cell, &i)) {
            all_int = false;
        }
        if (all_float && !absl::SimpleAtod(cell, &d)) {
            all_float = false;
        }
        if (all_bool && !ParseBool(cell, &b)) {
            all_bool = false;
        }
        if (!all_int && !all_float && !all_bool) {
            return model::DataType::kString;
        }
    }

    // A column with no values at all reads as float64, like an all-NaN column
    if (!any_value) {
        return model::DataType::kFloat64;
    }
    if (all_int) {
        return model::DataType::kInt64;
    }
    if (all_float) {
        return model::DataType::kFloat64;
    }
    if (all_bool) {
        return model::DataType::kBool;
    }
    return model::DataType::kString;
}

absl::StatusOr<model::Value> ParseCell(std::string_view cell, model::DataType dtype) {
    if (cell.empty()) {
        return model::Value{};
    }

    switch (dtype) {
        case model::DataType::kInt64: {
            int64_t value = 0;
            if (!absl::SimpleAtoi(cell, &value)) {
                return InvalidInputError(absl::StrCat("'", cell, "' is not an integer"));
            }
            return model::Value{value};
        }
        case model::DataType::kFloat64: {
            double value = 0.0;
            if (!absl::SimpleAtod(cell, &value)) {
                return InvalidInputError(absl::StrCat("'", cell, "' is not a number"));
            }
            return model::Value{value};
        }
        case model::DataType::kBool: {
            bool value = false;
            if (!ParseBool(cell, &value)) {
                return InvalidInputError(absl::StrCat("'", cell, "' is not a boolean"));
            }
            return model::Value{value};
        }
        case model::DataType::kString:
            return model::Value{std::string(cell)};
    }
    return InvalidInputError("Unknown column type");
}

// ============================================================================
// CsvReader
// ============================================================================

CsvReader::CsvReader(CsvOptions options) : options_(options) {}

absl::StatusOr<std::vector<std::string>> CsvReader::SplitRecord(std::string_view line) const {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;
    bool was_quoted = false;

    auto finish_field = [&]() {
        if (options_.trim_whitespace && !was_quoted) {
            field = std::string(absl::StripAsciiWhitespace(field));
        }
        fields.push_back(std::move(field));
        field.clear();
        was_quoted = false;
    };

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == options_.quote) {
                if (i + 1 < line.size() && line[i + 1] == options_.quote) {
                    field.push_back(options_.quote);
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field.push_back(c);
            }
        } else if (c == options_.quote) {
            in_quotes = true;
            was_quoted = true;
        } else if (c == options_.delimiter) {
            finish_field();
        } else {
            field.push_back(c);
        }
    }

    if (in_quotes) {
        return InvalidInputError("Unterminated quoted field");
    }
    finish_field();
    return fields;
}

absl::StatusOr<model::Table> CsvReader::Parse(std::istream& input) const {
    std::string record;
    if (!ReadRecord(input, options_.quote, &record) ||
        absl::StripAsciiWhitespace(record).empty()) {
        return InvalidInputError("CSV input is empty");
    }

    PLOTWISE_ASSIGN_OR_RETURN(std::vector<std::string> header, SplitRecord(record));
    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i].empty()) {
            return InvalidInputError(absl::StrCat("Header column ", i + 1, " has no name"));
        }
        if (!seen.insert(header[i]).second) {
            return InvalidInputError(
                absl::StrCat("Duplicate column '", header[i], "' in header"));
        }
    }

    std::vector<std::vector<std::string>> cells(header.size());
    size_t line_number = 1;
    while (ReadRecord(input, options_.quote, &record)) {
        ++line_number;
        if (absl::StripAsciiWhitespace(record).empty()) {
            continue;
        }
        PLOTWISE_ASSIGN_OR_RETURN(std::vector<std::string> fields, SplitRecord(record));
        if (fields.size() != header.size()) {
            return InvalidInputError(absl::StrCat(
                "Row ", line_number, " has ", fields.size(), " fields, expected ",
                header.size()));
        }
        for (size_t c = 0; c < fields.size(); ++c) {
            cells[c].push_back(std::move(fields[c]));
        }
    }

    model::Table table;
    for (size_t c = 0; c < header.size(); ++c) {
        model::Column column{
            .name = header[c],
            .dtype = InferColumnType(cells[c]),
        };
        column.values.reserve(cells[c].size());
        for (const auto& cell : cells[c]) {
            PLOTWISE_ASSIGN_OR_RETURN(model::Value value, ParseCell(cell, column.dtype));
            column.values.push_back(std::move(value));
        }
        PLOTWISE_RETURN_IF_ERROR(table.AddColumn(std::move(column)));
    }
    return table;
}

absl::StatusOr<model::Table> CsvReader::Read(const std::string& path) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return NotFoundError(absl::StrCat("CSV file not found: ", path));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return MakeError(ErrorCode::kIoError, absl::StrCat("Cannot open CSV file: ", path));
    }

    auto table = Parse(file);
    if (!table.ok()) {
        return absl::Status(table.status().code(),
                            absl::StrCat(path, ": ", table.status().message()));
    }
    PLOTWISE_LOG_DEBUG("Read {} rows x {} columns from {}", table->RowCount(),
                       table->ColumnCount(), path);
    return table;
}

}  // namespace plotwise::services
