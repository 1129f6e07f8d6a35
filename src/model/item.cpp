/// @file item.cpp
/// @brief Project tree item implementation and JSON mapping

#include "model/item.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <random>
#include <sstream>

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace plotwise::model {

using json = nlohmann::json;

namespace {

int64_t ToEpochMillis(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()).count();
}

Timestamp FromEpochMillis(int64_t millis) {
    return Timestamp(std::chrono::milliseconds(millis));
}

}  // namespace

std::string ToString(ItemType type) {
    switch (type) {
        case ItemType::kFolder: return "folder";
        case ItemType::kDataset: return "dataset";
        case ItemType::kChart: return "chart";
        case ItemType::kNote: return "note";
    }
    return "item";
}

absl::StatusOr<ItemType> ParseItemType(std::string_view name) {
    if (name == "folder") return ItemType::kFolder;
    if (name == "dataset") return ItemType::kDataset;
    if (name == "chart") return ItemType::kChart;
    if (name == "note") return ItemType::kNote;
    return absl::InvalidArgumentError(absl::StrCat("Unknown item type: ", name));
}

std::string GenerateItemId(ItemType type) {
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    static std::uniform_int_distribution<uint64_t> dis;

    std::ostringstream id;
    id << ToString(type) << "-" << std::hex << std::setw(16) << std::setfill('0') << dis(gen);
    return id.str();
}

// =============================================================================
// Item
// =============================================================================

Item::Item(std::string id, std::string name)
    : id_(std::move(id)),
      name_(std::move(name)),
      created_at_(std::chrono::system_clock::now()),
      modified_at_(created_at_) {}

void Item::SetName(std::string name) {
    name_ = std::move(name);
    Touch();
}

void Item::Touch() {
    modified_at_ = std::chrono::system_clock::now();
}

json Item::ToJson() const {
    json j;
    j["id"] = id_;
    j["name"] = name_;
    j["type"] = ToString(Type());
    j["parent_id"] = parent_id_.empty() ? json(nullptr) : json(parent_id_);
    j["created_at"] = ToEpochMillis(created_at_);
    j["modified_at"] = ToEpochMillis(modified_at_);
    j["metadata"] = metadata_;
    return j;
}

void Item::LoadCommonFields(const json& j) {
    if (j.contains("parent_id") && j["parent_id"].is_string()) {
        parent_id_ = j["parent_id"].get<std::string>();
    }
    if (j.contains("created_at") && j["created_at"].is_number_integer()) {
        created_at_ = FromEpochMillis(j["created_at"].get<int64_t>());
    }
    modified_at_ = created_at_;
    if (j.contains("modified_at") && j["modified_at"].is_number_integer()) {
        modified_at_ = FromEpochMillis(j["modified_at"].get<int64_t>());
    }
    if (j.contains("metadata") && j["metadata"].is_object()) {
        metadata_ = j["metadata"];
    }
}

std::string Item::DebugString() const {
    std::string type = ToString(Type());
    if (!type.empty()) {
        type[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(type[0])));
    }
    return absl::StrCat(type, "(id='", id_, "', name='", name_, "')");
}

// =============================================================================
// Folder
// =============================================================================

Folder::Folder(std::string name, std::string id)
    : Item(id.empty() ? GenerateItemId(ItemType::kFolder) : std::move(id), std::move(name)) {}

Item* Folder::InsertChild(std::unique_ptr<Item> child, std::optional<size_t> position) {
    child->set_parent_id(this->id());
    Item* raw = child.get();
    size_t at = std::min(position.value_or(children_.size()), children_.size());
    children_.insert(children_.begin() + static_cast<std::ptrdiff_t>(at), std::move(child));
    Touch();
    return raw;
}

std::unique_ptr<Item> Folder::DetachChild(std::string_view id) {
    auto it = std::find_if(children_.begin(), children_.end(),
                           [id](const std::unique_ptr<Item>& c) { return c->id() == id; });
    if (it == children_.end()) {
        return nullptr;
    }
    std::unique_ptr<Item> child = std::move(*it);
    children_.erase(it);
    child->set_parent_id("");
    Touch();
    return child;
}

std::optional<size_t> Folder::IndexOf(std::string_view id) const {
    for (size_t i = 0; i < children_.size(); ++i) {
        if (children_[i]->id() == id) {
            return i;
        }
    }
    return std::nullopt;
}

json Folder::ToJson() const {
    json j = Item::ToJson();
    json items = json::array();
    for (const auto& child : children_) {
        items.push_back(child->ToJson());
    }
    j["items"] = std::move(items);
    return j;
}

// =============================================================================
// Dataset
// =============================================================================

Dataset::Dataset(std::string name, Table table, std::string id)
    : Item(id.empty() ? GenerateItemId(ItemType::kDataset) : std::move(id), std::move(name)),
      table_(std::move(table)) {
    RefreshColumnInfo();
}

void Dataset::SetData(Table table) {
    table_ = std::move(table);
    RefreshColumnInfo();
    Touch();
}

void Dataset::RefreshColumnInfo() {
    json dtypes = json::object();
    for (const auto& column : table_.Columns()) {
        dtypes[column.name] = ToString(column.dtype);
    }
    metadata()["column_info"] = {
        {"columns", table_.ColumnNames()},
        {"dtypes", std::move(dtypes)},
        {"shape", {table_.RowCount(), table_.ColumnCount()}},
    };
}

json Dataset::ToJson() const {
    json j = Item::ToJson();
    j["source_file"] = source_file_ ? json(*source_file_) : json(nullptr);
    j["data"] = TableToJson(table_);
    return j;
}

// =============================================================================
// Note
// =============================================================================

Note::Note(std::string name, std::string content, std::string id)
    : Item(id.empty() ? GenerateItemId(ItemType::kNote) : std::move(id), std::move(name)),
      content_(std::move(content)) {}

void Note::SetContent(std::string content) {
    content_ = std::move(content);
    Touch();
}

void Note::AddTag(const std::string& tag) {
    if (std::find(tags_.begin(), tags_.end(), tag) == tags_.end()) {
        tags_.push_back(tag);
        Touch();
    }
}

void Note::RemoveTag(const std::string& tag) {
    auto it = std::find(tags_.begin(), tags_.end(), tag);
    if (it != tags_.end()) {
        tags_.erase(it);
        Touch();
    }
}

json Note::ToJson() const {
    json j = Item::ToJson();
    j["content"] = content_;
    j["tags"] = tags_;
    return j;
}

// =============================================================================
// Chart
// =============================================================================

Chart::Chart(std::string name, std::string chart_type, std::string id)
    : Item(id.empty() ? GenerateItemId(ItemType::kChart) : std::move(id), std::move(name)),
      chart_type_(std::move(chart_type)) {}

void Chart::AddSeries(ChartSeries series) {
    series_.push_back(std::move(series));
    Touch();
}

json Chart::ToJson() const {
    json j = Item::ToJson();
    j["chart_type"] = chart_type_;
    json series = json::array();
    for (const auto& s : series_) {
        series.push_back({
            {"dataset_id", s.dataset_id},
            {"x_column", s.x_column},
            {"y_column", s.y_column},
            {"label", s.label},
        });
    }
    j["series"] = std::move(series);
    j["config"] = config_;
    return j;
}

// =============================================================================
// JSON mapping
// =============================================================================

json ValueToJson(const Value& value) {
    return std::visit([](const auto& v) -> json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v)) {
                return nullptr;
            }
            return v;
        } else {
            return v;
        }
    }, value);
}

absl::StatusOr<Value> ValueFromJson(const json& j, DataType dtype) {
    if (j.is_null()) {
        return Value{};
    }
    switch (dtype) {
        case DataType::kInt64:
            if (j.is_number_integer()) return Value{j.get<int64_t>()};
            break;
        case DataType::kFloat64:
            if (j.is_number()) return Value{j.get<double>()};
            break;
        case DataType::kBool:
            if (j.is_boolean()) return Value{j.get<bool>()};
            break;
        case DataType::kString:
            if (j.is_string()) return Value{j.get<std::string>()};
            break;
    }
    return absl::InvalidArgumentError(
        absl::StrCat("Value ", j.dump(), " does not match dtype ", ToString(dtype)));
}

json TableToJson(const Table& table) {
    json columns = json::array();
    for (const auto& column : table.Columns()) {
        json values = json::array();
        for (const auto& value : column.values) {
            values.push_back(ValueToJson(value));
        }
        columns.push_back({
            {"name", column.name},
            {"dtype", ToString(column.dtype)},
            {"values", std::move(values)},
        });
    }
    return json{{"columns", std::move(columns)}};
}

absl::StatusOr<Table> TableFromJson(const json& j) {
    if (!j.is_object() || !j.contains("columns") || !j["columns"].is_array()) {
        return absl::InvalidArgumentError("Table JSON must be an object with a 'columns' array");
    }

    Table table;
    for (const auto& col : j["columns"]) {
        if (!col.is_object() || !col.contains("name") || !col["name"].is_string() ||
            !col.contains("values") || !col["values"].is_array()) {
            return absl::InvalidArgumentError("Malformed column entry in table JSON");
        }

        Column column;
        column.name = col["name"].get<std::string>();
        PLOTWISE_ASSIGN_OR_RETURN(std::string dtype_name,
                                  OptionalString(col, "dtype", "string"));
        auto dtype = ParseDataType(dtype_name);
        if (!dtype.ok()) {
            return dtype.status();
        }
        column.dtype = *dtype;

        for (const auto& v : col["values"]) {
            auto value = ValueFromJson(v, column.dtype);
            if (!value.ok()) {
                return value.status();
            }
            column.values.push_back(std::move(*value));
        }

        auto status = table.AddColumn(std::move(column));
        if (!status.ok()) {
            return absl::InvalidArgumentError(status.message());
        }
    }
    return table;
}

absl::StatusOr<std::unique_ptr<Item>> ItemFromJson(const json& j) {
    if (!j.is_object()) {
        return absl::InvalidArgumentError("Item JSON must be an object");
    }
    if (!j.contains("id") || !j["id"].is_string() || j["id"].get<std::string>().empty()) {
        return absl::InvalidArgumentError("Item JSON is missing 'id'");
    }
    if (!j.contains("type") || !j["type"].is_string()) {
        return absl::InvalidArgumentError("Item JSON is missing 'type'");
    }

    auto type = ParseItemType(j["type"].get<std::string>());
    if (!type.ok()) {
        return type.status();
    }

    const std::string id = j["id"].get<std::string>();
    PLOTWISE_ASSIGN_OR_RETURN(const std::string name, OptionalString(j, "name"));

    std::unique_ptr<Item> item;
    switch (*type) {
        case ItemType::kFolder: {
            auto folder = std::make_unique<Folder>(name, id);
            if (j.contains("items") && j["items"].is_array()) {
                for (const auto& child_json : j["items"]) {
                    auto child = ItemFromJson(child_json);
                    if (!child.ok()) {
                        return child.status();
                    }
                    folder->InsertChild(std::move(*child));
                }
            }
            item = std::move(folder);
            break;
        }
        case ItemType::kDataset: {
            Table table;
            if (j.contains("data") && !j["data"].is_null()) {
                auto parsed = TableFromJson(j["data"]);
                if (!parsed.ok()) {
                    return parsed.status();
                }
                table = std::move(*parsed);
            }
            auto dataset = std::make_unique<Dataset>(name, std::move(table), id);
            if (j.contains("source_file") && j["source_file"].is_string()) {
                dataset->set_source_file(j["source_file"].get<std::string>());
            }
            item = std::move(dataset);
            break;
        }
        case ItemType::kNote: {
            PLOTWISE_ASSIGN_OR_RETURN(std::string content, OptionalString(j, "content"));
            auto note = std::make_unique<Note>(name, std::move(content), id);
            if (j.contains("tags") && j["tags"].is_array()) {
                for (const auto& tag : j["tags"]) {
                    if (tag.is_string()) {
                        note->AddTag(tag.get<std::string>());
                    }
                }
            }
            item = std::move(note);
            break;
        }
        case ItemType::kChart: {
            PLOTWISE_ASSIGN_OR_RETURN(std::string chart_type,
                                      OptionalString(j, "chart_type", "line"));
            auto chart = std::make_unique<Chart>(name, std::move(chart_type), id);
            if (j.contains("series") && j["series"].is_array()) {
                for (const auto& s : j["series"]) {
                    ChartSeries series;
                    PLOTWISE_ASSIGN_OR_RETURN(series.dataset_id, OptionalString(s, "dataset_id"));
                    PLOTWISE_ASSIGN_OR_RETURN(series.x_column, OptionalString(s, "x_column"));
                    PLOTWISE_ASSIGN_OR_RETURN(series.y_column, OptionalString(s, "y_column"));
                    PLOTWISE_ASSIGN_OR_RETURN(series.label, OptionalString(s, "label"));
                    chart->AddSeries(std::move(series));
                }
            }
            if (j.contains("config") && j["config"].is_object()) {
                chart->config() = j["config"];
            }
            item = std::move(chart);
            break;
        }
    }

    // Children were inserted above; restore persisted fields last so that
    // timestamps are not bumped by the rebuild.
    item->LoadCommonFields(j);
    return item;
}

absl::StatusOr<std::string> OptionalString(const json& j,
                                           std::string_view key,
                                           std::string_view fallback) {
    if (!j.is_object()) {
        return InvalidInputError(absl::StrCat("Expected an object holding '", key, "'"));
    }
    auto it = j.find(std::string(key));
    if (it == j.end() || it->is_null()) {
        return std::string(fallback);
    }
    if (!it->is_string()) {
        return InvalidInputError(
            absl::StrCat("Field '", key, "' must be a string, got ", it->type_name()));
    }
    return it->get<std::string>();
}

}  // namespace plotwise::model
