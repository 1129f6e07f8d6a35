#pragma once

/// @file item.h
/// @brief Project tree items: folders, datasets, charts and notes

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "model/table.h"

namespace plotwise::model {

using Timestamp = std::chrono::system_clock::time_point;

enum class ItemType {
    kFolder,
    kDataset,
    kChart,
    kNote
};

std::string ToString(ItemType type);
absl::StatusOr<ItemType> ParseItemType(std::string_view name);

/// @brief Generate a fresh item id of the form "<type>-<16 hex digits>"
std::string GenerateItemId(ItemType type);

/// @brief Base class of every node in the project tree
class Item {
public:
    virtual ~Item() = default;

    Item(const Item&) = delete;
    Item& operator=(const Item&) = delete;

    virtual ItemType Type() const = 0;

    const std::string& id() const { return id_; }

    const std::string& name() const { return name_; }
    void SetName(std::string name);

    /// @brief Parent folder id; empty for the root and for detached items
    const std::string& parent_id() const { return parent_id_; }
    void set_parent_id(std::string parent_id) { parent_id_ = std::move(parent_id); }

    Timestamp created_at() const { return created_at_; }
    Timestamp modified_at() const { return modified_at_; }

    /// @brief Bump the modification time
    void Touch();

    nlohmann::json& metadata() { return metadata_; }
    const nlohmann::json& metadata() const { return metadata_; }

    /// @brief Serialize this item (and, for folders, its subtree)
    virtual nlohmann::json ToJson() const;

    /// @brief "<Type>(id='...', name='...')"
    std::string DebugString() const;

    /// @brief Restore parent id, timestamps and metadata written by ToJson
    void LoadCommonFields(const nlohmann::json& j);

protected:
    Item(std::string id, std::string name);

private:
    std::string id_;
    std::string name_;
    std::string parent_id_;
    Timestamp created_at_;
    Timestamp modified_at_;
    nlohmann::json metadata_ = nlohmann::json::object();
};

/// @brief Folder owning an ordered list of children
class Folder : public Item {
public:
    explicit Folder(std::string name, std::string id = "");

    ItemType Type() const override { return ItemType::kFolder; }

    const std::vector<std::unique_ptr<Item>>& children() const { return children_; }

    /// @brief Insert a child at position (appends when absent or past the end)
    Item* InsertChild(std::unique_ptr<Item> child, std::optional<size_t> position = std::nullopt);

    /// @brief Remove a direct child and return ownership; nullptr if absent
    std::unique_ptr<Item> DetachChild(std::string_view id);

    /// @brief Position of a direct child
    std::optional<size_t> IndexOf(std::string_view id) const;

    nlohmann::json ToJson() const override;

private:
    std::vector<std::unique_ptr<Item>> children_;
};

/// @brief Tabular dataset
class Dataset : public Item {
public:
    explicit Dataset(std::string name, Table table = {}, std::string id = "");

    ItemType Type() const override { return ItemType::kDataset; }

    const Table& data() const { return table_; }

    /// @brief Replace the whole table at once
    void SetData(Table table);

    const std::optional<std::string>& source_file() const { return source_file_; }
    void set_source_file(std::optional<std::string> path) { source_file_ = std::move(path); }

    nlohmann::json ToJson() const override;

private:
    void RefreshColumnInfo();

    Table table_;
    std::optional<std::string> source_file_;
};

/// @brief Free-text note
class Note : public Item {
public:
    explicit Note(std::string name, std::string content = "", std::string id = "");

    ItemType Type() const override { return ItemType::kNote; }

    const std::string& content() const { return content_; }
    void SetContent(std::string content);

    const std::vector<std::string>& tags() const { return tags_; }
    void AddTag(const std::string& tag);
    void RemoveTag(const std::string& tag);

    nlohmann::json ToJson() const override;

private:
    std::string content_;
    std::vector<std::string> tags_;
};

/// @brief One plotted series of a chart
struct ChartSeries {
    std::string dataset_id;
    std::string x_column;
    std::string y_column;
    std::string label;
};

/// @brief Chart description; rendering happens elsewhere
class Chart : public Item {
public:
    explicit Chart(std::string name, std::string chart_type = "line", std::string id = "");

    ItemType Type() const override { return ItemType::kChart; }

    const std::string& chart_type() const { return chart_type_; }
    void set_chart_type(std::string chart_type) { chart_type_ = std::move(chart_type); }

    const std::vector<ChartSeries>& series() const { return series_; }
    void AddSeries(ChartSeries series);

    nlohmann::json& config() { return config_; }
    const nlohmann::json& config() const { return config_; }

    nlohmann::json ToJson() const override;

private:
    std::string chart_type_;
    std::vector<ChartSeries> series_;
    nlohmann::json config_ = nlohmann::json::object();
};

/// @brief Cell as JSON; missing and non-finite values become null
nlohmann::json ValueToJson(const Value& value);

/// @brief Cell from JSON, checked against the column type
absl::StatusOr<Value> ValueFromJson(const nlohmann::json& j, DataType dtype);

/// @brief Serialize a table as {"columns":[{"name","dtype","values"}]}
nlohmann::json TableToJson(const Table& table);
absl::StatusOr<Table> TableFromJson(const nlohmann::json& j);

/// @brief Rebuild an item (and its subtree) from ToJson output
absl::StatusOr<std::unique_ptr<Item>> ItemFromJson(const nlohmann::json& j);

/// @brief String member `key` of an object, or `fallback` when absent or null.
/// InvalidArgument when the member holds any other JSON type.
absl::StatusOr<std::string> OptionalString(const nlohmann::json& j,
                                           std::string_view key,
                                           std::string_view fallback = "");

}  // namespace plotwise::model
