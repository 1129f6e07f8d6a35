#pragma once

/// @file snapshot.h
/// @brief Captured table state used by dataset commands to undo

#include <memory>
#include <optional>
#include <string>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "model/item.h"
#include "model/project.h"
#include "model/table.h"

namespace plotwise::commands {

/// @brief Whole-table snapshot for structural changes (row/column insertion)
class TableSnapshot {
public:
    void Capture(const model::Table& table) { table_ = table; }
    bool captured() const { return table_.has_value(); }

    /// @brief The captured table; call only when captured()
    const model::Table& table() const { return *table_; }

    void Reset() { table_.reset(); }

private:
    std::optional<model::Table> table_;
};

/// @brief Single-column snapshot for additive-or-replacing column writes
///
/// Remembers whether the column existed and, if so, its prior contents.
class ColumnSnapshot {
public:
    void Capture(const model::Table& table, const std::string& column_name);

    bool captured() const { return captured_; }
    bool existed_before() const { return previous_.has_value(); }
    const std::string& column_name() const { return column_name_; }

    /// @brief Copy of current with the column put back as captured
    ///
    /// Restores the saved column, or drops the column when it did not exist
    /// at capture time.
    absl::StatusOr<model::Table> Restore(const model::Table& current) const;

private:
    bool captured_ = false;
    std::string column_name_;
    std::optional<model::Column> previous_;
};

/// @brief Ownership of an item taken out of the tree, plus where it was
///
/// Create commands undo by detaching what they added, delete commands by
/// re-attaching what they removed. The same instance (and id) goes back
/// at the same parent and position.
class DetachedItem {
public:
    /// @brief Remove an item from the project and keep it
    absl::Status Detach(model::Project& project, const std::string& item_id);

    /// @brief Put the held item back where it was detached from
    absl::StatusOr<model::Item*> Reattach(model::Project& project);

    bool holding() const { return item_ != nullptr; }
    const model::Item* item() const { return item_.get(); }
    const std::string& parent_id() const { return parent_id_; }
    std::optional<size_t> position() const { return position_; }

private:
    std::unique_ptr<model::Item> item_;
    std::string parent_id_;
    std::optional<size_t> position_;
};

}  // namespace plotwise::commands
