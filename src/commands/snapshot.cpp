#include "commands/snapshot.h"

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace plotwise::commands {

void ColumnSnapshot::Capture(const model::Table& table, const std::string& column_name) {
    column_name_ = column_name;
    const model::Column* column = table.GetColumn(column_name);
    if (column != nullptr) {
        previous_ = *column;
    } else {
        previous_.reset();
    }
    captured_ = true;
}

absl::StatusOr<model::Table> ColumnSnapshot::Restore(const model::Table& current) const {
    PLOTWISE_CHECK_OR_RETURN(captured_,
                             FailedPreconditionError("Column snapshot was never captured"));

    model::Table restored = current;
    if (previous_.has_value()) {
        if (previous_->values.size() != restored.RowCount()) {
            return ExecutionFailureError(absl::StrCat(
                "Cannot restore column '", column_name_, "': table now has ",
                restored.RowCount(), " rows, snapshot has ", previous_->values.size()));
        }
        PLOTWISE_RETURN_IF_ERROR(restored.SetColumn(*previous_));
    } else if (restored.HasColumn(column_name_)) {
        PLOTWISE_RETURN_IF_ERROR(restored.DropColumn(column_name_));
    }
    return restored;
}

absl::Status DetachedItem::Detach(model::Project& project, const std::string& item_id) {
    if (item_ != nullptr) {
        return FailedPreconditionError(
            absl::StrCat("Already holding detached item '", item_->id(), "'"));
    }

    PLOTWISE_ASSIGN_OR_RETURN(model::Item * item, project.GetItem(item_id));
    std::string parent_id = item->parent_id();
    std::optional<size_t> position = project.IndexOf(item_id);

    PLOTWISE_ASSIGN_OR_RETURN(item_, project.RemoveItem(item_id));
    parent_id_ = std::move(parent_id);
    position_ = position;
    return absl::OkStatus();
}

absl::StatusOr<model::Item*> DetachedItem::Reattach(model::Project& project) {
    PLOTWISE_CHECK_OR_RETURN(item_ != nullptr,
                             FailedPreconditionError("No detached item to re-attach"));
    // Keep holding the item when the tree no longer accepts it
    PLOTWISE_RETURN_IF_ERROR(project.CanAddItem(*item_, parent_id_));
    auto attached = project.AddItem(std::move(item_), parent_id_, position_);
    if (!attached.ok()) {
        return attached.status();
    }
    return *attached;
}

}  // namespace plotwise::commands
