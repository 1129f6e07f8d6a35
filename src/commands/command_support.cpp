#include "commands/command_support.h"

#include "common/error.h"

namespace plotwise::commands {

absl::StatusOr<model::Project*> RequireProject(state::AppState& state) {
    model::Project* project = state.current_project();
    if (project == nullptr) {
        return MakeError(ErrorCode::kNoProject, "Please open or create a project first");
    }
    return project;
}

absl::StatusOr<model::Dataset*> ResolveDataset(state::AppState& state,
                                               std::string_view dataset_id) {
    PLOTWISE_ASSIGN_OR_RETURN(model::Project* project, RequireProject(state));
    return project->GetDataset(dataset_id);
}

std::string ResolveFolderId(const model::Project& project, std::string_view folder_id) {
    if (folder_id.empty() || folder_id == "root") {
        return project.root().id();
    }
    return std::string(folder_id);
}

void EmitDatasetEvent(state::AppState& state,
                      const char* type,
                      const model::Dataset& dataset,
                      nlohmann::json fields) {
    fields["dataset_id"] = dataset.id();
    fields["dataset_name"] = dataset.name();
    state.Emit(events::Event{
        .type = type,
        .dataset_data = &dataset.data(),
        .fields = std::move(fields),
    });
}

void EmitItemEvent(state::AppState& state,
                   const char* type,
                   const model::Item& item,
                   nlohmann::json fields) {
    fields["item_id"] = item.id();
    fields["item_name"] = item.name();
    fields["item_type"] = model::ToString(item.Type());
    state.Emit(events::Event{
        .type = type,
        .fields = std::move(fields),
    });
}

}  // namespace plotwise::commands
