/// @file project_commands.cpp
/// @brief Project lifecycle command implementations

#include "commands/project_commands.h"

#include <absl/strings/str_cat.h>

#include "commands/command_support.h"
#include "common/error.h"
#include "common/logging.h"

namespace plotwise::commands {

namespace {

// Install project (or close when null) and hand back what was current
std::unique_ptr<model::Project> SwapProject(state::AppState& state,
                                            std::unique_ptr<model::Project> project,
                                            std::optional<std::string> path,
                                            std::optional<std::string>* previous_path) {
    *previous_path = state.project_path();
    if (project == nullptr) {
        return state.CloseProject();
    }
    return state.LoadProject(std::move(project), std::move(path));
}

absl::Status NeverExecuted(std::string_view description) {
    return MakeError(ErrorCode::kInvalidState,
                     absl::StrCat("'", description, "' has not been executed"));
}

}  // namespace

// ============================================================================
// NewProjectCommand
// ============================================================================

NewProjectCommand::NewProjectCommand(state::AppState& state,
                                     std::string name,
                                     std::string description)
    : state_(state), name_(std::move(name)), description_(std::move(description)) {}

absl::Status NewProjectCommand::Execute() {
    if (name_.empty()) {
        return InvalidInputError("Project name must not be empty");
    }
    services::ProjectManager manager;
    held_ = SwapProject(state_, manager.CreateProject(name_, description_), std::nullopt,
                        &held_path_);
    executed_ = true;
    PLOTWISE_LOG_INFO("Created new project '{}'", name_);
    return absl::OkStatus();
}

absl::Status NewProjectCommand::Undo() {
    if (!executed_) {
        return NeverExecuted(Description());
    }
    std::optional<std::string> path = held_path_;
    held_ = SwapProject(state_, std::move(held_), std::move(path), &held_path_);
    return absl::OkStatus();
}

absl::Status NewProjectCommand::Redo() {
    if (!executed_ || held_ == nullptr) {
        return NeverExecuted(Description());
    }
    std::optional<std::string> path = held_path_;
    held_ = SwapProject(state_, std::move(held_), std::move(path), &held_path_);
    return absl::OkStatus();
}

std::string NewProjectCommand::Description() const {
    return absl::StrCat("New Project '", name_, "'");
}

// ============================================================================
// LoadProjectCommand
// ============================================================================

LoadProjectCommand::LoadProjectCommand(state::AppState& state, std::string path)
    : state_(state), path_(std::move(path)) {}

absl::Status LoadProjectCommand::Execute() {
    PLOTWISE_ASSIGN_OR_RETURN(std::unique_ptr<model::Project> loaded,
                              manager_.LoadProject(path_));
    held_ = SwapProject(state_, std::move(loaded), path_, &held_path_);
    executed_ = true;
    return absl::OkStatus();
}

absl::Status LoadProjectCommand::Undo() {
    if (!executed_) {
        return NeverExecuted(Description());
    }
    std::optional<std::string> path = held_path_;
    held_ = SwapProject(state_, std::move(held_), std::move(path), &held_path_);
    return absl::OkStatus();
}

absl::Status LoadProjectCommand::Redo() {
    if (!executed_ || held_ == nullptr) {
        return NeverExecuted(Description());
    }
    std::optional<std::string> path = held_path_;
    held_ = SwapProject(state_, std::move(held_), std::move(path), &held_path_);
    return absl::OkStatus();
}

std::string LoadProjectCommand::Description() const {
    return absl::StrCat("Load Project '", path_, "'");
}

// ============================================================================
// SaveProjectCommand
// ============================================================================

SaveProjectCommand::SaveProjectCommand(state::AppState& state, std::optional<std::string> path)
    : state_(state), path_(std::move(path)) {}

absl::Status SaveProjectCommand::Execute() {
    PLOTWISE_ASSIGN_OR_RETURN(model::Project * project, RequireProject(state_));

    std::optional<std::string> target = path_.has_value() ? path_ : state_.project_path();
    if (!target.has_value() || target->empty()) {
        return FailedPreconditionError("Project has no file path; save it under a new path");
    }

    PLOTWISE_RETURN_IF_ERROR(manager_.SaveProject(*project, *target));

    previous_path_ = state_.project_path();
    state_.set_project_path(*target);
    executed_ = true;

    state_.Emit(events::Event{
        .type = events::event_types::kProjectSaved,
        .fields = {{"file_path", *target},
                   {"previous_path", previous_path_.has_value()
                                         ? nlohmann::json(*previous_path_)
                                         : nlohmann::json(nullptr)}},
    });
    return absl::OkStatus();
}

absl::Status SaveProjectCommand::Undo() {
    if (!executed_) {
        return NeverExecuted(Description());
    }
    PLOTWISE_RETURN_IF_ERROR(RequireProject(state_).status());
    state_.set_project_path(previous_path_);
    PLOTWISE_LOG_DEBUG("Project path reverted to '{}'", previous_path_.value_or(""));
    return absl::OkStatus();
}

absl::Status SaveProjectCommand::Redo() {
    return Execute();
}

std::string SaveProjectCommand::Description() const {
    if (path_.has_value()) {
        return absl::StrCat("Save Project As '", *path_, "'");
    }
    return "Save Project";
}

}  // namespace plotwise::commands
