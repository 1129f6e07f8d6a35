#pragma once

/// @file project_commands.h
/// @brief Commands that replace or persist the current project

#include <memory>
#include <optional>
#include <string>

#include <absl/status/status.h>

#include "commands/command.h"
#include "model/project.h"
#include "services/project_manager.h"
#include "state/app_state.h"

namespace plotwise::commands {

/// @brief Install a fresh empty project
///
/// Undo puts the previous project (and its path) back, or closes the project
/// if there was none. Redo re-installs the same new project instance.
class NewProjectCommand : public Command {
public:
    NewProjectCommand(state::AppState& state, std::string name, std::string description = "");

    absl::Status Execute() override;
    absl::Status Undo() override;
    absl::Status Redo() override;
    std::string Description() const override;

private:
    state::AppState& state_;
    std::string name_;
    std::string description_;
    bool executed_ = false;
    std::unique_ptr<model::Project> held_;
    std::optional<std::string> held_path_;
};

/// @brief Load a project file and make it current
class LoadProjectCommand : public Command {
public:
    LoadProjectCommand(state::AppState& state, std::string path);

    absl::Status Execute() override;
    absl::Status Undo() override;
    absl::Status Redo() override;
    std::string Description() const override;

private:
    state::AppState& state_;
    std::string path_;
    services::ProjectManager manager_;
    bool executed_ = false;
    std::unique_ptr<model::Project> held_;
    std::optional<std::string> held_path_;
};

/// @brief Save the current project to path, or to its current file
///
/// Fails with FailedPrecondition when neither is available. Undo only
/// reverts the recorded project path; the written file stays.
class SaveProjectCommand : public Command {
public:
    explicit SaveProjectCommand(state::AppState& state,
                                std::optional<std::string> path = std::nullopt);

    absl::Status Execute() override;
    absl::Status Undo() override;
    absl::Status Redo() override;
    std::string Description() const override;

private:
    state::AppState& state_;
    std::optional<std::string> path_;
    services::ProjectManager manager_;
    bool executed_ = false;
    std::optional<std::string> previous_path_;
};

}  // namespace plotwise::commands
