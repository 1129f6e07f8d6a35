#pragma once

/// @file app_state.h
/// @brief Current project, its file path and the event bus

#include <memory>
#include <optional>
#include <string>

#include "events/event_bus.h"
#include "model/project.h"

namespace plotwise::state {

/// @brief Application state shared by commands
///
/// Owns the current project. Commands look items up through it on every
/// execute/undo/redo instead of holding pointers into the tree.
class AppState {
public:
    explicit AppState(events::EventBus& event_bus);

    AppState(const AppState&) = delete;
    AppState& operator=(const AppState&) = delete;

    bool has_project() const { return project_ != nullptr; }

    model::Project* current_project() { return project_.get(); }
    const model::Project* current_project() const { return project_.get(); }

    /// @brief File the current project was loaded from or saved to
    const std::optional<std::string>& project_path() const { return project_path_; }
    void set_project_path(std::optional<std::string> path) { project_path_ = std::move(path); }

    /// @brief Install a project, returning the one it replaces
    ///
    /// Emits project_loaded.
    std::unique_ptr<model::Project> LoadProject(std::unique_ptr<model::Project> project,
                                                std::optional<std::string> path = std::nullopt);

    /// @brief Remove the current project and return it; emits project_closed
    std::unique_ptr<model::Project> CloseProject();

    events::EventBus& event_bus() { return event_bus_; }

    /// @brief Emit an event stamped with the current project
    void Emit(events::Event event);

private:
    events::EventBus& event_bus_;
    std::unique_ptr<model::Project> project_;
    std::optional<std::string> project_path_;
};

}  // namespace plotwise::state
