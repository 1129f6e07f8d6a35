#include "state/app_state.h"

#include "common/logging.h"

namespace plotwise::state {

AppState::AppState(events::EventBus& event_bus)
    : event_bus_(event_bus) {}

std::unique_ptr<model::Project> AppState::LoadProject(
    std::unique_ptr<model::Project> project,
    std::optional<std::string> path) {

    std::unique_ptr<model::Project> previous = std::move(project_);
    project_ = std::move(project);
    project_path_ = std::move(path);

    if (project_) {
        PLOTWISE_LOG_INFO("Project '{}' loaded", project_->name());
        Emit(events::Event{
            .type = events::event_types::kProjectLoaded,
            .fields = {{"project_name", project_->name()}},
        });
    }
    return previous;
}

std::unique_ptr<model::Project> AppState::CloseProject() {
    std::unique_ptr<model::Project> previous = std::move(project_);
    project_path_.reset();
    if (previous) {
        PLOTWISE_LOG_INFO("Project '{}' closed", previous->name());
        Emit(events::Event{
            .type = events::event_types::kProjectClosed,
            .fields = {{"project_name", previous->name()}},
        });
    }
    return previous;
}

void AppState::Emit(events::Event event) {
    event.project = project_.get();
    event_bus_.Emit(event);
}

}  // namespace plotwise::state
