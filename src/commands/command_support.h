#pragma once

/// @file command_support.h
/// @brief Lookup and event helpers shared by concrete commands

#include <string>
#include <string_view>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "model/item.h"
#include "model/project.h"
#include "state/app_state.h"

namespace plotwise::commands {

/// @brief Current project; FailedPrecondition when none is loaded
absl::StatusOr<model::Project*> RequireProject(state::AppState& state);

/// @brief Dataset by id in the current project
///
/// FailedPrecondition without a project, NotFound when the id is unknown or
/// names something other than a dataset.
absl::StatusOr<model::Dataset*> ResolveDataset(state::AppState& state,
                                               std::string_view dataset_id);

/// @brief Map the "root" alias and empty ids to the project root id
std::string ResolveFolderId(const model::Project& project, std::string_view folder_id);

/// @brief Emit a dataset event with the standard payload
///
/// fields gains dataset_id and dataset_name; the event points at the
/// dataset's current table.
void EmitDatasetEvent(state::AppState& state,
                      const char* type,
                      const model::Dataset& dataset,
                      nlohmann::json fields = nlohmann::json::object());

/// @brief Emit an item event carrying item_id, item_name and item_type
void EmitItemEvent(state::AppState& state,
                   const char* type,
                   const model::Item& item,
                   nlohmann::json fields = nlohmann::json::object());

}  // namespace plotwise::commands
