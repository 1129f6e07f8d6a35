#pragma once

/// @file project_manager.h
/// @brief Project creation and JSON file persistence

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "model/project.h"

namespace plotwise::services {

/// @brief Creates, loads and saves project files
///
/// Project files are JSON documents with a ".plotwise" or ".json"
/// extension. Datasets are stored inline with their tables.
class ProjectManager {
public:
    ProjectManager() = default;

    /// @brief Extensions accepted by LoadProject and SaveProject
    static const std::vector<std::string>& SupportedExtensions();

    /// @brief New empty project
    std::unique_ptr<model::Project> CreateProject(std::string name,
                                                  std::string description = "") const;

    /// @brief Load a project file
    ///
    /// NotFound if the file does not exist. InvalidArgument for an
    /// unsupported extension, malformed JSON, a document that is not an
    /// object, or a tree that does not rebuild.
    absl::StatusOr<std::unique_ptr<model::Project>> LoadProject(const std::string& path) const;

    /// @brief Write the project as indented JSON, creating parent directories
    absl::Status SaveProject(const model::Project& project, const std::string& path) const;

    /// @brief True if path is a readable project file with "name" and "version"
    bool ValidateProjectFile(const std::string& path) const;

private:
    static absl::Status CheckExtension(const std::string& path);
};

}  // namespace plotwise::services
