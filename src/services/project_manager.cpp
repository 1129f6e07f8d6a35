/// @file project_manager.cpp
/// @brief Project persistence implementation

#include "services/project_manager.h"

#include <algorithm>
#include <filesystem>
#include <fstream>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <nlohmann/json.hpp>

#include "common/error.h"
#include "common/logging.h"

namespace plotwise::services {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

absl::StatusOr<json> ReadJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return MakeError(ErrorCode::kIoError, absl::StrCat("Cannot open project file: ", path));
    }
    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        return InvalidInputError(absl::StrCat("Invalid JSON in project file: ", e.what()));
    }
    return document;
}

}  // namespace

const std::vector<std::string>& ProjectManager::SupportedExtensions() {
    static const std::vector<std::string> kExtensions = {".plotwise", ".json"};
    return kExtensions;
}

absl::Status ProjectManager::CheckExtension(const std::string& path) {
    std::string extension = fs::path(path).extension().string();
    const auto& supported = SupportedExtensions();
    if (std::find(supported.begin(), supported.end(), extension) == supported.end()) {
        return InvalidInputError(absl::StrCat("Unsupported file format: '", extension,
                                              "'. Supported: ", absl::StrJoin(supported, ", ")));
    }
    return absl::OkStatus();
}

std::unique_ptr<model::Project> ProjectManager::CreateProject(std::string name,
                                                              std::string description) const {
    PLOTWISE_LOG_DEBUG("Creating project '{}'", name);
    return std::make_unique<model::Project>(std::move(name), std::move(description));
}

absl::StatusOr<std::unique_ptr<model::Project>> ProjectManager::LoadProject(
    const std::string& path) const {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return NotFoundError(absl::StrCat("Project file not found: ", path));
    }
    PLOTWISE_RETURN_IF_ERROR(CheckExtension(path));

    PLOTWISE_ASSIGN_OR_RETURN(json document, ReadJsonFile(path));
    if (!document.is_object()) {
        return InvalidInputError("Project file must contain a JSON object");
    }

    absl::StatusOr<std::unique_ptr<model::Project>> project;
    try {
        project = model::Project::FromJson(document);
    } catch (const json::exception& e) {
        return InvalidInputError(absl::StrCat("Malformed project file ", path, ": ", e.what()));
    }
    if (!project.ok()) {
        return InvalidInputError(
            absl::StrCat("Error loading project: ", project.status().message()));
    }

    PLOTWISE_LOG_INFO("Loaded project '{}' from {} ({} items)", (*project)->name(), path,
                      (*project)->ItemCount());
    return project;
}

absl::Status ProjectManager::SaveProject(const model::Project& project,
                                         const std::string& path) const {
    PLOTWISE_RETURN_IF_ERROR(CheckExtension(path));

    fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return MakeError(ErrorCode::kIoError,
                             absl::StrCat("Cannot create directory '",
                                          target.parent_path().string(), "': ", ec.message()));
        }
    }

    std::string contents;
    try {
        contents = project.ToJson().dump(2);
    } catch (const json::exception& e) {
        return InvalidInputError(
            absl::StrCat("Cannot serialize project '", project.name(), "': ", e.what()));
    }

    // A failed save leaves any previous file at `path` untouched
    const fs::path staging = fs::path(path + ".tmp");
    {
        std::ofstream file(staging, std::ios::trunc);
        if (!file.is_open()) {
            return MakeError(ErrorCode::kIoError,
                             absl::StrCat("Cannot write project file: ", staging.string()));
        }
        file << contents << '\n';
        file.close();
        if (!file) {
            fs::remove(staging, ec);
            return MakeError(ErrorCode::kIoError, absl::StrCat("Error saving project to ", path));
        }
    }
    fs::rename(staging, target, ec);
    if (ec) {
        const std::string reason = ec.message();
        fs::remove(staging, ec);
        return MakeError(ErrorCode::kIoError,
                         absl::StrCat("Cannot replace project file ", path, ": ", reason));
    }

    PLOTWISE_LOG_INFO("Saved project '{}' to {}", project.name(), path);
    return absl::OkStatus();
}

bool ProjectManager::ValidateProjectFile(const std::string& path) const {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || !CheckExtension(path).ok()) {
        return false;
    }
    auto document = ReadJsonFile(path);
    if (!document.ok()) {
        PLOTWISE_LOG_DEBUG("{} is not a project file: {}", path, document.status().message());
        return false;
    }
    return document->is_object() && document->contains("name") &&
           document->contains("version");
}

}  // namespace plotwise::services
