/// @file main.cpp
/// @brief Plotwise command line entry point

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <unistd.h>

#include <CLI/CLI.hpp>

#include "analysis/analysis_types.h"
#include "commands/analysis_command.h"
#include "commands/command_executor.h"
#include "commands/dataset_commands.h"
#include "commands/project_commands.h"
#include "common/config.h"
#include "common/logging.h"
#include "events/event_bus.h"
#include "model/project.h"
#include "state/app_state.h"

namespace {

constexpr const char* kVersion = "0.1.0";

void PrintTree(const plotwise::model::Item& item, int depth) {
    std::cout << std::string(static_cast<size_t>(depth) * 2, ' ') << item.DebugString();
    if (item.Type() == plotwise::model::ItemType::kDataset) {
        const auto& data = static_cast<const plotwise::model::Dataset&>(item).data();
        std::cout << " [" << data.RowCount() << " x " << data.ColumnCount() << "]";
    }
    std::cout << "\n";
    if (item.Type() == plotwise::model::ItemType::kFolder) {
        for (const auto& child : static_cast<const plotwise::model::Folder&>(item).children()) {
            PrintTree(*child, depth + 1);
        }
    }
}

void PrintResult(const plotwise::analysis::AnalysisResult& result) {
    std::cout << "Analysis: " << plotwise::analysis::ToString(result.analysis_type) << "\n";
    for (const auto& [key, value] : result.metadata) {
        std::cout << "  " << key << ": " << value << "\n";
    }
    for (const auto& [key, value] : result.statistics) {
        std::cout << "  " << std::left << std::setw(26) << key << std::setprecision(10) << value
                  << "\n";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"Plotwise - tabular data analysis with undo/redo"};

    std::string config_path;
    std::string log_level;
    std::string project_path;
    std::string import_path;
    std::string analyze_type;
    std::string dataset_id;
    std::string x_column;
    std::string y_column;
    std::string output_column;
    std::string method;
    int start_index = 0;
    int end_index = -1;
    int num_points = 0;
    bool replace_existing = false;
    bool print_tree = false;
    std::string save_path;
    bool version_flag = false;

    app.add_option("-c,--config", config_path, "Path to YAML configuration file");
    app.add_option("--log-level", log_level, "Log level (trace, debug, info, warn, error)");
    app.add_option("-p,--project", project_path, "Project file to open");
    app.add_option("-i,--import", import_path, "CSV file to import as a dataset");
    app.add_option("-a,--analyze", analyze_type,
                   "Analysis to apply (derivative, integral, arc_length, smoothing, "
                   "interpolation)");
    app.add_option("--dataset", dataset_id, "Dataset id (defaults to the imported dataset)");
    app.add_option("--x", x_column, "X column");
    app.add_option("--y", y_column, "Y column");
    app.add_option("-o,--output", output_column, "Result column name");
    app.add_option("-m,--method", method, "Analysis method");
    app.add_option("--start", start_index, "First row of the slice");
    app.add_option("--end", end_index, "End row of the slice (exclusive, -1 for all)");
    app.add_option("--points", num_points, "Number of interpolation points");
    app.add_flag("--replace", replace_existing, "Overwrite an existing result column");
    app.add_flag("-t,--tree", print_tree, "Print the project tree");
    app.add_option("-s,--save", save_path, "Save the project (to its file or the given path)")
        ->expected(0, 1);
    app.add_flag("-v,--version", version_flag, "Print version and exit");

    CLI11_PARSE(app, argc, argv);

    if (version_flag) {
        std::cout << "Plotwise v" << kVersion << std::endl;
        return 0;
    }

    std::optional<std::filesystem::path> config_file;
    if (!config_path.empty()) {
        config_file = config_path;
    }
    auto config_status = plotwise::InitGlobalConfig(config_file);
    if (!config_status.ok()) {
        std::cerr << "Failed to load config: " << config_status.message() << std::endl;
        return 1;
    }
    auto settings = plotwise::LoadSettings(plotwise::GlobalConfig());
    if (!settings.ok()) {
        std::cerr << "Invalid configuration: " << settings.status().message() << std::endl;
        return 1;
    }
    if (!log_level.empty()) {
        auto level = plotwise::ParseLogLevel(log_level);
        if (!level.has_value()) {
            std::cerr << "Unknown log level: " << log_level << std::endl;
            return 1;
        }
        settings->log_level = *level;
    }

    plotwise::LogConfig log_config = plotwise::MakeLogConfig(*settings);
    log_config.console_color = ::isatty(STDERR_FILENO) != 0;
    plotwise::InitLogging(log_config);
    PLOTWISE_LOG_DEBUG("Plotwise v{} starting, undo depth {}, log level {}", kVersion,
                       settings->max_undo_levels, plotwise::LogLevelName(settings->log_level));

    plotwise::events::EventBus event_bus;
    plotwise::state::AppState state(event_bus);
    plotwise::commands::CommandExecutor executor(settings->max_undo_levels);

    auto run = [&executor](std::unique_ptr<plotwise::commands::Command> command) {
        if (executor.ExecuteCommand(std::move(command))) {
            return true;
        }
        std::cerr << executor.last_error().message() << std::endl;
        return false;
    };

    int exit_code = 0;
    do {
        bool opened = project_path.empty()
            ? run(std::make_unique<plotwise::commands::NewProjectCommand>(
                  state, settings->default_project_name))
            : run(std::make_unique<plotwise::commands::LoadProjectCommand>(state, project_path));
        if (!opened) {
            exit_code = 1;
            break;
        }

        if (!import_path.empty()) {
            auto import_csv = std::make_unique<plotwise::commands::ImportCsvCommand>(state, import_path);
            const auto* import_command = import_csv.get();
            if (!run(std::move(import_csv))) {
                exit_code = 1;
                break;
            }
            if (dataset_id.empty()) {
                dataset_id = import_command->dataset_id();
            }
            std::cout << "Imported dataset " << dataset_id << "\n";
        }

        if (!analyze_type.empty()) {
            auto type = plotwise::analysis::ParseAnalysisType(analyze_type);
            if (!type.ok()) {
                std::cerr << type.status().message() << std::endl;
                exit_code = 2;
                break;
            }
            if (dataset_id.empty() || x_column.empty() || y_column.empty()) {
                std::cerr << "--analyze needs --dataset (or --import), --x and --y" << std::endl;
                exit_code = 2;
                break;
            }

            plotwise::commands::AnalysisRequest request{
                .type = *type,
                .x_column = x_column,
                .y_column = y_column,
                .new_column_name = output_column.empty()
                    ? y_column + "_" + plotwise::analysis::ToString(*type)
                    : output_column,
                .replace_existing = replace_existing,
            };
            request.parameters.method = method;
            request.parameters.start_index = start_index;
            request.parameters.end_index = end_index;
            if (num_points > 0) {
                request.parameters.num_points = num_points;
            }
            if (*type == plotwise::analysis::AnalysisType::kSmoothing) {
                auto smoothing = plotwise::analysis::ParseSmoothingMethod(method);
                if (smoothing.ok() && *smoothing == plotwise::analysis::SmoothingMethod::kLowess) {
                    request.parameters.additional.emplace("frac", settings->lowess_fraction);
                    request.parameters.additional.emplace("window", settings->rolling_window);
                }
            }

            auto analysis = std::make_unique<plotwise::commands::AnalysisCommand>(
                state, dataset_id, std::move(request));
            const auto* analysis_command = analysis.get();
            if (!run(std::move(analysis))) {
                exit_code = 1;
                break;
            }
            PrintResult(*analysis_command->last_result());
        }

        if (app.count("--save") > 0) {
            std::optional<std::string> target;
            if (!save_path.empty()) {
                target = save_path;
            }
            if (!run(std::make_unique<plotwise::commands::SaveProjectCommand>(state, target))) {
                exit_code = 1;
                break;
            }
            std::cout << "Saved to " << state.project_path().value_or("") << "\n";
        }

        if (print_tree && state.has_project()) {
            const auto* project = state.current_project();
            std::cout << "Project '" << project->name() << "' (" << project->ItemCount()
                      << " items)\n";
            PrintTree(project->root(), 0);
        }
    } while (false);

    plotwise::ShutdownLogging();
    return exit_code;
}
