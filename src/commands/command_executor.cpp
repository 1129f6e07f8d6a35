/// @file command_executor.cpp
/// @brief Command executor implementation

#include "commands/command_executor.h"

#include <exception>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace plotwise::commands {

CommandExecutor::CommandExecutor(size_t max_undo_levels)
    : max_undo_levels_(max_undo_levels) {}

absl::Status CommandExecutor::RunStep(Command& command, Step step, std::string_view action) {
    absl::Status status;
    try {
        status = (command.*step)();
    } catch (const std::exception& e) {
        status = ExecutionFailureError(e.what());
    } catch (...) {
        status = ExecutionFailureError("unknown exception");
    }

    if (!status.ok()) {
        last_error_ = absl::Status(
            status.code(),
            absl::StrCat("Error ", action, " command '", command.Description(), "': ",
                         status.message()));
        PLOTWISE_LOG_ERROR("{}", last_error_.message());
    }
    return status;
}

bool CommandExecutor::ExecuteCommand(std::unique_ptr<Command> command) {
    if (!command) {
        last_error_ = absl::InvalidArgumentError("Cannot execute a null command");
        return false;
    }

    if (!RunStep(*command, &Command::Execute, "executing").ok()) {
        return false;
    }

    PLOTWISE_LOG_DEBUG("Executed '{}'", command->Description());
    undo_stack_.push_back(std::move(command));
    if (undo_stack_.size() > max_undo_levels_) {
        PLOTWISE_LOG_DEBUG("Undo history full, dropping '{}'",
                           undo_stack_.front()->Description());
        undo_stack_.pop_front();
    }
    redo_stack_.clear();
    return true;
}

bool CommandExecutor::Undo() {
    if (undo_stack_.empty()) {
        return false;
    }

    std::unique_ptr<Command> command = std::move(undo_stack_.back());
    undo_stack_.pop_back();

    if (!RunStep(*command, &Command::Undo, "undoing").ok()) {
        PLOTWISE_LOG_WARN("Dropping '{}' from history after failed undo",
                          command->Description());
        return false;
    }

    PLOTWISE_LOG_DEBUG("Undid '{}'", command->Description());
    redo_stack_.push_back(std::move(command));
    return true;
}

bool CommandExecutor::Redo() {
    if (redo_stack_.empty()) {
        return false;
    }

    std::unique_ptr<Command> command = std::move(redo_stack_.back());
    redo_stack_.pop_back();

    if (!RunStep(*command, &Command::Redo, "redoing").ok()) {
        PLOTWISE_LOG_WARN("Dropping '{}' from history after failed redo",
                          command->Description());
        return false;
    }

    PLOTWISE_LOG_DEBUG("Redid '{}'", command->Description());
    undo_stack_.push_back(std::move(command));
    return true;
}

std::optional<std::string> CommandExecutor::GetUndoDescription() const {
    if (undo_stack_.empty()) {
        return std::nullopt;
    }
    return undo_stack_.back()->Description();
}

std::optional<std::string> CommandExecutor::GetRedoDescription() const {
    if (redo_stack_.empty()) {
        return std::nullopt;
    }
    return redo_stack_.back()->Description();
}

void CommandExecutor::ClearHistory() {
    undo_stack_.clear();
    redo_stack_.clear();
}

std::vector<const Command*> CommandExecutor::UndoHistory() const {
    std::vector<const Command*> history;
    history.reserve(undo_stack_.size());
    for (const auto& command : undo_stack_) {
        history.push_back(command.get());
    }
    return history;
}

std::vector<const Command*> CommandExecutor::RedoHistory() const {
    std::vector<const Command*> history;
    history.reserve(redo_stack_.size());
    for (const auto& command : redo_stack_) {
        history.push_back(command.get());
    }
    return history;
}

}  // namespace plotwise::commands
