#pragma once

/// @file command_executor.h
/// @brief Executes commands and keeps bounded undo/redo history

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>

#include "commands/command.h"

namespace plotwise::commands {

/// @brief Runs commands and owns their undo/redo stacks
///
/// A command that fails to execute is never recorded. A command whose undo
/// or redo fails is dropped from history rather than returned to its stack,
/// so the model may be inconsistent afterwards and the caller decides what
/// to do next.
///
/// History depth is bounded by max_undo_levels. Each successful execute
/// evicts at most one entry (the oldest), so lowering the limit only takes
/// effect gradually as new commands are pushed.
///
/// Example usage:
/// @code
///   CommandExecutor executor(settings.max_undo_levels);
///   if (!executor.ExecuteCommand(std::make_unique<AddColumnCommand>(state, id, "X"))) {
///       std::cerr << executor.last_error() << "\n";
///   }
///   executor.Undo();
/// @endcode
class CommandExecutor {
public:
    static constexpr size_t kDefaultMaxUndoLevels = 10;

    explicit CommandExecutor(size_t max_undo_levels = kDefaultMaxUndoLevels);

    CommandExecutor(const CommandExecutor&) = delete;
    CommandExecutor& operator=(const CommandExecutor&) = delete;

    /// @brief Execute and record a command
    /// @return true on success; on failure history is left unchanged
    bool ExecuteCommand(std::unique_ptr<Command> command);

    /// @brief Undo the most recent command; false if none or if it failed
    bool Undo();

    /// @brief Redo the most recently undone command; false if none or if it failed
    bool Redo();

    bool CanUndo() const { return !undo_stack_.empty(); }
    bool CanRedo() const { return !redo_stack_.empty(); }

    std::optional<std::string> GetUndoDescription() const;
    std::optional<std::string> GetRedoDescription() const;

    /// @brief Drop all history without undoing or redoing anything
    void ClearHistory();

    size_t max_undo_levels() const { return max_undo_levels_; }

    /// @brief Change the history bound; existing history is not trimmed here
    void set_max_undo_levels(size_t levels) { max_undo_levels_ = levels; }

    size_t UndoStackSize() const { return undo_stack_.size(); }
    size_t RedoStackSize() const { return redo_stack_.size(); }

    /// @brief Recorded commands, oldest first (top of stack last)
    std::vector<const Command*> UndoHistory() const;
    std::vector<const Command*> RedoHistory() const;

    /// @brief Status of the most recent failed operation (OK if none failed yet)
    const absl::Status& last_error() const { return last_error_; }

private:
    using Step = absl::Status (Command::*)();

    /// Run one step, turning escaped exceptions into an Internal status
    absl::Status RunStep(Command& command, Step step, std::string_view action);

    std::deque<std::unique_ptr<Command>> undo_stack_;
    std::deque<std::unique_ptr<Command>> redo_stack_;
    size_t max_undo_levels_;
    absl::Status last_error_;
};

}  // namespace plotwise::commands
