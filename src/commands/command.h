#pragma once

/// @file command.h
/// @brief Reversible unit of work driven by the CommandExecutor

#include <string>

#include <absl/status/status.h>

namespace plotwise::commands {

/// @brief A reversible mutation of application state
///
/// Lifecycle: constructed -> Execute() -> executed -> Undo() -> undone ->
/// Redo() -> executed. Execute captures whatever state Undo needs. Redo
/// replays the mutation from the captured intent without asking for input
/// again. A command reports failure through its Status and must leave state
/// untouched when validation fails.
class Command {
public:
    virtual ~Command() = default;

    virtual absl::Status Execute() = 0;
    virtual absl::Status Undo() = 0;
    virtual absl::Status Redo() = 0;

    /// @brief Short human readable label, e.g. "Add column 'X'"
    virtual std::string Description() const = 0;
};

}  // namespace plotwise::commands
