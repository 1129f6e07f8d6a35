/// @file command_executor_test.cpp
/// @brief Tests for command execution and undo/redo history

#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "commands/command_executor.h"

namespace plotwise::commands {
namespace {

/// Records every step into a shared journal; failures are scripted per step
class FakeCommand : public Command {
public:
    FakeCommand(std::string name, std::vector<std::string>* journal)
        : name_(std::move(name)), journal_(journal) {}

    absl::Status Execute() override { return Step("execute", fail_execute_); }
    absl::Status Undo() override { return Step("undo", fail_undo_); }
    absl::Status Redo() override { return Step("redo", fail_redo_); }
    std::string Description() const override { return name_; }

    FakeCommand& FailExecute() { fail_execute_ = true; return *this; }
    FakeCommand& FailUndo() { fail_undo_ = true; return *this; }
    FakeCommand& FailRedo() { fail_redo_ = true; return *this; }
    FakeCommand& ThrowOnExecute() { throw_execute_ = true; return *this; }
    FakeCommand& ThrowIntOnUndo() { throw_undo_ = true; return *this; }

private:
    absl::Status Step(const std::string& action, bool fail) {
        if (action == "execute" && throw_execute_) {
            throw std::runtime_error("exploded");
        }
        if (action == "undo" && throw_undo_) {
            throw 42;
        }
        if (fail) {
            return absl::InvalidArgumentError(action + " refused");
        }
        journal_->push_back(action + ":" + name_);
        return absl::OkStatus();
    }

    std::string name_;
    std::vector<std::string>* journal_;
    bool fail_execute_ = false;
    bool fail_undo_ = false;
    bool fail_redo_ = false;
    bool throw_execute_ = false;
    bool throw_undo_ = false;
};

class CommandExecutorTest : public ::testing::Test {
protected:
    std::unique_ptr<FakeCommand> Make(const std::string& name) {
        return std::make_unique<FakeCommand>(name, &journal_);
    }

    bool Run(const std::string& name) { return executor_.ExecuteCommand(Make(name)); }

    std::vector<std::string> journal_;
    CommandExecutor executor_{3};
};

TEST_F(CommandExecutorTest, StartsEmpty) {
    EXPECT_FALSE(executor_.CanUndo());
    EXPECT_FALSE(executor_.CanRedo());
    EXPECT_FALSE(executor_.GetUndoDescription().has_value());
    EXPECT_FALSE(executor_.GetRedoDescription().has_value());
    EXPECT_TRUE(executor_.last_error().ok());
    EXPECT_EQ(CommandExecutor().max_undo_levels(), CommandExecutor::kDefaultMaxUndoLevels);
}

TEST_F(CommandExecutorTest, UndoAndRedoOnEmptyStacksReturnFalse) {
    EXPECT_FALSE(executor_.Undo());
    EXPECT_FALSE(executor_.Redo());
    EXPECT_TRUE(journal_.empty());
}

TEST_F(CommandExecutorTest, ExecutingWithinLimitRecordsEveryCommand) {
    ASSERT_TRUE(Run("a"));
    ASSERT_TRUE(Run("b"));
    ASSERT_TRUE(Run("c"));

    EXPECT_EQ(executor_.UndoStackSize(), 3u);
    EXPECT_EQ(executor_.RedoStackSize(), 0u);
    EXPECT_EQ(executor_.GetUndoDescription(), "c");
}

TEST_F(CommandExecutorTest, NewCommandClearsRedoStack) {
    ASSERT_TRUE(Run("a"));
    ASSERT_TRUE(Run("b"));
    ASSERT_TRUE(Run("c"));
    ASSERT_TRUE(executor_.Undo());
    ASSERT_TRUE(executor_.Undo());
    EXPECT_EQ(executor_.RedoStackSize(), 2u);

    ASSERT_TRUE(Run("d"));
    EXPECT_EQ(executor_.RedoStackSize(), 0u);
    EXPECT_EQ(executor_.UndoStackSize(), 2u);
    EXPECT_FALSE(executor_.Redo());
}

TEST_F(CommandExecutorTest, OldestCommandEvictedPastLimit) {
    auto first = Make("a");
    const Command* first_ptr = first.get();
    ASSERT_TRUE(executor_.ExecuteCommand(std::move(first)));
    ASSERT_TRUE(Run("b"));
    ASSERT_TRUE(Run("c"));
    ASSERT_TRUE(Run("d"));

    EXPECT_EQ(executor_.UndoStackSize(), 3u);
    for (const Command* command : executor_.UndoHistory()) {
        EXPECT_NE(command, first_ptr);
    }
    EXPECT_EQ(executor_.UndoHistory().front()->Description(), "b");
}

TEST_F(CommandExecutorTest, UndoRedoOrder) {
    ASSERT_TRUE(Run("a"));
    ASSERT_TRUE(Run("b"));

    ASSERT_TRUE(executor_.Undo());
    ASSERT_TRUE(executor_.Undo());
    EXPECT_EQ(executor_.GetRedoDescription(), "a");
    ASSERT_TRUE(executor_.Redo());
    EXPECT_EQ(executor_.GetUndoDescription(), "a");
    EXPECT_EQ(executor_.GetRedoDescription(), "b");

    EXPECT_EQ(journal_, (std::vector<std::string>{
        "execute:a", "execute:b", "undo:b", "undo:a", "redo:a"}));
}

TEST_F(CommandExecutorTest, FailedExecuteIsNotRecorded) {
    ASSERT_TRUE(Run("a"));
    ASSERT_TRUE(executor_.Undo());

    auto bad = Make("bad");
    bad->FailExecute();
    EXPECT_FALSE(executor_.ExecuteCommand(std::move(bad)));

    EXPECT_EQ(executor_.UndoStackSize(), 0u);
    EXPECT_EQ(executor_.RedoStackSize(), 1u);
    EXPECT_EQ(executor_.last_error().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_NE(executor_.last_error().message().find("'bad'"), std::string::npos);
}

TEST_F(CommandExecutorTest, NullCommandRejected) {
    EXPECT_FALSE(executor_.ExecuteCommand(nullptr));
    EXPECT_EQ(executor_.last_error().code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(CommandExecutorTest, ThrowingCommandBecomesInternalError) {
    auto bad = Make("thrower");
    bad->ThrowOnExecute();
    EXPECT_FALSE(executor_.ExecuteCommand(std::move(bad)));
    EXPECT_EQ(executor_.last_error().code(), absl::StatusCode::kInternal);
    EXPECT_NE(executor_.last_error().message().find("exploded"), std::string::npos);
    EXPECT_FALSE(executor_.CanUndo());
}

TEST_F(CommandExecutorTest, NonStandardThrowBecomesInternalError) {
    auto bad = Make("int-thrower");
    bad->ThrowIntOnUndo();
    ASSERT_TRUE(executor_.ExecuteCommand(std::move(bad)));

    EXPECT_FALSE(executor_.Undo());
    EXPECT_EQ(executor_.last_error().code(), absl::StatusCode::kInternal);
    EXPECT_NE(executor_.last_error().message().find("unknown exception"), std::string::npos);
    EXPECT_FALSE(executor_.CanUndo());
    EXPECT_FALSE(executor_.CanRedo());
}

TEST_F(CommandExecutorTest, HistoryListsOldestFirst) {
    ASSERT_TRUE(Run("a"));
    ASSERT_TRUE(Run("b"));
    ASSERT_TRUE(Run("c"));
    ASSERT_TRUE(executor_.Undo());
    ASSERT_TRUE(executor_.Undo());

    auto names = [](const std::vector<const Command*>& history) {
        std::vector<std::string> out;
        for (const Command* command : history) {
            out.push_back(command->Description());
        }
        return out;
    };
    EXPECT_EQ(names(executor_.UndoHistory()), (std::vector<std::string>{"a"}));
    EXPECT_EQ(names(executor_.RedoHistory()), (std::vector<std::string>{"c", "b"}));
    EXPECT_EQ(executor_.GetRedoDescription(), "b");
}

TEST_F(CommandExecutorTest, FailedUndoDropsCommand) {
    ASSERT_TRUE(Run("a"));
    auto fragile = Make("fragile");
    fragile->FailUndo();
    ASSERT_TRUE(executor_.ExecuteCommand(std::move(fragile)));

    EXPECT_FALSE(executor_.Undo());
    EXPECT_EQ(executor_.UndoStackSize(), 1u);
    EXPECT_EQ(executor_.RedoStackSize(), 0u);
    EXPECT_EQ(executor_.GetUndoDescription(), "a");
}

TEST_F(CommandExecutorTest, FailedRedoDropsCommand) {
    auto fragile = Make("fragile");
    fragile->FailRedo();
    ASSERT_TRUE(executor_.ExecuteCommand(std::move(fragile)));
    ASSERT_TRUE(executor_.Undo());

    EXPECT_FALSE(executor_.Redo());
    EXPECT_FALSE(executor_.CanUndo());
    EXPECT_FALSE(executor_.CanRedo());
}

TEST_F(CommandExecutorTest, LoweredLimitTrimsOneEntryPerExecute) {
    CommandExecutor executor(5);
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(executor.ExecuteCommand(Make("c" + std::to_string(i))));
    }
    executor.set_max_undo_levels(2);
    EXPECT_EQ(executor.UndoStackSize(), 5u);

    ASSERT_TRUE(executor.ExecuteCommand(Make("next")));
    EXPECT_EQ(executor.UndoStackSize(), 5u);
    EXPECT_EQ(executor.UndoHistory().front()->Description(), "c1");
}

TEST_F(CommandExecutorTest, ClearHistory) {
    ASSERT_TRUE(Run("a"));
    ASSERT_TRUE(Run("b"));
    ASSERT_TRUE(executor_.Undo());
    executor_.ClearHistory();
    EXPECT_FALSE(executor_.CanUndo());
    EXPECT_FALSE(executor_.CanRedo());
    EXPECT_EQ(journal_.size(), 3u);
}

}  // namespace
}  // namespace plotwise::commands
