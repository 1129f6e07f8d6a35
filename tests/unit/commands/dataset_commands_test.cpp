/// @file dataset_commands_test.cpp
/// @brief Tests for column, row and dataset creation commands

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <unistd.h>

#include <gtest/gtest.h>

#include "commands/command_executor.h"
#include "commands/dataset_commands.h"

namespace plotwise::commands {
namespace {

using model::Column;
using model::DataType;
using model::Table;
using model::Value;

class DatasetCommandsTest : public ::testing::Test {
protected:
    void SetUp() override {
        bus_.Subscribe("*", [this](const events::Event& e) {
            events_.push_back(e.type);
            last_fields_ = e.fields;
        });

        auto project = std::make_unique<model::Project>("Test");
        Table table;
        ASSERT_TRUE(table.AddColumn(Column{
            .name = "x",
            .dtype = DataType::kInt64,
            .values = {int64_t{1}, int64_t{2}, int64_t{3}},
        }).ok());
        ASSERT_TRUE(table.AddColumn(Column{
            .name = "y",
            .dtype = DataType::kFloat64,
            .values = {1.5, 2.5, 3.5},
        }).ok());
        original_ = table;
        ASSERT_TRUE(project->AddItem(std::make_unique<model::Dataset>("data", table, "dataset-1"))
                        .ok());
        state_.LoadProject(std::move(project));
        events_.clear();
    }

    const Table& Data() {
        return state_.current_project()->GetDataset("dataset-1").value()->data();
    }

    events::EventBus bus_;
    state::AppState state_{bus_};
    CommandExecutor executor_;
    Table original_;
    std::vector<std::string> events_;
    nlohmann::json last_fields_;
};

TEST_F(DatasetCommandsTest, AddColumnDefaultsToZeroAndUndoRemovesIt) {
    ASSERT_TRUE(executor_.ExecuteCommand(
        std::make_unique<AddColumnCommand>(state_, "dataset-1", "X", Value{int64_t{0}})));

    const Column* added = Data().GetColumn("X");
    ASSERT_NE(added, nullptr);
    EXPECT_EQ(added->values, (std::vector<Value>{int64_t{0}, int64_t{0}, int64_t{0}}));
    EXPECT_EQ(events_.back(), "dataset_column_added");
    EXPECT_EQ(last_fields_["column_name"], "X");
    EXPECT_EQ(last_fields_["dataset_id"], "dataset-1");

    ASSERT_TRUE(executor_.Undo());
    EXPECT_FALSE(Data().HasColumn("X"));
    EXPECT_TRUE(Data() == original_);
    EXPECT_EQ(events_.back(), "dataset_column_removed");

    ASSERT_TRUE(executor_.Redo());
    EXPECT_TRUE(Data().HasColumn("X"));
}

TEST_F(DatasetCommandsTest, AddColumnInfersDefaultFromTable) {
    auto command = std::make_unique<AddColumnCommand>(state_, "dataset-1", "Z");
    const AddColumnCommand* raw = command.get();
    ASSERT_TRUE(executor_.ExecuteCommand(std::move(command)));
    EXPECT_TRUE(raw->applied_default() == Value{int64_t{0}});
    EXPECT_EQ(Data().GetColumn("Z")->dtype, DataType::kInt64);
    EXPECT_EQ(executor_.GetUndoDescription(), "Add column 'Z' to dataset");
}

TEST_F(DatasetCommandsTest, AddColumnUsesEmptyStringWithoutNumericColumns) {
    Table text;
    ASSERT_TRUE(text.AddColumn(Column{
        .name = "name",
        .dtype = DataType::kString,
        .values = {std::string("a")},
    }).ok());
    ASSERT_TRUE(state_.current_project()
                    ->AddItem(std::make_unique<model::Dataset>("text", text, "dataset-2"))
                    .ok());

    AddColumnCommand command(state_, "dataset-2", "note");
    ASSERT_TRUE(command.Execute().ok());
    EXPECT_TRUE(command.applied_default() == Value{std::string()});
}

TEST_F(DatasetCommandsTest, AddColumnValidation) {
    EXPECT_EQ(AddColumnCommand(state_, "dataset-1", "x").Execute().code(),
              absl::StatusCode::kAlreadyExists);
    EXPECT_EQ(AddColumnCommand(state_, "dataset-1", "").Execute().code(),
              absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(AddColumnCommand(state_, "missing", "X").Execute().code(),
              absl::StatusCode::kNotFound);

    ASSERT_TRUE(state_.current_project()
                    ->AddItem(std::make_unique<model::Dataset>("empty", Table{}, "dataset-e"))
                    .ok());
    auto status = AddColumnCommand(state_, "dataset-e", "X").Execute();
    EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
    EXPECT_NE(status.message().find("empty dataset"), std::string::npos);

    EXPECT_TRUE(Data() == original_);
    EXPECT_TRUE(events_.empty());
}

TEST_F(DatasetCommandsTest, AddColumnWithoutProject) {
    state_.CloseProject();
    EXPECT_EQ(AddColumnCommand(state_, "dataset-1", "X").Execute().code(),
              absl::StatusCode::kFailedPrecondition);
}

TEST_F(DatasetCommandsTest, UndoBeforeExecuteFails) {
    AddColumnCommand command(state_, "dataset-1", "X");
    EXPECT_FALSE(command.Undo().ok());
}

TEST_F(DatasetCommandsTest, AddRowAppendsDefaults) {
    auto command = std::make_unique<AddRowCommand>(state_, "dataset-1");
    const AddRowCommand* raw = command.get();
    ASSERT_TRUE(executor_.ExecuteCommand(std::move(command)));

    EXPECT_EQ(Data().RowCount(), 4u);
    EXPECT_EQ(raw->inserted_at(), 3u);
    EXPECT_TRUE(Data().GetColumn("x")->values[3] == Value{int64_t{0}});
    EXPECT_TRUE(Data().GetColumn("y")->values[3] == Value{0.0});
    EXPECT_EQ(last_fields_["row_position"], 3);

    ASSERT_TRUE(executor_.Undo());
    EXPECT_TRUE(Data() == original_);
    EXPECT_EQ(events_.back(), "dataset_row_removed");
}

TEST_F(DatasetCommandsTest, AddRowAtPosition) {
    ASSERT_TRUE(executor_.ExecuteCommand(std::make_unique<AddRowCommand>(state_, "dataset-1", 1)));
    EXPECT_EQ(Data().GetColumn("x")->values,
              (std::vector<Value>{int64_t{1}, int64_t{0}, int64_t{2}, int64_t{3}}));
    EXPECT_EQ(executor_.GetUndoDescription(), "Insert row at 1 in dataset");
}

TEST_F(DatasetCommandsTest, AddRowPastEndAppends) {
    AddRowCommand command(state_, "dataset-1", 99);
    ASSERT_TRUE(command.Execute().ok());
    EXPECT_EQ(command.inserted_at(), 3u);
}

TEST_F(DatasetCommandsTest, AddRowNeedsColumns) {
    ASSERT_TRUE(state_.current_project()
                    ->AddItem(std::make_unique<model::Dataset>("empty", Table{}, "dataset-e"))
                    .ok());
    EXPECT_EQ(AddRowCommand(state_, "dataset-e").Execute().code(),
              absl::StatusCode::kInvalidArgument);
}

TEST_F(DatasetCommandsTest, CreateEmptyDatasetUndoRedoKeepsId) {
    auto command = std::make_unique<CreateEmptyDatasetCommand>(state_, "Sheet");
    const CreateEmptyDatasetCommand* raw = command.get();
    ASSERT_TRUE(executor_.ExecuteCommand(std::move(command)));

    const std::string id = raw->dataset_id();
    auto dataset = state_.current_project()->GetDataset(id);
    ASSERT_TRUE(dataset.ok());
    EXPECT_EQ((*dataset)->data().ColumnNames(),
              (std::vector<std::string>{"Column1", "Column2", "Column3"}));
    EXPECT_EQ((*dataset)->data().RowCount(), 1u);
    EXPECT_EQ(events_.back(), "dataset_created");

    ASSERT_TRUE(executor_.Undo());
    EXPECT_EQ(state_.current_project()->FindItem(id), nullptr);
    EXPECT_EQ(events_.back(), "dataset_removed");

    ASSERT_TRUE(executor_.Redo());
    EXPECT_NE(state_.current_project()->FindItem(id), nullptr);
    EXPECT_EQ(state_.current_project()->IndexOf(id), 1u);
}

TEST(CreateEmptyDatasetTableTest, ThreeBlankStringColumns) {
    auto table = CreateEmptyDatasetCommand::EmptyTable();
    ASSERT_TRUE(table.ok()) << table.status();
    EXPECT_EQ(table->ColumnCount(), 3u);
    EXPECT_EQ(table->RowCount(), 1u);
    for (const auto& name : table->ColumnNames()) {
        const model::Column* column = table->GetColumn(name);
        ASSERT_NE(column, nullptr);
        EXPECT_EQ(column->dtype, model::DataType::kString);
    }
}

TEST_F(DatasetCommandsTest, CreateEmptyDatasetRejectsUnknownFolder) {
    CreateEmptyDatasetCommand command(state_, "Sheet", std::string("folder-missing"));
    EXPECT_EQ(command.Execute().code(), absl::StatusCode::kNotFound);
    EXPECT_EQ(state_.current_project()->ItemCount(), 1u);
}

TEST_F(DatasetCommandsTest, ImportCsvCreatesDatasetNamedAfterFile) {
    auto path = std::filesystem::temp_directory_path() /
                ("plotwise_import_" + std::to_string(::getpid()) + ".csv");
    {
        std::ofstream out(path);
        out << "t,v\n0,1.0\n1,2.0\n";
    }

    auto command = std::make_unique<ImportCsvCommand>(state_, path.string());
    const ImportCsvCommand* raw = command.get();
    bool ok = executor_.ExecuteCommand(std::move(command));
    std::filesystem::remove(path);
    ASSERT_TRUE(ok) << executor_.last_error();

    auto dataset = state_.current_project()->GetDataset(raw->dataset_id());
    ASSERT_TRUE(dataset.ok());
    EXPECT_EQ((*dataset)->name(), path.stem().string());
    EXPECT_EQ((*dataset)->data().RowCount(), 2u);
    EXPECT_EQ((*dataset)->source_file().value_or(""), path.string());
    EXPECT_EQ(last_fields_["rows"], 2);

    ASSERT_TRUE(executor_.Undo());
    EXPECT_FALSE(state_.current_project()->GetDataset(raw->dataset_id()).ok());
}

TEST_F(DatasetCommandsTest, ImportMissingFileFails) {
    EXPECT_FALSE(executor_.ExecuteCommand(
        std::make_unique<ImportCsvCommand>(state_, "/nonexistent/plotwise.csv")));
    EXPECT_EQ(executor_.last_error().code(), absl::StatusCode::kNotFound);
    EXPECT_FALSE(executor_.CanUndo());
}

}  // namespace
}  // namespace plotwise::commands
