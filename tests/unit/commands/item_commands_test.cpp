/// @file item_commands_test.cpp
/// @brief Tests for project tree commands

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "commands/command_executor.h"
#include "commands/item_commands.h"

namespace plotwise::commands {
namespace {

class ItemCommandsTest : public ::testing::Test {
protected:
    void SetUp() override {
        bus_.Subscribe("*", [this](const events::Event& e) {
            events_.push_back(e.type);
            last_fields_ = e.fields;
        });

        auto project = std::make_unique<model::Project>("Test");
        auto data = std::make_unique<model::Folder>("Data", "folder-data");
        data->InsertChild(std::make_unique<model::Folder>("Raw", "folder-raw"));
        data->InsertChild(std::make_unique<model::Dataset>("ds", model::Table{}, "dataset-1"));
        ASSERT_TRUE(project->AddItem(std::move(data)).ok());
        ASSERT_TRUE(project->AddItem(std::make_unique<model::Note>("Readme", "v1", "note-1")).ok());
        ASSERT_TRUE(project->AddItem(std::make_unique<model::Folder>("Out", "folder-out")).ok());
        state_.LoadProject(std::move(project));
        events_.clear();
    }

    model::Project& Tree() { return *state_.current_project(); }

    events::EventBus bus_;
    state::AppState state_{bus_};
    CommandExecutor executor_;
    std::vector<std::string> events_;
    nlohmann::json last_fields_;
};

TEST_F(ItemCommandsTest, CreateFolderUnderParentAndUndo) {
    auto command = std::make_unique<CreateFolderCommand>(state_, "Plots",
                                                         std::string("folder-data"));
    const CreateFolderCommand* raw = command.get();
    ASSERT_TRUE(executor_.ExecuteCommand(std::move(command)));

    const std::string id = raw->folder_id();
    ASSERT_NE(Tree().FindItem(id), nullptr);
    EXPECT_EQ(Tree().FindItem(id)->parent_id(), "folder-data");
    EXPECT_EQ(events_.back(), "folder_created");
    EXPECT_EQ(executor_.GetUndoDescription(), "Create Folder 'Plots'");

    ASSERT_TRUE(executor_.Undo());
    EXPECT_EQ(Tree().FindItem(id), nullptr);

    ASSERT_TRUE(executor_.Redo());
    EXPECT_EQ(Tree().IndexOf(id), 2u);
}

TEST_F(ItemCommandsTest, CreateFolderRootAlias) {
    CreateFolderCommand command(state_, "Top", std::string("root"));
    ASSERT_TRUE(command.Execute().ok());
    EXPECT_EQ(Tree().FindItem(command.folder_id())->parent_id(), Tree().root().id());
}

TEST_F(ItemCommandsTest, CreateFolderValidation) {
    EXPECT_EQ(CreateFolderCommand(state_, "").Execute().code(),
              absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(CreateFolderCommand(state_, "x", std::string("note-1")).Execute().code(),
              absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(CreateFolderCommand(state_, "x", std::string("folder-none")).Execute().code(),
              absl::StatusCode::kNotFound);
}

model::Table NumericTable(const std::vector<std::string>& names) {
    model::Table table;
    for (const auto& name : names) {
        EXPECT_TRUE(table.AddColumn(model::Column{
            .name = name,
            .dtype = model::DataType::kFloat64,
            .values = {1.0, 2.0, 3.0},
        }).ok());
    }
    return table;
}

TEST_F(ItemCommandsTest, CreateChartPlotsSecondColumnAgainstFirst) {
    ASSERT_TRUE(Tree().AddItem(std::make_unique<model::Dataset>(
        "Sensor", NumericTable({"time", "temp", "humidity"}), "dataset-2")).ok());

    auto command = std::make_unique<CreateChartCommand>(state_, "dataset-2", std::nullopt,
                                                        std::string("folder-out"));
    const CreateChartCommand* raw = command.get();
    ASSERT_TRUE(executor_.ExecuteCommand(std::move(command)));

    const std::string id = raw->chart_id();
    auto* chart = dynamic_cast<model::Chart*>(Tree().FindItem(id));
    ASSERT_NE(chart, nullptr);
    EXPECT_EQ(chart->name(), "Chart from Sensor");
    EXPECT_EQ(chart->chart_type(), "line");
    EXPECT_EQ(chart->parent_id(), "folder-out");
    ASSERT_EQ(chart->series().size(), 1u);
    EXPECT_EQ(chart->series()[0].dataset_id, "dataset-2");
    EXPECT_EQ(chart->series()[0].x_column, "time");
    EXPECT_EQ(chart->series()[0].y_column, "temp");
    EXPECT_EQ(chart->series()[0].label, "Sensor:temp");
    EXPECT_EQ(events_.back(), "chart_created");
    EXPECT_EQ(last_fields_["dataset_id"], "dataset-2");
    EXPECT_EQ(executor_.GetUndoDescription(), "Create Chart from 'Sensor'");

    ASSERT_TRUE(executor_.Undo());
    EXPECT_EQ(Tree().FindItem(id), nullptr);
    EXPECT_EQ(events_.back(), "item_deleted");

    ASSERT_TRUE(executor_.Redo());
    chart = dynamic_cast<model::Chart*>(Tree().FindItem(id));
    ASSERT_NE(chart, nullptr);
    EXPECT_EQ(chart->parent_id(), "folder-out");
    EXPECT_EQ(chart->series().size(), 1u);
    EXPECT_EQ(events_.back(), "chart_created");
}

TEST_F(ItemCommandsTest, CreateChartSingleColumnUsesIndex) {
    ASSERT_TRUE(Tree().AddItem(std::make_unique<model::Dataset>(
        "Counts", NumericTable({"n"}), "dataset-2")).ok());

    CreateChartCommand command(state_, "dataset-2", std::string("Trend"));
    ASSERT_TRUE(command.Execute().ok());
    const auto* chart = dynamic_cast<const model::Chart*>(Tree().FindItem(command.chart_id()));
    ASSERT_NE(chart, nullptr);
    EXPECT_EQ(chart->name(), "Trend");
    EXPECT_EQ(chart->parent_id(), Tree().root().id());
    ASSERT_EQ(chart->series().size(), 1u);
    EXPECT_TRUE(chart->series()[0].x_column.empty());
    EXPECT_EQ(chart->series()[0].y_column, "n");
}

TEST_F(ItemCommandsTest, CreateChartFromEmptyDatasetHasNoSeries) {
    CreateChartCommand command(state_, "dataset-1");
    ASSERT_TRUE(command.Execute().ok());
    const auto* chart = dynamic_cast<const model::Chart*>(Tree().FindItem(command.chart_id()));
    ASSERT_NE(chart, nullptr);
    EXPECT_EQ(chart->name(), "Chart from ds");
    EXPECT_TRUE(chart->series().empty());
}

TEST_F(ItemCommandsTest, CreateChartValidation) {
    EXPECT_EQ(CreateChartCommand(state_, "dataset-none").Execute().code(),
              absl::StatusCode::kNotFound);
    EXPECT_EQ(CreateChartCommand(state_, "note-1").Execute().code(),
              absl::StatusCode::kNotFound);

    CreateChartCommand never_run(state_, "dataset-1");
    EXPECT_EQ(never_run.Undo().code(), absl::StatusCode::kFailedPrecondition);
}

TEST_F(ItemCommandsTest, CreateAndEditNote) {
    auto create = std::make_unique<CreateNoteCommand>(state_, "Log", "first");
    const CreateNoteCommand* raw = create.get();
    ASSERT_TRUE(executor_.ExecuteCommand(std::move(create)));
    const std::string id = raw->note_id();
    EXPECT_EQ(events_.back(), "note_created");

    ASSERT_TRUE(executor_.ExecuteCommand(std::make_unique<EditNoteCommand>(state_, id, "second")));
    auto* note = static_cast<model::Note*>(Tree().FindItem(id));
    EXPECT_EQ(note->content(), "second");
    EXPECT_EQ(events_.back(), "note_edited");

    ASSERT_TRUE(executor_.Undo());
    EXPECT_EQ(note->content(), "first");
    ASSERT_TRUE(executor_.Redo());
    EXPECT_EQ(note->content(), "second");
}

TEST_F(ItemCommandsTest, EditNoteRejectsOtherItems) {
    EXPECT_EQ(EditNoteCommand(state_, "folder-data", "x").Execute().code(),
              absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(EditNoteCommand(state_, "note-404", "x").Execute().code(),
              absl::StatusCode::kNotFound);
}

TEST_F(ItemCommandsTest, RenameAndUndo) {
    ASSERT_TRUE(executor_.ExecuteCommand(
        std::make_unique<RenameItemCommand>(state_, "dataset-1", "measurements")));
    EXPECT_EQ(Tree().FindItem("dataset-1")->name(), "measurements");
    EXPECT_EQ(last_fields_["old_name"], "ds");
    EXPECT_EQ(last_fields_["new_name"], "measurements");
    EXPECT_EQ(executor_.GetUndoDescription(), "Rename to 'measurements'");

    ASSERT_TRUE(executor_.Undo());
    EXPECT_EQ(Tree().FindItem("dataset-1")->name(), "ds");
}

TEST_F(ItemCommandsTest, RenameValidation) {
    EXPECT_EQ(RenameItemCommand(state_, "dataset-1", "").Execute().code(),
              absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(RenameItemCommand(state_, Tree().root().id(), "Top").Execute().code(),
              absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(RenameItemCommand(state_, "missing", "x").Execute().code(),
              absl::StatusCode::kNotFound);
}

TEST_F(ItemCommandsTest, DeleteFolderSubtreeUndoRestoresIdsAndPosition) {
    ASSERT_TRUE(executor_.ExecuteCommand(std::make_unique<DeleteItemCommand>(state_, "folder-data")));
    EXPECT_EQ(Tree().FindItem("folder-data"), nullptr);
    EXPECT_EQ(Tree().FindItem("folder-raw"), nullptr);
    EXPECT_EQ(Tree().FindItem("dataset-1"), nullptr);
    EXPECT_EQ(Tree().ItemCount(), 2u);
    EXPECT_EQ(events_.back(), "item_deleted");
    EXPECT_EQ(last_fields_["position"], 0);
    EXPECT_EQ(executor_.GetUndoDescription(), "Delete 'Data'");

    ASSERT_TRUE(executor_.Undo());
    EXPECT_EQ(Tree().ItemCount(), 5u);
    EXPECT_EQ(Tree().IndexOf("folder-data"), 0u);
    EXPECT_EQ(Tree().FindItem("dataset-1")->parent_id(), "folder-data");
    EXPECT_EQ(events_.back(), "item_restored");

    ASSERT_TRUE(executor_.Redo());
    EXPECT_EQ(Tree().FindItem("folder-data"), nullptr);
}

TEST_F(ItemCommandsTest, DeleteRootRejected) {
    EXPECT_EQ(DeleteItemCommand(state_, Tree().root().id()).Execute().code(),
              absl::StatusCode::kInvalidArgument);
}

TEST_F(ItemCommandsTest, MoveAndUndoRestoresPosition) {
    ASSERT_TRUE(executor_.ExecuteCommand(
        std::make_unique<MoveItemCommand>(state_, "note-1", "folder-out")));
    EXPECT_EQ(Tree().FindItem("note-1")->parent_id(), "folder-out");
    EXPECT_EQ(last_fields_["old_parent_id"], Tree().root().id());
    EXPECT_EQ(last_fields_["new_parent_id"], "folder-out");

    ASSERT_TRUE(executor_.Undo());
    EXPECT_EQ(Tree().FindItem("note-1")->parent_id(), Tree().root().id());
    EXPECT_EQ(Tree().IndexOf("note-1"), 1u);
}

TEST_F(ItemCommandsTest, MoveIntoOwnSubtreeRejected) {
    EXPECT_FALSE(executor_.ExecuteCommand(
        std::make_unique<MoveItemCommand>(state_, "folder-data", "folder-raw")));
    EXPECT_EQ(executor_.last_error().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(Tree().FindItem("folder-raw")->parent_id(), "folder-data");
    EXPECT_TRUE(events_.empty());
}

TEST_F(ItemCommandsTest, CommandsNeedProject) {
    state_.CloseProject();
    EXPECT_EQ(CreateFolderCommand(state_, "x").Execute().code(),
              absl::StatusCode::kFailedPrecondition);
    EXPECT_EQ(DeleteItemCommand(state_, "note-1").Execute().code(),
              absl::StatusCode::kFailedPrecondition);
}

}  // namespace
}  // namespace plotwise::commands
