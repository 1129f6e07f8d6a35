/// @file snapshot_test.cpp
/// @brief Tests for captured undo state

#include <gtest/gtest.h>

#include "commands/snapshot.h"

namespace plotwise::commands {
namespace {

using model::Column;
using model::DataType;
using model::Table;
using model::Value;

Table TwoColumns() {
    Table table;
    EXPECT_TRUE(table.AddColumn(Column{
        .name = "a",
        .dtype = DataType::kInt64,
        .values = {int64_t{1}, int64_t{2}},
    }).ok());
    EXPECT_TRUE(table.AddColumn(Column{
        .name = "b",
        .dtype = DataType::kString,
        .values = {std::string("p"), std::string("q")},
    }).ok());
    return table;
}

TEST(TableSnapshotTest, CaptureIsACopy) {
    Table table = TwoColumns();
    TableSnapshot snapshot;
    EXPECT_FALSE(snapshot.captured());

    snapshot.Capture(table);
    ASSERT_TRUE(table.DropColumn("b").ok());
    ASSERT_TRUE(snapshot.captured());
    EXPECT_EQ(snapshot.table().ColumnCount(), 2u);

    snapshot.Reset();
    EXPECT_FALSE(snapshot.captured());
}

TEST(ColumnSnapshotTest, RestoresReplacedColumn) {
    const Table original = TwoColumns();
    ColumnSnapshot snapshot;
    snapshot.Capture(original, "b");
    EXPECT_TRUE(snapshot.existed_before());

    Table changed = original;
    ASSERT_TRUE(changed.SetColumn(Column{
        .name = "b",
        .dtype = DataType::kFloat64,
        .values = {0.5, 1.5},
    }).ok());

    auto restored = snapshot.Restore(changed);
    ASSERT_TRUE(restored.ok()) << restored.status();
    EXPECT_TRUE(*restored == original);
}

TEST(ColumnSnapshotTest, DropsColumnThatDidNotExist) {
    const Table original = TwoColumns();
    ColumnSnapshot snapshot;
    snapshot.Capture(original, "c");
    EXPECT_FALSE(snapshot.existed_before());

    Table changed = original;
    ASSERT_TRUE(changed.AddColumn(Column{
        .name = "c",
        .dtype = DataType::kBool,
        .values = {true, false},
    }).ok());

    auto restored = snapshot.Restore(changed);
    ASSERT_TRUE(restored.ok());
    EXPECT_TRUE(*restored == original);
}

TEST(ColumnSnapshotTest, RejectsRowCountDrift) {
    ColumnSnapshot snapshot;
    EXPECT_EQ(snapshot.Restore(TwoColumns()).status().code(),
              absl::StatusCode::kFailedPrecondition);

    snapshot.Capture(TwoColumns(), "a");
    Table grown = TwoColumns();
    ASSERT_TRUE(grown.InsertRow(2, {int64_t{3}, std::string("r")}).ok());
    EXPECT_EQ(snapshot.Restore(grown).status().code(), absl::StatusCode::kInternal);
}

TEST(DetachedItemTest, DetachAndReattachKeepsPosition) {
    model::Project project("Test");
    ASSERT_TRUE(project.AddItem(std::make_unique<model::Note>("one", "", "note-1")).ok());
    ASSERT_TRUE(project.AddItem(std::make_unique<model::Note>("two", "", "note-2")).ok());

    DetachedItem detached;
    ASSERT_TRUE(detached.Detach(project, "note-1").ok());
    EXPECT_TRUE(detached.holding());
    EXPECT_EQ(detached.position(), 0u);
    EXPECT_EQ(project.FindItem("note-1"), nullptr);
    EXPECT_EQ(detached.Detach(project, "note-2").code(), absl::StatusCode::kFailedPrecondition);

    auto reattached = detached.Reattach(project);
    ASSERT_TRUE(reattached.ok());
    EXPECT_EQ((*reattached)->id(), "note-1");
    EXPECT_EQ(project.IndexOf("note-1"), 0u);
    EXPECT_FALSE(detached.holding());
    EXPECT_EQ(detached.Reattach(project).status().code(), absl::StatusCode::kFailedPrecondition);
}

TEST(DetachedItemTest, KeepsItemWhenParentIsGone) {
    model::Project project("Test");
    ASSERT_TRUE(project.AddItem(std::make_unique<model::Folder>("f", "folder-1")).ok());
    ASSERT_TRUE(
        project.AddItem(std::make_unique<model::Note>("n", "", "note-1"), "folder-1").ok());

    DetachedItem detached;
    ASSERT_TRUE(detached.Detach(project, "note-1").ok());
    ASSERT_TRUE(project.RemoveItem("folder-1").ok());

    EXPECT_EQ(detached.Reattach(project).status().code(), absl::StatusCode::kNotFound);
    EXPECT_TRUE(detached.holding());
    EXPECT_EQ(detached.item()->id(), "note-1");
}

}  // namespace
}  // namespace plotwise::commands
