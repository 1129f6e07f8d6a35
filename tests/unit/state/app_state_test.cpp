/// @file app_state_test.cpp
/// @brief Tests for application state

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "state/app_state.h"

namespace plotwise::state {
namespace {

class AppStateTest : public ::testing::Test {
protected:
    void SetUp() override {
        bus_.Subscribe("project_*", [this](const events::Event& e) {
            received_.push_back(e.type);
            last_project_ = e.project;
        });
    }

    events::EventBus bus_;
    AppState state_{bus_};
    std::vector<std::string> received_;
    const model::Project* last_project_ = nullptr;
};

TEST_F(AppStateTest, StartsWithoutProject) {
    EXPECT_FALSE(state_.has_project());
    EXPECT_EQ(state_.current_project(), nullptr);
    EXPECT_FALSE(state_.project_path().has_value());
}

TEST_F(AppStateTest, LoadProjectReturnsPrevious) {
    auto first = state_.LoadProject(std::make_unique<model::Project>("One"), "/tmp/one.plotwise");
    EXPECT_TRUE(first == nullptr);
    ASSERT_TRUE(state_.has_project());
    EXPECT_EQ(state_.current_project()->name(), "One");
    EXPECT_EQ(state_.project_path().value_or(""), "/tmp/one.plotwise");

    auto previous = state_.LoadProject(std::make_unique<model::Project>("Two"));
    ASSERT_TRUE(previous != nullptr);
    EXPECT_EQ(previous->name(), "One");
    EXPECT_FALSE(state_.project_path().has_value());

    EXPECT_EQ(received_, (std::vector<std::string>{"project_loaded", "project_loaded"}));
    EXPECT_EQ(last_project_, state_.current_project());
}

TEST_F(AppStateTest, CloseProject) {
    state_.LoadProject(std::make_unique<model::Project>("One"), "/tmp/one.plotwise");
    auto closed = state_.CloseProject();
    ASSERT_TRUE(closed != nullptr);
    EXPECT_FALSE(state_.has_project());
    EXPECT_FALSE(state_.project_path().has_value());
    EXPECT_EQ(received_.back(), "project_closed");

    EXPECT_TRUE(state_.CloseProject() == nullptr);
    EXPECT_EQ(received_.size(), 2u);
}

TEST_F(AppStateTest, EmitStampsCurrentProject) {
    state_.LoadProject(std::make_unique<model::Project>("One"));
    state_.Emit(events::Event{.type = events::event_types::kProjectSaved});
    EXPECT_EQ(received_.back(), "project_saved");
    EXPECT_EQ(last_project_, state_.current_project());
}

}  // namespace
}  // namespace plotwise::state
