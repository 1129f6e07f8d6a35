#pragma once

/// @file event_bus.h
/// @brief Synchronous publish/subscribe for domain change notifications

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace plotwise::model {
class Project;
class Table;
}  // namespace plotwise::model

namespace plotwise::events {

/// Event type names emitted by commands and application state
namespace event_types {
inline constexpr const char* kDatasetColumnAdded = "dataset_column_added";
inline constexpr const char* kDatasetColumnRemoved = "dataset_column_removed";
inline constexpr const char* kDatasetRowAdded = "dataset_row_added";
inline constexpr const char* kDatasetRowRemoved = "dataset_row_removed";
inline constexpr const char* kDatasetAnalysisApplied = "dataset_analysis_applied";
inline constexpr const char* kDatasetAnalysisReverted = "dataset_analysis_reverted";
inline constexpr const char* kDatasetTransformApplied = "dataset_transform_applied";
inline constexpr const char* kDatasetTransformReverted = "dataset_transform_reverted";
inline constexpr const char* kDatasetCreated = "dataset_created";
inline constexpr const char* kDatasetImported = "dataset_imported";
inline constexpr const char* kDatasetRemoved = "dataset_removed";
inline constexpr const char* kFolderCreated = "folder_created";
inline constexpr const char* kNoteCreated = "note_created";
inline constexpr const char* kChartCreated = "chart_created";
inline constexpr const char* kNoteEdited = "note_edited";
inline constexpr const char* kItemRenamed = "item_renamed";
inline constexpr const char* kItemDeleted = "item_deleted";
inline constexpr const char* kItemRestored = "item_restored";
inline constexpr const char* kItemMoved = "item_moved";
inline constexpr const char* kProjectLoaded = "project_loaded";
inline constexpr const char* kProjectClosed = "project_closed";
inline constexpr const char* kProjectSaved = "project_saved";
}  // namespace event_types

/// @brief A change notification
///
/// Dataset events carry {dataset_id, dataset_name, ...} in fields and point
/// at the dataset's table. Pointers are only valid during dispatch.
struct Event {
    std::string type;
    const model::Project* project = nullptr;
    const model::Table* dataset_data = nullptr;
    nlohmann::json fields = nlohmann::json::object();
};

using EventCallback = std::function<void(const Event&)>;
using SubscriptionId = uint64_t;

/// @brief Dispatches events to subscribers in subscription order
///
/// Patterns are exact type names or a prefix followed by '*'
/// ("dataset_*"); a lone "*" receives everything.
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    SubscriptionId Subscribe(std::string pattern, EventCallback callback);

    /// @return false if the id was unknown
    bool Unsubscribe(SubscriptionId id);

    void Emit(const Event& event);

    size_t SubscriberCount() const { return subscribers_.size(); }

    /// @brief Whether a subscription pattern accepts an event type
    static bool Matches(std::string_view pattern, std::string_view type);

private:
    struct Subscriber {
        SubscriptionId id;
        std::string pattern;
        EventCallback callback;
    };

    std::vector<Subscriber> subscribers_;
    SubscriptionId next_id_ = 1;
};

}  // namespace plotwise::events
