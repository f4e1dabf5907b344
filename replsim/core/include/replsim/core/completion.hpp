#pragma once

#include <replsim/core/schedule.hpp>
#include <replsim/core/types.hpp>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace replsim::core {

/// @brief Stable identifier of a schedule event.
///
/// Identifies an event by what it is rather than by where it sits in a
/// list: the item's SKU, the event kind, the arrival date, and the ordinal
/// among events of the same schedule sharing those three values (0 for the
/// first). Regenerating a schedule from the same inputs yields the same keys.
///
/// @see event_keys, CompletionOverlay
/// @ingroup core_schedule
struct EventKey {
    std::string sku;
    EventKind kind{EventKind::OrderPlaced};
    Date arrival_date{};
    uint32_t ordinal{0};

    auto operator<=>(const EventKey&) const = default;
    bool operator==(const EventKey&) const = default;
};

/// @brief Compute the key of every event, index-aligned with @p schedule.
[[nodiscard]] std::vector<EventKey> event_keys(const Schedule& schedule);

/// @brief Completion flags kept apart from the schedules they describe.
///
/// Only completed keys are stored. Because flags are keyed by EventKey
/// rather than by row index, reordering or regenerating a schedule cannot
/// move a flag onto an unrelated event. Flags whose event no longer exists
/// are simply never applied.
///
/// Not thread-safe; intended for a single writer.
///
/// @ingroup core_schedule
class CompletionOverlay {
public:
    /// @brief Mark @p key completed (or not).
    void set_completed(const EventKey& key, bool completed);

    /// @brief True if @p key has been marked completed.
    [[nodiscard]] bool is_completed(const EventKey& key) const;

    /// @brief Copy the stored flags onto the events of @p schedule.
    void apply(Schedule& schedule) const;

    /// @brief Replace the flags of every event in @p schedule with the
    ///        event's own @c completed value.
    void capture(const Schedule& schedule);

    /// @brief Forget every flag belonging to @p sku.
    void clear_item(std::string_view sku);

    /// @brief Number of completed keys.
    [[nodiscard]] std::size_t size() const noexcept { return completed_.size(); }

private:
    std::set<EventKey> completed_;
};

} // namespace replsim::core
