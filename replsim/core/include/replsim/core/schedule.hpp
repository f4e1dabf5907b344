#pragma once

#include <replsim/core/inputs.hpp>
#include <replsim/core/types.hpp>

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace replsim::core {

/// @brief Kind of a schedule event.
/// @ingroup core_schedule
enum class EventKind {
    InTransitArrival, ///< Pending quantity credited to inventory.
    OrderPlaced       ///< Purchase order issued.
};

/// @brief Display name of @p kind ("In-Transit Arrival", "Order Placed").
[[nodiscard]] std::string_view to_string(EventKind kind) noexcept;

/// @brief Inverse of to_string(EventKind).
/// @throws UnknownEventError if @p text names no event kind.
[[nodiscard]] EventKind event_kind_from_string(std::string_view text);

/// @brief One row of a replenishment schedule.
///
/// Produced by the simulation. @c completed is the only field ever changed
/// after emission, and only by collaborators; the simulation ignores it.
///
/// @see ScheduleAssembler, CompletionOverlay
/// @ingroup core_schedule
struct ScheduleEvent {
    ItemIdentity item;
    EventKind kind{EventKind::OrderPlaced};
    std::optional<Date> order_date; ///< Empty for InTransitArrival events.
    Date arrival_date{};
    double quantity{0.0};
    bool completed{false};

    bool operator==(const ScheduleEvent&) const = default;
};

/// @brief Time-ordered sequence of schedule events (non-decreasing arrival date).
using Schedule = std::vector<ScheduleEvent>;

/// @brief Collects events as they are emitted and finalizes the schedule.
///
/// Events are appended in emission order. finish() attaches the item
/// identity, clears every completion flag and stable-sorts by arrival date,
/// so ties keep emission order.
///
/// @ingroup core_schedule
class ScheduleAssembler {
public:
    explicit ScheduleAssembler(ItemIdentity item);

    /// @brief Record a matured arrival credited on @p arrival_date.
    void record_arrival(Date arrival_date, double quantity);

    /// @brief Record an order placed on @p order_date, due on @p arrival_date.
    void record_order(Date order_date, Date arrival_date, double quantity);

    /// @brief Number of events recorded so far.
    [[nodiscard]] std::size_t size() const noexcept { return events_.size(); }

    /// @brief Produce the sorted schedule. The assembler is left empty.
    [[nodiscard]] Schedule finish();

private:
    ItemIdentity item_;
    Schedule events_;
};

} // namespace replsim::core
