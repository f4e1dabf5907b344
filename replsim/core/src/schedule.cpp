#include <replsim/core/schedule.hpp>
#include <replsim/core/error.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace replsim::core {

std::string_view to_string(EventKind kind) noexcept {
    switch (kind) {
        case EventKind::InTransitArrival: return "In-Transit Arrival";
        case EventKind::OrderPlaced:      return "Order Placed";
    }
    return "Unknown";
}

EventKind event_kind_from_string(std::string_view text) {
    if (text == to_string(EventKind::InTransitArrival)) {
        return EventKind::InTransitArrival;
    }
    if (text == to_string(EventKind::OrderPlaced)) {
        return EventKind::OrderPlaced;
    }
    throw UnknownEventError("unknown schedule event '" + std::string(text) + "'");
}

ScheduleAssembler::ScheduleAssembler(ItemIdentity item)
    : item_(std::move(item)) {}

void ScheduleAssembler::record_arrival(Date arrival_date, double quantity) {
    ScheduleEvent event;
    event.kind = EventKind::InTransitArrival;
    event.arrival_date = arrival_date;
    event.quantity = quantity;
    events_.push_back(std::move(event));
}

void ScheduleAssembler::record_order(Date order_date, Date arrival_date, double quantity) {
    ScheduleEvent event;
    event.kind = EventKind::OrderPlaced;
    event.order_date = order_date;
    event.arrival_date = arrival_date;
    event.quantity = quantity;
    events_.push_back(std::move(event));
}

Schedule ScheduleAssembler::finish() {
    for (auto& event : events_) {
        event.item = item_;
        event.completed = false;
    }

    std::stable_sort(events_.begin(), events_.end(),
        [](const ScheduleEvent& lhs, const ScheduleEvent& rhs) {
            return lhs.arrival_date < rhs.arrival_date;
        });

    Schedule result = std::move(events_);
    events_.clear();
    return result;
}

} // namespace replsim::core
