#include <replsim/core/completion.hpp>

#include <map>
#include <tuple>

namespace replsim::core {

std::vector<EventKey> event_keys(const Schedule& schedule) {
    std::map<std::tuple<std::string, EventKind, Date>, uint32_t> seen;
    std::vector<EventKey> keys;
    keys.reserve(schedule.size());

    for (const auto& event : schedule) {
        auto& count = seen[std::make_tuple(event.item.sku, event.kind, event.arrival_date)];
        keys.push_back(EventKey{event.item.sku, event.kind, event.arrival_date, count});
        ++count;
    }
    return keys;
}

void CompletionOverlay::set_completed(const EventKey& key, bool completed) {
    if (completed) {
        completed_.insert(key);
    } else {
        completed_.erase(key);
    }
}

bool CompletionOverlay::is_completed(const EventKey& key) const {
    return completed_.contains(key);
}

void CompletionOverlay::apply(Schedule& schedule) const {
    auto keys = event_keys(schedule);
    for (std::size_t i = 0; i < schedule.size(); ++i) {
        schedule[i].completed = is_completed(keys[i]);
    }
}

void CompletionOverlay::capture(const Schedule& schedule) {
    auto keys = event_keys(schedule);
    for (std::size_t i = 0; i < schedule.size(); ++i) {
        set_completed(keys[i], schedule[i].completed);
    }
}

void CompletionOverlay::clear_item(std::string_view sku) {
    std::erase_if(completed_, [sku](const EventKey& key) { return key.sku == sku; });
}

} // namespace replsim::core
