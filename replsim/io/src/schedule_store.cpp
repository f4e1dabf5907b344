#include <replsim/io/schedule_store.hpp>
#include <replsim/io/error.hpp>

#include <replsim/core/simulator.hpp>

#include <algorithm>
#include <set>
#include <stdexcept>

namespace replsim::io {

ScheduleStore::Entry ScheduleStore::simulate(const core::ReplenishmentInputs& inputs) {
    core::Simulator simulator(inputs);
    Entry entry{inputs, simulator.parameters(), {}};
    entry.schedule = simulator.run();
    return entry;
}

const ScheduleStore::Entry& ScheduleStore::find(std::string_view sku) const {
    auto iter = items_.find(std::string(sku));
    if (iter == items_.end()) {
        throw UnknownItemError(std::string(sku));
    }
    return iter->second;
}

ScheduleStore::Entry& ScheduleStore::find(std::string_view sku) {
    auto iter = items_.find(std::string(sku));
    if (iter == items_.end()) {
        throw UnknownItemError(std::string(sku));
    }
    return iter->second;
}

void ScheduleStore::add_item(const core::ReplenishmentInputs& inputs) {
    const auto& sku = inputs.item.sku;
    if (contains(sku)) {
        throw DuplicateItemError(sku);
    }

    auto entry = simulate(inputs);
    items_.emplace(sku, std::move(entry));
    order_.push_back(sku);
}

void ScheduleStore::update_item(const core::ReplenishmentInputs& inputs) {
    auto& entry = find(inputs.item.sku);
    auto updated = simulate(inputs);

    // Keep flags only for keys present in both schedules
    std::set<core::EventKey> kept;
    for (const auto& key : core::event_keys(entry.schedule)) {
        if (overlay_.is_completed(key)) {
            kept.insert(key);
        }
    }
    overlay_.clear_item(inputs.item.sku);
    for (const auto& key : core::event_keys(updated.schedule)) {
        if (kept.contains(key)) {
            overlay_.set_completed(key, true);
        }
    }

    entry = std::move(updated);
}

void ScheduleStore::remove_item(std::string_view sku) {
    auto iter = items_.find(std::string(sku));
    if (iter == items_.end()) {
        throw UnknownItemError(std::string(sku));
    }
    items_.erase(iter);
    std::erase(order_, sku);
    overlay_.clear_item(sku);
}

bool ScheduleStore::contains(std::string_view sku) const {
    return items_.contains(std::string(sku));
}

const core::ReplenishmentInputs& ScheduleStore::inputs(std::string_view sku) const {
    return find(sku).inputs;
}

const core::ReplenishmentParameters& ScheduleStore::parameters(std::string_view sku) const {
    return find(sku).parameters;
}

core::Schedule ScheduleStore::schedule(std::string_view sku) const {
    core::Schedule result = find(sku).schedule;
    overlay_.apply(result);
    return result;
}

void ScheduleStore::set_completed(std::string_view sku, std::size_t index, bool completed) {
    const auto& entry = find(sku);
    if (index >= entry.schedule.size()) {
        throw std::out_of_range("event index " + std::to_string(index) + " out of range for SKU '" +
                                std::string(sku) + "'");
    }
    overlay_.set_completed(core::event_keys(entry.schedule)[index], completed);
}

} // namespace replsim::io
