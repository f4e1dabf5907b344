#pragma once

/// @file schedule_store.hpp
/// @brief Collection of simulated items with their completion flags.
/// @ingroup io_store

#include <replsim/core/completion.hpp>
#include <replsim/core/inputs.hpp>
#include <replsim/core/parameters.hpp>
#include <replsim/core/schedule.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace replsim::io {

/// @brief Items being planned, each with its simulated schedule.
///
/// Adding or updating an item runs the simulation immediately. Completion
/// flags are held in a core::CompletionOverlay, so a re-simulated schedule
/// keeps the flags of every event that still exists and drops the rest.
///
/// Items are listed in insertion order. Not thread-safe.
///
/// @ingroup io_store
class ScheduleStore {
public:
    /// @brief Simulate @p inputs and add the item.
    /// @throws DuplicateItemError          If the SKU is already present.
    /// @throws core::InvalidParameterError If the inputs are invalid.
    void add_item(const core::ReplenishmentInputs& inputs);

    /// @brief Replace an item's inputs and re-simulate it.
    /// @throws UnknownItemError            If the SKU is not present.
    /// @throws core::InvalidParameterError If the inputs are invalid; the
    ///                                     stored item is left unchanged.
    void update_item(const core::ReplenishmentInputs& inputs);

    /// @brief Remove an item and its completion flags.
    /// @throws UnknownItemError If the SKU is not present.
    void remove_item(std::string_view sku);

    [[nodiscard]] bool contains(std::string_view sku) const;

    /// @throws UnknownItemError If the SKU is not present.
    [[nodiscard]] const core::ReplenishmentInputs& inputs(std::string_view sku) const;

    /// @throws UnknownItemError If the SKU is not present.
    [[nodiscard]] const core::ReplenishmentParameters& parameters(std::string_view sku) const;

    /// @brief Schedule of @p sku with the stored completion flags applied.
    /// @throws UnknownItemError If the SKU is not present.
    [[nodiscard]] core::Schedule schedule(std::string_view sku) const;

    /// @brief Flag event @p index of the schedule of @p sku.
    /// @throws UnknownItemError  If the SKU is not present.
    /// @throws std::out_of_range If @p index is past the end of the schedule.
    void set_completed(std::string_view sku, std::size_t index, bool completed);

    /// @brief SKUs in insertion order.
    [[nodiscard]] const std::vector<std::string>& skus() const noexcept { return order_; }

    [[nodiscard]] std::size_t size() const noexcept { return order_.size(); }

private:
    struct Entry {
        core::ReplenishmentInputs inputs;
        core::ReplenishmentParameters parameters;
        core::Schedule schedule;
    };

    static Entry simulate(const core::ReplenishmentInputs& inputs);

    [[nodiscard]] const Entry& find(std::string_view sku) const;
    [[nodiscard]] Entry& find(std::string_view sku);

    std::unordered_map<std::string, Entry> items_;
    std::vector<std::string> order_;
    core::CompletionOverlay overlay_;
};

} // namespace replsim::io
