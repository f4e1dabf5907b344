#pragma once

#include <replsim/core/types.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace replsim::core {

/// @brief Identity of the stock-keeping item a schedule belongs to.
///
/// Passed through the simulation unchanged and attached to every emitted
/// event.
///
/// @ingroup core_policy
struct ItemIdentity {
    std::string product; ///< Product title.
    std::string variant; ///< Variant title.
    std::string sku;     ///< Stock-keeping unit; the item's unique key.

    bool operator==(const ItemIdentity&) const = default;
};

/// @brief Per-run record describing one item and its replenishment policy.
///
/// Immutable for the duration of a run. Integer day counts are signed so
/// that invalid negative values survive long enough to be rejected by
/// @ref validate_inputs rather than wrapping around.
///
/// @see validate_inputs, simulate_replenishment
/// @ingroup core_policy
struct ReplenishmentInputs {
    ItemIdentity item;
    double daily_demand{0.0};
    int64_t lead_time_days{0};
    int64_t shipping_time_days{0};
    int64_t safety_stock_days{0};
    double starting_inventory{0.0};
    Date start_date{};
    double in_transit_quantity{0.0};
    std::optional<Date> in_transit_arrival_date; ///< Required iff in_transit_quantity > 0.
};

/// @brief Check every constraint on @p inputs.
///
/// @throws InvalidParameterError on a negative or non-finite numeric input,
///         a negative in-transit quantity, or an in-transit quantity without
///         an arrival date.
void validate_inputs(const ReplenishmentInputs& inputs);

} // namespace replsim::core
