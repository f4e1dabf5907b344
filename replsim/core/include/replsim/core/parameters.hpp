#pragma once

#include <replsim/core/types.hpp>

#include <cstdint>

namespace replsim::core {

/// @brief Policy constants derived once per simulation run.
///
/// The reorder point and the order quantity are computed with the same
/// expression, so a single order restores inventory to roughly twice the
/// reorder point. Both fields are kept so that callers can tell them apart
/// in reports.
///
/// @see compute_parameters
/// @ingroup core_policy
struct ReplenishmentParameters {
    Days total_lead_time{};     ///< Manufacturing lead time plus shipping time.
    double safety_stock{0.0};   ///< daily_demand * safety_stock_days.
    double reorder_point{0.0};  ///< daily_demand * total_lead_time + safety_stock.
    double order_quantity{0.0}; ///< daily_demand * total_lead_time + safety_stock.
};

/// @brief Derive the replenishment constants from raw policy inputs.
///
/// Pure function. Defined at zero demand (every derived quantity is 0).
///
/// @param daily_demand       Units consumed per day.
/// @param lead_time_days     Manufacturing lead time.
/// @param shipping_time_days Shipping time.
/// @param safety_stock_days  Days of demand held as buffer.
/// @return The derived parameters.
/// @throws InvalidParameterError if any input is negative or the demand is
///         not a finite number.
[[nodiscard]] ReplenishmentParameters compute_parameters(double daily_demand,
                                                         int64_t lead_time_days,
                                                         int64_t shipping_time_days,
                                                         int64_t safety_stock_days);

} // namespace replsim::core
