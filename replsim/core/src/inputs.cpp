#include <replsim/core/inputs.hpp>
#include <replsim/core/error.hpp>
#include <replsim/core/parameters.hpp>

#include <cmath>

namespace replsim::core {

void validate_inputs(const ReplenishmentInputs& inputs) {
    // Demand and day counts share their checks with the calculator
    (void)compute_parameters(inputs.daily_demand, inputs.lead_time_days,
                             inputs.shipping_time_days, inputs.safety_stock_days);

    if (!std::isfinite(inputs.starting_inventory)) {
        throw InvalidParameterError("starting_inventory must be a finite number");
    }
    if (!std::isfinite(inputs.in_transit_quantity) || inputs.in_transit_quantity < 0.0) {
        throw InvalidParameterError("in_transit_quantity must be a non-negative number");
    }
    // An arrival dated before start_date is accepted; it never matures
    if (inputs.in_transit_quantity > 0.0 && !inputs.in_transit_arrival_date) {
        throw InvalidParameterError(
            "in_transit_arrival_date is required when in_transit_quantity > 0 (sku '" +
            inputs.item.sku + "')");
    }
}

} // namespace replsim::core
