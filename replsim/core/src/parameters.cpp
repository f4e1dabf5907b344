#include <replsim/core/parameters.hpp>
#include <replsim/core/error.hpp>

#include <cmath>
#include <string>

namespace replsim::core {

namespace {

void require_non_negative(int64_t value, const char* name) {
    if (value < 0) {
        throw InvalidParameterError(std::string(name) + " must be non-negative, got " +
                                    std::to_string(value));
    }
}

} // anonymous namespace

ReplenishmentParameters compute_parameters(double daily_demand, int64_t lead_time_days,
                                           int64_t shipping_time_days,
                                           int64_t safety_stock_days) {
    if (!std::isfinite(daily_demand) || daily_demand < 0.0) {
        throw InvalidParameterError("daily_demand must be a non-negative number, got " +
                                    std::to_string(daily_demand));
    }
    require_non_negative(lead_time_days, "lead_time_days");
    require_non_negative(shipping_time_days, "shipping_time_days");
    require_non_negative(safety_stock_days, "safety_stock_days");

    ReplenishmentParameters params;
    params.total_lead_time = days(lead_time_days + shipping_time_days);
    params.safety_stock = daily_demand * static_cast<double>(safety_stock_days);

    const double lead_time_demand =
        daily_demand * static_cast<double>(params.total_lead_time.count());
    params.reorder_point = lead_time_demand + params.safety_stock;
    params.order_quantity = lead_time_demand + params.safety_stock;
    return params;
}

} // namespace replsim::core
