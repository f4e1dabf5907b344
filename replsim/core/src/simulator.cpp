#include <replsim/core/simulator.hpp>

#include <utility>

namespace replsim::core {

namespace {

ReplenishmentInputs validated(ReplenishmentInputs inputs) {
    validate_inputs(inputs);
    return inputs;
}

} // anonymous namespace

Simulator::Simulator(ReplenishmentInputs inputs)
    : inputs_(validated(std::move(inputs)))
    , params_(compute_parameters(inputs_.daily_demand, inputs_.lead_time_days,
                                 inputs_.shipping_time_days, inputs_.safety_stock_days))
    , end_date_(inputs_.start_date + days(HORIZON_DAYS))
    , current_date_(inputs_.start_date)
    , available_(inputs_.starting_inventory) {}

void Simulator::reset() {
    current_date_ = inputs_.start_date;
    available_ = inputs_.starting_inventory;
    queue_.clear();
    queue_.seed(inputs_.in_transit_quantity, inputs_.in_transit_arrival_date);
    orders_placed_ = 0;
    arrivals_ = 0;
    zero_order_placed_ = false;
}

Schedule Simulator::run() {
    reset();
    ScheduleAssembler assembler(inputs_.item);

    trace([&](TraceWriter& w) {
        w.type("simulation_start");
        w.field("sku", std::string_view(inputs_.item.sku));
        w.field("starting_inventory", available_);
        w.field("daily_demand", inputs_.daily_demand);
        w.field("total_lead_time", static_cast<uint64_t>(params_.total_lead_time.count()));
        w.field("safety_stock", params_.safety_stock);
        w.field("reorder_point", params_.reorder_point);
        w.field("order_quantity", params_.order_quantity);
    });

    // Maturity precedes the demand debit and the reorder check on every day
    while (current_date_ < end_date_) {
        mature_arrivals(assembler);
        consume_demand();
        check_reorder(assembler);
        current_date_ += days(1);
    }

    trace([&](TraceWriter& w) {
        w.type("simulation_end");
        w.field("orders_placed", orders_placed_);
        w.field("arrivals", arrivals_);
        w.field("available", available_);
        w.field("pending", queue_.pending_quantity());
    });

    return assembler.finish();
}

void Simulator::mature_arrivals(ScheduleAssembler& assembler) {
    for (const auto& arrival : queue_.mature_on(current_date_)) {
        if (arrival.quantity <= 0.0) {
            continue;
        }
        available_ += arrival.quantity;
        ++arrivals_;
        assembler.record_arrival(arrival.arrival_date, arrival.quantity);

        trace([&](TraceWriter& w) {
            w.type("arrival_matured");
            w.field("quantity", arrival.quantity);
            w.field("available", available_);
        });
    }
}

void Simulator::consume_demand() {
    available_ -= inputs_.daily_demand;

    trace([&](TraceWriter& w) {
        w.type("inventory_level");
        w.field("available", available_);
        w.field("pending", queue_.pending_quantity());
    });
}

void Simulator::check_reorder(ScheduleAssembler& assembler) {
    if (available_ > params_.reorder_point || queue_.has_pending_after(current_date_)) {
        return;
    }

    // A zero order quantity (zero demand, or no lead time and no safety
    // stock) is placed once per run; it could never lift inventory
    const bool zero_order = params_.order_quantity <= 0.0;
    if (zero_order && zero_order_placed_) {
        return;
    }
    zero_order_placed_ = zero_order_placed_ || zero_order;

    const Date arrival_date = current_date_ + params_.total_lead_time;
    assembler.record_order(current_date_, arrival_date, params_.order_quantity);
    queue_.schedule(params_.order_quantity, arrival_date);
    ++orders_placed_;

    trace([&](TraceWriter& w) {
        w.type("order_placed");
        w.field("arrival_date", std::string_view(format_iso_date(arrival_date)));
        w.field("quantity", params_.order_quantity);
        w.field("available", available_);
    });

    // Zero total lead time: the order is received on the day it is placed
    if (arrival_date == current_date_) {
        mature_arrivals(assembler);
    }
}

Schedule simulate_replenishment(const ReplenishmentInputs& inputs) {
    return simulate_replenishment(inputs, nullptr);
}

Schedule simulate_replenishment(const ReplenishmentInputs& inputs, TraceWriter* writer) {
    Simulator simulator(inputs);
    simulator.set_trace_writer(writer);
    return simulator.run();
}

} // namespace replsim::core
