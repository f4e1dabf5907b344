#pragma once

#include <replsim/core/arrivals_queue.hpp>
#include <replsim/core/inputs.hpp>
#include <replsim/core/parameters.hpp>
#include <replsim/core/schedule.hpp>
#include <replsim/core/trace_writer.hpp>
#include <replsim/core/types.hpp>

#include <cstdint>

namespace replsim::core {

/// @brief Length of the simulated window, in days.
inline constexpr int64_t HORIZON_DAYS = 365;

/// @brief Day-stepped inventory simulation for one item.
///
/// The Simulator validates its inputs and derives the policy constants on
/// construction, then run() walks every calendar day from the start date up
/// to but excluding `start_date + HORIZON_DAYS`. For each day `d`:
///
///   1. arrivals due on `d` are credited and reported as InTransitArrival;
///   2. one day of demand is consumed;
///   3. if inventory is at or below the reorder point and no arrival is
///      pending after `d`, an order is placed for arrival on
///      `d + total_lead_time`. Inventory is credited only when it matures.
///
/// There is never more than one order in flight. The loop runs a fixed
/// number of days and never divides by the demand, so it is well defined at
/// zero demand. Orders of zero quantity (zero demand or zero cover) are
/// placed at most once per run, and a zero-quantity arrival credits nothing
/// and is not reported.
///
/// When the total lead time is zero an order arrives on the day it is
/// placed and is credited immediately after the reorder check.
///
/// Each run() starts from a fresh queue and the starting inventory, so
/// repeated runs yield identical schedules.
///
/// @code
/// core::Simulator sim(inputs);
/// sim.set_trace_writer(&writer);
/// core::Schedule schedule = sim.run();
/// @endcode
///
/// @see simulate_replenishment, ArrivalsQueue, ScheduleAssembler
/// @ingroup core_engine
class Simulator {
public:
    /// @throws InvalidParameterError if @p inputs fails validate_inputs().
    explicit Simulator(ReplenishmentInputs inputs);

    Simulator(const Simulator&) = delete;
    Simulator& operator=(const Simulator&) = delete;
    Simulator(Simulator&&) = delete;
    Simulator& operator=(Simulator&&) = delete;

    [[nodiscard]] const ReplenishmentInputs& inputs() const noexcept { return inputs_; }
    [[nodiscard]] const ReplenishmentParameters& parameters() const noexcept { return params_; }

    /// @brief First day outside the horizon.
    [[nodiscard]] Date end_date() const noexcept { return end_date_; }

    /// @brief Simulated day (start date before the first run, end date after it).
    [[nodiscard]] Date current_date() const noexcept { return current_date_; }

    /// @brief Inventory on hand after the last simulated day.
    [[nodiscard]] double available_inventory() const noexcept { return available_; }

    /// @brief Arrivals still pending after the last simulated day.
    [[nodiscard]] const ArrivalsQueue& pending() const noexcept { return queue_; }

    /// @brief Set the trace writer. Not owned; nullptr disables tracing.
    void set_trace_writer(TraceWriter* writer) noexcept { trace_writer_ = writer; }

    /// @brief Invoke a tracing callback only if a trace writer is set.
    /// @tparam F Callable with signature void(TraceWriter&).
    template<typename F>
    void trace(F&& func);

    /// @brief Simulate the whole horizon and return the sorted schedule.
    [[nodiscard]] Schedule run();

private:
    void reset();
    void mature_arrivals(ScheduleAssembler& assembler);
    void consume_demand();
    void check_reorder(ScheduleAssembler& assembler);

    ReplenishmentInputs inputs_;
    ReplenishmentParameters params_;
    Date end_date_;

    Date current_date_;
    double available_{0.0};
    ArrivalsQueue queue_;
    uint64_t orders_placed_{0};
    uint64_t arrivals_{0};
    bool zero_order_placed_{false};

    TraceWriter* trace_writer_{nullptr};
};

template<typename F>
void Simulator::trace(F&& func) {
    if (trace_writer_) {
        trace_writer_->begin(current_date_);
        func(*trace_writer_);
        trace_writer_->end();
    }
}

/// @brief Compute the replenishment schedule for one item.
/// @throws InvalidParameterError if @p inputs is invalid.
[[nodiscard]] Schedule simulate_replenishment(const ReplenishmentInputs& inputs);

/// @brief Compute the replenishment schedule, tracing every step to @p writer.
/// @param writer Trace sink, may be nullptr.
/// @throws InvalidParameterError if @p inputs is invalid.
[[nodiscard]] Schedule simulate_replenishment(const ReplenishmentInputs& inputs,
                                              TraceWriter* writer);

} // namespace replsim::core
