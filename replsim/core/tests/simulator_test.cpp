#include <replsim/core/simulator.hpp>
#include <replsim/core/error.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <iterator>
#include <string>
#include <vector>

using namespace replsim::core;

class SimulatorTest : public ::testing::Test {
protected:
    Date day(int64_t n) {
        return date_from_ymd(2024, 1, 1) + days(n);
    }

    // dailyDemand=10, lead=20, shipping=10, safety=5, inventory=1000
    ReplenishmentInputs scenario_a() {
        ReplenishmentInputs in;
        in.item = ItemIdentity{"Mug", "Blue", "MUG-BLU"};
        in.daily_demand = 10.0;
        in.lead_time_days = 20;
        in.shipping_time_days = 10;
        in.safety_stock_days = 5;
        in.starting_inventory = 1000.0;
        in.start_date = day(0);
        return in;
    }

    ReplenishmentInputs scenario_b() {
        auto in = scenario_a();
        in.in_transit_quantity = 200.0;
        in.in_transit_arrival_date = day(10);
        return in;
    }

    static std::vector<ScheduleEvent> orders(const Schedule& schedule) {
        std::vector<ScheduleEvent> result;
        std::copy_if(schedule.begin(), schedule.end(), std::back_inserter(result),
                     [](const ScheduleEvent& e) { return e.kind == EventKind::OrderPlaced; });
        return result;
    }

    static std::vector<ScheduleEvent> arrivals(const Schedule& schedule) {
        std::vector<ScheduleEvent> result;
        std::copy_if(schedule.begin(), schedule.end(), std::back_inserter(result),
                     [](const ScheduleEvent& e) { return e.kind == EventKind::InTransitArrival; });
        return result;
    }
};

// =============================================================================
// Construction
// =============================================================================

TEST_F(SimulatorTest, ConstructionDerivesParameters) {
    Simulator sim(scenario_a());

    EXPECT_DOUBLE_EQ(sim.parameters().reorder_point, 350.0);
    EXPECT_DOUBLE_EQ(sim.parameters().order_quantity, 350.0);
    EXPECT_EQ(sim.parameters().total_lead_time, days(30));
    EXPECT_EQ(sim.end_date(), day(365));
    EXPECT_EQ(sim.current_date(), day(0));
}

TEST_F(SimulatorTest, InvalidInputsThrowBeforeRunning) {
    auto in = scenario_a();
    in.lead_time_days = -1;
    EXPECT_THROW(Simulator{in}, InvalidParameterError);
    EXPECT_THROW((void)simulate_replenishment(in), InvalidParameterError);

    in = scenario_a();
    in.in_transit_quantity = 10.0;
    EXPECT_THROW((void)simulate_replenishment(in), InvalidParameterError);

    in = scenario_a();
    in.daily_demand = -0.5;
    EXPECT_THROW((void)simulate_replenishment(in), InvalidParameterError);
}

// =============================================================================
// Scenario A: no goods in transit
// =============================================================================

TEST_F(SimulatorTest, ScenarioAFirstOrder) {
    auto schedule = simulate_replenishment(scenario_a());
    auto placed = orders(schedule);

    ASSERT_FALSE(placed.empty());
    // Inventory first reaches 350 at the end of the 65th day of consumption
    ASSERT_TRUE(placed[0].order_date.has_value());
    EXPECT_EQ(*placed[0].order_date, day(64));
    EXPECT_EQ(*placed[0].order_date, date_from_ymd(2024, 3, 5));
    EXPECT_EQ(placed[0].arrival_date, *placed[0].order_date + days(30));
    EXPECT_DOUBLE_EQ(placed[0].quantity, 350.0);
    EXPECT_EQ(placed[0].item.sku, "MUG-BLU");
}

TEST_F(SimulatorTest, ScenarioAFullSchedule) {
    auto schedule = simulate_replenishment(scenario_a());
    auto placed = orders(schedule);
    auto received = arrivals(schedule);

    // Steady state: one order every 35 days, starting on day 64
    ASSERT_EQ(placed.size(), 9u);
    for (std::size_t i = 0; i < placed.size(); ++i) {
        EXPECT_EQ(*placed[i].order_date, day(64 + 35 * static_cast<int64_t>(i)));
    }

    // The last order arrives after the horizon and is never credited
    ASSERT_EQ(received.size(), 8u);
    for (std::size_t i = 0; i < received.size(); ++i) {
        EXPECT_EQ(received[i].arrival_date, placed[i].arrival_date);
        EXPECT_FALSE(received[i].order_date.has_value());
        EXPECT_DOUBLE_EQ(received[i].quantity, 350.0);
    }

    EXPECT_EQ(schedule.size(), 17u);
}

TEST_F(SimulatorTest, ScenarioAFinalState) {
    Simulator sim(scenario_a());
    (void)sim.run();

    EXPECT_EQ(sim.current_date(), sim.end_date());
    // Order placed on day 344 is still in flight
    EXPECT_EQ(sim.pending().size(), 1u);
    EXPECT_DOUBLE_EQ(sim.pending().pending_quantity(), 350.0);
    // Last order placed at 350 on day 344, then 20 more days of demand
    EXPECT_DOUBLE_EQ(sim.available_inventory(), 150.0);
}

// =============================================================================
// Scenario B: goods in transit
// =============================================================================

TEST_F(SimulatorTest, ScenarioBInTransitArrival) {
    auto schedule = simulate_replenishment(scenario_b());

    ASSERT_FALSE(schedule.empty());
    const auto& first = schedule.front();
    EXPECT_EQ(first.kind, EventKind::InTransitArrival);
    EXPECT_EQ(first.arrival_date, day(10));
    EXPECT_FALSE(first.order_date.has_value());
    EXPECT_DOUBLE_EQ(first.quantity, 200.0);
}

TEST_F(SimulatorTest, ScenarioBDelaysFirstOrder) {
    auto first_a = orders(simulate_replenishment(scenario_a())).front();
    auto first_b = orders(simulate_replenishment(scenario_b())).front();

    EXPECT_GT(*first_b.order_date, *first_a.order_date);
    // 1200 units in total reach 350 after 85 days of consumption
    EXPECT_EQ(*first_b.order_date, day(84));
    EXPECT_EQ(first_b.arrival_date, day(114));
}

TEST_F(SimulatorTest, SeedBlocksOrdersUntilItArrives) {
    auto in = scenario_a();
    in.starting_inventory = 0.0;
    in.in_transit_quantity = 100.0;
    in.in_transit_arrival_date = day(15);

    auto placed = orders(simulate_replenishment(in));

    ASSERT_FALSE(placed.empty());
    EXPECT_EQ(*placed[0].order_date, day(15));
}

TEST_F(SimulatorTest, InTransitOnStartDateIsCreditedFirst) {
    auto in = scenario_a();
    in.starting_inventory = 300.0;
    in.in_transit_quantity = 100.0;
    in.in_transit_arrival_date = day(0);

    auto schedule = simulate_replenishment(in);
    ASSERT_FALSE(schedule.empty());
    EXPECT_EQ(schedule.front().kind, EventKind::InTransitArrival);
    EXPECT_EQ(schedule.front().arrival_date, day(0));

    // 300 + 100 - 10 = 390 > 350, so no order on the start date
    auto placed = orders(schedule);
    ASSERT_FALSE(placed.empty());
    EXPECT_EQ(*placed[0].order_date, day(4));
}

TEST_F(SimulatorTest, InTransitBeyondHorizonIsNotReported) {
    auto in = scenario_a();
    in.in_transit_quantity = 100.0;
    in.in_transit_arrival_date = day(400);

    auto schedule = simulate_replenishment(in);
    EXPECT_TRUE(arrivals(schedule).empty());
    EXPECT_TRUE(orders(schedule).empty());
}

TEST_F(SimulatorTest, InTransitBeforeStartNeverMatures) {
    auto in = scenario_a();
    in.in_transit_quantity = 200.0;
    in.in_transit_arrival_date = day(-1);

    Simulator sim(in);
    auto schedule = sim.run();

    // Neither credited nor blocking: identical to running without it
    EXPECT_EQ(schedule, simulate_replenishment(scenario_a()));
    EXPECT_EQ(arrivals(schedule).size(), 8u);
    EXPECT_EQ(*orders(schedule).front().order_date, day(64));
    EXPECT_DOUBLE_EQ(sim.available_inventory(), 150.0);

    // Still queued, next to the order in flight
    EXPECT_EQ(sim.pending().size(), 2u);
    EXPECT_DOUBLE_EQ(sim.pending().pending_quantity(), 550.0);
}

// =============================================================================
// Boundaries
// =============================================================================

TEST_F(SimulatorTest, ZeroDemandZeroInventoryOrdersOnceOnStartDate) {
    auto in = scenario_a();
    in.daily_demand = 0.0;
    in.starting_inventory = 0.0;
    in.lead_time_days = 45;
    in.shipping_time_days = 45;
    in.safety_stock_days = 10;

    auto schedule = simulate_replenishment(in);

    ASSERT_EQ(schedule.size(), 1u);
    EXPECT_EQ(schedule[0].kind, EventKind::OrderPlaced);
    EXPECT_EQ(*schedule[0].order_date, day(0));
    EXPECT_EQ(schedule[0].arrival_date, day(90));
    EXPECT_DOUBLE_EQ(schedule[0].quantity, 0.0);
}

TEST_F(SimulatorTest, ZeroDemandWithZeroLeadTimeStillOrdersOnce) {
    auto in = scenario_a();
    in.daily_demand = 0.0;
    in.starting_inventory = 0.0;
    in.lead_time_days = 0;
    in.shipping_time_days = 0;

    auto schedule = simulate_replenishment(in);
    ASSERT_EQ(schedule.size(), 1u);
    EXPECT_EQ(*schedule[0].order_date, day(0));
    EXPECT_EQ(schedule[0].arrival_date, day(0));
}

TEST_F(SimulatorTest, ZeroOrderQuantityWithDemandOrdersOnce) {
    auto in = scenario_a();
    in.lead_time_days = 0;
    in.shipping_time_days = 0;
    in.safety_stock_days = 0;
    in.starting_inventory = 100.0;

    Simulator sim(in);
    EXPECT_DOUBLE_EQ(sim.parameters().reorder_point, 0.0);
    EXPECT_DOUBLE_EQ(sim.parameters().order_quantity, 0.0);

    auto schedule = sim.run();

    // Stock reaches 0 at the end of day 9; later days go negative without reordering
    ASSERT_EQ(schedule.size(), 1u);
    EXPECT_EQ(schedule[0].kind, EventKind::OrderPlaced);
    EXPECT_EQ(*schedule[0].order_date, day(9));
    EXPECT_EQ(schedule[0].arrival_date, day(9));
    EXPECT_DOUBLE_EQ(schedule[0].quantity, 0.0);
    EXPECT_DOUBLE_EQ(sim.available_inventory(), 100.0 - 10.0 * HORIZON_DAYS);
    EXPECT_TRUE(sim.pending().empty());
}

TEST_F(SimulatorTest, ZeroDemandWithStockNeverOrders) {
    auto in = scenario_a();
    in.daily_demand = 0.0;
    in.starting_inventory = 5.0;

    EXPECT_TRUE(simulate_replenishment(in).empty());
}

TEST_F(SimulatorTest, AmpleStockYieldsEmptySchedule) {
    auto in = scenario_a();
    in.starting_inventory = 100000.0;

    EXPECT_TRUE(simulate_replenishment(in).empty());
}

TEST_F(SimulatorTest, LowStockOrdersOnStartDate) {
    auto in = scenario_a();
    in.starting_inventory = 100.0;

    auto placed = orders(simulate_replenishment(in));
    ASSERT_FALSE(placed.empty());
    EXPECT_EQ(*placed[0].order_date, day(0));
}

TEST_F(SimulatorTest, NegativeStartingInventoryOrdersImmediately) {
    auto in = scenario_a();
    in.starting_inventory = -50.0;

    auto placed = orders(simulate_replenishment(in));
    ASSERT_FALSE(placed.empty());
    EXPECT_EQ(*placed[0].order_date, day(0));
}

TEST_F(SimulatorTest, ZeroLeadTimeIsReceivedSameDay) {
    auto in = scenario_a();
    in.lead_time_days = 0;
    in.shipping_time_days = 0;
    in.safety_stock_days = 5;
    in.starting_inventory = 100.0;

    Simulator sim(in);
    auto schedule = sim.run();

    // Reorder point 50: reached at the end of day 4
    ASSERT_GE(schedule.size(), 2u);
    EXPECT_EQ(schedule[0].kind, EventKind::OrderPlaced);
    EXPECT_EQ(*schedule[0].order_date, day(4));
    EXPECT_EQ(schedule[0].arrival_date, day(4));
    EXPECT_EQ(schedule[1].kind, EventKind::InTransitArrival);
    EXPECT_EQ(schedule[1].arrival_date, day(4));
    EXPECT_DOUBLE_EQ(schedule[1].quantity, 50.0);

    // Credited immediately: the next order comes five days later
    auto placed = orders(schedule);
    ASSERT_GE(placed.size(), 2u);
    EXPECT_EQ(*placed[1].order_date, day(9));
    EXPECT_TRUE(sim.pending().empty());
}

TEST_F(SimulatorTest, HorizonStartsFromStartDate) {
    auto in = scenario_a();
    in.start_date = date_from_ymd(2023, 6, 15);
    const Date end = in.start_date + days(HORIZON_DAYS);

    auto schedule = simulate_replenishment(in);
    ASSERT_FALSE(schedule.empty());
    for (const auto& e : arrivals(schedule)) {
        EXPECT_GE(e.arrival_date, in.start_date);
        EXPECT_LT(e.arrival_date, end);
    }
    for (const auto& e : orders(schedule)) {
        EXPECT_GE(*e.order_date, in.start_date);
        EXPECT_LT(*e.order_date, end);
    }
}

TEST_F(SimulatorTest, LateOrderArrivesAfterHorizon) {
    auto schedule = simulate_replenishment(scenario_a());
    auto placed = orders(schedule);

    ASSERT_EQ(placed.size(), 9u);
    const auto& last = placed.back();
    EXPECT_EQ(*last.order_date, day(344));
    EXPECT_EQ(last.arrival_date, day(374));
    EXPECT_EQ(last.arrival_date, date_from_ymd(2025, 1, 9));
    EXPECT_GE(last.arrival_date, day(HORIZON_DAYS));

    // Kept as the final event, with no matching arrival
    EXPECT_EQ(schedule.back(), last);
    for (const auto& e : arrivals(schedule)) {
        EXPECT_LT(e.arrival_date, day(HORIZON_DAYS));
    }
}

// =============================================================================
// Repeated runs
// =============================================================================

TEST_F(SimulatorTest, RunIsRepeatable) {
    Simulator sim(scenario_b());

    auto first = sim.run();
    auto second = sim.run();

    EXPECT_EQ(first, second);
}

// =============================================================================
// Tracing
// =============================================================================

class RecordingTraceWriter : public TraceWriter {
public:
    struct Record {
        Date date;
        std::string type_name;
    };

    void begin(Date date) override { current_ = Record{date, {}}; }
    void type(std::string_view name) override { current_.type_name = std::string(name); }
    void field(std::string_view /*key*/, double /*value*/) override {}
    void field(std::string_view /*key*/, uint64_t /*value*/) override {}
    void field(std::string_view /*key*/, std::string_view /*value*/) override {}
    void end() override { records.push_back(current_); }

    std::size_t count(std::string_view type_name) const {
        return static_cast<std::size_t>(std::count_if(records.begin(), records.end(),
            [type_name](const Record& r) { return r.type_name == type_name; }));
    }

    std::vector<Record> records;

private:
    Record current_;
};

TEST_F(SimulatorTest, NoTraceWriterIsSafe) {
    Simulator sim(scenario_a());
    sim.trace([](TraceWriter& w) { w.type("never"); });
    EXPECT_NO_THROW((void)sim.run());
}

TEST_F(SimulatorTest, TraceRecordsEveryStep) {
    RecordingTraceWriter writer;
    auto schedule = simulate_replenishment(scenario_a(), &writer);

    ASSERT_FALSE(writer.records.empty());
    EXPECT_EQ(writer.records.front().type_name, "simulation_start");
    EXPECT_EQ(writer.records.front().date, day(0));
    EXPECT_EQ(writer.records.back().type_name, "simulation_end");
    EXPECT_EQ(writer.records.back().date, day(365));

    EXPECT_EQ(writer.count("inventory_level"), static_cast<std::size_t>(HORIZON_DAYS));
    EXPECT_EQ(writer.count("order_placed"), orders(schedule).size());
    EXPECT_EQ(writer.count("arrival_matured"), arrivals(schedule).size());
}

TEST_F(SimulatorTest, TracingDoesNotChangeSchedule) {
    RecordingTraceWriter writer;
    EXPECT_EQ(simulate_replenishment(scenario_b(), &writer),
              simulate_replenishment(scenario_b()));
}
