#include <replsim/io/io.hpp>

#include <replsim/core/error.hpp>

#include <gtest/gtest.h>

#include <stdexcept>

using namespace replsim::io;
using namespace replsim::core;

class ScheduleStoreTest : public ::testing::Test {
protected:
    Date day(int64_t n) {
        return date_from_ymd(2024, 1, 1) + days(n);
    }

    ReplenishmentInputs item(const std::string& sku) {
        ReplenishmentInputs in;
        in.item = ItemIdentity{"Mug", "Blue", sku};
        in.daily_demand = 10.0;
        in.lead_time_days = 20;
        in.shipping_time_days = 10;
        in.safety_stock_days = 5;
        in.starting_inventory = 1000.0;
        in.start_date = day(0);
        return in;
    }

    static std::size_t completed_count(const Schedule& schedule) {
        std::size_t count = 0;
        for (const auto& event : schedule) {
            count += event.completed ? 1 : 0;
        }
        return count;
    }
};

// =============================================================================
// Membership
// =============================================================================

TEST_F(ScheduleStoreTest, AddSimulatesItem) {
    ScheduleStore store;
    store.add_item(item("MUG-BLU"));

    EXPECT_TRUE(store.contains("MUG-BLU"));
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.schedule("MUG-BLU").size(), 17u);
    EXPECT_DOUBLE_EQ(store.parameters("MUG-BLU").order_quantity, 350.0);
    EXPECT_EQ(store.inputs("MUG-BLU").item.sku, "MUG-BLU");
}

TEST_F(ScheduleStoreTest, DuplicateSkuRejected) {
    ScheduleStore store;
    store.add_item(item("MUG-BLU"));

    try {
        store.add_item(item("MUG-BLU"));
        FAIL() << "expected DuplicateItemError";
    } catch (const DuplicateItemError& e) {
        EXPECT_STREQ(e.what(), "Product with SKU 'MUG-BLU' is already added");
        EXPECT_EQ(e.sku(), "MUG-BLU");
    }
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(ScheduleStoreTest, InvalidInputsLeaveStoreUnchanged) {
    ScheduleStore store;
    auto bad = item("BAD");
    bad.daily_demand = -1.0;

    EXPECT_THROW(store.add_item(bad), InvalidParameterError);
    EXPECT_FALSE(store.contains("BAD"));
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(ScheduleStoreTest, InsertionOrderKept) {
    ScheduleStore store;
    store.add_item(item("C"));
    store.add_item(item("A"));
    store.add_item(item("B"));
    store.remove_item("A");

    EXPECT_EQ(store.skus(), (std::vector<std::string>{"C", "B"}));
}

TEST_F(ScheduleStoreTest, UnknownSkuThrows) {
    ScheduleStore store;

    EXPECT_THROW((void)store.schedule("X"), UnknownItemError);
    EXPECT_THROW((void)store.inputs("X"), UnknownItemError);
    EXPECT_THROW((void)store.parameters("X"), UnknownItemError);
    EXPECT_THROW(store.remove_item("X"), UnknownItemError);
    EXPECT_THROW(store.update_item(item("X")), UnknownItemError);
    EXPECT_THROW(store.set_completed("X", 0, true), UnknownItemError);
}

// =============================================================================
// Completion flags
// =============================================================================

TEST_F(ScheduleStoreTest, SetCompletedAppliesToSchedule) {
    ScheduleStore store;
    store.add_item(item("MUG-BLU"));

    store.set_completed("MUG-BLU", 0, true);
    store.set_completed("MUG-BLU", 3, true);
    auto schedule = store.schedule("MUG-BLU");

    EXPECT_TRUE(schedule[0].completed);
    EXPECT_TRUE(schedule[3].completed);
    EXPECT_EQ(completed_count(schedule), 2u);

    store.set_completed("MUG-BLU", 3, false);
    EXPECT_EQ(completed_count(store.schedule("MUG-BLU")), 1u);
}

TEST_F(ScheduleStoreTest, IndexOutOfRangeThrows) {
    ScheduleStore store;
    store.add_item(item("MUG-BLU"));

    EXPECT_THROW(store.set_completed("MUG-BLU", 17, true), std::out_of_range);
}

TEST_F(ScheduleStoreTest, FlagsAreScopedToItem) {
    ScheduleStore store;
    store.add_item(item("A"));
    store.add_item(item("B"));

    store.set_completed("A", 0, true);

    EXPECT_EQ(completed_count(store.schedule("A")), 1u);
    EXPECT_EQ(completed_count(store.schedule("B")), 0u);
}

TEST_F(ScheduleStoreTest, UpdateKeepsFlagsOfSurvivingEvents) {
    ScheduleStore store;
    store.add_item(item("MUG-BLU"));
    store.set_completed("MUG-BLU", 0, true);

    auto renamed = item("MUG-BLU");
    renamed.item.product = "Mug (new)";
    store.update_item(renamed);

    auto schedule = store.schedule("MUG-BLU");
    EXPECT_TRUE(schedule[0].completed);
    EXPECT_EQ(schedule[0].item.product, "Mug (new)");
    EXPECT_EQ(store.inputs("MUG-BLU").item.product, "Mug (new)");
}

TEST_F(ScheduleStoreTest, UpdateDropsFlagsOfVanishedEvents) {
    ScheduleStore store;
    store.add_item(item("MUG-BLU"));
    store.set_completed("MUG-BLU", 0, true);

    // First order moves one day later, so its key changes
    auto more_stock = item("MUG-BLU");
    more_stock.starting_inventory = 1010.0;
    store.update_item(more_stock);
    EXPECT_EQ(completed_count(store.schedule("MUG-BLU")), 0u);

    // Restoring the original inputs does not resurrect the dropped flag
    store.update_item(item("MUG-BLU"));
    EXPECT_EQ(completed_count(store.schedule("MUG-BLU")), 0u);
}

TEST_F(ScheduleStoreTest, RemoveForgetsFlags) {
    ScheduleStore store;
    store.add_item(item("MUG-BLU"));
    store.set_completed("MUG-BLU", 0, true);

    store.remove_item("MUG-BLU");
    store.add_item(item("MUG-BLU"));

    EXPECT_EQ(completed_count(store.schedule("MUG-BLU")), 0u);
}
