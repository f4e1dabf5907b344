#include <replsim/io/schedule_export.hpp>
#include <replsim/io/error.hpp>

#include <replsim/core/error.hpp>
#include <replsim/core/simulator.hpp>

#include <rapidjson/document.h>

#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace replsim::io;
using namespace replsim::core;

class ScheduleExportTest : public ::testing::Test {
protected:
    Date day(int64_t n) {
        return date_from_ymd(2024, 1, 1) + days(n);
    }

    // 200 in transit on day 10, then regular 350-unit orders
    ReplenishmentInputs inputs() {
        ReplenishmentInputs in;
        in.item = ItemIdentity{"Mug, large", "Blue", "MUG-BLU"};
        in.daily_demand = 10.0;
        in.lead_time_days = 20;
        in.shipping_time_days = 10;
        in.safety_stock_days = 5;
        in.starting_inventory = 1000.0;
        in.start_date = day(0);
        in.in_transit_quantity = 200.0;
        in.in_transit_arrival_date = day(10);
        return in;
    }

    static std::string to_csv(const Schedule& schedule) {
        std::ostringstream oss;
        write_schedule_csv(schedule, oss);
        return oss.str();
    }
};

// =============================================================================
// CSV
// =============================================================================

TEST_F(ScheduleExportTest, FileName) {
    EXPECT_EQ(schedule_file_name("MUG-BLU"), "MUG-BLU_order_schedule.csv");
}

TEST_F(ScheduleExportTest, QuantityFormatting) {
    EXPECT_EQ(format_quantity(350.0), "350");
    EXPECT_EQ(format_quantity(122.5), "122.5");
    EXPECT_EQ(format_quantity(0.0), "0");
    EXPECT_EQ(format_quantity(1.0 / 3.0), "0.3333333333333333");
}

TEST_F(ScheduleExportTest, HeaderAndRows) {
    auto schedule = simulate_replenishment(inputs());
    ASSERT_GE(schedule.size(), 2u);
    schedule[1].completed = true;

    std::string csv = to_csv(schedule);
    std::istringstream lines(csv);
    std::string header;
    std::string arrival;
    std::string order;
    std::getline(lines, header);
    std::getline(lines, arrival);
    std::getline(lines, order);

    EXPECT_EQ(header, "Product,Variant,SKU,Order Date,Arrival Date,Order Quantity,Event,Completed");
    EXPECT_EQ(arrival, "\"Mug, large\",Blue,MUG-BLU,,2024-01-11,200,In-Transit Arrival,False");
    EXPECT_EQ(order, "\"Mug, large\",Blue,MUG-BLU,2024-03-25,2024-04-24,350,Order Placed,True");
}

TEST_F(ScheduleExportTest, EmptyScheduleWritesHeaderOnly) {
    EXPECT_EQ(to_csv({}),
              "Product,Variant,SKU,Order Date,Arrival Date,Order Quantity,Event,Completed\n");
}

TEST_F(ScheduleExportTest, ReadReproducesWrittenRecords) {
    auto schedule = simulate_replenishment(inputs());
    schedule[0].completed = true;
    schedule[2].completed = true;

    auto read = read_schedule_csv(to_csv(schedule));

    ASSERT_EQ(read.size(), schedule.size());
    for (std::size_t i = 0; i < schedule.size(); ++i) {
        EXPECT_EQ(read[i], schedule[i]) << "row " << i;
    }
}

TEST_F(ScheduleExportTest, FractionalQuantitiesReadBackExactly) {
    auto in = inputs();
    in.daily_demand = 1.0 / 3.0;
    in.safety_stock_days = 7;
    in.starting_inventory = 50.0;
    in.in_transit_quantity = 0.0;
    in.in_transit_arrival_date.reset();

    auto schedule = simulate_replenishment(in);
    ASSERT_FALSE(schedule.empty());
    // A third of a unit over 37 days is not a whole quantity
    EXPECT_NE(schedule[0].quantity, std::floor(schedule[0].quantity));

    auto read = read_schedule_csv(to_csv(schedule));

    ASSERT_EQ(read.size(), schedule.size());
    for (std::size_t i = 0; i < schedule.size(); ++i) {
        EXPECT_EQ(read[i].quantity, schedule[i].quantity) << "row " << i;
        EXPECT_EQ(read[i], schedule[i]) << "row " << i;
    }
}

TEST_F(ScheduleExportTest, WriteToFile) {
    auto schedule = simulate_replenishment(inputs());
    auto path = std::filesystem::temp_directory_path() / schedule_file_name("MUG-BLU");

    write_schedule_csv(schedule, path);
    std::ifstream file(path);
    std::ostringstream oss;
    oss << file.rdbuf();
    std::filesystem::remove(path);

    EXPECT_EQ(read_schedule_csv(oss.str()).size(), schedule.size());
}

TEST_F(ScheduleExportTest, ReadRejectsMissingColumn) {
    EXPECT_THROW((void)read_schedule_csv("Product,Variant,SKU\nA,B,C\n"), LoaderError);
}

TEST_F(ScheduleExportTest, ReadRejectsUnknownEvent) {
    EXPECT_THROW(
        (void)read_schedule_csv(
            "Product,Variant,SKU,Order Date,Arrival Date,Order Quantity,Event,Completed\n"
            "A,B,C,2024-01-01,2024-01-31,5,Order Cancelled,False\n"),
        UnknownEventError);
}

TEST_F(ScheduleExportTest, ReadRejectsBadDate) {
    EXPECT_THROW(
        (void)read_schedule_csv(
            "Product,Variant,SKU,Order Date,Arrival Date,Order Quantity,Event,Completed\n"
            "A,B,C,2024-01-01,31/01/2024,5,Order Placed,False\n"),
        LoaderError);
}

TEST_F(ScheduleExportTest, ReadRejectsOrderWithoutOrderDate) {
    EXPECT_THROW(
        (void)read_schedule_csv(
            "Product,Variant,SKU,Order Date,Arrival Date,Order Quantity,Event,Completed\n"
            "A,B,C,,2024-01-31,5,Order Placed,False\n"),
        LoaderError);
}

// =============================================================================
// JSON
// =============================================================================

TEST_F(ScheduleExportTest, JsonRecords) {
    auto schedule = simulate_replenishment(inputs());
    std::ostringstream oss;
    write_schedule_json(schedule, oss);

    rapidjson::Document doc;
    doc.Parse(oss.str().c_str());
    ASSERT_FALSE(doc.HasParseError());
    ASSERT_TRUE(doc.IsArray());
    ASSERT_EQ(doc.Size(), schedule.size());

    const auto& arrival = doc[0];
    EXPECT_STREQ(arrival["product"].GetString(), "Mug, large");
    EXPECT_TRUE(arrival["order_date"].IsNull());
    EXPECT_STREQ(arrival["arrival_date"].GetString(), "2024-01-11");
    EXPECT_STREQ(arrival["event"].GetString(), "In-Transit Arrival");
    EXPECT_DOUBLE_EQ(arrival["quantity"].GetDouble(), 200.0);
    EXPECT_FALSE(arrival["completed"].GetBool());

    const auto& order = doc[1];
    EXPECT_STREQ(order["order_date"].GetString(), "2024-03-25");
    EXPECT_STREQ(order["event"].GetString(), "Order Placed");
}
