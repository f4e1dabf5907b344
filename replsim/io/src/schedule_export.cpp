#include <replsim/io/schedule_export.hpp>
#include <replsim/io/csv.hpp>
#include <replsim/io/error.hpp>

#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

#include <array>
#include <charconv>
#include <cmath>
#include <fstream>
#include <unordered_map>
#include <vector>

namespace replsim::io {

namespace {

using namespace replsim::core;

bool parse_completed(std::string_view text, const std::string& ctx) {
    if (text == "True" || text == "true" || text == "1") {
        return true;
    }
    if (text == "False" || text == "false" || text == "0" || text.empty()) {
        return false;
    }
    throw LoaderError("column 'Completed' must be True or False, got '" + std::string(text) + "'",
                      ctx);
}

Date parse_date_cell(std::string_view text, const char* column, const std::string& ctx) {
    auto date = parse_iso_date(text);
    if (!date) {
        throw LoaderError(std::string("column '") + column + "' must be a YYYY-MM-DD date, got '" +
                              std::string(text) + "'",
                          ctx);
    }
    return *date;
}

double parse_quantity(std::string_view text, const std::string& ctx) {
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        throw LoaderError("column 'Order Quantity' must be a number, got '" + std::string(text) +
                              "'",
                          ctx);
    }
    return value;
}

void write_string(rapidjson::Writer<rapidjson::StringBuffer>& writer,
                  const std::string& value) {
    writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

} // anonymous namespace

std::string schedule_file_name(std::string_view sku) {
    return std::string(sku) + "_order_schedule.csv";
}

std::string format_quantity(double quantity) {
    // Shortest text that parses back to the same double
    std::array<char, 32> buf{};
    auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), quantity);
    if (ec != std::errc{}) {
        throw LoaderError("cannot format quantity", "schedule");
    }
    return std::string(buf.data(), ptr);
}

void write_schedule_csv(const Schedule& schedule, std::ostream& out) {
    out << format_csv_row({SCHEDULE_COLUMNS.begin(), SCHEDULE_COLUMNS.end()}) << '\n';

    for (const auto& event : schedule) {
        out << format_csv_row({
                   event.item.product,
                   event.item.variant,
                   event.item.sku,
                   event.order_date ? format_iso_date(*event.order_date) : std::string{},
                   format_iso_date(event.arrival_date),
                   format_quantity(event.quantity),
                   std::string(to_string(event.kind)),
                   event.completed ? "True" : "False",
               })
            << '\n';
    }
}

void write_schedule_csv(const Schedule& schedule, const std::filesystem::path& path) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    write_schedule_csv(schedule, file);
}

Schedule read_schedule_csv(std::string_view csv) {
    auto rows = parse_csv(csv);
    if (rows.empty()) {
        throw LoaderError("missing header row", "schedule");
    }

    std::unordered_map<std::string, std::size_t> column_index;
    for (std::size_t i = 0; i < rows[0].size(); ++i) {
        column_index.emplace(rows[0][i], i);
    }
    std::vector<std::size_t> cols;
    for (auto name : SCHEDULE_COLUMNS) {
        auto iter = column_index.find(std::string(name));
        if (iter == column_index.end()) {
            throw LoaderError("missing column '" + std::string(name) + "'", "schedule");
        }
        cols.push_back(iter->second);
    }

    Schedule schedule;
    schedule.reserve(rows.size() - 1);

    for (std::size_t r = 1; r < rows.size(); ++r) {
        const auto& row = rows[r];
        std::string ctx = "row " + std::to_string(r + 1);
        auto cell = [&](std::size_t column) -> std::string_view {
            std::size_t idx = cols[column];
            return idx < row.size() ? std::string_view(row[idx]) : std::string_view{};
        };

        ScheduleEvent event;
        event.item.product = std::string(cell(0));
        event.item.variant = std::string(cell(1));
        event.item.sku = std::string(cell(2));
        if (!cell(3).empty()) {
            event.order_date = parse_date_cell(cell(3), "Order Date", ctx);
        }
        event.arrival_date = parse_date_cell(cell(4), "Arrival Date", ctx);
        event.quantity = parse_quantity(cell(5), ctx);
        event.kind = event_kind_from_string(cell(6));
        event.completed = parse_completed(cell(7), ctx);

        if (event.kind == EventKind::OrderPlaced && !event.order_date) {
            throw LoaderError("order event without 'Order Date'", ctx);
        }

        schedule.push_back(std::move(event));
    }

    return schedule;
}

void write_schedule_json(const Schedule& schedule, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartArray();
    for (const auto& event : schedule) {
        writer.StartObject();
        writer.Key("product");
        write_string(writer, event.item.product);
        writer.Key("variant");
        write_string(writer, event.item.variant);
        writer.Key("sku");
        write_string(writer, event.item.sku);
        writer.Key("order_date");
        if (event.order_date) {
            write_string(writer, format_iso_date(*event.order_date));
        } else {
            writer.Null();
        }
        writer.Key("arrival_date");
        write_string(writer, format_iso_date(event.arrival_date));
        writer.Key("quantity");
        writer.Double(event.quantity);
        writer.Key("event");
        write_string(writer, std::string(to_string(event.kind)));
        writer.Key("completed");
        writer.Bool(event.completed);
        writer.EndObject();
    }
    writer.EndArray();

    out << buffer.GetString() << '\n';
}

} // namespace replsim::io
