#include <replsim/core/error.hpp>
#include <replsim/core/simulator.hpp>
#include <replsim/core/types.hpp>

#include <replsim/io/demand_loader.hpp>
#include <replsim/io/error.hpp>
#include <replsim/io/item_loader.hpp>
#include <replsim/io/metrics.hpp>
#include <replsim/io/schedule_export.hpp>
#include <replsim/io/schedule_store.hpp>
#include <replsim/io/trace_writers.hpp>

#include <cxxopts.hpp>

#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

namespace core = replsim::core;
namespace io = replsim::io;

struct Config {
    std::string demand_file;
    std::string config_file;
    std::vector<std::string> skus;
    io::LeadTimePolicy policy;
    std::optional<core::Date> start_date;  // empty = config file, then today
    double in_transit_quantity{0.0};
    std::optional<core::Date> in_transit_date;
    std::string output_dir{"."};
    std::string format{"csv"};
    std::string trace_file;
    std::string trace_format{"json"};
    bool metrics{false};
    bool verbose{false};
};

core::Date today() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    return core::date_from_ymd(local.tm_year + 1900, static_cast<unsigned>(local.tm_mon + 1),
                               static_cast<unsigned>(local.tm_mday));
}

core::Date parse_date_arg(const std::string& text, const char* option) {
    auto date = core::parse_iso_date(text);
    if (!date) {
        std::cerr << "Error: --" << option << " must be a YYYY-MM-DD date, got '" << text << "'"
                  << std::endl;
        std::exit(64);
    }
    return *date;
}

int64_t days_arg(const cxxopts::ParseResult& result, const char* option) {
    auto value = result[option].as<int64_t>();
    if (value < 0) {
        std::cerr << "Error: --" << option << " must be non-negative" << std::endl;
        std::exit(64);
    }
    return value;
}

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("replsim", "Replenishment schedule simulator");

    options.add_options()
        ("d,demand", "Demand export (CSV)", cxxopts::value<std::string>())
        ("c,config", "Item configuration (JSON)", cxxopts::value<std::string>())
        ("s,sku", "SKU or item label to plan (repeatable; default: all)", cxxopts::value<std::vector<std::string>>())
        ("lead-time", "Manufacturing lead time in days (default: 45)", cxxopts::value<int64_t>()->default_value("45"))
        ("shipping-time", "Shipping time in days (default: 45)", cxxopts::value<int64_t>()->default_value("45"))
        ("safety-stock-days", "Days of demand held as safety stock (default: 10)", cxxopts::value<int64_t>()->default_value("10"))
        ("start-date", "First simulated day, YYYY-MM-DD (default: today)", cxxopts::value<std::string>())
        ("in-transit-quantity", "Quantity already in transit (single SKU)", cxxopts::value<double>()->default_value("0"))
        ("in-transit-date", "Arrival date of the in-transit quantity, YYYY-MM-DD", cxxopts::value<std::string>())
        ("o,output-dir", "Directory for schedule files, or - for stdout (default: .)", cxxopts::value<std::string>()->default_value("."))
        ("format", "Schedule format: csv|json (default: csv)", cxxopts::value<std::string>()->default_value("csv"))
        ("t,trace", "Write the simulation trace to this file (- for stdout)", cxxopts::value<std::string>())
        ("trace-format", "Trace format: json|text (default: json)", cxxopts::value<std::string>()->default_value("json"))
        ("metrics", "Print inventory metrics to stderr")
        ("v,verbose", "Verbose output")
        ("h,help", "Show help");

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (result.count("demand") == 0U && result.count("config") == 0U) {
        std::cerr << "Error: --demand or --config is required" << std::endl;
        std::exit(64);
    }

    Config config;
    if (result.count("demand") != 0U) {
        config.demand_file = result["demand"].as<std::string>();
    }
    if (result.count("config") != 0U) {
        config.config_file = result["config"].as<std::string>();
    }
    if (result.count("sku") != 0U) {
        config.skus = result["sku"].as<std::vector<std::string>>();
    }
    config.policy.lead_time_days = days_arg(result, "lead-time");
    config.policy.shipping_time_days = days_arg(result, "shipping-time");
    config.policy.safety_stock_days = days_arg(result, "safety-stock-days");
    if (result.count("start-date") != 0U) {
        config.start_date = parse_date_arg(result["start-date"].as<std::string>(), "start-date");
    }
    config.in_transit_quantity = result["in-transit-quantity"].as<double>();
    if (result.count("in-transit-date") != 0U) {
        config.in_transit_date =
            parse_date_arg(result["in-transit-date"].as<std::string>(), "in-transit-date");
    }
    config.output_dir = result["output-dir"].as<std::string>();
    config.format = result["format"].as<std::string>();
    if (result.count("trace") != 0U) {
        config.trace_file = result["trace"].as<std::string>();
    }
    config.trace_format = result["trace-format"].as<std::string>();
    config.metrics = result.count("metrics") != 0U;
    config.verbose = result.count("verbose") != 0U;

    if (config.format != "csv" && config.format != "json") {
        std::cerr << "Error: --format must be csv or json" << std::endl;
        std::exit(64);
    }
    if (config.trace_format != "json" && config.trace_format != "text") {
        std::cerr << "Error: --trace-format must be json or text" << std::endl;
        std::exit(64);
    }
    if ((config.in_transit_quantity > 0.0 || config.in_transit_date) &&
        (config.demand_file.empty() || config.skus.size() != 1)) {
        std::cerr << "Error: --in-transit-quantity and --in-transit-date need --demand and exactly one --sku"
                  << std::endl;
        std::exit(64);
    }

    return config;
}

// Items from the configuration file come first, then the selected demand rows
void populate(io::ScheduleStore& store, const Config& config) {
    if (!config.config_file.empty()) {
        if (config.verbose) {
            std::cerr << "Loading items from: " << config.config_file << std::endl;
        }
        auto items = io::load_items(config.config_file);
        core::Date start = config.start_date.value_or(items.start_date.value_or(today()));
        for (auto& inputs : items.items) {
            inputs.start_date = start;
            store.add_item(inputs);
        }
    }

    if (config.demand_file.empty()) {
        return;
    }

    if (config.verbose) {
        std::cerr << "Loading demand from: " << config.demand_file << std::endl;
    }
    auto records = io::load_demand(config.demand_file);
    core::Date start = config.start_date.value_or(today());

    std::vector<io::DemandRecord> selected;
    if (config.skus.empty()) {
        selected = records;
    } else {
        for (const auto& sku : config.skus) {
            auto record = io::find_demand(records, sku);
            if (!record) {
                throw io::UnknownItemError(sku);
            }
            selected.push_back(*record);
        }
    }

    for (const auto& record : selected) {
        auto inputs = io::make_inputs(record, config.policy, start);
        inputs.in_transit_quantity = config.in_transit_quantity;
        inputs.in_transit_arrival_date = config.in_transit_date;
        store.add_item(inputs);
    }
}

void print_parameters(const io::ScheduleStore& store, const std::string& sku) {
    const auto& params = store.parameters(sku);
    std::cerr << io::display_label(store.inputs(sku).item) << ": total lead time "
              << params.total_lead_time.count() << "d, safety stock "
              << io::format_quantity(params.safety_stock) << ", reorder point "
              << io::format_quantity(params.reorder_point) << ", order quantity "
              << io::format_quantity(params.order_quantity) << std::endl;
}

void print_metrics(const std::string& sku, const io::ReplenishmentMetrics& metrics) {
    std::cerr << "\n=== Metrics: " << sku << " ===" << std::endl;
    std::cerr << "Days simulated:  " << metrics.days_simulated << std::endl;
    std::cerr << "Orders placed:   " << metrics.orders_placed << std::endl;
    std::cerr << "Arrivals:        " << metrics.arrivals << std::endl;
    std::cerr << "Total ordered:   " << io::format_quantity(metrics.total_ordered) << std::endl;
    std::cerr << "Total received:  " << io::format_quantity(metrics.total_received) << std::endl;
    if (metrics.min_available_date) {
        std::cerr << "Min available:   " << io::format_quantity(metrics.min_available) << " on "
                  << core::format_iso_date(*metrics.min_available_date) << std::endl;
    }
    std::cerr << "Stockout days:   " << metrics.stockout_days << std::endl;
    if (metrics.first_order_date) {
        std::cerr << "First order:     " << core::format_iso_date(*metrics.first_order_date)
                  << std::endl;
    }
}

void write_schedule(const Config& config, const std::string& sku, const core::Schedule& schedule) {
    if (config.output_dir == "-") {
        if (config.format == "json") {
            io::write_schedule_json(schedule, std::cout);
        } else {
            io::write_schedule_csv(schedule, std::cout);
        }
        return;
    }

    std::filesystem::path path = std::filesystem::path(config.output_dir) / io::schedule_file_name(sku);
    if (config.format == "json") {
        path.replace_extension(".json");
        std::ofstream file(path);
        if (!file) {
            throw io::LoaderError("cannot open file for writing", path.string());
        }
        io::write_schedule_json(schedule, file);
    } else {
        io::write_schedule_csv(schedule, path);
    }

    if (config.verbose) {
        std::cerr << "Wrote " << schedule.size() << " events to " << path.string() << std::endl;
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        // 1. Load and simulate every item
        io::ScheduleStore store;
        populate(store, config);

        if (store.size() == 0) {
            std::cerr << "Error: no items to plan" << std::endl;
            return 1;
        }

        // 2. Setup trace writer
        std::unique_ptr<core::TraceWriter> writer;
        std::ofstream tracefile;

        if (!config.trace_file.empty()) {
            std::ostream* out = &std::cout;
            if (config.trace_file != "-") {
                tracefile.open(config.trace_file);
                if (!tracefile) {
                    std::cerr << "Error: cannot open trace file: " << config.trace_file << std::endl;
                    return 1;
                }
                out = &tracefile;
            }
            if (config.trace_format == "text") {
                writer = std::make_unique<io::TextualTraceWriter>(*out, config.trace_file == "-");
            } else {
                writer = std::make_unique<io::JsonTraceWriter>(*out);
            }
        }

        // 3. Export schedules, tracing and measuring each item
        for (const auto& sku : store.skus()) {
            if (config.verbose) {
                print_parameters(store, sku);
            }

            write_schedule(config, sku, store.schedule(sku));

            if (writer) {
                (void)core::simulate_replenishment(store.inputs(sku), writer.get());
            }
            if (config.metrics) {
                io::MemoryTraceWriter memory;
                (void)core::simulate_replenishment(store.inputs(sku), &memory);
                print_metrics(sku, io::compute_metrics(memory.records()));
            }
        }

        // 4. Finalize output
        if (auto* json = dynamic_cast<io::JsonTraceWriter*>(writer.get())) {
            json->finalize();
        }

        if (config.verbose) {
            std::cerr << "Planned " << store.size() << " item(s)" << std::endl;
        }

        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }
    catch (const core::InvalidParameterError& e) {
        std::cerr << "Invalid parameter: " << e.what() << std::endl;
        return 1;
    }
    catch (const cxxopts::exceptions::parsing& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
