#include <replsim/io/demand_loader.hpp>
#include <replsim/io/csv.hpp>
#include <replsim/io/error.hpp>

#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>
#include <unordered_map>

namespace replsim::io {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

double parse_number(std::string_view cell, const char* column, const std::string& ctx) {
    auto text = trim(cell);
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size() ||
        !std::isfinite(value)) {
        throw LoaderError(std::string("column '") + column + "' must be a number, got '" +
                              std::string(cell) + "'",
                          ctx);
    }
    return value;
}

} // anonymous namespace

std::vector<DemandRecord> load_demand(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_demand_from_string(oss.str());
}

std::vector<DemandRecord> load_demand_from_string(std::string_view csv) {
    auto rows = parse_csv(csv);
    if (rows.empty()) {
        throw LoaderError("missing header row", "demand");
    }

    std::unordered_map<std::string, std::size_t> column_index;
    for (std::size_t i = 0; i < rows[0].size(); ++i) {
        column_index.emplace(std::string(trim(rows[0][i])), i);
    }

    std::string missing;
    for (auto name : REQUIRED_DEMAND_COLUMNS) {
        if (!column_index.contains(std::string(name))) {
            if (!missing.empty()) {
                missing += ", ";
            }
            missing += name;
        }
    }
    if (!missing.empty()) {
        throw LoaderError("missing required columns: " + missing, "demand");
    }

    const auto col = [&](std::string_view name) {
        return column_index.at(std::string(name));
    };
    const std::size_t product_col = col("product_title");
    const std::size_t variant_col = col("variant_title");
    const std::size_t sku_col = col("variant_sku");
    const std::size_t ending_col = col("ending_quantity");
    const std::size_t rate_col = col("quantity_sold_per_day");

    std::vector<DemandRecord> records;
    records.reserve(rows.size() - 1);

    for (std::size_t r = 1; r < rows.size(); ++r) {
        const auto& row = rows[r];
        std::string ctx = "row " + std::to_string(r + 1);

        // Short rows are padded with empty cells
        auto cell = [&row](std::size_t idx) -> std::string_view {
            return idx < row.size() ? std::string_view(row[idx]) : std::string_view{};
        };

        DemandRecord record;
        record.item.product = std::string(trim(cell(product_col)));
        record.item.variant = std::string(trim(cell(variant_col)));
        record.item.sku = std::string(trim(cell(sku_col)));
        if (record.item.sku.empty()) {
            throw LoaderError("column 'variant_sku' must not be empty", ctx);
        }
        record.ending_quantity = parse_number(cell(ending_col), "ending_quantity", ctx);
        record.quantity_sold_per_day =
            parse_number(cell(rate_col), "quantity_sold_per_day", ctx);

        records.push_back(std::move(record));
    }

    return records;
}

std::string display_label(const core::ItemIdentity& item) {
    return item.product + " - " + item.variant + " (SKU: " + item.sku + ")";
}

std::optional<DemandRecord> find_demand(const std::vector<DemandRecord>& records,
                                        std::string_view sku_or_label) {
    for (const auto& record : records) {
        if (record.item.sku == sku_or_label || display_label(record.item) == sku_or_label) {
            return record;
        }
    }
    return std::nullopt;
}

core::ReplenishmentInputs make_inputs(const DemandRecord& record, const LeadTimePolicy& policy,
                                      core::Date start_date) {
    core::ReplenishmentInputs inputs;
    inputs.item = record.item;
    inputs.daily_demand = record.quantity_sold_per_day;
    inputs.lead_time_days = policy.lead_time_days;
    inputs.shipping_time_days = policy.shipping_time_days;
    inputs.safety_stock_days = policy.safety_stock_days;
    inputs.starting_inventory = record.ending_quantity;
    inputs.start_date = start_date;
    return inputs;
}

} // namespace replsim::io
