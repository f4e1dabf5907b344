#pragma once

/// @file demand_loader.hpp
/// @brief Loading per-item demand data from CSV exports.
/// @ingroup io_loaders

#include <replsim/core/inputs.hpp>
#include <replsim/core/types.hpp>

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace replsim::io {

/// @brief Columns every demand file must provide.
inline constexpr std::array<std::string_view, 5> REQUIRED_DEMAND_COLUMNS{
    "product_title", "variant_title", "variant_sku", "ending_quantity",
    "quantity_sold_per_day"};

/// @brief One row of a demand file.
///
/// @ingroup io_loaders
/// @see load_demand, make_inputs
struct DemandRecord {
    core::ItemIdentity item;           ///< product_title, variant_title, variant_sku.
    double ending_quantity{0.0};       ///< Inventory on hand; becomes the starting inventory.
    double quantity_sold_per_day{0.0}; ///< Demand rate; becomes the daily demand.
};

/// @brief Lead times and safety stock applied to items loaded from a demand file.
///
/// Defaults match the usual sea-freight replenishment cycle.
///
/// @ingroup io_loaders
struct LeadTimePolicy {
    int64_t lead_time_days{45};     ///< Manufacturing lead time.
    int64_t shipping_time_days{45}; ///< Shipping time.
    int64_t safety_stock_days{10};  ///< Days of demand held as safety stock.
};

/// @brief Load demand records from a CSV file.
///
/// The first row is the header; columns are matched by name, in any order,
/// and extra columns are ignored.
///
/// @throws LoaderError  If the file cannot be read, a required column is
///                      missing, or a numeric cell does not parse.
[[nodiscard]] std::vector<DemandRecord> load_demand(const std::filesystem::path& path);

/// @brief Load demand records from CSV text.
/// @throws LoaderError  See load_demand.
[[nodiscard]] std::vector<DemandRecord> load_demand_from_string(std::string_view csv);

/// @brief Label used to pick an item: `"<product> - <variant> (SKU: <sku>)"`.
[[nodiscard]] std::string display_label(const core::ItemIdentity& item);

/// @brief Find a record by SKU or by its display label.
[[nodiscard]] std::optional<DemandRecord> find_demand(const std::vector<DemandRecord>& records,
                                                      std::string_view sku_or_label);

/// @brief Build simulation inputs from a demand record and a policy.
/// @param record      Loaded demand row.
/// @param policy      Lead time, shipping time and safety stock days.
/// @param start_date  First simulated day.
[[nodiscard]] core::ReplenishmentInputs make_inputs(const DemandRecord& record,
                                                    const LeadTimePolicy& policy,
                                                    core::Date start_date);

} // namespace replsim::io
