#pragma once

/// @file item_loader.hpp
/// @brief Loading and writing JSON item configuration files.
/// @ingroup io_loaders

#include <replsim/core/inputs.hpp>
#include <replsim/core/types.hpp>
#include <replsim/io/demand_loader.hpp>

#include <filesystem>
#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

namespace replsim::io {

/// @brief Parsed item configuration.
///
/// Example:
/// @code{.json}
/// {
///   "start_date": "2024-01-01",
///   "defaults": {"lead_time_days": 20, "shipping_time_days": 10, "safety_stock_days": 5},
///   "items": [{
///     "product": "Mug", "variant": "Blue", "sku": "MUG-BLU",
///     "starting_inventory": 1000, "daily_demand": 10,
///     "in_transit": {"quantity": 200, "arrival_date": "2024-01-11"}
///   }]
/// }
/// @endcode
///
/// Per-item `lead_time_days`, `shipping_time_days` and `safety_stock_days`
/// override the defaults. A missing `start_date` is left unset so that the
/// caller can supply one; every item's start date is then
/// core::Date::epoch() until the caller overwrites it.
///
/// @ingroup io_loaders
/// @see load_items, write_items_to_stream
struct ItemConfig {
    std::optional<core::Date> start_date;      ///< Shared start date, if given.
    LeadTimePolicy defaults;                   ///< Policy applied where an item is silent.
    std::vector<core::ReplenishmentInputs> items; ///< One entry per item, in file order.
};

/// @brief Load an item configuration from a JSON file.
/// @throws LoaderError  If the file cannot be read, is not valid JSON, or
///                      fails validation (negative values, bad dates,
///                      duplicate SKUs, in-transit quantity without a date).
[[nodiscard]] ItemConfig load_items(const std::filesystem::path& path);

/// @brief Load an item configuration from a JSON string.
/// @throws LoaderError  See load_items.
[[nodiscard]] ItemConfig load_items_from_string(std::string_view json);

/// @brief Write @p config as canonical JSON to @p out.
///
/// Every item is written with explicit lead, shipping and safety days, so
/// the output does not depend on the defaults block.
void write_items_to_stream(const ItemConfig& config, std::ostream& out);

/// @brief Write @p config as canonical JSON to the file at @p path.
/// @throws LoaderError  If the file cannot be opened.
void write_items(const ItemConfig& config, const std::filesystem::path& path);

} // namespace replsim::io
