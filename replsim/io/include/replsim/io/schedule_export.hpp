#pragma once

/// @file schedule_export.hpp
/// @brief Flat-record export of replenishment schedules (CSV and JSON).
/// @ingroup io_writers

#include <replsim/core/schedule.hpp>

#include <array>
#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>

namespace replsim::io {

/// @brief Header row of an exported schedule, in column order.
inline constexpr std::array<std::string_view, 8> SCHEDULE_COLUMNS{
    "Product",      "Variant",        "SKU",   "Order Date",
    "Arrival Date", "Order Quantity", "Event", "Completed"};

/// @brief Default export file name for @p sku: `<sku>_order_schedule.csv`.
[[nodiscard]] std::string schedule_file_name(std::string_view sku);

/// @brief Format @p quantity as the shortest text that reads back as the
/// same double.
///
/// Integral quantities print without a fractional part ("350"); 1/3 prints
/// as "0.3333333333333333".
[[nodiscard]] std::string format_quantity(double quantity);

/// @brief Write @p schedule as CSV with a header row.
///
/// `Order Date` is empty for in-transit arrivals. `Completed` is written
/// as `True` or `False`.
void write_schedule_csv(const core::Schedule& schedule, std::ostream& out);

/// @brief Write @p schedule as CSV to the file at @p path.
/// @throws LoaderError  If the file cannot be opened.
void write_schedule_csv(const core::Schedule& schedule, const std::filesystem::path& path);

/// @brief Parse a schedule previously written by write_schedule_csv.
///
/// Columns are matched by header name. `Completed` accepts
/// `True`/`False`/`true`/`false`/`1`/`0`.
///
/// @throws LoaderError          If a column is missing or a cell does not parse.
/// @throws core::UnknownEventError  If an `Event` cell names no event kind.
[[nodiscard]] core::Schedule read_schedule_csv(std::string_view csv);

/// @brief Write @p schedule as a JSON array of flat records.
///
/// Keys: `product`, `variant`, `sku`, `order_date` (null for arrivals),
/// `arrival_date`, `quantity`, `event`, `completed`.
void write_schedule_json(const core::Schedule& schedule, std::ostream& out);

} // namespace replsim::io
