#pragma once

/// @file metrics.hpp
/// @brief Post-simulation metrics computed from replenishment traces.
///
/// Defines aggregated inventory statistics (orders, receipts, minimum
/// available inventory, stockout days) and functions that derive them from
/// in-memory or on-disk traces.
///
/// @ingroup io_metrics

#include <replsim/core/types.hpp>
#include <replsim/io/trace_writers.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace replsim::io {

/// @brief Aggregated metrics computed from a replenishment trace.
///
/// @ingroup io_metrics
/// @see compute_metrics, compute_metrics_from_file
struct ReplenishmentMetrics {
    uint64_t days_simulated{0};   ///< Number of `inventory_level` records.
    uint64_t orders_placed{0};    ///< Number of `order_placed` records.
    uint64_t arrivals{0};         ///< Number of `arrival_matured` records.
    double total_ordered{0.0};    ///< Sum of ordered quantities.
    double total_received{0.0};   ///< Sum of matured quantities.

    /// @brief Lowest available inventory after a daily debit.
    double min_available{0.0};
    /// @brief First day on which @ref min_available was reached.
    std::optional<core::Date> min_available_date;

    /// @brief Days whose available inventory was negative after the debit.
    uint64_t stockout_days{0};

    /// @brief Date of the first `order_placed` record, if any.
    std::optional<core::Date> first_order_date;
};

/// @brief Compute aggregated metrics from in-memory trace records.
///
/// @param traces  Vector of trace records (typically from MemoryTraceWriter).
/// @return Populated ReplenishmentMetrics.
///
/// @see compute_metrics_from_file, MemoryTraceWriter
[[nodiscard]] ReplenishmentMetrics compute_metrics(const std::vector<TraceRecord>& traces);

/// @brief Compute aggregated metrics from a JSON trace file on disk.
///
/// The file is the array written by JsonTraceWriter.
///
/// @throws LoaderError  If the file cannot be read or parsed.
///
/// @see compute_metrics, JsonTraceWriter
[[nodiscard]] ReplenishmentMetrics compute_metrics_from_file(const std::filesystem::path& path);

/// @brief Parse a JSON trace (as written by JsonTraceWriter) into records.
/// @throws LoaderError  If the text is not a JSON array of trace objects.
[[nodiscard]] std::vector<TraceRecord> parse_json_trace(std::string_view json);

} // namespace replsim::io
