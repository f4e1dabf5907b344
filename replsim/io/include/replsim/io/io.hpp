#pragma once

/// @defgroup io I/O Library
/// @brief Demand and item loading, schedule export, traces, and metrics.
///
/// The I/O library handles all external data formats: loading demand CSV
/// exports and JSON item configurations, exporting schedules as CSV or
/// JSON, writing simulation traces (JSON, textual, in-memory), computing
/// post-simulation inventory metrics, and keeping a store of planned items
/// with their completion flags. Depends on core only.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief Demand CSV and item configuration JSON loaders.

/// @defgroup io_writers Writers
/// @ingroup io
/// @brief Schedule export and the JSON, in-memory and textual trace writers.

/// @defgroup io_metrics Metrics
/// @ingroup io
/// @brief Post-simulation inventory metrics.

/// @defgroup io_csv CSV
/// @ingroup io
/// @brief Minimal RFC 4180 reader and writer helpers.

/// @defgroup io_store Store
/// @ingroup io
/// @brief Planned items with completion flags.

// Convenience header for the I/O library

#include <replsim/io/error.hpp>
#include <replsim/io/csv.hpp>
#include <replsim/io/trace_writers.hpp>
#include <replsim/io/demand_loader.hpp>
#include <replsim/io/item_loader.hpp>
#include <replsim/io/schedule_export.hpp>
#include <replsim/io/metrics.hpp>
#include <replsim/io/schedule_store.hpp>
