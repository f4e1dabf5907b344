#pragma once

/// @defgroup core Core Library
/// @brief Replenishment policy, arrivals queue, simulation and schedules.
///
/// The core library computes the purchase-order schedule of one item over a
/// fixed horizon. It is pure and single-threaded: every run owns its queue
/// and event list, so independent items may be simulated in parallel by the
/// caller. It has no dependencies on file formats or I/O.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Strong types for calendar dates and day counts.

/// @defgroup core_policy Policy
/// @ingroup core
/// @brief Simulation inputs and derived replenishment parameters.

/// @defgroup core_queue Arrivals Queue
/// @ingroup core
/// @brief Pending inventory increments keyed by arrival date.

/// @defgroup core_engine Simulator
/// @ingroup core
/// @brief Day-stepped simulation loop.

/// @defgroup core_schedule Schedule
/// @ingroup core
/// @brief Schedule events, assembly and completion tracking.

#include <replsim/core/types.hpp>
#include <replsim/core/error.hpp>
#include <replsim/core/trace_writer.hpp>

#include <replsim/core/inputs.hpp>
#include <replsim/core/parameters.hpp>
#include <replsim/core/arrivals_queue.hpp>
#include <replsim/core/schedule.hpp>
#include <replsim/core/completion.hpp>

#include <replsim/core/simulator.hpp>
