#pragma once

#include <replsim/core/types.hpp>

#include <cstdint>
#include <string_view>

namespace replsim::core {

/// @brief Abstract interface for recording simulation trace events.
/// @ingroup core
///
/// Implementations of TraceWriter serialise simulation events to a
/// specific format (JSON, text, memory buffer, etc.).
/// Each trace record is built incrementally:
///   1. begin() -- opens a new record on a given simulated day
///   2. type()  -- sets the event type name
///   3. field() -- (repeated) adds key/value data fields
///   4. end()   -- closes and optionally flushes the record
///
/// The Simulator holds an optional pointer to a TraceWriter. When no writer
/// is installed the overhead is a single null-pointer check.
///
/// @see Simulator::set_trace_writer()
class TraceWriter {
public:
    virtual ~TraceWriter() = default;

    /// @brief Begin a new trace record on the given simulated day.
    virtual void begin(Date date) = 0;

    /// @brief Set the event type name for the current record
    ///        (e.g. `"order_placed"`, `"inventory_level"`).
    virtual void type(std::string_view name) = 0;

    /// @brief Add a floating-point field to the current record.
    virtual void field(std::string_view key, double value) = 0;

    /// @brief Add an unsigned integer field to the current record.
    virtual void field(std::string_view key, uint64_t value) = 0;

    /// @brief Add a string field to the current record.
    virtual void field(std::string_view key, std::string_view value) = 0;

    /// @brief End the current record and flush if needed.
    virtual void end() = 0;

protected:
    TraceWriter() = default;
    TraceWriter(const TraceWriter&) = default;
    TraceWriter& operator=(const TraceWriter&) = default;
    TraceWriter(TraceWriter&&) = default;
    TraceWriter& operator=(TraceWriter&&) = default;
};

} // namespace replsim::core
