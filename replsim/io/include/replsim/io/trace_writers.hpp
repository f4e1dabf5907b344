#pragma once

/// @file trace_writers.hpp
/// @brief TraceWriter implementations for simulation traces.
///
/// Three sinks for the records a @ref core::Simulator emits: a JSON array
/// streamed to a file or stdout, an in-memory buffer read back by
/// @ref compute_metrics, and one readable line per record for terminals.
/// Pass a null writer pointer to the simulator to disable tracing.
///
/// @ingroup io_writers

#include <replsim/core/trace_writer.hpp>
#include <replsim/core/types.hpp>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

namespace replsim::io {

/// @brief Streams one JSON object per record into a JSON array.
///
/// Records look like
/// `{"date":"2024-03-05","type":"order_placed","quantity":350.0,...}`.
/// Numbers are written with enough digits to read back unchanged, so a
/// trace file yields the same metrics as the in-memory run. Call
/// @ref finalize (or let the destructor do it) to close the array.
///
/// @ingroup io_writers
/// @see parse_json_trace, MemoryTraceWriter
class JsonTraceWriter : public core::TraceWriter {
public:
    /// @param output  Destination stream (must outlive this writer).
    explicit JsonTraceWriter(std::ostream& output);
    ~JsonTraceWriter() override;

    JsonTraceWriter(const JsonTraceWriter&) = delete;
    JsonTraceWriter& operator=(const JsonTraceWriter&) = delete;
    JsonTraceWriter(JsonTraceWriter&&) = delete;
    JsonTraceWriter& operator=(JsonTraceWriter&&) = delete;

    void begin(core::Date date) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    /// @brief Close the array. Later calls do nothing.
    void finalize();

    /// @brief Number of records written so far.
    [[nodiscard]] std::size_t record_count() const noexcept { return records_; }

private:
    struct Buffer;

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::unique_ptr<Buffer> buffer_;
    std::size_t records_{0};
    bool finalized_{false};
};

/// @brief Value of one trace field.
using TraceValue = std::variant<double, uint64_t, std::string>;

/// @brief One trace record held in memory.
///
/// @ingroup io_writers
/// @see MemoryTraceWriter, compute_metrics
struct TraceRecord {
    core::Date date{};
    std::string type;    ///< e.g. "order_placed", "inventory_level".
    std::map<std::string, TraceValue, std::less<>> fields;

    /// @brief Numeric field as a double; empty when absent or a string.
    [[nodiscard]] std::optional<double> number(std::string_view key) const;

    /// @brief String field; empty when absent or numeric.
    [[nodiscard]] std::optional<std::string> text(std::string_view key) const;
};

/// @brief Buffers every record for inspection after the run.
///
/// @ingroup io_writers
/// @see TraceRecord, compute_metrics
class MemoryTraceWriter : public core::TraceWriter {
public:
    void begin(core::Date date) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    [[nodiscard]] const std::vector<TraceRecord>& records() const { return records_; }

    /// @brief Records of one type, in emission order.
    [[nodiscard]] std::vector<TraceRecord> records_of(std::string_view type) const;

    void clear() { records_.clear(); }

private:
    std::vector<TraceRecord> records_;
    TraceRecord current_;
};

/// @brief One readable line per record.
///
/// `2024-03-05  +64d  order_placed      quantity=350 available=350`
///
/// The day offset is counted from the first record written (normally
/// `simulation_start`). Orders and arrivals are coloured when
/// @p color_enabled is set.
///
/// @ingroup io_writers
class TextualTraceWriter : public core::TraceWriter {
public:
    explicit TextualTraceWriter(std::ostream& output, bool color_enabled = true);

    TextualTraceWriter(const TextualTraceWriter&) = delete;
    TextualTraceWriter& operator=(const TextualTraceWriter&) = delete;
    TextualTraceWriter(TextualTraceWriter&&) = delete;
    TextualTraceWriter& operator=(TextualTraceWriter&&) = delete;

    void begin(core::Date date) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    /// @brief Skip the per-day `inventory_level` records (default: shown).
    void set_show_inventory_levels(bool show) noexcept { show_inventory_levels_ = show; }

private:
    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool color_enabled_;
    bool show_inventory_levels_{true};
    std::optional<core::Date> origin_;
    core::Date date_{};
    std::string type_;
    std::ostringstream fields_;
};

} // namespace replsim::io
