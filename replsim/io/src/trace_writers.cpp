#include <replsim/io/trace_writers.hpp>
#include <replsim/io/schedule_export.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iterator>

namespace replsim::io {

namespace {

constexpr const char* ANSI_RESET = "\033[0m";
constexpr const char* ANSI_ORDER = "\033[1;33m";
constexpr const char* ANSI_ARRIVAL = "\033[1;32m";

constexpr int TYPE_WIDTH = 16;

const char* colour_for(std::string_view type) {
    if (type == "order_placed") {
        return ANSI_ORDER;
    }
    if (type == "arrival_matured") {
        return ANSI_ARRIVAL;
    }
    return nullptr;
}

} // anonymous namespace

// =============================================================================
// JsonTraceWriter
// =============================================================================

// One record is rendered into the buffer, then copied to the stream on end()
struct JsonTraceWriter::Buffer {
    rapidjson::StringBuffer text;
    rapidjson::Writer<rapidjson::StringBuffer> writer{text};

    void key(std::string_view name) {
        writer.Key(name.data(), static_cast<rapidjson::SizeType>(name.size()), true);
    }

    void string(std::string_view value) {
        writer.String(value.data(), static_cast<rapidjson::SizeType>(value.size()), true);
    }
};

JsonTraceWriter::JsonTraceWriter(std::ostream& output)
    : output_(output)
    , buffer_(std::make_unique<Buffer>()) {
    output_ << "[\n";
}

JsonTraceWriter::~JsonTraceWriter() {
    finalize();
}

void JsonTraceWriter::begin(core::Date date) {
    buffer_->text.Clear();
    buffer_->writer.Reset(buffer_->text);
    buffer_->writer.StartObject();
    buffer_->key("date");
    buffer_->string(core::format_iso_date(date));
}

void JsonTraceWriter::type(std::string_view name) {
    buffer_->key("type");
    buffer_->string(name);
}

void JsonTraceWriter::field(std::string_view key, double value) {
    buffer_->key(key);
    if (std::isfinite(value)) {
        buffer_->writer.Double(value);
    } else {
        buffer_->writer.Null();
    }
}

void JsonTraceWriter::field(std::string_view key, uint64_t value) {
    buffer_->key(key);
    buffer_->writer.Uint64(value);
}

void JsonTraceWriter::field(std::string_view key, std::string_view value) {
    buffer_->key(key);
    buffer_->string(value);
}

void JsonTraceWriter::end() {
    buffer_->writer.EndObject();
    if (records_ > 0) {
        output_ << ",\n";
    }
    output_ << buffer_->text.GetString();
    ++records_;
}

void JsonTraceWriter::finalize() {
    if (finalized_) {
        return;
    }
    if (records_ > 0) {
        output_ << '\n';
    }
    output_ << "]\n";
    output_.flush();
    finalized_ = true;
}

// =============================================================================
// TraceRecord / MemoryTraceWriter
// =============================================================================

std::optional<double> TraceRecord::number(std::string_view key) const {
    auto iter = fields.find(key);
    if (iter == fields.end()) {
        return std::nullopt;
    }
    if (const auto* value = std::get_if<double>(&iter->second)) {
        return *value;
    }
    if (const auto* value = std::get_if<uint64_t>(&iter->second)) {
        return static_cast<double>(*value);
    }
    return std::nullopt;
}

std::optional<std::string> TraceRecord::text(std::string_view key) const {
    auto iter = fields.find(key);
    if (iter == fields.end()) {
        return std::nullopt;
    }
    if (const auto* value = std::get_if<std::string>(&iter->second)) {
        return *value;
    }
    return std::nullopt;
}

void MemoryTraceWriter::begin(core::Date date) {
    current_ = TraceRecord{};
    current_.date = date;
}

void MemoryTraceWriter::type(std::string_view name) {
    current_.type = std::string(name);
}

void MemoryTraceWriter::field(std::string_view key, double value) {
    current_.fields.insert_or_assign(std::string(key), value);
}

void MemoryTraceWriter::field(std::string_view key, uint64_t value) {
    current_.fields.insert_or_assign(std::string(key), value);
}

void MemoryTraceWriter::field(std::string_view key, std::string_view value) {
    current_.fields.insert_or_assign(std::string(key), std::string(value));
}

void MemoryTraceWriter::end() {
    records_.push_back(std::move(current_));
    current_ = TraceRecord{};
}

std::vector<TraceRecord> MemoryTraceWriter::records_of(std::string_view type) const {
    std::vector<TraceRecord> result;
    std::copy_if(records_.begin(), records_.end(), std::back_inserter(result),
                 [type](const TraceRecord& record) { return record.type == type; });
    return result;
}

// =============================================================================
// TextualTraceWriter
// =============================================================================

TextualTraceWriter::TextualTraceWriter(std::ostream& output, bool color_enabled)
    : output_(output)
    , color_enabled_(color_enabled) {}

void TextualTraceWriter::begin(core::Date date) {
    date_ = date;
    type_.clear();
    fields_.str(std::string());
    fields_.clear();
}

void TextualTraceWriter::type(std::string_view name) {
    type_ = std::string(name);
}

void TextualTraceWriter::field(std::string_view key, double value) {
    fields_ << ' ' << key << '=' << format_quantity(value);
}

void TextualTraceWriter::field(std::string_view key, uint64_t value) {
    fields_ << ' ' << key << '=' << value;
}

void TextualTraceWriter::field(std::string_view key, std::string_view value) {
    fields_ << ' ' << key << '=' << value;
}

void TextualTraceWriter::end() {
    if (!show_inventory_levels_ && type_ == "inventory_level") {
        return;
    }
    if (!origin_) {
        origin_ = date_;
    }

    std::string offset = "+" + std::to_string((date_ - *origin_).count()) + "d";
    output_ << core::format_iso_date(date_) << ' ' << std::setw(5) << std::right << offset
            << "  ";

    const char* colour = color_enabled_ ? colour_for(type_) : nullptr;
    if (colour != nullptr) {
        output_ << colour;
    }
    output_ << std::setw(TYPE_WIDTH) << std::left << type_ << std::right;
    if (colour != nullptr) {
        output_ << ANSI_RESET;
    }

    output_ << fields_.str() << '\n';
}

} // namespace replsim::io
