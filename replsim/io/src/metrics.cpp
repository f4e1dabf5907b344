#include <replsim/io/metrics.hpp>
#include <replsim/io/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <fstream>
#include <sstream>
#include <string>

namespace replsim::io {

ReplenishmentMetrics compute_metrics(const std::vector<TraceRecord>& traces) {
    ReplenishmentMetrics metrics;

    for (const auto& record : traces) {
        if (record.type == "inventory_level") {
            metrics.days_simulated++;
            double available = record.number("available").value_or(0.0);
            if (!metrics.min_available_date || available < metrics.min_available) {
                metrics.min_available = available;
                metrics.min_available_date = record.date;
            }
            if (available < 0.0) {
                metrics.stockout_days++;
            }
        }
        else if (record.type == "order_placed") {
            metrics.orders_placed++;
            metrics.total_ordered += record.number("quantity").value_or(0.0);
            if (!metrics.first_order_date) {
                metrics.first_order_date = record.date;
            }
        }
        else if (record.type == "arrival_matured") {
            metrics.arrivals++;
            metrics.total_received += record.number("quantity").value_or(0.0);
        }
    }

    return metrics;
}

std::vector<TraceRecord> parse_json_trace(std::string_view json) {
    rapidjson::Document doc;
    // Full precision so levels read back exactly as written
    doc.Parse<rapidjson::kParseFullPrecisionFlag>(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsArray()) {
        throw LoaderError("trace must be a JSON array", "trace");
    }

    std::vector<TraceRecord> traces;
    traces.reserve(doc.Size());

    for (rapidjson::SizeType idx = 0; idx < doc.Size(); ++idx) {
        const auto& obj = doc[idx];
        std::string ctx = "trace[" + std::to_string(idx) + "]";
        if (!obj.IsObject()) {
            throw LoaderError("must be an object", ctx);
        }

        TraceRecord record;
        if (!obj.HasMember("date") || !obj["date"].IsString()) {
            throw LoaderError("missing 'date'", ctx);
        }
        auto date = core::parse_iso_date(obj["date"].GetString());
        if (!date) {
            throw LoaderError("field 'date' must be a YYYY-MM-DD date", ctx);
        }
        record.date = *date;
        if (obj.HasMember("type") && obj["type"].IsString()) {
            record.type = obj["type"].GetString();
        }

        // Extract all other fields
        for (auto iter = obj.MemberBegin(); iter != obj.MemberEnd(); ++iter) {
            std::string key = iter->name.GetString();
            if (key == "date" || key == "type") {
                continue;
            }
            if (iter->value.IsDouble()) {
                record.fields[key] = iter->value.GetDouble();
            } else if (iter->value.IsUint64()) {
                record.fields[key] = iter->value.GetUint64();
            } else if (iter->value.IsInt64()) {
                // Negative integral levels stay signed
                record.fields[key] = static_cast<double>(iter->value.GetInt64());
            } else if (iter->value.IsString()) {
                record.fields[key] = std::string(iter->value.GetString());
            }
        }

        traces.push_back(std::move(record));
    }

    return traces;
}

ReplenishmentMetrics compute_metrics_from_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return compute_metrics(parse_json_trace(oss.str()));
}

} // namespace replsim::io
