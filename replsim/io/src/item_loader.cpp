#include <replsim/io/item_loader.hpp>
#include <replsim/io/error.hpp>

#include <replsim/core/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

#include <fstream>
#include <set>
#include <sstream>
#include <string>

namespace replsim::io {

namespace {

using namespace replsim::core;

// Helper to get required member with error context
const rapidjson::Value& get_member(const rapidjson::Value& obj, const char* name,
                                   const std::string& context) {
    if (!obj.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", context);
    }
    return obj[name];
}

double get_double(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsNumber()) {
        throw LoaderError(std::string("field '") + name + "' must be a number", context);
    }
    return member.GetDouble();
}

std::string get_string(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", context);
    }
    return {member.GetString(), member.GetStringLength()};
}

std::string get_string_or(const rapidjson::Value& val, const char* name,
                          const std::string& context) {
    if (!val.HasMember(name)) {
        return {};
    }
    return get_string(val, name, context);
}

int64_t get_days_or(const rapidjson::Value& val, const char* name, int64_t default_val,
                    const std::string& context) {
    if (!val.HasMember(name)) {
        return default_val;
    }
    const auto& member = val[name];
    if (!member.IsInt64()) {
        throw LoaderError(std::string("field '") + name + "' must be an integer", context);
    }
    int64_t value = member.GetInt64();
    if (value < 0) {
        throw LoaderError(std::string("field '") + name + "' must be non-negative", context);
    }
    return value;
}

Date get_date(const rapidjson::Value& val, const char* name, const std::string& context) {
    auto text = get_string(val, name, context);
    auto date = parse_iso_date(text);
    if (!date) {
        throw LoaderError(std::string("field '") + name + "' must be a YYYY-MM-DD date, got '" +
                              text + "'",
                          context);
    }
    return *date;
}

LeadTimePolicy parse_defaults(const rapidjson::Value& obj) {
    const std::string ctx = "defaults";
    if (!obj.IsObject()) {
        throw LoaderError("must be an object", ctx);
    }
    LeadTimePolicy policy;
    policy.lead_time_days = get_days_or(obj, "lead_time_days", policy.lead_time_days, ctx);
    policy.shipping_time_days =
        get_days_or(obj, "shipping_time_days", policy.shipping_time_days, ctx);
    policy.safety_stock_days =
        get_days_or(obj, "safety_stock_days", policy.safety_stock_days, ctx);
    return policy;
}

ReplenishmentInputs parse_item(const rapidjson::Value& obj, const ItemConfig& config,
                               const std::string& ctx) {
    if (!obj.IsObject()) {
        throw LoaderError("must be an object", ctx);
    }

    ReplenishmentInputs item;
    item.item.sku = get_string(obj, "sku", ctx);
    if (item.item.sku.empty()) {
        throw LoaderError("field 'sku' must not be empty", ctx);
    }
    item.item.product = get_string_or(obj, "product", ctx);
    item.item.variant = get_string_or(obj, "variant", ctx);

    item.starting_inventory = get_double(obj, "starting_inventory", ctx);
    item.daily_demand = get_double(obj, "daily_demand", ctx);
    if (item.daily_demand < 0.0) {
        throw LoaderError("field 'daily_demand' must be non-negative", ctx);
    }

    item.lead_time_days =
        get_days_or(obj, "lead_time_days", config.defaults.lead_time_days, ctx);
    item.shipping_time_days =
        get_days_or(obj, "shipping_time_days", config.defaults.shipping_time_days, ctx);
    item.safety_stock_days =
        get_days_or(obj, "safety_stock_days", config.defaults.safety_stock_days, ctx);

    if (config.start_date) {
        item.start_date = *config.start_date;
    }

    if (obj.HasMember("in_transit")) {
        const auto& transit = obj["in_transit"];
        std::string tctx = ctx + ".in_transit";
        if (!transit.IsObject()) {
            throw LoaderError("must be an object", tctx);
        }
        item.in_transit_quantity = get_double(transit, "quantity", tctx);
        if (item.in_transit_quantity < 0.0) {
            throw LoaderError("field 'quantity' must be non-negative", tctx);
        }
        if (transit.HasMember("arrival_date")) {
            item.in_transit_arrival_date = get_date(transit, "arrival_date", tctx);
        } else if (item.in_transit_quantity > 0.0) {
            throw LoaderError("missing required field 'arrival_date'", tctx);
        }
    }

    return item;
}

void parse_items_impl(ItemConfig& result, const rapidjson::Document& doc) {
    if (doc.HasMember("start_date")) {
        result.start_date = get_date(doc, "start_date", "config");
    }
    if (doc.HasMember("defaults")) {
        result.defaults = parse_defaults(doc["defaults"]);
    }

    if (!doc.HasMember("items")) {
        // No items is valid
        return;
    }
    const auto& items = doc["items"];
    if (!items.IsArray()) {
        throw LoaderError("field 'items' must be an array", "config");
    }

    std::set<std::string> seen;
    for (rapidjson::SizeType idx = 0; idx < items.Size(); ++idx) {
        std::string ctx = "items[" + std::to_string(idx) + "]";
        auto item = parse_item(items[idx], result, ctx);

        if (!seen.insert(item.item.sku).second) {
            throw LoaderError("duplicate sku '" + item.item.sku + "'", ctx);
        }

        // Remaining cross-field rules are the core's
        try {
            validate_inputs(item);
        } catch (const InvalidParameterError& e) {
            throw LoaderError(e.what(), ctx);
        }

        result.items.push_back(std::move(item));
    }
}

} // anonymous namespace

ItemConfig load_items(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_items_from_string(oss.str());
}

ItemConfig load_items_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse<rapidjson::kParseFullPrecisionFlag>(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "config");
    }

    ItemConfig result;
    parse_items_impl(result, doc);
    return result;
}

void write_items_to_stream(const ItemConfig& config, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();

    if (config.start_date) {
        writer.Key("start_date");
        writer.String(format_iso_date(*config.start_date).c_str());
    }

    writer.Key("defaults");
    writer.StartObject();
    writer.Key("lead_time_days");
    writer.Int64(config.defaults.lead_time_days);
    writer.Key("shipping_time_days");
    writer.Int64(config.defaults.shipping_time_days);
    writer.Key("safety_stock_days");
    writer.Int64(config.defaults.safety_stock_days);
    writer.EndObject();

    writer.Key("items");
    writer.StartArray();
    for (const auto& item : config.items) {
        writer.StartObject();

        writer.Key("product");
        writer.String(item.item.product.c_str(),
                      static_cast<rapidjson::SizeType>(item.item.product.size()));
        writer.Key("variant");
        writer.String(item.item.variant.c_str(),
                      static_cast<rapidjson::SizeType>(item.item.variant.size()));
        writer.Key("sku");
        writer.String(item.item.sku.c_str(),
                      static_cast<rapidjson::SizeType>(item.item.sku.size()));

        writer.Key("starting_inventory");
        writer.Double(item.starting_inventory);
        writer.Key("daily_demand");
        writer.Double(item.daily_demand);
        writer.Key("lead_time_days");
        writer.Int64(item.lead_time_days);
        writer.Key("shipping_time_days");
        writer.Int64(item.shipping_time_days);
        writer.Key("safety_stock_days");
        writer.Int64(item.safety_stock_days);

        if (item.in_transit_quantity > 0.0 && item.in_transit_arrival_date) {
            writer.Key("in_transit");
            writer.StartObject();
            writer.Key("quantity");
            writer.Double(item.in_transit_quantity);
            writer.Key("arrival_date");
            writer.String(format_iso_date(*item.in_transit_arrival_date).c_str());
            writer.EndObject();
        }

        writer.EndObject();
    }
    writer.EndArray();

    writer.EndObject();

    out << buffer.GetString();
}

void write_items(const ItemConfig& config, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    write_items_to_stream(config, file);
}

} // namespace replsim::io
