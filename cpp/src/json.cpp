#include "tradebook/json.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace tradebook {

namespace {

const nlohmann::json& require(const nlohmann::json& json, const char* key) {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        throw std::runtime_error(std::string("fill missing required field '") + key + "'");
    }
    return *it;
}

double require_decimal(const nlohmann::json& json, const char* key) {
    auto value = parse_decimal(require(json, key));
    if (!value) {
        throw std::runtime_error(std::string("fill has non-numeric '") + key + "'");
    }
    return *value;
}

double optional_decimal(const nlohmann::json& json, const char* key) {
    auto it = json.find(key);
    if (it == json.end()) {
        return 0.0;
    }
    return parse_decimal(*it).value_or(0.0);
}

std::int64_t optional_integer(const nlohmann::json& json, const char* key, std::int64_t fallback) {
    auto it = json.find(key);
    if (it == json.end() || !it->is_number_integer()) {
        return fallback;
    }
    return it->get<std::int64_t>();
}

} // namespace

std::optional<double> parse_decimal(const nlohmann::json& value) {
    if (value.is_number()) {
        double number = value.get<double>();
        if (!std::isfinite(number)) {
            return std::nullopt;
        }
        return number;
    }
    if (!value.is_string()) {
        return std::nullopt;
    }

    const auto& text = value.get_ref<const std::string&>();
    try {
        std::size_t consumed = 0;
        double parsed = std::stod(text, &consumed);
        // stod also accepts "nan" and "inf"
        if (consumed != text.size() || !std::isfinite(parsed)) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

Fill fill_from_json(const nlohmann::json& json, const std::string& account) {
    if (!json.is_object()) {
        throw std::runtime_error("fill is not a JSON object");
    }

    Fill fill;
    fill.coin = require(json, "coin").get<std::string>();
    fill.price = require_decimal(json, "px");
    fill.size = require_decimal(json, "sz");

    std::string side = require(json, "side").get<std::string>();
    if (side == "B") {
        fill.side = Side::Buy;
    } else if (side == "A") {
        fill.side = Side::Sell;
    } else {
        throw std::runtime_error("fill has unknown side '" + side + "'");
    }

    fill.time = require(json, "time").get<std::int64_t>();

    auto dir = json.find("dir");
    if (dir != json.end() && dir->is_string()) {
        fill.dir = dir->get<std::string>();
    }
    fill.direction = classify_direction(fill.dir);

    fill.start_position = optional_decimal(json, "startPosition");
    fill.closed_pnl = optional_decimal(json, "closedPnl");
    fill.fee = optional_decimal(json, "fee");
    fill.order_id = optional_integer(json, "oid", 0);
    fill.id = optional_integer(json, "tid", fill.order_id);

    auto hash = json.find("hash");
    if (hash != json.end() && hash->is_string()) {
        fill.hash = hash->get<std::string>();
    }
    auto crossed = json.find("crossed");
    if (crossed != json.end() && crossed->is_boolean()) {
        fill.crossed = crossed->get<bool>();
    }
    fill.account = account;
    return fill;
}

std::vector<Fill> fills_from_json(const nlohmann::json& json, const std::string& account) {
    if (!json.is_array()) {
        throw std::runtime_error("fills document must be a JSON array");
    }

    std::vector<Fill> fills;
    fills.reserve(json.size());
    for (const auto& entry : json) {
        fills.push_back(fill_from_json(entry, account));
    }
    return fills;
}

std::string serialize_fill_ids(const std::vector<std::int64_t>& ids) {
    std::ostringstream out;
    out << "[";
    for (std::size_t i = 0; i < ids.size(); i++) {
        if (i > 0) out << ", ";
        out << ids[i];
    }
    out << "]";
    return out.str();
}

nlohmann::json trade_to_json(const TradeRecord& trade) {
    return nlohmann::json{
        {"coin", trade.coin},
        {"side", trade.side == Side::Buy ? "B" : "A"},
        {"entry_px", trade.entry_price},
        {"exit_px", trade.exit_price},
        {"size", trade.size},
        {"pnl", trade.pnl},
        {"fees", trade.fees},
        {"open_time", trade.open_time},
        {"close_time", trade.close_time},
        {"hold_ms", trade.hold_ms},
        {"mae", trade.mae},
        {"mfe", trade.mfe},
        {"fill_ids", serialize_fill_ids(trade.fill_ids)}
    };
}

nlohmann::json trades_to_json(const std::vector<TradeRecord>& trades) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& trade : trades) {
        result.push_back(trade_to_json(trade));
    }
    return result;
}

std::vector<Candle> parse_candles(const nlohmann::json& json, std::size_t* skipped) {
    std::vector<Candle> candles;
    std::size_t dropped = 0;

    if (json.is_array()) {
        for (const auto& entry : json) {
            if (!entry.is_object() || !entry.contains("t") || !entry["t"].is_number_integer()) {
                dropped++;
                continue;
            }
            auto high = entry.contains("h") ? parse_decimal(entry["h"]) : std::nullopt;
            auto low = entry.contains("l") ? parse_decimal(entry["l"]) : std::nullopt;
            if (!high || !low) {
                dropped++;
                continue;
            }

            Candle candle;
            candle.start_time = entry["t"].get<std::int64_t>();
            candle.high = *high;
            candle.low = *low;
            candles.push_back(candle);
        }
    }

    std::stable_sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.start_time < b.start_time;
    });

    if (skipped) {
        *skipped = dropped;
    }
    return candles;
}

} // namespace tradebook
