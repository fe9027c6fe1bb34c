#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tradebook {

// Venue numbers arrive either as decimal strings or JSON numbers.
// Returns std::nullopt when the value is missing or not a clean decimal.
std::optional<double> parse_decimal(const nlohmann::json& value);

// Throws std::runtime_error when a required field (coin, px, sz, side, time) is missing
Fill fill_from_json(const nlohmann::json& json, const std::string& account = "");
std::vector<Fill> fills_from_json(const nlohmann::json& json, const std::string& account = "");

nlohmann::json trade_to_json(const TradeRecord& trade);
nlohmann::json trades_to_json(const std::vector<TradeRecord>& trades);

// Serialized form of the fill id list, e.g. "[101, 102]"
std::string serialize_fill_ids(const std::vector<std::int64_t>& ids);

// Lenient candle parsing: entries without a usable t/h/l are skipped.
// The result is sorted by start time.
std::vector<Candle> parse_candles(const nlohmann::json& json, std::size_t* skipped = nullptr);

} // namespace tradebook
