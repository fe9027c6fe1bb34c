#pragma once

#include "types.hpp"
#include <map>
#include <string>
#include <vector>

namespace tradebook {

using FillsByCoin = std::map<std::string, std::vector<Fill>>;

// Stable-sorts fills by time and partitions them per instrument.
// Fills sharing a timestamp keep their input order.
FillsByCoin normalize_fills(const std::vector<Fill>& fills);

} // namespace tradebook
