#pragma once

#include "accumulator.hpp"
#include "types.hpp"
#include <optional>
#include <vector>

namespace tradebook {

struct StepResult {
    std::optional<TradeAccumulator> live;
    std::vector<TradeRecord> emitted;
};

// Applies one fill to the instrument's live accumulator (if any).
StepResult step(std::optional<TradeAccumulator> live, const Fill& fill);

// Runs one instrument's chronologically ordered fills through step().
// A position still open at the end of input is dropped.
std::vector<TradeRecord> process_instrument(const std::vector<Fill>& fills);

} // namespace tradebook
