#pragma once

#include "types.hpp"
#include <cstddef>
#include <memory>
#include <vector>
#include <spdlog/spdlog.h>

namespace tradebook {

class TradeEngine {
public:
    explicit TradeEngine(std::size_t workers = 1);
    ~TradeEngine() = default;

    // Rebuilds round-trip trades from an account's fills, sorted by open time.
    // Output is independent of input order (up to equal timestamps) and worker count.
    std::vector<TradeRecord> process(const std::vector<Fill>& fills) const;

    std::size_t workers() const { return workers_; }

private:
    std::size_t workers_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace tradebook
