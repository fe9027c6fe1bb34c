#include "tradebook/position_machine.hpp"
#include "tradebook/finalizer.hpp"
#include <cmath>
#include <utility>

namespace tradebook {

namespace {

bool is_flat(double position) {
    return std::abs(position) < kFlatEpsilon;
}

void finish(std::optional<TradeAccumulator>& live, std::vector<TradeRecord>& emitted) {
    if (auto trade = finalize_trade(*live)) {
        emitted.push_back(std::move(*trade));
    }
    live.reset();
}

void apply_open(std::optional<TradeAccumulator>& live, const Fill& fill) {
    if (!live) {
        live = TradeAccumulator::open_from(fill);
    } else {
        live->scale_in(fill);
    }
}

void apply_close(std::optional<TradeAccumulator>& live, const Fill& fill,
                 std::vector<TradeRecord>& emitted) {
    if (!live) {
        // Position was opened before the visible history
        live = TradeAccumulator::open_from(fill);
        live->orphan = true;
        live->realized_pnl += fill.closed_pnl;
    } else {
        live->close_with(fill);
    }

    if (is_flat(fill.end_position())) {
        finish(live, emitted);
    }
}

void apply_unknown(std::optional<TradeAccumulator>& live, const Fill& fill,
                   std::vector<TradeRecord>& emitted) {
    if (!live) {
        if (!is_flat(fill.end_position())) {
            live = TradeAccumulator::open_from(fill);
        }
        return;
    }

    live->absorb_unknown(fill);
    if (is_flat(fill.end_position())) {
        finish(live, emitted);
    }
}

// Splits a flip at the zero crossing: the first leg flattens the old position,
// the second opens the new one at the same price. Fees are split by size and
// the realized pnl belongs to the closing leg.
std::pair<Fill, Fill> split_flip(const Fill& fill) {
    double close_size = std::abs(fill.start_position);
    double open_size = std::abs(fill.end_position());
    double total = close_size + open_size;

    Fill closing = fill;
    closing.size = close_size;
    closing.direction = Direction::Close;
    closing.fee = total > 0 ? fill.fee * close_size / total : 0.0;

    Fill opening = fill;
    opening.size = open_size;
    opening.direction = Direction::Open;
    opening.fee = fill.fee - closing.fee;
    opening.closed_pnl = 0.0;
    opening.start_position = 0.0;

    return {closing, opening};
}

void apply_flip(std::optional<TradeAccumulator>& live, const Fill& fill,
                std::vector<TradeRecord>& emitted) {
    if (is_flat(fill.start_position)) {
        apply_open(live, fill);
        return;
    }
    // Tagged as a flip but the position does not cross zero
    if (fill.start_position * fill.end_position() >= 0) {
        apply_close(live, fill, emitted);
        return;
    }

    auto [closing, opening] = split_flip(fill);
    apply_close(live, closing, emitted);
    apply_open(live, opening);
}

} // namespace

StepResult step(std::optional<TradeAccumulator> live, const Fill& fill) {
    StepResult result;

    switch (fill.direction) {
        case Direction::Open:
            apply_open(live, fill);
            break;
        case Direction::Close:
            apply_close(live, fill, result.emitted);
            break;
        case Direction::Flip:
            apply_flip(live, fill, result.emitted);
            break;
        case Direction::Unknown:
            apply_unknown(live, fill, result.emitted);
            break;
    }

    result.live = std::move(live);
    return result;
}

std::vector<TradeRecord> process_instrument(const std::vector<Fill>& fills) {
    std::vector<TradeRecord> trades;
    std::optional<TradeAccumulator> live;

    for (const auto& fill : fills) {
        StepResult result = step(std::move(live), fill);
        live = std::move(result.live);
        for (auto& trade : result.emitted) {
            trades.push_back(std::move(trade));
        }
    }

    return trades;
}

} // namespace tradebook
