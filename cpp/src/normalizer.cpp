#include "tradebook/normalizer.hpp"
#include <algorithm>

namespace tradebook {

FillsByCoin normalize_fills(const std::vector<Fill>& fills) {
    std::vector<Fill> sorted = fills;
    std::stable_sort(sorted.begin(), sorted.end(), [](const Fill& a, const Fill& b) {
        return a.time < b.time;
    });

    FillsByCoin by_coin;
    for (auto& fill : sorted) {
        by_coin[fill.coin].push_back(std::move(fill));
    }
    return by_coin;
}

} // namespace tradebook
