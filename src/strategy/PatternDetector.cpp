#include "strategy/PatternDetector.h"
#include "common/Errors.h"

#include <algorithm>
#include <cctype>

namespace gridcycle {
namespace strategy {

const char* toString(SuppressionPolicy policy) {
    switch (policy) {
        case SuppressionPolicy::OPPOSITE_SIDE: return "opposite_side";
        case SuppressionPolicy::SAME_SIDE: return "same_side";
        case SuppressionPolicy::NONE: return "none";
    }
    return "opposite_side";
}

SuppressionPolicy parseSuppressionPolicy(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (n == "opposite_side" || n == "opposite") return SuppressionPolicy::OPPOSITE_SIDE;
    if (n == "same_side" || n == "same") return SuppressionPolicy::SAME_SIDE;
    if (n == "none" || n == "off") return SuppressionPolicy::NONE;
    throw InvalidConfigurationError("unknown suppression policy '" + name + "'");
}

PatternDetector::PatternDetector(SuppressionPolicy policy, int min_streak)
    : policy_(policy)
    , min_streak_(std::max(2, min_streak))
{}

PatternSignal PatternDetector::detect(const std::vector<GridOrder>& filled_orders) const {
    std::vector<int> buys;
    std::vector<int> sells;
    for (const auto& order : filled_orders) {
        if (order.key.side == OrderSide::BUY) {
            buys.push_back(order.key.index);
        } else {
            sells.push_back(order.key.index);
        }
    }

    PatternSignal signal;
    // 매수는 오름차순 +1, 매도는 내림차순 -1
    signal.buy_streak = longestRun(std::move(buys), +1);
    signal.sell_streak = longestRun(std::move(sells), -1);

    const bool buy_run = signal.buy_streak >= min_streak_;
    const bool sell_run = signal.sell_streak >= min_streak_;

    if (policy_ == SuppressionPolicy::OPPOSITE_SIDE) {
        signal.suppress_next_sell = buy_run;
        signal.suppress_next_buy = sell_run;
    } else if (policy_ == SuppressionPolicy::SAME_SIDE) {
        signal.suppress_next_buy = buy_run;
        signal.suppress_next_sell = sell_run;
    }
    return signal;
}

int PatternDetector::longestRun(std::vector<int> indices, int step) {
    if (indices.empty()) {
        return 0;
    }
    if (step > 0) {
        std::sort(indices.begin(), indices.end());
    } else {
        std::sort(indices.begin(), indices.end(), std::greater<int>());
    }
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());

    int best = 1;
    int run = 1;
    for (std::size_t i = 1; i < indices.size(); ++i) {
        if (indices[i] - indices[i - 1] == step) {
            ++run;
            best = std::max(best, run);
        } else {
            run = 1;
        }
    }
    return best;
}

} // namespace strategy
} // namespace gridcycle
