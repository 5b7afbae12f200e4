#include "risk/GuardConfig.h"
#include "common/Errors.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace gridcycle {
namespace risk {

const char* toString(GuardKind kind) {
    switch (kind) {
        case GuardKind::MAX_DRAWDOWN: return "max_drawdown";
        case GuardKind::MAX_POSITIONS: return "max_positions";
        case GuardKind::MAX_ORDERS: return "max_orders";
        case GuardKind::MAX_SPREAD: return "max_spread";
        case GuardKind::MAX_REDUCE: return "max_reduce_balance";
        case GuardKind::MIN_FREE_MARGIN: return "min_free_margin";
        case GuardKind::MAX_TOTAL_EXPOSURE: return "max_total_exposure";
    }
    return "unknown";
}

std::optional<GuardKind> parseGuardKind(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // 콘솔 명령용 짧은 별칭 포함
    if (n == "max_drawdown" || n == "maxdd") return GuardKind::MAX_DRAWDOWN;
    if (n == "max_positions" || n == "maxpos") return GuardKind::MAX_POSITIONS;
    if (n == "max_orders" || n == "maxord") return GuardKind::MAX_ORDERS;
    if (n == "max_spread" || n == "maxspread") return GuardKind::MAX_SPREAD;
    if (n == "max_reduce_balance" || n == "max_reduce" || n == "maxreduce") return GuardKind::MAX_REDUCE;
    if (n == "min_free_margin" || n == "minmargin") return GuardKind::MIN_FREE_MARGIN;
    if (n == "max_total_exposure" || n == "maxexposure") return GuardKind::MAX_TOTAL_EXPOSURE;
    return std::nullopt;
}

void GuardConfig::setThreshold(GuardKind kind, std::optional<double> value) {
    if (value && (!std::isfinite(*value) || *value < 0.0)) {
        throw InvalidConfigurationError(
            std::string("guard ") + toString(kind) + " must be a non-negative number");
    }

    auto asCount = [](const std::optional<double>& v) -> std::optional<int> {
        if (!v) return std::nullopt;
        return toCount(*v);
    };

    switch (kind) {
        case GuardKind::MAX_DRAWDOWN: max_drawdown = value; break;
        case GuardKind::MAX_POSITIONS: max_positions = asCount(value); break;
        case GuardKind::MAX_ORDERS: max_orders = asCount(value); break;
        case GuardKind::MAX_SPREAD: max_spread = value; break;
        case GuardKind::MAX_REDUCE: max_reduce_balance = value; break;
        case GuardKind::MIN_FREE_MARGIN: min_free_margin = value; break;
        case GuardKind::MAX_TOTAL_EXPOSURE: max_total_exposure = value; break;
    }
}

std::optional<double> GuardConfig::threshold(GuardKind kind) const {
    switch (kind) {
        case GuardKind::MAX_DRAWDOWN: return max_drawdown;
        case GuardKind::MAX_POSITIONS:
            return max_positions ? std::optional<double>(*max_positions) : std::nullopt;
        case GuardKind::MAX_ORDERS:
            return max_orders ? std::optional<double>(*max_orders) : std::nullopt;
        case GuardKind::MAX_SPREAD: return max_spread;
        case GuardKind::MAX_REDUCE: return max_reduce_balance;
        case GuardKind::MIN_FREE_MARGIN: return min_free_margin;
        case GuardKind::MAX_TOTAL_EXPOSURE: return max_total_exposure;
    }
    return std::nullopt;
}

int GuardConfig::toCount(double value) {
    if (!std::isfinite(value) || value < 0.0) {
        throw InvalidConfigurationError("guard count must be a non-negative number");
    }
    const double rounded = std::round(value);
    if (rounded >= static_cast<double>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(rounded);
}

void GuardConfig::upsertBlackoutWindow(const TimeWindow& window) {
    auto it = std::find_if(blackout_windows.begin(), blackout_windows.end(),
                           [&](const TimeWindow& w) { return w.name == window.name; });
    if (it != blackout_windows.end()) {
        *it = window;
    } else {
        blackout_windows.push_back(window);
    }
}

} // namespace risk
} // namespace gridcycle
