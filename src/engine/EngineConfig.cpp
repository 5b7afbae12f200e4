#include "engine/EngineConfig.h"
#include "common/Errors.h"
#include "strategy/PositionSizer.h"

#include <cmath>
#include <string>

namespace gridcycle {
namespace engine {

namespace {
void requirePositive(double value, const char* name) {
    if (!(value > 0.0) || !std::isfinite(value)) {
        throw InvalidConfigurationError(std::string(name) + " must be positive");
    }
}
} // namespace

void EngineConfig::validate() const {
    if (grid.symbol.empty()) {
        throw InvalidConfigurationError("trading.symbol is empty");
    }
    requirePositive(trade_amount, "trading.trade_amount");
    requirePositive(grid.delta_enter_price, "trading.delta_enter_price");
    requirePositive(grid.target_profit, "trading.target_profit");
    requirePositive(target_profit_multiplier, "trading.target_profit_multiplier");
    strategy::PositionSizer::validateTable(grid.scaling_table);

    if (grid.percent_scale < 0.0 || !std::isfinite(grid.percent_scale)) {
        throw InvalidConfigurationError("trading.percent_scale must be >= 0");
    }
    if (grid.duplicate_price_tolerance < 0.0) {
        throw InvalidConfigurationError("trading.duplicate_price_tolerance must be >= 0");
    }
    if (grid.price_digits < 0 || grid.price_digits > 8 || grid.volume_digits < 0 || grid.volume_digits > 8) {
        throw InvalidConfigurationError("trading price/volume digits out of range");
    }
    if (!strategy::GridBuilder::yieldsTradableVolume(grid, trade_amount)) {
        throw InvalidConfigurationError("trading.trade_amount rounds to zero volume at "
                                        + std::to_string(grid.volume_digits) + " digits");
    }
    if (cycle_target_profit) {
        requirePositive(*cycle_target_profit, "trading.cycle_target_profit");
    }
    if (withdrawal_threshold) {
        requirePositive(*withdrawal_threshold, "trading.withdrawal_threshold");
    }
    if (tick_interval_ms <= 0 || paused_poll_interval_ms <= 0) {
        throw InvalidConfigurationError("loop intervals must be positive");
    }
    if (venue_failure_alert_threshold < 1) {
        throw InvalidConfigurationError("venue_failure_alert_threshold must be >= 1");
    }
    if (suppression_min_streak < 2) {
        throw InvalidConfigurationError("pattern min streak must be >= 2");
    }
    if (guards.utc_offset_minutes < -14 * 60 || guards.utc_offset_minutes > 14 * 60) {
        throw InvalidConfigurationError("utc_offset_minutes out of range");
    }
    if (!(guards.quiet_hours_factor > 0.0) || guards.quiet_hours_factor > 1.0) {
        throw InvalidConfigurationError("quiet_hours.factor must be in (0, 1]");
    }
}

} // namespace engine
} // namespace gridcycle
