#include "common/Config.h"
#include "common/Errors.h"
#include <iostream>
#include <cassert>
#include <cmath>
#include <limits>

int main() {
    using namespace gridcycle;

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    Config& config = Config::getInstance();

    // 1. 기본값
    config.resetToDefaults();
    {
        const auto cfg = config.getEngineConfig();
        assert(cfg.grid.symbol == "XAUUSDc");
        assert(std::abs(cfg.trade_amount - 0.1) < 1e-9);
        assert(std::abs(cfg.grid.delta_enter_price - 0.8) < 1e-9);
        assert(std::abs(cfg.grid.target_profit - 2.0) < 1e-9);
        assert(std::abs(cfg.grid.percent_scale - 12.0) < 1e-9);
        assert(cfg.grid.scaling_table.size() == 15);
        assert(cfg.grid.magic == 234002);
        assert(!cfg.cycle_target_profit);
        assert(std::abs(cfg.target_profit_multiplier - 1000.0) < 1e-9);

        // 감소 한도 = trade_amount * 10 * 2000
        assert(cfg.guards.max_reduce_balance && std::abs(*cfg.guards.max_reduce_balance - 2000.0) < 1e-9);
        assert(cfg.guards.min_free_margin && std::abs(*cfg.guards.min_free_margin - 100.0) < 1e-9);
        assert(!cfg.guards.max_spread);
        assert(cfg.guards.blackout_windows.size() == 1);
        assert(cfg.guards.blackout_windows[0].name == "news_halt");
        assert(cfg.guards.blackout_windows[0].start_minute == 270);
        assert(cfg.guards.blackout_windows[0].end_minute == 375);
        assert(cfg.guards.quiet_hours && cfg.guards.quiet_hours->start_minute == 19 * 60);
        assert(cfg.guards.utc_offset_minutes == 420);
        assert(config.getJournalPath() == "state/events.jsonl");
    }

    // 2. JSON 섹션
    {
        nlohmann::json j = {
            {"trading", {
                {"symbol", "XAUUSD"},
                {"trade_amount", 0.2},
                {"scaling_table", {1, 2, 3}},
                {"cycle_target_profit", 80.0},
                {"withdrawal_threshold", 500.0},
                {"pattern_suppression", "same_side"},
                {"pattern_min_streak", 3}
            }},
            {"guards", {
                {"max_spread", 0.5},
                {"max_drawdown", nullptr},
                {"max_positions", 10},
                {"blackout_windows", {
                    {{"name", "nfp"}, {"start", "19:00"}, {"end", "20:30"}, {"days", "fri"}},
                    {{"start", "04:30"}, {"end", "06:15"}, {"enabled", false}}
                }},
                {"quiet_hours", nullptr}
            }},
            {"logging", {{"dir", "out/logs"}, {"level", "debug"}}},
            {"journal", {{"path", "out/events.jsonl"}}},
            {"paper", {{"start_price", 2400.0}, {"seed", 7}}}
        };
        config.loadFromJson(j);

        const auto cfg = config.getEngineConfig();
        assert(cfg.grid.symbol == "XAUUSD");
        assert(std::abs(cfg.trade_amount - 0.2) < 1e-9);
        assert(cfg.grid.scaling_table.size() == 3);
        assert(cfg.cycle_target_profit && std::abs(*cfg.cycle_target_profit - 80.0) < 1e-9);
        assert(cfg.withdrawal_threshold && std::abs(*cfg.withdrawal_threshold - 500.0) < 1e-9);
        assert(cfg.suppression_policy == strategy::SuppressionPolicy::SAME_SIDE);
        assert(cfg.suppression_min_streak == 3);

        assert(cfg.guards.max_spread && std::abs(*cfg.guards.max_spread - 0.5) < 1e-9);
        assert(!cfg.guards.max_drawdown);
        assert(cfg.guards.max_positions && *cfg.guards.max_positions == 10);
        // 키 없음 -> trade_amount 기준 기본값
        assert(cfg.guards.max_reduce_balance && std::abs(*cfg.guards.max_reduce_balance - 4000.0) < 1e-9);
        assert(cfg.guards.blackout_windows.size() == 2);
        assert(cfg.guards.blackout_windows[0].name == "nfp");
        assert(cfg.guards.blackout_windows[0].weekday_mask != risk::TimeWindow::ALL_DAYS);
        assert(cfg.guards.blackout_windows[1].name == "blackout_1");
        assert(!cfg.guards.blackout_windows[1].enabled);
        assert(!cfg.guards.quiet_hours);

        assert(config.getLogDir() == "out/logs");
        assert(config.getLogLevel() == "debug");
        assert(config.getJournalPath() == "out/events.jsonl");
        assert(std::abs(config.getPaperConfig().start_price - 2400.0) < 1e-9);
        assert(config.getPaperConfig().seed == 7);
    }

    // 3. null -> 감소 한도 해제, 큰 개수는 int 최대값으로
    {
        nlohmann::json j = {
            {"trading", {{"scaling_overflow", "base_amount"}, {"pattern_suppression", "none"}}},
            {"guards", {{"max_reduce_balance", nullptr}, {"max_positions", 3e9}}}
        };
        config.loadFromJson(j);
        const auto cfg = config.getEngineConfig();
        assert(!cfg.guards.max_reduce_balance);
        assert(cfg.guards.max_positions && *cfg.guards.max_positions == std::numeric_limits<int>::max());
        assert(cfg.grid.table_overflow == strategy::TableOverflow::BASE_AMOUNT);
        assert(cfg.suppression_policy == strategy::SuppressionPolicy::NONE);
    }

    // 4. 잘못된 값은 거부, 기존 설정 유지
    {
        config.resetToDefaults();
        bool threw = false;
        try {
            config.loadFromJson({{"trading", {{"trade_amount", -1.0}}}});
        } catch (const InvalidConfigurationError&) {
            threw = true;
        }
        assert(threw);
        assert(std::abs(config.getEngineConfig().trade_amount - 0.1) < 1e-9);

        threw = false;
        try {
            nlohmann::json bad_window = {{"start", "25:00"}, {"end", "26:00"}};
            nlohmann::json j = {{"guards", {{"blackout_windows", nlohmann::json::array({bad_window})}}}};
            config.loadFromJson(j);
        } catch (const InvalidConfigurationError&) {
            threw = true;
        }
        assert(threw);

        // 0 lot 으로 반올림되는 기본 수량
        threw = false;
        try {
            config.loadFromJson({{"trading", {{"trade_amount", 0.004}}}});
        } catch (const InvalidConfigurationError&) {
            threw = true;
        }
        assert(threw);
        assert(std::abs(config.getEngineConfig().trade_amount - 0.1) < 1e-9);

        threw = false;
        try {
            config.loadFromJson({{"trading", {{"scaling_overflow", "wrap"}}}});
        } catch (const InvalidConfigurationError&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            config.loadFromJson({{"trading", {{"pattern_suppression", "sideways"}}}});
        } catch (const InvalidConfigurationError&) {
            threw = true;
        }
        assert(threw);
    }

    // 5. 없는 파일 -> 기본값
    config.load("config/does_not_exist.json");
    assert(config.getEngineConfig().grid.symbol == "XAUUSDc");

    std::cout << "[TEST] Config PASSED" << std::endl;
    return 0;
}
