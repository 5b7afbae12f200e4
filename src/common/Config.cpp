#include "common/Config.h"
#include "common/Errors.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace gridcycle {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

// 키 없음 -> fallback, null -> 해제, 숫자 -> 값
std::optional<double> optionalNumber(const nlohmann::json& section, const char* key,
                                     std::optional<double> fallback) {
    if (!section.contains(key)) {
        return fallback;
    }
    const auto& v = section.at(key);
    if (v.is_null()) {
        return std::nullopt;
    }
    return v.get<double>();
}

std::optional<int> optionalCount(const nlohmann::json& section, const char* key) {
    if (!section.contains(key) || section.at(key).is_null()) {
        return std::nullopt;
    }
    return risk::GuardConfig::toCount(section.at(key).get<double>());
}

risk::TimeWindow parseWindow(const nlohmann::json& w, const std::string& fallback_name) {
    const std::string name = w.value("name", fallback_name);
    const std::string range = w.value("start", std::string("00:00")) + "-" + w.value("end", std::string("00:00"));
    risk::TimeWindow window = risk::TimeWindow::parse(name, range);
    if (w.contains("days")) {
        window.weekday_mask = risk::TimeWindow::parseWeekdays(w.at("days").get<std::string>());
    }
    window.enabled = w.value("enabled", true);
    return window;
}

risk::TimeWindow defaultNewsHalt() {
    return risk::TimeWindow("news_halt", 4 * 60 + 30, 6 * 60 + 15);
}

risk::TimeWindow defaultQuietHours() {
    return risk::TimeWindow("quiet_hours", 19 * 60, 23 * 60 + 59);
}
} // namespace

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

Config::Config() {
    resetToDefaults();
}

void Config::resetToDefaults() {
    venue_login_.clear();
    venue_password_.clear();
    venue_server_.clear();
    log_dir_ = "logs";
    log_level_ = "info";
    journal_path_ = "state/events.jsonl";
    engine_config_ = engine::EngineConfig{};
    engine_config_.guards.max_reduce_balance = engine_config_.trade_amount * 10.0 * 2000.0;
    engine_config_.guards.blackout_windows = {defaultNewsHalt()};
    engine_config_.guards.quiet_hours = defaultQuietHours();
    paper_config_ = PaperVenueConfig{};
}

void Config::load(const std::string& path) {
    resetToDefaults();

    venue_login_ = readEnvVar("GRIDCYCLE_VENUE_LOGIN");
    venue_password_ = readEnvVar("GRIDCYCLE_VENUE_PASSWORD");
    venue_server_ = readEnvVar("GRIDCYCLE_VENUE_SERVER");

    const std::filesystem::path config_path = utils::PathUtils::resolveRelativePath(path);

    std::cout << "설정 파일 경로: " << config_path << std::endl;

    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        std::cout << "경고: 설정 파일을 찾을 수 없습니다: " << config_path << std::endl;
        std::cout << "기본값을 사용합니다." << std::endl;
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cout << "경고: 설정 파일을 열 수 없습니다." << std::endl;
        return;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "설정 파싱 오류 (기본값 사용): " << e.what() << std::endl;
        return;
    }

    if (j.contains("venue")) {
        const auto& v = j["venue"];
        if (v.contains("login") || v.contains("password")) {
            std::cout << "경고: config venue 인증 값은 무시됩니다. 환경 변수(GRIDCYCLE_VENUE_LOGIN/PASSWORD/SERVER)를 사용하세요."
                      << std::endl;
        }
    }

    try {
        loadFromJson(j);
    } catch (const nlohmann::json::exception& e) {
        // 타입이 맞지 않는 값: 파일 전체를 무시
        std::cerr << "설정 값 타입 오류 (기본값 사용): " << e.what() << std::endl;
        const std::string login = venue_login_;
        const std::string password = venue_password_;
        const std::string server = venue_server_;
        resetToDefaults();
        venue_login_ = login;
        venue_password_ = password;
        venue_server_ = server;
    }
}

void Config::loadFromJson(const nlohmann::json& j) {
    engine::EngineConfig cfg;
    cfg.guards.blackout_windows = {defaultNewsHalt()};
    cfg.guards.quiet_hours = defaultQuietHours();

    if (j.contains("trading")) {
        const auto& t = j["trading"];
        auto& grid = cfg.grid;

        grid.symbol = t.value("symbol", grid.symbol);
        cfg.trade_amount = t.value("trade_amount", cfg.trade_amount);
        grid.delta_enter_price = t.value("delta_enter_price", grid.delta_enter_price);
        grid.target_profit = t.value("target_profit", grid.target_profit);
        grid.percent_scale = t.value("percent_scale", grid.percent_scale);
        if (t.contains("scaling_table")) {
            grid.scaling_table = t["scaling_table"].get<std::vector<double>>();
        }
        if (t.contains("scaling_overflow")) {
            grid.table_overflow = strategy::parseTableOverflow(t["scaling_overflow"].get<std::string>());
        }
        grid.magic = t.value("magic_number", grid.magic);
        grid.duplicate_price_tolerance = t.value("duplicate_price_tolerance", grid.duplicate_price_tolerance);
        grid.price_digits = t.value("price_digits", grid.price_digits);
        grid.volume_digits = t.value("volume_digits", grid.volume_digits);

        cfg.cycle_target_profit = optionalNumber(t, "cycle_target_profit", std::nullopt);
        cfg.target_profit_multiplier = t.value("target_profit_multiplier", cfg.target_profit_multiplier);
        cfg.withdrawal_threshold = optionalNumber(t, "withdrawal_threshold", std::nullopt);
        cfg.tick_interval_ms = t.value("tick_interval_ms", cfg.tick_interval_ms);
        cfg.paused_poll_interval_ms = t.value("paused_poll_interval_ms", cfg.paused_poll_interval_ms);
        cfg.venue_failure_alert_threshold = t.value("venue_failure_alert_threshold", cfg.venue_failure_alert_threshold);
        cfg.reanchor_on_fill = t.value("reanchor_on_fill", cfg.reanchor_on_fill);
        if (t.contains("pattern_suppression")) {
            cfg.suppression_policy = strategy::parseSuppressionPolicy(t["pattern_suppression"].get<std::string>());
        }
        cfg.suppression_min_streak = t.value("pattern_min_streak", cfg.suppression_min_streak);
        cfg.guards.utc_offset_minutes = t.value("utc_offset_minutes", cfg.guards.utc_offset_minutes);
    }

    // 감소 한도 기본값은 trade_amount 기준
    const double default_max_reduce = cfg.trade_amount * 10.0 * 2000.0;
    cfg.guards.max_reduce_balance = default_max_reduce;

    if (j.contains("guards")) {
        const auto& g = j["guards"];
        auto& guards = cfg.guards;

        guards.max_drawdown = optionalNumber(g, "max_drawdown", std::nullopt);
        guards.max_positions = optionalCount(g, "max_positions");
        guards.max_orders = optionalCount(g, "max_orders");
        guards.max_spread = optionalNumber(g, "max_spread", std::nullopt);
        guards.max_reduce_balance = optionalNumber(g, "max_reduce_balance", default_max_reduce);
        guards.min_free_margin = optionalNumber(g, "min_free_margin", 100.0);
        guards.max_total_exposure = optionalNumber(g, "max_total_exposure", std::nullopt);
        guards.allow_cycle_completion_in_blackout =
            g.value("allow_cycle_completion_in_blackout", guards.allow_cycle_completion_in_blackout);

        if (g.contains("blackout_windows")) {
            guards.blackout_windows.clear();
            int n = 0;
            for (const auto& w : g["blackout_windows"]) {
                guards.blackout_windows.push_back(parseWindow(w, "blackout_" + std::to_string(n++)));
            }
        }

        if (g.contains("quiet_hours")) {
            const auto& q = g["quiet_hours"];
            if (q.is_null() || !q.value("enabled", true)) {
                guards.quiet_hours.reset();
            } else {
                guards.quiet_hours = parseWindow(q, "quiet_hours");
            }
            if (q.is_object()) {
                guards.quiet_hours_factor = q.value("factor", guards.quiet_hours_factor);
            }
        }
    }

    cfg.validate();

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        log_dir_ = l.value("dir", log_dir_);
        log_level_ = l.value("level", log_level_);
    }

    if (j.contains("journal")) {
        journal_path_ = j["journal"].value("path", journal_path_);
    }

    if (j.contains("paper")) {
        const auto& p = j["paper"];
        paper_config_.initial_balance = p.value("initial_balance", paper_config_.initial_balance);
        paper_config_.start_price = p.value("start_price", paper_config_.start_price);
        paper_config_.spread = p.value("spread", paper_config_.spread);
        paper_config_.volatility = p.value("volatility", paper_config_.volatility);
        paper_config_.seed = p.value("seed", paper_config_.seed);
        paper_config_.contract_size = p.value("contract_size", paper_config_.contract_size);
        paper_config_.leverage = p.value("leverage", paper_config_.leverage);
        paper_config_.quote_interval_ms = p.value("quote_interval_ms", paper_config_.quote_interval_ms);
    }

    engine_config_ = cfg;
}

} // namespace gridcycle
