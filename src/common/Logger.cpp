#include "common/Logger.h"
#include "common/PathUtils.h"
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace gridcycle {

namespace {
constexpr std::size_t kMaxLogBytes = 10 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 5;
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, const std::string& level) {
    if (initialized_) return;

    const std::filesystem::path logs_path = utils::PathUtils::resolveRelativePath(log_dir);
    std::string error;
    if (!utils::PathUtils::ensureParentDirectory(logs_path / "gridcycle.log", &error)) {
        throw std::runtime_error("Log directory unavailable: " + logs_path.string() + " (" + error + ")");
    }

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (logs_path / "gridcycle.log").string(), kMaxLogBytes, kMaxLogFiles);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [t%t] %v");

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        main_logger_ = std::make_shared<spdlog::logger>("gridcycle", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::from_str(level));
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        // 체결/청산 기록은 CSV 로 분리 (첫 열은 로컬 시각)
        trade_logger_ = spdlog::daily_logger_mt("trades", (logs_path / "trades.csv").string());
        trade_logger_->set_pattern("%Y-%m-%d %H:%M:%S.%e,%v");
        trade_logger_->flush_on(spdlog::level::info);

        initialized_ = true;
        main_logger_->info("Logger initialized (level {}, dir {})", level, logs_path.string());

    } catch (const spdlog::spdlog_ex& ex) {
        main_logger_.reset();
        trade_logger_.reset();
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::setLevel(const std::string& level) {
    if (!main_logger_) return;
    main_logger_->set_level(spdlog::level::from_str(level));
}

void Logger::shutdown() {
    if (main_logger_) main_logger_->flush();
    if (trade_logger_) trade_logger_->flush();
    spdlog::shutdown();
    main_logger_.reset();
    trade_logger_.reset();
    initialized_ = false;
}

void Logger::logTrade(const std::string& symbol, const std::string& layer,
                      const std::string& event, double price, double volume, double pnl) {
    if (!trade_logger_) return;

    std::ostringstream row;
    row << symbol << ',' << layer << ',' << event << ','
        << std::fixed << std::setprecision(3) << price << ','
        << std::setprecision(2) << volume << ','
        << std::setprecision(2) << pnl;
    trade_logger_->info(row.str());
}

} // namespace gridcycle
