#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <utility>
#include <string>

namespace gridcycle {

class Logger {
public:
    static Logger& getInstance();

    // 콘솔 + gridcycle.log(회전) + trades.csv(일별)
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");
    void setLevel(const std::string& level);
    void shutdown();

    // initialize() 전에는 모든 호출이 무시된다 (테스트에서 파일 생성 없음)
    template<typename... Args>
    void write(spdlog::level::level_enum level, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->log(level, fmt, std::forward<Args>(args)...);
        }
    }

    // trades.csv: time,symbol,layer,event,price,volume,pnl
    void logTrade(const std::string& symbol, const std::string& layer,
                  const std::string& event, double price, double volume, double pnl);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) gridcycle::Logger::getInstance().write(spdlog::level::debug, __VA_ARGS__)
#define LOG_INFO(...) gridcycle::Logger::getInstance().write(spdlog::level::info, __VA_ARGS__)
#define LOG_WARN(...) gridcycle::Logger::getInstance().write(spdlog::level::warn, __VA_ARGS__)
#define LOG_ERROR(...) gridcycle::Logger::getInstance().write(spdlog::level::err, __VA_ARGS__)

} // namespace gridcycle
