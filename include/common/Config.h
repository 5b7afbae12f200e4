#pragma once

#include <string>
#include <mutex>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace gridcycle {

// 콘솔 모의 거래 설정
struct PaperVenueConfig {
    double initial_balance = 10000.0;
    double start_price = 2000.0;
    double spread = 0.2;
    double volatility = 0.3;       // 틱당 가격 변화 표준편차
    unsigned int seed = 42;
    double contract_size = 100.0;
    double leverage = 100.0;
    int quote_interval_ms = 200;
};

class Config {
public:
    static Config& getInstance();

    // 파일이 없거나 JSON 파싱 실패 시 경고 후 기본값 유지
    void load(const std::string& config_path);
    // 값 오류(시간 형식, 범위 등)는 InvalidConfigurationError. 이 경우 기존 설정 유지
    void loadFromJson(const nlohmann::json& j);
    void resetToDefaults();

    // 거래소 인증 정보는 환경 변수에서만 읽는다
    std::string getVenueLogin() const { return venue_login_; }
    std::string getVenuePassword() const { return venue_password_; }
    std::string getVenueServer() const { return venue_server_; }

    std::string getLogDir() const { return log_dir_; }
    std::string getLogLevel() const { return log_level_; }
    std::string getJournalPath() const { return journal_path_; }

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    PaperVenueConfig getPaperConfig() const { return paper_config_; }

private:
    Config();

    std::string venue_login_;
    std::string venue_password_;
    std::string venue_server_;

    std::string log_dir_ = "logs";
    std::string log_level_ = "info";
    std::string journal_path_ = "state/events.jsonl";

    engine::EngineConfig engine_config_;
    PaperVenueConfig paper_config_;
};

} // namespace gridcycle
