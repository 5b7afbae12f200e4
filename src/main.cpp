#include "common/Logger.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "common/PathUtils.h"
#include "core/state/EventJournalJsonl.h"
#include "engine/CycleController.h"
#include "execution/PaperTradingVenue.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cmath>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace gridcycle;

// Ctrl+C 종료 플래그 (시그널 핸들러에서는 플래그만 세운다)
static std::atomic<bool> g_shutdown{false};

void signalHandler(int signal) {
    if (signal == SIGINT) {
        g_shutdown = true;
    }
}

// 콘솔 입력 헬퍼
static std::string trimCopy(const std::string& input) {
    const auto first = input.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = input.find_last_not_of(" \t\r\n");
    return input.substr(first, last - first + 1);
}

static std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

static std::vector<std::string> splitWords(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> words;
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

static bool parseNumber(const std::string& text, double& out) {
    try {
        size_t used = 0;
        out = std::stod(text, &used);
        return used == text.size() && std::isfinite(out);
    } catch (const std::logic_error&) {
        return false;
    }
}

static void printHelp() {
    std::cout << "\n명령어:\n"
              << "  start                      사이클 시작/재개\n"
              << "  pause                      일시정지 (다음 틱부터)\n"
              << "  stop                       현재 사이클 완료 후 정지\n"
              << "  ack                        긴급 정지 확인\n"
              << "  amount <x> | amount clear  기본 수량 고정/해제\n"
              << "  guard <kind> <value|off>   가드 임계값 (maxdd, maxpos, maxord, maxspread, maxreduce, minmargin, maxexposure)\n"
              << "  blackout HH:MM-HH:MM       블랙아웃 추가 | blackout clear\n"
              << "  quiet HH:MM-HH:MM <factor> 저유동성 시간대 | quiet off\n"
              << "  withdrawn                  출금 완료\n"
              << "  status                     상태 출력\n"
              << "  quit                       종료\n\n";
}

static void printStatus(const engine::ControllerStatus& s) {
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "\n===== GridCycle 상태 =====\n"
              << "  상태        : " << engine::toString(s.state);
    if (s.state != engine::ControllerState::RUNNING) {
        std::cout << " (" << engine::toString(s.pause_reason) << ")";
    }
    std::cout << "\n"
              << "  사이클      : #" << s.cycle_number << (s.cycle_active ? " (진행 중)" : " (대기)")
              << (s.stop_after_cycle ? " [완료 후 정지]" : "") << "\n"
              << "  anchor      : " << s.anchor_index << "\n"
              << "  기본 수량   : " << s.base_amount
              << (s.base_amount_override ? " (고정)" : "") << "\n"
              << "  사이클 목표 : " << s.cycle_target << "\n"
              << "  실현/미실현 : " << s.realized_pnl << " / " << s.unrealized_pnl << "\n"
              << "  최대 낙폭   : " << s.max_drawdown << "\n"
              << "  세션 수익   : " << s.session_profit << "\n";
    if (s.last_guard_reason != risk::GuardReason::NONE) {
        std::cout << "  가드 차단   : " << risk::toString(s.last_guard_reason)
                  << " - " << s.last_guard_detail << "\n";
    }
    if (s.consecutive_venue_failures > 0) {
        std::cout << "  거래소 오류 : 연속 " << s.consecutive_venue_failures << "회\n";
    }
    for (const auto& row : s.orders) {
        std::cout << "    " << std::left << std::setw(10) << row.layer << std::right
                  << " " << std::setw(8) << toString(row.status)
                  << "  entry " << std::setprecision(3) << row.entry_price
                  << "  tp " << row.target_price
                  << "  vol " << std::setprecision(2) << row.volume
                  << "  id " << row.venue_order_id << "\n";
    }
    std::cout << "==========================\n\n";
}

// 한 줄 명령 처리. quit 이면 false
static bool handleCommand(engine::CycleController& controller, const std::string& raw, int& window_seq) {
    const auto words = splitWords(trimCopy(raw));
    if (words.empty()) {
        return true;
    }
    const std::string cmd = toLowerCopy(words[0]);

    if (cmd == "quit" || cmd == "exit") {
        return false;
    }
    if (cmd == "help") {
        printHelp();
    } else if (cmd == "start") {
        controller.submit(engine::Command::start());
    } else if (cmd == "pause") {
        controller.submit(engine::Command::pause());
    } else if (cmd == "stop") {
        controller.submit(engine::Command::stopAfterCycle());
    } else if (cmd == "ack") {
        controller.submit(engine::Command::acknowledgeEmergencyStop());
    } else if (cmd == "withdrawn") {
        controller.submit(engine::Command::withdrawalComplete());
    } else if (cmd == "status") {
        printStatus(controller.status());
    } else if (cmd == "amount" && words.size() == 2) {
        double amount = 0.0;
        if (toLowerCopy(words[1]) == "clear") {
            controller.submit(engine::Command::clearBaseAmount());
        } else if (parseNumber(words[1], amount) && amount > 0.0) {
            controller.submit(engine::Command::setBaseAmount(amount));
        } else {
            std::cout << "  수량이 올바르지 않습니다: " << words[1] << "\n";
        }
    } else if (cmd == "guard" && words.size() == 3) {
        const auto kind = risk::parseGuardKind(words[1]);
        if (!kind) {
            std::cout << "  알 수 없는 가드: " << words[1] << "\n";
            return true;
        }
        double value = 0.0;
        if (toLowerCopy(words[2]) == "off") {
            controller.submit(engine::Command::setGuardThreshold(*kind, std::nullopt));
        } else if (parseNumber(words[2], value)) {
            controller.submit(engine::Command::setGuardThreshold(*kind, value));
        } else {
            std::cout << "  값이 올바르지 않습니다: " << words[2] << "\n";
        }
    } else if (cmd == "blackout" && words.size() == 2) {
        if (toLowerCopy(words[1]) == "clear") {
            controller.submit(engine::Command::clearBlackoutWindows());
        } else {
            try {
                auto window = risk::TimeWindow::parse("console_" + std::to_string(++window_seq), words[1]);
                controller.submit(engine::Command::setBlackoutWindow(window));
            } catch (const InvalidConfigurationError& e) {
                std::cout << "  " << e.what() << "\n";
            }
        }
    } else if (cmd == "quiet" && (words.size() == 2 || words.size() == 3)) {
        if (toLowerCopy(words[1]) == "off") {
            controller.submit(engine::Command::setQuietHours(std::nullopt, 1.0));
        } else {
            double factor = 0.5;
            if (words.size() == 3 && !parseNumber(words[2], factor)) {
                std::cout << "  factor 가 올바르지 않습니다: " << words[2] << "\n";
                return true;
            }
            try {
                auto window = risk::TimeWindow::parse("quiet_hours", words[1]);
                controller.submit(engine::Command::setQuietHours(window, factor));
            } catch (const InvalidConfigurationError& e) {
                std::cout << "  " << e.what() << "\n";
            }
        }
    } else {
        std::cout << "  알 수 없는 명령: " << raw << " (help 참고)\n";
    }
    return true;
}

int main(int argc, char* argv[]) {
    try {
        const std::string config_path = (argc > 1) ? argv[1] : "config/gridcycle.json";
        Config::getInstance().load(config_path);
        auto& config = Config::getInstance();

        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());

        std::cout << "\n";
        std::cout << "=============================================\n";
        std::cout << "       GridCycle Paper Trading Console\n";
        std::cout << "       레이어드 그리드 사이클 엔진\n";
        std::cout << "=============================================\n\n";

        std::signal(SIGINT, signalHandler);

        const engine::EngineConfig engine_config = config.getEngineConfig();
        const PaperVenueConfig paper = config.getPaperConfig();

        auto venue = std::make_shared<execution::PaperTradingVenue>(
            paper.initial_balance, paper.contract_size, paper.leverage);
        venue->setQuote(engine_config.grid.symbol,
                        paper.start_price - paper.spread / 2.0,
                        paper.start_price + paper.spread / 2.0);

        const auto journal_path = utils::PathUtils::resolveRelativePath(config.getJournalPath());
        auto journal = std::make_shared<core::EventJournalJsonl>(journal_path);

        auto controller = std::make_shared<engine::CycleController>(*venue, engine_config, journal.get());

        LOG_INFO("symbol {}, base {:.2f}, delta {:.2f}, tp {:.2f}, scale {:.1f}",
                 engine_config.grid.symbol, engine_config.trade_amount,
                 engine_config.grid.delta_enter_price, engine_config.grid.target_profit,
                 engine_config.grid.percent_scale);
        LOG_INFO("journal: {}", journal_path.string());

        // 엔진 루프
        std::thread engine_thread([controller] { controller->run(); });

        // 모의 시세 (시드 고정 랜덤워크)
        std::thread feeder_thread([venue, paper, symbol = engine_config.grid.symbol] {
            std::mt19937 rng(paper.seed);
            std::normal_distribution<double> step(0.0, paper.volatility);
            double mid = paper.start_price;
            while (!g_shutdown) {
                mid = std::max(paper.spread, mid + step(rng));
                const double bid = std::round((mid - paper.spread / 2.0) * 1000.0) / 1000.0;
                const double ask = std::round((mid + paper.spread / 2.0) * 1000.0) / 1000.0;
                venue->setQuote(symbol, bid, ask);
                std::this_thread::sleep_for(std::chrono::milliseconds(paper.quote_interval_ms));
            }
        });

        // 콘솔 입력 (getline 블로킹 -> 분리)
        std::thread input_thread([controller] {
            int window_seq = 0;
            std::string line;
            while (!g_shutdown && std::getline(std::cin, line)) {
                if (!handleCommand(*controller, line, window_seq)) {
                    g_shutdown = true;
                }
            }
            g_shutdown = true;
        });
        input_thread.detach();

        printHelp();
        std::cout << "'start' 입력 시 첫 사이클이 시작됩니다.\n\n";

        while (!g_shutdown) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        LOG_INFO("종료 신호 수신, 엔진 정지 중...");
        controller->stop();
        engine_thread.join();
        feeder_thread.join();

        printStatus(controller->status());
        LOG_INFO("잔고 {:.2f}, 미체결 {}건, 보유 포지션 {}건",
                 venue->balance(), venue->pendingOrderCount(), venue->openPositionCount());
        Logger::getInstance().shutdown();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "치명적 오류: " << e.what() << std::endl;
        LOG_ERROR("치명적 오류: {}", e.what());
        return 1;
    }
}
