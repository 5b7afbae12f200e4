#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "risk/GuardConfig.h"
#include "risk/TimeWindow.h"

namespace gridcycle {
namespace engine {

enum class CommandType {
    START,
    PAUSE,
    STOP_AFTER_CYCLE,
    SET_BASE_AMOUNT,
    CLEAR_BASE_AMOUNT,
    SET_GUARD_THRESHOLD,
    SET_BLACKOUT_WINDOW,
    CLEAR_BLACKOUT_WINDOWS,
    SET_QUIET_HOURS,
    ACKNOWLEDGE_EMERGENCY_STOP,
    WITHDRAWAL_COMPLETE
};

const char* toString(CommandType type);

struct Command {
    CommandType type = CommandType::START;
    std::optional<double> value;                  // 수량 / 임계값 / quiet factor (비어 있으면 해제)
    risk::GuardKind guard_kind = risk::GuardKind::MAX_SPREAD;
    std::optional<risk::TimeWindow> window;

    static Command start() { return Command{CommandType::START, std::nullopt, {}, std::nullopt}; }
    static Command pause() { return Command{CommandType::PAUSE, std::nullopt, {}, std::nullopt}; }
    static Command stopAfterCycle() { return Command{CommandType::STOP_AFTER_CYCLE, std::nullopt, {}, std::nullopt}; }
    static Command setBaseAmount(double amount) { return Command{CommandType::SET_BASE_AMOUNT, amount, {}, std::nullopt}; }
    static Command clearBaseAmount() { return Command{CommandType::CLEAR_BASE_AMOUNT, std::nullopt, {}, std::nullopt}; }
    static Command setGuardThreshold(risk::GuardKind kind, std::optional<double> threshold) {
        return Command{CommandType::SET_GUARD_THRESHOLD, threshold, kind, std::nullopt};
    }
    static Command setBlackoutWindow(risk::TimeWindow w) {
        return Command{CommandType::SET_BLACKOUT_WINDOW, std::nullopt, {}, std::move(w)};
    }
    static Command clearBlackoutWindows() { return Command{CommandType::CLEAR_BLACKOUT_WINDOWS, std::nullopt, {}, std::nullopt}; }
    // window 가 비어 있으면 quiet hours 해제
    static Command setQuietHours(std::optional<risk::TimeWindow> w, double factor) {
        return Command{CommandType::SET_QUIET_HOURS, factor, {}, std::move(w)};
    }
    static Command acknowledgeEmergencyStop() { return Command{CommandType::ACKNOWLEDGE_EMERGENCY_STOP, std::nullopt, {}, std::nullopt}; }
    static Command withdrawalComplete() { return Command{CommandType::WITHDRAWAL_COMPLETE, std::nullopt, {}, std::nullopt}; }
};

// 외부 스레드 -> 루프 스레드 명령 전달 (Thread-Safe)
class CommandQueue {
public:
    void push(Command command);
    std::vector<Command> drain();
    bool empty() const;

    // 명령 도착 / wake() / 타임아웃 중 먼저 오는 것까지 대기. 명령이 있으면 true
    bool waitFor(std::chrono::milliseconds timeout);
    void wake();

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Command> commands_;
    bool woken_ = false;
};

} // namespace engine
} // namespace gridcycle
