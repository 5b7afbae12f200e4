#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/contracts/IEventJournal.h"
#include "core/contracts/ITradingVenue.h"
#include "engine/CommandQueue.h"
#include "engine/EngineConfig.h"
#include "engine/GridState.h"
#include "execution/FillTracker.h"
#include "risk/GuardEvaluator.h"
#include "strategy/GridBuilder.h"

namespace gridcycle {
namespace engine {

enum class ControllerState {
    PAUSED,
    RUNNING,
    EMERGENCY_STOPPED      // 확인(ack) 전까지 재시작 불가
};

enum class PauseReason {
    NONE,
    AWAITING_START,
    USER_PAUSE,
    STOP_AFTER_CYCLE,
    DRAWDOWN_CAP,
    WITHDRAWAL_PENDING,
    EMERGENCY_STOP
};

const char* toString(ControllerState state);
const char* toString(PauseReason reason);

struct OrderRow {
    std::string layer;
    std::string venue_order_id;
    GridOrderStatus status = GridOrderStatus::UNPLACED;
    Price entry_price = 0.0;
    Price target_price = 0.0;
    Volume volume = 0.0;
    Amount realized_pnl = 0.0;
};

// 다른 스레드에서 읽는 상태 스냅샷
struct ControllerStatus {
    ControllerState state = ControllerState::PAUSED;
    PauseReason pause_reason = PauseReason::AWAITING_START;
    bool cycle_active = false;
    bool stop_after_cycle = false;
    int cycle_number = 0;
    int anchor_index = 0;
    double base_amount = 0.0;
    std::optional<double> base_amount_override;
    Amount cycle_target = 0.0;
    Amount cycle_start_balance = 0.0;
    Amount realized_pnl = 0.0;
    Amount unrealized_pnl = 0.0;
    Amount max_drawdown = 0.0;
    Amount session_profit = 0.0;
    int consecutive_venue_failures = 0;
    risk::GuardReason last_guard_reason = risk::GuardReason::NONE;
    std::string last_guard_detail;
    std::vector<OrderRow> orders;
};

// 단일 루프 스레드에서 tick() 을 순차 실행한다.
// 외부 명령은 submit() 으로 큐에 넣고 다음 틱 시작 시 반영된다.
class CycleController {
public:
    using Clock = std::function<Timestamp()>;

    CycleController(
        core::ITradingVenue& venue,
        EngineConfig config,
        core::IEventJournal* journal = nullptr,
        Clock clock = [] { return std::chrono::system_clock::now(); }
    );

    void submit(Command command);

    // 한 틱: 명령 반영 -> 가드 -> 구성 -> 체결/청산 추적 -> 목표 확인
    void tick();

    // 블로킹 루프. stop() 호출 시 종료
    void run();
    void stop();
    bool isLooping() const { return looping_; }

    ControllerStatus status() const;
    ControllerState state() const;

    // 루프 스레드(또는 테스트)에서만 접근
    const GridState& grid() const { return grid_; }
    const EngineConfig& config() const { return config_; }

private:
    struct VenueSnapshot {
        AccountSnapshot account;
        Tick tick;
        int open_positions = 0;
        int pending_orders = 0;
    };

    // ===== 명령 =====
    void applyCommands();
    void applyCommand(const Command& command);

    // ===== 틱 단계 =====
    VenueSnapshot captureSnapshot();
    risk::GuardDecision evaluateGuards(const VenueSnapshot& snapshot, Timestamp now) const;
    void startCycle(const VenueSnapshot& snapshot, const risk::GuardDecision& decision, Timestamp now);
    void build(int anchor_index, Price reference_price, const risk::GuardDecision& decision, Timestamp now);
    void guardedBuild(int anchor_index, Price reference_price, Timestamp now);
    void trackFillsAndClosures(Timestamp now);

    // ===== 사이클 리셋 / 긴급 정지 =====
    void beginCycleReset(Timestamp now);
    bool finishCycleReset(Timestamp now);
    bool flattenStrategy();
    void triggerEmergencyStop(const VenueSnapshot& snapshot, const risk::GuardDecision& decision, Timestamp now);
    void clearGrid();

    // ===== 보조 =====
    double computeBaseAmount(Timestamp now) const;
    Amount computeCycleTarget(double base_amount) const;
    void setState(ControllerState state, PauseReason reason, const std::string& detail);
    void onVenueFailure(const std::exception& e);
    void onVenueRecovered();
    void noteGuardDecision(const risk::GuardDecision& decision);
    void publish(core::JournalEventType type, const std::string& entity_id, nlohmann::json payload);
    void publishStatus();

    core::ITradingVenue& venue_;
    EngineConfig config_;
    core::IEventJournal* journal_;
    Clock clock_;

    strategy::GridBuilder builder_;
    execution::FillTracker tracker_;
    CommandQueue commands_;

    GridState grid_;
    ControllerState state_ = ControllerState::PAUSED;
    PauseReason pause_reason_ = PauseReason::AWAITING_START;

    double base_amount_ = 0.0;
    std::optional<double> base_amount_override_;
    Amount cycle_target_ = 0.0;
    Amount unrealized_pnl_ = 0.0;
    Amount session_profit_ = 0.0;

    bool stop_after_cycle_ = false;
    bool withdrawal_pending_ = false;
    bool rebuild_pending_ = false;
    bool resetting_ = false;               // 사이클 목표 도달 후 청산 확인 대기
    bool flatten_confirmed_ = true;        // 긴급 정지 청산 완료 여부

    int consecutive_venue_failures_ = 0;
    bool venue_alert_sent_ = false;
    risk::GuardReason last_guard_reason_ = risk::GuardReason::NONE;
    std::string last_guard_detail_;

    std::atomic<bool> looping_{false};
    std::atomic<bool> stop_requested_{false};
    mutable std::mutex status_mutex_;
    ControllerStatus status_;
};

} // namespace engine
} // namespace gridcycle
