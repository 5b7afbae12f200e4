#include "engine/CycleController.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <chrono>
#include <cmath>

namespace gridcycle {
namespace engine {

const char* toString(ControllerState state) {
    switch (state) {
        case ControllerState::PAUSED: return "Paused";
        case ControllerState::RUNNING: return "Running";
        case ControllerState::EMERGENCY_STOPPED: return "EmergencyStopped";
    }
    return "Paused";
}

const char* toString(PauseReason reason) {
    switch (reason) {
        case PauseReason::NONE: return "None";
        case PauseReason::AWAITING_START: return "AwaitingStart";
        case PauseReason::USER_PAUSE: return "UserPause";
        case PauseReason::STOP_AFTER_CYCLE: return "StopAfterCycle";
        case PauseReason::DRAWDOWN_CAP: return "DrawdownCap";
        case PauseReason::WITHDRAWAL_PENDING: return "WithdrawalPending";
        case PauseReason::EMERGENCY_STOP: return "EmergencyStop";
    }
    return "None";
}

CycleController::CycleController(
    core::ITradingVenue& venue,
    EngineConfig config,
    core::IEventJournal* journal,
    Clock clock
)
    : venue_(venue)
    , config_(std::move(config))
    , journal_(journal)
    , clock_(std::move(clock))
    , builder_(venue, config_.grid,
               strategy::PatternDetector(config_.suppression_policy, config_.suppression_min_streak))
    , tracker_(venue, config_.grid.symbol)
{
    config_.validate();
    base_amount_ = config_.trade_amount;
    cycle_target_ = computeCycleTarget(base_amount_);
    publishStatus();
}

void CycleController::submit(Command command) {
    LOG_DEBUG("command queued: {}", toString(command.type));
    commands_.push(std::move(command));
}

// ===== 메인 틱 =====

void CycleController::tick() {
    applyCommands();
    const Timestamp now = clock_();

    if (state_ == ControllerState::EMERGENCY_STOPPED) {
        // 청산 확인될 때까지 재시도
        if (!flatten_confirmed_) {
            flatten_confirmed_ = flattenStrategy();
            if (flatten_confirmed_) {
                LOG_INFO("emergency flatten confirmed, waiting for acknowledgement");
            }
        }
        publishStatus();
        return;
    }
    if (state_ != ControllerState::RUNNING) {
        publishStatus();
        return;
    }

    VenueSnapshot snapshot;
    try {
        snapshot = captureSnapshot();
    } catch (const VenueUnavailableError& e) {
        onVenueFailure(e);
        publishStatus();
        return;
    }
    onVenueRecovered();

    if (resetting_) {
        finishCycleReset(now);
        publishStatus();
        return;
    }

    if (grid_.active) {
        grid_.observeEquity(snapshot.account.equity);
    }

    // 1) 가드
    const risk::GuardDecision decision = evaluateGuards(snapshot, now);
    noteGuardDecision(decision);

    if (decision.emergency_stop) {
        triggerEmergencyStop(snapshot, decision, now);
        publishStatus();
        return;
    }
    if (!decision.allowed && decision.reason == risk::GuardReason::DRAWDOWN_CAP) {
        setState(ControllerState::PAUSED, PauseReason::DRAWDOWN_CAP, decision.detail);
        publishStatus();
        return;
    }

    // 2) 그리드 구성 (차단 시 건너뜀)
    if (!grid_.active) {
        if (decision.allowed && !decision.continuation_only) {
            startCycle(snapshot, decision, now);
        }
    } else if (rebuild_pending_ && decision.allowed) {
        LOG_INFO("retrying grid build at anchor {}", grid_.anchor_index);
        build(grid_.anchor_index, snapshot.tick.mid(), decision, now);
    }

    // 3) 체결/청산 추적 + 목표 확인 (가드 차단과 무관하게 실행)
    if (grid_.active) {
        trackFillsAndClosures(now);
    }

    publishStatus();
}

void CycleController::run() {
    looping_ = true;
    LOG_INFO("🚀 grid cycle loop started ({})", config_.grid.symbol);

    while (!stop_requested_) {
        auto tick_start = std::chrono::steady_clock::now();

        try {
            tick();

            const auto interval = std::chrono::milliseconds(
                state_ == ControllerState::RUNNING ? config_.tick_interval_ms
                                                   : config_.paused_poll_interval_ms);
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - tick_start);
            if (elapsed < interval && !stop_requested_) {
                // 명령이 들어오면 바로 깨어난다
                commands_.waitFor(interval - elapsed);
            }
        } catch (const std::exception& e) {
            LOG_ERROR("main loop error: {}", e.what());
            commands_.waitFor(std::chrono::seconds(1));
        }
    }

    looping_ = false;
    LOG_INFO("grid cycle loop stopped");
}

void CycleController::stop() {
    stop_requested_ = true;
    commands_.wake();
}

ControllerStatus CycleController::status() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return status_;
}

ControllerState CycleController::state() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return status_.state;
}

// ===== 명령 =====

void CycleController::applyCommands() {
    for (const auto& command : commands_.drain()) {
        applyCommand(command);
    }
}

void CycleController::applyCommand(const Command& command) {
    switch (command.type) {
        case CommandType::START:
            if (state_ == ControllerState::EMERGENCY_STOPPED) {
                LOG_WARN("start refused: emergency stop must be acknowledged first");
                return;
            }
            if (withdrawal_pending_) {
                LOG_WARN("start refused: profit withdrawal pending (session profit {:.2f})", session_profit_);
                return;
            }
            if (state_ == ControllerState::RUNNING) {
                return;
            }
            setState(ControllerState::RUNNING, PauseReason::NONE, "start command");
            return;

        case CommandType::PAUSE:
            if (state_ == ControllerState::RUNNING) {
                setState(ControllerState::PAUSED, PauseReason::USER_PAUSE, "pause command");
            }
            return;

        case CommandType::STOP_AFTER_CYCLE:
            stop_after_cycle_ = true;
            LOG_INFO("will pause after the current cycle completes");
            return;

        case CommandType::SET_BASE_AMOUNT:
            if (!command.value || !(*command.value > 0.0) || !std::isfinite(*command.value)) {
                LOG_WARN("set base amount ignored: amount must be positive");
                return;
            }
            if (!strategy::GridBuilder::yieldsTradableVolume(config_.grid, *command.value)) {
                LOG_WARN("set base amount ignored: {} rounds to zero volume", *command.value);
                return;
            }
            base_amount_override_ = *command.value;
            LOG_INFO("base amount override set to {:.2f} (applies from next cycle)", *command.value);
            return;

        case CommandType::CLEAR_BASE_AMOUNT:
            base_amount_override_.reset();
            LOG_INFO("base amount override cleared");
            return;

        case CommandType::SET_GUARD_THRESHOLD: {
            std::optional<double> value = command.value;
            if (value && std::isnan(*value)) {
                value.reset();
            }
            try {
                config_.guards.setThreshold(command.guard_kind, value);
                if (value) {
                    LOG_INFO("guard {} set to {}", risk::toString(command.guard_kind), *value);
                } else {
                    LOG_INFO("guard {} cleared", risk::toString(command.guard_kind));
                }
            } catch (const InvalidConfigurationError& e) {
                LOG_WARN("guard threshold rejected: {}", e.what());
            }
            return;
        }

        case CommandType::SET_BLACKOUT_WINDOW:
            if (command.window) {
                config_.guards.upsertBlackoutWindow(*command.window);
                LOG_INFO("blackout window set: {}", command.window->describe());
            }
            return;

        case CommandType::CLEAR_BLACKOUT_WINDOWS:
            config_.guards.blackout_windows.clear();
            LOG_INFO("blackout windows cleared");
            return;

        case CommandType::SET_QUIET_HOURS: {
            const double factor = command.value.value_or(config_.guards.quiet_hours_factor);
            if (!(factor > 0.0) || factor > 1.0) {
                LOG_WARN("quiet hours ignored: factor {} not in (0, 1]", factor);
                return;
            }
            config_.guards.quiet_hours = command.window;
            config_.guards.quiet_hours_factor = factor;
            if (command.window) {
                LOG_INFO("quiet hours set: {} x{:.2f}", command.window->describe(), factor);
            } else {
                LOG_INFO("quiet hours disabled");
            }
            return;
        }

        case CommandType::ACKNOWLEDGE_EMERGENCY_STOP:
            if (state_ != ControllerState::EMERGENCY_STOPPED) {
                LOG_WARN("acknowledge ignored: no emergency stop active");
                return;
            }
            if (!flatten_confirmed_) {
                flatten_confirmed_ = flattenStrategy();
            }
            if (!flatten_confirmed_) {
                LOG_WARN("acknowledge refused: strategy positions/orders still open");
                return;
            }
            clearGrid();
            setState(ControllerState::PAUSED, PauseReason::AWAITING_START, "emergency stop acknowledged");
            return;

        case CommandType::WITHDRAWAL_COMPLETE:
            if (!withdrawal_pending_) {
                LOG_WARN("withdrawal complete ignored: no withdrawal pending");
                return;
            }
            withdrawal_pending_ = false;
            session_profit_ = 0.0;
            setState(ControllerState::RUNNING, PauseReason::NONE, "withdrawal complete");
            return;
    }
}

// ===== 틱 단계 =====

CycleController::VenueSnapshot CycleController::captureSnapshot() {
    VenueSnapshot snapshot;
    snapshot.account = venue_.getAccountSnapshot();
    snapshot.tick = venue_.getTick(config_.grid.symbol);

    for (const auto& position : venue_.listOpenPositions(config_.grid.symbol)) {
        if (position.magic == config_.grid.magic) {
            ++snapshot.open_positions;
        }
    }
    for (const auto& order : venue_.listPendingOrders(config_.grid.symbol)) {
        if (order.magic == config_.grid.magic) {
            ++snapshot.pending_orders;
        }
    }
    return snapshot;
}

risk::GuardDecision CycleController::evaluateGuards(const VenueSnapshot& snapshot, Timestamp now) const {
    risk::GuardContext context;
    context.cycle_start_balance = grid_.active ? grid_.cycle_start_balance : snapshot.account.balance;
    context.max_drawdown_observed = grid_.active ? grid_.max_drawdown_observed : 0.0;
    context.open_positions = snapshot.open_positions;
    context.pending_orders = snapshot.pending_orders;
    context.cycle_in_flight = grid_.active && grid_.hasLiveOrders();

    risk::GuardDecision decision = risk::GuardEvaluator::evaluate(
        snapshot.tick, snapshot.account, context, config_.guards, now);

    // 블랙아웃 중에도 살아 있는 사이클의 감소 한도는 계속 감시
    if (!decision.allowed && decision.reason == risk::GuardReason::BLACKOUT && grid_.active) {
        risk::GuardDecision reduce = risk::GuardEvaluator::checkEquityReduction(
            snapshot.account, context, config_.guards);
        if (!reduce.allowed) {
            return reduce;
        }
    }
    return decision;
}

void CycleController::startCycle(const VenueSnapshot& snapshot, const risk::GuardDecision& decision, Timestamp now) {
    base_amount_ = computeBaseAmount(now);
    cycle_target_ = computeCycleTarget(base_amount_);
    grid_.reset(snapshot.account.balance, now);
    rebuild_pending_ = false;
    unrealized_pnl_ = 0.0;

    LOG_INFO("🔄 cycle #{} started: balance {:.2f}, base {:.2f}, target {:.2f}",
             grid_.cycle_number, snapshot.account.balance, base_amount_, cycle_target_);
    publish(core::JournalEventType::STATE_CHANGED, "cycle-" + std::to_string(grid_.cycle_number), {
        {"event", "cycle_started"},
        {"cycle_number", grid_.cycle_number},
        {"start_balance", snapshot.account.balance},
        {"base_amount", base_amount_},
        {"cycle_target", cycle_target_}
    });

    build(0, snapshot.tick.mid(), decision, now);
}

void CycleController::build(int anchor_index, Price reference_price, const risk::GuardDecision& decision, Timestamp now) {
    strategy::BuildReport report;
    try {
        report = builder_.buildAt(grid_, anchor_index, reference_price, base_amount_,
                                  decision, config_.guards, now);
    } catch (const GridCycleError& e) {
        // 사이징 오류 등: 이번 구성만 건너뜀
        LOG_ERROR("grid build at {} failed: {}", anchor_index, e.what());
        rebuild_pending_ = false;
        return;
    }

    rebuild_pending_ = report.needsRetry();
    if (report.blocked) {
        noteGuardDecision(risk::GuardDecision::block(report.block_reason, report.block_detail));
    }

    for (const auto& order : report.new_orders) {
        publish(core::JournalEventType::ORDER_PLACED, order.venue_order_id, {
            {"layer", order.key.label()},
            {"side", toString(order.key.side)},
            {"entry_price", order.entry_price},
            {"target_price", order.target_price},
            {"volume", order.volume},
            {"anchor_index", anchor_index}
        });
    }
    for (const auto& rejection : report.rejections) {
        publish(core::JournalEventType::ORDER_REJECTED, rejection.key.label(), {
            {"layer", rejection.key.label()},
            {"retcode", rejection.retcode},
            {"message", rejection.message},
            {"anchor_index", anchor_index}
        });
    }

    if (report.placed > 0 || report.rejected > 0 || report.venue_errors > 0) {
        LOG_INFO("grid @{}: placed {}, duplicates {}, rejected {}, venue errors {}, pattern skipped {}",
                 anchor_index, report.placed, report.duplicates, report.rejected,
                 report.venue_errors, report.pattern_skipped);
    }
}

void CycleController::guardedBuild(int anchor_index, Price reference_price, Timestamp now) {
    VenueSnapshot snapshot;
    try {
        snapshot = captureSnapshot();
    } catch (const VenueUnavailableError& e) {
        LOG_WARN("grid build at {} deferred: {}", anchor_index, e.what());
        rebuild_pending_ = true;
        return;
    }

    const risk::GuardDecision decision = evaluateGuards(snapshot, now);
    if (decision.emergency_stop) {
        noteGuardDecision(decision);
        triggerEmergencyStop(snapshot, decision, now);
        return;
    }
    if (!decision.allowed) {
        noteGuardDecision(decision);
        rebuild_pending_ = true;
        return;
    }
    build(anchor_index, reference_price, decision, now);
}

void CycleController::trackFillsAndClosures(Timestamp now) {
    execution::PollResult poll;
    try {
        poll = tracker_.poll(grid_, now);
    } catch (const VenueUnavailableError& e) {
        onVenueFailure(e);
        return;
    }
    unrealized_pnl_ = poll.unrealized_pnl;

    Amount closed_pnl = 0.0;
    for (const auto& close : poll.newly_closed) {
        closed_pnl += close.pnl;
    }
    // 목표 도달이 확실하면 재구성 없이 바로 리셋
    const bool target_reached = grid_.cycle_realized_pnl + closed_pnl + unrealized_pnl_ >= cycle_target_;

    // 상태 갱신을 모두 마친 뒤 한 번만 재구성한다 (청산 슬롯 정리 전 재배치 방지)
    Price last_fill_price = 0.0;
    for (const auto& fill : poll.newly_filled) {
        const GridOrder* order = grid_.findByVenueId(fill.venue_order_id);
        const Volume volume = order ? order->volume : 0.0;
        last_fill_price = fill.fill_price;

        LOG_INFO("✅ {} filled at {:.3f} (id {}, vol {:.2f})",
                 fill.key.label(), fill.fill_price, fill.venue_order_id, volume);
        Logger::getInstance().logTrade(config_.grid.symbol, fill.key.label(), "filled",
                                       fill.fill_price, volume, 0.0);
        publish(core::JournalEventType::ORDER_FILLED, fill.venue_order_id, {
            {"layer", fill.key.label()},
            {"side", toString(fill.key.side)},
            {"fill_price", fill.fill_price},
            {"volume", volume},
            {"anchor_index", grid_.anchor_index}
        });
    }

    for (const auto& close : poll.newly_closed) {
        const GridOrder* order = grid_.findByVenueId(close.venue_order_id);
        const Volume volume = order ? order->volume : 0.0;
        if (order) {
            grid_.closed_orders.push_back(*order);
        }

        grid_.cycle_realized_pnl += close.pnl;
        const int previous_anchor = grid_.anchor_index;
        grid_.anchor_index = close.key.index + (close.key.side == OrderSide::BUY ? 1 : -1);
        grid_.release(close.key);

        LOG_INFO("💰 {} closed, pnl {:.2f} (cycle {:.2f}/{:.2f}), anchor {} -> {}",
                 close.key.label(), close.pnl, grid_.cycle_realized_pnl, cycle_target_,
                 previous_anchor, grid_.anchor_index);
        Logger::getInstance().logTrade(config_.grid.symbol, close.key.label(), "closed",
                                       close.close_price, volume, close.pnl);
        publish(core::JournalEventType::POSITION_CLOSED, close.venue_order_id, {
            {"layer", close.key.label()},
            {"side", toString(close.key.side)},
            {"pnl", close.pnl},
            {"cycle_realized_pnl", grid_.cycle_realized_pnl},
            {"anchor_from", previous_anchor},
            {"anchor_to", grid_.anchor_index}
        });
    }

    if (!target_reached) {
        if (!poll.newly_closed.empty()) {
            // 새 anchor 기준, 현재 mid 로 재구성
            guardedBuild(grid_.anchor_index, 0.0, now);
        } else if (!poll.newly_filled.empty() && config_.reanchor_on_fill) {
            // 체결은 anchor 를 움직이지 않는다. 체결가 기준으로 현재 anchor 재구성
            guardedBuild(grid_.anchor_index, last_fill_price, now);
        }
        if (state_ != ControllerState::RUNNING) {
            return;
        }
    }

    if (grid_.cycle_realized_pnl + unrealized_pnl_ >= cycle_target_) {
        beginCycleReset(now);
    }
}

// ===== 사이클 리셋 / 긴급 정지 =====

void CycleController::beginCycleReset(Timestamp now) {
    LOG_INFO("🎯 cycle #{} target reached: realized {:.2f} + unrealized {:.2f} >= {:.2f}",
             grid_.cycle_number, grid_.cycle_realized_pnl, unrealized_pnl_, cycle_target_);
    publish(core::JournalEventType::CYCLE_TARGET_REACHED, "cycle-" + std::to_string(grid_.cycle_number), {
        {"cycle_number", grid_.cycle_number},
        {"realized_pnl", grid_.cycle_realized_pnl},
        {"unrealized_pnl", unrealized_pnl_},
        {"cycle_target", cycle_target_}
    });

    resetting_ = true;
    rebuild_pending_ = false;
    finishCycleReset(now);
}

bool CycleController::finishCycleReset(Timestamp now) {
    if (!flattenStrategy()) {
        LOG_WARN("cycle reset waiting for venue to confirm flat");
        return false;
    }

    AccountSnapshot account;
    try {
        account = venue_.getAccountSnapshot();
    } catch (const VenueUnavailableError& e) {
        onVenueFailure(e);
        return false;
    }

    const Amount cycle_profit = account.balance - grid_.cycle_start_balance;
    session_profit_ += cycle_profit;
    const int finished_cycle = grid_.cycle_number;

    LOG_INFO("cycle #{} closed: final balance {:.2f}, cycle profit {:.2f}, session {:.2f}",
             finished_cycle, account.balance, cycle_profit, session_profit_);
    publish(core::JournalEventType::STATE_CHANGED, "cycle-" + std::to_string(finished_cycle), {
        {"event", "cycle_reset"},
        {"cycle_number", finished_cycle},
        {"final_balance", account.balance},
        {"cycle_profit", cycle_profit},
        {"session_profit", session_profit_}
    });

    clearGrid();
    resetting_ = false;

    if (stop_after_cycle_) {
        stop_after_cycle_ = false;
        setState(ControllerState::PAUSED, PauseReason::STOP_AFTER_CYCLE, "stop after cycle requested");
        return true;
    }
    if (config_.withdrawal_threshold && session_profit_ >= *config_.withdrawal_threshold) {
        withdrawal_pending_ = true;
        setState(ControllerState::PAUSED, PauseReason::WITHDRAWAL_PENDING,
                 "session profit reached withdrawal threshold");
        return true;
    }

    // 다음 사이클 즉시 시작. 가드가 막으면 이후 틱으로 연기된다.
    VenueSnapshot snapshot;
    try {
        snapshot = captureSnapshot();
    } catch (const VenueUnavailableError& e) {
        onVenueFailure(e);
        return true;
    }
    const risk::GuardDecision decision = evaluateGuards(snapshot, now);
    noteGuardDecision(decision);
    if (decision.emergency_stop) {
        triggerEmergencyStop(snapshot, decision, now);
    } else if (decision.allowed && !decision.continuation_only) {
        startCycle(snapshot, decision, now);
    } else {
        LOG_INFO("next cycle deferred: {}", decision.detail);
    }
    return true;
}

bool CycleController::flattenStrategy() {
    const std::string& symbol = config_.grid.symbol;
    const long long magic = config_.grid.magic;

    try {
        for (const auto& order : venue_.listPendingOrders(symbol)) {
            if (order.magic == magic && !venue_.cancelOrder(order.id)) {
                LOG_WARN("cancel of order {} not confirmed", order.id);
            }
        }
        for (const auto& position : venue_.listOpenPositions(symbol)) {
            if (position.magic == magic && !venue_.closePosition(position.id)) {
                LOG_WARN("close of position {} not confirmed", position.id);
            }
        }

        // 긍정 확인 전까지는 정리되지 않은 것으로 본다
        int remaining = 0;
        for (const auto& order : venue_.listPendingOrders(symbol)) {
            remaining += (order.magic == magic) ? 1 : 0;
        }
        for (const auto& position : venue_.listOpenPositions(symbol)) {
            remaining += (position.magic == magic) ? 1 : 0;
        }
        if (remaining > 0) {
            LOG_WARN("flatten incomplete: {} strategy orders/positions remain", remaining);
            return false;
        }
        return true;
    } catch (const VenueUnavailableError& e) {
        LOG_ERROR("flatten failed: {}", e.what());
        return false;
    }
}

void CycleController::triggerEmergencyStop(const VenueSnapshot& snapshot, const risk::GuardDecision& decision, Timestamp now) {
    LOG_ERROR("🚨 EMERGENCY STOP: {}", decision.detail);

    const Amount start_balance = grid_.active ? grid_.cycle_start_balance : snapshot.account.balance;
    flatten_confirmed_ = flattenStrategy();
    resetting_ = false;
    rebuild_pending_ = false;
    setState(ControllerState::EMERGENCY_STOPPED, PauseReason::EMERGENCY_STOP, decision.detail);

    publish(core::JournalEventType::EMERGENCY_STOP, "cycle-" + std::to_string(grid_.cycle_number), {
        {"reason", risk::toString(decision.reason)},
        {"detail", decision.detail},
        {"balance", snapshot.account.balance},
        {"equity", snapshot.account.equity},
        {"cycle_start_balance", start_balance},
        {"reduced", start_balance - snapshot.account.equity},
        {"threshold", config_.guards.max_reduce_balance.value_or(0.0)},
        {"time_ms", toEpochMillis(now)},
        {"flattened", flatten_confirmed_}
    });
}

void CycleController::clearGrid() {
    const int cycle_number = grid_.cycle_number;
    grid_ = GridState{};
    grid_.cycle_number = cycle_number;
    rebuild_pending_ = false;
    unrealized_pnl_ = 0.0;
}

// ===== 보조 =====

double CycleController::computeBaseAmount(Timestamp now) const {
    if (base_amount_override_) {
        return *base_amount_override_;
    }
    if (risk::GuardEvaluator::inQuietHours(config_.guards, now)) {
        const double scaled = std::round(config_.trade_amount * config_.guards.quiet_hours_factor * 100.0) / 100.0;
        if (strategy::GridBuilder::yieldsTradableVolume(config_.grid, scaled)) {
            return scaled;
        }
    }
    return config_.trade_amount;
}

Amount CycleController::computeCycleTarget(double base_amount) const {
    if (config_.cycle_target_profit) {
        return *config_.cycle_target_profit;
    }
    return base_amount * config_.target_profit_multiplier;
}

void CycleController::setState(ControllerState state, PauseReason reason, const std::string& detail) {
    if (state_ == state && pause_reason_ == reason) {
        return;
    }
    const ControllerState previous = state_;
    state_ = state;
    pause_reason_ = reason;

    LOG_INFO("state {} -> {} ({}): {}", toString(previous), toString(state), toString(reason), detail);
    publish(core::JournalEventType::STATE_CHANGED, "controller", {
        {"from", toString(previous)},
        {"to", toString(state)},
        {"reason", toString(reason)},
        {"detail", detail}
    });
}

void CycleController::onVenueFailure(const std::exception& e) {
    ++consecutive_venue_failures_;
    LOG_WARN("venue call failed ({} in a row): {}", consecutive_venue_failures_, e.what());

    if (consecutive_venue_failures_ >= config_.venue_failure_alert_threshold && !venue_alert_sent_) {
        venue_alert_sent_ = true;
        publish(core::JournalEventType::VENUE_UNAVAILABLE, "venue", {
            {"consecutive_failures", consecutive_venue_failures_},
            {"error", e.what()}
        });
    }
}

void CycleController::onVenueRecovered() {
    if (consecutive_venue_failures_ > 0) {
        LOG_INFO("venue recovered after {} failed ticks", consecutive_venue_failures_);
    }
    consecutive_venue_failures_ = 0;
    venue_alert_sent_ = false;
}

void CycleController::noteGuardDecision(const risk::GuardDecision& decision) {
    if (decision.allowed) {
        last_guard_reason_ = risk::GuardReason::NONE;
        last_guard_detail_.clear();
        return;
    }
    last_guard_detail_ = decision.detail;
    if (decision.reason == last_guard_reason_) {
        return;
    }
    last_guard_reason_ = decision.reason;

    LOG_WARN("🛑 guard blocked: {} ({})", risk::toString(decision.reason), decision.detail);
    publish(core::JournalEventType::GUARD_BLOCKED, risk::toString(decision.reason), {
        {"reason", risk::toString(decision.reason)},
        {"detail", decision.detail},
        {"emergency_stop", decision.emergency_stop}
    });
}

void CycleController::publish(core::JournalEventType type, const std::string& entity_id, nlohmann::json payload) {
    if (!journal_) {
        return;
    }
    core::JournalEvent event;
    event.ts_ms = toEpochMillis(clock_());
    event.type = type;
    event.symbol = config_.grid.symbol;
    event.entity_id = entity_id;
    event.payload = std::move(payload);
    if (!journal_->append(event)) {
        LOG_WARN("journal append failed for {}", entity_id);
    }
}

void CycleController::publishStatus() {
    ControllerStatus snapshot;
    snapshot.state = state_;
    snapshot.pause_reason = pause_reason_;
    snapshot.cycle_active = grid_.active;
    snapshot.stop_after_cycle = stop_after_cycle_;
    snapshot.cycle_number = grid_.cycle_number;
    snapshot.anchor_index = grid_.anchor_index;
    snapshot.base_amount = base_amount_;
    snapshot.base_amount_override = base_amount_override_;
    snapshot.cycle_target = cycle_target_;
    snapshot.cycle_start_balance = grid_.cycle_start_balance;
    snapshot.realized_pnl = grid_.cycle_realized_pnl;
    snapshot.unrealized_pnl = unrealized_pnl_;
    snapshot.max_drawdown = grid_.max_drawdown_observed;
    snapshot.session_profit = session_profit_;
    snapshot.consecutive_venue_failures = consecutive_venue_failures_;
    snapshot.last_guard_reason = last_guard_reason_;
    snapshot.last_guard_detail = last_guard_detail_;

    for (const auto& [key, order] : grid_.orders) {
        OrderRow row;
        row.layer = key.label();
        row.venue_order_id = order.venue_order_id;
        row.status = order.status;
        row.entry_price = order.entry_price;
        row.target_price = order.target_price;
        row.volume = order.volume;
        row.realized_pnl = order.realized_pnl;
        snapshot.orders.push_back(row);
    }

    std::lock_guard<std::mutex> lock(status_mutex_);
    status_ = std::move(snapshot);
}

} // namespace engine
} // namespace gridcycle
