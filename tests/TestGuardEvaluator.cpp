#include "risk/GuardEvaluator.h"
#include "risk/TimeWindow.h"
#include "common/Errors.h"

#include <cassert>
#include <chrono>
#include <iostream>
#include <limits>

using namespace gridcycle;
using namespace gridcycle::risk;

namespace {
constexpr int kOffset = 420;   // GMT+7

// day 0 = 1970-01-01 (목), day 4 = 월요일
Timestamp localTime(int day, int hour, int minute) {
    return Timestamp(std::chrono::minutes(day * 1440LL + hour * 60 + minute - kOffset));
}

constexpr int MON = 4;
constexpr int TUE = 5;

template <typename Fn>
bool throwsInvalid(Fn fn) {
    try {
        fn();
    } catch (const InvalidConfigurationError&) {
        return true;
    }
    return false;
}

GuardConfig baseConfig() {
    GuardConfig config;
    config.utc_offset_minutes = kOffset;
    config.blackout_windows.clear();
    return config;
}
}

static void testTimeWindow() {
    auto news = TimeWindow::parse("news", "04:30-06:15");
    assert(news.start_minute == 270);
    assert(news.end_minute == 375);
    assert(news.contains(localTime(MON, 4, 30), kOffset));
    assert(news.contains(localTime(MON, 5, 0), kOffset));
    assert(!news.contains(localTime(MON, 6, 15), kOffset));   // end 미포함
    assert(!news.contains(localTime(MON, 4, 29), kOffset));

    // 자정 넘김 + 요일
    auto late = TimeWindow::parse("late", "22:00-02:00");
    late.weekday_mask = TimeWindow::parseWeekdays("mon");
    assert(late.contains(localTime(MON, 23, 0), kOffset));
    assert(late.contains(localTime(TUE, 1, 0), kOffset));      // 월요일 밤의 연장
    assert(!late.contains(localTime(MON, 1, 0), kOffset));     // 일요일 밤의 연장
    assert(!late.contains(localTime(TUE, 23, 0), kOffset));

    // start == end -> 하루 전체
    auto all_day = TimeWindow::parse("all", "00:00-24:00");
    assert(all_day.contains(localTime(TUE, 13, 37), kOffset));

    auto disabled = news;
    disabled.enabled = false;
    assert(!disabled.contains(localTime(MON, 5, 0), kOffset));

    assert(toLocalClock(localTime(MON, 5, 0), kOffset).weekday == 1);
    assert(toLocalClock(localTime(MON, 5, 0), kOffset).minute_of_day == 300);

    assert(throwsInvalid([] { TimeWindow::parse("bad", "25:00-26:00"); }));
    assert(throwsInvalid([] { TimeWindow::parse("bad", "abc"); }));
    assert(throwsInvalid([] { TimeWindow::parseWeekdays("mon,xyz"); }));
    assert(TimeWindow::parseWeekdays("") == TimeWindow::ALL_DAYS);
}

static void testEvaluationOrder() {
    const Tick tick{2000.0, 2000.2};
    const AccountSnapshot account{10000.0, 10000.0, 9000.0};
    GuardContext context;
    context.cycle_start_balance = 10000.0;
    const Timestamp noon = localTime(MON, 12, 0);

    // 전부 통과
    {
        auto d = GuardEvaluator::evaluate(tick, account, context, baseConfig(), noon);
        assert(d.allowed);
        assert(d.reason == GuardReason::NONE);
    }

    // 스프레드
    {
        auto config = baseConfig();
        config.max_spread = 0.1;
        auto d = GuardEvaluator::evaluate(tick, account, context, config, noon);
        assert(!d.allowed);
        assert(d.reason == GuardReason::SPREAD_TOO_WIDE);
        assert(!d.emergency_stop);
    }

    // 감소 한도: 초과(>)일 때만 긴급 정지, 스프레드보다 먼저 검사
    {
        auto config = baseConfig();
        config.max_spread = 0.1;
        config.max_reduce_balance = 2000.0;

        AccountSnapshot at_limit{10000.0, 8000.0, 7000.0};
        auto edge = GuardEvaluator::evaluate(tick, at_limit, context, config, noon);
        assert(edge.reason == GuardReason::SPREAD_TOO_WIDE);

        AccountSnapshot breached{10000.0, 7900.0, 7000.0};
        auto d = GuardEvaluator::evaluate(tick, breached, context, config, noon);
        assert(!d.allowed);
        assert(d.reason == GuardReason::MAX_REDUCE_BREACHED);
        assert(d.emergency_stop);
    }

    // 낙폭 (>=)
    {
        auto config = baseConfig();
        config.max_drawdown = 500.0;
        GuardContext dd = context;
        dd.max_drawdown_observed = 499.0;
        assert(GuardEvaluator::evaluate(tick, account, dd, config, noon).allowed);
        dd.max_drawdown_observed = 500.0;
        auto d = GuardEvaluator::evaluate(tick, account, dd, config, noon);
        assert(d.reason == GuardReason::DRAWDOWN_CAP);
        assert(!d.emergency_stop);
    }

    // 여유 증거금 (기본 100)
    {
        AccountSnapshot thin{10000.0, 10000.0, 50.0};
        auto d = GuardEvaluator::evaluate(tick, thin, context, baseConfig(), noon);
        assert(d.reason == GuardReason::LOW_MARGIN);
    }

    // 포지션/주문 수
    {
        auto config = baseConfig();
        config.max_positions = 3;
        config.max_orders = 6;
        GuardContext busy = context;
        busy.open_positions = 2;
        busy.pending_orders = 5;
        assert(GuardEvaluator::evaluate(tick, account, busy, config, noon).allowed);
        busy.open_positions = 3;
        assert(GuardEvaluator::evaluate(tick, account, busy, config, noon).reason == GuardReason::CAPACITY_REACHED);
        busy.open_positions = 0;
        busy.pending_orders = 6;
        assert(GuardEvaluator::evaluate(tick, account, busy, config, noon).reason == GuardReason::CAPACITY_REACHED);
    }
}

static void testBlackout() {
    const Tick tick{2000.0, 2000.2};
    const AccountSnapshot account{10000.0, 10000.0, 9000.0};
    auto config = baseConfig();
    config.blackout_windows.push_back(TimeWindow::parse("news_halt", "04:30-06:15"));
    const Timestamp inside = localTime(MON, 5, 0);
    const Timestamp outside = localTime(MON, 7, 0);

    GuardContext idle;
    idle.cycle_start_balance = 10000.0;

    auto blocked = GuardEvaluator::evaluate(tick, account, idle, config, inside);
    assert(!blocked.allowed);
    assert(blocked.reason == GuardReason::BLACKOUT);
    assert(GuardEvaluator::evaluate(tick, account, idle, config, outside).allowed);

    // 진행 중 사이클은 계속
    GuardContext live = idle;
    live.cycle_in_flight = true;
    auto cont = GuardEvaluator::evaluate(tick, account, live, config, inside);
    assert(cont.allowed);
    assert(cont.continuation_only);

    config.allow_cycle_completion_in_blackout = false;
    assert(GuardEvaluator::evaluate(tick, account, live, config, inside).reason == GuardReason::BLACKOUT);

    std::string name;
    assert(GuardEvaluator::inBlackout(config, inside, &name));
    assert(name == "news_halt");

    config.quiet_hours = TimeWindow::parse("quiet", "19:00-23:59");
    assert(GuardEvaluator::inQuietHours(config, localTime(MON, 20, 0)));
    assert(!GuardEvaluator::inQuietHours(config, localTime(MON, 23, 59)));
}

static void testExposureAndThresholds() {
    auto config = baseConfig();
    assert(GuardEvaluator::checkExposure(100.0, 100.0, config).allowed);   // 미설정 = 무제한

    config.max_total_exposure = 1.0;
    assert(GuardEvaluator::checkExposure(0.4, 0.5, config).allowed);
    auto d = GuardEvaluator::checkExposure(0.6, 0.5, config);
    assert(!d.allowed);
    assert(d.reason == GuardReason::EXPOSURE_CAP);

    config.setThreshold(GuardKind::MAX_POSITIONS, 2.6);
    assert(config.max_positions && *config.max_positions == 3);
    // int 범위를 넘는 개수는 최대값으로 고정 (음수로 감기지 않음)
    config.setThreshold(GuardKind::MAX_POSITIONS, 3e9);
    assert(config.max_positions && *config.max_positions == std::numeric_limits<int>::max());
    config.setThreshold(GuardKind::MAX_ORDERS, 1e300);
    assert(config.max_orders && *config.max_orders == std::numeric_limits<int>::max());
    {
        GuardContext busy;
        busy.cycle_start_balance = 10000.0;
        busy.open_positions = 40;
        busy.pending_orders = 60;
        const auto d = GuardEvaluator::evaluate(Tick{2000.0, 2000.2}, AccountSnapshot{10000.0, 10000.0, 9000.0},
                                                busy, config, localTime(MON, 12, 0));
        assert(d.allowed);
    }
    config.setThreshold(GuardKind::MAX_ORDERS, std::nullopt);
    assert(GuardConfig::toCount(2.4) == 2);
    assert(throwsInvalid([] { GuardConfig::toCount(-1.0); }));

    config.setThreshold(GuardKind::MAX_SPREAD, 0.5);
    assert(config.threshold(GuardKind::MAX_SPREAD) == 0.5);
    config.setThreshold(GuardKind::MAX_SPREAD, std::nullopt);
    assert(!config.max_spread);
    assert(throwsInvalid([&] { config.setThreshold(GuardKind::MAX_DRAWDOWN, -1.0); }));

    assert(parseGuardKind("maxdd") == GuardKind::MAX_DRAWDOWN);
    assert(parseGuardKind("MaxReduce") == GuardKind::MAX_REDUCE);
    assert(parseGuardKind("minmargin") == GuardKind::MIN_FREE_MARGIN);
    assert(!parseGuardKind("nope"));

    config.upsertBlackoutWindow(TimeWindow::parse("a", "01:00-02:00"));
    config.upsertBlackoutWindow(TimeWindow::parse("a", "03:00-04:00"));
    assert(config.blackout_windows.size() == 1);
    assert(config.blackout_windows[0].start_minute == 180);
}

int main() {
    testTimeWindow();
    testEvaluationOrder();
    testBlackout();
    testExposureAndThresholds();

    std::cout << "[TEST] GuardEvaluator PASSED\n";
    return 0;
}
