#include "execution/FillTracker.h"
#include "execution/PaperTradingVenue.h"
#include "strategy/GridBuilder.h"
#include "common/Errors.h"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>

using namespace gridcycle;

namespace {
bool near(double a, double b, double eps = 1e-6) { return std::fabs(a - b) < eps; }

const std::string kSymbol = "XAUUSDc";

struct Fixture {
    Timestamp now = Timestamp(std::chrono::seconds(1700000000));
    execution::PaperTradingVenue venue;
    strategy::GridBuilder builder;
    execution::FillTracker tracker;
    engine::GridState state;

    Fixture()
        : builder(venue, params(), strategy::PatternDetector())
        , tracker(venue, kSymbol)
    {
        venue.setClock([this] { return now; });
        venue.setQuote(kSymbol, 2000.0, 2000.2);
        state.reset(10000.0, now);

        risk::GuardConfig guards;
        guards.blackout_windows.clear();
        const auto report = builder.buildAt(state, 0, 2000.0, 0.1,
                                            risk::GuardDecision::allow(), guards, now);
        assert(report.placed == 6);
    }

    static strategy::GridParameters params() {
        strategy::GridParameters p;
        p.scaling_table = {1, 1, 2, 2, 3};
        return p;
    }

    void quote(Price bid, Price ask) {
        now += std::chrono::seconds(1);
        venue.setQuote(kSymbol, bid, ask);
    }

    execution::PollResult poll() {
        now += std::chrono::seconds(1);
        return tracker.poll(state, now);
    }

    const GridOrder& order(OrderSide side, int index) const {
        return state.orders.at(LayerKey(side, index));
    }
};

// 포지션 목록은 최신이지만 거래 이력 반영이 늦는 거래소
class LaggingHistoryVenue : public core::ITradingVenue {
public:
    explicit LaggingHistoryVenue(execution::PaperTradingVenue& inner) : inner_(inner) {}

    bool hide_exits = false;

    Tick getTick(const std::string& symbol) override { return inner_.getTick(symbol); }
    AccountSnapshot getAccountSnapshot() override { return inner_.getAccountSnapshot(); }
    OrderResult placeConditionalOrder(const ConditionalOrderRequest& request) override {
        return inner_.placeConditionalOrder(request);
    }
    bool cancelOrder(const std::string& id) override { return inner_.cancelOrder(id); }
    bool closePosition(const std::string& id) override { return inner_.closePosition(id); }
    std::vector<VenuePosition> listOpenPositions(const std::string& symbol) override {
        return inner_.listOpenPositions(symbol);
    }
    std::vector<VenueOrder> listPendingOrders(const std::string& symbol) override {
        return inner_.listPendingOrders(symbol);
    }
    std::vector<Deal> listTradeHistory(Timestamp since, Timestamp until) override {
        std::vector<Deal> deals = inner_.listTradeHistory(since, until);
        if (hide_exits) {
            deals.erase(std::remove_if(deals.begin(), deals.end(),
                                       [](const Deal& d) { return d.entry == DealEntry::OUT; }),
                        deals.end());
        }
        return deals;
    }

private:
    execution::PaperTradingVenue& inner_;
};
}

static void testFillsAndClosures() {
    Fixture f;

    auto result = f.poll();
    assert(result.newly_filled.empty());
    assert(result.newly_closed.empty());
    assert(near(result.unrealized_pnl, 0.0));

    // buy_0 stop 2000.8 발동
    f.quote(2000.7, 2000.9);
    result = f.poll();
    assert(result.newly_filled.size() == 1);
    assert(result.newly_filled[0].key == LayerKey(OrderSide::BUY, 0));
    assert(near(result.newly_filled[0].fill_price, 2000.8));
    assert(result.newly_closed.empty());
    assert(near(result.unrealized_pnl, -1.0));
    assert(f.order(OrderSide::BUY, 0).status == GridOrderStatus::FILLED);
    assert(f.state.filled_set.count(f.order(OrderSide::BUY, 0).venue_order_id) == 1);

    // 반복 호출해도 같은 체결을 두 번 보고하지 않는다
    result = f.poll();
    assert(result.newly_filled.empty());
    assert(result.newly_closed.empty());

    // buy_0 익절 (2002.8) + buy_1 발동 (2002.896)
    f.quote(2002.8, 2003.0);
    result = f.poll();
    assert(result.newly_filled.size() == 1);
    assert(result.newly_filled[0].key == LayerKey(OrderSide::BUY, 1));
    assert(result.newly_closed.size() == 1);
    assert(result.newly_closed[0].key == LayerKey(OrderSide::BUY, 0));
    assert(near(result.newly_closed[0].pnl, 20.0));
    assert(near(result.newly_closed[0].close_price, 2002.8));
    assert(near(result.unrealized_pnl, -0.96));
    assert(f.order(OrderSide::BUY, 0).status == GridOrderStatus::CLOSED);
    assert(near(f.order(OrderSide::BUY, 0).realized_pnl, 20.0));

    result = f.poll();
    assert(result.newly_filled.empty());
    assert(result.newly_closed.empty());

    // 두 폴링 사이에 체결과 청산이 모두 일어난 경우
    f.quote(2005.2, 2005.4);     // buy_1 익절, buy_2 발동
    f.quote(2007.8, 2008.0);     // buy_2 익절
    result = f.poll();
    assert(result.newly_filled.size() == 1);
    assert(result.newly_filled[0].key == LayerKey(OrderSide::BUY, 2));
    assert(near(result.newly_filled[0].fill_price, 2005.232));
    assert(result.newly_closed.size() == 2);
    assert(result.newly_closed[0].key == LayerKey(OrderSide::BUY, 1));
    assert(near(result.newly_closed[0].pnl, 22.4));
    assert(result.newly_closed[1].key == LayerKey(OrderSide::BUY, 2));
    assert(near(result.newly_closed[1].pnl, 49.6));
    assert(near(result.unrealized_pnl, 0.0));

    // sell 쪽은 그대로 대기
    assert(f.order(OrderSide::SELL, 0).status == GridOrderStatus::PLACED);
    assert(f.venue.pendingOrderCount() == 3);
}

static void testVenueOutageLeavesStateUntouched() {
    Fixture f;
    f.quote(2000.7, 2000.9);
    f.venue.setOffline(true);

    bool threw = false;
    try {
        f.poll();
    } catch (const VenueUnavailableError&) {
        threw = true;
    }
    assert(threw);
    assert(f.order(OrderSide::BUY, 0).status == GridOrderStatus::PLACED);
    assert(f.state.filled_set.empty());

    // 복구 후 다음 폴링에서 보고
    f.venue.setOffline(false);
    const auto result = f.poll();
    assert(result.newly_filled.size() == 1);
    assert(f.order(OrderSide::BUY, 0).status == GridOrderStatus::FILLED);
}

static void testSellSide() {
    Fixture f;
    f.quote(1999.0, 1999.2);     // sell_0 1999.2 발동
    auto result = f.poll();
    assert(result.newly_filled.size() == 1);
    assert(result.newly_filled[0].key == LayerKey(OrderSide::SELL, 0));
    assert(near(result.unrealized_pnl, 0.0));

    f.quote(1997.0, 1997.2);     // sell_0 익절 1997.2
    result = f.poll();
    assert(result.newly_closed.size() == 1);
    assert(near(result.newly_closed[0].pnl, 20.0));
}

static void testClosureWaitsForExitDeal() {
    Fixture f;
    LaggingHistoryVenue lagging(f.venue);
    execution::FillTracker tracker(lagging, kSymbol);

    f.quote(2000.7, 2000.9);
    f.now += std::chrono::seconds(1);
    auto result = tracker.poll(f.state, f.now);
    assert(result.newly_filled.size() == 1);

    // buy_0 익절 직후: 포지션은 사라졌지만 청산 기록은 아직 없다
    f.quote(2002.8, 2003.0);
    lagging.hide_exits = true;
    f.now += std::chrono::seconds(1);
    result = tracker.poll(f.state, f.now);
    assert(result.newly_closed.empty());
    assert(f.order(OrderSide::BUY, 0).status == GridOrderStatus::FILLED);
    assert(f.state.closed_set.empty());

    // 기록이 들어오면 실제 손익으로 한 번만 보고
    lagging.hide_exits = false;
    f.now += std::chrono::seconds(1);
    result = tracker.poll(f.state, f.now);
    assert(result.newly_closed.size() == 1);
    assert(result.newly_closed[0].key == LayerKey(OrderSide::BUY, 0));
    assert(near(result.newly_closed[0].pnl, 20.0));
    assert(near(f.order(OrderSide::BUY, 0).realized_pnl, 20.0));
    assert(f.order(OrderSide::BUY, 0).status == GridOrderStatus::CLOSED);

    f.now += std::chrono::seconds(1);
    result = tracker.poll(f.state, f.now);
    assert(result.newly_closed.empty());
}

int main() {
    testFillsAndClosures();
    testVenueOutageLeavesStateUntouched();
    testSellSide();
    testClosureWaitsForExitDeal();

    std::cout << "[TEST] FillTracker PASSED\n";
    return 0;
}
