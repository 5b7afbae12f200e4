#include "strategy/GridBuilder.h"
#include "execution/PaperTradingVenue.h"
#include "common/Errors.h"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace gridcycle;
using namespace gridcycle::strategy;

namespace {
bool near(double a, double b, double eps = 1e-6) { return std::fabs(a - b) < eps; }

const Timestamp kNow = Timestamp(std::chrono::seconds(1700000000));

GridParameters testParams() {
    GridParameters params;
    params.scaling_table = {1, 1, 2, 2, 3};
    return params;
}

const LayerPlan& planFor(const std::vector<LayerPlan>& plans, OrderSide side, int index) {
    for (const auto& plan : plans) {
        if (plan.key == LayerKey(side, index)) {
            return plan;
        }
    }
    throw std::runtime_error("layer not planned");
}

struct Fixture {
    execution::PaperTradingVenue venue;
    GridBuilder builder;
    engine::GridState state;
    risk::GuardConfig guards;

    Fixture() : builder(venue, testParams(), PatternDetector()) {
        venue.setClock([] { return kNow; });
        venue.setQuote("XAUUSDc", 2000.0, 2000.2);
        guards.blackout_windows.clear();
        state.reset(10000.0, kNow);
    }

    BuildReport build(int anchor, Price reference = 2000.0,
                      const risk::GuardDecision& decision = risk::GuardDecision::allow()) {
        return builder.buildAt(state, anchor, reference, 0.1, decision, guards, kNow);
    }
};
}

static void testPlanLayers() {
    const auto plans = GridBuilder::planLayers(testParams(), 0, 2000.0, 0.1);
    assert(plans.size() == 6);

    const auto& b0 = planFor(plans, OrderSide::BUY, 0);
    assert(b0.rung == 1);
    assert(near(b0.entry_price, 2000.8));
    assert(near(b0.target_price, 2002.8));
    assert(near(b0.volume, 0.1));

    const auto& b1 = planFor(plans, OrderSide::BUY, 1);
    assert(near(b1.entry_price, 2002.896));
    assert(near(b1.target_price, 2005.136));

    const auto& b2 = planFor(plans, OrderSide::BUY, 2);
    assert(b2.rung == 3);
    assert(near(b2.entry_price, 2005.232));
    assert(near(b2.target_price, 2007.712));
    assert(near(b2.volume, 0.2));

    const auto& s0 = planFor(plans, OrderSide::SELL, 0);
    assert(near(s0.entry_price, 1999.2));
    assert(near(s0.target_price, 1997.2));

    const auto& s1 = planFor(plans, OrderSide::SELL, -1);
    assert(near(s1.entry_price, 1997.104));
    assert(near(s1.target_price, 1994.864));

    const auto& s2 = planFor(plans, OrderSide::SELL, -2);
    assert(near(s2.entry_price, 1994.768));
    assert(near(s2.target_price, 1992.288));

    // anchor 3: buy 3,4,5 / sell 3,2,1
    const auto shifted = GridBuilder::planLayers(testParams(), 3, 2000.0, 0.1);
    assert(near(planFor(shifted, OrderSide::BUY, 3).entry_price, 2001.088));
    assert(near(planFor(shifted, OrderSide::SELL, 3).entry_price, 1998.912));
    assert(near(planFor(shifted, OrderSide::SELL, 2).entry_price, 1996.288));
    assert(near(planFor(shifted, OrderSide::BUY, 5).volume, 0.3));

    // 모든 buy 는 reference 위, sell 은 아래
    for (const auto& plan : plans) {
        if (plan.key.side == OrderSide::BUY) {
            assert(plan.entry_price > 2000.0 && plan.target_price > plan.entry_price);
        } else {
            assert(plan.entry_price < 2000.0 && plan.target_price < plan.entry_price);
        }
    }

    bool threw = false;
    try {
        GridBuilder::planLayers(testParams(), 0, 2000.0, 0.0);
    } catch (const InvalidConfigurationError&) {
        threw = true;
    }
    assert(threw);

    // 0.004 * 1 -> 0.00 lot: 주문 계획 자체를 거부
    threw = false;
    try {
        GridBuilder::planLayers(testParams(), 0, 2000.0, 0.004);
    } catch (const InvalidConfigurationError&) {
        threw = true;
    }
    assert(threw);
    assert(!GridBuilder::yieldsTradableVolume(testParams(), 0.004));
    assert(GridBuilder::yieldsTradableVolume(testParams(), 0.01));
    assert(!GridBuilder::yieldsTradableVolume(testParams(), 0.0));

    // 표 밖 레이어를 기본 수량으로
    GridParameters base_overflow = testParams();
    base_overflow.table_overflow = TableOverflow::BASE_AMOUNT;
    const auto far = GridBuilder::planLayers(base_overflow, 4, 2000.0, 0.1);
    assert(near(planFor(far, OrderSide::BUY, 4).volume, 0.3));
    assert(near(planFor(far, OrderSide::BUY, 5).volume, 0.1));
    assert(near(planFor(far, OrderSide::BUY, 6).volume, 0.1));
}

static void testFreshBuildAndIdempotence() {
    Fixture f;
    auto report = f.build(0);
    assert(report.placed == 6);
    assert(report.new_orders.size() == 6);
    assert(!report.needsRetry());
    assert(f.venue.pendingOrderCount() == 6);
    assert(f.state.orders.size() == 6);
    for (const auto& [key, order] : f.state.orders) {
        assert(order.status == GridOrderStatus::PLACED);
        assert(!order.venue_order_id.empty());
        assert(f.state.isTrackedVenueId(order.venue_order_id));
    }

    // 같은 anchor 재구성 -> 모두 live
    report = f.build(0);
    assert(report.placed == 0);
    assert(report.already_live == 6);
    assert(f.venue.pendingOrderCount() == 6);

    // reference 0 -> mid (2000.1)
    Fixture g;
    report = g.build(0, 0.0);
    assert(report.placed == 6);
    assert(near(g.state.orders.at(LayerKey(OrderSide::BUY, 0)).entry_price, 2000.9));
}

static void testBlockedDecision() {
    Fixture f;
    f.venue.setOffline(true);   // 거래소를 호출하면 venue_errors 가 잡힌다
    const auto report = f.build(0, 2000.0,
        risk::GuardDecision::block(risk::GuardReason::SPREAD_TOO_WIDE, "spread 1.0 > 0.5"));
    assert(report.blocked);
    assert(report.block_reason == risk::GuardReason::SPREAD_TOO_WIDE);
    assert(report.placed == 0);
    assert(report.venue_errors == 0);
    assert(report.needsRetry());
    assert(f.state.orders.empty());
}

static void testDuplicateAdoption() {
    Fixture f;
    assert(f.build(0).placed == 6);

    // 상태를 잃은 뒤 다시 구성 -> 거래소 대기 주문을 채택
    engine::GridState fresh;
    fresh.reset(10000.0, kNow);
    const auto report = f.builder.buildAt(fresh, 0, 2000.0, 0.1,
                                          risk::GuardDecision::allow(), f.guards, kNow);
    assert(report.placed == 0);
    assert(report.duplicates == 6);
    assert(f.venue.pendingOrderCount() == 6);
    assert(fresh.orders.size() == 6);
    for (const auto& [key, order] : fresh.orders) {
        assert(order.status == GridOrderStatus::PLACED);
        assert(f.state.isTrackedVenueId(order.venue_order_id));
    }
}

static void testPendingOrderIndex() {
    auto pendingAt = [](OrderSide side, Price price, const std::string& id) {
        VenueOrder order;
        order.id = id;
        order.side = side;
        order.open_price = price;
        return order;
    };

    PendingOrderIndex index(0.01, 3);
    index.add(pendingAt(OrderSide::BUY, 2000.805, "a"));
    index.add(pendingAt(OrderSide::SELL, 1999.2, "b"));
    assert(index.size() == 2);

    const VenueOrder* hit = index.find(OrderSide::BUY, 2000.8);   // 구간 경계 너머, 오차 안
    assert(hit && hit->id == "a");
    assert(!index.find(OrderSide::SELL, 2000.8));                 // side 가 다르면 무시
    assert(!index.find(OrderSide::BUY, 2000.83));                 // 오차 밖
    assert(index.find(OrderSide::SELL, 1999.195));

    // 오차 0: 같은 가격만
    PendingOrderIndex exact(0.0, 3);
    exact.add(pendingAt(OrderSide::BUY, 2000.8, "c"));
    assert(exact.find(OrderSide::BUY, 2000.8));
    assert(!exact.find(OrderSide::BUY, 2000.801));
}

static void testRejectionStaysUnplaced() {
    Fixture f;
    f.venue.rejectNextOrders(2);
    auto report = f.build(0);
    assert(report.placed == 4);
    assert(report.rejected == 2);
    assert(report.rejections.size() == 2);
    assert(report.rejections[0].key == LayerKey(OrderSide::BUY, 0));
    assert(report.rejections[0].retcode == 10015);
    assert(report.needsRetry());
    assert(!f.state.isLayerLive(LayerKey(OrderSide::BUY, 0)));
    assert(!f.state.isLayerLive(LayerKey(OrderSide::BUY, 1)));
    assert(f.state.isLayerLive(LayerKey(OrderSide::BUY, 2)));

    // 다음 시도에서 빠진 레이어만 채운다
    report = f.build(0);
    assert(report.placed == 2);
    assert(report.already_live == 4);
    assert(f.venue.pendingOrderCount() == 6);
}

static void testPatternSkip() {
    Fixture f;
    for (int i = 0; i < 2; ++i) {
        GridOrder filled;
        filled.key = LayerKey(OrderSide::BUY, i);
        filled.venue_order_id = "filled-" + std::to_string(i);
        filled.status = GridOrderStatus::FILLED;
        f.state.track(filled);
    }

    const auto report = f.build(0);
    assert(report.already_live == 2);
    assert(report.pattern_skipped == 1);   // sell 1층
    assert(report.placed == 3);
    assert(!f.state.isLayerLive(LayerKey(OrderSide::SELL, 0)));
    assert(f.state.isLayerLive(LayerKey(OrderSide::SELL, -1)));
    assert(f.state.isLayerLive(LayerKey(OrderSide::BUY, 2)));
}

static void testExposureCap() {
    Fixture f;
    f.guards.max_total_exposure = 0.3;
    auto report = f.build(0);
    assert(report.blocked);
    assert(report.block_reason == risk::GuardReason::EXPOSURE_CAP);
    assert(report.placed == 0);
    assert(f.venue.pendingOrderCount() == 0);

    f.guards.max_total_exposure = 1.0;
    report = f.build(0);
    assert(!report.blocked);
    assert(report.placed == 6);
}

static void testZeroVolumeBuildRejected() {
    Fixture f;
    bool threw = false;
    try {
        f.builder.buildAt(f.state, 0, 2000.0, 0.004, risk::GuardDecision::allow(), f.guards, kNow);
    } catch (const InvalidConfigurationError&) {
        threw = true;
    }
    assert(threw);
    assert(f.venue.pendingOrderCount() == 0);
    assert(f.state.orders.empty());
}

static void testVenueOutage() {
    Fixture f;
    f.venue.setOffline(true);
    const auto report = f.build(0);
    assert(report.venue_errors == 1);
    assert(report.placed == 0);
    assert(report.needsRetry());
    assert(f.state.orders.empty());
}

int main() {
    testPlanLayers();
    testFreshBuildAndIdempotence();
    testBlockedDecision();
    testDuplicateAdoption();
    testPendingOrderIndex();
    testRejectionStaysUnplaced();
    testPatternSkip();
    testExposureCap();
    testZeroVolumeBuildRejected();
    testVenueOutage();

    std::cout << "[TEST] GridBuilder PASSED\n";
    return 0;
}
