#include "execution/FillTracker.h"
#include "execution/GridOrderLifecycle.h"
#include "common/Logger.h"

#include <set>

namespace gridcycle {
namespace execution {

namespace {
// position_id 가 일치하는 마지막 청산 기록 (시간순, 같으면 뒤쪽)
const Deal* lastExitFor(const std::vector<Deal>& deals, const std::string& position_id) {
    const Deal* found = nullptr;
    for (const auto& deal : deals) {
        if (deal.position_id != position_id || deal.entry != DealEntry::OUT) {
            continue;
        }
        if (!found || deal.time >= found->time) {
            found = &deal;
        }
    }
    return found;
}
} // namespace

FillTracker::FillTracker(core::ITradingVenue& venue, std::string symbol)
    : venue_(venue)
    , symbol_(std::move(symbol))
{}

PollResult FillTracker::poll(engine::GridState& state, Timestamp now) {
    PollResult result;

    // 거래소 조회 (실패 시 예외 전파, 상태 변경 없음).
    // 포지션을 먼저 읽는다: 그 뒤에 닫힌 포지션은 아직 열린 것으로 보이고,
    // 이력에는 있는데 포지션 목록에 없으면 청산 기록이 있어야만 닫힌 것으로 본다.
    const std::vector<VenuePosition> positions = venue_.listOpenPositions(symbol_);
    const std::vector<Deal> deals = venue_.listTradeHistory(state.cycle_started_at, now);

    std::set<std::string> open_ids;
    for (const auto& position : positions) {
        open_ids.insert(position.id);
    }

    // 1) 신규 체결
    for (const auto& venue_id : state.venueIdsWithStatus(GridOrderStatus::PLACED)) {
        if (state.filled_set.count(venue_id) > 0) {
            continue;
        }
        const Deal* entry = nullptr;
        for (const auto& deal : deals) {
            if (deal.position_id != venue_id) {
                continue;
            }
            if (!entry || (deal.entry == DealEntry::IN && entry->entry != DealEntry::IN)) {
                entry = &deal;
            }
        }
        if (!entry) {
            continue;
        }

        GridOrder* order = state.findByVenueId(venue_id);
        if (!order) {
            continue;
        }
        auto transition = GridOrderLifecycle::transition("filled", order->status);
        if (!transition.changed) {
            continue;
        }
        order->status = transition.status;
        order->filled_at = entry->time;
        state.filled_set.insert(venue_id);

        FillEvent fill;
        fill.key = order->key;
        fill.venue_order_id = venue_id;
        fill.fill_price = (entry->entry == DealEntry::IN && entry->price > 0.0) ? entry->price : order->entry_price;
        fill.time = entry->time;
        result.newly_filled.push_back(fill);
    }

    // 2) 신규 청산: 체결됐지만 더 이상 열려 있지 않은 포지션
    for (const auto& venue_id : state.venueIdsWithStatus(GridOrderStatus::FILLED)) {
        if (open_ids.count(venue_id) > 0 || state.closed_set.count(venue_id) > 0) {
            continue;
        }
        // 청산 기록이 아직 이력에 없으면 다음 폴링으로 미룬다
        const Deal* exit = lastExitFor(deals, venue_id);
        if (!exit) {
            LOG_DEBUG("position {} not open but no exit deal yet, closure deferred", venue_id);
            continue;
        }

        GridOrder* order = state.findByVenueId(venue_id);
        if (!order) {
            continue;
        }
        auto transition = GridOrderLifecycle::transition("closed", order->status);
        if (!transition.changed) {
            continue;
        }

        order->status = transition.status;
        order->realized_pnl = exit->profit;
        order->closed_at = exit->time;
        state.closed_set.insert(venue_id);

        CloseEvent close;
        close.key = order->key;
        close.venue_order_id = venue_id;
        close.pnl = order->realized_pnl;
        close.close_price = exit->price;
        close.time = order->closed_at;
        result.newly_closed.push_back(close);
    }

    // 3) 미실현 손익
    for (const auto& position : positions) {
        const GridOrder* order = state.findByVenueId(position.id);
        if (order && order->status == GridOrderStatus::FILLED) {
            result.unrealized_pnl += position.profit;
        }
    }

    return result;
}

} // namespace execution
} // namespace gridcycle
