#pragma once

#include "common/Types.h"
#include "core/contracts/ITradingVenue.h"
#include "engine/GridState.h"

#include <string>
#include <vector>

namespace gridcycle {
namespace execution {

struct FillEvent {
    LayerKey key;
    std::string venue_order_id;
    Price fill_price = 0.0;
    Timestamp time{};
};

struct CloseEvent {
    LayerKey key;
    std::string venue_order_id;
    Amount pnl = 0.0;
    Price close_price = 0.0;
    Timestamp time{};
};

struct PollResult {
    std::vector<FillEvent> newly_filled;
    std::vector<CloseEvent> newly_closed;
    Amount unrealized_pnl = 0.0;     // 전략 소유 미청산 포지션 평가손익
};

// 매 틱 호출해도 안전하다. filled_set / closed_set 으로 중복 통지 방지.
// 거래소 호출이 모두 성공한 뒤에만 상태를 갱신한다.
class FillTracker {
public:
    FillTracker(core::ITradingVenue& venue, std::string symbol);

    PollResult poll(engine::GridState& state, Timestamp now);

private:
    core::ITradingVenue& venue_;
    std::string symbol_;
};

} // namespace execution
} // namespace gridcycle
