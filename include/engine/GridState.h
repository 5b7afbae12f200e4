#pragma once

#include "common/Types.h"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace gridcycle {
namespace engine {

// 한 사이클의 전체 상태. CycleController 가 단독 소유하며
// 리셋 시 통째로 교체된다 (부분 재구성 없음).
struct GridState {
    int anchor_index = 0;
    std::map<LayerKey, GridOrder> orders;
    std::set<std::string> filled_set;     // 체결 통지 완료된 venue id
    std::set<std::string> closed_set;     // 청산 통지 완료된 venue id

    Amount cycle_start_balance = 0.0;
    Amount cycle_realized_pnl = 0.0;
    Amount max_drawdown_observed = 0.0;
    Timestamp cycle_started_at{};
    int cycle_number = 0;
    bool active = false;

    // 이번 사이클에서 청산된 주문 (상태 보고용)
    std::vector<GridOrder> closed_orders;

    void reset(Amount start_balance, Timestamp now);

    // placed/filled 주문 존재 여부
    bool hasLiveOrders() const;
    // placed 또는 filled 상태면 해당 레이어는 이미 배치된 것으로 본다
    bool isLayerLive(const LayerKey& key) const;

    void track(const GridOrder& order);
    // 청산 후 슬롯을 비운다 (해당 key 는 다시 unplaced)
    void release(const LayerKey& key);

    GridOrder* findByVenueId(const std::string& venue_order_id);
    const GridOrder* findByVenueId(const std::string& venue_order_id) const;
    bool isTrackedVenueId(const std::string& venue_order_id) const;

    std::vector<GridOrder> ordersWithStatus(GridOrderStatus status) const;
    std::vector<std::string> venueIdsWithStatus(GridOrderStatus status) const;

    void observeEquity(Amount equity);

private:
    std::map<std::string, LayerKey> by_venue_id_;
};

} // namespace engine
} // namespace gridcycle
