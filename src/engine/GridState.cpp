#include "engine/GridState.h"

#include <algorithm>

namespace gridcycle {
namespace engine {

void GridState::reset(Amount start_balance, Timestamp now) {
    const int next_cycle = cycle_number + 1;
    *this = GridState{};
    cycle_number = next_cycle;
    cycle_start_balance = start_balance;
    cycle_started_at = now;
    active = true;
}

bool GridState::hasLiveOrders() const {
    return std::any_of(orders.begin(), orders.end(), [](const auto& entry) {
        return entry.second.status == GridOrderStatus::PLACED ||
               entry.second.status == GridOrderStatus::FILLED;
    });
}

bool GridState::isLayerLive(const LayerKey& key) const {
    auto it = orders.find(key);
    if (it == orders.end()) {
        return false;
    }
    return it->second.status == GridOrderStatus::PLACED ||
           it->second.status == GridOrderStatus::FILLED;
}

void GridState::track(const GridOrder& order) {
    auto it = orders.find(order.key);
    if (it != orders.end() && !it->second.venue_order_id.empty()) {
        by_venue_id_.erase(it->second.venue_order_id);
    }
    orders[order.key] = order;
    if (!order.venue_order_id.empty()) {
        by_venue_id_[order.venue_order_id] = order.key;
    }
}

void GridState::release(const LayerKey& key) {
    auto it = orders.find(key);
    if (it == orders.end()) {
        return;
    }
    if (!it->second.venue_order_id.empty()) {
        by_venue_id_.erase(it->second.venue_order_id);
    }
    orders.erase(it);
}

GridOrder* GridState::findByVenueId(const std::string& venue_order_id) {
    auto idx = by_venue_id_.find(venue_order_id);
    if (idx == by_venue_id_.end()) {
        return nullptr;
    }
    auto it = orders.find(idx->second);
    return it == orders.end() ? nullptr : &it->second;
}

const GridOrder* GridState::findByVenueId(const std::string& venue_order_id) const {
    auto idx = by_venue_id_.find(venue_order_id);
    if (idx == by_venue_id_.end()) {
        return nullptr;
    }
    auto it = orders.find(idx->second);
    return it == orders.end() ? nullptr : &it->second;
}

bool GridState::isTrackedVenueId(const std::string& venue_order_id) const {
    return by_venue_id_.count(venue_order_id) > 0;
}

std::vector<GridOrder> GridState::ordersWithStatus(GridOrderStatus status) const {
    std::vector<GridOrder> out;
    for (const auto& [key, order] : orders) {
        if (order.status == status) {
            out.push_back(order);
        }
    }
    return out;
}

std::vector<std::string> GridState::venueIdsWithStatus(GridOrderStatus status) const {
    std::vector<std::string> out;
    for (const auto& [key, order] : orders) {
        if (order.status == status && !order.venue_order_id.empty()) {
            out.push_back(order.venue_order_id);
        }
    }
    return out;
}

void GridState::observeEquity(Amount equity) {
    if (equity < cycle_start_balance) {
        max_drawdown_observed = (std::max)(max_drawdown_observed, cycle_start_balance - equity);
    }
}

} // namespace engine
} // namespace gridcycle
