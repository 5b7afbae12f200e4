#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace gridcycle {

using Timestamp = std::chrono::system_clock::time_point;
using Price = double;
using Volume = double;
using Amount = double;

enum class OrderSide { BUY, SELL };

// unplaced -> placed -> filled -> closed (단방향, 사이클 리셋 시에만 초기화)
enum class GridOrderStatus { UNPLACED, PLACED, FILLED, CLOSED };

const char* toString(OrderSide side);
const char* toString(GridOrderStatus status);

// 레이어 식별자: side + signed index (예: buy_2, sell_-1)
struct LayerKey {
    OrderSide side = OrderSide::BUY;
    int index = 0;

    LayerKey() = default;
    LayerKey(OrderSide s, int i) : side(s), index(i) {}

    // 거래소에 전달되는 라벨. 제어 로직에서는 다시 파싱하지 않는다.
    std::string label() const;

    bool operator<(const LayerKey& other) const {
        if (side != other.side) return side < other.side;
        return index < other.index;
    }
    bool operator==(const LayerKey& other) const {
        return side == other.side && index == other.index;
    }
    bool operator!=(const LayerKey& other) const { return !(*this == other); }
};

struct GridOrder {
    LayerKey key;
    std::string venue_order_id;      // 주문 성공 전에는 비어 있음
    Price entry_price = 0.0;
    Price target_price = 0.0;
    Volume volume = 0.0;
    GridOrderStatus status = GridOrderStatus::UNPLACED;
    Amount realized_pnl = 0.0;
    Timestamp placed_at{};
    Timestamp filled_at{};
    Timestamp closed_at{};
};

struct Tick {
    Price bid = 0.0;
    Price ask = 0.0;

    Price mid() const { return (bid + ask) / 2.0; }
    Price spread() const { return ask - bid; }
};

struct AccountSnapshot {
    Amount balance = 0.0;
    Amount equity = 0.0;
    Amount free_margin = 0.0;
};

struct VenuePosition {
    std::string id;
    OrderSide side = OrderSide::BUY;
    Volume volume = 0.0;
    Price open_price = 0.0;
    Amount profit = 0.0;
    std::string tag;
    long long magic = 0;
};

struct VenueOrder {
    std::string id;
    OrderSide side = OrderSide::BUY;
    Price open_price = 0.0;
    Price target_price = 0.0;
    Volume volume = 0.0;
    std::string tag;
    long long magic = 0;
};

enum class DealEntry { IN, OUT };

struct Deal {
    std::string order_id;
    std::string position_id;
    DealEntry entry = DealEntry::IN;
    OrderSide side = OrderSide::BUY;
    Volume volume = 0.0;
    Price price = 0.0;
    Amount profit = 0.0;
    Timestamp time{};
};

struct ConditionalOrderRequest {
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    Price price = 0.0;
    Price target_price = 0.0;
    Volume volume = 0.0;
    std::string tag;
    long long magic = 0;
};

struct OrderResult {
    bool success = false;
    std::string venue_order_id;
    int retcode = 0;
    std::string message;
};

long long toEpochMillis(Timestamp ts);

} // namespace gridcycle
