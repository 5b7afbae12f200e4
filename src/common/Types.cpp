#include "common/Types.h"

namespace gridcycle {

const char* toString(OrderSide side) {
    return side == OrderSide::BUY ? "buy" : "sell";
}

const char* toString(GridOrderStatus status) {
    switch (status) {
        case GridOrderStatus::UNPLACED: return "unplaced";
        case GridOrderStatus::PLACED: return "placed";
        case GridOrderStatus::FILLED: return "filled";
        case GridOrderStatus::CLOSED: return "closed";
    }
    return "unplaced";
}

std::string LayerKey::label() const {
    return std::string(toString(side)) + "_" + std::to_string(index);
}

long long toEpochMillis(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()
    ).count();
}

} // namespace gridcycle
