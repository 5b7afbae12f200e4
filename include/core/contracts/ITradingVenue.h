#pragma once

#include <string>
#include <vector>

#include "common/Types.h"

namespace gridcycle {
namespace core {

// 거래소 접근 계층 (세션/인증은 구현체 책임).
// 통신 실패는 VenueUnavailableError 로 던지고,
// 거래소가 거절한 주문은 OrderResult.success == false 로 돌려준다.
class ITradingVenue {
public:
    virtual ~ITradingVenue() = default;

    virtual Tick getTick(const std::string& symbol) = 0;
    virtual AccountSnapshot getAccountSnapshot() = 0;

    virtual OrderResult placeConditionalOrder(const ConditionalOrderRequest& request) = 0;
    virtual bool cancelOrder(const std::string& venue_order_id) = 0;
    virtual bool closePosition(const std::string& position_id) = 0;

    virtual std::vector<VenuePosition> listOpenPositions(const std::string& symbol) = 0;
    virtual std::vector<VenueOrder> listPendingOrders(const std::string& symbol) = 0;
    virtual std::vector<Deal> listTradeHistory(Timestamp since, Timestamp until) = 0;
};

} // namespace core
} // namespace gridcycle
