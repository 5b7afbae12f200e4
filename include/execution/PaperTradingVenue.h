#pragma once

#include "core/contracts/ITradingVenue.h"

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace gridcycle {
namespace execution {

// 메모리 상의 모의 거래소.
// 호가 갱신(setQuote) 시 stop 주문 발동과 익절 청산을 처리한다.
class PaperTradingVenue : public core::ITradingVenue {
public:
    using Clock = std::function<Timestamp()>;

    explicit PaperTradingVenue(Amount initial_balance = 10000.0,
                               double contract_size = 100.0,
                               double leverage = 100.0);

    void setClock(Clock clock);
    void setQuote(const std::string& symbol, Price bid, Price ask);

    // 장애 주입
    void setOffline(bool offline);
    void rejectNextOrders(int count, int retcode = 10015, const std::string& message = "Invalid price");

    Amount balance() const;
    std::size_t pendingOrderCount() const;
    std::size_t openPositionCount() const;

    Tick getTick(const std::string& symbol) override;
    AccountSnapshot getAccountSnapshot() override;

    OrderResult placeConditionalOrder(const ConditionalOrderRequest& request) override;
    bool cancelOrder(const std::string& venue_order_id) override;
    bool closePosition(const std::string& position_id) override;

    std::vector<VenuePosition> listOpenPositions(const std::string& symbol) override;
    std::vector<VenueOrder> listPendingOrders(const std::string& symbol) override;
    std::vector<Deal> listTradeHistory(Timestamp since, Timestamp until) override;

private:
    struct PendingEntry {
        VenueOrder order;
        std::string symbol;
    };

    struct OpenEntry {
        VenuePosition position;
        std::string symbol;
        Price target_price = 0.0;
    };

    void ensureOnline() const;
    std::string nextId();
    Timestamp now() const;

    Amount floatingProfit(const OpenEntry& entry) const;
    void triggerPending(const std::string& symbol);
    void checkTakeProfit(const std::string& symbol);
    void closeAt(const std::string& position_id, Price price);

    mutable std::mutex mutex_;
    Clock clock_;

    Amount balance_;
    double contract_size_;
    double leverage_;
    long long next_id_ = 1000;

    bool offline_ = false;
    int reject_remaining_ = 0;
    int reject_retcode_ = 0;
    std::string reject_message_;

    std::map<std::string, Tick> quotes_;
    std::map<std::string, PendingEntry> pending_;
    std::map<std::string, OpenEntry> positions_;
    std::vector<Deal> deals_;
};

} // namespace execution
} // namespace gridcycle
