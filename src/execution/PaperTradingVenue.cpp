#include "execution/PaperTradingVenue.h"
#include "common/Errors.h"
#include "common/Logger.h"

namespace gridcycle {
namespace execution {

PaperTradingVenue::PaperTradingVenue(Amount initial_balance, double contract_size, double leverage)
    : clock_([] { return std::chrono::system_clock::now(); })
    , balance_(initial_balance)
    , contract_size_(contract_size)
    , leverage_(leverage)
{}

void PaperTradingVenue::setClock(Clock clock) {
    std::lock_guard<std::mutex> lock(mutex_);
    clock_ = std::move(clock);
}

void PaperTradingVenue::setQuote(const std::string& symbol, Price bid, Price ask) {
    std::lock_guard<std::mutex> lock(mutex_);
    quotes_[symbol] = Tick{bid, ask};
    triggerPending(symbol);
    checkTakeProfit(symbol);
}

void PaperTradingVenue::setOffline(bool offline) {
    std::lock_guard<std::mutex> lock(mutex_);
    offline_ = offline;
}

void PaperTradingVenue::rejectNextOrders(int count, int retcode, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    reject_remaining_ = count;
    reject_retcode_ = retcode;
    reject_message_ = message;
}

Amount PaperTradingVenue::balance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return balance_;
}

std::size_t PaperTradingVenue::pendingOrderCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::size_t PaperTradingVenue::openPositionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_.size();
}

Tick PaperTradingVenue::getTick(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureOnline();
    auto it = quotes_.find(symbol);
    if (it == quotes_.end()) {
        throw VenueUnavailableError("no quote for " + symbol);
    }
    return it->second;
}

AccountSnapshot PaperTradingVenue::getAccountSnapshot() {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureOnline();

    Amount floating = 0.0;
    Amount used_margin = 0.0;
    for (const auto& [id, entry] : positions_) {
        floating += floatingProfit(entry);
        used_margin += entry.position.volume * contract_size_ * entry.position.open_price / leverage_;
    }

    AccountSnapshot snapshot;
    snapshot.balance = balance_;
    snapshot.equity = balance_ + floating;
    snapshot.free_margin = snapshot.equity - used_margin;
    return snapshot;
}

OrderResult PaperTradingVenue::placeConditionalOrder(const ConditionalOrderRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureOnline();

    OrderResult result;
    if (reject_remaining_ > 0) {
        --reject_remaining_;
        result.retcode = reject_retcode_;
        result.message = reject_message_;
        return result;
    }
    if (request.volume <= 0.0 || request.price <= 0.0) {
        result.retcode = 10014;
        result.message = "Invalid volume or price";
        return result;
    }

    PendingEntry entry;
    entry.symbol = request.symbol;
    entry.order.id = nextId();
    entry.order.side = request.side;
    entry.order.open_price = request.price;
    entry.order.target_price = request.target_price;
    entry.order.volume = request.volume;
    entry.order.tag = request.tag;
    entry.order.magic = request.magic;

    result.success = true;
    result.retcode = 10009;
    result.venue_order_id = entry.order.id;
    pending_[entry.order.id] = entry;

    // 이미 stop 가격을 넘어선 호가면 즉시 발동
    if (quotes_.count(request.symbol) > 0) {
        triggerPending(request.symbol);
        checkTakeProfit(request.symbol);
    }
    return result;
}

bool PaperTradingVenue::cancelOrder(const std::string& venue_order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureOnline();
    return pending_.erase(venue_order_id) > 0;
}

bool PaperTradingVenue::closePosition(const std::string& position_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureOnline();

    auto it = positions_.find(position_id);
    if (it == positions_.end()) {
        return false;
    }
    auto quote = quotes_.find(it->second.symbol);
    if (quote == quotes_.end()) {
        return false;
    }
    const Price price = (it->second.position.side == OrderSide::BUY) ? quote->second.bid : quote->second.ask;
    closeAt(position_id, price);
    return true;
}

std::vector<VenuePosition> PaperTradingVenue::listOpenPositions(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureOnline();

    std::vector<VenuePosition> out;
    for (const auto& [id, entry] : positions_) {
        if (entry.symbol != symbol) {
            continue;
        }
        VenuePosition position = entry.position;
        position.profit = floatingProfit(entry);
        out.push_back(position);
    }
    return out;
}

std::vector<VenueOrder> PaperTradingVenue::listPendingOrders(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureOnline();

    std::vector<VenueOrder> out;
    for (const auto& [id, entry] : pending_) {
        if (entry.symbol == symbol) {
            out.push_back(entry.order);
        }
    }
    return out;
}

std::vector<Deal> PaperTradingVenue::listTradeHistory(Timestamp since, Timestamp until) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureOnline();

    std::vector<Deal> out;
    for (const auto& deal : deals_) {
        if (deal.time >= since && deal.time <= until) {
            out.push_back(deal);
        }
    }
    return out;
}

void PaperTradingVenue::ensureOnline() const {
    if (offline_) {
        throw VenueUnavailableError("paper venue offline");
    }
}

std::string PaperTradingVenue::nextId() {
    return std::to_string(next_id_++);
}

Timestamp PaperTradingVenue::now() const {
    return clock_();
}

Amount PaperTradingVenue::floatingProfit(const OpenEntry& entry) const {
    auto quote = quotes_.find(entry.symbol);
    if (quote == quotes_.end()) {
        return 0.0;
    }
    const auto& position = entry.position;
    const double distance = (position.side == OrderSide::BUY)
        ? quote->second.bid - position.open_price
        : position.open_price - quote->second.ask;
    return distance * position.volume * contract_size_;
}

void PaperTradingVenue::triggerPending(const std::string& symbol) {
    const Tick& quote = quotes_[symbol];

    for (auto it = pending_.begin(); it != pending_.end();) {
        const PendingEntry& entry = it->second;
        const bool triggered = entry.symbol == symbol &&
            ((entry.order.side == OrderSide::BUY && quote.ask >= entry.order.open_price) ||
             (entry.order.side == OrderSide::SELL && quote.bid <= entry.order.open_price));
        if (!triggered) {
            ++it;
            continue;
        }

        OpenEntry open;
        open.symbol = symbol;
        open.target_price = entry.order.target_price;
        open.position.id = entry.order.id;
        open.position.side = entry.order.side;
        open.position.volume = entry.order.volume;
        open.position.open_price = entry.order.open_price;
        open.position.tag = entry.order.tag;
        open.position.magic = entry.order.magic;
        positions_[open.position.id] = open;

        Deal deal;
        deal.order_id = entry.order.id;
        deal.position_id = entry.order.id;
        deal.entry = DealEntry::IN;
        deal.side = entry.order.side;
        deal.volume = entry.order.volume;
        deal.price = entry.order.open_price;
        deal.time = now();
        deals_.push_back(deal);

        LOG_DEBUG("paper: {} stop {} triggered at {:.3f}", entry.order.tag, entry.order.id, entry.order.open_price);
        it = pending_.erase(it);
    }
}

void PaperTradingVenue::checkTakeProfit(const std::string& symbol) {
    const Tick& quote = quotes_[symbol];

    std::vector<std::pair<std::string, Price>> hits;
    for (const auto& [id, entry] : positions_) {
        if (entry.symbol != symbol || entry.target_price <= 0.0) {
            continue;
        }
        if (entry.position.side == OrderSide::BUY && quote.bid >= entry.target_price) {
            hits.emplace_back(id, entry.target_price);
        } else if (entry.position.side == OrderSide::SELL && quote.ask <= entry.target_price) {
            hits.emplace_back(id, entry.target_price);
        }
    }
    for (const auto& [id, price] : hits) {
        closeAt(id, price);
    }
}

void PaperTradingVenue::closeAt(const std::string& position_id, Price price) {
    auto it = positions_.find(position_id);
    if (it == positions_.end()) {
        return;
    }
    const VenuePosition& position = it->second.position;
    const double distance = (position.side == OrderSide::BUY) ? price - position.open_price
                                                               : position.open_price - price;
    const Amount profit = distance * position.volume * contract_size_;

    Deal deal;
    deal.order_id = nextId();
    deal.position_id = position.id;
    deal.entry = DealEntry::OUT;
    deal.side = (position.side == OrderSide::BUY) ? OrderSide::SELL : OrderSide::BUY;
    deal.volume = position.volume;
    deal.price = price;
    deal.profit = profit;
    deal.time = now();
    deals_.push_back(deal);

    balance_ += profit;
    LOG_DEBUG("paper: position {} closed at {:.3f}, profit {:.2f}", position.id, price, profit);
    positions_.erase(it);
}

} // namespace execution
} // namespace gridcycle
