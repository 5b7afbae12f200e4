#include "strategy/GridBuilder.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <string>

namespace gridcycle {
namespace strategy {

PendingOrderIndex::PendingOrderIndex(double tolerance, int price_digits)
    : tolerance_(tolerance)
    , width_(tolerance > 0.0 ? tolerance : std::pow(10.0, -price_digits))
{}

long long PendingOrderIndex::bucketOf(Price price) const {
    return std::llround(price / width_);
}

void PendingOrderIndex::add(VenueOrder order) {
    const auto key = std::make_pair(order.side, bucketOf(order.open_price));
    orders_.emplace(key, std::move(order));
}

const VenueOrder* PendingOrderIndex::find(OrderSide side, Price price) const {
    const long long bucket = bucketOf(price);
    for (long long b = bucket - 1; b <= bucket + 1; ++b) {
        const auto range = orders_.equal_range(std::make_pair(side, b));
        for (auto it = range.first; it != range.second; ++it) {
            if (std::fabs(it->second.open_price - price) <= tolerance_) {
                return &it->second;
            }
        }
    }
    return nullptr;
}

GridBuilder::GridBuilder(core::ITradingVenue& venue, GridParameters params, PatternDetector detector)
    : venue_(venue)
    , params_(std::move(params))
    , detector_(detector)
{}

double GridBuilder::spacingFactor(const GridParameters& params, int layer_index) {
    return 1.0 + (static_cast<double>(std::abs(layer_index)) / 100.0) * params.percent_scale;
}

double GridBuilder::roundTo(double value, int digits) {
    const double scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

std::vector<LayerPlan> GridBuilder::planLayers(
    const GridParameters& params, int anchor_index, Price reference_price, double base_amount)
{
    std::vector<LayerPlan> plans;
    plans.reserve(6);

    for (OrderSide side : {OrderSide::BUY, OrderSide::SELL}) {
        const int step = (side == OrderSide::BUY) ? 1 : -1;
        double offset = 0.0;   // 안쪽 레이어들의 익절 거리 누적

        for (int rung = 1; rung <= 3; ++rung) {
            const int layer_index = anchor_index + step * (rung - 1);
            const double factor = spacingFactor(params, layer_index);
            const double entry_distance = offset + params.delta_enter_price * factor;
            const double target_distance = params.target_profit * factor;

            LayerPlan plan;
            plan.key = LayerKey(side, layer_index);
            plan.rung = rung;
            plan.entry_price = roundTo(reference_price + step * entry_distance, params.price_digits);
            plan.target_price = roundTo(plan.entry_price + step * target_distance, params.price_digits);
            plan.volume = roundTo(
                PositionSizer::size(base_amount, params.scaling_table, layer_index, params.table_overflow),
                params.volume_digits);
            if (!(plan.volume > 0.0)) {
                throw InvalidConfigurationError(
                    plan.key.label() + ": base amount " + std::to_string(base_amount) +
                    " rounds to zero volume");
            }
            plans.push_back(plan);

            offset += target_distance;
        }
    }
    return plans;
}

bool GridBuilder::yieldsTradableVolume(const GridParameters& params, double base_amount) {
    if (!(base_amount > 0.0) || !std::isfinite(base_amount) || params.scaling_table.empty()) {
        return false;
    }
    // 가장 작은 배수 (표 밖 레이어가 기본 수량을 쓰면 1.0 도 후보)
    double smallest = *std::min_element(params.scaling_table.begin(), params.scaling_table.end());
    if (params.table_overflow == TableOverflow::BASE_AMOUNT) {
        smallest = std::min(smallest, 1.0);
    }
    return roundTo(base_amount * smallest, params.volume_digits) > 0.0;
}

BuildReport GridBuilder::buildAt(
    engine::GridState& state,
    int anchor_index,
    Price reference_price,
    double base_amount,
    const risk::GuardDecision& decision,
    const risk::GuardConfig& guards,
    Timestamp now)
{
    BuildReport report;
    if (!decision.allowed) {
        report.blocked = true;
        report.block_reason = decision.reason;
        report.block_detail = decision.detail;
        return report;
    }

    try {
        if (reference_price <= 0.0) {
            reference_price = venue_.getTick(params_.symbol).mid();
        }

        const auto plans = planLayers(params_, anchor_index, reference_price, base_amount);
        const PatternSignal signal = detector_.detect(state.ordersWithStatus(GridOrderStatus::FILLED));
        if (signal.detected()) {
            LOG_INFO("pattern: buy streak {}, sell streak {} -> skip buy L1 {}, skip sell L1 {}",
                     signal.buy_streak, signal.sell_streak,
                     signal.suppress_next_buy, signal.suppress_next_sell);
        }

        // 제출 대상 선별
        std::vector<LayerPlan> candidates;
        for (const auto& plan : plans) {
            if (state.isLayerLive(plan.key)) {
                ++report.already_live;
                continue;
            }
            if (plan.rung == 1) {
                const bool skip = (plan.key.side == OrderSide::BUY) ? signal.suppress_next_buy
                                                                    : signal.suppress_next_sell;
                if (skip) {
                    ++report.pattern_skipped;
                    continue;
                }
            }
            candidates.push_back(plan);
        }
        if (candidates.empty()) {
            return report;
        }

        // 총 노출 한도
        if (guards.max_total_exposure) {
            Volume additional = 0.0;
            for (const auto& plan : candidates) {
                additional += plan.volume;
            }
            risk::GuardDecision exposure = risk::GuardEvaluator::checkExposure(
                currentExposure(), additional, guards);
            if (!exposure.allowed) {
                report.blocked = true;
                report.block_reason = exposure.reason;
                report.block_detail = exposure.detail;
                LOG_WARN("grid build at {} blocked: {}", anchor_index, exposure.detail);
                return report;
            }
        }

        PendingOrderIndex pending(params_.duplicate_price_tolerance, params_.price_digits);
        for (auto& order : venue_.listPendingOrders(params_.symbol)) {
            if (order.magic == params_.magic) {
                pending.add(std::move(order));
            }
        }

        for (const auto& plan : candidates) {
            if (const VenueOrder* existing = pending.find(plan.key.side, plan.entry_price)) {
                ++report.duplicates;
                if (!state.isTrackedVenueId(existing->id)) {
                    GridOrder adopted;
                    adopted.key = plan.key;
                    adopted.venue_order_id = existing->id;
                    adopted.entry_price = existing->open_price;
                    adopted.target_price = existing->target_price > 0.0 ? existing->target_price
                                                                        : plan.target_price;
                    adopted.volume = existing->volume > 0.0 ? existing->volume : plan.volume;
                    adopted.status = GridOrderStatus::PLACED;
                    adopted.placed_at = now;
                    state.track(adopted);
                }
                LOG_DEBUG("{}: duplicate at {:.3f} (order {}), not resubmitted",
                          plan.key.label(), plan.entry_price, existing->id);
                continue;
            }

            ConditionalOrderRequest request;
            request.symbol = params_.symbol;
            request.side = plan.key.side;
            request.price = plan.entry_price;
            request.target_price = plan.target_price;
            request.volume = plan.volume;
            request.tag = plan.key.label();
            request.magic = params_.magic;

            OrderResult result;
            try {
                result = venue_.placeConditionalOrder(request);
            } catch (const VenueUnavailableError& e) {
                ++report.venue_errors;
                LOG_ERROR("{}: venue unavailable while placing: {}", plan.key.label(), e.what());
                break;
            }

            if (!result.success || result.venue_order_id.empty()) {
                ++report.rejected;
                report.rejections.push_back({plan.key, result.retcode, result.message});
                LOG_WARN("{}: order rejected (retcode {}): {}",
                         plan.key.label(), result.retcode, result.message);
                continue;
            }

            GridOrder order;
            order.key = plan.key;
            order.venue_order_id = result.venue_order_id;
            order.entry_price = plan.entry_price;
            order.target_price = plan.target_price;
            order.volume = plan.volume;
            order.status = GridOrderStatus::PLACED;
            order.placed_at = now;
            state.track(order);
            report.new_orders.push_back(order);
            ++report.placed;

            // 같은 빌드 안에서의 중복 제출 방지
            VenueOrder placed;
            placed.id = order.venue_order_id;
            placed.side = order.key.side;
            placed.open_price = order.entry_price;
            placed.target_price = order.target_price;
            placed.volume = order.volume;
            placed.tag = request.tag;
            placed.magic = params_.magic;
            pending.add(placed);

            LOG_INFO("{}: placed {} stop {:.3f} -> tp {:.3f}, vol {:.2f} (id {})",
                     plan.key.label(), toString(plan.key.side),
                     order.entry_price, order.target_price, order.volume, order.venue_order_id);
        }
    } catch (const VenueUnavailableError& e) {
        ++report.venue_errors;
        LOG_ERROR("grid build at {} aborted: {}", anchor_index, e.what());
    }

    return report;
}

Volume GridBuilder::currentExposure() {
    Volume total = 0.0;
    for (const auto& position : venue_.listOpenPositions(params_.symbol)) {
        if (position.magic == params_.magic) {
            total += position.volume;
        }
    }
    return total;
}

} // namespace strategy
} // namespace gridcycle
