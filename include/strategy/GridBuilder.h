#pragma once

#include "common/Types.h"
#include "core/contracts/ITradingVenue.h"
#include "engine/GridState.h"
#include "risk/GuardConfig.h"
#include "risk/GuardEvaluator.h"
#include "strategy/PatternDetector.h"
#include "strategy/PositionSizer.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace gridcycle {
namespace strategy {

struct GridParameters {
    std::string symbol = "XAUUSDc";
    double delta_enter_price = 0.8;     // 1층 진입 간격
    double target_profit = 2.0;         // 익절 거리
    double percent_scale = 12.0;        // abs(index)% * scale 만큼 간격 확대
    ScalingTable scaling_table{1, 1, 2, 2, 3, 3, 5, 5, 8, 8, 13, 13, 13, 13, 13};
    TableOverflow table_overflow = TableOverflow::LAST_MULTIPLIER;
    long long magic = 234002;
    double duplicate_price_tolerance = 1e-4;
    int price_digits = 3;
    int volume_digits = 2;
};

// 한 레이어의 계산 결과 (주문 전)
struct LayerPlan {
    LayerKey key;
    int rung = 1;            // 1 = anchor 레이어, 2/3 = 바깥쪽
    Price entry_price = 0.0;
    Price target_price = 0.0;
    Volume volume = 0.0;
};

struct LayerRejection {
    LayerKey key;
    int retcode = 0;
    std::string message;
};

struct BuildReport {
    int placed = 0;
    int duplicates = 0;
    int rejected = 0;
    int venue_errors = 0;
    int pattern_skipped = 0;
    int already_live = 0;

    bool blocked = false;
    risk::GuardReason block_reason = risk::GuardReason::NONE;
    std::string block_detail;

    std::vector<GridOrder> new_orders;
    std::vector<LayerRejection> rejections;

    // 다음 틱에 다시 시도해야 하는지
    bool needsRetry() const { return blocked || rejected > 0 || venue_errors > 0; }
};

// (side, 가격 구간) 으로 찾는 대기 주문 색인. 구간 폭 = 중복 허용 오차
// (0 이면 가격 자릿수의 최소 단위), 이웃 구간까지 보고 오차 안인지 다시 확인한다.
class PendingOrderIndex {
public:
    PendingOrderIndex(double tolerance, int price_digits);

    void add(VenueOrder order);
    const VenueOrder* find(OrderSide side, Price price) const;
    std::size_t size() const { return orders_.size(); }

private:
    long long bucketOf(Price price) const;

    double tolerance_;
    double width_;
    std::multimap<std::pair<OrderSide, long long>, VenueOrder> orders_;
};

class GridBuilder {
public:
    GridBuilder(core::ITradingVenue& venue, GridParameters params, PatternDetector detector);

    // buy: anchor, anchor+1, anchor+2 / sell: anchor, anchor-1, anchor-2
    // 가격은 reference 기준 누적 간격으로 계산한다.
    // 반올림한 수량이 0 이 되는 레이어가 있으면 InvalidConfigurationError
    static std::vector<LayerPlan> planLayers(
        const GridParameters& params, int anchor_index, Price reference_price, double base_amount);

    // 표의 모든 배수에서 volume_digits 반올림 후 0 보다 큰 수량이 나오는지
    static bool yieldsTradableVolume(const GridParameters& params, double base_amount);

    // 차단된 decision 이면 주문 0건, 거래소 호출 없음.
    // reference_price <= 0 이면 현재 mid 가격 사용.
    BuildReport buildAt(
        engine::GridState& state,
        int anchor_index,
        Price reference_price,
        double base_amount,
        const risk::GuardDecision& decision,
        const risk::GuardConfig& guards,
        Timestamp now);

    const GridParameters& parameters() const { return params_; }
    const PatternDetector& detector() const { return detector_; }

private:
    static double spacingFactor(const GridParameters& params, int layer_index);
    static double roundTo(double value, int digits);

    Volume currentExposure();

    core::ITradingVenue& venue_;
    GridParameters params_;
    PatternDetector detector_;
};

} // namespace strategy
} // namespace gridcycle
