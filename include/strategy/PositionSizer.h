#pragma once

#include "common/Types.h"
#include <string>
#include <vector>

namespace gridcycle {
namespace strategy {

// abs(layerIndex) 로 인덱싱되는 배수표. table[0] >= 1.
using ScalingTable = std::vector<double>;

// abs(layer_index) 가 표 길이를 넘을 때
enum class TableOverflow {
    LAST_MULTIPLIER,   // 마지막 배수 유지 (abs(index) 에 대해 단조)
    BASE_AMOUNT        // 기본 수량으로 돌아감
};

const char* toString(TableOverflow overflow);
TableOverflow parseTableOverflow(const std::string& name);

class PositionSizer {
public:
    // volume = base_amount * table[min(abs(layer_index), len - 1)]
    // BASE_AMOUNT 이면 표 밖 레이어는 base_amount 그대로.
    // base_amount <= 0 이거나 표가 잘못되면 InvalidConfigurationError
    static Volume size(double base_amount, const ScalingTable& table, int layer_index,
                       TableOverflow overflow = TableOverflow::LAST_MULTIPLIER);

    static void validateTable(const ScalingTable& table);
};

} // namespace strategy
} // namespace gridcycle
