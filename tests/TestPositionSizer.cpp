#include "strategy/PositionSizer.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <iostream>

using gridcycle::InvalidConfigurationError;
using gridcycle::strategy::PositionSizer;
using gridcycle::strategy::ScalingTable;

namespace {
bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

template <typename Fn>
bool throwsInvalid(Fn fn) {
    try {
        fn();
    } catch (const InvalidConfigurationError&) {
        return true;
    }
    return false;
}
}

int main() {
    // base 0.1, [1,1,2,2,3]
    {
        const ScalingTable table{1, 1, 2, 2, 3};
        assert(near(PositionSizer::size(0.1, table, 0), 0.1));
        assert(near(PositionSizer::size(0.1, table, 1), 0.1));
        assert(near(PositionSizer::size(0.1, table, 2), 0.2));
        assert(near(PositionSizer::size(0.1, table, -2), 0.2));
        assert(near(PositionSizer::size(0.1, table, 4), 0.3));
        // 표 길이를 넘으면 마지막 배수
        assert(near(PositionSizer::size(0.1, table, 9), 0.3));
        assert(near(PositionSizer::size(0.1, table, -40), 0.3));
    }

    // 표 밖 레이어를 기본 수량으로 돌리는 옵션
    {
        using gridcycle::strategy::TableOverflow;
        const ScalingTable table{1, 1, 2, 2, 3};
        assert(near(PositionSizer::size(0.1, table, 4, TableOverflow::BASE_AMOUNT), 0.3));
        assert(near(PositionSizer::size(0.1, table, 5, TableOverflow::BASE_AMOUNT), 0.1));
        assert(near(PositionSizer::size(0.1, table, -7, TableOverflow::BASE_AMOUNT), 0.1));
        assert(gridcycle::strategy::parseTableOverflow("base") == TableOverflow::BASE_AMOUNT);
        assert(gridcycle::strategy::parseTableOverflow("last_multiplier") == TableOverflow::LAST_MULTIPLIER);
        assert(throwsInvalid([] { gridcycle::strategy::parseTableOverflow("wrap"); }));
    }

    // 비감소 표 -> abs(index) 에 대해 단조
    {
        const ScalingTable table{1, 1, 2, 2, 3, 3, 5, 5, 8, 8, 13, 13, 13, 13, 13};
        double previous = 0.0;
        for (int i = 0; i < 25; ++i) {
            const double v = PositionSizer::size(0.1, table, i);
            assert(v > 0.0);
            assert(v >= previous);
            assert(near(v, PositionSizer::size(0.1, table, -i)));
            previous = v;
        }
    }

    // 잘못된 입력
    {
        const ScalingTable table{1, 2};
        assert(throwsInvalid([&] { PositionSizer::size(0.0, table, 0); }));
        assert(throwsInvalid([&] { PositionSizer::size(-0.1, table, 1); }));
        assert(throwsInvalid([&] { PositionSizer::size(0.1, ScalingTable{}, 0); }));
        assert(throwsInvalid([&] { PositionSizer::size(0.1, ScalingTable{0.5, 1}, 0); }));
        assert(throwsInvalid([&] { PositionSizer::size(0.1, ScalingTable{1, 0}, 0); }));
        assert(throwsInvalid([&] { PositionSizer::validateTable(ScalingTable{1, -2}); }));
    }

    std::cout << "[TEST] PositionSizer PASSED\n";
    return 0;
}
