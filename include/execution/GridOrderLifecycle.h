#pragma once

#include <string>

#include "common/Types.h"

namespace gridcycle {
namespace execution {

struct GridOrderTransitionResult {
    GridOrderStatus status = GridOrderStatus::UNPLACED;
    bool changed = false;
    bool terminal = false;
};

// unplaced -> placed -> filled -> closed. 역방향 이벤트는 무시된다.
class GridOrderLifecycle {
public:
    static GridOrderTransitionResult transition(const std::string& event, GridOrderStatus current);
};

} // namespace execution
} // namespace gridcycle
