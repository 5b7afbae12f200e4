#include "execution/GridOrderLifecycle.h"

#include <algorithm>
#include <cctype>

namespace gridcycle {
namespace execution {

namespace {
std::string normalizeEvent(std::string event) {
    std::transform(event.begin(), event.end(), event.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return event;
}

int rank(GridOrderStatus status) {
    switch (status) {
        case GridOrderStatus::UNPLACED: return 0;
        case GridOrderStatus::PLACED: return 1;
        case GridOrderStatus::FILLED: return 2;
        case GridOrderStatus::CLOSED: return 3;
    }
    return 0;
}
} // namespace

GridOrderTransitionResult GridOrderLifecycle::transition(const std::string& event, GridOrderStatus current) {
    GridOrderTransitionResult result;
    result.status = current;
    result.terminal = (current == GridOrderStatus::CLOSED);

    const std::string normalized_event = normalizeEvent(event);

    GridOrderStatus target = current;
    if (normalized_event == "placed" || normalized_event == "submitted" || normalized_event == "pending") {
        target = GridOrderStatus::PLACED;
    } else if (normalized_event == "filled" || normalized_event == "in" || normalized_event == "triggered") {
        target = GridOrderStatus::FILLED;
    } else if (normalized_event == "closed" || normalized_event == "out" || normalized_event == "tp") {
        target = GridOrderStatus::CLOSED;
    } else {
        return result;
    }

    // 체결 전 청산은 불가. placed 에서 closed 로 바로 가지 않는다.
    if (target == GridOrderStatus::CLOSED && current != GridOrderStatus::FILLED) {
        return result;
    }
    if (rank(target) <= rank(current)) {
        return result;
    }

    result.status = target;
    result.changed = true;
    result.terminal = (target == GridOrderStatus::CLOSED);
    return result;
}

} // namespace execution
} // namespace gridcycle
