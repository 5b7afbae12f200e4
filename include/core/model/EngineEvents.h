#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace gridcycle {
namespace core {

enum class JournalEventType {
    ORDER_PLACED,
    ORDER_REJECTED,
    ORDER_FILLED,
    POSITION_CLOSED,
    CYCLE_TARGET_REACHED,
    GUARD_BLOCKED,
    EMERGENCY_STOP,
    VENUE_UNAVAILABLE,
    STATE_CHANGED
};

// 저널에 기록되는 이름 (예: "ORDER_FILLED"). 모르는 이름은 STATE_CHANGED
const char* toString(JournalEventType type);
JournalEventType parseJournalEventType(const std::string& name);

struct JournalEvent {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    JournalEventType type = JournalEventType::STATE_CHANGED;
    std::string symbol;
    std::string entity_id;
    nlohmann::json payload;
};

} // namespace core
} // namespace gridcycle
