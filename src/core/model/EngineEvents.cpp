#include "core/model/EngineEvents.h"

#include <utility>

namespace gridcycle {
namespace core {

namespace {
const std::pair<JournalEventType, const char*> kEventNames[] = {
    {JournalEventType::ORDER_PLACED, "ORDER_PLACED"},
    {JournalEventType::ORDER_REJECTED, "ORDER_REJECTED"},
    {JournalEventType::ORDER_FILLED, "ORDER_FILLED"},
    {JournalEventType::POSITION_CLOSED, "POSITION_CLOSED"},
    {JournalEventType::CYCLE_TARGET_REACHED, "CYCLE_TARGET_REACHED"},
    {JournalEventType::GUARD_BLOCKED, "GUARD_BLOCKED"},
    {JournalEventType::EMERGENCY_STOP, "EMERGENCY_STOP"},
    {JournalEventType::VENUE_UNAVAILABLE, "VENUE_UNAVAILABLE"},
    {JournalEventType::STATE_CHANGED, "STATE_CHANGED"},
};
}

const char* toString(JournalEventType type) {
    for (const auto& [value, name] : kEventNames) {
        if (value == type) {
            return name;
        }
    }
    return "STATE_CHANGED";
}

JournalEventType parseJournalEventType(const std::string& name) {
    for (const auto& [value, text] : kEventNames) {
        if (name == text) {
            return value;
        }
    }
    return JournalEventType::STATE_CHANGED;
}

} // namespace core
} // namespace gridcycle
