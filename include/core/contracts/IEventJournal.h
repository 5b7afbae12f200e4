#pragma once

#include <cstdint>
#include <vector>

#include "core/model/EngineEvents.h"

namespace gridcycle {
namespace core {

// 알림 채널 쪽으로 나가는 이벤트 스트림
class IEventJournal {
public:
    virtual ~IEventJournal() = default;

    virtual bool append(const JournalEvent& event) = 0;
    virtual std::vector<JournalEvent> readFrom(std::uint64_t seq_inclusive) = 0;
    virtual std::uint64_t lastSeq() const = 0;
};

} // namespace core
} // namespace gridcycle
