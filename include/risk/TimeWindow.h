#pragma once

#include "common/Types.h"
#include <cstdint>
#include <string>
#include <utility>

namespace gridcycle {
namespace risk {

// 하루 중 시간 구간 + 요일 마스크. start == end 이면 해당 요일 전체.
// 자정을 넘는 구간(예: 22:00-02:00) 허용, end 는 미포함.
struct TimeWindow {
    static constexpr std::uint8_t ALL_DAYS = 0x7F;   // bit0 = 일요일

    std::string name;
    int start_minute = 0;
    int end_minute = 0;
    std::uint8_t weekday_mask = ALL_DAYS;
    bool enabled = true;

    TimeWindow() = default;
    TimeWindow(std::string n, int start_min, int end_min,
               std::uint8_t mask = ALL_DAYS, bool on = true)
        : name(std::move(n)), start_minute(start_min), end_minute(end_min)
        , weekday_mask(mask), enabled(on) {}

    bool contains(Timestamp now, int utc_offset_minutes) const;
    std::string describe() const;

    // "HH:MM-HH:MM" 또는 "HH-HH"
    static TimeWindow parse(const std::string& name, const std::string& range);
    // "mon,tue,sat" 형식 -> 마스크
    static std::uint8_t parseWeekdays(const std::string& days);
};

struct LocalClock {
    int minute_of_day = 0;
    int weekday = 0;    // 0 = 일요일
};

LocalClock toLocalClock(Timestamp now, int utc_offset_minutes);

} // namespace risk
} // namespace gridcycle
