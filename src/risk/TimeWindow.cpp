#include "risk/TimeWindow.h"
#include "common/Errors.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>

namespace gridcycle {
namespace risk {

namespace {
constexpr long long SECONDS_PER_DAY = 86400;
constexpr int MINUTES_PER_DAY = 1440;

long long floorDiv(long long a, long long b) {
    long long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

int parseClock(const std::string& text) {
    int hour = 0;
    int minute = 0;
    const auto colon = text.find(':');
    try {
        if (colon == std::string::npos) {
            hour = std::stoi(text);
        } else {
            hour = std::stoi(text.substr(0, colon));
            minute = std::stoi(text.substr(colon + 1));
        }
    } catch (const std::exception&) {
        throw InvalidConfigurationError("invalid clock value: '" + text + "'");
    }
    // 24:00 은 하루의 끝으로 허용
    if (hour < 0 || hour > 24 || minute < 0 || minute > 59 || (hour == 24 && minute != 0)) {
        throw InvalidConfigurationError("clock out of range: '" + text + "'");
    }
    return (hour * 60 + minute) % MINUTES_PER_DAY;
}

std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}
} // namespace

LocalClock toLocalClock(Timestamp now, int utc_offset_minutes) {
    const long long epoch_sec = std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()
    ).count() + static_cast<long long>(utc_offset_minutes) * 60;

    const long long days = floorDiv(epoch_sec, SECONDS_PER_DAY);
    const long long sec_of_day = epoch_sec - days * SECONDS_PER_DAY;

    LocalClock out;
    out.minute_of_day = static_cast<int>(sec_of_day / 60);
    // 1970-01-01 은 목요일(4)
    out.weekday = static_cast<int>(((days % 7) + 7 + 4) % 7);
    return out;
}

bool TimeWindow::contains(Timestamp now, int utc_offset_minutes) const {
    if (!enabled) {
        return false;
    }

    const LocalClock local = toLocalClock(now, utc_offset_minutes);
    const int m = local.minute_of_day;

    if (start_minute == end_minute) {
        return (weekday_mask & (1u << local.weekday)) != 0;
    }

    if (start_minute < end_minute) {
        if (m < start_minute || m >= end_minute) {
            return false;
        }
        return (weekday_mask & (1u << local.weekday)) != 0;
    }

    // 자정 넘김: 자정 이후 부분은 전날 요일 기준
    if (m >= start_minute) {
        return (weekday_mask & (1u << local.weekday)) != 0;
    }
    if (m < end_minute) {
        const int prev_day = (local.weekday + 6) % 7;
        return (weekday_mask & (1u << prev_day)) != 0;
    }
    return false;
}

std::string TimeWindow::describe() const {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02d:%02d-%02d:%02d",
                  start_minute / 60, start_minute % 60,
                  end_minute / 60, end_minute % 60);
    std::string out = name.empty() ? std::string(buf) : name + " " + buf;
    if (weekday_mask != ALL_DAYS) {
        static const char* names[] = {"sun", "mon", "tue", "wed", "thu", "fri", "sat"};
        out += " [";
        bool first = true;
        for (int d = 0; d < 7; ++d) {
            if (weekday_mask & (1u << d)) {
                if (!first) out += ",";
                out += names[d];
                first = false;
            }
        }
        out += "]";
    }
    if (!enabled) {
        out += " (disabled)";
    }
    return out;
}

TimeWindow TimeWindow::parse(const std::string& name, const std::string& range) {
    const std::string trimmed = trimCopy(range);
    const auto dash = trimmed.find('-');
    if (dash == std::string::npos) {
        throw InvalidConfigurationError("time window must be HH:MM-HH:MM, got '" + range + "'");
    }
    TimeWindow window;
    window.name = name;
    window.start_minute = parseClock(trimCopy(trimmed.substr(0, dash)));
    window.end_minute = parseClock(trimCopy(trimmed.substr(dash + 1)));
    return window;
}

std::uint8_t TimeWindow::parseWeekdays(const std::string& days) {
    static const char* names[] = {"sun", "mon", "tue", "wed", "thu", "fri", "sat"};

    std::uint8_t mask = 0;
    std::stringstream ss(days);
    std::string token;
    while (std::getline(ss, token, ',')) {
        token = trimCopy(token);
        std::transform(token.begin(), token.end(), token.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (token.empty()) continue;
        bool matched = false;
        for (int d = 0; d < 7; ++d) {
            if (token.compare(0, 3, names[d]) == 0) {
                mask |= static_cast<std::uint8_t>(1u << d);
                matched = true;
                break;
            }
        }
        if (!matched) {
            throw InvalidConfigurationError("unknown weekday '" + token + "'");
        }
    }
    return mask == 0 ? ALL_DAYS : mask;
}

} // namespace risk
} // namespace gridcycle
