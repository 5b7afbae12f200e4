#include "core/state/EventJournalJsonl.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <fstream>

namespace gridcycle {
namespace core {

EventJournalJsonl::EventJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        try {
            const auto line = nlohmann::json::parse(row);
            last_seq_ = (std::max)(last_seq_, line.value("seq", static_cast<std::uint64_t>(0)));
        } catch (const nlohmann::json::exception&) {
            ++skipped_lines_;
        }
    }
    if (skipped_lines_ > 0) {
        LOG_WARN("journal {}: {} malformed line(s) ignored, resuming at seq {}",
                 file_path_.string(), skipped_lines_, last_seq_ + 1);
    }
}

bool EventJournalJsonl::append(const JournalEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string error;
    if (!utils::PathUtils::ensureParentDirectory(file_path_, &error)) {
        LOG_ERROR("journal: cannot create directory for {}: {}", file_path_.string(), error);
        return false;
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        LOG_ERROR("journal: cannot open {}", file_path_.string());
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    out << toLine(event, next_seq).dump() << "\n";
    out.flush();
    if (!out) {
        return false;
    }
    last_seq_ = next_seq;
    return true;
}

std::vector<JournalEvent> EventJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<JournalEvent> events;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return events;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        nlohmann::json line;
        try {
            line = nlohmann::json::parse(row);
        } catch (const nlohmann::json::exception&) {
            continue;   // 생성자에서 이미 경고
        }
        if (line.value("seq", static_cast<std::uint64_t>(0)) >= seq_inclusive) {
            events.push_back(fromLine(line));
        }
    }
    return events;
}

std::uint64_t EventJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

nlohmann::json EventJournalJsonl::toLine(const JournalEvent& event, std::uint64_t seq) {
    return nlohmann::json{
        {"seq", seq},
        {"ts_ms", event.ts_ms},
        {"type", toString(event.type)},
        {"symbol", event.symbol},
        {"entity_id", event.entity_id},
        {"payload", event.payload.is_null() ? nlohmann::json::object() : event.payload}
    };
}

JournalEvent EventJournalJsonl::fromLine(const nlohmann::json& line) {
    JournalEvent event;
    event.seq = line.value("seq", static_cast<std::uint64_t>(0));
    event.ts_ms = line.value("ts_ms", 0LL);
    event.type = parseJournalEventType(line.value("type", std::string("STATE_CHANGED")));
    event.symbol = line.value("symbol", std::string());
    event.entity_id = line.value("entity_id", std::string());
    event.payload = line.value("payload", nlohmann::json::object());
    return event;
}

} // namespace core
} // namespace gridcycle
