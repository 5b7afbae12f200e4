#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>

#include "core/contracts/IEventJournal.h"

namespace gridcycle {
namespace core {

// 한 줄에 이벤트 하나 (JSON Lines), append-only.
// 재시작 시 파일의 마지막 seq 부터 이어서 기록한다.
class EventJournalJsonl : public IEventJournal {
public:
    explicit EventJournalJsonl(std::filesystem::path file_path);

    bool append(const JournalEvent& event) override;
    std::vector<JournalEvent> readFrom(std::uint64_t seq_inclusive) override;
    std::uint64_t lastSeq() const override;

    const std::filesystem::path& path() const { return file_path_; }

private:
    static nlohmann::json toLine(const JournalEvent& event, std::uint64_t seq);
    static JournalEvent fromLine(const nlohmann::json& line);

    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
    int skipped_lines_ = 0;
};

} // namespace core
} // namespace gridcycle
