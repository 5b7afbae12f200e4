#include "engine/CommandQueue.h"

namespace gridcycle {
namespace engine {

const char* toString(CommandType type) {
    switch (type) {
        case CommandType::START: return "start";
        case CommandType::PAUSE: return "pause";
        case CommandType::STOP_AFTER_CYCLE: return "stop_after_cycle";
        case CommandType::SET_BASE_AMOUNT: return "set_base_amount";
        case CommandType::CLEAR_BASE_AMOUNT: return "clear_base_amount";
        case CommandType::SET_GUARD_THRESHOLD: return "set_guard_threshold";
        case CommandType::SET_BLACKOUT_WINDOW: return "set_blackout_window";
        case CommandType::CLEAR_BLACKOUT_WINDOWS: return "clear_blackout_windows";
        case CommandType::SET_QUIET_HOURS: return "set_quiet_hours";
        case CommandType::ACKNOWLEDGE_EMERGENCY_STOP: return "acknowledge_emergency_stop";
        case CommandType::WITHDRAWAL_COMPLETE: return "withdrawal_complete";
    }
    return "unknown";
}

void CommandQueue::push(Command command) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        commands_.push_back(std::move(command));
    }
    cv_.notify_one();
}

std::vector<Command> CommandQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Command> out(commands_.begin(), commands_.end());
    commands_.clear();
    return out;
}

bool CommandQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return commands_.empty();
}

bool CommandQueue::waitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !commands_.empty() || woken_; });
    woken_ = false;
    return !commands_.empty();
}

void CommandQueue::wake() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        woken_ = true;
    }
    cv_.notify_all();
}

} // namespace engine
} // namespace gridcycle
