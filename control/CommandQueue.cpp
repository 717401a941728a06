#include "CommandQueue.hpp"

#include <sys/syslog.h>

CommandQueue::CommandQueue(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

bool CommandQueue::push(const Command& cmd) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool room = pending_.size() < capacity_;
    if (!room) {
        syslog(LOG_WARNING, "Command queue full, dropping %s", commandName(pending_.front().type));
        pending_.pop_front();
        ++dropped_;
    }
    pending_.push_back(cmd);
    return room;
}

std::vector<Command> CommandQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Command> out(pending_.begin(), pending_.end());
    pending_.clear();
    return out;
}

std::size_t CommandQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

uint64_t CommandQueue::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}
