#ifndef COMMANDQUEUE_HPP
#define COMMANDQUEUE_HPP

#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

#include "Command.hpp"

// Bounded hand-off between producers (UDP listener, button callback) and the
// control loop. When full the oldest pending command is dropped.
class CommandQueue {
public:
    explicit CommandQueue(std::size_t capacity = COMMAND_QUEUE_CAPACITY);

    // Returns false if an older command was dropped to make room
    bool push(const Command& cmd);
    // Everything pending, oldest first; the queue is left empty
    std::vector<Command> drain();

    std::size_t size() const;
    uint64_t dropped() const;

private:
    mutable std::mutex mutex_;
    std::deque<Command> pending_;
    std::size_t capacity_;
    uint64_t dropped_ = 0;
};

#endif // COMMANDQUEUE_HPP
