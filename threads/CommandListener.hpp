#ifndef COMMANDLISTENER_HPP
#define COMMANDLISTENER_HPP

#include <atomic>
#include <cstdint>

class CommandQueue;

struct CommandListenerArgs {
    CommandQueue* queue;
    uint16_t port;
    std::atomic<bool>* running;
};

// Receives command datagrams and queues the ones that parse
void* CommandListenerThread(void* arg);

#endif // COMMANDLISTENER_HPP
