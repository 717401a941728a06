#include "CommandListener.hpp"
#include "../control/CommandQueue.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstdio>
#include <iostream>
#include <pthread.h>
#include <string>
#include <sys/socket.h>
#include <sys/syslog.h>
#include <unistd.h>

#define RECV_TIMEOUT_MS 500
#define MAX_DATAGRAM    512

void* CommandListenerThread(void* arg) {
    auto* args = static_cast<CommandListenerArgs*>(arg);

    int sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock < 0) {
        std::cerr << "[CMD] socket creation failed\n";
        syslog(LOG_ERR, "Command socket creation failed");
        pthread_exit(nullptr);
    }

    // Bounded wait so the running flag is seen on shutdown
    struct timeval tv{};
    tv.tv_sec = 0;
    tv.tv_usec = RECV_TIMEOUT_MS * 1000;
    setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(args->port);
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    if (bind(sock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        perror("[CMD] bind");
        syslog(LOG_ERR, "Command socket bind to port %u failed", static_cast<unsigned>(args->port));
        close(sock);
        pthread_exit(nullptr);
    }

    std::cout << "[CMD] Listening on port " << args->port << "\n";

    char buf[MAX_DATAGRAM + 1];
    while (args->running->load()) {
        ssize_t len = recvfrom(sock, buf, MAX_DATAGRAM, 0, nullptr, nullptr);
        if (len < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                perror("[CMD] recvfrom");
            }
            continue;
        }
        buf[len] = '\0';
        std::string datagram(buf, static_cast<std::size_t>(len));

        if (isConfirmEcho(datagram)) {
            continue;
        }

        Command cmd;
        ParkStatus status = parseCommand(datagram, cmd);
        if (status != ParkStatus::Ok) {
            std::cout << "[CMD] Rejected: " << datagram << "\n";
            syslog(LOG_WARNING, "Command '%s' rejected: %s", datagram.c_str(), statusName(status));
            continue;
        }

        std::cout << "[CMD] Queued " << commandName(cmd.type) << "\n";
        args->queue->push(cmd);
    }

    close(sock);
    pthread_exit(nullptr);
}
