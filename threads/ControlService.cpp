#include "ControlService.hpp"
#include "../common/ParkingConfig.hpp"
#include "../control/ParkingController.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <limits>
#include <pthread.h>
#include <signal.h>
#include <sys/syslog.h>
#include <time.h>

#define WCET_REPORT_TICKS 1000

static uint64_t monotonicMs() {
    timespec ts{};
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<uint64_t>(ts.tv_sec) * 1000ULL + static_cast<uint64_t>(ts.tv_nsec) / 1000000ULL;
}

void* ControlServiceThread(void* arg) {
    auto* args = static_cast<ControlServiceArgs*>(arg);
    ParkingController& controller = *args->controller;

    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, CONTROL_TIMER_SIGNAL);
    pthread_sigmask(SIG_BLOCK, &mask, nullptr);

    timer_t timerid;
    struct sigevent sev{};
    sev.sigev_notify = SIGEV_SIGNAL;
    sev.sigev_signo = CONTROL_TIMER_SIGNAL;
    if (timer_create(CLOCK_MONOTONIC, &sev, &timerid) != 0) {
        perror("[CTRL] timer_create");
        syslog(LOG_ERR, "Control timer creation failed");
        args->running->store(false);
        pthread_exit(nullptr);
    }

    struct itimerspec its{};
    its.it_value.tv_nsec = CONTROL_TICK_MS * 1000000L;
    its.it_interval.tv_nsec = CONTROL_TICK_MS * 1000000L;
    if (timer_settime(timerid, 0, &its, nullptr) != 0) {
        perror("[CTRL] timer_settime");
        syslog(LOG_ERR, "Control timer start failed");
        timer_delete(timerid);
        args->running->store(false);
        pthread_exit(nullptr);
    }

    std::cout << "[CTRL] Control loop started, tick " << CONTROL_TICK_MS << " ms\n";

    // WCET tracking
    timespec start{}, end{};
    double min_time = std::numeric_limits<double>::max();
    double max_time = 0.0;
    double total_time = 0.0;
    uint64_t tick_count = 0;

    while (args->running->load()) {
        siginfo_t info;
        if (sigwaitinfo(&mask, &info) == -1) {
            perror("[CTRL] sigwaitinfo");
            continue;
        }

        clock_gettime(CLOCK_MONOTONIC, &start);
        controller.tick(monotonicMs());
        clock_gettime(CLOCK_MONOTONIC, &end);

        double exec_time = (end.tv_sec - start.tv_sec) * 1000.0 +
                           (end.tv_nsec - start.tv_nsec) / 1e6;
        min_time = std::min(min_time, exec_time);
        max_time = std::max(max_time, exec_time);
        total_time += exec_time;
        tick_count++;

        if (tick_count % WCET_REPORT_TICKS == 0) {
            std::cout << "[WCET] Avg: " << total_time / tick_count << " ms, Min: " << min_time
                      << " ms, Max: " << max_time << " ms, Jitter: " << max_time - min_time << " ms\n";
        }
    }

    timer_delete(timerid);
    std::cout << "[CTRL] Control loop stopped after " << tick_count << " ticks\n";
    pthread_exit(nullptr);
}
