#include <atomic>
#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <pigpio.h>
#include <pthread.h>
#include <sched.h>
#include <string>
#include <sys/syslog.h>
#include <thread>

#include "actuators/GpioActuators.hpp"
#include "common/Pins.hpp"
#include "control/CommandQueue.hpp"
#include "control/ParkingController.hpp"
#include "display/ConsoleDisplay.hpp"
#include "sensors/Bh1750.hpp"
#include "sensors/GateButton.hpp"
#include "sensors/IrSensor.hpp"
#include "sensors/Mq2Sensor.hpp"
#include "sensors/Ultrasonic.hpp"
#include "threads/CommandListener.hpp"
#include "threads/ControlService.hpp"
#include "threads/UDPSender.hpp"

#define DEFAULT_DEST_IP     "127.0.0.1"
#define DEFAULT_DEST_PORT   5005
#define DEFAULT_LISTEN_PORT 5006

std::atomic<bool> terminateProgram{false};

void signalHandler(int signum) {
    if (signum == SIGINT || signum == SIGTERM) {
        terminateProgram = true;
    }
}

bool setupThread(pthread_t& thread, void* (*func)(void*), void* arg, int priority) {
    pthread_attr_t attr;
    struct sched_param param;

    pthread_attr_init(&attr);
    pthread_attr_setinheritsched(&attr, PTHREAD_EXPLICIT_SCHED);
    pthread_attr_setschedpolicy(&attr, SCHED_FIFO);

    param.sched_priority = priority;
    pthread_attr_setschedparam(&attr, &param);

    int ret = pthread_create(&thread, &attr, func, arg);
    pthread_attr_destroy(&attr);

    if (ret == EPERM) {
        // Not allowed to use SCHED_FIFO, run with default scheduling
        std::cerr << "SCHED_FIFO not permitted, using default scheduling\n";
        syslog(LOG_WARNING, "SCHED_FIFO not permitted for priority %d", priority);
        ret = pthread_create(&thread, nullptr, func, arg);
    }
    if (ret != 0) {
        std::cerr << "Thread creation failed: " << std::strerror(ret) << std::endl;
        syslog(LOG_ERR, "Thread creation failed: %s", std::strerror(ret));
        return false;
    }
    return true;
}

static uint16_t parsePort(const char* text, uint16_t fallback) {
    int port = std::atoi(text);
    if (port <= 0 || port > 65535) {
        std::fprintf(stderr, "Invalid port '%s'. Using default %u.\n", text, static_cast<unsigned>(fallback));
        return fallback;
    }
    return static_cast<uint16_t>(port);
}

// Owns every pigpio device; all of them are released before gpioTerminate()
static int runBay(const std::string& dest_ip, uint16_t dest_port, uint16_t listen_port) {
    IrSensor ir_entrance(PIN_IR_ENTRANCE);
    IrSensor ir_exit(PIN_IR_EXIT);
    UltrasonicSensor ultrasonic(PIN_ULTRASONIC_TRIG, PIN_ULTRASONIC_ECHO);
    Mq2Sensor mq2(I2C_BUS, ADS1115_ADDRESS);
    Bh1750 bh1750(I2C_BUS, BH1750_ADDRESS);

    ServoGate servo(PIN_SERVO);
    TrafficLight traffic_light(PIN_TRAFFIC_RED, PIN_TRAFFIC_YELLOW, PIN_TRAFFIC_GREEN);
    BayIndicators indicators({PIN_SPOT_RED, PIN_SPOT_GREEN, PIN_BUZZER, PIN_PARKING_LIGHT, PIN_ALARM_LED});

    ir_entrance.setup();
    ir_exit.setup();
    ultrasonic.setup();
    servo.setup();
    traffic_light.setup();
    indicators.setup();
    std::cout << "[Main] GPIO initialized\n";

    // A missing I2C sensor degrades to held readings, it does not stop the bay
    if (!mq2.init()) {
        syslog(LOG_ERR, "MQ-2 ADC init failed, gas readings will hold");
    } else {
        std::cout << "[Main] ADS1115 ready\n";
    }
    if (!bh1750.init()) {
        syslog(LOG_ERR, "BH1750 init failed, lux readings will hold");
    } else {
        std::cout << "[Main] BH1750 ready\n";
    }

    UdpTelemetry telemetry;
    if (!telemetry.open(dest_ip, dest_port)) {
        return 1;
    }
    ConsoleDisplay display;

    CommandQueue queue;
    GateButton button(PIN_GATE_BUTTON, queue);
    if (!button.setup()) {
        syslog(LOG_ERR, "Gate button setup failed");
    }

    ParkingIo io{ultrasonic, ir_entrance, ir_exit, mq2, bh1750,
                 servo, traffic_light, indicators, telemetry, display};
    ParkingController controller(io, queue);

    std::atomic<bool> running{true};
    ControlServiceArgs control_args{&controller, &running};
    CommandListenerArgs listener_args{&queue, listen_port, &running};

    int max_priority = sched_get_priority_max(SCHED_FIFO);
    pthread_t control_thread, listener_thread;

    if (!setupThread(control_thread, ControlServiceThread, &control_args, max_priority - 1)) {
        return 1;
    }
    if (!setupThread(listener_thread, CommandListenerThread, &listener_args, max_priority - 20)) {
        running = false;
        pthread_join(control_thread, nullptr);
        return 1;
    }

    std::printf("Smart parking running. Telemetry -> %s:%u, commands on port %u\n",
                dest_ip.c_str(), static_cast<unsigned>(dest_port), static_cast<unsigned>(listen_port));

    while (!terminateProgram && running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::printf("\nTerminating services...\n");
    running = false;
    pthread_join(control_thread, nullptr);
    pthread_join(listener_thread, nullptr);

    // Leave the bay in a safe, quiet state
    indicators.allOff();
    traffic_light.setSignal(true, false, false);
    return 0;
}

int main(int argc, char* argv[]) {
    std::string dest_ip = DEFAULT_DEST_IP;
    uint16_t dest_port = DEFAULT_DEST_PORT;
    uint16_t listen_port = DEFAULT_LISTEN_PORT;

    if (argc > 1) dest_ip = argv[1];
    if (argc > 2) dest_port = parsePort(argv[2], DEFAULT_DEST_PORT);
    if (argc > 3) listen_port = parsePort(argv[3], DEFAULT_LISTEN_PORT);

    struct sigaction sa;
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    openlog("smart_parking", LOG_PID | LOG_CONS, LOG_USER);
    syslog(LOG_INFO, "Starting smart parking bay controller");

    // Block the timer signal before pigpio spawns its threads so every
    // thread inherits the mask; only sigwaitinfo in the control thread takes it
    sigset_t timer_mask;
    sigemptyset(&timer_mask);
    sigaddset(&timer_mask, CONTROL_TIMER_SIGNAL);
    pthread_sigmask(SIG_BLOCK, &timer_mask, nullptr);

    // We handle SIGINT/SIGTERM ourselves
    gpioCfgSetInternals(gpioCfgGetInternals() | PI_CFG_NOSIGHANDLER);
    if (gpioInitialise() < 0) {
        std::cerr << "pigpio initialization failed!" << std::endl;
        syslog(LOG_ERR, "pigpio initialization failed");
        closelog();
        return 1;
    }

    int rc = runBay(dest_ip, dest_port, listen_port);
    gpioTerminate();

    syslog(LOG_INFO, "Smart parking bay controller stopped");
    closelog();
    return rc;
}
