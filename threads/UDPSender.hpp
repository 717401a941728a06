#ifndef UDPSENDER_HPP
#define UDPSENDER_HPP

#include <cstdint>
#include <netinet/in.h>
#include <string>

#include "../common/Capabilities.hpp"

// Telemetry over UDP, one "<topic> <payload>" datagram per message
class UdpTelemetry : public TelemetrySink {
public:
    UdpTelemetry() = default;
    ~UdpTelemetry() override;
    UdpTelemetry(const UdpTelemetry&) = delete;
    UdpTelemetry& operator=(const UdpTelemetry&) = delete;

    bool open(const std::string& dest_ip, uint16_t dest_port);
    void publish(const std::string& topic, const std::string& payload) override;

private:
    int sock_ = -1;
    struct sockaddr_in dest_addr_{};
};

#endif // UDPSENDER_HPP
