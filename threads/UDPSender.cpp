#include "UDPSender.hpp"

#include <arpa/inet.h>
#include <iostream>
#include <sys/socket.h>
#include <sys/syslog.h>
#include <unistd.h>

UdpTelemetry::~UdpTelemetry() {
    if (sock_ >= 0) {
        close(sock_);
    }
}

bool UdpTelemetry::open(const std::string& dest_ip, uint16_t dest_port) {
    sock_ = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock_ < 0) {
        std::cerr << "UDP socket creation failed\n";
        syslog(LOG_ERR, "Telemetry socket creation failed");
        return false;
    }

    dest_addr_.sin_family = AF_INET;
    dest_addr_.sin_port = htons(dest_port);
    if (inet_pton(AF_INET, dest_ip.c_str(), &dest_addr_.sin_addr) != 1) {
        std::cerr << "Invalid telemetry destination " << dest_ip << "\n";
        syslog(LOG_ERR, "Invalid telemetry destination %s", dest_ip.c_str());
        close(sock_);
        sock_ = -1;
        return false;
    }

    std::cout << "[UDP] Telemetry to " << dest_ip << ":" << dest_port << "\n";
    return true;
}

void UdpTelemetry::publish(const std::string& topic, const std::string& payload) {
    if (sock_ < 0) {
        return;
    }
    std::string msg = topic + " " + payload;
    ssize_t sent = sendto(sock_, msg.c_str(), msg.size(), MSG_DONTWAIT,
                          reinterpret_cast<struct sockaddr*>(&dest_addr_), sizeof(dest_addr_));
    if (sent < 0) {
        syslog(LOG_WARNING, "Telemetry send failed for %s", topic.c_str());
        return;
    }
    std::cout << "[UDP] Sent: " << msg << std::endl;
}
