/**
 * @file UdpEventSink.cpp
 * @brief POSIX datagram sink
 */

#include "masterhand/io/EventSink.hpp"
#include "masterhand/core/exception.h"
#include "masterhand/core/Logger.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace masterhand {
namespace io {

struct UdpEventSink::Destination {
    sockaddr_in address{};
};

UdpEventSink::UdpEventSink(const std::string& host, uint16_t port)
    : host_(host)
    , port_(port) {
}

UdpEventSink::~UdpEventSink() {
    close();
}

core::ResultCode UdpEventSink::open() {
    close();

    auto destination = std::make_unique<Destination>();
    destination->address.sin_family = AF_INET;
    destination->address.sin_port = htons(port_);
    if (inet_pton(AF_INET, host_.c_str(), &destination->address.sin_addr) != 1) {
        MASTERHAND_LOG_ERROR("UdpEventSink: invalid IPv4 address '" + host_ + "'");
        return core::ResultCode::ERROR_INVALID_PARAMETER;
    }

    socket_fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (socket_fd_ < 0) {
        MASTERHAND_LOG_ERROR(std::string("UdpEventSink: socket() failed: ") + std::strerror(errno));
        return core::ResultCode::ERROR_NETWORK;
    }

    destination_ = std::move(destination);
    MASTERHAND_LOG_INFO("UdpEventSink: sending to " + host_ + ":" + std::to_string(port_));
    return core::ResultCode::SUCCESS;
}

void UdpEventSink::close() {
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
    destination_.reset();
}

void UdpEventSink::publish(const std::string& payload) {
    if (!is_open() || !destination_) {
        MASTERHAND_THROW(core::NetworkException, "UdpEventSink is not open");
    }

    const ssize_t sent = ::sendto(socket_fd_, payload.data(), payload.size(), 0,
                                  reinterpret_cast<const sockaddr*>(&destination_->address),
                                  sizeof(destination_->address));
    if (sent < 0) {
        MASTERHAND_THROW(core::NetworkException,
                         "sendto " + host_ + ":" + std::to_string(port_) + " failed: " + std::strerror(errno));
    }
    if (static_cast<size_t>(sent) != payload.size()) {
        MASTERHAND_THROW(core::NetworkException,
                         "Short datagram write (" + std::to_string(sent) + "/" +
                         std::to_string(payload.size()) + " bytes)");
    }
}

} // namespace io
} // namespace masterhand
