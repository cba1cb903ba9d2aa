/**
 * @file EventSink.hpp
 * @brief Frame result delivery boundary
 *
 * @copyright 2025 MasterHand Project
 * @license MIT License
 */

#ifndef MASTERHAND_IO_EVENT_SINK_HPP
#define MASTERHAND_IO_EVENT_SINK_HPP

#include <cstdint>
#include <memory>
#include <string>
#include "masterhand/core/types.hpp"

namespace masterhand {
namespace io {

/**
 * @brief Receives one serialized payload per non-empty frame
 */
class EventSink {
public:
    virtual ~EventSink() = default;

    /**
     * @brief Forward one payload
     * @throws core::NetworkException (or another core::Exception) on delivery failure
     */
    virtual void publish(const std::string& payload) = 0;
};

/**
 * @brief Sends each payload as a single UDP datagram
 *
 * The socket is owned by the sink and closed on destruction.
 */
class UdpEventSink : public EventSink {
public:
    static constexpr const char* DEFAULT_HOST = "127.0.0.1";
    static constexpr uint16_t DEFAULT_PORT = 5005;

    UdpEventSink(const std::string& host = DEFAULT_HOST, uint16_t port = DEFAULT_PORT);
    ~UdpEventSink() override;

    UdpEventSink(const UdpEventSink&) = delete;
    UdpEventSink& operator=(const UdpEventSink&) = delete;

    /**
     * @brief Create the socket and resolve the destination
     * @return SUCCESS, ERROR_INVALID_PARAMETER for a bad address, ERROR_NETWORK otherwise
     */
    core::ResultCode open();

    bool is_open() const { return socket_fd_ >= 0; }

    void close();

    /**
     * @throws core::NetworkException if the sink is not open or sendto() fails
     */
    void publish(const std::string& payload) override;

    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }

private:
    std::string host_;
    uint16_t port_;
    int socket_fd_ = -1;

    struct Destination;
    std::unique_ptr<Destination> destination_;
};

} // namespace io
} // namespace masterhand

#endif // MASTERHAND_IO_EVENT_SINK_HPP
