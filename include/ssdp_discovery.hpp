#ifndef DLNA_REMOTE_SSDP_DISCOVERY_HPP
#define DLNA_REMOTE_SSDP_DISCOVERY_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "transport.hpp"
#include "upnp_device.hpp"

namespace discovery
{

struct discover_options
{
    std::string name;                                 /// keep only devices whose name contains this
    std::chrono::milliseconds timeout {1000};
    std::string st {"ssdp:all"};
    unsigned mx = 3;
};

struct datagram
{
    std::string payload;
    std::string sender;
};

// Where the answers to a search request come from
class response_source
{
public:
    virtual ~response_source() = default;

    /**
     * Waits at most slice for the next answer.
     * Returns std::nullopt if nothing arrived and throws std::runtime_error if the
     * underlying socket reports an error.
     */
    virtual std::optional<datagram> wait(std::chrono::milliseconds slice) = 0;
};

class socket_source : public response_source
{
public:

    socket_source() = delete;
    socket_source(const socket_source&) = delete;
    socket_source& operator=(const socket_source&) = delete;

    explicit socket_source(transport::udp_socket&& sock)
        : m_sock {std::move(sock)}
    {}

    std::optional<datagram> wait(std::chrono::milliseconds slice) override;

private:

    transport::udp_socket m_sock;

};

std::string msearch_request(const std::string& st, unsigned mx);

/**
 * Converts a timeout given in (fractional) seconds, rounding up to whole milliseconds.
 * Throws std::invalid_argument for trailing characters, negative, non finite values
 * and values above MAX_DISCOVERY_TIMEOUT seconds.
 */
std::chrono::milliseconds parse_timeout(const std::string& seconds);

/**
 * Collects devices from the source until the timeout has passed. The source is
 * waited on at least once and the timeout is checked between two waits, so the
 * call may take up to one slice longer.
 */
std::vector<upnp::upnp_device> collect(response_source& source, const discover_options& options,
    const upnp::description_fetcher& fetch = transport::http_get,
    const transport::sender_ptr& sender = std::make_shared<transport::tcp_sender>());

std::vector<upnp::upnp_device> discover(const discover_options& options = {});

} // namespace discovery

#endif
