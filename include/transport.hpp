#ifndef DLNA_REMOTE_TRANSPORT_HPP
#define DLNA_REMOTE_TRANSPORT_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "socketwrapper.hpp"

namespace transport
{

using udp_socket = net::udp_socket<net::ip_version::v4>;

struct endpoint
{
    std::string host;
    uint16_t port;
};

// Sends payload once to the group and hands the socket to the caller, who reads the
// answers from it. The socket is closed when the returned object goes out of scope.
udp_socket send_multicast(const endpoint& group, std::string payload);

// Connects, writes the whole payload and closes the connection again.
// Connection or write errors are thrown as std::runtime_error, nothing is retried.
void send_unicast(const endpoint& to, std::string payload);

// Blocking GET of an http:// url, returns the response body
std::string http_get(const std::string& location);

class unicast_sender
{
public:
    virtual ~unicast_sender() = default;

    virtual void send(const endpoint& to, const std::string& payload) = 0;
};

class tcp_sender : public unicast_sender
{
public:
    void send(const endpoint& to, const std::string& payload) override
    {
        send_unicast(to, payload);
    }
};

using sender_ptr = std::shared_ptr<unicast_sender>;

} // namespace transport

#endif
