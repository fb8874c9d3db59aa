#include "transport.hpp"

#include "http/request.hpp"
#include "http/response.hpp"
#include "http/url.hpp"
#include "config.hpp"

#include "fmt/format.h"

#include <array>
#include <stdexcept>

namespace transport
{

udp_socket send_multicast(const endpoint& group, std::string payload)
{
    // Port 0 lets the kernel pick a free port, the answers are sent back to it
    udp_socket sock {"0.0.0.0", 0};
    sock.send(group.host, group.port, payload);
    return sock;
}

void send_unicast(const endpoint& to, std::string payload)
{
    net::tcp_connection<net::ip_version::v4> conn {to.host, to.port};
    conn.send(net::span {payload.begin(), payload.end()});
}

std::string http_get(const std::string& location)
{
    http::url target = http::parse_url(location);

    http::request req {"GET", target.path};
    req.set_header("HOST", fmt::format("{}:{}", target.host, target.port));
    req.set_header("User-Agent", DLNA_REMOTE_USER_AGENT);
    req.set_header("Accept", "*/*");
    req.set_header("Connection", "close");
    std::string req_str = req.to_string();

    net::tcp_connection<net::ip_version::v4> conn {target.host, target.port};
    conn.send(net::span {req_str.begin(), req_str.end()});

    // Stop as soon as the announced body is complete, some devices keep the connection open
    std::string received;
    std::array<char, 4096> buffer;
    while(!http::response::complete(received))
    {
        size_t br = conn.read(net::span {buffer});
        if(br == 0)
            break;
        received.append(buffer.data(), br);
    }

    http::response res {received};
    if(!res.ok())
        throw std::runtime_error {fmt::format("GET {} failed: {} {}", location, res.get_code(), res.get_phrase())};

    return res.get_body();
}

} // namespace transport
