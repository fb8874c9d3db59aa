#include "ssdp_discovery.hpp"

#include "fmt/format.h"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <stdexcept>
#include <sys/select.h>

namespace discovery
{

std::optional<datagram> socket_source::wait(std::chrono::milliseconds slice)
{
    const int fd = m_sock.get();

    fd_set readable;
    fd_set failed;
    FD_ZERO(&readable);
    FD_ZERO(&failed);
    FD_SET(fd, &readable);
    FD_SET(fd, &failed);

    timeval tv;
    tv.tv_sec = slice.count() / 1000;
    tv.tv_usec = (slice.count() % 1000) * 1000;

    int ret = ::select(fd + 1, &readable, nullptr, &failed, &tv);
    if(ret < 0)
        throw std::runtime_error {fmt::format("Getting response failed: {}", std::strerror(errno))};
    if(FD_ISSET(fd, &failed))
        throw std::runtime_error {"Getting response failed"};
    if(ret == 0 || !FD_ISSET(fd, &readable))
        return std::nullopt;

    auto [buffer, peer] = m_sock.read<char>(MAX_RESPONSE_SIZE);
    return datagram {std::string {buffer.data(), buffer.size()}, peer.addr};
}

std::string msearch_request(const std::string& st, unsigned mx)
{
    return fmt::format(
        "M-SEARCH * HTTP/1.1\r\n"
        "HOST: {}:{}\r\n"
        "Accept: */*\r\n"
        "MAN: \"ssdp:discover\"\r\n"
        "ST: {}\r\n"
        "MX: {}\r\n"
        "\r\n",
        DISCOVERY_IP, DISCOVERY_PORT, st, mx);
}

std::chrono::milliseconds parse_timeout(const std::string& seconds)
{
    size_t parsed = 0;
    double value;
    try {
        value = std::stod(seconds, &parsed);
    } catch(std::exception&) {
        throw std::invalid_argument {"Invalid timeout: " + seconds};
    }

    if(parsed != seconds.size() || !std::isfinite(value) || value < 0 || value > MAX_DISCOVERY_TIMEOUT)
        throw std::invalid_argument {"Invalid timeout: " + seconds};

    return std::chrono::ceil<std::chrono::milliseconds>(std::chrono::duration<double> {value});
}

std::vector<upnp::upnp_device> collect(response_source& source, const discover_options& options,
    const upnp::description_fetcher& fetch, const transport::sender_ptr& sender)
{
    using namespace std::chrono;

    std::vector<upnp::upnp_device> devices;
    const auto start = steady_clock::now();

    do
    {
        std::optional<datagram> answer = source.wait(milliseconds {DISCOVERY_SLICE});
        if(!answer)
            continue;

        upnp::device_result res = upnp::upnp_device::from_response(answer->payload, answer->sender, fetch, sender);
        if(res.error)
            fmt::print("{} (device {}, location '{}')\n", *res.error, res.device.ip(), res.device.location());

        // Devices usually answer more than once
        if(std::find(devices.begin(), devices.end(), res.device) != devices.end())
            continue;

        if(options.name.empty() || res.device.name().find(options.name) != std::string::npos)
            devices.push_back(std::move(res.device));
    } while(steady_clock::now() - start <= options.timeout);

    return devices;
}

std::vector<upnp::upnp_device> discover(const discover_options& options)
{
    transport::udp_socket sock = transport::send_multicast(
        transport::endpoint {DISCOVERY_IP, DISCOVERY_PORT},
        msearch_request(options.st, options.mx));

    socket_source source {std::move(sock)};
    return collect(source, options);
}

} // namespace discovery
