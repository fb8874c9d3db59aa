#include "http/url.hpp"

#include <charconv>
#include <stdexcept>

namespace http
{

url parse_url(std::string_view location)
{
    constexpr std::string_view scheme {"http://"};
    if(location.substr(0, scheme.size()) != scheme)
        throw std::invalid_argument {"Not an http url: " + std::string {location}};
    location.remove_prefix(scheme.size());

    url parsed;

    size_t path_start = location.find('/');
    std::string_view authority = location.substr(0, path_start);
    if(path_start != std::string_view::npos)
        parsed.path = std::string {location.substr(path_start)};

    size_t sep = authority.find(':');
    parsed.host = std::string {authority.substr(0, sep)};
    if(parsed.host.empty())
        throw std::invalid_argument {"Missing host in url: " + std::string {location}};

    if(sep != std::string_view::npos)
    {
        std::string_view port_view = authority.substr(sep + 1);
        auto res = std::from_chars(port_view.data(), port_view.data() + port_view.size(), parsed.port);
        if(res.ec != std::errc {} || res.ptr != port_view.data() + port_view.size())
            throw std::invalid_argument {"Invalid port in url: " + std::string {location}};
    }

    return parsed;
}

} // namespace http
