#ifndef DLNA_REMOTE_HTTP_URL_HPP
#define DLNA_REMOTE_HTTP_URL_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace http
{

struct url
{
    std::string host;
    uint16_t port = 80;
    std::string path = "/";
};

// Splits an http:// url into host, port and path
// Throws std::invalid_argument if the url can not be split
url parse_url(std::string_view location);

} // namespace http

#endif
