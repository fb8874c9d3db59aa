#ifndef DLNA_REMOTE_HTTP_REQUEST_HPP
#define DLNA_REMOTE_HTTP_REQUEST_HPP

#include <string>
#include <utility>
#include <vector>

namespace http {

// Outgoing http request. Headers keep the order in which they were set
class request {

public:

    request() = delete;
    request(const request& other) = default;
    request(request&& other) noexcept = default;
    request& operator=(const request& other) = default;
    request& operator=(request&& other) noexcept = default;

    request(std::string method, std::string resource);

    std::string to_string() const;

    void set_header(const std::string& key, const std::string& value);

    bool check_header(const std::string& key) const;

    std::string get_header(const std::string& key) const;

    const std::vector<std::pair<std::string, std::string>>& get_headers() const { return m_headers; }

    /// Also sets the Content-Length header to the size of the body
    void set_body(std::string body);

private:

    std::string m_method;     /// http method used by this request (e.g. post, get, ...)
    std::string m_resource;   /// resource addressed by this request
    std::string m_protocol {"HTTP/1.1"};
    std::string m_body;

    std::vector<std::pair<std::string, std::string>> m_headers;

};

} // namespace http

#endif
