#include "http/request.hpp"

#include <algorithm>

namespace http
{

request::request(std::string method, std::string resource)
    : m_method {std::move(method)},
      m_resource {std::move(resource)}
{}

std::string request::to_string() const
{
    std::string request;
    ((((request += m_method) += " ") += m_resource) += " ") += m_protocol;
    request += "\r\n";

    for(const auto& it : m_headers)
        (((request += it.first) += ": ") += it.second) += "\r\n";

    request += "\r\n";
    request += m_body;

    return request;
}

void request::set_header(const std::string& key, const std::string& value)
{
    auto it = std::find_if(m_headers.begin(), m_headers.end(), [&key](const auto& header) {
        return header.first == key;
    });

    if(it != m_headers.end())
        it->second = value;
    else
        m_headers.emplace_back(key, value);
}

bool request::check_header(const std::string& key) const
{
    return std::any_of(m_headers.begin(), m_headers.end(), [&key](const auto& header) {
        return header.first == key;
    });
}

std::string request::get_header(const std::string& key) const
{
    auto it = std::find_if(m_headers.begin(), m_headers.end(), [&key](const auto& header) {
        return header.first == key;
    });

    return (it != m_headers.end()) ? it->second : "";
}

void request::set_body(std::string body)
{
    m_body = std::move(body);
    set_header("Content-Length", std::to_string(m_body.size()));
}

} // namespace http
