#include "http/response.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

namespace http
{

static std::string to_lower(std::string_view view)
{
    std::string lower {view};
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lower;
}

static std::string_view trim(std::string_view view)
{
    while(!view.empty() && (view.front() == ' ' || view.front() == '\t'))
        view.remove_prefix(1);
    while(!view.empty() && (view.back() == ' ' || view.back() == '\t'))
        view.remove_suffix(1);
    return view;
}

void response::parse(std::string_view raw)
{
    m_headers.clear();
    m_body.clear();

    size_t endl = raw.find("\r\n");
    if(endl == std::string_view::npos)
        throw std::invalid_argument {"invalid_response"};
    parse_statusline(raw.substr(0, endl));
    raw.remove_prefix(endl + 2);

    /* Read and parse response headers up to the empty line */
    while(!raw.empty())
    {
        endl = raw.find("\r\n");
        if(endl == 0)
        {
            raw.remove_prefix(2);
            break;
        }

        std::string_view headerline = raw.substr(0, endl);
        size_t sep = headerline.find(':');
        if(sep != std::string_view::npos)
            m_headers[to_lower(trim(headerline.substr(0, sep)))] = std::string {trim(headerline.substr(sep + 1))};

        if(endl == std::string_view::npos)
        {
            raw = {};
            break;
        }
        raw.remove_prefix(endl + 2);
    }

    /* Everything behind the header block belongs to the body */
    if(to_lower(get_header("Transfer-Encoding")) == "chunked")
    {
        m_body = decode_chunked(raw);
        return;
    }

    m_body = std::string {raw};
    std::string length = get_header("Content-Length");
    size_t content_length;
    auto res = std::from_chars(length.data(), length.data() + length.size(), content_length);
    if(res.ec == std::errc {} && content_length < m_body.size())
        m_body.resize(content_length);
}

bool response::complete(std::string_view raw)
{
    size_t header_end = raw.find("\r\n\r\n");
    if(header_end == std::string_view::npos)
        return false;

    response head {raw.substr(0, header_end + 4)};
    std::string_view body = raw.substr(header_end + 4);

    if(to_lower(head.get_header("Transfer-Encoding")) == "chunked")
    {
        constexpr std::string_view last_chunk {"0\r\n\r\n"};
        return body.size() >= last_chunk.size()
            && body.substr(body.size() - last_chunk.size()) == last_chunk
            && (body.size() == last_chunk.size() || body[body.size() - last_chunk.size() - 1] == '\n');
    }

    std::string length = head.get_header("Content-Length");
    size_t content_length;
    auto res = std::from_chars(length.data(), length.data() + length.size(), content_length);
    return res.ec == std::errc {} && body.size() >= content_length;
}

std::string response::get_header(const std::string& key) const
{
    auto it = m_headers.find(to_lower(key));
    return (it != m_headers.end()) ? it->second : "";
}

void response::parse_statusline(std::string_view statusline)
{
    // HTTP/1.1 200 OK
    size_t first = statusline.find(' ');
    if(first == std::string_view::npos || statusline.substr(0, 5) != "HTTP/")
        throw std::invalid_argument {"invalid_statusline"};
    m_protocol = std::string {statusline.substr(0, first)};

    std::string_view rest = statusline.substr(first + 1);
    size_t second = rest.find(' ');
    std::string_view code = rest.substr(0, second);

    auto res = std::from_chars(code.data(), code.data() + code.size(), m_code);
    if(res.ec != std::errc {} || res.ptr != code.data() + code.size())
        throw std::invalid_argument {"invalid_statusline"};

    m_phrase = (second != std::string_view::npos) ? std::string {rest.substr(second + 1)} : "";
}

std::string response::decode_chunked(std::string_view body)
{
    // <hex size>[;extension]\r\n<data>\r\n ... 0\r\n\r\n
    std::string decoded;
    while(!body.empty())
    {
        size_t endl = body.find("\r\n");
        std::string_view size_line = body.substr(0, endl);
        size_line = size_line.substr(0, size_line.find(';'));
        size_line = trim(size_line);

        size_t chunk_size;
        auto res = std::from_chars(size_line.data(), size_line.data() + size_line.size(), chunk_size, 16);
        if(res.ec != std::errc {})
            throw std::invalid_argument {"invalid_chunk"};
        if(chunk_size == 0 || endl == std::string_view::npos)
            break;

        body.remove_prefix(endl + 2);
        if(chunk_size > body.size())
            chunk_size = body.size();
        decoded.append(body.data(), chunk_size);
        body.remove_prefix(chunk_size);

        if(body.substr(0, 2) == "\r\n")
            body.remove_prefix(2);
    }

    return decoded;
}

} // namespace http
