#ifndef DLNA_REMOTE_HTTP_RESPONSE_HPP
#define DLNA_REMOTE_HTTP_RESPONSE_HPP

#include <string>
#include <string_view>
#include <map>

namespace http
{

// Incoming http response as read from a connection that was closed by the peer
class response
{
public:

    response() = default;

    explicit response(std::string_view raw)
    {
        parse(raw);
    }

    /// Throws std::invalid_argument if the status line or a chunk size is malformed
    void parse(std::string_view raw);

    /**
     * True once raw holds the header block and the whole body announced by
     * Content-Length or by the last chunk. Without either the body ends with the connection.
     */
    static bool complete(std::string_view raw);

    /// Header names are compared case-insensitively
    std::string get_header(const std::string& key) const;

    int get_code() const
    {
        return m_code;
    }

    const std::string& get_phrase() const
    {
        return m_phrase;
    }

    const std::string& get_body() const
    {
        return m_body;
    }

    bool ok() const
    {
        return m_code >= 200 && m_code < 300;
    }

private:

    void parse_statusline(std::string_view statusline);

    static std::string decode_chunked(std::string_view body);

    int m_code = 0;
    std::string m_protocol;
    std::string m_phrase;
    std::string m_body;

    std::map<std::string, std::string> m_headers; /// keys are stored lower case

};

} // namespace http

#endif
