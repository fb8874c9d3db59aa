#include "upnp_extract.hpp"

#include <regex>
#include <optional>
#include <algorithm>

namespace upnp
{

static std::optional<std::string> element_text(std::string_view text, std::string_view tag, size_t from = 0)
{
    const std::string open = "<" + std::string {tag} + ">";
    const std::string close = "</" + std::string {tag} + ">";

    size_t start = text.find(open, from);
    if(start == std::string_view::npos)
        return std::nullopt;
    start += open.size();

    size_t end = text.find(close, start);
    if(end == std::string_view::npos)
        return std::nullopt;

    return std::string {text.substr(start, end - start)};
}

uint16_t extract_port(std::string_view location)
{
    // Greedy on purpose, the port is the last ":<digits>" behind the scheme
    static const std::regex port_pattern {"http://.*:(\\d+).*"};

    std::match_results<std::string_view::const_iterator> match;
    if(!std::regex_search(location.begin(), location.end(), match, port_pattern))
        return 80;

    try {
        unsigned long port = std::stoul(match[1].str());
        return (port > 0xFFFF) ? 80 : static_cast<uint16_t>(port);
    } catch(std::out_of_range&) {
        return 80;
    }
}

std::string extract_control_url(std::string_view description, std::string_view service_urn)
{
    // A service block is usually spread over several lines
    std::string flat {description};
    flat.erase(std::remove_if(flat.begin(), flat.end(), [](char c) {
        return c == '\n' || c == '\r';
    }), flat.end());

    const std::string service_type = "<serviceType>" + std::string {service_urn} + "</serviceType>";
    size_t pos = flat.find(service_type);
    if(pos == std::string::npos)
        return {};

    return element_text(flat, "controlURL", pos + service_type.size()).value_or("");
}

std::string extract_friendly_name(std::string_view description)
{
    return element_text(description, "friendlyName").value_or(unknown_name);
}

std::string extract_location(std::string_view response)
{
    constexpr std::string_view prefix {"LOCATION: "};

    while(!response.empty())
    {
        size_t endl = response.find("\r\n");
        std::string_view line = response.substr(0, endl);
        if(line.substr(0, prefix.size()) == prefix)
            return std::string {line.substr(prefix.size())};

        if(endl == std::string_view::npos)
            break;
        response.remove_prefix(endl + 2);
    }

    return {};
}

bool has_service_type(std::string_view description, std::string_view service_urn)
{
    const std::string service_type = "<serviceType>" + std::string {service_urn} + "</serviceType>";
    return description.find(service_type) != std::string_view::npos;
}

} // namespace upnp
