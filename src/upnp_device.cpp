#include "upnp_device.hpp"
#include "upnp_extract.hpp"
#include "config.hpp"

#include "http/request.hpp"

#include "fmt/format.h"

#include <stdexcept>
#include <utility>

namespace upnp
{

upnp_device::upnp_device(std::string ip, transport::sender_ptr sender)
    : m_ip {std::move(ip)},
      m_sender {std::move(sender)}
{}

device_result upnp_device::from_response(std::string_view response, std::string ip,
    const description_fetcher& fetch, transport::sender_ptr sender)
{
    upnp_device device {std::move(ip), std::move(sender)};

    device.m_location = extract_location(response);
    device.m_port = extract_port(device.m_location);
    if(device.m_location.empty())
        return {std::move(device), std::string {"No LOCATION in discovery response"}};

    try {
        std::string description = fetch(device.m_location);
        device.m_name = extract_friendly_name(description);
        device.m_has_av_transport = has_service_type(description, urn_av_transport);
        device.m_control_url = extract_control_url(description, urn_av_transport);
    } catch(std::exception& e) {
        // One broken device must not stop the discovery of the others
        return {std::move(device), std::string {e.what()}};
    }

    return {std::move(device), std::nullopt};
}

std::string upnp_device::build_request(const service_parameter& param, unsigned instance_id) const
{
    std::string envelope = fmt::format(
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
        "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\" s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">"
        "<s:Body><u:{0} xmlns:u=\"{1}\"><InstanceID>{2}</InstanceID>{3}</u:{0}></s:Body>"
        "</s:Envelope>",
        param.action,
        urn_av_transport,
        instance_id,
        param.body
    );

    http::request req {"POST", m_control_url};
    req.set_header("User-Agent", DLNA_REMOTE_USER_AGENT);
    req.set_header("Accept", "*/*");
    req.set_header("Content-Type", "text/xml; charset=\"utf-8\"");
    req.set_header("HOST", fmt::format("{}:{}", m_ip, m_port));
    req.set_body(std::move(envelope));
    req.set_header("SOAPACTION", fmt::format("\"{}#{}\"", urn_av_transport, param.action));
    req.set_header("Connection", "close");

    return req.to_string();
}

void upnp_device::use_service(const service_parameter& param, unsigned instance_id) const
{
    if(m_control_url.empty())
        throw std::runtime_error {fmt::format("{} has no AVTransport control url", to_string())};

    m_sender->send(transport::endpoint {m_ip, m_port}, build_request(param, instance_id));
}

void upnp_device::set_media_uri(const std::string& url, unsigned instance_id) const
{
    use_service(service_parameter {
        "SetAVTransportURI", fmt::format("<CurrentURI>{}</CurrentURI><CurrentURIMetaData />", xml_escape(url))
    }, instance_id);
}

void upnp_device::play(unsigned instance_id) const
{
    use_service(service_parameter {"Play", "<Speed>1</Speed>"}, instance_id);
}

void upnp_device::play(const std::string& url) const
{
    set_media_uri(url);
    play();
}

void upnp_device::pause(unsigned instance_id) const
{
    use_service(service_parameter {"Pause", ""}, instance_id);
}

void upnp_device::stop(unsigned instance_id) const
{
    use_service(service_parameter {"Stop", ""}, instance_id);
}

std::string upnp_device::to_string() const
{
    return fmt::format("{} @ {}", m_name, m_ip);
}

std::string xml_escape(std::string_view text)
{
    std::string escaped;
    escaped.reserve(text.size());
    for(char c : text)
    {
        switch(c)
        {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            case '\'': escaped += "&apos;"; break;
            default: escaped += c;
        }
    }
    return escaped;
}

} // namespace upnp
