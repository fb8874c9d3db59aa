#ifndef DLNA_REMOTE_UPNP_DEVICE_HPP
#define DLNA_REMOTE_UPNP_DEVICE_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "transport.hpp"

namespace upnp
{

static constexpr const char* urn_av_transport = "urn:schemas-upnp-org:service:AVTransport:1";

// Returns the description document stored at a location url
using description_fetcher = std::function<std::string(const std::string&)>;

struct service_parameter
{
    std::string action;
    std::string body; /// Arguments following the InstanceID element
};

struct device_result;

// A media renderer found during discovery. Two devices are the same device if
// name and address match, port and control url do not take part.
class upnp_device
{
public:

    upnp_device(const upnp_device&) = delete;
    upnp_device& operator=(const upnp_device&) = delete;
    upnp_device(upnp_device&&) = default;
    upnp_device& operator=(upnp_device&&) = default;
    ~upnp_device() = default;

    /**
     * Builds a device from one raw discovery answer sent by ip.
     * Fetching or reading the description never throws. On failure the device is
     * returned with the fields that were set so far and the error is stored in the result.
     */
    static device_result from_response(std::string_view response, std::string ip,
        const description_fetcher& fetch = transport::http_get,
        transport::sender_ptr sender = std::make_shared<transport::tcp_sender>());

    void set_media_uri(const std::string& url, unsigned instance_id = 0) const;

    void play(unsigned instance_id = 0) const;

    /// Sets the media and starts it without checking that the first request succeeded
    void play(const std::string& url) const;

    void pause(unsigned instance_id = 0) const;

    void stop(unsigned instance_id = 0) const;

    /// Builds the complete http request that invokes action on the AVTransport service
    std::string build_request(const service_parameter& param, unsigned instance_id) const;

    std::string to_string() const;

    const std::string& ip() const { return m_ip; }

    const std::string& name() const { return m_name; }

    uint16_t port() const { return m_port; }

    const std::string& control_url() const { return m_control_url; }

    const std::string& location() const { return m_location; }

    bool has_av_transport() const { return m_has_av_transport; }

    bool operator==(const upnp_device& other) const
    {
        return m_name == other.m_name && m_ip == other.m_ip;
    }

    bool operator!=(const upnp_device& other) const
    {
        return !(*this == other);
    }

private:

    upnp_device(std::string ip, transport::sender_ptr sender);

    void use_service(const service_parameter& param, unsigned instance_id) const;

    std::string m_ip;

    std::string m_name;

    uint16_t m_port = 80;

    std::string m_control_url;

    std::string m_location;

    bool m_has_av_transport = false;

    transport::sender_ptr m_sender;

};

struct device_result
{
    upnp_device device;
    std::optional<std::string> error;
};

std::string xml_escape(std::string_view text);

} // namespace upnp

#endif
