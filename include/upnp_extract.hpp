#ifndef DLNA_REMOTE_UPNP_EXTRACT_HPP
#define DLNA_REMOTE_UPNP_EXTRACT_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace upnp
{

// Name reported for devices whose description carries no friendlyName
static constexpr const char* unknown_name = "Unknown";

// All extractors return a default value when the pattern is missing. Device
// descriptions vary a lot between vendors so a miss is never an error.

uint16_t extract_port(std::string_view location);

std::string extract_control_url(std::string_view description, std::string_view service_urn);

std::string extract_friendly_name(std::string_view description);

std::string extract_location(std::string_view response);

bool has_service_type(std::string_view description, std::string_view service_urn);

} // namespace upnp

#endif
