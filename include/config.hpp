#ifndef DLNA_REMOTE_CONFIG_HPP
#define DLNA_REMOTE_CONFIG_HPP

#define DLNA_REMOTE_VERSION "0.2"
#define DLNA_REMOTE_USER_AGENT "dlna_remote/" DLNA_REMOTE_VERSION

// SSDP multicast group
#define DISCOVERY_IP "239.255.255.250"
#define DISCOVERY_PORT 1900

// Upper bound for a single discovery answer in bytes
#define MAX_RESPONSE_SIZE 4096

// Longest discovery accepted on the command line in seconds
#define MAX_DISCOVERY_TIMEOUT 86400

// Length of one wait on the discovery socket in milliseconds
#define DISCOVERY_SLICE 1000

#endif
