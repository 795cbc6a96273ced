#ifndef LANWATCH_RESPONSE_PARSER_HPP
#define LANWATCH_RESPONSE_PARSER_HPP

#include <string>
#include <string_view>
#include <vector>

#include "device.hpp"
#include "mdns_discovery.hpp"
#include "probe.hpp"
#include "ssdp_discovery.hpp"

namespace discovery
{

// mDNS keys in raw_metadata. TXT entries keep their key behind the prefix so
// they never collide with SSDP header names on a correlated device.
#define MDNS_TXT_PREFIX "txt."
#define MDNS_SRV_TARGET_KEY "srv.target"
#define MDNS_ADDRESSES_KEY "srv.addresses"

// "uuid:123::upnp:rootdevice" -> "123"
std::string identity_from_usn(std::string_view usn);

// Device type URN from ST or the USN suffix, empty for service or root entries
std::string device_type_from_ssdp(const ssdp_res& res);

struct sourced_record
{
    mdns_record record;
    std::string source;
    sys_clock::time_point received_at;
};

// Joins PTR/SRV/TXT/A/AAAA records into one device per service instance.
// Records may come from different packets of the same round.
std::vector<device> resolve_mdns_instances(const std::vector<sourced_record>& records);

// Every device described by one response, throws parse_error
std::vector<device> parse_all(protocol proto, const raw_response& raw);

// The first device described by one response, throws parse_error if there is none
device parse(protocol proto, const raw_response& raw);

// Parses all responses of one probe in a round. Malformed responses are
// logged, counted in parse_errors and dropped.
std::vector<device> parse_round(protocol proto, const std::vector<raw_response>& responses, size_t& parse_errors);

} // namespace discovery

#endif
