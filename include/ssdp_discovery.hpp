#ifndef LANWATCH_SSDP_DISCOVERY_HPP
#define LANWATCH_SSDP_DISCOVERY_HPP

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "probe.hpp"

namespace discovery
{

#define SSDP_MULTICAST_IP "239.255.255.250"
#define SSDP_MULTICAST_PORT 1900
#define SSDP_MULTICAST_TTL 2

struct ssdp_location
{
    std::string ip;
    std::string path;
    uint16_t port = 80;
};

struct ssdp_res
{
    ssdp_location location;
    std::string cache_control;
    std::string server;
    std::string usn;
    std::string st;
    std::map<std::string, std::string> headers;    // every header as sent
};

std::string build_msearch(std::string_view search_target, unsigned int mx);

// Splits http://host[:port][/path], throws parse_error
ssdp_location parse_location(std::string_view view);

// Parses a "200 OK" search response, throws parse_error if it is malformed
// or LOCATION, USN, ST or SERVER is missing
ssdp_res parse_response(std::string_view view);

class ssdp_probe : public probe
{
public:

    ssdp_probe() = delete;
    ssdp_probe(const ssdp_probe&) = delete;
    ssdp_probe& operator=(const ssdp_probe&) = delete;

    explicit ssdp_probe(const config& conf);

    protocol source() const override
    {
        return protocol::ssdp;
    }

    std::vector<raw_response> discover(std::chrono::milliseconds timeout, const std::atomic<bool>& cancelled) override;

private:

    std::string m_bind;

    std::string m_search_target;

    unsigned int m_mx;

};

} // namespace discovery

#endif
