#include "device.hpp"

#include <ctime>

#include "fmt/chrono.h"
#include "fmt/format.h"

namespace discovery
{

std::string_view to_string(protocol proto)
{
    switch(proto)
    {
        case protocol::ssdp:
            return "ssdp";
        case protocol::mdns:
            return "mdns";
    }
    return "unknown";
}

bool operator==(const device& lhs, const device& rhs)
{
    return lhs.identity == rhs.identity &&
        lhs.discovered_via == rhs.discovered_via &&
        lhs.address == rhs.address &&
        lhs.port == rhs.port &&
        lhs.friendly_name == rhs.friendly_name &&
        lhs.device_type == rhs.device_type &&
        lhs.raw_metadata == rhs.raw_metadata &&
        lhs.first_seen == rhs.first_seen &&
        lhs.last_seen == rhs.last_seen;
}

std::string format_timestamp(sys_clock::time_point tp)
{
    std::time_t t = sys_clock::to_time_t(tp);
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(t));
}

void to_json(json& j, const device& dev)
{
    json via = json::array();
    for(protocol proto : dev.discovered_via)
        via.push_back(std::string {to_string(proto)});

    j = json {
        {"identity", dev.identity},
        {"address", dev.address},
        {"port", dev.port},
        {"friendly_name", dev.friendly_name},
        {"device_type", dev.device_type},
        {"discovered_via", via},
        {"first_seen", format_timestamp(dev.first_seen)},
        {"last_seen", format_timestamp(dev.last_seen)},
        {"raw_metadata", dev.raw_metadata}
    };
}

} // namespace discovery
