#ifndef LANWATCH_DEVICE_HPP
#define LANWATCH_DEVICE_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace discovery
{

using sys_clock = std::chrono::system_clock;

enum class protocol : uint8_t
{
    ssdp,
    mdns
};

std::string_view to_string(protocol proto);

struct device
{
    std::string identity;                               // USN uuid or mDNS instance name

    std::set<protocol> discovered_via;

    std::string address;

    uint16_t port = 0;                                  // 0 if unknown

    std::string friendly_name;

    std::string device_type;

    std::map<std::string, std::string> raw_metadata;    // SSDP headers or TXT entries

    sys_clock::time_point first_seen;

    sys_clock::time_point last_seen;

    bool seen_via(protocol proto) const
    {
        return discovered_via.count(proto) > 0;
    }
};

bool operator==(const device& lhs, const device& rhs);

inline bool operator!=(const device& lhs, const device& rhs)
{
    return !(lhs == rhs);
}

std::string format_timestamp(sys_clock::time_point tp);

void to_json(json& j, const device& dev);

} // namespace discovery

#endif
