#include "config.hpp"

#include <charconv>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

namespace discovery
{

const std::vector<std::string>& default_service_types()
{
    static const std::vector<std::string> types {
        "_afpovertcp._tcp.local",
        "_airdrop._tcp.local",
        "_airplay._tcp.local",
        "_airport._tcp.local",
        "_androidtvremote._tcp.local",
        "_axis-video._tcp.local",
        "_bose._tcp.local",
        "_companion-link._tcp.local",
        "_cups._sub._ipps._tcp.local",
        "_daap._tcp.local",
        "_device-info._tcp.local",
        "_epson-scanner._tcp.local",
        "_ftp._tcp.local",
        "_googlecast._tcp.local",
        "_googlezone._tcp.local",
        "_hap._tcp.local",
        "_homekit._tcp.local",
        "_http._tcp.local",
        "_https._tcp.local",
        "_hue._tcp.local",
        "_ipp._tcp.local",
        "_ipps._tcp.local",
        "_matter._tcp.local",
        "_mqtt._tcp.local",
        "_nfs._tcp.local",
        "_nut._tcp.local",
        "_pdl-datastream._tcp.local",
        "_philipshue._tcp.local",
        "_printer._tcp.local",
        "_raop._tcp.local",
        "_remote-login._tcp.local",
        "_rfb._tcp.local",
        "_roku._tcp.local",
        "_rsp._tcp.local",
        "_scanner._tcp.local",
        "_sftp-ssh._tcp.local",
        "_shelly._tcp.local",
        "_sleep-proxy._udp.local",
        "_smb._tcp.local",
        "_sonos._tcp.local",
        "_spotify-connect._tcp.local",
        "_ssh._tcp.local",
        "_telnet._tcp.local",
        "_webdav._tcp.local",
        "_webdavs._tcp.local",
        "_workstation._tcp.local"
    };
    return types;
}

// Upper bounds keep durations far away from clock overflow
constexpr long MAX_TIMEOUT_MS = 60 * 1000;
constexpr long MAX_INTERVAL_S = 24 * 60 * 60;

static long parse_number(std::string_view name, std::string_view value, long max)
{
    long result = 0;
    auto res = std::from_chars(value.data(), value.data() + value.size(), result);
    if(res.ec != std::errc {} || res.ptr != value.data() + value.size() || result < 0)
        throw std::invalid_argument {fmt::format("{} must be a non-negative number, got '{}'", name, value)};
    if(result > max)
        throw std::invalid_argument {fmt::format("{} must not exceed {}, got {}", name, max, result)};
    return result;
}

static bool parse_flag(std::string_view name, std::string_view value)
{
    if(value == "1" || value == "true" || value == "yes" || value == "on")
        return true;
    else if(value == "0" || value == "false" || value == "no" || value == "off")
        return false;

    throw std::invalid_argument {fmt::format("{} must be a boolean, got '{}'", name, value)};
}

static std::vector<std::string> split_list(std::string_view value)
{
    std::vector<std::string> items;
    while(!value.empty())
    {
        size_t sep = value.find(',');
        std::string_view item = value.substr(0, sep);
        if(!item.empty())
            items.emplace_back(item);
        if(sep == std::string_view::npos)
            break;
        value.remove_prefix(sep + 1);
    }
    return items;
}

config config_from_env()
{
    config conf;
    conf.mdns_service_types = default_service_types();

    auto env = [](const char* name) -> std::string_view {
        const char* val = std::getenv(name);
        return (val) ? std::string_view {val} : std::string_view {};
    };

    if(auto v = env("LANWATCH_SSDP_TIMEOUT_MS"); !v.empty())
        conf.ssdp_timeout = std::chrono::milliseconds {parse_number("LANWATCH_SSDP_TIMEOUT_MS", v, MAX_TIMEOUT_MS)};
    if(auto v = env("LANWATCH_MDNS_TIMEOUT_MS"); !v.empty())
        conf.mdns_timeout = std::chrono::milliseconds {parse_number("LANWATCH_MDNS_TIMEOUT_MS", v, MAX_TIMEOUT_MS)};
    if(auto v = env("LANWATCH_BIND"); !v.empty())
        conf.bind_address = std::string {v};
    if(auto v = env("LANWATCH_SEARCH_TARGET"); !v.empty())
        conf.search_target = std::string {v};
    if(auto v = env("LANWATCH_MX"); !v.empty())
    {
        // UPnP allows MX between 1 and 5 seconds
        long mx = parse_number("LANWATCH_MX", v, 5);
        if(mx < 1 || mx > 5)
            throw std::invalid_argument {fmt::format("LANWATCH_MX must be between 1 and 5, got {}", mx)};
        conf.mx = static_cast<unsigned int>(mx);
    }
    if(auto v = env("LANWATCH_MDNS_QUERY"); !v.empty())
        conf.mdns_send_query = parse_flag("LANWATCH_MDNS_QUERY", v);
    if(auto v = env("LANWATCH_MDNS_SERVICES"); !v.empty())
        conf.mdns_service_types = split_list(v);
    if(auto v = env("LANWATCH_RETENTION"); !v.empty())
    {
        if(v == "expiry")
            conf.retention = retention_policy::refresh_with_expiry;
        else if(v == "reset")
            conf.retention = retention_policy::hard_reset;
        else
            throw std::invalid_argument {fmt::format("LANWATCH_RETENTION must be 'expiry' or 'reset', got '{}'", v)};
    }
    if(auto v = env("LANWATCH_EXPIRY_S"); !v.empty())
        conf.expiry = std::chrono::seconds {parse_number("LANWATCH_EXPIRY_S", v, MAX_INTERVAL_S)};
    if(auto v = env("LANWATCH_REFRESH_S"); !v.empty())
        conf.refresh_interval = std::chrono::seconds {parse_number("LANWATCH_REFRESH_S", v, MAX_INTERVAL_S)};
    if(auto v = env("LANWATCH_CORRELATE"); !v.empty())
        conf.correlate_by_address = parse_flag("LANWATCH_CORRELATE", v);
    if(auto v = env("LANWATCH_LOG_LEVEL"); !v.empty())
        conf.log_level = logging::parse_level(v);

    return conf;
}

} // namespace discovery
