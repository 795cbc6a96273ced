#include "ssdp_discovery.hpp"

#include <charconv>
#include <stdexcept>

#include "errors.hpp"
#include "log.hpp"
#include "multicast_socket.hpp"
#include "utils.hpp"

namespace discovery
{

std::string build_msearch(std::string_view search_target, unsigned int mx)
{
    return fmt::format("M-SEARCH * HTTP/1.1\r\n"
        "HOST: {}:{}\r\n"
        "MAN: \"ssdp:discover\"\r\n"
        "MX: {}\r\n"
        "ST: {}\r\n"
        "\r\n", SSDP_MULTICAST_IP, SSDP_MULTICAST_PORT, mx, search_target);
}

ssdp_location parse_location(std::string_view view)
{
    ssdp_location parsed;

    view = utils::trim(view);
    size_t tmp = view.find("://");
    if(tmp == std::string_view::npos || tmp == 0)
        throw parse_error {fmt::format("LOCATION '{}' has no scheme", view)};
    view.remove_prefix(tmp + 3);

    size_t path_start = view.find('/');
    std::string_view authority = view.substr(0, path_start);
    parsed.path = (path_start == std::string_view::npos) ? "/" : std::string {view.substr(path_start)};

    std::string_view port_view;
    if(!authority.empty() && authority.front() == '[')
    {
        // IPv6 literal
        size_t close = authority.find(']');
        if(close == std::string_view::npos)
            throw parse_error {fmt::format("LOCATION '{}' has an unterminated IPv6 host", view)};
        parsed.ip = std::string {authority.substr(1, close - 1)};
        if(close + 1 < authority.size() && authority[close + 1] == ':')
            port_view = authority.substr(close + 2);
    }
    else
    {
        size_t sep = authority.find(':');
        parsed.ip = std::string {authority.substr(0, sep)};
        if(sep != std::string_view::npos)
            port_view = authority.substr(sep + 1);
    }

    if(parsed.ip.empty())
        throw parse_error {fmt::format("LOCATION '{}' has no host", view)};

    if(!port_view.empty())
    {
        uint16_t port = 0;
        auto res = std::from_chars(port_view.data(), port_view.data() + port_view.size(), port);
        if(res.ec != std::errc {} || res.ptr != port_view.data() + port_view.size() || port == 0)
            throw parse_error {fmt::format("LOCATION port '{}' is invalid", port_view)};
        parsed.port = port;
    }

    return parsed;
}

ssdp_res parse_response(std::string_view view)
{
    ssdp_res res;

    size_t endl = view.find('\n');
    if(endl == std::string_view::npos)
        throw parse_error {"SSDP response has no header block"};

    std::string_view status_line = utils::trim(view.substr(0, endl));
    if(!utils::istarts_with(status_line, "HTTP/") || status_line.find(" 200") == std::string_view::npos)
        throw parse_error {fmt::format("Unexpected SSDP status line '{}'", status_line)};
    view.remove_prefix(endl + 1);

    while(!view.empty())
    {
        endl = view.find('\n');
        std::string_view line = view.substr(0, endl);
        view.remove_prefix((endl == std::string_view::npos) ? view.size() : endl + 1);

        line = utils::trim(line);
        if(line.empty())
            break;

        size_t sep = line.find(':');
        if(sep == std::string_view::npos)
            continue;

        std::string_view key = utils::trim(line.substr(0, sep));
        std::string_view val = utils::trim(line.substr(sep + 1));
        if(key.empty())
            continue;

        res.headers[std::string {key}] = std::string {val};

        if(utils::iequals(key, "LOCATION"))
            res.location = parse_location(val);
        else if(utils::iequals(key, "CACHE-CONTROL"))
            res.cache_control = val;
        else if(utils::iequals(key, "SERVER"))
            res.server = val;
        else if(utils::iequals(key, "USN"))
            res.usn = val;
        else if(utils::iequals(key, "ST"))
            res.st = val;
    }

    if(res.location.ip.empty())
        throw parse_error {"SSDP response without LOCATION"};
    if(res.usn.empty())
        throw parse_error {"SSDP response without USN"};
    if(res.st.empty())
        throw parse_error {"SSDP response without ST"};
    if(res.server.empty())
        throw parse_error {"SSDP response without SERVER"};

    return res;
}

ssdp_probe::ssdp_probe(const config& conf)
    : m_bind {conf.bind_address},
      m_search_target {conf.search_target},
      m_mx {conf.mx}
{}

std::vector<raw_response> ssdp_probe::discover(std::chrono::milliseconds timeout, const std::atomic<bool>& cancelled)
{
    std::string iface;
    try {
        iface = utils::resolve_bind_address(m_bind);
    } catch(const std::runtime_error& e) {
        throw network_unavailable {e.what()};
    }

    // Replies are sent unicast to the port the search came from, so an ephemeral port is enough
    multicast_socket d_sock {iface, iface, 0, false};
    d_sock.set_ttl(SSDP_MULTICAST_TTL);
    d_sock.send_to(SSDP_MULTICAST_IP, SSDP_MULTICAST_PORT, build_msearch(m_search_target, m_mx));
    logging::info("Sent SSDP discovery request for {}", m_search_target);

    std::vector<raw_response> responses = collect_until(d_sock, timeout, cancelled, "ssdp");
    logging::info("SSDP discovery collected {} response(s)", responses.size());
    return responses;
}

} // namespace discovery
