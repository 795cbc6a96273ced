#include <utils.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>
#include <ifaddrs.h>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <netdb.h>
#include <net/if.h>

#include "fmt/format.h"

namespace utils
{

std::string get_interface_ipaddr(std::string_view if_name)
{
    ifaddrs* addrs;
    if(getifaddrs(&addrs))
        throw std::runtime_error {"Unable to list network interfaces"};

    std::string result;
    for(ifaddrs* curr_addr = addrs; curr_addr != nullptr; curr_addr = curr_addr->ifa_next)
    {
        if(curr_addr->ifa_addr == nullptr || curr_addr->ifa_addr->sa_family != AF_INET)
            continue;
        if(if_name != curr_addr->ifa_name)
            continue;

        std::array<char, NI_MAXHOST> host;
        if(getnameinfo(curr_addr->ifa_addr, sizeof(sockaddr_in), host.data(), NI_MAXHOST, nullptr, 0, NI_NUMERICHOST) != 0)
            continue;

        if(curr_addr->ifa_flags & IFF_UP)
        {
            result = host.data();
            break;
        }
    }

    freeifaddrs(addrs);
    if(result.empty())
        throw std::runtime_error {fmt::format("No usable IPv4 address on interface '{}'", if_name)};
    return result;
}

bool is_ipv4_address(std::string_view addr)
{
    in_addr tmp;
    return inet_pton(AF_INET, std::string {addr}.c_str(), &tmp) == 1;
}

std::string resolve_bind_address(std::string_view addr_or_interface)
{
    if(addr_or_interface.empty())
        return "0.0.0.0";
    if(is_ipv4_address(addr_or_interface))
        return std::string {addr_or_interface};
    return get_interface_ipaddr(addr_or_interface);
}

std::string_view trim(std::string_view view)
{
    while(!view.empty() && std::isspace(static_cast<unsigned char>(view.front())))
        view.remove_prefix(1);
    while(!view.empty() && std::isspace(static_cast<unsigned char>(view.back())))
        view.remove_suffix(1);
    return view;
}

bool iequals(std::string_view lhs, std::string_view rhs)
{
    return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

bool istarts_with(std::string_view view, std::string_view prefix)
{
    return view.size() >= prefix.size() && iequals(view.substr(0, prefix.size()), prefix);
}

} // utils
