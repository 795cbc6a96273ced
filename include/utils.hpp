#ifndef LANWATCH_UTILS_HPP
#define LANWATCH_UTILS_HPP

#include <string>
#include <string_view>

namespace utils
{

// IPv4 address of the named interface, throws std::runtime_error if it has none
std::string get_interface_ipaddr(std::string_view if_name);

bool is_ipv4_address(std::string_view addr);

// Dotted addresses are returned as they are, anything else is looked up as an interface name
std::string resolve_bind_address(std::string_view addr_or_interface);

std::string_view trim(std::string_view view);

bool iequals(std::string_view lhs, std::string_view rhs);

// Case insensitive prefix test
bool istarts_with(std::string_view view, std::string_view prefix);

} // utils

#endif
