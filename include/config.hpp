#ifndef LANWATCH_CONFIG_HPP
#define LANWATCH_CONFIG_HPP

#include <chrono>
#include <string>
#include <vector>

#include "log.hpp"

namespace discovery
{

enum class retention_policy
{
    refresh_with_expiry,    // carry unseen devices forward until the expiry window elapsed
    hard_reset              // keep only what the latest round observed
};

struct config
{
    std::chrono::milliseconds ssdp_timeout {5000};

    std::chrono::milliseconds mdns_timeout {5000};

    // Dotted IPv4 address or interface name, multicast membership follows it
    std::string bind_address {"0.0.0.0"};

    std::string search_target {"ssdp:all"};

    unsigned int mx = 3;

    bool mdns_send_query = true;

    std::vector<std::string> mdns_service_types;

    retention_policy retention = retention_policy::refresh_with_expiry;

    std::chrono::seconds expiry {300};

    std::chrono::seconds refresh_interval {30};

    bool correlate_by_address = true;

    logging::level log_level = logging::level::info;
};

// Service types browsed when the configuration names none
const std::vector<std::string>& default_service_types();

// Defaults overridden by LANWATCH_* environment variables
config config_from_env();

} // namespace discovery

#endif
