#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include "config.hpp"

using namespace discovery;

namespace
{

const char* env_names[] = {
    "LANWATCH_SSDP_TIMEOUT_MS",
    "LANWATCH_MDNS_TIMEOUT_MS",
    "LANWATCH_BIND",
    "LANWATCH_SEARCH_TARGET",
    "LANWATCH_MX",
    "LANWATCH_MDNS_QUERY",
    "LANWATCH_MDNS_SERVICES",
    "LANWATCH_RETENTION",
    "LANWATCH_EXPIRY_S",
    "LANWATCH_REFRESH_S",
    "LANWATCH_CORRELATE",
    "LANWATCH_LOG_LEVEL"
};

class ConfigFromEnv : public ::testing::Test
{
protected:

    void SetUp() override
    {
        for(const char* name : env_names)
            unsetenv(name);
    }

    void TearDown() override
    {
        SetUp();
    }

};

} // namespace

TEST_F(ConfigFromEnv, DefaultsWithoutEnvironment)
{
    config conf = config_from_env();

    EXPECT_EQ(conf.ssdp_timeout, std::chrono::milliseconds {5000});
    EXPECT_EQ(conf.mdns_timeout, std::chrono::milliseconds {5000});
    EXPECT_EQ(conf.bind_address, "0.0.0.0");
    EXPECT_EQ(conf.search_target, "ssdp:all");
    EXPECT_EQ(conf.mx, 3u);
    EXPECT_TRUE(conf.mdns_send_query);
    EXPECT_EQ(conf.mdns_service_types, default_service_types());
    EXPECT_EQ(conf.retention, retention_policy::refresh_with_expiry);
    EXPECT_EQ(conf.expiry, std::chrono::seconds {300});
    EXPECT_EQ(conf.refresh_interval, std::chrono::seconds {30});
    EXPECT_TRUE(conf.correlate_by_address);
    EXPECT_EQ(conf.log_level, logging::level::info);
}

TEST_F(ConfigFromEnv, EnvironmentOverridesDefaults)
{
    setenv("LANWATCH_SSDP_TIMEOUT_MS", "1500", 1);
    setenv("LANWATCH_MDNS_TIMEOUT_MS", "2500", 1);
    setenv("LANWATCH_BIND", "eth0", 1);
    setenv("LANWATCH_SEARCH_TARGET", "upnp:rootdevice", 1);
    setenv("LANWATCH_MX", "5", 1);
    setenv("LANWATCH_MDNS_QUERY", "off", 1);
    setenv("LANWATCH_MDNS_SERVICES", "_ipp._tcp.local,,_hap._tcp.local", 1);
    setenv("LANWATCH_RETENTION", "reset", 1);
    setenv("LANWATCH_EXPIRY_S", "60", 1);
    setenv("LANWATCH_REFRESH_S", "10", 1);
    setenv("LANWATCH_CORRELATE", "no", 1);
    setenv("LANWATCH_LOG_LEVEL", "debug", 1);

    config conf = config_from_env();

    EXPECT_EQ(conf.ssdp_timeout, std::chrono::milliseconds {1500});
    EXPECT_EQ(conf.mdns_timeout, std::chrono::milliseconds {2500});
    EXPECT_EQ(conf.bind_address, "eth0");
    EXPECT_EQ(conf.search_target, "upnp:rootdevice");
    EXPECT_EQ(conf.mx, 5u);
    EXPECT_FALSE(conf.mdns_send_query);
    ASSERT_EQ(conf.mdns_service_types.size(), 2u);
    EXPECT_EQ(conf.mdns_service_types[0], "_ipp._tcp.local");
    EXPECT_EQ(conf.mdns_service_types[1], "_hap._tcp.local");
    EXPECT_EQ(conf.retention, retention_policy::hard_reset);
    EXPECT_EQ(conf.expiry, std::chrono::seconds {60});
    EXPECT_EQ(conf.refresh_interval, std::chrono::seconds {10});
    EXPECT_FALSE(conf.correlate_by_address);
    EXPECT_EQ(conf.log_level, logging::level::debug);
}

TEST_F(ConfigFromEnv, InvalidValuesAreRejected)
{
    setenv("LANWATCH_SSDP_TIMEOUT_MS", "soon", 1);
    EXPECT_THROW(config_from_env(), std::invalid_argument);
    unsetenv("LANWATCH_SSDP_TIMEOUT_MS");

    setenv("LANWATCH_EXPIRY_S", "-5", 1);
    EXPECT_THROW(config_from_env(), std::invalid_argument);
    unsetenv("LANWATCH_EXPIRY_S");

    setenv("LANWATCH_MX", "9", 1);
    EXPECT_THROW(config_from_env(), std::invalid_argument);
    setenv("LANWATCH_MX", "0", 1);
    EXPECT_THROW(config_from_env(), std::invalid_argument);
    unsetenv("LANWATCH_MX");

    setenv("LANWATCH_CORRELATE", "maybe", 1);
    EXPECT_THROW(config_from_env(), std::invalid_argument);
    unsetenv("LANWATCH_CORRELATE");

    setenv("LANWATCH_RETENTION", "forever", 1);
    EXPECT_THROW(config_from_env(), std::invalid_argument);
    unsetenv("LANWATCH_RETENTION");

    setenv("LANWATCH_LOG_LEVEL", "loud", 1);
    EXPECT_THROW(config_from_env(), std::invalid_argument);
}

TEST_F(ConfigFromEnv, DurationsAreBounded)
{
    setenv("LANWATCH_SSDP_TIMEOUT_MS", "60000", 1);
    setenv("LANWATCH_EXPIRY_S", "86400", 1);
    config conf = config_from_env();
    EXPECT_EQ(conf.ssdp_timeout, std::chrono::milliseconds {60000});
    EXPECT_EQ(conf.expiry, std::chrono::seconds {86400});

    setenv("LANWATCH_SSDP_TIMEOUT_MS", "60001", 1);
    EXPECT_THROW(config_from_env(), std::invalid_argument);
    unsetenv("LANWATCH_SSDP_TIMEOUT_MS");

    setenv("LANWATCH_MDNS_TIMEOUT_MS", "9223372036854775807", 1);
    EXPECT_THROW(config_from_env(), std::invalid_argument);
    unsetenv("LANWATCH_MDNS_TIMEOUT_MS");

    setenv("LANWATCH_EXPIRY_S", "9223372036854775", 1);
    EXPECT_THROW(config_from_env(), std::invalid_argument);
    unsetenv("LANWATCH_EXPIRY_S");

    setenv("LANWATCH_REFRESH_S", "86401", 1);
    EXPECT_THROW(config_from_env(), std::invalid_argument);
}

TEST(Config, DefaultServiceTypesAreBrowsable)
{
    const std::vector<std::string>& types = default_service_types();

    ASSERT_FALSE(types.empty());
    for(const std::string& type : types)
    {
        EXPECT_EQ(type.front(), '_') << type;
        std::string suffix = type.substr(type.size() - std::min<size_t>(type.size(), 11));
        EXPECT_TRUE(suffix == "._tcp.local" || suffix == "._udp.local") << type;
        EXPECT_NE(type.back(), '.') << type;
    }
}

TEST(Logging, ParseLevel)
{
    EXPECT_EQ(logging::parse_level("debug"), logging::level::debug);
    EXPECT_EQ(logging::parse_level("info"), logging::level::info);
    EXPECT_EQ(logging::parse_level("warning"), logging::level::warn);
    EXPECT_EQ(logging::parse_level("error"), logging::level::error);
    EXPECT_THROW(logging::parse_level("DEBUG!"), std::invalid_argument);
}
