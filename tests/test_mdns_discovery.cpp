#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <vector>

#include "config.hpp"
#include "dns_builder.hpp"
#include "errors.hpp"
#include "mdns_discovery.hpp"

using namespace discovery;

static std::vector<char> to_vector(const std::string& str)
{
    return std::vector<char> {str.begin(), str.end()};
}

TEST(MdnsDiscovery, QueriesCoverEveryServiceType)
{
    const std::vector<std::string>& types = default_service_types();
    std::vector<std::string> queries = build_queries(types);

    ASSERT_EQ(queries.size(), (types.size() + 11) / 12);

    size_t questions = 0;
    for(const std::string& query : queries)
    {
        mdns_res res = parse_mdns_message(to_vector(query));
        EXPECT_FALSE(res.response);
        EXPECT_FALSE(res.truncated);
        EXPECT_LT(query.size(), 1200u);
        questions += res.questions.size();
    }
    EXPECT_EQ(questions, types.size());
}

TEST(MdnsDiscovery, QueryEncodesPtrQuestion)
{
    std::vector<std::string> queries = build_queries({"_http._tcp.local"});
    ASSERT_EQ(queries.size(), 1u);

    std::string expected;
    dns_builder::append_u16(expected, 0);
    dns_builder::append_u16(expected, 0);
    dns_builder::append_u16(expected, 1);
    dns_builder::append_u16(expected, 0);
    dns_builder::append_u16(expected, 0);
    dns_builder::append_u16(expected, 0);
    dns_builder::append_name(expected, "_http._tcp.local");
    dns_builder::append_u16(expected, 12);
    dns_builder::append_u16(expected, 1);

    EXPECT_EQ(queries.front(), expected);
}

TEST(MdnsDiscovery, ReadFqdnFollowsCompressionPointers)
{
    std::string msg(12, '\0');
    dns_builder::append_name(msg, "_http._tcp.local");    // starts at 12
    size_t second = msg.size();
    msg.push_back(7);
    msg += "printer";
    msg.push_back(static_cast<char>(0xC0));
    msg.push_back(12);
    msg += "tail";

    std::vector<char> data = to_vector(msg);
    size_t offset = second;
    EXPECT_EQ(read_fqdn(data, offset), "printer._http._tcp.local");
    EXPECT_EQ(offset, second + 10);

    offset = 12;
    EXPECT_EQ(read_fqdn(data, offset), "_http._tcp.local");
    EXPECT_EQ(offset, second);
}

TEST(MdnsDiscovery, ReadFqdnRejectsLoopsAndOverruns)
{
    std::string msg(12, '\0');
    msg.push_back(static_cast<char>(0xC0));
    msg.push_back(12);
    std::vector<char> loop = to_vector(msg);
    size_t offset = 12;
    EXPECT_THROW(read_fqdn(loop, offset), parse_error);

    std::string cut(12, '\0');
    cut.push_back(10);
    cut += "short";
    std::vector<char> overrun = to_vector(cut);
    offset = 12;
    EXPECT_THROW(read_fqdn(overrun, offset), parse_error);
}

TEST(MdnsDiscovery, DotsInsideLabelsAreEscaped)
{
    std::string msg(12, '\0');
    msg.push_back(9);
    msg += "Hall.Lamp";
    dns_builder::append_name(msg, "_hap._tcp.local");
    std::vector<char> data = to_vector(msg);

    size_t offset = 12;
    std::string name = read_fqdn(data, offset);
    EXPECT_EQ(name, "Hall\\.Lamp._hap._tcp.local");
    EXPECT_EQ(first_label(name), "Hall.Lamp");
    EXPECT_EQ(strip_first_label(name), "_hap._tcp.local");
}

TEST(MdnsDiscovery, ParsesKnownRecordsAndSkipsUnknown)
{
    std::vector<char> msg = dns_builder {}
        .ptr("_http._tcp.local", "printer._http._tcp.local")
        .record("printer._http._tcp.local", 47, std::string("\x00\x05\x00\x00\x80\x00\x40", 7))   // NSEC
        .srv("printer._http._tcp.local", "printer.local", 631)
        .txt("printer._http._tcp.local", {"txtvers=1", "ty=LaserJet 400", "duplex"})
        .a("printer.local", "10.0.0.7")
        .aaaa("printer.local", "fe80::1234")
        .build();

    mdns_res res = parse_mdns_message(msg);
    EXPECT_TRUE(res.response);
    EXPECT_FALSE(res.truncated);
    ASSERT_EQ(res.records.size(), 5u);

    EXPECT_EQ(res.records[0].type, record_type::ptr);
    EXPECT_EQ(res.records[0].name, "_http._tcp.local");
    EXPECT_EQ(res.records[0].target, "printer._http._tcp.local");

    EXPECT_EQ(res.records[1].type, record_type::srv);
    EXPECT_EQ(res.records[1].port, 631);
    EXPECT_EQ(res.records[1].target, "printer.local");

    EXPECT_EQ(res.records[2].type, record_type::txt);
    EXPECT_EQ(res.records[2].txt.at("txtvers"), "1");
    EXPECT_EQ(res.records[2].txt.at("ty"), "LaserJet 400");
    EXPECT_EQ(res.records[2].txt.at("duplex"), "");

    EXPECT_EQ(res.records[3].type, record_type::a);
    EXPECT_EQ(res.records[3].address, "10.0.0.7");

    EXPECT_EQ(res.records[4].type, record_type::aaaa);
    EXPECT_EQ(res.records[4].address, "fe80::1234");
}

TEST(MdnsDiscovery, BrokenRecordDoesNotSpoilOthers)
{
    std::vector<char> msg = dns_builder {}
        .record("bad.local", 1, std::string("\x0a\x00", 2))    // A record of two bytes
        .a("good.local", "10.0.0.8")
        .build();

    mdns_res res = parse_mdns_message(msg);
    ASSERT_EQ(res.records.size(), 1u);
    EXPECT_EQ(res.records[0].address, "10.0.0.8");
}

TEST(MdnsDiscovery, TruncatedMessageKeepsRecordsBeforeTheCut)
{
    std::vector<char> msg = dns_builder {}
        .ptr("_ipp._tcp.local", "office._ipp._tcp.local")
        .srv("office._ipp._tcp.local", "office.local", 631)
        .a("office.local", "10.0.0.9")
        .build();
    msg.resize(msg.size() - 3);

    mdns_res res = parse_mdns_message(msg);
    EXPECT_TRUE(res.truncated);
    ASSERT_EQ(res.records.size(), 2u);
    EXPECT_EQ(res.records[1].type, record_type::srv);
}

TEST(MdnsDiscovery, UnreadableMessagesAreParseErrors)
{
    EXPECT_THROW(parse_mdns_message(std::vector<char>(5, '\0')), parse_error);

    std::vector<char> msg = dns_builder {}.a("host.local", "10.0.0.1").build();
    msg.resize(20);
    EXPECT_THROW(parse_mdns_message(msg), parse_error);
}

TEST(MdnsDiscovery, GoodbyeKeepsItsTtl)
{
    std::vector<char> msg = dns_builder {}.ptr("_http._tcp.local", "gone._http._tcp.local", 0).build();

    mdns_res res = parse_mdns_message(msg);
    ASSERT_EQ(res.records.size(), 1u);
    EXPECT_EQ(res.records[0].ttl, 0u);
}

TEST(MdnsDiscovery, UnknownInterfaceMakesNetworkUnavailable)
{
    config conf;
    conf.bind_address = "no-such-interface0";
    mdns_probe probe {conf};
    std::atomic<bool> cancelled {false};

    EXPECT_THROW(probe.discover(std::chrono::milliseconds {100}, cancelled), network_unavailable);
}
