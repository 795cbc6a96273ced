#ifndef LANWATCH_MDNS_DISCOVERY_HPP
#define LANWATCH_MDNS_DISCOVERY_HPP

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "probe.hpp"

#define MDNS_MULTICAST_IP "224.0.0.251"
#define MDNS_MULTICAST_PORT 5353
#define MDNS_MULTICAST_TTL 255

namespace discovery
{

enum class record_type : uint16_t
{
    a = 1,
    ptr = 12,
    txt = 16,
    aaaa = 28,
    srv = 33
};

struct mdns_record
{
    std::string name;                               // owner name, labels joined with '.'
    record_type type;
    uint32_t ttl = 0;

    std::string target;                             // PTR target or SRV target host
    uint16_t port = 0;                              // From SRV record
    std::string address;                            // From A or AAAA record
    std::map<std::string, std::string> txt;         // From TXT record
};

struct mdns_res
{
    bool response = false;
    bool truncated = false;                         // ended before every announced record was read
    std::vector<std::string> questions;
    std::vector<mdns_record> records;               // PTR, SRV, A, AAAA and TXT only
};

// Encodes the PTR questions for the given service types, split over as many
// datagrams as needed to keep each of them small
std::vector<std::string> build_queries(const std::vector<std::string>& service_types);

// Reads a possibly compressed name starting at offset and moves offset past it.
// Dots inside a label are escaped as "\.". Throws parse_error.
std::string read_fqdn(const std::vector<char>& data, size_t& offset);

// First label of a name with its escapes removed
std::string first_label(std::string_view name);

// Strips the leading instance label, "a._http._tcp.local" -> "_http._tcp.local"
std::string strip_first_label(std::string_view name);

// Decodes a DNS message. Unknown record types are skipped and a truncated
// message yields the records before the cut. Throws parse_error when not even
// the header or the first announced record can be read.
mdns_res parse_mdns_message(const std::vector<char>& buffer);

void parse_ptr_record(const std::vector<char>& msg, size_t offset, std::string& dest_name);

void parse_txt_record(const std::vector<char>& msg, size_t offset, size_t length, std::map<std::string, std::string>& dest_txt);

void parse_srv_record(const std::vector<char>& msg, size_t offset, size_t length, uint16_t& dest_port, std::string& dest_target);

void parse_a_record(const std::vector<char>& msg, size_t offset, size_t length, std::string& dest_addr);

void parse_aaaa_record(const std::vector<char>& msg, size_t offset, size_t length, std::string& dest_addr);

class mdns_probe : public probe
{
public:

    mdns_probe() = delete;
    mdns_probe(const mdns_probe&) = delete;
    mdns_probe& operator=(const mdns_probe&) = delete;

    explicit mdns_probe(const config& conf);

    protocol source() const override
    {
        return protocol::mdns;
    }

    std::vector<raw_response> discover(std::chrono::milliseconds timeout, const std::atomic<bool>& cancelled) override;

private:

    std::string m_bind;

    bool m_send_query;

    std::vector<std::string> m_service_types;

};

} // namespace discovery

#endif
