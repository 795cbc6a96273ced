#include "mdns_discovery.hpp"

#include <algorithm>
#include <stdexcept>

#include <arpa/inet.h>

#include "errors.hpp"
#include "log.hpp"
#include "multicast_socket.hpp"
#include "utils.hpp"

namespace discovery
{

constexpr uint16_t MDNS_RESPONSE_FLAG = 0x8000;
constexpr uint16_t MDNS_CLASS_IN = 1;
constexpr uint8_t MDNS_OFFSET_TOKEN = 0xC0;
constexpr size_t DNS_HEADER_SIZE = 12;
constexpr size_t MAX_LABEL_LENGTH = 63;
constexpr size_t MAX_POINTER_JUMPS = 16;
constexpr size_t QUESTIONS_PER_QUERY = 12;

static uint16_t read_u16(const std::vector<char>& data, size_t offset)
{
    return static_cast<uint16_t>((static_cast<uint8_t>(data[offset]) << 8) | static_cast<uint8_t>(data[offset + 1]));
}

static uint32_t read_u32(const std::vector<char>& data, size_t offset)
{
    return (static_cast<uint32_t>(read_u16(data, offset)) << 16) | read_u16(data, offset + 2);
}

static void write_u16(std::string& out, uint16_t value)
{
    out.push_back(static_cast<char>(value >> 8));
    out.push_back(static_cast<char>(value & 0xFF));
}

static void to_dns_name_format(std::string& out, std::string_view host)
{
    while(!host.empty())
    {
        size_t dot = host.find('.');
        std::string_view label = host.substr(0, dot);
        if(!label.empty())
        {
            out.push_back(static_cast<char>(std::min(label.size(), MAX_LABEL_LENGTH)));
            out.append(label.data(), std::min(label.size(), MAX_LABEL_LENGTH));
        }
        if(dot == std::string_view::npos)
            break;
        host.remove_prefix(dot + 1);
    }
    out.push_back('\0');
}

std::vector<std::string> build_queries(const std::vector<std::string>& service_types)
{
    std::vector<std::string> queries;

    for(size_t first = 0; first < service_types.size(); first += QUESTIONS_PER_QUERY)
    {
        size_t count = std::min(QUESTIONS_PER_QUERY, service_types.size() - first);

        std::string query;
        write_u16(query, 0);                                // id, always 0 in mDNS
        write_u16(query, 0);                                // flags, standard query
        write_u16(query, static_cast<uint16_t>(count));     // questions
        write_u16(query, 0);
        write_u16(query, 0);
        write_u16(query, 0);

        for(size_t i = first; i < first + count; i++)
        {
            to_dns_name_format(query, service_types[i]);
            write_u16(query, static_cast<uint16_t>(record_type::ptr));
            write_u16(query, MDNS_CLASS_IN);
        }
        queries.push_back(std::move(query));
    }

    return queries;
}

std::string read_fqdn(const std::vector<char>& data, size_t& offset)
{
    // fqdn = fully qualified domain names
    std::string result;
    size_t pos = offset;
    size_t jumps = 0;
    bool jumped = false;

    while(true)
    {
        if(pos >= data.size())
            throw parse_error {"Name runs past the end of the message"};

        uint8_t len = static_cast<uint8_t>(data[pos++]);
        if(len == 0)
            break;

        if((len & MDNS_OFFSET_TOKEN) == MDNS_OFFSET_TOKEN)
        {
            if(pos >= data.size())
                throw parse_error {"Truncated name compression pointer"};

            size_t pointer = (static_cast<size_t>(len & 0x3F) << 8) | static_cast<uint8_t>(data[pos++]);
            if(pointer >= data.size())
                throw parse_error {"Name compression pointer out of range"};
            if(++jumps > MAX_POINTER_JUMPS)
                throw parse_error {"Name compression loop"};

            if(!jumped)
                offset = pos;
            jumped = true;
            pos = pointer;
            continue;
        }

        if(len > MAX_LABEL_LENGTH)
            throw parse_error {"Invalid label length"};
        if(pos + len > data.size())
            throw parse_error {"Label runs past the end of the message"};

        if(!result.empty())
            result.push_back('.');
        for(size_t i = pos; i < pos + len; i++)
        {
            if(data[i] == '.' || data[i] == '\\')
                result.push_back('\\');
            result.push_back(data[i]);
        }
        pos += len;
    }

    if(!jumped)
        offset = pos;
    return result;
}

static size_t label_end(std::string_view name)
{
    for(size_t i = 0; i < name.size(); i++)
    {
        if(name[i] == '\\')
            i++;
        else if(name[i] == '.')
            return i;
    }
    return name.size();
}

std::string first_label(std::string_view name)
{
    std::string label;
    std::string_view escaped = name.substr(0, label_end(name));
    for(size_t i = 0; i < escaped.size(); i++)
    {
        if(escaped[i] == '\\' && i + 1 < escaped.size())
            i++;
        label.push_back(escaped[i]);
    }
    return label;
}

std::string strip_first_label(std::string_view name)
{
    size_t end = label_end(name);
    return (end < name.size()) ? std::string {name.substr(end + 1)} : std::string {};
}

void parse_ptr_record(const std::vector<char>& msg, size_t offset, std::string& dest_name)
{
    dest_name = read_fqdn(msg, offset);
}

void parse_txt_record(const std::vector<char>& msg, size_t offset, size_t length, std::map<std::string, std::string>& dest_txt)
{
    // Structure of the rdata:
    // [1 byte -> len][key=value of length len]...
    size_t end = offset + length;
    while(offset < end)
    {
        size_t len = static_cast<uint8_t>(msg[offset++]);
        if(offset + len > end)
            throw parse_error {"TXT string runs past the record"};

        std::string_view view {&msg[offset], len};
        offset += len;
        if(view.empty())
            continue;

        // Attributes without '=' are boolean flags
        size_t sep = view.find('=');
        if(sep == 0)
            continue;
        if(sep == std::string_view::npos)
            dest_txt.emplace(std::string {view}, std::string {});
        else
            dest_txt.emplace(std::string {view.substr(0, sep)}, std::string {view.substr(sep + 1)});
    }
}

void parse_srv_record(const std::vector<char>& msg, size_t offset, size_t length, uint16_t& dest_port, std::string& dest_target)
{
    // priority : byte 0 and 1
    // weight : byte 2 and 3
    // port : byte 4 and 5
    // target : byte 6 to the end, may be compressed
    if(length < 7)
        throw parse_error {"SRV record too short"};

    dest_port = read_u16(msg, offset + 4);
    size_t target_offset = offset + 6;
    dest_target = read_fqdn(msg, target_offset);
}

void parse_a_record(const std::vector<char>& msg, size_t offset, size_t length, std::string& dest_addr)
{
    if(length != 4)
        throw parse_error {"A record with invalid length"};

    char buffer[INET_ADDRSTRLEN];
    if(inet_ntop(AF_INET, &msg[offset], buffer, sizeof(buffer)) == nullptr)
        throw parse_error {"A record not convertible"};
    dest_addr = buffer;
}

void parse_aaaa_record(const std::vector<char>& msg, size_t offset, size_t length, std::string& dest_addr)
{
    if(length != 16)
        throw parse_error {"AAAA record with invalid length"};

    char buffer[INET6_ADDRSTRLEN];
    if(inet_ntop(AF_INET6, &msg[offset], buffer, sizeof(buffer)) == nullptr)
        throw parse_error {"AAAA record not convertible"};
    dest_addr = buffer;
}

static bool decode_rdata(const std::vector<char>& buffer, size_t offset, size_t length, mdns_record& rec)
{
    switch(static_cast<uint16_t>(rec.type))
    {
        case static_cast<uint16_t>(record_type::a):
            parse_a_record(buffer, offset, length, rec.address);
            return true;
        case static_cast<uint16_t>(record_type::ptr):
            parse_ptr_record(buffer, offset, rec.target);
            return true;
        case static_cast<uint16_t>(record_type::txt):
            parse_txt_record(buffer, offset, length, rec.txt);
            return true;
        case static_cast<uint16_t>(record_type::aaaa):
            parse_aaaa_record(buffer, offset, length, rec.address);
            return true;
        case static_cast<uint16_t>(record_type::srv):
            parse_srv_record(buffer, offset, length, rec.port, rec.target);
            return true;
        default:
            // Skip all not expected record types
            return false;
    }
}

mdns_res parse_mdns_message(const std::vector<char>& buffer)
{
    if(buffer.size() < DNS_HEADER_SIZE)
        throw parse_error {"Message shorter than a DNS header"};

    mdns_res result;
    result.response = (read_u16(buffer, 2) & MDNS_RESPONSE_FLAG) != 0;
    uint16_t q_count = read_u16(buffer, 4);
    size_t rr_count = static_cast<size_t>(read_u16(buffer, 6)) + read_u16(buffer, 8) + read_u16(buffer, 10);

    size_t pos = DNS_HEADER_SIZE;
    size_t rr_read = 0;
    try {
        for(uint16_t i = 0; i < q_count; i++)
        {
            result.questions.push_back(read_fqdn(buffer, pos));
            if(pos + 4 > buffer.size())
                throw parse_error {"Truncated question"};
            pos += 4;
        }

        for(; rr_read < rr_count; rr_read++)
        {
            std::string name = read_fqdn(buffer, pos);
            if(pos + 10 > buffer.size())
                throw parse_error {"Truncated resource record header"};

            mdns_record rec;
            rec.name = std::move(name);
            rec.type = static_cast<record_type>(read_u16(buffer, pos));
            rec.ttl = read_u32(buffer, pos + 4);
            size_t length = read_u16(buffer, pos + 8);
            pos += 10;

            if(pos + length > buffer.size())
                throw parse_error {"Truncated resource record data"};

            try {
                if(decode_rdata(buffer, pos, length, rec))
                    result.records.push_back(std::move(rec));
            } catch(const parse_error& e) {
                // A broken record does not spoil the others
                logging::debug("Skipping record {} of type {}: {}", rec.name, static_cast<uint16_t>(rec.type), e.what());
            }
            pos += length;
        }
    } catch(const parse_error& e) {
        if(rr_count > 0 && rr_read == 0)
            throw;
        result.truncated = true;
        logging::debug("Truncated mDNS message after {} of {} records: {}", rr_read, rr_count, e.what());
    }

    return result;
}

mdns_probe::mdns_probe(const config& conf)
    : m_bind {conf.bind_address},
      m_send_query {conf.mdns_send_query},
      m_service_types {conf.mdns_service_types.empty() ? default_service_types() : conf.mdns_service_types}
{}

std::vector<raw_response> mdns_probe::discover(std::chrono::milliseconds timeout, const std::atomic<bool>& cancelled)
{
    std::string iface;
    try {
        iface = utils::resolve_bind_address(m_bind);
    } catch(const std::runtime_error& e) {
        throw network_unavailable {e.what()};
    }

    // Other responders on this host hold 5353 too, so the port has to be shared
    multicast_socket q_sock {iface, "0.0.0.0", MDNS_MULTICAST_PORT, true};
    q_sock.join_group(MDNS_MULTICAST_IP);
    q_sock.set_ttl(MDNS_MULTICAST_TTL);
    logging::info("Starting mDNS discovery on {}", iface);

    if(m_send_query)
    {
        try {
            for(std::string& query : build_queries(m_service_types))
                q_sock.send_to(MDNS_MULTICAST_IP, MDNS_MULTICAST_PORT, std::move(query));
        } catch(const send_failure& e) {
            // Announcements still arrive without a query
            logging::warn("mDNS query not sent, listening passively: {}", e.what());
        }
    }

    std::vector<raw_response> responses = collect_until(q_sock, timeout, cancelled, "mdns");
    logging::info("mDNS discovery collected {} packet(s)", responses.size());
    return responses;
}

} // namespace discovery
