#include "response_parser.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <map>

#include "fmt/format.h"
#include "fmt/ranges.h"

#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace discovery
{

static std::string to_lower(std::string_view view)
{
    std::string lower {view};
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lower;
}

static bool is_device_urn(std::string_view view)
{
    return utils::istarts_with(view, "urn:") && view.find(":device:") != std::string_view::npos;
}

std::string identity_from_usn(std::string_view usn)
{
    usn = utils::trim(usn);
    if(utils::istarts_with(usn, "uuid:"))
        usn.remove_prefix(5);
    usn = usn.substr(0, usn.find("::"));

    if(usn.empty())
        throw parse_error {"USN carries no identifier"};
    return std::string {usn};
}

std::string device_type_from_ssdp(const ssdp_res& res)
{
    if(is_device_urn(res.st))
        return res.st;

    size_t sep = res.usn.find("::");
    if(sep != std::string::npos)
    {
        std::string_view suffix {res.usn.data() + sep + 2, res.usn.size() - sep - 2};
        if(is_device_urn(suffix))
            return std::string {suffix};
    }
    return {};
}

static device parse_ssdp(const raw_response& raw)
{
    ssdp_res res = parse_response(std::string_view {raw.payload.data(), raw.payload.size()});

    device dev;
    dev.identity = identity_from_usn(res.usn);
    dev.discovered_via.insert(protocol::ssdp);
    dev.address = res.location.ip;
    dev.port = res.location.port;
    dev.device_type = device_type_from_ssdp(res);
    dev.raw_metadata = std::move(res.headers);
    dev.first_seen = raw.received_at;
    dev.last_seen = raw.received_at;
    return dev;
}

static bool is_meta_name(std::string_view name)
{
    // Service type enumeration and reverse lookups do not name an instance
    return utils::istarts_with(name, "_services._dns-sd._udp") ||
        (name.size() >= 5 && utils::iequals(name.substr(name.size() - 5), ".arpa"));
}

std::vector<device> resolve_mdns_instances(const std::vector<sourced_record>& records)
{
    struct instance
    {
        std::string name;
        const sourced_record* srv = nullptr;
        const sourced_record* txt = nullptr;
        std::string source;
        sys_clock::time_point seen;
    };

    // Keys are lower case, DNS names compare case insensitively
    std::map<std::string, instance> instances;
    std::multimap<std::string, const sourced_record*> hosts;

    auto touch = [&instances](const std::string& name, const sourced_record& src) -> instance& {
        instance& inst = instances[to_lower(name)];
        if(inst.name.empty())
            inst.name = name;
        if(inst.source.empty() || src.received_at >= inst.seen)
            inst.source = src.source;
        inst.seen = std::max(inst.seen, src.received_at);
        return inst;
    };

    for(const sourced_record& src : records)
    {
        const mdns_record& rec = src.record;
        switch(rec.type)
        {
            case record_type::ptr:
                // TTL 0 is a goodbye announcement
                if(rec.ttl > 0 && !is_meta_name(rec.name) && !is_meta_name(rec.target) &&
                    !strip_first_label(rec.target).empty())
                    touch(rec.target, src);
                break;
            case record_type::srv:
                if(rec.ttl > 0)
                    touch(rec.name, src).srv = &src;
                break;
            case record_type::a:
            case record_type::aaaa:
                hosts.emplace(to_lower(rec.name), &src);
                break;
            default:
                break;
        }
    }

    // TXT records only count for instances announced through PTR or SRV
    for(const sourced_record& src : records)
    {
        if(src.record.type != record_type::txt)
            continue;
        auto it = instances.find(to_lower(src.record.name));
        if(it != instances.end())
            it->second.txt = &src;
    }

    std::vector<device> devices;
    devices.reserve(instances.size());
    for(const auto& [key, inst] : instances)
    {
        device dev;
        dev.identity = inst.name;
        dev.discovered_via.insert(protocol::mdns);
        dev.friendly_name = first_label(inst.name);
        dev.device_type = strip_first_label(inst.name);
        dev.first_seen = inst.seen;
        dev.last_seen = inst.seen;

        if(inst.txt)
        {
            for(const auto& [txt_key, txt_value] : inst.txt->record.txt)
                dev.raw_metadata[MDNS_TXT_PREFIX + txt_key] = txt_value;
        }

        if(inst.srv)
        {
            dev.port = inst.srv->record.port;
            dev.raw_metadata[MDNS_SRV_TARGET_KEY] = inst.srv->record.target;

            // Every address of the target host, IPv4 first
            std::vector<std::string> v4;
            std::vector<std::string> v6;
            auto range = hosts.equal_range(to_lower(inst.srv->record.target));
            for(auto it = range.first; it != range.second; ++it)
            {
                const mdns_record& host = it->second->record;
                std::vector<std::string>& dest = (host.type == record_type::a) ? v4 : v6;
                if(std::find(dest.begin(), dest.end(), host.address) == dest.end())
                    dest.push_back(host.address);
            }
            std::move(v6.begin(), v6.end(), std::back_inserter(v4));

            if(!v4.empty())
            {
                dev.address = v4.front();
                dev.raw_metadata[MDNS_ADDRESSES_KEY] = fmt::format("{}", fmt::join(v4, ","));
            }
        }
        if(dev.address.empty())
            dev.address = (inst.srv) ? inst.srv->source : inst.source;

        devices.push_back(std::move(dev));
    }

    return devices;
}

static std::vector<sourced_record> decode_packet(const raw_response& raw)
{
    mdns_res res = parse_mdns_message(raw.payload);

    std::vector<sourced_record> records;
    if(!res.response)
        return records;

    records.reserve(res.records.size());
    for(mdns_record& rec : res.records)
        records.push_back(sourced_record {std::move(rec), raw.addr, raw.received_at});
    return records;
}

std::vector<device> parse_all(protocol proto, const raw_response& raw)
{
    if(proto == protocol::ssdp)
        return {parse_ssdp(raw)};

    return resolve_mdns_instances(decode_packet(raw));
}

device parse(protocol proto, const raw_response& raw)
{
    std::vector<device> devices = parse_all(proto, raw);
    if(devices.empty())
        throw parse_error {"Response describes no service instance"};
    return std::move(devices.front());
}

std::vector<device> parse_round(protocol proto, const std::vector<raw_response>& responses, size_t& parse_errors)
{
    std::vector<device> devices;

    if(proto == protocol::ssdp)
    {
        for(const raw_response& raw : responses)
        {
            try {
                devices.push_back(parse_ssdp(raw));
            } catch(const parse_error& e) {
                parse_errors++;
                logging::debug("Dropping SSDP response from {}: {}", raw.addr, e.what());
            }
        }
        return devices;
    }

    std::vector<sourced_record> records;
    for(const raw_response& raw : responses)
    {
        try {
            std::vector<sourced_record> packet = decode_packet(raw);
            std::move(packet.begin(), packet.end(), std::back_inserter(records));
        } catch(const parse_error& e) {
            parse_errors++;
            logging::debug("Dropping mDNS packet from {}: {}", raw.addr, e.what());
        }
    }

    devices = resolve_mdns_instances(records);
    for(const device& dev : devices)
        logging::debug("Found mDNS device: {}", dev.identity);
    return devices;
}

} // namespace discovery
