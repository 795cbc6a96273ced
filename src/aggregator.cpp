#include "aggregator.hpp"

#include <algorithm>

#include "log.hpp"

namespace discovery
{

device merge(const std::optional<device>& existing, const device& incoming)
{
    if(!existing)
        return incoming;

    device merged = *existing;

    // Addresses move, descriptive fields only get filled in
    if(!incoming.address.empty())
        merged.address = incoming.address;
    if(incoming.port != 0)
        merged.port = incoming.port;

    if(merged.friendly_name.empty())
        merged.friendly_name = incoming.friendly_name;
    if(merged.device_type.empty())
        merged.device_type = incoming.device_type;

    for(const auto& [key, value] : incoming.raw_metadata)
        merged.raw_metadata[key] = value;

    merged.discovered_via.insert(incoming.discovered_via.begin(), incoming.discovered_via.end());
    merged.first_seen = std::min(merged.first_seen, incoming.first_seen);
    merged.last_seen = std::max(merged.last_seen, incoming.last_seen);

    return merged;
}

std::string_view to_string(round_outcome outcome)
{
    switch(outcome)
    {
        case round_outcome::published:
            return "published";
        case round_outcome::network_failure:
            return "network_failure";
        case round_outcome::cancelled:
            return "cancelled";
    }
    return "unknown";
}

std::set<protocol> round_report::failed_sources() const
{
    std::set<protocol> failed;
    for(const source_report& rep : sources)
    {
        if(rep.failed)
            failed.insert(rep.source);
    }
    return failed;
}

void to_json(json& j, const source_report& rep)
{
    j = json {
        {"source", std::string {to_string(rep.source)}},
        {"failed", rep.failed},
        {"error", rep.error},
        {"responses", rep.responses},
        {"parse_errors", rep.parse_errors},
        {"devices", rep.devices}
    };
}

void to_json(json& j, const round_report& rep)
{
    j = json {
        {"round", rep.round},
        {"outcome", std::string {to_string(rep.outcome)}},
        {"started", format_timestamp(rep.started)},
        {"finished", format_timestamp(rep.finished)},
        {"sources", rep.sources}
    };
}

void to_json(json& j, const directory_snapshot& snap)
{
    j = json {
        {"version", snap.version},
        {"published_at", format_timestamp(snap.published_at)},
        {"devices", snap.devices},
        {"report", snap.report}
    };
}

aggregator::aggregator()
    : aggregator {retention_policy::refresh_with_expiry, std::chrono::seconds {300}, true}
{}

aggregator::aggregator(retention_policy policy, std::chrono::seconds expiry, bool correlate_by_address)
    : m_policy {policy},
      m_expiry {expiry},
      m_correlate {correlate_by_address},
      m_current {std::make_shared<directory_snapshot>()}
{}

snapshot_ptr aggregator::apply_round(const std::vector<device>& devices, round_report report)
{
    // One coarse lock around merge and publish, readers only ever see m_current
    std::lock_guard<std::mutex> lock {m_merge_mutex};

    m_seen.clear();
    for(const device& dev : devices)
        add(dev);
    expire(report.finished, report.failed_sources());

    auto next = std::make_shared<directory_snapshot>();
    next->published_at = report.finished;
    next->devices.reserve(m_directory.size());
    for(const auto& [identity, dev] : m_directory)
        next->devices.push_back(dev);
    next->report = std::move(report);

    {
        std::lock_guard<std::mutex> snap_lock {m_snapshot_mutex};
        next->version = m_current->version + 1;
        m_current = next;
    }

    logging::info("Published directory version {} with {} device(s)", next->version, next->devices.size());
    return next;
}

snapshot_ptr aggregator::snapshot() const
{
    std::lock_guard<std::mutex> lock {m_snapshot_mutex};
    return m_current;
}

void aggregator::add(const device& incoming)
{
    std::string key = incoming.identity;
    auto alias = m_aliases.find(key);
    if(alias != m_aliases.end() && m_directory.count(alias->second) > 0)
        key = alias->second;

    auto it = m_directory.find(key);
    if(it == m_directory.end() && m_correlate && !incoming.address.empty())
    {
        // Same host answering through the other protocol
        it = std::find_if(m_directory.begin(), m_directory.end(), [&incoming](const auto& entry) {
            const device& stored = entry.second;
            return stored.address == incoming.address &&
                std::none_of(incoming.discovered_via.begin(), incoming.discovered_via.end(), [&stored](protocol proto) {
                    return stored.seen_via(proto);
                });
        });
        if(it != m_directory.end())
        {
            logging::debug("Correlated {} with {} at {}", incoming.identity, it->first, incoming.address);
            m_aliases[incoming.identity] = it->first;
        }
    }

    if(it == m_directory.end())
    {
        it = m_directory.emplace(incoming.identity, incoming).first;
    }
    else
    {
        it->second = merge(it->second, incoming);
    }
    m_seen.insert(it->first);
}

void aggregator::expire(sys_clock::time_point now, const std::set<protocol>& failed_sources)
{
    for(auto it = m_directory.begin(); it != m_directory.end(); )
    {
        const device& dev = it->second;
        bool keep = m_seen.count(it->first) > 0;

        // Nothing new is known about devices whose only sources failed this round
        if(!keep && !failed_sources.empty())
        {
            keep = std::all_of(dev.discovered_via.begin(), dev.discovered_via.end(), [&failed_sources](protocol proto) {
                return failed_sources.count(proto) > 0;
            });
        }

        if(!keep && m_policy == retention_policy::refresh_with_expiry)
            keep = now - dev.last_seen <= m_expiry;

        if(keep)
        {
            ++it;
            continue;
        }

        logging::debug("Expiring {}", it->first);
        for(auto alias = m_aliases.begin(); alias != m_aliases.end(); )
        {
            if(alias->second == it->first)
                alias = m_aliases.erase(alias);
            else
                ++alias;
        }
        it = m_directory.erase(it);
    }
}

} // namespace discovery
