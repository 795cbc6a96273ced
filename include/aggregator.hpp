#ifndef LANWATCH_AGGREGATOR_HPP
#define LANWATCH_AGGREGATOR_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "config.hpp"
#include "device.hpp"

namespace discovery
{

// Deterministic and idempotent merge of two records for the same identity.
// Without an existing record the incoming one is returned as it is.
device merge(const std::optional<device>& existing, const device& incoming);

struct source_report
{
    protocol source;
    bool failed = false;
    std::string error;
    size_t responses = 0;
    size_t parse_errors = 0;
    size_t devices = 0;
};

enum class round_outcome
{
    published,
    network_failure,    // every probe failed, nothing was published
    cancelled
};

std::string_view to_string(round_outcome outcome);

struct round_report
{
    uint64_t round = 0;
    round_outcome outcome = round_outcome::published;
    sys_clock::time_point started;
    sys_clock::time_point finished;
    std::vector<source_report> sources;

    std::set<protocol> failed_sources() const;
};

struct directory_snapshot
{
    uint64_t version = 0;
    sys_clock::time_point published_at;
    std::vector<device> devices;        // ordered by identity
    round_report report;
};

using snapshot_ptr = std::shared_ptr<const directory_snapshot>;

void to_json(json& j, const source_report& rep);

void to_json(json& j, const round_report& rep);

void to_json(json& j, const directory_snapshot& snap);

class aggregator
{
public:

    aggregator(const aggregator&) = delete;
    aggregator& operator=(const aggregator&) = delete;

    aggregator();

    aggregator(retention_policy policy, std::chrono::seconds expiry, bool correlate_by_address);

    // Merges one round into the directory, applies the retention policy and
    // publishes the result as a new snapshot
    snapshot_ptr apply_round(const std::vector<device>& devices, round_report report);

    // Currently published snapshot, never null
    snapshot_ptr snapshot() const;

private:

    void add(const device& incoming);

    void expire(sys_clock::time_point now, const std::set<protocol>& failed_sources);

    retention_policy m_policy;

    std::chrono::seconds m_expiry;

    bool m_correlate;

    std::map<std::string, device> m_directory;

    std::map<std::string, std::string> m_aliases;       // correlated identity -> stored identity

    std::set<std::string> m_seen;                       // identities stored this round

    std::mutex m_merge_mutex;

    mutable std::mutex m_snapshot_mutex;

    snapshot_ptr m_current;

};

} // namespace discovery

#endif
