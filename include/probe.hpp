#ifndef LANWATCH_PROBE_HPP
#define LANWATCH_PROBE_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "device.hpp"

namespace discovery
{

struct raw_response
{
    std::string addr;

    uint16_t port = 0;

    std::vector<char> payload;

    sys_clock::time_point received_at;
};

// Identity of a response is its sender and payload, the receive time is ignored
inline bool operator<(const raw_response& lhs, const raw_response& rhs)
{
    if(lhs.addr != rhs.addr)
        return lhs.addr < rhs.addr;
    if(lhs.port != rhs.port)
        return lhs.port < rhs.port;
    return lhs.payload < rhs.payload;
}

inline bool operator==(const raw_response& lhs, const raw_response& rhs)
{
    return lhs.addr == rhs.addr && lhs.port == rhs.port && lhs.payload == rhs.payload;
}

class probe
{
public:

    virtual ~probe() = default;

    virtual protocol source() const = 0;

    // Collects distinct responses until timeout elapsed.
    // Throws network_unavailable, send_failure or round_cancelled.
    virtual std::vector<raw_response> discover(std::chrono::milliseconds timeout, const std::atomic<bool>& cancelled) = 0;

};

using probe_ptr = std::unique_ptr<probe>;

} // namespace discovery

#endif
