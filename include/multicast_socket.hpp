#ifndef LANWATCH_MULTICAST_SOCKET_HPP
#define LANWATCH_MULTICAST_SOCKET_HPP

#include <array>
#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <netinet/in.h>

#include "socketwrapper.hpp"
#include "probe.hpp"

namespace discovery
{

// UDP socket owned by one probe for the length of one discover() call.
// Group memberships are dropped and the socket closed on destruction.
class multicast_socket
{
public:

    using steady_clock = std::chrono::steady_clock;

    multicast_socket() = delete;
    multicast_socket(const multicast_socket&) = delete;
    multicast_socket& operator=(const multicast_socket&) = delete;
    multicast_socket(multicast_socket&&) = delete;
    multicast_socket& operator=(multicast_socket&&) = delete;
    ~multicast_socket();

    // Throws network_unavailable if the socket can not be opened or bound
    multicast_socket(std::string_view interface_addr, std::string_view bind_addr, uint16_t port, bool reuse_port);

    void join_group(std::string_view group);

    void set_ttl(int ttl);

    // Throws send_failure
    void send_to(std::string_view addr, uint16_t port, std::string payload);

    // Waits for one datagram until the deadline passes, std::nullopt on deadline.
    // Throws round_cancelled as soon as the flag is observed.
    std::optional<raw_response> receive(steady_clock::time_point deadline, const std::atomic<bool>& cancelled);

    const std::string& interface_addr() const
    {
        return m_interface;
    }

    // Port the socket is bound to, resolves an ephemeral port 0
    uint16_t local_port() const;

private:

    net::udp_socket<net::ip_version::v4> m_sock;

    std::string m_interface;

    std::vector<ip_mreq> m_groups;

    std::array<char, 9000> m_buffer;

};

// Receives until the deadline and keeps every distinct (sender, payload) pair.
// Receive errors end the collection with what was gathered so far.
std::vector<raw_response> collect_until(multicast_socket& sock, std::chrono::milliseconds timeout,
    const std::atomic<bool>& cancelled, std::string_view tag);

} // namespace discovery

#endif
