#include "multicast_socket.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <set>
#include <stdexcept>

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>

#include "errors.hpp"
#include "log.hpp"

namespace discovery
{

using namespace std::chrono;

// Upper bound for a single poll so a cancellation is noticed promptly
static constexpr milliseconds CANCEL_CHECK_INTERVAL {50};

static in_addr to_in_addr(std::string_view addr)
{
    in_addr result {};
    if(inet_pton(AF_INET, std::string {addr}.c_str(), &result) != 1)
        throw network_unavailable {fmt::format("Invalid IPv4 address '{}'", addr)};
    return result;
}

multicast_socket::multicast_socket(std::string_view interface_addr, std::string_view bind_addr, uint16_t port, bool reuse_port)
try : m_sock {},
      m_interface {interface_addr}
{
    int enable = 1;
    if(setsockopt(m_sock.get(), SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable)) != 0)
        throw network_unavailable {fmt::format("SO_REUSEADDR failed: {}", std::strerror(errno))};
#ifdef SO_REUSEPORT
    if(reuse_port && setsockopt(m_sock.get(), SOL_SOCKET, SO_REUSEPORT, &enable, sizeof(enable)) != 0)
        throw network_unavailable {fmt::format("SO_REUSEPORT failed: {}", std::strerror(errno))};
#endif

    m_sock.bind(bind_addr, port);

    if(m_interface != "0.0.0.0")
    {
        in_addr iface = to_in_addr(m_interface);
        if(setsockopt(m_sock.get(), IPPROTO_IP, IP_MULTICAST_IF, &iface, sizeof(iface)) != 0)
            throw network_unavailable {fmt::format("Can not send multicast on {}: {}", m_interface, std::strerror(errno))};
    }
} catch(const network_unavailable&) {
    throw;
} catch(const std::runtime_error& e) {
    throw network_unavailable {fmt::format("Can not open socket on {}:{}: {}", bind_addr, port, e.what())};
}

multicast_socket::~multicast_socket()
{
    for(const ip_mreq& mreq : m_groups)
    {
        if(setsockopt(m_sock.get(), IPPROTO_IP, IP_DROP_MEMBERSHIP, &mreq, sizeof(mreq)) != 0)
            logging::debug("Leaving multicast group failed: {}", std::strerror(errno));
    }
}

void multicast_socket::join_group(std::string_view group)
{
    ip_mreq mreq {};
    mreq.imr_multiaddr = to_in_addr(group);
    mreq.imr_interface = to_in_addr(m_interface);

    if(setsockopt(m_sock.get(), IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) != 0)
        throw network_unavailable {fmt::format("Can not join multicast group {} on {}: {}", group, m_interface, std::strerror(errno))};
    m_groups.push_back(mreq);
}

void multicast_socket::set_ttl(int ttl)
{
    unsigned char value = static_cast<unsigned char>(ttl);
    if(setsockopt(m_sock.get(), IPPROTO_IP, IP_MULTICAST_TTL, &value, sizeof(value)) != 0)
        logging::warn("Setting multicast TTL failed: {}", std::strerror(errno));
}

void multicast_socket::send_to(std::string_view addr, uint16_t port, std::string payload)
{
    size_t sent = 0;
    try {
        sent = m_sock.send(addr, port, net::span {payload.begin(), payload.end()});
    } catch(const std::runtime_error& e) {
        throw send_failure {fmt::format("Sending to {}:{} failed: {}", addr, port, e.what())};
    }

    if(sent != payload.size())
        throw send_failure {fmt::format("Short send to {}:{} ({} of {} bytes)", addr, port, sent, payload.size())};
}

uint16_t multicast_socket::local_port() const
{
    sockaddr_in local {};
    socklen_t len = sizeof(local);
    if(getsockname(m_sock.get(), reinterpret_cast<sockaddr*>(&local), &len) != 0)
        throw network_unavailable {fmt::format("getsockname failed: {}", std::strerror(errno))};
    return ntohs(local.sin_port);
}

std::optional<raw_response> multicast_socket::receive(steady_clock::time_point deadline, const std::atomic<bool>& cancelled)
{
    while(true)
    {
        if(cancelled.load())
            throw round_cancelled {};

        auto now = steady_clock::now();
        if(now >= deadline)
            return std::nullopt;

        auto wait = std::min(duration_cast<milliseconds>(deadline - now) + milliseconds {1}, CANCEL_CHECK_INTERVAL);

        pollfd pfd {};
        pfd.fd = m_sock.get();
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, static_cast<int>(wait.count()));
        if(ready < 0)
        {
            if(errno == EINTR)
                continue;
            throw std::runtime_error {fmt::format("poll failed: {}", std::strerror(errno))};
        }
        if(ready == 0)
            continue;

        auto [bytes, peer] = m_sock.read(net::span {m_buffer.data(), m_buffer.size()});

        raw_response res;
        res.addr = peer.addr;
        res.port = peer.port;
        res.payload.assign(m_buffer.data(), m_buffer.data() + bytes);
        res.received_at = sys_clock::now();
        return res;
    }
}

std::vector<raw_response> collect_until(multicast_socket& sock, milliseconds timeout,
    const std::atomic<bool>& cancelled, std::string_view tag)
{
    std::set<raw_response> distinct;
    auto deadline = steady_clock::now() + timeout;

    while(true)
    {
        std::optional<raw_response> res;
        try {
            res = sock.receive(deadline, cancelled);
        } catch(const round_cancelled&) {
            throw;
        } catch(const std::runtime_error& e) {
            logging::warn("{}: receive failed, keeping {} response(s): {}", tag, distinct.size(), e.what());
            break;
        }

        if(!res)
            break;

        // Identical announcements from one host are common, keep the first
        std::string sender = res->addr;
        if(distinct.insert(std::move(*res)).second)
            logging::debug("{}: response from {}", tag, sender);
    }

    return std::vector<raw_response> {distinct.begin(), distinct.end()};
}

} // namespace discovery
