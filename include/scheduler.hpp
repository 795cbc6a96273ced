#ifndef LANWATCH_SCHEDULER_HPP
#define LANWATCH_SCHEDULER_HPP

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <string_view>
#include <thread>
#include <vector>

#include "aggregator.hpp"
#include "config.hpp"
#include "probe.hpp"

namespace discovery
{

enum class scheduler_state
{
    idle,
    running,        // probes in flight
    aggregating,
    published
};

std::string_view to_string(scheduler_state state);

class scheduler
{
public:

    using publish_callback = std::function<void(const snapshot_ptr&)>;

    scheduler() = delete;
    scheduler(const scheduler&) = delete;
    scheduler& operator=(const scheduler&) = delete;
    scheduler(scheduler&&) = delete;
    scheduler& operator=(scheduler&&) = delete;
    ~scheduler();

    // Uses the SSDP and mDNS probes
    explicit scheduler(const config& conf);

    scheduler(const config& conf, probe_ptr ssdp, probe_ptr mdns);

    // Runs one round on the calling thread. Rounds never overlap, a second
    // caller waits for the round in flight to finish. The publish callback
    // runs after the round is over and may trigger the next one; an exception
    // it throws reaches the caller.
    round_report trigger_round();

    std::future<round_report> trigger_round_async();

    snapshot_ptr get_snapshot() const
    {
        return m_aggregator.snapshot();
    }

    // Continuous refresh, one round every refresh_interval until stop()
    void start();

    void stop();

    // Aborts the round in flight, or the next one if none is running.
    // A cancelled round ends without publishing.
    void cancel();

    void on_publish(publish_callback callback);

    scheduler_state state() const
    {
        return m_state.load();
    }

private:

    std::chrono::milliseconds timeout_for(protocol proto) const;

    // Body of trigger_round, called with the round lock held
    round_report run_round(snapshot_ptr& published);

    void run_loop();

    config m_config;

    std::vector<probe_ptr> m_probes;

    aggregator m_aggregator;

    std::mutex m_round_mutex;

    std::atomic<bool> m_cancel {false};

    std::atomic<scheduler_state> m_state {scheduler_state::idle};

    uint64_t m_round_count = 0;

    std::mutex m_callback_mutex;

    publish_callback m_on_publish;

    std::thread m_worker;

    std::mutex m_loop_mutex;

    std::condition_variable m_loop_cv;

    bool m_running = false;

};

} // namespace discovery

#endif
