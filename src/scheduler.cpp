#include "scheduler.hpp"

#include <exception>
#include <iterator>
#include <utility>

#include "errors.hpp"
#include "log.hpp"
#include "mdns_discovery.hpp"
#include "response_parser.hpp"
#include "ssdp_discovery.hpp"

namespace discovery
{

std::string_view to_string(scheduler_state state)
{
    switch(state)
    {
        case scheduler_state::idle:
            return "idle";
        case scheduler_state::running:
            return "running";
        case scheduler_state::aggregating:
            return "aggregating";
        case scheduler_state::published:
            return "published";
    }
    return "unknown";
}

namespace
{

struct probe_outcome
{
    std::vector<raw_response> responses;
    bool failed = false;
    bool cancelled = false;
    std::string error;
};

} // namespace

scheduler::scheduler(const config& conf)
    : scheduler {conf, std::make_unique<ssdp_probe>(conf), std::make_unique<mdns_probe>(conf)}
{}

scheduler::scheduler(const config& conf, probe_ptr ssdp, probe_ptr mdns)
    : m_config {conf},
      m_aggregator {conf.retention, conf.expiry, conf.correlate_by_address}
{
    m_probes.push_back(std::move(ssdp));
    m_probes.push_back(std::move(mdns));
}

scheduler::~scheduler()
{
    stop();
}

std::chrono::milliseconds scheduler::timeout_for(protocol proto) const
{
    return (proto == protocol::ssdp) ? m_config.ssdp_timeout : m_config.mdns_timeout;
}

round_report scheduler::trigger_round()
{
    snapshot_ptr published;
    round_report report;
    {
        std::lock_guard<std::mutex> lock {m_round_mutex};
        report = run_round(published);
    }

    // Called without the round lock so the callback may start another round
    if(published)
    {
        publish_callback callback;
        {
            std::lock_guard<std::mutex> cb_lock {m_callback_mutex};
            callback = m_on_publish;
        }
        if(callback)
            callback(published);
    }
    return report;
}

round_report scheduler::run_round(snapshot_ptr& published)
{
    round_report report;
    report.round = ++m_round_count;
    report.started = sys_clock::now();
    m_state.store(scheduler_state::running);

    // Both probes run at the same time, the round takes as long as the slower one
    std::vector<std::future<probe_outcome>> pending;
    pending.reserve(m_probes.size());
    for(const probe_ptr& pr : m_probes)
    {
        probe* p = pr.get();
        std::chrono::milliseconds timeout = timeout_for(p->source());
        pending.push_back(std::async(std::launch::async, [this, p, timeout]() {
            probe_outcome outcome;
            try {
                outcome.responses = p->discover(timeout, m_cancel);
            } catch(const round_cancelled&) {
                outcome.cancelled = true;
            } catch(const network_unavailable& e) {
                outcome.failed = true;
                outcome.error = e.what();
            } catch(const send_failure& e) {
                outcome.failed = true;
                outcome.error = e.what();
            } catch(const std::exception& e) {
                outcome.failed = true;
                outcome.error = fmt::format("Unexpected probe failure: {}", e.what());
            }
            return outcome;
        }));
    }

    std::vector<probe_outcome> outcomes;
    outcomes.reserve(pending.size());
    for(auto& fut : pending)
        outcomes.push_back(fut.get());

    // A cancel() issued before or during the round applies to this round only
    bool cancelled = m_cancel.exchange(false);
    bool all_failed = true;
    for(size_t i = 0; i < outcomes.size(); i++)
    {
        cancelled = cancelled || outcomes[i].cancelled;
        all_failed = all_failed && outcomes[i].failed;

        source_report src;
        src.source = m_probes[i]->source();
        src.failed = outcomes[i].failed;
        src.error = outcomes[i].error;
        src.responses = outcomes[i].responses.size();
        report.sources.push_back(std::move(src));

        if(outcomes[i].failed)
            logging::warn("{} discovery failed: {}", to_string(m_probes[i]->source()), outcomes[i].error);
    }

    if(cancelled)
    {
        report.outcome = round_outcome::cancelled;
        report.finished = sys_clock::now();
        m_state.store(scheduler_state::idle);
        logging::info("Round {} cancelled, keeping directory version {}", report.round, get_snapshot()->version);
        return report;
    }

    if(all_failed)
    {
        report.outcome = round_outcome::network_failure;
        report.finished = sys_clock::now();
        m_state.store(scheduler_state::idle);
        logging::error("Round {} failed, no discovery socket could be used", report.round);
        return report;
    }

    m_state.store(scheduler_state::aggregating);
    std::vector<device> devices;
    for(size_t i = 0; i < outcomes.size(); i++)
    {
        source_report& src = report.sources[i];
        std::vector<device> parsed = parse_round(src.source, outcomes[i].responses, src.parse_errors);
        src.devices = parsed.size();
        logging::info("{}: {} response(s), {} device(s), {} parse error(s)",
            to_string(src.source), src.responses, src.devices, src.parse_errors);
        std::move(parsed.begin(), parsed.end(), std::back_inserter(devices));
    }

    report.finished = sys_clock::now();
    published = m_aggregator.apply_round(devices, std::move(report));
    m_state.store(scheduler_state::published);
    m_state.store(scheduler_state::idle);
    return published->report;
}

std::future<round_report> scheduler::trigger_round_async()
{
    return std::async(std::launch::async, [this]() {
        return trigger_round();
    });
}

void scheduler::start()
{
    std::lock_guard<std::mutex> lock {m_loop_mutex};
    if(m_running)
        return;

    m_running = true;
    m_worker = std::thread {&scheduler::run_loop, this};
}

void scheduler::stop()
{
    {
        std::lock_guard<std::mutex> lock {m_loop_mutex};
        if(!m_running)
            return;
        m_running = false;
    }

    cancel();
    m_loop_cv.notify_all();
    if(m_worker.joinable())
        m_worker.join();
    m_cancel.store(false);
}

void scheduler::cancel()
{
    m_cancel.store(true);
}

void scheduler::on_publish(publish_callback callback)
{
    std::lock_guard<std::mutex> lock {m_callback_mutex};
    m_on_publish = std::move(callback);
}

void scheduler::run_loop()
{
    while(true)
    {
        {
            std::lock_guard<std::mutex> lock {m_loop_mutex};
            if(!m_running)
                break;
        }

        try {
            round_report report = trigger_round();
            if(report.outcome == round_outcome::network_failure)
                logging::warn("Keeping directory version {} after failed round", get_snapshot()->version);
        } catch(const std::exception& e) {
            // Only the publish callback throws out of a round
            logging::error("Publish callback failed: {}", e.what());
        }

        std::unique_lock<std::mutex> lock {m_loop_mutex};
        m_loop_cv.wait_for(lock, m_config.refresh_interval, [this]() {
            return !m_running;
        });
    }
}

} // namespace discovery
