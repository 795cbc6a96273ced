#include <atomic>
#include <csignal>
#include <cstdlib>
#include <future>
#include <string_view>

#include <time.h>

#include "fmt/format.h"

#include "config.hpp"
#include "log.hpp"
#include "scheduler.hpp"

static void block_signals(sigset_t* sigset)
{
    sigemptyset(sigset);
    sigaddset(sigset, SIGINT);
    sigaddset(sigset, SIGTERM);
    pthread_sigmask(SIG_BLOCK, sigset, nullptr);
}

static void print_snapshot(const discovery::snapshot_ptr& snap)
{
    if(snap->devices.empty())
        fmt::print(stderr, "No devices found.\n");
    fmt::print("{}\n", json(*snap).dump(2));
}

static void print_usage(const char* prog)
{
    fmt::print("Usage: {} [--watch]\n\n"
        "Without --watch one discovery round runs and the directory is printed as JSON.\n"
        "With --watch the directory is refreshed until SIGINT or SIGTERM.\n"
        "Settings are read from LANWATCH_* environment variables.\n", prog);
}

int main(int argc, char** argv)
{
    bool watch = false;
    for(int i = 1; i < argc; i++)
    {
        std::string_view arg {argv[i]};
        if(arg == "--watch")
        {
            watch = true;
        }
        else
        {
            print_usage(argv[0]);
            return (arg == "--help" || arg == "-h") ? EXIT_SUCCESS : EXIT_FAILURE;
        }
    }

    discovery::config conf;
    try {
        conf = discovery::config_from_env();
    } catch(const std::invalid_argument& e) {
        logging::error("Invalid configuration: {}", e.what());
        return EXIT_FAILURE;
    }
    logging::set_level(conf.log_level);

    // Worker threads inherit the mask, so only the handler below sees the signals
    sigset_t sigset;
    std::atomic<bool> run_condition {true};
    block_signals(&sigset);

    discovery::scheduler sched {conf};

    std::future<void> signal_handler = std::async(std::launch::async, [&run_condition, &sigset, &sched]()
    {
        timespec interval {0, 200 * 1000 * 1000};
        while(run_condition.load())
        {
            if(sigtimedwait(&sigset, nullptr, &interval) > 0)
            {
                logging::info("Shutting down...");
                run_condition.store(false);
                sched.cancel();
            }
        }
    });

    int exit_code = EXIT_SUCCESS;
    if(watch)
    {
        sched.on_publish(print_snapshot);
        sched.start();
        signal_handler.get();
        sched.stop();
    }
    else
    {
        discovery::round_report report = sched.trigger_round();
        run_condition.store(false);
        signal_handler.get();

        switch(report.outcome)
        {
            case discovery::round_outcome::published:
                print_snapshot(sched.get_snapshot());
                break;
            case discovery::round_outcome::network_failure:
                logging::error("Discovery failed, no network socket could be opened");
                exit_code = EXIT_FAILURE;
                break;
            case discovery::round_outcome::cancelled:
                exit_code = EXIT_FAILURE;
                break;
        }
    }

    return exit_code;
}
