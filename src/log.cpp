#include "log.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>

namespace logging
{

static std::atomic<int> g_level {static_cast<int>(level::info)};
static std::mutex g_write_mutex;

static std::string_view level_tag(level lvl)
{
    switch(lvl)
    {
        case level::debug:
            return "DEBUG";
        case level::info:
            return "INFO";
        case level::warn:
            return "WARN";
        case level::error:
            return "ERROR";
    }
    return "";
}

void set_level(level lvl)
{
    g_level.store(static_cast<int>(lvl));
}

level get_level()
{
    return static_cast<level>(g_level.load());
}

level parse_level(std::string_view name)
{
    if(name == "debug")
        return level::debug;
    else if(name == "info")
        return level::info;
    else if(name == "warn" || name == "warning")
        return level::warn;
    else if(name == "error")
        return level::error;

    throw std::invalid_argument {fmt::format("Unknown log level '{}'", name)};
}

void write(level lvl, std::string_view msg)
{
    std::time_t now = std::time(nullptr);

    // Lines from both probe threads must not interleave
    std::lock_guard<std::mutex> lock {g_write_mutex};
    fmt::print(stderr, "{:%Y-%m-%d %H:%M:%S} - {} - {}\n", fmt::localtime(now), level_tag(lvl), msg);
}

} // namespace logging
