#ifndef LANWATCH_LOG_HPP
#define LANWATCH_LOG_HPP

#include <cstdio>
#include <ctime>
#include <string_view>
#include <utility>

#include "fmt/chrono.h"
#include "fmt/format.h"

namespace logging
{

enum class level : int
{
    debug = 0,
    info,
    warn,
    error
};

void set_level(level lvl);

level get_level();

// Accepts debug, info, warn(ing), error; throws std::invalid_argument otherwise
level parse_level(std::string_view name);

void write(level lvl, std::string_view msg);

template<typename... Args>
inline void log(level lvl, fmt::format_string<Args...> format, Args&&... args)
{
    if(lvl < get_level())
        return;
    write(lvl, fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
inline void debug(fmt::format_string<Args...> format, Args&&... args)
{
    log(level::debug, format, std::forward<Args>(args)...);
}

template<typename... Args>
inline void info(fmt::format_string<Args...> format, Args&&... args)
{
    log(level::info, format, std::forward<Args>(args)...);
}

template<typename... Args>
inline void warn(fmt::format_string<Args...> format, Args&&... args)
{
    log(level::warn, format, std::forward<Args>(args)...);
}

template<typename... Args>
inline void error(fmt::format_string<Args...> format, Args&&... args)
{
    log(level::error, format, std::forward<Args>(args)...);
}

} // namespace logging

#endif
