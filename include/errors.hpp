#ifndef LANWATCH_ERRORS_HPP
#define LANWATCH_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace discovery
{

// No usable socket or interface, fatal for the probe in this round
class network_unavailable : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// The query datagram could not be sent
class send_failure : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Malformed payload, the record is dropped and the round continues
class parse_error : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

class round_cancelled : public std::runtime_error
{
public:
    round_cancelled()
        : std::runtime_error {"Discovery round cancelled"}
    {}
};

} // namespace discovery

#endif
