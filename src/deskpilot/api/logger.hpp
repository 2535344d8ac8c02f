#pragma once

#include <functional>
#include <string>

namespace deskpilot
{

// Host-provided log sinks. Any member may be left empty.
struct Logger
{
    std::function<void(const std::string&)> info;
    std::function<void(const std::string&)> debug;
    std::function<void(const std::string&)> warn;
    std::function<void(const std::string&)> error;
};

} // namespace deskpilot
