#include "brewsource/util/log.hpp"

#include "brewsource/exceptions.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace brewsource::log
{

namespace
{
std::atomic<int> g_level{static_cast<int>(Level::Info)};
std::mutex g_sink_mutex;
Sink g_sink;
} // namespace

const char* to_string(Level level)
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warning:
        return "WARNING";
    case Level::Error:
        return "ERROR";
    }
    return "INFO";
}

Level parse_level(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
    if (upper == "DEBUG" || upper == "TRACE")
        return Level::Debug;
    if (upper == "INFO")
        return Level::Info;
    if (upper == "WARNING" || upper == "WARN")
        return Level::Warning;
    if (upper == "ERROR" || upper == "CRITICAL")
        return Level::Error;
    throw ValidationError("unknown log level: " + name);
}

void set_level(Level level)
{
    g_level = static_cast<int>(level);
}

Level level()
{
    return static_cast<Level>(g_level.load());
}

void set_sink(Sink sink)
{
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = std::move(sink);
}

void write(Level lvl, const std::string& message)
{
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    if (g_sink)
    {
        g_sink(lvl, message);
        return;
    }
    std::cerr << "[brewsource] " << to_string(lvl) << " " << message << std::endl;
}

} // namespace brewsource::log
