#pragma once
#include <functional>
#include <string>

namespace brewsource::log
{

enum class Level
{
    Debug,
    Info,
    Warning,
    Error
};

const char* to_string(Level level);

/// Parse "debug", "INFO", "warn", ... Unknown names throw ValidationError.
Level parse_level(const std::string& name);

void set_level(Level level);
Level level();

inline bool enabled(Level lvl)
{
    return static_cast<int>(lvl) >= static_cast<int>(level());
}

/// Replace the output sink. Passing an empty function restores the default,
/// which writes "[brewsource] LEVEL message" lines to stderr. stdout is never
/// used so the stdio transport keeps its stream clean.
using Sink = std::function<void(Level, const std::string&)>;
void set_sink(Sink sink);

void write(Level lvl, const std::string& message);

inline void debug(const std::string& message)
{
    if (enabled(Level::Debug))
        write(Level::Debug, message);
}
inline void info(const std::string& message)
{
    if (enabled(Level::Info))
        write(Level::Info, message);
}
inline void warning(const std::string& message)
{
    if (enabled(Level::Warning))
        write(Level::Warning, message);
}
inline void error(const std::string& message)
{
    if (enabled(Level::Error))
        write(Level::Error, message);
}

} // namespace brewsource::log
