#include "pfverify/log.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace pfverify::log
{
namespace
{
struct LoggerState
{
    Level level{Level::Warn};
    std::ostream* sink{nullptr};
};

LoggerState& state()
{
    static LoggerState s;
    return s;
}
} // namespace

std::string to_string(Level level)
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warn:
        return "WARN";
    case Level::Error:
        return "ERROR";
    case Level::Off:
        return "OFF";
    }
    return "WARN";
}

std::optional<Level> level_from_string(const std::string& s)
{
    std::string lvl = s;
    std::transform(lvl.begin(), lvl.end(), lvl.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (lvl == "DEBUG")
        return Level::Debug;
    if (lvl == "INFO")
        return Level::Info;
    if (lvl == "WARN" || lvl == "WARNING")
        return Level::Warn;
    if (lvl == "ERROR")
        return Level::Error;
    if (lvl == "OFF")
        return Level::Off;
    return std::nullopt;
}

void set_level(Level level)
{
    state().level = level;
}

Level level()
{
    return state().level;
}

void set_sink(std::ostream* sink)
{
    state().sink = sink;
}

void write(Level lvl, const std::string& message)
{
    auto& s = state();
    if (lvl == Level::Off || lvl < s.level)
        return;
    std::ostream& out = s.sink ? *s.sink : std::cerr;
    out << "[pfverify] " << to_string(lvl) << " " << message << std::endl;
}

} // namespace pfverify::log
