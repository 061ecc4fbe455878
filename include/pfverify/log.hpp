#pragma once
#include <optional>
#include <ostream>
#include <string>

namespace pfverify::log
{

enum class Level
{
    Debug,
    Info,
    Warn,
    Error,
    Off
};

std::string to_string(Level level);

/// Case-insensitive; accepts "warning" for Warn.
std::optional<Level> level_from_string(const std::string& s);

void set_level(Level level);
Level level();

/// Redirects output; nullptr restores std::cerr.
void set_sink(std::ostream* sink);

void write(Level level, const std::string& message);

inline void debug(const std::string& message)
{
    write(Level::Debug, message);
}

inline void info(const std::string& message)
{
    write(Level::Info, message);
}

inline void warn(const std::string& message)
{
    write(Level::Warn, message);
}

inline void error(const std::string& message)
{
    write(Level::Error, message);
}

} // namespace pfverify::log
