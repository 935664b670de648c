#pragma once
/// @file util/log.hpp
/// @brief Minimal leveled logger writing to stderr
/// @details stdout of a stdio MCP process is the protocol channel, so diagnostics
///          always go to stderr. The level is process-wide and thread-safe.

#include <iosfwd>
#include <string>

namespace mcpbridge::log
{

enum class Level
{
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    Off = 4
};

/// Parse "DEBUG", "info", "WARN", ... (unknown names map to Info)
Level level_from_string(const std::string& name);
const char* to_string(Level level);

void set_level(Level level);
Level level();
bool enabled(Level level);

/// Write one line: "[mcpbridge] LEVEL: message"
void write(Level level, const std::string& message);

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

/// Redirect output (tests); nullptr restores std::cerr
void set_sink(std::ostream* sink);

} // namespace mcpbridge::log
