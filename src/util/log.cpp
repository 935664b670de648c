#include "mcpbridge/util/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace mcpbridge::log
{

namespace
{
std::atomic<int> g_level{static_cast<int>(Level::Info)};
std::mutex g_write_mutex;
std::ostream* g_sink = nullptr;
} // namespace

Level level_from_string(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG" || upper == "TRACE")
        return Level::Debug;
    if (upper == "WARNING" || upper == "WARN")
        return Level::Warning;
    if (upper == "ERROR" || upper == "CRITICAL")
        return Level::Error;
    if (upper == "OFF" || upper == "NONE")
        return Level::Off;
    return Level::Info;
}

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
    case Level::Off:
        return "OFF";
    }
    return "INFO";
}

void set_level(Level level)
{
    g_level.store(static_cast<int>(level));
}

Level level()
{
    return static_cast<Level>(g_level.load());
}

bool enabled(Level level)
{
    return level != Level::Off && static_cast<int>(level) >= g_level.load();
}

void write(Level level, const std::string& message)
{
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::ostream& out = g_sink ? *g_sink : std::cerr;
    out << "[mcpbridge] " << to_string(level) << ": " << message << '\n';
    out.flush();
}

void set_sink(std::ostream* sink)
{
    std::lock_guard<std::mutex> lock(g_write_mutex);
    g_sink = sink;
}

} // namespace mcpbridge::log
