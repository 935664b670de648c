#include "mcpbridge/settings.hpp"

#include "mcpbridge/util/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace mcpbridge
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

/// Non-negative integer from an environment variable; unparsable values keep the default
static long long getenv_count(const char* key, long long defv)
{
    const char* v = std::getenv(key);
    if (!v || !*v)
        return defv;
    char* end = nullptr;
    long long parsed = std::strtoll(v, &end, 10);
    if (*end != '\0' || parsed < 0)
        return defv;
    return parsed;
}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = getenv_str("MCPBRIDGE_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    s.log_level = lvl;
    s.tool_cap = static_cast<std::size_t>(
        getenv_count("MCPBRIDGE_TOOL_CAP", static_cast<long long>(s.tool_cap)));
    s.request_timeout = std::chrono::milliseconds(
        getenv_count("MCPBRIDGE_REQUEST_TIMEOUT_MS", s.request_timeout.count()));
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("log_level"))
        s.log_level = j.at("log_level").get<std::string>();
    if (j.contains("tool_cap"))
        s.tool_cap = j.at("tool_cap").get<std::size_t>();
    if (j.contains("request_timeout_ms"))
        s.request_timeout = std::chrono::milliseconds(j.at("request_timeout_ms").get<long long>());
    return s;
}

void apply_logging(const Settings& settings)
{
    log::set_level(log::level_from_string(settings.log_level));
}

} // namespace mcpbridge
