#pragma once
#include "mcpbridge/types.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace mcpbridge
{

struct Settings
{
    std::string log_level{"INFO"};
    /// Maximum number of MCP tools across all servers
    std::size_t tool_cap{50};
    /// Bound on every request/response round trip (0 = unbounded)
    std::chrono::milliseconds request_timeout{60000};

    static Settings from_env();
    static Settings from_json(const Json& j);
};

/// Set the process-wide log level from settings.log_level
void apply_logging(const Settings& settings);

} // namespace mcpbridge
