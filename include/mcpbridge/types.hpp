#pragma once
#include <nlohmann/json.hpp>

#include <string>

namespace mcpbridge
{

using Json = nlohmann::json;

constexpr const char* LIBRARY_NAME = "mcpbridge";
constexpr const char* LIBRARY_VERSION = "0.1.0";

/// MCP protocol revision announced during the handshake
constexpr const char* DEFAULT_PROTOCOL_VERSION = "2024-11-05";

} // namespace mcpbridge
