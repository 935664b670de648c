#pragma once
/// @file config.hpp
/// @brief MCP server definitions and the .mcp.json file format
/// @details File layout:
/// @code
/// {"mcpServers": {"fs": {"command": "npx", "args": ["-y", "server-fs"], "env": {"K": "V"}}}}
/// @endcode

#include "mcpbridge/types.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcpbridge
{

constexpr const char* CONFIG_FILE_NAME = ".mcp.json";
constexpr const char* GLOBAL_CONFIG_DIR = ".mcpbridge";

/// How to launch one MCP server. `name` is its identity inside a Registry.
struct McpServerConfig
{
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    bool operator==(const McpServerConfig& o) const
    {
        return name == o.name && command == o.command && args == o.args && env == o.env;
    }
};

/// Parse a .mcp.json file.
/// A missing file yields an empty list. Unreadable files, malformed JSON and entries
/// without "command" throw ConfigError. Results are ordered by server name.
std::vector<McpServerConfig> parse_mcp_config(const std::filesystem::path& path);

/// Parse the "mcpServers" document itself (no file access)
std::vector<McpServerConfig> parse_mcp_config_json(const Json& document);

/// Search <workspace_dir>/.mcp.json, then <home_dir>/.mcpbridge/.mcp.json.
/// home_dir defaults to $HOME. The first existing file wins; none yields an empty list.
std::vector<McpServerConfig>
load_mcp_configs(const std::optional<std::filesystem::path>& workspace_dir,
                 const std::optional<std::filesystem::path>& home_dir = std::nullopt);

/// Write configs in .mcp.json format via <path>.tmp + rename
void save_mcp_config(const std::filesystem::path& path,
                     const std::vector<McpServerConfig>& configs);

Json to_mcp_config_json(const std::vector<McpServerConfig>& configs);

} // namespace mcpbridge
