#include "mcpbridge/config.hpp"

#include "mcpbridge/exceptions.hpp"
#include "mcpbridge/util/log.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace mcpbridge
{

namespace fs = std::filesystem;

namespace
{

McpServerConfig parse_entry(const std::string& name, const Json& entry)
{
    if (!entry.is_object())
        throw ConfigError("MCP server '" + name + "' definition must be an object");
    if (!entry.contains("command") || !entry["command"].is_string())
        throw ConfigError("MCP server '" + name + "' is missing a string 'command'");

    McpServerConfig config;
    config.name = name;
    try
    {
        config.command = entry["command"].get<std::string>();
        if (entry.contains("args") && !entry["args"].is_null())
            config.args = entry["args"].get<std::vector<std::string>>();
        if (entry.contains("env") && !entry["env"].is_null())
            config.env = entry["env"].get<std::map<std::string, std::string>>();
    }
    catch (const Json::exception& e)
    {
        throw ConfigError("MCP server '" + name + "' has an invalid definition: " + e.what());
    }
    return config;
}

} // namespace

std::vector<McpServerConfig> parse_mcp_config_json(const Json& document)
{
    if (!document.is_object())
        throw ConfigError("MCP config must be a JSON object");

    std::vector<McpServerConfig> configs;
    auto servers = document.find("mcpServers");
    if (servers == document.end() || servers->is_null())
        return configs;
    if (!servers->is_object())
        throw ConfigError("'mcpServers' must be an object");

    // nlohmann::json objects iterate in key order, so the result is sorted by name
    configs.reserve(servers->size());
    for (const auto& item : servers->items())
        configs.push_back(parse_entry(item.key(), item.value()));
    return configs;
}

std::vector<McpServerConfig> parse_mcp_config(const fs::path& path)
{
    std::error_code ec;
    if (!fs::exists(path, ec))
    {
        if (ec)
            throw ConfigError("Failed to read " + path.string() + ": " + ec.message());
        return {};
    }

    std::ifstream in(path);
    if (!in)
        throw ConfigError("Failed to read " + path.string());
    std::stringstream content;
    content << in.rdbuf();

    Json document;
    try
    {
        document = Json::parse(content.str());
    }
    catch (const Json::parse_error& e)
    {
        throw ConfigError("Failed to parse " + path.string() + " as JSON: " + e.what());
    }

    auto configs = parse_mcp_config_json(document);
    log::debug("Loaded " + std::to_string(configs.size()) + " MCP server definitions from " +
               path.string());
    return configs;
}

std::vector<McpServerConfig> load_mcp_configs(const std::optional<fs::path>& workspace_dir,
                                              const std::optional<fs::path>& home_dir)
{
    if (workspace_dir)
    {
        fs::path workspace_config = *workspace_dir / CONFIG_FILE_NAME;
        if (fs::exists(workspace_config))
            return parse_mcp_config(workspace_config);
    }

    std::optional<fs::path> home = home_dir;
    if (!home)
    {
        if (const char* env_home = std::getenv("HOME"); env_home && *env_home)
            home = fs::path(env_home);
    }
    if (home)
    {
        fs::path global_config = *home / GLOBAL_CONFIG_DIR / CONFIG_FILE_NAME;
        if (fs::exists(global_config))
            return parse_mcp_config(global_config);
    }

    return {};
}

Json to_mcp_config_json(const std::vector<McpServerConfig>& configs)
{
    Json servers = Json::object();
    for (const auto& config : configs)
    {
        servers[config.name] = Json{{"command", config.command},
                                    {"args", config.args},
                                    {"env", config.env}};
    }
    return Json{{"mcpServers", servers}};
}

void save_mcp_config(const fs::path& path, const std::vector<McpServerConfig>& configs)
{
    const std::string text = to_mcp_config_json(configs).dump(2) + "\n";

    fs::path tmp_path = path;
    tmp_path += ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out)
            throw ConfigError("Failed to write temporary MCP config to " + tmp_path.string());
        out << text;
        out.flush();
        if (!out)
            throw ConfigError("Failed to write temporary MCP config to " + tmp_path.string());
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec)
    {
        std::string reason = ec.message();
        fs::remove(tmp_path, ec);
        throw ConfigError("Failed to rename " + tmp_path.string() + " to " + path.string() +
                          ": " + reason);
    }
}

} // namespace mcpbridge
