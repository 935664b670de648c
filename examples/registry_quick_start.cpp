// Register the MCP servers defined in .mcp.json and invoke one tool.
//
// Usage: mcpbridge_example_registry_quick_start [workspace_dir] [server tool [json_args]]

#include "mcpbridge.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>

int main(int argc, char** argv)
{
    using namespace mcpbridge;

    auto settings = Settings::from_env();
    apply_logging(settings);

    std::filesystem::path workspace =
        argc > 1 ? std::filesystem::path(argv[1]) : std::filesystem::current_path();

    auto registry = Registry::from_settings(settings, {"shell", "file_read", "file_write"});

    std::vector<McpServerConfig> configs;
    try
    {
        configs = load_mcp_configs(workspace);
    }
    catch (const ConfigError& e)
    {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 2;
    }

    for (const auto& config : configs)
    {
        try
        {
            auto tools = registry->add_server(config);
            std::cout << config.name << ": " << tools.size() << " tools" << std::endl;
        }
        catch (const Error& e)
        {
            std::cerr << "Skipping '" << config.name << "': " << e.what() << std::endl;
        }
    }

    auto servers = registry->list_servers();
    std::sort(servers.begin(), servers.end());
    for (const auto& [name, count] : servers)
        std::cout << "  " << name << " (" << count << ")" << std::endl;

    for (const auto& [server, tool] : registry->get_all_tools())
        std::cout << "  " << server << "/" << tool.name << ": " << tool.description.value_or("")
                  << std::endl;

    if (argc > 3)
    {
        std::optional<Json> args;
        try
        {
            if (argc > 4)
                args = Json::parse(argv[4]);
            auto result = registry->call_tool(argv[2], argv[3], args);
            std::cout << (result.is_error() ? "error: " : "") << result.text() << std::endl;
        }
        catch (const Json::parse_error& e)
        {
            std::cerr << "Invalid arguments: " << e.what() << std::endl;
            return 2;
        }
        catch (const Error& e)
        {
            std::cerr << "Call failed: " << e.what() << std::endl;
            return 1;
        }
    }
    return 0;
}
