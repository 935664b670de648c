#include "mcpbridge/registry.hpp"

#include "mcpbridge/exceptions.hpp"
#include "mcpbridge/util/log.hpp"

#include <numeric>

namespace mcpbridge
{

Registry::Registry(std::size_t tool_cap, std::unordered_set<std::string> builtin_tool_names,
                   client::TransportFactory factory)
    : tool_cap_(tool_cap), builtin_tool_names_(std::move(builtin_tool_names)),
      factory_(factory ? std::move(factory) : client::stdio_transport_factory())
{
}

std::shared_ptr<Registry> Registry::from_settings(const Settings& settings,
                                                  std::unordered_set<std::string> builtins)
{
    client::StdioTransportOptions options;
    options.timeout = settings.request_timeout;
    return std::make_shared<Registry>(settings.tool_cap, std::move(builtins),
                                      client::stdio_transport_factory(options));
}

Registry::~Registry()
{
    std::unordered_map<std::string, Entry> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remaining.swap(servers_);
        tool_owners_.clear();
    }
    for (auto& [name, entry] : remaining)
        close_quietly(name, *entry.client);
}

std::vector<client::ToolInfo> Registry::add_server(const McpServerConfig& config)
{
    log::info("Adding MCP server: " + config.name);

    // Fast fail before spawning anything; admit() re-checks under the same lock as the commit
    if (has_server(config.name))
        throw ServerExistsError(config.name);

    std::unique_ptr<client::ITransport> transport = factory_(config);
    if (!transport)
        throw TransportError("No transport available for MCP server '" + config.name + "'");

    auto client = std::make_shared<client::Client>();
    try
    {
        client->connect(std::move(transport));
    }
    catch (const Error& e)
    {
        log::warning("Failed to connect to MCP server '" + config.name + "': " + e.what());
        throw;
    }

    return admit(config.name, std::move(client), config);
}

std::vector<client::ToolInfo>
Registry::add_server_with_client(const std::string& name, std::shared_ptr<client::Client> client,
                                 const McpServerConfig& config)
{
    if (!client)
        throw Error("add_server_with_client requires a client");
    if (!client->is_ready())
        throw ClientStateError("MCP server '" + name + "' client is not ready (state: " +
                               client::to_string(client->state()) + ")");
    return admit(name, std::move(client), config);
}

std::vector<client::ToolInfo> Registry::admit(const std::string& name,
                                              std::shared_ptr<client::Client> client,
                                              const McpServerConfig& config)
{
    std::vector<client::ToolInfo> tools;
    try
    {
        tools = client->list_tools();
    }
    catch (const Error& e)
    {
        log::warning("Failed to list tools from MCP server '" + name + "': " + e.what());
        close_quietly(name, *client);
        throw;
    }
    log::debug("MCP server '" + name + "' advertised " + std::to_string(tools.size()) +
               " tools");

    {
        std::unique_lock<std::mutex> lock(mutex_);
        try
        {
            validate_locked(name, tools);
        }
        catch (const RegistryError& e)
        {
            lock.unlock();
            log::warning(std::string("Rejected MCP server: ") + e.what());
            close_quietly(name, *client);
            throw;
        }

        Entry entry;
        entry.client = std::move(client);
        entry.config = config;
        entry.config.name = name;
        entry.tools = tools;
        for (const auto& tool : tools)
        {
            entry.tool_names.insert(tool.name);
            tool_owners_[tool.name] = name;
        }
        servers_.emplace(name, std::move(entry));
    }

    log::info("MCP server '" + name + "' added successfully with " +
              std::to_string(tools.size()) + " tools");
    return tools;
}

void Registry::validate_locked(const std::string& name,
                               const std::vector<client::ToolInfo>& tools) const
{
    if (servers_.count(name) > 0)
        throw ServerExistsError(name);

    const std::size_t current = total_tool_count_locked();
    if (current + tools.size() > tool_cap_)
        throw ToolCapExceededError(name, current, tools.size(), tool_cap_);

    std::set<std::string> seen;
    for (const auto& tool : tools)
    {
        if (!seen.insert(tool.name).second)
            throw NameCollisionError(name, tool.name, CollisionKind::SameListing);
        if (builtin_tool_names_.count(tool.name) > 0)
            throw NameCollisionError(name, tool.name, CollisionKind::Builtin);
        auto owner = tool_owners_.find(tool.name);
        if (owner != tool_owners_.end())
            throw NameCollisionError(name, tool.name, CollisionKind::ExistingTool,
                                     owner->second);
    }
}

void Registry::remove_server(const std::string& name)
{
    log::info("Removing MCP server: " + name);

    std::shared_ptr<client::Client> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(name);
        if (it == servers_.end())
            throw ServerNotFoundError(name);
        client = it->second.client;
        for (const auto& tool_name : it->second.tool_names)
            tool_owners_.erase(tool_name);
        servers_.erase(it);
    }

    // Outside the lock: close waits for any in-flight call on this client
    close_quietly(name, *client);
    log::info("MCP server '" + name + "' removed successfully");
}

std::vector<std::pair<std::string, std::size_t>> Registry::list_servers() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<std::string, std::size_t>> out;
    out.reserve(servers_.size());
    for (const auto& [name, entry] : servers_)
        out.emplace_back(name, entry.tools.size());
    return out;
}

std::vector<std::pair<std::string, client::ToolInfo>> Registry::get_all_tools() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<std::string, client::ToolInfo>> out;
    for (const auto& [name, entry] : servers_)
        for (const auto& tool : entry.tools)
            out.emplace_back(name, tool);
    return out;
}

client::CallToolResult Registry::call_tool(const std::string& server_name,
                                           const std::string& tool_name,
                                           const std::optional<Json>& arguments)
{
    log::debug("Calling MCP tool '" + tool_name + "' on server '" + server_name + "'");

    std::shared_ptr<client::Client> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(server_name);
        if (it == servers_.end())
            throw ServerNotFoundError(server_name);
        client = it->second.client;
    }

    return client->call_tool(tool_name, arguments);
}

std::future<client::CallToolResult> Registry::call_tool_async(const std::string& server_name,
                                                              const std::string& tool_name,
                                                              std::optional<Json> arguments)
{
    return std::async(std::launch::async,
                      [this, server_name, tool_name, args = std::move(arguments)]()
                      { return call_tool(server_name, tool_name, args); });
}

bool Registry::has_server(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return servers_.count(name) > 0;
}

std::size_t Registry::server_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return servers_.size();
}

std::size_t Registry::total_tool_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return total_tool_count_locked();
}

std::vector<McpServerConfig> Registry::server_configs() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<McpServerConfig> out;
    out.reserve(servers_.size());
    for (const auto& [name, entry] : servers_)
        out.push_back(entry.config);
    return out;
}

std::size_t Registry::total_tool_count_locked() const
{
    return std::accumulate(servers_.begin(), servers_.end(), std::size_t{0},
                           [](std::size_t sum, const auto& kv)
                           { return sum + kv.second.tools.size(); });
}

void Registry::close_quietly(const std::string& name, client::Client& client)
{
    try
    {
        client.close();
    }
    catch (const std::exception& e)
    {
        log::warning("Failed to close MCP server '" + name + "': " + e.what());
    }
}

// =============================================================================
// SharedRegistry
// =============================================================================

void SharedRegistry::initialize(std::shared_ptr<Registry> registry)
{
    if (!registry)
        throw Error("SharedRegistry::initialize requires a registry");
    std::lock_guard<std::mutex> lock(mutex_);
    if (registry_)
        throw Error("MCP registry is already initialized");
    registry_ = std::move(registry);
}

bool SharedRegistry::initialized() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_ != nullptr;
}

std::shared_ptr<Registry> SharedRegistry::get() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!registry_)
        throw NotInitializedError("MCP registry is not initialized");
    return registry_;
}

void SharedRegistry::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    registry_.reset();
}

} // namespace mcpbridge
