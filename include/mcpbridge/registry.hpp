#pragma once
/// @file registry.hpp
/// @brief Owner of all live MCP server connections and of the shared tool namespace
/// @details Every registered tool name is unique across servers and disjoint from the
///          builtin names; the total never exceeds the tool cap. A server entry exists
///          only while its Client is Ready. Admission is all-or-nothing: a rejected
///          server leaves no trace and its client is closed.
///
/// Slow I/O (spawn, handshake, tools/list, tools/call) never runs under the registry
/// lock. The cap/collision check and the commit form one critical section.

#include "mcpbridge/client/client.hpp"
#include "mcpbridge/client/transports.hpp"
#include "mcpbridge/client/types.hpp"
#include "mcpbridge/config.hpp"
#include "mcpbridge/settings.hpp"

#include <cstddef>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace mcpbridge
{

class Registry
{
  public:
    /// @param tool_cap Maximum number of MCP tools across all servers
    /// @param builtin_tool_names Names no server may ever claim
    /// @param factory Transport resolver for add_server (defaults to spawning processes)
    Registry(std::size_t tool_cap, std::unordered_set<std::string> builtin_tool_names,
             client::TransportFactory factory = nullptr);

    /// Registry configured from settings (cap and request timeout)
    static std::shared_ptr<Registry> from_settings(const Settings& settings,
                                                   std::unordered_set<std::string> builtins);

    ~Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    /// Spawn/attach, connect, list tools, validate, commit.
    /// Throws ServerExistsError, ToolCapExceededError, NameCollisionError,
    /// TransportError or ProtocolError.
    std::vector<client::ToolInfo> add_server(const McpServerConfig& config);

    /// Same admission for an already-connected client; tools are listed through it.
    std::vector<client::ToolInfo> add_server_with_client(const std::string& name,
                                                         std::shared_ptr<client::Client> client,
                                                         const McpServerConfig& config);

    /// Unregister, free its tool names and close its client (close errors are logged).
    /// Throws ServerNotFoundError.
    void remove_server(const std::string& name);

    /// (server name, tool count) pairs, unordered
    std::vector<std::pair<std::string, std::size_t>> list_servers() const;

    /// (server name, tool) for every registered tool
    std::vector<std::pair<std::string, client::ToolInfo>> get_all_tools() const;

    /// Forward to the server's client without holding the registry lock.
    /// Throws ServerNotFoundError; the tool name itself is validated by the server.
    client::CallToolResult call_tool(const std::string& server_name,
                                     const std::string& tool_name,
                                     const std::optional<Json>& arguments = std::nullopt);

    /// call_tool on a worker thread. The registry must outlive the returned future.
    std::future<client::CallToolResult>
    call_tool_async(const std::string& server_name, const std::string& tool_name,
                    std::optional<Json> arguments = std::nullopt);

    bool has_server(const std::string& name) const;
    std::size_t server_count() const;
    std::size_t total_tool_count() const;
    std::vector<McpServerConfig> server_configs() const;

    std::size_t tool_cap() const
    {
        return tool_cap_;
    }
    const std::unordered_set<std::string>& builtin_tool_names() const
    {
        return builtin_tool_names_;
    }

  private:
    struct Entry
    {
        std::shared_ptr<client::Client> client;
        McpServerConfig config;
        std::vector<client::ToolInfo> tools;
        std::set<std::string> tool_names;
    };

    std::vector<client::ToolInfo> admit(const std::string& name,
                                        std::shared_ptr<client::Client> client,
                                        const McpServerConfig& config);
    /// Throws on any violation. Caller holds mutex_.
    void validate_locked(const std::string& name,
                         const std::vector<client::ToolInfo>& tools) const;
    std::size_t total_tool_count_locked() const;
    static void close_quietly(const std::string& name, client::Client& client);

    const std::size_t tool_cap_;
    const std::unordered_set<std::string> builtin_tool_names_;
    client::TransportFactory factory_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> servers_;
    /// tool name -> owning server
    std::map<std::string, std::string> tool_owners_;
};

/// Explicitly initialized holder for a process-wide Registry
class SharedRegistry
{
  public:
    SharedRegistry() = default;

    /// Install the registry. Throws Error if one is already installed.
    void initialize(std::shared_ptr<Registry> registry);
    bool initialized() const;
    /// Throws NotInitializedError before initialize()
    std::shared_ptr<Registry> get() const;
    /// Drop the registry (servers are closed once the last holder releases it)
    void reset();

  private:
    mutable std::mutex mutex_;
    std::shared_ptr<Registry> registry_;
};

} // namespace mcpbridge
