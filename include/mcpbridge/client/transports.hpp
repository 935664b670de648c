#pragma once
/// @file client/transports.hpp
/// @brief Line-delimited JSON-RPC channels to one MCP server
/// @details One message per line. A transport carries at most one outstanding request:
///          callers never send() again before the matching receive() completed.

#include "mcpbridge/config.hpp"
#include "mcpbridge/jsonrpc.hpp"

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mcpbridge::process
{
class Process;
}

namespace mcpbridge::client
{

// ============================================================================
// Transport Interface
// ============================================================================

/// Abstract channel to one MCP server
class ITransport
{
  public:
    virtual ~ITransport() = default;

    /// Write one request line. Throws TransportError.
    virtual void send(const jsonrpc::JsonRpcRequest& request) = 0;

    /// Write one notification line. Throws TransportError.
    virtual void send_notification(const jsonrpc::JsonRpcNotification& notification) = 0;

    /// Block until one response line is available.
    /// Throws TransportError on EOF/closed stream/timeout, ProtocolError on malformed data.
    virtual jsonrpc::JsonRpcResponse receive() = 0;

    /// Release the channel. Idempotent.
    virtual void close() = 0;
};

// ============================================================================
// StdioTransport
// ============================================================================

struct StdioTransportOptions
{
    /// Bound on each receive(); 0 waits forever
    std::chrono::milliseconds timeout{60000};
    /// Time between SIGTERM and SIGKILL in close()
    std::chrono::milliseconds kill_grace{2000};
    /// Child starts from the host environment plus McpServerConfig::env
    bool inherit_environment{true};
    std::string working_directory;
};

/// Spawns an MCP server process and talks to it over its stdin/stdout.
/// The child's stderr is inherited from the host.
class StdioTransport : public ITransport
{
  public:
    /// Spawn config.command with config.args and config.env. Throws TransportError.
    explicit StdioTransport(const McpServerConfig& config, StdioTransportOptions options = {});
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void send(const jsonrpc::JsonRpcRequest& request) override;
    void send_notification(const jsonrpc::JsonRpcNotification& notification) override;
    jsonrpc::JsonRpcResponse receive() override;
    void close() override;

    bool is_open() const;
    /// Child pid, 0 once closed
    int pid() const;

  private:
    void write_line(const std::string& line);
    std::string read_line();
    void shutdown_process();

    std::string name_;
    StdioTransportOptions options_;
    std::unique_ptr<process::Process> process_;
    std::string buffer_;
    bool closed_ = false;
};

// ============================================================================
// QueueTransport
// ============================================================================

/// In-memory transport answering from a pre-loaded response queue.
/// Sent messages are discarded. Used to drive Client and Registry without processes.
class QueueTransport : public ITransport
{
  public:
    QueueTransport() = default;
    explicit QueueTransport(std::vector<jsonrpc::JsonRpcResponse> responses);

    void push(jsonrpc::JsonRpcResponse response);

    void send(const jsonrpc::JsonRpcRequest& request) override;
    void send_notification(const jsonrpc::JsonRpcNotification& notification) override;
    jsonrpc::JsonRpcResponse receive() override;
    void close() override;

    bool is_closed() const;
    std::size_t pending() const;

  private:
    mutable std::mutex mutex_;
    std::deque<jsonrpc::JsonRpcResponse> responses_;
    bool closed_ = false;
};

// ============================================================================
// Factories
// ============================================================================

/// Produces a connected-but-not-initialized transport for a server definition
using TransportFactory =
    std::function<std::unique_ptr<ITransport>(const McpServerConfig& config)>;

/// Factory spawning a StdioTransport per server
TransportFactory stdio_transport_factory(StdioTransportOptions options = {});

} // namespace mcpbridge::client
