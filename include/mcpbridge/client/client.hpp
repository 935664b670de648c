#pragma once
/// @file client/client.hpp
/// @brief Connection state machine for one MCP server
/// @details Disconnected -> Connecting -> Ready -> Closed.
///
/// connect() sends `initialize` with id 1, requires a matching result carrying
/// protocolVersion/capabilities/serverInfo, then sends `notifications/initialized`.
/// Later requests use ids 2, 3, ... and every response must echo the id just sent.
/// Round trips on one Client are serialised, so at most one request is outstanding.
///
/// Example usage:
/// @code
/// mcpbridge::McpServerConfig cfg{"fs", "npx", {"-y", "server-fs"}, {}};
/// mcpbridge::client::Client client;
/// client.connect(std::make_unique<mcpbridge::client::StdioTransport>(cfg));
/// for (const auto& tool : client.list_tools())
///     std::cout << tool.name << std::endl;
/// auto result = client.call_tool("read_file", Json{{"path", "/tmp/x"}});
/// client.close();
/// @endcode

#include "mcpbridge/client/transports.hpp"
#include "mcpbridge/client/types.hpp"
#include "mcpbridge/exceptions.hpp"
#include "mcpbridge/jsonrpc.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpbridge::client
{

enum class ClientState
{
    Disconnected,
    Connecting,
    Ready,
    Closed
};

const char* to_string(ClientState state);

struct ClientOptions
{
    std::string protocol_version{DEFAULT_PROTOCOL_VERSION};
    Implementation client_info{LIBRARY_NAME, LIBRARY_VERSION};
};

class Client
{
  public:
    Client() = default;
    explicit Client(ClientOptions options) : options_(std::move(options)) {}
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    /// Take ownership of a transport and perform the handshake.
    /// On failure the transport is closed and the client ends up Closed.
    /// Throws ClientStateError unless Disconnected; TransportError/ProtocolError otherwise.
    void connect(std::unique_ptr<ITransport> transport);

    /// tools/list. Requires Ready.
    std::vector<ToolInfo> list_tools();

    /// tools/call with params {name, arguments}. Requires Ready.
    /// A JSON-RPC error response is thrown as ProtocolError carrying the server's error.
    /// A tool-level failure (isError=true) is returned, not thrown.
    CallToolResult call_tool(const std::string& name,
                             const std::optional<Json>& arguments = std::nullopt);

    /// Transition to Closed and close the transport. Idempotent.
    void close();

    ClientState state() const
    {
        return state_.load();
    }
    bool is_ready() const
    {
        return state() == ClientState::Ready;
    }

    /// Handshake result, available once Ready
    std::optional<InitializeResult> initialize_result() const;

  private:
    jsonrpc::JsonRpcResponse round_trip(const std::string& method,
                                        std::optional<Json> params);
    const Json& require_result(const jsonrpc::JsonRpcResponse& response,
                               const std::string& method) const;
    void ensure_ready(const std::string& operation) const;

    ClientOptions options_;
    mutable std::mutex io_mutex_;
    std::atomic<ClientState> state_{ClientState::Disconnected};
    std::unique_ptr<ITransport> transport_;
    std::int64_t next_id_{1};
    std::optional<InitializeResult> init_result_;
};

/// Connect a new client over `transport`
std::shared_ptr<Client> connect_client(std::unique_ptr<ITransport> transport,
                                       ClientOptions options = {});

} // namespace mcpbridge::client
