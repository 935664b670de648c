#include "mcpbridge/client/client.hpp"

#include "mcpbridge/util/log.hpp"

namespace mcpbridge::client
{

namespace
{
constexpr std::int64_t INITIALIZE_ID = 1;
} // namespace

const char* to_string(ClientState state)
{
    switch (state)
    {
    case ClientState::Disconnected:
        return "disconnected";
    case ClientState::Connecting:
        return "connecting";
    case ClientState::Ready:
        return "ready";
    case ClientState::Closed:
        return "closed";
    }
    return "unknown";
}

Client::~Client()
{
    close();
}

void Client::connect(std::unique_ptr<ITransport> transport)
{
    if (!transport)
        throw Error("Client::connect requires a transport");

    std::lock_guard<std::mutex> lock(io_mutex_);
    ClientState expected = ClientState::Disconnected;
    if (!state_.compare_exchange_strong(expected, ClientState::Connecting))
        throw ClientStateError(std::string("connect() requires a disconnected client (state: ") +
                               to_string(expected) + ")");

    transport_ = std::move(transport);
    log::debug("Starting MCP client handshake");

    try
    {
        InitializeParams params;
        params.protocolVersion = options_.protocol_version;
        params.clientInfo = options_.client_info;

        jsonrpc::JsonRpcRequest request;
        request.id = jsonrpc::RequestId(INITIALIZE_ID);
        request.method = "initialize";
        request.params = Json(params);
        transport_->send(request);

        auto response = transport_->receive();
        if (response.id != request.id)
            throw ProtocolError("initialize response id " + response.id.to_string() +
                                " does not match request id " + request.id.to_string());
        const Json& result = require_result(response, "initialize");

        InitializeResult init;
        try
        {
            init = result.get<InitializeResult>();
        }
        catch (const Json::exception& e)
        {
            throw ProtocolError(std::string("Invalid initialize result: ") + e.what());
        }

        log::debug("MCP server initialized: protocol=" + init.protocolVersion +
                   ", server=" + init.serverInfo.name + " " + init.serverInfo.version);

        jsonrpc::JsonRpcNotification initialized;
        initialized.method = "notifications/initialized";
        transport_->send_notification(initialized);

        init_result_ = std::move(init);
        next_id_ = INITIALIZE_ID + 1;
        state_ = ClientState::Ready;
        log::debug("MCP client handshake complete");
    }
    catch (const Error&)
    {
        state_ = ClientState::Closed;
        transport_->close();
        throw;
    }
}

std::vector<ToolInfo> Client::list_tools()
{
    auto response = round_trip("tools/list", std::nullopt);
    const Json& result = require_result(response, "tools/list");

    if (!result.is_object() || !result.contains("tools"))
        throw ProtocolError("tools/list result missing 'tools' field");
    if (!result["tools"].is_array())
        throw ProtocolError("tools/list 'tools' field is not an array");

    std::vector<ToolInfo> tools;
    try
    {
        tools = result["tools"].get<std::vector<ToolInfo>>();
    }
    catch (const Json::exception& e)
    {
        throw ProtocolError(std::string("Failed to parse tools list: ") + e.what());
    }

    log::debug("Retrieved " + std::to_string(tools.size()) + " tools");
    return tools;
}

CallToolResult Client::call_tool(const std::string& name, const std::optional<Json>& arguments)
{
    Json params = {{"name", name}};
    if (arguments)
        params["arguments"] = *arguments;

    log::debug("Calling tool: " + name);
    auto response = round_trip("tools/call", std::move(params));
    const Json& result = require_result(response, "tools/call");

    try
    {
        return result.get<CallToolResult>();
    }
    catch (const Json::exception& e)
    {
        throw ProtocolError(std::string("Failed to parse tools/call result: ") + e.what());
    }
}

void Client::close()
{
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (state_ == ClientState::Closed)
        return;
    state_ = ClientState::Closed;
    if (transport_)
    {
        log::debug("Closing MCP client connection");
        transport_->close();
    }
}

std::optional<InitializeResult> Client::initialize_result() const
{
    std::lock_guard<std::mutex> lock(io_mutex_);
    return init_result_;
}

jsonrpc::JsonRpcResponse Client::round_trip(const std::string& method,
                                            std::optional<Json> params)
{
    std::lock_guard<std::mutex> lock(io_mutex_);
    ensure_ready(method);

    jsonrpc::JsonRpcRequest request;
    request.id = jsonrpc::RequestId(next_id_++);
    request.method = method;
    request.params = std::move(params);

    jsonrpc::JsonRpcResponse response;
    try
    {
        transport_->send(request);
        response = transport_->receive();
    }
    catch (const TransportError& e)
    {
        // The connection is gone; later calls fail fast with ClientStateError
        log::warning(method + " failed, closing MCP client: " + e.what());
        state_ = ClientState::Closed;
        transport_->close();
        throw;
    }
    if (response.id != request.id)
        throw ProtocolError(method + " response id " + response.id.to_string() +
                            " does not match request id " + request.id.to_string());
    return response;
}

const Json& Client::require_result(const jsonrpc::JsonRpcResponse& response,
                                   const std::string& method) const
{
    if (response.error && response.result)
        throw ProtocolError(method + " response carries both result and error");
    if (response.error)
        throw ProtocolError(method + " failed: " + response.error->message, *response.error);
    if (!response.result)
        throw ProtocolError(method + " response missing result");
    return *response.result;
}

void Client::ensure_ready(const std::string& operation) const
{
    auto current = state_.load();
    if (current != ClientState::Ready)
        throw ClientStateError(operation + " requires a ready client (state: " +
                               to_string(current) + ")");
}

std::shared_ptr<Client> connect_client(std::unique_ptr<ITransport> transport,
                                       ClientOptions options)
{
    auto client = std::make_shared<Client>(std::move(options));
    client->connect(std::move(transport));
    return client;
}

} // namespace mcpbridge::client
