#include "mcpbridge/client/transports.hpp"

#include "../internal/process.hpp"
#include "mcpbridge/exceptions.hpp"
#include "mcpbridge/util/log.hpp"

#include <algorithm>
#include <limits>

namespace mcpbridge::client
{

namespace
{
/// Refuse to buffer an unbounded line from a misbehaving server
constexpr size_t MAX_LINE_BYTES = 64 * 1024 * 1024;
constexpr size_t READ_CHUNK = 4096;
} // namespace

// =============================================================================
// StdioTransport implementation
// =============================================================================

StdioTransport::StdioTransport(const McpServerConfig& config, StdioTransportOptions options)
    : name_(config.name.empty() ? config.command : config.name), options_(std::move(options)),
      process_(std::make_unique<process::Process>())
{
    log::info("Spawning MCP server '" + name_ + "': " + config.command + " with " +
              std::to_string(config.args.size()) + " args");

    process::ProcessOptions popts;
    popts.environment = config.env;
    popts.inherit_environment = options_.inherit_environment;
    popts.working_directory = options_.working_directory;
    try
    {
        process_->spawn(config.command, config.args, popts);
    }
    catch (const process::ProcessError& e)
    {
        closed_ = true;
        throw TransportError("Failed to spawn MCP server '" + name_ + "': " + e.what());
    }

    log::debug("MCP server '" + name_ + "' spawned with pid " + std::to_string(pid()));
}

StdioTransport::~StdioTransport()
{
    close();
}

void StdioTransport::send(const jsonrpc::JsonRpcRequest& request)
{
    log::debug("Sending JSON-RPC request to '" + name_ + "': method=" + request.method +
               " id=" + request.id.to_string());
    write_line(jsonrpc::encode(request));
}

void StdioTransport::send_notification(const jsonrpc::JsonRpcNotification& notification)
{
    log::debug("Sending JSON-RPC notification to '" + name_ + "': method=" +
               notification.method);
    write_line(jsonrpc::encode(notification));
}

jsonrpc::JsonRpcResponse StdioTransport::receive()
{
    while (true)
    {
        Json message = jsonrpc::parse_line(read_line());
        if (jsonrpc::is_notification(message))
        {
            log::debug("Skipping notification from '" + name_ +
                       "': method=" + message.value("method", std::string()));
            continue;
        }
        auto response = jsonrpc::decode_response(message);
        log::debug("Received JSON-RPC response from '" + name_ +
                   "': id=" + response.id.to_string());
        return response;
    }
}

void StdioTransport::close()
{
    if (closed_)
        return;
    closed_ = true;
    buffer_.clear();
    shutdown_process();
}

bool StdioTransport::is_open() const
{
    return !closed_;
}

int StdioTransport::pid() const
{
    return process_ ? process_->pid() : 0;
}

void StdioTransport::write_line(const std::string& line)
{
    if (closed_)
        throw TransportError("Transport to MCP server '" + name_ + "' is closed");
    try
    {
        process_->stdin_pipe().write(line + "\n");
    }
    catch (const process::ProcessError& e)
    {
        throw TransportError("Failed to write to MCP server '" + name_ + "': " + e.what());
    }
}

std::string StdioTransport::read_line()
{
    using clock = std::chrono::steady_clock;
    const bool bounded = options_.timeout.count() > 0;
    const auto deadline = clock::now() + options_.timeout;

    while (true)
    {
        auto newline = buffer_.find('\n');
        if (newline != std::string::npos)
        {
            std::string line = buffer_.substr(0, newline);
            buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            return line;
        }

        if (closed_)
            throw TransportError("Transport to MCP server '" + name_ + "' is closed");

        int wait_ms = -1;
        if (bounded)
        {
            auto remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
            wait_ms = static_cast<int>(std::clamp<long long>(
                remaining.count(), 0, std::numeric_limits<int>::max()));
        }

        char chunk[READ_CHUNK];
        size_t bytes_read = 0;
        try
        {
            auto& out = process_->stdout_pipe();
            if (!out.has_data(wait_ms))
            {
                close();
                throw TransportError("MCP server '" + name_ + "' timed out after " +
                                     std::to_string(options_.timeout.count()) +
                                     " ms waiting for a response");
            }
            bytes_read = out.read(chunk, sizeof(chunk));
        }
        catch (const process::ProcessError& e)
        {
            throw TransportError("Failed to read from MCP server '" + name_ + "': " + e.what());
        }

        if (bytes_read == 0)
        {
            std::string status;
            try
            {
                if (auto code = process_->wait_for(std::chrono::milliseconds(100)))
                    status = " (exit code " + std::to_string(*code) + ")";
            }
            catch (const process::ProcessError& e)
            {
                log::debug("Could not collect exit status of '" + name_ + "': " + e.what());
            }
            throw TransportError("MCP server '" + name_ + "' closed its output" + status);
        }

        buffer_.append(chunk, bytes_read);
        if (buffer_.size() > MAX_LINE_BYTES)
        {
            buffer_.clear();
            throw ProtocolError("MCP server '" + name_ + "' sent a line longer than " +
                                std::to_string(MAX_LINE_BYTES) + " bytes");
        }
    }
}

void StdioTransport::shutdown_process()
{
    if (!process_)
        return;

    log::info("Closing MCP transport for '" + name_ + "' (pid " + std::to_string(pid()) + ")");
    try
    {
        process_->close_pipes();
        if (process_->is_running())
        {
            process_->terminate();
            if (!process_->wait_for(options_.kill_grace))
            {
                log::warning("MCP server '" + name_ + "' ignored SIGTERM, killing");
                process_->kill();
            }
        }
        int code = process_->wait();
        log::info("MCP server '" + name_ + "' exited with status " + std::to_string(code));
    }
    catch (const process::ProcessError& e)
    {
        log::warning("Failed to stop MCP server '" + name_ + "': " + e.what());
    }
}

// =============================================================================
// QueueTransport implementation
// =============================================================================

QueueTransport::QueueTransport(std::vector<jsonrpc::JsonRpcResponse> responses)
    : responses_(responses.begin(), responses.end())
{
}

void QueueTransport::push(jsonrpc::JsonRpcResponse response)
{
    std::lock_guard<std::mutex> lock(mutex_);
    responses_.push_back(std::move(response));
}

void QueueTransport::send(const jsonrpc::JsonRpcRequest& /*request*/)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_)
        throw TransportError("QueueTransport is closed");
}

void QueueTransport::send_notification(const jsonrpc::JsonRpcNotification& /*notification*/)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_)
        throw TransportError("QueueTransport is closed");
}

jsonrpc::JsonRpcResponse QueueTransport::receive()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_)
        throw TransportError("QueueTransport is closed");
    if (responses_.empty())
        throw TransportError("No more queued responses");
    auto response = std::move(responses_.front());
    responses_.pop_front();
    return response;
}

void QueueTransport::close()
{
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

bool QueueTransport::is_closed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t QueueTransport::pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return responses_.size();
}

// =============================================================================
// Factories
// =============================================================================

TransportFactory stdio_transport_factory(StdioTransportOptions options)
{
    return [options](const McpServerConfig& config) -> std::unique_ptr<ITransport>
    { return std::make_unique<StdioTransport>(config, options); };
}

} // namespace mcpbridge::client
