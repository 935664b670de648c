#pragma once
#include "mcpbridge/jsonrpc.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace mcpbridge
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// Spawn failure, closed or broken stream, EOF, write failure, round-trip timeout
struct TransportError : public Error
{
    using Error::Error;
};

/// Malformed wire data, response id mismatch, incomplete handshake, or a JSON-RPC
/// error object returned in place of a result
class ProtocolError : public Error
{
  public:
    explicit ProtocolError(const std::string& message) : Error(message) {}
    ProtocolError(const std::string& message, jsonrpc::JsonRpcError rpc_error)
        : Error(message), rpc_error_(std::move(rpc_error))
    {
    }

    /// The server's error object, when the failure came from one
    const std::optional<jsonrpc::JsonRpcError>& rpc_error() const
    {
        return rpc_error_;
    }

  private:
    std::optional<jsonrpc::JsonRpcError> rpc_error_;
};

/// Operation attempted in a client state that does not allow it
struct ClientStateError : public Error
{
    using Error::Error;
};

struct ConfigError : public Error
{
    using Error::Error;
};

struct NotInitializedError : public Error
{
    using Error::Error;
};

// ============================================================================
// Registry errors
// ============================================================================

struct RegistryError : public Error
{
    using Error::Error;
};

class ToolCapExceededError : public RegistryError
{
  public:
    ToolCapExceededError(std::string server, std::size_t current, std::size_t added,
                         std::size_t cap)
        : RegistryError("Adding server '" + server + "' would exceed tool cap (" +
                        std::to_string(cap) + "). Current: " + std::to_string(current) +
                        ", New: " + std::to_string(added) + ", Cap: " + std::to_string(cap)),
          server_(std::move(server)), current_(current), added_(added), cap_(cap)
    {
    }

    const std::string& server() const
    {
        return server_;
    }
    std::size_t current_total() const
    {
        return current_;
    }
    std::size_t new_tools() const
    {
        return added_;
    }
    std::size_t attempted_total() const
    {
        return current_ + added_;
    }
    std::size_t cap() const
    {
        return cap_;
    }

  private:
    std::string server_;
    std::size_t current_;
    std::size_t added_;
    std::size_t cap_;
};

enum class CollisionKind
{
    Builtin,      ///< Reserved builtin tool name
    ExistingTool, ///< Tool already registered by another server
    SameListing   ///< Name repeated inside one tools/list result
};

class NameCollisionError : public RegistryError
{
  public:
    NameCollisionError(std::string server, std::string tool, CollisionKind kind,
                       std::string owner = {})
        : RegistryError(describe(server, tool, kind, owner)), server_(std::move(server)),
          tool_(std::move(tool)), kind_(kind), owner_(std::move(owner))
    {
    }

    const std::string& server() const
    {
        return server_;
    }
    const std::string& tool() const
    {
        return tool_;
    }
    CollisionKind kind() const
    {
        return kind_;
    }
    bool collides_with_builtin() const
    {
        return kind_ == CollisionKind::Builtin;
    }
    /// Server already owning the name (ExistingTool only)
    const std::string& owner() const
    {
        return owner_;
    }

  private:
    static std::string describe(const std::string& server, const std::string& tool,
                                CollisionKind kind, const std::string& owner)
    {
        switch (kind)
        {
        case CollisionKind::Builtin:
            return "MCP server '" + server + "' tool '" + tool +
                   "' collides with builtin tool name";
        case CollisionKind::ExistingTool:
            return "MCP server '" + server + "' tool '" + tool +
                   "' collides with existing MCP tool name (server '" + owner + "')";
        case CollisionKind::SameListing:
            return "MCP server '" + server + "' advertises tool '" + tool +
                   "' more than once";
        }
        return "MCP server '" + server + "' tool '" + tool + "' collides";
    }

    std::string server_;
    std::string tool_;
    CollisionKind kind_;
    std::string owner_;
};

class ServerNotFoundError : public RegistryError
{
  public:
    explicit ServerNotFoundError(std::string server)
        : RegistryError("MCP server '" + server + "' not found"), server_(std::move(server))
    {
    }

    const std::string& server() const
    {
        return server_;
    }

  private:
    std::string server_;
};

class ServerExistsError : public RegistryError
{
  public:
    explicit ServerExistsError(std::string server)
        : RegistryError("MCP server '" + server + "' is already registered"),
          server_(std::move(server))
    {
    }

    const std::string& server() const
    {
        return server_;
    }

  private:
    std::string server_;
};

} // namespace mcpbridge
