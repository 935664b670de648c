#pragma once
/// @file client/types.hpp
/// @brief MCP payload types for the handshake, tool discovery and tool invocation
/// @details Field names follow the MCP wire names so that the JSON adapters stay a
///          one-to-one mapping.

#include "mcpbridge/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mcpbridge::client
{

// ============================================================================
// Session Types
// ============================================================================

/// Name and version of a client or server implementation
struct Implementation
{
    std::string name;
    std::string version;

    bool operator==(const Implementation& o) const
    {
        return name == o.name && version == o.version;
    }
};

/// Capabilities the client announces (none beyond the base protocol)
struct ClientCapabilities
{
    std::optional<Json> experimental;
};

/// Server capabilities as advertised in the initialize result
struct ServerCapabilities
{
    std::optional<Json> experimental;
    std::optional<Json> logging;
    std::optional<Json> prompts;
    std::optional<Json> resources;
    std::optional<Json> tools;
};

struct InitializeParams
{
    std::string protocolVersion{DEFAULT_PROTOCOL_VERSION};
    ClientCapabilities capabilities;
    Implementation clientInfo{LIBRARY_NAME, LIBRARY_VERSION};
};

struct InitializeResult
{
    std::string protocolVersion;
    ServerCapabilities capabilities;
    Implementation serverInfo;
    std::optional<std::string> instructions;
};

// ============================================================================
// Tool Types
// ============================================================================

/// Tool information as returned by tools/list
struct ToolInfo
{
    std::string name;
    std::optional<std::string> description;
    Json inputSchema = Json::object(); ///< JSON Schema for tool arguments

    bool operator==(const ToolInfo& o) const
    {
        return name == o.name && description == o.description && inputSchema == o.inputSchema;
    }
};

/// One content block of a tool result ("text", "image", "resource", ...)
struct ContentBlock
{
    std::string type{"text"};
    std::optional<std::string> text;

    bool operator==(const ContentBlock& o) const
    {
        return type == o.type && text == o.text;
    }
};

/// Result of tools/call
struct CallToolResult
{
    std::vector<ContentBlock> content;
    std::optional<bool> isError; ///< Absent means false

    bool is_error() const
    {
        return isError.value_or(false);
    }

    /// Text of the first text block, or "" when there is none
    std::string text() const
    {
        for (const auto& block : content)
            if (block.type == "text" && block.text)
                return *block.text;
        return "";
    }
};

// ============================================================================
// JSON Serialization Helpers
// ============================================================================

inline void to_json(Json& j, const Implementation& i)
{
    j = Json{{"name", i.name}, {"version", i.version}};
}

inline void from_json(const Json& j, Implementation& i)
{
    i.name = j.at("name").get<std::string>();
    i.version = j.value("version", std::string("unknown"));
}

inline void to_json(Json& j, const ClientCapabilities& c)
{
    j = Json::object();
    if (c.experimental)
        j["experimental"] = *c.experimental;
}

inline void from_json(const Json& j, ClientCapabilities& c)
{
    if (j.contains("experimental"))
        c.experimental = j["experimental"];
}

inline void to_json(Json& j, const ServerCapabilities& c)
{
    j = Json::object();
    if (c.experimental)
        j["experimental"] = *c.experimental;
    if (c.logging)
        j["logging"] = *c.logging;
    if (c.prompts)
        j["prompts"] = *c.prompts;
    if (c.resources)
        j["resources"] = *c.resources;
    if (c.tools)
        j["tools"] = *c.tools;
}

inline void from_json(const Json& j, ServerCapabilities& c)
{
    if (j.contains("experimental"))
        c.experimental = j["experimental"];
    if (j.contains("logging"))
        c.logging = j["logging"];
    if (j.contains("prompts"))
        c.prompts = j["prompts"];
    if (j.contains("resources"))
        c.resources = j["resources"];
    if (j.contains("tools"))
        c.tools = j["tools"];
}

inline void to_json(Json& j, const InitializeParams& p)
{
    j = Json{{"protocolVersion", p.protocolVersion},
             {"capabilities", p.capabilities},
             {"clientInfo", p.clientInfo}};
}

inline void from_json(const Json& j, InitializeParams& p)
{
    p.protocolVersion = j.at("protocolVersion").get<std::string>();
    p.capabilities = j.value("capabilities", Json::object()).get<ClientCapabilities>();
    p.clientInfo = j.at("clientInfo").get<Implementation>();
}

inline void to_json(Json& j, const InitializeResult& r)
{
    j = Json{{"protocolVersion", r.protocolVersion},
             {"capabilities", r.capabilities},
             {"serverInfo", r.serverInfo}};
    if (r.instructions)
        j["instructions"] = *r.instructions;
}

/// Requires protocolVersion, capabilities and serverInfo
inline void from_json(const Json& j, InitializeResult& r)
{
    r.protocolVersion = j.at("protocolVersion").get<std::string>();
    r.capabilities = j.at("capabilities").get<ServerCapabilities>();
    r.serverInfo = j.at("serverInfo").get<Implementation>();
    if (j.contains("instructions") && j["instructions"].is_string())
        r.instructions = j["instructions"].get<std::string>();
}

inline void to_json(Json& j, const ToolInfo& t)
{
    j = Json{{"name", t.name}, {"inputSchema", t.inputSchema}};
    if (t.description)
        j["description"] = *t.description;
}

inline void from_json(const Json& j, ToolInfo& t)
{
    t.name = j.at("name").get<std::string>();
    if (j.contains("description") && !j["description"].is_null())
        t.description = j["description"].get<std::string>();
    t.inputSchema = j.value("inputSchema", Json::object());
}

inline void to_json(Json& j, const ContentBlock& c)
{
    j = Json{{"type", c.type}};
    if (c.text)
        j["text"] = *c.text;
}

inline void from_json(const Json& j, ContentBlock& c)
{
    c.type = j.at("type").get<std::string>();
    if (j.contains("text") && j["text"].is_string())
        c.text = j["text"].get<std::string>();
}

inline void to_json(Json& j, const CallToolResult& r)
{
    j = Json{{"content", r.content}};
    if (r.isError)
        j["isError"] = *r.isError;
}

inline void from_json(const Json& j, CallToolResult& r)
{
    r.content = j.value("content", Json::array()).get<std::vector<ContentBlock>>();
    if (j.contains("isError") && j["isError"].is_boolean())
        r.isError = j["isError"].get<bool>();
}

} // namespace mcpbridge::client
