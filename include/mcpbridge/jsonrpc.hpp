#pragma once
/// @file jsonrpc.hpp
/// @brief JSON-RPC 2.0 envelope types exchanged with MCP servers
/// @details Optional members are omitted on serialization and default to absent when
///          missing on parse. The "jsonrpc" member defaults to "2.0" when absent.

#include "mcpbridge/types.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace mcpbridge::jsonrpc
{

constexpr const char* VERSION = "2.0";

// Standard JSON-RPC error codes
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

/// Request identifier: a bare JSON integer or a bare JSON string
class RequestId
{
  public:
    RequestId() : value_(std::int64_t{0}) {}
    RequestId(std::int64_t n) : value_(n) {}
    RequestId(int n) : value_(static_cast<std::int64_t>(n)) {}
    RequestId(std::string s) : value_(std::move(s)) {}
    RequestId(const char* s) : value_(std::string(s)) {}

    bool is_number() const
    {
        return std::holds_alternative<std::int64_t>(value_);
    }
    bool is_string() const
    {
        return std::holds_alternative<std::string>(value_);
    }
    std::int64_t as_number() const
    {
        return std::get<std::int64_t>(value_);
    }
    const std::string& as_string() const
    {
        return std::get<std::string>(value_);
    }

    /// Diagnostic rendering (strings quoted, numbers bare)
    std::string to_string() const
    {
        if (is_number())
            return std::to_string(as_number());
        return "\"" + as_string() + "\"";
    }

    bool operator==(const RequestId& other) const
    {
        return value_ == other.value_;
    }
    bool operator!=(const RequestId& other) const
    {
        return !(*this == other);
    }

  private:
    std::variant<std::int64_t, std::string> value_;
};

struct JsonRpcError
{
    std::int64_t code{0};
    std::string message;
    std::optional<Json> data;

    bool operator==(const JsonRpcError& o) const
    {
        return code == o.code && message == o.message && data == o.data;
    }
};

struct JsonRpcRequest
{
    std::string jsonrpc{VERSION};
    RequestId id;
    std::string method;
    std::optional<Json> params;

    bool operator==(const JsonRpcRequest& o) const
    {
        return jsonrpc == o.jsonrpc && id == o.id && method == o.method && params == o.params;
    }
};

/// Response envelope. Exactly one of result/error is expected; the client checks this.
struct JsonRpcResponse
{
    std::string jsonrpc{VERSION};
    RequestId id;
    std::optional<Json> result;
    std::optional<JsonRpcError> error;

    bool operator==(const JsonRpcResponse& o) const
    {
        return jsonrpc == o.jsonrpc && id == o.id && result == o.result && error == o.error;
    }
};

/// Notification envelope (no id, never answered)
struct JsonRpcNotification
{
    std::string jsonrpc{VERSION};
    std::string method;
    std::optional<Json> params;

    bool operator==(const JsonRpcNotification& o) const
    {
        return jsonrpc == o.jsonrpc && method == o.method && params == o.params;
    }
};

// nlohmann::json adapters
inline void to_json(Json& j, const RequestId& id)
{
    if (id.is_number())
        j = id.as_number();
    else
        j = id.as_string();
}

inline void from_json(const Json& j, RequestId& id)
{
    constexpr auto max_id = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    if (j.is_number_unsigned() && j.get<std::uint64_t>() > max_id)
        throw std::invalid_argument("JSON-RPC id " + j.dump() + " is out of range");
    if (j.is_number_integer())
        id = RequestId(j.get<std::int64_t>());
    else if (j.is_string())
        id = RequestId(j.get<std::string>());
    else
        throw std::invalid_argument("JSON-RPC id must be an integer or a string, got " +
                                    std::string(j.type_name()));
}

inline void to_json(Json& j, const JsonRpcError& e)
{
    j = Json{{"code", e.code}, {"message", e.message}};
    if (e.data)
        j["data"] = *e.data;
}

inline void from_json(const Json& j, JsonRpcError& e)
{
    e.code = j.at("code").get<std::int64_t>();
    e.message = j.at("message").get<std::string>();
    if (j.contains("data"))
        e.data = j["data"];
    else
        e.data.reset();
}

inline void to_json(Json& j, const JsonRpcRequest& r)
{
    j = Json{{"jsonrpc", r.jsonrpc}, {"id", r.id}, {"method", r.method}};
    if (r.params)
        j["params"] = *r.params;
}

inline void from_json(const Json& j, JsonRpcRequest& r)
{
    r.jsonrpc = j.value("jsonrpc", std::string(VERSION));
    r.id = j.at("id").get<RequestId>();
    r.method = j.at("method").get<std::string>();
    if (j.contains("params"))
        r.params = j["params"];
    else
        r.params.reset();
}

inline void to_json(Json& j, const JsonRpcResponse& r)
{
    j = Json{{"jsonrpc", r.jsonrpc}, {"id", r.id}};
    if (r.result)
        j["result"] = *r.result;
    if (r.error)
        j["error"] = *r.error;
}

inline void from_json(const Json& j, JsonRpcResponse& r)
{
    r.jsonrpc = j.value("jsonrpc", std::string(VERSION));
    r.id = j.at("id").get<RequestId>();
    if (j.contains("result"))
        r.result = j["result"];
    else
        r.result.reset();
    if (j.contains("error"))
        r.error = j["error"].get<JsonRpcError>();
    else
        r.error.reset();
}

inline void to_json(Json& j, const JsonRpcNotification& n)
{
    j = Json{{"jsonrpc", n.jsonrpc}, {"method", n.method}};
    if (n.params)
        j["params"] = *n.params;
}

inline void from_json(const Json& j, JsonRpcNotification& n)
{
    n.jsonrpc = j.value("jsonrpc", std::string(VERSION));
    n.method = j.at("method").get<std::string>();
    if (j.contains("params"))
        n.params = j["params"];
    else
        n.params.reset();
}

/// Serialize a message as one wire line (no trailing newline)
template <typename Message>
std::string encode(const Message& message)
{
    return Json(message).dump();
}

/// Parse one wire line as JSON. Throws ProtocolError on malformed JSON.
Json parse_line(const std::string& line);

/// Interpret a parsed message as a response. Throws ProtocolError on a wrong shape.
JsonRpcResponse decode_response(const Json& message);

/// parse_line + decode_response
JsonRpcResponse decode_response(const std::string& line);

/// True for a server-initiated notification (has "method", no "id")
bool is_notification(const Json& message);

} // namespace mcpbridge::jsonrpc
