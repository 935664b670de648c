#include "mcpbridge/jsonrpc.hpp"

#include "mcpbridge/exceptions.hpp"

namespace mcpbridge::jsonrpc
{

namespace
{
constexpr size_t MAX_ECHO = 200;

std::string excerpt(const std::string& line)
{
    if (line.size() <= MAX_ECHO)
        return line;
    return line.substr(0, MAX_ECHO) + "...";
}
} // namespace

Json parse_line(const std::string& line)
{
    if (line.empty())
        throw ProtocolError("Received empty line from MCP server");
    try
    {
        return Json::parse(line);
    }
    catch (const Json::parse_error& e)
    {
        throw ProtocolError("Failed to parse JSON: " + excerpt(line) + " (" + e.what() + ")");
    }
}

JsonRpcResponse decode_response(const Json& message)
{
    if (!message.is_object())
        throw ProtocolError("JSON-RPC response must be an object, got " +
                            std::string(message.type_name()));
    try
    {
        return message.get<JsonRpcResponse>();
    }
    catch (const Json::exception& e)
    {
        throw ProtocolError("Malformed JSON-RPC response: " + std::string(e.what()));
    }
    catch (const std::invalid_argument& e)
    {
        throw ProtocolError("Malformed JSON-RPC response: " + std::string(e.what()));
    }
}

JsonRpcResponse decode_response(const std::string& line)
{
    return decode_response(parse_line(line));
}

bool is_notification(const Json& message)
{
    return message.is_object() && message.contains("method") && !message.contains("id");
}

} // namespace mcpbridge::jsonrpc
