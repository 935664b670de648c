// Line-delimited MCP server over stdin/stdout used by the end-to-end tests.
//
// Tools: echo, add, env, cwd, fail, slow (plus --tools N generated ones).
// Flags:
//   --prefix P          prefix every tool name with P
//   --tools N           advertise N extra tools named <P>tool_<i>
//   --notify            emit a notifications/message line before each response
//   --garbage           answer tools/list with a non-JSON line
//   --exit-after-init   exit right after answering initialize
//   --bad-handshake     omit serverInfo from the initialize result
//   --ignore-sigterm    ignore SIGTERM and linger after stdin closes (only SIGKILL stops it)

#include "mcpbridge/client/types.hpp"
#include "mcpbridge/jsonrpc.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using mcpbridge::Json;
using mcpbridge::client::ContentBlock;
using mcpbridge::client::ToolInfo;

namespace
{

struct Options
{
    std::string prefix;
    int extra_tools = 0;
    bool notify = false;
    bool garbage = false;
    bool exit_after_init = false;
    bool bad_handshake = false;
    bool ignore_sigterm = false;
};

Options parse_args(int argc, char** argv)
{
    Options o;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--prefix" && i + 1 < argc)
            o.prefix = argv[++i];
        else if (arg == "--tools" && i + 1 < argc)
            o.extra_tools = std::atoi(argv[++i]);
        else if (arg == "--notify")
            o.notify = true;
        else if (arg == "--garbage")
            o.garbage = true;
        else if (arg == "--exit-after-init")
            o.exit_after_init = true;
        else if (arg == "--bad-handshake")
            o.bad_handshake = true;
        else if (arg == "--ignore-sigterm")
            o.ignore_sigterm = true;
    }
    return o;
}

ToolInfo tool(const std::string& name, const std::string& description, Json properties)
{
    ToolInfo t;
    t.name = name;
    t.description = description;
    t.inputSchema = Json{{"type", "object"}, {"properties", std::move(properties)}};
    return t;
}

std::vector<ToolInfo> advertised_tools(const Options& o)
{
    const auto& p = o.prefix;
    std::vector<ToolInfo> tools = {
        tool(p + "echo", "Echo the given text", Json{{"text", {{"type", "string"}}}}),
        tool(p + "add", "Add two numbers",
             Json{{"a", {{"type", "number"}}}, {"b", {{"type", "number"}}}}),
        tool(p + "env", "Read an environment variable", Json{{"name", {{"type", "string"}}}}),
        tool(p + "cwd", "Report the working directory", Json::object()),
        tool(p + "fail", "Always reports a tool error", Json::object()),
        tool(p + "slow", "Sleep before answering", Json{{"ms", {{"type", "integer"}}}}),
    };
    for (int i = 0; i < o.extra_tools; ++i)
        tools.push_back(tool(p + "tool_" + std::to_string(i), "Generated tool", Json::object()));
    return tools;
}

Json text_result(const std::string& text, bool is_error = false)
{
    Json result = {{"content", Json::array({Json(ContentBlock{"text", text})})}};
    if (is_error)
        result["isError"] = true;
    return result;
}

void emit(const Json& message)
{
    std::cout << message.dump() << "\n";
    std::cout.flush();
}

Json call_tool(const Options& o, const std::string& name, const Json& args)
{
    const auto& p = o.prefix;
    if (name == p + "echo")
        return text_result(args.value("text", std::string()));
    if (name == p + "add")
    {
        double sum = args.value("a", 0.0) + args.value("b", 0.0);
        return text_result(std::to_string(sum));
    }
    if (name == p + "env")
    {
        const char* value = std::getenv(args.value("name", std::string()).c_str());
        return text_result(value ? value : "");
    }
    if (name == p + "cwd")
        return text_result(std::filesystem::current_path().string());
    if (name == p + "fail")
        return text_result("tool failed on purpose", true);
    if (name == p + "slow")
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(args.value("ms", 1000)));
        return text_result("done");
    }
    return Json();
}

} // namespace

int main(int argc, char** argv)
{
    const Options options = parse_args(argc, argv);
    if (options.ignore_sigterm)
        std::signal(SIGTERM, SIG_IGN);
    const auto tools = advertised_tools(options);

    std::string line;
    while (std::getline(std::cin, line))
    {
        if (line.empty())
            continue;

        Json message;
        try
        {
            message = Json::parse(line);
        }
        catch (const Json::parse_error&)
        {
            emit(Json{{"jsonrpc", "2.0"},
                      {"id", nullptr},
                      {"error",
                       {{"code", mcpbridge::jsonrpc::PARSE_ERROR}, {"message", "Parse error"}}}});
            continue;
        }

        // Notifications are never answered
        if (!message.contains("id"))
            continue;

        const Json id = message["id"];
        const std::string method = message.value("method", std::string());
        const Json params = message.value("params", Json::object());

        if (options.notify)
            emit(Json{{"jsonrpc", "2.0"},
                      {"method", "notifications/message"},
                      {"params", {{"level", "info"}, {"data", "handling " + method}}}});

        Json response = {{"jsonrpc", "2.0"}, {"id", id}};
        if (method == "initialize")
        {
            Json result = {{"protocolVersion", params.value("protocolVersion", "2024-11-05")},
                           {"capabilities", {{"tools", Json::object()}}}};
            if (!options.bad_handshake)
                result["serverInfo"] = {{"name", "stdio_tool_server"}, {"version", "1.0.0"}};
            response["result"] = result;
            emit(response);
            if (options.exit_after_init)
                return 0;
            continue;
        }

        if (method == "tools/list")
        {
            if (options.garbage)
            {
                std::cout << "this is not json\n";
                std::cout.flush();
                continue;
            }
            response["result"] = {{"tools", tools}};
        }
        else if (method == "tools/call")
        {
            const std::string name = params.value("name", std::string());
            Json result = call_tool(options, name, params.value("arguments", Json::object()));
            if (result.is_null())
                response["error"] = {{"code", mcpbridge::jsonrpc::INVALID_PARAMS},
                                     {"message", "Unknown tool: " + name},
                                     {"data", {{"tool", name}}}};
            else
                response["result"] = result;
        }
        else
        {
            response["error"] = {{"code", mcpbridge::jsonrpc::METHOD_NOT_FOUND},
                                 {"message", "Method not found: " + method}};
        }
        emit(response);
    }

    while (options.ignore_sigterm)
        std::this_thread::sleep_for(std::chrono::seconds(60));
    return 0;
}
