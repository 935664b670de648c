/// @file tests/registry/stdio_e2e.cpp
/// @brief Registry driving real stdio_tool_server processes
#include "mcpbridge/registry.hpp"
#include "mcpbridge/exceptions.hpp"

#include <cassert>
#include <iostream>

using namespace mcpbridge;

static McpServerConfig fixture(const std::string& name, std::vector<std::string> args = {})
{
    McpServerConfig c;
    c.name = name;
    c.command = MCPBRIDGE_TEST_SERVER_PATH;
    c.args = std::move(args);
    return c;
}

int main()
{
    Registry registry(20, {"shell"});

    std::cout << "Test: add two prefixed servers...\n";
    auto math = fixture("math", {"--prefix", "math_"});
    math.env["MCPBRIDGE_E2E"] = "math-env";
    auto tools = registry.add_server(math);
    assert(tools.size() == 6);
    registry.add_server(fixture("text", {"--prefix", "text_", "--notify"}));
    assert(registry.total_tool_count() == 12);
    std::cout << "  [PASS]\n";

    std::cout << "Test: calls route to the right process...\n";
    auto sum = registry.call_tool("math", "math_add", Json{{"a", 2}, {"b", 3}});
    assert(sum.text().rfind("5", 0) == 0);
    auto echoed = registry.call_tool("text", "text_echo", Json{{"text", "hi"}});
    assert(echoed.text() == "hi");
    auto env = registry.call_tool("math", "math_env", Json{{"name", "MCPBRIDGE_E2E"}});
    assert(env.text() == "math-env");
    auto failed = registry.call_tool("text", "text_fail");
    assert(failed.is_error());

    bool caught = false;
    try
    {
        (void)registry.call_tool("math", "text_echo");
    }
    catch (const ProtocolError& e)
    {
        caught = e.rpc_error() && e.rpc_error()->code == -32602;
    }
    assert(caught);
    std::cout << "  [PASS]\n";

    std::cout << "Test: colliding server is rejected and its process reaped...\n";
    caught = false;
    try
    {
        registry.add_server(fixture("clash", {"--prefix", "math_"}));
    }
    catch (const NameCollisionError& e)
    {
        caught = e.owner() == "math";
    }
    assert(caught);
    assert(registry.server_count() == 2);

    caught = false;
    try
    {
        registry.add_server(fixture("huge", {"--prefix", "h_", "--tools", "20"}));
    }
    catch (const ToolCapExceededError&)
    {
        caught = true;
    }
    assert(caught);
    std::cout << "  [PASS]\n";

    std::cout << "Test: spawn and handshake failures...\n";
    McpServerConfig ghost;
    ghost.name = "ghost";
    ghost.command = "nonexistent_command_xyz";
    caught = false;
    try
    {
        registry.add_server(ghost);
    }
    catch (const TransportError&)
    {
        caught = true;
    }
    assert(caught);

    caught = false;
    try
    {
        registry.add_server(fixture("rude", {"--bad-handshake"}));
    }
    catch (const ProtocolError&)
    {
        caught = true;
    }
    assert(caught);
    assert(registry.server_count() == 2);
    std::cout << "  [PASS]\n";

    std::cout << "Test: remove and call...\n";
    registry.remove_server("text");
    caught = false;
    try
    {
        (void)registry.call_tool("text", "text_echo");
    }
    catch (const ServerNotFoundError&)
    {
        caught = true;
    }
    assert(caught);
    assert(registry.call_tool("math", "math_echo", Json{{"text", "still here"}}).text() ==
           "still here");
    std::cout << "  [PASS]\n";
    return 0;
}
