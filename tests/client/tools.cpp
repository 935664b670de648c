/// @file tests/client/tools.cpp
/// @brief tools/list and tools/call over a recorded transport
#include "test_helpers.hpp"

void test_list_tools()
{
    std::cout << "Test: list_tools parses the listing...\n";
    auto log = std::make_shared<TransportLog>();
    auto c = create_recorded_client(
        log, {make_tools_response({tool_json("echo", "Echo text"), Json{{"name", "bare"}}})});

    auto tools = c->list_tools();
    assert(tools.size() == 2);
    assert(tools[0].name == "echo");
    assert(tools[0].description && *tools[0].description == "Echo text");
    assert(!tools[1].description);
    assert(tools[1].inputSchema.is_object());

    assert(log->requests.size() == 2);
    assert(log->requests[1].method == "tools/list");
    assert(log->requests[1].id == RequestId(2));
    std::cout << "  [PASS]\n";
}

void test_list_tools_malformed()
{
    std::cout << "Test: list_tools rejects a result without a tools array...\n";
    JsonRpcResponse r;
    r.id = 2;
    r.result = Json{{"tools", "nope"}};
    auto log = std::make_shared<TransportLog>();
    auto c = create_recorded_client(log, {r});
    assert(throws<ProtocolError>([&] { (void)c->list_tools(); }));

    JsonRpcResponse empty;
    empty.id = 2;
    empty.result = Json::object();
    auto c2 = create_recorded_client(log, {empty});
    assert(throws<ProtocolError>([&] { (void)c2->list_tools(); }));
    std::cout << "  [PASS]\n";
}

void test_call_tool_params_and_ids()
{
    std::cout << "Test: call_tool params and monotonically increasing ids...\n";
    auto log = std::make_shared<TransportLog>();
    auto c = create_recorded_client(
        log, {make_text_result(2, "hi"), make_text_result(3, "no-args")});

    auto r = c->call_tool("echo", Json{{"text", "hi"}});
    assert(r.text() == "hi");
    assert(!r.is_error());
    auto r2 = c->call_tool("ping");
    assert(r2.text() == "no-args");

    const auto& first = log->requests[1];
    assert(first.method == "tools/call");
    assert(first.id == RequestId(2));
    assert((*first.params)["name"] == "echo");
    assert((*first.params)["arguments"]["text"] == "hi");

    const auto& second = log->requests[2];
    assert(second.id == RequestId(3));
    assert(!second.params->contains("arguments"));
    std::cout << "  [PASS]\n";
}

void test_call_tool_error_object()
{
    std::cout << "Test: JSON-RPC error keeps code and data...\n";
    auto log = std::make_shared<TransportLog>();
    auto c = create_recorded_client(
        log, {make_error_response(2, jsonrpc::INVALID_PARAMS, "Unknown tool: x",
                                  Json{{"tool", "x"}})});
    bool caught = false;
    try
    {
        (void)c->call_tool("x");
    }
    catch (const ProtocolError& e)
    {
        caught = true;
        assert(contains(e.what(), "Unknown tool: x"));
        assert(e.rpc_error());
        assert(e.rpc_error()->code == -32602);
        assert((*e.rpc_error()->data)["tool"] == "x");
    }
    assert(caught);
    // The client stays usable after a server-side error
    assert(c->is_ready());
    std::cout << "  [PASS]\n";
}

void test_tool_level_error_is_returned()
{
    std::cout << "Test: isError results are returned, not thrown...\n";
    auto log = std::make_shared<TransportLog>();
    auto c = create_recorded_client(log, {make_text_result(2, "tool failed", true)});
    auto r = c->call_tool("fail");
    assert(r.is_error());
    assert(r.text() == "tool failed");
    std::cout << "  [PASS]\n";
}

void test_mismatched_id()
{
    std::cout << "Test: mismatched response id is a ProtocolError...\n";
    auto log = std::make_shared<TransportLog>();
    auto c = create_recorded_client(log, {make_text_result(7, "wrong")});
    std::string msg;
    assert(throws<ProtocolError>([&] { (void)c->call_tool("echo"); }, &msg));
    assert(contains(msg, "does not match"));

    JsonRpcResponse both = make_text_result(3, "x");
    both.error = jsonrpc::JsonRpcError{-1, "also", std::nullopt};
    auto log2 = std::make_shared<TransportLog>();
    auto c2 = create_recorded_client(log2, {make_text_result(2, "ok"), both});
    (void)c2->call_tool("a");
    assert(throws<ProtocolError>([&] { (void)c2->call_tool("b"); }));
    std::cout << "  [PASS]\n";
}

void test_transport_failure_closes_client()
{
    std::cout << "Test: transport failure moves the client to closed...\n";
    auto log = std::make_shared<TransportLog>();
    auto c = create_recorded_client(log, {});

    assert(throws<TransportError>([&] { (void)c->call_tool("echo"); }));
    assert(c->state() == client::ClientState::Closed);
    assert(log->close_count() == 1);

    std::string msg;
    assert(throws<ClientStateError>([&] { (void)c->list_tools(); }, &msg));
    assert(contains(msg, "closed"));

    // A protocol violation alone keeps the connection
    auto log2 = std::make_shared<TransportLog>();
    auto c2 = create_recorded_client(log2, {make_text_result(9, "wrong id")});
    assert(throws<ProtocolError>([&] { (void)c2->call_tool("echo"); }));
    assert(c2->is_ready());
    assert(log2->close_count() == 0);
    std::cout << "  [PASS]\n";
}

int main()
{
    test_list_tools();
    test_list_tools_malformed();
    test_call_tool_params_and_ids();
    test_call_tool_error_object();
    test_tool_level_error_is_returned();
    test_mismatched_id();
    test_transport_failure_closes_client();
    std::cout << "All client tool tests passed\n";
    return 0;
}
