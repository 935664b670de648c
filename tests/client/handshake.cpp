/// @file tests/client/handshake.cpp
/// @brief initialize / notifications/initialized sequencing and client states
#include "test_helpers.hpp"

void test_handshake_sequence()
{
    std::cout << "Test: handshake sends initialize then initialized...\n";
    auto log = std::make_shared<TransportLog>();
    auto c = create_recorded_client(log, {});

    assert(c->is_ready());
    assert(log->requests.size() == 1);
    assert(log->requests[0].method == "initialize");
    assert(log->requests[0].id == RequestId(1));
    const Json& params = *log->requests[0].params;
    assert(params["protocolVersion"] == "2024-11-05");
    assert(params["clientInfo"]["name"] == "mcpbridge");
    assert(params["capabilities"].is_object());

    assert(log->notifications.size() == 1);
    assert(log->notifications[0].method == "notifications/initialized");

    auto init = c->initialize_result();
    assert(init && init->serverInfo.name == "TestServer");
    std::cout << "  [PASS]\n";
}

void test_custom_client_info()
{
    std::cout << "Test: client options reach the initialize params...\n";
    auto log = std::make_shared<TransportLog>();
    client::ClientOptions opts;
    opts.protocol_version = "2025-03-26";
    opts.client_info = client::Implementation{"host-agent", "9.9"};
    auto c = client::connect_client(
        std::make_unique<RecordingTransport>(log, std::vector<JsonRpcResponse>{make_init_response()}),
        opts);
    const Json& params = *log->requests[0].params;
    assert(params["protocolVersion"] == "2025-03-26");
    assert(params["clientInfo"]["name"] == "host-agent");
    std::cout << "  [PASS]\n";
}

void test_initialize_error_closes()
{
    std::cout << "Test: initialize error closes the transport...\n";
    auto log = std::make_shared<TransportLog>();
    client::Client c;
    std::string msg;
    bool threw = throws<ProtocolError>(
        [&]
        {
            c.connect(std::make_unique<RecordingTransport>(
                log, std::vector<JsonRpcResponse>{
                         make_error_response(1, jsonrpc::INTERNAL_ERROR, "boot failure")}));
        },
        &msg);
    assert(threw);
    assert(contains(msg, "boot failure"));
    assert(c.state() == client::ClientState::Closed);
    assert(log->close_count() == 1);
    assert(log->notifications.empty());
    std::cout << "  [PASS]\n";
}

void test_initialize_malformed()
{
    std::cout << "Test: malformed initialize result is a ProtocolError...\n";
    JsonRpcResponse bad = make_init_response();
    bad.result->erase("serverInfo");
    client::Client c;
    assert(throws<ProtocolError>(
        [&] { c.connect(std::make_unique<client::QueueTransport>(std::vector<JsonRpcResponse>{bad})); }));
    assert(c.state() == client::ClientState::Closed);

    client::Client c2;
    assert(throws<ProtocolError>(
        [&]
        {
            c2.connect(std::make_unique<client::QueueTransport>(
                std::vector<JsonRpcResponse>{make_init_response(99)}));
        }));
    std::cout << "  [PASS]\n";
}

void test_state_rules()
{
    std::cout << "Test: operations require a ready client...\n";
    client::Client idle;
    assert(idle.state() == client::ClientState::Disconnected);
    assert(throws<ClientStateError>([&] { (void)idle.list_tools(); }));
    assert(throws<ClientStateError>([&] { (void)idle.call_tool("echo"); }));

    auto c = create_mock_client({tool_json("echo")});
    assert(throws<ClientStateError>(
        [&] { c->connect(std::make_unique<client::QueueTransport>()); }));

    c->close();
    c->close();
    assert(c->state() == client::ClientState::Closed);
    assert(std::string(client::to_string(c->state())) == "closed");
    std::string msg;
    assert(throws<ClientStateError>([&] { (void)c->list_tools(); }, &msg));
    assert(contains(msg, "tools/list"));
    std::cout << "  [PASS]\n";
}

void test_transport_failure_during_handshake()
{
    std::cout << "Test: transport failure during handshake...\n";
    client::Client c;
    assert(throws<TransportError>(
        [&] { c.connect(std::make_unique<client::QueueTransport>()); }));
    assert(c.state() == client::ClientState::Closed);
    std::cout << "  [PASS]\n";
}

int main()
{
    test_handshake_sequence();
    test_custom_client_info();
    test_initialize_error_closes();
    test_initialize_malformed();
    test_state_rules();
    test_transport_failure_during_handshake();
    std::cout << "All handshake tests passed\n";
    return 0;
}
