#include "mcpbridge/exceptions.hpp"
#include "mcpbridge/jsonrpc.hpp"

#include <cassert>
#include <iostream>
#include <limits>
#include <string>

using namespace mcpbridge;
using namespace mcpbridge::jsonrpc;

template <typename Fn>
static bool throws_protocol(Fn&& fn)
{
    try
    {
        fn();
    }
    catch (const ProtocolError&)
    {
        return true;
    }
    return false;
}

void test_request_id_forms()
{
    std::cout << "Test: numeric and string ids keep their JSON type...\n";

    Json n = RequestId(42);
    assert(n.is_number_integer());
    assert(n.get<int>() == 42);

    Json s = RequestId("test-id");
    assert(s.is_string());
    assert(s.get<std::string>() == "test-id");

    auto back = Json(42).get<RequestId>();
    assert(back.is_number() && back.as_number() == 42);
    back = Json("test-id").get<RequestId>();
    assert(back.is_string() && back.as_string() == "test-id");

    assert(RequestId(1) != RequestId("1"));
    assert(RequestId(7).to_string() == "7");
    assert(RequestId("a").to_string() == "\"a\"");

    bool threw = false;
    try
    {
        (void)Json(1.5).get<RequestId>();
    }
    catch (const std::invalid_argument&)
    {
        threw = true;
    }
    assert(threw);

    std::cout << "  [PASS] ids\n";
}

void test_request_encoding()
{
    std::cout << "Test: request encoding omits absent params...\n";

    JsonRpcRequest req;
    req.id = 1;
    req.method = "tools/list";
    Json j = req;
    assert(j["jsonrpc"] == "2.0");
    assert(j["id"] == 1);
    assert(j["method"] == "tools/list");
    assert(!j.contains("params"));

    req.params = Json{{"name", "echo"}};
    j = req;
    assert(j["params"]["name"] == "echo");

    std::string line = encode(req);
    assert(line.find('\n') == std::string::npos);
    assert(Json::parse(line).get<JsonRpcRequest>() == req);

    std::cout << "  [PASS] request\n";
}

void test_response_encoding()
{
    std::cout << "Test: response encoding omits absent result/error...\n";

    JsonRpcResponse ok;
    ok.id = 3;
    ok.result = Json{{"tools", Json::array()}};
    Json j = ok;
    assert(j.contains("result"));
    assert(!j.contains("error"));

    JsonRpcResponse err;
    err.id = "x";
    err.error = JsonRpcError{METHOD_NOT_FOUND, "Method not found", std::nullopt};
    j = err;
    assert(!j.contains("result"));
    assert(j["error"]["code"] == -32601);
    assert(!j["error"].contains("data"));

    std::cout << "  [PASS] response\n";
}

void test_notification_encoding()
{
    std::cout << "Test: notifications carry no id...\n";

    JsonRpcNotification n;
    n.method = "notifications/initialized";
    Json j = n;
    assert(!j.contains("id"));
    assert(!j.contains("params"));
    assert(j["jsonrpc"] == "2.0");
    assert(is_notification(j));
    assert(!is_notification(Json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", 1}}));

    std::cout << "  [PASS] notification\n";
}

void test_missing_version_defaults()
{
    std::cout << "Test: missing jsonrpc field defaults to 2.0...\n";

    auto r = decode_response(Json{{"id", 5}, {"result", Json::object()}});
    assert(r.jsonrpc == "2.0");
    assert(r.id == RequestId(5));

    auto req = Json{{"id", 1}, {"method", "ping"}}.get<JsonRpcRequest>();
    assert(req.jsonrpc == "2.0");

    std::cout << "  [PASS] default version\n";
}

void test_decode_errors()
{
    std::cout << "Test: malformed input maps to ProtocolError...\n";

    assert(throws_protocol([] { (void)parse_line(""); }));
    assert(throws_protocol([] { (void)parse_line("{not json"); }));
    assert(throws_protocol([] { (void)decode_response(std::string("{\"result\":1}")); }));
    assert(throws_protocol([] { (void)decode_response(Json{{"id", true}, {"result", 1}}); }));

    auto r = decode_response(std::string(
        R"({"jsonrpc":"2.0","id":"abc","error":{"code":-32602,"message":"bad","data":{"k":1}}})"));
    assert(r.id == RequestId("abc"));
    assert(r.error && r.error->code == INVALID_PARAMS);
    assert(r.error->data && (*r.error->data)["k"] == 1);

    std::cout << "  [PASS] decode errors\n";
}

void test_request_id_range()
{
    std::cout << "Test: ids beyond the int64 range are rejected...\n";

    auto largest = Json::parse("9223372036854775807").get<RequestId>();
    assert(largest.as_number() == std::numeric_limits<std::int64_t>::max());
    assert(Json(largest).dump() == "9223372036854775807");

    bool threw = false;
    try
    {
        (void)Json::parse("9223372036854775808").get<RequestId>();
    }
    catch (const std::invalid_argument& e)
    {
        threw = std::string(e.what()).find("out of range") != std::string::npos;
    }
    assert(threw);

    assert(throws_protocol(
        [] { (void)decode_response(std::string(R"({"id":18446744073709551615,"result":{}})")); }));

    std::cout << "  [PASS] id range\n";
}

int main()
{
    test_request_id_forms();
    test_request_id_range();
    test_request_encoding();
    test_response_encoding();
    test_notification_encoding();
    test_missing_version_defaults();
    test_decode_errors();
    std::cout << "All JSON-RPC tests passed\n";
    return 0;
}
