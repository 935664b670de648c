#include "mcpbridge/settings.hpp"
#include "mcpbridge/util/log.hpp"

#include <cassert>
#include <cstdlib>

static void set_env(const char* name, const char* value)
{
    setenv(name, value, 1);
}

int main()
{
    using namespace mcpbridge;

    // Defaults
    Settings d;
    assert(d.log_level == "INFO");
    assert(d.tool_cap == 50);
    assert(d.request_timeout.count() == 60000);

    // JSON parse
    auto s = Settings::from_json(
        Json{{"log_level", "debug"}, {"tool_cap", 3}, {"request_timeout_ms", 250}});
    assert(s.log_level == "debug");
    assert(s.tool_cap == 3);
    assert(s.request_timeout.count() == 250);

    // Partial JSON keeps defaults
    auto p = Settings::from_json(Json{{"tool_cap", 7}});
    assert(p.log_level == "INFO");
    assert(p.tool_cap == 7);

    // Env parse (set locally)
    set_env("MCPBRIDGE_LOG_LEVEL", "warn");
    set_env("MCPBRIDGE_TOOL_CAP", "12");
    set_env("MCPBRIDGE_REQUEST_TIMEOUT_MS", "1500");
    auto e = Settings::from_env();
    assert(e.log_level == "WARN"); // uppercased
    assert(e.tool_cap == 12);
    assert(e.request_timeout.count() == 1500);

    // Garbage numbers keep the default
    set_env("MCPBRIDGE_TOOL_CAP", "lots");
    set_env("MCPBRIDGE_REQUEST_TIMEOUT_MS", "-5");
    auto g = Settings::from_env();
    assert(g.tool_cap == 50);
    assert(g.request_timeout.count() == 60000);

    apply_logging(e);
    assert(log::level() == log::Level::Warning);
    apply_logging(d);
    assert(log::level() == log::Level::Info);
    return 0;
}
