#include "mcpbridge/util/log.hpp"

#include <cassert>
#include <iostream>
#include <sstream>

using namespace mcpbridge;

int main()
{
    std::cout << "Test: level names...\n";
    assert(log::level_from_string("DEBUG") == log::Level::Debug);
    assert(log::level_from_string("warn") == log::Level::Warning);
    assert(log::level_from_string("Error") == log::Level::Error);
    assert(log::level_from_string("off") == log::Level::Off);
    assert(log::level_from_string("nonsense") == log::Level::Info);
    assert(std::string(log::to_string(log::Level::Warning)) == "WARNING");
    std::cout << "  [PASS]\n";

    std::cout << "Test: threshold filters output...\n";
    std::ostringstream out;
    log::set_sink(&out);
    log::set_level(log::Level::Warning);
    log::info("hidden");
    log::warning("shown");
    log::error("also shown");
    std::string text = out.str();
    assert(text.find("hidden") == std::string::npos);
    assert(text.find("[mcpbridge] WARNING: shown\n") != std::string::npos);
    assert(text.find("[mcpbridge] ERROR: also shown\n") != std::string::npos);

    log::set_level(log::Level::Off);
    log::error("silenced");
    assert(out.str().find("silenced") == std::string::npos);

    log::set_sink(nullptr);
    log::set_level(log::Level::Info);
    std::cout << "  [PASS]\n";
    return 0;
}
