#pragma once

/// @file mcpbridge.hpp
/// @brief Main header for mcpbridge - includes commonly used components
///
/// Usage:
/// @code
/// #include <mcpbridge.hpp>
///
/// int main() {
///     auto settings = mcpbridge::Settings::from_env();
///     auto registry = mcpbridge::Registry::from_settings(settings, {"shell", "file_read"});
///
///     for (const auto& cfg : mcpbridge::load_mcp_configs(std::filesystem::current_path()))
///         registry->add_server(cfg);
///
///     auto result = registry->call_tool("fs", "read_file", mcpbridge::Json{{"path", "a.txt"}});
/// }
/// @endcode

// Core types and exceptions
#include "mcpbridge/types.hpp"
#include "mcpbridge/exceptions.hpp"
#include "mcpbridge/jsonrpc.hpp"
#include "mcpbridge/settings.hpp"
#include "mcpbridge/config.hpp"

// Client
#include "mcpbridge/client/client.hpp"
#include "mcpbridge/client/transports.hpp"
#include "mcpbridge/client/types.hpp"

// Registry
#include "mcpbridge/registry.hpp"

// Utilities
#include "mcpbridge/util/log.hpp"
