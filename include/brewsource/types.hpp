#pragma once
#include <nlohmann/json.hpp>

#include <string>

namespace brewsource
{

using Json = nlohmann::json;

/// JSON-RPC version tag every envelope must carry.
constexpr const char* JSONRPC_VERSION = "2.0";

/// MCP protocol revision advertised in the initialize result.
constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";

} // namespace brewsource
