#pragma once
#include "brewsource/types.hpp"

#include <string>

namespace brewsource
{

enum class TransportKind
{
    Stdio,
    WebSocket,
    Http
};

const char* to_string(TransportKind kind);
/// Accepts "stdio", "ws"/"websocket" and "http". Throws ValidationError otherwise.
TransportKind transport_from_string(const std::string& s);

/// Parse a TCP port in [0, 65535]. Throws ValidationError otherwise.
int parse_port(const std::string& s);

struct Settings
{
    std::string log_level{"INFO"};
    TransportKind transport{TransportKind::Stdio};
    std::string host{"127.0.0.1"};
    int port{8080};
    std::string server_name{"BrewSource MCP Server"};
    std::string server_version{"1.0.0"};

    static Settings from_env();
    static Settings from_json(const Json& j);
    static Settings from_file(const std::string& path);
};

} // namespace brewsource
