#pragma once
#include "brewsource/types.hpp"

#include <string>
#include <vector>

namespace brewsource::mcp
{

// ---------------------------------------------------------------------------
// Descriptors
// ---------------------------------------------------------------------------

/// Tool descriptor returned by tools/list. The input schema is forwarded
/// as-is; the core never validates arguments against it.
struct Tool
{
    std::string name;
    std::string description;
    Json input_schema = Json::object();
};

/// Resource descriptor returned by resources/list. `uri` may be a concrete
/// URI or a template such as "bjcp://styles/{code}".
struct Resource
{
    std::string uri;
    std::string name;
    std::string description;
    std::string mime_type;
};

// ---------------------------------------------------------------------------
// Handler payloads
// ---------------------------------------------------------------------------

struct ToolContent
{
    std::string type{"text"};
    std::string text;
    std::string data;
};

struct ToolResult
{
    std::vector<ToolContent> content;
    bool is_error{false};

    static ToolResult text(const std::string& text);
    static ToolResult error(const std::string& message);
};

struct ResourceContent
{
    std::string uri;
    std::string mime_type;
    std::string text;
    std::string blob;
};

// ---------------------------------------------------------------------------
// initialize
// ---------------------------------------------------------------------------

struct ClientInfo
{
    std::string name;
    std::string version;
};

struct InitializeRequest
{
    std::string protocol_version;
    Json capabilities = Json::object();
    ClientInfo client_info;
};

struct ServerInfo
{
    std::string name;
    std::string version;
};

struct ServerCapabilities
{
    bool tools_list_changed{false};
    bool resources_subscribe{false};
    bool resources_list_changed{false};
};

struct InitializeResult
{
    std::string protocol_version{MCP_PROTOCOL_VERSION};
    ServerCapabilities capabilities;
    ServerInfo server_info;
};

void to_json(Json& j, const Tool& tool);
void from_json(const Json& j, Tool& tool);
void to_json(Json& j, const Resource& resource);
void from_json(const Json& j, Resource& resource);
void to_json(Json& j, const ToolContent& content);
void to_json(Json& j, const ToolResult& result);
void from_json(const Json& j, ToolResult& result);
void to_json(Json& j, const ResourceContent& content);
void to_json(Json& j, const ServerCapabilities& caps);
void to_json(Json& j, const InitializeResult& result);

/// Lenient decode: wrong-typed sub-fields fall back to empty values. Throws
/// ValidationError when `params` or its `clientInfo` member is not an object.
InitializeRequest parse_initialize_request(const Json& params);

// ---------------------------------------------------------------------------
// JSON Schema helpers for descriptor input schemas
// ---------------------------------------------------------------------------

Json string_schema(const std::string& description);
Json integer_schema(const std::string& description);
Json object_schema(Json properties, const std::vector<std::string>& required = {});

} // namespace brewsource::mcp
