#include "brewsource/service/service_registrar.hpp"

#include "brewsource/exceptions.hpp"
#include "brewsource/server/registry.hpp"

#include <fstream>
#include <sstream>

namespace brewsource::service
{

namespace
{
constexpr const char* HEALTH_URI = "service://health";
constexpr const char* VERSION_URI = "service://version";
constexpr const char* MIME_JSON = "application/json";
} // namespace

ServiceRegistrar::ServiceRegistrar(std::string version_file)
    : version_file_(std::move(version_file))
{
}

std::string ServiceRegistrar::version() const
{
    std::ifstream in(version_file_);
    if (!in)
        return "dev";
    std::stringstream ss;
    ss << in.rdbuf();
    std::string v = ss.str();
    while (!v.empty() && (v.back() == '\n' || v.back() == '\r' || v.back() == ' '))
        v.pop_back();
    return v.empty() ? "dev" : v;
}

Json ServiceRegistrar::health() const
{
    return Json{{"status", "healthy"}, {"service", "brewsource-mcp"}, {"version", version()}};
}

mcp::ResourceContent ServiceRegistrar::read(const server::RequestContext&,
                                            const std::string& uri) const
{
    Json doc;
    if (uri == HEALTH_URI)
        doc = health();
    else if (uri == VERSION_URI)
        doc = Json{{"version", version()}};
    else
        throw ProtocolError(ErrorCode::MethodNotFound, "Resource not found: " + uri);

    mcp::ResourceContent content;
    content.uri = uri;
    content.mime_type = MIME_JSON;
    content.text = doc.dump();
    return content;
}

void ServiceRegistrar::register_tools(server::Registry& registry)
{
    registry.register_tool("service_info", [this](const server::RequestContext&, const Json&)
                           { return mcp::ToolResult::text(health().dump(2)); });
}

std::vector<mcp::Tool> ServiceRegistrar::tool_definitions() const
{
    return {
        {"service_info", "Report service health and version", mcp::object_schema(Json::object())},
    };
}

void ServiceRegistrar::register_resources(server::Registry& registry)
{
    registry.register_resource("service://*",
                               [this](const server::RequestContext& ctx, const std::string& uri)
                               { return read(ctx, uri); });
}

std::vector<mcp::Resource> ServiceRegistrar::resource_definitions() const
{
    return {
        {HEALTH_URI, "Service Health", "Health status of the BrewSource MCP service", MIME_JSON},
        {VERSION_URI, "Service Version", "Current version of the BrewSource MCP service",
         MIME_JSON},
    };
}

} // namespace brewsource::service
