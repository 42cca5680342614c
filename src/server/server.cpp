#include "brewsource/server/server.hpp"

#include "brewsource/util/log.hpp"

namespace brewsource::server
{

namespace
{
std::vector<mcp::Tool> collect_tools(const Server::ToolRegistrars& registrars)
{
    std::vector<mcp::Tool> tools;
    for (const auto& r : registrars)
    {
        if (!r)
            continue;
        auto defs = r->tool_definitions();
        tools.insert(tools.end(), defs.begin(), defs.end());
    }
    return tools;
}

std::vector<mcp::Resource> collect_resources(const Server::ResourceRegistrars& registrars)
{
    std::vector<mcp::Resource> resources;
    for (const auto& r : registrars)
    {
        if (!r)
            continue;
        auto defs = r->resource_definitions();
        resources.insert(resources.end(), defs.begin(), defs.end());
    }
    return resources;
}
} // namespace

Server::Server(mcp::ServerInfo info, ToolRegistrars tool_registrars,
               ResourceRegistrars resource_registrars)
    : tool_registrars_(std::move(tool_registrars)),
      resource_registrars_(std::move(resource_registrars)),
      dispatcher_(registry_, std::move(info), collect_tools(tool_registrars_),
                  collect_resources(resource_registrars_))
{
    for (const auto& r : tool_registrars_)
        if (r)
            r->register_tools(registry_);
    for (const auto& r : resource_registrars_)
        if (r)
            r->register_resources(registry_);

    log::debug("Server '" + dispatcher_.server_info().name + "' ready with " +
               std::to_string(registry_.tool_count()) + " tools and " +
               std::to_string(registry_.resource_count()) + " resource patterns");
}

std::optional<std::string> Server::process(const RequestContext& ctx, std::string_view data) const
{
    auto response = dispatcher_.dispatch(ctx, data);
    if (!response)
        return std::nullopt;
    return Json(*response).dump(-1, ' ', false, Json::error_handler_t::replace);
}

} // namespace brewsource::server
