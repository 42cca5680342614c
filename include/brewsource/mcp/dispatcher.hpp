#pragma once
#include "brewsource/mcp/message.hpp"
#include "brewsource/mcp/types.hpp"
#include "brewsource/server/context.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace brewsource::server
{
class Registry;
}

namespace brewsource::mcp
{

enum class Method
{
    Initialize,
    ToolsList,
    ToolsCall,
    ResourcesList,
    ResourcesRead,
    Unknown
};

Method method_from_string(std::string_view name);
const char* to_string(Method method);

/// Routes validated envelopes to the registry and shapes the reply.
///
/// tools/list and resources/list answer from the descriptor lists given at
/// construction; tools/call and resources/read go through the registry. The
/// registry is only read here, and handlers run after its lock is released.
class Dispatcher
{
  public:
    Dispatcher(const server::Registry& registry, ServerInfo server_info,
               std::vector<Tool> tools = {}, std::vector<Resource> resources = {});

    /// Validate raw bytes and route them. Envelope failures yield an error
    /// response with a null id. std::nullopt means nothing must be written
    /// back, which only one-way notifications may produce.
    std::optional<Message> dispatch(const server::RequestContext& ctx,
                                    std::string_view data) const;
    std::optional<Message> dispatch(const server::RequestContext& ctx, const Message& msg) const;

    const ServerInfo& server_info() const
    {
        return server_info_;
    }
    const std::vector<Tool>& tools() const
    {
        return tools_;
    }
    const std::vector<Resource>& resources() const
    {
        return resources_;
    }

  private:
    Message handle_initialize(const Message& msg) const;
    Message handle_tools_list(const Message& msg) const;
    Message handle_tools_call(const server::RequestContext& ctx, const Message& msg) const;
    Message handle_resources_list(const Message& msg) const;
    Message handle_resources_read(const server::RequestContext& ctx, const Message& msg) const;

    const server::Registry& registry_;
    ServerInfo server_info_;
    std::vector<Tool> tools_;
    std::vector<Resource> resources_;
};

} // namespace brewsource::mcp
