#pragma once
#include "brewsource/mcp/types.hpp"

#include <vector>

namespace brewsource::server
{
class Registry;
}

namespace brewsource::mcp
{

/// Implemented by a handler module that contributes tools. The server calls
/// register_tools() once during construction, before any transport starts,
/// and publishes tool_definitions() through tools/list.
class ToolRegistrar
{
  public:
    virtual ~ToolRegistrar() = default;

    virtual void register_tools(server::Registry& registry) = 0;
    virtual std::vector<Tool> tool_definitions() const = 0;
};

/// Resource counterpart of ToolRegistrar; definitions feed resources/list.
class ResourceRegistrar
{
  public:
    virtual ~ResourceRegistrar() = default;

    virtual void register_resources(server::Registry& registry) = 0;
    virtual std::vector<Resource> resource_definitions() const = 0;
};

} // namespace brewsource::mcp
