#pragma once
#include "brewsource/mcp/types.hpp"
#include "brewsource/server/context.hpp"
#include "brewsource/types.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace brewsource::server
{

/// Tool callable. Failures are reported by throwing; a ProtocolError keeps its
/// code on the wire, anything else becomes InternalError.
using ToolHandler = std::function<mcp::ToolResult(const RequestContext&, const Json& arguments)>;

/// Resource callable, invoked with the concrete URI that matched its pattern.
using ResourceHandler =
    std::function<mcp::ResourceContent(const RequestContext&, const std::string& uri)>;

/// Name -> tool handler and pattern -> resource handler maps behind one
/// reader/writer lock.
///
/// Lookups hand back a copy of the callable so it can be invoked after the lock
/// is released. Registering an existing key replaces its handler; entries are
/// never removed.
class Registry
{
  public:
    void register_tool(const std::string& name, ToolHandler handler);
    void register_resource(const std::string& pattern, ResourceHandler handler);

    std::optional<ToolHandler> find_tool(const std::string& name) const;

    /// Resolve a URI to a handler. An exact pattern wins; otherwise the
    /// wildcard pattern with the longest literal prefix wins, so "*" is only
    /// used when nothing more specific matches.
    std::optional<ResourceHandler> find_resource(const std::string& uri) const;

    std::vector<std::string> tool_names() const;
    std::vector<std::string> resource_patterns() const;
    std::size_t tool_count() const;
    std::size_t resource_count() const;

  private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, ToolHandler> tools_;
    std::map<std::string, ResourceHandler> resources_;
};

} // namespace brewsource::server
