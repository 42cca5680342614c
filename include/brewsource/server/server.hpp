#pragma once
#include "brewsource/mcp/dispatcher.hpp"
#include "brewsource/mcp/registrar.hpp"
#include "brewsource/server/context.hpp"
#include "brewsource/server/registry.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace brewsource::server
{

/// Owns the registry and the dispatcher that all transports share.
///
/// Registrars are run synchronously in the constructor, so the registry is
/// fully populated before any transport can reach it. Their descriptor lists
/// are captured at the same time and back tools/list and resources/list.
class Server
{
  public:
    using ToolRegistrars = std::vector<std::shared_ptr<mcp::ToolRegistrar>>;
    using ResourceRegistrars = std::vector<std::shared_ptr<mcp::ResourceRegistrar>>;

    explicit Server(mcp::ServerInfo info, ToolRegistrars tool_registrars = {},
                    ResourceRegistrars resource_registrars = {});

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    Registry& registry()
    {
        return registry_;
    }
    const Registry& registry() const
    {
        return registry_;
    }
    const mcp::Dispatcher& dispatcher() const
    {
        return dispatcher_;
    }
    const mcp::ServerInfo& info() const
    {
        return dispatcher_.server_info();
    }

    /// Dispatch raw bytes and serialize the reply, if any.
    std::optional<std::string> process(const RequestContext& ctx, std::string_view data) const;

  private:
    Registry registry_;
    ToolRegistrars tool_registrars_;
    ResourceRegistrars resource_registrars_;
    mcp::Dispatcher dispatcher_;
};

} // namespace brewsource::server
