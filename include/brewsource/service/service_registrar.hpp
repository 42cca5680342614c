#pragma once
#include "brewsource/mcp/registrar.hpp"
#include "brewsource/server/context.hpp"

#include <string>
#include <vector>

namespace brewsource::service
{

/// Exposes the service's own health and version documents.
///
/// Resources: service://health and service://version (registered under the
/// pattern service://*). Tool: service_info, which returns the health document
/// as text content.
class ServiceRegistrar : public mcp::ToolRegistrar, public mcp::ResourceRegistrar
{
  public:
    /// @param version_file File holding the version string; "dev" when unreadable.
    explicit ServiceRegistrar(std::string version_file = "VERSION");

    void register_tools(server::Registry& registry) override;
    std::vector<mcp::Tool> tool_definitions() const override;

    void register_resources(server::Registry& registry) override;
    std::vector<mcp::Resource> resource_definitions() const override;

    std::string version() const;
    Json health() const;

    mcp::ResourceContent read(const server::RequestContext& ctx, const std::string& uri) const;

  private:
    std::string version_file_;
};

} // namespace brewsource::service
