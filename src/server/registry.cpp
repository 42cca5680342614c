#include "brewsource/server/registry.hpp"

#include "brewsource/exceptions.hpp"
#include "brewsource/resources/uri_pattern.hpp"
#include "brewsource/util/log.hpp"

#include <algorithm>
#include <mutex>

namespace brewsource::server
{

void Registry::register_tool(const std::string& name, ToolHandler handler)
{
    if (!handler)
        throw ValidationError("tool handler for '" + name + "' is empty");
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        tools_[name] = std::move(handler);
    }
    log::debug("Registered tool handler: " + name);
}

void Registry::register_resource(const std::string& pattern, ResourceHandler handler)
{
    if (!handler)
        throw ValidationError("resource handler for '" + pattern + "' is empty");
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        resources_[pattern] = std::move(handler);
    }
    log::debug("Registered resource handler: " + pattern);
}

std::optional<ToolHandler> Registry::find_tool(const std::string& name) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tools_.find(name);
    if (it == tools_.end())
        return std::nullopt;
    return it->second;
}

std::optional<ResourceHandler> Registry::find_resource(const std::string& uri) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto exact = resources_.find(uri);
    if (exact != resources_.end())
        return exact->second;

    const ResourceHandler* best = nullptr;
    std::size_t best_len = 0;
    for (const auto& [pattern, handler] : resources_)
    {
        if (!resources::is_wildcard_pattern(pattern) || !resources::matches_pattern(pattern, uri))
            continue;
        std::size_t len = resources::pattern_specificity(pattern);
        if (!best || len > best_len)
        {
            best = &handler;
            best_len = len;
        }
    }
    if (!best)
        return std::nullopt;
    return *best;
}

std::vector<std::string> Registry::tool_names() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& kv : tools_)
        names.push_back(kv.first);
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> Registry::resource_patterns() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> patterns;
    patterns.reserve(resources_.size());
    for (const auto& kv : resources_)
        patterns.push_back(kv.first);
    return patterns;
}

std::size_t Registry::tool_count() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tools_.size();
}

std::size_t Registry::resource_count() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return resources_.size();
}

} // namespace brewsource::server
