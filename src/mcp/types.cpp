#include "brewsource/mcp/types.hpp"

#include "brewsource/exceptions.hpp"
#include "brewsource/util/json.hpp"

namespace brewsource::mcp
{

using util::json::string_or;

ToolResult ToolResult::text(const std::string& text)
{
    ToolResult r;
    r.content.push_back(ToolContent{"text", text, ""});
    return r;
}

ToolResult ToolResult::error(const std::string& message)
{
    ToolResult r = text(message);
    r.is_error = true;
    return r;
}

void to_json(Json& j, const Tool& tool)
{
    j = Json{{"name", tool.name},
             {"description", tool.description},
             {"inputSchema", tool.input_schema.is_null() ? Json::object() : tool.input_schema}};
}

void from_json(const Json& j, Tool& tool)
{
    tool.name = j.at("name").get<std::string>();
    tool.description = string_or(j, "description");
    tool.input_schema = j.value("inputSchema", Json::object());
}

void to_json(Json& j, const Resource& resource)
{
    j = Json{{"uri", resource.uri}, {"name", resource.name}};
    if (!resource.description.empty())
        j["description"] = resource.description;
    if (!resource.mime_type.empty())
        j["mimeType"] = resource.mime_type;
}

void from_json(const Json& j, Resource& resource)
{
    resource.uri = j.at("uri").get<std::string>();
    resource.name = j.at("name").get<std::string>();
    resource.description = string_or(j, "description");
    resource.mime_type = string_or(j, "mimeType");
}

void to_json(Json& j, const ToolContent& content)
{
    j = Json{{"type", content.type}};
    if (!content.text.empty())
        j["text"] = content.text;
    if (!content.data.empty())
        j["data"] = content.data;
}

void to_json(Json& j, const ToolResult& result)
{
    Json items = Json::array();
    for (const auto& c : result.content)
        items.push_back(Json(c));
    j = Json{{"content", items}};
    if (result.is_error)
        j["isError"] = true;
}

void from_json(const Json& j, ToolResult& result)
{
    result.content.clear();
    if (j.contains("content") && j["content"].is_array())
    {
        for (const auto& item : j["content"])
        {
            ToolContent c;
            c.type = string_or(item, "type", "text");
            c.text = string_or(item, "text");
            c.data = string_or(item, "data");
            result.content.push_back(std::move(c));
        }
    }
    result.is_error = j.value("isError", false);
}

void to_json(Json& j, const ResourceContent& content)
{
    j = Json{{"uri", content.uri},
             {"mimeType", content.mime_type},
             {"text", content.text},
             {"blob", content.blob}};
}

void to_json(Json& j, const ServerCapabilities& caps)
{
    j = Json{{"tools", {{"listChanged", caps.tools_list_changed}}},
             {"resources",
              {{"subscribe", caps.resources_subscribe},
               {"listChanged", caps.resources_list_changed}}}};
}

void to_json(Json& j, const InitializeResult& result)
{
    j = Json{{"protocolVersion", result.protocol_version},
             {"capabilities", result.capabilities},
             {"serverInfo",
              {{"name", result.server_info.name}, {"version", result.server_info.version}}}};
}

InitializeRequest parse_initialize_request(const Json& params)
{
    InitializeRequest req;
    if (params.is_null())
        return req;
    if (!params.is_object())
        throw ValidationError("initialize params must be an object");

    req.protocol_version = string_or(params, "protocolVersion");
    if (auto it = params.find("capabilities"); it != params.end() && it->is_object())
        req.capabilities = *it;
    if (auto it = params.find("clientInfo"); it != params.end() && !it->is_null())
    {
        if (!it->is_object())
            throw ValidationError("clientInfo must be an object");
        req.client_info.name = string_or(*it, "name");
        req.client_info.version = string_or(*it, "version");
    }
    return req;
}

Json string_schema(const std::string& description)
{
    return Json{{"type", "string"}, {"description", description}};
}

Json integer_schema(const std::string& description)
{
    return Json{{"type", "integer"}, {"description", description}};
}

Json object_schema(Json properties, const std::vector<std::string>& required)
{
    Json schema = {{"type", "object"},
                   {"properties", properties.is_null() ? Json::object() : std::move(properties)}};
    if (!required.empty())
        schema["required"] = required;
    return schema;
}

} // namespace brewsource::mcp
