#include "brewsource/mcp/dispatcher.hpp"

#include "brewsource/exceptions.hpp"
#include "brewsource/resources/uri_pattern.hpp"
#include "brewsource/server/registry.hpp"
#include "brewsource/util/log.hpp"

#include <chrono>

namespace brewsource::mcp
{

namespace
{

Message error_response(const Message& msg, ErrorCode code, const std::string& message)
{
    return make_error_response(msg.response_id(), ProtocolError(code, message));
}

// Run a handler and turn whatever it throws into an error envelope. Coded
// errors keep their code and data; everything else becomes InternalError
// carrying the exception text.
template <typename Fn>
Message invoke_handler(const Message& msg, Fn&& fn)
{
    try
    {
        return make_response(msg.response_id(), fn());
    }
    catch (const ProtocolError& e)
    {
        return make_error_response(msg.response_id(), e);
    }
    catch (const NotFoundError& e)
    {
        return error_response(msg, ErrorCode::MethodNotFound, e.what());
    }
    catch (const ValidationError& e)
    {
        return error_response(msg, ErrorCode::InvalidParams, e.what());
    }
    catch (const std::exception& e)
    {
        return error_response(msg, ErrorCode::InternalError, e.what());
    }
    catch (...)
    {
        return error_response(msg, ErrorCode::InternalError, "Unknown handler error");
    }
}

const Json& params_or_empty(const Message& msg)
{
    static const Json empty = Json::object();
    return msg.params ? *msg.params : empty;
}

} // namespace

Method method_from_string(std::string_view name)
{
    if (name == "initialize")
        return Method::Initialize;
    if (name == "tools/list")
        return Method::ToolsList;
    if (name == "tools/call")
        return Method::ToolsCall;
    if (name == "resources/list")
        return Method::ResourcesList;
    if (name == "resources/read")
        return Method::ResourcesRead;
    return Method::Unknown;
}

const char* to_string(Method method)
{
    switch (method)
    {
    case Method::Initialize:
        return "initialize";
    case Method::ToolsList:
        return "tools/list";
    case Method::ToolsCall:
        return "tools/call";
    case Method::ResourcesList:
        return "resources/list";
    case Method::ResourcesRead:
        return "resources/read";
    case Method::Unknown:
        return "unknown";
    }
    return "unknown";
}

Dispatcher::Dispatcher(const server::Registry& registry, ServerInfo server_info,
                       std::vector<Tool> tools, std::vector<Resource> resources)
    : registry_(registry), server_info_(std::move(server_info)), tools_(std::move(tools)),
      resources_(std::move(resources))
{
}

std::optional<Message> Dispatcher::dispatch(const server::RequestContext& ctx,
                                            std::string_view data) const
{
    if (log::enabled(log::Level::Debug))
        log::debug("Processing message: " + std::string(data));

    Message msg;
    try
    {
        msg = validate_message(data);
    }
    catch (const ProtocolError& e)
    {
        log::debug(std::string("Rejected envelope: ") + e.what());
        return make_error_response(Json(), e);
    }
    return dispatch(ctx, msg);
}

std::optional<Message> Dispatcher::dispatch(const server::RequestContext& ctx,
                                            const Message& msg) const
{
    const std::string name = msg.method.value_or("");
    const Method method = method_from_string(name);
    auto start = std::chrono::steady_clock::now();

    Message response;
    switch (method)
    {
    case Method::Initialize:
        response = handle_initialize(msg);
        break;
    case Method::ToolsList:
        response = handle_tools_list(msg);
        break;
    case Method::ToolsCall:
        response = handle_tools_call(ctx, msg);
        break;
    case Method::ResourcesList:
        response = handle_resources_list(msg);
        break;
    case Method::ResourcesRead:
        response = handle_resources_read(ctx, msg);
        break;
    case Method::Unknown:
        response = error_response(msg, ErrorCode::MethodNotFound, "Method not found: " + name);
        break;
    }

    if (log::enabled(log::Level::Debug))
    {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        log::debug("RESPONSE " + name + " (" + std::to_string(elapsed.count()) + "ms)" +
                   (response.error ? " error=" + std::to_string(response.error->code()) : ""));
    }
    return response;
}

Message Dispatcher::handle_initialize(const Message& msg) const
{
    InitializeRequest req;
    try
    {
        req = parse_initialize_request(msg.params.value_or(Json()));
    }
    catch (const ValidationError&)
    {
        return error_response(msg, ErrorCode::InvalidParams, "Invalid initialize parameters");
    }

    log::info("Initialize request from client: " + req.client_info.name + " v" +
              req.client_info.version);

    InitializeResult result;
    result.server_info = server_info_;
    return make_response(msg.response_id(), result);
}

Message Dispatcher::handle_tools_list(const Message& msg) const
{
    Json tools = Json::array();
    for (const auto& tool : tools_)
        tools.push_back(Json(tool));
    return make_response(msg.response_id(), Json{{"tools", tools}});
}

Message Dispatcher::handle_tools_call(const server::RequestContext& ctx, const Message& msg) const
{
    const Json& params = params_or_empty(msg);
    if (!params.is_object())
        return error_response(msg, ErrorCode::InvalidParams, "Invalid tool call parameters");

    std::string name;
    Json arguments = Json::object();
    if (auto it = params.find("name"); it != params.end() && !it->is_null())
    {
        if (!it->is_string())
            return error_response(msg, ErrorCode::InvalidParams, "Invalid tool call parameters");
        name = it->get<std::string>();
    }
    if (auto it = params.find("arguments"); it != params.end() && !it->is_null())
    {
        if (!it->is_object())
            return error_response(msg, ErrorCode::InvalidParams, "Invalid tool call parameters");
        arguments = *it;
    }

    if (name.empty())
        return error_response(msg, ErrorCode::InvalidParams, "Missing tool name");

    auto handler = registry_.find_tool(name);
    if (!handler)
        return error_response(msg, ErrorCode::MethodNotFound, "Tool not found: " + name);

    return invoke_handler(msg, [&]() { return Json((*handler)(ctx, arguments)); });
}

Message Dispatcher::handle_resources_list(const Message& msg) const
{
    Json resources = Json::array();
    for (const auto& resource : resources_)
        resources.push_back(Json(resource));
    return make_response(msg.response_id(), Json{{"resources", resources}});
}

Message Dispatcher::handle_resources_read(const server::RequestContext& ctx,
                                          const Message& msg) const
{
    const Json& params = params_or_empty(msg);
    if (!params.is_object())
        return error_response(msg, ErrorCode::InvalidParams, "Invalid resource read parameters");

    std::string uri;
    if (auto it = params.find("uri"); it != params.end() && !it->is_null())
    {
        if (!it->is_string())
            return error_response(msg, ErrorCode::InvalidParams,
                                  "Invalid resource read parameters");
        uri = it->get<std::string>();
    }

    if (uri.empty())
        return error_response(msg, ErrorCode::InvalidParams, "Missing resource URI");
    if (!resources::is_valid_uri(uri))
        return error_response(msg, ErrorCode::InvalidParams, "Malformed resource URI");

    auto handler = registry_.find_resource(uri);
    if (!handler)
        return error_response(msg, ErrorCode::MethodNotFound, "Resource not found: " + uri);

    return invoke_handler(msg,
                          [&]()
                          {
                              ResourceContent content = (*handler)(ctx, uri);
                              return Json{{"contents", Json::array({Json(content)})}};
                          });
}

} // namespace brewsource::mcp
