#include "brewsource/mcp/message.hpp"

#include <cctype>

namespace brewsource::mcp
{

namespace
{
bool is_blank(std::string_view data)
{
    for (char c : data)
        if (!std::isspace(static_cast<unsigned char>(c)))
            return false;
    return true;
}

ProtocolError invalid_json()
{
    return ProtocolError(ErrorCode::ParseError, "Invalid JSON");
}

// The version tag normally lives under "jsonrpc"; "version" is accepted when
// the canonical key is missing.
const Json* find_version(const Json& j)
{
    auto it = j.find("jsonrpc");
    if (it != j.end())
        return &*it;
    it = j.find("version");
    if (it != j.end())
        return &*it;
    return nullptr;
}
} // namespace

void to_json(Json& j, const Message& msg)
{
    j = Json{{"jsonrpc", msg.jsonrpc}};
    bool response = msg.result.has_value() || msg.error.has_value();
    if (msg.id)
        j["id"] = *msg.id;
    else if (response)
        j["id"] = nullptr;
    if (msg.method)
        j["method"] = *msg.method;
    if (msg.params)
        j["params"] = *msg.params;
    if (msg.error)
        j["error"] = msg.error->to_json();
    else if (msg.result)
        j["result"] = *msg.result;
}

void from_json(const Json& j, Message& msg)
{
    if (!j.is_object())
        throw ProtocolError(ErrorCode::InvalidRequest, "Envelope must be a JSON object");

    const Json* version = find_version(j);
    if (!version || !version->is_string() || version->get<std::string>() != JSONRPC_VERSION)
        throw ProtocolError(ErrorCode::InvalidRequest, "Invalid JSON-RPC version");

    Message out;
    out.jsonrpc = version->get<std::string>();

    if (auto it = j.find("id"); it != j.end())
    {
        if (!it->is_null() && !it->is_string() && !it->is_number())
            throw ProtocolError(ErrorCode::InvalidRequest, "Invalid request id");
        out.id = *it;
    }
    if (auto it = j.find("method"); it != j.end() && !it->is_null())
    {
        if (!it->is_string())
            throw ProtocolError(ErrorCode::InvalidRequest, "Method must be a string");
        out.method = it->get<std::string>();
    }
    if (auto it = j.find("params"); it != j.end() && !it->is_null())
        out.params = *it;
    if (auto it = j.find("result"); it != j.end())
        out.result = *it;
    if (auto it = j.find("error"); it != j.end() && !it->is_null())
    {
        try
        {
            out.error = ProtocolError::from_json(*it);
        }
        catch (const ValidationError& e)
        {
            throw ProtocolError(ErrorCode::InvalidRequest, e.what());
        }
    }

    msg = std::move(out);
}

Message validate_message(std::string_view data)
{
    if (data.empty() || is_blank(data))
        throw invalid_json();

    Json j = Json::parse(data.begin(), data.end(), nullptr, false);
    if (j.is_discarded() || j.is_null() || !j.is_object())
        throw invalid_json();

    return j.get<Message>();
}

Message make_request(const std::string& method, Json params, Json id)
{
    Message msg;
    msg.id = std::move(id);
    msg.method = method;
    if (!params.is_null())
        msg.params = std::move(params);
    return msg;
}

Message make_notification(const std::string& method, Json params)
{
    Message msg;
    msg.method = method;
    if (!params.is_null())
        msg.params = std::move(params);
    return msg;
}

Message make_response(Json id, Json result)
{
    Message msg;
    msg.id = std::move(id);
    msg.result = std::move(result);
    return msg;
}

Message make_error_response(Json id, const ProtocolError& error)
{
    Message msg;
    msg.id = std::move(id);
    msg.error = error;
    return msg;
}

} // namespace brewsource::mcp
