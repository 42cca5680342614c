#pragma once
#include "brewsource/exceptions.hpp"
#include "brewsource/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace brewsource::mcp
{

/// JSON-RPC 2.0 envelope.
///
/// `id` distinguishes "absent" (std::nullopt) from an explicit JSON null. A
/// response carries exactly one of `result` / `error`; a request or
/// notification carries neither.
struct Message
{
    std::string jsonrpc{JSONRPC_VERSION};
    std::optional<Json> id;
    std::optional<std::string> method;
    std::optional<Json> params;
    std::optional<Json> result;
    std::optional<ProtocolError> error;

    bool is_request() const
    {
        return method.has_value();
    }
    bool is_notification() const
    {
        return method.has_value() && (!id || id->is_null());
    }
    bool is_response() const
    {
        return !method && (result.has_value() || error.has_value());
    }

    /// Identifier to echo in a response; JSON null when the request had none.
    Json response_id() const
    {
        return id ? *id : Json();
    }
};

void to_json(Json& j, const Message& msg);
void from_json(const Json& j, Message& msg);

/// Parse raw bytes into an envelope.
///
/// Throws ProtocolError with ErrorCode::ParseError for empty input, the
/// literal `null` document, undecodable bytes or a non-object document, and
/// ErrorCode::InvalidRequest for a missing or unsupported version tag or
/// mistyped id/method members.
Message validate_message(std::string_view data);

Message make_request(const std::string& method, Json params, Json id);
Message make_notification(const std::string& method, Json params = nullptr);
Message make_response(Json id, Json result);
Message make_error_response(Json id, const ProtocolError& error);

} // namespace brewsource::mcp
