#pragma once
#include "brewsource/types.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace brewsource
{

/// JSON-RPC 2.0 error codes. Handler-defined codes outside this set are
/// forwarded unchanged.
enum class ErrorCode : int
{
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,
};

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct NotFoundError : public Error
{
    using Error::Error;
};

struct ValidationError : public Error
{
    using Error::Error;
};

struct TransportError : public Error
{
    using Error::Error;
};

/// Coded protocol error. Doubles as the wire "error" member of a response
/// envelope and as the exception handlers throw to report a coded failure.
class ProtocolError : public Error
{
  public:
    ProtocolError(int code, const std::string& message, Json data = nullptr)
        : Error(message), code_(code), data_(std::move(data))
    {
    }
    ProtocolError(ErrorCode code, const std::string& message, Json data = nullptr)
        : ProtocolError(static_cast<int>(code), message, std::move(data))
    {
    }

    int code() const
    {
        return code_;
    }
    const Json& data() const
    {
        return data_;
    }
    std::string message() const
    {
        return what();
    }

    bool is(ErrorCode code) const
    {
        return code_ == static_cast<int>(code);
    }

    Json to_json() const
    {
        Json j = {{"code", code_}, {"message", message()}};
        if (!data_.is_null())
            j["data"] = data_;
        return j;
    }

    /// Rebuild from a wire error object. Missing members throw ValidationError.
    static ProtocolError from_json(const Json& j)
    {
        if (!j.is_object() || !j.contains("code") || !j["code"].is_number_integer() ||
            !j.contains("message") || !j["message"].is_string())
            throw ValidationError("error object requires integer code and string message");
        const auto& code = j["code"];
        bool in_range = true;
        if (code.is_number_unsigned())
            in_range = code.get<std::uint64_t>() <=
                       static_cast<std::uint64_t>(std::numeric_limits<int>::max());
        else
            in_range = code.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
                       code.get<std::int64_t>() <= std::numeric_limits<int>::max();
        if (!in_range)
            throw ValidationError("error code out of range: " + code.dump());
        return ProtocolError(code.get<int>(), j["message"].get<std::string>(),
                             j.value("data", Json()));
    }

  private:
    int code_;
    Json data_;
};

} // namespace brewsource
