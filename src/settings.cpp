#include "brewsource/settings.hpp"

#include "brewsource/exceptions.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>

namespace brewsource
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

int parse_port(const std::string& s)
{
    std::size_t pos = 0;
    int port = -1;
    try
    {
        port = std::stoi(s, &pos);
    }
    catch (const std::exception&)
    {
        throw ValidationError("invalid port: " + s);
    }
    if (pos != s.size() || port < 0 || port > 65535)
        throw ValidationError("invalid port: " + s);
    return port;
}

const char* to_string(TransportKind kind)
{
    switch (kind)
    {
    case TransportKind::Stdio:
        return "stdio";
    case TransportKind::WebSocket:
        return "ws";
    case TransportKind::Http:
        return "http";
    }
    return "stdio";
}

TransportKind transport_from_string(const std::string& s)
{
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "stdio")
        return TransportKind::Stdio;
    if (lower == "ws" || lower == "websocket")
        return TransportKind::WebSocket;
    if (lower == "http")
        return TransportKind::Http;
    throw ValidationError("unknown transport: " + s);
}

Settings Settings::from_env()
{
    Settings s;
    // LOG_LEVEL=debug is honoured for compatibility with existing deployments.
    auto lvl = getenv_str("BREWSOURCE_LOG_LEVEL", getenv_str("LOG_LEVEL", s.log_level));
    std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::toupper);
    s.log_level = lvl;
    s.transport = transport_from_string(getenv_str("BREWSOURCE_TRANSPORT", to_string(s.transport)));
    s.host = getenv_str("BREWSOURCE_HOST", s.host);
    if (const char* port = std::getenv("BREWSOURCE_PORT"))
        s.port = parse_port(port);
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (!j.is_object())
        throw ValidationError("settings must be a JSON object");
    try
    {
        if (j.contains("log_level"))
            s.log_level = j.at("log_level").get<std::string>();
        if (j.contains("transport"))
            s.transport = transport_from_string(j.at("transport").get<std::string>());
        if (j.contains("host"))
            s.host = j.at("host").get<std::string>();
        if (j.contains("port"))
        {
            const auto& p = j.at("port");
            s.port = p.is_string() ? parse_port(p.get<std::string>()) : p.get<int>();
            if (s.port < 0 || s.port > 65535)
                throw ValidationError("invalid port: " + p.dump());
        }
        if (j.contains("server_name"))
            s.server_name = j.at("server_name").get<std::string>();
        if (j.contains("server_version"))
            s.server_version = j.at("server_version").get<std::string>();
    }
    catch (const Json::exception& e)
    {
        throw ValidationError(std::string("invalid settings: ") + e.what());
    }
    return s;
}

Settings Settings::from_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw NotFoundError("cannot open settings file: " + path);
    Json j = Json::parse(in, nullptr, false);
    if (j.is_discarded())
        throw ValidationError("settings file is not valid JSON: " + path);
    return from_json(j);
}

} // namespace brewsource
