#include "brewsource/server/server.hpp"
#include "brewsource/service/service_registrar.hpp"

#include <cassert>
#include <cstdio>
#include <fstream>
#include <memory>
#include <string>

using namespace brewsource;

int main()
{
    const std::string version_file = "service_registrar_test.VERSION";
    {
        std::ofstream out(version_file);
        out << "2.3.4\n";
    }

    auto service = std::make_shared<service::ServiceRegistrar>(version_file);
    assert(service->version() == "2.3.4");
    assert(service->health()["status"] == "healthy");
    assert(service->health()["service"] == "brewsource-mcp");

    server::Server srv(mcp::ServerInfo{"svc", "1"}, {service}, {service});
    server::RequestContext ctx;
    auto call = [&](const Json& req) { return Json::parse(*srv.process(ctx, req.dump())); };

    assert(srv.registry().find_tool("service_info"));
    assert(srv.registry().resource_patterns() == std::vector<std::string>{"service://*"});

    // Health resource
    {
        auto j = call({{"jsonrpc", "2.0"},
                       {"id", 1},
                       {"method", "resources/read"},
                       {"params", {{"uri", "service://health"}}}});
        const auto& content = j["result"]["contents"][0];
        assert(content["uri"] == "service://health");
        assert(content["mimeType"] == "application/json");
        auto doc = Json::parse(content["text"].get<std::string>());
        assert(doc["status"] == "healthy");
        assert(doc["version"] == "2.3.4");
    }

    // Unknown service URI: the handler's own coded error is forwarded
    {
        auto j = call({{"jsonrpc", "2.0"},
                       {"id", 2},
                       {"method", "resources/read"},
                       {"params", {{"uri", "service://metrics"}}}});
        assert(j["error"]["code"] == -32601);
        assert(j["error"]["message"] == "Resource not found: service://metrics");
    }

    // service_info tool
    {
        auto j = call({{"jsonrpc", "2.0"},
                       {"id", 3},
                       {"method", "tools/call"},
                       {"params", {{"name", "service_info"}}}});
        auto doc = Json::parse(j["result"]["content"][0]["text"].get<std::string>());
        assert(doc["version"] == "2.3.4");
    }

    // Descriptors
    {
        auto j = call({{"jsonrpc", "2.0"}, {"id", 4}, {"method", "resources/list"}});
        assert(j["result"]["resources"].size() == 2);
        assert(j["result"]["resources"][1]["uri"] == "service://version");
    }

    std::remove(version_file.c_str());
    assert(service->version() == "dev");
    return 0;
}
