#include "brewsource/exceptions.hpp"
#include "brewsource/server/http_server.hpp"
#include "brewsource/server/server.hpp"
#include "brewsource/server/stdio_server.hpp"
#include "brewsource/server/ws_server.hpp"
#include "brewsource/service/service_registrar.hpp"
#include "brewsource/settings.hpp"
#include "brewsource/util/log.hpp"
#include "brewsource/version.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace
{

volatile std::sig_atomic_t g_stop = 0;

void on_signal(int)
{
    g_stop = 1;
}

static int usage(int exit_code = 1)
{
    std::cout << "brewsource-mcp " << brewsource::VERSION_STRING << "\n";
    std::cout << "Usage:\n";
    std::cout << "  brewsource-mcp [options]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --transport <stdio|ws|http>   Transport to serve (default: stdio)\n";
    std::cout << "  --host <addr>                 Bind address for ws/http (default: 127.0.0.1)\n";
    std::cout << "  --port <n>                    Port for ws/http (default: 8080)\n";
    std::cout << "  --log-level <level>           DEBUG, INFO, WARNING or ERROR\n";
    std::cout << "  --config <file.json>          Load settings from a JSON file\n";
    std::cout << "  --version                     Print version and exit\n";
    std::cout << "  --help                        Show this help\n";
    std::cout << "\n";
    std::cout << "Environment: BREWSOURCE_TRANSPORT, BREWSOURCE_HOST, BREWSOURCE_PORT,\n";
    std::cout << "             BREWSOURCE_LOG_LEVEL (or LOG_LEVEL)\n";
    return exit_code;
}

struct CliOptions
{
    std::optional<std::string> config;
    std::optional<std::string> transport;
    std::optional<std::string> host;
    std::optional<std::string> port;
    std::optional<std::string> log_level;
};

template <typename Transport>
int serve_until_signalled(Transport& transport)
{
    if (!transport.start())
        return 1;
    while (!g_stop && transport.running())
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    brewsource::log::info("Shutting down server...");
    transport.stop();
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    using namespace brewsource;

    CliOptions cli;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        auto next = [&](const char* flag) -> std::string
        {
            if (i + 1 >= argc)
                throw ValidationError(std::string("missing value for ") + flag);
            return argv[++i];
        };
        try
        {
            if (arg == "--help" || arg == "-h")
                return usage(0);
            if (arg == "--version")
            {
                std::cout << VERSION_STRING << "\n";
                return 0;
            }
            if (arg == "--config")
                cli.config = next("--config");
            else if (arg == "--transport")
                cli.transport = next("--transport");
            else if (arg == "--host")
                cli.host = next("--host");
            else if (arg == "--port")
                cli.port = next("--port");
            else if (arg == "--log-level")
                cli.log_level = next("--log-level");
            else
            {
                std::cerr << "Unknown option: " << arg << "\n";
                return usage(2);
            }
        }
        catch (const Error& e)
        {
            std::cerr << "Error: " << e.what() << "\n";
            return 2;
        }
    }

    try
    {
        Settings settings = cli.config ? Settings::from_file(*cli.config) : Settings::from_env();
        if (cli.transport)
            settings.transport = transport_from_string(*cli.transport);
        if (cli.host)
            settings.host = *cli.host;
        if (cli.port)
            settings.port = parse_port(*cli.port);
        if (cli.log_level)
            settings.log_level = *cli.log_level;

        log::set_level(log::parse_level(settings.log_level));

        auto service = std::make_shared<service::ServiceRegistrar>();
        auto core = std::make_shared<server::Server>(
            mcp::ServerInfo{settings.server_name, settings.server_version},
            server::Server::ToolRegistrars{service}, server::Server::ResourceRegistrars{service});

        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);

        switch (settings.transport)
        {
        case TransportKind::Stdio:
        {
            log::info("Starting stdio MCP server");
            server::StdioServerWrapper stdio(core);
            return stdio.run() ? 0 : 1;
        }
        case TransportKind::WebSocket:
        {
            server::WsServerWrapper ws(core, settings.host, settings.port);
            return serve_until_signalled(ws);
        }
        case TransportKind::Http:
        {
            server::HttpServerWrapper http(core, settings.host, settings.port);
            return serve_until_signalled(http);
        }
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
