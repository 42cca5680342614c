#pragma once
#include "brewsource/server/server.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace httplib
{
class Server;
}

namespace brewsource::server
{

/// HTTP transport: one envelope per `POST /mcp` body.
///
/// Replies 200 with the response envelope, 204 when there is nothing to send,
/// 400 for a body that is not a JSON object and 405 for any other verb on /mcp.
class HttpServerWrapper
{
  public:
    /**
     * @param core Shared server whose dispatcher answers each request.
     * @param host Host address to bind to (default: "127.0.0.1").
     * @param port Port to listen on; 0 binds any free port, see port().
     * @param path Endpoint path (default: "/mcp").
     */
    HttpServerWrapper(std::shared_ptr<const Server> core, std::string host = "127.0.0.1",
                      int port = 8080, std::string path = "/mcp");
    ~HttpServerWrapper();

    /// Returns false if already running; throws TransportError if the port
    /// cannot be bound.
    bool start();
    void stop();
    bool running() const
    {
        return running_.load();
    }
    int port() const
    {
        return port_;
    }
    const std::string& host() const
    {
        return host_;
    }

  private:
    std::shared_ptr<const Server> core_;
    std::string host_;
    int port_;
    std::string path_;
    std::unique_ptr<httplib::Server> svr_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

} // namespace brewsource::server
