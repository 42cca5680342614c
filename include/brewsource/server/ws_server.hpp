#pragma once
#include "brewsource/server/server.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>

namespace brewsource::server
{

/**
 * WebSocket transport: one JSON-RPC envelope per text frame.
 *
 * Each connection gets its own worker thread and FIFO inbox, so frames from one
 * client are answered in the order they arrived while separate clients proceed
 * concurrently. The connection's RequestContext is cancelled when the peer
 * disconnects. A failed send closes only that connection.
 */
class WsServerWrapper
{
  public:
    /**
     * @param core Shared server whose dispatcher answers each frame.
     * @param host Address to bind (default: "127.0.0.1").
     * @param port Port to listen on; 0 picks a free port, see port().
     */
    WsServerWrapper(std::shared_ptr<const Server> core, std::string host = "127.0.0.1",
                    int port = 8080);
    ~WsServerWrapper();

    WsServerWrapper(const WsServerWrapper&) = delete;
    WsServerWrapper& operator=(const WsServerWrapper&) = delete;

    /// Bind and start accepting on a background I/O thread. Returns false if
    /// already running; throws TransportError if the address cannot be bound.
    bool start();

    /// Close every connection, wait for in-flight requests, stop the I/O
    /// thread. Safe to call multiple times.
    void stop();

    bool running() const
    {
        return running_.load();
    }
    /// Bound port; resolved to the actual port after start() when 0 was given.
    int port() const
    {
        return port_;
    }
    const std::string& host() const
    {
        return host_;
    }
    std::size_t connection_count() const;

  private:
    struct Impl;

    std::shared_ptr<const Server> core_;
    std::string host_;
    int port_;
    std::unique_ptr<Impl> impl_;
    std::atomic<bool> running_{false};
};

} // namespace brewsource::server
