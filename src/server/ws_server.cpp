#include "brewsource/server/ws_server.hpp"

#include "brewsource/exceptions.hpp"
#include "brewsource/util/log.hpp"

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace brewsource::server
{

namespace
{

typedef websocketpp::server<websocketpp::config::asio> ws_server;
typedef websocketpp::connection_hdl connection_hdl;

constexpr std::size_t MAX_MESSAGE_SIZE = 10 * 1024 * 1024;

struct Connection
{
    Connection(std::string id_, connection_hdl hdl_)
        : id(std::move(id_)), hdl(std::move(hdl_)), ctx("ws", id)
    {
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            closed = true;
            inbox.clear();
        }
        ctx.cancel();
        cv.notify_all();
    }

    void join()
    {
        std::lock_guard<std::mutex> lock(join_mutex);
        if (worker.joinable())
            worker.join();
    }

    std::string id;
    connection_hdl hdl;
    RequestContext ctx;

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> inbox;
    bool closed{false};
    std::atomic<bool> finished{false};

    std::mutex join_mutex;
    std::thread worker;
};

} // namespace

struct WsServerWrapper::Impl
{
    explicit Impl(std::shared_ptr<const Server> core_) : core(std::move(core_)) {}

    void on_open(connection_hdl hdl)
    {
        reap_finished();

        auto conn = std::make_shared<Connection>("ws-" + std::to_string(++next_id), hdl);
        {
            std::lock_guard<std::mutex> lock(connections_mutex);
            if (!stopping)
                connections[hdl] = conn;
            else
                conn.reset();
        }
        if (!conn)
        {
            // Handshake finished after stop() began.
            websocketpp::lib::error_code ec;
            endpoint.close(hdl, websocketpp::close::status::going_away, "server shutdown", ec);
            return;
        }
        {
            std::lock_guard<std::mutex> lock(conn->join_mutex);
            conn->worker = std::thread([this, conn]() { worker_loop(conn); });
        }
        log::info("WebSocket connection opened: " + conn->id);
    }

    void on_close(connection_hdl hdl)
    {
        std::shared_ptr<Connection> conn;
        {
            std::lock_guard<std::mutex> lock(connections_mutex);
            auto it = connections.find(hdl);
            if (it == connections.end())
                return;
            conn = it->second;
            connections.erase(it);
            retired.push_back(conn);
        }
        conn->close();
        log::info("WebSocket connection closed: " + conn->id);
    }

    void on_message(connection_hdl hdl, ws_server::message_ptr msg)
    {
        std::shared_ptr<Connection> conn;
        {
            std::lock_guard<std::mutex> lock(connections_mutex);
            auto it = connections.find(hdl);
            if (it == connections.end())
                return;
            conn = it->second;
        }
        {
            std::lock_guard<std::mutex> lock(conn->mutex);
            if (conn->closed)
                return;
            conn->inbox.push_back(msg->get_payload());
        }
        conn->cv.notify_one();
    }

    void worker_loop(const std::shared_ptr<Connection>& conn)
    {
        for (;;)
        {
            std::string frame;
            {
                std::unique_lock<std::mutex> lock(conn->mutex);
                conn->cv.wait(lock, [&]() { return conn->closed || !conn->inbox.empty(); });
                if (conn->closed)
                    break;
                frame = std::move(conn->inbox.front());
                conn->inbox.pop_front();
            }

            std::optional<std::string> response;
            try
            {
                response = core->process(conn->ctx, frame);
            }
            catch (const std::exception& e)
            {
                log::error("WebSocket " + conn->id + ": failed to process frame: " + e.what());
                continue;
            }
            if (!response)
                continue;

            websocketpp::lib::error_code ec;
            endpoint.send(conn->hdl, *response, websocketpp::frame::opcode::text, ec);
            if (ec)
            {
                log::warning("WebSocket " + conn->id + ": send failed: " + ec.message());
                websocketpp::lib::error_code close_ec;
                endpoint.close(conn->hdl, websocketpp::close::status::internal_endpoint_error,
                               "send failed", close_ec);
                break;
            }
        }
        conn->finished = true;
    }

    void reap_finished()
    {
        std::vector<std::shared_ptr<Connection>> done;
        {
            std::lock_guard<std::mutex> lock(connections_mutex);
            for (auto it = retired.begin(); it != retired.end();)
            {
                if ((*it)->finished)
                {
                    done.push_back(*it);
                    it = retired.erase(it);
                }
                else
                {
                    ++it;
                }
            }
        }
        for (auto& conn : done)
            conn->join();
    }

    void close_and_join(const std::vector<std::shared_ptr<Connection>>& conns)
    {
        for (const auto& conn : conns)
            conn->close();
        for (const auto& conn : conns)
            conn->join();
    }

    std::vector<std::shared_ptr<Connection>> all_connections()
    {
        std::lock_guard<std::mutex> lock(connections_mutex);
        std::vector<std::shared_ptr<Connection>> all(retired.begin(), retired.end());
        for (const auto& kv : connections)
            all.push_back(kv.second);
        return all;
    }

    std::shared_ptr<const Server> core;
    ws_server endpoint;
    std::thread io_thread;

    mutable std::mutex connections_mutex;
    std::map<connection_hdl, std::shared_ptr<Connection>, std::owner_less<connection_hdl>>
        connections;
    std::vector<std::shared_ptr<Connection>> retired;
    bool stopping{false};
    std::atomic<std::uint64_t> next_id{0};
};

WsServerWrapper::WsServerWrapper(std::shared_ptr<const Server> core, std::string host, int port)
    : core_(std::move(core)), host_(std::move(host)), port_(port)
{
}

WsServerWrapper::~WsServerWrapper()
{
    stop();
}

bool WsServerWrapper::start()
{
    if (running_)
        return false;

    impl_ = std::make_unique<Impl>(core_);
    auto& ep = impl_->endpoint;

    ep.clear_access_channels(websocketpp::log::alevel::all);
    ep.set_error_channels(websocketpp::log::elevel::rerror | websocketpp::log::elevel::fatal);
    ep.init_asio();
    ep.set_reuse_addr(true);
    ep.set_max_message_size(MAX_MESSAGE_SIZE);

    Impl* impl = impl_.get();
    ep.set_open_handler([impl](connection_hdl hdl) { impl->on_open(hdl); });
    ep.set_close_handler([impl](connection_hdl hdl) { impl->on_close(hdl); });
    ep.set_fail_handler([impl](connection_hdl hdl) { impl->on_close(hdl); });
    ep.set_message_handler([impl](connection_hdl hdl, ws_server::message_ptr msg)
                           { impl->on_message(hdl, msg); });

    websocketpp::lib::error_code ec;
    ep.listen(host_, std::to_string(port_), ec);
    if (ec)
    {
        impl_.reset();
        throw TransportError("WebSocket listen on " + host_ + ":" + std::to_string(port_) +
                             " failed: " + ec.message());
    }
    websocketpp::lib::asio::error_code local_ec;
    auto local = ep.get_local_endpoint(local_ec);
    if (!local_ec)
        port_ = local.port();
    ep.start_accept(ec);
    if (ec)
    {
        impl_.reset();
        throw TransportError("WebSocket accept failed: " + ec.message());
    }

    running_ = true;
    impl_->io_thread = std::thread(
        [this, impl]()
        {
            try
            {
                impl->endpoint.run();
            }
            catch (const std::exception& e)
            {
                log::error(std::string("WebSocket server error: ") + e.what());
            }
            running_ = false;
        });

    log::info("WebSocket MCP server listening on ws://" + host_ + ":" + std::to_string(port_));
    return true;
}

void WsServerWrapper::stop()
{
    if (!impl_)
        return;

    auto& ep = impl_->endpoint;
    {
        std::lock_guard<std::mutex> lock(impl_->connections_mutex);
        impl_->stopping = true;
    }
    websocketpp::lib::error_code ec;
    ep.stop_listening(ec);

    auto conns = impl_->all_connections();
    for (auto& conn : conns)
    {
        websocketpp::lib::error_code close_ec;
        ep.close(conn->hdl, websocketpp::close::status::going_away, "server shutdown", close_ec);
    }
    impl_->close_and_join(conns);

    ep.stop();
    if (impl_->io_thread.joinable())
        impl_->io_thread.join();

    // on_open only runs on the I/O thread, so nothing is added past this point.
    impl_->close_and_join(impl_->all_connections());

    impl_.reset();
    running_ = false;
}

std::size_t WsServerWrapper::connection_count() const
{
    if (!impl_)
        return 0;
    std::lock_guard<std::mutex> lock(impl_->connections_mutex);
    return impl_->connections.size();
}

} // namespace brewsource::server
