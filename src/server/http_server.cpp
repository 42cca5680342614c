#include "brewsource/server/http_server.hpp"

#include "brewsource/exceptions.hpp"
#include "brewsource/util/log.hpp"

#include <httplib.h>

namespace brewsource::server
{

HttpServerWrapper::HttpServerWrapper(std::shared_ptr<const Server> core, std::string host,
                                     int port, std::string path)
    : core_(std::move(core)), host_(std::move(host)), port_(port), path_(std::move(path))
{
}

HttpServerWrapper::~HttpServerWrapper()
{
    stop();
}

bool HttpServerWrapper::start()
{
    // Idempotent start: return false if already running
    if (running_)
        return false;
    svr_ = std::make_unique<httplib::Server>();

    svr_->set_payload_max_length(10 * 1024 * 1024); // 10MB max payload
    svr_->set_read_timeout(30, 0);
    svr_->set_write_timeout(30, 0);

    svr_->Post(path_,
               [this](const httplib::Request& req, httplib::Response& res)
               {
                   // Bodies that do not decode to a JSON object are rejected at the
                   // HTTP layer. A literal null and version errors get a JSON-RPC reply.
                   Json check = Json::parse(req.body, nullptr, false);
                   if (check.is_discarded() || !(check.is_object() || check.is_null()))
                   {
                       res.status = 400;
                       res.set_content("Invalid JSON", "text/plain");
                       return;
                   }

                   try
                   {
                       RequestContext ctx("http", req.remote_addr);
                       auto out = core_->process(ctx, req.body);
                       if (!out)
                       {
                           res.status = 204;
                           return;
                       }
                       res.set_content(*out, "application/json");
                       res.status = 200;
                   }
                   catch (const std::exception& e)
                   {
                       log::error(std::string("http: failed to process request: ") + e.what());
                       res.status = 500;
                       res.set_content("Failed to process request", "text/plain");
                   }
               });

    // Only POST is served on the endpoint, whatever the verb.
    svr_->set_pre_routing_handler(
        [this](const httplib::Request& req, httplib::Response& res)
        {
            if (req.path != path_ || req.method == "POST")
                return httplib::Server::HandlerResponse::Unhandled;
            res.status = 405;
            res.set_header("Allow", "POST");
            res.set_content("Method Not Allowed", "text/plain");
            return httplib::Server::HandlerResponse::Handled;
        });

    if (port_ == 0)
    {
        port_ = svr_->bind_to_any_port(host_);
        if (port_ < 0)
        {
            svr_.reset();
            throw TransportError("HTTP bind on " + host_ + " failed");
        }
    }
    else if (!svr_->bind_to_port(host_, port_))
    {
        svr_.reset();
        throw TransportError("HTTP bind on " + host_ + ":" + std::to_string(port_) + " failed");
    }

    running_ = true;
    thread_ = std::thread(
        [this]()
        {
            svr_->listen_after_bind();
            running_ = false;
        });

    log::info("HTTP MCP server listening on http://" + host_ + ":" + std::to_string(port_) +
              path_);
    return true;
}

void HttpServerWrapper::stop()
{
    // Always attempt a graceful shutdown; safe to call multiple times
    if (svr_)
        svr_->stop();
    if (thread_.joinable())
        thread_.join();
    running_ = false;
    svr_.reset();
}

} // namespace brewsource::server
