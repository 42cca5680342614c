#pragma once
#include <atomic>
#include <memory>
#include <string>

namespace brewsource::server
{

/// Per-request context handed to tool and resource handlers.
///
/// Copies share one cancellation flag. The WebSocket transport creates one
/// context per connection and cancels it when the peer goes away; handlers are
/// expected to poll cancelled() during long work. Nothing aborts a handler that
/// ignores it.
class RequestContext
{
  public:
    RequestContext() : RequestContext("inproc") {}
    explicit RequestContext(std::string transport, std::string connection_id = "")
        : transport_(std::move(transport)), connection_id_(std::move(connection_id)),
          cancelled_(std::make_shared<std::atomic<bool>>(false))
    {
    }

    const std::string& transport() const
    {
        return transport_;
    }
    const std::string& connection_id() const
    {
        return connection_id_;
    }

    bool cancelled() const
    {
        return cancelled_->load();
    }
    void cancel() const
    {
        cancelled_->store(true);
    }

  private:
    std::string transport_;
    std::string connection_id_;
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

} // namespace brewsource::server
