#include "brewsource/server/stdio_server.hpp"

#include "brewsource/util/log.hpp"

#include <iostream>
#include <string>

namespace brewsource::server
{

namespace
{
bool is_blank(const std::string& line)
{
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}
} // namespace

StdioServerWrapper::StdioServerWrapper(std::shared_ptr<const Server> core)
    : StdioServerWrapper(std::move(core), std::cin, std::cout)
{
}

StdioServerWrapper::StdioServerWrapper(std::shared_ptr<const Server> core, std::istream& in,
                                       std::ostream& out)
    : core_(std::move(core)), in_(in), out_(out)
{
}

StdioServerWrapper::~StdioServerWrapper()
{
    stop();
}

bool StdioServerWrapper::run_loop()
{
    RequestContext ctx("stdio");
    std::string line;
    bool ok = true;

    while (running_ && !stop_requested_ && std::getline(in_, line))
    {
        if (is_blank(line))
            continue;

        // Tolerate CRLF line endings from Windows clients.
        if (line.back() == '\r')
            line.pop_back();

        std::optional<std::string> response;
        try
        {
            response = core_->process(ctx, line);
        }
        catch (const std::exception& e)
        {
            log::error(std::string("stdio: failed to process line: ") + e.what());
            continue;
        }
        ++processed_;

        if (!response)
            continue;

        out_ << *response << '\n';
        out_.flush();
        if (!out_)
        {
            log::error("stdio: write to output stream failed, ending session");
            ok = false;
            break;
        }
    }

    if (in_.bad())
    {
        log::error("stdio: input stream error");
        ok = false;
    }
    ctx.cancel();
    running_ = false;
    log::debug("stdio: session ended after " + std::to_string(processed_.load()) + " messages");
    return ok;
}

bool StdioServerWrapper::run()
{
    if (running_)
        return false;

    running_ = true;
    stop_requested_ = false;
    return run_loop();
}

bool StdioServerWrapper::start_async()
{
    if (running_)
        return false;

    running_ = true;
    stop_requested_ = false;

    thread_ = std::thread([this]() { run_loop(); });

    return true;
}

void StdioServerWrapper::stop()
{
    stop_requested_ = true;

    if (thread_.joinable())
        thread_.join();

    running_ = false;
}

} // namespace brewsource::server
