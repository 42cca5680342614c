#pragma once
#include "brewsource/server/server.hpp"

#include <atomic>
#include <iosfwd>
#include <memory>
#include <thread>

namespace brewsource::server
{

/**
 * Line-delimited JSON-RPC transport over standard streams.
 *
 * Reads one envelope per line from the input stream and writes one response
 * per line to the output stream. Blank lines are skipped; a line that fails
 * validation gets a ParseError/InvalidRequest reply and the loop keeps going.
 *
 * Requests are handled one at a time on the reading thread, so a slow handler
 * holds up every line queued behind it.
 *
 * Usage:
 *   auto core = std::make_shared<Server>(info, tool_registrars, resource_registrars);
 *   StdioServerWrapper stdio(core);
 *   stdio.run();  // Blocking - runs until EOF or stop() is called
 */
class StdioServerWrapper
{
  public:
    /**
     * @param core Shared server whose dispatcher answers each line.
     * @param in   Input stream (std::cin by default).
     * @param out  Output stream (std::cout by default).
     */
    explicit StdioServerWrapper(std::shared_ptr<const Server> core);
    StdioServerWrapper(std::shared_ptr<const Server> core, std::istream& in, std::ostream& out);

    ~StdioServerWrapper();

    /**
     * Run the loop on the calling thread until EOF, stop(), or a write
     * failure.
     *
     * @return false if the server was already running or the session ended on
     *         a stream error
     */
    bool run();

    /// Run the loop on a background thread. Use stop() to terminate.
    bool start_async();

    /**
     * Ask the loop to stop after the current line and join the background
     * thread, if any. A read that is already blocked on the input stream is
     * not interrupted. Safe to call multiple times.
     */
    void stop();

    bool running() const
    {
        return running_.load();
    }

    /// Number of lines handed to the dispatcher so far.
    std::size_t processed() const
    {
        return processed_.load();
    }

  private:
    bool run_loop();

    std::shared_ptr<const Server> core_;
    std::istream& in_;
    std::ostream& out_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<std::size_t> processed_{0};
    std::thread thread_;
};

} // namespace brewsource::server
