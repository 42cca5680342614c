/// @file ws_integration.cpp
/// @brief WebSocket transport: concurrent clients, per-connection ordering,
///        cancellation on disconnect

#include "brewsource/server/ws_server.hpp"

#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_no_tls_client.hpp>

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace brewsource;

typedef websocketpp::client<websocketpp::config::asio_client> ws_client;

namespace
{

std::atomic<int> g_calls{0};
std::atomic<bool> g_wait_started{false};
std::atomic<bool> g_saw_cancel{false};

class StressRegistrar : public mcp::ToolRegistrar
{
  public:
    void register_tools(server::Registry& registry) override
    {
        registry.register_tool("counter", [](const server::RequestContext& ctx, const Json& args)
                               {
                                   ++g_calls;
                                   Json out = {{"seq", args.value("seq", -1)},
                                               {"connection", ctx.connection_id()}};
                                   return mcp::ToolResult::text(out.dump());
                               });
        registry.register_tool("wait_for_cancel",
                               [](const server::RequestContext& ctx, const Json&)
                               {
                                   g_wait_started = true;
                                   auto deadline =
                                       std::chrono::steady_clock::now() + std::chrono::seconds(10);
                                   while (!ctx.cancelled() &&
                                          std::chrono::steady_clock::now() < deadline)
                                       std::this_thread::sleep_for(std::chrono::milliseconds(5));
                                   g_saw_cancel = ctx.cancelled();
                                   return mcp::ToolResult::text("done");
                               });
    }
    std::vector<mcp::Tool> tool_definitions() const override
    {
        return {{"counter", "Count calls", mcp::object_schema(Json::object())},
                {"wait_for_cancel", "Block until cancelled", mcp::object_schema(Json::object())}};
    }
};

Json call_request(int id, const std::string& tool, const Json& args)
{
    return Json{{"jsonrpc", "2.0"},
                {"id", id},
                {"method", "tools/call"},
                {"params", {{"name", tool}, {"arguments", args}}}};
}

// Open one connection, send every frame up front, collect `expected` replies.
std::vector<Json> run_client(const std::string& uri, const std::vector<std::string>& frames,
                             std::size_t expected)
{
    ws_client c;
    c.clear_access_channels(websocketpp::log::alevel::all);
    c.clear_error_channels(websocketpp::log::elevel::all);
    c.init_asio();

    std::vector<Json> replies;
    c.set_open_handler(
        [&](websocketpp::connection_hdl hdl)
        {
            for (const auto& f : frames)
                c.send(hdl, f, websocketpp::frame::opcode::text);
        });
    c.set_message_handler(
        [&](websocketpp::connection_hdl hdl, ws_client::message_ptr msg)
        {
            replies.push_back(Json::parse(msg->get_payload()));
            if (replies.size() == expected)
                c.close(hdl, websocketpp::close::status::normal, "done");
        });

    websocketpp::lib::error_code ec;
    auto con = c.get_connection(uri, ec);
    assert(!ec);
    c.connect(con);
    c.run();
    return replies;
}

// Connect, ask for one reply and disconnect, over and over until told to stop.
// Connections that fail or get closed by the server are expected here.
void churn_client(const std::string& uri, const std::atomic<bool>& done, std::atomic<int>& opened)
{
    while (!done)
    {
        ws_client c;
        c.clear_access_channels(websocketpp::log::alevel::all);
        c.clear_error_channels(websocketpp::log::elevel::all);
        c.init_asio();
        c.set_open_handler(
            [&](websocketpp::connection_hdl hdl)
            {
                ++opened;
                websocketpp::lib::error_code ec;
                c.send(hdl, call_request(1, "counter", Json::object()).dump(),
                       websocketpp::frame::opcode::text, ec);
            });
        c.set_message_handler(
            [&](websocketpp::connection_hdl hdl, ws_client::message_ptr)
            {
                websocketpp::lib::error_code ec;
                c.close(hdl, websocketpp::close::status::normal, "done", ec);
            });

        websocketpp::lib::error_code ec;
        auto con = c.get_connection(uri, ec);
        if (ec)
            return;
        c.connect(con);
        c.run();
    }
}

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred())
    {
        if (std::chrono::steady_clock::now() > deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

} // namespace

int main()
{
    auto core = std::make_shared<server::Server>(
        mcp::ServerInfo{"ws_test", "1.0.0"},
        server::Server::ToolRegistrars{std::make_shared<StressRegistrar>()});

    server::WsServerWrapper ws(core, "127.0.0.1", 0);
    assert(ws.start());
    assert(!ws.start());
    assert(ws.running());
    assert(ws.port() > 0);
    const std::string uri = "ws://127.0.0.1:" + std::to_string(ws.port());

    // Many clients hammer the same tool; each sees its replies in order
    {
        const int clients = 8;
        const int per_client = 25;
        std::vector<std::vector<Json>> results(clients);
        std::vector<std::thread> threads;
        for (int c = 0; c < clients; ++c)
        {
            threads.emplace_back(
                [&, c]()
                {
                    std::vector<std::string> frames;
                    for (int i = 0; i < per_client; ++i)
                        frames.push_back(call_request(i, "counter", {{"seq", i}}).dump());
                    results[c] = run_client(uri, frames, per_client);
                });
        }
        for (auto& t : threads)
            t.join();

        assert(g_calls == clients * per_client);
        for (const auto& replies : results)
        {
            assert(replies.size() == static_cast<std::size_t>(per_client));
            std::string connection;
            for (int i = 0; i < per_client; ++i)
            {
                assert(replies[i]["id"] == i);
                assert(replies[i].contains("result"));
                auto body = Json::parse(replies[i]["result"]["content"][0]["text"].get<std::string>());
                assert(body["seq"] == i);
                if (i == 0)
                    connection = body["connection"].get<std::string>();
                assert(body["connection"] == connection);
            }
            assert(!connection.empty());
        }
        std::cout << "[PASS] concurrent clients\n";
    }

    // Malformed frames and unknown methods are answered on the same connection
    {
        auto replies = run_client(uri,
                                  {"not json", R"({"jsonrpc":"2.0","id":"x","method":"nope"})",
                                   R"({"jsonrpc":"2.0","id":"y","method":"tools/list"})"},
                                  3);
        assert(replies.size() == 3);
        assert(replies[0]["id"].is_null());
        assert(replies[0]["error"]["code"] == -32700);
        assert(replies[1]["id"] == "x");
        assert(replies[1]["error"]["code"] == -32601);
        assert(replies[2]["id"] == "y");
        assert(replies[2]["result"]["tools"].size() == 2);
        std::cout << "[PASS] error frames\n";
    }

    // Closing the connection cancels the context seen by a running handler
    {
        ws_client c;
        c.clear_access_channels(websocketpp::log::alevel::all);
        c.clear_error_channels(websocketpp::log::elevel::all);
        c.init_asio();

        std::mutex hdl_mutex;
        websocketpp::connection_hdl opened;
        std::atomic<bool> is_open{false};
        c.set_open_handler(
            [&](websocketpp::connection_hdl hdl)
            {
                {
                    std::lock_guard<std::mutex> lock(hdl_mutex);
                    opened = hdl;
                }
                is_open = true;
                c.send(hdl, call_request(1, "wait_for_cancel", Json::object()).dump(),
                       websocketpp::frame::opcode::text);
            });

        websocketpp::lib::error_code ec;
        auto con = c.get_connection(uri, ec);
        assert(!ec);
        c.connect(con);
        std::thread client_thread([&]() { c.run(); });

        assert(wait_until([&]() { return is_open.load() && g_wait_started.load(); }));
        {
            std::lock_guard<std::mutex> lock(hdl_mutex);
            c.close(opened, websocketpp::close::status::normal, "bye", ec);
        }
        client_thread.join();

        assert(wait_until([&]() { return g_saw_cancel.load(); }));
        std::cout << "[PASS] cancellation on disconnect\n";
    }

    assert(wait_until([&]() { return ws.connection_count() == 0; }));

    ws.stop();
    ws.stop();
    assert(!ws.running());
    assert(ws.connection_count() == 0);

    // Stopping while clients keep opening connections shuts down cleanly
    {
        server::WsServerWrapper busy(core, "127.0.0.1", 0);
        assert(busy.start());
        const std::string busy_uri = "ws://127.0.0.1:" + std::to_string(busy.port());

        std::atomic<bool> done{false};
        std::atomic<int> opened{0};
        std::vector<std::thread> churners;
        for (int i = 0; i < 6; ++i)
            churners.emplace_back([&]() { churn_client(busy_uri, done, opened); });

        assert(wait_until([&]() { return opened.load() >= 6; }));
        busy.stop();
        done = true;
        for (auto& t : churners)
            t.join();

        assert(!busy.running());
        assert(busy.connection_count() == 0);
        std::cout << "[PASS] stop under connection churn\n";
    }
    return 0;
}
