#include "brewsource/server/stdio_server.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

// Drive the line transport through string streams

using namespace brewsource;

namespace
{
class CounterRegistrar : public mcp::ToolRegistrar
{
  public:
    void register_tools(server::Registry& registry) override
    {
        registry.register_tool("add", [](const server::RequestContext& ctx, const Json& args)
                               {
                                   assert(ctx.transport() == "stdio");
                                   int sum = args.at("a").get<int>() + args.at("b").get<int>();
                                   return mcp::ToolResult::text(std::to_string(sum));
                               });
    }
    std::vector<mcp::Tool> tool_definitions() const override
    {
        return {{"add", "Add two integers",
                 mcp::object_schema({{"a", mcp::integer_schema("First addend")},
                                     {"b", mcp::integer_schema("Second addend")}},
                                    {"a", "b"})}};
    }
};

std::vector<Json> read_lines(const std::string& text)
{
    std::vector<Json> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
        out.push_back(Json::parse(line));
    return out;
}
} // namespace

int main()
{
    auto core = std::make_shared<server::Server>(mcp::ServerInfo{"stdio_test", "0.1.0"},
                                                 server::Server::ToolRegistrars{
                                                     std::make_shared<CounterRegistrar>()});

    // Test 1: one response line per request, in order; blank lines skipped;
    // malformed lines answered without ending the loop
    {
        std::istringstream in(
            R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"clientInfo":{"name":"cli","version":"1"}}})"
            "\n"
            "\n"
            "   \n"
            "this is not json\n"
            R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})"
            "\r\n"
            R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"add","arguments":{"a":2,"b":40}}})"
            "\n"
            R"({"jsonrpc":"1.0","id":4,"method":"tools/list"})"
            "\n"
            R"({"jsonrpc":"2.0","id":5,"method":"unknown/method"})");
        std::ostringstream out;

        server::StdioServerWrapper stdio(core, in, out);
        bool ok = stdio.run();
        assert(ok);
        assert(!stdio.running());
        assert(stdio.processed() == 6);

        auto lines = read_lines(out.str());
        assert(lines.size() == 6);

        assert(lines[0]["id"] == 1);
        assert(lines[0]["result"]["serverInfo"]["name"] == "stdio_test");

        assert(lines[1]["id"].is_null());
        assert(lines[1]["error"]["code"] == -32700);

        assert(lines[2]["id"] == 2);
        assert(lines[2]["result"]["tools"].size() == 1);
        assert(lines[2]["result"]["tools"][0]["inputSchema"]["required"].size() == 2);

        assert(lines[3]["id"] == 3);
        assert(lines[3]["result"]["content"][0]["text"] == "42");

        assert(lines[4]["id"].is_null());
        assert(lines[4]["error"]["code"] == -32600);

        assert(lines[5]["id"] == 5);
        assert(lines[5]["error"]["code"] == -32601);
        std::cout << "[PASS] Test 1: request/response lines\n";
    }

    // Test 2: empty input ends immediately without output
    {
        std::istringstream in("");
        std::ostringstream out;
        server::StdioServerWrapper stdio(core, in, out);
        assert(stdio.run());
        assert(out.str().empty());
        assert(stdio.processed() == 0);
        std::cout << "[PASS] Test 2: EOF on empty input\n";
    }

    // Test 3: a broken output stream ends the session with failure
    {
        std::istringstream in(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})"
                              "\n"
                              R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})"
                              "\n");
        std::ostringstream out;
        out.setstate(std::ios::badbit);
        server::StdioServerWrapper stdio(core, in, out);
        assert(!stdio.run());
        assert(stdio.processed() == 1);
        std::cout << "[PASS] Test 3: write failure ends session\n";
    }

    // Test 4: background mode runs to EOF and can be stopped repeatedly
    {
        std::istringstream in(R"({"jsonrpc":"2.0","id":"bg","method":"tools/list"})"
                              "\n");
        std::ostringstream out;
        server::StdioServerWrapper stdio(core, in, out);
        assert(stdio.start_async());
        assert(!stdio.start_async());

        // The loop clears running() itself once it reaches EOF
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (stdio.running() && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        assert(!stdio.running());

        stdio.stop();
        stdio.stop();
        assert(stdio.processed() == 1);
        auto lines = read_lines(out.str());
        assert(lines.size() == 1);
        assert(lines[0]["id"] == "bg");
        assert(lines[0]["result"]["tools"].is_array());
        std::cout << "[PASS] Test 4: async start/stop\n";
    }

    return 0;
}
