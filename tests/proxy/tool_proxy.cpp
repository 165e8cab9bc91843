// JSON-RPC over stdio against the demo calc server
#include "../support/calc_server.hpp"
#include "mcpcompose/process/process_manager.hpp"
#include "mcpcompose/process/supervised_process.hpp"
#include "mcpcompose/proxy/tool_proxy.hpp"
#include "mcpcompose/rpc/jsonrpc.hpp"

#include <cassert>
#include <chrono>
#include <future>
#include <thread>
#include <iostream>

using namespace mcpcompose;
using namespace std::chrono_literals;

static std::string text_of(const Result<Json>& r)
{
    assert(r.ok());
    return r.value()["content"].at(0).value("text", std::string());
}

int main()
{
    // Discovery and calls
    {
        process::SupervisedProcess proc("calc", test_support::calc_server({"--name", "calc"}));
        proc.start();
        proxy::ToolProxy proxy;

        auto found = proxy.discover("calc", proc, 5000ms);
        assert(found.ok());
        const auto& d = found.value();
        assert(d.server_info["serverInfo"]["name"] == "calc");
        assert(d.tools.size() == 3);
        assert(d.prompts.size() == 1 && d.prompts[0]["name"] == "greet");
        assert(d.resources.size() == 1 && d.resources[0]["uri"] == "calc://calc/info");

        auto tools = proxy.discover_tools("calc", proc, 5000ms);
        assert(tools.ok() && tools.value().count("add") == 1);
        assert(tools.value().at("add")["inputSchema"]["properties"].contains("a"));

        assert(text_of(proxy.call_tool(proc, "add", Json{{"a", 2}, {"b", 3}}, 5000ms)) == "5");
        std::cout << "[PASS] discover + call" << std::endl;

        // The server refuses: a protocol failure, not a transport one
        auto bad = proxy.call(proc, "nope/method", Json::object(), 5000ms);
        assert(!bad.ok());
        assert(bad.failure().kind == FailureKind::Protocol);
        assert(bad.failure().code == rpc::kMethodNotFound);

        auto bad_args = proxy.call_tool(proc, "add", Json{{"a", "x"}}, 5000ms);
        assert(!bad_args.ok() && bad_args.failure().code == rpc::kInvalidParams);
        std::cout << "[PASS] protocol errors" << std::endl;

        // A slow call answered after a fast one still gets its own reply
        auto slow = std::async(std::launch::async,
                               [&]()
                               {
                                   return proxy.call_tool(proc, "sleep", Json{{"ms", 300}},
                                                          5000ms);
                               });
        std::this_thread::sleep_for(50ms);
        auto fast_started = std::chrono::steady_clock::now();
        auto fast = proxy.call_tool(proc, "add", Json{{"a", 20}, {"b", 22}}, 5000ms);
        assert(std::chrono::steady_clock::now() - fast_started < 250ms);
        assert(text_of(fast) == "42");
        assert(text_of(slow.get()) == "slept 300");
        assert(proxy.session(proc)->pending_count() == 0);
        std::cout << "[PASS] out-of-order responses" << std::endl;

        // Restart: the next call performs a fresh handshake
        proc.restart(2000ms);
        assert(text_of(proxy.call_tool(proc, "add", Json{{"a", 1}, {"b", 1}}, 5000ms)) == "2");

        proc.stop(2000ms);
        auto after = proxy.call_tool(proc, "add", Json{{"a", 1}, {"b", 1}}, 1000ms);
        assert(!after.ok() && after.failure().kind == FailureKind::TransportClosed);
        std::cout << "[PASS] restart and stopped process" << std::endl;
    }

    // Capabilities gate the optional listings
    {
        process::SupervisedProcess proc("bare", test_support::calc_server({"--no-prompts",
                                                                            "--no-resources"}));
        proc.start();
        proxy::ToolProxy proxy;
        auto found = proxy.discover("bare", proc, 5000ms);
        assert(found.ok());
        assert(found.value().tools.size() == 3);
        assert(found.value().prompts.empty() && found.value().resources.empty());
        proc.stop(2000ms);
        std::cout << "[PASS] capability-gated discovery" << std::endl;
    }

    // A silent server times out and leaves nothing pending
    {
        process::SupervisedProcess proc("mute", test_support::calc_server({"--silent"}));
        proc.start();
        proxy::ToolProxy proxy;
        auto found = proxy.discover("mute", proc, 200ms);
        assert(!found.ok() && found.failure().kind == FailureKind::Discovery);

        auto session = proxy.session(proc);
        auto r = session->request("ping", Json::object(), 150ms);
        assert(!r.ok() && r.failure().kind == FailureKind::Timeout);
        assert(session->pending_count() == 0);
        proc.stop(2000ms);
        std::cout << "[PASS] timeout" << std::endl;
    }

    // The process dies with a request in flight
    {
        process::SupervisedProcess proc("doomed",
                                        test_support::calc_server({"--exit-after-ms", "400"}));
        proc.start();
        proxy::ToolProxy proxy;
        assert(proxy.discover("doomed", proc, 5000ms).ok());
        auto started = std::chrono::steady_clock::now();
        auto r = proxy.call_tool(proc, "sleep", Json{{"ms", 5000}}, 10000ms);
        assert(!r.ok() && r.failure().kind == FailureKind::TransportClosed);
        assert(std::chrono::steady_clock::now() - started < 3000ms);
        std::cout << "[PASS] transport closed mid-request" << std::endl;
    }

    // A name removed and registered again gets a session for the new process
    {
        process::ProcessManager pm;
        proxy::ToolProxy proxy;
        auto& first = pm.add("calc", test_support::calc_server({"--name", "calc"}));
        const auto first_id = first.instance_id();
        assert(text_of(proxy.call_tool(first, "add", Json{{"a", 1}, {"b", 2}}, 5000ms)) == "3");
        assert(proxy.session(first)->instance_id() == first_id);

        pm.remove("calc", 2000ms);
        auto& second = pm.add("calc", test_support::calc_server({"--name", "calc"}));
        assert(second.instance_id() != first_id);
        assert(text_of(proxy.call_tool(second, "add", Json{{"a", 4}, {"b", 5}}, 5000ms)) == "9");
        assert(proxy.session(second)->instance_id() == second.instance_id());
        pm.stop_all(2000ms);
        std::cout << "[PASS] session replaced after remove and re-add" << std::endl;
    }

    // Replies with mistyped members fail the request without killing the reader
    {
        StdioServer spec;
        spec.command = "/bin/sh";
        spec.args = {"-c", "while read l; do "
                           "echo '{\"jsonrpc\":\"2.0\",\"method\":5}'; "
                           "echo '{\"jsonrpc\":\"2.0\",\"id\":1,"
                           "\"error\":{\"code\":\"E1\",\"message\":\"nope\"}}'; "
                           "done"};
        process::SupervisedProcess proc("mistyped", spec);
        proc.start();
        proxy::ToolProxy proxy;
        auto session = proxy.session(proc);

        auto r = session->request("ping", Json::object(), 5000ms);
        assert(!r.ok());
        assert(r.failure().kind == FailureKind::Protocol);
        assert(r.failure().code == rpc::kInternalError);
        assert(r.failure().message == "nope");

        // Still reading: the next reply carries a stale id and is dropped
        auto again = session->request("ping", Json::object(), 300ms);
        assert(!again.ok() && again.failure().kind == FailureKind::Timeout);
        assert(proc.is_running());
        proc.stop(2000ms);
        std::cout << "[PASS] malformed error reply" << std::endl;
    }

    // Invalid UTF-8 in arguments is replaced, not rejected
    {
        process::SupervisedProcess proc("utf8", test_support::calc_server({"--name", "utf8"}));
        proc.start();
        proxy::ToolProxy proxy;
        auto r = proxy.call_tool(proc, "add", Json{{"a", 1}, {"b", 1}, {"note", "\xff\xfe"}},
                                 5000ms);
        assert(text_of(r) == "2");
        proc.stop(2000ms);
        std::cout << "[PASS] invalid UTF-8 arguments" << std::endl;
    }

    return 0;
}
