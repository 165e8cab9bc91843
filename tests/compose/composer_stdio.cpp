// End-to-end composition of stdio servers
#include "../support/calc_server.hpp"
#include "mcpcompose/compose/composer.hpp"
#include "mcpcompose/exceptions.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

using namespace mcpcompose;
using namespace mcpcompose::compose;
using namespace std::chrono_literals;
using test_support::calc_config;

static ComposerConfig make_config(ConflictStrategy strategy, std::vector<ServerConfig> servers)
{
    ComposerConfig c;
    c.name = "unified";
    c.conflict_resolution = strategy;
    c.discovery_timeout = 5000ms;
    c.call_timeout = 5000ms;
    c.shutdown_timeout = 1000ms;
    c.servers = std::move(servers);
    return c;
}

static std::string text_of(const Result<Json>& r)
{
    assert(r.ok());
    const Json& v = r.value();
    if (v.contains("content"))
        return v["content"].at(0).value("text", std::string());
    if (v.contains("contents"))
        return v["contents"].at(0).value("text", std::string());
    return v["messages"].at(0)["content"].value("text", std::string());
}

int main()
{
    // Prefix: the later server's components are renamed
    {
        Composer composer(make_config(ConflictStrategy::Prefix, {calc_config("a"), calc_config("calc")}));
        auto report = composer.start();
        assert(report.ok());
        assert(report.servers.size() == 2);
        assert(report.servers[1].tools == 3);
        assert(report.conflicts.size() == 5);

        assert(text_of(composer.call_tool("calc_add", Json{{"a", 2}, {"b", 3}})) == "5");
        // String arguments are coerced against the tool's input schema
        assert(text_of(composer.call_tool("calc_add", Json{{"a", "2"}, {"b", "3"}})) == "5");
        assert(text_of(composer.call_tool("whoami", Json::object())) == "a");
        assert(text_of(composer.call_tool("calc_whoami", Json::object())) == "calc");
        assert(text_of(composer.get_prompt("calc_greet", Json{{"who", "x"}})) == "Hello x from calc");
        assert(text_of(composer.read_resource("calc_info")) == "served by calc");
        assert(text_of(composer.read_resource("info")) == "served by a");

        auto missing = composer.call_tool("nope", Json::object());
        assert(!missing.ok() && missing.failure().kind == FailureKind::NotFound);

        auto snapshot = composer.get_composition();
        assert(snapshot.tools.size() == 6);
        assert(snapshot.tools[3].exported_definition()["name"] == "calc_add");

        Json summary = composer.summary_json();
        assert(summary["composed_server_name"] == "unified");
        assert(summary["conflict_resolution_strategy"] == "prefix");
        assert(summary["state"] == "active");
        assert(summary["total_tools"] == 6);
        assert(summary["total_prompts"] == 2);
        assert(summary["total_resources"] == 2);
        assert(summary["source_servers"] == 2);
        assert(summary["conflicts_resolved"] == 5);
        assert(summary["component_sources"]["tools"]["calc_add"] == "calc");
        assert(summary["component_sources"]["tools"]["add"] == "a");
        assert(summary["servers"][1]["status"] == "composed");

        auto info = composer.get_process_info("calc");
        assert(info && info->state == process::ProcessState::Running);
        assert(!composer.get_process_info("zzz"));
        assert(composer.list_processes().size() == 2);

        // start() is idempotent
        auto again = composer.start();
        assert(again.servers.size() == 2);
        assert(composer.list_processes().size() == 2);

        bool threw = false;
        try
        {
            composer.compose_server(calc_config("calc"));
        }
        catch (const CompositionError&)
        {
            threw = true;
        }
        assert(threw);
        std::cout << "[PASS] prefix end-to-end" << std::endl;
    }

    // Suffix
    {
        Composer composer(make_config(ConflictStrategy::Suffix, {calc_config("a"), calc_config("b")}));
        composer.start();
        assert(text_of(composer.call_tool("add_b", Json{{"a", 1}, {"b", 1}})) == "2");
        assert(text_of(composer.call_tool("whoami_b", Json::object())) == "b");
        std::cout << "[PASS] suffix" << std::endl;
    }

    // Ignore: the first definition wins, nothing is logged
    {
        Composer composer(make_config(ConflictStrategy::Ignore, {calc_config("a"), calc_config("b")}));
        auto report = composer.start();
        assert(report.conflicts.empty());
        assert(composer.registry().size(ComponentKind::Tool) == 3);
        assert(text_of(composer.call_tool("whoami", Json::object())) == "a");
        assert(report.servers[1].tools == 0);
        std::cout << "[PASS] ignore" << std::endl;
    }

    // Override: the last definition wins
    {
        Composer composer(make_config(ConflictStrategy::Override, {calc_config("a"), calc_config("b")}));
        auto report = composer.start();
        assert(composer.registry().size(ComponentKind::Tool) == 3);
        assert(text_of(composer.call_tool("whoami", Json::object())) == "b");
        assert(report.conflicts.size() == 5);
        assert(report.conflicts[0].previous_source && *report.conflicts[0].previous_source == "a");
        std::cout << "[PASS] override" << std::endl;
    }

    // Error: composition aborts and the namespace keeps only the first server
    {
        Composer composer(make_config(ConflictStrategy::Error, {calc_config("a"), calc_config("b")}));
        bool threw = false;
        try
        {
            composer.start();
        }
        catch (const ConflictError& e)
        {
            threw = true;
            assert(e.conflicting_servers[0] == "a" && e.conflicting_servers[1] == "b");
        }
        assert(threw);
        assert(composer.registry().size(ComponentKind::Tool) == 3);
        assert(*composer.registry().source_of(ComponentKind::Tool, "add") == "a");
        assert(composer.registry().counts_for("b")["tools"] == 0);

        auto servers = composer.list_servers();
        assert(servers.size() == 2);
        assert(servers[1].status == CompositionStatus::Failed);
        assert(servers[1].error.find("conflict") != std::string::npos);
        auto b = composer.get_process_info("b");
        assert(b && b->state == process::ProcessState::Stopped);
        std::cout << "[PASS] error strategy" << std::endl;
    }

    // Failures are isolated per server; filters and disabled entries are skipped
    {
        ServerConfig ghost;
        ghost.name = "ghost";
        ghost.descriptor = StdioServer{"/nonexistent/server", {}, {}, "", RestartPolicy::Never, 3};
        ServerConfig off = calc_config("off");
        off.enabled = false;

        auto cfg = make_config(ConflictStrategy::Prefix,
                               {calc_config("a"), ghost, calc_config("mute", {"--silent"}), off,
                                calc_config("hidden")});
        cfg.discovery_timeout = 300ms;
        cfg.exclude = {"hidden"};
        Composer composer(cfg);
        auto report = composer.start();
        assert(!report.ok());
        auto errors = report.errors();
        assert(errors.size() == 2);
        assert(errors.count("ghost") && errors.count("mute"));
        assert(report.skipped.size() == 2);
        assert(composer.registry().size(ComponentKind::Tool) == 3);
        assert(text_of(composer.call_tool("add", Json{{"a", 4}, {"b", 5}})) == "9");

        Json j = report;
        assert(j["ok"] == false);
        assert(j["servers"][1]["status"] == "failed");
        assert(!j["servers"][1]["error"].is_null());
        std::cout << "[PASS] failure isolation and filtering" << std::endl;
    }

    // Include list
    {
        auto cfg = make_config(ConflictStrategy::Prefix, {calc_config("a"), calc_config("b")});
        cfg.include = {"b"};
        Composer composer(cfg);
        assert(composer.is_selected("b") && !composer.is_selected("a"));
        auto report = composer.start();
        assert(report.servers.size() == 1 && report.servers[0].name == "b");
        assert(report.skipped == std::vector<std::string>{"a"});
        std::cout << "[PASS] include filter" << std::endl;
    }

    // Administrative start/stop/restart
    {
        Composer composer(make_config(ConflictStrategy::Prefix, {calc_config("a")}));
        composer.start();
        composer.stop_server("a");
        auto down = composer.call_tool("add", Json{{"a", 1}, {"b", 2}});
        assert(!down.ok() && down.failure().kind == FailureKind::TransportClosed);

        composer.start_server("a");
        assert(text_of(composer.call_tool("add", Json{{"a", 1}, {"b", 2}})) == "3");

        composer.restart_server("a");
        assert(composer.get_process_info("a")->restart_count == 1);
        assert(text_of(composer.call_tool("add", Json{{"a", 2}, {"b", 2}})) == "4");

        bool threw = false;
        try
        {
            composer.restart_server("zzz");
        }
        catch (const NotFoundError&)
        {
            threw = true;
        }
        assert(threw);
        std::cout << "[PASS] admin surface" << std::endl;
    }

    // stop(): bounded by the shutdown timeout, idempotent, final
    {
        auto cfg = make_config(ConflictStrategy::Prefix,
                               {calc_config("a", {"--ignore-sigterm"}), calc_config("b")});
        cfg.shutdown_timeout = 300ms;
        Composer composer(cfg);
        composer.start();
        assert(composer.state() == ComposerState::Active);

        auto started = std::chrono::steady_clock::now();
        composer.stop();
        assert(std::chrono::steady_clock::now() - started < 300ms + 1500ms);
        assert(composer.state() == ComposerState::Inactive);
        assert(composer.wait_until_stopped(0ms));
        for (const auto& p : composer.list_processes())
            assert(p.state == process::ProcessState::Stopped);

        composer.stop();
        assert(composer.state() == ComposerState::Inactive);
        for (const auto& p : composer.list_processes())
            assert(p.restart_count == 0 && p.state == process::ProcessState::Stopped);

        auto r = composer.call_tool("add", Json{{"a", 1}, {"b", 1}});
        assert(!r.ok() && r.failure().kind == FailureKind::TransportClosed);

        bool threw = false;
        try
        {
            composer.compose_server(calc_config("late"));
        }
        catch (const CompositionError&)
        {
            threw = true;
        }
        assert(threw);
        assert(composer.summary_json()["state"] == "inactive");
        std::cout << "[PASS] stop" << std::endl;
    }

    return 0;
}
