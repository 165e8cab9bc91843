// Composition across stdio, HTTP streaming and SSE servers
#include "../support/calc_server.hpp"
#include "../support/http_fixtures.hpp"
#include "mcpcompose/compose/composer.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

using namespace mcpcompose;
using namespace mcpcompose::compose;
using namespace std::chrono_literals;
using test_support::SseFixture;
using test_support::StreamFixture;

static std::string text_of(const Result<Json>& r)
{
    assert(r.ok());
    const Json& v = r.value();
    if (v.contains("contents"))
        return v["contents"].at(0).value("text", std::string());
    return v["content"].at(0).value("text", std::string());
}

static ServerConfig http_config(const std::string& name, const StreamFixture& fixture,
                                StreamProtocol protocol)
{
    HttpStreamServer spec;
    spec.url = fixture.url();
    spec.protocol = protocol;
    spec.poll_interval = 50ms;
    spec.retry_interval = 50ms;
    spec.timeout = 5000ms;
    ServerConfig cfg;
    cfg.name = name;
    cfg.descriptor = spec;
    return cfg;
}

static ServerConfig sse_config(const std::string& name, const SseFixture& fixture)
{
    ServerConfig cfg;
    cfg.name = name;
    cfg.descriptor = fixture.descriptor();
    return cfg;
}

int main()
{
    calc::Options web_options;
    web_options.name = "web";
    calc::Options poll_options;
    poll_options.name = "poller";
    poll_options.prompts = false;
    poll_options.resources = false;
    calc::Options sse_options;
    sse_options.name = "events";

    StreamFixture web(StreamFixture::Mode::Stream, web_options);
    StreamFixture poller(StreamFixture::Mode::Poll, poll_options);
    SseFixture events(sse_options);

    ComposerConfig config;
    config.name = "mixed";
    config.discovery_timeout = 5000ms;
    config.call_timeout = 5000ms;
    config.shutdown_timeout = 1000ms;
    config.servers = {test_support::calc_config("calc"),
                      http_config("web", web, StreamProtocol::Lines),
                      http_config("poller", poller, StreamProtocol::Poll),
                      sse_config("events", events)};

    {
        Composer composer(config);
        auto report = composer.start();
        assert(report.ok());
        assert(report.servers.size() == 4);
        assert(report.servers[1].transport == "http");
        assert(report.servers[3].transport == "sse");
        assert(report.servers[3].status == CompositionStatus::Composed);
        assert(report.servers[2].tools == 3);
        assert(report.servers[2].prompts == 0);

        assert(text_of(composer.call_tool("add", Json{{"a", 1}, {"b", 1}})) == "2");
        assert(text_of(composer.call_tool("web_add", Json{{"a", 2}, {"b", 2}})) == "4");
        assert(text_of(composer.call_tool("poller_add", Json{{"a", 3}, {"b", 3}})) == "6");
        assert(text_of(composer.call_tool("events_add", Json{{"a", 4}, {"b", 4}})) == "8");
        assert(text_of(composer.call_tool("web_whoami", Json::object())) == "web");
        assert(text_of(composer.call_tool("events_whoami", Json::object())) == "events");
        assert(text_of(composer.read_resource("events_info")) == "served by events");
        std::cout << "[PASS] calls routed to every transport" << std::endl;

        Json summary = composer.summary_json();
        assert(summary["source_servers"] == 4);
        assert(summary["total_tools"] == 12);
        assert(summary["component_sources"]["tools"]["poller_sleep"] == "poller");
        std::cout << "[PASS] summary" << std::endl;

        // Remote servers have no process behind them
        assert(!composer.get_process_info("web"));
        assert(composer.list_processes().size() == 1);

        composer.stop();
        assert(composer.state() == ComposerState::Inactive);
        auto after = composer.call_tool("web_add", Json{{"a", 1}, {"b", 1}});
        assert(!after.ok());
        std::cout << "[PASS] stop" << std::endl;
    }

    // An unreachable remote server fails on its own; the rest still compose
    {
        ComposerConfig partial = config;
        HttpStreamServer dead;
        dead.url = "http://127.0.0.1:1/mcp";
        dead.reconnect_on_failure = false;
        dead.timeout = 1000ms;
        ServerConfig dead_cfg;
        dead_cfg.name = "dead";
        dead_cfg.descriptor = dead;
        partial.discovery_timeout = 2000ms;
        partial.servers = {test_support::calc_config("calc"), dead_cfg};

        Composer composer(partial);
        auto report = composer.start();
        assert(!report.ok());
        assert(report.servers[0].composed());
        assert(!report.servers[1].composed());
        assert(report.errors().count("dead") == 1);
        assert(composer.registry().counts_for("dead")["tools"] == 0);
        assert(text_of(composer.call_tool("add", Json{{"a", 1}, {"b", 2}})) == "3");
        std::cout << "[PASS] unreachable server isolated" << std::endl;
    }

    return 0;
}
