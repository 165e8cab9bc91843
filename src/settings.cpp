#include "mcpcompose/settings.hpp"

#include "mcpcompose/exceptions.hpp"
#include "mcpcompose/util/log.hpp"

#include <algorithm>
#include <cstdlib>

namespace mcpcompose
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static std::chrono::milliseconds ms_field(const Json& j, const char* key,
                                          std::chrono::milliseconds defv)
{
    if (!j.contains(key))
        return defv;
    const auto& v = j.at(key);
    if (!v.is_number())
        throw ValidationError(std::string("'") + key + "' must be a number of milliseconds");
    return std::chrono::milliseconds(v.get<long long>());
}

std::string to_string(RestartPolicy policy)
{
    switch (policy)
    {
    case RestartPolicy::Never:
        return "never";
    case RestartPolicy::OnFailure:
        return "on-failure";
    case RestartPolicy::Always:
        return "always";
    }
    return "never";
}

std::optional<RestartPolicy> restart_policy_from_string(const std::string& s)
{
    if (s == "never")
        return RestartPolicy::Never;
    if (s == "on-failure" || s == "on_failure")
        return RestartPolicy::OnFailure;
    if (s == "always")
        return RestartPolicy::Always;
    return std::nullopt;
}

std::string to_string(StreamProtocol protocol)
{
    switch (protocol)
    {
    case StreamProtocol::Lines:
        return "lines";
    case StreamProtocol::Chunked:
        return "chunked";
    case StreamProtocol::Poll:
        return "poll";
    }
    return "lines";
}

std::optional<StreamProtocol> stream_protocol_from_string(const std::string& s)
{
    if (s == "lines")
        return StreamProtocol::Lines;
    if (s == "chunked")
        return StreamProtocol::Chunked;
    if (s == "poll")
        return StreamProtocol::Poll;
    return std::nullopt;
}

std::string transport_name(const ServerDescriptor& descriptor)
{
    if (std::holds_alternative<StdioServer>(descriptor))
        return "stdio";
    if (std::holds_alternative<SseServer>(descriptor))
        return "sse";
    return "http";
}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = getenv_str("MCPCOMPOSE_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::toupper);
    s.log_level = lvl;
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("log_level"))
        s.log_level = j.at("log_level").get<std::string>();
    return s;
}

void Settings::apply() const
{
    auto level = log::level_from_string(log_level);
    if (!level)
        throw ValidationError("Unknown log level: " + log_level);
    log::set_level(*level);
}

ServerConfig server_config_from_json(const Json& j)
{
    ServerConfig cfg;
    if (!j.contains("name") || !j["name"].is_string() || j["name"].get<std::string>().empty())
        throw ValidationError("Server entry requires a non-empty 'name'");
    cfg.name = j["name"].get<std::string>();
    cfg.enabled = j.value("enabled", true);

    const std::string type = j.value("type", std::string("stdio"));
    if (type == "stdio")
    {
        StdioServer s;
        if (!j.contains("command") || !j["command"].is_string())
            throw ValidationError("stdio server '" + cfg.name + "' requires 'command'");
        s.command = j["command"].get<std::string>();
        if (j.contains("args"))
            s.args = j["args"].get<std::vector<std::string>>();
        if (j.contains("env"))
            s.env = j["env"].get<std::map<std::string, std::string>>();
        s.working_directory = j.value("working_directory", std::string());
        if (j.contains("restart_policy"))
        {
            auto policy = restart_policy_from_string(j["restart_policy"].get<std::string>());
            if (!policy)
                throw ValidationError("Unknown restart_policy for server '" + cfg.name + "'");
            s.restart_policy = *policy;
        }
        s.max_restarts = j.value("max_restarts", s.max_restarts);
        cfg.descriptor = std::move(s);
    }
    else if (type == "sse")
    {
        SseServer s;
        if (!j.contains("url") || !j["url"].is_string())
            throw ValidationError("sse server '" + cfg.name + "' requires 'url'");
        s.url = j["url"].get<std::string>();
        s.sse_path = j.value("sse_path", s.sse_path);
        s.messages_path = j.value("messages_path", s.messages_path);
        if (j.contains("headers"))
            s.headers = j["headers"].get<std::unordered_map<std::string, std::string>>();
        cfg.descriptor = std::move(s);
    }
    else if (type == "http" || type == "streamable-http" || type == "http-stream")
    {
        HttpStreamServer s;
        if (!j.contains("url") || !j["url"].is_string())
            throw ValidationError("http server '" + cfg.name + "' requires 'url'");
        s.url = j["url"].get<std::string>();
        if (j.contains("protocol"))
        {
            auto protocol = stream_protocol_from_string(j["protocol"].get<std::string>());
            if (!protocol)
                throw ValidationError("Unknown protocol for server '" + cfg.name + "'");
            s.protocol = *protocol;
        }
        if (j.contains("auth_token") && j["auth_token"].is_string())
            s.auth_token = j["auth_token"].get<std::string>();
        const std::string auth_type = j.value("auth_type", std::string("bearer"));
        if (auth_type == "bearer")
            s.auth_type = AuthType::Bearer;
        else if (auth_type == "basic")
            s.auth_type = AuthType::Basic;
        else
            throw ValidationError("Unknown auth_type for server '" + cfg.name + "'");
        s.reconnect_on_failure = j.value("reconnect_on_failure", s.reconnect_on_failure);
        s.max_reconnect_attempts = j.value("max_reconnect_attempts", s.max_reconnect_attempts);
        s.retry_interval = ms_field(j, "retry_interval_ms", s.retry_interval);
        s.poll_interval = ms_field(j, "poll_interval_ms", s.poll_interval);
        s.timeout = ms_field(j, "timeout_ms", s.timeout);
        if (j.contains("headers"))
            s.headers = j["headers"].get<std::unordered_map<std::string, std::string>>();
        cfg.descriptor = std::move(s);
    }
    else
    {
        throw ValidationError("Unknown server type '" + type + "' for server '" + cfg.name + "'");
    }
    return cfg;
}

ComposerConfig ComposerConfig::from_json(const Json& j)
{
    ComposerConfig c;
    c.name = j.value("name", c.name);
    if (j.contains("conflict_resolution"))
    {
        auto strategy =
            compose::conflict_strategy_from_string(j["conflict_resolution"].get<std::string>());
        if (!strategy)
            throw ValidationError("Unknown conflict_resolution: " +
                                  j["conflict_resolution"].get<std::string>());
        c.conflict_resolution = *strategy;
    }
    c.discovery_timeout = ms_field(j, "discovery_timeout_ms", c.discovery_timeout);
    c.call_timeout = ms_field(j, "call_timeout_ms", c.call_timeout);
    c.shutdown_timeout = ms_field(j, "shutdown_timeout_ms", c.shutdown_timeout);
    if (j.contains("include"))
        c.include = j["include"].get<std::vector<std::string>>();
    if (j.contains("exclude"))
        c.exclude = j["exclude"].get<std::vector<std::string>>();

    if (j.contains("servers"))
    {
        if (!j["servers"].is_array())
            throw ValidationError("'servers' must be an array");
        for (const auto& entry : j["servers"])
        {
            auto server = server_config_from_json(entry);
            for (const auto& existing : c.servers)
                if (existing.name == server.name)
                    throw ValidationError("Duplicate server name: " + server.name);
            c.servers.push_back(std::move(server));
        }
    }
    return c;
}

} // namespace mcpcompose
