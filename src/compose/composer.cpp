#include "mcpcompose/compose/composer.hpp"

#include "mcpcompose/compose/argument_coercion.hpp"
#include "mcpcompose/exceptions.hpp"
#include "mcpcompose/transport/sse_transport.hpp"
#include "mcpcompose/transport/stream_transport.hpp"
#include "mcpcompose/util/log.hpp"

#include <algorithm>
#include <set>

namespace mcpcompose::compose
{

namespace
{
constexpr const char* kLogger = "composer";
}

std::string to_string(ComposerState state)
{
    switch (state)
    {
    case ComposerState::Active:
        return "active";
    case ComposerState::ShuttingDown:
        return "shutting_down";
    case ComposerState::Inactive:
        return "inactive";
    }
    return "inactive";
}

std::string to_string(CompositionStatus status)
{
    switch (status)
    {
    case CompositionStatus::Composed:
        return "composed";
    case CompositionStatus::ComposedCleanupFailed:
        return "composed_cleanup_failed";
    case CompositionStatus::Failed:
        return "failed";
    }
    return "failed";
}

void to_json(Json& j, const ServerStatus& status)
{
    j = Json{{"name", status.name},
             {"transport", status.transport},
             {"status", to_string(status.status)},
             {"tools", status.tools},
             {"prompts", status.prompts},
             {"resources", status.resources}};
    j["error"] = status.error.empty() ? Json(nullptr) : Json(status.error);
}

bool CompositionReport::ok() const
{
    return std::all_of(servers.begin(), servers.end(),
                       [](const ServerStatus& s) { return s.composed(); });
}

std::map<std::string, std::string> CompositionReport::errors() const
{
    std::map<std::string, std::string> out;
    for (const auto& s : servers)
        if (!s.composed())
            out[s.name] = s.error;
    return out;
}

void to_json(Json& j, const CompositionReport& report)
{
    j = Json{{"ok", report.ok()},
             {"servers", report.servers},
             {"skipped", report.skipped},
             {"conflicts", report.conflicts}};
}

Composer::Composer(ComposerConfig config, ShutdownCoordinator& coordinator)
    : coordinator_(coordinator), config_(std::move(config)),
      resolver_(config_.conflict_resolution)
{
    coordinator_.add(this);
    log::debug(kLogger, "Composer '" + config_.name + "' created (strategy " +
                            to_string(config_.conflict_resolution) + ")");
}

Composer::~Composer()
{
    stop();
    coordinator_.release(this);
}

std::string Composer::participant_name() const
{
    return "composer '" + config_.name + "'";
}

CompositionReport Composer::start()
{
    std::lock_guard<std::mutex> lock(start_mutex_);
    if (start_report_)
        return *start_report_;
    auto report = compose_all(config_.servers);
    start_report_ = report;
    return report;
}

void Composer::stop()
{
    auto expected = ComposerState::Active;
    if (!state_.compare_exchange_strong(expected, ComposerState::ShuttingDown))
        return;

    log::info(kLogger, "Stopping composer '" + config_.name + "'");
    manager_.stop_all(config_.shutdown_timeout);

    std::vector<std::pair<std::string, ServerEntry>> remotes;
    {
        std::lock_guard<std::mutex> lock(compose_mutex_);
        for (const auto& [name, entry] : servers_)
            if (entry.stream || entry.sse)
                remotes.emplace_back(name, entry);
    }
    for (auto& [name, entry] : remotes)
    {
        if (entry.stream)
            entry.stream->disconnect();
        if (entry.sse)
            if (auto failure = entry.sse->disconnect())
                log::warning(kLogger, "Cleanup of " + name + " failed: " + failure->message);
    }

    coordinator_.remove(this);
    {
        std::lock_guard<std::mutex> lock(stopped_mutex_);
        state_.store(ComposerState::Inactive);
    }
    stopped_cv_.notify_all();
    log::info(kLogger, "Composer '" + config_.name + "' stopped");
}

bool Composer::wait_until_stopped(std::optional<std::chrono::milliseconds> timeout)
{
    std::unique_lock<std::mutex> lock(stopped_mutex_);
    auto done = [this]() { return state_.load() == ComposerState::Inactive; };
    if (!timeout)
    {
        stopped_cv_.wait(lock, done);
        return true;
    }
    return stopped_cv_.wait_for(lock, *timeout, done);
}

bool Composer::is_selected(const std::string& server_name) const
{
    const auto& inc = config_.include;
    const auto& exc = config_.exclude;
    if (!inc.empty() && std::find(inc.begin(), inc.end(), server_name) == inc.end())
        return false;
    return std::find(exc.begin(), exc.end(), server_name) == exc.end();
}

CompositionReport Composer::compose_all(const std::vector<ServerConfig>& servers)
{
    CompositionReport report;
    std::size_t first_conflict = 0;
    {
        std::lock_guard<std::mutex> lock(compose_mutex_);
        first_conflict = conflicts_.size();
    }

    for (const auto& server : servers)
    {
        if (!server.enabled)
        {
            log::info(kLogger, "Skipping disabled server " + server.name);
            report.skipped.push_back(server.name);
            continue;
        }
        if (!is_selected(server.name))
        {
            log::info(kLogger, "Skipping filtered server " + server.name);
            report.skipped.push_back(server.name);
            continue;
        }
        report.servers.push_back(compose_server(server));
    }

    {
        std::lock_guard<std::mutex> lock(compose_mutex_);
        report.conflicts.assign(conflicts_.begin() + static_cast<std::ptrdiff_t>(first_conflict),
                                conflicts_.end());
    }

    log::info(kLogger, "Composition complete: " +
                           std::to_string(registry_.size(ComponentKind::Tool)) + " tools, " +
                           std::to_string(registry_.size(ComponentKind::Prompt)) + " prompts, " +
                           std::to_string(registry_.size(ComponentKind::Resource)) +
                           " resources from " + std::to_string(report.servers.size()) +
                           " servers");
    for (const auto& [name, error] : report.errors())
        log::warning(kLogger, "Server " + name + " failed to compose: " + error);
    return report;
}

Composer::Discovered Composer::discover_stdio(const std::string& name, const StdioServer& spec)
{
    Discovered d;
    d.target = StdioTarget{&proxy_, &manager_, name};
    try
    {
        if (manager_.contains(name))
            manager_.start(name);
        else
            manager_.add(name, spec, true);
    }
    catch (const ProcessError& e)
    {
        d.error = std::string("failed to start: ") + e.what();
        return d;
    }

    auto found = proxy_.discover(name, manager_.get(name), config_.discovery_timeout);
    if (!found)
    {
        d.error = found.failure().describe();
        // Kept registered so restart_server() can retry it later
        manager_.stop(name, config_.shutdown_timeout);
        return d;
    }
    d.result = std::move(found.value());
    return d;
}

Composer::Discovered Composer::discover_stream(const std::string& name,
                                               const HttpStreamServer& spec)
{
    Discovered d;
    std::shared_ptr<transport::StreamTransport> stream;
    try
    {
        stream = std::make_shared<transport::StreamTransport>(name, spec);
    }
    catch (const TransportError& e)
    {
        d.error = e.what();
        return d;
    }

    if (auto failure = stream->connect())
    {
        d.error = failure->describe();
        return d;
    }
    auto found = rpc::discover(*stream, config_.discovery_timeout);
    if (!found)
    {
        d.error = found.failure().describe();
        stream->disconnect();
        return d;
    }
    d.result = std::move(found.value());
    d.stream = stream;
    d.target = RemoteTarget{stream};
    return d;
}

Composer::Discovered Composer::discover_sse(const std::string& name, const SseServer& spec)
{
    Discovered d;
    try
    {
        // Discovery runs on its own session; invocations get a lazily
        // connected one
        transport::SseTransport session(name, spec);
        if (auto failure = session.connect(config_.discovery_timeout))
        {
            d.error = failure->describe();
            return d;
        }
        auto found = rpc::discover(session, config_.discovery_timeout);
        auto cleanup = session.disconnect();
        if (!found)
        {
            d.error = found.failure().describe();
            return d;
        }
        if (cleanup)
            d.cleanup_error = cleanup->message;
        d.result = std::move(found.value());
        d.sse = std::make_shared<transport::SseTransport>(name, spec, true);
        d.target = RemoteTarget{d.sse};
    }
    catch (const TransportError& e)
    {
        d.error = e.what();
    }
    return d;
}

std::vector<Composer::PlannedEntry> Composer::plan(const std::string& server,
                                                   const rpc::DiscoveryResult& found,
                                                   const Invoker::Target& target) const
{
    std::vector<PlannedEntry> out;

    auto plan_kind = [&](ComponentKind kind, const std::vector<Json>& definitions)
    {
        // Names this server already claimed in the plan
        std::set<std::string> mine;
        auto taken = [&](const std::string& n) { return registry_.contains(kind, n) || mine.count(n); };
        auto source_of = [&](const std::string& n)
        {
            if (auto src = registry_.source_of(kind, n))
                return *src;
            return server;
        };

        for (const auto& def : definitions)
        {
            std::string name = def.value("name", std::string());
            std::string target_name = name;
            if (kind == ComponentKind::Resource)
            {
                target_name = def.value("uri", std::string());
                if (name.empty())
                    name = target_name;
            }
            if (name.empty() || target_name.empty())
            {
                log::warning(kLogger, server + " advertised a " + to_string(kind) +
                                          " without a name; skipped");
                continue;
            }

            Resolution resolution = resolver_.resolve(kind, name, server, taken, source_of);
            if (resolution.action == Resolution::Action::Skip)
            {
                log::debug(kLogger, "Ignoring " + to_string(kind) + " '" + name + "' from " +
                                        server + " (name taken)");
                continue;
            }
            ComposedComponent component;
            component.kind = kind;
            component.resolved_name = resolution.resolved_name;
            component.original_name = name;
            component.server_name = server;
            component.definition = def;
            component.invoker = std::make_shared<const Invoker>(kind, target_name, target);

            if (resolution.action == Resolution::Action::Replace && mine.count(name))
            {
                // Overriding an entry this same server planned earlier
                for (auto& p : out)
                {
                    if (p.component.kind == kind && p.component.resolved_name == name)
                    {
                        p.component = std::move(component);
                        break;
                    }
                }
                continue;
            }
            mine.insert(resolution.resolved_name);
            out.push_back({std::move(resolution), std::move(component)});
        }
    };

    plan_kind(ComponentKind::Tool, found.tools);
    plan_kind(ComponentKind::Prompt, found.prompts);
    plan_kind(ComponentKind::Resource, found.resources);
    return out;
}

void Composer::release_server(const std::string& name, Discovered& discovered)
{
    if (std::holds_alternative<StdioTarget>(discovered.target) && manager_.contains(name))
        manager_.stop(name, config_.shutdown_timeout);
    if (discovered.stream)
        discovered.stream->disconnect();
    if (discovered.sse)
        if (auto failure = discovered.sse->disconnect())
            log::debug(kLogger, "Cleanup of " + name + ": " + failure->message);
}

ServerStatus Composer::compose_server(const ServerConfig& server)
{
    if (state_.load() != ComposerState::Active)
        throw CompositionError("Composer '" + config_.name + "' is not active", server.name);

    std::lock_guard<std::mutex> lock(compose_mutex_);
    if (state_.load() != ComposerState::Active)
        throw CompositionError("Composer '" + config_.name + "' is not active", server.name);

    auto existing = servers_.find(server.name);
    if (existing != servers_.end())
    {
        if (existing->second.status.composed())
            throw CompositionError("Server already composed: " + server.name, server.name);
        servers_.erase(existing);
        server_order_.erase(std::remove(server_order_.begin(), server_order_.end(), server.name),
                            server_order_.end());
    }

    log::info(kLogger, "Composing " + transport_name(server.descriptor) + " server " +
                           server.name);

    Discovered discovered;
    if (const auto* stdio = std::get_if<StdioServer>(&server.descriptor))
        discovered = discover_stdio(server.name, *stdio);
    else if (const auto* sse = std::get_if<SseServer>(&server.descriptor))
        discovered = discover_sse(server.name, *sse);
    else
        discovered = discover_stream(server.name, std::get<HttpStreamServer>(server.descriptor));

    ServerEntry entry;
    entry.config = server;
    entry.status.name = server.name;
    entry.status.transport = transport_name(server.descriptor);

    if (!discovered.result)
    {
        entry.status.status = CompositionStatus::Failed;
        entry.status.error = discovered.error;
        servers_.emplace(server.name, entry);
        server_order_.push_back(server.name);
        log::warning(kLogger, "Discovery of " + server.name + " failed: " + discovered.error);
        return entry.status;
    }

    std::vector<PlannedEntry> planned;
    try
    {
        planned = plan(server.name, *discovered.result, discovered.target);
    }
    catch (const ConflictError& e)
    {
        release_server(server.name, discovered);
        entry.status.status = CompositionStatus::Failed;
        entry.status.error = e.what();
        servers_.emplace(server.name, entry);
        server_order_.push_back(server.name);
        throw;
    }

    for (auto& p : planned)
    {
        switch (p.component.kind)
        {
        case ComponentKind::Tool:
            ++entry.status.tools;
            break;
        case ComponentKind::Prompt:
            ++entry.status.prompts;
            break;
        case ComponentKind::Resource:
            ++entry.status.resources;
            break;
        }
        if (p.resolution.record)
        {
            conflicts_.push_back(*p.resolution.record);
            log::info(kLogger, to_string(p.component.kind) + " '" + p.component.original_name +
                                   "' from " + server.name + " resolved as '" +
                                   p.component.resolved_name + "' (" +
                                   to_string(p.resolution.record->strategy) + ")");
        }
        if (p.resolution.action == Resolution::Action::Replace)
            registry_.replace(std::move(p.component));
        else
            registry_.register_component(std::move(p.component));
    }

    entry.stream = discovered.stream;
    entry.sse = discovered.sse;
    if (discovered.cleanup_error)
    {
        entry.status.status = CompositionStatus::ComposedCleanupFailed;
        entry.status.error = *discovered.cleanup_error;
        log::warning(kLogger, "Composed " + server.name +
                                  " but its discovery session did not close cleanly: " +
                                  *discovered.cleanup_error);
    }
    else
    {
        entry.status.status = CompositionStatus::Composed;
    }
    servers_.emplace(server.name, entry);
    server_order_.push_back(server.name);

    log::info(kLogger, "Composed " + server.name + ": " + std::to_string(entry.status.tools) +
                           " tools, " + std::to_string(entry.status.prompts) + " prompts, " +
                           std::to_string(entry.status.resources) + " resources");
    return entry.status;
}

CompositionSnapshot Composer::get_composition() const
{
    CompositionSnapshot snap;
    snap.tools = registry_.list(ComponentKind::Tool);
    snap.prompts = registry_.list(ComponentKind::Prompt);
    snap.resources = registry_.list(ComponentKind::Resource);
    std::lock_guard<std::mutex> lock(compose_mutex_);
    snap.conflicts = conflicts_;
    for (const auto& name : server_order_)
        snap.servers.push_back(servers_.at(name).status);
    return snap;
}

Json Composer::summary_json() const
{
    auto snap = get_composition();

    Json sources = {{"tools", Json::object()},
                    {"prompts", Json::object()},
                    {"resources", Json::object()}};
    auto fill = [](Json& target, const std::vector<ComposedComponent>& components)
    {
        for (const auto& c : components)
            target[c.resolved_name] = c.server_name;
    };
    fill(sources["tools"], snap.tools);
    fill(sources["prompts"], snap.prompts);
    fill(sources["resources"], snap.resources);

    std::set<std::string> source_servers;
    for (const auto* list : {&snap.tools, &snap.prompts, &snap.resources})
        for (const auto& c : *list)
            source_servers.insert(c.server_name);

    return Json{{"composed_server_name", config_.name},
                {"conflict_resolution_strategy", to_string(config_.conflict_resolution)},
                {"state", to_string(state())},
                {"total_tools", snap.tools.size()},
                {"total_prompts", snap.prompts.size()},
                {"total_resources", snap.resources.size()},
                {"source_servers", source_servers.size()},
                {"conflicts_resolved", snap.conflicts.size()},
                {"conflict_details", snap.conflicts},
                {"component_sources", sources},
                {"servers", snap.servers}};
}

Result<Json> Composer::invoke(ComponentKind kind, const std::string& name, const Json& arguments,
                              std::optional<std::chrono::milliseconds> timeout)
{
    if (state_.load() != ComposerState::Active)
        return Failure::closed("Composer '" + config_.name + "' is not active");

    auto component = registry_.lookup(kind, name);
    if (!component)
        return Failure::not_found(to_string(kind) + " not found: " + name);

    Json args = arguments;
    if (kind == ComponentKind::Tool)
        args = coerce_arguments(component->definition.value("inputSchema", Json::object()),
                                arguments);
    return component->invoker->invoke(args, timeout.value_or(config_.call_timeout));
}

Result<Json> Composer::call_tool(const std::string& name, const Json& arguments,
                                 std::optional<std::chrono::milliseconds> timeout)
{
    return invoke(ComponentKind::Tool, name, arguments, timeout);
}

Result<Json> Composer::get_prompt(const std::string& name, const Json& arguments,
                                  std::optional<std::chrono::milliseconds> timeout)
{
    return invoke(ComponentKind::Prompt, name, arguments, timeout);
}

Result<Json> Composer::read_resource(const std::string& name,
                                     std::optional<std::chrono::milliseconds> timeout)
{
    return invoke(ComponentKind::Resource, name, Json::object(), timeout);
}

std::vector<ServerStatus> Composer::list_servers() const
{
    std::lock_guard<std::mutex> lock(compose_mutex_);
    std::vector<ServerStatus> out;
    for (const auto& name : server_order_)
        out.push_back(servers_.at(name).status);
    return out;
}

std::optional<process::ProcessInfo> Composer::get_process_info(const std::string& server_name) const
{
    if (!manager_.contains(server_name))
        return std::nullopt;
    try
    {
        return manager_.info(server_name);
    }
    catch (const NotFoundError&)
    {
        // removed between the check and the lookup
        return std::nullopt;
    }
}

std::vector<process::ProcessInfo> Composer::list_processes() const
{
    return manager_.list_all();
}

Composer::ServerEntry& Composer::entry_locked(const std::string& server_name)
{
    auto it = servers_.find(server_name);
    if (it == servers_.end())
        throw NotFoundError("Server not found: " + server_name);
    return it->second;
}

const Composer::ServerEntry& Composer::entry_locked(const std::string& server_name) const
{
    auto it = servers_.find(server_name);
    if (it == servers_.end())
        throw NotFoundError("Server not found: " + server_name);
    return it->second;
}

void Composer::start_server(const std::string& server_name)
{
    ServerEntry entry;
    {
        std::lock_guard<std::mutex> lock(compose_mutex_);
        entry = entry_locked(server_name);
    }

    if (std::holds_alternative<StdioServer>(entry.config.descriptor))
    {
        manager_.start(server_name);
    }
    else if (entry.stream)
    {
        if (auto failure = entry.stream->connect())
            throw TransportError("Cannot start " + server_name + ": " + failure->describe());
    }
    else if (entry.sse)
    {
        if (auto failure = entry.sse->connect(config_.discovery_timeout))
            throw TransportError("Cannot start " + server_name + ": " + failure->describe());
    }
    else
    {
        throw CompositionError("Server " + server_name + " was never composed", server_name);
    }
    log::info(kLogger, "Started server " + server_name);
}

void Composer::stop_server(const std::string& server_name)
{
    ServerEntry entry;
    {
        std::lock_guard<std::mutex> lock(compose_mutex_);
        entry = entry_locked(server_name);
    }

    if (std::holds_alternative<StdioServer>(entry.config.descriptor))
        manager_.stop(server_name, config_.shutdown_timeout);
    if (entry.stream)
        entry.stream->disconnect();
    if (entry.sse)
        if (auto failure = entry.sse->disconnect())
            log::warning(kLogger, "Stopping " + server_name + ": " + failure->message);
    log::info(kLogger, "Stopped server " + server_name);
}

void Composer::restart_server(const std::string& server_name)
{
    bool stdio = false;
    {
        std::lock_guard<std::mutex> lock(compose_mutex_);
        stdio = std::holds_alternative<StdioServer>(entry_locked(server_name).config.descriptor);
    }
    if (stdio)
    {
        manager_.restart(server_name, config_.shutdown_timeout);
        log::info(kLogger, "Restarted server " + server_name);
        return;
    }
    stop_server(server_name);
    start_server(server_name);
}

} // namespace mcpcompose::compose
