#include "mcpcompose/proxy/tool_proxy.hpp"

#include "mcpcompose/exceptions.hpp"
#include "mcpcompose/rpc/jsonrpc.hpp"
#include "mcpcompose/util/json.hpp"
#include "mcpcompose/util/log.hpp"

namespace mcpcompose::proxy
{

namespace
{
constexpr const char* kLogger = "tool_proxy";
} // namespace

StdioSession::StdioSession(process::SupervisedProcess& process)
    : process_(process), instance_id_(process.instance_id())
{
}

void StdioSession::attach()
{
    std::weak_ptr<StdioSession> weak = shared_from_this();
    process_.set_output_handlers(
        [weak](const std::string& line)
        {
            if (auto self = weak.lock())
                self->on_line(line);
        },
        [weak]()
        {
            if (auto self = weak.lock())
                self->on_close();
        });
}

std::string StdioSession::describe() const
{
    return "stdio:" + process_.name();
}

std::optional<Failure> StdioSession::ensure_open()
{
    if (!process_.is_running())
        return Failure::closed("Process " + process_.name() + " is not running");
    if (pending_.closed())
    {
        // stdout of an earlier incarnation ended; this one is fresh
        pending_.reopen();
        log::debug(kLogger, describe() + ": reopened after process restart");
    }
    return std::nullopt;
}

Result<Json> StdioSession::request(const std::string& method, const Json& params,
                                   std::chrono::milliseconds timeout)
{
    if (auto failure = ensure_open())
        return *failure;

    auto ticket = pending_.open();
    if (ticket.future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready)
        return ticket.future.get();

    try
    {
        process_.write_line(rpc::encode(rpc::make_request(ticket.id, method, params)));
    }
    catch (const ProcessError& e)
    {
        pending_.cancel(ticket.id);
        return Failure::closed(std::string("Write to ") + describe() + " failed: " + e.what());
    }
    log::debug(kLogger, describe() + " -> " + method + " (id " + std::to_string(ticket.id) + ")");
    return pending_.await(ticket, timeout);
}

std::optional<Failure> StdioSession::notify(const std::string& method, const Json& params)
{
    if (auto failure = ensure_open())
        return failure;
    try
    {
        process_.write_line(rpc::encode(rpc::make_notification(method, params)));
    }
    catch (const ProcessError& e)
    {
        return Failure::closed(std::string("Write to ") + describe() + " failed: " + e.what());
    }
    return std::nullopt;
}

Result<Json> StdioSession::ensure_initialized(std::chrono::milliseconds timeout)
{
    std::lock_guard<std::mutex> lock(init_mutex_);
    auto pid = process_.info().pid;
    if (initialized_pid_ && pid && *initialized_pid_ == *pid)
        return init_result_;

    auto init = rpc::initialize(*this, timeout);
    if (!init)
        return init;
    initialized_pid_ = pid;
    init_result_ = init.value();
    return init_result_;
}

void StdioSession::mark_initialized(Json init_result)
{
    std::lock_guard<std::mutex> lock(init_mutex_);
    initialized_pid_ = process_.info().pid;
    init_result_ = std::move(init_result);
}

void StdioSession::on_line(const std::string& line)
{
    auto parsed = util::json::try_parse(line);
    if (!parsed || !parsed->is_object())
    {
        log::debug(kLogger, describe() + ": ignoring non-JSON output: " + line);
        return;
    }
    try
    {
        if (pending_.resolve(*parsed))
            return;
        if (rpc::is_notification(*parsed))
        {
            log::debug(kLogger, describe() + " notification: " + rpc::encode((*parsed)["method"]));
            return;
        }
    }
    catch (const Json::exception& e)
    {
        log::warning(kLogger, describe() + ": dropping malformed message: " + e.what());
        return;
    }
    log::debug(kLogger, describe() + ": dropping message without a pending id: " + line);
}

void StdioSession::on_close()
{
    log::debug(kLogger, describe() + ": stdout closed");
    pending_.close(Failure::closed("Process " + process_.name() + " closed its output"));
    std::lock_guard<std::mutex> lock(init_mutex_);
    initialized_pid_.reset();
}

std::shared_ptr<StdioSession> ToolProxy::session(process::SupervisedProcess& process)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(process.name());
    // A session left over from a removed process of the same name refers to
    // a destroyed object; it is replaced without being touched.
    if (it != sessions_.end() && it->second->instance_id() == process.instance_id())
        return it->second;
    auto created = std::make_shared<StdioSession>(process);
    created->attach();
    sessions_[process.name()] = created;
    return created;
}

Result<rpc::DiscoveryResult> ToolProxy::discover(const std::string& server_name,
                                                 process::SupervisedProcess& process,
                                                 std::chrono::milliseconds timeout)
{
    const auto started = std::chrono::steady_clock::now();
    auto s = session(process);
    auto init = s->ensure_initialized(timeout);
    if (!init)
    {
        log::warning(kLogger, "Discovery of " + server_name + " failed: " +
                                  init.failure().describe());
        return init.failure();
    }

    auto spent = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    auto left = timeout > spent ? timeout - spent : std::chrono::milliseconds(0);
    auto listed = rpc::list_components(*s, init.value(), left);
    if (!listed)
        log::warning(kLogger, "Discovery of " + server_name + " failed: " +
                                  listed.failure().describe());
    return listed;
}

Result<std::map<std::string, Json>> ToolProxy::discover_tools(const std::string& server_name,
                                                              process::SupervisedProcess& process,
                                                              std::chrono::milliseconds timeout)
{
    auto found = discover(server_name, process, timeout);
    if (!found)
        return found.failure();

    std::map<std::string, Json> tools;
    for (const auto& tool : found.value().tools)
    {
        auto name = tool.value("name", std::string());
        if (name.empty())
        {
            log::warning(kLogger, server_name + " listed a tool without a name");
            continue;
        }
        tools[name] = tool;
    }
    return tools;
}

Result<Json> ToolProxy::call(process::SupervisedProcess& process, const std::string& method,
                             const Json& params, std::chrono::milliseconds timeout)
{
    if (!process.is_running())
        return Failure::closed("Process " + process.name() + " is not running");

    auto s = session(process);
    if (method != "initialize")
    {
        auto init = s->ensure_initialized(timeout);
        if (!init)
            return init.failure();
    }
    return s->request(method, params, timeout);
}

Result<Json> ToolProxy::call_tool(process::SupervisedProcess& process, const std::string& tool_name,
                                  const Json& arguments, std::chrono::milliseconds timeout)
{
    Json params = {{"name", tool_name},
                   {"arguments", arguments.is_null() ? Json::object() : arguments}};
    return call(process, "tools/call", params, timeout);
}

} // namespace mcpcompose::proxy
