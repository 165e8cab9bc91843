#pragma once
/// @file proxy/tool_proxy.hpp
/// @brief JSON-RPC 2.0 over the stdio pipes of supervised processes.

#include "mcpcompose/process/supervised_process.hpp"
#include "mcpcompose/result.hpp"
#include "mcpcompose/rpc/channel.hpp"
#include "mcpcompose/rpc/pending_requests.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace mcpcompose::proxy
{

/// One JSON-RPC connection bound to a SupervisedProcess.
///
/// Requests are written as single lines to the child's stdin; the process's
/// stdout reader thread feeds lines back through on_line(). End of stdout
/// fails every pending request with TransportClosed. A restarted process gets
/// a fresh handshake on the next call.
class StdioSession : public rpc::RpcChannel, public std::enable_shared_from_this<StdioSession>
{
  public:
    explicit StdioSession(process::SupervisedProcess& process);

    /// Install this session as the process's output handler
    void attach();

    Result<Json> request(const std::string& method, const Json& params,
                         std::chrono::milliseconds timeout) override;
    std::optional<Failure> notify(const std::string& method, const Json& params) override;
    std::string describe() const override;

    /// Run the MCP handshake unless this incarnation of the process already
    /// completed it. Returns the `initialize` result.
    Result<Json> ensure_initialized(std::chrono::milliseconds timeout);

    /// Record a handshake performed elsewhere (discovery)
    void mark_initialized(Json init_result);

    void on_line(const std::string& line);
    void on_close();

    std::size_t pending_count() const
    {
        return pending_.size();
    }

    /// SupervisedProcess::instance_id() of the process this session serves
    std::uint64_t instance_id() const
    {
        return instance_id_;
    }

  private:
    std::optional<Failure> ensure_open();

    process::SupervisedProcess& process_;
    const std::uint64_t instance_id_;
    rpc::PendingRequests pending_;

    std::mutex init_mutex_;
    std::optional<int> initialized_pid_;
    Json init_result_;
};

/// Stdio discovery and invocation for every supervised process.
class ToolProxy
{
  public:
    /// Session for `process`, created and attached on first use and
    /// recreated when a different process object takes over the name
    std::shared_ptr<StdioSession> session(process::SupervisedProcess& process);

    /// Handshake plus tools/prompts/resources listing
    Result<rpc::DiscoveryResult> discover(const std::string& server_name,
                                          process::SupervisedProcess& process,
                                          std::chrono::milliseconds timeout);

    /// Tool definitions keyed by their original names
    Result<std::map<std::string, Json>> discover_tools(const std::string& server_name,
                                                       process::SupervisedProcess& process,
                                                       std::chrono::milliseconds timeout);

    /// Arbitrary request; performs the handshake first if needed
    Result<Json> call(process::SupervisedProcess& process, const std::string& method,
                      const Json& params, std::chrono::milliseconds timeout);

    /// `tools/call` with the tool's original (unresolved) name
    Result<Json> call_tool(process::SupervisedProcess& process, const std::string& tool_name,
                           const Json& arguments, std::chrono::milliseconds timeout);

  private:
    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<StdioSession>> sessions_;
};

} // namespace mcpcompose::proxy
