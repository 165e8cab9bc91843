#pragma once
/// @file rpc/channel.hpp
/// @brief Request/response channel shared by the stdio, SSE and HTTP stream
///        transports, plus the MCP handshake and discovery run over it.

#include "mcpcompose/result.hpp"
#include "mcpcompose/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace mcpcompose::rpc
{

class RpcChannel
{
  public:
    virtual ~RpcChannel() = default;

    /// Send a request and wait for the response with the same id
    virtual Result<Json> request(const std::string& method, const Json& params,
                                 std::chrono::milliseconds timeout) = 0;

    /// Send a notification; nullopt on success
    virtual std::optional<Failure> notify(const std::string& method, const Json& params) = 0;

    /// Human readable endpoint for log lines
    virtual std::string describe() const = 0;
};

/// Components advertised by one server
struct DiscoveryResult
{
    Json server_info = Json::object(); ///< the `initialize` result
    std::vector<Json> tools;
    std::vector<Json> prompts;
    std::vector<Json> resources;
};

/// `initialize` followed by `notifications/initialized`
Result<Json> initialize(RpcChannel& channel, std::chrono::milliseconds timeout,
                        const std::string& client_name = "mcpcompose");

/// `tools/list`, then `prompts/list` and `resources/list` when `init_result`
/// advertises them (or advertises no capabilities at all). Pagination via
/// `nextCursor` is followed; -32601 on an optional list counts as empty.
/// Every failure is reported as FailureKind::Discovery.
Result<DiscoveryResult> list_components(RpcChannel& channel, const Json& init_result,
                                        std::chrono::milliseconds timeout);

/// Handshake plus list_components under one deadline
Result<DiscoveryResult> discover(RpcChannel& channel, std::chrono::milliseconds timeout);

} // namespace mcpcompose::rpc
