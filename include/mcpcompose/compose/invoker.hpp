#pragma once
/// @file compose/invoker.hpp
/// @brief Forwarding of a composed component back to its source server.

#include "mcpcompose/result.hpp"
#include "mcpcompose/rpc/channel.hpp"
#include "mcpcompose/types.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <variant>

namespace mcpcompose::process
{
class ProcessManager;
}
namespace mcpcompose::proxy
{
class ToolProxy;
}

namespace mcpcompose::compose
{

/// A stdio server, resolved through the process manager at call time so a
/// restarted process is picked up
struct StdioTarget
{
    proxy::ToolProxy* proxy{nullptr};
    process::ProcessManager* manager{nullptr};
    std::string process_name;
};

/// An SSE or HTTP stream server
struct RemoteTarget
{
    std::shared_ptr<rpc::RpcChannel> channel;
};

class Invoker
{
  public:
    using Target = std::variant<StdioTarget, RemoteTarget>;

    /// @param target_name the name the source server knows the component by
    ///        (the URI for resources)
    Invoker(ComponentKind kind, std::string target_name, Target target)
        : kind_(kind), target_name_(std::move(target_name)), target_(std::move(target))
    {
    }

    /// tools/call, prompts/get or resources/read depending on the kind;
    /// `arguments` is ignored for resources
    Result<Json> invoke(const Json& arguments, std::chrono::milliseconds timeout) const;

    ComponentKind kind() const
    {
        return kind_;
    }
    const std::string& target_name() const
    {
        return target_name_;
    }
    bool is_stdio() const
    {
        return std::holds_alternative<StdioTarget>(target_);
    }

  private:
    ComponentKind kind_;
    std::string target_name_;
    Target target_;
};

} // namespace mcpcompose::compose
