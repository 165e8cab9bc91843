#include "mcpcompose/compose/invoker.hpp"

#include "mcpcompose/exceptions.hpp"
#include "mcpcompose/process/process_manager.hpp"
#include "mcpcompose/proxy/tool_proxy.hpp"

namespace mcpcompose::compose
{

Result<Json> Invoker::invoke(const Json& arguments, std::chrono::milliseconds timeout) const
{
    std::string method;
    Json params;
    const Json args = arguments.is_null() ? Json::object() : arguments;
    switch (kind_)
    {
    case ComponentKind::Tool:
        method = "tools/call";
        params = {{"name", target_name_}, {"arguments", args}};
        break;
    case ComponentKind::Prompt:
        method = "prompts/get";
        params = {{"name", target_name_}, {"arguments", args}};
        break;
    case ComponentKind::Resource:
        method = "resources/read";
        params = {{"uri", target_name_}};
        break;
    }

    struct Visitor
    {
        const std::string& method;
        const Json& params;
        std::chrono::milliseconds timeout;

        Result<Json> operator()(const StdioTarget& t) const
        {
            if (!t.manager || !t.proxy)
                return Failure::not_found("Invoker has no process manager");
            try
            {
                auto& proc = t.manager->get(t.process_name);
                return t.proxy->call(proc, method, params, timeout);
            }
            catch (const NotFoundError& e)
            {
                return Failure::not_found(e.what());
            }
        }
        Result<Json> operator()(const RemoteTarget& t) const
        {
            if (!t.channel)
                return Failure::closed("Remote server has no channel");
            return t.channel->request(method, params, timeout);
        }
    };
    return std::visit(Visitor{method, params, timeout}, target_);
}

} // namespace mcpcompose::compose
