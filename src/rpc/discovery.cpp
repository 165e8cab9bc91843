#include "mcpcompose/rpc/channel.hpp"
#include "mcpcompose/rpc/jsonrpc.hpp"
#include "mcpcompose/util/log.hpp"

namespace mcpcompose::rpc
{

namespace
{
constexpr const char* kLogger = "discovery";
constexpr int kMaxPages = 100;

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds remaining(Clock::time_point deadline)
{
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

bool advertises(const Json& init_result, const char* capability)
{
    auto caps = init_result.find("capabilities");
    if (caps == init_result.end() || !caps->is_object())
        return true;
    return caps->contains(capability);
}

/// Collect every page of a `*/list` method into `out`.
/// @return nullopt on success
std::optional<Failure> list_all(RpcChannel& channel, const std::string& method, const char* key,
                                bool optional, Clock::time_point deadline, std::vector<Json>& out)
{
    std::optional<std::string> cursor;
    for (int page = 0; page < kMaxPages; ++page)
    {
        Json params = Json::object();
        if (cursor)
            params["cursor"] = *cursor;

        auto res = channel.request(method, params, remaining(deadline));
        if (!res)
        {
            const auto& f = res.failure();
            if (optional && f.kind == FailureKind::Protocol && f.code == kMethodNotFound)
            {
                log::debug(kLogger, channel.describe() + " does not implement " + method);
                return std::nullopt;
            }
            return Failure::discovery(method + " failed: " + f.describe());
        }

        const Json& result = res.value();
        if (result.contains(key) && result[key].is_array())
            for (const auto& item : result[key])
                out.push_back(item);

        auto next = result.find("nextCursor");
        if (next == result.end() || !next->is_string() || next->get<std::string>().empty())
            return std::nullopt;
        cursor = next->get<std::string>();
    }
    log::warning(kLogger, method + " on " + channel.describe() + " exceeded " +
                              std::to_string(kMaxPages) + " pages; result truncated");
    return std::nullopt;
}
} // namespace

Result<Json> initialize(RpcChannel& channel, std::chrono::milliseconds timeout,
                        const std::string& client_name)
{
    auto init = channel.request("initialize", initialize_params(client_name), timeout);
    if (!init)
        return Failure::discovery("initialize failed: " + init.failure().describe());

    if (auto failure = channel.notify("notifications/initialized", Json::object()))
        return Failure::discovery("notifications/initialized failed: " + failure->describe());
    return init.value();
}

Result<DiscoveryResult> list_components(RpcChannel& channel, const Json& init_result,
                                        std::chrono::milliseconds timeout)
{
    const auto deadline = Clock::now() + timeout;
    DiscoveryResult out;
    out.server_info = init_result;

    if (auto f = list_all(channel, "tools/list", "tools", false, deadline, out.tools))
        return *f;
    if (advertises(init_result, "prompts"))
        if (auto f = list_all(channel, "prompts/list", "prompts", true, deadline, out.prompts))
            return *f;
    if (advertises(init_result, "resources"))
        if (auto f =
                list_all(channel, "resources/list", "resources", true, deadline, out.resources))
            return *f;

    log::debug(kLogger, channel.describe() + ": " + std::to_string(out.tools.size()) +
                            " tools, " + std::to_string(out.prompts.size()) + " prompts, " +
                            std::to_string(out.resources.size()) + " resources");
    return out;
}

Result<DiscoveryResult> discover(RpcChannel& channel, std::chrono::milliseconds timeout)
{
    const auto deadline = Clock::now() + timeout;
    auto init = initialize(channel, timeout);
    if (!init)
        return init.failure();
    return list_components(channel, init.value(), remaining(deadline));
}

} // namespace mcpcompose::rpc
