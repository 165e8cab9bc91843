#include "mcpcompose/rpc/jsonrpc.hpp"

namespace mcpcompose::rpc
{

Json make_request(std::int64_t id, const std::string& method, const Json& params)
{
    Json msg = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
    if (!params.is_null())
        msg["params"] = params;
    return msg;
}

Json make_notification(const std::string& method, const Json& params)
{
    Json msg = {{"jsonrpc", "2.0"}, {"method", method}};
    if (!params.is_null() && !(params.is_object() && params.empty()))
        msg["params"] = params;
    return msg;
}

std::optional<std::int64_t> response_id(const Json& message)
{
    if (!message.is_object() || message.contains("method"))
        return std::nullopt;
    if (!message.contains("result") && !message.contains("error"))
        return std::nullopt;
    auto it = message.find("id");
    if (it == message.end() || !it->is_number_integer())
        return std::nullopt;
    return it->get<std::int64_t>();
}

bool is_notification(const Json& message)
{
    return message.is_object() && message.contains("method") && !message.contains("id");
}

Result<Json> to_result(const Json& response)
{
    if (response.contains("error"))
    {
        const auto& err = response["error"];
        if (!err.is_object())
            return Failure::protocol(kInternalError, encode(err));
        // Servers in the wild send string codes and structured messages
        auto code = err.find("code");
        auto message = err.find("message");
        int c = code != err.end() && code->is_number_integer() ? code->get<int>() : kInternalError;
        std::string text = message == err.end() ? std::string("Unknown error")
                           : message->is_string() ? message->get<std::string>()
                                                  : encode(*message);
        return Failure::protocol(c, text);
    }
    if (response.contains("result"))
        return response["result"];
    return Failure::protocol(kInvalidRequest, "Response carries neither result nor error");
}

std::string encode(const Json& message)
{
    return message.dump(-1, ' ', false, Json::error_handler_t::replace);
}

Json initialize_params(const std::string& client_name)
{
    return Json{{"protocolVersion", kProtocolVersion},
                {"capabilities", Json::object()},
                {"clientInfo", {{"name", client_name}, {"version", "1.0.0"}}}};
}

} // namespace mcpcompose::rpc
