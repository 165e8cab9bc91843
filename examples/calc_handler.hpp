#pragma once
/// @file calc_handler.hpp
/// @brief Minimal MCP request handler shared by the demo servers.
/// @details Serves an `add` tool, a `whoami` tool, a `greet` prompt and an
///          `info` resource. Used by the stdio demo server and by the HTTP
///          and SSE test fixtures.

#include "mcpcompose/rpc/jsonrpc.hpp"
#include "mcpcompose/types.hpp"

#include <optional>
#include <string>

namespace calc
{

using mcpcompose::Json;

struct Options
{
    std::string name{"calc"};
    bool prompts{true};
    bool resources{true};
};

inline Json error_response(const Json& id, int code, const std::string& message)
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

inline Json result_response(const Json& id, Json result)
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

inline Json text_content(const std::string& text)
{
    return Json{{"content", Json::array({Json{{"type", "text"}, {"text", text}}})}};
}

inline Json tool_list()
{
    return Json::array(
        {Json{{"name", "add"},
              {"description", "Add two integers"},
              {"inputSchema",
               {{"type", "object"},
                {"properties", {{"a", {{"type", "integer"}}}, {"b", {{"type", "integer"}}}}},
                {"required", Json::array({"a", "b"})}}}},
         Json{{"name", "whoami"},
              {"description", "Name of the serving process"},
              {"inputSchema", {{"type", "object"}, {"properties", Json::object()}}}},
         Json{{"name", "sleep"},
              {"description", "Reply after `ms` milliseconds"},
              {"inputSchema",
               {{"type", "object"}, {"properties", {{"ms", {{"type", "integer"}}}}}}}}});
}

/// Handle one request. Returns nullopt for notifications and for requests
/// the caller answers itself (`sleep`).
inline std::optional<Json> handle(const Json& request, const Options& options)
{
    if (!request.is_object() || !request.contains("method"))
        return error_response(nullptr, mcpcompose::rpc::kInvalidRequest, "Invalid request");
    if (!request.contains("id"))
        return std::nullopt;

    const Json id = request["id"];
    const std::string method = request.value("method", std::string());
    const Json params = request.value("params", Json::object());

    if (method == "initialize")
    {
        Json caps = {{"tools", Json::object()}};
        if (options.prompts)
            caps["prompts"] = Json::object();
        if (options.resources)
            caps["resources"] = Json::object();
        return result_response(id, {{"protocolVersion", mcpcompose::rpc::kProtocolVersion},
                                    {"capabilities", caps},
                                    {"serverInfo", {{"name", options.name}, {"version", "1.0"}}}});
    }
    if (method == "ping")
        return result_response(id, Json::object());
    if (method == "tools/list")
        return result_response(id, {{"tools", tool_list()}});
    if (method == "tools/call")
    {
        const std::string tool = params.value("name", std::string());
        const Json args = params.value("arguments", Json::object());
        if (tool == "add")
        {
            if (!args.contains("a") || !args.contains("b") || !args["a"].is_number_integer() ||
                !args["b"].is_number_integer())
                return error_response(id, mcpcompose::rpc::kInvalidParams,
                                      "add expects integer a and b");
            return result_response(
                id, text_content(std::to_string(args["a"].get<long long>() +
                                                args["b"].get<long long>())));
        }
        if (tool == "whoami")
            return result_response(id, text_content(options.name));
        if (tool == "sleep")
            return std::nullopt;
        return error_response(id, mcpcompose::rpc::kInvalidParams, "Unknown tool: " + tool);
    }
    if (options.prompts && method == "prompts/list")
    {
        return result_response(
            id, {{"prompts",
                  Json::array({Json{{"name", "greet"},
                                    {"description", "Greeting"},
                                    {"arguments", Json::array({Json{{"name", "who"}}})}}})}});
    }
    if (options.prompts && method == "prompts/get")
    {
        const std::string who = params.value("arguments", Json::object()).value("who", "world");
        return result_response(
            id, {{"messages",
                  Json::array({Json{{"role", "user"},
                                    {"content", {{"type", "text"},
                                                 {"text", "Hello " + who + " from " +
                                                              options.name}}}}})}});
    }
    if (options.resources && method == "resources/list")
    {
        return result_response(
            id, {{"resources", Json::array({Json{{"uri", "calc://" + options.name + "/info"},
                                                 {"name", "info"},
                                                 {"mimeType", "text/plain"}}})}});
    }
    if (options.resources && method == "resources/read")
    {
        const std::string uri = params.value("uri", std::string());
        return result_response(
            id, {{"contents", Json::array({Json{{"uri", uri},
                                                {"mimeType", "text/plain"},
                                                {"text", "served by " + options.name}}})}});
    }
    return error_response(id, mcpcompose::rpc::kMethodNotFound, "Method not found: " + method);
}

} // namespace calc
