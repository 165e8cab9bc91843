#pragma once
/// @file rpc/jsonrpc.hpp
/// @brief JSON-RPC 2.0 message builders and response translation.

#include "mcpcompose/result.hpp"
#include "mcpcompose/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace mcpcompose::rpc
{

/// MCP protocol revision announced in `initialize`
inline constexpr const char* kProtocolVersion = "2024-11-05";

inline constexpr int kParseError = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kInternalError = -32603;

Json make_request(std::int64_t id, const std::string& method, const Json& params);
Json make_notification(const std::string& method, const Json& params = Json::object());

/// Numeric id of a response (an object with `result` or `error`), nullopt
/// for requests, notifications and responses with non-integer ids
std::optional<std::int64_t> response_id(const Json& message);

/// True for objects with a `method` and no `id`
bool is_notification(const Json& message);

/// `result` of a response, or a Protocol failure built from its `error`.
/// A non-integer code becomes kInternalError; a non-string message is
/// reported as its JSON text.
Result<Json> to_result(const Json& response);

/// Compact wire text; invalid UTF-8 in strings becomes U+FFFD
std::string encode(const Json& message);

/// Parameters of the `initialize` request sent by the composer
Json initialize_params(const std::string& client_name);

} // namespace mcpcompose::rpc
