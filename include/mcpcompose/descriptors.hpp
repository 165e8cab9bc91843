#pragma once
/// @file descriptors.hpp
/// @brief Read-only descriptions of the downstream servers to compose.

#include "mcpcompose/types.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace mcpcompose
{

/// What the supervisor does when a running server exits on its own
enum class RestartPolicy
{
    Never,     ///< stay Crashed
    OnFailure, ///< restart on non-zero exit or signal
    Always     ///< restart on any exit
};

std::string to_string(RestartPolicy policy);
std::optional<RestartPolicy> restart_policy_from_string(const std::string& s);

/// Inbound framing dialect of an HTTP streaming server
enum class StreamProtocol
{
    Lines,   ///< long-lived response, one JSON object per text line
    Chunked, ///< long-lived response, NDJSON extracted from raw byte chunks
    Poll     ///< periodic GET, each response carries zero or more messages
};

std::string to_string(StreamProtocol protocol);
std::optional<StreamProtocol> stream_protocol_from_string(const std::string& s);

enum class AuthType
{
    Bearer,
    Basic
};

/// Subprocess speaking JSON-RPC on stdin/stdout
struct StdioServer
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env; ///< overlay on the inherited environment
    std::string working_directory;
    RestartPolicy restart_policy{RestartPolicy::Never};
    int max_restarts{3};
};

/// Remote server reached through an SSE stream and a POST endpoint
struct SseServer
{
    std::string url; ///< scheme://host:port
    std::string sse_path{"/sse"};
    std::string messages_path{"/messages"};
    std::unordered_map<std::string, std::string> headers;
};

/// Remote server reached through one of the HTTP streaming dialects
struct HttpStreamServer
{
    std::string url; ///< full stream endpoint, used for GET and POST
    StreamProtocol protocol{StreamProtocol::Lines};
    std::optional<std::string> auth_token;
    AuthType auth_type{AuthType::Bearer};
    bool reconnect_on_failure{true};
    int max_reconnect_attempts{10};
    std::chrono::milliseconds retry_interval{1000};
    std::chrono::milliseconds poll_interval{1000};
    std::chrono::milliseconds timeout{30000};
    std::unordered_map<std::string, std::string> headers;
};

using ServerDescriptor = std::variant<StdioServer, SseServer, HttpStreamServer>;

/// Transport name of a descriptor: "stdio", "sse" or "http"
std::string transport_name(const ServerDescriptor& descriptor);

struct ServerConfig
{
    std::string name;
    bool enabled{true};
    ServerDescriptor descriptor;
};

} // namespace mcpcompose
