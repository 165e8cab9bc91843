#pragma once
/// @file transport/sse_transport.hpp
/// @brief JSON-RPC over a Server-Sent-Events stream plus a POST endpoint.

#include "mcpcompose/descriptors.hpp"
#include "mcpcompose/result.hpp"
#include "mcpcompose/rpc/channel.hpp"
#include "mcpcompose/rpc/pending_requests.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace httplib
{
class Client;
}

namespace mcpcompose::transport
{

/// One parsed SSE event
struct SseEvent
{
    std::string type; ///< empty for the default "message" event
    std::string data;
};

/// Incremental parser for `text/event-stream` bodies. Events are separated by
/// a blank line (LF or CRLF); multiple `data:` lines are concatenated.
class SseParser
{
  public:
    std::vector<SseEvent> feed(const char* data, std::size_t len);

  private:
    std::string buffer_;
};

/// Client side of an SSE server.
///
/// The listener thread holds the GET stream open; the server's `endpoint`
/// event names the path (and session id) requests are POSTed to, and
/// responses come back as `data:` events matched to pending requests by id.
/// The connection is opened lazily by the first request when connect() was
/// not called explicitly.
class SseTransport : public rpc::RpcChannel
{
  public:
    /// @param initialize_on_connect run the MCP handshake right after each
    ///        connect, for sessions used only for invocation
    SseTransport(std::string name, SseServer config, bool initialize_on_connect = false);
    ~SseTransport() override;

    SseTransport(const SseTransport&) = delete;
    SseTransport& operator=(const SseTransport&) = delete;

    std::optional<Failure> connect(std::chrono::milliseconds timeout);

    /// Close the stream. Reports a failure when the listener had already hit
    /// an error of its own (stream dropped, HTTP error) before this call.
    std::optional<Failure> disconnect();

    bool is_connected() const
    {
        return connected_.load();
    }
    std::string session_id() const;
    std::string endpoint_path() const;

    Result<Json> request(const std::string& method, const Json& params,
                         std::chrono::milliseconds timeout) override;
    std::optional<Failure> notify(const std::string& method, const Json& params) override;
    std::string describe() const override;

  private:
    std::optional<Failure> connect_locked(std::chrono::milliseconds timeout);
    std::optional<Failure> ensure_connected(std::chrono::milliseconds timeout);
    void listen();
    void handle_event(const SseEvent& event);
    std::optional<Failure> post(const Json& message, std::chrono::milliseconds timeout);
    std::optional<Failure> teardown_locked();

    const std::string name_;
    const SseServer config_;
    const bool initialize_on_connect_;
    std::string base_url_;

    std::mutex lifecycle_mutex_;
    std::thread listener_;
    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};

    mutable std::mutex endpoint_mutex_;
    std::condition_variable endpoint_cv_;
    std::string endpoint_path_;
    std::string session_id_;
    bool listener_done_{false};
    std::optional<std::string> listener_error_;

    std::mutex client_mutex_;
    httplib::Client* stream_client_{nullptr};

    rpc::PendingRequests pending_;
};

} // namespace mcpcompose::transport
