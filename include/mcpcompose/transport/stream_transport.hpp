#pragma once
/// @file transport/stream_transport.hpp
/// @brief JSON-RPC over HTTP with three inbound framing dialects.
/// @details Outbound messages are always POSTed to the configured URL. The
///          inbound side depends on the protocol:
///          - Lines: a long-lived GET read through cpp-httplib, one JSON
///            object per text line
///          - Chunked: a long-lived GET read through libcurl, NDJSON
///            extracted from the raw byte chunks
///          - Poll: a GET every poll_interval, each body holding a JSON array
///            or NDJSON lines
///          Responses matching a pending request() complete it; everything
///          else lands in the receive() queue.

#include "mcpcompose/descriptors.hpp"
#include "mcpcompose/result.hpp"
#include "mcpcompose/rpc/channel.hpp"
#include "mcpcompose/rpc/pending_requests.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
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

/// Byte accumulator that yields complete newline-terminated lines.
/// CR before LF is stripped and blank lines are skipped; an incomplete tail
/// stays buffered until the rest arrives.
class LineBuffer
{
  public:
    std::vector<std::string> feed(const char* data, std::size_t len);
    std::vector<std::string> feed(const std::string& data)
    {
        return feed(data.data(), data.size());
    }

    const std::string& pending() const
    {
        return buffer_;
    }
    void clear()
    {
        buffer_.clear();
    }

  private:
    std::string buffer_;
};

/// Messages carried by one poll response: the elements of a JSON array,
/// a single JSON object, or one object per NDJSON line. Malformed lines are
/// skipped.
std::vector<Json> parse_poll_body(const std::string& body);

class StreamTransport : public rpc::RpcChannel
{
  public:
    StreamTransport(std::string name, HttpStreamServer config);
    ~StreamTransport() override;

    StreamTransport(const StreamTransport&) = delete;
    StreamTransport& operator=(const StreamTransport&) = delete;

    const std::string& name() const
    {
        return name_;
    }
    const HttpStreamServer& config() const
    {
        return config_;
    }

    /// Check the endpoint answers and start the inbound reader
    std::optional<Failure> connect();

    /// Stop the inbound reader and fail everything pending. Idempotent.
    void disconnect();

    bool is_connected() const
    {
        return connected_.load();
    }

    /// Number of reconnects performed since connect()
    int reconnect_count() const
    {
        return reconnect_count_.load();
    }

    /// POST one message. A JSON-RPC body returned inline is dispatched as if
    /// it had arrived on the inbound stream.
    std::optional<Failure> send(const Json& message);

    /// Next unsolicited message; Timeout if none arrives in time,
    /// TransportClosed once the transport is disconnected and drained
    Result<Json> receive(std::chrono::milliseconds timeout);

    /// Unsolicited messages kept for receive(); the oldest is dropped when a
    /// new one arrives at the limit
    static constexpr std::size_t kInboxLimit = 1000;

    std::size_t inbox_size() const;

    /// Messages discarded because the receive queue was full
    std::size_t dropped_count() const;

    Result<Json> request(const std::string& method, const Json& params,
                         std::chrono::milliseconds timeout) override;
    std::optional<Failure> notify(const std::string& method, const Json& params) override;
    std::string describe() const override;

    /// Headers sent with every request, Authorization included
    std::map<std::string, std::string> build_headers() const;

  private:
    enum class Outcome
    {
        Stopped,
        Failed
    };

    void run_inbound();
    Outcome run_lines(bool& established, std::string& error);
    Outcome run_chunked(bool& established, std::string& error);
    Outcome run_poll(bool& established, std::string& error);

    void dispatch(const Json& message);
    void dispatch_lines(const std::vector<std::string>& lines);
    void fail_terminal(const Failure& failure);
    bool wait_or_stop(std::chrono::milliseconds delay);

    const std::string name_;
    const HttpStreamServer config_;
    std::string base_url_;
    std::string path_;

    std::atomic<bool> connected_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<int> reconnect_count_{0};

    rpc::PendingRequests pending_;

    mutable std::mutex inbox_mutex_;
    std::condition_variable inbox_cv_;
    std::deque<Json> inbox_;
    std::size_t dropped_count_{0};
    bool closed_{false};

    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    std::mutex client_mutex_;
    httplib::Client* stream_client_{nullptr};

    std::mutex lifecycle_mutex_;
    std::thread reader_;
};

} // namespace mcpcompose::transport
