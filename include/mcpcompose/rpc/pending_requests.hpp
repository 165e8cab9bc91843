#pragma once
/// @file rpc/pending_requests.hpp
/// @brief Id allocation and response correlation for one JSON-RPC connection.

#include "mcpcompose/result.hpp"
#include "mcpcompose/types.hpp"

#include <chrono>
#include <cstdint>
#include <future>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace mcpcompose::rpc
{

/// Table of in-flight requests keyed by id.
///
/// Ids increase monotonically for the lifetime of the table. A response is
/// delivered only to the request carrying the same id, whatever the order in
/// which responses arrive. Once closed, every pending and every later request
/// fails with the close reason until reopen() is called.
class PendingRequests
{
  public:
    struct Ticket
    {
        std::int64_t id{0};
        std::future<Result<Json>> future;
    };

    /// Allocate an id and its completion slot
    Ticket open();

    /// Complete the request whose id matches `message`
    /// @return false if the message is not a response to a pending request
    bool resolve(const Json& message);

    /// Drop a pending entry without completing it
    void cancel(std::int64_t id);

    /// Block until the response arrives or `timeout` elapses. On timeout the
    /// entry is removed and a Timeout failure returned.
    Result<Json> await(Ticket& ticket, std::chrono::milliseconds timeout);

    /// Fail everything in flight and refuse new requests with `reason`
    void close(const Failure& reason);
    void reopen();
    bool closed() const;

    std::size_t size() const;

  private:
    mutable std::mutex mutex_;
    std::int64_t next_id_{1};
    std::unordered_map<std::int64_t, std::promise<Result<Json>>> pending_;
    std::optional<Failure> closed_;
};

} // namespace mcpcompose::rpc
