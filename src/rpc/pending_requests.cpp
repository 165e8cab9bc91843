#include "mcpcompose/rpc/pending_requests.hpp"

#include "mcpcompose/rpc/jsonrpc.hpp"

namespace mcpcompose::rpc
{

PendingRequests::Ticket PendingRequests::open()
{
    std::lock_guard<std::mutex> lock(mutex_);
    Ticket ticket;
    ticket.id = next_id_++;
    std::promise<Result<Json>> promise;
    ticket.future = promise.get_future();
    if (closed_)
        promise.set_value(*closed_);
    else
        pending_.emplace(ticket.id, std::move(promise));
    return ticket;
}

bool PendingRequests::resolve(const Json& message)
{
    auto id = response_id(message);
    if (!id)
        return false;

    std::promise<Result<Json>> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(*id);
        if (it == pending_.end())
            return false;
        promise = std::move(it->second);
        pending_.erase(it);
    }
    promise.set_value(to_result(message));
    return true;
}

void PendingRequests::cancel(std::int64_t id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.erase(id);
}

Result<Json> PendingRequests::await(Ticket& ticket, std::chrono::milliseconds timeout)
{
    if (ticket.future.wait_for(timeout) == std::future_status::ready)
        return ticket.future.get();

    cancel(ticket.id);
    // The response may have landed between the wait and the cancel
    if (ticket.future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready)
        return ticket.future.get();
    return Failure::timeout("No response to request " + std::to_string(ticket.id) + " within " +
                            std::to_string(timeout.count()) + "ms");
}

void PendingRequests::close(const Failure& reason)
{
    std::unordered_map<std::int64_t, std::promise<Result<Json>>> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = reason;
        failed.swap(pending_);
    }
    for (auto& entry : failed)
        entry.second.set_value(reason);
}

void PendingRequests::reopen()
{
    std::lock_guard<std::mutex> lock(mutex_);
    closed_.reset();
}

bool PendingRequests::closed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_.has_value();
}

std::size_t PendingRequests::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace mcpcompose::rpc
