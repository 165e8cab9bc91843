#include "mcpcompose/transport/sse_transport.hpp"

#include "mcpcompose/exceptions.hpp"
#include "mcpcompose/rpc/jsonrpc.hpp"
#include "mcpcompose/util/json.hpp"
#include "mcpcompose/util/log.hpp"
#include "url.hpp"

#include <httplib.h>

namespace mcpcompose::transport
{

namespace
{
constexpr const char* kLogger = "sse_transport";
constexpr int kStreamReadTimeoutSec = 300;

httplib::Headers make_headers(const SseServer& config, const char* accept)
{
    httplib::Headers headers = {{"Accept", accept}};
    for (const auto& [k, v] : config.headers)
        headers.emplace(k, v);
    return headers;
}
} // namespace

std::vector<SseEvent> SseParser::feed(const char* data, std::size_t len)
{
    std::vector<SseEvent> events;
    buffer_.append(data, len);

    std::size_t pos = 0;
    while (true)
    {
        // Both \n\n and \r\n\r\n terminate an event
        std::size_t sep = buffer_.find("\n\n", pos);
        std::size_t sep_len = 2;
        std::size_t crlf = buffer_.find("\r\n\r\n", pos);
        if (crlf != std::string::npos && (sep == std::string::npos || crlf < sep))
        {
            sep = crlf;
            sep_len = 4;
        }
        if (sep == std::string::npos)
            break;

        std::string chunk = buffer_.substr(pos, sep - pos);
        pos = sep + sep_len;

        SseEvent event;
        bool has_data = false;
        std::size_t line_start = 0;
        while (line_start <= chunk.size())
        {
            std::size_t line_end = chunk.find('\n', line_start);
            std::string line = chunk.substr(line_start, line_end == std::string::npos
                                                            ? std::string::npos
                                                            : line_end - line_start);
            if (!line.empty() && line.back() == '\r')
                line.pop_back();

            if (line.rfind("event:", 0) == 0)
            {
                event.type = line.substr(6);
                if (!event.type.empty() && event.type[0] == ' ')
                    event.type.erase(0, 1);
            }
            else if (line.rfind("data:", 0) == 0)
            {
                std::string part = line.substr(5);
                if (!part.empty() && part[0] == ' ')
                    part.erase(0, 1);
                if (has_data)
                    event.data += "\n";
                event.data += part;
                has_data = true;
            }
            if (line_end == std::string::npos)
                break;
            line_start = line_end + 1;
        }
        if (has_data)
            events.push_back(std::move(event));
    }
    if (pos > 0)
        buffer_.erase(0, pos);
    return events;
}

SseTransport::SseTransport(std::string name, SseServer config, bool initialize_on_connect)
    : name_(std::move(name)), config_(std::move(config)),
      initialize_on_connect_(initialize_on_connect)
{
    base_url_ = parse_url(config_.url).base();
}

SseTransport::~SseTransport()
{
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (auto failure = teardown_locked())
        log::debug(kLogger, name_ + ": " + failure->message);
}

std::string SseTransport::describe() const
{
    return "sse:" + name_ + " (" + config_.url + config_.sse_path + ")";
}

std::string SseTransport::session_id() const
{
    std::lock_guard<std::mutex> lock(endpoint_mutex_);
    return session_id_;
}

std::string SseTransport::endpoint_path() const
{
    std::lock_guard<std::mutex> lock(endpoint_mutex_);
    return endpoint_path_.empty() ? config_.messages_path : endpoint_path_;
}

std::optional<Failure> SseTransport::connect(std::chrono::milliseconds timeout)
{
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (connected_.load())
            return std::nullopt;
        if (auto failure = connect_locked(timeout))
            return failure;
    }
    if (initialize_on_connect_)
    {
        auto init = rpc::initialize(*this, timeout);
        if (!init)
            return init.failure();
    }
    return std::nullopt;
}

std::optional<Failure> SseTransport::ensure_connected(std::chrono::milliseconds timeout)
{
    if (connected_.load())
        return std::nullopt;
    log::debug(kLogger, "Lazily connecting " + describe());
    return connect(timeout);
}

std::optional<Failure> SseTransport::connect_locked(std::chrono::milliseconds timeout)
{
    if (listener_.joinable())
        listener_.join();

    {
        std::lock_guard<std::mutex> lock(endpoint_mutex_);
        endpoint_path_.clear();
        session_id_.clear();
        listener_done_ = false;
        listener_error_.reset();
    }
    pending_.reopen();
    running_.store(true);
    listener_ = std::thread([this]() { listen(); });

    std::unique_lock<std::mutex> lock(endpoint_mutex_);
    endpoint_cv_.wait_for(lock, timeout,
                          [this]() { return !endpoint_path_.empty() || listener_done_; });
    if (listener_done_)
    {
        auto reason = listener_error_.value_or("stream closed");
        listener_error_.reset(); // reported here, not again by disconnect()
        lock.unlock();
        running_.store(false);
        listener_.join();
        return Failure::transport("SSE connect to " + config_.url + " failed: " + reason);
    }
    if (!connected_.load())
    {
        lock.unlock();
        if (auto failure = teardown_locked())
            log::debug(kLogger, name_ + ": " + failure->message);
        return Failure::timeout("SSE connect to " + config_.url + " timed out");
    }
    if (endpoint_path_.empty())
        log::warning(kLogger, name_ + ": no endpoint event received, posting to " +
                                  config_.messages_path);
    log::info(kLogger, "Connected " + describe());
    return std::nullopt;
}

void SseTransport::listen()
{
    httplib::Client cli(base_url_);
    cli.set_connection_timeout(10, 0);
    cli.set_read_timeout(kStreamReadTimeoutSec, 0);
    cli.set_keep_alive(true);
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        stream_client_ = &cli;
    }

    SseParser parser;
    int status = 0;
    auto response_handler = [this, &status](const httplib::Response& r)
    {
        status = r.status;
        if (r.status >= 200 && r.status < 300)
        {
            connected_.store(true);
            return true;
        }
        return false;
    };
    auto content_receiver = [this, &parser](const char* data, size_t len)
    {
        if (!running_.load())
            return false;
        for (const auto& event : parser.feed(data, len))
        {
            try
            {
                handle_event(event);
            }
            catch (const Json::exception& e)
            {
                log::warning(kLogger, name_ + ": dropping malformed event: " + e.what());
            }
            catch (const TransportError& e)
            {
                log::warning(kLogger, name_ + ": ignoring bad endpoint event: " + e.what());
            }
        }
        return running_.load();
    };

    // A disconnect() issued before the client was registered is seen here
    httplib::Result res;
    if (running_.load())
        res = cli.Get(config_.sse_path, make_headers(config_, "text/event-stream"),
                      response_handler, content_receiver);
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        stream_client_ = nullptr;
    }

    std::optional<std::string> error;
    if (running_.load())
    {
        if (status != 0 && (status < 200 || status >= 300))
            error = "HTTP error " + std::to_string(status);
        else if (!res)
            error = "stream interrupted: " + httplib::to_string(res.error());
        else
            error = "stream ended by server";
        log::warning(kLogger, name_ + ": " + *error);
    }

    connected_.store(false);
    pending_.close(Failure::closed("SSE stream of " + name_ + " closed"));
    {
        std::lock_guard<std::mutex> lock(endpoint_mutex_);
        listener_done_ = true;
        listener_error_ = error;
    }
    endpoint_cv_.notify_all();
}

void SseTransport::handle_event(const SseEvent& event)
{
    if (event.type == "endpoint")
    {
        std::string path = event.data;
        if (path.rfind("http://", 0) == 0 || path.rfind("https://", 0) == 0)
            path = parse_url(path).path;
        else if (path.empty() || path[0] != '/')
            path.insert(path.begin(), '/');

        std::string session;
        auto pos = path.find("session_id=");
        if (pos != std::string::npos)
        {
            pos += std::string("session_id=").size();
            auto end = path.find_first_of("&#", pos);
            session = path.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
        }
        {
            std::lock_guard<std::mutex> lock(endpoint_mutex_);
            endpoint_path_ = path;
            session_id_ = session;
        }
        endpoint_cv_.notify_all();
        log::debug(kLogger, name_ + ": endpoint " + path);
        return;
    }

    auto msg = util::json::try_parse(event.data);
    if (!msg || !msg->is_object())
    {
        log::debug(kLogger, name_ + ": ignoring non-JSON event: " + event.data);
        return;
    }
    if (pending_.resolve(*msg))
        return;

    if (msg->contains("method") && msg->contains("id"))
    {
        // Server-initiated requests (sampling, elicitation) are not supported
        const auto& method = (*msg)["method"];
        std::string shown = method.is_string() ? method.get<std::string>() : rpc::encode(method);
        Json reply = {{"jsonrpc", "2.0"},
                      {"id", (*msg)["id"]},
                      {"error",
                       {{"code", rpc::kMethodNotFound},
                        {"message", "Method not handled: " + shown}}}};
        if (auto failure = post(reply, std::chrono::milliseconds(5000)))
            log::debug(kLogger, name_ + ": could not reject server request: " +
                                    failure->message);
        return;
    }
    log::debug(kLogger, name_ + ": unsolicited message: " + event.data);
}

std::optional<Failure> SseTransport::post(const Json& message, std::chrono::milliseconds timeout)
{
    httplib::Client cli(base_url_);
    const auto sec = static_cast<time_t>(timeout.count() / 1000);
    const auto usec = static_cast<time_t>((timeout.count() % 1000) * 1000);
    cli.set_connection_timeout(sec, usec);
    cli.set_read_timeout(sec, usec);

    const std::string path = endpoint_path();
    auto res = cli.Post(path, make_headers(config_, "application/json, text/event-stream"),
                        rpc::encode(message), "application/json");
    if (!res)
        return Failure::transport("POST to " + path + " failed: " +
                                  httplib::to_string(res.error()));
    if (res->status < 200 || res->status >= 300)
        return Failure::transport("POST to " + path + " returned HTTP " +
                                  std::to_string(res->status));
    return std::nullopt;
}

Result<Json> SseTransport::request(const std::string& method, const Json& params,
                                   std::chrono::milliseconds timeout)
{
    if (auto failure = ensure_connected(timeout))
        return *failure;

    auto ticket = pending_.open();
    if (ticket.future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready)
        return ticket.future.get();

    if (auto failure = post(rpc::make_request(ticket.id, method, params), timeout))
    {
        pending_.cancel(ticket.id);
        return *failure;
    }
    return pending_.await(ticket, timeout);
}

std::optional<Failure> SseTransport::notify(const std::string& method, const Json& params)
{
    if (auto failure = ensure_connected(std::chrono::milliseconds(10000)))
        return failure;
    return post(rpc::make_notification(method, params), std::chrono::milliseconds(10000));
}

std::optional<Failure> SseTransport::disconnect()
{
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    auto failure = teardown_locked();
    if (failure)
        log::warning(kLogger, name_ + ": " + failure->message);
    else
        log::debug(kLogger, "Disconnected " + describe());
    return failure;
}

std::optional<Failure> SseTransport::teardown_locked()
{
    running_.store(false);
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        if (stream_client_)
            stream_client_->stop();
    }
    if (listener_.joinable())
        listener_.join();
    connected_.store(false);
    pending_.close(Failure::closed("Transport " + name_ + " disconnected"));

    std::optional<std::string> error;
    {
        std::lock_guard<std::mutex> lock(endpoint_mutex_);
        error.swap(listener_error_);
        endpoint_path_.clear();
        session_id_.clear();
    }
    if (error)
        return Failure::transport("SSE listener of " + name_ + " failed before disconnect: " +
                                  *error);
    return std::nullopt;
}

} // namespace mcpcompose::transport
