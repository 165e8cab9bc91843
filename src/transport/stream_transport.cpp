#include "mcpcompose/transport/stream_transport.hpp"

#include "mcpcompose/exceptions.hpp"
#include "mcpcompose/rpc/jsonrpc.hpp"
#include "mcpcompose/util/json.hpp"
#include "mcpcompose/util/log.hpp"
#include "url.hpp"

#include <curl/curl.h>
#include <httplib.h>

namespace mcpcompose::transport
{

namespace
{
constexpr const char* kLogger = "stream_transport";

// Idle long-lived streams are kept open this long before the reader gives up
constexpr int kStreamReadTimeoutSec = 300;

void set_timeouts(httplib::Client& cli, std::chrono::milliseconds timeout)
{
    const auto sec = static_cast<time_t>(timeout.count() / 1000);
    const auto usec = static_cast<time_t>((timeout.count() % 1000) * 1000);
    cli.set_connection_timeout(sec, usec);
    cli.set_read_timeout(sec, usec);
    cli.set_write_timeout(sec, usec);
}

httplib::Headers to_httplib(const std::map<std::string, std::string>& headers)
{
    httplib::Headers out;
    for (const auto& [k, v] : headers)
        out.emplace(k, v);
    return out;
}

void ensure_curl_initialized()
{
    static std::once_flag once;
    std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}
} // namespace

std::vector<std::string> LineBuffer::feed(const char* data, std::size_t len)
{
    std::vector<std::string> lines;
    buffer_.append(data, len);

    std::size_t start = 0;
    while (true)
    {
        std::size_t nl = buffer_.find('\n', start);
        if (nl == std::string::npos)
            break;
        std::string line = buffer_.substr(start, nl - start);
        start = nl + 1;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (util::json::is_blank(line))
            continue;
        lines.push_back(std::move(line));
    }
    if (start > 0)
        buffer_.erase(0, start);
    return lines;
}

std::vector<Json> parse_poll_body(const std::string& body)
{
    std::vector<Json> out;
    if (util::json::is_blank(body))
        return out;

    if (auto whole = util::json::try_parse(body))
    {
        if (whole->is_array())
        {
            for (auto& item : *whole)
                out.push_back(std::move(item));
        }
        else
        {
            out.push_back(std::move(*whole));
        }
        return out;
    }

    LineBuffer lines;
    auto complete = lines.feed(body);
    if (!util::json::is_blank(lines.pending()))
        complete.push_back(lines.pending());
    for (const auto& line : complete)
    {
        if (auto msg = util::json::try_parse(line))
            out.push_back(std::move(*msg));
        else
            log::warning(kLogger, "Skipping malformed poll line: " + line);
    }
    return out;
}

StreamTransport::StreamTransport(std::string name, HttpStreamServer config)
    : name_(std::move(name)), config_(std::move(config))
{
    auto parsed = parse_url(config_.url);
    base_url_ = parsed.base();
    path_ = parsed.path;
}

StreamTransport::~StreamTransport()
{
    disconnect();
}

std::string StreamTransport::describe() const
{
    return "http:" + name_ + " (" + config_.url + ", " + to_string(config_.protocol) + ")";
}

std::map<std::string, std::string> StreamTransport::build_headers() const
{
    std::map<std::string, std::string> headers = {
        {"Content-Type", "application/json"},
        {"Accept", "application/json, application/x-ndjson, text/plain"}};
    for (const auto& [k, v] : config_.headers)
        headers[k] = v;
    if (config_.auth_token && !config_.auth_token->empty())
    {
        const char* scheme = config_.auth_type == AuthType::Basic ? "Basic " : "Bearer ";
        headers["Authorization"] = scheme + *config_.auth_token;
    }
    return headers;
}

std::optional<Failure> StreamTransport::connect()
{
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (connected_.load())
        return std::nullopt;

    {
        httplib::Client cli(base_url_);
        set_timeouts(cli, config_.timeout);
        cli.set_follow_location(false);
        auto res = cli.Head(path_, to_httplib(build_headers()));
        if (!res)
            return Failure::transport("Cannot reach " + config_.url + ": " +
                                      httplib::to_string(res.error()));
        if (res->status == 401 || res->status == 403)
            return Failure::transport("Authentication rejected by " + config_.url + " (HTTP " +
                                      std::to_string(res->status) + ")");
    }

    if (reader_.joinable())
        reader_.join();

    stop_requested_.store(false);
    reconnect_count_.store(0);
    pending_.reopen();
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        closed_ = false;
    }
    connected_.store(true);
    reader_ = std::thread([this]() { run_inbound(); });
    log::info(kLogger, "Connected " + describe());
    return std::nullopt;
}

void StreamTransport::disconnect()
{
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    stop_requested_.store(true);
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        if (stream_client_)
            stream_client_->stop();
    }
    wake_cv_.notify_all();
    if (reader_.joinable())
        reader_.join();

    const bool was_connected = connected_.exchange(false);
    pending_.close(Failure::closed("Transport " + name_ + " disconnected"));
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        closed_ = true;
    }
    inbox_cv_.notify_all();
    if (was_connected)
        log::info(kLogger, "Disconnected " + describe());
}

bool StreamTransport::wait_or_stop(std::chrono::milliseconds delay)
{
    std::unique_lock<std::mutex> lock(wake_mutex_);
    return wake_cv_.wait_for(lock, delay, [this]() { return stop_requested_.load(); });
}

void StreamTransport::dispatch(const Json& message)
{
    try
    {
        if (pending_.resolve(message))
            return;
    }
    catch (const Json::exception& e)
    {
        log::warning(kLogger, name_ + ": dropping malformed message: " + e.what());
        return;
    }

    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        if (inbox_.size() >= kInboxLimit)
        {
            inbox_.pop_front();
            dropped = ++dropped_count_;
        }
        inbox_.push_back(message);
    }
    if (dropped % 100 == 1)
        log::warning(kLogger, name_ + ": receive queue full, dropped " + std::to_string(dropped) +
                                  " oldest message(s)");
    inbox_cv_.notify_one();
}

std::size_t StreamTransport::inbox_size() const
{
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    return inbox_.size();
}

std::size_t StreamTransport::dropped_count() const
{
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    return dropped_count_;
}

void StreamTransport::dispatch_lines(const std::vector<std::string>& lines)
{
    for (const auto& line : lines)
    {
        auto msg = util::json::try_parse(line);
        if (!msg)
        {
            log::warning(kLogger, name_ + ": skipping malformed line: " + line);
            continue;
        }
        dispatch(*msg);
    }
}

void StreamTransport::fail_terminal(const Failure& failure)
{
    log::error(kLogger, name_ + ": " + failure.message);
    connected_.store(false);
    pending_.close(failure);
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        closed_ = true;
    }
    inbox_cv_.notify_all();
}

void StreamTransport::run_inbound()
{
    int attempts = 0;
    while (!stop_requested_.load())
    {
        bool established = false;
        std::string error;
        Outcome outcome = Outcome::Failed;
        switch (config_.protocol)
        {
        case StreamProtocol::Lines:
            outcome = run_lines(established, error);
            break;
        case StreamProtocol::Chunked:
            outcome = run_chunked(established, error);
            break;
        case StreamProtocol::Poll:
            outcome = run_poll(established, error);
            break;
        }
        if (outcome == Outcome::Stopped || stop_requested_.load())
            return;

        if (established)
            attempts = 0;

        if (!config_.reconnect_on_failure)
        {
            fail_terminal(Failure::transport("Stream failed: " + error));
            return;
        }
        if (attempts >= config_.max_reconnect_attempts)
        {
            fail_terminal(Failure::transport("Reconnect budget of " +
                                             std::to_string(config_.max_reconnect_attempts) +
                                             " attempts exhausted: " + error));
            return;
        }
        ++attempts;
        reconnect_count_.fetch_add(1);
        log::warning(kLogger, name_ + ": " + error + "; reconnecting (attempt " +
                                  std::to_string(attempts) + "/" +
                                  std::to_string(config_.max_reconnect_attempts) + ")");
        if (wait_or_stop(config_.retry_interval))
            return;
    }
}

StreamTransport::Outcome StreamTransport::run_lines(bool& established, std::string& error)
{
    httplib::Client cli(base_url_);
    const auto sec = static_cast<time_t>(config_.timeout.count() / 1000);
    cli.set_connection_timeout(sec, 0);
    cli.set_read_timeout(kStreamReadTimeoutSec, 0);
    cli.set_keep_alive(true);
    cli.set_follow_location(false);
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        if (stop_requested_.load())
            return Outcome::Stopped;
        stream_client_ = &cli;
    }

    LineBuffer buffer;
    int status = 0;
    auto response_handler = [&](const httplib::Response& r)
    {
        status = r.status;
        if (r.status >= 200 && r.status < 300)
        {
            established = true;
            return true;
        }
        return false;
    };
    auto content_receiver = [&](const char* data, size_t len)
    {
        if (stop_requested_.load())
            return false;
        dispatch_lines(buffer.feed(data, len));
        return !stop_requested_.load();
    };

    auto res = cli.Get(path_, to_httplib(build_headers()), response_handler, content_receiver);
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        stream_client_ = nullptr;
    }
    if (stop_requested_.load())
        return Outcome::Stopped;

    if (status != 0 && (status < 200 || status >= 300))
        error = "HTTP error " + std::to_string(status);
    else if (!res)
        error = "stream interrupted: " + httplib::to_string(res.error());
    else
        error = "stream ended by server";
    return Outcome::Failed;
}

StreamTransport::Outcome StreamTransport::run_chunked(bool& established, std::string& error)
{
    ensure_curl_initialized();
    CURL* curl = curl_easy_init();
    if (!curl)
    {
        error = "libcurl init failed";
        return Outcome::Failed;
    }

    struct Sink
    {
        StreamTransport* self;
        LineBuffer buffer;
        bool* established;
    } sink{this, LineBuffer(), &established};

    struct curl_slist* headers = nullptr;
    for (const auto& [k, v] : build_headers())
        headers = curl_slist_append(headers, (k + ": " + v).c_str());

    curl_easy_setopt(curl, CURLOPT_URL, config_.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(config_.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 0L); // long-lived stream
    curl_easy_setopt(
        curl, CURLOPT_WRITEFUNCTION,
        +[](char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t
        {
            auto* s = static_cast<Sink*>(userdata);
            if (s->self->stop_requested_.load())
                return 0;
            *s->established = true;
            s->self->dispatch_lines(s->buffer.feed(ptr, size * nmemb));
            return size * nmemb;
        });
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
    // The progress callback fires about once a second even on an idle
    // stream, which is what lets disconnect() abort the transfer.
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(
        curl, CURLOPT_XFERINFOFUNCTION,
        +[](void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) -> int
        {
            auto* s = static_cast<Sink*>(userdata);
            return s->self->stop_requested_.load() ? 1 : 0;
        });
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &sink);

    CURLcode code = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (stop_requested_.load())
        return Outcome::Stopped;

    if (code == CURLE_OK)
    {
        if (status >= 200 && status < 300)
            established = true;
        error = "stream ended by server";
    }
    else if (code == CURLE_HTTP_RETURNED_ERROR)
    {
        error = "HTTP error " + std::to_string(status);
    }
    else
    {
        error = std::string("stream interrupted: ") + curl_easy_strerror(code);
    }
    return Outcome::Failed;
}

StreamTransport::Outcome StreamTransport::run_poll(bool& established, std::string& error)
{
    httplib::Client cli(base_url_);
    set_timeouts(cli, config_.timeout);
    cli.set_keep_alive(true);
    cli.set_follow_location(false);
    const auto headers = to_httplib(build_headers());

    while (!stop_requested_.load())
    {
        auto res = cli.Get(path_, headers);
        if (stop_requested_.load())
            return Outcome::Stopped;
        if (!res)
        {
            error = "poll failed: " + httplib::to_string(res.error());
            return Outcome::Failed;
        }
        if (res->status < 200 || res->status >= 300)
        {
            error = "poll returned HTTP " + std::to_string(res->status);
            return Outcome::Failed;
        }
        established = true;
        if (res->status != 204)
            for (const auto& msg : parse_poll_body(res->body))
                dispatch(msg);

        if (wait_or_stop(config_.poll_interval))
            return Outcome::Stopped;
    }
    return Outcome::Stopped;
}

std::optional<Failure> StreamTransport::send(const Json& message)
{
    if (!connected_.load())
        return Failure::transport("Transport " + name_ + " is not connected");

    httplib::Client cli(base_url_);
    set_timeouts(cli, config_.timeout);
    cli.set_follow_location(false);
    auto headers = build_headers();
    headers.erase("Content-Type"); // set by Post itself
    auto res = cli.Post(path_, to_httplib(headers), rpc::encode(message), "application/json");
    if (!res)
        return Failure::transport("POST to " + config_.url + " failed: " +
                                  httplib::to_string(res.error()));
    if (res->status < 200 || res->status >= 300)
        return Failure::transport("POST to " + config_.url + " returned HTTP " +
                                  std::to_string(res->status));

    for (const auto& msg : parse_poll_body(res->body))
    {
        if (msg.is_object() && msg.contains("jsonrpc"))
            dispatch(msg);
    }
    return std::nullopt;
}

Result<Json> StreamTransport::receive(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(inbox_mutex_);
    inbox_cv_.wait_for(lock, timeout, [this]() { return !inbox_.empty() || closed_; });
    if (!inbox_.empty())
    {
        Json msg = std::move(inbox_.front());
        inbox_.pop_front();
        return msg;
    }
    if (closed_)
        return Failure::closed("Transport " + name_ + " is closed");
    return Failure::timeout("No message within " + std::to_string(timeout.count()) + "ms");
}

Result<Json> StreamTransport::request(const std::string& method, const Json& params,
                                      std::chrono::milliseconds timeout)
{
    auto ticket = pending_.open();
    if (ticket.future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready)
        return ticket.future.get();

    if (auto failure = send(rpc::make_request(ticket.id, method, params)))
    {
        pending_.cancel(ticket.id);
        return *failure;
    }
    return pending_.await(ticket, timeout);
}

std::optional<Failure> StreamTransport::notify(const std::string& method, const Json& params)
{
    return send(rpc::make_notification(method, params));
}

} // namespace mcpcompose::transport
