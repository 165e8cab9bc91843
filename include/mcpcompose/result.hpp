#pragma once
/// @file result.hpp
/// @brief Value-or-failure return type used by the proxy and transport layers.
/// @details Operations that cross a thread boundary (waiting on a pipe, a
///          stream or a subprocess) return Result<T> instead of throwing, so
///          callers can tell a refused call from a silent server.

#include "mcpcompose/types.hpp"

#include <string>
#include <utility>
#include <variant>

namespace mcpcompose
{

enum class FailureKind
{
    Transport,       ///< connection dropped, HTTP error, reconnect budget exhausted
    TransportClosed, ///< peer went away while the request was pending
    Protocol,        ///< well-formed JSON-RPC error response
    Timeout,         ///< no response before the caller's deadline
    Discovery,       ///< enumeration of a server's components failed
    NotFound         ///< unknown component or server
};

inline std::string to_string(FailureKind kind)
{
    switch (kind)
    {
    case FailureKind::Transport:
        return "transport";
    case FailureKind::TransportClosed:
        return "transport_closed";
    case FailureKind::Protocol:
        return "protocol";
    case FailureKind::Timeout:
        return "timeout";
    case FailureKind::Discovery:
        return "discovery";
    case FailureKind::NotFound:
        return "not_found";
    }
    return "transport";
}

struct Failure
{
    FailureKind kind{FailureKind::Transport};
    int code{0}; ///< JSON-RPC error code for Protocol failures
    std::string message;

    static Failure transport(std::string message)
    {
        return {FailureKind::Transport, 0, std::move(message)};
    }
    static Failure closed(std::string message)
    {
        return {FailureKind::TransportClosed, 0, std::move(message)};
    }
    static Failure protocol(int code, std::string message)
    {
        return {FailureKind::Protocol, code, std::move(message)};
    }
    static Failure timeout(std::string message)
    {
        return {FailureKind::Timeout, 0, std::move(message)};
    }
    static Failure discovery(std::string message)
    {
        return {FailureKind::Discovery, 0, std::move(message)};
    }
    static Failure not_found(std::string message)
    {
        return {FailureKind::NotFound, 0, std::move(message)};
    }

    std::string describe() const
    {
        std::string out = to_string(kind) + ": " + message;
        if (kind == FailureKind::Protocol)
            out += " (code " + std::to_string(code) + ")";
        return out;
    }
};

inline void to_json(Json& j, const Failure& f)
{
    j = Json{{"kind", to_string(f.kind)}, {"message", f.message}};
    if (f.kind == FailureKind::Protocol)
        j["code"] = f.code;
}

template<typename T>
class Result
{
  public:
    Result(T value) : storage_(std::move(value)) {}
    Result(Failure failure) : storage_(std::move(failure)) {}

    bool ok() const
    {
        return std::holds_alternative<T>(storage_);
    }
    explicit operator bool() const
    {
        return ok();
    }

    T& value()
    {
        return std::get<T>(storage_);
    }
    const T& value() const
    {
        return std::get<T>(storage_);
    }

    const Failure& failure() const
    {
        return std::get<Failure>(storage_);
    }

    T value_or(T fallback) const
    {
        return ok() ? value() : std::move(fallback);
    }

  private:
    std::variant<T, Failure> storage_;
};

} // namespace mcpcompose
