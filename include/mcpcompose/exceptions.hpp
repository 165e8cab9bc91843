#pragma once
#include "mcpcompose/types.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace mcpcompose
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct NotFoundError : public Error
{
    using Error::Error;
};

struct ValidationError : public Error
{
    using Error::Error;
};

struct TransportError : public Error
{
    using Error::Error;
};

/// Spawn, pipe and wait failures of a subprocess
struct ProcessError : public Error
{
    using Error::Error;
};

/// Composition could not proceed (bad descriptor, unknown server, ...)
struct CompositionError : public Error
{
    CompositionError(const std::string& message, std::string server = {})
        : Error(message), server_name(std::move(server))
    {
    }

    std::string server_name;
};

/// Raised under the `error` conflict strategy when two servers export the
/// same name in one category.
struct ConflictError : public CompositionError
{
    ConflictError(ComponentKind kind, std::string name, std::string existing_server,
                  std::string new_server)
        : CompositionError(to_string(kind) + " name conflict: '" + name + "' from " + new_server +
                               " conflicts with existing " + to_string(kind) + " from " +
                               existing_server,
                           new_server),
          kind(kind), component_name(std::move(name)),
          conflicting_servers{std::move(existing_server), new_server}
    {
    }

    ComponentKind kind;
    std::string component_name;
    std::vector<std::string> conflicting_servers;
};

} // namespace mcpcompose
