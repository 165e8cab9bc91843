#pragma once
#include "mcpcompose/compose/conflict.hpp"
#include "mcpcompose/descriptors.hpp"
#include "mcpcompose/types.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace mcpcompose
{

struct Settings
{
    std::string log_level{"INFO"};

    static Settings from_env();
    static Settings from_json(const Json& j);

    /// Push log_level into the process-wide logger
    void apply() const;
};

/// Composer options, usually parsed from the JSON config file
struct ComposerConfig
{
    std::string name{"composed-mcp-server"};
    compose::ConflictStrategy conflict_resolution{compose::ConflictStrategy::Prefix};
    std::chrono::milliseconds discovery_timeout{30000};
    std::chrono::milliseconds call_timeout{60000};
    std::chrono::milliseconds shutdown_timeout{5000};
    std::vector<std::string> include; ///< empty = all servers
    std::vector<std::string> exclude;
    std::vector<ServerConfig> servers;

    static ComposerConfig from_json(const Json& j);
};

/// Parse one entry of the `servers` array
ServerConfig server_config_from_json(const Json& j);

} // namespace mcpcompose
