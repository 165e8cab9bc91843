#pragma once
/// @file compose/composer.hpp
/// @brief Composition of many downstream servers into one namespace.
/// @details A Composer discovers each configured server over its transport,
///          merges the advertised tools, prompts and resources into a
///          NamespaceRegistry under the configured conflict strategy, and
///          forwards calls on resolved names back to the source server.
///          It registers itself with the ShutdownCoordinator on construction
///          so termination signals tear it down even before start().

#include "mcpcompose/compose/conflict.hpp"
#include "mcpcompose/compose/namespace_registry.hpp"
#include "mcpcompose/compose/shutdown_coordinator.hpp"
#include "mcpcompose/process/process_manager.hpp"
#include "mcpcompose/proxy/tool_proxy.hpp"
#include "mcpcompose/result.hpp"
#include "mcpcompose/settings.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpcompose::transport
{
class StreamTransport;
class SseTransport;
} // namespace mcpcompose::transport

namespace mcpcompose::compose
{

enum class ComposerState
{
    Active,
    ShuttingDown,
    Inactive
};

std::string to_string(ComposerState state);

enum class CompositionStatus
{
    Composed,
    /// Components registered, but the transient discovery session could not
    /// be closed cleanly
    ComposedCleanupFailed,
    Failed
};

std::string to_string(CompositionStatus status);

struct ServerStatus
{
    std::string name;
    std::string transport;
    CompositionStatus status{CompositionStatus::Failed};
    std::string error;
    int tools{0};
    int prompts{0};
    int resources{0};

    bool composed() const
    {
        return status != CompositionStatus::Failed;
    }
};

void to_json(Json& j, const ServerStatus& status);

struct CompositionReport
{
    std::vector<ServerStatus> servers;
    std::vector<std::string> skipped; ///< disabled or filtered out
    std::vector<ConflictRecord> conflicts;

    /// True if every attempted server composed
    bool ok() const;
    /// server name -> error text of every failed server
    std::map<std::string, std::string> errors() const;
};

void to_json(Json& j, const CompositionReport& report);

struct CompositionSnapshot
{
    std::vector<ComposedComponent> tools;
    std::vector<ComposedComponent> prompts;
    std::vector<ComposedComponent> resources;
    std::vector<ConflictRecord> conflicts;
    std::vector<ServerStatus> servers;
};

class Composer : public ShutdownParticipant
{
  public:
    explicit Composer(ComposerConfig config,
                      ShutdownCoordinator& coordinator = ShutdownCoordinator::instance());
    ~Composer() override;

    Composer(const Composer&) = delete;
    Composer& operator=(const Composer&) = delete;

    const std::string& name() const
    {
        return config_.name;
    }
    const ComposerConfig& config() const
    {
        return config_;
    }
    ComposerState state() const
    {
        return state_.load();
    }

    /// Compose the configured servers. Later calls are no-ops returning the
    /// first report.
    /// @throws ConflictError under the `error` strategy
    CompositionReport start();

    /// Tear down every process and transport. Idempotent and safe to race
    /// with signal-driven shutdown.
    void stop() override;
    std::string participant_name() const override;

    /// Block until stop() has completed
    /// @return false if `timeout` elapsed first
    bool wait_until_stopped(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Discover one server and merge its components.
    /// A discovery failure is reported in the returned status; a conflict
    /// under the `error` strategy throws and leaves the namespace unchanged.
    /// @throws ConflictError, CompositionError if the composer is stopping
    ServerStatus compose_server(const ServerConfig& server);

    /// Compose servers in order, skipping disabled and filtered ones
    /// @throws ConflictError (aborts the rest of the batch)
    CompositionReport compose_all(const std::vector<ServerConfig>& servers);

    CompositionSnapshot get_composition() const;
    Json summary_json() const;

    /// Whether `server_name` passes the include/exclude filters
    bool is_selected(const std::string& server_name) const;

    Result<Json> call_tool(const std::string& name, const Json& arguments,
                           std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    Result<Json> get_prompt(const std::string& name, const Json& arguments,
                            std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    Result<Json> read_resource(const std::string& name,
                               std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Administrative surface

    std::vector<ServerStatus> list_servers() const;
    std::optional<process::ProcessInfo> get_process_info(const std::string& server_name) const;
    std::vector<process::ProcessInfo> list_processes() const;

    /// @throws NotFoundError for unknown servers, TransportError when a
    ///         remote server cannot be reached
    void start_server(const std::string& server_name);
    void stop_server(const std::string& server_name);
    void restart_server(const std::string& server_name);

    const NamespaceRegistry& registry() const
    {
        return registry_;
    }
    process::ProcessManager& process_manager()
    {
        return manager_;
    }

  private:
    struct ServerEntry
    {
        ServerConfig config;
        ServerStatus status;
        std::shared_ptr<transport::StreamTransport> stream;
        std::shared_ptr<transport::SseTransport> sse;
    };

    struct Discovered
    {
        std::optional<rpc::DiscoveryResult> result;
        Invoker::Target target;
        std::optional<std::string> cleanup_error;
        std::shared_ptr<transport::StreamTransport> stream;
        std::shared_ptr<transport::SseTransport> sse;
        std::string error;
    };

    struct PlannedEntry
    {
        Resolution resolution;
        ComposedComponent component;
    };

    Discovered discover_stdio(const std::string& name, const StdioServer& spec);
    Discovered discover_stream(const std::string& name, const HttpStreamServer& spec);
    Discovered discover_sse(const std::string& name, const SseServer& spec);

    std::vector<PlannedEntry> plan(const std::string& server, const rpc::DiscoveryResult& found,
                                   const Invoker::Target& target) const;
    void release_server(const std::string& name, Discovered& discovered);

    Result<Json> invoke(ComponentKind kind, const std::string& name, const Json& arguments,
                        std::optional<std::chrono::milliseconds> timeout);
    ServerEntry& entry_locked(const std::string& server_name);
    const ServerEntry& entry_locked(const std::string& server_name) const;

    ShutdownCoordinator& coordinator_;
    const ComposerConfig config_;
    const ConflictResolver resolver_;

    std::atomic<ComposerState> state_{ComposerState::Active};
    std::mutex stopped_mutex_;
    std::condition_variable stopped_cv_;

    process::ProcessManager manager_;
    proxy::ToolProxy proxy_;
    NamespaceRegistry registry_;

    mutable std::mutex compose_mutex_;
    std::map<std::string, ServerEntry> servers_;
    std::vector<std::string> server_order_;
    std::vector<ConflictRecord> conflicts_;

    std::mutex start_mutex_;
    std::optional<CompositionReport> start_report_;
};

} // namespace mcpcompose::compose
