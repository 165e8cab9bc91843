#pragma once
/// @file process/process_manager.hpp
/// @brief Owner of all supervised stdio servers, with a crash monitor.

#include "mcpcompose/process/supervised_process.hpp"

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mcpcompose::process
{

/// Owns SupervisedProcess instances keyed by name.
///
/// A monitor thread polls running children; an unexpected exit moves the
/// process to Crashed and, when its restart policy allows, immediately starts
/// it again. Every state transition of every process is forwarded to the
/// subscribers registered with on_event().
class ProcessManager
{
  public:
    using EventHandler = SupervisedProcess::EventHandler;

    explicit ProcessManager(
        std::chrono::milliseconds monitor_interval = std::chrono::milliseconds(200));
    ~ProcessManager();

    ProcessManager(const ProcessManager&) = delete;
    ProcessManager& operator=(const ProcessManager&) = delete;

    /// Register a process under a unique name
    /// @throws ValidationError if the name is taken
    /// @throws ProcessError if auto_start is set and the spawn fails (the
    ///         process stays registered in the Crashed state)
    SupervisedProcess& add(const std::string& name, StdioServer spec, bool auto_start = true);

    /// @throws NotFoundError for unknown names
    SupervisedProcess& get(const std::string& name);
    bool contains(const std::string& name) const;

    void start(const std::string& name);
    bool stop(const std::string& name, std::chrono::milliseconds timeout);
    void restart(const std::string& name, std::chrono::milliseconds timeout);

    /// Stop (if needed) and destroy the process
    void remove(const std::string& name, std::chrono::milliseconds timeout);

    ProcessInfo info(const std::string& name) const;
    std::vector<ProcessInfo> list_all() const;
    std::vector<std::string> names() const;

    /// Stop every process concurrently; returns once all stops finished
    void stop_all(std::chrono::milliseconds timeout);

    void on_event(EventHandler handler);

  private:
    std::shared_ptr<SupervisedProcess> find(const std::string& name) const;
    std::vector<std::shared_ptr<SupervisedProcess>> snapshot() const;
    void publish(const ProcessEvent& event);
    void monitor_loop();

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<SupervisedProcess>> processes_;
    std::vector<std::string> order_;

    std::mutex subscribers_mutex_;
    std::vector<EventHandler> subscribers_;

    std::chrono::milliseconds monitor_interval_;
    std::mutex monitor_mutex_;
    std::condition_variable monitor_cv_;
    bool monitor_stop_{false};
    std::thread monitor_;
};

} // namespace mcpcompose::process
