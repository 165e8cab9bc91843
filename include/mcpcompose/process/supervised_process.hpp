#pragma once
/// @file process/supervised_process.hpp
/// @brief One supervised downstream server subprocess.

#include "mcpcompose/descriptors.hpp"
#include "mcpcompose/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mcpcompose::process
{

class Process;

/// Starting -> Running -> Stopping -> Stopped, plus Crashed from Running
/// (unexpected exit) or Stopping (termination failed).
enum class ProcessState
{
    Starting,
    Running,
    Stopping,
    Stopped,
    Crashed
};

std::string to_string(ProcessState state);

/// Value snapshot of a supervised process
struct ProcessInfo
{
    std::string name;
    std::string command;
    std::vector<std::string> args;
    ProcessState state{ProcessState::Stopped};
    std::optional<int> pid;
    std::optional<std::chrono::system_clock::time_point> started_at;
    int restart_count{0};
    RestartPolicy restart_policy{RestartPolicy::Never};
    std::string last_exit_reason;
    std::optional<int> last_exit_code;
    std::vector<std::string> stderr_tail;
};

void to_json(Json& j, const ProcessInfo& info);

struct ProcessEvent
{
    std::string name;
    ProcessState from{ProcessState::Stopped};
    ProcessState to{ProcessState::Stopped};
    std::optional<int> pid;
    std::string reason;
};

class SupervisedProcess
{
  public:
    using LineHandler = std::function<void(const std::string&)>;
    using CloseHandler = std::function<void()>;
    using EventHandler = std::function<void(const ProcessEvent&)>;

    /// Number of stderr lines kept for diagnostics
    static constexpr size_t kStderrTailLines = 50;

    SupervisedProcess(std::string name, StdioServer spec);
    ~SupervisedProcess();

    SupervisedProcess(const SupervisedProcess&) = delete;
    SupervisedProcess& operator=(const SupervisedProcess&) = delete;

    const std::string& name() const
    {
        return name_;
    }
    const StdioServer& spec() const
    {
        return spec_;
    }

    /// Distinguishes this object from an earlier process registered under
    /// the same name
    std::uint64_t instance_id() const
    {
        return instance_id_;
    }

    ProcessState state() const;
    ProcessInfo info() const;
    bool is_running() const;

    /// Receivers for stdout lines and stdout end-of-stream. Called from the
    /// reader thread; they persist across restarts.
    void set_output_handlers(LineHandler on_line, CloseHandler on_close);

    /// Receiver for state transitions. Called without the state lock held,
    /// but from inside start()/stop(): it must not start or stop this process.
    void set_event_handler(EventHandler handler);

    /// Spawn the subprocess. No-op if already Starting/Running.
    /// @throws ProcessError if the spawn fails (state becomes Crashed)
    void start();

    /// SIGTERM, wait up to `timeout`, then SIGKILL; pipes are always closed,
    /// also for a Crashed process. Concurrent calls are serialized.
    /// @return true if this call performed the teardown, false if the process
    ///         was already stopped or crashed.
    bool stop(std::chrono::milliseconds timeout);

    /// Write one newline-terminated message to the child's stdin
    /// @throws ProcessError if the process is not running or the pipe broke
    void write_line(const std::string& line);

    /// Reap the child if it exited while Running; moves it to Crashed.
    /// @return true if an unexpected exit was observed by this call
    bool check_exit();

    /// Whether a Crashed process qualifies for auto-restart under its policy
    bool should_restart() const;

    /// Crashed -> Starting with restart_count + 1
    void restart_after_crash();

    /// Restart on explicit request: stop then start, restart_count + 1
    void restart(std::chrono::milliseconds timeout);

  private:
    struct Transition
    {
        bool changed{false};
        ProcessEvent event;
    };

    Transition transition_locked(ProcessState to, std::string reason);
    void emit(const Transition& t);
    void launch_readers();
    void join_readers();
    void close_pipes();
    void read_stdout_loop();
    void read_stderr_loop();
    std::string describe_exit(int code, int sig) const;

    const std::string name_;
    const StdioServer spec_;
    const std::uint64_t instance_id_;

    /// Serializes start() and stop()
    std::mutex lifecycle_mutex_;

    mutable std::mutex state_mutex_;
    ProcessState state_{ProcessState::Stopped};
    std::optional<std::chrono::system_clock::time_point> started_at_;
    int restart_count_{0};
    std::string last_exit_reason_;
    std::optional<int> last_exit_code_;
    std::deque<std::string> stderr_tail_;
    EventHandler event_handler_;

    std::mutex proc_mutex_;
    std::unique_ptr<Process> process_;
    int pid_{0};

    std::mutex stdin_mutex_;

    std::mutex handler_mutex_;
    LineHandler on_line_;
    CloseHandler on_close_;

    std::atomic<bool> readers_stop_{false};
    std::thread stdout_reader_;
    std::thread stderr_reader_;
};

} // namespace mcpcompose::process
