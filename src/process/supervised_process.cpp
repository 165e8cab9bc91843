#include "mcpcompose/process/supervised_process.hpp"

#include "../internal/process.hpp"
#include "mcpcompose/exceptions.hpp"
#include "mcpcompose/util/log.hpp"

#include <atomic>
#include <csignal>
#include <cstring>

namespace mcpcompose::process
{

namespace
{
constexpr const char* kLogger = "process";
constexpr int kReaderPollMs = 100;

std::atomic<std::uint64_t> g_next_instance_id{1};
} // namespace

std::string to_string(ProcessState state)
{
    switch (state)
    {
    case ProcessState::Starting:
        return "starting";
    case ProcessState::Running:
        return "running";
    case ProcessState::Stopping:
        return "stopping";
    case ProcessState::Stopped:
        return "stopped";
    case ProcessState::Crashed:
        return "crashed";
    }
    return "stopped";
}

void to_json(Json& j, const ProcessInfo& info)
{
    j = Json{{"name", info.name},
             {"command", info.command},
             {"args", info.args},
             {"state", to_string(info.state)},
             {"restart_count", info.restart_count},
             {"restart_policy", to_string(info.restart_policy)},
             {"last_exit_reason", info.last_exit_reason},
             {"stderr_tail", info.stderr_tail}};
    j["pid"] = info.pid ? Json(*info.pid) : Json(nullptr);
    j["last_exit_code"] = info.last_exit_code ? Json(*info.last_exit_code) : Json(nullptr);
    if (info.started_at)
    {
        auto since = info.started_at->time_since_epoch();
        j["started_at"] = std::chrono::duration_cast<std::chrono::milliseconds>(since).count();
        if (info.state == ProcessState::Running)
        {
            auto up = std::chrono::system_clock::now() - *info.started_at;
            j["uptime_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(up).count();
        }
    }
    else
    {
        j["started_at"] = nullptr;
    }
}

SupervisedProcess::SupervisedProcess(std::string name, StdioServer spec)
    : name_(std::move(name)), spec_(std::move(spec)), instance_id_(g_next_instance_id.fetch_add(1))
{
}

SupervisedProcess::~SupervisedProcess()
{
    try
    {
        stop(std::chrono::milliseconds(2000));
    }
    catch (const Error& e)
    {
        log::warning(kLogger, "Error stopping " + name_ + " during destruction: " + e.what());
    }
    join_readers();
}

ProcessState SupervisedProcess::state() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool SupervisedProcess::is_running() const
{
    return state() == ProcessState::Running;
}

ProcessInfo SupervisedProcess::info() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    ProcessInfo out;
    out.name = name_;
    out.command = spec_.command;
    out.args = spec_.args;
    out.state = state_;
    if (pid_ > 0 && (state_ == ProcessState::Running || state_ == ProcessState::Stopping ||
                     state_ == ProcessState::Starting))
        out.pid = pid_;
    out.started_at = started_at_;
    out.restart_count = restart_count_;
    out.restart_policy = spec_.restart_policy;
    out.last_exit_reason = last_exit_reason_;
    out.last_exit_code = last_exit_code_;
    out.stderr_tail.assign(stderr_tail_.begin(), stderr_tail_.end());
    return out;
}

void SupervisedProcess::set_output_handlers(LineHandler on_line, CloseHandler on_close)
{
    std::lock_guard<std::mutex> lock(handler_mutex_);
    on_line_ = std::move(on_line);
    on_close_ = std::move(on_close);
}

void SupervisedProcess::set_event_handler(EventHandler handler)
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    event_handler_ = std::move(handler);
}

SupervisedProcess::Transition SupervisedProcess::transition_locked(ProcessState to,
                                                                   std::string reason)
{
    Transition t;
    if (state_ == to)
        return t;
    t.changed = true;
    t.event.name = name_;
    t.event.from = state_;
    t.event.to = to;
    if (pid_ > 0)
        t.event.pid = pid_;
    t.event.reason = std::move(reason);
    state_ = to;
    return t;
}

void SupervisedProcess::emit(const Transition& t)
{
    if (!t.changed)
        return;
    log::debug(kLogger, name_ + ": " + to_string(t.event.from) + " -> " + to_string(t.event.to) +
                            (t.event.reason.empty() ? "" : " (" + t.event.reason + ")"));
    EventHandler handler;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        handler = event_handler_;
    }
    if (handler)
        handler(t.event);
}

std::string SupervisedProcess::describe_exit(int code, int sig) const
{
    if (sig != 0)
        return "terminated by signal " + std::to_string(sig) + " (" + strsignal(sig) + ")";
    return "exited with code " + std::to_string(code);
}

void SupervisedProcess::start()
{
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    Transition starting;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == ProcessState::Starting || state_ == ProcessState::Running)
            return;
        if (state_ == ProcessState::Stopping)
            throw ProcessError("Process " + name_ + " is stopping");
        starting = transition_locked(ProcessState::Starting, "start requested");
    }
    emit(starting);

    // Leftovers from a previous incarnation
    join_readers();
    close_pipes();

    SpawnOptions options;
    options.env = spec_.env;
    options.working_directory = spec_.working_directory;

    int pid = 0;
    try
    {
        std::lock_guard<std::mutex> lock(proc_mutex_);
        process_ = std::make_unique<Process>();
        process_->spawn(spec_.command, spec_.args, options);
        pid = process_->pid();
    }
    catch (const ProcessError& e)
    {
        Transition crashed;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            last_exit_reason_ = std::string("spawn failed: ") + e.what();
            crashed = transition_locked(ProcessState::Crashed, last_exit_reason_);
        }
        emit(crashed);
        log::error(kLogger, "Failed to start " + name_ + ": " + e.what());
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        stderr_tail_.clear();
    }
    launch_readers();

    Transition running;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pid_ = pid;
        started_at_ = std::chrono::system_clock::now();
        last_exit_code_.reset();
        running = transition_locked(ProcessState::Running, "spawned");
        running.event.pid = pid;
    }
    emit(running);
    log::info(kLogger, "Started " + name_ + " (PID " + std::to_string(pid) + ")");
}

bool SupervisedProcess::stop(std::chrono::milliseconds timeout)
{
    // A concurrent stop() waits here and then finds the process Stopped
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    Transition stopping;
    bool crashed = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        crashed = state_ == ProcessState::Crashed;
        if (state_ == ProcessState::Running)
            stopping = transition_locked(ProcessState::Stopping, "stop requested");
    }
    if (crashed)
    {
        // Already exited; only the readers and pipes are left to release
        join_readers();
        close_pipes();
        return false;
    }
    if (!stopping.changed)
        return false;
    emit(stopping);

    std::optional<int> exit_code;
    int term_signal = 0;
    bool forced = false;
    std::string failure;

    {
        std::lock_guard<std::mutex> lock(proc_mutex_);
        if (process_)
            process_->terminate();
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    try
    {
        while (true)
        {
            {
                std::lock_guard<std::mutex> lock(proc_mutex_);
                if (!process_)
                    break;
                exit_code = process_->try_wait();
                if (exit_code)
                {
                    term_signal = process_->term_signal();
                    break;
                }
            }
            if (std::chrono::steady_clock::now() >= deadline)
                break;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        if (!exit_code)
        {
            std::lock_guard<std::mutex> lock(proc_mutex_);
            if (process_)
            {
                log::warning(kLogger, "Process " + name_ + " (PID " + std::to_string(pid_) +
                                          ") did not terminate gracefully, sending SIGKILL");
                forced = true;
                process_->kill();
                exit_code = process_->wait();
                term_signal = process_->term_signal();
            }
        }
    }
    catch (const ProcessError& e)
    {
        failure = e.what();
    }

    // Unblock readers even if a grandchild still holds the pipes open
    readers_stop_.store(true);
    join_readers();
    close_pipes();

    Transition done;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!failure.empty())
        {
            last_exit_reason_ = "termination failed: " + failure;
            done = transition_locked(ProcessState::Crashed, last_exit_reason_);
        }
        else
        {
            if (exit_code)
                last_exit_code_ = *exit_code;
            last_exit_reason_ = exit_code ? describe_exit(*exit_code, term_signal) : "stopped";
            if (forced)
                last_exit_reason_ += " after SIGKILL";
            done = transition_locked(ProcessState::Stopped, last_exit_reason_);
        }
    }
    emit(done);
    if (failure.empty())
        log::info(kLogger, "Stopped " + name_ + (forced ? " (killed)" : ""));
    else
        log::error(kLogger, "Failed to stop " + name_ + ": " + failure);
    return true;
}

void SupervisedProcess::write_line(const std::string& line)
{
    if (state() != ProcessState::Running)
        throw ProcessError("Process " + name_ + " is not running");

    std::lock_guard<std::mutex> lock(stdin_mutex_);
    Process* proc = nullptr;
    {
        std::lock_guard<std::mutex> plock(proc_mutex_);
        proc = process_.get();
    }
    if (!proc)
        throw ProcessError("Process " + name_ + " is not running");
    proc->stdin_pipe().write_all(line + "\n");
}

bool SupervisedProcess::check_exit()
{
    if (state() != ProcessState::Running)
        return false;

    std::optional<int> code;
    int sig = 0;
    {
        std::lock_guard<std::mutex> lock(proc_mutex_);
        if (!process_)
            return false;
        code = process_->try_wait();
        if (code)
            sig = process_->term_signal();
    }
    if (!code)
        return false;

    Transition crashed;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        // stop() may have claimed the exit in the meantime
        if (state_ != ProcessState::Running)
            return false;
        last_exit_code_ = *code;
        last_exit_reason_ = "unexpected exit: " + describe_exit(*code, sig);
        crashed = transition_locked(ProcessState::Crashed, last_exit_reason_);
    }
    emit(crashed);
    log::warning(kLogger, "Process " + name_ + " " + describe_exit(*code, sig));
    return true;
}

bool SupervisedProcess::should_restart() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != ProcessState::Crashed)
        return false;
    if (restart_count_ >= spec_.max_restarts)
        return false;
    switch (spec_.restart_policy)
    {
    case RestartPolicy::Never:
        return false;
    case RestartPolicy::Always:
        return true;
    case RestartPolicy::OnFailure:
        return last_exit_code_.value_or(1) != 0;
    }
    return false;
}

void SupervisedProcess::restart_after_crash()
{
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != ProcessState::Crashed)
            return;
        ++restart_count_;
    }
    log::info(kLogger, "Auto-restarting " + name_ + " (attempt " +
                           std::to_string(info().restart_count) + ")");
    start();
}

void SupervisedProcess::restart(std::chrono::milliseconds timeout)
{
    stop(timeout);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ++restart_count_;
    }
    start();
}

void SupervisedProcess::launch_readers()
{
    readers_stop_.store(false);
    stdout_reader_ = std::thread([this]() { read_stdout_loop(); });
    stderr_reader_ = std::thread([this]() { read_stderr_loop(); });
}

void SupervisedProcess::join_readers()
{
    readers_stop_.store(true);
    if (stdout_reader_.joinable() && stdout_reader_.get_id() != std::this_thread::get_id())
        stdout_reader_.join();
    if (stderr_reader_.joinable() && stderr_reader_.get_id() != std::this_thread::get_id())
        stderr_reader_.join();
}

void SupervisedProcess::close_pipes()
{
    std::lock_guard<std::mutex> stdin_lock(stdin_mutex_);
    std::lock_guard<std::mutex> lock(proc_mutex_);
    if (!process_)
        return;

    auto close_one = [this](const char* pipe_name, auto&& closer)
    {
        try
        {
            closer();
        }
        catch (const ProcessError& e)
        {
            // Expected when the pipe was never opened or is already closed
            log::debug(kLogger, std::string("Pipe ") + pipe_name + " for " + name_ + ": " +
                                    e.what());
        }
    };
    close_one("stdin", [this]() { process_->stdin_pipe().close(); });
    close_one("stdout", [this]() { process_->stdout_pipe().close(); });
    close_one("stderr", [this]() { process_->stderr_pipe().close(); });
}

void SupervisedProcess::read_stdout_loop()
{
    Pipe& pipe = process_->stdout_pipe();
    std::string buffer;
    char chunk[4096];

    auto deliver = [this](std::string line)
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            return;
        LineHandler handler;
        {
            std::lock_guard<std::mutex> lock(handler_mutex_);
            handler = on_line_;
        }
        if (!handler)
        {
            log::debug(kLogger, name_ + " stdout (unhandled): " + line);
            return;
        }
        try
        {
            handler(line);
        }
        catch (const std::exception& e)
        {
            // A malformed message must not take the reader thread down
            log::warning(kLogger, name_ + ": dropping stdout line after handler error: " +
                                      e.what());
        }
    };

    while (!readers_stop_.load())
    {
        size_t n = 0;
        try
        {
            if (!pipe.readable(kReaderPollMs))
                continue;
            n = pipe.read(chunk, sizeof(chunk));
        }
        catch (const ProcessError& e)
        {
            log::debug(kLogger, name_ + " stdout reader stopped: " + e.what());
            break;
        }
        if (n == 0)
            break; // EOF

        buffer.append(chunk, n);
        size_t pos;
        while ((pos = buffer.find('\n')) != std::string::npos)
        {
            std::string line = buffer.substr(0, pos);
            buffer.erase(0, pos + 1);
            deliver(std::move(line));
        }
    }
    if (!buffer.empty())
        deliver(std::move(buffer));

    CloseHandler on_close;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        on_close = on_close_;
    }
    if (on_close)
        on_close();
}

void SupervisedProcess::read_stderr_loop()
{
    Pipe& pipe = process_->stderr_pipe();
    std::string buffer;
    char chunk[4096];

    while (!readers_stop_.load())
    {
        size_t n = 0;
        try
        {
            if (!pipe.readable(kReaderPollMs))
                continue;
            n = pipe.read(chunk, sizeof(chunk));
        }
        catch (const ProcessError&)
        {
            break;
        }
        if (n == 0)
            break;

        buffer.append(chunk, n);
        size_t pos;
        while ((pos = buffer.find('\n')) != std::string::npos)
        {
            std::string line = buffer.substr(0, pos);
            buffer.erase(0, pos + 1);
            log::debug(kLogger, name_ + " stderr: " + line);
            std::lock_guard<std::mutex> lock(state_mutex_);
            stderr_tail_.push_back(std::move(line));
            if (stderr_tail_.size() > kStderrTailLines)
                stderr_tail_.pop_front();
        }
    }
}

} // namespace mcpcompose::process
