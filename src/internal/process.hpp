// POSIX child process with piped stdio, as needed by SupervisedProcess

#pragma once

#include "mcpcompose/exceptions.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpcompose::process
{

/// One end of a pipe(2). The descriptor is closed on destruction.
class Pipe
{
  public:
    Pipe() = default;
    ~Pipe();

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    /// Bytes read, 0 on EOF
    /// @throws ProcessError if the pipe is closed or read(2) fails
    size_t read(char* buffer, size_t size);

    /// Wait up to timeout_ms for data or EOF
    bool readable(int timeout_ms);

    /// Write all of `data`, retrying short writes
    /// @throws ProcessError on EPIPE and other write errors
    void write_all(const std::string& data);

    /// @throws ProcessError if already closed or close(2) fails
    void close();

    /// Take ownership of `fd`, closing the previous descriptor
    void reset(int fd);

    bool is_open() const
    {
        return fd_ >= 0;
    }

  private:
    int fd_{-1};
};

struct SpawnOptions
{
    std::string working_directory;
    std::map<std::string, std::string> env; ///< overlay on the inherited environment
};

/// A child running in its own process group, so SIGTERM and SIGKILL also
/// reach anything it forks.
class Process
{
  public:
    Process() = default;
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    /// fork + execve; exec failures are reported back through a CLOEXEC pipe
    /// @throws ProcessError if the child could not be started
    void spawn(const std::string& command, const std::vector<std::string>& args,
               const SpawnOptions& options);

    Pipe& stdin_pipe()
    {
        return stdin_;
    }
    Pipe& stdout_pipe()
    {
        return stdout_;
    }
    Pipe& stderr_pipe()
    {
        return stderr_;
    }

    /// Exit code if the child has been reaped, without blocking.
    /// A child killed by signal N reports 128 + N.
    std::optional<int> try_wait();

    /// Block until the child is reaped
    int wait();

    void terminate();
    void kill();

    int pid() const
    {
        return pid_;
    }

    /// Signal that ended the child, 0 for a normal exit
    int term_signal() const
    {
        return term_signal_;
    }

  private:
    void signal_group(int sig);
    void record(int status);

    int pid_{0};
    bool reaped_{true};
    int exit_code_{-1};
    int term_signal_{0};
    Pipe stdin_;
    Pipe stdout_;
    Pipe stderr_;
};

} // namespace mcpcompose::process
