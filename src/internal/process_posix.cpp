#include "process.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <sys/select.h>
#include <sys/wait.h>
#include <unistd.h>

extern "C" char** environ;

namespace mcpcompose::process
{

namespace
{

std::string errno_text()
{
    return std::strerror(errno);
}

/// Both ends of a fresh CLOEXEC pipe; whatever is not taken is closed
struct PipePair
{
    int read_end{-1};
    int write_end{-1};

    PipePair()
    {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0)
            throw ProcessError("Failed to create pipe: " + errno_text());
        read_end = fds[0];
        write_end = fds[1];
    }

    ~PipePair()
    {
        drop(read_end);
        drop(write_end);
    }

    static void drop(int& fd)
    {
        if (fd >= 0)
            ::close(fd);
        fd = -1;
    }

    static int take(int& fd)
    {
        int out = fd;
        fd = -1;
        return out;
    }
};

[[noreturn]] void report_and_exit(int report_fd)
{
    int err = errno;
    (void)::write(report_fd, &err, sizeof(err));
    _exit(127);
}

// Writes to a pipe whose reader died must fail with EPIPE instead of killing
// the composer
void ignore_sigpipe()
{
    static std::once_flag once;
    std::call_once(once, []() { std::signal(SIGPIPE, SIG_IGN); });
}

std::vector<std::string> merged_environment(const std::map<std::string, std::string>& overlay)
{
    std::map<std::string, std::string> merged;
    for (char** e = environ; e && *e; ++e)
    {
        const char* eq = std::strchr(*e, '=');
        if (eq)
            merged[std::string(*e, static_cast<std::size_t>(eq - *e))] = eq + 1;
    }
    for (const auto& [key, value] : overlay)
        merged[key] = value;

    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [key, value] : merged)
        out.push_back(key + "=" + value);
    return out;
}

/// execve does not search PATH; bare command names are resolved here
std::string resolve_command(const std::string& command)
{
    if (command.find('/') != std::string::npos)
        return command;
    const char* path = std::getenv("PATH");
    std::string dirs = path ? path : "/usr/local/bin:/usr/bin:/bin";
    size_t start = 0;
    while (start <= dirs.size())
    {
        size_t end = dirs.find(':', start);
        std::string dir = dirs.substr(start, end == std::string::npos ? end : end - start);
        if (!dir.empty())
        {
            std::string candidate = dir + "/" + command;
            if (::access(candidate.c_str(), X_OK) == 0)
                return candidate;
        }
        if (end == std::string::npos)
            break;
        start = end + 1;
    }
    return command;
}

} // namespace

Pipe::~Pipe()
{
    if (fd_ >= 0)
        ::close(fd_);
}

void Pipe::reset(int fd)
{
    if (fd_ >= 0)
        ::close(fd_);
    fd_ = fd;
}

size_t Pipe::read(char* buffer, size_t size)
{
    if (fd_ < 0)
        throw ProcessError("Pipe is not open");
    ssize_t n;
    do
    {
        n = ::read(fd_, buffer, size);
    } while (n < 0 && errno == EINTR);
    if (n < 0)
        throw ProcessError("Read failed: " + errno_text());
    return static_cast<size_t>(n);
}

bool Pipe::readable(int timeout_ms)
{
    if (fd_ < 0)
        return false;
    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(fd_, &fds);
    timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    int rc = ::select(fd_ + 1, &fds, nullptr, nullptr, &tv);
    if (rc < 0)
    {
        if (errno == EINTR)
            return false;
        throw ProcessError("select failed: " + errno_text());
    }
    return rc > 0;
}

void Pipe::write_all(const std::string& data)
{
    if (fd_ < 0)
        throw ProcessError("Pipe is not open");
    size_t done = 0;
    while (done < data.size())
    {
        ssize_t n = ::write(fd_, data.data() + done, data.size() - done);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw ProcessError("Broken pipe (process closed stdin)");
            throw ProcessError("Write failed: " + errno_text());
        }
        done += static_cast<size_t>(n);
    }
}

void Pipe::close()
{
    if (fd_ < 0)
        throw ProcessError("Pipe already closed");
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0)
        throw ProcessError("close failed: " + errno_text());
}

Process::~Process()
{
    if (reaped_)
        return;
    signal_group(SIGKILL);
    try
    {
        wait();
    }
    catch (const ProcessError&)
    {
        // reaped elsewhere
    }
}

void Process::spawn(const std::string& command, const std::vector<std::string>& args,
                    const SpawnOptions& options)
{
    if (!reaped_)
        throw ProcessError("Process already running (pid " + std::to_string(pid_) + ")");
    ignore_sigpipe();

    PipePair in, out, err, report;

    // Everything the child touches is prepared before fork
    const std::string path = resolve_command(command);
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(command.c_str()));
    for (const auto& a : args)
        argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    std::vector<std::string> env = merged_environment(options.env);
    std::vector<char*> envp;
    for (auto& entry : env)
        envp.push_back(entry.data());
    envp.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0)
        throw ProcessError("Failed to fork process: " + errno_text());

    if (pid == 0)
    {
        ::setpgid(0, 0);
        if (::dup2(in.read_end, STDIN_FILENO) < 0 || ::dup2(out.write_end, STDOUT_FILENO) < 0 ||
            ::dup2(err.write_end, STDERR_FILENO) < 0)
            report_and_exit(report.write_end);
        if (!options.working_directory.empty() && ::chdir(options.working_directory.c_str()) != 0)
            report_and_exit(report.write_end);
        std::signal(SIGPIPE, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        std::signal(SIGINT, SIG_DFL);
        ::execve(path.c_str(), argv.data(), envp.data());
        report_and_exit(report.write_end);
    }

    ::setpgid(pid, pid); // races the child's own call; either one wins
    PipePair::drop(report.write_end);
    int child_errno = 0;
    ssize_t n;
    do
    {
        n = ::read(report.read_end, &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    if (n > 0)
    {
        ::waitpid(pid, nullptr, 0);
        throw ProcessError("Failed to execute '" + command + "': " + std::strerror(child_errno));
    }

    stdin_.reset(PipePair::take(in.write_end));
    stdout_.reset(PipePair::take(out.read_end));
    stderr_.reset(PipePair::take(err.read_end));

    pid_ = pid;
    reaped_ = false;
    exit_code_ = -1;
    term_signal_ = 0;
}

void Process::record(int status)
{
    if (WIFSIGNALED(status))
    {
        term_signal_ = WTERMSIG(status);
        exit_code_ = 128 + term_signal_;
    }
    else
    {
        term_signal_ = 0;
        exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    }
    reaped_ = true;
}

std::optional<int> Process::try_wait()
{
    if (reaped_)
        return exit_code_;
    int status = 0;
    pid_t rc = ::waitpid(pid_, &status, WNOHANG);
    if (rc == 0)
        return std::nullopt;
    if (rc == pid_)
    {
        record(status);
        return exit_code_;
    }
    if (errno == ECHILD)
    {
        reaped_ = true;
        return exit_code_;
    }
    throw ProcessError("waitpid failed: " + errno_text());
}

int Process::wait()
{
    if (reaped_)
        return exit_code_;
    int status = 0;
    pid_t rc;
    do
    {
        rc = ::waitpid(pid_, &status, 0);
    } while (rc < 0 && errno == EINTR);
    if (rc != pid_)
        throw ProcessError("waitpid failed: " + errno_text());
    record(status);
    return exit_code_;
}

void Process::signal_group(int sig)
{
    if (reaped_ || pid_ <= 0)
        return;
    // Fall back to the leader alone if the group is already gone
    if (::kill(-pid_, sig) != 0)
        ::kill(pid_, sig);
}

void Process::terminate()
{
    signal_group(SIGTERM);
}

void Process::kill()
{
    signal_group(SIGKILL);
}

} // namespace mcpcompose::process
