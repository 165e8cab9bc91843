#include "mcpcompose/compose/shutdown_coordinator.hpp"

#include "mcpcompose/exceptions.hpp"
#include "mcpcompose/util/log.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <future>
#include <poll.h>
#include <unistd.h>

namespace mcpcompose::compose
{

namespace
{
constexpr const char* kLogger = "shutdown";

std::atomic<int> g_wake_fd{-1};

extern "C" void on_termination_signal(int sig)
{
    const int saved_errno = errno;
    const int fd = g_wake_fd.load();
    if (fd >= 0)
    {
        unsigned char byte = static_cast<unsigned char>(sig);
        // Nothing useful can be done about a full pipe inside a handler
        ssize_t written = ::write(fd, &byte, 1);
        static_cast<void>(written);
    }
    errno = saved_errno;
}
} // namespace

ShutdownCoordinator& ShutdownCoordinator::instance()
{
    static ShutdownCoordinator coordinator;
    return coordinator;
}

ShutdownCoordinator::ShutdownCoordinator() = default;

ShutdownCoordinator::~ShutdownCoordinator()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (installed_)
            restore_handlers_locked();
    }
    if (wake_write_ >= 0)
    {
        g_wake_fd.store(-1);
        unsigned char stop_byte = 0;
        while (::write(wake_write_, &stop_byte, 1) < 0 && errno == EINTR)
        {
        }
    }
    if (watcher_.joinable())
        watcher_.join();
    if (wake_read_ >= 0)
        ::close(wake_read_);
    if (wake_write_ >= 0)
        ::close(wake_write_);
}

void ShutdownCoordinator::ensure_watcher_locked()
{
    if (watcher_.joinable())
        return;

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0)
        throw Error(std::string("Cannot create shutdown pipe: ") + std::strerror(errno));
    // The handler must never block on a full pipe
    const int flags = ::fcntl(fds[1], F_GETFL);
    if (flags < 0 || ::fcntl(fds[1], F_SETFL, flags | O_NONBLOCK) != 0)
    {
        const int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        throw Error(std::string("Cannot configure shutdown pipe: ") + std::strerror(err));
    }
    wake_read_ = fds[0];
    wake_write_ = fds[1];
    g_wake_fd.store(wake_write_);
    watcher_ = std::thread([this]() { watch(); });
}

void ShutdownCoordinator::install_handlers_locked()
{
    ensure_watcher_locked();

    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = on_termination_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    if (::sigaction(SIGTERM, &action, &original_term_) != 0)
        throw Error(std::string("Cannot install SIGTERM handler: ") + std::strerror(errno));
    if (::sigaction(SIGINT, &action, &original_int_) != 0)
    {
        const int err = errno;
        if (::sigaction(SIGTERM, &original_term_, nullptr) != 0)
            log::warning(kLogger, "Could not roll back SIGTERM handler");
        throw Error(std::string("Cannot install SIGINT handler: ") + std::strerror(err));
    }
    installed_ = true;
    log::debug(kLogger, "Signal handlers installed for SIGTERM and SIGINT");
}

void ShutdownCoordinator::restore_handlers_locked()
{
    if (::sigaction(SIGTERM, &original_term_, nullptr) != 0 ||
        ::sigaction(SIGINT, &original_int_, nullptr) != 0)
        log::warning(kLogger, std::string("Could not restore signal handlers: ") +
                                  std::strerror(errno));
    installed_ = false;
    log::debug(kLogger, "Signal handlers restored to originals");
}

void ShutdownCoordinator::add(ShutdownParticipant* participant)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(participants_.begin(), participants_.end(), participant) != participants_.end())
        return;
    if (!installed_)
        install_handlers_locked();
    participants_.push_back(participant);
    log::debug(kLogger, participant->participant_name() + " registered for signal shutdown (" +
                            std::to_string(participants_.size()) + " active)");
}

bool ShutdownCoordinator::remove(ShutdownParticipant* participant)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(participants_.begin(), participants_.end(), participant);
    if (it == participants_.end())
        return false;
    participants_.erase(it);
    if (participants_.empty() && installed_)
        restore_handlers_locked();
    return true;
}

void ShutdownCoordinator::release(ShutdownParticipant* participant)
{
    remove(participant);
    std::unique_lock<std::mutex> lock(mutex_);
    dispatch_cv_.wait(lock, [this, participant]() { return in_dispatch_.count(participant) == 0; });
}

bool ShutdownCoordinator::contains(const ShutdownParticipant* participant) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return std::find(participants_.begin(), participants_.end(), participant) !=
           participants_.end();
}

std::size_t ShutdownCoordinator::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return participants_.size();
}

bool ShutdownCoordinator::handlers_installed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return installed_;
}

std::size_t ShutdownCoordinator::stop_all(int signal_number)
{
    std::vector<ShutdownParticipant*> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets = participants_;
        for (auto* p : targets)
            in_dispatch_.insert(p);
    }
    if (targets.empty())
    {
        log::debug(kLogger, "No active composers to stop");
        return 0;
    }

    if (signal_number != 0)
        log::info(kLogger, "Received signal " + std::to_string(signal_number) +
                               ", stopping " + std::to_string(targets.size()) + " composer(s)");

    std::vector<std::future<void>> stops;
    for (auto* p : targets)
    {
        stops.push_back(std::async(std::launch::async,
                                   [p]()
                                   {
                                       try
                                       {
                                           p->stop();
                                       }
                                       catch (const std::exception& e)
                                       {
                                           log::error(kLogger, "Error stopping " +
                                                                   p->participant_name() + ": " +
                                                                   e.what());
                                       }
                                   }));
    }
    for (auto& f : stops)
        f.get();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto* p : targets)
            in_dispatch_.erase(in_dispatch_.find(p));
    }
    dispatch_cv_.notify_all();
    return targets.size();
}

void ShutdownCoordinator::watch()
{
    while (true)
    {
        struct pollfd pfd;
        pfd.fd = wake_read_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int rc = ::poll(&pfd, 1, -1);
        if (rc < 0)
        {
            if (errno == EINTR)
                continue;
            log::error(kLogger, std::string("Signal watcher poll failed: ") + std::strerror(errno));
            return;
        }

        unsigned char byte = 0;
        ssize_t n = ::read(wake_read_, &byte, 1);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0 || byte == 0)
            return;
        stop_all(byte);
    }
}

} // namespace mcpcompose::compose
