#pragma once
/// @file compose/shutdown_coordinator.hpp
/// @brief Process-wide registry of live composers, torn down on SIGTERM/SIGINT.
/// @details The installed signal handler only writes the signal number to a
///          self-pipe. A watcher thread reads it and stops every registered
///          participant concurrently. Handlers are installed when the first
///          participant is added and the previous handlers are restored when
///          the last one is removed.

#include <condition_variable>
#include <csignal>
#include <cstddef>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace mcpcompose::compose
{

/// Anything the coordinator can stop. stop() must be idempotent and must
/// call ShutdownCoordinator::remove() for itself once torn down.
class ShutdownParticipant
{
  public:
    virtual ~ShutdownParticipant() = default;
    virtual void stop() = 0;
    virtual std::string participant_name() const = 0;
};

class ShutdownCoordinator
{
  public:
    static ShutdownCoordinator& instance();

    ShutdownCoordinator(const ShutdownCoordinator&) = delete;
    ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

    /// Register a participant; installs the signal handlers if needed
    void add(ShutdownParticipant* participant);

    /// Unregister; restores the original handlers when none remain.
    /// @return false if the participant was not registered
    bool remove(ShutdownParticipant* participant);

    /// remove() plus a wait for any signal-driven stop of `participant` that
    /// is still running. For destructors.
    void release(ShutdownParticipant* participant);

    bool contains(const ShutdownParticipant* participant) const;
    std::size_t size() const;
    bool handlers_installed() const;

    /// Stop every registered participant concurrently, as on a signal.
    /// @return number of participants stopped
    std::size_t stop_all(int signal_number = 0);

  private:
    ShutdownCoordinator();
    ~ShutdownCoordinator();

    void install_handlers_locked();
    void restore_handlers_locked();
    void ensure_watcher_locked();
    void watch();

    mutable std::mutex mutex_;
    std::condition_variable dispatch_cv_;
    std::vector<ShutdownParticipant*> participants_;
    std::multiset<ShutdownParticipant*> in_dispatch_;

    bool installed_{false};
    struct sigaction original_term_
    {
    };
    struct sigaction original_int_
    {
    };

    int wake_read_{-1};
    int wake_write_{-1};
    std::thread watcher_;
};

} // namespace mcpcompose::compose
