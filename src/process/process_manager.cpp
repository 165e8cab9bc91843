#include "mcpcompose/process/process_manager.hpp"

#include "mcpcompose/exceptions.hpp"
#include "mcpcompose/util/log.hpp"

#include <algorithm>
#include <future>

namespace mcpcompose::process
{

namespace
{
constexpr const char* kLogger = "process_manager";
}

ProcessManager::ProcessManager(std::chrono::milliseconds monitor_interval)
    : monitor_interval_(monitor_interval)
{
    monitor_ = std::thread([this]() { monitor_loop(); });
}

ProcessManager::~ProcessManager()
{
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor_stop_ = true;
    }
    monitor_cv_.notify_all();
    if (monitor_.joinable())
        monitor_.join();

    stop_all(std::chrono::milliseconds(2000));
    std::lock_guard<std::mutex> lock(mutex_);
    processes_.clear();
    order_.clear();
}

SupervisedProcess& ProcessManager::add(const std::string& name, StdioServer spec,
                                       bool auto_start)
{
    std::shared_ptr<SupervisedProcess> proc;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (processes_.count(name))
            throw ValidationError("Process already registered: " + name);
        proc = std::make_shared<SupervisedProcess>(name, std::move(spec));
        proc->set_event_handler([this](const ProcessEvent& event) { publish(event); });
        processes_.emplace(name, proc);
        order_.push_back(name);
    }
    log::debug(kLogger, "Registered process " + name);
    if (auto_start)
        proc->start();
    return *proc;
}

std::shared_ptr<SupervisedProcess> ProcessManager::find(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(name);
    if (it == processes_.end())
        throw NotFoundError("Process not found: " + name);
    return it->second;
}

std::vector<std::shared_ptr<SupervisedProcess>> ProcessManager::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<SupervisedProcess>> out;
    out.reserve(order_.size());
    for (const auto& name : order_)
        out.push_back(processes_.at(name));
    return out;
}

SupervisedProcess& ProcessManager::get(const std::string& name)
{
    return *find(name);
}

bool ProcessManager::contains(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return processes_.count(name) > 0;
}

void ProcessManager::start(const std::string& name)
{
    find(name)->start();
}

bool ProcessManager::stop(const std::string& name, std::chrono::milliseconds timeout)
{
    return find(name)->stop(timeout);
}

void ProcessManager::restart(const std::string& name, std::chrono::milliseconds timeout)
{
    find(name)->restart(timeout);
}

void ProcessManager::remove(const std::string& name, std::chrono::milliseconds timeout)
{
    std::shared_ptr<SupervisedProcess> proc;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processes_.find(name);
        if (it == processes_.end())
            throw NotFoundError("Process not found: " + name);
        proc = it->second;
        processes_.erase(it);
        order_.erase(std::remove(order_.begin(), order_.end(), name), order_.end());
    }
    proc->stop(timeout);
    log::debug(kLogger, "Removed process " + name);
}

ProcessInfo ProcessManager::info(const std::string& name) const
{
    return find(name)->info();
}

std::vector<ProcessInfo> ProcessManager::list_all() const
{
    std::vector<ProcessInfo> out;
    for (const auto& proc : snapshot())
        out.push_back(proc->info());
    return out;
}

std::vector<std::string> ProcessManager::names() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

void ProcessManager::stop_all(std::chrono::milliseconds timeout)
{
    std::vector<std::future<void>> pending;
    for (auto& proc : snapshot())
    {
        pending.push_back(std::async(std::launch::async,
                                     [proc, timeout]()
                                     {
                                         try
                                         {
                                             proc->stop(timeout);
                                         }
                                         catch (const Error& e)
                                         {
                                             log::error(kLogger, "Error stopping " + proc->name() +
                                                                     ": " + e.what());
                                         }
                                     }));
    }
    for (auto& f : pending)
        f.get();
}

void ProcessManager::on_event(EventHandler handler)
{
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    subscribers_.push_back(std::move(handler));
}

void ProcessManager::publish(const ProcessEvent& event)
{
    std::vector<EventHandler> subscribers;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        subscribers = subscribers_;
    }
    for (const auto& handler : subscribers)
        handler(event);
}

void ProcessManager::monitor_loop()
{
    while (true)
    {
        {
            std::unique_lock<std::mutex> lock(monitor_mutex_);
            monitor_cv_.wait_for(lock, monitor_interval_, [this]() { return monitor_stop_; });
            if (monitor_stop_)
                return;
        }

        for (auto& proc : snapshot())
        {
            if (!proc->check_exit())
                continue;
            // A restart whose spawn fails leaves the process Crashed; the
            // budget bounds the retries.
            while (proc->should_restart())
            {
                try
                {
                    proc->restart_after_crash();
                    break;
                }
                catch (const ProcessError& e)
                {
                    log::warning(kLogger, "Restart of " + proc->name() + " failed: " + e.what());
                }
            }
        }
    }
}

} // namespace mcpcompose::process
