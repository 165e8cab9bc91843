#include "../support/calc_server.hpp"
#include "mcpcompose/exceptions.hpp"
#include "mcpcompose/process/supervised_process.hpp"

#include <atomic>
#include <cassert>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

using namespace mcpcompose;
using namespace mcpcompose::process;
using namespace std::chrono_literals;

static bool pid_alive(int pid)
{
    return ::kill(pid, 0) == 0 || errno != ESRCH;
}

static std::size_t open_fds()
{
    std::size_t n = 0;
    for (const auto& entry : std::filesystem::directory_iterator("/proc/self/fd"))
    {
        (void)entry;
        ++n;
    }
    return n;
}

template<typename Pred>
static bool eventually(Pred pred, std::chrono::milliseconds limit = 5000ms)
{
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (pred())
            return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

int main()
{
    // Lifecycle and stdout lines
    {
        SupervisedProcess proc("calc", test_support::calc_server({"--name", "calc"}));
        std::mutex m;
        std::vector<std::string> lines;
        std::atomic<bool> closed{false};
        proc.set_output_handlers(
            [&](const std::string& line)
            {
                std::lock_guard<std::mutex> lock(m);
                lines.push_back(line);
            },
            [&]() { closed.store(true); });

        std::vector<ProcessEvent> events;
        proc.set_event_handler(
            [&](const ProcessEvent& e)
            {
                std::lock_guard<std::mutex> lock(m);
                events.push_back(e);
            });

        assert(proc.state() == ProcessState::Stopped);
        proc.start();
        assert(proc.is_running());
        auto info = proc.info();
        assert(info.pid && *info.pid > 0);
        assert(info.started_at);

        proc.write_line(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
        assert(eventually(
            [&]()
            {
                std::lock_guard<std::mutex> lock(m);
                return !lines.empty();
            }));
        {
            std::lock_guard<std::mutex> lock(m);
            assert(lines[0].find("\"id\":1") != std::string::npos);
        }
        assert(eventually(
            [&]()
            {
                auto tail = proc.info().stderr_tail;
                return !tail.empty() && tail[0] == "calc ready";
            }));

        assert(proc.stop(2000ms));
        assert(proc.state() == ProcessState::Stopped);
        assert(!pid_alive(*info.pid));
        assert(closed.load());
        // A second stop is a no-op
        assert(!proc.stop(2000ms));

        std::lock_guard<std::mutex> lock(m);
        std::vector<ProcessState> seen;
        for (const auto& e : events)
            seen.push_back(e.to);
        assert((seen == std::vector<ProcessState>{ProcessState::Starting, ProcessState::Running,
                                                  ProcessState::Stopping, ProcessState::Stopped}));
        std::cout << "[PASS] lifecycle" << std::endl;
    }

    // SIGTERM ignored: killed once the timeout expires
    {
        SupervisedProcess proc("stubborn", test_support::calc_server({"--ignore-sigterm"}));
        proc.start();
        int pid = *proc.info().pid;
        // let the child install its signal disposition
        assert(eventually([&]() { return !proc.info().stderr_tail.empty(); }));

        const auto timeout = 300ms;
        auto start = std::chrono::steady_clock::now();
        assert(proc.stop(timeout));
        auto elapsed = std::chrono::steady_clock::now() - start;
        assert(elapsed >= timeout);
        assert(elapsed < timeout + 1500ms);
        assert(!pid_alive(pid));
        auto info = proc.info();
        assert(info.state == ProcessState::Stopped);
        assert(info.last_exit_reason.find("SIGKILL") != std::string::npos);
        std::cout << "[PASS] forced kill within timeout" << std::endl;
    }

    // Unexpected exit is observed as a crash
    {
        SupervisedProcess proc("flaky", test_support::calc_server({"--exit-after-ms", "100"}));
        proc.start();
        assert(eventually([&]() { return proc.check_exit() || proc.state() == ProcessState::Crashed; }));
        auto info = proc.info();
        assert(info.state == ProcessState::Crashed);
        assert(info.last_exit_code && *info.last_exit_code == 3);
        assert(!proc.should_restart()); // policy never
        bool threw = false;
        try
        {
            proc.write_line("{}");
        }
        catch (const ProcessError&)
        {
            threw = true;
        }
        assert(threw);
        std::cout << "[PASS] crash detection" << std::endl;
    }

    // stop() on a crashed process releases its pipes and keeps the state
    {
        SupervisedProcess proc("leaky", test_support::calc_server({"--exit-after-ms", "100"}));
        std::mutex m;
        std::vector<ProcessEvent> events;
        proc.set_event_handler(
            [&](const ProcessEvent& e)
            {
                std::lock_guard<std::mutex> lock(m);
                events.push_back(e);
            });
        const auto before = open_fds();
        proc.start();
        assert(eventually([&]() { return proc.check_exit() || proc.state() == ProcessState::Crashed; }));
        assert(open_fds() == before + 3);

        assert(!proc.stop(1000ms));
        assert(proc.state() == ProcessState::Crashed);
        assert(open_fds() == before);
        {
            std::lock_guard<std::mutex> lock(m);
            assert(events.size() == 3);
            assert(events.back().to == ProcessState::Crashed);
        }

        proc.start();
        assert(proc.is_running());
        assert(proc.stop(1000ms));
        std::cout << "[PASS] stop after crash" << std::endl;
    }

    // Two threads stopping at once: one teardown, one Stopping -> Stopped
    {
        SupervisedProcess proc("shared", test_support::calc_server());
        std::mutex m;
        std::vector<ProcessEvent> events;
        proc.set_event_handler(
            [&](const ProcessEvent& e)
            {
                std::lock_guard<std::mutex> lock(m);
                events.push_back(e);
            });
        proc.start();

        std::atomic<int> performed{0};
        std::atomic<bool> go{false};
        auto stopper = [&]()
        {
            while (!go.load())
                std::this_thread::yield();
            if (proc.stop(2000ms))
                ++performed;
        };
        std::thread a(stopper);
        std::thread b(stopper);
        go.store(true);
        a.join();
        b.join();

        assert(performed.load() == 1);
        assert(proc.state() == ProcessState::Stopped);
        std::lock_guard<std::mutex> lock(m);
        int stopping = 0;
        int stopped = 0;
        for (const auto& e : events)
        {
            stopping += e.to == ProcessState::Stopping;
            stopped += e.to == ProcessState::Stopped;
        }
        assert(stopping == 1 && stopped == 1);
        std::cout << "[PASS] concurrent stop" << std::endl;
    }

    // start() racing stop() never leaves Stopping for anything but Stopped
    {
        SupervisedProcess proc("racy", test_support::calc_server());
        std::mutex m;
        std::vector<ProcessEvent> events;
        proc.set_event_handler(
            [&](const ProcessEvent& e)
            {
                std::lock_guard<std::mutex> lock(m);
                events.push_back(e);
            });
        for (int round = 0; round < 5; ++round)
        {
            std::thread starter([&]() { proc.start(); });
            std::thread stopper([&]() { proc.stop(2000ms); });
            starter.join();
            stopper.join();
            proc.stop(2000ms);
            assert(proc.state() == ProcessState::Stopped);
        }

        std::lock_guard<std::mutex> lock(m);
        for (const auto& e : events)
        {
            switch (e.to)
            {
            case ProcessState::Starting:
                assert(e.from == ProcessState::Stopped || e.from == ProcessState::Crashed);
                break;
            case ProcessState::Running:
                assert(e.from == ProcessState::Starting);
                break;
            case ProcessState::Stopping:
                assert(e.from == ProcessState::Running);
                break;
            case ProcessState::Stopped:
                assert(e.from == ProcessState::Stopping);
                break;
            case ProcessState::Crashed:
                break;
            }
        }
        std::cout << "[PASS] start/stop race" << std::endl;
    }

    // Spawn failure
    {
        StdioServer spec;
        spec.command = "/nonexistent/definitely-not-here";
        SupervisedProcess proc("ghost", spec);
        bool threw = false;
        try
        {
            proc.start();
        }
        catch (const ProcessError&)
        {
            threw = true;
        }
        assert(threw);
        assert(proc.state() == ProcessState::Crashed);
        std::cout << "[PASS] spawn failure" << std::endl;
    }

    // Explicit restart bumps the counter and changes the pid
    {
        SupervisedProcess proc("again", test_support::calc_server());
        proc.start();
        int first = *proc.info().pid;
        proc.restart(1000ms);
        auto info = proc.info();
        assert(info.state == ProcessState::Running);
        assert(info.restart_count == 1);
        assert(*info.pid != first);
        Json j = info;
        assert(j["state"] == "running" && j["restart_count"] == 1);
        proc.stop(1000ms);
        std::cout << "[PASS] restart" << std::endl;
    }

    return 0;
}
