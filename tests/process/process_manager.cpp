#include "../support/calc_server.hpp"
#include "mcpcompose/exceptions.hpp"
#include "mcpcompose/process/process_manager.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

using namespace mcpcompose;
using namespace mcpcompose::process;
using namespace std::chrono_literals;

template<typename Pred>
static bool eventually(Pred pred, std::chrono::milliseconds limit = 8000ms)
{
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (pred())
            return true;
        std::this_thread::sleep_for(20ms);
    }
    return pred();
}

int main()
{
    // Registry operations
    {
        ProcessManager pm(50ms);
        pm.add("a", test_support::calc_server());
        pm.add("b", test_support::calc_server(), false);
        assert(pm.contains("a") && pm.contains("b"));
        assert(pm.get("a").is_running());
        assert(pm.info("b").state == ProcessState::Stopped);

        auto names = pm.names();
        assert(names.size() == 2 && names[0] == "a" && names[1] == "b");

        bool dup = false;
        try
        {
            pm.add("a", test_support::calc_server());
        }
        catch (const ValidationError&)
        {
            dup = true;
        }
        assert(dup);

        bool missing = false;
        try
        {
            pm.get("zzz");
        }
        catch (const NotFoundError&)
        {
            missing = true;
        }
        assert(missing);

        pm.start("b");
        assert(pm.info("b").state == ProcessState::Running);
        assert(pm.stop("b", 1000ms));
        assert(!pm.stop("b", 1000ms));

        pm.remove("a", 1000ms);
        assert(!pm.contains("a"));
        assert(pm.list_all().size() == 1);
        std::cout << "[PASS] registry operations" << std::endl;
    }

    // Auto-restart up to the budget, with events for every transition
    {
        ProcessManager pm(50ms);
        std::mutex m;
        std::vector<ProcessEvent> events;
        pm.on_event(
            [&](const ProcessEvent& e)
            {
                std::lock_guard<std::mutex> lock(m);
                events.push_back(e);
            });

        StdioServer spec = test_support::calc_server({"--exit-after-ms", "150"});
        spec.restart_policy = RestartPolicy::OnFailure;
        spec.max_restarts = 2;
        pm.add("flaky", spec);

        // Two restarts, then the third crash is final
        assert(eventually(
            [&]()
            {
                auto info = pm.info("flaky");
                return info.restart_count == 2 && info.state == ProcessState::Crashed;
            }));
        std::this_thread::sleep_for(300ms);
        auto info = pm.info("flaky");
        assert(info.restart_count == 2);
        assert(info.state == ProcessState::Crashed);
        assert(info.last_exit_reason.find("unexpected exit") != std::string::npos);

        std::lock_guard<std::mutex> lock(m);
        int crashes = 0;
        int runs = 0;
        for (const auto& e : events)
        {
            assert(e.name == "flaky");
            if (e.to == ProcessState::Crashed)
                ++crashes;
            if (e.to == ProcessState::Running)
                ++runs;
        }
        assert(crashes == 3);
        assert(runs == 3);
        std::cout << "[PASS] auto-restart budget" << std::endl;
    }

    // Policy never: a crash stays a crash
    {
        ProcessManager pm(50ms);
        pm.add("once", test_support::calc_server({"--exit-after-ms", "50"}));
        assert(eventually([&]() { return pm.info("once").state == ProcessState::Crashed; }));
        std::this_thread::sleep_for(200ms);
        assert(pm.info("once").restart_count == 0);
        std::cout << "[PASS] no restart under never" << std::endl;
    }

    // stop_all runs the graceful windows concurrently
    {
        ProcessManager pm(50ms);
        for (int i = 0; i < 3; ++i)
            pm.add("s" + std::to_string(i), test_support::calc_server({"--ignore-sigterm"}));
        std::this_thread::sleep_for(200ms);
        auto start = std::chrono::steady_clock::now();
        pm.stop_all(400ms);
        auto elapsed = std::chrono::steady_clock::now() - start;
        assert(elapsed < 1200ms);
        for (const auto& info : pm.list_all())
            assert(info.state == ProcessState::Stopped);
        std::cout << "[PASS] concurrent stop_all" << std::endl;
    }

    return 0;
}
