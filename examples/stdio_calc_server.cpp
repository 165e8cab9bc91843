// Demo MCP server on stdin/stdout, used by the composer tests.
//
//   stdio_calc_server [--name <n>] [--no-prompts] [--no-resources]
//                     [--ignore-sigterm] [--exit-after-ms <n>] [--silent]
//
// `sleep` calls are answered from a worker thread so replies can arrive out
// of order. --silent reads requests but never answers them.
#include "calc_handler.hpp"

#include "mcpcompose/util/json.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace
{

std::mutex g_out_mutex;

void write_message(const mcpcompose::Json& message)
{
    std::lock_guard<std::mutex> lock(g_out_mutex);
    std::cout << message.dump() << "\n" << std::flush;
}

} // namespace

int main(int argc, char** argv)
{
    using mcpcompose::Json;

    calc::Options options;
    bool silent = false;
    long exit_after_ms = -1;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--name" && i + 1 < argc)
            options.name = argv[++i];
        else if (arg == "--no-prompts")
            options.prompts = false;
        else if (arg == "--no-resources")
            options.resources = false;
        else if (arg == "--ignore-sigterm")
            std::signal(SIGTERM, SIG_IGN);
        else if (arg == "--exit-after-ms" && i + 1 < argc)
            exit_after_ms = std::atol(argv[++i]);
        else if (arg == "--silent")
            silent = true;
    }

    if (exit_after_ms >= 0)
    {
        std::thread(
            [exit_after_ms]()
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(exit_after_ms));
                std::cerr << "exiting on timer" << std::endl;
                std::_Exit(3);
            })
            .detach();
    }

    std::cerr << options.name << " ready" << std::endl;

    std::vector<std::thread> workers;
    std::string line;
    while (std::getline(std::cin, line))
    {
        if (mcpcompose::util::json::is_blank(line))
            continue;

        auto request = mcpcompose::util::json::try_parse(line);
        if (!request)
        {
            write_message(calc::error_response(nullptr, mcpcompose::rpc::kParseError,
                                               "Parse error"));
            continue;
        }
        if (silent)
            continue;

        auto response = calc::handle(*request, options);
        if (response)
        {
            write_message(*response);
            continue;
        }

        const Json params = request->value("params", Json::object());
        if (request->value("method", std::string()) == "tools/call" &&
            params.value("name", std::string()) == "sleep")
        {
            const Json id = (*request)["id"];
            const long long ms =
                params.value("arguments", Json::object()).value("ms", 0LL);
            workers.emplace_back(
                [id, ms]()
                {
                    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
                    write_message(calc::result_response(
                        id, calc::text_content("slept " + std::to_string(ms))));
                });
        }
    }

    for (auto& w : workers)
        w.join();
    return 0;
}
