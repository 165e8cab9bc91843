#include "mcpcompose/compose/composer.hpp"
#include "mcpcompose/exceptions.hpp"
#include "mcpcompose/settings.hpp"
#include "mcpcompose/util/json.hpp"
#include "mcpcompose/util/log.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace
{

static int usage(int exit_code = 1)
{
    std::cout << "mcpcompose\n";
    std::cout << "Usage:\n";
    std::cout << "  mcpcompose --help\n";
    std::cout << "  mcpcompose <config.json> [--summary] [--log-level <level>]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --summary              Compose, print the summary and exit\n";
    std::cout << "  --log-level <level>    DEBUG, INFO, WARNING or ERROR\n";
    std::cout << "                         (default: $MCPCOMPOSE_LOG_LEVEL or INFO)\n";
    std::cout << "\n";
    std::cout << "Without --summary the composer runs until SIGTERM or SIGINT.\n";
    return exit_code;
}

static mcpcompose::Json load_config(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw mcpcompose::ValidationError("Cannot open config file: " + path);
    std::ostringstream buf;
    buf << in.rdbuf();
    auto parsed = mcpcompose::util::json::try_parse(buf.str());
    if (!parsed || !parsed->is_object())
        throw mcpcompose::ValidationError("Config file is not a JSON object: " + path);
    return *parsed;
}

} // namespace

int main(int argc, char** argv)
{
    using namespace mcpcompose;

    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty())
        return usage();

    std::optional<std::string> config_path;
    std::optional<std::string> log_level;
    bool summary_only = false;
    for (size_t i = 0; i < args.size(); ++i)
    {
        const auto& a = args[i];
        if (a == "--help" || a == "-h")
            return usage(0);
        if (a == "--summary")
            summary_only = true;
        else if (a == "--log-level" && i + 1 < args.size())
            log_level = args[++i];
        else if (!a.empty() && a[0] == '-')
            return usage();
        else if (!config_path)
            config_path = a;
        else
            return usage();
    }
    if (!config_path)
        return usage();

    try
    {
        auto settings = Settings::from_env();
        const Json raw = load_config(*config_path);
        if (raw.contains("settings"))
            settings = Settings::from_json(raw["settings"]);
        if (log_level)
            settings.log_level = *log_level;
        settings.apply();

        compose::Composer composer(ComposerConfig::from_json(raw));
        auto report = composer.start();
        std::cout << composer.summary_json().dump(2) << std::endl;

        if (summary_only)
        {
            composer.stop();
            return report.ok() ? 0 : 2;
        }

        log::info("cli", "Composer '" + composer.name() + "' running; send SIGTERM or SIGINT to stop");
        composer.wait_until_stopped();
        return 0;
    }
    catch (const ConflictError& e)
    {
        std::cerr << "Conflict: " << e.what() << "\n";
        return 3;
    }
    catch (const Error& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    catch (const nlohmann::json::exception& e)
    {
        std::cerr << "Invalid config: " << e.what() << "\n";
        return 1;
    }
}
