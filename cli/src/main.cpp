#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "sessionguard/cli/commands.hpp"
#include "sessionguard/cli/logger.hpp"
#include "sessionguard/cli/options.hpp"
#include "sessionguard/error_codes.hpp"
#include "sessionguard/version.hpp"

namespace
{

    int dispatch(const sessionguard::cli::CliOptions &options, const sessionguard::GuardConfig &config)
    {
        using namespace sessionguard::cli;

        const auto &command = options.command;
        if (command == "backup")
        {
            return run_backup(config, options.args);
        }
        if (command == "restore")
        {
            return run_restore(config, options.args);
        }
        if (command == "migrate")
        {
            return run_migrate(config, options.args);
        }
        if (command == "canonicalize")
        {
            return run_canonicalize(options.args);
        }
        if (command == "validate" && options.args.empty())
        {
            return run_validate(config);
        }
        if (command == "sessions" && options.args.empty())
        {
            return run_sessions(config);
        }
        std::cerr << "Unknown command: " << command << std::endl;
        return kExitFailure;
    }

} // namespace

int main(int argc, char *argv[])
{
    using namespace sessionguard::cli;

    CliOptions options;
    try
    {
        options = parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        print_usage(argv[0]);
        return kExitFailure;
    }
    if (options.help)
    {
        print_usage(argv[0]);
        return EXIT_SUCCESS;
    }

    try
    {
        configure_logging(options.log_path, options.verbose);
        const auto program_name = std::filesystem::path(argv[0]).filename().string();
        const auto config = resolve_config(options, program_name);
        spdlog::debug("SessionGuard {} running '{}'", sessionguard::version(), options.command);

        return dispatch(options, config);
    }
    catch (const sessionguard::GuardError &ex)
    {
        return report_error(ex);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: internal_error: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return kExitFailure;
    }
}
