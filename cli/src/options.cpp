#include "sessionguard/cli/options.hpp"

#include <iostream>
#include <stdexcept>

#include "sessionguard/version.hpp"

namespace sessionguard::cli
{

    namespace
    {

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index + 1 >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            ++index;
            return std::string(argv[index]);
        }

        std::chrono::seconds parse_seconds(const std::string &value, const std::string &flag)
        {
            long long seconds = 0;
            try
            {
                std::size_t consumed = 0;
                seconds = std::stoll(value, &consumed);
                if (consumed != value.size())
                {
                    throw std::invalid_argument(value);
                }
            }
            catch (const std::logic_error &)
            {
                throw std::runtime_error(flag + " expects a number of seconds, got '" + value + "'");
            }
            if (seconds <= 0)
            {
                throw std::runtime_error(flag + " must be positive");
            }
            return std::chrono::seconds(seconds);
        }

    } // namespace

    void print_usage(const char *program_name)
    {
        std::cout << "SessionGuard " << sessionguard::version() << "\n"
                  << "Usage: " << program_name << " [options] <command> [args]\n\n"
                  << "Commands:\n"
                  << "  backup create [--label <LABEL>]   verified backup of local and remote sessions\n"
                  << "  backup list                       list backups recorded in the manifest directory\n"
                  << "  restore <TIMESTAMP> [--local-only|--remote-only]\n"
                  << "                                    replace live sessions with a backup\n"
                  << "  migrate [--dry-run]               merge legacy session directories into canonical names\n"
                  << "  canonicalize <NAME>               print the canonical name for a directory name\n"
                  << "  validate                          check the canonical tree for stray directories\n"
                  << "  sessions                          list canonical directories and session counts\n\n"
                  << "Options:\n"
                  << "  --config <FILE>  --log <FILE>  --verbose\n"
                  << "  --sessions-dir <DIR>  --backup-root <DIR>\n"
                  << "  --remote-host <HOST|local>  --remote-sessions-dir <DIR>  --remote-backup-root <DIR>\n"
                  << "  --legacy-root <DIR>  --target-root <DIR>\n"
                  << "  --connect-timeout <SECONDS>  --command-timeout <SECONDS>\n";
    }

    CliOptions parse_arguments(int argc, char *argv[])
    {
        CliOptions options;
        auto &overrides = options.overrides;

        int index = 1;
        for (; index < argc; ++index)
        {
            const std::string arg = argv[index];
            if (arg.rfind("--", 0) != 0 && arg != "-h")
            {
                break;
            }
            if (arg == "--help" || arg == "-h")
            {
                options.help = true;
            }
            else if (arg == "--verbose")
            {
                options.verbose = true;
            }
            else if (arg == "--config")
            {
                options.config_file = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--log")
            {
                options.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--sessions-dir")
            {
                overrides.sessions_dir = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--backup-root")
            {
                overrides.backup_root = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--remote-host")
            {
                overrides.remote_host = require_value(index, argc, argv, arg);
            }
            else if (arg == "--remote-sessions-dir")
            {
                overrides.remote_sessions_dir = require_value(index, argc, argv, arg);
            }
            else if (arg == "--remote-backup-root")
            {
                overrides.remote_backup_root = require_value(index, argc, argv, arg);
            }
            else if (arg == "--legacy-root")
            {
                overrides.legacy_root = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--target-root")
            {
                overrides.target_root = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--connect-timeout")
            {
                overrides.connect_timeout = parse_seconds(require_value(index, argc, argv, arg), arg);
            }
            else if (arg == "--command-timeout")
            {
                overrides.command_timeout = parse_seconds(require_value(index, argc, argv, arg), arg);
            }
            else
            {
                throw std::runtime_error("Unknown option: " + arg);
            }
        }

        if (index < argc)
        {
            options.command = argv[index++];
        }
        for (; index < argc; ++index)
        {
            options.args.emplace_back(argv[index]);
        }
        if (options.command.empty() && !options.help)
        {
            throw std::runtime_error("Missing command");
        }
        return options;
    }

    GuardConfig resolve_config(const CliOptions &options, const std::string &program_name)
    {
        auto config = default_config();
        config.program_name = program_name;

        if (options.config_file)
        {
            apply_config_file(config, *options.config_file);
        }
        else if (const auto fallback = default_config_path(); std::filesystem::exists(fallback))
        {
            apply_config_file(config, fallback);
        }

        const auto &overrides = options.overrides;
        if (overrides.sessions_dir)
        {
            config.sessions_dir = *overrides.sessions_dir;
        }
        if (overrides.backup_root)
        {
            config.backup_root = *overrides.backup_root;
        }
        if (overrides.remote_host)
        {
            config.remote_host = *overrides.remote_host;
        }
        if (overrides.remote_sessions_dir)
        {
            config.remote_sessions_dir = *overrides.remote_sessions_dir;
        }
        if (overrides.remote_backup_root)
        {
            config.remote_backup_root = *overrides.remote_backup_root;
        }
        if (overrides.legacy_root)
        {
            config.legacy_root = *overrides.legacy_root;
        }
        if (overrides.target_root)
        {
            config.target_root = *overrides.target_root;
        }
        if (overrides.connect_timeout)
        {
            config.connect_timeout = *overrides.connect_timeout;
        }
        if (overrides.command_timeout)
        {
            config.command_timeout = *overrides.command_timeout;
        }
        return config;
    }

} // namespace sessionguard::cli
