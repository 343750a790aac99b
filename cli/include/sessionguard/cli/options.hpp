#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "sessionguard/config.hpp"

namespace sessionguard::cli
{

    // Values given on the command line; each one wins over the config file.
    struct ConfigOverrides
    {
        std::optional<std::filesystem::path> sessions_dir;
        std::optional<std::filesystem::path> backup_root;
        std::optional<std::string> remote_host;
        std::optional<std::string> remote_sessions_dir;
        std::optional<std::string> remote_backup_root;
        std::optional<std::filesystem::path> legacy_root;
        std::optional<std::filesystem::path> target_root;
        std::optional<std::chrono::seconds> connect_timeout;
        std::optional<std::chrono::seconds> command_timeout;
    };

    struct CliOptions
    {
        std::optional<std::filesystem::path> config_file;
        std::optional<std::filesystem::path> log_path;
        bool verbose{};
        bool help{};
        ConfigOverrides overrides;
        std::string command;
        std::vector<std::string> args;
    };

    // Throws std::runtime_error with a short message on malformed input.
    CliOptions parse_arguments(int argc, char *argv[]);

    // Defaults, then the config file (explicit --config, or the default path if present),
    // then command-line overrides.
    GuardConfig resolve_config(const CliOptions &options, const std::string &program_name);

    void print_usage(const char *program_name);

} // namespace sessionguard::cli
