#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace sessionguard
{

    inline constexpr auto kLocalExecutionHost = "local";

    struct GuardConfig
    {
        std::filesystem::path sessions_dir;
        std::filesystem::path backup_root;
        std::string remote_host{"tca"};
        std::string remote_sessions_dir{"~/.claude/system/sessions"};
        std::string remote_backup_root{"~/.claude/backups/emergency"};
        std::filesystem::path legacy_root;
        std::filesystem::path target_root;
        std::vector<std::string> extensions{".jsonl", ".json"};
        std::chrono::seconds connect_timeout{std::chrono::seconds{10}};
        std::chrono::seconds command_timeout{std::chrono::seconds{300}};
        std::size_t sample_size{3};
        std::string program_name{"sessionguard"};
    };

    // Defaults rooted at $HOME (or the current directory when HOME is unset).
    GuardConfig default_config();

    std::filesystem::path default_config_path();

    // Overlays keys present in a JSON config file onto `config`. Throws GuardError
    // (InvalidArgument) when the file cannot be parsed.
    void apply_config_file(GuardConfig &config, const std::filesystem::path &path);

} // namespace sessionguard
