#include "sessionguard/config.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>

#include <nlohmann/json.hpp>

#include "sessionguard/error_codes.hpp"

namespace sessionguard
{

    namespace
    {
        std::filesystem::path home_directory()
        {
            if (const char *home = std::getenv("HOME"))
            {
                return std::filesystem::path(home);
            }
            return std::filesystem::current_path();
        }

        std::filesystem::path expand_home(const std::string &value)
        {
            if (value == "~")
            {
                return home_directory();
            }
            if (value.rfind("~/", 0) == 0)
            {
                return home_directory() / value.substr(2);
            }
            return std::filesystem::path(value);
        }

        std::chrono::seconds seconds_value(const nlohmann::json &json, const char *key, std::chrono::seconds fallback)
        {
            if (!json.contains(key))
            {
                return fallback;
            }
            const auto value = json.at(key).get<std::int64_t>();
            if (value <= 0)
            {
                throw GuardError(ErrorCode::InvalidArgument, std::string(key) + " must be positive");
            }
            return std::chrono::seconds(value);
        }
    } // namespace

    GuardConfig default_config()
    {
        const auto home = home_directory();
        GuardConfig config;
        config.sessions_dir = home / ".claude" / "system" / "sessions";
        config.backup_root = home / ".claude" / "backups" / "emergency";
        config.legacy_root = home / ".claude" / "system" / "sessions";
        config.target_root = home / ".claude" / "projects";
        return config;
    }

    std::filesystem::path default_config_path()
    {
        return home_directory() / ".sessionguard" / "config.json";
    }

    void apply_config_file(GuardConfig &config, const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw GuardError(ErrorCode::NotFound, "Config file not readable: " + path.string());
        }

        nlohmann::json json;
        try
        {
            in >> json;
            if (!json.is_object())
            {
                throw GuardError(ErrorCode::InvalidArgument, "Config file must contain a JSON object: " + path.string());
            }

            if (json.contains("sessions_dir"))
            {
                config.sessions_dir = expand_home(json.at("sessions_dir").get<std::string>());
            }
            if (json.contains("backup_root"))
            {
                config.backup_root = expand_home(json.at("backup_root").get<std::string>());
            }
            if (json.contains("legacy_root"))
            {
                config.legacy_root = expand_home(json.at("legacy_root").get<std::string>());
            }
            if (json.contains("target_root"))
            {
                config.target_root = expand_home(json.at("target_root").get<std::string>());
            }
            // Remote paths stay unexpanded: "~" is resolved on the remote host.
            config.remote_host = json.value("remote_host", config.remote_host);
            config.remote_sessions_dir = json.value("remote_sessions_dir", config.remote_sessions_dir);
            config.remote_backup_root = json.value("remote_backup_root", config.remote_backup_root);
            if (json.contains("extensions"))
            {
                config.extensions = json.at("extensions").get<std::vector<std::string>>();
            }
            config.connect_timeout = seconds_value(json, "connect_timeout", config.connect_timeout);
            config.command_timeout = seconds_value(json, "command_timeout", config.command_timeout);
            config.sample_size = json.value("sample_size", config.sample_size);
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw GuardError(ErrorCode::InvalidArgument, "Invalid config file " + path.string() + ": " + ex.what());
        }
    }

} // namespace sessionguard
