#include "sessionguard/manifest.hpp"

#include <array>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <time.h>

namespace sessionguard
{

    void to_json(nlohmann::json &json, const ManifestSide &side)
    {
        json = {
            {"path", side.path},
            {"session_count", side.session_count},
            {"size", side.size},
        };
        if (!side.host.empty())
        {
            json["host"] = side.host;
        }
    }

    void from_json(const nlohmann::json &json, ManifestSide &side)
    {
        side.path = json.at("path").get<std::string>();
        side.session_count = json.at("session_count").get<std::uint64_t>();
        side.size = json.at("size").get<std::uint64_t>();
        side.host = json.value("host", std::string{});
    }

    void to_json(nlohmann::json &json, const Manifest &manifest)
    {
        json = {
            {"timestamp", manifest.timestamp},
            {"created_at", manifest.created_at},
            {"local", manifest.local},
            {"remote", manifest.remote},
            {"integrity_verified", manifest.integrity_verified},
            {"restore_command", manifest.restore_command},
        };
    }

    void from_json(const nlohmann::json &json, Manifest &manifest)
    {
        manifest.timestamp = json.at("timestamp").get<std::string>();
        manifest.created_at = json.at("created_at").get<std::string>();
        manifest.local = json.at("local").get<ManifestSide>();
        manifest.remote = json.at("remote").get<ManifestSide>();
        manifest.integrity_verified = json.at("integrity_verified").get<bool>();
        manifest.restore_command = json.value("restore_command", std::string{});
    }

    std::string format_backup_timestamp(std::chrono::system_clock::time_point time)
    {
        const std::time_t raw = std::chrono::system_clock::to_time_t(time);
        std::tm local{};
        localtime_r(&raw, &local);
        std::ostringstream out;
        out << std::put_time(&local, "%Y%m%d_%H%M%S");
        return out.str();
    }

    std::string format_utc_iso8601(std::chrono::system_clock::time_point time)
    {
        const std::time_t raw = std::chrono::system_clock::to_time_t(time);
        std::tm utc{};
        gmtime_r(&raw, &utc);
        std::ostringstream out;
        out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
        return out.str();
    }

    std::string format_size(std::uint64_t bytes)
    {
        constexpr std::array<const char *, 5> kUnits{"B", "KiB", "MiB", "GiB", "TiB"};
        auto value = static_cast<double>(bytes);
        std::size_t unit = 0;
        while (value >= 1024.0 && unit + 1 < kUnits.size())
        {
            value /= 1024.0;
            ++unit;
        }
        std::ostringstream out;
        if (unit == 0)
        {
            out << bytes << " " << kUnits[unit];
        }
        else
        {
            out << std::fixed << std::setprecision(1) << value << " " << kUnits[unit];
        }
        return out.str();
    }

} // namespace sessionguard
