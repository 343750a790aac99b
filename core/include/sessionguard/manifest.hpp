/**
 * SessionGuard - Manifest schema describing one verified backup.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace sessionguard
{

    struct ManifestSide
    {
        std::string host;
        std::string path;
        std::uint64_t session_count{};
        std::uint64_t size{};
    };

    struct Manifest
    {
        std::string timestamp;
        std::string created_at;
        ManifestSide local;
        ManifestSide remote;
        bool integrity_verified{};
        std::string restore_command;
    };

    void to_json(nlohmann::json &json, const ManifestSide &side);
    void from_json(const nlohmann::json &json, ManifestSide &side);

    void to_json(nlohmann::json &json, const Manifest &manifest);
    void from_json(const nlohmann::json &json, Manifest &manifest);

    // Backup identity, e.g. "20250114_093012" (local time).
    std::string format_backup_timestamp(std::chrono::system_clock::time_point time);

    // e.g. "2025-01-14T08:30:12Z".
    std::string format_utc_iso8601(std::chrono::system_clock::time_point time);

    // "1.2 MiB" style rendering for summaries.
    std::string format_size(std::uint64_t bytes);

} // namespace sessionguard
