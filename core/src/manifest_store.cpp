#include "sessionguard/manifest_store.hpp"

#include <algorithm>
#include <fstream>

#include <spdlog/spdlog.h>

#include "sessionguard/error_codes.hpp"

namespace sessionguard
{

    namespace
    {
        constexpr auto kManifestPrefix = "manifest_";
        constexpr auto kManifestExtension = ".json";

        void validate_timestamp(const std::string &timestamp)
        {
            if (timestamp.empty() || timestamp.find('/') != std::string::npos || timestamp.find("..") != std::string::npos)
            {
                throw GuardError(ErrorCode::InvalidArgument, "Invalid backup timestamp: '" + timestamp + "'");
            }
        }

        Manifest parse_manifest_file(const std::filesystem::path &path)
        {
            std::ifstream in(path);
            if (!in.is_open())
            {
                throw GuardError(ErrorCode::ManifestCorrupt, "Cannot open manifest " + path.string());
            }
            try
            {
                nlohmann::json json;
                in >> json;
                return json.get<Manifest>();
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw GuardError(ErrorCode::ManifestCorrupt, "Corrupt manifest " + path.string() + ": " + ex.what());
            }
        }
    } // namespace

    ManifestStore::ManifestStore(std::filesystem::path directory) : directory_(std::move(directory)) {}

    std::filesystem::path ManifestStore::path_for(const std::string &timestamp) const
    {
        validate_timestamp(timestamp);
        return directory_ / (kManifestPrefix + timestamp + kManifestExtension);
    }

    bool ManifestStore::exists(const std::string &timestamp) const
    {
        return std::filesystem::exists(path_for(timestamp));
    }

    std::filesystem::path ManifestStore::write(const Manifest &manifest) const
    {
        const auto path = path_for(manifest.timestamp);
        std::filesystem::create_directories(directory_);

        auto temp_path = path;
        temp_path += ".part";
        {
            std::ofstream out(temp_path, std::ios::trunc);
            if (!out.is_open())
            {
                throw GuardError(ErrorCode::InternalError, "Cannot write manifest " + temp_path.string());
            }
            out << nlohmann::json(manifest).dump(2) << '\n';
            out.flush();
            if (!out)
            {
                throw GuardError(ErrorCode::InternalError, "Failed writing manifest " + temp_path.string());
            }
        }
        std::filesystem::rename(temp_path, path);
        spdlog::info("Backup manifest written: {}", path.string());
        return path;
    }

    Manifest ManifestStore::read(const std::string &timestamp) const
    {
        const auto path = path_for(timestamp);
        if (!std::filesystem::exists(path))
        {
            throw GuardError(ErrorCode::NotFound, "No backup manifest for timestamp " + timestamp + " (" +
                                                      path.string() + ")");
        }
        return parse_manifest_file(path);
    }

    std::vector<Manifest> ManifestStore::list_all() const
    {
        std::vector<Manifest> manifests;
        if (!std::filesystem::exists(directory_))
        {
            return manifests;
        }

        std::vector<std::filesystem::path> files;
        try
        {
            for (const auto &entry : std::filesystem::directory_iterator(directory_))
            {
                const auto name = entry.path().filename().string();
                if (entry.is_regular_file() && name.rfind(kManifestPrefix, 0) == 0 &&
                    entry.path().extension() == kManifestExtension)
                {
                    files.push_back(entry.path());
                }
            }
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            throw GuardError(ErrorCode::InternalError, "Manifest directory unreadable: " + std::string(ex.what()));
        }

        std::sort(files.begin(), files.end());
        for (const auto &file : files)
        {
            try
            {
                manifests.push_back(parse_manifest_file(file));
            }
            catch (const GuardError &ex)
            {
                spdlog::warn("Skipping manifest: {}", ex.what());
            }
        }
        return manifests;
    }

} // namespace sessionguard
