#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "sessionguard/manifest.hpp"

namespace sessionguard
{

    // One manifest_<timestamp>.json file per backup under a fixed directory.
    class ManifestStore
    {
    public:
        explicit ManifestStore(std::filesystem::path directory);

        std::filesystem::path write(const Manifest &manifest) const;

        // NotFound when no manifest exists for `timestamp`, ManifestCorrupt when it
        // exists but cannot be parsed.
        Manifest read(const std::string &timestamp) const;

        // Every parsable manifest, oldest first. Corrupt files are skipped with a warning.
        std::vector<Manifest> list_all() const;

        bool exists(const std::string &timestamp) const;

        std::filesystem::path path_for(const std::string &timestamp) const;

        const std::filesystem::path &directory() const noexcept { return directory_; }

    private:
        std::filesystem::path directory_;
    };

} // namespace sessionguard
