#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace sessionguard
{

    inline constexpr auto kCanonicalPrefix = "~";

    enum class NamingConvention
    {
        NestedProjects,
        NestedLegacy,
        Canonical,
        MacHome,
        LinuxHome,
        LinuxDoubledPrefix,
        WindowsHome,
        BareHome,
        Unknown
    };

    std::string_view to_string(NamingConvention convention) noexcept;

    struct Classification
    {
        std::string source_name;
        NamingConvention convention{NamingConvention::Unknown};
        std::string canonical_name;

        bool nested() const noexcept
        {
            return convention == NamingConvention::NestedProjects || convention == NamingConvention::NestedLegacy;
        }
    };

    struct StoreDirectory
    {
        std::filesystem::path path;
        Classification classification;
        // Name of the nested container ("projects", "legacy") this directory was found in, if any.
        std::string container;
    };

    class PathResolver
    {
    public:
        // Applies the ordered naming-convention table; first match wins. Names no rule
        // recognises are returned unchanged as Unknown.
        static Classification classify(const std::string &name);

        static std::string canonicalize(const std::string &name);

        // Immediate subdirectories of `root` in name order. Nested containers are
        // expanded one level and are not themselves returned.
        std::vector<StoreDirectory> enumerate(const std::filesystem::path &root) const;

        // Canonical directory name for a workspace under `home`, e.g. ~/eon/nt -> "~eon-nt".
        static std::string workspace_to_canonical(const std::filesystem::path &workspace,
                                                  const std::filesystem::path &home);
    };

} // namespace sessionguard
