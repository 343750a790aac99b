#include "sessionguard/path_resolver.hpp"

#include <algorithm>
#include <array>
#include <regex>

#include <spdlog/spdlog.h>

#include "sessionguard/error_codes.hpp"

namespace sessionguard
{

    namespace
    {
        constexpr auto kProjectsDir = "projects";
        constexpr auto kLegacyDir = "legacy";
        constexpr auto kHomeCanonical = "~-home";

        struct ConventionMapping
        {
            NamingConvention convention;
            std::string_view label;
        };

        constexpr std::array<ConventionMapping, 9> kConventionLabels{{
            {NamingConvention::NestedProjects, "nested-projects"},
            {NamingConvention::NestedLegacy, "nested-legacy"},
            {NamingConvention::Canonical, "canonical"},
            {NamingConvention::MacHome, "macos-home"},
            {NamingConvention::LinuxHome, "linux-home"},
            {NamingConvention::LinuxDoubledPrefix, "linux-doubled-prefix"},
            {NamingConvention::WindowsHome, "windows-home"},
            {NamingConvention::BareHome, "bare-home"},
            {NamingConvention::Unknown, "unknown"},
        }};

        struct HostPattern
        {
            NamingConvention convention;
            std::regex pattern;
        };

        // Host-absolute encodings: the workspace path with '/' replaced by '-'.
        // Group 1 is the user name, group 2 the path relative to home.
        const std::vector<HostPattern> &host_patterns()
        {
            static const std::vector<HostPattern> patterns{
                {NamingConvention::MacHome, std::regex("^-Users-([^-]+)-(.+)$")},
                {NamingConvention::LinuxHome, std::regex("^-home-([^-]+)-(.+)$")},
                {NamingConvention::LinuxDoubledPrefix, std::regex("^--home-([^-]+)-(.+)$")},
                {NamingConvention::WindowsHome, std::regex("^-c-Users-([^-]+)-(.+)$")},
            };
            return patterns;
        }

        const std::regex &bare_home_pattern()
        {
            static const std::regex pattern("^-(Users|home|c-Users)-[^-]+$");
            return pattern;
        }

        std::vector<std::filesystem::path> sorted_subdirectories(const std::filesystem::path &root)
        {
            std::vector<std::filesystem::path> result;
            for (const auto &entry : std::filesystem::directory_iterator(root))
            {
                if (entry.is_directory())
                {
                    result.push_back(entry.path());
                }
            }
            std::sort(result.begin(), result.end());
            return result;
        }
    } // namespace

    std::string_view to_string(NamingConvention convention) noexcept
    {
        for (const auto &mapping : kConventionLabels)
        {
            if (mapping.convention == convention)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    Classification PathResolver::classify(const std::string &name)
    {
        Classification result{.source_name = name, .convention = NamingConvention::Unknown, .canonical_name = name};
        if (name == kProjectsDir)
        {
            result.convention = NamingConvention::NestedProjects;
            return result;
        }
        if (name == kLegacyDir)
        {
            result.convention = NamingConvention::NestedLegacy;
            return result;
        }
        if (name.rfind(kCanonicalPrefix, 0) == 0)
        {
            result.convention = NamingConvention::Canonical;
            return result;
        }

        std::smatch match;
        for (const auto &entry : host_patterns())
        {
            if (std::regex_match(name, match, entry.pattern))
            {
                result.convention = entry.convention;
                result.canonical_name = std::string(kCanonicalPrefix) + match[2].str();
                return result;
            }
        }
        if (std::regex_match(name, bare_home_pattern()))
        {
            result.convention = NamingConvention::BareHome;
            result.canonical_name = kHomeCanonical;
        }
        return result;
    }

    std::string PathResolver::canonicalize(const std::string &name)
    {
        return classify(name).canonical_name;
    }

    std::vector<StoreDirectory> PathResolver::enumerate(const std::filesystem::path &root) const
    {
        if (!std::filesystem::is_directory(root))
        {
            throw GuardError(ErrorCode::NotFound, "Session store root does not exist: " + root.string());
        }

        std::vector<StoreDirectory> directories;
        for (const auto &path : sorted_subdirectories(root))
        {
            auto classification = classify(path.filename().string());
            if (!classification.nested())
            {
                if (classification.convention == NamingConvention::Unknown)
                {
                    spdlog::warn("Unrecognised session directory name '{}', keeping it as-is", path.filename().string());
                }
                directories.push_back(StoreDirectory{.path = path, .classification = std::move(classification), .container = {}});
                continue;
            }

            const auto container = path.filename().string();
            spdlog::debug("Descending into nested '{}' directory", container);
            for (const auto &child : sorted_subdirectories(path))
            {
                auto child_classification = classify(child.filename().string());
                if (child_classification.nested())
                {
                    // Only one level of nesting is expanded.
                    child_classification.convention = NamingConvention::Unknown;
                }
                if (child_classification.convention == NamingConvention::Unknown)
                {
                    spdlog::warn("Unrecognised session directory name '{}/{}', keeping it as-is", container,
                                 child.filename().string());
                }
                directories.push_back(
                    StoreDirectory{.path = child, .classification = std::move(child_classification), .container = container});
            }
        }
        return directories;
    }

    std::string PathResolver::workspace_to_canonical(const std::filesystem::path &workspace,
                                                     const std::filesystem::path &home)
    {
        const auto relative = workspace.lexically_normal().lexically_relative(home.lexically_normal());
        const auto relative_string = relative.generic_string();
        if (relative.empty() || relative_string.rfind("..", 0) == 0)
        {
            throw GuardError(ErrorCode::NotFound,
                             "Workspace " + workspace.string() + " is not under home directory " + home.string());
        }
        if (relative_string == ".")
        {
            return kHomeCanonical;
        }

        std::string encoded = relative_string;
        if (!encoded.empty() && encoded.back() == '/')
        {
            encoded.pop_back();
        }
        std::replace(encoded.begin(), encoded.end(), '/', '-');
        std::replace(encoded.begin(), encoded.end(), '.', '-');
        return std::string(kCanonicalPrefix) + encoded;
    }

} // namespace sessionguard
