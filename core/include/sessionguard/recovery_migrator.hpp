#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "sessionguard/path_resolver.hpp"

namespace sessionguard
{

    enum class FileAction
    {
        Copied,
        Updated,
        Unchanged,
        KeptNewer
    };

    std::string_view to_string(FileAction action) noexcept;

    struct MigrationFailure
    {
        std::filesystem::path source;
        std::filesystem::path target;
        std::string reason;
    };

    struct DirectoryMigration
    {
        StoreDirectory source;
        std::filesystem::path target;
        std::size_t session_files{};
        std::size_t copied{};
        std::size_t updated{};
        std::size_t unchanged{};
        std::size_t kept_newer{};
        bool skipped{};
    };

    struct MigrationReport
    {
        bool dry_run{};
        std::vector<DirectoryMigration> directories;
        std::vector<MigrationFailure> failures;
        std::size_t copied{};
        std::size_t updated{};
        std::size_t unchanged{};
        std::size_t kept_newer{};
        std::uint64_t target_sessions{};
        std::size_t target_directories{};

        bool ok() const noexcept { return failures.empty(); }
    };

    struct CanonicalSummary
    {
        std::string name;
        std::string workspace_hint;
        std::uint64_t session_count{};
    };

    struct ValidationReport
    {
        std::vector<std::string> errors;
        std::vector<std::string> warnings;

        bool ok() const noexcept { return errors.empty(); }
    };

    // Reconciles session directories created under historical naming conventions into
    // one canonical tree. Files are copied, never moved, and a re-run only touches files
    // that are new or changed, so running it repeatedly is safe.
    class RecoveryMigrator
    {
    public:
        explicit RecoveryMigrator(std::vector<std::string> extensions);

        // Per-file copy failures are collected in the report instead of aborting the run.
        MigrationReport migrate(const std::filesystem::path &legacy_root, const std::filesystem::path &target_root,
                                bool dry_run = false) const;

        ValidationReport validate(const std::filesystem::path &target_root) const;

        std::vector<CanonicalSummary> list(const std::filesystem::path &target_root) const;

    private:
        void migrate_directory(DirectoryMigration &migration, bool dry_run,
                               std::vector<MigrationFailure> &failures) const;
        std::vector<std::filesystem::path> session_files(const std::filesystem::path &directory) const;

        std::vector<std::string> extensions_;
        PathResolver resolver_;
    };

} // namespace sessionguard
