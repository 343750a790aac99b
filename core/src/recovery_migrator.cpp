#include "sessionguard/recovery_migrator.hpp"

#include <algorithm>
#include <array>

#include <spdlog/spdlog.h>

#include "sessionguard/error_codes.hpp"
#include "sessionguard/session_counter.hpp"

namespace sessionguard
{

    namespace
    {
        constexpr auto kLegacyDir = "legacy";

        struct ActionMapping
        {
            FileAction action;
            std::string_view label;
        };

        constexpr std::array<ActionMapping, 4> kActionLabels{{
            {FileAction::Copied, "copied"},
            {FileAction::Updated, "updated"},
            {FileAction::Unchanged, "unchanged"},
            {FileAction::KeptNewer, "kept-newer"},
        }};

        // Same name and size counts as already migrated; otherwise the newer file wins.
        FileAction plan_file(const std::filesystem::path &source, const std::filesystem::path &target)
        {
            if (!std::filesystem::exists(target))
            {
                return FileAction::Copied;
            }
            if (std::filesystem::file_size(source) == std::filesystem::file_size(target))
            {
                return FileAction::Unchanged;
            }
            if (std::filesystem::last_write_time(source) > std::filesystem::last_write_time(target))
            {
                return FileAction::Updated;
            }
            return FileAction::KeptNewer;
        }

        void copy_preserving_time(const std::filesystem::path &source, const std::filesystem::path &target)
        {
            std::filesystem::create_directories(target.parent_path());
            std::filesystem::copy_file(source, target, std::filesystem::copy_options::overwrite_existing);
            std::filesystem::last_write_time(target, std::filesystem::last_write_time(source));
        }

        std::string workspace_hint(const std::string &canonical_name)
        {
            std::string relative = canonical_name.substr(std::string(kCanonicalPrefix).size());
            std::replace(relative.begin(), relative.end(), '-', '/');
            return "~/" + relative;
        }
    } // namespace

    std::string_view to_string(FileAction action) noexcept
    {
        for (const auto &mapping : kActionLabels)
        {
            if (mapping.action == action)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    RecoveryMigrator::RecoveryMigrator(std::vector<std::string> extensions) : extensions_(std::move(extensions)) {}

    std::vector<std::filesystem::path> RecoveryMigrator::session_files(const std::filesystem::path &directory) const
    {
        std::vector<std::filesystem::path> files;
        for (std::filesystem::recursive_directory_iterator it(directory); it != std::filesystem::recursive_directory_iterator(); ++it)
        {
            if (it->is_regular_file() && has_session_extension(it->path(), extensions_))
            {
                files.push_back(it->path());
            }
        }
        std::sort(files.begin(), files.end());
        return files;
    }

    MigrationReport RecoveryMigrator::migrate(const std::filesystem::path &legacy_root,
                                              const std::filesystem::path &target_root, bool dry_run) const
    {
        MigrationReport report;
        report.dry_run = dry_run;

        spdlog::info("Starting session recovery: {} -> {}{}", legacy_root.string(), target_root.string(),
                     dry_run ? " (dry run)" : "");
        const auto directories = resolver_.enumerate(legacy_root);
        if (!dry_run)
        {
            std::filesystem::create_directories(target_root);
        }

        for (const auto &directory : directories)
        {
            DirectoryMigration migration{.source = directory,
                                         .target = target_root / directory.classification.canonical_name};
            migrate_directory(migration, dry_run, report.failures);
            report.copied += migration.copied;
            report.updated += migration.updated;
            report.unchanged += migration.unchanged;
            report.kept_newer += migration.kept_newer;
            report.directories.push_back(std::move(migration));
        }

        if (std::filesystem::is_directory(target_root))
        {
            for (const auto &entry : std::filesystem::directory_iterator(target_root))
            {
                if (entry.is_directory())
                {
                    ++report.target_directories;
                }
            }
            report.target_sessions = SessionCounter(extensions_, nullptr).count_local(target_root).file_count;
        }

        if (report.ok())
        {
            spdlog::info("Recovery complete: {} copied, {} updated, {} unchanged", report.copied, report.updated,
                         report.unchanged);
        }
        else
        {
            spdlog::error("Recovery finished with {} failed file(s)", report.failures.size());
        }
        return report;
    }

    void RecoveryMigrator::migrate_directory(DirectoryMigration &migration, bool dry_run,
                                             std::vector<MigrationFailure> &failures) const
    {
        const auto &source_root = migration.source.path;
        std::vector<std::filesystem::path> files;
        try
        {
            files = session_files(source_root);
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            failures.push_back(MigrationFailure{.source = source_root, .target = migration.target, .reason = ex.what()});
            spdlog::error("Cannot read {}: {}", source_root.string(), ex.what());
            return;
        }

        migration.session_files = files.size();
        if (files.empty())
        {
            migration.skipped = true;
            spdlog::info("SKIP: {} (no sessions)", source_root.string());
            return;
        }

        spdlog::info("MIGRATE: {} [{}] -> {} ({} sessions)", source_root.string(),
                     to_string(migration.source.classification.convention), migration.target.string(), files.size());
        for (const auto &file : files)
        {
            const auto target = migration.target / file.lexically_relative(source_root);
            try
            {
                const auto action = plan_file(file, target);
                switch (action)
                {
                case FileAction::Copied:
                    ++migration.copied;
                    break;
                case FileAction::Updated:
                    ++migration.updated;
                    break;
                case FileAction::Unchanged:
                    ++migration.unchanged;
                    break;
                case FileAction::KeptNewer:
                    ++migration.kept_newer;
                    break;
                }
                if (action == FileAction::Copied || action == FileAction::Updated)
                {
                    if (!dry_run)
                    {
                        copy_preserving_time(file, target);
                    }
                    spdlog::debug("{} {} -> {}", to_string(action), file.string(), target.string());
                }
            }
            catch (const std::filesystem::filesystem_error &ex)
            {
                failures.push_back(MigrationFailure{.source = file, .target = target, .reason = ex.what()});
                spdlog::error("Failed to copy {}: {}", file.string(), ex.what());
            }
        }
    }

    ValidationReport RecoveryMigrator::validate(const std::filesystem::path &target_root) const
    {
        if (!std::filesystem::is_directory(target_root))
        {
            throw GuardError(ErrorCode::NotFound, "Canonical session root does not exist: " + target_root.string());
        }

        ValidationReport report;
        SessionCounter counter(extensions_, nullptr);
        std::vector<std::filesystem::path> directories;
        for (const auto &entry : std::filesystem::directory_iterator(target_root))
        {
            if (entry.is_directory())
            {
                directories.push_back(entry.path());
            }
        }
        std::sort(directories.begin(), directories.end());

        for (const auto &directory : directories)
        {
            const auto name = directory.filename().string();
            if (name == kLegacyDir)
            {
                continue;
            }
            const auto classification = PathResolver::classify(name);
            if (classification.convention != NamingConvention::Canonical)
            {
                report.errors.push_back("Non-canonical session directory: " + name + " (expected " +
                                        classification.canonical_name + ")");
                continue;
            }
            if (counter.count_local(directory).file_count == 0)
            {
                report.warnings.push_back("Empty canonical session directory: " + name);
            }
        }
        return report;
    }

    std::vector<CanonicalSummary> RecoveryMigrator::list(const std::filesystem::path &target_root) const
    {
        std::vector<CanonicalSummary> summaries;
        if (!std::filesystem::is_directory(target_root))
        {
            return summaries;
        }
        SessionCounter counter(extensions_, nullptr);
        for (const auto &entry : std::filesystem::directory_iterator(target_root))
        {
            const auto name = entry.path().filename().string();
            if (!entry.is_directory() || PathResolver::classify(name).convention != NamingConvention::Canonical)
            {
                continue;
            }
            summaries.push_back(CanonicalSummary{.name = name,
                                                 .workspace_hint = workspace_hint(name),
                                                 .session_count = counter.count_local(entry.path()).file_count});
        }
        std::sort(summaries.begin(), summaries.end(), [](const CanonicalSummary &a, const CanonicalSummary &b)
                  { return a.name < b.name; });
        return summaries;
    }

} // namespace sessionguard
