#include "sessionguard/cli/commands.hpp"

#include <iostream>

#include <spdlog/spdlog.h>

#include "sessionguard/path_resolver.hpp"
#include "sessionguard/recovery_migrator.hpp"

namespace sessionguard::cli
{

    int run_migrate(const GuardConfig &config, const std::vector<std::string> &args)
    {
        bool dry_run = false;
        for (const auto &arg : args)
        {
            if (arg != "--dry-run")
            {
                std::cout << "ERROR: invalid_usage" << std::endl;
                std::cout << "Usage: migrate [--dry-run]" << std::endl;
                return kExitFailure;
            }
            dry_run = true;
        }

        const RecoveryMigrator migrator(config.extensions);
        const auto report = migrator.migrate(config.legacy_root, config.target_root, dry_run);

        for (const auto &directory : report.directories)
        {
            const auto &classification = directory.source.classification;
            std::cout << (directory.skipped ? "SKIP     " : "MIGRATE  ") << directory.source.path.filename().string()
                      << " [" << to_string(classification.convention) << "] -> " << classification.canonical_name;
            if (!directory.skipped)
            {
                std::cout << " (" << directory.session_files << " sessions: " << directory.copied << " copied, "
                          << directory.updated << " updated, " << directory.unchanged << " unchanged, "
                          << directory.kept_newer << " kept newer)";
            }
            std::cout << std::endl;
        }
        for (const auto &failure : report.failures)
        {
            std::cout << "FAILED   " << failure.source.string() << ": " << failure.reason << std::endl;
        }

        std::cout << (dry_run ? "Dry run: " : "") << report.copied << " copied, " << report.updated << " updated, "
                  << report.unchanged << " unchanged, " << report.kept_newer << " kept newer, "
                  << report.failures.size() << " failed" << std::endl;
        if (!dry_run)
        {
            std::cout << "Canonical tree: " << report.target_directories << " directories, " << report.target_sessions
                      << " sessions" << std::endl;
        }
        return report.ok() ? kExitOk : kExitPartial;
    }

    int run_canonicalize(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            std::cout << "ERROR: invalid_usage" << std::endl;
            std::cout << "Usage: canonicalize <NAME>" << std::endl;
            return kExitFailure;
        }
        const auto classification = PathResolver::classify(args.front());
        std::cout << classification.canonical_name << " (" << to_string(classification.convention) << ")"
                  << std::endl;
        return classification.convention == NamingConvention::Unknown ? kExitFailure : kExitOk;
    }

    int run_validate(const GuardConfig &config)
    {
        const RecoveryMigrator migrator(config.extensions);
        const auto report = migrator.validate(config.target_root);
        for (const auto &warning : report.warnings)
        {
            std::cout << "WARNING: " << warning << std::endl;
        }
        for (const auto &error : report.errors)
        {
            std::cout << "ERROR: " << error << std::endl;
        }
        if (report.ok())
        {
            std::cout << "OK" << std::endl;
            return kExitOk;
        }
        spdlog::error("{} non-canonical directories under {}", report.errors.size(), config.target_root.string());
        return kExitFailure;
    }

    int run_sessions(const GuardConfig &config)
    {
        const RecoveryMigrator migrator(config.extensions);
        const auto summaries = migrator.list(config.target_root);
        if (summaries.empty())
        {
            std::cout << "No canonical session directories in " << config.target_root.string() << std::endl;
            return kExitOk;
        }
        for (const auto &summary : summaries)
        {
            std::cout << summary.name << "  " << summary.workspace_hint << "  (" << summary.session_count
                      << " sessions)" << std::endl;
        }
        return kExitOk;
    }

} // namespace sessionguard::cli
