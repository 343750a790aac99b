#include <cassert>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "sessionguard/error_codes.hpp"
#include "sessionguard/recovery_migrator.hpp"
#include "test_helpers.hpp"

using namespace sessionguard;
using namespace sessionguard::test;

void run_recovery_tests();

namespace
{

    const std::vector<std::string> kExtensions{".jsonl", ".json"};

    void age_file(const std::filesystem::path &path, std::chrono::hours age)
    {
        std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now() - age);
    }

    void test_migration_merges_conventions()
    {
        const auto root = fresh_directory("migrate_merge");
        const auto legacy = root / "sessions";
        const auto target = root / "projects";
        write_file(legacy / "-home-tca-eon-nt" / "a.jsonl", "{\"from\":\"linux\"}\n");
        write_file(legacy / "-Users-terryli-eon-nt" / "b.jsonl", "{\"from\":\"mac\"}\n");
        std::filesystem::create_directories(legacy / "-home-tca-empty");

        const RecoveryMigrator migrator(kExtensions);
        const auto report = migrator.migrate(legacy, target);

        assert(report.ok());
        assert(!report.dry_run);
        assert(report.directories.size() == 3);
        assert(report.copied == 2);
        assert(report.target_sessions == 2);
        assert(report.target_directories == 1);
        assert(read_file(target / "~eon-nt" / "a.jsonl") == "{\"from\":\"linux\"}\n");
        assert(read_file(target / "~eon-nt" / "b.jsonl") == "{\"from\":\"mac\"}\n");
        assert(!std::filesystem::exists(target / "~empty"));

        // Sources are copied, never moved.
        assert(std::filesystem::exists(legacy / "-home-tca-eon-nt" / "a.jsonl"));
        assert(std::filesystem::exists(legacy / "-Users-terryli-eon-nt" / "b.jsonl"));

        bool saw_skip = false;
        for (const auto &directory : report.directories)
        {
            if (directory.source.path.filename() == "-home-tca-empty")
            {
                saw_skip = directory.skipped;
            }
        }
        assert(saw_skip);
        cleanup_path(root);
    }

    void test_migration_is_idempotent()
    {
        const auto root = fresh_directory("migrate_idempotent");
        const auto legacy = root / "sessions";
        const auto target = root / "projects";
        write_session(legacy / "-home-tca-eon-nt" / "a.jsonl", 50);
        write_session(legacy / "-home-tca-eon-nt" / "sub" / "c.jsonl", 70);
        write_session(legacy / "projects" / "-Users-terryli-scripts" / "d.json", 30);
        age_file(legacy / "-home-tca-eon-nt" / "a.jsonl", std::chrono::hours{48});

        const RecoveryMigrator migrator(kExtensions);
        const auto first = migrator.migrate(legacy, target);
        assert(first.copied == 3);
        const auto after_first = tree_contents(target);
        const auto copied_time = std::filesystem::last_write_time(target / "~eon-nt" / "a.jsonl");
        assert(copied_time == std::filesystem::last_write_time(legacy / "-home-tca-eon-nt" / "a.jsonl"));

        const auto second = migrator.migrate(legacy, target);
        assert(second.ok());
        assert(second.copied == 0);
        assert(second.updated == 0);
        assert(second.unchanged == 3);
        assert(tree_contents(target) == after_first);
        assert(std::filesystem::last_write_time(target / "~eon-nt" / "a.jsonl") == copied_time);
        assert(std::filesystem::exists(target / "~scripts" / "d.json"));
        cleanup_path(root);
    }

    void test_migration_newest_wins()
    {
        const auto root = fresh_directory("migrate_newest");
        const auto legacy = root / "sessions";
        const auto target = root / "projects";
        write_file(legacy / "-home-tca-eon-nt" / "grown.jsonl", "{\"turns\":2}\n{\"turns\":3}\n");
        write_file(target / "~eon-nt" / "grown.jsonl", "{\"turns\":1}\n");
        age_file(target / "~eon-nt" / "grown.jsonl", std::chrono::hours{2});

        write_file(legacy / "-home-tca-eon-nt" / "stale.jsonl", "{\"turns\":1}\n");
        write_file(target / "~eon-nt" / "stale.jsonl", "{\"turns\":1}\n{\"turns\":2}\n");
        age_file(legacy / "-home-tca-eon-nt" / "stale.jsonl", std::chrono::hours{2});

        const RecoveryMigrator migrator(kExtensions);
        const auto report = migrator.migrate(legacy, target);
        assert(report.updated == 1);
        assert(report.kept_newer == 1);
        assert(read_file(target / "~eon-nt" / "grown.jsonl") == "{\"turns\":2}\n{\"turns\":3}\n");
        assert(read_file(target / "~eon-nt" / "stale.jsonl") == "{\"turns\":1}\n{\"turns\":2}\n");
        assert(to_string(FileAction::KeptNewer) == "kept-newer");
        cleanup_path(root);
    }

    void test_migration_dry_run_writes_nothing()
    {
        const auto root = fresh_directory("migrate_dry_run");
        const auto legacy = root / "sessions";
        const auto target = root / "projects";
        write_session(legacy / "-home-tca-eon-nt" / "a.jsonl", 40);
        write_session(legacy / "-Users-terryli-eon-nt" / "b.jsonl", 40);

        const RecoveryMigrator migrator(kExtensions);
        const auto report = migrator.migrate(legacy, target, true);
        assert(report.dry_run);
        assert(report.copied == 2);
        assert(report.target_sessions == 0);
        assert(!std::filesystem::exists(target));

        assert(error_code_of([&] { (void)migrator.migrate(root / "missing", target); }) == ErrorCode::NotFound);
        cleanup_path(root);
    }

    void test_validate_and_list()
    {
        const auto root = fresh_directory("validate");
        write_session(root / "~eon-nt" / "a.jsonl", 40);
        write_session(root / "~eon-nt" / "b.jsonl", 40);
        write_session(root / "~scripts" / "c.jsonl", 40);
        std::filesystem::create_directories(root / "~empty");
        std::filesystem::create_directories(root / "legacy");

        const RecoveryMigrator migrator(kExtensions);
        auto report = migrator.validate(root);
        assert(report.ok());
        assert(report.warnings.size() == 1);

        const auto summaries = migrator.list(root);
        assert(summaries.size() == 3);
        assert(summaries[0].name == "~empty");
        assert(summaries[1].name == "~eon-nt");
        assert(summaries[1].workspace_hint == "~/eon/nt");
        assert(summaries[1].session_count == 2);
        assert(summaries[2].session_count == 1);

        write_session(root / "-home-tca-eon-nt" / "d.jsonl", 40);
        report = migrator.validate(root);
        assert(!report.ok());
        assert(report.errors.size() == 1);
        assert(report.errors[0].find("~eon-nt") != std::string::npos);

        assert(error_code_of([&] { (void)migrator.validate(root / "missing"); }) == ErrorCode::NotFound);
        assert(migrator.list(root / "missing").empty());
        cleanup_path(root);
    }

} // namespace

void run_recovery_tests()
{
    test_migration_merges_conventions();
    test_migration_is_idempotent();
    test_migration_newest_wins();
    test_migration_dry_run_writes_nothing();
    test_validate_and_list();
}
