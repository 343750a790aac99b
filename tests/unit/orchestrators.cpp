#include <cassert>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include "sessionguard/backup_orchestrator.hpp"
#include "sessionguard/error_codes.hpp"
#include "sessionguard/remote_executor.hpp"
#include "sessionguard/restore_orchestrator.hpp"
#include "test_helpers.hpp"

using namespace sessionguard;
using namespace sessionguard::test;

void run_orchestrator_tests();

namespace
{

    const auto kEpoch = std::chrono::system_clock::time_point{std::chrono::seconds{1736847012}};

    // Each call returns a time one second after the previous one.
    Clock ticking_clock()
    {
        auto current = std::make_shared<std::chrono::system_clock::time_point>(kEpoch);
        return [current]
        {
            *current += std::chrono::seconds{1};
            return *current;
        };
    }

    Clock frozen_clock()
    {
        return [] { return kEpoch; };
    }

    // Removes one session file from the remote backup tree right after it is copied,
    // simulating a copy that silently lost data.
    class LossyExecutor : public ShellExecutor
    {
    public:
        explicit LossyExecutor(std::filesystem::path backup_root) : backup_root_(std::move(backup_root)) {}

        CommandResult run(const std::string &command) override
        {
            auto result = ShellExecutor::run(command);
            if (!dropped_ && command.find("cp -R") != std::string::npos)
            {
                for (const auto &entry : std::filesystem::recursive_directory_iterator(backup_root_))
                {
                    if (entry.is_regular_file())
                    {
                        std::filesystem::remove(entry.path());
                        dropped_ = true;
                        break;
                    }
                }
            }
            return result;
        }

    private:
        std::filesystem::path backup_root_;
        bool dropped_{};
    };

    // Fails every attempt to set an unverified snapshot aside.
    class StuckCleanupExecutor : public LossyExecutor
    {
    public:
        using LossyExecutor::LossyExecutor;

        CommandResult run(const std::string &command) override
        {
            if (command.find(".invalid") != std::string::npos)
            {
                throw GuardError(ErrorCode::CommandFailed, "mv: cannot move snapshot: Read-only file system");
            }
            return LossyExecutor::run(command);
        }
    };

    // Answers every command the way ssh does when the host cannot be reached.
    class UnreachableExecutor : public RemoteExecutor
    {
    public:
        CommandResult run(const std::string &) override
        {
            CommandResult result;
            result.exit_code = 255;
            result.err = "ssh: connect to host tca port 22: Connection refused\n";
            return result;
        }

        std::string describe() const override { return "tca"; }

        bool is_connectivity_failure(const CommandResult &result) const override
        {
            return result.timed_out || result.exit_code == 255;
        }
    };

    struct Workspace
    {
        explicit Workspace(const std::string &name) : root(fresh_directory(name))
        {
            config.sessions_dir = root / "local_sessions";
            config.backup_root = root / "local_backups";
            config.remote_host = kLocalExecutionHost;
            config.remote_sessions_dir = (root / "remote_sessions").string();
            config.remote_backup_root = (root / "remote_backups").string();
            config.legacy_root = root / "legacy";
            config.target_root = root / "projects";
        }

        ~Workspace() { cleanup_path(root); }

        std::filesystem::path local_live() const { return config.sessions_dir; }
        std::filesystem::path remote_live() const { return config.remote_sessions_dir; }
        std::filesystem::path remote_backups() const { return config.remote_backup_root; }

        std::filesystem::path root;
        GuardConfig config;
    };

    // 8 x 283 + 4 x 284 = 3,400 bytes.
    void populate_twelve_sessions(const std::filesystem::path &directory)
    {
        for (int i = 0; i < 12; ++i)
        {
            write_session(directory / ("session_" + std::to_string(i) + ".jsonl"), i < 8 ? 283 : 284);
        }
    }

    std::size_t count_files(const std::filesystem::path &directory)
    {
        return tree_contents(directory).size();
    }

    std::string confirm_phrase(const RestorePreview &)
    {
        return std::string(kRestoreConfirmationPhrase) + "\n";
    }

    void test_stage_labels()
    {
        assert(to_string(BackupStage::LocalSnapshot) == "LOCAL_SNAPSHOT");
        assert(to_string(BackupStage::IntegrityCheck) == "INTEGRITY_CHECK");
        assert(to_string(RestoreStage::PreRestoreBackup) == "PRE_RESTORE_BACKUP");
        assert(to_string(RestoreStage::PostVerify) == "POST_VERIFY");
    }

    void test_backup_counts_match_sources()
    {
        Workspace ws("backup_counts");
        populate_twelve_sessions(ws.local_live());
        for (int i = 0; i < 5; ++i)
        {
            write_session(ws.remote_live() / "nested" / ("r" + std::to_string(i) + ".jsonl"), 100);
        }
        write_file(ws.local_live() / "README.txt", "not a session");

        ShellExecutor shell;
        BackupOrchestrator backups(ws.config, shell, ticking_clock());
        const auto manifest = backups.create_backup();

        assert(backups.stage() == BackupStage::Done);
        assert(manifest.integrity_verified);
        assert(manifest.local.session_count == 12);
        assert(manifest.local.size == 3400);
        assert(manifest.remote.session_count == 5);
        assert(manifest.remote.size == 500);
        assert(manifest.remote.host == "local");
        assert(manifest.restore_command == "sessionguard restore " + manifest.timestamp);
        assert(std::filesystem::path(manifest.local.path) == ws.config.backup_root / ("local_" + manifest.timestamp));
        assert(std::filesystem::path(manifest.remote.path) == ws.remote_backups() / ("remote_" + manifest.timestamp));
        assert(count_files(manifest.local.path) == 13);
        assert(tree_contents(manifest.remote.path) == tree_contents(ws.remote_live()));

        assert(backups.manifest_path());
        assert(*backups.manifest_path() == backups.manifests().path_for(manifest.timestamp));
        const auto stored = backups.manifests().read(manifest.timestamp);
        assert(stored.local.session_count == 12);
        assert(stored.remote.path == manifest.remote.path);
    }

    void test_backup_timestamps_never_collide()
    {
        Workspace ws("backup_collide");
        populate_twelve_sessions(ws.local_live());
        populate_twelve_sessions(ws.remote_live());

        ShellExecutor shell;
        BackupOrchestrator backups(ws.config, shell, frozen_clock());
        const auto first = backups.create_backup();
        const auto second = backups.create_backup();
        const auto labelled = backups.create_backup("pre-restore");

        assert(second.timestamp == first.timestamp + "_2");
        assert(labelled.timestamp == first.timestamp + "_pre-restore");
        assert(backups.manifests().list_all().size() == 3);
        assert(count_files(second.local.path) == 12);
    }

    void test_backup_of_missing_remote_store()
    {
        Workspace ws("backup_missing_remote");
        populate_twelve_sessions(ws.local_live());

        ShellExecutor shell;
        BackupOrchestrator backups(ws.config, shell, ticking_clock());
        const auto manifest = backups.create_backup();
        assert(manifest.local.session_count == 12);
        assert(manifest.remote.session_count == 0);
        assert(std::filesystem::is_directory(manifest.remote.path));
    }

    void test_backup_verification_mismatch_aborts()
    {
        Workspace ws("backup_mismatch");
        populate_twelve_sessions(ws.local_live());
        for (int i = 0; i < 5; ++i)
        {
            write_session(ws.remote_live() / ("r" + std::to_string(i) + ".jsonl"), 50);
        }

        LossyExecutor lossy(ws.remote_backups());
        BackupOrchestrator backups(ws.config, lossy, frozen_clock());
        const auto timestamp = format_backup_timestamp(kEpoch);

        bool caught = false;
        try
        {
            (void)backups.create_backup();
        }
        catch (const VerificationMismatchError &ex)
        {
            caught = true;
            assert(ex.side() == "remote");
            assert(ex.expected() == 5);
            assert(ex.actual() == 4);
        }
        assert(caught);
        assert(backups.stage() == BackupStage::Failed);
        assert(backups.failed_stage() == BackupStage::RemoteVerify);
        assert(!backups.manifest_path());
        assert(backups.manifests().list_all().empty());

        assert(!std::filesystem::exists(ws.config.backup_root / ("local_" + timestamp)));
        assert(std::filesystem::is_directory(ws.config.backup_root / ("local_" + timestamp + ".invalid")));
        assert(!std::filesystem::exists(ws.remote_backups() / ("remote_" + timestamp)));
        assert(std::filesystem::is_directory(ws.remote_backups() / ("remote_" + timestamp + ".invalid")));
    }

    void test_backup_cleanup_failure_keeps_original_error()
    {
        Workspace ws("backup_stuck_cleanup");
        populate_twelve_sessions(ws.local_live());
        populate_twelve_sessions(ws.remote_live());

        StuckCleanupExecutor stuck(ws.remote_backups());
        BackupOrchestrator backups(ws.config, stuck, frozen_clock());
        const auto timestamp = format_backup_timestamp(kEpoch);

        bool caught = false;
        try
        {
            (void)backups.create_backup();
        }
        catch (const VerificationMismatchError &ex)
        {
            caught = true;
            assert(ex.expected() == 12);
            assert(ex.actual() == 11);
        }
        assert(caught);
        assert(backups.failed_stage() == BackupStage::RemoteVerify);
        assert(std::filesystem::is_directory(ws.config.backup_root / ("local_" + timestamp + ".invalid")));
        assert(std::filesystem::is_directory(ws.remote_backups() / ("remote_" + timestamp)));
    }

    void test_backup_unreachable_remote_host()
    {
        Workspace ws("backup_unreachable");
        populate_twelve_sessions(ws.local_live());

        UnreachableExecutor unreachable;
        BackupOrchestrator backups(ws.config, unreachable, frozen_clock());
        assert(error_code_of([&] { (void)backups.create_backup(); }) == ErrorCode::ConnectivityFailure);
        assert(backups.stage() == BackupStage::Failed);
        assert(backups.failed_stage() == BackupStage::RemoteSnapshot);
        assert(!backups.manifest_path());
        assert(backups.manifests().list_all().empty());

        const auto timestamp = format_backup_timestamp(kEpoch);
        assert(!std::filesystem::exists(ws.config.backup_root / ("local_" + timestamp)));
        assert(count_files(ws.config.backup_root / ("local_" + timestamp + ".invalid")) == 12);
        assert(count_files(ws.local_live()) == 12);
    }

    void test_backup_follows_symlinked_stores()
    {
        Workspace ws("backup_symlinked");
        const auto local_target = ws.root / "local_target";
        const auto remote_target = ws.root / "remote_target";
        for (int i = 0; i < 3; ++i)
        {
            write_session(local_target / ("s" + std::to_string(i) + ".jsonl"), 100);
            write_session(remote_target / ("s" + std::to_string(i) + ".jsonl"), 100);
        }
        std::filesystem::create_directory_symlink(local_target, ws.local_live());
        std::filesystem::create_directory_symlink(remote_target, ws.remote_live());

        ShellExecutor shell;
        const auto clock = ticking_clock();
        BackupOrchestrator backups(ws.config, shell, clock);
        const auto manifest = backups.create_backup();
        assert(manifest.local.session_count == 3);
        assert(manifest.remote.session_count == 3);
        assert(!std::filesystem::is_symlink(manifest.local.path));
        assert(!std::filesystem::is_symlink(manifest.remote.path));

        // The backup must outlive the directories the live links point at.
        std::filesystem::remove_all(local_target);
        std::filesystem::remove_all(remote_target);
        assert(count_files(manifest.local.path) == 3);
        assert(count_files(manifest.remote.path) == 3);

        // Restoring over a link moves the link aside and leaves its target alone.
        write_session(local_target / "later.jsonl", 50);
        RestoreOrchestrator restorer(ws.config, shell, backups, confirm_phrase, clock);
        const auto result = restorer.restore(manifest.timestamp, true, false);
        assert(result.verified());
        assert(!std::filesystem::is_symlink(ws.local_live()));
        assert(count_files(ws.local_live()) == 3);
        assert(result.local.displaced_path);
        assert(std::filesystem::is_symlink(*result.local.displaced_path));
        assert(count_files(local_target) == 1);
    }

    void test_backup_integrity_failure_aborts()
    {
        Workspace ws("backup_integrity");
        populate_twelve_sessions(ws.local_live());
        write_file(ws.local_live() / "a_broken.jsonl", "{\"role\": \"user\", \"content\": ");
        populate_twelve_sessions(ws.remote_live());

        ShellExecutor shell;
        BackupOrchestrator backups(ws.config, shell, frozen_clock());
        assert(error_code_of([&] { (void)backups.create_backup(); }) == ErrorCode::IntegrityFailure);
        assert(backups.failed_stage() == BackupStage::IntegrityCheck);
        assert(backups.manifests().list_all().empty());

        const auto timestamp = format_backup_timestamp(kEpoch);
        assert(std::filesystem::is_directory(ws.config.backup_root / ("local_" + timestamp + ".invalid")));
        assert(std::filesystem::is_directory(ws.remote_backups() / ("remote_" + timestamp + ".invalid")));
    }

    void test_restore_into_empty_stores()
    {
        Workspace ws("restore_scenario");
        populate_twelve_sessions(ws.local_live());
        populate_twelve_sessions(ws.remote_live());

        ShellExecutor shell;
        const auto clock = ticking_clock();
        BackupOrchestrator backups(ws.config, shell, clock);
        const auto backup = backups.create_backup();
        assert(backup.local.size == 3400);
        assert(backup.remote.size == 3400);

        // Sessions vanish from both live stores; the directories stay.
        for (const auto &live : {ws.local_live(), ws.remote_live()})
        {
            for (const auto &entry : std::filesystem::directory_iterator(live))
            {
                std::filesystem::remove_all(entry.path());
            }
        }

        RestoreOrchestrator restorer(ws.config, shell, backups, confirm_phrase, clock);
        const auto result = restorer.restore(backup.timestamp);

        assert(restorer.stage() == RestoreStage::Done);
        assert(result.verified());
        assert(result.target_manifest.timestamp == backup.timestamp);
        assert(result.local.performed && result.remote.performed);
        assert(result.local.actual_count == 12);
        assert(result.remote.actual_count == 12);
        assert(count_files(ws.local_live()) == 12);
        assert(count_files(ws.remote_live()) == 12);

        assert(result.pre_restore_backup.timestamp.find("_pre-restore") != std::string::npos);
        assert(result.pre_restore_backup.local.session_count == 0);
        assert(result.pre_restore_backup.remote.session_count == 0);

        for (const auto &side : {result.local, result.remote})
        {
            assert(side.displaced_path);
            assert(side.displaced_path->find(".backup.") != std::string::npos);
            assert(std::filesystem::is_directory(*side.displaced_path));
            assert(count_files(*side.displaced_path) == 0);
        }
        assert(backups.manifests().list_all().size() == 2);
    }

    void test_restore_post_verify_mismatch_is_reported()
    {
        Workspace ws("restore_post_verify");
        populate_twelve_sessions(ws.local_live());
        populate_twelve_sessions(ws.remote_live());

        ShellExecutor shell;
        const auto clock = ticking_clock();
        BackupOrchestrator backups(ws.config, shell, clock);
        auto manifest = backups.create_backup();
        const auto backup_contents = tree_contents(manifest.local.path);

        // The record now promises one session more than the snapshot holds.
        manifest.local.session_count += 1;
        backups.manifests().write(manifest);
        write_session(ws.local_live() / "newer.jsonl", 120);
        const auto local_before = tree_contents(ws.local_live());

        RestoreOrchestrator restorer(ws.config, shell, backups, confirm_phrase, clock);
        const auto result = restorer.restore(manifest.timestamp);

        assert(restorer.stage() == RestoreStage::Done);
        assert(!result.verified());
        assert(!result.local.verified());
        assert(result.remote.verified());
        assert(result.local.expected_count == 13);
        assert(result.local.actual_count == 12);

        // Nothing is rolled back: the backup stays live and the prior state stays recoverable.
        assert(tree_contents(ws.local_live()) == backup_contents);
        assert(result.local.displaced_path);
        assert(tree_contents(*result.local.displaced_path) == local_before);
        assert(result.pre_restore_backup.local.session_count == 13);
        assert(backups.manifests().exists(result.pre_restore_backup.timestamp));
        assert(backups.manifests().list_all().size() == 2);
    }

    void test_restore_requires_exact_phrase()
    {
        Workspace ws("restore_confirm");
        populate_twelve_sessions(ws.local_live());
        populate_twelve_sessions(ws.remote_live());

        ShellExecutor shell;
        BackupOrchestrator backups(ws.config, shell, ticking_clock());
        const auto backup = backups.create_backup();
        write_session(ws.local_live() / "newer.jsonl", 120);
        const auto local_before = tree_contents(ws.local_live());
        const auto remote_before = tree_contents(ws.remote_live());

        bool prompted = false;
        RestoreOrchestrator restorer(ws.config, shell, backups,
                                     [&](const RestorePreview &preview)
                                     {
                                         prompted = true;
                                         assert(preview.manifest.timestamp == backup.timestamp);
                                         assert(preview.restore_local && preview.restore_remote);
                                         return std::string("i understand restore will replace current sessions");
                                     });
        assert(error_code_of([&] { (void)restorer.restore(backup.timestamp); }) == ErrorCode::UserCancelled);
        assert(prompted);
        assert(restorer.failed_stage() == RestoreStage::Confirm);

        assert(tree_contents(ws.local_live()) == local_before);
        assert(tree_contents(ws.remote_live()) == remote_before);
        assert(backups.manifests().list_all().size() == 1);
        for (const auto &entry : std::filesystem::directory_iterator(ws.root))
        {
            assert(entry.path().filename().string().find(".backup.") == std::string::npos);
        }

        RestoreOrchestrator silent(ws.config, shell, backups, [](const RestorePreview &) { return std::string{}; });
        assert(error_code_of([&] { (void)silent.restore(backup.timestamp); }) == ErrorCode::UserCancelled);
        assert(tree_contents(ws.local_live()) == local_before);
    }

    void test_restore_detects_divergence()
    {
        Workspace ws("restore_divergence");
        populate_twelve_sessions(ws.local_live());
        populate_twelve_sessions(ws.remote_live());

        ShellExecutor shell;
        BackupOrchestrator backups(ws.config, shell, ticking_clock());
        const auto backup = backups.create_backup();

        bool prompted = false;
        RestoreOrchestrator restorer(ws.config, shell, backups,
                                     [&](const RestorePreview &preview)
                                     {
                                         prompted = true;
                                         return confirm_phrase(preview);
                                     });

        assert(error_code_of([&] { (void)restorer.restore("20200101_000000"); }) == ErrorCode::NotFound);
        assert(restorer.failed_stage() == RestoreStage::ValidateManifest);

        std::filesystem::remove_all(backup.remote.path);
        assert(error_code_of([&] { (void)restorer.restore(backup.timestamp); }) == ErrorCode::NotFound);
        assert(restorer.failed_stage() == RestoreStage::ValidateBackupIntact);
        assert(error_code_of([&] { (void)restorer.restore(backup.timestamp, false, true); }) == ErrorCode::NotFound);

        std::filesystem::remove_all(backup.local.path);
        assert(error_code_of([&] { (void)restorer.restore(backup.timestamp, true, false); }) == ErrorCode::NotFound);
        assert(!prompted);
        assert(count_files(ws.local_live()) == 12);
        assert(backups.manifests().list_all().size() == 1);
    }

    void test_restore_rejects_untrusted_manifests()
    {
        Workspace ws("restore_untrusted");
        populate_twelve_sessions(ws.local_live());
        populate_twelve_sessions(ws.remote_live());

        ShellExecutor shell;
        BackupOrchestrator backups(ws.config, shell, ticking_clock());
        auto manifest = backups.create_backup();
        RestoreOrchestrator restorer(ws.config, shell, backups, confirm_phrase);

        assert(error_code_of([&] { (void)restorer.restore(manifest.timestamp, false, false); }) ==
               ErrorCode::InvalidArgument);

        manifest.remote.host = "tca";
        backups.manifests().write(manifest);
        assert(error_code_of([&] { (void)restorer.restore(manifest.timestamp); }) == ErrorCode::InvalidArgument);

        manifest.remote.host = kLocalExecutionHost;
        manifest.integrity_verified = false;
        backups.manifests().write(manifest);
        assert(error_code_of([&] { (void)restorer.restore(manifest.timestamp); }) == ErrorCode::IntegrityFailure);
        assert(restorer.failed_stage() == RestoreStage::ValidateManifest);

        write_file(backups.manifests().path_for(manifest.timestamp), "{\"timestamp\": ");
        assert(error_code_of([&] { (void)restorer.restore(manifest.timestamp); }) == ErrorCode::ManifestCorrupt);
    }

    void test_restore_is_reversible()
    {
        Workspace ws("restore_reversible");
        write_session(ws.local_live() / "a.jsonl", 40);
        write_session(ws.local_live() / "project" / "b.jsonl", 60);
        write_session(ws.remote_live() / "c.jsonl", 80);

        ShellExecutor shell;
        const auto clock = ticking_clock();
        BackupOrchestrator backups(ws.config, shell, clock);
        const auto original = backups.create_backup();
        const auto local_original = tree_contents(ws.local_live());
        const auto remote_original = tree_contents(ws.remote_live());

        write_session(ws.local_live() / "d.jsonl", 90);
        write_session(ws.remote_live() / "c.jsonl", 120);
        std::filesystem::remove(ws.local_live() / "a.jsonl");
        const auto local_changed = tree_contents(ws.local_live());
        const auto remote_changed = tree_contents(ws.remote_live());

        RestoreOrchestrator restorer(ws.config, shell, backups, confirm_phrase, clock);
        const auto first = restorer.restore(original.timestamp);
        assert(first.verified());
        assert(tree_contents(ws.local_live()) == local_original);
        assert(tree_contents(ws.remote_live()) == remote_original);

        const auto undo = restorer.restore(first.pre_restore_backup.timestamp);
        assert(undo.verified());
        assert(tree_contents(ws.local_live()) == local_changed);
        assert(tree_contents(ws.remote_live()) == remote_changed);
        assert(*first.local.displaced_path != *undo.local.displaced_path);
    }

    void test_restore_single_side()
    {
        Workspace ws("restore_single_side");
        populate_twelve_sessions(ws.local_live());
        populate_twelve_sessions(ws.remote_live());

        ShellExecutor shell;
        const auto clock = ticking_clock();
        BackupOrchestrator backups(ws.config, shell, clock);
        const auto backup = backups.create_backup();

        std::filesystem::remove_all(ws.local_live());
        write_session(ws.remote_live() / "extra.jsonl", 30);
        const auto remote_before = tree_contents(ws.remote_live());

        RestoreOrchestrator restorer(ws.config, shell, backups, confirm_phrase, clock);
        const auto result = restorer.restore(backup.timestamp, true, false);
        assert(result.verified());
        assert(result.local.performed);
        assert(!result.local.displaced_path);
        assert(!result.remote.performed);
        assert(count_files(ws.local_live()) == 12);
        assert(tree_contents(ws.remote_live()) == remote_before);
    }

} // namespace

void run_orchestrator_tests()
{
    test_stage_labels();
    test_backup_counts_match_sources();
    test_backup_timestamps_never_collide();
    test_backup_of_missing_remote_store();
    test_backup_verification_mismatch_aborts();
    test_backup_cleanup_failure_keeps_original_error();
    test_backup_unreachable_remote_host();
    test_backup_follows_symlinked_stores();
    test_backup_integrity_failure_aborts();
    test_restore_into_empty_stores();
    test_restore_post_verify_mismatch_is_reported();
    test_restore_requires_exact_phrase();
    test_restore_detects_divergence();
    test_restore_rejects_untrusted_manifests();
    test_restore_is_reversible();
    test_restore_single_side();
}
