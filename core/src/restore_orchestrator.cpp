#include "sessionguard/restore_orchestrator.hpp"

#include <array>

#include <spdlog/spdlog.h>

#include "sessionguard/error_codes.hpp"

namespace sessionguard
{

    namespace
    {
        constexpr auto kPreRestoreLabel = "pre-restore";

        struct StageMapping
        {
            RestoreStage stage;
            std::string_view label;
        };

        constexpr std::array<StageMapping, 10> kStageLabels{{
            {RestoreStage::Start, "START"},
            {RestoreStage::ValidateManifest, "VALIDATE_MANIFEST"},
            {RestoreStage::ValidateBackupIntact, "VALIDATE_BACKUP_INTACT"},
            {RestoreStage::Confirm, "CONFIRM"},
            {RestoreStage::PreRestoreBackup, "PRE_RESTORE_BACKUP"},
            {RestoreStage::RestoreLocal, "RESTORE_LOCAL"},
            {RestoreStage::RestoreRemote, "RESTORE_REMOTE"},
            {RestoreStage::PostVerify, "POST_VERIFY"},
            {RestoreStage::Done, "DONE"},
            {RestoreStage::Failed, "FAILED"},
        }};

        std::string strip_line_ending(std::string value)
        {
            while (!value.empty() && (value.back() == '\n' || value.back() == '\r'))
            {
                value.pop_back();
            }
            return value;
        }
    } // namespace

    std::string_view to_string(RestoreStage stage) noexcept
    {
        for (const auto &mapping : kStageLabels)
        {
            if (mapping.stage == stage)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    RestoreOrchestrator::RestoreOrchestrator(const GuardConfig &config, RemoteExecutor &remote,
                                             BackupOrchestrator &backups, ConfirmationPrompt confirm, Clock clock)
        : config_(config),
          remote_(remote),
          backups_(backups),
          confirm_(std::move(confirm)),
          clock_(std::move(clock)),
          counter_(config.extensions, &remote),
          writer_(&remote)
    {
    }

    void RestoreOrchestrator::validate_backup_intact(const Manifest &manifest, bool restore_local,
                                                     bool restore_remote) const
    {
        if (restore_local && !writer_.exists(Location::local(manifest.local.path)))
        {
            throw GuardError(ErrorCode::NotFound, "Local backup directory not found: " + manifest.local.path);
        }
        if (!restore_remote)
        {
            return;
        }
        if (!manifest.remote.host.empty() && manifest.remote.host != remote_.describe())
        {
            throw GuardError(ErrorCode::InvalidArgument, "Backup " + manifest.timestamp + " was taken on " +
                                                             manifest.remote.host + ", not " + remote_.describe());
        }
        if (!writer_.exists(Location::remote(remote_.describe(), manifest.remote.path)))
        {
            throw GuardError(ErrorCode::NotFound, "Remote backup directory not found on " + remote_.describe() + ": " +
                                                      manifest.remote.path);
        }
    }

    SideRestoreResult RestoreOrchestrator::restore_side(const Location &live, const Location &backup,
                                                        std::uint64_t expected, const std::string &time_tag) const
    {
        spdlog::info("Restoring {} sessions from {}", to_string(live.side), backup.display());
        const auto replaced = writer_.replace_live(live, backup, time_tag);
        return SideRestoreResult{
            .performed = true,
            .live_path = live.path,
            .displaced_path = replaced.displaced_path,
            .expected_count = expected,
            .actual_count = 0,
        };
    }

    RestoreResult RestoreOrchestrator::restore(const std::string &timestamp, bool restore_local, bool restore_remote)
    {
        stage_ = RestoreStage::Start;
        if (!restore_local && !restore_remote)
        {
            throw GuardError(ErrorCode::InvalidArgument, "Nothing to restore: both sides were excluded");
        }

        RestoreResult result;
        try
        {
            stage_ = RestoreStage::ValidateManifest;
            result.target_manifest = backups_.manifests().read(timestamp);
            const auto &manifest = result.target_manifest;
            if (!manifest.integrity_verified)
            {
                throw GuardError(ErrorCode::IntegrityFailure,
                                 "Backup " + timestamp + " was never integrity-verified; refusing to restore it");
            }

            stage_ = RestoreStage::ValidateBackupIntact;
            validate_backup_intact(manifest, restore_local, restore_remote);
            spdlog::info("Backup validation passed for timestamp {}", timestamp);

            stage_ = RestoreStage::Confirm;
            const RestorePreview preview{.manifest = manifest,
                                         .restore_local = restore_local,
                                         .restore_remote = restore_remote};
            const auto answer = confirm_ ? strip_line_ending(confirm_(preview)) : std::string{};
            if (answer != kRestoreConfirmationPhrase)
            {
                throw GuardError(ErrorCode::UserCancelled, "Restore cancelled - current sessions preserved");
            }

            stage_ = RestoreStage::PreRestoreBackup;
            try
            {
                result.pre_restore_backup = backups_.create_backup(kPreRestoreLabel);
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Pre-restore safety backup failed, not touching current sessions: {}", ex.what());
                throw;
            }
            spdlog::info("Pre-restore safety backup created: {}", result.pre_restore_backup.timestamp);

            const auto time_tag = format_backup_timestamp(clock_());
            stage_ = RestoreStage::RestoreLocal;
            if (restore_local)
            {
                result.local = restore_side(Location::local(config_.sessions_dir.string()),
                                            Location::local(manifest.local.path), manifest.local.session_count,
                                            time_tag);
            }

            stage_ = RestoreStage::RestoreRemote;
            if (restore_remote)
            {
                result.remote = restore_side(Location::remote(remote_.describe(), config_.remote_sessions_dir),
                                             Location::remote(remote_.describe(), manifest.remote.path),
                                             manifest.remote.session_count, time_tag);
            }

            stage_ = RestoreStage::PostVerify;
            for (auto *side : {&result.local, &result.remote})
            {
                if (!side->performed)
                {
                    continue;
                }
                const bool remote_side = side == &result.remote;
                const auto live = remote_side ? Location::remote(remote_.describe(), side->live_path)
                                              : Location::local(side->live_path);
                side->actual_count = counter_.count_and_size(live).file_count;
                if (side->verified())
                {
                    spdlog::info("{} sessions restored: {} files", to_string(live.side), side->actual_count);
                }
                else
                {
                    spdlog::error("{} restore verification failed on {}: expected {}, found {}; previous sessions kept "
                                  "at {}",
                                  to_string(live.side), live.display(), side->expected_count, side->actual_count,
                                  side->displaced_path.value_or("(none)"));
                }
            }
            stage_ = RestoreStage::Done;
            return result;
        }
        catch (...)
        {
            failed_stage_ = stage_;
            stage_ = RestoreStage::Failed;
            throw;
        }
    }

} // namespace sessionguard
