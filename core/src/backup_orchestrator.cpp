#include "sessionguard/backup_orchestrator.hpp"

#include <array>

#include <spdlog/spdlog.h>

#include "sessionguard/error_codes.hpp"

namespace sessionguard
{

    namespace
    {
        struct StageMapping
        {
            BackupStage stage;
            std::string_view label;
        };

        constexpr std::array<StageMapping, 9> kStageLabels{{
            {BackupStage::Start, "START"},
            {BackupStage::LocalSnapshot, "LOCAL_SNAPSHOT"},
            {BackupStage::LocalVerify, "LOCAL_VERIFY"},
            {BackupStage::RemoteSnapshot, "REMOTE_SNAPSHOT"},
            {BackupStage::RemoteVerify, "REMOTE_VERIFY"},
            {BackupStage::IntegrityCheck, "INTEGRITY_CHECK"},
            {BackupStage::ManifestWrite, "MANIFEST_WRITE"},
            {BackupStage::Done, "DONE"},
            {BackupStage::Failed, "FAILED"},
        }};
    } // namespace

    std::string_view to_string(BackupStage stage) noexcept
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

    BackupOrchestrator::BackupOrchestrator(const GuardConfig &config, RemoteExecutor &remote, Clock clock)
        : config_(config),
          remote_(remote),
          clock_(std::move(clock)),
          counter_(config.extensions, &remote),
          probe_(config.extensions, &remote),
          writer_(&remote),
          store_(config.backup_root)
    {
    }

    std::string BackupOrchestrator::allocate_timestamp(const std::string &label) const
    {
        auto base = format_backup_timestamp(clock_());
        if (!label.empty())
        {
            base += "_" + label;
        }
        const auto taken = [&](const std::string &candidate)
        {
            return store_.exists(candidate) ||
                   std::filesystem::exists(config_.backup_root / SnapshotWriter::snapshot_name(Side::Local, candidate));
        };
        if (!taken(base))
        {
            return base;
        }
        for (int n = 2;; ++n)
        {
            auto candidate = base + "_" + std::to_string(n);
            if (!taken(candidate))
            {
                return candidate;
            }
        }
    }

    SnapshotResult BackupOrchestrator::snapshot_and_verify(const Location &source, const std::string &dest_root,
                                                           const std::string &timestamp, BackupStage verify_stage,
                                                           SessionTally &tally)
    {
        const bool present = writer_.exists(source);
        const SessionTally expected = present ? counter_.count_and_size(source) : SessionTally{};
        spdlog::info("{} sessions at {}: {}", to_string(source.side), source.display(), expected.file_count);

        auto snapshot = writer_.snapshot(source, dest_root, timestamp);
        written_.push_back(snapshot.destination);

        stage_ = verify_stage;
        tally = counter_.count_and_size(snapshot.destination);
        if (tally.file_count != expected.file_count)
        {
            throw VerificationMismatchError(to_string(source.side), expected.file_count, tally.file_count,
                                            "backup verification failed for " + snapshot.destination.display());
        }
        spdlog::info("{} backup verified: {} sessions ({})", to_string(source.side), tally.file_count,
                     format_size(tally.total_bytes));
        return snapshot;
    }

    Manifest BackupOrchestrator::create_backup(const std::string &label)
    {
        stage_ = BackupStage::Start;
        manifest_path_.reset();
        written_.clear();

        const auto timestamp = allocate_timestamp(label);
        spdlog::info("Creating emergency backup with timestamp {}", timestamp);

        try
        {
            stage_ = BackupStage::LocalSnapshot;
            SessionTally local_tally;
            const auto local = snapshot_and_verify(Location::local(config_.sessions_dir.string()),
                                                   config_.backup_root.string(), timestamp, BackupStage::LocalVerify,
                                                   local_tally);

            stage_ = BackupStage::RemoteSnapshot;
            SessionTally remote_tally;
            const auto remote = snapshot_and_verify(Location::remote(remote_.describe(), config_.remote_sessions_dir),
                                                    config_.remote_backup_root, timestamp, BackupStage::RemoteVerify,
                                                    remote_tally);

            stage_ = BackupStage::IntegrityCheck;
            for (const auto &destination : {local.destination, remote.destination})
            {
                if (!probe_.probe(destination, config_.sample_size))
                {
                    throw GuardError(ErrorCode::IntegrityFailure,
                                     "Backup integrity test failed for " + destination.display());
                }
            }

            stage_ = BackupStage::ManifestWrite;
            Manifest manifest{
                .timestamp = timestamp,
                .created_at = format_utc_iso8601(clock_()),
                .local = ManifestSide{.host = {},
                                      .path = local.destination.path,
                                      .session_count = local_tally.file_count,
                                      .size = local_tally.total_bytes},
                .remote = ManifestSide{.host = remote.destination.host,
                                       .path = remote.destination.path,
                                       .session_count = remote_tally.file_count,
                                       .size = remote_tally.total_bytes},
                .integrity_verified = true,
                .restore_command = config_.program_name + " restore " + timestamp,
            };
            manifest_path_ = store_.write(manifest);
            stage_ = BackupStage::Done;
            return manifest;
        }
        catch (...)
        {
            failed_stage_ = stage_;
            stage_ = BackupStage::Failed;
            spdlog::error("Emergency backup {} failed during {}", timestamp, to_string(failed_stage_));
            for (const auto &destination : written_)
            {
                writer_.mark_invalid(destination);
            }
            throw;
        }
    }

} // namespace sessionguard
