#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sessionguard/config.hpp"
#include "sessionguard/integrity_probe.hpp"
#include "sessionguard/manifest.hpp"
#include "sessionguard/manifest_store.hpp"
#include "sessionguard/remote_executor.hpp"
#include "sessionguard/session_counter.hpp"
#include "sessionguard/snapshot_writer.hpp"

namespace sessionguard
{

    using Clock = std::function<std::chrono::system_clock::time_point()>;

    enum class BackupStage
    {
        Start,
        LocalSnapshot,
        LocalVerify,
        RemoteSnapshot,
        RemoteVerify,
        IntegrityCheck,
        ManifestWrite,
        Done,
        Failed
    };

    std::string_view to_string(BackupStage stage) noexcept;

    // Creates a verified local + remote snapshot pair and its manifest. All or nothing:
    // any failed step aborts the run and no manifest is written. Snapshots already copied
    // are renamed to *.invalid and left in place for inspection.
    class BackupOrchestrator
    {
    public:
        BackupOrchestrator(const GuardConfig &config, RemoteExecutor &remote,
                           Clock clock = [] { return std::chrono::system_clock::now(); });

        // `label` is appended to the timestamp, e.g. "20250114_093012_pre-restore".
        Manifest create_backup(const std::string &label = {});

        BackupStage stage() const noexcept { return stage_; }
        // Stage that was running when the last backup failed.
        BackupStage failed_stage() const noexcept { return failed_stage_; }
        const std::optional<std::filesystem::path> &manifest_path() const noexcept { return manifest_path_; }

        const ManifestStore &manifests() const noexcept { return store_; }

    private:
        std::string allocate_timestamp(const std::string &label) const;
        SnapshotResult snapshot_and_verify(const Location &source, const std::string &dest_root,
                                           const std::string &timestamp, BackupStage verify_stage,
                                           SessionTally &tally);

        const GuardConfig &config_;
        RemoteExecutor &remote_;
        Clock clock_;
        SessionCounter counter_;
        IntegrityProbe probe_;
        SnapshotWriter writer_;
        ManifestStore store_;
        BackupStage stage_{BackupStage::Start};
        BackupStage failed_stage_{BackupStage::Start};
        std::optional<std::filesystem::path> manifest_path_;
        std::vector<Location> written_;
    };

} // namespace sessionguard
