#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "sessionguard/backup_orchestrator.hpp"
#include "sessionguard/config.hpp"
#include "sessionguard/manifest.hpp"
#include "sessionguard/remote_executor.hpp"

namespace sessionguard
{

    inline constexpr auto kRestoreConfirmationPhrase = "I UNDERSTAND RESTORE WILL REPLACE CURRENT SESSIONS";

    enum class RestoreStage
    {
        Start,
        ValidateManifest,
        ValidateBackupIntact,
        Confirm,
        PreRestoreBackup,
        RestoreLocal,
        RestoreRemote,
        PostVerify,
        Done,
        Failed
    };

    std::string_view to_string(RestoreStage stage) noexcept;

    struct RestorePreview
    {
        const Manifest &manifest;
        bool restore_local;
        bool restore_remote;
    };

    // Returns the operator's typed answer; only kRestoreConfirmationPhrase proceeds.
    using ConfirmationPrompt = std::function<std::string(const RestorePreview &)>;

    struct SideRestoreResult
    {
        bool performed{};
        std::string live_path;
        std::optional<std::string> displaced_path;
        std::uint64_t expected_count{};
        std::uint64_t actual_count{};

        bool verified() const noexcept { return !performed || expected_count == actual_count; }
    };

    struct RestoreResult
    {
        Manifest target_manifest;
        Manifest pre_restore_backup;
        SideRestoreResult local;
        SideRestoreResult remote;

        bool verified() const noexcept { return local.verified() && remote.verified(); }
    };

    // Replaces the live session stores with a backup's content. Every destructive step is
    // preceded by manifest and backup validation, an exact-match operator confirmation and
    // a fresh safety backup of the current state. A post-restore count mismatch is reported
    // through RestoreResult::verified() and is not rolled back automatically.
    class RestoreOrchestrator
    {
    public:
        RestoreOrchestrator(const GuardConfig &config, RemoteExecutor &remote, BackupOrchestrator &backups,
                            ConfirmationPrompt confirm,
                            Clock clock = [] { return std::chrono::system_clock::now(); });

        RestoreResult restore(const std::string &timestamp, bool restore_local = true, bool restore_remote = true);

        RestoreStage stage() const noexcept { return stage_; }
        RestoreStage failed_stage() const noexcept { return failed_stage_; }

    private:
        void validate_backup_intact(const Manifest &manifest, bool restore_local, bool restore_remote) const;
        SideRestoreResult restore_side(const Location &live, const Location &backup, std::uint64_t expected,
                                       const std::string &time_tag) const;

        const GuardConfig &config_;
        RemoteExecutor &remote_;
        BackupOrchestrator &backups_;
        ConfirmationPrompt confirm_;
        Clock clock_;
        SessionCounter counter_;
        SnapshotWriter writer_;
        RestoreStage stage_{RestoreStage::Start};
        RestoreStage failed_stage_{RestoreStage::Start};
    };

} // namespace sessionguard
