#include "sessionguard/cli/commands.hpp"

#include <iostream>
#include <string>

#include "sessionguard/backup_orchestrator.hpp"
#include "sessionguard/remote_executor.hpp"
#include "sessionguard/restore_orchestrator.hpp"

namespace sessionguard::cli
{

    namespace
    {

        std::string prompt_on_terminal(const RestorePreview &preview)
        {
            const auto &manifest = preview.manifest;
            std::cout << "RESTORE CONFIRMATION" << std::endl;
            std::cout << "This will REPLACE current sessions with backup data." << std::endl;
            std::cout << "Backup timestamp: " << manifest.timestamp << std::endl;
            std::cout << "Created: " << manifest.created_at << std::endl;
            if (preview.restore_local)
            {
                std::cout << "Local sessions: " << manifest.local.session_count << " files from "
                          << manifest.local.path << std::endl;
            }
            if (preview.restore_remote)
            {
                std::cout << "Remote sessions: " << manifest.remote.session_count << " files from "
                          << manifest.remote.path << std::endl;
            }
            std::cout << "Current sessions will be backed up before restore." << std::endl;
            std::cout << "To proceed, type: " << kRestoreConfirmationPhrase << std::endl;
            std::cout << "> " << std::flush;

            std::string answer;
            if (!std::getline(std::cin, answer))
            {
                return {};
            }
            return answer;
        }

        void print_side(const char *label, const SideRestoreResult &side)
        {
            if (!side.performed)
            {
                return;
            }
            std::cout << label << " sessions: " << side.actual_count << " files (expected " << side.expected_count
                      << ")" << std::endl;
            if (side.displaced_path)
            {
                std::cout << "  Previous sessions kept at " << *side.displaced_path << std::endl;
            }
        }

    } // namespace

    int run_restore(const GuardConfig &config, const std::vector<std::string> &args)
    {
        std::string timestamp;
        bool restore_local = true;
        bool restore_remote = true;
        for (const auto &arg : args)
        {
            if (arg == "--local-only")
            {
                restore_remote = false;
            }
            else if (arg == "--remote-only")
            {
                restore_local = false;
            }
            else if (timestamp.empty() && arg.rfind("--", 0) != 0)
            {
                timestamp = arg;
            }
            else
            {
                timestamp.clear();
                break;
            }
        }
        if (timestamp.empty() || (!restore_local && !restore_remote))
        {
            std::cout << "ERROR: invalid_usage" << std::endl;
            std::cout << "Usage: restore <TIMESTAMP> [--local-only|--remote-only]" << std::endl;
            return kExitFailure;
        }

        auto remote = make_executor(config.remote_host, config.connect_timeout, config.command_timeout);
        BackupOrchestrator backups(config, *remote);
        RestoreOrchestrator orchestrator(config, *remote, backups, prompt_on_terminal);
        const auto result = orchestrator.restore(timestamp, restore_local, restore_remote);

        std::cout << (result.verified() ? "OK" : "ERROR: verification_mismatch") << std::endl;
        std::cout << "Restored from backup: " << result.target_manifest.timestamp << std::endl;
        std::cout << "Safety backup: " << result.pre_restore_backup.timestamp << std::endl;
        print_side("Local", result.local);
        print_side("Remote", result.remote);
        if (!result.verified())
        {
            std::cout << "Restore finished but counts do not match the backup; inspect the directories above."
                      << std::endl;
            return kExitVerification;
        }
        return kExitOk;
    }

} // namespace sessionguard::cli
