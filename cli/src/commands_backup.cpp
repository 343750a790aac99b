#include "sessionguard/cli/commands.hpp"

#include <iostream>

#include "sessionguard/backup_orchestrator.hpp"
#include "sessionguard/manifest_store.hpp"
#include "sessionguard/remote_executor.hpp"

namespace sessionguard::cli
{

    namespace
    {

        int handle_create(const GuardConfig &config, const std::vector<std::string> &args)
        {
            std::string label;
            for (std::size_t i = 0; i < args.size(); ++i)
            {
                if (args[i] == "--label" && i + 1 < args.size())
                {
                    label = args[++i];
                }
                else
                {
                    std::cout << "ERROR: invalid_usage" << std::endl;
                    std::cout << "Usage: backup create [--label <LABEL>]" << std::endl;
                    return kExitFailure;
                }
            }

            auto remote = make_executor(config.remote_host, config.connect_timeout, config.command_timeout);
            BackupOrchestrator orchestrator(config, *remote);
            const auto manifest = orchestrator.create_backup(label);

            std::cout << "OK" << std::endl;
            std::cout << "Timestamp: " << manifest.timestamp << std::endl;
            std::cout << "Local backup: " << manifest.local.path << " (" << manifest.local.session_count
                      << " sessions, " << format_size(manifest.local.size) << ")" << std::endl;
            std::cout << "Remote backup: " << manifest.remote.host << ":" << manifest.remote.path << " ("
                      << manifest.remote.session_count << " sessions, " << format_size(manifest.remote.size) << ")"
                      << std::endl;
            if (orchestrator.manifest_path())
            {
                std::cout << "Manifest: " << orchestrator.manifest_path()->string() << std::endl;
            }
            std::cout << "Restore command: " << manifest.restore_command << std::endl;
            return kExitOk;
        }

        int handle_list(const GuardConfig &config)
        {
            const ManifestStore store(config.backup_root);
            const auto manifests = store.list_all();
            if (manifests.empty())
            {
                std::cout << "No backups found in " << store.directory().string() << std::endl;
                return kExitOk;
            }

            std::cout << "Available backups:" << std::endl;
            for (const auto &manifest : manifests)
            {
                std::cout << "Backup: " << manifest.timestamp << std::endl;
                std::cout << "  Created: " << manifest.created_at << std::endl;
                std::cout << "  Sessions: local=" << manifest.local.session_count
                          << ", remote=" << manifest.remote.session_count << std::endl;
                std::cout << "  Size: local=" << format_size(manifest.local.size)
                          << ", remote=" << format_size(manifest.remote.size) << std::endl;
                if (!manifest.integrity_verified)
                {
                    std::cout << "  Integrity: NOT VERIFIED" << std::endl;
                }
                std::cout << "  Restore: " << manifest.restore_command << std::endl;
            }
            return kExitOk;
        }

    } // namespace

    int run_backup(const GuardConfig &config, const std::vector<std::string> &args)
    {
        if (args.empty())
        {
            std::cout << "ERROR: invalid_usage" << std::endl;
            std::cout << "Usage: backup <create|list>" << std::endl;
            return kExitFailure;
        }
        const auto &verb = args.front();
        const std::vector<std::string> rest(args.begin() + 1, args.end());
        if (verb == "create")
        {
            return handle_create(config, rest);
        }
        if (verb == "list" && rest.empty())
        {
            return handle_list(config);
        }
        std::cout << "ERROR: invalid_usage" << std::endl;
        std::cout << "Usage: backup <create|list>" << std::endl;
        return kExitFailure;
    }

} // namespace sessionguard::cli
