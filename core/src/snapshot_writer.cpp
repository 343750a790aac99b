#include "sessionguard/snapshot_writer.hpp"

#include <sstream>
#include <vector>

#include <spdlog/spdlog.h>

#include "sessionguard/error_codes.hpp"
#include "sessionguard/session_counter.hpp"

namespace sessionguard
{

    namespace
    {
        constexpr auto kInvalidSuffix = ".invalid";
        constexpr auto kDisplacedInfix = ".backup.";
        constexpr auto kDisplacedMarker = "displaced:";
        constexpr int kDestinationExistsStatus = 4;

        std::string join_remote_path(const std::string &root, const std::string &name)
        {
            if (root.empty())
            {
                return name;
            }
            if (root.back() == '/')
            {
                return root + name;
            }
            return root + "/" + name;
        }

        std::vector<std::string> output_lines(const std::string &output)
        {
            std::vector<std::string> result;
            std::istringstream lines(output);
            std::string line;
            while (std::getline(lines, line))
            {
                while (!line.empty() && (line.back() == '\r' || line.back() == ' '))
                {
                    line.pop_back();
                }
                if (!line.empty())
                {
                    result.push_back(line);
                }
            }
            return result;
        }

        std::string last_line(const std::string &output)
        {
            const auto lines = output_lines(output);
            return lines.empty() ? std::string() : lines.back();
        }

        // First of base, base_2, base_3, ... that does not exist yet.
        std::filesystem::path unique_sibling(const std::filesystem::path &base)
        {
            if (!std::filesystem::exists(base))
            {
                return base;
            }
            for (int n = 2;; ++n)
            {
                auto candidate = base;
                candidate += "_" + std::to_string(n);
                if (!std::filesystem::exists(candidate))
                {
                    return candidate;
                }
            }
        }

        // Shell fragment leaving the first free name of base, base_2, ... in $target.
        std::string unique_remote_target(const std::string &base)
        {
            const auto quoted = shell_quote_path(base);
            return "target=" + quoted + "; n=1; while [ -e \"$target\" ]; do n=$((n+1)); target=" + quoted +
                   "_$n; done; ";
        }

        // -H dereferences a symlinked source operand while links inside the tree stay links.
        std::string copy_tree_command(const std::string &quoted_source, const std::string &quoted_destination)
        {
            return "cp -RH " + quoted_source + " " + quoted_destination;
        }

        void copy_tree(const std::filesystem::path &source, const std::filesystem::path &destination)
        {
            std::filesystem::copy(std::filesystem::canonical(source), destination,
                                  std::filesystem::copy_options::recursive | std::filesystem::copy_options::copy_symlinks);
        }

        // Runs a remote script that reports one expected failure through `status`.
        CommandResult run_script(RemoteExecutor &executor, const std::string &command, int status, ErrorCode code,
                                 const std::string &failure, const std::string &what)
        {
            const auto result = executor.run(command);
            if (!result.timed_out && result.exit_code == status)
            {
                throw GuardError(code, failure);
            }
            require_remote_success(executor, result, what);
            return result;
        }
    } // namespace

    SnapshotWriter::SnapshotWriter(RemoteExecutor *remote) : remote_(remote) {}

    std::string SnapshotWriter::snapshot_name(Side side, const std::string &timestamp)
    {
        return std::string(to_string(side)) + "_" + timestamp;
    }

    SnapshotResult SnapshotWriter::snapshot(const Location &source, const std::string &dest_root,
                                            const std::string &timestamp) const
    {
        const auto name = snapshot_name(source.side, timestamp);
        if (source.is_remote())
        {
            return snapshot_remote(source.path, dest_root, join_remote_path(dest_root, name));
        }
        return snapshot_local(source.path, std::filesystem::path(dest_root) / name);
    }

    SnapshotResult SnapshotWriter::snapshot_local(const std::filesystem::path &source,
                                                  const std::filesystem::path &destination) const
    {
        if (std::filesystem::exists(destination))
        {
            throw GuardError(ErrorCode::InternalError, "Snapshot destination already exists: " + destination.string());
        }
        std::filesystem::create_directories(destination.parent_path());

        SnapshotResult result{.destination = Location::local(destination.string()), .source_present = false};
        if (!std::filesystem::is_directory(source))
        {
            spdlog::warn("No local session directory at {}; creating empty snapshot", source.string());
            std::filesystem::create_directories(destination);
            return result;
        }

        spdlog::info("Copying {} -> {}", source.string(), destination.string());
        copy_tree(source, destination);
        result.source_present = true;
        return result;
    }

    SnapshotResult SnapshotWriter::snapshot_remote(const std::string &source, const std::string &dest_root,
                                                   const std::string &destination) const
    {
        auto &executor = remote();
        const auto src = shell_quote_path(source);
        const auto dst = shell_quote_path(destination);
        const auto command = "mkdir -p " + shell_quote_path(dest_root) + " || exit 1; test ! -e " + dst + " || exit " +
                             std::to_string(kDestinationExistsStatus) + "; if [ -d " + src + " ]; then " +
                             copy_tree_command(src, dst) + " && echo present; else mkdir " + dst +
                             " && echo absent; fi";

        spdlog::info("Copying {0}:{1} -> {0}:{2}", executor.describe(), source, destination);
        const auto result = run_script(executor, command, kDestinationExistsStatus, ErrorCode::InternalError,
                                       "Snapshot destination already exists on " + executor.describe() + ": " +
                                           destination,
                                       "create remote snapshot " + destination);

        const auto marker = last_line(result.out);
        if (marker != "present" && marker != "absent")
        {
            throw GuardError(ErrorCode::CommandFailed, "Unexpected output from remote snapshot: '" + marker + "'");
        }
        if (marker == "absent")
        {
            spdlog::warn("No session directory at {}:{}; created empty snapshot", executor.describe(), source);
        }
        return SnapshotResult{.destination = Location::remote(executor.describe(), destination),
                              .source_present = marker == "present"};
    }

    ReplaceResult SnapshotWriter::replace_live(const Location &live, const Location &backup,
                                               const std::string &time_tag) const
    {
        if (live.side != backup.side)
        {
            throw GuardError(ErrorCode::InvalidArgument, "Cannot restore across hosts: " + backup.display() + " -> " +
                                                             live.display());
        }
        if (live.is_remote())
        {
            return replace_remote(live.path, backup.path, time_tag);
        }
        return replace_local(live.path, backup.path, time_tag);
    }

    ReplaceResult SnapshotWriter::replace_local(const std::filesystem::path &live, const std::filesystem::path &backup,
                                                const std::string &time_tag) const
    {
        if (!std::filesystem::is_directory(backup))
        {
            throw GuardError(ErrorCode::NotFound, "Backup directory not found: " + backup.string());
        }

        ReplaceResult result;
        if (std::filesystem::exists(std::filesystem::symlink_status(live)))
        {
            auto displaced = live;
            displaced += kDisplacedInfix + time_tag;
            displaced = unique_sibling(displaced);
            std::filesystem::rename(live, displaced);
            spdlog::info("Current sessions moved to {}", displaced.string());
            result.displaced_path = displaced.string();
        }

        if (live.has_parent_path())
        {
            std::filesystem::create_directories(live.parent_path());
        }
        copy_tree(backup, live);
        spdlog::info("Restored {} -> {}", backup.string(), live.string());
        return result;
    }

    ReplaceResult SnapshotWriter::replace_remote(const std::string &live, const std::string &backup,
                                                 const std::string &time_tag) const
    {
        auto &executor = remote();
        const auto src = shell_quote_path(backup);
        const auto dst = shell_quote_path(live);
        const auto command = "test -d " + src + " || exit " + std::to_string(kMissingDirectoryStatus) + "; if [ -e " +
                             dst + " ] || [ -L " + dst + " ]; then " +
                             unique_remote_target(live + kDisplacedInfix + time_tag) + "mv " + dst +
                             " \"$target\" || exit 1; echo \"" + kDisplacedMarker + "$target\"; fi; mkdir -p \"$(dirname " +
                             dst + ")\" && " + copy_tree_command(src, dst) + " && echo restored";

        const auto result = run_script(executor, command, kMissingDirectoryStatus, ErrorCode::NotFound,
                                       "Backup directory not found on " + executor.describe() + ": " + backup,
                                       "restore " + backup + " into " + live);

        ReplaceResult replaced;
        bool restored = false;
        for (const auto &line : output_lines(result.out))
        {
            if (line.rfind(kDisplacedMarker, 0) == 0)
            {
                replaced.displaced_path = line.substr(std::string(kDisplacedMarker).size());
                spdlog::info("Current remote sessions moved to {}:{}", executor.describe(), *replaced.displaced_path);
            }
            else if (line == "restored")
            {
                restored = true;
            }
        }
        if (!restored)
        {
            throw GuardError(ErrorCode::CommandFailed, "Remote restore did not confirm completion on " +
                                                           executor.describe());
        }
        spdlog::info("Restored {0}:{1} -> {0}:{2}", executor.describe(), backup, live);
        return replaced;
    }

    void SnapshotWriter::mark_invalid(const Location &destination) const
    {
        try
        {
            if (!destination.is_remote())
            {
                if (!std::filesystem::exists(destination.path))
                {
                    return;
                }
                const auto target = unique_sibling(std::filesystem::path(destination.path + kInvalidSuffix));
                std::filesystem::rename(destination.path, target);
                spdlog::warn("Unverified snapshot kept for inspection at {}", target.string());
                return;
            }

            auto &executor = remote();
            const auto dst = shell_quote_path(destination.path);
            const auto result = executor.run("test -e " + dst + " || exit 0; " +
                                             unique_remote_target(destination.path + kInvalidSuffix) + "mv " + dst +
                                             " \"$target\" && echo \"$target\"");
            require_remote_success(executor, result, "mark " + destination.path + " invalid");
            const auto target = last_line(result.out);
            if (!target.empty())
            {
                spdlog::warn("Unverified snapshot kept for inspection at {}:{}", executor.describe(), target);
            }
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Could not mark {} invalid: {}", destination.display(), ex.what());
        }
    }

    bool SnapshotWriter::exists(const Location &location) const
    {
        if (!location.is_remote())
        {
            return std::filesystem::is_directory(location.path);
        }
        auto &executor = remote();
        const auto result = executor.run("test -d " + shell_quote_path(location.path));
        if (!result.timed_out && (result.exit_code == 0 || result.exit_code == 1))
        {
            return result.exit_code == 0;
        }
        require_remote_success(executor, result, "check " + location.path);
        return false;
    }

    RemoteExecutor &SnapshotWriter::remote() const
    {
        if (!remote_)
        {
            throw GuardError(ErrorCode::InvalidArgument, "No control channel configured for remote snapshot");
        }
        return *remote_;
    }

} // namespace sessionguard
