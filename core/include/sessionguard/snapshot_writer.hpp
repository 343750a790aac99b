#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "sessionguard/location.hpp"
#include "sessionguard/remote_executor.hpp"

namespace sessionguard
{

    struct SnapshotResult
    {
        Location destination;
        // False when the source did not exist and an empty destination was created.
        bool source_present{};
    };

    struct ReplaceResult
    {
        // Where the previous live directory was moved, if there was one.
        std::optional<std::string> displaced_path;
    };

    class SnapshotWriter
    {
    public:
        explicit SnapshotWriter(RemoteExecutor *remote);

        // Copies `source` to <dest_root>/local_<timestamp> (or remote_<timestamp> on the
        // remote host, without the data passing through this machine). A source that is a
        // symlink to a directory is followed, so the snapshot always holds real files.
        SnapshotResult snapshot(const Location &source, const std::string &dest_root, const std::string &timestamp) const;

        // Moves `live` aside to <live>.backup.<time_tag> and copies `backup` into its place.
        // The live directory is never deleted.
        ReplaceResult replace_live(const Location &live, const Location &backup, const std::string &time_tag) const;

        // Renames a snapshot that failed verification to <path>.invalid. Problems are logged
        // and otherwise ignored so the original failure is what gets reported.
        void mark_invalid(const Location &destination) const;

        bool exists(const Location &location) const;

        static std::string snapshot_name(Side side, const std::string &timestamp);

    private:
        SnapshotResult snapshot_local(const std::filesystem::path &source, const std::filesystem::path &destination) const;
        SnapshotResult snapshot_remote(const std::string &source, const std::string &dest_root,
                                       const std::string &destination) const;
        ReplaceResult replace_local(const std::filesystem::path &live, const std::filesystem::path &backup,
                                    const std::string &time_tag) const;
        ReplaceResult replace_remote(const std::string &live, const std::string &backup, const std::string &time_tag) const;
        RemoteExecutor &remote() const;

        RemoteExecutor *remote_;
    };

} // namespace sessionguard
