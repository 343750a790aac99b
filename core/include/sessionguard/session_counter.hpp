#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "sessionguard/location.hpp"
#include "sessionguard/remote_executor.hpp"

namespace sessionguard
{

    // Exit status remote scripts use to report a missing directory.
    inline constexpr int kMissingDirectoryStatus = 3;

    struct SessionTally
    {
        std::uint64_t file_count{};
        std::uint64_t total_bytes{};
    };

    bool has_session_extension(const std::filesystem::path &path, const std::vector<std::string> &extensions);

    // find(1) predicate matching the extension set, e.g. \( -name '*.jsonl' -o -name '*.json' \).
    std::string find_name_predicate(const std::vector<std::string> &extensions);

    // Throws GuardError for a remote command that failed to run; ConnectivityFailure when
    // the executor reports the host unreachable, CommandFailed otherwise.
    void require_remote_success(const RemoteExecutor &executor, const CommandResult &result, const std::string &what);

    class SessionCounter
    {
    public:
        SessionCounter(std::vector<std::string> extensions, RemoteExecutor *remote);

        // Never reports zero for a count it could not determine: a missing directory is
        // NotFound, an unreachable host ConnectivityFailure, unparsable output CommandFailed.
        SessionTally count_and_size(const Location &location) const;

        SessionTally count_local(const std::filesystem::path &path) const;
        SessionTally count_remote(const std::string &path) const;

    private:
        std::vector<std::string> extensions_;
        RemoteExecutor *remote_;
    };

} // namespace sessionguard
