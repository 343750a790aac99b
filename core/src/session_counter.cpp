#include "sessionguard/session_counter.hpp"

#include <algorithm>
#include <sstream>

#include <spdlog/spdlog.h>

#include "sessionguard/error_codes.hpp"

namespace sessionguard
{

    namespace
    {
        constexpr int kIncompleteListingStatus = 5;

        std::string trim(const std::string &value)
        {
            const auto begin = value.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return {};
            }
            const auto end = value.find_last_not_of(" \t\r\n");
            return value.substr(begin, end - begin + 1);
        }

        bool all_digits(const std::string &value)
        {
            return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c)
                                                 { return c >= '0' && c <= '9'; });
        }
    } // namespace

    bool has_session_extension(const std::filesystem::path &path, const std::vector<std::string> &extensions)
    {
        const auto extension = path.extension().string();
        return std::find(extensions.begin(), extensions.end(), extension) != extensions.end();
    }

    std::string find_name_predicate(const std::vector<std::string> &extensions)
    {
        std::ostringstream out;
        out << "\\(";
        for (std::size_t i = 0; i < extensions.size(); ++i)
        {
            if (i > 0)
            {
                out << " -o";
            }
            out << " -name " << shell_quote("*" + extensions[i]);
        }
        out << " \\)";
        return out.str();
    }

    void require_remote_success(const RemoteExecutor &executor, const CommandResult &result, const std::string &what)
    {
        if (result.ok())
        {
            return;
        }
        if (executor.is_connectivity_failure(result))
        {
            throw GuardError(ErrorCode::ConnectivityFailure,
                             "Cannot reach " + executor.describe() + " while trying to " + what +
                                 (result.timed_out ? " (timed out)" : ": " + trim(result.err)));
        }
        throw GuardError(ErrorCode::CommandFailed, "Failed to " + what + " on " + executor.describe() + " (exit " +
                                                       std::to_string(result.exit_code) + "): " + trim(result.err));
    }

    SessionCounter::SessionCounter(std::vector<std::string> extensions, RemoteExecutor *remote)
        : extensions_(std::move(extensions)), remote_(remote)
    {
        if (extensions_.empty())
        {
            throw GuardError(ErrorCode::InvalidArgument, "Session extension set must not be empty");
        }
    }

    SessionTally SessionCounter::count_and_size(const Location &location) const
    {
        return location.is_remote() ? count_remote(location.path) : count_local(location.path);
    }

    SessionTally SessionCounter::count_local(const std::filesystem::path &path) const
    {
        if (!std::filesystem::is_directory(path))
        {
            throw GuardError(ErrorCode::NotFound, "Session directory does not exist: " + path.string());
        }

        SessionTally tally;
        for (std::filesystem::recursive_directory_iterator it(path); it != std::filesystem::recursive_directory_iterator(); ++it)
        {
            if (!it->is_regular_file() || !has_session_extension(it->path(), extensions_))
            {
                continue;
            }
            ++tally.file_count;
            tally.total_bytes += static_cast<std::uint64_t>(it->file_size());
        }
        return tally;
    }

    SessionTally SessionCounter::count_remote(const std::string &path) const
    {
        if (!remote_)
        {
            throw GuardError(ErrorCode::InvalidArgument, "No control channel configured for remote count");
        }

        const auto quoted = shell_quote_path(path);
        // -H follows a symlinked store root. find's own status travels down the pipe as a marker
        // line, since a tree it could not fully walk must not produce a tally.
        const auto command = "test -d " + quoted + " || exit " + std::to_string(kMissingDirectoryStatus) +
                             "; { find -H " + quoted + " -type f " + find_name_predicate(extensions_) +
                             " -exec wc -c {} \\; ; echo \"find-status $?\"; } | awk '$1 == \"find-status\" { "
                             "status = $2; next } { n += 1; s += $1 } END { if (status != 0) exit " +
                             std::to_string(kIncompleteListingStatus) + "; printf \"%.0f %.0f\\n\", n, s }'";
        const auto result = remote_->run(command);
        if (!result.timed_out && result.exit_code == kMissingDirectoryStatus)
        {
            throw GuardError(ErrorCode::NotFound,
                             "Session directory does not exist on " + remote_->describe() + ": " + path);
        }
        if (!result.timed_out && result.exit_code == kIncompleteListingStatus)
        {
            throw GuardError(ErrorCode::CommandFailed, "Could not read every session file under " +
                                                           remote_->describe() + ":" + path + ": " + trim(result.err));
        }
        require_remote_success(*remote_, result, "count sessions in " + path);

        std::istringstream output(trim(result.out));
        std::string count_field;
        std::string bytes_field;
        std::string extra;
        output >> count_field >> bytes_field;
        if (!all_digits(count_field) || !all_digits(bytes_field) || (output >> extra))
        {
            throw GuardError(ErrorCode::CommandFailed, "Unexpected session count output from " + remote_->describe() +
                                                           ": '" + trim(result.out) + "'");
        }

        SessionTally tally{.file_count = std::stoull(count_field), .total_bytes = std::stoull(bytes_field)};
        spdlog::debug("{}:{} holds {} sessions ({} bytes)", remote_->describe(), path, tally.file_count,
                      tally.total_bytes);
        return tally;
    }

} // namespace sessionguard
