#include "sessionguard/integrity_probe.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "sessionguard/error_codes.hpp"
#include "sessionguard/session_counter.hpp"

namespace sessionguard
{

    namespace
    {
        constexpr auto kLineDelimitedExtension = ".jsonl";

        bool parses(const std::string &content, const std::string &extension, const std::string &label)
        {
            try
            {
                parse_session_records(content, extension);
                return true;
            }
            catch (const nlohmann::json::exception &ex)
            {
                spdlog::error("Integrity check failed for {}: {}", label, ex.what());
                return false;
            }
        }
    } // namespace

    void parse_session_records(const std::string &content, const std::string &extension)
    {
        if (extension != kLineDelimitedExtension)
        {
            (void)nlohmann::json::parse(content);
            return;
        }
        std::istringstream lines(content);
        std::string line;
        while (std::getline(lines, line))
        {
            if (line.find_first_not_of(" \t\r") == std::string::npos)
            {
                continue;
            }
            (void)nlohmann::json::parse(line);
        }
    }

    IntegrityProbe::IntegrityProbe(std::vector<std::string> extensions, RemoteExecutor *remote)
        : extensions_(std::move(extensions)), remote_(remote)
    {
    }

    bool IntegrityProbe::probe(const Location &location, std::size_t sample_size) const
    {
        return location.is_remote() ? probe_remote(location.path, sample_size)
                                    : probe_local(location.path, sample_size);
    }

    bool IntegrityProbe::probe_local(const std::filesystem::path &root, std::size_t sample_size) const
    {
        if (!std::filesystem::is_directory(root))
        {
            spdlog::error("Integrity check failed: {} does not exist", root.string());
            return false;
        }

        std::vector<std::filesystem::path> candidates;
        for (std::filesystem::recursive_directory_iterator it(root); it != std::filesystem::recursive_directory_iterator(); ++it)
        {
            if (it->is_regular_file() && has_session_extension(it->path(), extensions_))
            {
                candidates.push_back(it->path());
            }
        }
        std::sort(candidates.begin(), candidates.end());
        if (candidates.size() > sample_size)
        {
            candidates.resize(sample_size);
        }
        if (candidates.empty())
        {
            spdlog::warn("No session files to sample under {}", root.string());
        }

        for (const auto &file : candidates)
        {
            std::ifstream in(file, std::ios::binary);
            if (!in.is_open())
            {
                spdlog::error("Integrity check failed: cannot open {}", file.string());
                return false;
            }
            const std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            if (!parses(content, file.extension().string(), file.string()))
            {
                return false;
            }
        }
        spdlog::info("Integrity verified for {} sampled file(s) under {}", candidates.size(), root.string());
        return true;
    }

    bool IntegrityProbe::probe_remote(const std::string &root, std::size_t sample_size) const
    {
        if (!remote_)
        {
            throw GuardError(ErrorCode::InvalidArgument, "No control channel configured for remote probe");
        }

        const auto quoted = shell_quote_path(root);
        const auto listing = remote_->run("test -d " + quoted + " || exit " + std::to_string(kMissingDirectoryStatus) +
                                          "; find -H " + quoted + " -type f " + find_name_predicate(extensions_) +
                                          " | LC_ALL=C sort | head -n " + std::to_string(sample_size));
        if (!listing.timed_out && listing.exit_code == kMissingDirectoryStatus)
        {
            spdlog::error("Integrity check failed: {}:{} does not exist", remote_->describe(), root);
            return false;
        }
        require_remote_success(*remote_, listing, "list session files in " + root);

        std::vector<std::string> files;
        std::istringstream lines(listing.out);
        std::string line;
        while (std::getline(lines, line))
        {
            if (!line.empty())
            {
                files.push_back(line);
            }
        }
        if (files.empty())
        {
            spdlog::warn("No session files to sample under {}:{}", remote_->describe(), root);
        }

        for (const auto &file : files)
        {
            const auto content = remote_->run("cat " + shell_quote(file));
            if (!content.ok())
            {
                if (remote_->is_connectivity_failure(content))
                {
                    require_remote_success(*remote_, content, "read " + file);
                }
                spdlog::error("Integrity check failed: cannot read {}:{}", remote_->describe(), file);
                return false;
            }
            const auto extension = std::filesystem::path(file).extension().string();
            std::string text = content.out;
            if (content.truncated)
            {
                // Only whole records of a capped line-delimited file can be checked.
                const auto end = text.rfind('\n');
                if (extension != kLineDelimitedExtension || end == std::string::npos)
                {
                    throw GuardError(ErrorCode::CommandFailed, "Cannot check " + remote_->describe() + ":" + file +
                                                                   ": larger than " + std::to_string(text.size()) +
                                                                   " bytes of captured output");
                }
                text.resize(end + 1);
                spdlog::debug("Checking the first {} bytes of {}:{}", text.size(), remote_->describe(), file);
            }
            if (!parses(text, extension, remote_->describe() + ":" + file))
            {
                return false;
            }
        }
        spdlog::info("Integrity verified for {} sampled file(s) under {}:{}", files.size(), remote_->describe(), root);
        return true;
    }

} // namespace sessionguard
