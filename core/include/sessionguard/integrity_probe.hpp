#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "sessionguard/location.hpp"
#include "sessionguard/remote_executor.hpp"

namespace sessionguard
{

    // Parses every record of a session file. Line-delimited files (.jsonl) must hold
    // one JSON value per non-empty line; other extensions must hold one JSON document.
    // Throws on malformed content.
    void parse_session_records(const std::string &content, const std::string &extension);

    // Cheap sanity check over a small sample of session files. A passing probe says
    // nothing about files outside the sample; this is not a full-corpus validator.
    class IntegrityProbe
    {
    public:
        IntegrityProbe(std::vector<std::string> extensions, RemoteExecutor *remote);

        // Returns false on the first file that is missing or fails to parse.
        bool probe(const Location &location, std::size_t sample_size = 3) const;

    private:
        bool probe_local(const std::filesystem::path &root, std::size_t sample_size) const;
        bool probe_remote(const std::string &root, std::size_t sample_size) const;

        std::vector<std::string> extensions_;
        RemoteExecutor *remote_;
    };

} // namespace sessionguard
