#pragma once

#include <string>
#include <utility>

namespace sessionguard
{

    enum class Side
    {
        Local,
        Remote
    };

    // A session store or backup directory. Remote paths are interpreted by the
    // remote shell and may start with "~/".
    struct Location
    {
        Side side{Side::Local};
        std::string host;
        std::string path;

        static Location local(std::string path) { return Location{Side::Local, {}, std::move(path)}; }
        static Location remote(std::string host, std::string path)
        {
            return Location{Side::Remote, std::move(host), std::move(path)};
        }

        bool is_remote() const noexcept { return side == Side::Remote; }
        std::string display() const { return is_remote() ? host + ":" + path : path; }
    };

    inline const char *to_string(Side side) noexcept
    {
        return side == Side::Local ? "local" : "remote";
    }

} // namespace sessionguard
