/**
 * SessionGuard - Control channel used for every remote-side operation.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace sessionguard
{

    inline constexpr std::size_t kDefaultOutputLimit = 64 * 1024 * 1024;

    struct CommandResult
    {
        int exit_code{-1};
        std::string out;
        std::string err;
        bool timed_out{};
        // Set when stdout exceeded the capture limit; `out` then holds only its prefix.
        bool truncated{};

        bool ok() const noexcept { return !timed_out && exit_code == 0; }
    };

    // Runs argv[0] with the given arguments, capturing stdout and stderr separately.
    // The child is killed once `timeout` elapses. At most `output_limit` bytes of each
    // stream are kept.
    CommandResult run_process(const std::vector<std::string> &argv, std::chrono::milliseconds timeout,
                              std::size_t output_limit = kDefaultOutputLimit);

    class RemoteExecutor
    {
    public:
        virtual ~RemoteExecutor() = default;

        virtual CommandResult run(const std::string &command) = 0;

        // Human-readable host name used in logs and error messages.
        virtual std::string describe() const = 0;

        // True when a failed result means the host itself could not be reached.
        virtual bool is_connectivity_failure(const CommandResult &result) const;
    };

    class SshExecutor : public RemoteExecutor
    {
    public:
        SshExecutor(std::string host, std::chrono::seconds connect_timeout, std::chrono::seconds command_timeout);

        CommandResult run(const std::string &command) override;
        std::string describe() const override;
        bool is_connectivity_failure(const CommandResult &result) const override;

    private:
        std::string host_;
        std::chrono::seconds connect_timeout_;
        std::chrono::seconds command_timeout_;
    };

    // Executes commands with /bin/sh on this machine. Stands in for the remote host
    // when both stores live on one machine.
    class ShellExecutor : public RemoteExecutor
    {
    public:
        explicit ShellExecutor(std::chrono::seconds command_timeout = std::chrono::seconds{300},
                               std::size_t output_limit = kDefaultOutputLimit);

        CommandResult run(const std::string &command) override;
        std::string describe() const override;

    private:
        std::chrono::seconds command_timeout_;
        std::size_t output_limit_;
    };

    std::unique_ptr<RemoteExecutor> make_executor(const std::string &host, std::chrono::seconds connect_timeout,
                                                  std::chrono::seconds command_timeout);

    // Quotes a path for a POSIX shell. A leading "~/" is kept outside the quotes as
    // "$HOME" so it expands on the executing host.
    std::string shell_quote_path(const std::string &path);

    std::string shell_quote(const std::string &value);

} // namespace sessionguard
