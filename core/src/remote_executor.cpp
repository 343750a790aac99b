#include "sessionguard/remote_executor.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "sessionguard/config.hpp"
#include "sessionguard/error_codes.hpp"

namespace sessionguard
{

    namespace
    {
        constexpr int kSshFailureStatus = 255;

        // Returns false when part of `data` did not fit under `limit`.
        bool append_capped(std::string &target, const char *data, std::size_t size, std::size_t limit)
        {
            const std::size_t remaining = limit > target.size() ? limit - target.size() : 0;
            target.append(data, std::min(remaining, size));
            return size <= remaining;
        }

        // Reads whatever is available on `fd`; returns false once the pipe is closed.
        bool drain(int fd, std::string &target, std::size_t limit, bool &truncated)
        {
            std::array<char, 4096> buffer{};
            while (true)
            {
                const ssize_t bytes = read(fd, buffer.data(), buffer.size());
                if (bytes > 0)
                {
                    if (!append_capped(target, buffer.data(), static_cast<std::size_t>(bytes), limit))
                    {
                        truncated = true;
                    }
                    continue;
                }
                if (bytes == 0)
                {
                    return false;
                }
                return errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR;
            }
        }

        int exit_code_from_status(int status)
        {
            if (WIFEXITED(status))
            {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status))
            {
                return 128 + WTERMSIG(status);
            }
            return status;
        }
    } // namespace

    CommandResult run_process(const std::vector<std::string> &argv, std::chrono::milliseconds timeout,
                              std::size_t output_limit)
    {
        if (argv.empty())
        {
            throw GuardError(ErrorCode::InvalidArgument, "Empty command line");
        }

        int out_pipe[2] = {-1, -1};
        int err_pipe[2] = {-1, -1};
        if (pipe(out_pipe) != 0)
        {
            throw GuardError(ErrorCode::InternalError, "Failed to create pipe");
        }
        if (pipe(err_pipe) != 0)
        {
            close(out_pipe[0]);
            close(out_pipe[1]);
            throw GuardError(ErrorCode::InternalError, "Failed to create pipe");
        }

        const pid_t pid = fork();
        if (pid < 0)
        {
            close(out_pipe[0]);
            close(out_pipe[1]);
            close(err_pipe[0]);
            close(err_pipe[1]);
            throw GuardError(ErrorCode::InternalError, "Failed to fork");
        }

        if (pid == 0)
        {
            close(out_pipe[0]);
            close(err_pipe[0]);
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(err_pipe[1], STDERR_FILENO);
            close(out_pipe[1]);
            close(err_pipe[1]);
            const int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0)
            {
                dup2(devnull, STDIN_FILENO);
                close(devnull);
            }

            std::vector<char *> args;
            args.reserve(argv.size() + 1);
            for (const auto &arg : argv)
            {
                args.push_back(const_cast<char *>(arg.c_str()));
            }
            args.push_back(nullptr);
            execvp(args[0], args.data());
            _exit(127);
        }

        close(out_pipe[1]);
        close(err_pipe[1]);
        for (const int fd : {out_pipe[0], err_pipe[0]})
        {
            const int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        }

        CommandResult result;
        const auto started = std::chrono::steady_clock::now();
        bool out_open = true;
        bool err_open = true;
        while (out_open || err_open)
        {
            if (std::chrono::steady_clock::now() - started > timeout)
            {
                kill(pid, SIGKILL);
                result.timed_out = true;
                break;
            }

            std::array<pollfd, 2> fds{{
                {.fd = out_open ? out_pipe[0] : -1, .events = POLLIN, .revents = 0},
                {.fd = err_open ? err_pipe[0] : -1, .events = POLLIN, .revents = 0},
            }};
            (void)poll(fds.data(), fds.size(), 50);

            if (out_open && fds[0].revents != 0)
            {
                out_open = drain(out_pipe[0], result.out, output_limit, result.truncated);
            }
            if (err_open && fds[1].revents != 0)
            {
                bool err_truncated = false;
                err_open = drain(err_pipe[0], result.err, output_limit, err_truncated);
            }
        }

        close(out_pipe[0]);
        close(err_pipe[0]);

        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
        {
        }
        result.exit_code = result.timed_out ? -1 : exit_code_from_status(status);
        return result;
    }

    bool RemoteExecutor::is_connectivity_failure(const CommandResult &result) const
    {
        return result.timed_out;
    }

    SshExecutor::SshExecutor(std::string host, std::chrono::seconds connect_timeout,
                             std::chrono::seconds command_timeout)
        : host_(std::move(host)), connect_timeout_(connect_timeout), command_timeout_(command_timeout)
    {
    }

    CommandResult SshExecutor::run(const std::string &command)
    {
        const std::vector<std::string> argv{
            "ssh",
            "-o", "BatchMode=yes",
            "-o", "ConnectTimeout=" + std::to_string(connect_timeout_.count()),
            host_,
            command,
        };
        spdlog::debug("ssh {}: {}", host_, command);
        auto result = run_process(argv, command_timeout_ + connect_timeout_);
        if (result.timed_out)
        {
            spdlog::warn("Command on {} timed out after {}s", host_, (command_timeout_ + connect_timeout_).count());
        }
        return result;
    }

    std::string SshExecutor::describe() const
    {
        return host_;
    }

    bool SshExecutor::is_connectivity_failure(const CommandResult &result) const
    {
        return result.timed_out || result.exit_code == kSshFailureStatus;
    }

    ShellExecutor::ShellExecutor(std::chrono::seconds command_timeout, std::size_t output_limit)
        : command_timeout_(command_timeout), output_limit_(output_limit)
    {
    }

    CommandResult ShellExecutor::run(const std::string &command)
    {
        spdlog::debug("sh: {}", command);
        return run_process({"/bin/sh", "-c", command}, command_timeout_, output_limit_);
    }

    std::string ShellExecutor::describe() const
    {
        return kLocalExecutionHost;
    }

    std::unique_ptr<RemoteExecutor> make_executor(const std::string &host, std::chrono::seconds connect_timeout,
                                                  std::chrono::seconds command_timeout)
    {
        if (host.empty())
        {
            throw GuardError(ErrorCode::InvalidArgument, "Remote host must not be empty");
        }
        if (host == kLocalExecutionHost)
        {
            return std::make_unique<ShellExecutor>(command_timeout);
        }
        return std::make_unique<SshExecutor>(host, connect_timeout, command_timeout);
    }

    std::string shell_quote(const std::string &value)
    {
        std::string out;
        out.reserve(value.size() + 2);
        out.push_back('\'');
        for (char c : value)
        {
            if (c == '\'')
            {
                out += "'\\''";
            }
            else
            {
                out.push_back(c);
            }
        }
        out.push_back('\'');
        return out;
    }

    std::string shell_quote_path(const std::string &path)
    {
        if (path == "~")
        {
            return "\"$HOME\"";
        }
        if (path.rfind("~/", 0) == 0)
        {
            return "\"$HOME\"/" + shell_quote(path.substr(2));
        }
        return shell_quote(path);
    }

} // namespace sessionguard
