/**
 * SessionGuard - Error taxonomy shared by the core pipeline and the CLI.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sessionguard
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        NotFound = 1,
        VerificationMismatch = 2,
        IntegrityFailure = 3,
        ConnectivityFailure = 4,
        UserCancelled = 5,
        PartialFailure = 6,
        ManifestCorrupt = 7,
        CommandFailed = 8,
        InvalidArgument = 9,
        InternalError = 10
    };

    std::string_view to_string(ErrorCode code) noexcept;

    class GuardError : public std::runtime_error
    {
    public:
        GuardError(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    // Raised when an independent recount disagrees with the expected value.
    class VerificationMismatchError : public GuardError
    {
    public:
        VerificationMismatchError(std::string side, std::uint64_t expected, std::uint64_t actual,
                                  std::string detail);

        const std::string &side() const noexcept { return side_; }
        std::uint64_t expected() const noexcept { return expected_; }
        std::uint64_t actual() const noexcept { return actual_; }

    private:
        std::string side_;
        std::uint64_t expected_;
        std::uint64_t actual_;
    };

} // namespace sessionguard
