#include "sessionguard/error_codes.hpp"

#include <array>
#include <utility>

namespace sessionguard
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 11> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::VerificationMismatch, "verification_mismatch"},
            {ErrorCode::IntegrityFailure, "integrity_failure"},
            {ErrorCode::ConnectivityFailure, "connectivity_failure"},
            {ErrorCode::UserCancelled, "user_cancelled"},
            {ErrorCode::PartialFailure, "partial_failure"},
            {ErrorCode::ManifestCorrupt, "manifest_corrupt"},
            {ErrorCode::CommandFailed, "command_failed"},
            {ErrorCode::InvalidArgument, "invalid_argument"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    GuardError::GuardError(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    VerificationMismatchError::VerificationMismatchError(std::string side, std::uint64_t expected,
                                                         std::uint64_t actual, std::string detail)
        : GuardError(ErrorCode::VerificationMismatch,
                     side + " " + detail + ": expected " + std::to_string(expected) + ", found " +
                         std::to_string(actual)),
          side_(std::move(side)), expected_(expected), actual_(actual)
    {
    }

} // namespace sessionguard
