#include "sessionguard/cli/commands.hpp"

#include <iostream>

#include <spdlog/spdlog.h>

namespace sessionguard::cli
{

    int exit_code_for(ErrorCode code) noexcept
    {
        switch (code)
        {
        case ErrorCode::Ok:
            return kExitOk;
        case ErrorCode::VerificationMismatch:
        case ErrorCode::IntegrityFailure:
            return kExitVerification;
        case ErrorCode::ConnectivityFailure:
            return kExitConnectivity;
        case ErrorCode::UserCancelled:
            return kExitCancelled;
        case ErrorCode::NotFound:
            return kExitNotFound;
        case ErrorCode::PartialFailure:
            return kExitPartial;
        case ErrorCode::ManifestCorrupt:
        case ErrorCode::CommandFailed:
        case ErrorCode::InvalidArgument:
        case ErrorCode::InternalError:
            break;
        }
        return kExitFailure;
    }

    int report_error(const GuardError &error)
    {
        std::cerr << "ERROR: " << to_string(error.code()) << ": " << error.what() << std::endl;
        spdlog::debug("Command failed with {}", to_string(error.code()));
        return exit_code_for(error.code());
    }

} // namespace sessionguard::cli
