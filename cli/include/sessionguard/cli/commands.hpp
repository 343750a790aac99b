#pragma once

#include <string>
#include <vector>

#include "sessionguard/config.hpp"
#include "sessionguard/error_codes.hpp"

namespace sessionguard::cli
{

    enum ExitCode : int
    {
        kExitOk = 0,
        kExitFailure = 1,
        kExitVerification = 2,
        kExitConnectivity = 3,
        kExitCancelled = 4,
        kExitNotFound = 5,
        kExitPartial = 6
    };

    int exit_code_for(ErrorCode code) noexcept;

    // Prints the one-line "ERROR: <code>: <detail>" report and logs it.
    int report_error(const GuardError &error);

    int run_backup(const GuardConfig &config, const std::vector<std::string> &args);
    int run_restore(const GuardConfig &config, const std::vector<std::string> &args);

    int run_migrate(const GuardConfig &config, const std::vector<std::string> &args);
    int run_canonicalize(const std::vector<std::string> &args);
    int run_validate(const GuardConfig &config);
    int run_sessions(const GuardConfig &config);

} // namespace sessionguard::cli
