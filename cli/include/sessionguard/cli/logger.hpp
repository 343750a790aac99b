#pragma once

#include <filesystem>
#include <optional>

namespace sessionguard::cli
{

    // Installs the process-wide spdlog logger: colour console output plus an optional
    // append-mode log file.
    void configure_logging(const std::optional<std::filesystem::path> &log_path, bool verbose);

} // namespace sessionguard::cli
