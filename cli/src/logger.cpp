#include "sessionguard/cli/logger.hpp"

#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace sessionguard::cli
{

    void configure_logging(const std::optional<std::filesystem::path> &log_path, bool verbose)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (log_path)
        {
            if (log_path->has_parent_path())
            {
                std::filesystem::create_directories(log_path->parent_path());
            }
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path->string(), false));
        }
        auto logger = std::make_shared<spdlog::logger>("sessionguard", sinks.begin(), sinks.end());
        logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    }

} // namespace sessionguard::cli
