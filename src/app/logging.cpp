#include "app/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace chunkdump::app {

void setup_logging(const std::string& level) {
    // Logs go to stderr so that stdout stays clean for command output
    auto logger = spdlog::stderr_color_mt("chunkdump");
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(level));
}

}  // namespace chunkdump::app
