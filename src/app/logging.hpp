#pragma once

#include <string>

namespace chunkdump::app {

/// Install the default spdlog logger: colored stdout, timestamped pattern.
/// @param level spdlog level name ("info", "debug", ...)
void setup_logging(const std::string& level);

}  // namespace chunkdump::app
