#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace chunkdump {

// Key that queues records of one logical entity (channel, thread, file list...)
using GroupId = std::string;

// Byte offset of a record inside a log stream
using Offset = std::int64_t;

// Channel / conversation identifier, e.g. "C01234567"
using ChannelId = std::string;

// Message timestamp as sent by the service, e.g. "1638912345.000200"
using MessageTs = std::string;

// Wall clock time for capture stamps
using WallTime = std::chrono::system_clock::time_point;

namespace convert {

/// Capture stamp: microseconds since the Unix epoch
[[nodiscard]] inline std::int64_t to_epoch_micros(WallTime t) {
    return std::chrono::duration_cast<std::chrono::microseconds>(t.time_since_epoch()).count();
}

}  // namespace convert

}  // namespace chunkdump
