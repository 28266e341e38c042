#pragma once

#include "chunk/chunk.hpp"
#include "core/status.hpp"
#include <string>
#include <string_view>

namespace chunkdump::chunk {

/// Wire format of the chunk log: one JSON object per line,
/// abbreviated keys, empty fields omitted.
class ChunkCodec {
public:
    /// Serialize a chunk as one newline-terminated record
    /// @return Err(InvalidArgument) when a string field is not valid UTF-8
    [[nodiscard]] static Result<std::string> encode(const Chunk& chunk);

    /// Parse one record (trailing newline optional)
    /// @return Err(Decode) on malformed input, Err(UnsupportedAddress) on unknown type tag
    [[nodiscard]] static Result<Chunk> decode(std::string_view record);
};

}  // namespace chunkdump::chunk
