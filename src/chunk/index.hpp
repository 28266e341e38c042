#pragma once

#include "core/status.hpp"
#include "core/types.hpp"
#include <cstddef>
#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkdump::chunk {

/// Byte offsets of every record in a log, grouped by group key.
/// Offsets of one key are in file order. Immutable once built.
class Index {
public:
    using Offsets = std::vector<Offset>;

    Index() = default;

    /// Scan the stream from its current position (expected: the start).
    /// Any decode or addressing error aborts the build; the error names the
    /// offending offset. On success the stream is rewound to the start.
    [[nodiscard]] static Result<Index> build(std::istream& in);

    /// Offsets for a key, nullptr when the key is unknown
    [[nodiscard]] const Offsets* find(const GroupId& id) const noexcept;

    [[nodiscard]] bool contains(const GroupId& id) const noexcept {
        return find(id) != nullptr;
    }

    /// All keys, unordered
    [[nodiscard]] std::vector<GroupId> keys() const;

    /// Number of distinct keys
    [[nodiscard]] std::size_t size() const noexcept { return groups_.size(); }

    /// Number of records in the log
    [[nodiscard]] std::size_t record_count() const noexcept { return records_; }

private:
    std::unordered_map<GroupId, Offsets> groups_;
    std::size_t records_{0};
};

/// Read one newline-terminated record starting at the stream's position.
/// Skips blank lines. @return false on end of stream.
bool read_record(std::istream& in, std::string& line, Offset& offset);

}  // namespace chunkdump::chunk
