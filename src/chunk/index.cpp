#include "chunk/index.hpp"
#include "chunk/codec.hpp"
#include <spdlog/spdlog.h>
#include <string_view>

namespace chunkdump::chunk {

namespace {

bool is_blank(std::string_view line) {
    return line.find_first_not_of(" \t\r") == std::string_view::npos;
}

}  // namespace

bool read_record(std::istream& in, std::string& line, Offset& offset) {
    while (true) {
        offset = static_cast<Offset>(in.tellg());
        if (!std::getline(in, line)) {
            return false;
        }
        if (!is_blank(line)) {
            return true;
        }
    }
}

Result<Index> Index::build(std::istream& in) {
    Index idx;
    std::string line;
    Offset offset = 0;

    while (read_record(in, line, offset)) {
        auto chunk = ChunkCodec::decode(line);
        if (chunk.is_err()) {
            return Result<Index>::Err(Error{
                chunk.error().code,
                "indexing record at offset " + std::to_string(offset) + ": " + chunk.error().message
            });
        }

        auto id = chunk.value().group_id();
        if (id.is_err()) {
            return Result<Index>::Err(Error{
                id.error().code,
                "indexing record at offset " + std::to_string(offset) + ": " + id.error().message
            });
        }

        idx.groups_[id.value()].push_back(offset);
        ++idx.records_;
    }

    if (in.bad()) {
        return Result<Index>::Err(Error{ErrorCode::Io, "read error while indexing chunk log"});
    }

    // Rewind for random access on the same handle
    in.clear();
    in.seekg(0, std::ios::beg);
    if (in.fail()) {
        return Result<Index>::Err(Error{ErrorCode::Io, "failed to rewind chunk log"});
    }

    spdlog::debug("Indexed {} records in {} groups", idx.records_, idx.groups_.size());
    return Result<Index>::Ok(std::move(idx));
}

const Index::Offsets* Index::find(const GroupId& id) const noexcept {
    auto it = groups_.find(id);
    return it == groups_.end() ? nullptr : &it->second;
}

std::vector<GroupId> Index::keys() const {
    std::vector<GroupId> out;
    out.reserve(groups_.size());
    for (const auto& [id, _] : groups_) {
        out.push_back(id);
    }
    return out;
}

}  // namespace chunkdump::chunk
