#include "chunk/recorder.hpp"
#include "chunk/codec.hpp"
#include <spdlog/spdlog.h>
#include <system_error>

namespace chunkdump::chunk {

ChunkRecorder::ChunkRecorder(std::ostream& out, std::string name)
    : out_(out)
    , state_(std::move(name))
{}

ChunkRecorder::ChunkRecorder(PrivateTag, std::unique_ptr<std::ofstream> file, std::filesystem::path path)
    : file_(std::move(file))
    , path_(std::move(path))
    , out_(*file_)
    , state_(path_.filename().string())
{}

ChunkRecorder::~ChunkRecorder() {
    auto status = close();
    if (status.is_err()) {
        spdlog::error("Closing chunk recorder: {}", status.error().to_string());
    }
}

Result<std::unique_ptr<ChunkRecorder>> ChunkRecorder::create(const std::filesystem::path& path) {
    auto file = std::make_unique<std::ofstream>(path, std::ios::binary | std::ios::trunc);
    if (!file->is_open()) {
        return Result<std::unique_ptr<ChunkRecorder>>::Err(Error{
            ErrorCode::Io,
            "Failed to create chunk log: " + path.string()
        });
    }
    spdlog::debug("Recording chunks to {}", path.string());
    return Result<std::unique_ptr<ChunkRecorder>>::Ok(
        std::make_unique<ChunkRecorder>(PrivateTag{}, std::move(file), path)
    );
}

Status ChunkRecorder::record(const Chunk& chunk) {
    // Unaddressable chunks could never be read back through the index.
    auto id = chunk.group_id();
    if (id.is_err()) {
        return Status::Err(id.error());
    }

    auto encoded = ChunkCodec::encode(chunk);
    if (encoded.is_err()) {
        return Status::Err(encoded.error());
    }
    const std::string line = std::move(encoded).take_value();

    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return error_status(ErrorCode::Io, "recorder is closed");
    }
    if (failed_) {
        return error_status(ErrorCode::Io, "recorder stopped after a failed write");
    }

    const auto start = out_.tellp();
    out_.write(line.data(), static_cast<std::streamsize>(line.size()));
    if (flush_each_record_) {
        out_.flush();
    }

    if (!out_) {
        failed_ = true;
        // Drop the torn tail so the log stays decodable up to the last good record.
        if (file_ && start != std::streampos(-1)) {
            file_->close();
            std::error_code ec;
            std::filesystem::resize_file(path_, static_cast<std::uintmax_t>(start), ec);
            if (ec) {
                spdlog::error("Failed to truncate {} after write error: {}", path_.string(), ec.message());
            }
        }
        return error_status(ErrorCode::Io, "failed to write record " + chunk.describe());
    }

    ++records_;
    state_.apply(chunk);
    return ok_status();
}

Status ChunkRecorder::stamp_and_record(Chunk chunk) {
    chunk.timestamp = convert::to_epoch_micros(std::chrono::system_clock::now());
    return record(chunk);
}

Status ChunkRecorder::messages(const ChannelId& channel_id,
                               std::vector<slack::Message> messages,
                               bool is_last, int num_threads) {
    Chunk c;
    c.channel_id = channel_id;
    c.count = static_cast<int>(messages.size());
    c.payload = MessagesPayload{std::move(messages), is_last, num_threads};
    return stamp_and_record(std::move(c));
}

Status ChunkRecorder::thread_messages(const ChannelId& channel_id,
                                      slack::Message parent,
                                      std::vector<slack::Message> replies,
                                      bool is_last) {
    Chunk c;
    c.channel_id = channel_id;
    c.thread_ts = parent.thread_ts;
    c.count = static_cast<int>(replies.size());
    c.payload = ThreadMessagesPayload{std::move(parent), std::move(replies), is_last};
    return stamp_and_record(std::move(c));
}

Status ChunkRecorder::files(const ChannelId& channel_id,
                            slack::Message parent,
                            std::vector<slack::File> files,
                            std::optional<slack::Channel> channel) {
    Chunk c;
    c.channel_id = channel_id;
    c.thread_ts = parent.thread_ts;
    c.count = static_cast<int>(files.size());
    c.payload = FilesPayload{std::move(channel), std::move(parent), std::move(files)};
    return stamp_and_record(std::move(c));
}

Status ChunkRecorder::users(std::vector<slack::User> users) {
    Chunk c;
    c.count = static_cast<int>(users.size());
    c.payload = UsersPayload{std::move(users)};
    return stamp_and_record(std::move(c));
}

Status ChunkRecorder::channels(std::vector<slack::Channel> channels) {
    Chunk c;
    c.count = static_cast<int>(channels.size());
    c.payload = ChannelsPayload{std::move(channels)};
    return stamp_and_record(std::move(c));
}

Status ChunkRecorder::channel_info(slack::Channel channel) {
    Chunk c;
    c.channel_id = channel.id;
    c.payload = ChannelInfoPayload{std::move(channel)};
    return stamp_and_record(std::move(c));
}

Status ChunkRecorder::channel_users(const ChannelId& channel_id, std::vector<std::string> user_ids) {
    Chunk c;
    c.channel_id = channel_id;
    c.count = static_cast<int>(user_ids.size());
    c.payload = ChannelUsersPayload{std::move(user_ids)};
    return stamp_and_record(std::move(c));
}

Status ChunkRecorder::workspace_info(slack::WorkspaceInfo info) {
    Chunk c;
    c.payload = WorkspaceInfoPayload{std::move(info)};
    return stamp_and_record(std::move(c));
}

Status ChunkRecorder::starred_items(std::vector<slack::StarredItem> items) {
    Chunk c;
    c.count = static_cast<int>(items.size());
    c.payload = StarredItemsPayload{std::move(items)};
    return stamp_and_record(std::move(c));
}

Status ChunkRecorder::bookmarks(const ChannelId& channel_id, std::vector<slack::Bookmark> bookmarks) {
    Chunk c;
    c.channel_id = channel_id;
    c.count = static_cast<int>(bookmarks.size());
    c.payload = BookmarksPayload{std::move(bookmarks)};
    return stamp_and_record(std::move(c));
}

Status ChunkRecorder::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return ok_status();
    }
    closed_ = true;

    if (failed_) {
        return ok_status();  // already reported by record()
    }

    out_.flush();
    if (file_) {
        file_->close();
    }
    if (!out_) {
        return error_status(ErrorCode::Io, "failed to flush chunk log");
    }
    spdlog::debug("Chunk recorder closed after {} records", records_);
    return ok_status();
}

state::State ChunkRecorder::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::size_t ChunkRecorder::record_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

}  // namespace chunkdump::chunk
