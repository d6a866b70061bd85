#include "history_buffer.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

std::optional<uint64_t> HistoryBuffer::append(const std::string& bytes,
                                              std::optional<uint64_t> prompt_offset) {
    if (bytes.empty()) return std::nullopt;

    std::lock_guard<std::mutex> lock(mutex_);

    OutputChunk chunk;
    chunk.sequence = chunks_.size();
    chunk.offset = bytes_;
    chunk.data = bytes;

    if (prompt_offset) {
        if (last_prompt_ && *prompt_offset <= *last_prompt_) {
            shellcast_log(fmt::format("history: dropped repeated prompt boundary at {} (last {})",
                                      *prompt_offset, *last_prompt_));
        } else {
            chunk.prompt_boundary = true;
            chunk.prompt_offset = *prompt_offset;
            last_prompt_ = *prompt_offset;
        }
    }

    bytes_ += bytes.size();
    chunks_.push_back(std::move(chunk));

    const OutputChunk& stored = chunks_.back();
    for (const auto& [id, listener] : listeners_) {
        listener(stored);
    }
    return stored.sequence;
}

std::vector<OutputChunk> HistoryBuffer::replay() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_;
}

std::vector<OutputChunk> HistoryBuffer::replay_from(uint64_t sequence) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sequence >= chunks_.size()) return {};
    return std::vector<OutputChunk>(chunks_.begin() + static_cast<std::ptrdiff_t>(sequence),
                                    chunks_.end());
}

std::string HistoryBuffer::concatenated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string out;
    out.reserve(bytes_);
    for (const auto& c : chunks_) out += c.data;
    return out;
}

std::size_t HistoryBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

uint64_t HistoryBuffer::byte_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_;
}

std::optional<uint64_t> HistoryBuffer::last_prompt_offset() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_prompt_;
}

std::size_t HistoryBuffer::add_listener(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t id = next_listener_++;
    listeners_[id] = std::move(listener);
    return id;
}

void HistoryBuffer::remove_listener(std::size_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(id);
}

void HistoryBuffer::with_snapshot(const SnapshotFn& fn) const {
    std::lock_guard<std::mutex> lock(mutex_);
    fn(chunks_);
}
