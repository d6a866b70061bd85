#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// One immutable, sequence-numbered slice of session output.
struct OutputChunk {
    uint64_t sequence = 0;
    uint64_t offset = 0;              // session-relative offset of data[0]
    std::string data;                 // raw bytes exactly as the remote sent them
    bool prompt_boundary = false;     // data ends with a confirmed prompt
    uint64_t prompt_offset = 0;       // where that prompt starts (valid if prompt_boundary)
};

// Append-only record of a session's terminal bytes.
//
// Sequence numbers start at 0 and are gap-free. Listeners run synchronously
// inside append() while the buffer lock is held, so every listener has seen
// chunk N before append() of chunk N returns and before any reader can see
// chunk N+1. Listeners must not call back into the buffer.
class HistoryBuffer {
public:
    using Listener = std::function<void(const OutputChunk&)>;
    using SnapshotFn = std::function<void(const std::vector<OutputChunk>&)>;

    HistoryBuffer() = default;
    HistoryBuffer(const HistoryBuffer&) = delete;
    HistoryBuffer& operator=(const HistoryBuffer&) = delete;

    // Store bytes as the next chunk. prompt_offset marks the chunk as ending
    // with a prompt that starts at that offset. A boundary at or before the
    // last recorded one is not recorded again (the chunk is kept, the flag is
    // dropped). Empty data is ignored and returns nullopt.
    std::optional<uint64_t> append(const std::string& bytes,
                                   std::optional<uint64_t> prompt_offset = std::nullopt);

    std::vector<OutputChunk> replay() const;
    std::vector<OutputChunk> replay_from(uint64_t sequence) const;

    // Whole history as one byte string
    std::string concatenated() const;

    std::size_t size() const;
    uint64_t byte_count() const;
    std::optional<uint64_t> last_prompt_offset() const;

    std::size_t add_listener(Listener listener);
    void remove_listener(std::size_t id);

    // Run fn on the current chunks with appends blocked. Used for the
    // replay-then-live handoff: whatever fn registers sees every later chunk.
    void with_snapshot(const SnapshotFn& fn) const;

private:
    mutable std::mutex mutex_;
    std::vector<OutputChunk> chunks_;
    uint64_t bytes_ = 0;
    std::optional<uint64_t> last_prompt_;
    std::map<std::size_t, Listener> listeners_;
    std::size_t next_listener_ = 1;
};
