#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "history_buffer.hpp"

// What an observer sees next
struct ObserverEvent {
    enum class Type {
        Chunk,    // chunk holds the next chunk in sequence order
        Idle,     // nothing new within the wait
        End,      // stream finished; error is set if the session failed
    };

    Type type = Type::Idle;
    OutputChunk chunk;
    std::string error;
};

using ObserverCallback = std::function<void(const ObserverEvent&)>;

// Per-subscription delivery state, shared between the Observer handle
// (owner) and the hub (weak).
struct ObserverState {
    uint64_t id = 0;
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<OutputChunk> queue;
    ObserverCallback callback;        // push mode when set
    uint64_t delivered = 0;
    bool ended = false;
    bool detached = false;
    std::string end_error;
};

class BroadcastHub;

// Subscription handle returned by BroadcastHub::attach(). Move-only.
// Destroying the handle detaches it.
class Observer {
public:
    Observer() = default;
    ~Observer();

    Observer(Observer&& other) noexcept = default;
    Observer& operator=(Observer&& other) noexcept;
    Observer(const Observer&) = delete;
    Observer& operator=(const Observer&) = delete;

    // Next replayed or live chunk, waiting up to `wait`. After the stream
    // ends (session closed, failed or this handle detached) queued chunks
    // are still returned first, then End.
    ObserverEvent next(std::chrono::milliseconds wait);

    // Number of chunks delivered so far: the sequence number of the next
    // chunk. 0 means nothing delivered yet (full replay pending).
    uint64_t cursor() const;

    // Idempotent; stops future deliveries.
    void detach();

    bool attached() const;
    uint64_t id() const;

private:
    friend class BroadcastHub;
    Observer(std::weak_ptr<BroadcastHub> hub, std::shared_ptr<ObserverState> state);

    std::weak_ptr<BroadcastHub> hub_;
    std::shared_ptr<ObserverState> state_;
};

// Fans out history chunks to observers.
//
// attach() takes the replay snapshot and registers the observer inside one
// history lock hold, so the observer receives every chunk from sequence 0
// exactly once and in order. Chunks are delivered on the appending thread,
// so per-observer order is the history order.
class BroadcastHub : public std::enable_shared_from_this<BroadcastHub> {
public:
    static std::shared_ptr<BroadcastHub> create(std::shared_ptr<HistoryBuffer> history);
    ~BroadcastHub();

    BroadcastHub(const BroadcastHub&) = delete;
    BroadcastHub& operator=(const BroadcastHub&) = delete;

    // Pull-mode subscription
    Observer attach();

    // Push-mode subscription: callback receives the replay synchronously,
    // then live chunks and a final End. The callback runs with the history
    // lock held and must not call back into the session.
    Observer attach(ObserverCallback callback);

    void detach(uint64_t id);

    // End every subscription. Later attaches get the replay then End.
    void close(const std::string& error = "");

    bool closed() const;
    std::size_t observer_count() const;

private:
    explicit BroadcastHub(std::shared_ptr<HistoryBuffer> history);

    void publish(const OutputChunk& chunk);
    Observer subscribe(ObserverCallback callback);

    std::shared_ptr<HistoryBuffer> history_;
    std::size_t listener_id_ = 0;

    mutable std::mutex mutex_;
    std::map<uint64_t, std::weak_ptr<ObserverState>> observers_;
    uint64_t next_id_ = 1;
    bool closed_ = false;
    std::string close_error_;
};
