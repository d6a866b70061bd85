#include "broadcast_hub.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <vector>

// Hand one chunk to a subscription. Callbacks run without the state lock
// so they may detach their own handle.
static void deliver(ObserverState& state, const OutputChunk& chunk) {
    ObserverCallback callback;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (state.ended || state.detached) return;
        if (!state.callback) {
            state.queue.push_back(chunk);
            state.cv.notify_all();
            return;
        }
        state.delivered++;
        callback = state.callback;
    }
    ObserverEvent ev;
    ev.type = ObserverEvent::Type::Chunk;
    ev.chunk = chunk;
    callback(ev);
}

static void end_stream(ObserverState& state, const std::string& error) {
    ObserverCallback callback;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (state.ended || state.detached) return;
        state.ended = true;
        state.end_error = error;
        state.cv.notify_all();
        callback = state.callback;
    }
    if (callback) {
        ObserverEvent ev;
        ev.type = ObserverEvent::Type::End;
        ev.error = error;
        callback(ev);
    }
}

// ── Observer ─────────────────────────────────────────────────

Observer::Observer(std::weak_ptr<BroadcastHub> hub, std::shared_ptr<ObserverState> state)
    : hub_(std::move(hub)), state_(std::move(state)) {}

Observer::~Observer() {
    detach();
}

Observer& Observer::operator=(Observer&& other) noexcept {
    if (this != &other) {
        detach();
        hub_ = std::move(other.hub_);
        state_ = std::move(other.state_);
    }
    return *this;
}

ObserverEvent Observer::next(std::chrono::milliseconds wait) {
    ObserverEvent ev;
    if (!state_) {
        ev.type = ObserverEvent::Type::End;
        return ev;
    }

    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait_for(lock, wait, [this] {
        return !state_->queue.empty() || state_->ended || state_->detached;
    });

    if (!state_->queue.empty()) {
        ev.type = ObserverEvent::Type::Chunk;
        ev.chunk = std::move(state_->queue.front());
        state_->queue.pop_front();
        state_->delivered++;
    } else if (state_->ended || state_->detached) {
        ev.type = ObserverEvent::Type::End;
        ev.error = state_->end_error;
    } else {
        ev.type = ObserverEvent::Type::Idle;
    }
    return ev;
}

uint64_t Observer::cursor() const {
    if (!state_) return 0;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->delivered;
}

void Observer::detach() {
    if (!state_) return;
    if (auto hub = hub_.lock()) {
        hub->detach(state_->id);
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->detached = true;
    state_->cv.notify_all();
}

bool Observer::attached() const {
    if (!state_) return false;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return !state_->detached && !state_->ended;
}

uint64_t Observer::id() const {
    return state_ ? state_->id : 0;
}

// ── BroadcastHub ─────────────────────────────────────────────

BroadcastHub::BroadcastHub(std::shared_ptr<HistoryBuffer> history)
    : history_(std::move(history)) {}

std::shared_ptr<BroadcastHub> BroadcastHub::create(std::shared_ptr<HistoryBuffer> history) {
    std::shared_ptr<BroadcastHub> hub(new BroadcastHub(history));
    std::weak_ptr<BroadcastHub> weak = hub;
    hub->listener_id_ = history->add_listener([weak](const OutputChunk& chunk) {
        if (auto h = weak.lock()) h->publish(chunk);
    });
    return hub;
}

BroadcastHub::~BroadcastHub() {
    history_->remove_listener(listener_id_);
}

Observer BroadcastHub::attach() {
    return subscribe(nullptr);
}

Observer BroadcastHub::attach(ObserverCallback callback) {
    return subscribe(std::move(callback));
}

Observer BroadcastHub::subscribe(ObserverCallback callback) {
    auto state = std::make_shared<ObserverState>();
    state->callback = std::move(callback);

    history_->with_snapshot([&](const std::vector<OutputChunk>& chunks) {
        bool was_closed;
        std::string error;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state->id = next_id_++;
            was_closed = closed_;
            error = close_error_;
            if (!was_closed) observers_[state->id] = state;
        }

        for (const auto& chunk : chunks) deliver(*state, chunk);
        if (was_closed) end_stream(*state, error);

        shellcast_log(fmt::format("hub: observer {} attached, replay {} chunks{}",
                                  state->id, chunks.size(), was_closed ? " (closed)" : ""));
    });

    return Observer(weak_from_this(), state);
}

void BroadcastHub::detach(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (observers_.erase(id)) {
        shellcast_log(fmt::format("hub: observer {} detached", id));
    }
}

void BroadcastHub::publish(const OutputChunk& chunk) {
    std::vector<std::shared_ptr<ObserverState>> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = observers_.begin(); it != observers_.end();) {
            if (auto s = it->second.lock()) {
                live.push_back(std::move(s));
                ++it;
            } else {
                it = observers_.erase(it);
            }
        }
    }
    for (const auto& s : live) deliver(*s, chunk);
}

void BroadcastHub::close(const std::string& error) {
    // Under the history lock so no chunk is published after End
    history_->with_snapshot([&](const std::vector<OutputChunk>&) {
        std::vector<std::shared_ptr<ObserverState>> live;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            closed_ = true;
            close_error_ = error;
            for (const auto& [id, weak] : observers_) {
                if (auto s = weak.lock()) live.push_back(std::move(s));
            }
            observers_.clear();
        }
        for (const auto& s : live) end_stream(*s, error);
    });
}

bool BroadcastHub::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t BroadcastHub::observer_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t n = 0;
    for (const auto& [id, weak] : observers_) {
        if (!weak.expired()) n++;
    }
    return n;
}
