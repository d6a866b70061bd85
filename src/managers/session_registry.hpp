#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <ssh/remote_channel.hpp>
#include "session.hpp"

// Named sessions for the dispatch layer. One instance per process, created
// and torn down explicitly with init()/shutdown() and passed by reference.
class SessionRegistry {
public:
    SessionRegistry(ChannelOpener opener, SessionOptions options = {});
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    Result<void> init();

    // Close every session; further calls fail with SessionClosed until init()
    void shutdown();

    bool running() const;

    // Open a channel, inject the prompt and wait for Ready
    Result<SessionInfo> connect(const std::string& name, const SessionTarget& target,
                                StatusCallback callback = nullptr);

    Result<CommandResult> exec(const std::string& name, const std::string& command,
                               std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                               CommandSource source = CommandSource::Agent);

    std::vector<SessionInfo> list_sessions() const;

    // Drives the session to Closed and forgets it
    Result<void> disconnect(const std::string& name);

    // Replay then live chunks
    Result<Observer> attach_monitor(const std::string& name);

    // Full terminal history as one string
    Result<std::string> history(const std::string& name) const;

    Result<std::vector<CommandRecord>> command_records(const std::string& name) const;
    Result<void> send_input(const std::string& name, const std::string& bytes);
    Result<void> send_signal(const std::string& name, const std::string& signal);

    std::shared_ptr<Session> find(const std::string& name) const;

private:
    ChannelOpener opener_;
    SessionOptions options_;

    mutable std::mutex mutex_;
    bool running_ = false;
    std::map<std::string, std::shared_ptr<Session>> sessions_;
    std::set<std::string> connecting_;
};
