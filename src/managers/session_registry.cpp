#include "session_registry.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

SessionRegistry::SessionRegistry(ChannelOpener opener, SessionOptions options)
    : opener_(std::move(opener)), options_(std::move(options)) {}

SessionRegistry::~SessionRegistry() {
    shutdown();
}

Result<void> SessionRegistry::init() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!opener_) {
        return Result<void>::Err("No channel opener configured");
    }
    running_ = true;
    shellcast_log("registry: init");
    return Result<void>::Ok();
}

void SessionRegistry::shutdown() {
    std::map<std::string, std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ && sessions_.empty()) return;
        running_ = false;
        sessions.swap(sessions_);
    }

    for (auto& [name, session] : sessions) {
        session->close();
    }
    shellcast_log(fmt::format("registry: shutdown, closed {} sessions", sessions.size()));
}

bool SessionRegistry::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

std::shared_ptr<Session> SessionRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(name);
    return it == sessions_.end() ? nullptr : it->second;
}

// ── Lifecycle ───────────────────────────────────────────────

Result<SessionInfo> SessionRegistry::connect(const std::string& name,
                                             const SessionTarget& target,
                                             StatusCallback callback) {
    auto valid = validate_session_name(name);
    if (valid.is_err()) {
        return Result<SessionInfo>::Err(valid.error, ErrorCode::InvalidArgument);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return Result<SessionInfo>::Err("Registry is not running", ErrorCode::SessionClosed);
        }
        if (sessions_.count(name) || connecting_.count(name)) {
            return Result<SessionInfo>::Err("Session '" + name + "' already exists",
                                            ErrorCode::AlreadyExists);
        }
        connecting_.insert(name);
    }

    auto release = [&] {
        std::lock_guard<std::mutex> lock(mutex_);
        connecting_.erase(name);
    };

    shellcast_log(fmt::format("registry: connect {} -> {}@{}:{}", name, target.user,
                              target.host, target.port));
    if (callback) callback(fmt::format("Connecting to {}...", target.host));

    auto channel = opener_(target);
    if (channel.is_err()) {
        release();
        return Result<SessionInfo>::Err(channel.error, ErrorCode::ConnectError);
    }

    auto session = std::make_shared<Session>(name, target, options_);
    auto started = session->start(channel.value, callback);
    if (started.is_err()) {
        release();
        session->close();
        return Result<SessionInfo>::Err(started.error, ErrorCode::ConnectError);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        connecting_.erase(name);
        if (!running_) {
            // shutdown() ran while we were connecting
            session->close();
            return Result<SessionInfo>::Err("Registry shut down during connect",
                                            ErrorCode::SessionClosed);
        }
        sessions_[name] = session;
    }
    return Result<SessionInfo>::Ok(session->info());
}

Result<void> SessionRegistry::disconnect(const std::string& name) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(name);
        if (it == sessions_.end()) {
            return Result<void>::Err("No session named '" + name + "'", ErrorCode::NotFound);
        }
        session = it->second;
        sessions_.erase(it);
    }
    session->close();
    shellcast_log(fmt::format("registry: disconnected {}", name));
    return Result<void>::Ok();
}

// ── Operations ──────────────────────────────────────────────

Result<CommandResult> SessionRegistry::exec(const std::string& name, const std::string& command,
                                            std::optional<std::chrono::milliseconds> timeout,
                                            CommandSource source) {
    auto session = find(name);
    if (!session) {
        return Result<CommandResult>::Err("No session named '" + name + "'", ErrorCode::NotFound);
    }
    return session->exec(command, timeout, source);
}

std::vector<SessionInfo> SessionRegistry::list_sessions() const {
    std::vector<std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, session] : sessions_) sessions.push_back(session);
    }

    std::vector<SessionInfo> out;
    for (const auto& s : sessions) out.push_back(s->info());
    return out;
}

Result<Observer> SessionRegistry::attach_monitor(const std::string& name) {
    auto session = find(name);
    if (!session) {
        return Result<Observer>::Err("No session named '" + name + "'", ErrorCode::NotFound);
    }
    return Result<Observer>::Ok(session->attach());
}

Result<std::string> SessionRegistry::history(const std::string& name) const {
    auto session = find(name);
    if (!session) {
        return Result<std::string>::Err("No session named '" + name + "'", ErrorCode::NotFound);
    }
    return Result<std::string>::Ok(session->history_text());
}

Result<std::vector<CommandRecord>> SessionRegistry::command_records(const std::string& name) const {
    auto session = find(name);
    if (!session) {
        return Result<std::vector<CommandRecord>>::Err("No session named '" + name + "'",
                                                       ErrorCode::NotFound);
    }
    return Result<std::vector<CommandRecord>>::Ok(session->command_records());
}

Result<void> SessionRegistry::send_input(const std::string& name, const std::string& bytes) {
    auto session = find(name);
    if (!session) {
        return Result<void>::Err("No session named '" + name + "'", ErrorCode::NotFound);
    }
    return session->send_input(bytes);
}

Result<void> SessionRegistry::send_signal(const std::string& name, const std::string& signal) {
    auto session = find(name);
    if (!session) {
        return Result<void>::Err("No session named '" + name + "'", ErrorCode::NotFound);
    }
    return session->send_signal(signal);
}
