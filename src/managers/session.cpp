#include "session.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <ssh/marker_protocol.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>

// Ready-line search gives up keeping bytes beyond this
static constexpr std::size_t MAX_INIT_BUFFER = 256 * 1024;

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Connecting:  return "connecting";
        case SessionState::Ready:       return "ready";
        case SessionState::Executing:   return "executing";
        case SessionState::Closing:     return "closing";
        case SessionState::Closed:      return "closed";
        case SessionState::Failed:      return "failed";
    }
    return "unknown";
}

SessionOptions SessionOptions::from_config(const Config& config) {
    SessionOptions o;
    o.ps1 = config.shell().ps1;
    o.prompt_template = config.shell().prompt_template;
    o.max_cwd_length = static_cast<std::size_t>(std::max(1, config.shell().max_cwd_length));
    o.init_timeout = std::chrono::seconds(config.timeouts().init_secs);
    o.command_timeout = std::chrono::seconds(config.timeouts().command_secs);
    o.drain_timeout = std::chrono::seconds(config.timeouts().drain_secs);
    o.max_output_bytes = config.max_output_bytes();
    o.max_command_records = static_cast<std::size_t>(std::max(0, config.max_command_records()));
    return o;
}

static std::future<Result<CommandResult>> ready_future(Result<CommandResult> r) {
    std::promise<Result<CommandResult>> p;
    p.set_value(std::move(r));
    return p.get_future();
}

Session::Session(std::string name, SessionTarget target, SessionOptions options)
    : name_(std::move(name)),
      target_(std::move(target)),
      options_(std::move(options)),
      created_at_(std::chrono::system_clock::now()),
      history_(std::make_shared<HistoryBuffer>()),
      hub_(BroadcastHub::create(history_)),
      last_activity_(created_at_) {}

Session::~Session() {
    close();
    if (executor_listener_) history_->remove_listener(executor_listener_);
}

// ── Lifecycle ───────────────────────────────────────────────

Result<void> Session::start(std::shared_ptr<RemoteChannel> channel, StatusCallback callback) {
    if (!channel) {
        return Result<void>::Err("No channel", ErrorCode::ConnectError);
    }

    auto tmpl = PromptTemplate::create(options_.prompt_template, options_.max_cwd_length);
    if (tmpl.is_err()) {
        fail(tmpl.error);
        return Result<void>::Err(tmpl.error, ErrorCode::ConnectError);
    }
    template_ = tmpl.value;

    channel_ = std::move(channel);
    executor_ = std::make_unique<CommandExecutor>(channel_, options_.max_output_bytes);
    CommandExecutor* exec = executor_.get();
    executor_listener_ = history_->add_listener([exec](const OutputChunk& chunk) {
        exec->on_chunk(chunk);
    });

    reader_ = std::thread(&Session::reader_loop, this);

    if (callback) callback("Initializing shell prompt...");
    shellcast_log(fmt::format("[{}] init: forcing PS1 {}", name_, options_.ps1));

    std::string error;
    auto w = channel_->write(build_init_command(options_.ps1));
    if (w.is_err()) {
        error = "Failed to write init command: " + w.error;
    } else {
        std::unique_lock<std::mutex> lock(mutex_);
        bool settled = state_cv_.wait_for(lock, options_.init_timeout, [this] {
            return state_ != SessionState::Connecting;
        });
        if (state_ == SessionState::Ready) {
            shellcast_log(fmt::format("[{}] ready as {}@{}", name_, remote_user_, remote_host_));
            return Result<void>::Ok();
        }
        error = settled ? error_details_
                        : fmt::format("Shell did not show a prompt within {}ms",
                                      options_.init_timeout.count());
    }

    fail(error);
    stop_ = true;
    channel_->close();
    if (reader_.joinable()) reader_.join();
    return Result<void>::Err(error, ErrorCode::ConnectError);
}

void Session::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Closed || state_ == SessionState::Closing) return;
        if (state_ != SessionState::Failed) state_ = SessionState::Closing;
    }
    state_cv_.notify_all();
    shellcast_log(fmt::format("[{}] closing", name_));

    if (executor_) executor_->shutdown(options_.drain_timeout);

    stop_ = true;
    if (channel_) channel_->close();
    if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id()) {
        reader_.join();
    }

    // After the reader is gone no chunk can follow End
    hub_->close();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Closing) state_ = SessionState::Closed;
    }
    state_cv_.notify_all();
    shellcast_log(fmt::format("[{}] closed", name_));
}

void Session::fail(const std::string& error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Failed || state_ == SessionState::Closed ||
            state_ == SessionState::Closing) {
            return;
        }
        state_ = SessionState::Failed;
        error_details_ = error;
    }
    state_cv_.notify_all();
    shellcast_log(fmt::format("[{}] failed: {}", name_, error));

    if (executor_) executor_->shutdown(std::chrono::milliseconds(0));
    hub_->close(error);
}

// ── Reader ──────────────────────────────────────────────────

void Session::reader_loop() {
    while (!stop_) {
        auto r = channel_->read(options_.poll_interval);
        switch (r.status) {
            case ReadResult::Status::Data:
                touch();
                handle_bytes(r.bytes);
                break;
            case ReadResult::Status::Idle:
                break;
            case ReadResult::Status::Closed:
                if (!stop_) fail("Remote shell closed the channel");
                return;
            case ReadResult::Status::Error:
                if (!stop_) fail("Channel error: " + r.error);
                return;
        }
    }
}

void Session::handle_bytes(const std::string& bytes) {
    switch (stage_) {
        case InitStage::AwaitReady: {
            init_buf_ += bytes;
            auto ready = parse_ready_line(init_buf_);
            if (!ready) {
                if (init_buf_.size() > MAX_INIT_BUFFER) {
                    init_buf_.erase(0, init_buf_.size() - MAX_INIT_BUFFER / 2);
                }
                return;
            }

            PromptPattern pattern = template_->instantiate(ready->user, ready->host);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                remote_user_ = ready->user;
                remote_host_ = ready->host;
            }
            shellcast_log(fmt::format("[{}] init: ready marker, prompt '{}<cwd>{}'",
                                      name_, escape_bytes(pattern.prefix),
                                      escape_bytes(pattern.suffix)));

            probe_ = std::make_unique<PromptMatcher>(pattern);
            matcher_ = std::make_unique<PromptMatcher>(pattern);
            std::string rest = init_buf_.substr(ready->end);
            init_buf_.clear();
            stage_ = InitStage::AwaitFirstPrompt;
            if (!rest.empty()) handle_bytes(rest);
            return;
        }

        case InitStage::AwaitFirstPrompt: {
            // Everything before the first real prompt is init noise
            init_buf_ += bytes;
            auto found = probe_->feed(bytes);
            if (found.empty()) return;

            std::string rest = init_buf_.substr(found.front().start);
            init_buf_.clear();
            probe_.reset();
            stage_ = InitStage::Streaming;
            stream(rest);

            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (state_ == SessionState::Connecting) state_ = SessionState::Ready;
            }
            state_cv_.notify_all();
            return;
        }

        case InitStage::Streaming:
            stream(bytes);
            return;
    }
}

// Split at prompt ends so every boundary chunk ends exactly with its prompt
void Session::stream(const std::string& bytes) {
    uint64_t base = matcher_->offset();
    auto found = matcher_->feed(bytes);

    std::size_t pos = 0;
    for (const auto& b : found) {
        std::size_t end = static_cast<std::size_t>(b.end - base);
        history_->append(bytes.substr(pos, end - pos), b.start);
        pos = end;
    }
    if (pos < bytes.size()) {
        history_->append(bytes.substr(pos));
    }
}

// ── Commands ────────────────────────────────────────────────

std::future<Result<CommandResult>> Session::submit(const std::string& command,
                                                   std::optional<std::chrono::milliseconds> timeout) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Ready) {
            return ready_future(Result<CommandResult>::Err(
                fmt::format("Session '{}' is {}", name_, session_state_name(state_)),
                ErrorCode::SessionClosed));
        }
    }
    touch();
    return executor_->submit(command, timeout.value_or(options_.command_timeout));
}

Result<CommandResult> Session::exec(const std::string& command,
                                    std::optional<std::chrono::milliseconds> timeout,
                                    CommandSource source) {
    auto started = std::chrono::system_clock::now();
    auto result = submit(command, timeout).get();

    // Only commands that reached the shell are recorded
    if (result.is_ok() || result.code == ErrorCode::Timeout ||
        result.code == ErrorCode::ChannelError) {
        record(command, source, result, started);
    }
    return result;
}

void Session::record(const std::string& command, CommandSource source,
                     const Result<CommandResult>& r,
                     std::chrono::system_clock::time_point started) {
    CommandRecord rec;
    rec.command = command;
    rec.source = source;
    rec.started_at = started;
    if (r.is_ok()) {
        rec.duration_ms = r.value.duration_ms;
        rec.exit_code = r.value.exit_code;
        rec.status = r.value.exit_code == 0 ? "success" : "failure";
    } else {
        rec.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now() - started).count();
        rec.status = r.code == ErrorCode::Timeout ? "timeout" : "error";
    }

    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(std::move(rec));
    while (records_.size() > options_.max_command_records) {
        records_.pop_front();
    }
}

Result<void> Session::send_input(const std::string& bytes) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Ready) {
            return Result<void>::Err(
                fmt::format("Session '{}' is {}", name_, session_state_name(state_)),
                ErrorCode::SessionClosed);
        }
    }
    // A typed line would run in the middle of the in-flight command; control
    // characters (^C, ^D, ^Z) still pass so it can be cancelled
    if (executor_ && executor_->busy() && bytes.find_first_of("\r\n") != std::string::npos) {
        return Result<void>::Err(
            fmt::format("Session '{}' is executing a command", name_), ErrorCode::Busy);
    }
    auto w = channel_->write(bytes);
    if (w.is_err()) {
        return Result<void>::Err(w.error, ErrorCode::ChannelError);
    }
    touch();
    return Result<void>::Ok();
}

Result<void> Session::send_signal(const std::string& signal) {
    std::string sig = signal;
    trim(sig);
    std::transform(sig.begin(), sig.end(), sig.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (sig.rfind("SIG", 0) != 0) sig = "SIG" + sig;

    std::string bytes;
    if (sig == "SIGINT") bytes = "\x03";
    else if (sig == "SIGTERM" || sig == "SIGQUIT") bytes = "\x04";
    else if (sig == "SIGTSTP") bytes = "\x1a";
    else return Result<void>::Err("Unsupported signal: " + signal);

    shellcast_log(fmt::format("[{}] signal {}", name_, sig));
    return send_input(bytes);
}

Observer Session::attach() {
    return hub_->attach();
}

Observer Session::attach(ObserverCallback callback) {
    return hub_->attach(std::move(callback));
}

// ── State ───────────────────────────────────────────────────

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::Ready && executor_ && executor_->busy()) {
        return SessionState::Executing;
    }
    return state_;
}

SessionInfo Session::info() const {
    SessionInfo info;
    info.name = name_;
    info.status = state();
    info.created_at = created_at_;
    info.host = target_.host;

    std::lock_guard<std::mutex> lock(mutex_);
    info.last_activity = last_activity_;
    info.user = remote_user_.empty() ? target_.user : remote_user_;
    info.error = error_details_;
    return info;
}

std::vector<CommandRecord> Session::command_records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<CommandRecord>(records_.begin(), records_.end());
}

void Session::touch() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_activity_ = std::chrono::system_clock::now();
}
