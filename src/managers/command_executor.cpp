#include "command_executor.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <ssh/marker_protocol.hpp>
#include <fmt/format.h>
#include <algorithm>

const char* command_state_name(CommandState state) {
    switch (state) {
        case CommandState::Queued:          return "queued";
        case CommandState::Sent:            return "sent";
        case CommandState::AwaitingPrompt:  return "awaiting-prompt";
        case CommandState::Completed:       return "completed";
        case CommandState::TimedOut:        return "timed-out";
        case CommandState::Failed:          return "failed";
    }
    return "unknown";
}

static std::future<Result<CommandResult>> ready_future(Result<CommandResult> r) {
    std::promise<Result<CommandResult>> p;
    p.set_value(std::move(r));
    return p.get_future();
}

CommandExecutor::CommandExecutor(std::shared_ptr<RemoteChannel> channel,
                                 std::size_t max_output_bytes)
    : channel_(std::move(channel)), max_output_bytes_(max_output_bytes) {}

// Index just past the first line whose text (CRs dropped) ends with the
// command, i.e. the shell's echo of it
static std::optional<std::size_t> echo_line_end(const std::string& segment,
                                                const std::string& command) {
    std::string cmd = command;
    trim(cmd);
    std::size_t start = 0;
    while (start < segment.size()) {
        auto nl = segment.find('\n', start);
        if (nl == std::string::npos) break;

        std::string line = segment.substr(start, nl - start);
        line.erase(std::remove(line.begin(), line.end(), '\r'), line.end());
        trim(line);
        if (line.size() >= cmd.size() &&
            line.compare(line.size() - cmd.size(), cmd.size(), cmd) == 0) {
            return nl + 1;
        }
        start = nl + 1;
    }
    return std::nullopt;
}

CommandExecutor::~CommandExecutor() {
    shutdown(std::chrono::milliseconds(0));
}

Result<void> CommandExecutor::validate_command(const std::string& command) {
    std::string cmd = command;
    trim(cmd);
    if (cmd.empty()) {
        return Result<void>::Err("Command is empty");
    }
    if (command.find_first_of("\r\n") != std::string::npos) {
        return Result<void>::Err("Multi-line commands are not supported");
    }

    std::string word = cmd.substr(0, cmd.find_first_of(" \t;&|"));
    if (word == "exit" || word == "logout") {
        return Result<void>::Err("'" + word + "' would terminate the shell session");
    }
    return Result<void>::Ok();
}

std::future<Result<CommandResult>> CommandExecutor::submit(const std::string& command,
                                                           std::chrono::milliseconds timeout) {
    auto valid = validate_command(command);
    if (valid.is_err()) {
        return ready_future(Result<CommandResult>::Err(valid.error, ErrorCode::InvalidArgument));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return ready_future(Result<CommandResult>::Err("Session is closed",
                                                           ErrorCode::SessionClosed));
        }
        if (pending_) {
            shellcast_log(fmt::format("exec: busy, rejected '{}' (in flight: '{}')",
                                      command, pending_->command));
            return ready_future(Result<CommandResult>::Err(
                "Another command is in flight: " + pending_->command, ErrorCode::Busy));
        }

        pending_ = PendingCommand{command, std::chrono::system_clock::now(), CommandState::Queued};
        phase_ = Phase::UserCommand;
        capture_.clear();
        capture_base_.reset();
        user_output_.clear();
        exec_id_++;
        exit_code_ = -1;
        user_done_ = false;
        status_done_ = false;
        overflow_ = false;
        active_++;

        // Sent before the write: the echo can reach on_chunk before write() returns
        pending_->state = CommandState::Sent;
    }

    shellcast_log(fmt::format("exec: sent '{}' (timeout {}ms)", command, timeout.count()));
    auto w = channel_->write(command + "\n");

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (w.is_err()) {
            return ready_future(finish(Result<CommandResult>::Err(
                "Failed to write command: " + w.error, ErrorCode::ChannelError),
                CommandState::Failed));
        }
        if (pending_ && pending_->state == CommandState::Sent) {
            pending_->state = CommandState::AwaitingPrompt;
        }
    }

    std::promise<Result<CommandResult>> promise;
    auto future = promise.get_future();

    std::lock_guard<std::mutex> waiter_lock(waiter_mutex_);
    // The previous waiter already finished its command; it is at most
    // handing over its result
    if (waiter_.joinable()) waiter_.join();
    waiter_ = std::thread([this, timeout, p = std::move(promise)]() mutable {
        p.set_value(await_completion(timeout));
    });
    return future;
}

Result<CommandResult> CommandExecutor::await_completion(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    auto started = std::chrono::steady_clock::now();
    auto submitted_at = pending_ ? pending_->submitted_at : std::chrono::system_clock::now();

    auto timed_out = [&](const char* what) {
        return finish(Result<CommandResult>::Err(
            fmt::format("Command timed out after {}ms {}", timeout.count(), what),
            ErrorCode::Timeout), CommandState::TimedOut);
    };

    // Phase 1: the user command's own prompt
    bool woke = cv_.wait_until(lock, deadline, [this] {
        return aborting_ || overflow_ || user_done_;
    });
    if (aborting_) {
        return finish(Result<CommandResult>::Err("Session closed during command",
                                                 ErrorCode::SessionClosed),
                      CommandState::Failed);
    }
    if (overflow_) {
        return finish(Result<CommandResult>::Err(
            fmt::format("No prompt found within {} bytes of output", max_output_bytes_),
            ErrorCode::Timeout), CommandState::TimedOut);
    }
    if (!woke) return timed_out("waiting for prompt");

    // Phase 2: status query, written only after the prompt so it is never
    // consumed as input by the user command
    uint64_t id = exec_id_;
    lock.unlock();
    auto w = channel_->write(build_status_command(id));
    lock.lock();
    if (w.is_err()) {
        return finish(Result<CommandResult>::Err("Failed to write status query: " + w.error,
                                                 ErrorCode::ChannelError),
                      CommandState::Failed);
    }

    woke = cv_.wait_until(lock, deadline, [this] {
        return aborting_ || overflow_ || status_done_;
    });
    if (aborting_) {
        return finish(Result<CommandResult>::Err("Session closed during command",
                                                 ErrorCode::SessionClosed),
                      CommandState::Failed);
    }
    if (overflow_ || !woke) return timed_out("waiting for exit status");

    CommandResult result;
    result.stdout_data = user_output_;
    result.exit_code = exit_code_;
    result.started_at = submitted_at;
    result.completed_at = std::chrono::system_clock::now();
    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    return finish(Result<CommandResult>::Ok(std::move(result)), CommandState::Completed);
}

// Caller holds mutex_
Result<CommandResult> CommandExecutor::finish(Result<CommandResult> result, CommandState state) {
    last_state_ = state;
    if (pending_) {
        pending_->state = state;
        shellcast_log_exec(fmt::format("exec[{}]", command_state_name(state)),
                           pending_->command, result);
    }
    pending_.reset();
    active_--;
    done_cv_.notify_all();
    return result;
}

void CommandExecutor::on_chunk(const OutputChunk& chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending_ || status_done_ || overflow_) return;
    if (pending_->state != CommandState::Sent &&
        pending_->state != CommandState::AwaitingPrompt) {
        return;
    }

    if (!capture_base_) capture_base_ = chunk.offset;
    capture_ += chunk.data;

    if (capture_.size() > max_output_bytes_) {
        overflow_ = true;
        cv_.notify_all();
        return;
    }
    if (!chunk.prompt_boundary) return;

    std::size_t prompt_at = 0;
    if (chunk.prompt_offset > *capture_base_) {
        prompt_at = std::min<std::size_t>(chunk.prompt_offset - *capture_base_, capture_.size());
    }
    std::string segment = capture_.substr(0, prompt_at);
    capture_.clear();
    capture_base_ = chunk.offset + chunk.data.size();

    if (phase_ == Phase::UserCommand) {
        auto echo = echo_line_end(segment, pending_->command);
        if (!echo) {
            shellcast_log(fmt::format("exec: skipped prompt without echo of '{}': {}",
                                      pending_->command, escape_bytes(segment)));
            return;
        }
        user_output_ = segment.substr(*echo);
        user_done_ = true;
        phase_ = Phase::StatusQuery;
    } else if (auto code = parse_status_output(segment, exec_id_)) {
        exit_code_ = *code;
        status_done_ = true;
    } else if (segment.find(SHELLCAST_STATUS_MARKER) == std::string::npos) {
        // The earlier prompt was stale; this one ends the command
        auto echo = echo_line_end(segment, pending_->command);
        user_output_ = echo ? segment.substr(*echo) : segment;
        shellcast_log(fmt::format("exec: late prompt for '{}', output replaced",
                                  pending_->command));
        return;
    } else {
        shellcast_log("exec: skipped status reply of an earlier command");
        return;
    }
    cv_.notify_all();
}

bool CommandExecutor::busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.has_value();
}

std::optional<PendingCommand> CommandExecutor::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

std::optional<CommandState> CommandExecutor::last_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_state_;
}

void CommandExecutor::shutdown(std::chrono::milliseconds drain) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        closed_ = true;
        if (!done_cv_.wait_for(lock, drain, [this] { return active_ == 0; })) {
            shellcast_log("exec: drain timeout, aborting in-flight command");
            aborting_ = true;
            cv_.notify_all();
            done_cv_.wait(lock, [this] { return active_ == 0; });
        }
    }

    std::lock_guard<std::mutex> waiter_lock(waiter_mutex_);
    if (waiter_.joinable()) waiter_.join();
}
