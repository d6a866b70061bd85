#pragma once

#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <core/types.hpp>
#include <ssh/remote_channel.hpp>
#include <terminal/history_buffer.hpp>

enum class CommandState {
    Queued,
    Sent,
    AwaitingPrompt,
    Completed,
    TimedOut,
    Failed,               // write error, or interrupted by shutdown
};

const char* command_state_name(CommandState state);

struct PendingCommand {
    std::string command;
    std::chrono::system_clock::time_point submitted_at;
    CommandState state = CommandState::Queued;
};

// Runs one command at a time against a session's channel.
//
// The command is written followed by LF. The first prompt boundary preceded
// by the command's echoed line ends the command; prompts without it are left
// over from an earlier, timed-out command and are skipped. Only then is the
// status query written, tagged with a per-exec id, and the prompt after the
// matching status line completes the exec. A prompt that arrives before that
// line means the command's real prompt came later, so stdout is taken from
// the latest segment instead. The executor never reads the channel itself:
// it is fed every history chunk through on_chunk(), so all execution bytes
// stay in the session history.
class CommandExecutor {
public:
    CommandExecutor(std::shared_ptr<RemoteChannel> channel, std::size_t max_output_bytes);
    ~CommandExecutor();

    CommandExecutor(const CommandExecutor&) = delete;
    CommandExecutor& operator=(const CommandExecutor&) = delete;

    // Busy, InvalidArgument, SessionClosed and ChannelError come back as an
    // already-ready future. Otherwise the future resolves on completion,
    // Timeout, or SessionClosed if shutdown() interrupts the wait. The wait
    // runs on a waiter thread owned by the executor, so dropping the future
    // does not block.
    std::future<Result<CommandResult>> submit(const std::string& command,
                                              std::chrono::milliseconds timeout);

    // HistoryBuffer listener
    void on_chunk(const OutputChunk& chunk);

    bool busy() const;
    std::optional<PendingCommand> pending() const;

    // State the most recently finished command ended in
    std::optional<CommandState> last_state() const;

    // Refuse new submits, give an in-flight command up to `drain` to finish,
    // then wake it with SessionClosed and wait for it to return.
    void shutdown(std::chrono::milliseconds drain);

    // Commands that would end the remote shell, or break prompt tracking
    static Result<void> validate_command(const std::string& command);

private:
    enum class Phase { UserCommand, StatusQuery };

    Result<CommandResult> await_completion(std::chrono::milliseconds timeout);
    Result<CommandResult> finish(Result<CommandResult> result, CommandState state);

    std::shared_ptr<RemoteChannel> channel_;
    std::size_t max_output_bytes_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;          // chunk arrived / shutdown
    std::condition_variable done_cv_;     // in-flight command finished

    std::optional<PendingCommand> pending_;
    std::optional<CommandState> last_state_;
    Phase phase_ = Phase::UserCommand;
    std::string capture_;
    std::optional<uint64_t> capture_base_;
    std::string user_output_;
    uint64_t exec_id_ = 0;
    int exit_code_ = -1;
    bool user_done_ = false;
    bool status_done_ = false;
    bool overflow_ = false;

    int active_ = 0;
    bool closed_ = false;
    bool aborting_ = false;

    std::mutex waiter_mutex_;
    std::thread waiter_;
};
