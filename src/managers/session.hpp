#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include <ssh/remote_channel.hpp>
#include <terminal/prompt_matcher.hpp>
#include <terminal/history_buffer.hpp>
#include <terminal/broadcast_hub.hpp>
#include "command_executor.hpp"

enum class SessionState {
    Connecting,
    Ready,
    Executing,     // reported while a command is in flight; stored state stays Ready
    Closing,
    Closed,
    Failed,
};

const char* session_state_name(SessionState state);

// Per-session settings, normally taken from Config
struct SessionOptions {
    std::string ps1 = DEFAULT_PS1;
    std::string prompt_template = DEFAULT_PROMPT_TEMPLATE;
    std::size_t max_cwd_length = MAX_CWD_LENGTH;
    std::chrono::milliseconds init_timeout{SHELL_INIT_TIMEOUT_SECS * 1000};
    std::chrono::milliseconds command_timeout{CMD_TIMEOUT_SECS * 1000};
    std::chrono::milliseconds drain_timeout{DRAIN_TIMEOUT_SECS * 1000};
    std::chrono::milliseconds poll_interval{READER_POLL_MS};
    std::size_t max_output_bytes = MAX_OUTPUT_BYTES;
    std::size_t max_command_records = MAX_COMMAND_RECORDS;

    static SessionOptions from_config(const Config& config);
};

struct CommandRecord {
    std::string command;
    std::chrono::system_clock::time_point started_at;
    int64_t duration_ms = 0;
    int exit_code = -1;
    std::string status;            // success | failure | timeout | error
    CommandSource source = CommandSource::User;
};

struct SessionInfo {
    std::string name;
    SessionState status = SessionState::Closed;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point last_activity;
    std::string host;
    std::string user;              // as reported by the remote shell
    std::string error;             // Failed sessions
};

// One remote shell: channel, prompt matcher, history, executor and hub.
//
// A reader thread owns the byte path: channel read -> prompt matcher ->
// chunks split at prompt ends -> history append, which notifies the hub and
// the executor before returning.
class Session {
public:
    Session(std::string name, SessionTarget target, SessionOptions options = {});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Start the reader, inject the prompt and wait for the first real prompt.
    // Errors carry ConnectError; the session is left Failed.
    Result<void> start(std::shared_ptr<RemoteChannel> channel, StatusCallback callback = nullptr);

    // Executor submit (future). SessionClosed unless Ready. The future may be
    // dropped without waiting for the command.
    std::future<Result<CommandResult>> submit(const std::string& command,
                                              std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // submit + wait + command record
    Result<CommandResult> exec(const std::string& command,
                               std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                               CommandSource source = CommandSource::User);

    Observer attach();
    Observer attach(ObserverCallback callback);

    // Raw keyboard input (monitor clients). Busy for input containing CR or
    // LF while a command is in flight.
    Result<void> send_input(const std::string& bytes);

    // SIGINT -> ^C, SIGTERM/SIGQUIT -> ^D, SIGTSTP -> ^Z
    Result<void> send_signal(const std::string& signal);

    // Closing -> drain -> close channel -> join reader -> Closed
    void close();

    SessionState state() const;
    SessionInfo info() const;
    const std::string& name() const { return name_; }
    std::chrono::system_clock::time_point created_at() const { return created_at_; }

    std::vector<CommandRecord> command_records() const;
    std::vector<OutputChunk> replay() const { return history_->replay(); }
    std::string history_text() const { return history_->concatenated(); }
    const HistoryBuffer& history() const { return *history_; }

private:
    enum class InitStage { AwaitReady, AwaitFirstPrompt, Streaming };

    void reader_loop();
    void handle_bytes(const std::string& bytes);
    void stream(const std::string& bytes);
    void fail(const std::string& error);
    void touch();
    void record(const std::string& command, CommandSource source,
                const Result<CommandResult>& r,
                std::chrono::system_clock::time_point started);

    std::string name_;
    SessionTarget target_;
    SessionOptions options_;
    std::chrono::system_clock::time_point created_at_;

    std::shared_ptr<RemoteChannel> channel_;
    std::shared_ptr<HistoryBuffer> history_;
    std::shared_ptr<BroadcastHub> hub_;
    std::unique_ptr<CommandExecutor> executor_;
    std::size_t executor_listener_ = 0;

    std::optional<PromptTemplate> template_;

    // Reader-thread only
    InitStage stage_ = InitStage::AwaitReady;
    std::string init_buf_;
    std::unique_ptr<PromptMatcher> probe_;
    std::unique_ptr<PromptMatcher> matcher_;

    std::thread reader_;
    std::atomic<bool> stop_{false};

    mutable std::mutex mutex_;
    std::condition_variable state_cv_;
    SessionState state_ = SessionState::Connecting;
    std::string remote_user_;
    std::string remote_host_;
    std::string error_details_;
    std::chrono::system_clock::time_point last_activity_;
    std::deque<CommandRecord> records_;
};
