#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>
#include <chrono>

// Error taxonomy shared by every layer above the transport
enum class ErrorCode {
    None,
    ConnectError,     // transport/auth failure while opening a session
    Busy,             // another command is in flight on the session
    Timeout,          // deadline expired or no prompt within the byte budget
    SessionClosed,    // session is Closing, Closed or Failed
    NotFound,         // unknown session name
    AlreadyExists,    // session name already registered
    InvalidArgument,
    ChannelError,     // remote channel write/read failed
};

const char* error_code_name(ErrorCode code);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorCode code = ErrorCode::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorCode::None};
    }

    static Result<T> Err(const std::string& err, ErrorCode code = ErrorCode::InvalidArgument) {
        return {false, T{}, err, code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorCode code = ErrorCode::None;

    static Result<void> Ok() {
        return {true, "", ErrorCode::None};
    }

    static Result<void> Err(const std::string& err, ErrorCode code = ErrorCode::InvalidArgument) {
        return {false, err, code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Connection parameters for one remote shell
struct SessionTarget {
    std::string host;
    int port = 22;
    std::string user;
    std::string password;
    std::optional<std::string> key_path;
    std::optional<std::string> passphrase;
    int timeout = 10;                 // TCP connect + handshake, seconds
};

// Outcome of one exec: stdout is the raw byte range between the echoed
// command line and the next prompt, exit_code comes from the status sentinel.
struct CommandResult {
    std::string stdout_data;
    int exit_code = -1;
    int64_t duration_ms = 0;
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point completed_at;
};

// Who issued a command (recorded per session)
enum class CommandSource {
    User,
    Agent,
    System,
};

const char* command_source_name(CommandSource source);

// Status callback for long-running operations
using StatusCallback = std::function<void(const std::string&)>;
