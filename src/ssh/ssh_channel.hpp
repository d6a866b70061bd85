#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <core/config.hpp>
#include <platform/socket_util.hpp>
#include "remote_channel.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// RemoteChannel over a libssh2 PTY shell channel.
// Owns socket, session and channel; closes and frees them on destruction.
// All libssh2 calls are protected by brief io_mutex_ holds.
class SshChannel : public RemoteChannel {
public:
    ~SshChannel() override;

    // TCP connect, handshake, authenticate, request PTY + shell.
    // Errors carry ErrorCode::ConnectError.
    static Result<std::shared_ptr<RemoteChannel>> open(const SessionTarget& target,
                                                       const PtyConfig& pty,
                                                       StatusCallback callback = nullptr);

    // ChannelOpener bound to a PTY configuration
    static ChannelOpener opener(const PtyConfig& pty);

    Result<void> write(const std::string& data) override;
    ReadResult read(std::chrono::milliseconds wait) override;
    void close() override;
    bool is_open() const override;

    // Send an SSH keepalive; false if the connection is gone.
    bool check_alive();

    SshChannel(const SshChannel&) = delete;
    SshChannel& operator=(const SshChannel&) = delete;

private:
    SshChannel() = default;

    LIBSSH2_SESSION* session_ = nullptr;
    LIBSSH2_CHANNEL* channel_ = nullptr;
    socket_t sock_ = SHELLCAST_INVALID_SOCKET;
    std::mutex io_mutex_;
    std::atomic<bool> open_{false};

    Result<void> connect_socket(const SessionTarget& target);
    Result<void> handshake();
    Result<void> authenticate(const SessionTarget& target, StatusCallback callback);
    Result<void> open_shell(const PtyConfig& pty);
    void release();
};
