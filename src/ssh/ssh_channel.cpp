#include "ssh_channel.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <mutex>

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
    StatusCallback callback;
};

// libssh2 keyboard-interactive callback: answer every prompt with the password
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);

    for (int i = 0; i < num_prompts; i++) {
        std::string prompt_text(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length);
        if (data->callback && prompt_text.find("assword") != std::string::npos) {
            data->callback("Sending password...");
        }
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

static void ensure_libssh2_init() {
    static std::once_flag once;
    std::call_once(once, [] { libssh2_init(0); });
}

SshChannel::~SshChannel() {
    close();
}

ChannelOpener SshChannel::opener(const PtyConfig& pty) {
    return [pty](const SessionTarget& target) {
        return SshChannel::open(target, pty);
    };
}

Result<std::shared_ptr<RemoteChannel>> SshChannel::open(const SessionTarget& target,
                                                        const PtyConfig& pty,
                                                        StatusCallback callback) {
    using R = Result<std::shared_ptr<RemoteChannel>>;
    ensure_libssh2_init();

    std::shared_ptr<SshChannel> ch(new SshChannel());

    if (callback) callback("Connecting to " + target.host + "...");
    auto step = ch->connect_socket(target);
    if (step.is_err()) return R::Err(step.error, ErrorCode::ConnectError);

    if (callback) callback("TCP connected, starting SSH handshake...");
    step = ch->handshake();
    if (step.is_err()) { ch->release(); return R::Err(step.error, ErrorCode::ConnectError); }

    if (callback) callback("SSH handshake complete, authenticating...");
    step = ch->authenticate(target, callback);
    if (step.is_err()) { ch->release(); return R::Err(step.error, ErrorCode::ConnectError); }

    step = ch->open_shell(pty);
    if (step.is_err()) { ch->release(); return R::Err(step.error, ErrorCode::ConnectError); }

    ch->open_ = true;
    shellcast_log(fmt::format("SshChannel: shell open on {}@{}:{}", target.user, target.host, target.port));
    if (callback) callback("Connected to " + target.host);
    return R::Ok(ch);
}

Result<void> SshChannel::connect_socket(const SessionTarget& target) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string port = std::to_string(target.port);
    int gai = getaddrinfo(target.host.c_str(), port.c_str(), &hints, &res);
    if (gai != 0 || !res) {
        return Result<void>::Err("Failed to resolve host: " + target.host);
    }

    std::string last_error = "no usable address";
    for (auto* ai = res; ai; ai = ai->ai_next) {
        sock_ = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock_ < 0) {
            last_error = "Failed to create socket";
            continue;
        }

        // Non-blocking connect so the timeout is ours, not the kernel's
        platform::set_nonblocking(sock_);
        int ret = ::connect(sock_, ai->ai_addr, ai->ai_addrlen);
        if (ret < 0 && errno != EINPROGRESS) {
            last_error = "Failed to connect: " + std::string(strerror(errno));
            platform::close_socket(sock_);
            sock_ = SHELLCAST_INVALID_SOCKET;
            continue;
        }

        if (ret < 0) {
            int revents = platform::poll_socket(sock_, POLLOUT, target.timeout * 1000);
            if (revents == 0) {
                last_error = "Connection timed out: " + target.host;
                platform::close_socket(sock_);
                sock_ = SHELLCAST_INVALID_SOCKET;
                continue;
            }
            int sock_err = platform::socket_error(sock_);
            if (sock_err != 0) {
                last_error = "Connection failed: " + std::string(strerror(sock_err));
                platform::close_socket(sock_);
                sock_ = SHELLCAST_INVALID_SOCKET;
                continue;
            }
        }
        break;
    }
    freeaddrinfo(res);

    if (sock_ == SHELLCAST_INVALID_SOCKET) {
        return Result<void>::Err(last_error);
    }

    platform::enable_keepalive(sock_, 60, 15, 4);
    return Result<void>::Ok();
}

Result<void> SshChannel::handshake() {
    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        return Result<void>::Err("Failed to create SSH session");
    }

    libssh2_session_set_blocking(session_, 0);

    int ret;
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        platform::poll_socket(sock_, POLLIN | POLLOUT, 100);
    }
    if (ret != 0) {
        return Result<void>::Err("SSH handshake failed");
    }

    libssh2_keepalive_config(session_, 1, SSH_KEEPALIVE_SECS);
    return Result<void>::Ok();
}

Result<void> SshChannel::authenticate(const SessionTarget& target, StatusCallback callback) {
    int ret;

    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, target.user.c_str(),
                                              static_cast<unsigned int>(target.user.length()))) == nullptr) {
        if (libssh2_userauth_authenticated(session_)) {
            return Result<void>::Ok();  // "none" auth accepted
        }
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            break;
        }
        platform::sleep_ms(20);
    }

    std::string methods = auth_list ? auth_list : "";
    if (callback && !methods.empty()) {
        callback("Auth methods: " + methods);
    }

    // Public key from file (original client supported keyFilePath + passphrase)
    if (target.key_path && methods.find("publickey") != std::string::npos) {
        if (callback) callback("Using public key " + *target.key_path + "...");
        const char* passphrase = target.passphrase ? target.passphrase->c_str() : nullptr;
        while ((ret = libssh2_userauth_publickey_fromfile(session_, target.user.c_str(), nullptr,
                                                          target.key_path->c_str(),
                                                          passphrase)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(20);
        }
        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return Result<void>::Ok();
        }
        if (callback) callback("Public key rejected");
    }

    if (!target.password.empty() && methods.find("keyboard-interactive") != std::string::npos) {
        if (callback) callback("Using keyboard-interactive auth...");

        KbdAuthData kbd_data{target.password, 0, callback};
        *libssh2_session_abstract(session_) = &kbd_data;

        while ((ret = libssh2_userauth_keyboard_interactive(session_,
                target.user.c_str(), kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(20);
        }
        *libssh2_session_abstract(session_) = nullptr;

        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return Result<void>::Ok();
        }
    }

    if (!target.password.empty() &&
        (methods.empty() || methods.find("password") != std::string::npos)) {
        if (callback) callback("Using password auth...");

        while ((ret = libssh2_userauth_password(session_,
                target.user.c_str(), target.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(20);
        }
        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return Result<void>::Ok();
        }
    }

    return Result<void>::Err("Authentication failed for " + target.user + "@" + target.host);
}

Result<void> SshChannel::open_shell(const PtyConfig& pty) {
    while ((channel_ = libssh2_channel_open_session(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            return Result<void>::Err("Failed to open SSH channel");
        }
        platform::poll_socket(sock_, POLLIN, 100);
    }

    // The remote PTY does the only echo; nothing on this side ever echoes
    // input into the byte stream.
    int ret;
    while ((ret = libssh2_channel_request_pty_ex(
                channel_, pty.term.c_str(), static_cast<unsigned int>(pty.term.size()),
                nullptr, 0, pty.cols, pty.rows, 0, 0)) == LIBSSH2_ERROR_EAGAIN) {
        platform::poll_socket(sock_, POLLIN, 100);
    }
    if (ret != 0) {
        return Result<void>::Err("Failed to request PTY");
    }

    while ((ret = libssh2_channel_shell(channel_)) == LIBSSH2_ERROR_EAGAIN) {
        platform::poll_socket(sock_, POLLIN, 100);
    }
    if (ret != 0) {
        return Result<void>::Err("Failed to request shell");
    }
    return Result<void>::Ok();
}

Result<void> SshChannel::write(const std::string& data) {
    if (!open_) {
        return Result<void>::Err("Channel closed", ErrorCode::SessionClosed);
    }

    std::size_t total = data.size();
    std::size_t sent = 0;
    int retries = 0;

    while (sent < total) {
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            if (!channel_) {
                return Result<void>::Err("Channel closed", ErrorCode::SessionClosed);
            }
            w = libssh2_channel_write(channel_, data.data() + sent, total - sent);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            if (++retries > 100) {
                return Result<void>::Err("Write stalled (EAGAIN for too long)", ErrorCode::ChannelError);
            }
            platform::poll_socket(sock_, POLLOUT, 10);
            continue;
        }
        if (w < 0) {
            return Result<void>::Err(fmt::format("Channel write error ({})", w), ErrorCode::ChannelError);
        }
        retries = 0;
        sent += static_cast<std::size_t>(w);
    }
    return Result<void>::Ok();
}

ReadResult SshChannel::read(std::chrono::milliseconds wait) {
    char buf[SSH_READ_BUF_SIZE];
    auto deadline = std::chrono::steady_clock::now() + wait;

    while (true) {
        ssize_t n;
        bool eof = false;
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            if (!channel_) return ReadResult::closed();
            n = libssh2_channel_read(channel_, buf, sizeof(buf));
            if (n == 0 || n == LIBSSH2_ERROR_EAGAIN) {
                eof = libssh2_channel_eof(channel_) != 0;
            }
        }

        if (n > 0) {
            return ReadResult::data(std::string(buf, static_cast<std::size_t>(n)));
        }
        if (eof) {
            open_ = false;
            return ReadResult::closed();
        }
        if (n != LIBSSH2_ERROR_EAGAIN && n != 0) {
            open_ = false;
            return ReadResult::failure(fmt::format("SSH channel read error ({})", n));
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            // Keepalives are only sent once SSH_KEEPALIVE_SECS have passed
            if (!check_alive()) return ReadResult::failure("SSH keepalive failed");
            return ReadResult::idle();
        }

        // Poll socket without holding io_mutex_
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int revents = platform::poll_socket(sock_, POLLIN, static_cast<int>(remaining.count()));
        if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
            open_ = false;
            return ReadResult::failure("SSH socket hung up");
        }
    }
}

bool SshChannel::check_alive() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (!open_ || !session_) return false;

    int seconds_to_next = 0;
    if (libssh2_keepalive_send(session_, &seconds_to_next) != 0) {
        open_ = false;
        return false;
    }
    return true;
}

void SshChannel::close() {
    open_ = false;
    release();
}

bool SshChannel::is_open() const {
    return open_;
}

void SshChannel::release() {
    // Each libssh2 call gets its own brief lock
    if (channel_) {
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            libssh2_channel_close(channel_);
        }
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            libssh2_channel_free(channel_);
            channel_ = nullptr;
        }
    }

    if (session_) {
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            libssh2_session_disconnect(session_, "Normal disconnection");
        }
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            libssh2_session_free(session_);
            session_ = nullptr;
        }
    }

    if (sock_ != SHELLCAST_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = SHELLCAST_INVALID_SOCKET;
    }
}
