#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <core/types.hpp>

// Outcome of one read from a remote shell channel
struct ReadResult {
    enum class Status {
        Data,     // bytes holds newly arrived output
        Idle,     // nothing arrived within the wait
        Closed,   // remote side closed the channel (EOF)
        Error,    // transport failure, error holds the reason
    };

    Status status = Status::Idle;
    std::string bytes;
    std::string error;

    static ReadResult data(std::string b) { return {Status::Data, std::move(b), ""}; }
    static ReadResult idle() { return {Status::Idle, "", ""}; }
    static ReadResult closed() { return {Status::Closed, "", ""}; }
    static ReadResult failure(const std::string& err) { return {Status::Error, "", err}; }
};

// An open duplex byte channel to a remote interactive shell.
//
// write() may be called from any thread; read() is only ever called by the
// owning session's reader thread. close() makes further reads return Closed.
class RemoteChannel {
public:
    virtual ~RemoteChannel() = default;

    virtual Result<void> write(const std::string& data) = 0;
    virtual ReadResult read(std::chrono::milliseconds wait) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

// open(target) -> Channel | ConnectError
using ChannelOpener =
    std::function<Result<std::shared_ptr<RemoteChannel>>(const SessionTarget&)>;
