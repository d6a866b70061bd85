#include "utils.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cstdio>
#include <stdexcept>

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:            return "None";
        case ErrorCode::ConnectError:    return "ConnectError";
        case ErrorCode::Busy:            return "Busy";
        case ErrorCode::Timeout:         return "Timeout";
        case ErrorCode::SessionClosed:   return "SessionClosed";
        case ErrorCode::NotFound:        return "NotFound";
        case ErrorCode::AlreadyExists:   return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::ChannelError:    return "ChannelError";
    }
    return "Unknown";
}

const char* command_source_name(CommandSource source) {
    switch (source) {
        case CommandSource::User:   return "user";
        case CommandSource::Agent:  return "agent";
        case CommandSource::System: return "system";
    }
    return "unknown";
}

std::string to_iso(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::string now_iso() {
    return to_iso(std::chrono::system_clock::now());
}

std::time_t parse_iso_time(const std::string& iso) {
    struct tm tm_buf = {};
    if (sscanf(iso.c_str(), "%d-%d-%dT%d:%d:%d",
               &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday,
               &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec) == 6) {
        tm_buf.tm_year -= 1900;
        tm_buf.tm_mon -= 1;
        tm_buf.tm_isdst = -1;
        return mktime(&tm_buf);
    }
    return 0;
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

Result<void> validate_session_name(const std::string& name) {
    std::string trimmed = name;
    trim(trimmed);
    if (trimmed.empty()) {
        return Result<void>::Err("Invalid session name: name cannot be empty");
    }
    if (name.find(' ') != std::string::npos) {
        return Result<void>::Err("Invalid session name: name cannot contain spaces");
    }
    if (name.find('@') != std::string::npos) {
        return Result<void>::Err("Invalid session name: name cannot contain @ character");
    }
    return Result<void>::Ok();
}

std::string escape_bytes(const std::string& data, std::size_t max_len) {
    std::string out;
    out.reserve(std::min(data.size(), max_len) + 16);
    for (std::size_t i = 0; i < data.size() && i < max_len; ++i) {
        unsigned char c = static_cast<unsigned char>(data[i]);
        if (c == '\r') out += "\\r";
        else if (c == '\n') out += "\\n";
        else if (c == '\t') out += "\\t";
        else if (c < 32 || c == 0x7f) out += fmt::format("\\x{:02x}", c);
        else out += static_cast<char>(c);
    }
    if (data.size() > max_len) out += "...";
    return out;
}
