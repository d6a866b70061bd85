#pragma once

#include <cstdint>
#include <optional>
#include <string>

// Marker protocol for shell initialization and exit-status capture.
//
// The markers are printed by `echo` with the literal split by '' so the
// echoed command line never contains the marker text itself; only the
// command's output does.

inline constexpr const char* SHELLCAST_READY_MARKER  = "__SHELLCAST_READY__";
inline constexpr const char* SHELLCAST_STATUS_MARKER = "__SHELLCAST_STATUS__";

// Remote identity reported by the ready line
struct ReadyInfo {
    std::string user;
    std::string host;
    std::size_t end;       // index just past the ready line's LF
};

// One-line init command: force PS1, drop PROMPT_COMMAND and bracketed paste,
// then print the ready marker followed by `id -un` and the short hostname.
std::string build_init_command(const std::string& ps1);

// Find a complete ready line in raw init output.
std::optional<ReadyInfo> parse_ready_line(const std::string& raw);

// Status query written after a command's prompt reappears. The id is echoed
// back so a reply to an earlier, timed-out query is never taken for this one.
std::string build_status_command(uint64_t id);

// Parse the exit status for query `id` from sentinel output. nullopt until a
// complete marker line with that id and a number has arrived.
std::optional<int> parse_status_output(const std::string& raw, uint64_t id);

// Quote a string for a single-quoted POSIX shell word.
std::string shell_single_quote(const std::string& s);
