#include "marker_protocol.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <sstream>

std::string shell_single_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string build_init_command(const std::string& ps1) {
    // Leading space keeps it out of the remote shell history (ignorespace).
    return " unset PROMPT_COMMAND; PS1=" + shell_single_quote(ps1) +
           "; bind 'set enable-bracketed-paste off' 2>/dev/null;"
           " echo __SHELLCAST_RE''ADY__ \"$(id -un)\" \"$(hostname -s 2>/dev/null || hostname)\"\n";
}

std::optional<ReadyInfo> parse_ready_line(const std::string& raw) {
    std::string marker = SHELLCAST_READY_MARKER;
    auto pos = raw.find(marker);
    if (pos == std::string::npos) return std::nullopt;

    auto nl = raw.find('\n', pos);
    if (nl == std::string::npos) return std::nullopt;

    std::string rest = raw.substr(pos + marker.size(), nl - pos - marker.size());
    std::istringstream iss(rest);
    ReadyInfo info;
    iss >> info.user >> info.host;
    trim(info.user);
    trim(info.host);
    if (info.user.empty() || info.host.empty()) return std::nullopt;

    info.end = nl + 1;
    return info;
}

std::string build_status_command(uint64_t id) {
    return fmt::format(" echo __SHELLCAST_ST''ATUS__ {} $?\n", id);
}

std::optional<int> parse_status_output(const std::string& raw, uint64_t id) {
    std::string marker = SHELLCAST_STATUS_MARKER;
    for (auto pos = raw.find(marker); pos != std::string::npos;
         pos = raw.find(marker, pos + marker.size())) {
        auto nl = raw.find('\n', pos);
        if (nl == std::string::npos) return std::nullopt;

        std::istringstream iss(raw.substr(pos + marker.size(), nl - pos - marker.size()));
        std::string id_str, code_str;
        iss >> id_str >> code_str;
        if (id_str != std::to_string(id)) continue;   // an earlier exec's query

        auto num_start = code_str.find_first_of("0123456789");
        if (num_start == std::string::npos) return std::nullopt;
        int code = safe_stoi(code_str.substr(num_start), -1);
        if (code < 0) return std::nullopt;
        return code;
    }
    return std::nullopt;
}
