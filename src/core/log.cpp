#include "log.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <mutex>

namespace {

std::mutex& log_mutex() {
    static std::mutex mtx;
    return mtx;
}

std::string& log_path_storage() {
    static std::string path = (platform::temp_dir() / "shellcast_debug.log").string();
    return path;
}

std::atomic<bool> g_log_enabled{true};

} // namespace

void set_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex());
    log_path_storage() = path;
}

void set_log_enabled(bool enabled) {
    g_log_enabled = enabled;
}

std::string shellcast_log_path() {
    std::lock_guard<std::mutex> lock(log_mutex());
    return log_path_storage();
}

void shellcast_log(const std::string& msg) {
    if (!g_log_enabled) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    std::string line = fmt::format("[{:02}:{:02}:{:02}.{:03}] {}\n",
                                   tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                                   static_cast<int>(ms.count()), msg);

    std::lock_guard<std::mutex> lock(log_mutex());
    std::ofstream out(log_path_storage(), std::ios::app);
    if (!out) return;
    out << line;
}

void shellcast_log_exec(const std::string& label, const std::string& cmd,
                        const Result<CommandResult>& r) {
    shellcast_log(fmt::format("{} CMD: {}", label, cmd));
    if (r.is_ok()) {
        shellcast_log(fmt::format("{} exit={} duration={}ms stdout({})={}", label,
                                  r.value.exit_code, r.value.duration_ms,
                                  r.value.stdout_data.size(),
                                  r.value.stdout_data.substr(0, 500)));
    } else {
        shellcast_log(fmt::format("{} error={} {}", label, error_code_name(r.code), r.error));
    }
}
