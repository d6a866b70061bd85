#pragma once

#include <string>
#include <core/types.hpp>

// Debug log: timestamped lines appended to <temp>/shellcast_debug.log.
// Safe to call from any thread.

void set_log_path(const std::string& path);
void set_log_enabled(bool enabled);
std::string shellcast_log_path();

void shellcast_log(const std::string& msg);

// One line for the command, one for its outcome (stdout truncated to 500 bytes).
void shellcast_log_exec(const std::string& label, const std::string& cmd,
                        const Result<CommandResult>& r);
