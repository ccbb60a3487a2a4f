#pragma once

namespace assetcdn {

void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

/// Only emitted when verbose logging is enabled.
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

void set_verbose(bool verbose);
bool is_verbose();

}  // namespace assetcdn
