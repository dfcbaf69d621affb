#pragma once

namespace s3pipe {

// printf-style process logging. Info and debug go to stdout, errors to
// stderr with an "ERROR: " prefix. Each call emits one line.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

// Debug lines are dropped unless enabled (--debug)
void set_debug_logging(bool enabled);

} // namespace s3pipe
