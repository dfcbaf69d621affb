#include "s3pipe/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace s3pipe {

namespace {

std::atomic<bool> g_debug{false};

// Keeps lines from concurrent upload workers from interleaving
std::mutex g_log_mutex;

void vlog(FILE* out, const char* prefix, const char* fmt, va_list args) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (prefix) fputs(prefix, out);
    vfprintf(out, fmt, args);
    fputc('\n', out);
    fflush(out);
}

}  // namespace

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stdout, nullptr, fmt, args);
    va_end(args);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stderr, "ERROR: ", fmt, args);
    va_end(args);
}

void log_debug(const char* fmt, ...) {
    if (!g_debug.load(std::memory_order_relaxed)) return;
    va_list args;
    va_start(args, fmt);
    vlog(stdout, "DEBUG: ", fmt, args);
    va_end(args);
}

void set_debug_logging(bool enabled) {
    g_debug.store(enabled, std::memory_order_relaxed);
}

} // namespace s3pipe
