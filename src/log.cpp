#include "blobstream/core/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace blobstream {

namespace {
std::atomic<bool> g_verbose{false};
}  // namespace

void set_log_verbose(bool verbose) {
    g_verbose.store(verbose, std::memory_order_relaxed);
}

bool log_verbose() {
    return g_verbose.load(std::memory_order_relaxed);
}

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vfprintf(stdout, fmt, args);
    va_end(args);
    fputc('\n', stdout);
    fflush(stdout);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    fprintf(stderr, "ERROR: ");
    vfprintf(stderr, fmt, args);
    va_end(args);
    fputc('\n', stderr);
}

void log_debug(const char* fmt, ...) {
    if (!log_verbose()) return;
    va_list args;
    va_start(args, fmt);
    vfprintf(stdout, fmt, args);
    va_end(args);
    fputc('\n', stdout);
    fflush(stdout);
}

}  // namespace blobstream
