#pragma once

namespace blobstream {

/// Enable or disable log_debug() output (--verbose).
void set_log_verbose(bool verbose);
bool log_verbose();

/// printf-style logging. Info and debug go to stdout, errors to stderr
/// with an "ERROR: " prefix. Each call writes one line.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace blobstream
