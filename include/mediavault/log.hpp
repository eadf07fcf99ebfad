#pragma once

#include <filesystem>

namespace mediavault {

/// Enable or disable log_debug output (process-wide).
void set_verbose(bool verbose);
bool verbose_enabled();

/// Append stdout and stderr to the given file. Returns false if it cannot be opened.
bool redirect_logs(const std::filesystem::path& log_file);

// printf-style loggers. Info and debug go to stdout, warnings and errors to
// stderr. Each call writes one line.
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace mediavault
