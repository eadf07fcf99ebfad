#include "mediavault/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <unistd.h>

namespace mediavault {

namespace {

std::atomic<bool> g_verbose{false};

void vlog(FILE* stream, const char* prefix, const char* fmt, va_list args) {
    if (prefix) fputs(prefix, stream);
    vfprintf(stream, fmt, args);
    fputc('\n', stream);
    fflush(stream);
}

}  // namespace

void set_verbose(bool verbose) {
    g_verbose.store(verbose, std::memory_order_relaxed);
}

bool verbose_enabled() {
    return g_verbose.load(std::memory_order_relaxed);
}

bool redirect_logs(const std::filesystem::path& log_file) {
    std::error_code ec;
    if (log_file.has_parent_path()) {
        std::filesystem::create_directories(log_file.parent_path(), ec);
    }
    FILE* log = fopen(log_file.c_str(), "a");
    if (!log) return false;
    fflush(stdout);
    fflush(stderr);
    dup2(fileno(log), STDOUT_FILENO);
    dup2(fileno(log), STDERR_FILENO);
    fclose(log);
    return true;
}

void log_debug(const char* fmt, ...) {
    if (!verbose_enabled()) return;
    va_list args;
    va_start(args, fmt);
    vlog(stdout, "DEBUG: ", fmt, args);
    va_end(args);
}

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stdout, nullptr, fmt, args);
    va_end(args);
}

void log_warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stderr, "WARNING: ", fmt, args);
    va_end(args);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stderr, "ERROR: ", fmt, args);
    va_end(args);
}

}  // namespace mediavault
