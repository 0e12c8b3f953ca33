// ==============================
// CSD Dumper - Shared Logging
// ==============================
// Provides LOG_INFO, LOG_WARN, LOG_ERROR (always on) and
// LOG_DEBUG, LOG_TRACE (debug builds only) across all translation units.
//
// Implementation: header-only with inline statics. Lines go to the console
// (WARN/ERROR on stderr) and, once csd_log_open_file() has been called,
// are appended to a log file as well.

#pragma once

#include <chrono>
#include <cstdio>
#include <cstdarg>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <string>

// ========== Debug/Release Logging Macros ==========

#ifdef CSD_DEBUG
    #define LOG_DEBUG(fmt, ...) csd_log_message("[DEBUG] " fmt, ##__VA_ARGS__)
    #define LOG_TRACE(fmt, ...) csd_log_message("[TRACE] " fmt, ##__VA_ARGS__)
#else
    #define LOG_DEBUG(fmt, ...) ((void)0)
    #define LOG_TRACE(fmt, ...) ((void)0)
#endif

#define LOG_ERROR(fmt, ...) csd_log_message("[ERROR] " fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  csd_log_message("[WARN] " fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  csd_log_message("[INFO] " fmt, ##__VA_ARGS__)

// ========== Implementation ==========

namespace csd_log_detail {

inline FILE*& log_file() { static FILE* f = nullptr; return f; }

inline void format_timestamp(char* out, size_t size) {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&t, &local);
    snprintf(out, size, "[%02d:%02d:%02d.%03d] ",
             local.tm_hour, local.tm_min, local.tm_sec, static_cast<int>(ms));
}

} // namespace csd_log_detail

// Append log lines to `path` in addition to the console. Creates parent
// directories. Returns false if the file could not be opened.
inline bool csd_log_open_file(const std::string& path) {
    if (csd_log_detail::log_file()) {
        fclose(csd_log_detail::log_file());
        csd_log_detail::log_file() = nullptr;
    }

    std::filesystem::path log_path(path);
    if (log_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(log_path.parent_path(), ec);
    }
    csd_log_detail::log_file() = fopen(log_path.string().c_str(), "a");
    return csd_log_detail::log_file() != nullptr;
}

inline void csd_log_close_file() {
    if (csd_log_detail::log_file()) {
        fclose(csd_log_detail::log_file());
        csd_log_detail::log_file() = nullptr;
    }
}

inline void csd_log_message(const char* format, ...) {
    va_list args;
    va_start(args, format);

    char timestamp[32];
    csd_log_detail::format_timestamp(timestamp, sizeof(timestamp));

    // Log to file
    if (csd_log_detail::log_file()) {
        va_list file_args;
        va_copy(file_args, args);
        fprintf(csd_log_detail::log_file(), "%s", timestamp);
        vfprintf(csd_log_detail::log_file(), format, file_args);
        fprintf(csd_log_detail::log_file(), "\n");
        fflush(csd_log_detail::log_file());
        va_end(file_args);
    }

    // Warnings and errors go to stderr
    FILE* console = stdout;
    if (strncmp(format, "[ERROR]", 7) == 0 || strncmp(format, "[WARN]", 6) == 0) {
        console = stderr;
    }

    va_list con_args;
    va_copy(con_args, args);
    fprintf(console, "%s", timestamp);
    vfprintf(console, format, con_args);
    fprintf(console, "\n");
    fflush(console);
    va_end(con_args);

    va_end(args);
}
