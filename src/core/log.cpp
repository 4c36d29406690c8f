#include "symform/log.h"
#include <SDL3/SDL.h>
#include <stdarg.h>
#include <stdio.h>
#include <string.h>
#include <strings.h>
#include <time.h>

/* ============================================================================
 * Sink State
 * ============================================================================ */

#define MAX_LOG_CALLBACKS 4
#define LOG_MESSAGE_LEN 1024

struct LogCallbackEntry {
    Symform_LogCallback callback;
    void *userdata;
    uint32_t handle;
};

struct LogSink {
    FILE *file;
    char path[512];
    Symform_LogLevel level;
    bool console;
    LogCallbackEntry callbacks[MAX_LOG_CALLBACKS];
    uint32_t next_handle;
};

static LogSink s_log = { NULL, {0}, SYMFORM_LOG_LEVEL_INFO, false, {}, 1 };

/* Indexed by Symform_LogLevel */
struct LevelInfo {
    const char *name;
    const char *alias;
    SDL_LogPriority priority;
};

static const LevelInfo s_levels[] = {
    { "ERROR",   "error",   SDL_LOG_PRIORITY_ERROR },
    { "WARNING", "warn",    SDL_LOG_PRIORITY_WARN },
    { "INFO",    "info",    SDL_LOG_PRIORITY_INFO },
    { "DEBUG",   "debug",   SDL_LOG_PRIORITY_DEBUG },
};

static void format_timestamp(char *buf, size_t size) {
    time_t now = time(NULL);
    struct tm *tm_info = localtime(&now);
    if (!tm_info || strftime(buf, size, "%Y-%m-%d %H:%M:%S", tm_info) == 0) {
        snprintf(buf, size, "?");
    }
}

static void write_marker(const char *what) {
    char timestamp[32];
    format_timestamp(timestamp, sizeof(timestamp));
    fprintf(s_log.file, "--- symform log %s %s ---\n", what, timestamp);
    fflush(s_log.file);
}

/* ============================================================================
 * File Lifecycle
 * ============================================================================ */

bool symform_log_open(const char *path) {
    if (s_log.file) return true;
    if (!path || path[0] == '\0') return false;

    FILE *file = fopen(path, "a");
    if (!file) return false;

    s_log.file = file;
    snprintf(s_log.path, sizeof(s_log.path), "%s", path);
    write_marker("opened");
    return true;
}

void symform_log_close(void) {
    if (!s_log.file) return;

    write_marker("closed");
    fclose(s_log.file);
    s_log.file = NULL;
    s_log.path[0] = '\0';
}

bool symform_log_is_open(void) {
    return s_log.file != NULL;
}

const char *symform_log_get_path(void) {
    return s_log.file ? s_log.path : NULL;
}

/* ============================================================================
 * Settings
 * ============================================================================ */

void symform_log_set_level(Symform_LogLevel level) {
    s_log.level = level;
}

Symform_LogLevel symform_log_get_level(void) {
    return s_log.level;
}

bool symform_log_level_from_string(const char *name, Symform_LogLevel *out_level) {
    if (!name || !out_level) return false;

    for (int i = 0; i < (int)(sizeof(s_levels) / sizeof(s_levels[0])); i++) {
        if (strcasecmp(name, s_levels[i].name) == 0 || strcasecmp(name, s_levels[i].alias) == 0) {
            *out_level = (Symform_LogLevel)i;
            return true;
        }
    }
    return false;
}

void symform_log_set_console_output(bool enabled) {
    s_log.console = enabled;
}

/* ============================================================================
 * Writing
 * ============================================================================ */

static void log_write_v(Symform_LogLevel level, const char *subsystem, const char *fmt, va_list args) {
    /* Errors always pass the filter */
    if (level != SYMFORM_LOG_LEVEL_ERROR && level > s_log.level) {
        return;
    }
    if (!subsystem) subsystem = "?";

    char message[LOG_MESSAGE_LEN];
    vsnprintf(message, sizeof(message), fmt, args);

    if (s_log.file) {
        char timestamp[32];
        format_timestamp(timestamp, sizeof(timestamp));
        fprintf(s_log.file, "[%s] %-7s %-6s | %s\n",
                timestamp, s_levels[level].name, subsystem, message);
        if (level == SYMFORM_LOG_LEVEL_ERROR) {
            fflush(s_log.file);
        }
    }

    if (s_log.console) {
        SDL_LogMessage(SDL_LOG_CATEGORY_APPLICATION, s_levels[level].priority,
                       "%s: %s", subsystem, message);
    }

    for (int i = 0; i < MAX_LOG_CALLBACKS; i++) {
        const LogCallbackEntry &entry = s_log.callbacks[i];
        if (entry.handle != 0) {
            entry.callback(level, subsystem, message, entry.userdata);
        }
    }
}

void symform_log_error(const char *subsystem, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_write_v(SYMFORM_LOG_LEVEL_ERROR, subsystem, fmt, args);
    va_end(args);
}

void symform_log_warning(const char *subsystem, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_write_v(SYMFORM_LOG_LEVEL_WARNING, subsystem, fmt, args);
    va_end(args);
}

void symform_log_info(const char *subsystem, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_write_v(SYMFORM_LOG_LEVEL_INFO, subsystem, fmt, args);
    va_end(args);
}

void symform_log_debug(const char *subsystem, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_write_v(SYMFORM_LOG_LEVEL_DEBUG, subsystem, fmt, args);
    va_end(args);
}

/* ============================================================================
 * Callbacks
 * ============================================================================ */

uint32_t symform_log_add_callback(Symform_LogCallback callback, void *userdata) {
    if (!callback) return 0;

    for (int i = 0; i < MAX_LOG_CALLBACKS; i++) {
        LogCallbackEntry &entry = s_log.callbacks[i];
        if (entry.handle == 0) {
            entry.callback = callback;
            entry.userdata = userdata;
            entry.handle = s_log.next_handle++;
            return entry.handle;
        }
    }
    return 0;
}

void symform_log_remove_callback(uint32_t handle) {
    if (handle == 0) return;

    for (int i = 0; i < MAX_LOG_CALLBACKS; i++) {
        LogCallbackEntry &entry = s_log.callbacks[i];
        if (entry.handle == handle) {
            entry = LogCallbackEntry{};
            return;
        }
    }
}
