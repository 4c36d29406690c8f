#ifndef SYMFORM_LOG_H
#define SYMFORM_LOG_H

#include <stdbool.h>
#include <stdint.h>

/**
 * Symform Logging
 *
 * One process-wide log sink shared by the REPL host, the evaluator session
 * and the configuration loader. Lines go to the file opened from the
 * `[log]` configuration table, optionally echoed through SDL_LogMessage,
 * and are handed to registered callbacks.
 *
 * The engine logs statement evaluation and rule applications at DEBUG
 * level only when the session is verbose; nothing else in the engine logs.
 *
 * Usage:
 *   symform_log_open(config.log_file);
 *   symform_log_set_level(config.log_level);
 *   symform_log_info(SYMFORM_LOG_REPL, "Running script %s", path);
 *   symform_log_close();
 *
 * File format:
 *   [2024-01-15 14:30:22] DEBUG   Rules  | Rule 0 applied at top level (iteration 1)
 */

typedef enum {
    SYMFORM_LOG_LEVEL_ERROR = 0,    /**< Always logged, flushed immediately */
    SYMFORM_LOG_LEVEL_WARNING = 1,
    SYMFORM_LOG_LEVEL_INFO = 2,
    SYMFORM_LOG_LEVEL_DEBUG = 3     /**< Verbose evaluation trace */
} Symform_LogLevel;

#define SYMFORM_LOG_EVAL    "Eval"
#define SYMFORM_LOG_RULES   "Rules"
#define SYMFORM_LOG_REPL    "Repl"
#define SYMFORM_LOG_CONFIG  "Config"

/**
 * Callback invoked for every line that passes the level filter.
 * The subsystem is one of the SYMFORM_LOG_* tags, unpadded.
 */
typedef void (*Symform_LogCallback)(Symform_LogLevel level, const char *subsystem,
                                    const char *message, void *userdata);

/**
 * Open (append to) the log file and write the "log opened" marker.
 * Calling it while a file is open keeps the current file.
 * @return false if path is NULL/empty or the file cannot be opened
 */
bool symform_log_open(const char *path);

/**
 * Write the "log closed" marker and close the file. Level, console and
 * callback settings are kept.
 */
void symform_log_close(void);

bool symform_log_is_open(void);

/**
 * @return Path of the open log file, or NULL
 */
const char *symform_log_get_path(void);

/**
 * Lines above this level are dropped. Errors always pass.
 */
void symform_log_set_level(Symform_LogLevel level);
Symform_LogLevel symform_log_get_level(void);

/**
 * Parse a `[log] level` value ("error", "warning"/"warn", "info", "debug",
 * any case).
 * @return true if the name was recognized; out_level is untouched otherwise
 */
bool symform_log_level_from_string(const char *name, Symform_LogLevel *out_level);

/**
 * Echo lines through SDL_LogMessage. Off unless `[log] console` enables it.
 */
void symform_log_set_console_output(bool enabled);

void symform_log_error(const char *subsystem, const char *fmt, ...);
void symform_log_warning(const char *subsystem, const char *fmt, ...);
void symform_log_info(const char *subsystem, const char *fmt, ...);
void symform_log_debug(const char *subsystem, const char *fmt, ...);

/**
 * Register a callback. Returns a handle (0 if all slots are taken).
 */
uint32_t symform_log_add_callback(Symform_LogCallback callback, void *userdata);
void symform_log_remove_callback(uint32_t handle);

#endif /* SYMFORM_LOG_H */
