#ifndef SYMFORM_ERROR_H
#define SYMFORM_ERROR_H

#include <stdbool.h>

/**
 * Symform Error Handling
 *
 * Two layers:
 * - Result codes (Symform_Result) returned by evaluation entry points, with
 *   the matching message kept in the owning session.
 * - A thread-local "last error" buffer with printf-style formatting, used by
 *   the parser, the configuration loader and the REPL host.
 *
 * Usage:
 *   Symform_Stmt *stmt = symform_parse(line);
 *   if (!stmt) {
 *       printf("Error: %s\n", symform_get_last_error());
 *   }
 */

/**
 * Result codes for evaluation. Every failure is an ordinary return value.
 */
typedef enum Symform_Result {
    SYMFORM_OK = 0,
    SYMFORM_ERR_PARSE,                  /**< Unexpected token in a statement */
    SYMFORM_ERR_DIVISION_BY_ZERO,       /**< Literal division by exactly 0.0 */
    SYMFORM_ERR_UNDEFINED_PRINT_TARGET, /**< Print of a name with no expression */
    SYMFORM_ERR_RECURSION_LIMIT,        /**< Self-referential expression binding */
    SYMFORM_ERR_OUT_OF_MEMORY,
    SYMFORM_ERR_INVALID_ARGUMENT
} Symform_Result;

/**
 * Get a short stable name for a result code (e.g. "DivisionByZero").
 */
const char *symform_result_name(Symform_Result result);

/**
 * Set the thread-local error message (printf-style). The parser stores its
 * first "Expected X, got Y" error here; the configuration loader its TOML
 * or I/O failure. A NULL format clears the message.
 */
void symform_set_error(const char *fmt, ...);

/**
 * Get the last error message.
 * Returns an empty string if no error has been set.
 *
 * @return Pointer to the error message (thread-local, do not free)
 */
const char *symform_get_last_error(void);

/**
 * Clear the last error message.
 */
void symform_clear_error(void);

/**
 * Check if an error is currently set.
 */
bool symform_has_error(void);

#endif /* SYMFORM_ERROR_H */
