#ifndef SYMFORM_REPL_H
#define SYMFORM_REPL_H

#include "symform/config.h"
#include "symform/session.h"
#include <stdbool.h>
#include <stdio.h>

/**
 * Symform REPL Host
 *
 * Line-oriented driver around one evaluator session. Each submitted line is
 * one statement; the host commands quit, exit, help and clear are handled
 * here and never reach the parser.
 */

typedef struct Symform_Repl Symform_Repl;

typedef enum Symform_ReplStatus {
    SYMFORM_REPL_CONTINUE = 0,  /**< Line handled (or empty) */
    SYMFORM_REPL_ERROR,         /**< Parse or evaluation error */
    SYMFORM_REPL_QUIT           /**< quit / exit */
} Symform_ReplStatus;

/**
 * @param config Host settings (NULL for defaults)
 */
Symform_Repl *symform_repl_create(const Symform_Config *config);
void symform_repl_destroy(Symform_Repl *repl);

/**
 * Handle one line of input.
 *
 * @param out_text Receives the text to display (caller frees): the result,
 *                 help text, or "Error: <message>". Set to NULL when there is
 *                 nothing to show. May be NULL.
 */
Symform_ReplStatus symform_repl_execute_line(Symform_Repl *repl, const char *line,
                                             char **out_text);

/**
 * Execute every line of a stream, writing results to out and errors to err.
 * @return Number of lines that failed
 */
int symform_repl_run_stream(Symform_Repl *repl, FILE *in, FILE *out, FILE *err);

/**
 * Interactive loop on stdin/stdout with prompt and banner.
 */
void symform_repl_run_interactive(Symform_Repl *repl);

Symform_Session *symform_repl_get_session(Symform_Repl *repl);

/**
 * Wall time of the last evaluated statement (0 for host commands).
 */
double symform_repl_last_elapsed_ms(const Symform_Repl *repl);

const char *symform_repl_help_text(void);

#endif /* SYMFORM_REPL_H */
