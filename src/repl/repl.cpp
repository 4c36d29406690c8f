/**
 * Symform - REPL Host
 *
 * One statement per line. Host commands (quit, exit, help, clear) are
 * handled here; everything else goes through symform_parse() and
 * symform_session_eval().
 */

#include "symform/repl.h"
#include "symform/parser.h"
#include "symform/error.h"
#include "symform/log.h"
#include "symform/symform.h"
#include "../engine/engine_internal.h"
#include <SDL3/SDL.h>
#include <stdlib.h>
#include <string.h>
#include <stdio.h>
#include <ctype.h>

struct Symform_Repl {
    Symform_Session *session;
    Symform_Config config;
    double last_elapsed_ms;
    int lines_executed;
    int lines_failed;
};

static const char *s_help_text =
    "Symform REPL Help\n"
    "=================\n"
    "\n"
    "Commands:\n"
    "  quit, exit       - Exit the REPL\n"
    "  help             - Show this help message\n"
    "  clear            - Clear all definitions\n"
    "\n"
    "Syntax:\n"
    "  Symbols x, y, z  - Declare symbols\n"
    "  Expression e = (x + y)^2  - Define an expression\n"
    "  Local a = x + 1  - Define a local variable\n"
    "  id x = 1         - Add substitution rule\n"
    "  Print e          - Print an expression\n"
    "  .sort            - Apply all rules and simplify\n"
    "\n"
    "Examples:\n"
    "  > Symbols x, y\n"
    "  > Expression e = (x + 1) * (x - 1)\n"
    "  > id x = 2\n"
    "  > .sort\n"
    "  > Print e\n"
    "  > 2 + 3 * 4\n"
    "  > (1 + 2) ^ 3\n";

/* ============================================================================
 * Helpers
 * ============================================================================ */

static char *format_error(const char *message) {
    StrBuf sb;
    strbuf_init(&sb);
    strbuf_appendf(&sb, "Error: %s", message);
    return strbuf_take(&sb);
}

/**
 * Copy of line without leading/trailing whitespace.
 */
static char *trim_copy(const char *line) {
    const char *start = line;
    while (*start && isspace((unsigned char)*start)) start++;

    const char *end = start + strlen(start);
    while (end > start && isspace((unsigned char)end[-1])) end--;

    return symform_strndup(start, (size_t)(end - start));
}

/**
 * A line that is nothing but a comment: "* " followed by text, or a lone "*".
 * Any other character after the star ("*\tx", "*x") is a statement.
 */
static bool is_comment_line(const char *trimmed) {
    return trimmed[0] == '*' && (trimmed[1] == '\0' || trimmed[1] == ' ');
}

/**
 * Read one line of any length (without the newline). NULL at end of input.
 */
static char *read_line(FILE *in) {
    size_t capacity = 256;
    size_t length = 0;
    char *buf = (char *)malloc(capacity);
    if (!buf) return NULL;

    int c;
    while ((c = fgetc(in)) != EOF && c != '\n') {
        if (length + 1 >= capacity) {
            char *grown = (char *)realloc(buf, capacity * 2);
            if (!grown) {
                free(buf);
                return NULL;
            }
            buf = grown;
            capacity *= 2;
        }
        buf[length++] = (char)c;
    }

    if (c == EOF && length == 0) {
        free(buf);
        return NULL;
    }
    buf[length] = '\0';
    return buf;
}

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

Symform_Repl *symform_repl_create(const Symform_Config *config) {
    Symform_Repl *repl = SYMFORM_ALLOC(Symform_Repl);
    if (!repl) {
        symform_set_error("Failed to allocate REPL");
        return NULL;
    }

    if (config) {
        repl->config = *config;
    } else {
        symform_config_defaults(&repl->config);
    }

    Symform_SessionConfig session_config = SYMFORM_SESSION_CONFIG_DEFAULT;
    session_config.verbose = repl->config.verbose;
    repl->session = symform_session_create(&session_config);
    if (!repl->session) {
        free(repl);
        return NULL;
    }

    return repl;
}

void symform_repl_destroy(Symform_Repl *repl) {
    if (!repl) return;
    symform_session_destroy(repl->session);
    free(repl);
}

Symform_Session *symform_repl_get_session(Symform_Repl *repl) {
    return repl ? repl->session : NULL;
}

const char *symform_repl_help_text(void) {
    return s_help_text;
}

double symform_repl_last_elapsed_ms(const Symform_Repl *repl) {
    return repl ? repl->last_elapsed_ms : 0.0;
}

/* ============================================================================
 * Line Execution
 * ============================================================================ */

static Symform_ReplStatus evaluate_statement(Symform_Repl *repl, const char *source,
                                             char **out_text) {
    Symform_Stmt *stmt = symform_parse(source);
    if (!stmt) {
        *out_text = format_error(symform_get_last_error());
        symform_log_info(SYMFORM_LOG_REPL, "Parse error: %s", symform_get_last_error());
        symform_clear_error();
        return SYMFORM_REPL_ERROR;
    }

    char *text = NULL;
    Symform_Result result = symform_session_eval(repl->session, stmt, &text);
    symform_stmt_free(stmt);

    if (result != SYMFORM_OK) {
        const char *message = symform_session_get_error(repl->session);
        *out_text = format_error(message);
        symform_log_info(SYMFORM_LOG_REPL, "%s: %s", symform_result_name(result), message);
        return SYMFORM_REPL_ERROR;
    }

    *out_text = text;
    return SYMFORM_REPL_CONTINUE;
}

Symform_ReplStatus symform_repl_execute_line(Symform_Repl *repl, const char *line,
                                             char **out_text) {
    char *discard = NULL;
    char **text = out_text ? out_text : &discard;
    *text = NULL;

    if (!repl || !line) return SYMFORM_REPL_ERROR;

    char *trimmed = trim_copy(line);
    if (!trimmed) {
        *text = format_error("Out of memory");
        return SYMFORM_REPL_ERROR;
    }

    Symform_ReplStatus status = SYMFORM_REPL_CONTINUE;
    repl->last_elapsed_ms = 0.0;

    if (trimmed[0] == '\0' || is_comment_line(trimmed)) {
        /* Nothing to do */
    } else if (strcmp(trimmed, "quit") == 0 || strcmp(trimmed, "exit") == 0) {
        *text = symform_strdup("Goodbye!");
        status = SYMFORM_REPL_QUIT;
    } else if (strcmp(trimmed, "help") == 0) {
        *text = symform_strdup(s_help_text);
    } else if (strcmp(trimmed, "clear") == 0) {
        symform_session_clear(repl->session);
        symform_log_info(SYMFORM_LOG_REPL, "Environment cleared");
        *text = symform_strdup("Environment cleared");
    } else {
        uint64_t start = SDL_GetPerformanceCounter();
        status = evaluate_statement(repl, trimmed, text);
        uint64_t end = SDL_GetPerformanceCounter();
        repl->last_elapsed_ms = (double)(end - start) * 1000.0 /
                                (double)SDL_GetPerformanceFrequency();

        repl->lines_executed++;
        if (status == SYMFORM_REPL_ERROR) {
            repl->lines_failed++;
        }
    }

    free(trimmed);
    free(discard);
    return status;
}

/* ============================================================================
 * Drivers
 * ============================================================================ */

int symform_repl_run_stream(Symform_Repl *repl, FILE *in, FILE *out, FILE *err) {
    if (!repl || !in) return 0;

    int failures = 0;
    char *line;
    while ((line = read_line(in)) != NULL) {
        char *text = NULL;
        Symform_ReplStatus status = symform_repl_execute_line(repl, line, &text);
        free(line);

        if (status == SYMFORM_REPL_ERROR) {
            failures++;
            if (err && text) fprintf(err, "%s\n", text);
        } else if (status == SYMFORM_REPL_CONTINUE && text && out) {
            fprintf(out, "%s\n", text);
            if (repl->config.show_timing) {
                fprintf(out, "  (%.3f ms)\n", repl->last_elapsed_ms);
            }
        }
        free(text);

        if (status == SYMFORM_REPL_QUIT) break;
    }

    symform_log_info(SYMFORM_LOG_REPL, "Script finished: %d line(s), %d failed",
                     repl->lines_executed, failures);
    return failures;
}

void symform_repl_run_interactive(Symform_Repl *repl) {
    if (!repl) return;

    printf("Symform v%d.%d.%d\n", SYMFORM_VERSION_MAJOR, SYMFORM_VERSION_MINOR,
           SYMFORM_VERSION_PATCH);
    printf("A symbolic manipulation system\n");
    printf("Type 'quit' or 'exit' to exit, 'help' for help\n\n");

    for (;;) {
        printf("%s", repl->config.prompt);
        fflush(stdout);

        char *line = read_line(stdin);
        if (!line) {
            printf("\nGoodbye!\n");
            break;
        }

        char *text = NULL;
        Symform_ReplStatus status = symform_repl_execute_line(repl, line, &text);
        free(line);

        if (status == SYMFORM_REPL_QUIT) {
            printf("%s\n", text ? text : "Goodbye!");
            free(text);
            break;
        }

        if (status == SYMFORM_REPL_ERROR) {
            fprintf(stderr, "%s\n", text ? text : "Error");
        } else if (text) {
            printf("  %s\n", text);
            if (repl->config.show_timing) {
                printf("  (%.3f ms)\n", repl->last_elapsed_ms);
            }
        }
        free(text);
    }
}
