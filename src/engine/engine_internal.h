/**
 * Symform - Engine Internal Helpers
 *
 * Shared by the engine sources and the REPL host.
 * Not part of the public API.
 */

#ifndef SYMFORM_ENGINE_INTERNAL_H
#define SYMFORM_ENGINE_INTERNAL_H

#include "symform/symform.h"
#include <stddef.h>
#include <stdbool.h>

/* ============================================================================
 * Growable String Buffer
 * ============================================================================ */

typedef struct StrBuf {
    char *data;
    size_t length;
    size_t capacity;
    bool failed;     /* Set once an allocation fails; further appends are no-ops */
} StrBuf;

void strbuf_init(StrBuf *sb);
void strbuf_free(StrBuf *sb);
void strbuf_append(StrBuf *sb, const char *text);
void strbuf_append_n(StrBuf *sb, const char *text, size_t length);
void strbuf_appendf(StrBuf *sb, const char *fmt, ...);

/**
 * Hand the buffer to the caller (free()), or NULL if any append failed.
 * The StrBuf is reset either way.
 */
char *strbuf_take(StrBuf *sb);

/**
 * Append the rendering of an expression.
 */
void strbuf_append_expr(StrBuf *sb, const Symform_Expr *expr);

/* ============================================================================
 * String Helpers
 * ============================================================================ */

char *symform_strdup(const char *text);
char *symform_strndup(const char *text, size_t length);

/* ============================================================================
 * Session Internals (session.cpp)
 *
 * The rule engine needs read access to the rule table and the session's
 * error reporting.
 * ============================================================================ */

typedef struct SessionRule {
    Symform_Expr *pattern;
    Symform_Expr *replacement;
} SessionRule;

/**
 * Borrow the rule table.
 */
const SessionRule *session_rules(const Symform_Session *session, int *out_count);

/**
 * Record an evaluation error in the session and return the code.
 */
Symform_Result session_fail(Symform_Session *session, Symform_Result code, const char *fmt, ...);

#endif /* SYMFORM_ENGINE_INTERNAL_H */
