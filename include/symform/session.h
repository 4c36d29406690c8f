#ifndef SYMFORM_SESSION_H
#define SYMFORM_SESSION_H

#include "symform/error.h"
#include "symform/expr.h"
#include <stdbool.h>

/**
 * Symform Evaluator Session
 *
 * Owns the three session tables:
 *   symbols      name -> Symbol placeholder
 *   expressions  name -> most recently simplified expression
 *   rules        ordered (pattern, replacement) pairs, order is priority
 *
 * Tables change only after a statement has been evaluated successfully; a
 * failing statement leaves all of them untouched.
 *
 * Example usage:
 *   Symform_Session *s = symform_session_create(NULL);
 *   Symform_Stmt *stmt = symform_parse("Expression e = (x + 1) * 2");
 *   char *text = NULL;
 *   if (symform_session_eval(s, stmt, &text) == SYMFORM_OK) {
 *       printf("%s\n", text);   // e = ((x + 1) * 2)
 *       free(text);
 *   } else {
 *       printf("Error: %s\n", symform_session_get_error(s));
 *   }
 *   symform_stmt_free(stmt);
 *   symform_session_destroy(s);
 */

/* Maximum nesting of symbol -> expression resolution during simplify */
#define SYMFORM_MAX_RESOLVE_DEPTH 256

#define SYMFORM_SESSION_ERROR_LEN 256

typedef struct Symform_Session Symform_Session;

typedef struct Symform_SessionConfig {
    bool verbose;   /* Debug-log statement evaluation and rule applications */
} Symform_SessionConfig;

#define SYMFORM_SESSION_CONFIG_DEFAULT { false }

/*============================================================================
 * Lifecycle
 *============================================================================*/

/**
 * Create a session with empty tables.
 * @param config Session options (NULL for defaults)
 * @return New session, or NULL on allocation failure
 */
Symform_Session *symform_session_create(const Symform_SessionConfig *config);

void symform_session_destroy(Symform_Session *session);

/**
 * Reset all three tables and the error message.
 */
void symform_session_clear(Symform_Session *session);

void symform_session_set_verbose(Symform_Session *session, bool verbose);
bool symform_session_is_verbose(const Symform_Session *session);

/*============================================================================
 * Evaluation
 *============================================================================*/

/**
 * Evaluate one statement.
 *
 * @param session Session whose tables the statement reads and updates
 * @param stmt Statement to evaluate (not consumed)
 * @param out_text Receives the display text on success (caller frees);
 *                 set to NULL on failure. May be NULL.
 * @return SYMFORM_OK or the error code; the message is available from
 *         symform_session_get_error()
 */
Symform_Result symform_session_eval(Symform_Session *session, const Symform_Stmt *stmt,
                                    char **out_text);

/**
 * Simplify an expression against the session's expression table: constant
 * folding, algebraic identities, transparent substitution of bound names.
 *
 * @param out Receives the new tree on success (caller frees)
 */
Symform_Result symform_session_simplify(Symform_Session *session, const Symform_Expr *expr,
                                        Symform_Expr **out);

const char *symform_session_get_error(const Symform_Session *session);

/*============================================================================
 * Table Access (read-only)
 *============================================================================*/

int symform_session_symbol_count(const Symform_Session *session);
bool symform_session_has_symbol(const Symform_Session *session, const char *name);

int symform_session_expression_count(const Symform_Session *session);

/**
 * Look up a stored expression.
 * @return Borrowed pointer (valid until the next mutating call), or NULL
 */
const Symform_Expr *symform_session_get_expression(const Symform_Session *session,
                                                   const char *name);

/**
 * Expression name by index, for iteration (0 to count-1).
 */
const char *symform_session_expression_name(const Symform_Session *session, int index);

int symform_session_rule_count(const Symform_Session *session);
const Symform_Expr *symform_session_rule_pattern(const Symform_Session *session, int index);
const Symform_Expr *symform_session_rule_replacement(const Symform_Session *session, int index);

#endif /* SYMFORM_SESSION_H */
