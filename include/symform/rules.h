#ifndef SYMFORM_RULES_H
#define SYMFORM_RULES_H

#include "symform/error.h"
#include "symform/expr.h"
#include <stdbool.h>

/**
 * Symform Rule Engine
 *
 * Applies the session's ordered id-rules to an expression:
 *
 *   1. Top level: the first rule whose pattern matches the whole expression
 *      is applied and the scan restarts from the first rule, until nothing
 *      matches or SYMFORM_RULES_MAX_ITERATIONS applications have happened.
 *   2. Subterms: every child is rewritten bottom-up (children first, then the
 *      first matching rule at that node, applied once).
 *
 * The result is simplified once more before it is returned.
 *
 * Matching is structural: numbers within 1e-10, symbols by identical name,
 * binary operations by kind and both children. Negations and function calls
 * never match a pattern as a whole; rules reach them only through their
 * children.
 */

#define SYMFORM_RULES_MAX_ITERATIONS 100
#define SYMFORM_RULES_NUMBER_TOLERANCE 1e-10

typedef struct Symform_Session Symform_Session;

/**
 * Name -> expression bindings produced by a match.
 */
typedef struct Symform_Bindings {
    char **names;
    Symform_Expr **values;
    int count;
    int capacity;
} Symform_Bindings;

void symform_bindings_init(Symform_Bindings *bindings);
void symform_bindings_clear(Symform_Bindings *bindings);

/**
 * Add a binding (name and value are copied).
 * @return false on allocation failure or if the name is already bound to a
 *         different value
 */
bool symform_bindings_bind(Symform_Bindings *bindings, const char *name, const Symform_Expr *value);

/**
 * @return Borrowed value, or NULL if the name is unbound
 */
const Symform_Expr *symform_bindings_get(const Symform_Bindings *bindings, const char *name);

/**
 * Structural match of expr against pattern.
 *
 * @param bindings Receives any bindings (cleared first; may be NULL)
 * @return true if the pattern matches
 */
bool symform_rules_match(const Symform_Expr *expr, const Symform_Expr *pattern,
                         Symform_Bindings *bindings);

/**
 * Copy a replacement template, replacing bound symbols by their values.
 * @return New tree, or NULL on allocation failure
 */
Symform_Expr *symform_rules_substitute(const Symform_Expr *tmpl, const Symform_Bindings *bindings);

/**
 * Rewrite an expression with the session's rules, then simplify it.
 *
 * @param out Receives the rewritten tree on success (caller frees)
 */
Symform_Result symform_rules_apply(Symform_Session *session, const Symform_Expr *expr,
                                   Symform_Expr **out);

#endif /* SYMFORM_RULES_H */
