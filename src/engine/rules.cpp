/**
 * Symform - Rule Engine
 *
 * Structural matching, substitution and fixed-point rewriting of stored
 * expressions with the session's id-rules.
 */

#include "engine_internal.h"
#include <stdlib.h>
#include <string.h>
#include <math.h>

/* ============================================================================
 * Bindings
 * ============================================================================ */

void symform_bindings_init(Symform_Bindings *bindings) {
    if (!bindings) return;
    bindings->names = NULL;
    bindings->values = NULL;
    bindings->count = 0;
    bindings->capacity = 0;
}

void symform_bindings_clear(Symform_Bindings *bindings) {
    if (!bindings) return;
    for (int i = 0; i < bindings->count; i++) {
        free(bindings->names[i]);
        symform_expr_free(bindings->values[i]);
    }
    free(bindings->names);
    free(bindings->values);
    symform_bindings_init(bindings);
}

const Symform_Expr *symform_bindings_get(const Symform_Bindings *bindings, const char *name) {
    if (!bindings || !name) return NULL;
    for (int i = 0; i < bindings->count; i++) {
        if (strcmp(bindings->names[i], name) == 0) {
            return bindings->values[i];
        }
    }
    return NULL;
}

bool symform_bindings_bind(Symform_Bindings *bindings, const char *name, const Symform_Expr *value) {
    if (!bindings || !name || !value) return false;

    const Symform_Expr *existing = symform_bindings_get(bindings, name);
    if (existing) {
        return symform_expr_equal(existing, value);
    }

    if (bindings->count == bindings->capacity) {
        int new_capacity = bindings->capacity ? bindings->capacity * 2 : 4;
        char **names = SYMFORM_REALLOC(bindings->names, char *, new_capacity);
        if (!names) return false;
        bindings->names = names;
        Symform_Expr **values = SYMFORM_REALLOC(bindings->values, Symform_Expr *, new_capacity);
        if (!values) return false;
        bindings->values = values;
        bindings->capacity = new_capacity;
    }

    char *name_copy = symform_strdup(name);
    Symform_Expr *value_copy = symform_expr_clone(value);
    if (!name_copy || !value_copy) {
        free(name_copy);
        symform_expr_free(value_copy);
        return false;
    }

    bindings->names[bindings->count] = name_copy;
    bindings->values[bindings->count] = value_copy;
    bindings->count++;
    return true;
}

/**
 * Merge src into dst. Fails on a name bound to two different values.
 */
static bool bindings_merge(Symform_Bindings *dst, const Symform_Bindings *src) {
    for (int i = 0; i < src->count; i++) {
        if (!symform_bindings_bind(dst, src->names[i], src->values[i])) {
            return false;
        }
    }
    return true;
}

/* ============================================================================
 * Matching
 * ============================================================================ */

static bool match_node(const Symform_Expr *expr, const Symform_Expr *pattern,
                       Symform_Bindings *bindings) {
    if (expr->kind != pattern->kind) return false;

    switch (expr->kind) {
        case SYMFORM_EXPR_SYMBOL:
            /* Name equality only: pattern symbols are not variables */
            return strcmp(expr->as.symbol, pattern->as.symbol) == 0;

        case SYMFORM_EXPR_NUMBER:
            return fabs(expr->as.number - pattern->as.number) < SYMFORM_RULES_NUMBER_TOLERANCE;

        case SYMFORM_EXPR_BINOP: {
            if (expr->as.binop.op != pattern->as.binop.op) return false;

            Symform_Bindings left;
            Symform_Bindings right;
            symform_bindings_init(&left);
            symform_bindings_init(&right);

            bool matched = match_node(expr->as.binop.left, pattern->as.binop.left, &left) &&
                           match_node(expr->as.binop.right, pattern->as.binop.right, &right) &&
                           bindings_merge(bindings, &left) &&
                           bindings_merge(bindings, &right);

            symform_bindings_clear(&left);
            symform_bindings_clear(&right);
            return matched;
        }

        case SYMFORM_EXPR_UNOP:
        case SYMFORM_EXPR_CALL:
            /* Never matched as a whole */
            return false;
    }
    return false;
}

bool symform_rules_match(const Symform_Expr *expr, const Symform_Expr *pattern,
                         Symform_Bindings *bindings) {
    if (!expr || !pattern) return false;

    Symform_Bindings local;
    symform_bindings_init(&local);
    bool matched = match_node(expr, pattern, &local);

    if (bindings) {
        symform_bindings_clear(bindings);
        if (matched) {
            *bindings = local;
            return true;
        }
    }
    symform_bindings_clear(&local);
    return matched;
}

/* ============================================================================
 * Substitution
 * ============================================================================ */

Symform_Expr *symform_rules_substitute(const Symform_Expr *tmpl, const Symform_Bindings *bindings) {
    if (!tmpl) return NULL;

    switch (tmpl->kind) {
        case SYMFORM_EXPR_NUMBER:
            return symform_expr_number(tmpl->as.number);

        case SYMFORM_EXPR_SYMBOL: {
            const Symform_Expr *value = symform_bindings_get(bindings, tmpl->as.symbol);
            return value ? symform_expr_clone(value) : symform_expr_symbol(tmpl->as.symbol);
        }

        case SYMFORM_EXPR_BINOP:
            return symform_expr_binop(tmpl->as.binop.op,
                                      symform_rules_substitute(tmpl->as.binop.left, bindings),
                                      symform_rules_substitute(tmpl->as.binop.right, bindings));

        case SYMFORM_EXPR_UNOP:
            return symform_expr_unop(tmpl->as.unop.op,
                                     symform_rules_substitute(tmpl->as.unop.operand, bindings));

        case SYMFORM_EXPR_CALL: {
            int argc = tmpl->as.call.arg_count;
            Symform_Expr **args = NULL;
            if (argc > 0) {
                args = SYMFORM_ALLOC_ARRAY(Symform_Expr *, argc);
                if (!args) return NULL;
                for (int i = 0; i < argc; i++) {
                    args[i] = symform_rules_substitute(tmpl->as.call.args[i], bindings);
                    if (!args[i]) {
                        for (int j = 0; j < i; j++) {
                            symform_expr_free(args[j]);
                        }
                        free(args);
                        return NULL;
                    }
                }
            }
            return symform_expr_call(tmpl->as.call.name, args, argc);
        }
    }
    return NULL;
}

/* ============================================================================
 * Rewriting
 * ============================================================================ */

/**
 * Apply the first rule whose pattern matches expr as a whole.
 *
 * @param out Receives the substituted replacement, or NULL when no rule matched
 * @param out_rule Index of the applied rule (may be NULL)
 */
static Symform_Result apply_first_rule(Symform_Session *session, const Symform_Expr *expr,
                                       Symform_Expr **out, int *out_rule) {
    *out = NULL;

    int rule_count = 0;
    const SessionRule *rules = session_rules(session, &rule_count);

    for (int i = 0; i < rule_count; i++) {
        Symform_Bindings bindings;
        symform_bindings_init(&bindings);

        if (symform_rules_match(expr, rules[i].pattern, &bindings)) {
            *out = symform_rules_substitute(rules[i].replacement, &bindings);
            symform_bindings_clear(&bindings);
            if (!*out) {
                return session_fail(session, SYMFORM_ERR_OUT_OF_MEMORY, "Out of memory");
            }
            if (out_rule) *out_rule = i;
            return SYMFORM_OK;
        }
        symform_bindings_clear(&bindings);
    }
    return SYMFORM_OK;
}

static Symform_Result rewrite_subterm(Symform_Session *session, const Symform_Expr *expr,
                                      Symform_Expr **out);

/**
 * Rebuild a node with every direct child fully rewritten.
 */
static Symform_Result rewrite_children(Symform_Session *session, const Symform_Expr *expr,
                                       Symform_Expr **out) {
    *out = NULL;
    Symform_Result result;

    switch (expr->kind) {
        case SYMFORM_EXPR_NUMBER:
        case SYMFORM_EXPR_SYMBOL:
            *out = symform_expr_clone(expr);
            break;

        case SYMFORM_EXPR_BINOP: {
            Symform_Expr *left = NULL;
            Symform_Expr *right = NULL;
            result = rewrite_subterm(session, expr->as.binop.left, &left);
            if (result != SYMFORM_OK) return result;
            result = rewrite_subterm(session, expr->as.binop.right, &right);
            if (result != SYMFORM_OK) {
                symform_expr_free(left);
                return result;
            }
            *out = symform_expr_binop(expr->as.binop.op, left, right);
            break;
        }

        case SYMFORM_EXPR_UNOP: {
            Symform_Expr *operand = NULL;
            result = rewrite_subterm(session, expr->as.unop.operand, &operand);
            if (result != SYMFORM_OK) return result;
            *out = symform_expr_unop(expr->as.unop.op, operand);
            break;
        }

        case SYMFORM_EXPR_CALL: {
            int argc = expr->as.call.arg_count;
            Symform_Expr **args = NULL;
            if (argc > 0) {
                args = SYMFORM_ALLOC_ARRAY(Symform_Expr *, argc);
                if (!args) break;
                for (int i = 0; i < argc; i++) {
                    result = rewrite_subterm(session, expr->as.call.args[i], &args[i]);
                    if (result != SYMFORM_OK) {
                        for (int j = 0; j < i; j++) {
                            symform_expr_free(args[j]);
                        }
                        free(args);
                        return result;
                    }
                }
            }
            *out = symform_expr_call(expr->as.call.name, args, argc);
            break;
        }
    }

    if (!*out) {
        return session_fail(session, SYMFORM_ERR_OUT_OF_MEMORY, "Out of memory");
    }
    return SYMFORM_OK;
}

/**
 * Bottom-up: children first, then at most one rule application at this node.
 */
static Symform_Result rewrite_subterm(Symform_Session *session, const Symform_Expr *expr,
                                      Symform_Expr **out) {
    Symform_Expr *rebuilt = NULL;
    Symform_Result result = rewrite_children(session, expr, &rebuilt);
    if (result != SYMFORM_OK) return result;

    Symform_Expr *replaced = NULL;
    int rule_index = -1;
    result = apply_first_rule(session, rebuilt, &replaced, &rule_index);
    if (result != SYMFORM_OK) {
        symform_expr_free(rebuilt);
        return result;
    }

    if (replaced) {
        if (symform_session_is_verbose(session)) {
            symform_log_debug(SYMFORM_LOG_RULES, "Rule %d applied to subterm", rule_index);
        }
        symform_expr_free(rebuilt);
        *out = replaced;
    } else {
        *out = rebuilt;
    }
    return SYMFORM_OK;
}

Symform_Result symform_rules_apply(Symform_Session *session, const Symform_Expr *expr,
                                   Symform_Expr **out) {
    if (out) *out = NULL;
    if (!session) return SYMFORM_ERR_INVALID_ARGUMENT;
    if (!expr || !out) {
        return session_fail(session, SYMFORM_ERR_INVALID_ARGUMENT, "NULL expression");
    }

    bool verbose = symform_session_is_verbose(session);

    Symform_Expr *current = symform_expr_clone(expr);
    if (!current) {
        return session_fail(session, SYMFORM_ERR_OUT_OF_MEMORY, "Out of memory");
    }

    /* Phase 1: whole-expression rewriting, restarting from the first rule */
    int iterations = 0;
    bool changed = true;
    while (changed && iterations < SYMFORM_RULES_MAX_ITERATIONS) {
        changed = false;
        iterations++;

        Symform_Expr *replaced = NULL;
        int rule_index = -1;
        Symform_Result result = apply_first_rule(session, current, &replaced, &rule_index);
        if (result != SYMFORM_OK) {
            symform_expr_free(current);
            return result;
        }

        if (replaced) {
            if (verbose) {
                symform_log_debug(SYMFORM_LOG_RULES, "Rule %d applied at top level (iteration %d)",
                                  rule_index, iterations);
            }
            symform_expr_free(current);
            current = replaced;
            changed = true;
            continue;
        }

        /* Phase 2: no top-level match, rewrite the subterms */
        Symform_Expr *rewritten = NULL;
        result = rewrite_children(session, current, &rewritten);
        symform_expr_free(current);
        if (result != SYMFORM_OK) return result;
        current = rewritten;
    }

    if (changed && verbose) {
        symform_log_debug(SYMFORM_LOG_RULES, "Iteration cap of %d reached",
                          SYMFORM_RULES_MAX_ITERATIONS);
    }

    Symform_Result result = symform_session_simplify(session, current, out);
    symform_expr_free(current);
    return result;
}
