/**
 * Symform - Evaluator Session
 *
 * Statement evaluation against the symbol, expression and rule tables, and
 * the simplifier (constant folding plus fixed algebraic identities).
 *
 * Every statement first computes its complete result into temporaries and
 * only then commits them to the tables, so a failing statement never leaves
 * a table partially updated.
 */

#include "engine_internal.h"
#include <stdlib.h>
#include <string.h>
#include <stdio.h>
#include <stdarg.h>
#include <math.h>

/* ============================================================================
 * Internal Types
 * ============================================================================ */

typedef struct NamedExpr {
    char *name;
    Symform_Expr *expr;
} NamedExpr;

typedef struct ExprTable {
    NamedExpr *items;
    int count;
    int capacity;
} ExprTable;

struct Symform_Session {
    ExprTable symbols;
    ExprTable expressions;

    SessionRule *rules;
    int rule_count;
    int rule_capacity;

    bool verbose;
    char error[SYMFORM_SESSION_ERROR_LEN];
};

/* ============================================================================
 * Table Helpers
 * ============================================================================ */

static int table_find(const ExprTable *table, const char *name) {
    for (int i = 0; i < table->count; i++) {
        if (strcmp(table->items[i].name, name) == 0) {
            return i;
        }
    }
    return -1;
}

/**
 * Make room for `extra` more entries so a following commit cannot fail.
 */
static bool table_reserve(ExprTable *table, int extra) {
    int needed = table->count + extra;
    if (needed <= table->capacity) return true;

    int new_capacity = table->capacity ? table->capacity : 8;
    while (new_capacity < needed) {
        new_capacity *= 2;
    }

    NamedExpr *items = SYMFORM_REALLOC(table->items, NamedExpr, new_capacity);
    if (!items) return false;
    table->items = items;
    table->capacity = new_capacity;
    return true;
}

/**
 * Insert or replace. Takes ownership of name and expr. Capacity must have
 * been reserved.
 */
static void table_commit(ExprTable *table, char *name, Symform_Expr *expr) {
    int index = table_find(table, name);
    if (index >= 0) {
        symform_expr_free(table->items[index].expr);
        table->items[index].expr = expr;
        free(name);
        return;
    }
    table->items[table->count].name = name;
    table->items[table->count].expr = expr;
    table->count++;
}

static void table_clear(ExprTable *table) {
    for (int i = 0; i < table->count; i++) {
        free(table->items[i].name);
        symform_expr_free(table->items[i].expr);
    }
    free(table->items);
    table->items = NULL;
    table->count = 0;
    table->capacity = 0;
}

static void rules_clear(Symform_Session *session) {
    for (int i = 0; i < session->rule_count; i++) {
        symform_expr_free(session->rules[i].pattern);
        symform_expr_free(session->rules[i].replacement);
    }
    free(session->rules);
    session->rules = NULL;
    session->rule_count = 0;
    session->rule_capacity = 0;
}

/* ============================================================================
 * Error Reporting
 * ============================================================================ */

Symform_Result session_fail(Symform_Session *session, Symform_Result code, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vsnprintf(session->error, sizeof(session->error), fmt, args);
    va_end(args);

    if (session->verbose) {
        symform_log_debug(SYMFORM_LOG_EVAL, "%s: %s", symform_result_name(code), session->error);
    }
    return code;
}

static Symform_Result session_oom(Symform_Session *session) {
    return session_fail(session, SYMFORM_ERR_OUT_OF_MEMORY, "Out of memory");
}

const SessionRule *session_rules(const Symform_Session *session, int *out_count) {
    *out_count = session->rule_count;
    return session->rules;
}

/* ============================================================================
 * Simplifier
 * ============================================================================ */

static Symform_Result simplify_expr(Symform_Session *session, const Symform_Expr *expr,
                                    int depth, Symform_Expr **out);

static Symform_Result make_number(Symform_Session *session, double value, Symform_Expr **out) {
    *out = symform_expr_number(value);
    return *out ? SYMFORM_OK : session_oom(session);
}

static Symform_Result fold_numbers(Symform_Session *session, Symform_BinOpKind op,
                                   double l, double r, Symform_Expr **out) {
    double result = 0.0;
    switch (op) {
        case SYMFORM_BINOP_ADD: result = l + r; break;
        case SYMFORM_BINOP_SUB: result = l - r; break;
        case SYMFORM_BINOP_MUL: result = l * r; break;
        case SYMFORM_BINOP_DIV:
            if (r == 0.0) {
                return session_fail(session, SYMFORM_ERR_DIVISION_BY_ZERO, "Division by zero");
            }
            result = l / r;
            break;
        case SYMFORM_BINOP_POW:
            /* NaN for invalid domains propagates as-is */
            result = pow(l, r);
            break;
    }
    return make_number(session, result, out);
}

/**
 * Algebraic identities, in priority order:
 *   x+0=x  0+x=x  x*0=0  0*x=0  x*1=x  1*x=x  x^0=1  x^1=x
 * Consumes left and right.
 */
static Symform_Result apply_identities(Symform_Session *session, Symform_BinOpKind op,
                                       Symform_Expr *left, Symform_Expr *right,
                                       Symform_Expr **out) {
    switch (op) {
        case SYMFORM_BINOP_ADD:
            if (symform_expr_is_number(right, 0.0)) {
                symform_expr_free(right);
                *out = left;
                return SYMFORM_OK;
            }
            if (symform_expr_is_number(left, 0.0)) {
                symform_expr_free(left);
                *out = right;
                return SYMFORM_OK;
            }
            break;
        case SYMFORM_BINOP_MUL:
            if (symform_expr_is_number(right, 0.0) || symform_expr_is_number(left, 0.0)) {
                symform_expr_free(left);
                symform_expr_free(right);
                return make_number(session, 0.0, out);
            }
            if (symform_expr_is_number(right, 1.0)) {
                symform_expr_free(right);
                *out = left;
                return SYMFORM_OK;
            }
            if (symform_expr_is_number(left, 1.0)) {
                symform_expr_free(left);
                *out = right;
                return SYMFORM_OK;
            }
            break;
        case SYMFORM_BINOP_POW:
            if (symform_expr_is_number(right, 0.0)) {
                symform_expr_free(left);
                symform_expr_free(right);
                return make_number(session, 1.0, out);
            }
            if (symform_expr_is_number(right, 1.0)) {
                symform_expr_free(right);
                *out = left;
                return SYMFORM_OK;
            }
            break;
        case SYMFORM_BINOP_SUB:
        case SYMFORM_BINOP_DIV:
            break;
    }

    *out = symform_expr_binop(op, left, right);
    return *out ? SYMFORM_OK : session_oom(session);
}

static Symform_Result simplify_binop(Symform_Session *session, const Symform_Expr *expr,
                                     int depth, Symform_Expr **out) {
    Symform_Expr *left = NULL;
    Symform_Expr *right = NULL;

    Symform_Result result = simplify_expr(session, expr->as.binop.left, depth, &left);
    if (result != SYMFORM_OK) return result;

    result = simplify_expr(session, expr->as.binop.right, depth, &right);
    if (result != SYMFORM_OK) {
        symform_expr_free(left);
        return result;
    }

    if (left->kind == SYMFORM_EXPR_NUMBER && right->kind == SYMFORM_EXPR_NUMBER) {
        double l = left->as.number;
        double r = right->as.number;
        symform_expr_free(left);
        symform_expr_free(right);
        return fold_numbers(session, expr->as.binop.op, l, r, out);
    }

    return apply_identities(session, expr->as.binop.op, left, right, out);
}

typedef double (*BuiltinFunc)(double);

static BuiltinFunc find_builtin(const char *name) {
    if (strcmp(name, "sin") == 0) return sin;
    if (strcmp(name, "cos") == 0) return cos;
    if (strcmp(name, "exp") == 0) return exp;
    if (strcmp(name, "log") == 0) return log;   /* natural logarithm */
    return NULL;
}

static Symform_Result simplify_call(Symform_Session *session, const Symform_Expr *expr,
                                    int depth, Symform_Expr **out) {
    int argc = expr->as.call.arg_count;
    Symform_Expr **args = NULL;

    if (argc > 0) {
        args = SYMFORM_ALLOC_ARRAY(Symform_Expr *, argc);
        if (!args) return session_oom(session);

        for (int i = 0; i < argc; i++) {
            Symform_Result result = simplify_expr(session, expr->as.call.args[i], depth, &args[i]);
            if (result != SYMFORM_OK) {
                for (int j = 0; j < i; j++) {
                    symform_expr_free(args[j]);
                }
                free(args);
                return result;
            }
        }
    }

    BuiltinFunc func = find_builtin(expr->as.call.name);
    if (func && argc == 1 && args[0]->kind == SYMFORM_EXPR_NUMBER) {
        double value = func(args[0]->as.number);
        symform_expr_free(args[0]);
        free(args);
        return make_number(session, value, out);
    }

    *out = symform_expr_call(expr->as.call.name, args, argc);
    return *out ? SYMFORM_OK : session_oom(session);
}

static Symform_Result simplify_expr(Symform_Session *session, const Symform_Expr *expr,
                                    int depth, Symform_Expr **out) {
    *out = NULL;

    switch (expr->kind) {
        case SYMFORM_EXPR_NUMBER:
            return make_number(session, expr->as.number, out);

        case SYMFORM_EXPR_SYMBOL: {
            /* Names bound in the expression table are substituted transparently */
            int index = table_find(&session->expressions, expr->as.symbol);
            if (index < 0) {
                *out = symform_expr_symbol(expr->as.symbol);
                return *out ? SYMFORM_OK : session_oom(session);
            }
            if (depth >= SYMFORM_MAX_RESOLVE_DEPTH) {
                return session_fail(session, SYMFORM_ERR_RECURSION_LIMIT,
                                    "Recursive definition of '%s'", expr->as.symbol);
            }
            return simplify_expr(session, session->expressions.items[index].expr, depth + 1, out);
        }

        case SYMFORM_EXPR_BINOP:
            return simplify_binop(session, expr, depth, out);

        case SYMFORM_EXPR_UNOP: {
            Symform_Expr *operand = NULL;
            Symform_Result result = simplify_expr(session, expr->as.unop.operand, depth, &operand);
            if (result != SYMFORM_OK) return result;

            if (operand->kind == SYMFORM_EXPR_NUMBER) {
                double value = -operand->as.number;
                symform_expr_free(operand);
                return make_number(session, value, out);
            }
            *out = symform_expr_unop(expr->as.unop.op, operand);
            return *out ? SYMFORM_OK : session_oom(session);
        }

        case SYMFORM_EXPR_CALL:
            return simplify_call(session, expr, depth, out);
    }

    return session_fail(session, SYMFORM_ERR_INVALID_ARGUMENT, "Unknown expression kind");
}

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

Symform_Session *symform_session_create(const Symform_SessionConfig *config) {
    Symform_Session *session = SYMFORM_ALLOC(Symform_Session);
    if (!session) {
        symform_set_error("Failed to allocate session");
        return NULL;
    }
    session->verbose = config ? config->verbose : false;
    return session;
}

void symform_session_destroy(Symform_Session *session) {
    if (!session) return;
    symform_session_clear(session);
    free(session);
}

void symform_session_clear(Symform_Session *session) {
    if (!session) return;
    table_clear(&session->symbols);
    table_clear(&session->expressions);
    rules_clear(session);
    session->error[0] = '\0';
}

void symform_session_set_verbose(Symform_Session *session, bool verbose) {
    if (session) session->verbose = verbose;
}

bool symform_session_is_verbose(const Symform_Session *session) {
    return session && session->verbose;
}

/* ============================================================================
 * Statement Evaluation
 * ============================================================================ */

static Symform_Result eval_symbols(Symform_Session *session, const Symform_Stmt *stmt,
                                   char **out_text) {
    int count = stmt->as.symbols.count;
    char **names = SYMFORM_ALLOC_ARRAY(char *, count > 0 ? count : 1);
    Symform_Expr **placeholders = SYMFORM_ALLOC_ARRAY(Symform_Expr *, count > 0 ? count : 1);
    char *text = symform_strdup("Symbols declared");
    bool ok = names && placeholders && text && table_reserve(&session->symbols, count);

    for (int i = 0; ok && i < count; i++) {
        names[i] = symform_strdup(stmt->as.symbols.names[i]);
        placeholders[i] = symform_expr_symbol(stmt->as.symbols.names[i]);
        ok = names[i] && placeholders[i];
    }

    if (!ok) {
        for (int i = 0; names && placeholders && i < count; i++) {
            free(names[i]);
            symform_expr_free(placeholders[i]);
        }
        free(names);
        free(placeholders);
        free(text);
        return session_oom(session);
    }

    for (int i = 0; i < count; i++) {
        table_commit(&session->symbols, names[i], placeholders[i]);
    }
    free(names);
    free(placeholders);

    *out_text = text;
    return SYMFORM_OK;
}

/**
 * Expression and Local are evaluated identically.
 */
static Symform_Result eval_decl(Symform_Session *session, const Symform_Stmt *stmt,
                                char **out_text) {
    Symform_Expr *simplified = NULL;
    Symform_Result result = simplify_expr(session, stmt->as.decl.expr, 0, &simplified);
    if (result != SYMFORM_OK) return result;

    StrBuf sb;
    strbuf_init(&sb);
    strbuf_appendf(&sb, "%s = ", stmt->as.decl.name);
    strbuf_append_expr(&sb, simplified);
    char *text = strbuf_take(&sb);
    char *name = symform_strdup(stmt->as.decl.name);

    if (!text || !name || !table_reserve(&session->expressions, 1)) {
        free(text);
        free(name);
        symform_expr_free(simplified);
        return session_oom(session);
    }

    table_commit(&session->expressions, name, simplified);
    *out_text = text;
    return SYMFORM_OK;
}

static Symform_Result eval_id_rule(Symform_Session *session, const Symform_Stmt *stmt,
                                   char **out_text) {
    if (session->rule_count == session->rule_capacity) {
        int new_capacity = session->rule_capacity ? session->rule_capacity * 2 : 8;
        SessionRule *grown = SYMFORM_REALLOC(session->rules, SessionRule, new_capacity);
        if (!grown) return session_oom(session);
        session->rules = grown;
        session->rule_capacity = new_capacity;
    }

    Symform_Expr *pattern = symform_expr_clone(stmt->as.rule.pattern);
    Symform_Expr *replacement = symform_expr_clone(stmt->as.rule.replacement);

    StrBuf sb;
    strbuf_init(&sb);
    strbuf_append(&sb, "Rule added: ");
    strbuf_append_expr(&sb, stmt->as.rule.pattern);
    strbuf_append(&sb, " -> ");
    strbuf_append_expr(&sb, stmt->as.rule.replacement);
    char *text = strbuf_take(&sb);

    if (!pattern || !replacement || !text) {
        symform_expr_free(pattern);
        symform_expr_free(replacement);
        free(text);
        return session_oom(session);
    }

    session->rules[session->rule_count].pattern = pattern;
    session->rules[session->rule_count].replacement = replacement;
    session->rule_count++;

    *out_text = text;
    return SYMFORM_OK;
}

static Symform_Result eval_print(Symform_Session *session, const Symform_Stmt *stmt,
                                 char **out_text) {
    int index = table_find(&session->expressions, stmt->as.print.name);
    if (index < 0) {
        return session_fail(session, SYMFORM_ERR_UNDEFINED_PRINT_TARGET,
                            "Expression '%s' not found", stmt->as.print.name);
    }

    StrBuf sb;
    strbuf_init(&sb);
    strbuf_appendf(&sb, "%s = ", stmt->as.print.name);
    strbuf_append_expr(&sb, session->expressions.items[index].expr);
    *out_text = strbuf_take(&sb);
    return *out_text ? SYMFORM_OK : session_oom(session);
}

/**
 * Rewrite every stored expression. All results are computed before any entry
 * is replaced.
 */
static Symform_Result eval_sort(Symform_Session *session, char **out_text) {
    int count = session->expressions.count;
    Symform_Expr **rewritten = SYMFORM_ALLOC_ARRAY(Symform_Expr *, count > 0 ? count : 1);
    char *text = symform_strdup("Sorted and rules applied");
    if (!rewritten || !text) {
        free(rewritten);
        free(text);
        return session_oom(session);
    }

    for (int i = 0; i < count; i++) {
        Symform_Result result = symform_rules_apply(session, session->expressions.items[i].expr,
                                                    &rewritten[i]);
        if (result != SYMFORM_OK) {
            for (int j = 0; j < i; j++) {
                symform_expr_free(rewritten[j]);
            }
            free(rewritten);
            free(text);
            return result;
        }
    }

    for (int i = 0; i < count; i++) {
        symform_expr_free(session->expressions.items[i].expr);
        session->expressions.items[i].expr = rewritten[i];
    }
    free(rewritten);

    if (session->verbose) {
        symform_log_debug(SYMFORM_LOG_RULES, "Sorted %d expression(s) with %d rule(s)",
                          count, session->rule_count);
    }

    *out_text = text;
    return SYMFORM_OK;
}

static Symform_Result eval_expr(Symform_Session *session, const Symform_Stmt *stmt,
                                char **out_text) {
    Symform_Expr *simplified = NULL;
    Symform_Result result = simplify_expr(session, stmt->as.eval.expr, 0, &simplified);
    if (result != SYMFORM_OK) return result;

    *out_text = symform_expr_to_string(simplified);
    symform_expr_free(simplified);
    return *out_text ? SYMFORM_OK : session_oom(session);
}

Symform_Result symform_session_eval(Symform_Session *session, const Symform_Stmt *stmt,
                                    char **out_text) {
    if (out_text) *out_text = NULL;
    if (!session) return SYMFORM_ERR_INVALID_ARGUMENT;
    if (!stmt) {
        return session_fail(session, SYMFORM_ERR_INVALID_ARGUMENT, "NULL statement");
    }

    session->error[0] = '\0';

    if (session->verbose) {
        char *source = symform_stmt_to_string(stmt);
        symform_log_debug(SYMFORM_LOG_EVAL, "Evaluating %s: %s",
                          symform_stmt_kind_name(stmt->kind), source ? source : "?");
        free(source);
    }

    char *text = NULL;
    Symform_Result result = SYMFORM_ERR_INVALID_ARGUMENT;
    switch (stmt->kind) {
        case SYMFORM_STMT_SYMBOLS:    result = eval_symbols(session, stmt, &text); break;
        case SYMFORM_STMT_EXPRESSION:
        case SYMFORM_STMT_LOCAL:      result = eval_decl(session, stmt, &text); break;
        case SYMFORM_STMT_ID_RULE:    result = eval_id_rule(session, stmt, &text); break;
        case SYMFORM_STMT_PRINT:      result = eval_print(session, stmt, &text); break;
        case SYMFORM_STMT_SORT:       result = eval_sort(session, &text); break;
        case SYMFORM_STMT_EVAL:       result = eval_expr(session, stmt, &text); break;
    }

    if (out_text) {
        *out_text = text;
    } else {
        free(text);
    }
    return result;
}

Symform_Result symform_session_simplify(Symform_Session *session, const Symform_Expr *expr,
                                        Symform_Expr **out) {
    if (out) *out = NULL;
    if (!session) return SYMFORM_ERR_INVALID_ARGUMENT;
    if (!expr || !out) {
        return session_fail(session, SYMFORM_ERR_INVALID_ARGUMENT, "NULL expression");
    }
    return simplify_expr(session, expr, 0, out);
}

const char *symform_session_get_error(const Symform_Session *session) {
    if (!session) return "";
    return session->error;
}

/* ============================================================================
 * Table Access
 * ============================================================================ */

int symform_session_symbol_count(const Symform_Session *session) {
    return session ? session->symbols.count : 0;
}

bool symform_session_has_symbol(const Symform_Session *session, const char *name) {
    return session && name && table_find(&session->symbols, name) >= 0;
}

int symform_session_expression_count(const Symform_Session *session) {
    return session ? session->expressions.count : 0;
}

const Symform_Expr *symform_session_get_expression(const Symform_Session *session,
                                                   const char *name) {
    if (!session || !name) return NULL;
    int index = table_find(&session->expressions, name);
    return index >= 0 ? session->expressions.items[index].expr : NULL;
}

const char *symform_session_expression_name(const Symform_Session *session, int index) {
    if (!session || index < 0 || index >= session->expressions.count) return NULL;
    return session->expressions.items[index].name;
}

int symform_session_rule_count(const Symform_Session *session) {
    return session ? session->rule_count : 0;
}

const Symform_Expr *symform_session_rule_pattern(const Symform_Session *session, int index) {
    if (!session || index < 0 || index >= session->rule_count) return NULL;
    return session->rules[index].pattern;
}

const Symform_Expr *symform_session_rule_replacement(const Symform_Session *session, int index) {
    if (!session || index < 0 || index >= session->rule_count) return NULL;
    return session->rules[index].replacement;
}
