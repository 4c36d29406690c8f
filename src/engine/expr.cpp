/**
 * Symform - Expression and Statement Data Model
 *
 * Construction, ownership, comparison and display of expression trees.
 */

#include "engine_internal.h"
#include <stdlib.h>
#include <string.h>
#include <stdio.h>
#include <stdarg.h>
#include <math.h>

/* ============================================================================
 * String Helpers
 * ============================================================================ */

char *symform_strdup(const char *text) {
    if (!text) return NULL;
    return symform_strndup(text, strlen(text));
}

char *symform_strndup(const char *text, size_t length) {
    char *copy = (char *)malloc(length + 1);
    if (!copy) return NULL;
    memcpy(copy, text, length);
    copy[length] = '\0';
    return copy;
}

void strbuf_init(StrBuf *sb) {
    sb->data = NULL;
    sb->length = 0;
    sb->capacity = 0;
    sb->failed = false;
}

void strbuf_free(StrBuf *sb) {
    free(sb->data);
    strbuf_init(sb);
}

static bool strbuf_reserve(StrBuf *sb, size_t extra) {
    if (sb->failed) return false;

    size_t needed = sb->length + extra + 1;
    if (needed <= sb->capacity) return true;

    size_t new_capacity = sb->capacity ? sb->capacity * 2 : 64;
    while (new_capacity < needed) {
        new_capacity *= 2;
    }

    char *data = SYMFORM_REALLOC(sb->data, char, new_capacity);
    if (!data) {
        sb->failed = true;
        return false;
    }
    sb->data = data;
    sb->capacity = new_capacity;
    return true;
}

void strbuf_append_n(StrBuf *sb, const char *text, size_t length) {
    if (!strbuf_reserve(sb, length)) return;
    memcpy(sb->data + sb->length, text, length);
    sb->length += length;
    sb->data[sb->length] = '\0';
}

void strbuf_append(StrBuf *sb, const char *text) {
    strbuf_append_n(sb, text, strlen(text));
}

void strbuf_appendf(StrBuf *sb, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    va_list copy;
    va_copy(copy, args);
    int needed = vsnprintf(NULL, 0, fmt, copy);
    va_end(copy);

    if (needed >= 0 && strbuf_reserve(sb, (size_t)needed)) {
        vsnprintf(sb->data + sb->length, (size_t)needed + 1, fmt, args);
        sb->length += (size_t)needed;
    }
    va_end(args);
}

char *strbuf_take(StrBuf *sb) {
    if (sb->failed) {
        strbuf_free(sb);
        return NULL;
    }
    /* Empty output still yields a valid string */
    if (!strbuf_reserve(sb, 0)) {
        strbuf_free(sb);
        return NULL;
    }
    sb->data[sb->length] = '\0';
    char *result = sb->data;
    strbuf_init(sb);
    return result;
}

/* ============================================================================
 * Construction
 * ============================================================================ */

Symform_Expr *symform_expr_number(double value) {
    Symform_Expr *expr = SYMFORM_ALLOC(Symform_Expr);
    if (!expr) return NULL;
    expr->kind = SYMFORM_EXPR_NUMBER;
    expr->as.number = value;
    return expr;
}

Symform_Expr *symform_expr_symbol(const char *name) {
    if (!name) return NULL;

    Symform_Expr *expr = SYMFORM_ALLOC(Symform_Expr);
    if (!expr) return NULL;
    expr->kind = SYMFORM_EXPR_SYMBOL;
    expr->as.symbol = symform_strdup(name);
    if (!expr->as.symbol) {
        free(expr);
        return NULL;
    }
    return expr;
}

Symform_Expr *symform_expr_binop(Symform_BinOpKind op, Symform_Expr *left, Symform_Expr *right) {
    if (!left || !right) {
        symform_expr_free(left);
        symform_expr_free(right);
        return NULL;
    }

    Symform_Expr *expr = SYMFORM_ALLOC(Symform_Expr);
    if (!expr) {
        symform_expr_free(left);
        symform_expr_free(right);
        return NULL;
    }
    expr->kind = SYMFORM_EXPR_BINOP;
    expr->as.binop.op = op;
    expr->as.binop.left = left;
    expr->as.binop.right = right;
    return expr;
}

Symform_Expr *symform_expr_unop(Symform_UnOpKind op, Symform_Expr *operand) {
    if (!operand) return NULL;

    Symform_Expr *expr = SYMFORM_ALLOC(Symform_Expr);
    if (!expr) {
        symform_expr_free(operand);
        return NULL;
    }
    expr->kind = SYMFORM_EXPR_UNOP;
    expr->as.unop.op = op;
    expr->as.unop.operand = operand;
    return expr;
}

static void free_args(Symform_Expr **args, int arg_count) {
    if (!args) return;
    for (int i = 0; i < arg_count; i++) {
        symform_expr_free(args[i]);
    }
    free(args);
}

Symform_Expr *symform_expr_call(const char *name, Symform_Expr **args, int arg_count) {
    bool args_ok = name != NULL && arg_count >= 0 && (arg_count == 0 || args != NULL);
    for (int i = 0; args_ok && i < arg_count; i++) {
        if (!args[i]) args_ok = false;
    }

    Symform_Expr *expr = args_ok ? SYMFORM_ALLOC(Symform_Expr) : NULL;
    char *name_copy = expr ? symform_strdup(name) : NULL;
    if (!name_copy) {
        free(expr);
        free_args(args, arg_count);
        return NULL;
    }

    expr->kind = SYMFORM_EXPR_CALL;
    expr->as.call.name = name_copy;
    expr->as.call.args = args;
    expr->as.call.arg_count = arg_count;
    return expr;
}

void symform_expr_free(Symform_Expr *expr) {
    if (!expr) return;

    switch (expr->kind) {
        case SYMFORM_EXPR_NUMBER:
            break;
        case SYMFORM_EXPR_SYMBOL:
            free(expr->as.symbol);
            break;
        case SYMFORM_EXPR_BINOP:
            symform_expr_free(expr->as.binop.left);
            symform_expr_free(expr->as.binop.right);
            break;
        case SYMFORM_EXPR_UNOP:
            symform_expr_free(expr->as.unop.operand);
            break;
        case SYMFORM_EXPR_CALL:
            free(expr->as.call.name);
            free_args(expr->as.call.args, expr->as.call.arg_count);
            break;
    }
    free(expr);
}

Symform_Expr *symform_expr_clone(const Symform_Expr *expr) {
    if (!expr) return NULL;

    switch (expr->kind) {
        case SYMFORM_EXPR_NUMBER:
            return symform_expr_number(expr->as.number);
        case SYMFORM_EXPR_SYMBOL:
            return symform_expr_symbol(expr->as.symbol);
        case SYMFORM_EXPR_BINOP:
            return symform_expr_binop(expr->as.binop.op,
                                      symform_expr_clone(expr->as.binop.left),
                                      symform_expr_clone(expr->as.binop.right));
        case SYMFORM_EXPR_UNOP:
            return symform_expr_unop(expr->as.unop.op,
                                     symform_expr_clone(expr->as.unop.operand));
        case SYMFORM_EXPR_CALL: {
            int argc = expr->as.call.arg_count;
            Symform_Expr **args = NULL;
            if (argc > 0) {
                args = SYMFORM_ALLOC_ARRAY(Symform_Expr *, argc);
                if (!args) return NULL;
                for (int i = 0; i < argc; i++) {
                    args[i] = symform_expr_clone(expr->as.call.args[i]);
                    if (!args[i]) {
                        free_args(args, i);
                        return NULL;
                    }
                }
            }
            return symform_expr_call(expr->as.call.name, args, argc);
        }
    }
    return NULL;
}

/* ============================================================================
 * Comparison
 * ============================================================================ */

bool symform_expr_equal(const Symform_Expr *a, const Symform_Expr *b) {
    if (a == b) return true;
    if (!a || !b || a->kind != b->kind) return false;

    switch (a->kind) {
        case SYMFORM_EXPR_NUMBER:
            return a->as.number == b->as.number;
        case SYMFORM_EXPR_SYMBOL:
            return strcmp(a->as.symbol, b->as.symbol) == 0;
        case SYMFORM_EXPR_BINOP:
            return a->as.binop.op == b->as.binop.op &&
                   symform_expr_equal(a->as.binop.left, b->as.binop.left) &&
                   symform_expr_equal(a->as.binop.right, b->as.binop.right);
        case SYMFORM_EXPR_UNOP:
            return a->as.unop.op == b->as.unop.op &&
                   symform_expr_equal(a->as.unop.operand, b->as.unop.operand);
        case SYMFORM_EXPR_CALL:
            if (strcmp(a->as.call.name, b->as.call.name) != 0 ||
                a->as.call.arg_count != b->as.call.arg_count) {
                return false;
            }
            for (int i = 0; i < a->as.call.arg_count; i++) {
                if (!symform_expr_equal(a->as.call.args[i], b->as.call.args[i])) {
                    return false;
                }
            }
            return true;
    }
    return false;
}

bool symform_expr_is_number(const Symform_Expr *expr, double value) {
    return expr && expr->kind == SYMFORM_EXPR_NUMBER && expr->as.number == value;
}

/* ============================================================================
 * Display
 * ============================================================================ */

int symform_format_number(double value, char *buf, size_t buf_size) {
    if (isnan(value)) {
        return snprintf(buf, buf_size, "NaN");
    }
    if (isinf(value)) {
        return snprintf(buf, buf_size, value > 0 ? "Inf" : "-Inf");
    }

    /* Integral values print without a fractional part; -0 prints as 0 */
    if (value == floor(value)) {
        if (fabs(value) < 9.0e18) {
            return snprintf(buf, buf_size, "%lld", (long long)value);
        }
        return snprintf(buf, buf_size, "%.0f", value);
    }

    /* Shortest precision that reads back to the same double */
    char tmp[64];
    for (int precision = 1; precision <= 17; precision++) {
        snprintf(tmp, sizeof(tmp), "%.*g", precision, value);
        if (strtod(tmp, NULL) == value) {
            break;
        }
    }
    return snprintf(buf, buf_size, "%s", tmp);
}

const char *symform_binop_symbol(Symform_BinOpKind op) {
    switch (op) {
        case SYMFORM_BINOP_ADD: return "+";
        case SYMFORM_BINOP_SUB: return "-";
        case SYMFORM_BINOP_MUL: return "*";
        case SYMFORM_BINOP_DIV: return "/";
        case SYMFORM_BINOP_POW: return "^";
    }
    return "?";
}

void strbuf_append_expr(StrBuf *sb, const Symform_Expr *expr) {
    if (!expr) {
        strbuf_append(sb, "<null>");
        return;
    }

    switch (expr->kind) {
        case SYMFORM_EXPR_NUMBER: {
            int needed = symform_format_number(expr->as.number, NULL, 0);
            if (needed >= 0 && strbuf_reserve(sb, (size_t)needed)) {
                symform_format_number(expr->as.number, sb->data + sb->length, (size_t)needed + 1);
                sb->length += (size_t)needed;
            }
            break;
        }
        case SYMFORM_EXPR_SYMBOL:
            strbuf_append(sb, expr->as.symbol);
            break;
        case SYMFORM_EXPR_BINOP:
            strbuf_append(sb, "(");
            strbuf_append_expr(sb, expr->as.binop.left);
            strbuf_appendf(sb, " %s ", symform_binop_symbol(expr->as.binop.op));
            strbuf_append_expr(sb, expr->as.binop.right);
            strbuf_append(sb, ")");
            break;
        case SYMFORM_EXPR_UNOP:
            strbuf_append(sb, "(-");
            strbuf_append_expr(sb, expr->as.unop.operand);
            strbuf_append(sb, ")");
            break;
        case SYMFORM_EXPR_CALL:
            strbuf_append(sb, expr->as.call.name);
            strbuf_append(sb, "(");
            for (int i = 0; i < expr->as.call.arg_count; i++) {
                if (i > 0) strbuf_append(sb, ", ");
                strbuf_append_expr(sb, expr->as.call.args[i]);
            }
            strbuf_append(sb, ")");
            break;
    }
}

char *symform_expr_to_string(const Symform_Expr *expr) {
    StrBuf sb;
    strbuf_init(&sb);
    strbuf_append_expr(&sb, expr);
    return strbuf_take(&sb);
}

/* ============================================================================
 * Statements
 * ============================================================================ */

void symform_stmt_free(Symform_Stmt *stmt) {
    if (!stmt) return;

    switch (stmt->kind) {
        case SYMFORM_STMT_SYMBOLS:
            for (int i = 0; i < stmt->as.symbols.count; i++) {
                free(stmt->as.symbols.names[i]);
            }
            free(stmt->as.symbols.names);
            break;
        case SYMFORM_STMT_EXPRESSION:
        case SYMFORM_STMT_LOCAL:
            free(stmt->as.decl.name);
            symform_expr_free(stmt->as.decl.expr);
            break;
        case SYMFORM_STMT_ID_RULE:
            symform_expr_free(stmt->as.rule.pattern);
            symform_expr_free(stmt->as.rule.replacement);
            break;
        case SYMFORM_STMT_PRINT:
            free(stmt->as.print.name);
            break;
        case SYMFORM_STMT_SORT:
            break;
        case SYMFORM_STMT_EVAL:
            symform_expr_free(stmt->as.eval.expr);
            break;
    }
    free(stmt);
}

char *symform_stmt_to_string(const Symform_Stmt *stmt) {
    if (!stmt) return NULL;

    StrBuf sb;
    strbuf_init(&sb);

    switch (stmt->kind) {
        case SYMFORM_STMT_SYMBOLS:
            strbuf_append(&sb, "Symbols ");
            for (int i = 0; i < stmt->as.symbols.count; i++) {
                if (i > 0) strbuf_append(&sb, ", ");
                strbuf_append(&sb, stmt->as.symbols.names[i]);
            }
            break;
        case SYMFORM_STMT_EXPRESSION:
        case SYMFORM_STMT_LOCAL:
            strbuf_appendf(&sb, "%s %s = ",
                           stmt->kind == SYMFORM_STMT_LOCAL ? "Local" : "Expression",
                           stmt->as.decl.name);
            strbuf_append_expr(&sb, stmt->as.decl.expr);
            break;
        case SYMFORM_STMT_ID_RULE:
            strbuf_append(&sb, "id ");
            strbuf_append_expr(&sb, stmt->as.rule.pattern);
            strbuf_append(&sb, " = ");
            strbuf_append_expr(&sb, stmt->as.rule.replacement);
            break;
        case SYMFORM_STMT_PRINT:
            strbuf_appendf(&sb, "Print %s", stmt->as.print.name);
            break;
        case SYMFORM_STMT_SORT:
            strbuf_append(&sb, ".sort");
            break;
        case SYMFORM_STMT_EVAL:
            strbuf_append_expr(&sb, stmt->as.eval.expr);
            break;
    }

    return strbuf_take(&sb);
}

const char *symform_stmt_kind_name(Symform_StmtKind kind) {
    switch (kind) {
        case SYMFORM_STMT_SYMBOLS:    return "Symbols";
        case SYMFORM_STMT_EXPRESSION: return "Expression";
        case SYMFORM_STMT_LOCAL:      return "Local";
        case SYMFORM_STMT_ID_RULE:    return "id";
        case SYMFORM_STMT_PRINT:      return "Print";
        case SYMFORM_STMT_SORT:       return ".sort";
        case SYMFORM_STMT_EVAL:       return "Eval";
    }
    return "Unknown";
}
