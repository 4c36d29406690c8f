/**
 * Symform - Statement Parser
 *
 * Recursive descent over the token array produced by symform_tokenize().
 *
 * Operator Precedence (lowest to highest):
 *   1. Additive (+, -)        - left-associative
 *   2. Multiplicative (*, /)  - left-associative
 *   3. Power (^)              - right-associative (2^3^2 = 2^9 = 512)
 *   4. Unary minus
 *   5. Primary                - numbers, symbols, calls, parentheses
 *
 * The first error aborts the statement; nothing is recovered.
 */

#include "engine_internal.h"
#include <stdlib.h>
#include <string.h>
#include <stdio.h>

/* Nesting limit for parenthesized/unary/power recursion */
#define SYMFORM_PARSER_MAX_DEPTH 512

/* ============================================================================
 * Parser Structure
 * ============================================================================ */

typedef struct Parser {
    Symform_Token *tokens;
    int count;
    int pos;
    const Symform_Token *current;
    int depth;

    char error[SYMFORM_NUMBER_TEXT_MAX + 256];
    bool has_error;
} Parser;

/* ============================================================================
 * Forward Declarations
 * ============================================================================ */

static Symform_Expr *parse_expression(Parser *p);
static Symform_Expr *parse_additive(Parser *p);
static Symform_Expr *parse_multiplicative(Parser *p);
static Symform_Expr *parse_power(Parser *p);
static Symform_Expr *parse_unary(Parser *p);
static Symform_Expr *parse_primary(Parser *p);

/* ============================================================================
 * Parser Helpers
 * ============================================================================ */

static void parser_advance(Parser *p) {
    /* The last token is always EOF; stay on it */
    if (p->pos < p->count - 1) {
        p->pos++;
    }
    p->current = &p->tokens[p->pos];
}

static bool parser_check(Parser *p, Symform_TokenType type) {
    return p->current->type == type;
}

static bool parser_match(Parser *p, Symform_TokenType type) {
    if (!parser_check(p, type)) return false;
    parser_advance(p);
    return true;
}

/**
 * Record "Expected <what>, got <current token>". Only the first error sticks.
 */
static void parser_error_expected(Parser *p, const char *what) {
    if (p->has_error) return;
    p->has_error = true;

    char got[SYMFORM_NUMBER_TEXT_MAX + 16];
    symform_token_describe(p->current, got, sizeof(got));
    snprintf(p->error, sizeof(p->error), "Expected %s, got %s", what, got);
}

static void parser_error(Parser *p, const char *message) {
    if (p->has_error) return;
    p->has_error = true;
    snprintf(p->error, sizeof(p->error), "%s", message);
}

static bool parser_consume(Parser *p, Symform_TokenType type) {
    if (parser_match(p, type)) return true;
    parser_error_expected(p, symform_token_type_name(type));
    return false;
}

static char *parser_copy_identifier(Parser *p) {
    char *name = symform_strndup(p->current->start, (size_t)p->current->length);
    if (!name) {
        parser_error(p, "Out of memory");
    }
    return name;
}

static Symform_Expr *parser_oom(Parser *p) {
    parser_error(p, "Out of memory");
    return NULL;
}

/* ============================================================================
 * Expression Parsing
 * ============================================================================ */

/**
 * Entry point for expressions. Enforces the nesting limit.
 */
static Symform_Expr *parse_expression(Parser *p) {
    if (p->depth >= SYMFORM_PARSER_MAX_DEPTH) {
        char message[96];
        snprintf(message, sizeof(message), "Expression too deeply nested (max depth %d)",
                 SYMFORM_PARSER_MAX_DEPTH);
        parser_error(p, message);
        return NULL;
    }
    p->depth++;
    Symform_Expr *result = parse_additive(p);
    p->depth--;
    return result;
}

static Symform_Expr *parse_additive(Parser *p) {
    Symform_Expr *left = parse_multiplicative(p);
    if (!left) return NULL;

    while (parser_check(p, SYMFORM_TOK_PLUS) || parser_check(p, SYMFORM_TOK_MINUS)) {
        Symform_BinOpKind op = parser_check(p, SYMFORM_TOK_PLUS) ? SYMFORM_BINOP_ADD
                                                                 : SYMFORM_BINOP_SUB;
        parser_advance(p);

        Symform_Expr *right = parse_multiplicative(p);
        if (!right) {
            symform_expr_free(left);
            return NULL;
        }
        left = symform_expr_binop(op, left, right);
        if (!left) return parser_oom(p);
    }

    return left;
}

static Symform_Expr *parse_multiplicative(Parser *p) {
    Symform_Expr *left = parse_power(p);
    if (!left) return NULL;

    while (parser_check(p, SYMFORM_TOK_STAR) || parser_check(p, SYMFORM_TOK_SLASH)) {
        Symform_BinOpKind op = parser_check(p, SYMFORM_TOK_STAR) ? SYMFORM_BINOP_MUL
                                                                 : SYMFORM_BINOP_DIV;
        parser_advance(p);

        Symform_Expr *right = parse_power(p);
        if (!right) {
            symform_expr_free(left);
            return NULL;
        }
        left = symform_expr_binop(op, left, right);
        if (!left) return parser_oom(p);
    }

    return left;
}

/**
 * Right-associative: the exponent recurses into parse_power.
 * Unary minus binds tighter than '^', so -2^2 is (-2)^2.
 */
static Symform_Expr *parse_power(Parser *p) {
    Symform_Expr *base = parse_unary(p);
    if (!base) return NULL;

    if (parser_match(p, SYMFORM_TOK_CARET)) {
        p->depth++;
        Symform_Expr *exponent = p->depth >= SYMFORM_PARSER_MAX_DEPTH ? NULL : parse_power(p);
        p->depth--;
        if (!exponent) {
            parser_error(p, "Expression too deeply nested");
            symform_expr_free(base);
            return NULL;
        }
        base = symform_expr_binop(SYMFORM_BINOP_POW, base, exponent);
        if (!base) return parser_oom(p);
    }

    return base;
}

static Symform_Expr *parse_unary(Parser *p) {
    if (parser_match(p, SYMFORM_TOK_MINUS)) {
        p->depth++;
        Symform_Expr *operand = p->depth >= SYMFORM_PARSER_MAX_DEPTH ? NULL : parse_unary(p);
        p->depth--;
        if (!operand) {
            parser_error(p, "Expression too deeply nested");
            return NULL;
        }
        Symform_Expr *neg = symform_expr_unop(SYMFORM_UNOP_NEG, operand);
        if (!neg) return parser_oom(p);
        return neg;
    }
    return parse_primary(p);
}

static Symform_Expr *parse_call(Parser *p, const char *name) {
    int capacity = 4;
    int argc = 0;
    Symform_Expr **args = NULL;

    if (!parser_check(p, SYMFORM_TOK_RPAREN)) {
        args = SYMFORM_ALLOC_ARRAY(Symform_Expr *, capacity);
        if (!args) return parser_oom(p);

        do {
            if (argc == capacity) {
                Symform_Expr **grown = SYMFORM_REALLOC(args, Symform_Expr *, capacity * 2);
                if (!grown) {
                    parser_error(p, "Out of memory");
                    break;
                }
                args = grown;
                capacity *= 2;
            }
            Symform_Expr *arg = parse_expression(p);
            if (!arg) break;
            args[argc++] = arg;
        } while (parser_match(p, SYMFORM_TOK_COMMA));
    }

    if (!p->has_error) {
        parser_consume(p, SYMFORM_TOK_RPAREN);
    }

    if (p->has_error) {
        for (int i = 0; i < argc; i++) {
            symform_expr_free(args[i]);
        }
        free(args);
        return NULL;
    }

    Symform_Expr *call = symform_expr_call(name, args, argc);
    if (!call) return parser_oom(p);
    return call;
}

static Symform_Expr *parse_primary(Parser *p) {
    if (parser_check(p, SYMFORM_TOK_NUMBER)) {
        double value = p->current->number;
        parser_advance(p);
        Symform_Expr *num = symform_expr_number(value);
        if (!num) return parser_oom(p);
        return num;
    }

    /* Symbol, or function call when '(' follows directly */
    if (parser_check(p, SYMFORM_TOK_IDENTIFIER)) {
        char *name = parser_copy_identifier(p);
        if (!name) return NULL;
        parser_advance(p);

        Symform_Expr *result;
        if (parser_match(p, SYMFORM_TOK_LPAREN)) {
            result = parse_call(p, name);
        } else {
            result = symform_expr_symbol(name);
            if (!result) parser_oom(p);
        }
        free(name);
        return result;
    }

    if (parser_match(p, SYMFORM_TOK_LPAREN)) {
        Symform_Expr *inner = parse_expression(p);
        if (!inner) return NULL;
        if (!parser_consume(p, SYMFORM_TOK_RPAREN)) {
            symform_expr_free(inner);
            return NULL;
        }
        return inner;
    }

    parser_error_expected(p, "expression");
    return NULL;
}

/* ============================================================================
 * Statement Parsing
 * ============================================================================ */

static Symform_Stmt *create_stmt(Parser *p, Symform_StmtKind kind) {
    Symform_Stmt *stmt = SYMFORM_ALLOC(Symform_Stmt);
    if (!stmt) {
        parser_error(p, "Out of memory");
        return NULL;
    }
    stmt->kind = kind;
    return stmt;
}

static Symform_Stmt *parse_symbols_decl(Parser *p) {
    parser_advance(p);  /* Symbols */

    Symform_Stmt *stmt = create_stmt(p, SYMFORM_STMT_SYMBOLS);
    if (!stmt) return NULL;

    int capacity = 0;
    do {
        if (!parser_check(p, SYMFORM_TOK_IDENTIFIER)) {
            parser_error_expected(p, "identifier");
            break;
        }
        if (stmt->as.symbols.count == capacity) {
            int new_capacity = capacity ? capacity * 2 : 4;
            char **grown = SYMFORM_REALLOC(stmt->as.symbols.names, char *, new_capacity);
            if (!grown) {
                parser_error(p, "Out of memory");
                break;
            }
            stmt->as.symbols.names = grown;
            capacity = new_capacity;
        }
        char *name = parser_copy_identifier(p);
        if (!name) break;
        stmt->as.symbols.names[stmt->as.symbols.count++] = name;
        parser_advance(p);
    } while (parser_match(p, SYMFORM_TOK_COMMA));

    if (p->has_error) {
        symform_stmt_free(stmt);
        return NULL;
    }
    return stmt;
}

/**
 * Expression and Local share one grammar: KEYWORD IDENT "=" expr
 */
static Symform_Stmt *parse_decl(Parser *p, Symform_StmtKind kind, const char *keyword) {
    parser_advance(p);  /* Expression / Local */

    if (!parser_check(p, SYMFORM_TOK_IDENTIFIER)) {
        char what[64];
        snprintf(what, sizeof(what), "identifier after %s", keyword);
        parser_error_expected(p, what);
        return NULL;
    }

    char *name = parser_copy_identifier(p);
    if (!name) return NULL;
    parser_advance(p);

    Symform_Expr *expr = NULL;
    if (parser_consume(p, SYMFORM_TOK_EQUALS)) {
        expr = parse_expression(p);
    }

    Symform_Stmt *stmt = expr ? create_stmt(p, kind) : NULL;
    if (!stmt) {
        free(name);
        symform_expr_free(expr);
        return NULL;
    }
    stmt->as.decl.name = name;
    stmt->as.decl.expr = expr;
    return stmt;
}

static Symform_Stmt *parse_id_rule(Parser *p) {
    parser_advance(p);  /* id */

    Symform_Expr *pattern = parse_expression(p);
    if (!pattern) return NULL;

    Symform_Expr *replacement = NULL;
    if (parser_consume(p, SYMFORM_TOK_EQUALS)) {
        replacement = parse_expression(p);
    }

    Symform_Stmt *stmt = replacement ? create_stmt(p, SYMFORM_STMT_ID_RULE) : NULL;
    if (!stmt) {
        symform_expr_free(pattern);
        symform_expr_free(replacement);
        return NULL;
    }
    stmt->as.rule.pattern = pattern;
    stmt->as.rule.replacement = replacement;
    return stmt;
}

static Symform_Stmt *parse_print(Parser *p) {
    parser_advance(p);  /* Print */

    if (!parser_check(p, SYMFORM_TOK_IDENTIFIER)) {
        parser_error_expected(p, "identifier after Print");
        return NULL;
    }

    char *name = parser_copy_identifier(p);
    if (!name) return NULL;
    parser_advance(p);

    Symform_Stmt *stmt = create_stmt(p, SYMFORM_STMT_PRINT);
    if (!stmt) {
        free(name);
        return NULL;
    }
    stmt->as.print.name = name;
    return stmt;
}

static Symform_Stmt *parse_statement(Parser *p) {
    while (parser_match(p, SYMFORM_TOK_NEWLINE)) {
        /* Skip blank lines */
    }

    Symform_Stmt *stmt = NULL;
    switch (p->current->type) {
        case SYMFORM_TOK_SYMBOLS:
            stmt = parse_symbols_decl(p);
            break;
        case SYMFORM_TOK_EXPRESSION:
            stmt = parse_decl(p, SYMFORM_STMT_EXPRESSION, "Expression");
            break;
        case SYMFORM_TOK_LOCAL:
            stmt = parse_decl(p, SYMFORM_STMT_LOCAL, "Local");
            break;
        case SYMFORM_TOK_ID:
            stmt = parse_id_rule(p);
            break;
        case SYMFORM_TOK_PRINT:
            stmt = parse_print(p);
            break;
        case SYMFORM_TOK_SORT:
            parser_advance(p);
            stmt = create_stmt(p, SYMFORM_STMT_SORT);
            break;
        case SYMFORM_TOK_EOF:
            parser_error(p, "End of input");
            return NULL;
        default: {
            Symform_Expr *expr = parse_expression(p);
            if (!expr) return NULL;
            stmt = create_stmt(p, SYMFORM_STMT_EVAL);
            if (!stmt) {
                symform_expr_free(expr);
                return NULL;
            }
            stmt->as.eval.expr = expr;
            break;
        }
    }

    if (stmt) {
        parser_match(p, SYMFORM_TOK_SEMICOLON);
    }
    return stmt;
}

static bool parser_init(Parser *p, const char *source) {
    memset(p, 0, sizeof(*p));
    p->tokens = symform_tokenize(source, &p->count);
    if (!p->tokens) {
        symform_set_error("%s", source ? "Out of memory" : "NULL source");
        return false;
    }
    p->current = &p->tokens[0];
    return true;
}

/* ============================================================================
 * Public API
 * ============================================================================ */

Symform_Stmt *symform_parse(const char *source) {
    Parser p;
    if (!parser_init(&p, source)) return NULL;

    Symform_Stmt *stmt = parse_statement(&p);
    if (!stmt) {
        symform_set_error("%s", p.error);
    }

    free(p.tokens);
    return stmt;
}

Symform_Expr *symform_parse_expr(const char *source) {
    Parser p;
    if (!parser_init(&p, source)) return NULL;

    Symform_Expr *expr = parse_expression(&p);
    if (!expr) {
        symform_set_error("%s", p.error);
    }

    free(p.tokens);
    return expr;
}
