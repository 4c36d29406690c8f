#ifndef SYMFORM_EXPR_H
#define SYMFORM_EXPR_H

#include <stdbool.h>
#include <stddef.h>

/**
 * Symform Data Model
 *
 * Expressions are immutable trees. Each node exclusively owns its children;
 * trees are never shared or aliased, so every transformation produces a new
 * tree and the caller frees both with symform_expr_free().
 *
 * Statements are produced once by the parser and consumed once by the
 * evaluator.
 */

/*============================================================================
 * Expressions
 *============================================================================*/

typedef enum Symform_ExprKind {
    SYMFORM_EXPR_NUMBER = 0,
    SYMFORM_EXPR_SYMBOL,
    SYMFORM_EXPR_BINOP,
    SYMFORM_EXPR_UNOP,
    SYMFORM_EXPR_CALL
} Symform_ExprKind;

typedef enum Symform_BinOpKind {
    SYMFORM_BINOP_ADD = 0,
    SYMFORM_BINOP_SUB,
    SYMFORM_BINOP_MUL,
    SYMFORM_BINOP_DIV,
    SYMFORM_BINOP_POW
} Symform_BinOpKind;

typedef enum Symform_UnOpKind {
    SYMFORM_UNOP_NEG = 0
} Symform_UnOpKind;

typedef struct Symform_Expr Symform_Expr;

struct Symform_Expr {
    Symform_ExprKind kind;
    union {
        double number;
        char *symbol;
        struct {
            Symform_BinOpKind op;
            Symform_Expr *left;
            Symform_Expr *right;
        } binop;
        struct {
            Symform_UnOpKind op;
            Symform_Expr *operand;
        } unop;
        struct {
            char *name;
            Symform_Expr **args;
            int arg_count;
        } call;
    } as;
};

/**
 * Create a number literal.
 * @return New node, or NULL on allocation failure
 */
Symform_Expr *symform_expr_number(double value);

/**
 * Create a symbol reference. The name is copied.
 */
Symform_Expr *symform_expr_symbol(const char *name);

/**
 * Create a binary operation. Takes ownership of left and right, which are
 * freed if the node cannot be allocated (or if either is NULL).
 */
Symform_Expr *symform_expr_binop(Symform_BinOpKind op, Symform_Expr *left, Symform_Expr *right);

/**
 * Create a unary operation. Takes ownership of operand.
 */
Symform_Expr *symform_expr_unop(Symform_UnOpKind op, Symform_Expr *operand);

/**
 * Create a function call. The name is copied; the args array and every
 * argument are owned by the new node (args may be NULL when arg_count is 0).
 */
Symform_Expr *symform_expr_call(const char *name, Symform_Expr **args, int arg_count);

/**
 * Free an expression tree. NULL is ignored.
 */
void symform_expr_free(Symform_Expr *expr);

/**
 * Deep copy.
 * @return New tree, or NULL on allocation failure
 */
Symform_Expr *symform_expr_clone(const Symform_Expr *expr);

/**
 * Exact structural equality (numbers compared with ==).
 */
bool symform_expr_equal(const Symform_Expr *a, const Symform_Expr *b);

/**
 * Check for a number literal with exactly the given value.
 */
bool symform_expr_is_number(const Symform_Expr *expr, double value);

/**
 * Render an expression: binary operations fully parenthesized "(a + b)",
 * negation "(-a)", calls "f(a, b)".
 * @return Newly allocated string (caller frees), or NULL on allocation failure
 */
char *symform_expr_to_string(const Symform_Expr *expr);

/* Buffer size that holds any formatted double (DBL_MAX prints 309 digits) */
#define SYMFORM_NUMBER_TEXT_MAX 328

/**
 * Format a number for display. Integral values print every digit without a
 * fraction, other values use the shortest round-tripping %g precision
 * (0.0000001 prints as 1e-07). Non-finite values print as NaN, Inf, -Inf.
 * @return Number of characters that would have been written (snprintf-style);
 *         pass buf = NULL, buf_size = 0 to size the output
 */
int symform_format_number(double value, char *buf, size_t buf_size);

const char *symform_binop_symbol(Symform_BinOpKind op);

/*============================================================================
 * Statements
 *============================================================================*/

typedef enum Symform_StmtKind {
    SYMFORM_STMT_SYMBOLS = 0,   /**< Symbols x, y, z */
    SYMFORM_STMT_EXPRESSION,    /**< Expression e = expr */
    SYMFORM_STMT_LOCAL,         /**< Local e = expr */
    SYMFORM_STMT_ID_RULE,       /**< id pattern = replacement */
    SYMFORM_STMT_PRINT,         /**< Print e */
    SYMFORM_STMT_SORT,          /**< .sort */
    SYMFORM_STMT_EVAL           /**< bare expression */
} Symform_StmtKind;

typedef struct Symform_Stmt {
    Symform_StmtKind kind;
    union {
        struct {
            char **names;
            int count;
        } symbols;
        struct {
            char *name;
            Symform_Expr *expr;
        } decl;              /* EXPRESSION and LOCAL */
        struct {
            Symform_Expr *pattern;
            Symform_Expr *replacement;
        } rule;
        struct {
            char *name;
        } print;
        struct {
            Symform_Expr *expr;
        } eval;
    } as;
} Symform_Stmt;

/**
 * Free a statement and everything it owns. NULL is ignored.
 */
void symform_stmt_free(Symform_Stmt *stmt);

/**
 * Render a statement back to source-like text.
 * @return Newly allocated string (caller frees)
 */
char *symform_stmt_to_string(const Symform_Stmt *stmt);

const char *symform_stmt_kind_name(Symform_StmtKind kind);

#endif /* SYMFORM_EXPR_H */
