#ifndef SYMFORM_PARSER_H
#define SYMFORM_PARSER_H

#include "symform/expr.h"

/**
 * Symform Parser
 *
 * Recursive descent with one token of lookahead.
 *
 * Grammar:
 *   statement  = symbols | expression | local | idrule | print | ".sort" | expr
 *   symbols    = "Symbols" IDENT ( "," IDENT )* [";"]
 *   expression = "Expression" IDENT "=" expr [";"]
 *   local      = "Local" IDENT "=" expr [";"]
 *   idrule     = "id" expr "=" expr [";"]
 *   print      = "Print" IDENT [";"]
 *   expr       = term ( ("+" | "-") term )*
 *   term       = power ( ("*" | "/") power )*
 *   power      = unary [ "^" power ]
 *   unary      = "-" unary | primary
 *   primary    = NUMBER | IDENT | IDENT "(" [ expr ( "," expr )* ] ")" | "(" expr ")"
 */

/**
 * Parse one statement.
 *
 * Leading newlines are skipped. Tokens after the statement (other than an
 * optional ';') are ignored.
 *
 * @param source Null-terminated source text
 * @return New statement (free with symform_stmt_free), or NULL on error with
 *         the message available from symform_get_last_error()
 */
Symform_Stmt *symform_parse(const char *source);

/**
 * Parse a single expression (convenience for hosts and tests).
 * @return New expression, or NULL on error (see symform_get_last_error())
 */
Symform_Expr *symform_parse_expr(const char *source);

#endif /* SYMFORM_PARSER_H */
