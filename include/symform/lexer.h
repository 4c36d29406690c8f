#ifndef SYMFORM_LEXER_H
#define SYMFORM_LEXER_H

#include <stddef.h>
#include <stdbool.h>

/**
 * Symform Lexer
 *
 * Turns source text into a token array. Lexing never fails: characters
 * outside the language are skipped and malformed numbers become 0.
 *
 * Token texts point into the source buffer, which must outlive the tokens.
 */

typedef enum Symform_TokenType {
    SYMFORM_TOK_EOF = 0,
    SYMFORM_TOK_NEWLINE,

    /* Literals */
    SYMFORM_TOK_NUMBER,
    SYMFORM_TOK_IDENTIFIER,

    /* Operators */
    SYMFORM_TOK_PLUS,       /* + */
    SYMFORM_TOK_MINUS,      /* - */
    SYMFORM_TOK_STAR,       /* * */
    SYMFORM_TOK_SLASH,      /* / */
    SYMFORM_TOK_CARET,      /* ^ */
    SYMFORM_TOK_EQUALS,     /* = */

    /* Delimiters */
    SYMFORM_TOK_LPAREN,     /* ( */
    SYMFORM_TOK_RPAREN,     /* ) */
    SYMFORM_TOK_LBRACKET,   /* [ */
    SYMFORM_TOK_RBRACKET,   /* ] */
    SYMFORM_TOK_COMMA,      /* , */
    SYMFORM_TOK_SEMICOLON,  /* ; */

    /* Keywords */
    SYMFORM_TOK_SYMBOLS,
    SYMFORM_TOK_EXPRESSION,
    SYMFORM_TOK_LOCAL,
    SYMFORM_TOK_ID,
    SYMFORM_TOK_PRINT,
    SYMFORM_TOK_SORT        /* .sort */
} Symform_TokenType;

typedef struct Symform_Token {
    Symform_TokenType type;
    const char *start;   /* Pointer into source (not null-terminated) */
    int length;          /* Token length in bytes */
    int line;            /* 1-based */
    int column;          /* 1-based */
    double number;       /* Value for SYMFORM_TOK_NUMBER */
} Symform_Token;

/**
 * Tokenize a whole source buffer.
 *
 * @param source Null-terminated source text
 * @param out_count Receives the number of tokens, including the final EOF
 * @return Heap array of tokens (caller frees with free()), or NULL on
 *         allocation failure
 */
Symform_Token *symform_tokenize(const char *source, int *out_count);

/**
 * Get a printable name for a token type ("Number", "Identifier", "'+'", ...).
 */
const char *symform_token_type_name(Symform_TokenType type);

/**
 * Describe a token for diagnostics: Number(5), Identifier(x), '+', NEWLINE.
 * @return Number of characters that would have been written (snprintf-style)
 */
int symform_token_describe(const Symform_Token *token, char *buf, size_t buf_size);

/**
 * Check whether a token's text equals the given null-terminated string.
 */
bool symform_token_text_equals(const Symform_Token *token, const char *text);

#endif /* SYMFORM_LEXER_H */
