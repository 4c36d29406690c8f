/**
 * Symform - Lexer
 *
 * Tokenizes statement text.
 *
 * Token rules:
 *   NUMBER      digit ( digit | "." )*      text that is not a valid decimal
 *                                           ("1.2.3") reads as 0
 *   IDENTIFIER  ( letter | "_" ) ( letter | digit | "_" )*
 *   keywords    Symbols Expression Local id Print (exact text)
 *   .sort       "." directly followed by the identifier "sort"; any other
 *               "." (and the identifier after it) is dropped
 *   comment     "* " at offset 0 of the input, up to the end of that line
 *   NEWLINE     "\n"; space, tab and CR are skipped
 *
 * Any other character is skipped. Lexing never reports an error.
 */

#include "engine_internal.h"
#include <stdlib.h>
#include <string.h>
#include <stdio.h>
#include <ctype.h>

/* ============================================================================
 * Lexer State
 * ============================================================================ */

typedef struct Lexer {
    const char *source;  /* Source text */
    const char *start;   /* Start of current token */
    const char *current; /* Current position */
    int line;
    int column;
    int start_line;
    int start_column;
    bool out_of_memory;
} Lexer;

typedef struct Keyword {
    const char *text;
    Symform_TokenType type;
} Keyword;

static const Keyword s_keywords[] = {
    { "Symbols",    SYMFORM_TOK_SYMBOLS },
    { "Expression", SYMFORM_TOK_EXPRESSION },
    { "Local",      SYMFORM_TOK_LOCAL },
    { "id",         SYMFORM_TOK_ID },
    { "Print",      SYMFORM_TOK_PRINT },
};

/* ============================================================================
 * Helper Functions
 * ============================================================================ */

static bool is_at_end(Lexer *lexer) {
    return *lexer->current == '\0';
}

static char advance(Lexer *lexer) {
    char c = *lexer->current++;
    if (c == '\n') {
        lexer->line++;
        lexer->column = 1;
    } else {
        lexer->column++;
    }
    return c;
}

static char peek(Lexer *lexer) {
    return *lexer->current;
}

static char peek_next(Lexer *lexer) {
    if (is_at_end(lexer)) return '\0';
    return lexer->current[1];
}

static bool is_ident_start(char c) {
    return isalpha((unsigned char)c) || c == '_';
}

static bool is_ident_char(char c) {
    return isalnum((unsigned char)c) || c == '_';
}

static void skip_whitespace(Lexer *lexer) {
    for (;;) {
        char c = peek(lexer);
        if (c == ' ' || c == '\t' || c == '\r') {
            advance(lexer);
        } else {
            return;
        }
    }
}

static void begin_token(Lexer *lexer) {
    lexer->start = lexer->current;
    lexer->start_line = lexer->line;
    lexer->start_column = lexer->column;
}

static Symform_Token make_token(Lexer *lexer, Symform_TokenType type) {
    Symform_Token token = {};
    token.type = type;
    token.start = lexer->start;
    token.length = (int)(lexer->current - lexer->start);
    token.line = lexer->start_line;
    token.column = lexer->start_column;
    return token;
}

/* ============================================================================
 * Token Scanning
 * ============================================================================ */

static void scan_identifier_chars(Lexer *lexer) {
    while (is_ident_char(peek(lexer))) {
        advance(lexer);
    }
}

static Symform_Token scan_number(Lexer *lexer) {
    while (isdigit((unsigned char)peek(lexer)) || peek(lexer) == '.') {
        advance(lexer);
    }

    Symform_Token token = make_token(lexer, SYMFORM_TOK_NUMBER);

    char *text = symform_strndup(token.start, (size_t)token.length);
    if (!text) {
        lexer->out_of_memory = true;
        return token;
    }
    char *end = NULL;
    double value = strtod(text, &end);
    token.number = (end && *end == '\0') ? value : 0.0;
    free(text);
    return token;
}

static Symform_Token scan_identifier(Lexer *lexer) {
    scan_identifier_chars(lexer);
    Symform_Token token = make_token(lexer, SYMFORM_TOK_IDENTIFIER);

    for (size_t i = 0; i < sizeof(s_keywords) / sizeof(s_keywords[0]); i++) {
        if (symform_token_text_equals(&token, s_keywords[i].text)) {
            token.type = s_keywords[i].type;
            break;
        }
    }
    return token;
}

/**
 * Scan the next token. Returns false (no token) for skipped input: comments,
 * dropped dot-directives and unknown characters.
 */
static bool scan_token(Lexer *lexer, Symform_Token *out) {
    /* Leading comment: "* " at the very start of the input */
    if (lexer->current == lexer->source && peek(lexer) == '*' && peek_next(lexer) == ' ') {
        while (!is_at_end(lexer) && peek(lexer) != '\n') {
            advance(lexer);
        }
        return false;
    }

    begin_token(lexer);
    char c = advance(lexer);

    if (c == '.') {
        const char *ident = lexer->current;
        scan_identifier_chars(lexer);
        size_t len = (size_t)(lexer->current - ident);
        if (len == 4 && strncmp(ident, "sort", 4) == 0) {
            *out = make_token(lexer, SYMFORM_TOK_SORT);
            return true;
        }
        return false;
    }

    if (isdigit((unsigned char)c)) {
        *out = scan_number(lexer);
        return true;
    }

    if (is_ident_start(c)) {
        *out = scan_identifier(lexer);
        return true;
    }

    Symform_TokenType type;
    switch (c) {
        case '+':  type = SYMFORM_TOK_PLUS; break;
        case '-':  type = SYMFORM_TOK_MINUS; break;
        case '*':  type = SYMFORM_TOK_STAR; break;
        case '/':  type = SYMFORM_TOK_SLASH; break;
        case '^':  type = SYMFORM_TOK_CARET; break;
        case '=':  type = SYMFORM_TOK_EQUALS; break;
        case '(':  type = SYMFORM_TOK_LPAREN; break;
        case ')':  type = SYMFORM_TOK_RPAREN; break;
        case '[':  type = SYMFORM_TOK_LBRACKET; break;
        case ']':  type = SYMFORM_TOK_RBRACKET; break;
        case ',':  type = SYMFORM_TOK_COMMA; break;
        case ';':  type = SYMFORM_TOK_SEMICOLON; break;
        case '\n': type = SYMFORM_TOK_NEWLINE; break;
        default:
            return false;
    }

    *out = make_token(lexer, type);
    return true;
}

/* ============================================================================
 * Public API
 * ============================================================================ */

Symform_Token *symform_tokenize(const char *source, int *out_count) {
    if (out_count) *out_count = 0;
    if (!source) return NULL;

    Lexer lexer = {};
    lexer.source = source;
    lexer.start = source;
    lexer.current = source;
    lexer.line = 1;
    lexer.column = 1;

    int capacity = 16;
    int count = 0;
    Symform_Token *tokens = SYMFORM_ALLOC_ARRAY(Symform_Token, capacity);
    if (!tokens) return NULL;

    for (;;) {
        skip_whitespace(&lexer);

        Symform_Token token = {};
        bool done = is_at_end(&lexer);
        if (done) {
            begin_token(&lexer);
            token = make_token(&lexer, SYMFORM_TOK_EOF);
        } else if (!scan_token(&lexer, &token)) {
            continue;
        }

        if (count == capacity) {
            Symform_Token *grown = SYMFORM_REALLOC(tokens, Symform_Token, capacity * 2);
            if (!grown) {
                free(tokens);
                return NULL;
            }
            tokens = grown;
            capacity *= 2;
        }
        tokens[count++] = token;

        if (done || lexer.out_of_memory) break;
    }

    if (lexer.out_of_memory) {
        free(tokens);
        return NULL;
    }

    if (out_count) *out_count = count;
    return tokens;
}

const char *symform_token_type_name(Symform_TokenType type) {
    switch (type) {
        case SYMFORM_TOK_EOF:        return "EOF";
        case SYMFORM_TOK_NEWLINE:    return "NEWLINE";
        case SYMFORM_TOK_NUMBER:     return "Number";
        case SYMFORM_TOK_IDENTIFIER: return "Identifier";
        case SYMFORM_TOK_PLUS:       return "'+'";
        case SYMFORM_TOK_MINUS:      return "'-'";
        case SYMFORM_TOK_STAR:       return "'*'";
        case SYMFORM_TOK_SLASH:      return "'/'";
        case SYMFORM_TOK_CARET:      return "'^'";
        case SYMFORM_TOK_EQUALS:     return "'='";
        case SYMFORM_TOK_LPAREN:     return "'('";
        case SYMFORM_TOK_RPAREN:     return "')'";
        case SYMFORM_TOK_LBRACKET:   return "'['";
        case SYMFORM_TOK_RBRACKET:   return "']'";
        case SYMFORM_TOK_COMMA:      return "','";
        case SYMFORM_TOK_SEMICOLON:  return "';'";
        case SYMFORM_TOK_SYMBOLS:    return "Symbols";
        case SYMFORM_TOK_EXPRESSION: return "Expression";
        case SYMFORM_TOK_LOCAL:      return "Local";
        case SYMFORM_TOK_ID:         return "id";
        case SYMFORM_TOK_PRINT:      return "Print";
        case SYMFORM_TOK_SORT:       return ".sort";
    }
    return "Unknown";
}

int symform_token_describe(const Symform_Token *token, char *buf, size_t buf_size) {
    if (!token) return snprintf(buf, buf_size, "<none>");

    switch (token->type) {
        case SYMFORM_TOK_NUMBER: {
            char num[SYMFORM_NUMBER_TEXT_MAX];
            symform_format_number(token->number, num, sizeof(num));
            return snprintf(buf, buf_size, "Number(%s)", num);
        }
        case SYMFORM_TOK_IDENTIFIER:
            return snprintf(buf, buf_size, "Identifier(%.*s)", token->length, token->start);
        default:
            return snprintf(buf, buf_size, "%s", symform_token_type_name(token->type));
    }
}

bool symform_token_text_equals(const Symform_Token *token, const char *text) {
    if (!token || !text) return false;
    size_t len = strlen(text);
    return (size_t)token->length == len && strncmp(token->start, text, len) == 0;
}
