#ifndef SYMFORM_H
#define SYMFORM_H

#include <stdlib.h>
#include <stdbool.h>

/**
 * Symform - symbolic expression engine
 *
 * Umbrella header. Pulls in the data model, the lexer/parser front end,
 * the evaluator session, the rule engine and the REPL host.
 */

#define SYMFORM_ALLOC(type) (type*)calloc(1, sizeof(type))
#define SYMFORM_ALLOC_ARRAY(type, count) (type*)calloc((count), sizeof(type))
#define SYMFORM_REALLOC(ptr, type, count) (type*)realloc((ptr), (count) * sizeof(type))

// Version info
#define SYMFORM_VERSION_MAJOR 0
#define SYMFORM_VERSION_MINOR 1
#define SYMFORM_VERSION_PATCH 0

/*============================================================================
 * Memory Ownership Conventions
 *============================================================================
 *
 * - Functions named *_create() return a handle released with *_destroy().
 * - Expression and statement trees are released with symform_expr_free()
 *   and symform_stmt_free(). A node exclusively owns its children.
 * - Functions returning char * (to_string, eval output) hand ownership of
 *   the string to the caller, who releases it with free().
 * - const char * returns point into internal storage and must not be freed.
 */

#include "symform/error.h"
#include "symform/log.h"
#include "symform/expr.h"
#include "symform/lexer.h"
#include "symform/parser.h"
#include "symform/session.h"
#include "symform/rules.h"
#include "symform/config.h"
#include "symform/repl.h"

#endif /* SYMFORM_H */
