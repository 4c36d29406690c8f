#include "symform/error.h"
#include <stdarg.h>
#include <stddef.h>
#include <stdio.h>

/* Parser messages quote the offending token, which may be a long number */
#define SYMFORM_ERROR_BUFFER_SIZE 1024

#if defined(_MSC_VER)
    #define SYMFORM_THREAD_LOCAL __declspec(thread)
#else
    #define SYMFORM_THREAD_LOCAL thread_local
#endif

static SYMFORM_THREAD_LOCAL char s_last_error[SYMFORM_ERROR_BUFFER_SIZE] = {0};

/* Indexed by Symform_Result */
static const char *const s_result_names[] = {
    "Ok",
    "ParseError",
    "DivisionByZero",
    "UndefinedPrintTarget",
    "RecursionLimit",
    "OutOfMemory",
    "InvalidArgument",
};

const char *symform_result_name(Symform_Result result) {
    size_t index = (size_t)result;
    if (index >= sizeof(s_result_names) / sizeof(s_result_names[0])) {
        return "Unknown";
    }
    return s_result_names[index];
}

void symform_set_error(const char *fmt, ...) {
    if (!fmt) {
        s_last_error[0] = '\0';
        return;
    }

    va_list args;
    va_start(args, fmt);
    vsnprintf(s_last_error, sizeof(s_last_error), fmt, args);
    va_end(args);
}

const char *symform_get_last_error(void) {
    return s_last_error;
}

void symform_clear_error(void) {
    s_last_error[0] = '\0';
}

bool symform_has_error(void) {
    return s_last_error[0] != '\0';
}
