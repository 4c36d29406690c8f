/*
 * Symform Session Tests
 *
 * Tests for statement evaluation and the session tables.
 */

#include <catch2/catch_test_macros.hpp>
#include "symform/symform.h"
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

class SessionFixture {
public:
    Symform_Session *session = nullptr;
    Symform_Result last_result = SYMFORM_OK;

    SessionFixture() {
        session = symform_session_create(nullptr);
    }

    ~SessionFixture() {
        symform_session_destroy(session);
    }

    /* Parse and evaluate one statement; returns display text or error message */
    std::string run(const char *source) {
        Symform_Stmt *stmt = symform_parse(source);
        if (!stmt) {
            last_result = SYMFORM_ERR_PARSE;
            return symform_get_last_error();
        }

        char *text = nullptr;
        last_result = symform_session_eval(session, stmt, &text);
        symform_stmt_free(stmt);

        std::string result = last_result == SYMFORM_OK ? (text ? text : "")
                                                        : symform_session_get_error(session);
        free(text);
        return result;
    }

    std::string stored(const char *name) {
        const Symform_Expr *expr = symform_session_get_expression(session, name);
        if (!expr) return "<none>";
        char *text = symform_expr_to_string(expr);
        std::string result = text ? text : "";
        free(text);
        return result;
    }
};

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

TEST_CASE("Session creation and destruction", "[session][lifecycle]") {
    Symform_Session *session = symform_session_create(nullptr);
    REQUIRE(session != nullptr);
    REQUIRE(symform_session_symbol_count(session) == 0);
    REQUIRE(symform_session_expression_count(session) == 0);
    REQUIRE(symform_session_rule_count(session) == 0);
    REQUIRE_FALSE(symform_session_is_verbose(session));
    symform_session_destroy(session);

    Symform_SessionConfig config = SYMFORM_SESSION_CONFIG_DEFAULT;
    config.verbose = true;
    session = symform_session_create(&config);
    REQUIRE(symform_session_is_verbose(session));
    symform_session_destroy(session);

    /* NULL-safe */
    symform_session_destroy(nullptr);
}

/* ============================================================================
 * Statements
 * ============================================================================ */

TEST_CASE_METHOD(SessionFixture, "Session end-to-end scenario", "[session][scenario]") {
    REQUIRE(run("Symbols x, y") == "Symbols declared");
    REQUIRE(run("Expression e = (x + 1) * (x - 1)") == "e = ((x + 1) * (x - 1))");
    REQUIRE(run("id x = 2") == "Rule added: x -> 2");
    REQUIRE(run(".sort") == "Sorted and rules applied");
    REQUIRE(run("Print e") == "e = 3");
}

TEST_CASE_METHOD(SessionFixture, "Session Symbols declaration", "[session][symbols]") {
    REQUIRE(run("Symbols x, y") == "Symbols declared");
    REQUIRE(symform_session_symbol_count(session) == 2);
    REQUIRE(symform_session_has_symbol(session, "x"));
    REQUIRE(symform_session_has_symbol(session, "y"));
    REQUIRE_FALSE(symform_session_has_symbol(session, "z"));

    SECTION("Redeclaration does not duplicate") {
        REQUIRE(run("Symbols y, z") == "Symbols declared");
        REQUIRE(symform_session_symbol_count(session) == 3);
    }

    SECTION("Declared symbols are not bound names") {
        REQUIRE(run("x + 1") == "(x + 1)");
    }
}

TEST_CASE_METHOD(SessionFixture, "Session Expression and Local", "[session][decl]") {
    SECTION("Stored expression is simplified") {
        REQUIRE(run("Expression f = 2 * 3 + x * 1") == "f = (6 + x)");
        REQUIRE(stored("f") == "(6 + x)");
    }

    SECTION("Local behaves like Expression") {
        REQUIRE(run("Local a = 4 * 2") == "a = 8");
        REQUIRE(run("a + 1") == "9");
    }

    SECTION("Earlier definitions are substituted") {
        run("Expression a = 5");
        REQUIRE(run("Expression b = a * x") == "b = (5 * x)");
    }

    SECTION("Redefinition replaces the entry") {
        run("Expression a = 1");
        run("Expression a = 2");
        REQUIRE(symform_session_expression_count(session) == 1);
        REQUIRE(run("Print a") == "a = 2");
    }

    SECTION("Iteration by index") {
        run("Expression p = 1");
        run("Expression q = 2");
        REQUIRE(strcmp(symform_session_expression_name(session, 0), "p") == 0);
        REQUIRE(strcmp(symform_session_expression_name(session, 1), "q") == 0);
        REQUIRE(symform_session_expression_name(session, 2) == nullptr);
    }
}

TEST_CASE_METHOD(SessionFixture, "Session rules are stored in order", "[session][rules]") {
    REQUIRE(run("id x * y = z") == "Rule added: (x * y) -> z");
    REQUIRE(run("id z = 0") == "Rule added: z -> 0");
    REQUIRE(symform_session_rule_count(session) == 2);

    char *pattern = symform_expr_to_string(symform_session_rule_pattern(session, 0));
    char *replacement = symform_expr_to_string(symform_session_rule_replacement(session, 0));
    REQUIRE(std::string(pattern) == "(x * y)");
    REQUIRE(std::string(replacement) == "z");
    free(pattern);
    free(replacement);

    pattern = symform_expr_to_string(symform_session_rule_pattern(session, 1));
    replacement = symform_expr_to_string(symform_session_rule_replacement(session, 1));
    REQUIRE(std::string(pattern) == "z");
    REQUIRE(std::string(replacement) == "0");
    free(pattern);
    free(replacement);

    REQUIRE(symform_session_rule_pattern(session, 2) == nullptr);
    REQUIRE(symform_session_rule_replacement(session, -1) == nullptr);

    SECTION("Rules are not applied before .sort") {
        REQUIRE(run("Expression g = z + 1") == "g = (z + 1)");
    }
}

TEST_CASE_METHOD(SessionFixture, "Session bare expressions", "[session][eval]") {
    REQUIRE(run("2 + 3 * 4") == "14");
    REQUIRE(run("(2 + 3) * 4") == "20");
    REQUIRE(run("2 ^ 3 ^ 2") == "512");

    SECTION("Evaluation does not touch the tables") {
        run("Expression e = x");
        run("e * 2");
        run("y + 1");
        REQUIRE(symform_session_expression_count(session) == 1);
        REQUIRE(stored("e") == "x");
        REQUIRE(symform_session_symbol_count(session) == 0);
    }
}

/* ============================================================================
 * Errors
 * ============================================================================ */

TEST_CASE_METHOD(SessionFixture, "Session Print of an undefined name", "[session][errors]") {
    run("Expression e = 1");
    REQUIRE(run("Print zz") == "Expression 'zz' not found");
    REQUIRE(last_result == SYMFORM_ERR_UNDEFINED_PRINT_TARGET);
    REQUIRE(symform_session_expression_count(session) == 1);
    REQUIRE(stored("zz") == "<none>");
}

TEST_CASE_METHOD(SessionFixture, "Session failed statements leave tables unchanged", "[session][errors]") {
    run("Expression e = x + 1");

    SECTION("Division by zero") {
        REQUIRE(run("Expression e = 1 / 0") == "Division by zero");
        REQUIRE(last_result == SYMFORM_ERR_DIVISION_BY_ZERO);
        REQUIRE(stored("e") == "(x + 1)");
    }

    SECTION("Division by zero in a new entry") {
        run("Expression d = 3 / (1 - 1)");
        REQUIRE(symform_session_expression_count(session) == 1);
    }

    SECTION("Error message is reset by the next statement") {
        run("1 / 0");
        REQUIRE(run("2") == "2");
        REQUIRE(strlen(symform_session_get_error(session)) == 0);
    }
}

TEST_CASE_METHOD(SessionFixture, "Session self-referential definitions", "[session][errors]") {
    REQUIRE(run("Expression e = e + 1") == "e = (e + 1)");
    REQUIRE(run("Expression e = e + 1") == "Recursive definition of 'e'");
    REQUIRE(last_result == SYMFORM_ERR_RECURSION_LIMIT);
    REQUIRE(stored("e") == "(e + 1)");

    REQUIRE(run("e * 2") == "Recursive definition of 'e'");
}

TEST_CASE("Session rejects NULL input", "[session][errors]") {
    Symform_Session *session = symform_session_create(nullptr);
    char *text = nullptr;

    REQUIRE(symform_session_eval(session, nullptr, &text) == SYMFORM_ERR_INVALID_ARGUMENT);
    REQUIRE(text == nullptr);
    REQUIRE(symform_session_eval(nullptr, nullptr, &text) == SYMFORM_ERR_INVALID_ARGUMENT);

    Symform_Expr *out = nullptr;
    REQUIRE(symform_session_simplify(session, nullptr, &out) == SYMFORM_ERR_INVALID_ARGUMENT);
    REQUIRE(out == nullptr);

    symform_session_destroy(session);
}

/* ============================================================================
 * Clear and Verbose Logging
 * ============================================================================ */

TEST_CASE_METHOD(SessionFixture, "Session clear", "[session][clear]") {
    run("Symbols x");
    run("Expression e = x");
    run("id x = 1");

    symform_session_clear(session);
    REQUIRE(symform_session_symbol_count(session) == 0);
    REQUIRE(symform_session_expression_count(session) == 0);
    REQUIRE(symform_session_rule_count(session) == 0);
    REQUIRE(run("Print e") == "Expression 'e' not found");
}

static void collect_messages(Symform_LogLevel level, const char *subsystem,
                             const char *message, void *userdata) {
    (void)level;
    (void)subsystem;
    static_cast<std::vector<std::string> *>(userdata)->push_back(message);
}

TEST_CASE_METHOD(SessionFixture, "Session verbose mode logs evaluation", "[session][verbose]") {
    std::vector<std::string> messages;
    Symform_LogLevel saved = symform_log_get_level();
    symform_log_set_level(SYMFORM_LOG_LEVEL_DEBUG);
    uint32_t handle = symform_log_add_callback(collect_messages, &messages);

    run("Expression e = 1");
    REQUIRE(messages.empty());

    symform_session_set_verbose(session, true);
    run("Expression e = 2");
    REQUIRE_FALSE(messages.empty());
    REQUIRE(messages[0].find("Evaluating Expression") != std::string::npos);

    symform_log_remove_callback(handle);
    symform_log_set_level(saved);
}
