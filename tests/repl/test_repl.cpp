/*
 * Symform REPL Host Tests
 *
 * Tests for line handling, host commands and script execution.
 */

#include <catch2/catch_test_macros.hpp>
#include "symform/symform.h"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

class ReplFixture {
public:
    Symform_Repl *repl = nullptr;
    Symform_ReplStatus last_status = SYMFORM_REPL_CONTINUE;

    ReplFixture() {
        repl = symform_repl_create(nullptr);
    }

    ~ReplFixture() {
        symform_repl_destroy(repl);
    }

    std::string exec(const char *line) {
        char *text = nullptr;
        last_status = symform_repl_execute_line(repl, line, &text);
        std::string result = text ? text : "<none>";
        free(text);
        return result;
    }
};

static std::string read_all(FILE *fp) {
    std::string contents;
    rewind(fp);
    char buf[256];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), fp)) > 0) {
        contents.append(buf, n);
    }
    return contents;
}

/* ============================================================================
 * Line Execution
 * ============================================================================ */

TEST_CASE_METHOD(ReplFixture, "REPL evaluates statements", "[repl][execute]") {
    REQUIRE(repl != nullptr);

    REQUIRE(exec("Symbols x, y") == "Symbols declared");
    REQUIRE(exec("Expression e = (x + 1) * (x - 1)") == "e = ((x + 1) * (x - 1))");
    REQUIRE(exec("id x = 2") == "Rule added: x -> 2");
    REQUIRE(exec(".sort") == "Sorted and rules applied");
    REQUIRE(exec("Print e") == "e = 3");
    REQUIRE(last_status == SYMFORM_REPL_CONTINUE);

    REQUIRE(exec("  2 + 3 * 4  \r\n") == "14");
}

TEST_CASE_METHOD(ReplFixture, "REPL empty and comment lines", "[repl][execute]") {
    REQUIRE(exec("") == "<none>");
    REQUIRE(last_status == SYMFORM_REPL_CONTINUE);
    REQUIRE(exec("   \t ") == "<none>");
    REQUIRE(last_status == SYMFORM_REPL_CONTINUE);
    REQUIRE(exec("* just a note") == "<none>");
    REQUIRE(last_status == SYMFORM_REPL_CONTINUE);
    REQUIRE(exec("  *") == "<none>");
    REQUIRE(last_status == SYMFORM_REPL_CONTINUE);
}

TEST_CASE_METHOD(ReplFixture, "REPL star without a space is a statement", "[repl][execute]") {
    REQUIRE(exec("*\tfoo") == "Error: Expected expression, got '*'");
    REQUIRE(last_status == SYMFORM_REPL_ERROR);
    REQUIRE(exec("*foo") == "Error: Expected expression, got '*'");
    REQUIRE(last_status == SYMFORM_REPL_ERROR);
    REQUIRE(exec("  * still a note") == "<none>");
    REQUIRE(last_status == SYMFORM_REPL_CONTINUE);
}

TEST_CASE_METHOD(ReplFixture, "REPL errors", "[repl][errors]") {
    SECTION("Parse error") {
        REQUIRE(exec("Expression = 1") == "Error: Expected identifier after Expression, got '='");
        REQUIRE(last_status == SYMFORM_REPL_ERROR);
    }

    SECTION("Evaluation error") {
        REQUIRE(exec("1 / 0") == "Error: Division by zero");
        REQUIRE(last_status == SYMFORM_REPL_ERROR);
    }

    SECTION("Undefined Print target") {
        REQUIRE(exec("Print nothing") == "Error: Expression 'nothing' not found");
    }

    SECTION("Session survives errors") {
        exec("Expression a = 4");
        exec("1 / 0");
        REQUIRE(exec("a * 2") == "8");
    }

    SECTION("NULL line") {
        REQUIRE(symform_repl_execute_line(repl, nullptr, nullptr) == SYMFORM_REPL_ERROR);
    }
}

/* ============================================================================
 * Host Commands
 * ============================================================================ */

TEST_CASE_METHOD(ReplFixture, "REPL host commands", "[repl][commands]") {
    SECTION("quit and exit") {
        REQUIRE(exec("quit") == "Goodbye!");
        REQUIRE(last_status == SYMFORM_REPL_QUIT);
        REQUIRE(exec("  exit ") == "Goodbye!");
        REQUIRE(last_status == SYMFORM_REPL_QUIT);
    }

    SECTION("help") {
        std::string help = exec("help");
        REQUIRE(last_status == SYMFORM_REPL_CONTINUE);
        REQUIRE(help == symform_repl_help_text());
        REQUIRE(help.find("Symbols x, y, z") != std::string::npos);
        REQUIRE(help.find(".sort") != std::string::npos);
    }

    SECTION("clear") {
        exec("Expression e = 1");
        exec("id x = 2");
        REQUIRE(exec("clear") == "Environment cleared");

        Symform_Session *session = symform_repl_get_session(repl);
        REQUIRE(symform_session_expression_count(session) == 0);
        REQUIRE(symform_session_rule_count(session) == 0);
        REQUIRE(exec("Print e") == "Error: Expression 'e' not found");
    }

    SECTION("Commands are whole-line and case-sensitive") {
        REQUIRE(exec("Quit") == "Quit");
        REQUIRE(last_status == SYMFORM_REPL_CONTINUE);
    }
}

/* ============================================================================
 * Streams
 * ============================================================================ */

TEST_CASE_METHOD(ReplFixture, "REPL runs a script stream", "[repl][stream]") {
    FILE *in = tmpfile();
    FILE *out = tmpfile();
    FILE *err = tmpfile();
    REQUIRE(in != nullptr);
    REQUIRE(out != nullptr);
    REQUIRE(err != nullptr);

    fputs("* scenario script\n"
          "Symbols x\n"
          "\n"
          "Expression e = x ^ 2\n"
          "Print f\n"
          "id x = 3\n"
          ".sort\n"
          "Print e\n"
          "quit\n"
          "Print e\n", in);
    rewind(in);

    int failures = symform_repl_run_stream(repl, in, out, err);
    REQUIRE(failures == 1);

    std::string output = read_all(out);
    REQUIRE(output == "Symbols declared\n"
                      "e = (x ^ 2)\n"
                      "Rule added: x -> 3\n"
                      "Sorted and rules applied\n"
                      "e = 9\n");
    REQUIRE(read_all(err) == "Error: Expression 'f' not found\n");

    fclose(in);
    fclose(out);
    fclose(err);
}

TEST_CASE("REPL timing output", "[repl][timing]") {
    Symform_Config config;
    symform_config_defaults(&config);
    config.show_timing = true;

    Symform_Repl *repl = symform_repl_create(&config);
    REQUIRE(repl != nullptr);

    FILE *in = tmpfile();
    FILE *out = tmpfile();
    fputs("2 + 2\n", in);
    rewind(in);

    REQUIRE(symform_repl_run_stream(repl, in, out, nullptr) == 0);
    std::string output = read_all(out);
    REQUIRE(output.find("4\n") == 0);
    REQUIRE(output.find(" ms)") != std::string::npos);
    REQUIRE(symform_repl_last_elapsed_ms(repl) >= 0.0);

    fclose(in);
    fclose(out);
    symform_repl_destroy(repl);
}

TEST_CASE("REPL passes verbose setting to the session", "[repl][config]") {
    Symform_Config config;
    symform_config_defaults(&config);
    config.verbose = true;

    Symform_Repl *repl = symform_repl_create(&config);
    REQUIRE(repl != nullptr);
    REQUIRE(symform_session_is_verbose(symform_repl_get_session(repl)));
    symform_repl_destroy(repl);
}
