/*
 * Symform Logging Tests
 *
 * Tests for level parsing, filtering, callbacks and the log file format.
 */

#include <catch2/catch_test_macros.hpp>
#include "symform/log.h"
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

struct CapturedLog {
    Symform_LogLevel level;
    std::string subsystem;
    std::string message;
};

static void capture_callback(Symform_LogLevel level, const char *subsystem,
                             const char *message, void *userdata) {
    auto *logs = static_cast<std::vector<CapturedLog> *>(userdata);
    logs->push_back({level, subsystem ? subsystem : "", message ? message : ""});
}

/* ============================================================================
 * Level Parsing
 * ============================================================================ */

TEST_CASE("Log level from string", "[log][level]") {
    Symform_LogLevel level = SYMFORM_LOG_LEVEL_INFO;

    REQUIRE(symform_log_level_from_string("error", &level));
    REQUIRE(level == SYMFORM_LOG_LEVEL_ERROR);
    REQUIRE(symform_log_level_from_string("warn", &level));
    REQUIRE(level == SYMFORM_LOG_LEVEL_WARNING);
    REQUIRE(symform_log_level_from_string("WARNING", &level));
    REQUIRE(level == SYMFORM_LOG_LEVEL_WARNING);
    REQUIRE(symform_log_level_from_string("info", &level));
    REQUIRE(level == SYMFORM_LOG_LEVEL_INFO);
    REQUIRE(symform_log_level_from_string("Debug", &level));

    REQUIRE_FALSE(symform_log_level_from_string("verbose", &level));
    REQUIRE(level == SYMFORM_LOG_LEVEL_DEBUG);
    REQUIRE_FALSE(symform_log_level_from_string(nullptr, &level));
}

/* ============================================================================
 * Callbacks and Filtering
 * ============================================================================ */

TEST_CASE("Log callbacks receive filtered messages", "[log][callback]") {
    std::vector<CapturedLog> logs;
    Symform_LogLevel saved = symform_log_get_level();

    uint32_t handle = symform_log_add_callback(capture_callback, &logs);
    REQUIRE(handle != 0);

    SECTION("Messages at or above the level pass") {
        symform_log_set_level(SYMFORM_LOG_LEVEL_INFO);
        symform_log_info(SYMFORM_LOG_EVAL, "Evaluated %d statement(s)", 3);
        symform_log_debug(SYMFORM_LOG_EVAL, "hidden");

        REQUIRE(logs.size() == 1);
        REQUIRE(logs[0].level == SYMFORM_LOG_LEVEL_INFO);
        REQUIRE(logs[0].message == "Evaluated 3 statement(s)");
        REQUIRE(logs[0].subsystem == "Eval");
    }

    SECTION("Errors always pass") {
        symform_log_set_level(SYMFORM_LOG_LEVEL_ERROR);
        symform_log_warning(SYMFORM_LOG_RULES, "hidden");
        symform_log_error(SYMFORM_LOG_RULES, "shown");

        REQUIRE(logs.size() == 1);
        REQUIRE(logs[0].message == "shown");
    }

    SECTION("Removed callback stops receiving") {
        symform_log_remove_callback(handle);
        handle = 0;
        symform_log_error(SYMFORM_LOG_REPL, "not captured");
        REQUIRE(logs.empty());
    }

    if (handle) symform_log_remove_callback(handle);
    symform_log_set_level(saved);
}

/* ============================================================================
 * File Lifecycle
 * ============================================================================ */

TEST_CASE("Log file lifecycle", "[log][file]") {
    const char *path = "symform_test.log";
    remove(path);

    REQUIRE_FALSE(symform_log_open(nullptr));
    REQUIRE_FALSE(symform_log_open(""));
    REQUIRE_FALSE(symform_log_is_open());
    REQUIRE(symform_log_get_path() == nullptr);

    REQUIRE(symform_log_open(path));
    REQUIRE(symform_log_is_open());
    REQUIRE(strcmp(symform_log_get_path(), path) == 0);

    /* A second open keeps the current file */
    REQUIRE(symform_log_open("other.log"));
    REQUIRE(strcmp(symform_log_get_path(), path) == 0);

    symform_log_error(SYMFORM_LOG_REPL, "Expected expression, got EOF");
    symform_log_close();
    REQUIRE_FALSE(symform_log_is_open());
    REQUIRE(symform_log_get_path() == nullptr);

    FILE *fp = fopen(path, "r");
    REQUIRE(fp != nullptr);
    std::vector<std::string> lines;
    char line[512];
    while (fgets(line, sizeof(line), fp)) {
        lines.push_back(line);
    }
    fclose(fp);
    remove(path);

    REQUIRE(lines.size() == 3);
    REQUIRE(lines[0].find("--- symform log opened ") == 0);
    REQUIRE(lines[1].find("] ERROR   Repl   | Expected expression, got EOF\n") != std::string::npos);
    REQUIRE(lines[2].find("--- symform log closed ") == 0);
}
