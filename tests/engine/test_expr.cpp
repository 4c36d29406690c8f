/*
 * Symform Expression Tree Tests
 *
 * Tests for node construction, ownership, comparison and display.
 */

#include <catch2/catch_test_macros.hpp>
#include "symform/expr.h"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <string>

static std::string number_text(double value) {
    char buf[SYMFORM_NUMBER_TEXT_MAX];
    symform_format_number(value, buf, sizeof(buf));
    return buf;
}

static std::string expr_text(const Symform_Expr *expr) {
    char *text = symform_expr_to_string(expr);
    std::string result = text ? text : "<null>";
    free(text);
    return result;
}

/* ============================================================================
 * Construction
 * ============================================================================ */

TEST_CASE("Expression construction", "[expr][lifecycle]") {
    SECTION("Leaves") {
        Symform_Expr *num = symform_expr_number(2.5);
        REQUIRE(num != nullptr);
        REQUIRE(num->kind == SYMFORM_EXPR_NUMBER);
        REQUIRE(num->as.number == 2.5);
        symform_expr_free(num);

        Symform_Expr *sym = symform_expr_symbol("alpha");
        REQUIRE(sym != nullptr);
        REQUIRE(strcmp(sym->as.symbol, "alpha") == 0);
        symform_expr_free(sym);
    }

    SECTION("Composite nodes take ownership") {
        Symform_Expr *sum = symform_expr_binop(SYMFORM_BINOP_ADD,
                                               symform_expr_symbol("a"),
                                               symform_expr_number(1.0));
        Symform_Expr *neg = symform_expr_unop(SYMFORM_UNOP_NEG, sum);
        REQUIRE(neg != nullptr);
        REQUIRE(expr_text(neg) == "(-(a + 1))");
        symform_expr_free(neg);
    }

    SECTION("Missing child fails and frees the other") {
        Symform_Expr *node = symform_expr_binop(SYMFORM_BINOP_MUL, symform_expr_symbol("a"), nullptr);
        REQUIRE(node == nullptr);
        REQUIRE(symform_expr_unop(SYMFORM_UNOP_NEG, nullptr) == nullptr);
        REQUIRE(symform_expr_symbol(nullptr) == nullptr);
    }

    SECTION("Calls") {
        Symform_Expr **args = (Symform_Expr **)calloc(2, sizeof(Symform_Expr *));
        args[0] = symform_expr_symbol("a");
        args[1] = symform_expr_number(3.0);
        Symform_Expr *call = symform_expr_call("f", args, 2);
        REQUIRE(call != nullptr);
        REQUIRE(expr_text(call) == "f(a, 3)");
        symform_expr_free(call);

        Symform_Expr *empty = symform_expr_call("g", nullptr, 0);
        REQUIRE(expr_text(empty) == "g()");
        symform_expr_free(empty);
    }

    symform_expr_free(nullptr);
}

/* ============================================================================
 * Clone and Equality
 * ============================================================================ */

TEST_CASE("Expression clone and equality", "[expr][compare]") {
    Symform_Expr **args = (Symform_Expr **)calloc(1, sizeof(Symform_Expr *));
    args[0] = symform_expr_symbol("x");
    Symform_Expr *original = symform_expr_binop(
        SYMFORM_BINOP_POW,
        symform_expr_call("sin", args, 1),
        symform_expr_unop(SYMFORM_UNOP_NEG, symform_expr_number(2.0)));
    REQUIRE(original != nullptr);

    Symform_Expr *copy = symform_expr_clone(original);
    REQUIRE(copy != nullptr);
    REQUIRE(copy != original);
    REQUIRE(symform_expr_equal(original, copy));
    REQUIRE(expr_text(copy) == "(sin(x) ^ (-2))");

    SECTION("Deep copy is independent") {
        free(copy->as.binop.left->as.call.args[0]->as.symbol);
        copy->as.binop.left->as.call.args[0]->as.symbol = strdup("y");
        REQUIRE_FALSE(symform_expr_equal(original, copy));
        REQUIRE(expr_text(original) == "(sin(x) ^ (-2))");
    }

    SECTION("Different operators are unequal") {
        copy->as.binop.op = SYMFORM_BINOP_MUL;
        REQUIRE_FALSE(symform_expr_equal(original, copy));
    }

    symform_expr_free(copy);
    symform_expr_free(original);

    REQUIRE(symform_expr_equal(nullptr, nullptr));
    REQUIRE(symform_expr_clone(nullptr) == nullptr);
}

/* ============================================================================
 * Number Display
 * ============================================================================ */

TEST_CASE("Number formatting", "[expr][format]") {
    SECTION("Integral values") {
        REQUIRE(number_text(3.0) == "3");
        REQUIRE(number_text(-12.0) == "-12");
        REQUIRE(number_text(-0.0) == "0");
        REQUIRE(number_text(1e20) == "100000000000000000000");
    }

    SECTION("Fractions use the shortest round-trip form") {
        REQUIRE(number_text(0.5) == "0.5");
        REQUIRE(number_text(-2.25) == "-2.25");
        REQUIRE(number_text(0.1) == "0.1");
        REQUIRE(number_text(0.1 + 0.2) == "0.30000000000000004");
    }

    SECTION("Small magnitudes use exponent notation") {
        REQUIRE(number_text(0.0000001) == "1e-07");
        REQUIRE(number_text(-0.0000001) == "-1e-07");
        REQUIRE(number_text(1.5e-10) == "1.5e-10");
        REQUIRE(number_text(0.0001) == "0.0001");
    }

    SECTION("Non-finite values") {
        REQUIRE(number_text(std::numeric_limits<double>::quiet_NaN()) == "NaN");
        REQUIRE(number_text(std::numeric_limits<double>::infinity()) == "Inf");
        REQUIRE(number_text(-std::numeric_limits<double>::infinity()) == "-Inf");
    }
}

TEST_CASE("Large integral numbers print every digit", "[expr][format]") {
    char expected[SYMFORM_NUMBER_TEXT_MAX];
    snprintf(expected, sizeof(expected), "%.0f", 1e70);
    REQUIRE(strlen(expected) == 71);

    SECTION("Sizing call reports the full length") {
        REQUIRE(symform_format_number(1e70, nullptr, 0) == 71);
        REQUIRE(number_text(1e70) == expected);
    }

    SECTION("Display inside an expression is not truncated") {
        Symform_Expr *sum = symform_expr_binop(SYMFORM_BINOP_ADD,
                                               symform_expr_symbol("x"),
                                               symform_expr_number(1e70));
        REQUIRE(expr_text(sum) == std::string("(x + ") + expected + ")");
        symform_expr_free(sum);
    }

    SECTION("Largest finite double") {
        double max = std::numeric_limits<double>::max();
        std::string text = number_text(max);
        REQUIRE(text.size() == 309);
        REQUIRE(strtod(text.c_str(), nullptr) == max);
        REQUIRE(number_text(-max).size() == 310);
    }
}

TEST_CASE("Operator symbols", "[expr][format]") {
    REQUIRE(strcmp(symform_binop_symbol(SYMFORM_BINOP_ADD), "+") == 0);
    REQUIRE(strcmp(symform_binop_symbol(SYMFORM_BINOP_SUB), "-") == 0);
    REQUIRE(strcmp(symform_binop_symbol(SYMFORM_BINOP_MUL), "*") == 0);
    REQUIRE(strcmp(symform_binop_symbol(SYMFORM_BINOP_DIV), "/") == 0);
    REQUIRE(strcmp(symform_binop_symbol(SYMFORM_BINOP_POW), "^") == 0);
}
