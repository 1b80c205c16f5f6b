#include <gtest/gtest.h>

#include <limits>

#include "Interpreter.h"
#include "Lexer.h"
#include "Parser.h"
#include "SymbolTableBuilder.h"

using namespace spi;

namespace {
    std::unique_ptr<Program> parseSource(const std::string &source) {
        Lexer lexer(source);
        Parser parser(lexer);
        return parser.parse();
    }

    // Full pipeline: parse, check, evaluate.
    GlobalScope run(const std::string &source) {
        auto program = parseSource(source);
        SymbolTableBuilder builder;
        builder.build(*program);
        Interpreter interpreter;
        return interpreter.interpret(*program);
    }

    Number evaluateInto(const std::string &type, const std::string &expression) {
        GlobalScope globals = run("PROGRAM T; VAR r : " + type + "; BEGIN r := " + expression + " END.");
        return globals.at("R");
    }

    int64_t asInteger(const Number &n) {
        EXPECT_TRUE(isInteger(n)) << "expected an INTEGER value, got " << toString(n);
        return isInteger(n) ? std::get<int64_t>(n) : 0;
    }

    double asRealValue(const Number &n) {
        EXPECT_TRUE(isReal(n)) << "expected a REAL value, got " << toString(n);
        return toReal(n);
    }

    ErrorKind runErrorKind(const std::string &source) {
        try {
            run(source);
        } catch (const SpiError &e) {
            return e.kind();
        }
        ADD_FAILURE() << "expected a failure for: " << source;
        return ErrorKind::InvalidSyntax;
    }
}

TEST(Interpreter, AssignsIntegers) {
    GlobalScope globals = run("PROGRAM Test; VAR a, b : INTEGER; BEGIN a := 10; b := a + 5 * 2; END.");
    ASSERT_EQ(globals.size(), 2u);
    EXPECT_EQ(asInteger(globals.at("A")), 10);
    EXPECT_EQ(asInteger(globals.at("B")), 20);
}

TEST(Interpreter, CommentedProgramWithRealDivision) {
    GlobalScope globals = run("{ this is ignored } PROGRAM P; VAR x:REAL; BEGIN x := 7 / 2; END.");
    ASSERT_EQ(globals.size(), 1u);
    EXPECT_DOUBLE_EQ(asRealValue(globals.at("X")), 3.5);
}

TEST(Interpreter, FloatDivisionAlwaysYieldsReal) {
    Number n = evaluateInto("REAL", "6 / 2");
    EXPECT_DOUBLE_EQ(asRealValue(n), 3.0);
    EXPECT_EQ(toString(n), "3.0");
}

TEST(Interpreter, OperatorPrecedence) {
    EXPECT_DOUBLE_EQ(asRealValue(evaluateInto("REAL", "14 + 2 * 3 - 6 / 2")), 17.0);
    EXPECT_EQ(asInteger(evaluateInto("INTEGER", "2 + 3 * (10 - 4)")), 20);
}

TEST(Interpreter, UnaryChainsFollowSignParity) {
    EXPECT_EQ(asInteger(evaluateInto("INTEGER", "- - 5")), 5);
    EXPECT_EQ(asInteger(evaluateInto("INTEGER", "- + - 5")), 5);
    EXPECT_EQ(asInteger(evaluateInto("INTEGER", "- - - 5")), -5);
    EXPECT_EQ(asInteger(evaluateInto("INTEGER", "+ + 5")), 5);
    EXPECT_DOUBLE_EQ(asRealValue(evaluateInto("REAL", "-2.5")), -2.5);
}

TEST(Interpreter, IntegerDivisionFloors) {
    EXPECT_EQ(asInteger(evaluateInto("INTEGER", "7 DIV 2")), 3);
    EXPECT_EQ(asInteger(evaluateInto("INTEGER", "-7 DIV 2")), -4);
    EXPECT_EQ(asInteger(evaluateInto("INTEGER", "7 DIV -2")), -4);
    EXPECT_EQ(asInteger(evaluateInto("INTEGER", "-7 DIV -2")), 3);
    EXPECT_EQ(asInteger(evaluateInto("INTEGER", "-8 DIV 2")), -4);
}

TEST(Interpreter, IntegerDivisionOfRealsFloorsToReal) {
    EXPECT_DOUBLE_EQ(asRealValue(evaluateInto("REAL", "7.5 DIV 2")), 3.0);
    EXPECT_DOUBLE_EQ(asRealValue(evaluateInto("REAL", "-7.5 DIV 2")), -4.0);
}

TEST(Interpreter, MixedArithmeticPromotesToReal) {
    EXPECT_DOUBLE_EQ(asRealValue(evaluateInto("REAL", "1 + 0.5")), 1.5);
    EXPECT_DOUBLE_EQ(asRealValue(evaluateInto("REAL", "2.0 * 3")), 6.0);
    EXPECT_DOUBLE_EQ(asRealValue(evaluateInto("REAL", "10 - 0.25")), 9.75);
}

TEST(Interpreter, IntegerArithmeticMatchesDirectEvaluation) {
    struct Case {
        const char *expression;
        int64_t expected;
    };
    const Case cases[] = {
            {"(3 + 4) * 5 DIV 2", 17},
            {"-(10 - 3) DIV 2", -4},
            {"100 - 3 * (4 + 5) DIV 7", 97},
            {"2 * -3 - -4", -2},
            {"1 - 2 - 3 - 4", -8},
            {"((((1))))", 1},
            {"12 DIV 4 DIV 2", 1},
            {"5 * 5 * 5 - 125", 0},
    };
    for (const auto &c : cases) {
        EXPECT_EQ(asInteger(evaluateInto("INTEGER", c.expression)), c.expected) << c.expression;
    }
}

TEST(Interpreter, NestedCompoundsAndReassignment) {
    const std::string source =
            "PROGRAM Part10;\n"
            "VAR\n"
            "   number     : INTEGER;\n"
            "   a, b, c, x : INTEGER;\n"
            "   y          : REAL;\n"
            "\n"
            "BEGIN {Part10}\n"
            "   BEGIN\n"
            "      number := 2;\n"
            "      a := number;\n"
            "      b := 10 * a + 10 * number DIV 4;\n"
            "      c := a - - b\n"
            "   END;\n"
            "   x := 11;\n"
            "   x := x + 1;\n"
            "   y := 20 / 7 + 3.14;\n"
            "   { writeln('a = ', a); }\n"
            "END.  {Part10}\n";
    GlobalScope globals = run(source);
    EXPECT_EQ(asInteger(globals.at("NUMBER")), 2);
    EXPECT_EQ(asInteger(globals.at("A")), 2);
    EXPECT_EQ(asInteger(globals.at("B")), 25);
    EXPECT_EQ(asInteger(globals.at("C")), 27);
    EXPECT_EQ(asInteger(globals.at("X")), 12);
    EXPECT_DOUBLE_EQ(asRealValue(globals.at("Y")), 20.0 / 7.0 + 3.14);
}

TEST(Interpreter, ReadingUnassignedVariableFailsAtRuntime) {
    auto program = parseSource("PROGRAM P; VAR a, b : INTEGER; BEGIN b := a END.");
    SymbolTableBuilder builder;
    ASSERT_NO_THROW(builder.build(*program));

    Interpreter interpreter;
    try {
        interpreter.interpret(*program);
        FAIL() << "expected UndefinedVariable";
    } catch (const SpiError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::UndefinedVariable);
        EXPECT_EQ(e.token().text(), "A");
    }
}

TEST(Interpreter, DivisionByZeroFails) {
    EXPECT_EQ(runErrorKind("PROGRAM P; VAR r : INTEGER; BEGIN r := 1 DIV 0 END."), ErrorKind::DivisionByZero);
    EXPECT_EQ(runErrorKind("PROGRAM P; VAR r : REAL; BEGIN r := 1 / 0 END."), ErrorKind::DivisionByZero);
    EXPECT_EQ(runErrorKind("PROGRAM P; VAR r : REAL; BEGIN r := 1.5 / 0.0 END."), ErrorKind::DivisionByZero);
    EXPECT_EQ(runErrorKind("PROGRAM P; VAR r, z : INTEGER; BEGIN z := 3 - 3; r := 9 DIV z END."),
              ErrorKind::DivisionByZero);
}

TEST(Interpreter, IntegerOverflowFails) {
    EXPECT_EQ(runErrorKind("PROGRAM P; VAR r : INTEGER; BEGIN r := 9223372036854775807 + 1 END."),
              ErrorKind::IntegerOverflow);
    EXPECT_EQ(runErrorKind("PROGRAM P; VAR r : INTEGER; BEGIN r := -9223372036854775807 - 2 END."),
              ErrorKind::IntegerOverflow);
    EXPECT_EQ(runErrorKind("PROGRAM P; VAR r : INTEGER; BEGIN r := 4611686018427387904 * 2 END."),
              ErrorKind::IntegerOverflow);
    EXPECT_EQ(runErrorKind("PROGRAM P; VAR r : INTEGER; BEGIN r := -(-9223372036854775807 - 1) END."),
              ErrorKind::IntegerOverflow);
}

TEST(Interpreter, MostNegativeIntegerDividedByMinusOneFails) {
    auto program = parseSource(
            "PROGRAM P; VAR a, b : INTEGER; BEGIN a := -9223372036854775807 - 1; b := a div -1 END.");
    Interpreter interpreter;
    try {
        interpreter.interpret(*program);
        FAIL() << "expected IntegerOverflow";
    } catch (const SpiError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::IntegerOverflow);
        EXPECT_EQ(e.token().type, TokenType::INTEGER_DIV);
        EXPECT_EQ(e.token().lexeme, "div");
    }
    EXPECT_EQ(asInteger(interpreter.getGlobalScope().at("A")), std::numeric_limits<int64_t>::min());
}

TEST(Interpreter, ArithmeticAtTheIntegerLimits) {
    EXPECT_EQ(asInteger(evaluateInto("INTEGER", "-9223372036854775807 - 1")),
              std::numeric_limits<int64_t>::min());
    EXPECT_EQ(asInteger(evaluateInto("INTEGER", "(-9223372036854775807 - 1) DIV 1")),
              std::numeric_limits<int64_t>::min());
    EXPECT_EQ(asInteger(evaluateInto("INTEGER", "(-9223372036854775807 - 1) DIV 2")),
              std::numeric_limits<int64_t>::min() / 2);
    EXPECT_DOUBLE_EQ(asRealValue(evaluateInto("REAL", "9223372036854775807 + 1.0")), 9223372036854775808.0);
}

TEST(Interpreter, UndeclaredIdentifierStopsBeforeEvaluation) {
    EXPECT_EQ(runErrorKind("PROGRAM P; BEGIN y := 1; END."), ErrorKind::UndeclaredIdentifier);
    EXPECT_EQ(runErrorKind("PROGRAM P; VAR a : INTEGER; BEGIN a := 1 DIV 0; a := q END."),
              ErrorKind::UndeclaredIdentifier);
}

TEST(Interpreter, ProceduresAreNeverExecuted) {
    GlobalScope globals = run(
            "PROGRAM P;\n"
            "VAR a : INTEGER;\n"
            "PROCEDURE SetB;\n"
            "  VAR b : INTEGER;\n"
            "BEGIN b := 99 END;\n"
            "BEGIN a := 1 END.");
    EXPECT_EQ(globals.size(), 1u);
    EXPECT_EQ(globals.count("B"), 0u);
}

TEST(Interpreter, EachRunStartsWithAnEmptyStore) {
    auto first = parseSource("PROGRAM One; VAR a : INTEGER; BEGIN a := 1 END.");
    auto second = parseSource("PROGRAM Two; VAR b : INTEGER; BEGIN b := 2 END.");

    Interpreter interpreter;
    interpreter.interpret(*first);
    const GlobalScope &globals = interpreter.interpret(*second);
    EXPECT_EQ(globals.size(), 1u);
    EXPECT_EQ(globals.count("A"), 0u);

    Interpreter other;
    EXPECT_TRUE(other.getGlobalScope().empty());
}

TEST(Interpreter, SameProgramSameResult) {
    auto program = parseSource("PROGRAM P; VAR a : INTEGER; r : REAL; BEGIN a := 17 DIV 5; r := a / 4 END.");
    Interpreter interpreter;
    GlobalScope first = interpreter.interpret(*program);
    GlobalScope second = interpreter.interpret(*program);
    EXPECT_EQ(first, second);
}

TEST(Interpreter, GlobalScopeFormatting) {
    GlobalScope globals = run("PROGRAM P; VAR a : INTEGER; x : REAL; BEGIN a := 3; x := 1 / 4 END.");
    EXPECT_EQ(toString(globals), "{'A': 3, 'X': 0.25}");
}
