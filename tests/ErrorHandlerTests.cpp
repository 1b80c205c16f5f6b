#include <gtest/gtest.h>

#include <sstream>

#include "CollectingErrorHandler.h"
#include "ErrorHandler.h"
#include "Lexer.h"
#include "Logger.h"

using namespace spi;

namespace {
    SpiError lexFailure(const std::string &source) {
        Lexer lexer(source);
        try {
            while (lexer.getNextToken().type != TokenType::EOF_TOKEN) {}
        } catch (const SpiError &e) {
            return e;
        }
        ADD_FAILURE() << "expected a lexer failure for: " << source;
        return SpiError(ErrorKind::InvalidSyntax, Token{}, "no failure");
    }
}

TEST(ErrorHandler, ReportsKindLocationAndCaret) {
    const std::string source = "BEGIN\n  x @ 1\nEND.";
    std::ostringstream out;
    ErrorHandler handler(source, out, false);

    handler.report(lexFailure(source));

    std::string expected =
            "[Line 2] Error at '@': InvalidCharacter: Unexpected character '@'.\n"
            " 2 |   x @ 1\n"
            "   |     ^\n";
    EXPECT_EQ(out.str(), expected);
    EXPECT_TRUE(handler.hadError());

    handler.clearError();
    EXPECT_FALSE(handler.hadError());
}

TEST(ErrorHandler, CaretSpansTheWholeLexeme) {
    const std::string source = "a := total";
    std::ostringstream out;
    ErrorHandler handler(source, out, false);

    Token token{TokenType::ID, "total", std::string("TOTAL"), 1, 6};
    handler.report(token, "Symbol (identifier) not found 'TOTAL'.");

    EXPECT_NE(out.str().find("   |      ^^^^^\n"), std::string::npos);
}

TEST(ErrorHandler, EndOfInputIsReportedAtEnd) {
    std::ostringstream out;
    ErrorHandler handler("BEGIN END", out, false);

    Token eof{TokenType::EOF_TOKEN, "", std::monostate{}, 1, 10};
    handler.report(eof, "Invalid syntax.");

    EXPECT_EQ(out.str().rfind("[Line 1] Error at end: Invalid syntax.\n", 0), 0u);
}

TEST(ErrorHandler, ColorCanBeSwitchedOn) {
    std::ostringstream out;
    ErrorHandler handler("x", out, true);
    handler.report(Token{TokenType::ID, "x", std::string("X"), 1, 1}, "bad");
    EXPECT_NE(out.str().find("\033[31m"), std::string::npos);
}

TEST(ErrorHandler, NotesDoNotCountAsErrors) {
    std::ostringstream out;
    ErrorHandler handler("VAR a : INTEGER;", out, false);
    handler.note(Token{TokenType::ID, "a", std::string("A"), 1, 5}, "'A' was declared here.");

    EXPECT_FALSE(handler.hadError());
    EXPECT_NE(out.str().find("[Line 1] note: 'A' was declared here."), std::string::npos);
}

TEST(CollectingErrorHandler, RecordsZeroIndexedDiagnostics) {
    const std::string source = "BEGIN { open";
    CollectingErrorHandler handler(source);
    handler.report(lexFailure(source));

    ASSERT_EQ(handler.get_diagnostics().size(), 1u);
    const Diagnostic &d = handler.get_diagnostics()[0];
    EXPECT_EQ(d.range.start_line, 0);
    EXPECT_EQ(d.range.start_char, 6);
    EXPECT_EQ(d.range.end_char, 7);
    EXPECT_EQ(d.severity, DiagnosticSeverity::Error);
    ASSERT_TRUE(d.kind.has_value());
    EXPECT_EQ(*d.kind, ErrorKind::UnterminatedComment);
    EXPECT_TRUE(handler.hadError());
}

TEST(CollectingErrorHandler, NotesAreInformational) {
    CollectingErrorHandler handler("a");
    handler.note(Token{TokenType::ID, "a", std::string("A"), 1, 1}, "hint");
    handler.report(Token{TokenType::ID, "a", std::string("A"), 1, 1}, "plain report");

    ASSERT_EQ(handler.get_diagnostics().size(), 2u);
    EXPECT_EQ(handler.get_diagnostics()[0].severity, DiagnosticSeverity::Information);
    EXPECT_FALSE(handler.get_diagnostics()[1].kind.has_value());
}

TEST(Logger, BuffersPipelineMessages) {
    Logger::instance().clear();
    Lexer("BEGIN END").scanTokens();

    std::string log = Logger::instance().contents();
    EXPECT_NE(log.find("lexer: scanned 3 tokens"), std::string::npos);

    std::ostringstream dumped;
    Logger::instance().dump(dumped);
    EXPECT_EQ(dumped.str().rfind("--- SPI LOG DUMP ---\n", 0), 0u);

    Logger::instance().clear();
    EXPECT_TRUE(Logger::instance().contents().empty());
}
