#pragma once

#include <vector>
#include <memory>
#include <string>
#include "Token.h"
#include "Lexer.h"
#include "Expr.h"
#include "Stmt.h"
#include "Errors.h"

namespace spi {

    /**
     * @class Parser
     * @brief Recursive-descent parser with one token of lookahead, pulled from
     *        the Lexer on demand. The first syntax error aborts the parse.
     */
    class Parser {
    public:
        // Deepest allowed chain of unary prefixes, parentheses, nested
        // BEGIN blocks and nested procedures. Deeper input fails with InvalidSyntax.
        static constexpr int MAX_NESTING_DEPTH = 512;

        explicit Parser(Lexer &lexer);

        // program followed by EOF. Throws SpiError on the first error.
        std::unique_ptr<Program> parse();

    private:
        // Grammar rule methods
        std::unique_ptr<Program> program();
        std::unique_ptr<Block> block();
        std::vector<std::unique_ptr<Stmt>> declarations();
        std::vector<std::unique_ptr<Stmt>> varDeclaration();
        Token typeSpec();
        std::unique_ptr<Stmt> procedureDeclaration();
        std::unique_ptr<Compound> compoundStatement();
        std::vector<std::unique_ptr<Stmt>> statementList();
        std::unique_ptr<Stmt> statement();
        std::unique_ptr<Stmt> assignmentStatement();
        std::unique_ptr<Var> variable();

        std::unique_ptr<Expr> expr();
        std::unique_ptr<Expr> term();
        std::unique_ptr<Expr> factor();

        // Helper methods
        bool check(TokenType type) const;
        Token consume(TokenType type, const std::string &message);
        Token advance();
        const Token &peek() const;

        SpiError error(const Token &token, const std::string &message) const;

        Lexer &m_lexer;
        Token m_current;
        int m_consumed = 0;
        int m_depth = 0;
    };
}
