#include "Parser.h"
#include "Logger.h"

namespace spi {

    namespace {
        // Counts one level of recursion through factor(), compoundStatement()
        // or procedureDeclaration() for the lifetime of one call.
        class NestingGuard {
        public:
            explicit NestingGuard(int &depth) : m_depth(depth) { ++m_depth; }
            ~NestingGuard() { --m_depth; }

            NestingGuard(const NestingGuard &) = delete;
            NestingGuard &operator=(const NestingGuard &) = delete;

        private:
            int &m_depth;
        };
    }

    Parser::Parser(Lexer &lexer) : m_lexer(lexer) {}

    std::unique_ptr<Program> Parser::parse() {
        m_consumed = 0;
        m_depth = 0;
        m_current = m_lexer.getNextToken();

        auto node = program();

        if (!check(TokenType::EOF_TOKEN)) {
            throw error(peek(), "Expect end of input after '.'.");
        }

        SPI_LOG("parser: built program '" + node->program_name + "' from "
                + std::to_string(m_consumed) + " tokens");
        return node;
    }

// program → PROGRAM variable SEMI block DOT
    std::unique_ptr<Program> Parser::program() {
        consume(TokenType::PROGRAM, "Expect 'PROGRAM' at the start of the source.");
        Token name = consume(TokenType::ID, "Expect program name after 'PROGRAM'.");
        consume(TokenType::SEMI, "Expect ';' after program name.");
        auto body = block();
        consume(TokenType::DOT, "Expect '.' at the end of the program.");
        return std::make_unique<Program>(std::move(name), std::move(body));
    }

// block → declarations compound_statement
    std::unique_ptr<Block> Parser::block() {
        auto decls = declarations();
        auto compound = compoundStatement();
        return std::make_unique<Block>(std::move(decls), std::move(compound));
    }

// declarations → ( VAR (var_declaration SEMI)+ | PROCEDURE ID SEMI block SEMI )*
    std::vector<std::unique_ptr<Stmt>> Parser::declarations() {
        std::vector<std::unique_ptr<Stmt>> decls;

        while (check(TokenType::VAR) || check(TokenType::PROCEDURE)) {
            if (check(TokenType::VAR)) {
                advance();
                // At least one declaration must follow VAR.
                do {
                    for (auto &decl : varDeclaration()) {
                        decls.push_back(std::move(decl));
                    }
                    consume(TokenType::SEMI, "Expect ';' after variable declaration.");
                } while (check(TokenType::ID));
            } else {
                decls.push_back(procedureDeclaration());
            }
        }

        return decls;
    }

// var_declaration → ID (COMMA ID)* COLON type_spec
    std::vector<std::unique_ptr<Stmt>> Parser::varDeclaration() {
        std::vector<Token> names;
        names.push_back(consume(TokenType::ID, "Expect variable name."));

        while (check(TokenType::COMMA)) {
            advance();
            names.push_back(consume(TokenType::ID, "Expect variable name after ','."));
        }

        consume(TokenType::COLON, "Expect ':' after variable names.");
        Token type = typeSpec();

        std::vector<std::unique_ptr<Stmt>> decls;
        for (auto &name : names) {
            decls.push_back(std::make_unique<VarDecl>(std::move(name), type));
        }
        return decls;
    }

// type_spec → INTEGER | REAL
    Token Parser::typeSpec() {
        if (check(TokenType::INTEGER) || check(TokenType::REAL)) {
            return advance();
        }
        throw error(peek(), "Expect a type name ('INTEGER' or 'REAL').");
    }

// PROCEDURE ID SEMI block SEMI
    std::unique_ptr<Stmt> Parser::procedureDeclaration() {
        NestingGuard guard(m_depth);
        if (m_depth > MAX_NESTING_DEPTH) {
            throw error(peek(), "Procedures nested too deeply.");
        }
        consume(TokenType::PROCEDURE, "Expect 'PROCEDURE'.");
        Token name = consume(TokenType::ID, "Expect procedure name.");
        consume(TokenType::SEMI, "Expect ';' after procedure name.");
        auto body = block();
        consume(TokenType::SEMI, "Expect ';' after procedure body.");
        return std::make_unique<ProcedureDecl>(std::move(name), std::move(body));
    }

// compound_statement → BEGIN statement_list END
    std::unique_ptr<Compound> Parser::compoundStatement() {
        NestingGuard guard(m_depth);
        if (m_depth > MAX_NESTING_DEPTH) {
            throw error(peek(), "Statements nested too deeply.");
        }
        Token keyword = consume(TokenType::BEGIN, "Expect 'BEGIN'.");
        auto statements = statementList();
        consume(TokenType::END, "Expect 'END' to close 'BEGIN'.");
        return std::make_unique<Compound>(std::move(keyword), std::move(statements));
    }

// statement_list → statement (SEMI statement)*
    std::vector<std::unique_ptr<Stmt>> Parser::statementList() {
        std::vector<std::unique_ptr<Stmt>> statements;
        statements.push_back(statement());

        while (check(TokenType::SEMI)) {
            advance();
            statements.push_back(statement());
        }

        return statements;
    }

// statement → compound_statement | assignment | empty
    std::unique_ptr<Stmt> Parser::statement() {
        if (check(TokenType::BEGIN)) return compoundStatement();
        if (check(TokenType::ID)) return assignmentStatement();
        return std::make_unique<NoOp>();
    }

// assignment → variable ASSIGN expr
    std::unique_ptr<Stmt> Parser::assignmentStatement() {
        auto target = variable();
        Token op = consume(TokenType::ASSIGN, "Expect ':=' after variable in assignment.");
        auto value = expr();
        return std::make_unique<Assign>(std::move(target), std::move(op), std::move(value));
    }

// variable → ID
    std::unique_ptr<Var> Parser::variable() {
        return std::make_unique<Var>(consume(TokenType::ID, "Expect variable name."));
    }

// expr → term ((PLUS | MINUS) term)*
    std::unique_ptr<Expr> Parser::expr() {
        auto node = term();

        while (check(TokenType::PLUS) || check(TokenType::MINUS)) {
            Token op = advance();
            auto right = term();
            node = std::make_unique<BinOp>(std::move(node), std::move(op), std::move(right));
        }

        return node;
    }

// term → factor ((MUL | INTEGER_DIV | FLOAT_DIV) factor)*
    std::unique_ptr<Expr> Parser::term() {
        auto node = factor();

        while (check(TokenType::MUL) || check(TokenType::INTEGER_DIV) || check(TokenType::FLOAT_DIV)) {
            Token op = advance();
            auto right = factor();
            node = std::make_unique<BinOp>(std::move(node), std::move(op), std::move(right));
        }

        return node;
    }

// factor → (PLUS | MINUS) factor | INTEGER_CONST | REAL_CONST | LPAREN expr RPAREN | variable
    std::unique_ptr<Expr> Parser::factor() {
        NestingGuard guard(m_depth);
        if (m_depth > MAX_NESTING_DEPTH) {
            throw error(peek(), "Expression nested too deeply.");
        }

        if (check(TokenType::PLUS) || check(TokenType::MINUS)) {
            Token op = advance();
            return std::make_unique<UnaryOp>(std::move(op), factor());
        }

        if (check(TokenType::INTEGER_CONST)) {
            Token literal = advance();
            Number value = std::get<int64_t>(literal.value);
            return std::make_unique<Num>(std::move(literal), value);
        }

        if (check(TokenType::REAL_CONST)) {
            Token literal = advance();
            Number value = std::get<double>(literal.value);
            return std::make_unique<Num>(std::move(literal), value);
        }

        if (check(TokenType::LPAREN)) {
            advance();
            auto inner = expr();
            consume(TokenType::RPAREN, "Expect ')' after expression.");
            return inner;
        }

        if (check(TokenType::ID)) {
            return variable();
        }

        throw error(peek(), "Expect expression.");
    }

// --- Helper methods ---

    bool Parser::check(TokenType type) const {
        return m_current.type == type;
    }

    const Token &Parser::peek() const {
        return m_current;
    }

    Token Parser::advance() {
        Token previous = m_current;
        // EOF is terminal; never pull past it.
        if (previous.type != TokenType::EOF_TOKEN) {
            m_current = m_lexer.getNextToken();
        }
        m_consumed++;
        return previous;
    }

    Token Parser::consume(TokenType type, const std::string &message) {
        if (check(type)) return advance();
        throw error(peek(), message);
    }

    SpiError Parser::error(const Token &token, const std::string &message) const {
        return SpiError(ErrorKind::InvalidSyntax, token, message);
    }

}
