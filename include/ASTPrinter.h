#pragma once

#include "Expr.h"
#include "Stmt.h"
#include <initializer_list>
#include <string>
#include <sstream>

namespace spi {

/**
 * @class ASTPrinter
 * @brief Walks a parsed AST and prints an indented S-expression, one
 *        declaration or statement per line with expressions inline.
 *
 * Two trees print identically exactly when they have the same shape, names,
 * operators and literal values.
 */
    class ASTPrinter : public ExprVisitor, public StmtVisitor {
    public:
        ASTPrinter() = default;

        /**
         * @brief The main entry point to print a whole program.
         * @param program The AST to print.
         * @return A string representing the AST.
         */
        std::string print(const Program& program);

        // Prints a single expression, e.g. (+ A (* 5 2)).
        std::string print(const Expr& expr);

    private:
        // --- Visitor Methods ---
        void visit(const Program& stmt) override;
        void visit(const Block& stmt) override;
        void visit(const VarDecl& stmt) override;
        void visit(const ProcedureDecl& stmt) override;
        void visit(const Compound& stmt) override;
        void visit(const Assign& stmt) override;
        void visit(const NoOp& stmt) override;

        std::any visit(const BinOp& expr) override;
        std::any visit(const UnaryOp& expr) override;
        std::any visit(const Num& expr) override;
        std::any visit(const Var& expr) override;

        std::string parenthesize(const std::string& name, std::initializer_list<const Expr*> exprs);
        void indent();

        std::stringstream m_out;
        int m_indent_level = 0;
    };

} // namespace spi
