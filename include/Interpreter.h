#pragma once

#include "Expr.h"
#include "Stmt.h"
#include "Errors.h"
#include "Value.h"

namespace spi {

    /**
     * @class Interpreter
     * @brief Tree-walking evaluator. Executes the program's compound statement
     *        against a global variable store owned by this run.
     */
    class Interpreter : public ExprVisitor, public StmtVisitor {
    public:
        Interpreter() = default;

        // Runs the program from an empty store and returns the final store.
        // Throws SpiError on UndefinedVariable, DivisionByZero or IntegerOverflow.
        const GlobalScope& interpret(const Program& program);

        // Evaluates one expression against the current store.
        Number evaluate(const Expr& expr);

        [[nodiscard]] const GlobalScope& getGlobalScope() const;

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

        GlobalScope m_globals;
    };

} // namespace spi
