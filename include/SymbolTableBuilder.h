#pragma once

#include "Expr.h"
#include "Stmt.h"
#include "Errors.h"
#include "SymbolTable.h"

namespace spi {

    /**
     * @class SymbolTableBuilder
     * @brief Static declaration/usage check. Populates the symbol table with
     *        one variable per VarDecl and verifies that every assigned or read
     *        name was declared. Throws SpiError on the first violation.
     *
     * Procedure bodies are not checked: the table is flat and procedures are
     * never invoked.
     */
    class SymbolTableBuilder : public ExprVisitor, public StmtVisitor {
    public:
        SymbolTableBuilder() = default;

        // The main entry point.
        void build(const Program& program);

        [[nodiscard]] const SymbolTable& getSymbolTable() const;

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

        std::shared_ptr<const Symbol> lookupVariable(const Token& token, const std::string& name) const;

        SymbolTable m_symbols;
    };

} // namespace spi
