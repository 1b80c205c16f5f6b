#pragma once

#include <vector>
#include <string>
#include <memory>
#include "Token.h"
#include "Expr.h"

namespace spi {
    struct Program;
    struct Block;
    struct VarDecl;
    struct ProcedureDecl;
    struct Compound;
    struct Assign;
    struct NoOp;

// Statement Visitor Interface (returns void)
    class StmtVisitor {
    public:
        virtual ~StmtVisitor() = default;
        virtual void visit(const Program &stmt) = 0;
        virtual void visit(const Block &stmt) = 0;
        virtual void visit(const VarDecl &stmt) = 0;
        virtual void visit(const ProcedureDecl &stmt) = 0;
        virtual void visit(const Compound &stmt) = 0;
        virtual void visit(const Assign &stmt) = 0;
        virtual void visit(const NoOp &stmt) = 0;
    };

    // Base class for all statements and declarations
    struct Stmt {
        virtual ~Stmt() = default;

        virtual void accept(StmtVisitor &visitor) const = 0;
    };

    // BEGIN statement (; statement)* END
    struct Compound : Stmt {
        Compound(Token keyword, std::vector<std::unique_ptr<Stmt>> statements)
                : keyword(std::move(keyword)), statements(std::move(statements)) {}

        void accept(StmtVisitor &visitor) const override { visitor.visit(*this); }

        const Token keyword;
        const std::vector<std::unique_ptr<Stmt>> statements;
    };

    struct Assign : Stmt {
        Assign(std::unique_ptr<Var> target, Token op, std::unique_ptr<Expr> value)
                : target(std::move(target)), op(std::move(op)), value(std::move(value)) {}

        void accept(StmtVisitor &visitor) const override { visitor.visit(*this); }

        const std::unique_ptr<Var> target;
        const Token op;
        const std::unique_ptr<Expr> value;
    };

    // The empty statement, e.g. between "; END".
    struct NoOp : Stmt {
        void accept(StmtVisitor &visitor) const override { visitor.visit(*this); }
    };

    // One declared variable. "a, b : INTEGER" produces two of these.
    struct VarDecl : Stmt {
        VarDecl(Token name, Token type)
                : name(std::move(name)), type(std::move(type)),
                  variable_name(this->name.text()), type_name(this->type.text()) {}

        void accept(StmtVisitor &visitor) const override { visitor.visit(*this); }

        const Token name;
        const Token type;
        const std::string variable_name;
        const std::string type_name;
    };

    struct Block : Stmt {
        Block(std::vector<std::unique_ptr<Stmt>> declarations, std::unique_ptr<Compound> compound)
                : declarations(std::move(declarations)), compound(std::move(compound)) {}

        void accept(StmtVisitor &visitor) const override { visitor.visit(*this); }

        // VarDecl and ProcedureDecl nodes, in source order.
        const std::vector<std::unique_ptr<Stmt>> declarations;
        const std::unique_ptr<Compound> compound;
    };

    // Parsed and stored, never checked or executed.
    struct ProcedureDecl : Stmt {
        ProcedureDecl(Token name, std::unique_ptr<Block> block)
                : name(std::move(name)), block(std::move(block)), procedure_name(this->name.text()) {}

        void accept(StmtVisitor &visitor) const override { visitor.visit(*this); }

        const Token name;
        const std::unique_ptr<Block> block;
        const std::string procedure_name;
    };

    struct Program : Stmt {
        Program(Token name, std::unique_ptr<Block> block)
                : name(std::move(name)), block(std::move(block)), program_name(this->name.text()) {}

        void accept(StmtVisitor &visitor) const override { visitor.visit(*this); }

        const Token name;
        const std::unique_ptr<Block> block;
        const std::string program_name;
    };

} // namespace spi
