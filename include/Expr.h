#pragma once

#include <memory>
#include <string>
#include <any>
#include "Token.h"
#include "Value.h"

namespace spi {

    struct BinOp;
    struct UnaryOp;
    struct Num;
    struct Var;

// The Visitor interface for expressions
    class ExprVisitor {
    public:
        virtual ~ExprVisitor() = default;

        virtual std::any visit(const BinOp &expr) = 0;
        virtual std::any visit(const UnaryOp &expr) = 0;
        virtual std::any visit(const Num &expr) = 0;
        virtual std::any visit(const Var &expr) = 0;
    };

// Base class for all expression types
    struct Expr {
        virtual ~Expr() = default;

        virtual std::any accept(ExprVisitor &visitor) const = 0;
    };

    // left op right, where op is PLUS, MINUS, MUL, INTEGER_DIV or FLOAT_DIV.
    struct BinOp : Expr {
        BinOp(std::unique_ptr<Expr> left, Token op, std::unique_ptr<Expr> right)
                : left(std::move(left)), op(std::move(op)), right(std::move(right)) {}

        std::any accept(ExprVisitor &visitor) const override { return visitor.visit(*this); }

        const std::unique_ptr<Expr> left;
        const Token op;
        const std::unique_ptr<Expr> right;
    };

    // op operand, where op is PLUS or MINUS.
    struct UnaryOp : Expr {
        UnaryOp(Token op, std::unique_ptr<Expr> operand)
                : op(std::move(op)), operand(std::move(operand)) {}

        std::any accept(ExprVisitor &visitor) const override { return visitor.visit(*this); }

        const Token op;
        const std::unique_ptr<Expr> operand;
    };

    struct Num : Expr {
        Num(Token token, Number value) : token(std::move(token)), value(value) {}

        std::any accept(ExprVisitor &visitor) const override { return visitor.visit(*this); }

        const Token token;
        const Number value;
    };

    // A variable reference. The name is already uppercased by the lexer.
    struct Var : Expr {
        explicit Var(Token token) : token(std::move(token)), name(this->token.text()) {}

        std::any accept(ExprVisitor &visitor) const override { return visitor.visit(*this); }

        const Token token;
        const std::string name;
    };

} // namespace spi
