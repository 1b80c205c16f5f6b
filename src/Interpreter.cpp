#include "Interpreter.h"
#include "Logger.h"

#include <cmath>
#include <limits>

namespace spi {

    namespace {

        [[noreturn]] void overflow(const Token& op) {
            throw SpiError(ErrorKind::IntegerOverflow, op,
                           "Integer overflow in '" + op.lexeme + "'.");
        }

        // Floor division: rounds toward negative infinity, so -7 DIV 2 = -4.
        // The caller has already rejected b == 0.
        int64_t floorDiv(const Token& op, int64_t a, int64_t b) {
            if (a == std::numeric_limits<int64_t>::min() && b == -1) {
                overflow(op);
            }
            int64_t q = a / b;
            if ((a % b != 0) && ((a < 0) != (b < 0))) {
                q--;
            }
            return q;
        }

        Number arithmetic(const Token& op, const Number& lhs, const Number& rhs) {
            if (isInteger(lhs) && isInteger(rhs)) {
                int64_t a = std::get<int64_t>(lhs);
                int64_t b = std::get<int64_t>(rhs);
                int64_t result{};
                switch (op.type) {
                    case TokenType::PLUS:
                        if (__builtin_add_overflow(a, b, &result)) overflow(op);
                        return result;
                    case TokenType::MINUS:
                        if (__builtin_sub_overflow(a, b, &result)) overflow(op);
                        return result;
                    case TokenType::MUL:
                        if (__builtin_mul_overflow(a, b, &result)) overflow(op);
                        return result;
                    case TokenType::INTEGER_DIV:
                        return floorDiv(op, a, b);
                    default: break;
                }
            }

            // Either side is real (or this is FLOAT_DIV): promote both.
            double a = toReal(lhs);
            double b = toReal(rhs);
            switch (op.type) {
                case TokenType::PLUS:        return a + b;
                case TokenType::MINUS:       return a - b;
                case TokenType::MUL:         return a * b;
                case TokenType::INTEGER_DIV: return std::floor(a / b);
                case TokenType::FLOAT_DIV:   return a / b;
                default: break;
            }
            return 0.0;
        }

    } // namespace

    const GlobalScope& Interpreter::interpret(const Program& program) {
        m_globals.clear();
        program.accept(*this);
        SPI_LOG("interpreter: program '" + program.program_name + "' finished with "
                + std::to_string(m_globals.size()) + " variables assigned");
        return m_globals;
    }

    Number Interpreter::evaluate(const Expr& expr) {
        return std::any_cast<Number>(expr.accept(*this));
    }

    const GlobalScope& Interpreter::getGlobalScope() const {
        return m_globals;
    }

// --- Statement Visitors ---

    void Interpreter::visit(const Program& stmt) {
        stmt.block->accept(*this);
    }

    void Interpreter::visit(const Block& stmt) {
        for (const auto& declaration : stmt.declarations) {
            declaration->accept(*this);
        }
        stmt.compound->accept(*this);
    }

    void Interpreter::visit(const VarDecl& stmt) {}

    void Interpreter::visit(const ProcedureDecl& stmt) {}

    void Interpreter::visit(const Compound& stmt) {
        for (const auto& statement : stmt.statements) {
            statement->accept(*this);
        }
    }

    void Interpreter::visit(const Assign& stmt) {
        Number value = evaluate(*stmt.value);
        m_globals[stmt.target->name] = value;
    }

    void Interpreter::visit(const NoOp& stmt) {}

// --- Expression Visitors ---

    std::any Interpreter::visit(const BinOp& expr) {
        Number left = evaluate(*expr.left);
        Number right = evaluate(*expr.right);

        switch (expr.op.type) {
            case TokenType::PLUS:
            case TokenType::MINUS:
            case TokenType::MUL:
                return arithmetic(expr.op, left, right);

            case TokenType::INTEGER_DIV:
            case TokenType::FLOAT_DIV:
                if (isZero(right)) {
                    throw SpiError(ErrorKind::DivisionByZero, expr.op, "Division by zero.");
                }
                return arithmetic(expr.op, left, right);

            default:
                throw SpiError(ErrorKind::InvalidSyntax, expr.op,
                               "Unsupported binary operator '" + expr.op.lexeme + "'.");
        }
    }

    std::any Interpreter::visit(const UnaryOp& expr) {
        Number operand = evaluate(*expr.operand);

        switch (expr.op.type) {
            case TokenType::PLUS:
                return operand;
            case TokenType::MINUS:
                if (isInteger(operand)) {
                    int64_t value = std::get<int64_t>(operand);
                    if (value == std::numeric_limits<int64_t>::min()) {
                        throw SpiError(ErrorKind::IntegerOverflow, expr.op,
                                       "Integer overflow in unary '-'.");
                    }
                    return Number{-value};
                }
                return Number{-std::get<double>(operand)};
            default:
                throw SpiError(ErrorKind::InvalidSyntax, expr.op,
                               "Unsupported unary operator '" + expr.op.lexeme + "'.");
        }
    }

    std::any Interpreter::visit(const Num& expr) {
        return expr.value;
    }

    std::any Interpreter::visit(const Var& expr) {
        auto it = m_globals.find(expr.name);
        if (it == m_globals.end()) {
            throw SpiError(ErrorKind::UndefinedVariable, expr.token,
                           "Variable '" + expr.name + "' is used before it is assigned.");
        }
        return it->second;
    }

} // namespace spi
