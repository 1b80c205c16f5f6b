#include "ASTPrinter.h"
#include <initializer_list>

namespace spi {

    namespace {
        std::string operatorSymbol(const Token& op) {
            switch (op.type) {
                case TokenType::PLUS:        return "+";
                case TokenType::MINUS:       return "-";
                case TokenType::MUL:         return "*";
                case TokenType::FLOAT_DIV:   return "/";
                case TokenType::INTEGER_DIV: return "div";
                default:                     return op.lexeme;
            }
        }
    }

    void ASTPrinter::indent() {
        for (int i = 0; i < m_indent_level; ++i) {
            m_out << "  ";
        }
    }

    std::string ASTPrinter::print(const Program& program) {
        m_out.str(""); // Clear the stream
        m_indent_level = 0;
        program.accept(*this);
        return m_out.str();
    }

    std::string ASTPrinter::print(const Expr& expr) {
        return std::any_cast<std::string>(expr.accept(*this));
    }

// --- Helper to format expressions like: `(op lhs rhs)` ---
    std::string ASTPrinter::parenthesize(const std::string& name, std::initializer_list<const Expr*> exprs) {
        std::stringstream ss;
        ss << "(" << name;
        for (const auto* expr : exprs) {
            if (expr) ss << " " << std::any_cast<std::string>(expr->accept(*this));
        }
        ss << ")";
        return ss.str();
    }

// --- Statement Visitors ---

    void ASTPrinter::visit(const Program& stmt) {
        indent();
        m_out << "(program " << stmt.program_name << "\n";
        m_indent_level++;
        stmt.block->accept(*this);
        m_indent_level--;
        indent();
        m_out << ")\n";
    }

    void ASTPrinter::visit(const Block& stmt) {
        indent();
        m_out << "(block\n";
        m_indent_level++;
        for (const auto& declaration : stmt.declarations) {
            declaration->accept(*this);
        }
        stmt.compound->accept(*this);
        m_indent_level--;
        indent();
        m_out << ")\n";
    }

    void ASTPrinter::visit(const VarDecl& stmt) {
        indent();
        m_out << "(var " << stmt.variable_name << " : " << stmt.type_name << ")\n";
    }

    void ASTPrinter::visit(const ProcedureDecl& stmt) {
        indent();
        m_out << "(procedure " << stmt.procedure_name << "\n";
        m_indent_level++;
        stmt.block->accept(*this);
        m_indent_level--;
        indent();
        m_out << ")\n";
    }

    void ASTPrinter::visit(const Compound& stmt) {
        indent();
        m_out << "(begin\n";
        m_indent_level++;
        for (const auto& statement : stmt.statements) {
            statement->accept(*this);
        }
        m_indent_level--;
        indent();
        m_out << ")\n";
    }

    void ASTPrinter::visit(const Assign& stmt) {
        indent();
        m_out << "(assign " << stmt.target->name << " "
              << std::any_cast<std::string>(stmt.value->accept(*this)) << ")\n";
    }

    void ASTPrinter::visit(const NoOp& stmt) {
        indent();
        m_out << "(noop)\n";
    }

// --- Expression Visitors ---

    std::any ASTPrinter::visit(const BinOp& expr) {
        return parenthesize(operatorSymbol(expr.op), {expr.left.get(), expr.right.get()});
    }

    std::any ASTPrinter::visit(const UnaryOp& expr) {
        // (unary- 5)
        return parenthesize("unary" + operatorSymbol(expr.op), {expr.operand.get()});
    }

    std::any ASTPrinter::visit(const Num& expr) {
        return toString(expr.value);
    }

    std::any ASTPrinter::visit(const Var& expr) {
        return expr.name;
    }

} // namespace spi
