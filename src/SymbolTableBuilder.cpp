#include "SymbolTableBuilder.h"
#include "Logger.h"

namespace spi {

    void SymbolTableBuilder::build(const Program& program) {
        program.accept(*this);
        SPI_LOG("semantic: " + std::to_string(m_symbols.size()) + " symbols defined for program '"
                + program.program_name + "'");
    }

    const SymbolTable& SymbolTableBuilder::getSymbolTable() const {
        return m_symbols;
    }

    std::shared_ptr<const Symbol> SymbolTableBuilder::lookupVariable(const Token& token, const std::string& name) const {
        auto symbol = m_symbols.resolve(name);
        if (!symbol) {
            throw SpiError(ErrorKind::UndeclaredIdentifier, token,
                           "Symbol (identifier) not found '" + name + "'.");
        }
        return symbol;
    }

// --- Statement Visitors ---

    void SymbolTableBuilder::visit(const Program& stmt) {
        stmt.block->accept(*this);
    }

    void SymbolTableBuilder::visit(const Block& stmt) {
        for (const auto& declaration : stmt.declarations) {
            declaration->accept(*this);
        }
        stmt.compound->accept(*this);
    }

    void SymbolTableBuilder::visit(const VarDecl& stmt) {
        auto type_symbol = m_symbols.resolve(stmt.type_name);
        if (!type_symbol || type_symbol->category != SymbolCategory::BUILTIN_TYPE) {
            // The parser only accepts INTEGER and REAL, so this is unreachable
            // for trees it produced.
            throw SpiError(ErrorKind::UndeclaredIdentifier, stmt.type,
                           "Unknown type '" + stmt.type_name + "'.");
        }

        auto symbol = std::make_shared<Symbol>();
        symbol->name = stmt.variable_name;
        symbol->category = SymbolCategory::VARIABLE;
        symbol->type = type_symbol;
        symbol->declaration_token = stmt.name;

        if (!m_symbols.define(symbol)) {
            throw SpiError(ErrorKind::DuplicateIdentifier, stmt.name,
                           "Duplicate identifier '" + stmt.variable_name + "'.");
        }
    }

    void SymbolTableBuilder::visit(const ProcedureDecl& stmt) {
        // Intentionally empty: nested declarations are not checked.
    }

    void SymbolTableBuilder::visit(const Compound& stmt) {
        for (const auto& statement : stmt.statements) {
            statement->accept(*this);
        }
    }

    void SymbolTableBuilder::visit(const Assign& stmt) {
        lookupVariable(stmt.target->token, stmt.target->name);
        stmt.value->accept(*this);
    }

    void SymbolTableBuilder::visit(const NoOp& stmt) {}

// --- Expression Visitors ---

    std::any SymbolTableBuilder::visit(const BinOp& expr) {
        expr.left->accept(*this);
        expr.right->accept(*this);
        return {};
    }

    std::any SymbolTableBuilder::visit(const UnaryOp& expr) {
        expr.operand->accept(*this);
        return {};
    }

    std::any SymbolTableBuilder::visit(const Num& expr) {
        return {};
    }

    std::any SymbolTableBuilder::visit(const Var& expr) {
        lookupVariable(expr.token, expr.name);
        return {};
    }

} // namespace spi
