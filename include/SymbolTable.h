#pragma once

#include <string>
#include <map>
#include <vector>
#include <memory>
#include "Token.h"

namespace spi {

    enum class SymbolCategory {
        BUILTIN_TYPE,
        VARIABLE,
    };

    // Represents a single entry in the symbol table: a built-in type or a
    // declared variable.
    struct Symbol {
        std::string name;
        SymbolCategory category = SymbolCategory::VARIABLE;
        // The variable's type symbol. Null for built-in types.
        std::shared_ptr<const Symbol> type;
        // Where the variable was declared. Default-constructed for built-ins.
        Token declaration_token;

        // <INTEGER> or <A:INTEGER>
        std::string toString() const;
        // <BuiltinTypeSymbol(name='INTEGER')> or <VarSymbol(name='A', type='INTEGER')>
        std::string repr() const;
    };

    /**
     * @class SymbolTable
     * @brief A single flat table for the whole program. Names are unique and
     *        uppercase; INTEGER and REAL are registered on construction.
     */
    class SymbolTable {
    public:
        SymbolTable();

        // Returns false and leaves the table unchanged if the name is taken.
        [[nodiscard]] bool define(std::shared_ptr<const Symbol> symbol);

        // Returns the symbol if found, otherwise nullptr.
        [[nodiscard]] std::shared_ptr<const Symbol> resolve(const std::string& name) const;

        // Symbols in definition order, built-ins first.
        const std::vector<std::shared_ptr<const Symbol>>& symbols() const;

        size_t size() const;

        // The "Symbol table contents" listing.
        std::string toString() const;

    private:
        std::map<std::string, std::shared_ptr<const Symbol>> m_symbols;
        std::vector<std::shared_ptr<const Symbol>> m_order;
    };

} // namespace spi
