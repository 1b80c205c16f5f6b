#include "SymbolTable.h"

#include <iomanip>
#include <sstream>

namespace spi {

    std::string Symbol::toString() const {
        if (category == SymbolCategory::BUILTIN_TYPE || !type) {
            return name;
        }
        return "<" + name + ":" + type->name + ">";
    }

    std::string Symbol::repr() const {
        if (category == SymbolCategory::BUILTIN_TYPE) {
            return "<BuiltinTypeSymbol(name='" + name + "')>";
        }
        return "<VarSymbol(name='" + name + "', type='" + (type ? type->name : "?") + "')>";
    }

    SymbolTable::SymbolTable() {
        // The language has no user-defined types; these two are all there is.
        for (const char* builtin : {"INTEGER", "REAL"}) {
            auto symbol = std::make_shared<Symbol>();
            symbol->name = builtin;
            symbol->category = SymbolCategory::BUILTIN_TYPE;
            m_symbols[symbol->name] = symbol;
            m_order.push_back(symbol);
        }
    }

    bool SymbolTable::define(std::shared_ptr<const Symbol> symbol) {
        if (m_symbols.count(symbol->name)) {
            return false;
        }
        m_symbols[symbol->name] = symbol;
        m_order.push_back(std::move(symbol));
        return true;
    }

    std::shared_ptr<const Symbol> SymbolTable::resolve(const std::string& name) const {
        auto it = m_symbols.find(name);
        if (it != m_symbols.end()) {
            return it->second;
        }
        return nullptr;
    }

    const std::vector<std::shared_ptr<const Symbol>>& SymbolTable::symbols() const {
        return m_order;
    }

    size_t SymbolTable::size() const {
        return m_order.size();
    }

    std::string SymbolTable::toString() const {
        const std::string header = "Symbol table contents";
        std::stringstream ss;
        ss << header << "\n" << std::string(header.size(), '_') << "\n";
        for (const auto& symbol : m_order) {
            ss << std::setw(7) << symbol->name << ": " << symbol->repr() << "\n";
        }
        return ss.str();
    }

} // namespace spi
