#include "JsonExport.h"

namespace spi {

    json number_to_json(const Number& value) {
        if (isInteger(value)) {
            return json(std::get<int64_t>(value));
        }
        return json(std::get<double>(value));
    }

    json symbol_table_to_json(const SymbolTable& table) {
        json symbols = json::array();
        for (const auto& symbol : table.symbols()) {
            json entry = {
                {"name", symbol->name},
                {"category", symbol->category == SymbolCategory::BUILTIN_TYPE ? "builtin_type" : "variable"}
            };
            if (symbol->type) {
                entry["type"] = symbol->type->name;
                entry["line"] = symbol->declaration_token.line;
                entry["column"] = symbol->declaration_token.column;
            }
            symbols.push_back(entry);
        }
        return symbols;
    }

    json global_scope_to_json(const GlobalScope& scope) {
        json globals = json::object();
        for (const auto& [name, value] : scope) {
            globals[name] = number_to_json(value);
        }
        return globals;
    }

    json diagnostic_to_json(const Diagnostic& d) {
        json j = {
            {"range", {
                {"start", {{"line", d.range.start_line}, {"character", d.range.start_char}}},
                {"end", {{"line", d.range.end_line}, {"character", d.range.end_char}}}
            }},
            {"severity", static_cast<int>(d.severity)},
            {"source", "spi"},
            {"message", d.message}
        };
        if (d.kind) {
            j["code"] = to_string(*d.kind);
        }
        return j;
    }

} // namespace spi
