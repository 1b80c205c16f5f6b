#pragma once

#include <nlohmann/json.hpp>

#include "Diagnostic.h"
#include "SymbolTable.h"
#include "Value.h"

namespace spi {

    using json = nlohmann::json;

    // Integers stay JSON integers, reals become JSON floating-point numbers.
    json number_to_json(const Number& value);

    // [{"name": "A", "category": "variable", "type": "INTEGER", "line": 1, "column": 20}, ...]
    json symbol_table_to_json(const SymbolTable& table);

    // {"A": 10, "B": 20}
    json global_scope_to_json(const GlobalScope& scope);

    json diagnostic_to_json(const Diagnostic& d);

} // namespace spi
