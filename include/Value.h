#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <map>

namespace spi {

    // --- Runtime Value Representation ---
    using Number = std::variant<
            int64_t,        // INTEGER
            double          // REAL
    >;

    // The global variable store of one run, keyed by uppercase name.
    using GlobalScope = std::map<std::string, Number>;

    inline bool isReal(const Number& n) { return std::holds_alternative<double>(n); }
    inline bool isInteger(const Number& n) { return std::holds_alternative<int64_t>(n); }

    // Widens an integer to real; reals are returned unchanged.
    double toReal(const Number& n);

    bool isZero(const Number& n);

    // Integers print as-is, reals always carry a fractional part (3.0, 3.5).
    std::string toString(const Number& n);

    std::string toString(const GlobalScope& scope);

} // namespace spi
