#include "Value.h"
#include <cmath>
#include <sstream>
#include <iterator>
#include <limits>

namespace spi {

    double toReal(const Number& n) {
        if (std::holds_alternative<int64_t>(n)) {
            return static_cast<double>(std::get<int64_t>(n));
        }
        return std::get<double>(n);
    }

    bool isZero(const Number& n) {
        if (std::holds_alternative<int64_t>(n)) {
            return std::get<int64_t>(n) == 0;
        }
        return std::get<double>(n) == 0.0;
    }

    std::string toString(const Number& n) {
        std::stringstream ss;
        if (std::holds_alternative<int64_t>(n)) {
            ss << std::get<int64_t>(n);
            return ss.str();
        }

        double d = std::get<double>(n);
        ss.precision(std::numeric_limits<double>::digits10);
        ss << d;
        std::string text = ss.str();
        // Keep reals visibly real: 3 -> 3.0
        if (std::isfinite(d) && text.find_first_of(".e") == std::string::npos) {
            text += ".0";
        }
        return text;
    }

    std::string toString(const GlobalScope& scope) {
        std::stringstream ss;
        ss << "{";
        for (auto it = scope.begin(); it != scope.end(); ++it) {
            ss << "'" << it->first << "': " << toString(it->second);
            if (std::next(it) != scope.end()) ss << ", ";
        }
        ss << "}";
        return ss.str();
    }

} // namespace spi
