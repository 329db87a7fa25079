#ifndef PROPCHECK_SHOW_H
#define PROPCHECK_SHOW_H

#include "ordered_map.h"
#include "value.h"

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

/* Renders a generated value for a counterexample report.

   Anything with an operator<< works out of the box; containers and text get
   a readable, unambiguous form.
 */
template<typename T>
std::string show(const T &value) {
    std::ostringstream os;
    os << value;
    return os.str();
}

inline std::string show(const std::string &value) { return repr::quoted(value); }
inline std::string show(bool value) { return value ? "true" : "false"; }
// Bytes as numbers, not as raw chars.
inline std::string show(uint8_t value) { return std::to_string(value); }
inline std::string show(const Value &value) { return to_string(value); }

template<typename T>
std::string show(const std::vector<T> &values);

template<typename V>
std::string show(const OrderedMap<V> &map) {
    std::string out = "{";
    bool first = true;
    for (const auto &item : map) {
        if (!first) { out += ", "; }
        first = false;
        out += repr::quoted(item.first) + ": " + show(item.second);
    }
    return out + "}";
}

template<typename T>
std::string show(const std::vector<T> &values) {
    std::string out = "[";
    for (size_t i = 0; i < values.size(); i++) {
        if (i > 0) { out += ", "; }
        out += show(values[i]);
    }
    return out + "]";
}

#endif//PROPCHECK_SHOW_H
