#ifndef PROPCHECK_CHECK_RESULT_H
#define PROPCHECK_CHECK_RESULT_H

#include "show.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// What one evaluation of the predicate said about one value.
struct Holds {};
struct Falsified {};
struct Raised {
    std::string error;
};

using Verdict = std::variant<Holds, Falsified, Raised>;

template<typename T>
struct Shrunk {
    size_t reductions;
    T value;
};

template<typename T>
using ReduceResult = std::variant<Shrunk<T>, Raised>;

/* One failing trial: the value that was sampled, and either how far it could
   be shrunk or what the predicate threw.
 */
template<typename T>
struct Counterexample {
    T original;
    ReduceResult<T> outcome;

    [[nodiscard]] bool errored() const { return std::holds_alternative<Raised>(outcome); }
};

template<typename T>
struct CheckReport {
    uint64_t seed;
    size_t trials;
    std::vector<Counterexample<T>> counterexamples;

    [[nodiscard]] bool passed() const { return counterexamples.empty(); }
};

/* "after 3 reductions: [5, 5]"
   "{\"a\": 1} : boom"
 */
template<typename T>
std::string to_string(const Counterexample<T> &c) {
    struct stringifier {
        const T &original;
        std::string operator()(const Shrunk<T> &s) {
            return "after " + std::to_string(s.reductions) + " reductions: " + show(s.value);
        }
        std::string operator()(const Raised &r) { return show(original) + " : " + r.error; }
    };
    return std::visit(stringifier{c.original}, c.outcome);
}

template<typename T>
std::vector<std::string> to_strings(const CheckReport<T> &report) {
    std::vector<std::string> out;
    out.reserve(report.counterexamples.size());
    for (const auto &c : report.counterexamples) {
        out.push_back(to_string(c));
    }
    return out;
}

/* The message a test framework shows when a property fails:

   found 12 counter examples, displaying first 5:
       -> after 2 reductions: [5, 5]
       -> ...
 */
inline std::string format_failures(const std::vector<std::string> &counterexamples, size_t limit) {
    size_t shown = std::min(counterexamples.size(), limit);
    std::string message = "found " + std::to_string(counterexamples.size()) + " counter examples, displaying first " +
                          std::to_string(shown) + ":";
    for (size_t i = 0; i < shown; i++) {
        message += "\n    -> " + counterexamples[i];
    }
    return message;
}

template<typename T>
std::string to_string(const CheckReport<T> &report) {
    if (report.passed()) {
        return "Passes (" + std::to_string(report.trials) + " trials)";
    }
    size_t errored = std::count_if(report.counterexamples.begin(), report.counterexamples.end(),
                                   [](const Counterexample<T> &c) { return c.errored(); });
    return "Fails (seed " + std::to_string(report.seed) + ", " + std::to_string(errored) + " raised):\n" +
           format_failures(to_strings(report), report.counterexamples.size());
}

#endif//PROPCHECK_CHECK_RESULT_H
