#ifndef PROPCHECK_PROPCHECK_H
#define PROPCHECK_PROPCHECK_H

#include "check_result.h"
#include "config.h"
#include "document_gen.h"
#include "generator.h"
#include "misuse_error.h"
#include "rand_source.h"
#include "scalar_gen.h"
#include "shrink.h"
#include "show.h"
#include "value.h"

#include <iostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

/* Samples `config.trials` values and checks the predicate on each.

   A false result is shrunk and recorded; a throw is recorded as-is with the
   exception text. Neither stops the run, and neither escapes this function:
   only MisuseError (and real bugs in generator code) can.

   An empty report means no counterexample turned up this time, nothing more.
 */
template<typename T, typename FN>
CheckReport<T> run(Generator<T> const &generator, FN predicate, CheckConfig const &config = CheckConfig()) {
    RandSource rand = config.seed ? RandSource(*config.seed) : RandSource::from_entropy();
    CheckReport<T> report{rand.seed(), config.trials, {}};

    for (size_t i = 0; i < config.trials; i++) {
        T value = generator(rand);
        Verdict verdict = evaluate(predicate, value);
        if (std::holds_alternative<Holds>(verdict)) {
            continue;
        }
        if (auto raised = std::get_if<Raised>(&verdict)) {
            report.counterexamples.push_back(Counterexample<T>{std::move(value), *raised});
            continue;
        }
        ReduceResult<T> reduced = reduce(value, predicate, rand, config);
        report.counterexamples.push_back(Counterexample<T>{std::move(value), std::move(reduced)});
    }
    return report;
}

/* The rendered counterexamples of one run, in the order they were found:

   check(is_even, Gen::int_range(1, 1), 1) -> {"after 0 reductions: 1"}
 */
template<typename T, typename FN>
std::vector<std::string> check(FN predicate, Generator<T> const &generator, size_t trials = PROPCHECK_DEFAULT_TRIALS) {
    CheckConfig config;
    config.trials = trials;
    return to_strings(run(generator, std::move(predicate), config));
}

template<typename FN>
auto negate(FN predicate) {
    return [predicate](const auto &value) { return !predicate(value); };
}

template<typename T, typename FN>
void run_test(const std::string &name, Generator<T> const &gen, FN predicate, CheckConfig const &config = CheckConfig()) {
    std::ostream &out = *config.log;
    out << "--------" << std::endl;
    auto result = run(gen, std::move(predicate), config);
    out << "[" << name << "] " << to_string(result) << std::endl;
}

#endif//PROPCHECK_PROPCHECK_H
