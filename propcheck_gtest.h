#ifndef PROPCHECK_PROPCHECK_GTEST_H
#define PROPCHECK_PROPCHECK_GTEST_H

#include "propcheck.h"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

/* Runs the property and turns the report into a gtest assertion.

   On failure the message lists the total count and the first
   `config.example_limit` counterexamples, plus the seed to replay the run.
 */
template<typename T, typename FN>
::testing::AssertionResult holds_for_all(FN predicate, Generator<T> const &generator, CheckConfig const &config = CheckConfig()) {
    CheckReport<T> report = run(generator, std::move(predicate), config);
    if (report.passed()) {
        return ::testing::AssertionSuccess();
    }
    return ::testing::AssertionFailure() << format_failures(to_strings(report), config.example_limit)
                                         << "\n(seed " << report.seed << ")";
}

template<typename T, typename FN>
::testing::AssertionResult holds_for_all(FN predicate, Generator<T> const &generator, size_t example_limit) {
    CheckConfig config;
    config.example_limit = example_limit;
    return holds_for_all(std::move(predicate), generator, config);
}

/* PROPCHECK_*_HOLDS(predicate, generator[, config or example limit]).
   Variadic so a lambda with unparenthesized commas passes through intact.
 */
// Fails the current test and returns from it.
#define PROPCHECK_ASSERT_HOLDS(...) ASSERT_TRUE(holds_for_all(__VA_ARGS__))
// Fails the current test and keeps going.
#define PROPCHECK_EXPECT_HOLDS(...) EXPECT_TRUE(holds_for_all(__VA_ARGS__))

#endif//PROPCHECK_PROPCHECK_GTEST_H
