#ifndef PROPCHECK_CONFIG_H
#define PROPCHECK_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>

// Override at build time with -DPROPCHECK_DEFAULT_TRIALS=1000 and friends.
#ifndef PROPCHECK_DEFAULT_TRIALS
#define PROPCHECK_DEFAULT_TRIALS 100
#endif
#ifndef PROPCHECK_DEFAULT_REDUCTION_ATTEMPTS
#define PROPCHECK_DEFAULT_REDUCTION_ATTEMPTS 10
#endif
#ifndef PROPCHECK_DEFAULT_EXAMPLES
#define PROPCHECK_DEFAULT_EXAMPLES 5
#endif

struct CheckConfig {
    size_t trials = PROPCHECK_DEFAULT_TRIALS;
    // Proposals tried on one value before the shrinker settles for it.
    size_t reduction_attempts = PROPCHECK_DEFAULT_REDUCTION_ATTEMPTS;
    // How many counterexamples a failure message lists.
    size_t example_limit = PROPCHECK_DEFAULT_EXAMPLES;
    // Unset: a fresh seed from std::random_device per run.
    std::optional<uint64_t> seed;
    bool verbose = false;
    std::ostream *log = &std::cout;
};

#endif//PROPCHECK_CONFIG_H
