#ifndef PROPCHECK_RAND_SOURCE_H
#define PROPCHECK_RAND_SOURCE_H

#include <cstddef>
#include <cstdint>
#include <random>

/* The only mutable state a generator is allowed to touch.

   Every sampling call receives the RandSource by reference. The checker owns
   one for the whole run, so a run started from a known seed replays exactly.
 */
class RandSource {
public:
    explicit RandSource(uint64_t seed) : seed_(seed), rng(seed) {}

    static RandSource from_entropy() {
        std::random_device r;
        uint64_t seed = (static_cast<uint64_t>(r()) << 32) | r();
        return RandSource(seed);
    }

    [[nodiscard]] uint64_t seed() const { return seed_; }

    // Closed interval, lo <= hi is the caller's job.
    int64_t int_in(int64_t lo, int64_t hi) {
        std::uniform_int_distribution<int64_t> dist(lo, hi);
        return dist(rng);
    }

    // [0, 1)
    double unit() {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return dist(rng);
    }

    bool coin() { return int_in(0, 1) == 1; }

    // Uniform index into a non-empty collection of the given size.
    size_t index(size_t size) {
        std::uniform_int_distribution<size_t> dist(0, size - 1);
        return dist(rng);
    }

    uint8_t byte() { return static_cast<uint8_t>(int_in(0, 255)); }

private:
    uint64_t seed_;
    std::mt19937_64 rng;
};

#endif//PROPCHECK_RAND_SOURCE_H
