#ifndef PROPCHECK_GENERATOR_H
#define PROPCHECK_GENERATOR_H

#include "misuse_error.h"
#include "ordered_map.h"
#include "rand_source.h"

#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

/* One sampling strategy. Each combinator below is a small subclass of this.

   Implementations hold no mutable state: `sample` is const and every bit of
   randomness comes from the RandSource it is handed.
 */
template<typename T>
class GenImpl {
public:
    virtual ~GenImpl() = default;
    virtual T sample(RandSource &rand) const = 0;
};

template<typename T>
class Generator {
public:
    using value_type = T;

    explicit Generator(std::shared_ptr<const GenImpl<T>> implementation) : impl(std::move(implementation)) {}

    T operator()(RandSource &rand) const {
        return impl->sample(rand);
    }

    template<typename FN>
    Generator<std::invoke_result_t<FN, T>> map(FN map_fn) const;

private:
    std::shared_ptr<const GenImpl<T>> impl;
};

namespace Gen {

    namespace detail {

        template<typename Impl, typename... Args>
        Generator<typename Impl::value_type> make(Args &&...args) {
            return Generator<typename Impl::value_type>(std::make_shared<const Impl>(std::forward<Args>(args)...));
        }

        template<typename T>
        class ConstantGen : public GenImpl<T> {
        public:
            using value_type = T;
            explicit ConstantGen(T value) : value(std::move(value)) {}
            T sample(RandSource &) const override { return value; }

        private:
            T value;
        };

        template<typename T>
        class ChooseValueGen : public GenImpl<T> {
        public:
            using value_type = T;
            explicit ChooseValueGen(std::vector<T> choices) : choices(std::move(choices)) {}
            T sample(RandSource &rand) const override { return choices[rand.index(choices.size())]; }

        private:
            std::vector<T> choices;
        };

        template<typename T>
        class ChooseGen : public GenImpl<T> {
        public:
            using value_type = T;
            explicit ChooseGen(std::vector<Generator<T>> choices) : choices(std::move(choices)) {}
            T sample(RandSource &rand) const override {
                const Generator<T> &picked = choices[rand.index(choices.size())];
                return picked(rand);
            }

        private:
            std::vector<Generator<T>> choices;
        };

        template<typename T, typename FN>
        class MappedGen : public GenImpl<std::invoke_result_t<FN, T>> {
        public:
            using value_type = std::invoke_result_t<FN, T>;
            MappedGen(Generator<T> source, FN map_fn) : source(std::move(source)), map_fn(std::move(map_fn)) {}
            value_type sample(RandSource &rand) const override { return map_fn(source(rand)); }

        private:
            Generator<T> source;
            FN map_fn;
        };

        class IntRangeGen : public GenImpl<int64_t> {
        public:
            using value_type = int64_t;
            IntRangeGen(int64_t min, int64_t max) : min(min), max(max) {}
            int64_t sample(RandSource &rand) const override { return rand.int_in(min, max); }

        private:
            int64_t min;
            int64_t max;
        };

        class FloatGen : public GenImpl<double> {
        public:
            using value_type = double;
            explicit FloatGen(double scale) : scale(scale) {}
            double sample(RandSource &rand) const override { return (rand.unit() - 0.5) * scale; }

        private:
            double scale;
        };

        class BoolGen : public GenImpl<bool> {
        public:
            using value_type = bool;
            bool sample(RandSource &rand) const override { return rand.coin(); }
        };

        inline size_t checked_length(int64_t length) {
            if (length < 0) {
                throw MisuseError("length generator produced a negative length: " + std::to_string(length));
            }
            return static_cast<size_t>(length);
        }

        template<typename T>
        class ListGen : public GenImpl<std::vector<T>> {
        public:
            using value_type = std::vector<T>;
            ListGen(Generator<T> element, Generator<int64_t> length) : element(std::move(element)), length(std::move(length)) {}
            std::vector<T> sample(RandSource &rand) const override {
                size_t n = checked_length(length(rand));
                std::vector<T> out;
                out.reserve(n);
                for (size_t i = 0; i < n; i++) {
                    out.push_back(element(rand));
                }
                return out;
            }

        private:
            Generator<T> element;
            Generator<int64_t> length;
        };

        template<typename V>
        class DictGen : public GenImpl<OrderedMap<V>> {
        public:
            using value_type = OrderedMap<V>;
            DictGen(Generator<std::string> key, Generator<V> value, Generator<int64_t> length)
                : key(std::move(key)), value(std::move(value)), length(std::move(length)) {}
            OrderedMap<V> sample(RandSource &rand) const override {
                size_t n = checked_length(length(rand));
                OrderedMap<V> out;
                for (size_t i = 0; i < n; i++) {
                    std::string k = key(rand);
                    out.set(k, value(rand));
                }
                return out;
            }

        private:
            Generator<std::string> key;
            Generator<V> value;
            Generator<int64_t> length;
        };

    }// namespace detail

    /* Always the same value. FP folks will know this as `pure` or `return`.

       Gen::constant(x) -> x (always)
     */
    template<typename T>
    Generator<T> constant(T const &val) {
        return detail::make<detail::ConstantGen<T>>(val);
    }

    /* A uniformly random element of a fixed, non-empty list.

       Gen::choose_value<int>({1, 2, 3}) -> 1, 2 or 3

       An empty list throws MisuseError right away rather than on first use.
     */
    template<typename T>
    Generator<T> choose_value(std::vector<T> choices) {
        if (choices.empty()) {
            throw MisuseError("choose_value needs at least one value");
        }
        return detail::make<detail::ChooseValueGen<T>>(std::move(choices));
    }

    /* Picks one of the given generators uniformly, then samples it.

       The two-level pick means each generator is one "family" with equal
       weight, no matter how many values the family can produce:

       Gen::choose<int64_t>({Gen::constant<int64_t>(0), Gen::int_full()})
           -> 0 about half of the time
     */
    template<typename T>
    Generator<T> choose(std::vector<Generator<T>> choices) {
        if (choices.empty()) {
            throw MisuseError("choose needs at least one generator");
        }
        return detail::make<detail::ChooseGen<T>>(std::move(choices));
    }

    template<typename T, typename FN>
    Generator<std::invoke_result_t<FN, T>> map(Generator<T> const &generator, FN map_fn) {
        return generator.map(std::move(map_fn));
    }

    /* Uniform integer in the closed interval [min, max].

       Gen::int_range(3, 10) -> 3, 8, 10, ...
       Gen::int_range(3, 3)  -> 3 (always, no randomness consumed)

       `min > max` is a MisuseError.
     */
    inline Generator<int64_t> int_range(int64_t min, int64_t max) {
        if (min > max) {
            throw MisuseError("int_range: min " + std::to_string(min) + " is above max " + std::to_string(max));
        }
        if (min == max) { return constant(min); }
        return detail::make<detail::IntRangeGen>(min, max);
    }

    // Whole signed 32-bit range.
    inline Generator<int64_t> int_full() {
        return int_range(std::numeric_limits<int32_t>::min(), std::numeric_limits<int32_t>::max());
    }

    /* Symmetric around zero and scaled by INT64_MAX, so most samples are huge
       and a few are tiny. Never NaN or infinite.
     */
    inline Generator<double> float_full() {
        return detail::make<detail::FloatGen>(static_cast<double>(std::numeric_limits<int64_t>::max()));
    }

    inline Generator<bool> boolean() {
        return detail::make<detail::BoolGen>();
    }

    /* Samples a length first, then that many independent elements.

       Gen::list(Gen::constant(5), Gen::int_range(3, 3)) -> [5, 5, 5]

       A negative sampled length throws MisuseError.
     */
    template<typename T>
    Generator<std::vector<T>> list(Generator<T> const &element, Generator<int64_t> const &length) {
        return detail::make<detail::ListGen<T>>(element, length);
    }

    /* Samples a length, then that many (key, value) pairs inserted in order.

       A repeated key overwrites the earlier value, so the result can hold
       fewer entries than the sampled length.
     */
    template<typename V>
    Generator<OrderedMap<V>> dict(Generator<std::string> const &key, Generator<V> const &value, Generator<int64_t> const &length) {
        return detail::make<detail::DictGen<V>>(key, value, length);
    }

}// namespace Gen

template<typename T>
template<typename FN>
Generator<std::invoke_result_t<FN, T>> Generator<T>::map(FN map_fn) const {
    return Gen::detail::make<Gen::detail::MappedGen<T, FN>>(*this, std::move(map_fn));
}

#endif//PROPCHECK_GENERATOR_H
