#ifndef PROPCHECK_SHRINK_H
#define PROPCHECK_SHRINK_H

#include "check_result.h"
#include "config.h"
#include "ordered_map.h"
#include "rand_source.h"
#include "show.h"
#include "value.h"

#include <cstddef>
#include <exception>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

template<typename T>
struct ShrinkProposal {
    bool changed;
    T candidate;
};

template<typename T>
ShrinkProposal<T> no_change(const T &value) {
    return ShrinkProposal<T>{false, value};
}

/* One random simplification step.

   Containers either lose one random element (probability 1/2) or get one
   random element simplified in place; in the latter case the proposal is
   only "changed" if the element was. Everything else is already as simple
   as it gets.

   Every changed proposal holds strictly fewer elements somewhere in the
   tree, which is what makes `reduce` terminate.
 */
template<typename T>
ShrinkProposal<T> simplify(const T &value, RandSource &rand);
template<typename T>
ShrinkProposal<std::vector<T>> simplify(const std::vector<T> &seq, RandSource &rand);
template<typename V>
ShrinkProposal<OrderedMap<V>> simplify(const OrderedMap<V> &map, RandSource &rand);
inline ShrinkProposal<Value> simplify(const Value &value, RandSource &rand);

template<typename T>
ShrinkProposal<T> simplify(const T &value, RandSource &) {
    return no_change(value);
}

template<typename T>
ShrinkProposal<std::vector<T>> simplify(const std::vector<T> &seq, RandSource &rand) {
    bool delete_one = rand.coin();
    if (seq.empty()) {
        return no_change(seq);
    }
    size_t index = rand.index(seq.size());
    std::vector<T> simplified = seq;
    if (delete_one) {
        simplified.erase(simplified.begin() + static_cast<std::ptrdiff_t>(index));
        return ShrinkProposal<std::vector<T>>{true, std::move(simplified)};
    }
    ShrinkProposal<T> element = simplify(seq[index], rand);
    if (!element.changed) {
        return no_change(seq);
    }
    simplified[index] = std::move(element.candidate);
    return ShrinkProposal<std::vector<T>>{true, std::move(simplified)};
}

// Documents carrying the reference key are references in disguise and are
// left whole.
template<typename V>
ShrinkProposal<OrderedMap<V>> simplify(const OrderedMap<V> &map, RandSource &rand) {
    if (map.contains(REFERENCE_KEY)) {
        return no_change(map);
    }
    bool delete_one = rand.coin();
    if (map.empty()) {
        return no_change(map);
    }
    const auto &picked = map.item_at(rand.index(map.size()));
    OrderedMap<V> simplified = map;
    if (delete_one) {
        simplified.erase(picked.first);
        return ShrinkProposal<OrderedMap<V>>{true, std::move(simplified)};
    }
    ShrinkProposal<V> element = simplify(picked.second, rand);
    if (!element.changed) {
        return no_change(map);
    }
    simplified.set(picked.first, std::move(element.candidate));
    return ShrinkProposal<OrderedMap<V>>{true, std::move(simplified)};
}

namespace shrink_detail {

    struct simplifier {
        const Value &value;
        RandSource &rand;

        ShrinkProposal<Value> operator()(const Sequence &seq) { return lift(simplify(seq, rand)); }
        ShrinkProposal<Value> operator()(const Document &doc) { return lift(simplify(doc, rand)); }
        // Scalars and references: nothing to take away.
        template<typename Leaf>
        ShrinkProposal<Value> operator()(const Leaf &) { return no_change(value); }

        template<typename C>
        ShrinkProposal<Value> lift(ShrinkProposal<C> p) {
            if (!p.changed) { return no_change(value); }
            return ShrinkProposal<Value>{true, Value(std::move(p.candidate))};
        }
    };

}// namespace shrink_detail

inline ShrinkProposal<Value> simplify(const Value &value, RandSource &rand) {
    return std::visit(shrink_detail::simplifier{value, rand}, value.data);
}

/* Runs the predicate, turning whatever it throws into a Raised verdict.

   This is the one place where predicate exceptions stop: the checker and
   the shrinker only ever see the Verdict.
 */
template<typename T, typename FN>
Verdict evaluate(FN &predicate, const T &value) {
    try {
        if (predicate(value)) {
            return Holds{};
        }
        return Falsified{};
    } catch (const std::exception &e) {
        return Raised{e.what()};
    } catch (...) {
        return Raised{"unknown exception"};
    }
}

/* Greedy descent from a failing value.

   Up to `config.reduction_attempts` proposals are tried on the current value.
   The first one that still falsifies the predicate is accepted and the search
   starts over from it; proposals that make the predicate hold again went too
   far and are dropped. When a whole round of attempts brings nothing, the
   current value is the result.

   If the predicate throws on a proposal, shrinking stops right there and the
   error is returned instead.

   reduce([5, 5, 5], sum < 10) -> Shrunk{1, [5, 5]}
 */
template<typename T, typename FN>
ReduceResult<T> reduce(T value, FN &predicate, RandSource &rand, const CheckConfig &config) {
    if (config.verbose) {
        *config.log << "Let's shrink: " << show(value) << std::endl;
    }
    size_t reductions = 0;
    bool improved;
    do {
        improved = false;
        for (size_t attempt = 0; attempt < config.reduction_attempts && !improved; attempt++) {
            ShrinkProposal<T> proposal = simplify(value, rand);
            if (!proposal.changed) {
                continue;
            }
            Verdict verdict = evaluate(predicate, proposal.candidate);
            if (auto raised = std::get_if<Raised>(&verdict)) {
                if (config.verbose) {
                    *config.log << "Predicate raised while shrinking: " << raised->error << std::endl;
                }
                return *raised;
            }
            if (std::holds_alternative<Falsified>(verdict)) {
                value = std::move(proposal.candidate);
                reductions++;
                improved = true;
                if (config.verbose) {
                    *config.log << "Shrunk to: " << show(value) << std::endl;
                }
            }
        }
    } while (improved);

    if (config.verbose) {
        *config.log << "Done shrinking after " << reductions << " reductions" << std::endl;
    }
    return Shrunk<T>{reductions, std::move(value)};
}

#endif//PROPCHECK_SHRINK_H
