#ifndef PROPCHECK_DOCUMENT_GEN_H
#define PROPCHECK_DOCUMENT_GEN_H

#include "generator.h"
#include "scalar_gen.h"
#include "value.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#define PROPCHECK_MAX_TEXT_LENGTH 50
#define PROPCHECK_MAX_BYTES_LENGTH 1000
#define PROPCHECK_MAX_KEY_LENGTH 20
#define PROPCHECK_MAX_CONTAINER_LENGTH 10

namespace Gen {

    namespace detail {

        class DbRefGen : public GenImpl<DbRef> {
        public:
            using value_type = DbRef;
            DbRefGen(Generator<std::string> collection, Generator<Value> id) : collection(std::move(collection)), id(std::move(id)) {}
            DbRef sample(RandSource &rand) const override {
                std::string coll = collection(rand);
                return DbRef(std::move(coll), id(rand));
            }

        private:
            Generator<std::string> collection;
            Generator<Value> id;
        };

    }// namespace detail

    template<typename T>
    Generator<Value> as_value(Generator<T> const &generator) {
        return generator.map([](T v) { return Value(std::move(v)); });
    }

    inline Generator<Value> value(int depth, bool references);

    /* Document keys: key-safe text of length 0..20. */
    inline Generator<std::string> key() {
        return text(int_range(0, PROPCHECK_MAX_KEY_LENGTH));
    }

    /* A reference into a named collection.

       The referenced id is at most one container deep (none at depth 0) and
       may not itself contain references, so reference chains are at most
       one link long.
     */
    inline Generator<DbRef> dbref(int depth = 1) {
        Generator<std::string> collection = key();
        Generator<Value> id = value(std::min(depth, 1), false);
        return detail::make<detail::DbRefGen>(collection, id);
    }

    // list(value(depth - 1), 0..10)
    inline Generator<Sequence> sequence_of_values(int depth, bool references) {
        return list(value(depth - 1, references), int_range(0, PROPCHECK_MAX_CONTAINER_LENGTH));
    }

    // dict(key, value(depth - 1), 0..10)
    inline Generator<Document> document(int depth, bool references = true) {
        return dict(key(), value(depth - 1, references), int_range(0, PROPCHECK_MAX_CONTAINER_LENGTH));
    }

    /* Any document value, nested at most `depth` containers deep.

       Every family below is equally likely. Leaves are long and varied while
       containers stay short, which keeps trees wide and shallow:

       value(0, false) -> one of the nine leaf kinds
       value(2, true)  -> leaves, references, [..] and {..} up to two deep
     */
    inline Generator<Value> value(int depth, bool references) {
        std::vector<Generator<Value>> choices = {
                as_value(text(int_range(0, PROPCHECK_MAX_TEXT_LENGTH))),
                as_value(printable_text(int_range(0, PROPCHECK_MAX_TEXT_LENGTH))),
                as_value(bytes(int_range(0, PROPCHECK_MAX_BYTES_LENGTH))),
                as_value(int_full()),
                as_value(float_full()),
                as_value(boolean()),
                as_value(timestamp()),
                as_value(object_id()),
                constant(Value(Null{})),
        };
        if (references) {
            choices.push_back(as_value(dbref(depth)));
        }
        if (depth > 0) {
            choices.push_back(as_value(sequence_of_values(depth, references)));
            choices.push_back(as_value(document(depth, references)));
        }
        return choose(std::move(choices));
    }

}// namespace Gen

#endif//PROPCHECK_DOCUMENT_GEN_H
