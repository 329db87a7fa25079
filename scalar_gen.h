#ifndef PROPCHECK_SCALAR_GEN_H
#define PROPCHECK_SCALAR_GEN_H

#include "generator.h"
#include "rand_source.h"
#include "value.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace Gen {

    namespace detail {

        inline std::string utf8_encode(uint32_t cp) {
            std::string out;
            if (cp < 0x80) {
                out.push_back(static_cast<char>(cp));
            } else if (cp < 0x800) {
                out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp < 0x10000) {
                out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
            return out;
        }

        inline std::string join(const std::vector<std::string> &parts) {
            std::string out;
            for (const auto &p : parts) { out += p; }
            return out;
        }

        class TimestampGen : public GenImpl<Timestamp> {
        public:
            using value_type = Timestamp;
            Timestamp sample(RandSource &rand) const override {
                Timestamp t;
                t.year = static_cast<int>(rand.int_in(1970, 2037));
                t.month = static_cast<int>(rand.int_in(1, 12));
                t.day = static_cast<int>(rand.int_in(1, 28));
                t.hour = static_cast<int>(rand.int_in(0, 23));
                t.minute = static_cast<int>(rand.int_in(0, 59));
                t.second = static_cast<int>(rand.int_in(0, 59));
                t.millisecond = static_cast<int>(rand.int_in(0, 999));
                return t;
            }
        };

        class ObjectIdGen : public GenImpl<ObjectId> {
        public:
            using value_type = ObjectId;
            ObjectId sample(RandSource &rand) const override {
                auto now = std::chrono::system_clock::now().time_since_epoch();
                auto secs = static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
                ObjectId::Bytes bytes{};
                bytes[0] = static_cast<uint8_t>(secs >> 24);
                bytes[1] = static_cast<uint8_t>(secs >> 16);
                bytes[2] = static_cast<uint8_t>(secs >> 8);
                bytes[3] = static_cast<uint8_t>(secs);
                for (size_t i = 4; i < bytes.size(); i++) {
                    bytes[i] = rand.byte();
                }
                return ObjectId(bytes);
            }
        };

        class RegexGen : public GenImpl<Regex> {
        public:
            using value_type = Regex;
            explicit RegexGen(Generator<std::string> pattern) : pattern(std::move(pattern)) {}
            Regex sample(RandSource &rand) const override {
                Regex r;
                r.pattern = pattern(rand);
                if (rand.coin()) { r.flags |= Regex::IGNORECASE; }
                if (rand.coin()) { r.flags |= Regex::MULTILINE; }
                if (rand.coin()) { r.flags |= Regex::VERBOSE; }
                return r;
            }

        private:
            Generator<std::string> pattern;
        };

    }// namespace detail

    // One code point in 1..0xFFF, UTF-8 encoded.
    inline Generator<std::string> unichar() {
        return int_range(1, 0xFFF).map([](int64_t cp) { return detail::utf8_encode(static_cast<uint32_t>(cp)); });
    }

    /* Text that is safe to use as a document key: code points 1..0xFFF with
       every '.' and '$' dropped after joining.

       Dropping happens after the length is sampled, so the result can be
       shorter than asked for:

       Gen::text(Gen::int_range(5, 5)) -> 5 code points, or 4 if one was a '.'
     */
    inline Generator<std::string> text(Generator<int64_t> const &length) {
        return list(unichar(), length).map([](const std::vector<std::string> &chars) {
            std::string joined = detail::join(chars);
            std::string out;
            out.reserve(joined.size());
            for (char c : joined) {
                if (c != '.' && c != '$') { out.push_back(c); }
            }
            return out;
        });
    }

    // ASCII 32..126
    inline Generator<std::string> printable_char() {
        return int_range(32, 126).map([](int64_t c) { return std::string(1, static_cast<char>(c)); });
    }

    inline Generator<std::string> printable_text(Generator<int64_t> const &length) {
        return list(printable_char(), length).map(detail::join);
    }

    // Code points 0..255, UTF-8 encoded (so 128..255 take two bytes).
    inline Generator<std::string> latin1_char() {
        return int_range(0, 255).map([](int64_t cp) { return detail::utf8_encode(static_cast<uint32_t>(cp)); });
    }

    inline Generator<std::string> latin1_text(Generator<int64_t> const &length) {
        return list(latin1_char(), length).map(detail::join);
    }

    inline Generator<uint8_t> byte() {
        return int_range(0, 255).map([](int64_t b) { return static_cast<uint8_t>(b); });
    }

    // Raw bytes, wrapped as Binary with the generic subtype 0.
    inline Generator<Binary> bytes(Generator<int64_t> const &length) {
        return list(byte(), length).map([](const std::vector<uint8_t> &raw) {
            return Binary(std::string(raw.begin(), raw.end()));
        });
    }

    /* Every field drawn independently:

       year 1970..2037, month 1..12, day 1..28, hour 0..23, minute 0..59,
       second 0..59, millisecond 0..999.

       Days stop at 28 so no month/leap-year combination is ever invalid.
     */
    inline Generator<Timestamp> timestamp() {
        return detail::make<detail::TimestampGen>();
    }

    // A fresh id per sample, stamped with the current time.
    inline Generator<ObjectId> object_id() {
        return detail::make<detail::ObjectIdGen>();
    }

    /* Patterns only ever repeat the letter 'a'; the three flags are each set
       with probability 1/2.

       Gen::regex(Gen::int_range(0, 3)) -> Regex("aa", IGNORECASE | VERBOSE), ...
     */
    inline Generator<Regex> regex(Generator<int64_t> const &length) {
        auto pattern = list(constant(std::string("a")), length).map(detail::join);
        return detail::make<detail::RegexGen>(pattern);
    }

}// namespace Gen

#endif//PROPCHECK_SCALAR_GEN_H
