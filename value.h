#ifndef PROPCHECK_VALUE_H
#define PROPCHECK_VALUE_H

#include "ordered_map.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

struct Value;

struct Null {
    bool operator==(const Null &) const = default;
};

/* A byte string with a subtype tag, 0 being "generic binary". */
class Binary {
public:
    Binary() = default;
    explicit Binary(std::string data, int subtype = 0) : bytes(std::move(data)) {
        if (subtype < 0 || subtype > 255) {
            throw std::invalid_argument("Binary: subtype must be in 0..255, got " + std::to_string(subtype));
        }
        tag = static_cast<uint8_t>(subtype);
    }

    [[nodiscard]] const std::string &data() const { return bytes; }
    [[nodiscard]] int subtype() const { return tag; }
    [[nodiscard]] size_t size() const { return bytes.size(); }

    bool operator==(const Binary &) const = default;

private:
    std::string bytes;
    uint8_t tag = 0;
};

/* A naive calendar instant with millisecond precision. No time zone.

   The constructor rejects out-of-range fields; days are only checked
   against 1..31.
 */
struct Timestamp {
    Timestamp() = default;
    Timestamp(int year, int month, int day, int hour = 0, int minute = 0, int second = 0, int millisecond = 0)
        : year(year), month(month), day(day), hour(hour), minute(minute), second(second), millisecond(millisecond) {
        check_field("month", month, 1, 12);
        check_field("day", day, 1, 31);
        check_field("hour", hour, 0, 23);
        check_field("minute", minute, 0, 59);
        check_field("second", second, 0, 59);
        check_field("millisecond", millisecond, 0, 999);
    }

    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int millisecond = 0;

    bool operator==(const Timestamp &) const = default;

    // Proleptic Gregorian, treating the fields as UTC.
    [[nodiscard]] int64_t millis_since_epoch() const {
        int64_t y = year - (month <= 2 ? 1 : 0);
        int64_t era = (y >= 0 ? y : y - 399) / 400;
        int64_t yoe = y - era * 400;
        int64_t mp = (month + 9) % 12;
        int64_t doy = (153 * mp + 2) / 5 + day - 1;
        int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        int64_t days = era * 146097 + doe - 719468;
        int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second;
        return secs * 1000 + millisecond;
    }

private:
    static void check_field(const char *name, int v, int lo, int hi) {
        if (v < lo || v > hi) {
            throw std::invalid_argument(std::string("Timestamp: ") + name + " must be in " + std::to_string(lo) + ".." +
                                        std::to_string(hi) + ", got " + std::to_string(v));
        }
    }
};

/* 12 bytes: 4 bytes of big-endian seconds since the epoch, then 8 bytes of
   randomness. Built by Gen::object_id(); the default value is all zeros.
 */
class ObjectId {
public:
    using Bytes = std::array<uint8_t, 12>;

    ObjectId() : raw{} {}
    explicit ObjectId(const Bytes &bytes) : raw(bytes) {}

    [[nodiscard]] const Bytes &bytes() const { return raw; }

    [[nodiscard]] uint32_t seconds() const {
        return (static_cast<uint32_t>(raw[0]) << 24) | (static_cast<uint32_t>(raw[1]) << 16) |
               (static_cast<uint32_t>(raw[2]) << 8) | static_cast<uint32_t>(raw[3]);
    }

    [[nodiscard]] std::string hex() const {
        static const char digits[] = "0123456789abcdef";
        std::string out;
        out.reserve(24);
        for (uint8_t b : raw) {
            out.push_back(digits[b >> 4]);
            out.push_back(digits[b & 0x0F]);
        }
        return out;
    }

    bool operator==(const ObjectId &) const = default;

private:
    Bytes raw;
};

struct Regex {
    static constexpr int IGNORECASE = 2;
    static constexpr int MULTILINE = 8;
    static constexpr int VERBOSE = 64;

    std::string pattern;
    int flags = 0;

    bool operator==(const Regex &) const = default;
};

/* A reference to a document in another collection: the collection name and
   the id of the referenced document. The id is owned; copies are deep.
 */
class DbRef {
public:
    DbRef(std::string collection, Value id);
    DbRef(const DbRef &other);
    DbRef(DbRef &&other) noexcept;
    DbRef &operator=(const DbRef &other);
    DbRef &operator=(DbRef &&other) noexcept;
    ~DbRef();

    [[nodiscard]] const std::string &collection() const { return coll; }
    [[nodiscard]] const Value &id() const { return *target; }

    bool operator==(const DbRef &rhs) const;

private:
    std::string coll;
    std::unique_ptr<Value> target;
};

using Sequence = std::vector<Value>;
using Document = OrderedMap<Value>;

/* Any generated document value.

   The alternatives are closed: everything that inspects a Value (rendering,
   shrinking, depth measurement) visits all of them.
 */
struct Value {
    using Variant = std::variant<Null, bool, int64_t, double, std::string, Binary, Timestamp, ObjectId, Regex, Sequence, Document, DbRef>;

    Variant data;

    Value() : data(Null{}) {}
    Value(Null n) : data(n) {}
    Value(bool b) : data(b) {}
    Value(int i) : data(static_cast<int64_t>(i)) {}
    Value(int64_t i) : data(i) {}
    Value(double d) : data(d) {}
    Value(const char *s) : data(std::string(s)) {}
    Value(std::string s) : data(std::move(s)) {}
    Value(Binary b) : data(std::move(b)) {}
    Value(Timestamp t) : data(t) {}
    Value(ObjectId o) : data(o) {}
    Value(Regex r) : data(std::move(r)) {}
    Value(Sequence s) : data(std::move(s)) {}
    Value(Document d) : data(std::move(d)) {}
    Value(DbRef r) : data(std::move(r)) {}

    template<typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    template<typename T>
    const T &as() const { return std::get<T>(data); }

    bool operator==(const Value &rhs) const { return data == rhs.data; }
    bool operator!=(const Value &rhs) const { return !(*this == rhs); }
};

inline DbRef::DbRef(std::string collection, Value id)
    : coll(std::move(collection)), target(std::make_unique<Value>(std::move(id))) {}
inline DbRef::DbRef(const DbRef &other) : coll(other.coll), target(std::make_unique<Value>(*other.target)) {}
inline DbRef::DbRef(DbRef &&other) noexcept = default;
inline DbRef &DbRef::operator=(const DbRef &other) {
    if (this != &other) {
        coll = other.coll;
        target = std::make_unique<Value>(*other.target);
    }
    return *this;
}
inline DbRef &DbRef::operator=(DbRef &&other) noexcept = default;
inline DbRef::~DbRef() = default;
inline bool DbRef::operator==(const DbRef &rhs) const {
    return coll == rhs.coll && *target == *rhs.target;
}

/* Key whose presence marks a plain document as a reference in disguise. */
inline const std::string REFERENCE_KEY = "$ref";

// Sequences and documents count one level each; a reference is as deep as
// its id.
inline size_t nesting_depth(const Value &value) {
    if (auto seq = std::get_if<Sequence>(&value.data)) {
        size_t deepest = 0;
        for (const Value &item : *seq) { deepest = std::max(deepest, nesting_depth(item)); }
        return deepest + 1;
    }
    if (auto doc = std::get_if<Document>(&value.data)) {
        size_t deepest = 0;
        for (const auto &item : *doc) { deepest = std::max(deepest, nesting_depth(item.second)); }
        return deepest + 1;
    }
    if (auto ref = std::get_if<DbRef>(&value.data)) {
        return nesting_depth(ref->id());
    }
    return 0;
}

namespace repr {

    inline std::string quoted(const std::string &s) {
        std::string out = "\"";
        for (unsigned char c : s) {
            switch (c) {
                case '"': out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n"; break;
                case '\t': out += "\\t"; break;
                default:
                    if (c < 0x20 || c == 0x7F) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\x%02x", c);
                        out += buf;
                    } else {
                        out.push_back(static_cast<char>(c));
                    }
            }
        }
        out += "\"";
        return out;
    }

    inline std::string two_digits(int n) {
        return (n < 10 ? "0" : "") + std::to_string(n);
    }

}// namespace repr

inline std::string to_string(const Timestamp &t) {
    // Fields are public, so a hand-edited one may be wide or negative.
    std::string ms = std::to_string(t.millisecond);
    if (ms.size() < 3) { ms.insert(0, 3 - ms.size(), '0'); }
    return std::to_string(t.year) + "-" + repr::two_digits(t.month) + "-" + repr::two_digits(t.day) + "T" +
           repr::two_digits(t.hour) + ":" + repr::two_digits(t.minute) + ":" + repr::two_digits(t.second) + "." + ms;
}

inline std::string to_string(const Value &value);

inline std::string to_string(const Document &doc) {
    std::string out = "{";
    bool first = true;
    for (const auto &item : doc) {
        if (!first) { out += ", "; }
        first = false;
        out += repr::quoted(item.first) + ": " + to_string(item.second);
    }
    return out + "}";
}

inline std::string to_string(const Sequence &seq) {
    std::string out = "[";
    for (size_t i = 0; i < seq.size(); i++) {
        if (i > 0) { out += ", "; }
        out += to_string(seq[i]);
    }
    return out + "]";
}

inline std::string to_string(const Value &value) {
    struct stringifier {
        std::string operator()(Null) { return "null"; }
        std::string operator()(bool b) { return b ? "true" : "false"; }
        std::string operator()(int64_t i) { return std::to_string(i); }
        std::string operator()(double d) {
            std::ostringstream os;
            os.precision(17);
            os << d;
            return os.str();
        }
        std::string operator()(const std::string &s) { return repr::quoted(s); }
        std::string operator()(const Binary &b) {
            return "Binary(" + repr::quoted(b.data()) + ", " + std::to_string(b.subtype()) + ")";
        }
        std::string operator()(const Timestamp &t) { return "Timestamp(" + to_string(t) + ")"; }
        std::string operator()(const ObjectId &o) { return "ObjectId(" + o.hex() + ")"; }
        std::string operator()(const Regex &r) {
            return "Regex(" + repr::quoted(r.pattern) + ", " + std::to_string(r.flags) + ")";
        }
        std::string operator()(const Sequence &s) { return to_string(s); }
        std::string operator()(const Document &d) { return to_string(d); }
        std::string operator()(const DbRef &r) {
            return "DbRef(" + repr::quoted(r.collection()) + ", " + to_string(r.id()) + ")";
        }
    };
    return std::visit(stringifier{}, value.data);
}

inline std::ostream &operator<<(std::ostream &os, const Value &value) {
    return os << to_string(value);
}

inline std::ostream &operator<<(std::ostream &os, const Document &doc) {
    return os << to_string(doc);
}

#endif//PROPCHECK_VALUE_H
