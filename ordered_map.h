#ifndef PROPCHECK_ORDERED_MAP_H
#define PROPCHECK_ORDERED_MAP_H

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/* A string-keyed map that iterates in insertion order.

   This is the shape of generated documents. Keys are unique: `set` on an
   existing key replaces the value and keeps the key where it was, it never
   appends a second entry.

   Lookup is a linear scan; generated documents hold at most a few dozen keys.

   The element type may still be incomplete where OrderedMap<V> is named (the
   recursive Value type relies on that), so member bodies only touch V when
   they are instantiated.
 */
template<typename V>
class OrderedMap {
public:
    using Item = std::pair<std::string, V>;
    using const_iterator = typename std::vector<Item>::const_iterator;

    OrderedMap() = default;

    [[nodiscard]] size_t size() const { return items.size(); }
    [[nodiscard]] bool empty() const { return items.empty(); }

    [[nodiscard]] bool contains(const std::string &key) const { return find(key) != items.size(); }

    // nullptr when absent
    const V *get(const std::string &key) const {
        size_t i = find(key);
        return i == items.size() ? nullptr : &items[i].second;
    }

    const V &at(const std::string &key) const {
        size_t i = find(key);
        if (i == items.size()) {
            throw std::out_of_range("OrderedMap: no such key: " + key);
        }
        return items[i].second;
    }

    void set(const std::string &key, V value) {
        size_t i = find(key);
        if (i == items.size()) {
            items.emplace_back(key, std::move(value));
        } else {
            items[i].second = std::move(value);
        }
    }

    bool erase(const std::string &key) {
        size_t i = find(key);
        if (i == items.size()) { return false; }
        items.erase(items.begin() + static_cast<std::ptrdiff_t>(i));
        return true;
    }

    // Positional access, used by the shrinker to pick a random entry.
    const Item &item_at(size_t index) const { return items.at(index); }

    std::vector<std::string> keys() const {
        std::vector<std::string> out;
        out.reserve(items.size());
        for (const auto &item : items) { out.push_back(item.first); }
        return out;
    }

    std::vector<V> values() const {
        std::vector<V> out;
        out.reserve(items.size());
        for (const auto &item : items) { out.push_back(item.second); }
        return out;
    }

    const_iterator begin() const { return items.begin(); }
    const_iterator end() const { return items.end(); }

    bool operator==(const OrderedMap &rhs) const { return items == rhs.items; }
    bool operator!=(const OrderedMap &rhs) const { return !(*this == rhs); }

private:
    size_t find(const std::string &key) const {
        for (size_t i = 0; i < items.size(); i++) {
            if (items[i].first == key) { return i; }
        }
        return items.size();
    }

    std::vector<Item> items;
};

#endif//PROPCHECK_ORDERED_MAP_H
