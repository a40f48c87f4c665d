#pragma once

#include <initializer_list>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../pattern/pattern.hpp"

namespace path {

/**
 * @brief Insertion-ordered attribute map of a matrix path element
 *
 * Each key maps to an optional value: an empty optional is a bare flag
 * (`;key`), which is distinct from the key being absent altogether. find()
 * reports the three cases as nullptr / pointer to nullopt / pointer to value.
 */
template <typename V>
class AttributeMap {
public:
    using entry_type = std::pair<std::string, std::optional<V>>;
    using const_iterator = typename std::vector<entry_type>::const_iterator;

    AttributeMap() = default;
    AttributeMap(std::initializer_list<entry_type> entries) {
        for (const auto &entry : entries) set(entry.first, entry.second);
    }

    // Replaces the value of an existing key in place, keeping its position.
    void set(std::string key, std::optional<V> value) {
        for (auto &entry : entries_) {
            if (entry.first == key) {
                entry.second = std::move(value);
                return;
            }
        }
        entries_.emplace_back(std::move(key), std::move(value));
    }

    const std::optional<V> *find(std::string_view key) const {
        for (const auto &entry : entries_) {
            if (entry.first == key) return &entry.second;
        }
        return nullptr;
    }

    bool contains(std::string_view key) const { return find(key) != nullptr; }
    bool is_flag(std::string_view key) const {
        const auto *value = find(key);
        return value && !value->has_value();
    }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    // Same keys with equal values; order is not significant.
    bool operator==(const AttributeMap &other) const {
        if (size() != other.size()) return false;
        for (const auto &[key, value] : entries_) {
            const auto *theirs = other.find(key);
            if (!theirs || !(*theirs == value)) return false;
        }
        return true;
    }

private:
    std::vector<entry_type> entries_;
};

// One matrix path segment: `name;key=value;flag`.
template <typename T>
struct PathElement {
    T name{};
    AttributeMap<T> attr;

    PathElement() = default;
    explicit PathElement(T name, AttributeMap<T> attr = {})
        : name(std::move(name)), attr(std::move(attr)) {}

    bool equals(const PathElement &other) const {
        return name == other.name && attr == other.attr;
    }
    bool operator==(const PathElement &other) const { return equals(other); }
};

using PathElementString = PathElement<std::string>;

/**
 * @brief Matrix element whose name and attribute values are wildcard patterns
 *
 * test() accepts a concrete element when the name matches and every
 * attribute the pattern mentions is satisfied: a flag only by a flag, a
 * valued attribute by a present value its pattern accepts. Attributes the
 * pattern does not mention are ignored.
 */
class PathElementPattern : public PathElement<pattern::Pattern> {
public:
    using PathElement<pattern::Pattern>::PathElement;

    bool test(const PathElementString &target) const;
};

// `name;key=value;flag` with every reserved character of `operators` escaped.
std::string render_element(const PathElementString &element, char escape, const OperatorSet &operators);
std::string render_element(const PathElementPattern &element, char escape, const OperatorSet &operators);

std::ostream &operator<<(std::ostream &os, const PathElementString &element);
std::ostream &operator<<(std::ostream &os, const PathElementPattern &element);

} // namespace path
