#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "../lexer/escape.hpp"
#include "../lexer/tokenizer.hpp"
#include "constants.hpp"

namespace path {

namespace detail {

template <typename T>
std::string element_text(const T &value) {
    if constexpr (std::is_convertible_v<const T &, std::string_view>) {
        return std::string(std::string_view(value));
    } else {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    }
}

} // namespace detail

/**
 * @brief Immutable ordered sequence of path elements
 *
 * Derived is the concrete path type (CRTP). Every derivation (tail, parent,
 * slice, add, ...) returns a new Derived built from a copy of the elements,
 * so a MatrixPath stays a MatrixPath through any chain of operations.
 *
 * Derived must be constructible from std::vector<T>, and may define its own
 * public compare_elements(a, b) to replace operator== as the element equality
 * used by equals, starts_with and ends_with.
 */
template <typename Derived, typename T>
class PathBase {
public:
    using value_type = T;
    using const_iterator = typename std::vector<T>::const_iterator;

    PathBase() = default;
    explicit PathBase(std::vector<T> elements) : elements_(std::move(elements)) {}

    template <typename... Args>
    static Derived of(Args &&...elements) {
        std::vector<T> values;
        values.reserve(sizeof...(elements));
        (values.emplace_back(std::forward<Args>(elements)), ...);
        return Derived(std::move(values));
    }

    size_t size() const { return elements_.size(); }
    bool empty() const { return elements_.empty(); }
    const T &element(size_t index) const { return elements_.at(index); }
    const std::vector<T> &elements() const { return elements_; }

    const_iterator begin() const { return elements_.begin(); }
    const_iterator end() const { return elements_.end(); }

    // Precondition: !empty().
    const T &head() const {
        if (empty()) throw std::out_of_range("head() of an empty path");
        return elements_.front();
    }

    // Precondition: !empty().
    const T &last() const {
        if (empty()) throw std::out_of_range("last() of an empty path");
        return elements_.back();
    }

    Derived tail() const { return consume(1); }

    // Negative counts are taken from the end, as in slice().
    Derived consume(std::ptrdiff_t count) const {
        size_t from = clamp_index(count);
        if (from == size()) return Derived();
        return make(std::vector<T>(elements_.begin() + from, elements_.end()));
    }

    Derived parent() const {
        if (empty()) return Derived();
        return make(std::vector<T>(elements_.begin(), elements_.end() - 1));
    }

    template <typename... Args>
    Derived add(Args &&...more) const {
        std::vector<T> values = elements_;
        (values.emplace_back(std::forward<Args>(more)), ...);
        return make(std::move(values));
    }

    Derived add_all(const PathBase &other) const {
        std::vector<T> values = elements_;
        values.insert(values.end(), other.elements_.begin(), other.elements_.end());
        return make(std::move(values));
    }

    Derived prepend(T element) const {
        std::vector<T> values;
        values.reserve(size() + 1);
        values.push_back(std::move(element));
        values.insert(values.end(), elements_.begin(), elements_.end());
        return make(std::move(values));
    }

    // Half-open [begin, end). Negative indices count from the end; both are
    // clamped to the path, an empty or inverted range gives an empty path.
    Derived slice(std::ptrdiff_t begin, std::ptrdiff_t end) const {
        size_t from = clamp_index(begin);
        size_t to = clamp_index(end);
        if (to <= from) return Derived();
        return make(std::vector<T>(elements_.begin() + from, elements_.begin() + to));
    }

    bool equals(const PathBase &other) const {
        return size() == other.size() && aligned(other, 0);
    }

    bool operator==(const PathBase &other) const { return equals(other); }

    bool starts_with(const PathBase &prefix) const {
        return size() >= prefix.size() && aligned(prefix, 0);
    }

    bool ends_with(const PathBase &suffix) const {
        return size() >= suffix.size() && aligned(suffix, size() - suffix.size());
    }

    template <typename Predicate>
    std::optional<T> find(Predicate predicate) const {
        for (const auto &element : elements_) {
            if (predicate(element)) return element;
        }
        return std::nullopt;
    }

    template <typename Predicate>
    std::ptrdiff_t find_index(Predicate predicate) const {
        for (size_t i = 0; i < elements_.size(); ++i) {
            if (predicate(elements_[i])) return static_cast<std::ptrdiff_t>(i);
        }
        return -1;
    }

    // Paths of different length never match. Otherwise every element of
    // `patterns` must accept the element at the same position.
    template <typename OtherDerived, typename U>
    bool matches(const PathBase<OtherDerived, U> &patterns) const {
        if (size() != patterns.size()) return false;
        for (size_t i = 0; i < elements_.size(); ++i) {
            if (!patterns.element(i).test(elements_[i])) return false;
        }
        return true;
    }

    bool compare_elements(const T &a, const T &b) const { return a == b; }

    friend std::ostream &operator<<(std::ostream &os, const Derived &value) {
        return os << value.to_string();
    }

private:
    std::vector<T> elements_;

    const Derived &derived() const { return static_cast<const Derived &>(*this); }

    Derived make(std::vector<T> values) const { return Derived(std::move(values)); }

    // Compares `other` against this path starting at `offset`.
    bool aligned(const PathBase &other, size_t offset) const {
        for (size_t i = 0; i < other.size(); ++i) {
            if (!derived().compare_elements(other.elements_[i], elements_[i + offset])) return false;
        }
        return true;
    }

    size_t clamp_index(std::ptrdiff_t index) const {
        auto length = static_cast<std::ptrdiff_t>(size());
        if (index < 0) index += length;
        if (index < 0) return 0;
        return static_cast<size_t>(std::min(index, length));
    }
};

/**
 * @brief A path of plain values, `a/b/c`
 *
 * Non-string element types are rendered with operator<<; only paths whose
 * elements can be built from a std::string can be parsed.
 */
template <typename T = std::string>
class Path : public PathBase<Path<T>, T> {
public:
    using PathBase<Path<T>, T>::PathBase;

    static Path parse(std::string_view text, char escape = DEFAULT_ESCAPE) {
        static_assert(std::is_constructible_v<T, std::string>,
                      "Path::parse needs elements constructible from std::string");
        std::vector<T> elements;
        for (const auto &token : tokenize(text, escape, DEFAULT_PATH_OPERATORS)) {
            if (token.type == TOKEN_LITERAL) elements.emplace_back(token.value);
        }
        return Path(std::move(elements));
    }

    std::string to_string(char escape = DEFAULT_ESCAPE,
                          const OperatorSet &operators = DEFAULT_PATH_OPERATORS) const {
        std::string result;
        for (size_t i = 0; i < this->size(); ++i) {
            if (i > 0) result += '/';
            result += escape_string(detail::element_text(this->element(i)), escape, operators);
        }
        return result;
    }
};

using StringPath = Path<std::string>;

} // namespace path
