#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../span/span.hpp"
#include "../utils/error.hpp"
#include "element.hpp"

namespace path {

/**
 * @brief Assembles matrix path elements from a stream of values and operators
 *
 * The caller feeds the delimiters (`/`, `;`, `=`) with add_operator() and
 * the parsed values between them with add_value(). The most recent delimiter
 * decides what a value is: after `/` it names a new element, after `;` it is
 * an attribute key, after `=` the value of the pending key. Delimiters with
 * no value between them are absorbed.
 *
 * T is the value type (std::string, pattern::Pattern); key_of turns a value
 * into the text of an attribute key.
 */
template <typename T, typename Element>
class MatrixPathBuilder {
public:
    using KeyOf = std::function<std::string(const T &)>;

    explicit MatrixPathBuilder(KeyOf key_of) : key_of_(std::move(key_of)) {}

    void add_operator(char op, span::Span where = span::Span::invalid()) {
        switch (op) {
        case '/': state_ = State::ExpectName; break;
        case ';': state_ = State::ExpectAttrKey; break;
        case '=': state_ = State::ExpectAttrValue; break;
        default: error_helper::report_unexpected_operator(op, where);
        }
        last_operator_ = where;
    }

    // Throws SyntaxError when a value follows `=` with no attribute key
    // pending.
    void add_value(T value) {
        switch (state_) {
        case State::ExpectAttrValue:
            if (!attr_key_) error_helper::report_unexpected_operator('=', last_operator_);
            attr_.set(std::move(*attr_key_), std::move(value));
            attr_key_.reset();
            break;
        case State::ExpectAttrKey:
            commit_flag();
            attr_key_ = key_of_(value);
            break;
        case State::ExpectName:
            finish_element();
            name_ = std::move(value);
            break;
        }
    }

    std::vector<Element> build() {
        finish_element();
        return std::move(path_);
    }

private:
    enum class State { ExpectName, ExpectAttrKey, ExpectAttrValue };

    // A key with no `=value` yet becomes a bare flag.
    void commit_flag() {
        if (attr_key_) {
            attr_.set(std::move(*attr_key_), std::nullopt);
            attr_key_.reset();
        }
    }

    // Attributes seen before any element name stay pending and go to the
    // first element.
    void finish_element() {
        commit_flag();
        if (name_) {
            path_.emplace_back(std::move(*name_), std::move(attr_));
            name_.reset();
            attr_ = AttributeMap<T>();
        }
    }

    KeyOf key_of_;
    State state_ = State::ExpectName;
    std::optional<T> name_;
    AttributeMap<T> attr_;
    std::optional<std::string> attr_key_;
    span::Span last_operator_ = span::Span::invalid();
    std::vector<Element> path_;
};

} // namespace path
