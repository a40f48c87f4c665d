#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include "../span/span.hpp"
#include "stream.hpp"

enum TokenType {
  TOKEN_LITERAL,
  TOKEN_OPERATOR
};

using OperatorSet = std::unordered_set<char>;

struct Token {
  TokenType type;
  std::string value;
  span::Span span{};

  bool operator==(const Token &other) const {
    return type == other.type && value == other.value;
  }
  bool is_operator(char op) const {
    return type == TOKEN_OPERATOR && value.size() == 1 && value[0] == op;
  }
};

inline OperatorSet with_operator(OperatorSet operators, char op) {
  operators.insert(op);
  return operators;
}

// Splits text into literal runs and single-character operator tokens.
//
// An escape character makes the character after it literal, whatever it is;
// a trailing escape with nothing after it is kept as a literal escape
// character. With no escape character every operator character is an
// operator. Adjacent plain and escaped characters form one literal token and
// empty literals are never produced.
//
// The tokenizer keeps a view of `text`, which must outlive it.
class Tokenizer {
  PositionedStream input;
  std::optional<char> escape;
  OperatorSet operators;
  span::SourceId source;
  std::optional<Token> current_;

public:
  Tokenizer(std::string_view text, std::optional<char> escape, OperatorSet operators,
            span::SourceId source = 0)
      : input(text), escape(escape), operators(std::move(operators)), source(source) {
    scan();
  }

  bool done() const { return !current_.has_value(); }
  const Token &current() const { return *current_; }
  void next() { scan(); }

  bool is_operator_char(char c) const { return operators.count(c) > 0; }

private:
  void scan();
  Token scanLiteral();

  span::Span make_span(const Position &start, const Position &end) const {
    return {source, start.offset, end.offset};
  }
};

inline void Tokenizer::scan() {
  if (input.eof()) {
    current_.reset();
    return;
  }
  Position start = input.getPosition();
  char c = input.peek();
  if (!(escape && c == *escape) && is_operator_char(c)) {
    input.advance(1);
    current_ = Token{TOKEN_OPERATOR, std::string(1, c), make_span(start, input.getPosition())};
    return;
  }
  current_ = scanLiteral();
}

inline Token Tokenizer::scanLiteral() {
  Position start = input.getPosition();
  std::string value;
  while (!input.eof()) {
    char c = input.peek();
    if (escape && c == *escape) {
      input.advance(1);
      value += input.eof() ? c : input.get();
      continue;
    }
    if (is_operator_char(c)) break;
    value += input.get();
  }
  return {TOKEN_LITERAL, value, make_span(start, input.getPosition())};
}

inline std::vector<Token> tokenize(std::string_view text, std::optional<char> escape,
                                   const OperatorSet &operators) {
  std::vector<Token> tokens;
  for (Tokenizer tokenizer(text, escape, operators); !tokenizer.done(); tokenizer.next()) {
    tokens.push_back(tokenizer.current());
  }
  return tokens;
}
