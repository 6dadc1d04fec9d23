#pragma once

#include "ciflow/core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ciflow {

struct Value;
using Array = std::vector<Value>;

// Dynamically typed expression value: null, bool, number, string or array.
struct Value {
  std::variant<std::monostate, bool, double, std::string, Array> data;

  Value() = default;
  Value(bool b) : data(b) {}
  Value(double d) : data(d) {}
  Value(int i) : data(static_cast<double>(i)) {}
  Value(std::string s) : data(std::move(s)) {}
  Value(std::string_view s) : data(std::string(s)) {}
  Value(const char* s) : data(std::string(s)) {}
  Value(Array a) : data(std::move(a)) {}

  [[nodiscard]] auto is_null() const noexcept -> bool {
    return std::holds_alternative<std::monostate>(data);
  }
  [[nodiscard]] auto is_string() const noexcept -> bool {
    return std::holds_alternative<std::string>(data);
  }
  [[nodiscard]] auto is_array() const noexcept -> bool {
    return std::holds_alternative<Array>(data);
  }

  // null, false, 0, NaN and '' are falsy.
  [[nodiscard]] auto truthy() const -> bool;
  // Text used for ${{ }} substitution and string functions.
  [[nodiscard]] auto to_string() const -> std::string;
  [[nodiscard]] auto to_number() const -> double;
};

// Loose equality: strings compare case-insensitively, mixed types compare
// as numbers.
[[nodiscard]] auto loose_equals(const Value& a, const Value& b) -> bool;

namespace expr {

struct Node;
using NodePtr = std::unique_ptr<const Node>;

struct Literal {
  Value value;
};

// needs.build.result, matrix.os, env['HOME']; "*" is a wildcard segment.
struct Path {
  std::vector<std::string> segments;
};

struct Call {
  std::string name;
  std::vector<NodePtr> args;
};

struct Not {
  NodePtr operand;
};

enum class BinaryOp : std::uint8_t { Eq, Ne, Lt, Le, Gt, Ge, And, Or };

struct Binary {
  BinaryOp op;
  NodePtr lhs;
  NodePtr rhs;
};

struct Node {
  std::variant<Literal, Path, Call, Not, Binary> kind;
  std::size_t offset{0};
};

}  // namespace expr

// Parsed, immutable condition expression. Cheap to copy.
class Expression {
public:
  // Syntax errors and calls with the wrong number of arguments to a known
  // function give InvalidCondition. A surrounding "${{ }}" is accepted.
  [[nodiscard]] static auto parse(std::string_view source)
      -> DetailedResult<Expression>;

  [[nodiscard]] auto source() const noexcept -> const std::string& {
    return source_;
  }
  [[nodiscard]] auto root() const noexcept -> const expr::Node& {
    return *root_;
  }

private:
  Expression(std::string source, std::shared_ptr<const expr::Node> root)
      : source_(std::move(source)), root_(std::move(root)) {}

  std::string source_;
  std::shared_ptr<const expr::Node> root_;
};

// Strips one enclosing "${{ ... }}" and surrounding whitespace.
[[nodiscard]] auto strip_expression_braces(std::string_view text)
    -> std::string_view;

}  // namespace ciflow
