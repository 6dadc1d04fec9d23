#include "ciflow/condition/expression.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <limits>
#include <optional>

namespace ciflow {

namespace {

auto trim(std::string_view sv) -> std::string_view {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
    sv.remove_suffix(1);
  }
  return sv;
}

auto lower(std::string_view s) -> std::string {
  std::string out(s);
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

auto format_number(double d) -> std::string {
  if (std::isnan(d)) {
    return "NaN";
  }
  if (std::isinf(d)) {
    return d > 0 ? "Infinity" : "-Infinity";
  }
  if (d == std::trunc(d) && std::fabs(d) < 1e15) {
    return std::format("{}", static_cast<long long>(d));
  }
  return std::format("{}", d);
}

auto parse_number(std::string_view s) -> std::optional<double> {
  s = trim(s);
  if (s.empty()) {
    return 0.0;
  }
  double out = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc{} || ptr != s.data() + s.size()) {
    return std::nullopt;
  }
  return out;
}

}  // namespace

auto Value::truthy() const -> bool {
  return std::visit(
      [](const auto& v) -> bool {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return false;
        } else if constexpr (std::is_same_v<T, bool>) {
          return v;
        } else if constexpr (std::is_same_v<T, double>) {
          return v != 0.0 && !std::isnan(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return !v.empty();
        } else {
          return true;
        }
      },
      data);
}

auto Value::to_string() const -> std::string {
  return std::visit(
      [](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return {};
        } else if constexpr (std::is_same_v<T, bool>) {
          return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, double>) {
          return format_number(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return v;
        } else {
          std::string out;
          for (std::size_t i = 0; i < v.size(); ++i) {
            if (i > 0) {
              out.push_back(',');
            }
            out += v[i].to_string();
          }
          return out;
        }
      },
      data);
}

auto Value::to_number() const -> double {
  constexpr auto nan = std::numeric_limits<double>::quiet_NaN();
  return std::visit(
      [](const auto& v) -> double {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return 0.0;
        } else if constexpr (std::is_same_v<T, bool>) {
          return v ? 1.0 : 0.0;
        } else if constexpr (std::is_same_v<T, double>) {
          return v;
        } else if constexpr (std::is_same_v<T, std::string>) {
          return parse_number(v).value_or(nan);
        } else {
          return nan;
        }
      },
      data);
}

auto loose_equals(const Value& a, const Value& b) -> bool {
  if (a.data.index() == b.data.index()) {
    if (a.is_string()) {
      return lower(std::get<std::string>(a.data)) ==
             lower(std::get<std::string>(b.data));
    }
    if (a.is_null()) {
      return true;
    }
    if (a.is_array()) {
      return false;
    }
  }
  return a.to_number() == b.to_number();
}

auto strip_expression_braces(std::string_view text) -> std::string_view {
  auto t = trim(text);
  if (t.starts_with("${{") && t.ends_with("}}") && t.size() >= 5) {
    t.remove_prefix(3);
    t.remove_suffix(2);
  }
  return trim(t);
}

namespace {

enum class Tok : std::uint8_t {
  End,
  LParen,
  RParen,
  LBracket,
  RBracket,
  Comma,
  Dot,
  Star,
  Not,
  Eq,
  Ne,
  Lt,
  Le,
  Gt,
  Ge,
  And,
  Or,
  String,
  Number,
  Ident,
};

struct Token {
  Tok kind{Tok::End};
  std::string text;
  double number{0};
  std::size_t offset{0};
};

// Arity bounds of the built-in functions; unknown names are resolved at
// evaluation time.
struct FunctionArity {
  std::string_view name;
  std::size_t min;
  std::size_t max;
};

constexpr FunctionArity kFunctions[] = {
    {"success", 0, 0},    {"failure", 0, 0},    {"cancelled", 0, 0},
    {"always", 0, 0},     {"contains", 2, 2},   {"startswith", 2, 2},
    {"endswith", 2, 2},   {"join", 1, 2},
};

class Parser {
public:
  explicit Parser(std::string_view src) : src_(src) {}

  auto parse() -> DetailedResult<expr::NodePtr> {
    if (auto r = advance(); !r) {
      return std::unexpected(r.error());
    }
    auto root = parse_or();
    if (!root) {
      return root;
    }
    if (cur_.kind != Tok::End) {
      return error("unexpected trailing input");
    }
    return root;
  }

private:
  auto error(std::string_view what) const -> std::unexpected<ErrorDetail> {
    return fail_with(Error::InvalidCondition,
                     std::format("{} at offset {} in '{}'", what, cur_.offset,
                                 src_));
  }

  auto make(std::size_t offset, auto kind) -> expr::NodePtr {
    return std::make_unique<const expr::Node>(
        expr::Node{.kind = std::move(kind), .offset = offset});
  }

  auto advance() -> DetailedResult<void> {
    while (pos_ < src_.size() &&
           std::isspace(static_cast<unsigned char>(src_[pos_]))) {
      ++pos_;
    }
    cur_ = Token{.offset = pos_};
    if (pos_ >= src_.size()) {
      return {};
    }

    char c = src_[pos_];
    auto two = [&](char next) {
      return pos_ + 1 < src_.size() && src_[pos_ + 1] == next;
    };

    switch (c) {
      case '(': cur_.kind = Tok::LParen; ++pos_; return {};
      case ')': cur_.kind = Tok::RParen; ++pos_; return {};
      case '[': cur_.kind = Tok::LBracket; ++pos_; return {};
      case ']': cur_.kind = Tok::RBracket; ++pos_; return {};
      case ',': cur_.kind = Tok::Comma; ++pos_; return {};
      case '.': cur_.kind = Tok::Dot; ++pos_; return {};
      case '*': cur_.kind = Tok::Star; ++pos_; return {};
      case '!':
        cur_.kind = two('=') ? Tok::Ne : Tok::Not;
        pos_ += two('=') ? 2 : 1;
        return {};
      case '=':
        if (!two('=')) {
          return error("expected '=='");
        }
        cur_.kind = Tok::Eq;
        pos_ += 2;
        return {};
      case '<':
        cur_.kind = two('=') ? Tok::Le : Tok::Lt;
        pos_ += two('=') ? 2 : 1;
        return {};
      case '>':
        cur_.kind = two('=') ? Tok::Ge : Tok::Gt;
        pos_ += two('=') ? 2 : 1;
        return {};
      case '&':
        if (!two('&')) {
          return error("expected '&&'");
        }
        cur_.kind = Tok::And;
        pos_ += 2;
        return {};
      case '|':
        if (!two('|')) {
          return error("expected '||'");
        }
        cur_.kind = Tok::Or;
        pos_ += 2;
        return {};
      case '\'':
        return lex_string();
      default:
        break;
    }

    if (std::isdigit(static_cast<unsigned char>(c)) ||
        (c == '-' && pos_ + 1 < src_.size() &&
         std::isdigit(static_cast<unsigned char>(src_[pos_ + 1])))) {
      return lex_number();
    }
    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
      auto start = pos_;
      while (pos_ < src_.size() &&
             (std::isalnum(static_cast<unsigned char>(src_[pos_])) ||
              src_[pos_] == '_' || src_[pos_] == '-')) {
        ++pos_;
      }
      cur_.kind = Tok::Ident;
      cur_.text = std::string(src_.substr(start, pos_ - start));
      return {};
    }
    return error(std::format("unexpected character '{}'", c));
  }

  auto lex_string() -> DetailedResult<void> {
    ++pos_;
    std::string out;
    while (pos_ < src_.size()) {
      if (src_[pos_] == '\'') {
        if (pos_ + 1 < src_.size() && src_[pos_ + 1] == '\'') {
          out.push_back('\'');
          pos_ += 2;
          continue;
        }
        ++pos_;
        cur_.kind = Tok::String;
        cur_.text = std::move(out);
        return {};
      }
      out.push_back(src_[pos_++]);
    }
    return error("unterminated string literal");
  }

  auto lex_number() -> DetailedResult<void> {
    auto start = pos_;
    if (src_[pos_] == '-') {
      ++pos_;
    }
    while (pos_ < src_.size() &&
           (std::isdigit(static_cast<unsigned char>(src_[pos_])) ||
            src_[pos_] == '.')) {
      ++pos_;
    }
    auto text = src_.substr(start, pos_ - start);
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), cur_.number);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
      return error(std::format("invalid number '{}'", text));
    }
    cur_.kind = Tok::Number;
    return {};
  }

  auto expect(Tok kind, std::string_view what) -> DetailedResult<void> {
    if (cur_.kind != kind) {
      return error(std::format("expected {}", what));
    }
    return advance();
  }

  auto parse_or() -> DetailedResult<expr::NodePtr> {
    auto lhs = parse_and();
    while (lhs && cur_.kind == Tok::Or) {
      auto offset = cur_.offset;
      if (auto r = advance(); !r) {
        return std::unexpected(r.error());
      }
      auto rhs = parse_and();
      if (!rhs) {
        return rhs;
      }
      lhs = make(offset, expr::Binary{expr::BinaryOp::Or, std::move(*lhs),
                                      std::move(*rhs)});
    }
    return lhs;
  }

  auto parse_and() -> DetailedResult<expr::NodePtr> {
    auto lhs = parse_unary();
    while (lhs && cur_.kind == Tok::And) {
      auto offset = cur_.offset;
      if (auto r = advance(); !r) {
        return std::unexpected(r.error());
      }
      auto rhs = parse_unary();
      if (!rhs) {
        return rhs;
      }
      lhs = make(offset, expr::Binary{expr::BinaryOp::And, std::move(*lhs),
                                      std::move(*rhs)});
    }
    return lhs;
  }

  auto parse_unary() -> DetailedResult<expr::NodePtr> {
    if (cur_.kind == Tok::Not) {
      auto offset = cur_.offset;
      if (auto r = advance(); !r) {
        return std::unexpected(r.error());
      }
      auto operand = parse_unary();
      if (!operand) {
        return operand;
      }
      return make(offset, expr::Not{std::move(*operand)});
    }
    return parse_comparison();
  }

  static auto comparison_op(Tok t) -> std::optional<expr::BinaryOp> {
    switch (t) {
      case Tok::Eq: return expr::BinaryOp::Eq;
      case Tok::Ne: return expr::BinaryOp::Ne;
      case Tok::Lt: return expr::BinaryOp::Lt;
      case Tok::Le: return expr::BinaryOp::Le;
      case Tok::Gt: return expr::BinaryOp::Gt;
      case Tok::Ge: return expr::BinaryOp::Ge;
      default: return std::nullopt;
    }
  }

  auto parse_comparison() -> DetailedResult<expr::NodePtr> {
    auto lhs = parse_primary();
    if (!lhs) {
      return lhs;
    }
    auto op = comparison_op(cur_.kind);
    if (!op) {
      return lhs;
    }
    auto offset = cur_.offset;
    if (auto r = advance(); !r) {
      return std::unexpected(r.error());
    }
    auto rhs = parse_primary();
    if (!rhs) {
      return rhs;
    }
    if (comparison_op(cur_.kind)) {
      return error("chained comparison needs parentheses");
    }
    return make(offset, expr::Binary{*op, std::move(*lhs), std::move(*rhs)});
  }

  auto parse_primary() -> DetailedResult<expr::NodePtr> {
    auto offset = cur_.offset;
    switch (cur_.kind) {
      case Tok::LParen: {
        if (auto r = advance(); !r) {
          return std::unexpected(r.error());
        }
        auto inner = parse_or();
        if (!inner) {
          return inner;
        }
        if (auto r = expect(Tok::RParen, "')'"); !r) {
          return std::unexpected(r.error());
        }
        return inner;
      }
      case Tok::String: {
        auto node = make(offset, expr::Literal{Value{std::move(cur_.text)}});
        if (auto r = advance(); !r) {
          return std::unexpected(r.error());
        }
        return node;
      }
      case Tok::Number: {
        auto node = make(offset, expr::Literal{Value{cur_.number}});
        if (auto r = advance(); !r) {
          return std::unexpected(r.error());
        }
        return node;
      }
      case Tok::Ident:
        return parse_identifier();
      case Tok::End:
        return error("unexpected end of expression");
      default:
        return error("expected a value");
    }
  }

  auto parse_identifier() -> DetailedResult<expr::NodePtr> {
    auto offset = cur_.offset;
    auto name = std::move(cur_.text);
    if (auto r = advance(); !r) {
      return std::unexpected(r.error());
    }

    if (name == "true" || name == "false") {
      return make(offset, expr::Literal{Value{name == "true"}});
    }
    if (name == "null") {
      return make(offset, expr::Literal{Value{}});
    }

    if (cur_.kind == Tok::LParen) {
      return parse_call(offset, std::move(name));
    }

    expr::Path path;
    path.segments.push_back(std::move(name));
    for (;;) {
      if (cur_.kind == Tok::Dot) {
        if (auto r = advance(); !r) {
          return std::unexpected(r.error());
        }
        if (cur_.kind == Tok::Star) {
          path.segments.emplace_back("*");
        } else if (cur_.kind == Tok::Ident) {
          path.segments.push_back(std::move(cur_.text));
        } else {
          return error("expected property name after '.'");
        }
        if (auto r = advance(); !r) {
          return std::unexpected(r.error());
        }
      } else if (cur_.kind == Tok::LBracket) {
        if (auto r = advance(); !r) {
          return std::unexpected(r.error());
        }
        if (cur_.kind == Tok::String) {
          path.segments.push_back(std::move(cur_.text));
        } else if (cur_.kind == Tok::Star) {
          path.segments.emplace_back("*");
        } else {
          return error("expected quoted property name");
        }
        if (auto r = advance(); !r) {
          return std::unexpected(r.error());
        }
        if (auto r = expect(Tok::RBracket, "']'"); !r) {
          return std::unexpected(r.error());
        }
      } else {
        break;
      }
    }
    return make(offset, std::move(path));
  }

  auto parse_call(std::size_t offset, std::string name)
      -> DetailedResult<expr::NodePtr> {
    if (auto r = advance(); !r) {
      return std::unexpected(r.error());
    }
    expr::Call call{.name = lower(name), .args = {}};
    if (cur_.kind != Tok::RParen) {
      for (;;) {
        auto arg = parse_or();
        if (!arg) {
          return arg;
        }
        call.args.push_back(std::move(*arg));
        if (cur_.kind != Tok::Comma) {
          break;
        }
        if (auto r = advance(); !r) {
          return std::unexpected(r.error());
        }
      }
    }
    if (auto r = expect(Tok::RParen, "')' after arguments"); !r) {
      return std::unexpected(r.error());
    }

    auto known = std::ranges::find(kFunctions, std::string_view{call.name},
                                   &FunctionArity::name);
    if (known != std::end(kFunctions) &&
        (call.args.size() < known->min || call.args.size() > known->max)) {
      return fail_with(Error::InvalidCondition,
                       std::format("{}() takes {} argument(s), got {} in '{}'",
                                   name, known->min, call.args.size(), src_));
    }
    return make(offset, std::move(call));
  }

  std::string_view src_;
  std::size_t pos_{0};
  Token cur_;
};

}  // namespace

auto Expression::parse(std::string_view source) -> DetailedResult<Expression> {
  auto body = strip_expression_braces(source);
  if (body.empty()) {
    return fail_with(Error::InvalidCondition, "empty expression");
  }
  Parser parser{body};
  auto root = parser.parse();
  if (!root) {
    return std::unexpected(std::move(root.error()));
  }
  return Expression{std::string(body),
                    std::shared_ptr<const expr::Node>(std::move(*root))};
}

}  // namespace ciflow
