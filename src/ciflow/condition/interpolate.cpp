#include "ciflow/condition/interpolate.hpp"

namespace ciflow {

auto find_closing_braces(std::string_view text, std::size_t from) noexcept
    -> std::size_t {
  bool in_string = false;
  for (std::size_t i = from; i < text.size(); ++i) {
    char c = text[i];
    if (c == '\'') {
      in_string = !in_string;
      continue;
    }
    if (!in_string && c == '}' && i + 1 < text.size() && text[i + 1] == '}') {
      return i;
    }
  }
  return std::string_view::npos;
}

auto interpolate(std::string_view text, const EvalContext& ctx)
    -> DetailedResult<std::string> {
  constexpr std::string_view open = "${{";

  std::string out;
  out.reserve(text.size());
  std::size_t pos = 0;

  while (pos < text.size()) {
    auto start = text.find(open, pos);
    if (start == std::string_view::npos) {
      out.append(text.substr(pos));
      break;
    }
    out.append(text.substr(pos, start - pos));

    auto body_start = start + open.size();
    auto close = find_closing_braces(text, body_start);
    if (close == std::string_view::npos) {
      out.append(text.substr(start));
      break;
    }

    auto expression = Expression::parse(text.substr(body_start, close - body_start));
    if (!expression) {
      return std::unexpected(std::move(expression.error()));
    }
    auto value = evaluate(*expression, ctx);
    if (!value) {
      return std::unexpected(std::move(value.error()));
    }
    out += value->to_string();
    pos = close + 2;
  }
  return out;
}

}  // namespace ciflow
