#include "ciflow/condition/evaluator.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace ciflow {

namespace {

auto lower(std::string_view s) -> std::string {
  std::string out(s);
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

auto unresolved(const Expression& e, std::string_view what)
    -> std::unexpected<ErrorDetail> {
  return fail_with(Error::UnresolvedReference,
                   std::format("{} in '{}'", what, e.source()));
}

auto joined_path(const std::vector<std::string>& segments) -> std::string {
  std::string out;
  for (const auto& s : segments) {
    if (!out.empty()) {
      out.push_back('.');
    }
    out += s;
  }
  return out;
}

auto dependency_exit_code(const EvalContext& ctx, const JobId& job) -> Value {
  std::optional<int> first;
  for (const auto& o : ctx.outcomes) {
    if (o.job != job || !o.exit_code) {
      continue;
    }
    if (*o.exit_code != 0) {
      return Value{*o.exit_code};
    }
    first = first.value_or(*o.exit_code);
  }
  return first ? Value{*first} : Value{};
}

class Evaluator {
public:
  Evaluator(const Expression& e, const EvalContext& ctx) : e_(e), ctx_(ctx) {}

  auto eval(const expr::Node& node) -> DetailedResult<Value> {
    return std::visit([this](const auto& k) { return eval_kind(k); },
                      node.kind);
  }

private:
  auto eval_kind(const expr::Literal& lit) -> DetailedResult<Value> {
    return lit.value;
  }

  auto eval_kind(const expr::Not& n) -> DetailedResult<Value> {
    auto v = eval(*n.operand);
    if (!v) {
      return v;
    }
    return Value{!v->truthy()};
  }

  auto eval_kind(const expr::Binary& b) -> DetailedResult<Value> {
    auto lhs = eval(*b.lhs);
    if (!lhs) {
      return lhs;
    }
    if (b.op == expr::BinaryOp::And) {
      return lhs->truthy() ? eval(*b.rhs) : lhs;
    }
    if (b.op == expr::BinaryOp::Or) {
      return lhs->truthy() ? lhs : eval(*b.rhs);
    }
    auto rhs = eval(*b.rhs);
    if (!rhs) {
      return rhs;
    }
    return Value{compare(b.op, *lhs, *rhs)};
  }

  static auto compare(expr::BinaryOp op, const Value& a, const Value& b)
      -> bool {
    using enum expr::BinaryOp;
    if (op == Eq) {
      return loose_equals(a, b);
    }
    if (op == Ne) {
      return !loose_equals(a, b);
    }
    if (a.is_string() && b.is_string()) {
      auto l = lower(std::get<std::string>(a.data));
      auto r = lower(std::get<std::string>(b.data));
      switch (op) {
        case Lt: return l < r;
        case Le: return l <= r;
        case Gt: return l > r;
        case Ge: return l >= r;
        default: return false;
      }
    }
    // NaN on either side makes every ordering false.
    double l = a.to_number();
    double r = b.to_number();
    switch (op) {
      case Lt: return l < r;
      case Le: return l <= r;
      case Gt: return l > r;
      case Ge: return l >= r;
      default: return false;
    }
  }

  auto eval_kind(const expr::Path& p) -> DetailedResult<Value> {
    const auto& seg = p.segments;
    const auto& root = seg.front();

    if (root == "needs") {
      return resolve_needs(p);
    }
    if (root == "matrix" || root == "env") {
      if (seg.size() != 2 || seg[1] == "*") {
        return unresolved(e_, std::format("'{}' needs exactly one key",
                                          joined_path(seg)));
      }
      const auto& list = root == "matrix" ? ctx_.matrix : ctx_.env;
      auto v = lookup_binding(list, seg[1]);
      if (!v) {
        return unresolved(e_, std::format("unknown {} key '{}'", root, seg[1]));
      }
      return Value{*v};
    }
    if (root == "job" && seg.size() == 2 && seg[1] == "status" &&
        ctx_.step_failed) {
      return Value{*ctx_.step_failed ? "failure" : "success"};
    }
    return unresolved(e_,
                      std::format("unknown reference '{}'", joined_path(seg)));
  }

  auto resolve_needs(const expr::Path& p) -> DetailedResult<Value> {
    const auto& seg = p.segments;
    if (seg.size() != 3) {
      return unresolved(
          e_, std::format("'{}' must be needs.<job>.<result|exit_code>",
                          joined_path(seg)));
    }
    const auto& prop = seg[2];
    if (prop != "result" && prop != "exit_code") {
      return unresolved(e_, std::format("unknown property '{}' of needs.{}",
                                        prop, seg[1]));
    }

    auto property = [&](const JobId& job) -> Value {
      if (prop == "result") {
        return Value{*dependency_result(ctx_, job)};
      }
      return dependency_exit_code(ctx_, job);
    };

    if (seg[1] == "*") {
      Array all;
      all.reserve(ctx_.needs.size());
      for (const auto& job : ctx_.needs) {
        all.push_back(property(job));
      }
      return Value{std::move(all)};
    }

    JobId job{seg[1]};
    if (std::ranges::find(ctx_.needs, job) == ctx_.needs.end()) {
      return unresolved(
          e_, std::format("'{}' is not a declared dependency", seg[1]));
    }
    return property(job);
  }

  auto eval_kind(const expr::Call& c) -> DetailedResult<Value> {
    std::vector<Value> args;
    args.reserve(c.args.size());
    for (const auto& a : c.args) {
      auto v = eval(*a);
      if (!v) {
        return v;
      }
      args.push_back(std::move(*v));
    }

    const auto& fn = c.name;
    if (fn == "always") {
      return Value{true};
    }
    if (fn == "cancelled") {
      return Value{ctx_.cancelled};
    }
    if (fn == "success") {
      if (ctx_.step_failed) {
        return Value{!*ctx_.step_failed && !ctx_.cancelled};
      }
      return Value{!ctx_.cancelled && all_dependencies_succeeded(ctx_)};
    }
    if (fn == "failure") {
      if (ctx_.step_failed) {
        return Value{*ctx_.step_failed};
      }
      return Value{any_dependency_failed(ctx_)};
    }
    if (fn == "contains") {
      const auto& hay = args[0];
      if (hay.is_array()) {
        const auto& items = std::get<Array>(hay.data);
        return Value{std::ranges::any_of(items, [&](const Value& item) {
          return loose_equals(item, args[1]);
        })};
      }
      return Value{lower(hay.to_string()).find(lower(args[1].to_string())) !=
                   std::string::npos};
    }
    if (fn == "startswith") {
      return Value{
          lower(args[0].to_string()).starts_with(lower(args[1].to_string()))};
    }
    if (fn == "endswith") {
      return Value{
          lower(args[0].to_string()).ends_with(lower(args[1].to_string()))};
    }
    if (fn == "join") {
      std::string sep = args.size() > 1 ? args[1].to_string() : ",";
      if (!args[0].is_array()) {
        return Value{args[0].to_string()};
      }
      std::string out;
      const auto& items = std::get<Array>(args[0].data);
      for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
          out += sep;
        }
        out += items[i].to_string();
      }
      return Value{std::move(out)};
    }
    return unresolved(e_, std::format("unknown function '{}()'", fn));
  }

  const Expression& e_;
  const EvalContext& ctx_;
};

}  // namespace

auto dependency_result(const EvalContext& ctx, const JobId& job)
    -> std::optional<std::string_view> {
  if (std::ranges::find(ctx.needs, job) == ctx.needs.end()) {
    return std::nullopt;
  }
  bool any_failed = false;
  bool any_cancelled = false;
  bool all_skipped = true;
  for (const auto& o : ctx.outcomes) {
    if (o.job != job) {
      continue;
    }
    any_failed |= o.status == JobStatus::Failed;
    any_cancelled |= o.status == JobStatus::Cancelled;
    all_skipped &= o.status == JobStatus::Skipped;
  }
  if (any_failed) {
    return result_name(JobStatus::Failed);
  }
  if (any_cancelled) {
    return result_name(JobStatus::Cancelled);
  }
  if (all_skipped) {
    return result_name(JobStatus::Skipped);
  }
  return result_name(JobStatus::Succeeded);
}

auto all_dependencies_succeeded(const EvalContext& ctx) -> bool {
  return std::ranges::all_of(ctx.outcomes, [](const DependencyOutcome& o) {
    return o.status == JobStatus::Succeeded;
  });
}

auto any_dependency_failed(const EvalContext& ctx) -> bool {
  return std::ranges::any_of(ctx.outcomes, [](const DependencyOutcome& o) {
    return o.status == JobStatus::Failed;
  });
}

auto evaluate(const Expression& expression, const EvalContext& ctx)
    -> DetailedResult<Value> {
  Evaluator ev{expression, ctx};
  return ev.eval(expression.root());
}

auto evaluate_condition(const RunCondition& condition,
                        const Expression* compiled, const EvalContext& ctx)
    -> DetailedResult<Eligibility> {
  if (std::holds_alternative<DefaultCondition>(condition)) {
    return all_dependencies_succeeded(ctx) ? Eligibility::Run
                                           : Eligibility::Skip;
  }
  if (std::holds_alternative<AlwaysCondition>(condition)) {
    return Eligibility::Run;
  }

  std::optional<Expression> parsed;
  if (compiled == nullptr) {
    auto p = Expression::parse(std::get<CustomCondition>(condition).expression);
    if (!p) {
      return std::unexpected(std::move(p.error()));
    }
    parsed = std::move(*p);
    compiled = &*parsed;
  }

  auto value = evaluate(*compiled, ctx);
  if (!value) {
    return std::unexpected(std::move(value.error()));
  }
  return value->truthy() ? Eligibility::Run : Eligibility::Skip;
}

auto evaluate_step_condition(const Expression* condition,
                             const EvalContext& ctx) -> DetailedResult<bool> {
  if (condition == nullptr) {
    return !ctx.step_failed.value_or(false);
  }
  auto value = evaluate(*condition, ctx);
  if (!value) {
    return std::unexpected(std::move(value.error()));
  }
  return value->truthy();
}

}  // namespace ciflow
