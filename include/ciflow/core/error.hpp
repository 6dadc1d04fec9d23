#pragma once

#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

namespace ciflow {

// Zero is reserved so a default std::error_code never reads as a ciflow
// failure.
enum class Error : int {
  // workflow file
  FileNotFound = 1,
  ParseError,
  InvalidArgument,
  // matrix and graph construction
  InvalidMatrix,
  DuplicateAxis,
  DuplicateJob,
  UnknownDependency,
  SelfDependency,
  CyclicDependency,
  // if: expressions
  InvalidCondition,
  UnresolvedReference,
  // run time
  NotFound,
  Timeout,
  Cancelled,
  ExecutorError,
  // run history
  DatabaseError,
  DatabaseOpenFailed,
  DatabaseQueryFailed,
};

[[nodiscard]] constexpr auto error_text(Error e) noexcept -> std::string_view {
  switch (e) {
    case Error::FileNotFound: return "file not found";
    case Error::ParseError: return "parse error";
    case Error::InvalidArgument: return "invalid argument";
    case Error::InvalidMatrix: return "invalid matrix";
    case Error::DuplicateAxis: return "duplicate matrix axis";
    case Error::DuplicateJob: return "duplicate job identifier";
    case Error::UnknownDependency: return "unknown dependency";
    case Error::SelfDependency: return "job depends on itself";
    case Error::CyclicDependency: return "cyclic dependency";
    case Error::InvalidCondition: return "invalid condition expression";
    case Error::UnresolvedReference: return "unresolved reference";
    case Error::NotFound: return "not found";
    case Error::Timeout: return "timeout";
    case Error::Cancelled: return "cancelled";
    case Error::ExecutorError: return "executor error";
    case Error::DatabaseError: return "database error";
    case Error::DatabaseOpenFailed: return "failed to open database";
    case Error::DatabaseQueryFailed: return "database query failed";
  }
  return "unknown error";
}

[[nodiscard]] inline auto ciflow_category() noexcept
    -> const std::error_category& {
  struct Category final : std::error_category {
    auto name() const noexcept -> const char* override { return "ciflow"; }
    auto message(int ev) const -> std::string override {
      return std::string{error_text(static_cast<Error>(ev))};
    }
  };
  static const Category category;
  return category;
}

[[nodiscard]] inline auto make_error_code(Error e) noexcept
    -> std::error_code {
  return {std::to_underlying(e), ciflow_category()};
}

}  // namespace ciflow

template <>
struct std::is_error_code_enum<ciflow::Error> : std::true_type {};

namespace ciflow {

template <typename T>
using Result = std::expected<T, std::error_code>;

template <typename T>
[[nodiscard]] constexpr auto ok(T&& value) -> Result<std::decay_t<T>> {
  return Result<std::decay_t<T>>{std::forward<T>(value)};
}

[[nodiscard]] constexpr auto ok() -> Result<void> {
  return {};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return fail(make_error_code(e));
}

// For workflow problems the user has to fix: the code says what kind, the
// message names the offending jobs.
struct ErrorDetail {
  std::error_code code;
  std::string message;
  // Only for CyclicDependency: template ids around the cycle, with the first
  // id repeated at the end.
  std::vector<std::string> cycle;
};

template <typename T>
using DetailedResult = std::expected<T, ErrorDetail>;

[[nodiscard]] inline auto fail_with(Error e, std::string message,
                                    std::vector<std::string> cycle = {})
    -> std::unexpected<ErrorDetail> {
  return std::unexpected{ErrorDetail{.code = make_error_code(e),
                                     .message = std::move(message),
                                     .cycle = std::move(cycle)}};
}

// Heterogeneous lookup for string-keyed maps.
struct StringHash {
  using is_transparent = void;
  auto operator()(std::string_view sv) const noexcept -> std::size_t {
    return std::hash<std::string_view>{}(sv);
  }
};

using StringEqual = std::equal_to<>;

}  // namespace ciflow
