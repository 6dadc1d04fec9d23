#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <random>
#include <string>
#include <string_view>

namespace ciflow {

// Identifier strings tagged by what they name, so a JobId and an InstanceId
// never convert into each other.
template <typename Tag>
class TypedId {
public:
  TypedId() = default;
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string& {
    return value_;
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return value_.size();
  }

  friend auto operator==(const TypedId&, const TypedId&) -> bool = default;
  friend auto operator<=>(const TypedId&, const TypedId&) = default;

private:
  std::string value_;
};

namespace id_tag {
struct Job {};
struct Instance {};
struct Run {};
}  // namespace id_tag

// Job key as written under `jobs:` in the workflow file.
using JobId = TypedId<id_tag::Job>;
// "job" or "job[axis=value,...]" once the matrix is expanded.
using InstanceId = TypedId<id_tag::Instance>;
using RunId = TypedId<id_tag::Run>;

// "run_<utc timestamp>_<8 hex>", so history sorts roughly by start time.
[[nodiscard]] inline auto generate_run_id() -> RunId {
  thread_local std::mt19937 rng{std::random_device{}()};
  auto now = std::chrono::floor<std::chrono::seconds>(
      std::chrono::system_clock::now());
  return RunId{std::format("run_{:%Y%m%dT%H%M%S}_{:08x}", now,
                           static_cast<std::uint32_t>(rng()))};
}

template <typename Tag>
auto operator<<(std::ostream& os, const TypedId<Tag>& id) -> std::ostream& {
  return os << id.value();
}

}  // namespace ciflow

template <typename Tag>
struct std::hash<ciflow::TypedId<Tag>> {
  auto operator()(const ciflow::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<ciflow::TypedId<Tag>> : std::formatter<std::string_view> {
  auto format(const ciflow::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
