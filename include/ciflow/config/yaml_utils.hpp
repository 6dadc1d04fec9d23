#pragma once

#include "ciflow/util/id.hpp"
#include "ciflow/workflow/job_template.hpp"

#include <yaml-cpp/yaml.h>

#include <string>
#include <string_view>
#include <vector>

namespace YAML {

// Ids decode from any scalar, so `needs: 3` names a job called "3".
template <typename Tag>
struct convert<ciflow::TypedId<Tag>> {
  static auto encode(const ciflow::TypedId<Tag>& id) -> Node {
    return Node(id.str());
  }
  static auto decode(const Node& node, ciflow::TypedId<Tag>& id) -> bool {
    if (!node.IsScalar()) {
      return false;
    }
    id = ciflow::TypedId<Tag>{node.Scalar()};
    return true;
  }
};

}  // namespace YAML

namespace ciflow {

// Value of `key`, or `fallback` when the key is absent or explicitly null.
// A present value of the wrong shape still throws YAML::BadConversion.
template <typename T>
  requires requires(const YAML::Node& n) { n.as<T>(); }
[[nodiscard]] auto yaml_get_or(const YAML::Node& node, std::string_view key,
                               T fallback) -> T {
  auto field = node[std::string(key)];
  if (!field.IsDefined() || field.IsNull()) {
    return fallback;
  }
  return field.as<T>();
}

// Accepts both `key: a` and `key: [a, b]`.
template <typename T>
[[nodiscard]] auto yaml_scalar_or_list(const YAML::Node& node)
    -> std::vector<T> {
  if (!node.IsDefined() || node.IsNull()) {
    return {};
  }
  if (node.IsScalar()) {
    return {node.as<T>()};
  }
  return node.as<std::vector<T>>();
}

// Mapping of scalars, in document order.
[[nodiscard]] inline auto yaml_ordered_pairs(const YAML::Node& node)
    -> EnvList {
  EnvList out;
  if (!node.IsDefined() || !node.IsMap()) {
    return out;
  }
  out.reserve(node.size());
  for (const auto& kv : node) {
    out.emplace_back(kv.first.Scalar(), kv.second.as<std::string>());
  }
  return out;
}

template <typename T>
void yaml_emit(YAML::Emitter& out, std::string_view key, const T& value) {
  out << YAML::Key << std::string(key) << YAML::Value << value;
}

inline void yaml_emit_if_not_empty(YAML::Emitter& out, std::string_view key,
                                   const std::string& value) {
  if (!value.empty()) {
    yaml_emit(out, key, value);
  }
}

}  // namespace ciflow
