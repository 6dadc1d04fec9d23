#pragma once

#include "ciflow/condition/evaluator.hpp"
#include "ciflow/core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace ciflow {

// Replaces every "${{ expr }}" in `text` with the string value of `expr`.
// An unterminated "${{" is copied literally. Evaluation errors are returned
// unchanged (InvalidCondition, UnresolvedReference).
[[nodiscard]] auto interpolate(std::string_view text, const EvalContext& ctx)
    -> DetailedResult<std::string>;

// Offset of the "}}" closing the expression that starts at `from`, skipping
// quoted strings. npos when there is none.
[[nodiscard]] auto find_closing_braces(std::string_view text,
                                       std::size_t from) noexcept
    -> std::size_t;

}  // namespace ciflow
