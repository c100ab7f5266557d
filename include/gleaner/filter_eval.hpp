#pragma once

/** \file filter_eval.hpp
 *  \brief In-memory evaluation of filter_expr against index records.
 */

#include <optional>
#include <string>
#include <string_view>

#include "gleaner/filter_expr.hpp"
#include "gleaner/types.hpp"

namespace gleaner::filter_eval {

// Numeric view of a record field; nullopt when the record has no such field.
auto numeric_field(const record& r, std::string_view field) -> std::optional<double>;

// Evaluate whether a record matches the expression.
auto matches(const filter_expr& expr, const record& r) -> bool;

} // namespace gleaner::filter_eval
