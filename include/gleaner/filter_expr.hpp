#pragma once

/** \file filter_expr.hpp
 *  \brief Metadata predicates over indexed chunks.
 *
 * String fields: document_id, chunk_id, model_id and any tag key (filename,
 * content_hash, collection, ...). Numeric fields: sequence_index,
 * start_offset, end_offset. A predicate on a field the record lacks is false.
 */

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace gleaner {

/** \brief field == value */
struct term {
  std::string field;
  std::string value;
};

/** \brief min_value <= field <= max_value */
struct range {
  std::string field;
  double min_value{};
  double max_value{};
};

struct filter_expr {
  struct and_t { std::vector<filter_expr> children; };  /**< empty: true */
  struct or_t  { std::vector<filter_expr> children; };  /**< empty: false */
  struct not_t { std::vector<filter_expr> children; };  /**< none of the children; empty: true */

  std::variant<term, range, and_t, or_t, not_t> node;

  static filter_expr eq(std::string field, std::string value) {
    return {term{std::move(field), std::move(value)}};
  }
  static filter_expr between(std::string field, double lo, double hi) { return {range{std::move(field), lo, hi}}; }
  static filter_expr all_of(std::vector<filter_expr> c) { return {and_t{std::move(c)}}; }
  static filter_expr any_of(std::vector<filter_expr> c) { return {or_t{std::move(c)}}; }
  static filter_expr none_of(std::vector<filter_expr> c) { return {not_t{std::move(c)}}; }
};

/** \brief Matches chunks belonging to any of the given documents. */
auto document_filter(const std::vector<std::string>& document_ids) -> filter_expr;

} // namespace gleaner
