#include "gleaner/filter_eval.hpp"

#include <algorithm>

namespace gleaner {

auto document_filter(const std::vector<std::string>& document_ids) -> filter_expr {
  std::vector<filter_expr> ids;
  ids.reserve(document_ids.size());
  for (const auto& id : document_ids) ids.push_back(filter_expr::eq("document_id", id));
  return filter_expr::any_of(std::move(ids));
}

} // namespace gleaner

namespace gleaner::filter_eval {

namespace {

auto string_field(const record& r, const std::string& field) -> const std::string* {
  if (field == "document_id") return &r.document_id;
  if (field == "chunk_id") return &r.chunk_id;
  if (field == "model_id") return &r.model_id;
  const auto it = r.tags.find(field);
  return it == r.tags.end() ? nullptr : &it->second;
}

struct evaluator {
  const record& r;

  bool operator()(const term& t) const {
    const auto* v = string_field(r, t.field);
    return v && *v == t.value;
  }
  bool operator()(const range& rg) const {
    const auto v = numeric_field(r, rg.field);
    return v && *v >= rg.min_value && *v <= rg.max_value;
  }
  bool operator()(const filter_expr::and_t& a) const {
    return std::all_of(a.children.begin(), a.children.end(), [this](const filter_expr& c) { return eval(c); });
  }
  bool operator()(const filter_expr::or_t& o) const {
    return std::any_of(o.children.begin(), o.children.end(), [this](const filter_expr& c) { return eval(c); });
  }
  bool operator()(const filter_expr::not_t& n) const {
    return std::none_of(n.children.begin(), n.children.end(), [this](const filter_expr& c) { return eval(c); });
  }

  bool eval(const filter_expr& e) const { return std::visit(*this, e.node); }
};

} // namespace

auto numeric_field(const record& r, std::string_view field) -> std::optional<double> {
  if (field == "sequence_index") return static_cast<double>(r.sequence_index);
  if (field == "start_offset") return static_cast<double>(r.start_offset);
  if (field == "end_offset") return static_cast<double>(r.end_offset);
  return std::nullopt;
}

auto matches(const filter_expr& expr, const record& r) -> bool {
  return evaluator{r}.eval(expr);
}

} // namespace gleaner::filter_eval
