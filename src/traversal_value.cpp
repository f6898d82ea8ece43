#include "traversal_value.hpp"

namespace quasar
{

  std::optional<Id> TraversalValue::id() const
  {
    if (auto n = std::get_if<Node>(this))
      return n->id;
    if (auto e = std::get_if<Edge>(this))
      return e->id;
    if (auto v = std::get_if<HVector>(this))
      return v->id;
    if (auto v = std::get_if<VectorWithoutData>(this))
      return v->id;
    if (auto s = std::get_if<NodeWithScore>(this))
      return s->node.id;
    return std::nullopt;
  }

  std::string_view TraversalValue::label() const
  {
    if (auto n = std::get_if<Node>(this))
      return n->label;
    if (auto e = std::get_if<Edge>(this))
      return e->label;
    if (auto v = std::get_if<HVector>(this))
      return v->label;
    if (auto v = std::get_if<VectorWithoutData>(this))
      return v->label;
    if (auto s = std::get_if<NodeWithScore>(this))
      return s->node.label;
    return std::string_view();
  }

  const Value *TraversalValue::get(std::string_view key) const
  {
    if (auto n = std::get_if<Node>(this))
      return n->get(key);
    if (auto e = std::get_if<Edge>(this))
      return e->get(key);
    if (auto v = std::get_if<HVector>(this))
      return v->get(key);
    if (auto v = std::get_if<VectorWithoutData>(this))
      return v->get(key);
    if (auto s = std::get_if<NodeWithScore>(this))
      return s->node.get(key);
    if (auto g = std::get_if<Group>(this))
      return g->values ? findProperty(*g->values, key) : nullptr;
    if (auto v = std::get_if<Value>(this))
      return v;
    return nullptr;
  }

} // namespace quasar
