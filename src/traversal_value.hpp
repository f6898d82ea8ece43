#pragma once
#include "errors.hpp"
#include "items.hpp"
#include "vector.hpp"
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace quasar
{

  class TraversalValue;

  struct Path
  {
    std::vector<Node> nodes;
    std::vector<Edge> edges;
  };

  struct NodeWithScore
  {
    Node node;
    double score{0.0};
  };

  // group_by / aggregate_by result; items is null for count-only groups
  struct Group
  {
    const Properties *values{nullptr};
    uint64_t count{0};
    const std::vector<TraversalValue> *items{nullptr};
  };

  // std::monostate is the Empty item
  class TraversalValue
      : public std::variant<std::monostate, Node, Edge, HVector, VectorWithoutData, Path, Value, NodeWithScore, Group>
  {
  public:
    using variant::variant;

    bool isEmpty() const { return std::holds_alternative<std::monostate>(*this); }

    // id of Node/Edge/Vector/VectorWithoutData/NodeWithScore items
    std::optional<Id> id() const;
    std::string_view label() const;
    // property lookup on record items; a Value item yields itself
    const Value *get(std::string_view key) const;
  };

  class Item
  {
  public:
    Item(TraversalValue value) : v_(std::move(value)) {}
    Item(GraphError error) : v_(std::move(error)) {}

    bool ok() const { return v_.index() == 0; }
    TraversalValue &value() { return std::get<0>(v_); }
    const TraversalValue &value() const { return std::get<0>(v_); }
    const GraphError &error() const { return std::get<1>(v_); }

  private:
    std::variant<TraversalValue, GraphError> v_;
  };

} // namespace quasar
