#pragma once
#include "traversal_value.hpp"
#include "schemas/engine.capnp.h"
#include <string>
#include <string_view>
#include <vector>

namespace quasar::rpc
{

  // Conversions between engine values and their Cap'n Proto form.

  // ids travel as 16 big-endian bytes
  quasar::Id fromRpcId(capnp::Data::Reader d);
  std::string idBytes(quasar::Id id);
  kj::ArrayPtr<const capnp::byte> asBytes(const std::string &s);

  quasar::Value fromRpcValue(Value::Reader v);
  void toRpcValue(Value::Builder b, const quasar::Value &v);

  quasar::Properties fromRpcProperties(capnp::List<Property>::Reader list);
  void toRpcProperties(capnp::List<Property>::Builder out, const quasar::Properties *props);

  void toRpcNode(Node::Builder b, const quasar::Node &n);
  void toRpcEdge(Edge::Builder b, const quasar::Edge &e);
  void toRpcItem(Item::Builder b, const TraversalValue &v);
  void toRpcItems(QueryResult::Builder b, const std::vector<TraversalValue> &items);

  // request argument accessors; a missing or mistyped argument is a Conversion error
  const quasar::Value &requireArg(const quasar::Properties &args, std::string_view key);
  std::string textArg(const quasar::Properties &args, std::string_view key);
  quasar::Id idArg(const quasar::Properties &args, std::string_view key);
  uint64_t countArg(const quasar::Properties &args, std::string_view key, uint64_t fallback);

} // namespace quasar::rpc
