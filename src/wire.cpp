#include "wire.hpp"
#include "encode.hpp"
#include <limits>

namespace quasar::rpc
{

  quasar::Id fromRpcId(capnp::Data::Reader d)
  {
    if (d.size() != kIdSize)
      throw GraphError(GraphError::Code::Conversion, "id must be " + std::to_string(kIdSize) + " bytes");
    return read_be128(d.begin());
  }

  std::string idBytes(quasar::Id id) { return key_id_be(id); }

  kj::ArrayPtr<const capnp::byte> asBytes(const std::string &s)
  {
    return kj::ArrayPtr<const capnp::byte>(reinterpret_cast<const capnp::byte *>(s.data()), s.size());
  }

  quasar::Value fromRpcValue(Value::Reader v)
  {
    switch (v.which())
    {
    case Value::TEXT:
    {
      auto t = v.getText();
      return std::string(t.begin(), t.size());
    }
    case Value::I64:
      return static_cast<int64_t>(v.getI64());
    case Value::U64:
      return static_cast<uint64_t>(v.getU64());
    case Value::F64:
      return static_cast<double>(v.getF64());
    case Value::BOOLV:
      return static_cast<bool>(v.getBoolv());
    case Value::ID:
      return quasar::Value(std::in_place_type<quasar::Id>, fromRpcId(v.getId()));
    case Value::EMPTY:
    default:
      return std::monostate{};
    }
  }

  void toRpcValue(Value::Builder b, const quasar::Value &v)
  {
    if (auto s = std::get_if<std::string>(&v))
    {
      b.setText(capnp::Text::Reader(s->data(), s->size()));
      return;
    }
    if (auto i = std::get_if<int64_t>(&v))
    {
      b.setI64(*i);
      return;
    }
    if (auto u = std::get_if<uint64_t>(&v))
    {
      b.setU64(*u);
      return;
    }
    if (auto d = std::get_if<double>(&v))
    {
      b.setF64(*d);
      return;
    }
    if (auto flag = std::get_if<bool>(&v))
    {
      b.setBoolv(*flag);
      return;
    }
    if (auto id = std::get_if<quasar::Id>(&v))
    {
      b.setId(asBytes(idBytes(*id)));
      return;
    }
    b.setEmpty();
  }

  quasar::Properties fromRpcProperties(capnp::List<Property>::Reader list)
  {
    quasar::Properties out;
    out.reserve(list.size());
    for (auto p : list)
    {
      auto key = p.getKey();
      out.emplace_back(std::string(key.begin(), key.size()), fromRpcValue(p.getVal()));
    }
    return out;
  }

  void toRpcProperties(capnp::List<Property>::Builder out, const quasar::Properties *props)
  {
    if (!props)
      return;
    for (uint32_t i = 0; i < props->size(); ++i)
    {
      const auto &[key, value] = (*props)[i];
      out[i].setKey(capnp::Text::Reader(key.data(), key.size()));
      toRpcValue(out[i].initVal(), value);
    }
  }

  namespace
  {
    uint32_t propCount(const quasar::Properties *props)
    {
      return props ? static_cast<uint32_t>(props->size()) : 0;
    }

    // arena labels are not NUL terminated
    kj::String text(std::string_view s) { return kj::heapString(s.data(), s.size()); }

    template <typename Vec>
    void toRpcVector(Vector::Builder b, const Vec &v)
    {
      b.setId(asBytes(idBytes(v.id)));
      b.setLabel(text(v.label));
      b.setVersion(v.version);
      b.setLevel(v.level);
      b.setDeleted(v.deleted);
      toRpcProperties(b.initProps(propCount(v.properties)), v.properties);
    }
  } // namespace

  void toRpcNode(Node::Builder b, const quasar::Node &n)
  {
    b.setId(asBytes(idBytes(n.id)));
    b.setLabel(text(n.label));
    b.setVersion(n.version);
    toRpcProperties(b.initProps(propCount(n.properties)), n.properties);
  }

  void toRpcEdge(Edge::Builder b, const quasar::Edge &e)
  {
    b.setId(asBytes(idBytes(e.id)));
    b.setLabel(text(e.label));
    b.setVersion(e.version);
    b.setFromNode(asBytes(idBytes(e.fromNode)));
    b.setToNode(asBytes(idBytes(e.toNode)));
    toRpcProperties(b.initProps(propCount(e.properties)), e.properties);
  }

  void toRpcItem(Item::Builder b, const TraversalValue &v)
  {
    if (auto n = std::get_if<quasar::Node>(&v))
      toRpcNode(b.initNode(), *n);
    else if (auto e = std::get_if<quasar::Edge>(&v))
      toRpcEdge(b.initEdge(), *e);
    else if (auto hv = std::get_if<HVector>(&v))
    {
      auto out = b.initVector();
      toRpcVector(out, *hv);
      out.setDistance(hv->distance ? *hv->distance : std::numeric_limits<double>::quiet_NaN());
      auto data = out.initData(static_cast<uint32_t>(hv->len()));
      for (uint32_t i = 0; i < hv->len(); ++i)
        data.set(i, hv->data[i]);
    }
    else if (auto meta = std::get_if<VectorWithoutData>(&v))
    {
      auto out = b.initVector();
      toRpcVector(out, *meta);
      out.setDistance(std::numeric_limits<double>::quiet_NaN());
    }
    else if (auto path = std::get_if<quasar::Path>(&v))
    {
      auto out = b.initPath();
      auto nodes = out.initNodes(static_cast<uint32_t>(path->nodes.size()));
      for (uint32_t i = 0; i < path->nodes.size(); ++i)
        toRpcNode(nodes[i], path->nodes[i]);
      auto edges = out.initEdges(static_cast<uint32_t>(path->edges.size()));
      for (uint32_t i = 0; i < path->edges.size(); ++i)
        toRpcEdge(edges[i], path->edges[i]);
    }
    else if (auto value = std::get_if<quasar::Value>(&v))
      toRpcValue(b.initValue(), *value);
    else if (auto scored = std::get_if<NodeWithScore>(&v))
    {
      auto out = b.initScored();
      toRpcNode(out.initNode(), scored->node);
      out.setScore(scored->score);
    }
    else if (auto group = std::get_if<quasar::Group>(&v))
    {
      auto out = b.initGroup();
      toRpcProperties(out.initValues(propCount(group->values)), group->values);
      out.setCount(group->count);
      if (group->items)
      {
        auto items = out.initItems(static_cast<uint32_t>(group->items->size()));
        for (uint32_t i = 0; i < group->items->size(); ++i)
          toRpcItem(items[i], (*group->items)[i]);
      }
    }
    else
      b.setEmpty();
  }

  void toRpcItems(QueryResult::Builder b, const std::vector<TraversalValue> &items)
  {
    auto out = b.initItems(static_cast<uint32_t>(items.size()));
    for (uint32_t i = 0; i < items.size(); ++i)
      toRpcItem(out[i], items[i]);
    b.setCount(items.size());
  }

  const quasar::Value &requireArg(const quasar::Properties &args, std::string_view key)
  {
    const quasar::Value *v = findProperty(args, key);
    if (!v)
      throw GraphError(GraphError::Code::Conversion, "missing argument " + std::string(key));
    return *v;
  }

  std::string textArg(const quasar::Properties &args, std::string_view key)
  {
    auto s = std::get_if<std::string>(&requireArg(args, key));
    if (!s)
      throw GraphError(GraphError::Code::Conversion, "argument " + std::string(key) + " must be text");
    return *s;
  }

  quasar::Id idArg(const quasar::Properties &args, std::string_view key)
  {
    const quasar::Value &v = requireArg(args, key);
    if (auto id = std::get_if<quasar::Id>(&v))
      return *id;
    if (auto s = std::get_if<std::string>(&v))
    {
      if (auto parsed = parseId(*s))
        return *parsed;
    }
    throw GraphError(GraphError::Code::Conversion, "argument " + std::string(key) + " is not an id");
  }

  uint64_t countArg(const quasar::Properties &args, std::string_view key, uint64_t fallback)
  {
    const quasar::Value *v = findProperty(args, key);
    if (!v)
      return fallback;
    if (auto u = std::get_if<uint64_t>(v))
      return *u;
    if (auto i = std::get_if<int64_t>(v); i && *i >= 0)
      return static_cast<uint64_t>(*i);
    throw GraphError(GraphError::Code::Conversion, "argument " + std::string(key) + " must be a count");
  }

} // namespace quasar::rpc
