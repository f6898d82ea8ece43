#include "codec.hpp"
#include "encode.hpp"
#include "errors.hpp"
#include <kj/debug.h>
#include <cstring>

namespace quasar
{

  enum class ValueTag : uint8_t
  {
    I64 = 0,
    F64 = 1,
    Bool = 2,
    String = 3,
    Empty = 4,
    U64 = 5,
    IdV = 6
  };

  void encodeValue(std::string &out, const Value &v)
  {
    if (auto p = std::get_if<int64_t>(&v))
    {
      out.push_back(char(ValueTag::I64));
      put_be64(out, static_cast<uint64_t>(*p));
      return;
    }
    if (auto p = std::get_if<double>(&v))
    {
      out.push_back(char(ValueTag::F64));
      static_assert(sizeof(double) == 8, "double not 8 bytes");
      uint64_t ux;
      std::memcpy(&ux, p, 8);
      put_be64(out, ux);
      return;
    }
    if (auto p = std::get_if<bool>(&v))
    {
      out.push_back(char(ValueTag::Bool));
      out.push_back(*p ? 1 : 0);
      return;
    }
    if (auto p = std::get_if<std::string>(&v))
    {
      out.push_back(char(ValueTag::String));
      put_be32(out, static_cast<uint32_t>(p->size()));
      out.append(*p);
      return;
    }
    if (auto p = std::get_if<uint64_t>(&v))
    {
      out.push_back(char(ValueTag::U64));
      put_be64(out, *p);
      return;
    }
    if (auto p = std::get_if<Id>(&v))
    {
      out.push_back(char(ValueTag::IdV));
      put_be128(out, *p);
      return;
    }
    out.push_back(char(ValueTag::Empty));
  }

  static GraphError decodeError(const char *what)
  {
    return GraphError(GraphError::Code::Decode, what);
  }

  const unsigned char *decodeValue(const unsigned char *p, const unsigned char *end, Value &out)
  {
    if (p >= end)
      throw decodeError("corrupt value: empty");
    auto tag = static_cast<ValueTag>(*p++);
    switch (tag)
    {
    case ValueTag::I64:
      if (end - p < 8)
        throw decodeError("corrupt i64");
      out = static_cast<int64_t>(read_be64(p));
      return p + 8;
    case ValueTag::F64:
    {
      if (end - p < 8)
        throw decodeError("corrupt f64");
      uint64_t ux = read_be64(p);
      double d;
      std::memcpy(&d, &ux, 8);
      out = d;
      return p + 8;
    }
    case ValueTag::Bool:
      if (end - p < 1)
        throw decodeError("corrupt bool");
      out = bool(*p != 0);
      return p + 1;
    case ValueTag::String:
    {
      if (end - p < 4)
        throw decodeError("corrupt string len");
      uint32_t len = read_be32(p);
      p += 4;
      if (end - p < static_cast<std::ptrdiff_t>(len))
        throw decodeError("corrupt string data");
      out = std::string(reinterpret_cast<const char *>(p), len);
      return p + len;
    }
    case ValueTag::Empty:
      out = std::monostate{};
      return p;
    case ValueTag::U64:
      if (end - p < 8)
        throw decodeError("corrupt u64");
      out = read_be64(p);
      return p + 8;
    case ValueTag::IdV:
      if (end - p < 16)
        throw decodeError("corrupt id");
      out = read_be128(p);
      return p + 16;
    }
    throw decodeError("unknown value tag");
  }

  std::string indexKey(const Value &v)
  {
    std::string k;
    encodeValue(k, v);
    return k;
  }

  // -------------------- header / property map --------------------

  static void encodeHeader(std::string &out, std::string_view label, uint8_t version)
  {
    put_le64(out, label.size());
    out.append(label);
    out.push_back(char(version));
  }

  static std::string_view checkedLabel(std::string_view bytes)
  {
    KJ_ASSERT(bytes.size() >= kLabelHeaderLength, "record shorter than its label header", bytes.size());
    uint64_t len = read_le64(reinterpret_cast<const unsigned char *>(bytes.data()));
    KJ_ASSERT(len <= bytes.size() - kLabelHeaderLength, "label length exceeds record", len, bytes.size());
    return bytes.substr(kLabelHeaderLength, len);
  }

  std::string_view peekLabel(std::string_view bytes)
  {
    return checkedLabel(bytes);
  }

  static void encodeProperties(std::string &out, const Properties *props)
  {
    if (props == nullptr)
    {
      out.push_back(0);
      return;
    }
    out.push_back(1);
    put_be32(out, static_cast<uint32_t>(props->size()));
    for (const auto &[k, v] : *props)
    {
      put_be32(out, static_cast<uint32_t>(k.size()));
      out.append(k);
      encodeValue(out, v);
    }
  }

  static const unsigned char *decodeProperties(const unsigned char *p, const unsigned char *end,
                                               kj::Arena &arena, const Properties *&out)
  {
    if (p >= end)
      throw decodeError("corrupt property map: missing presence byte");
    if (*p++ == 0)
    {
      out = nullptr;
      return p;
    }
    if (end - p < 4)
      throw decodeError("corrupt property count");
    uint32_t n = read_be32(p);
    p += 4;
    Properties props;
    props.reserve(n);
    for (uint32_t i = 0; i < n; ++i)
    {
      if (end - p < 4)
        throw decodeError("corrupt property key len");
      uint32_t klen = read_be32(p);
      p += 4;
      if (end - p < static_cast<std::ptrdiff_t>(klen))
        throw decodeError("corrupt property key");
      std::string key(reinterpret_cast<const char *>(p), klen);
      p += klen;
      Value v;
      p = decodeValue(p, end, v);
      props.emplace_back(std::move(key), std::move(v));
    }
    out = copyToArena(arena, std::move(props));
    return p;
  }

  struct Header
  {
    std::string_view label;
    uint8_t version;
    const unsigned char *rest;
    const unsigned char *end;
  };

  static Header decodeHeader(std::string_view bytes, kj::Arena &arena)
  {
    std::string_view label = checkedLabel(bytes);
    auto *p = reinterpret_cast<const unsigned char *>(bytes.data()) + kLabelHeaderLength + label.size();
    auto *end = reinterpret_cast<const unsigned char *>(bytes.data()) + bytes.size();
    if (p >= end)
      throw decodeError("corrupt record: missing version byte");
    uint8_t version = *p++;
    return Header{copyToArena(arena, label), version, p, end};
  }

  // -------------------- records --------------------

  std::string encodeNode(const Node &node)
  {
    std::string out;
    out.reserve(kLabelHeaderLength + node.label.size() + 16);
    encodeHeader(out, node.label, node.version);
    encodeProperties(out, node.properties);
    return out;
  }

  Node decodeNode(Id id, std::string_view bytes, kj::Arena &arena)
  {
    Header h = decodeHeader(bytes, arena);
    Node n{};
    n.id = id;
    n.label = h.label;
    n.version = h.version;
    decodeProperties(h.rest, h.end, arena, n.properties);
    return n;
  }

  std::string encodeEdge(const Edge &edge)
  {
    std::string out;
    out.reserve(kLabelHeaderLength + edge.label.size() + 48);
    encodeHeader(out, edge.label, edge.version);
    put_be128(out, edge.fromNode);
    put_be128(out, edge.toNode);
    encodeProperties(out, edge.properties);
    return out;
  }

  Edge decodeEdge(Id id, std::string_view bytes, kj::Arena &arena)
  {
    Header h = decodeHeader(bytes, arena);
    if (h.end - h.rest < 32)
      throw decodeError("corrupt edge endpoints");
    Edge e{};
    e.id = id;
    e.label = h.label;
    e.version = h.version;
    e.fromNode = read_be128(h.rest);
    e.toNode = read_be128(h.rest + 16);
    decodeProperties(h.rest + 32, h.end, arena, e.properties);
    return e;
  }

  std::string encodeVectorProperties(const VectorWithoutData &v)
  {
    std::string out;
    out.reserve(kLabelHeaderLength + v.label.size() + 16);
    encodeHeader(out, v.label, v.version);
    out.push_back(v.deleted ? 1 : 0);
    put_be64(out, v.level);
    encodeProperties(out, v.properties);
    return out;
  }

  VectorWithoutData decodeVectorProperties(Id id, std::string_view bytes, kj::Arena &arena)
  {
    Header h = decodeHeader(bytes, arena);
    if (h.end - h.rest < 9)
      throw decodeError("corrupt vector properties");
    VectorWithoutData v{};
    v.id = id;
    v.label = h.label;
    v.version = h.version;
    v.deleted = h.rest[0] != 0;
    v.level = read_be64(h.rest + 1);
    decodeProperties(h.rest + 9, h.end, arena, v.properties);
    return v;
  }

  // -------------------- arena helpers --------------------

  std::string_view copyToArena(kj::Arena &arena, std::string_view s)
  {
    if (s.empty())
      return std::string_view();
    auto buf = arena.allocateArray<char>(s.size());
    std::memcpy(buf.begin(), s.data(), s.size());
    return std::string_view(buf.begin(), buf.size());
  }

  const Properties *copyToArena(kj::Arena &arena, Properties props)
  {
    return &arena.allocate<Properties>(std::move(props));
  }

} // namespace quasar
