#pragma once
#include "items.hpp"
#include "value.hpp"
#include "vector.hpp"
#include <kj/arena.h>
#include <string>
#include <string_view>

namespace quasar
{

  // Record layout shared by nodes, edges and vector properties:
  //   <u64 LE labelLen>|<label>|<u8 version>|<kind specific>|<property map>
  // property map: <u8 present>[<u32 count>{<u32 keyLen><key><tagged value>}]
  constexpr size_t kLabelHeaderLength = 8;

  void encodeValue(std::string &out, const Value &v);
  const unsigned char *decodeValue(const unsigned char *p, const unsigned char *end, Value &out);

  // secondary index key bytes for a property value
  std::string indexKey(const Value &v);

  std::string encodeNode(const Node &node);
  Node decodeNode(Id id, std::string_view bytes, kj::Arena &arena);

  std::string encodeEdge(const Edge &edge);
  Edge decodeEdge(Id id, std::string_view bytes, kj::Arena &arena);

  std::string encodeVectorProperties(const VectorWithoutData &v);
  VectorWithoutData decodeVectorProperties(Id id, std::string_view bytes, kj::Arena &arena);

  // Label of an encoded record without decoding the rest. Asserts on a
  // structurally corrupt header.
  std::string_view peekLabel(std::string_view bytes);

  std::string_view copyToArena(kj::Arena &arena, std::string_view s);
  const Properties *copyToArena(kj::Arena &arena, Properties props);

} // namespace quasar
