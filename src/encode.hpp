#pragma once
#include "id.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace quasar
{

  inline void put_be128(std::string &s, Id x)
  {
    for (int i = 15; i >= 0; --i)
      s.push_back(char(uint8_t(x >> (i * 8))));
  }
  inline void put_be64(std::string &s, uint64_t x)
  {
    for (int i = 7; i >= 0; --i)
      s.push_back(char((x >> (i * 8)) & 0xff));
  }
  inline void put_be32(std::string &s, uint32_t x)
  {
    for (int i = 3; i >= 0; --i)
      s.push_back(char((x >> (i * 8)) & 0xff));
  }
  inline void put_le64(std::string &s, uint64_t x)
  {
    for (int i = 0; i < 8; ++i)
      s.push_back(char((x >> (i * 8)) & 0xff));
  }

  inline Id read_be128(const unsigned char *p)
  {
    Id x = 0;
    for (int i = 0; i < 16; ++i)
      x = (x << 8) | p[i];
    return x;
  }
  inline uint64_t read_be64(const unsigned char *p)
  {
    uint64_t x = 0;
    for (int i = 0; i < 8; ++i)
      x = (x << 8) | p[i];
    return x;
  }
  inline uint32_t read_be32(const unsigned char *p)
  {
    uint32_t x = 0;
    for (int i = 0; i < 4; ++i)
      x = (x << 8) | p[i];
    return x;
  }
  inline uint64_t read_le64(const unsigned char *p)
  {
    uint64_t x = 0;
    for (int i = 7; i >= 0; --i)
      x = (x << 8) | p[i];
    return x;
  }

  // 32-bit FNV-1a over the label bytes; stored big-endian in adjacency keys
  inline uint32_t hash_label(std::string_view label)
  {
    uint32_t h = 2166136261u;
    for (unsigned char c : label)
    {
      h ^= c;
      h *= 16777619u;
    }
    return h;
  }

  constexpr size_t kIdSize = 16;
  constexpr size_t kAdjacencyKeySize = kIdSize + 4;
  constexpr size_t kAdjacencyValueSize = kIdSize + kIdSize;

  // nodes / edges / vectors / vector_properties: <u128 id>
  inline std::string key_id_be(Id id)
  {
    std::string k;
    k.reserve(kIdSize);
    put_be128(k, id);
    return k;
  }

  // out_edges / in_edges: <u128 nodeId>|<u32 labelHash>
  inline std::string key_adjacency_be(Id nodeId, uint32_t labelHash)
  {
    std::string k;
    k.reserve(kAdjacencyKeySize);
    put_be128(k, nodeId);
    put_be32(k, labelHash);
    return k;
  }

  // out_edges / in_edges value: <u128 edgeId>|<u128 otherNodeId>
  inline std::string pack_adjacency_be(Id edgeId, Id otherId)
  {
    std::string v;
    v.reserve(kAdjacencyValueSize);
    put_be128(v, edgeId);
    put_be128(v, otherId);
    return v;
  }

  struct AdjacencyEntry
  {
    Id edgeId{0};
    Id otherId{0};
  };

  inline AdjacencyEntry unpack_adjacency_be(const unsigned char *p)
  {
    return AdjacencyEntry{read_be128(p), read_be128(p + kIdSize)};
  }

  // hnsw_links: <u128 id>|<u64 level>|<u128 neighborId>
  inline std::string key_hnsw_links_prefix_be(Id id, uint64_t level)
  {
    std::string k;
    k.reserve(kIdSize + 8 + kIdSize);
    put_be128(k, id);
    put_be64(k, level);
    return k;
  }
  inline std::string key_hnsw_link_be(Id id, uint64_t level, Id neighbor)
  {
    std::string k = key_hnsw_links_prefix_be(id, level);
    put_be128(k, neighbor);
    return k;
  }

  // metadata / hnsw_meta string keys
  inline std::string key_meta_storage_version() { return std::string("storage_version"); }
  inline std::string key_meta_vector_endianness() { return std::string("vector_endianness"); }
  inline std::string key_hnsw_entry_point() { return std::string("entry_point"); }

  // idx:<name> secondary index tables
  inline std::string index_table_name(std::string_view name)
  {
    return std::string("idx:") + std::string(name);
  }

} // namespace quasar
