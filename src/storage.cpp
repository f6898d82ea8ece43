#include "storage.hpp"
#include "codec.hpp"
#include "encode.hpp"
#include "metadata.hpp"
#include <lmdb.h>
#include <kj/debug.h>
#include <cstring>
#include <mutex>
#include <set>

namespace quasar
{

  namespace
  {
    constexpr unsigned int kFixedTables = 16;
    constexpr unsigned int kRuntimeIndexHeadroom = 64;

    struct AdjacencyRow
    {
      uint32_t labelHash;
      Id edgeId;
      Id otherId;
    };

    // every (labelHash, edge, other) stored under any key starting with nodeId
    std::vector<AdjacencyRow> scan_adjacency(const Txn &tx, DbHandle dbi, Id nodeId)
    {
      std::vector<AdjacencyRow> rows;
      std::string prefix = key_id_be(nodeId);
      Cursor cur(tx, dbi);
      MDB_val k{}, v{};
      for (bool ok = cur.seekRange(prefix, k, v); ok; ok = cur.next(k, v))
      {
        if (k.mv_size != kAdjacencyKeySize || std::memcmp(k.mv_data, prefix.data(), kIdSize) != 0)
          break;
        if (v.mv_size != kAdjacencyValueSize)
          throw GraphError(GraphError::Code::Decode, "corrupt adjacency entry");
        auto kb = static_cast<const unsigned char *>(k.mv_data);
        auto entry = unpack_adjacency_be(static_cast<const unsigned char *>(v.mv_data));
        rows.push_back(AdjacencyRow{read_be32(kb + kIdSize), entry.edgeId, entry.otherId});
      }
      return rows;
    }

    Properties merged_properties(const Properties *current, const Properties &props)
    {
      Properties merged = current ? *current : Properties{};
      for (const auto &[k, v] : props)
        setProperty(merged, k, v);
      return merged;
    }

    void del_key(Txn &tx, DbHandle dbi, const std::string &key)
    {
      MDB_val k{key.size(), const_cast<char *>(key.data())};
      int rc = mdb_del(tx.get(), dbi, &k, nullptr);
      if (rc && rc != MDB_NOTFOUND)
        throw MdbError(mdb_strerror(rc));
    }
  } // namespace

  GraphStorage::GraphStorage(const std::filesystem::path &path, Config config, VersionInfo versionInfo)
      : env_(path, config.mapSizeBytes(),
             kFixedTables + static_cast<unsigned int>(config.secondaryIndices.size()) + kRuntimeIndexHeadroom),
        config_(std::move(config)),
        versionInfo_(std::move(versionInfo)),
        vectors_(env_, HnswConfig::make(config_.m, config_.efConstruction, config_.efSearch))
  {
    StorageVersion version = migrate(env_);

    Txn tx(env_.raw(), true);
    for (const auto &idx : config_.secondaryIndices)
    {
      DbHandle dbi = env_.openIndex(tx, idx.name, idx.unique);
      indices_[idx.name] = SecondaryIndex{idx.name, dbi, idx.unique};
    }
    tx.commit();

    KJ_LOG(INFO, "opened graph store", path.c_str(), static_cast<uint64_t>(version), indices_.size());
  }

  Txn GraphStorage::readTxn() const { return Txn(env_.raw(), false); }
  Txn GraphStorage::writeTxn() const { return Txn(env_.raw(), true); }

  // -------------------- nodes / edges --------------------

  Node GraphStorage::getNode(const Txn &tx, kj::Arena &arena, Id id) const
  {
    auto key = key_id_be(id);
    MDB_val k{key.size(), key.data()}, v{};
    int rc = mdb_get(tx.get(), env_.nodes(), &k, &v);
    if (rc == MDB_NOTFOUND)
      throw GraphError(GraphError::Code::NodeNotFound, "node not found " + idToString(id));
    if (rc)
      throw MdbError(mdb_strerror(rc));
    return nodeFromRecord(id, std::string_view(static_cast<const char *>(v.mv_data), v.mv_size), arena);
  }

  Node GraphStorage::nodeFromRecord(Id id, std::string_view bytes, kj::Arena &arena) const
  {
    Node node = decodeNode(id, bytes, arena);
    if (versionInfo_.needsUpgrade(node.label, node.version))
    {
      Properties props = node.properties ? *node.properties : Properties{};
      node.version = versionInfo_.upgrade(node.label, node.version, props);
      node.properties = copyToArena(arena, std::move(props));
    }
    return node;
  }

  Edge GraphStorage::getEdge(const Txn &tx, kj::Arena &arena, Id id) const
  {
    auto key = key_id_be(id);
    MDB_val k{key.size(), key.data()}, v{};
    int rc = mdb_get(tx.get(), env_.edges(), &k, &v);
    if (rc == MDB_NOTFOUND)
      throw GraphError(GraphError::Code::EdgeNotFound, "edge not found " + idToString(id));
    if (rc)
      throw MdbError(mdb_strerror(rc));
    return decodeEdge(id, std::string_view(static_cast<const char *>(v.mv_data), v.mv_size), arena);
  }

  void GraphStorage::putNodeRecord(Txn &tx, const Node &node)
  {
    auto key = key_id_be(node.id);
    auto val = encodeNode(node);
    MDB_val k{key.size(), key.data()};
    MDB_val v{val.size(), val.data()};
    int rc = mdb_put(tx.get(), env_.nodes(), &k, &v, 0);
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

  Node GraphStorage::addNode(Txn &tx, kj::Arena &arena, std::string_view label, Properties props)
  {
    Node node{};
    node.id = newId();
    node.label = copyToArena(arena, label);
    node.version = versionInfo_.latest(label);
    node.properties = props.empty() ? nullptr : copyToArena(arena, std::move(props));

    if (node.properties)
    {
      std::shared_lock lock(indicesMutex_);
      // unique keys are checked before anything is written
      for (const auto &[name, idx] : indices_)
      {
        if (const Value *v = node.get(name))
          checkUniqueKey(tx, idx, *v, node.id);
      }
      for (const auto &[name, idx] : indices_)
      {
        if (const Value *v = node.get(name))
          putIndexEntry(tx, idx, *v, node.id);
      }
    }
    putNodeRecord(tx, node);
    return node;
  }

  Edge GraphStorage::addEdge(Txn &tx, kj::Arena &arena, std::string_view label, Properties props, Id from, Id to)
  {
    Edge edge{};
    edge.id = newId();
    edge.label = copyToArena(arena, label);
    edge.version = versionInfo_.latest(label);
    edge.fromNode = from;
    edge.toNode = to;
    edge.properties = props.empty() ? nullptr : copyToArena(arena, std::move(props));

    auto key = key_id_be(edge.id);
    auto val = encodeEdge(edge);
    MDB_val k{key.size(), key.data()};
    MDB_val v{val.size(), val.data()};
    int rc = mdb_put(tx.get(), env_.edges(), &k, &v, MDB_NOOVERWRITE);
    if (rc)
      throw MdbError(mdb_strerror(rc));

    uint32_t hash = hash_label(label);
    auto outKey = key_adjacency_be(from, hash);
    auto outVal = pack_adjacency_be(edge.id, to);
    MDB_val ok{outKey.size(), outKey.data()};
    MDB_val ov{outVal.size(), outVal.data()};
    rc = mdb_put(tx.get(), env_.outEdges(), &ok, &ov, MDB_NODUPDATA);
    if (rc)
      throw MdbError(mdb_strerror(rc));

    auto inKey = key_adjacency_be(to, hash);
    auto inVal = pack_adjacency_be(edge.id, from);
    MDB_val ik{inKey.size(), inKey.data()};
    MDB_val iv{inVal.size(), inVal.data()};
    rc = mdb_put(tx.get(), env_.inEdges(), &ik, &iv, MDB_NODUPDATA);
    if (rc)
      throw MdbError(mdb_strerror(rc));
    return edge;
  }

  Node GraphStorage::updateNode(Txn &tx, kj::Arena &arena, const Node &node, const Properties &props)
  {
    Properties merged = merged_properties(node.properties, props);

    Node updated = node;
    updated.version = versionInfo_.latest(node.label);
    updated.properties = merged.empty() ? nullptr : copyToArena(arena, std::move(merged));

    {
      std::shared_lock lock(indicesMutex_);
      auto changed = [&](const Value *oldV, const Value *newV)
      {
        return !(oldV && newV && valuesEqual(*oldV, *newV) && oldV->index() == newV->index());
      };
      for (const auto &[name, idx] : indices_)
      {
        const Value *newV = updated.get(name);
        if (newV && changed(node.get(name), newV))
          checkUniqueKey(tx, idx, *newV, node.id);
      }
      for (const auto &[name, idx] : indices_)
      {
        const Value *oldV = node.get(name);
        const Value *newV = updated.get(name);
        if (!changed(oldV, newV))
          continue;
        if (oldV)
          deleteIndexEntry(tx, idx, *oldV, node.id);
        if (newV)
          putIndexEntry(tx, idx, *newV, node.id);
      }
    }
    putNodeRecord(tx, updated);
    return updated;
  }

  Edge GraphStorage::updateEdge(Txn &tx, kj::Arena &arena, const Edge &edge, const Properties &props)
  {
    Properties merged = merged_properties(edge.properties, props);
    Edge updated = edge;
    updated.version = versionInfo_.latest(edge.label);
    updated.properties = merged.empty() ? nullptr : copyToArena(arena, std::move(merged));

    auto key = key_id_be(updated.id);
    auto val = encodeEdge(updated);
    MDB_val k{key.size(), key.data()};
    MDB_val v{val.size(), val.data()};
    int rc = mdb_put(tx.get(), env_.edges(), &k, &v, 0);
    if (rc)
      throw MdbError(mdb_strerror(rc));
    return updated;
  }

  VectorWithoutData GraphStorage::updateVector(Txn &tx, kj::Arena &arena, Id id, const Properties &props)
  {
    VectorWithoutData meta = getVectorWithoutData(tx, arena, id);
    if (meta.deleted)
      throw GraphError(VectorError(VectorError::Code::VectorDeleted, "vector deleted " + idToString(id)));
    Properties merged = merged_properties(meta.properties, props);
    meta.version = versionInfo_.latest(meta.label);
    meta.properties = merged.empty() ? nullptr : copyToArena(arena, std::move(merged));
    vectors_.putVectorProperties(tx, meta);
    return meta;
  }

  void GraphStorage::removeAdjacency(Txn &tx, DbHandle dbi, Id nodeId, uint32_t labelHash, Id edgeId, Id otherId)
  {
    auto key = key_adjacency_be(nodeId, labelHash);
    auto val = pack_adjacency_be(edgeId, otherId);
    MDB_val k{key.size(), key.data()};
    MDB_val v{val.size(), val.data()};
    int rc = mdb_del(tx.get(), dbi, &k, &v);
    if (rc && rc != MDB_NOTFOUND)
      throw MdbError(mdb_strerror(rc));
  }

  void GraphStorage::dropNode(Txn &tx, Id id)
  {
    kj::Arena arena;
    Node node = getNode(tx, arena, id);

    std::set<uint32_t> outHashes;
    for (const auto &row : scan_adjacency(tx, env_.outEdges(), id))
    {
      removeAdjacency(tx, env_.inEdges(), row.otherId, row.labelHash, row.edgeId, id);
      del_key(tx, env_.edges(), key_id_be(row.edgeId));
      outHashes.insert(row.labelHash);
    }
    for (uint32_t h : outHashes)
      del_key(tx, env_.outEdges(), key_adjacency_be(id, h));

    std::set<uint32_t> inHashes;
    for (const auto &row : scan_adjacency(tx, env_.inEdges(), id))
    {
      removeAdjacency(tx, env_.outEdges(), row.otherId, row.labelHash, row.edgeId, id);
      del_key(tx, env_.edges(), key_id_be(row.edgeId));
      inHashes.insert(row.labelHash);
    }
    for (uint32_t h : inHashes)
      del_key(tx, env_.inEdges(), key_adjacency_be(id, h));

    {
      std::shared_lock lock(indicesMutex_);
      for (const auto &[name, idx] : indices_)
      {
        if (const Value *v = node.get(name))
          deleteIndexEntry(tx, idx, *v, id);
      }
    }

    del_key(tx, env_.nodes(), key_id_be(id));
  }

  void GraphStorage::dropEdge(Txn &tx, Id id)
  {
    kj::Arena arena;
    Edge edge = getEdge(tx, arena, id);
    uint32_t hash = hash_label(edge.label);
    removeAdjacency(tx, env_.outEdges(), edge.fromNode, hash, id, edge.toNode);
    removeAdjacency(tx, env_.inEdges(), edge.toNode, hash, id, edge.fromNode);
    del_key(tx, env_.edges(), key_id_be(id));
  }

  void GraphStorage::dropVector(Txn &tx, Id id)
  {
    kj::Arena arena;
    try
    {
      vectors_.softDelete(tx, arena, id);
    }
    catch (const VectorError &e)
    {
      throw GraphError(e);
    }
  }

  // -------------------- vectors --------------------

  HVector GraphStorage::getVector(const Txn &tx, kj::Arena &arena, Id id)
  {
    try
    {
      return vectors_.getFullVector(tx, arena, id);
    }
    catch (const VectorError &e)
    {
      throw GraphError(e);
    }
  }

  VectorWithoutData GraphStorage::getVectorWithoutData(const Txn &tx, kj::Arena &arena, Id id)
  {
    try
    {
      return vectors_.getVectorProperties(tx, arena, id);
    }
    catch (const VectorError &e)
    {
      throw GraphError(e);
    }
  }

  // -------------------- secondary indices --------------------

  void GraphStorage::putIndexEntry(Txn &tx, const SecondaryIndex &idx, const Value &value, Id nodeId)
  {
    auto key = indexKey(value);
    auto val = key_id_be(nodeId);
    MDB_val k{key.size(), key.data()};
    MDB_val v{val.size(), val.data()};
    int rc = mdb_put(tx.get(), idx.dbi, &k, &v, idx.unique ? MDB_NOOVERWRITE : 0);
    if (rc == MDB_KEYEXIST)
      throw GraphError(GraphError::Code::DuplicateKey,
                       "duplicate key for unique index " + idx.name + ": " + valueToString(value));
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

  void GraphStorage::checkUniqueKey(const Txn &tx, const SecondaryIndex &idx, const Value &value, Id nodeId) const
  {
    if (!idx.unique)
      return;
    auto key = indexKey(value);
    MDB_val k{key.size(), key.data()}, cur{};
    int rc = mdb_get(tx.get(), idx.dbi, &k, &cur);
    if (rc == MDB_NOTFOUND)
      return;
    if (rc)
      throw MdbError(mdb_strerror(rc));
    auto owner = key_id_be(nodeId);
    if (cur.mv_size == owner.size() && std::memcmp(cur.mv_data, owner.data(), owner.size()) == 0)
      return;
    throw GraphError(GraphError::Code::DuplicateKey,
                     "duplicate key for unique index " + idx.name + ": " + valueToString(value));
  }

  void GraphStorage::deleteIndexEntry(Txn &tx, const SecondaryIndex &idx, const Value &value, Id nodeId)
  {
    auto key = indexKey(value);
    auto val = key_id_be(nodeId);
    MDB_val k{key.size(), key.data()};
    if (idx.unique)
    {
      // only remove the entry if it still belongs to this node
      MDB_val cur{};
      int rc = mdb_get(tx.get(), idx.dbi, &k, &cur);
      if (rc == MDB_NOTFOUND)
        return;
      if (rc)
        throw MdbError(mdb_strerror(rc));
      if (cur.mv_size != val.size() || std::memcmp(cur.mv_data, val.data(), val.size()) != 0)
        return;
      rc = mdb_del(tx.get(), idx.dbi, &k, nullptr);
      if (rc && rc != MDB_NOTFOUND)
        throw MdbError(mdb_strerror(rc));
      return;
    }
    MDB_val v{val.size(), val.data()};
    int rc = mdb_del(tx.get(), idx.dbi, &k, &v);
    if (rc && rc != MDB_NOTFOUND)
      throw MdbError(mdb_strerror(rc));
  }

  // The LMDB writer lock is always taken before indicesMutex_, the same order
  // a write txn follows when it reaches addNode/updateNode/dropNode.
  void GraphStorage::createSecondaryIndex(const SecondaryIndexConfig &index)
  {
    if (secondaryIndex(index.name))
      return;
    Txn tx(env_.raw(), true);
    DbHandle dbi = env_.openIndex(tx, index.name, index.unique);
    tx.commit();

    std::unique_lock lock(indicesMutex_);
    if (!indices_.emplace(index.name, SecondaryIndex{index.name, dbi, index.unique}).second)
      return;
    KJ_LOG(INFO, "created secondary index", index.name.c_str(), index.unique);
  }

  void GraphStorage::dropSecondaryIndex(std::string_view name)
  {
    Txn tx(env_.raw(), true);
    std::unique_lock lock(indicesMutex_);
    auto it = indices_.find(name);
    if (it == indices_.end())
      return;
    env_.clearIndex(tx, it->second.dbi);
    tx.commit();
    KJ_LOG(INFO, "dropped secondary index", it->first.c_str());
    indices_.erase(it);
  }

  std::optional<SecondaryIndex> GraphStorage::secondaryIndex(std::string_view name) const
  {
    std::shared_lock lock(indicesMutex_);
    auto it = indices_.find(name);
    if (it == indices_.end())
      return std::nullopt;
    return it->second;
  }

  std::vector<std::string> GraphStorage::secondaryIndexNames() const
  {
    std::shared_lock lock(indicesMutex_);
    std::vector<std::string> names;
    names.reserve(indices_.size());
    for (const auto &[name, idx] : indices_)
      names.push_back(name);
    return names;
  }

  std::vector<Id> GraphStorage::lookupIndex(const Txn &tx, std::string_view name, const Value &value) const
  {
    auto idx = secondaryIndex(name);
    if (!idx)
      throw GraphError(GraphError::Code::Traversal, "secondary index not found: " + std::string(name));

    std::vector<Id> ids;
    auto key = indexKey(value);
    Cursor cur(tx, idx->dbi);
    MDB_val k{}, v{};
    for (bool ok = cur.seekKey(key, k, v); ok; ok = idx->unique ? false : cur.nextDup(k, v))
    {
      if (v.mv_size != kIdSize)
        throw GraphError(GraphError::Code::Decode, "corrupt secondary index entry");
      ids.push_back(read_be128(static_cast<const unsigned char *>(v.mv_data)));
    }
    return ids;
  }

} // namespace quasar
