#pragma once
#include "config.hpp"
#include "env.hpp"
#include "hnsw.hpp"
#include "items.hpp"
#include <kj/arena.h>
#include <filesystem>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace quasar
{

  struct SecondaryIndex
  {
    std::string name;
    DbHandle dbi{};
    bool unique{false};
  };

  class GraphStorage
  {
  public:
    // path must be an existing directory
    GraphStorage(const std::filesystem::path &path, Config config, VersionInfo versionInfo = {});

    GraphStorage(const GraphStorage &) = delete;
    GraphStorage &operator=(const GraphStorage &) = delete;

    Env &env() { return env_; }
    const Config &config() const { return config_; }
    const VersionInfo &versionInfo() const { return versionInfo_; }
    VectorCore &vectors() { return vectors_; }

    Txn readTxn() const;
    Txn writeTxn() const;

    // -------------------- nodes / edges --------------------

    Node getNode(const Txn &tx, kj::Arena &arena, Id id) const;
    // decodes a nodes-table record, applying any pending version upgrade
    Node nodeFromRecord(Id id, std::string_view bytes, kj::Arena &arena) const;
    Edge getEdge(const Txn &tx, kj::Arena &arena, Id id) const;

    Node addNode(Txn &tx, kj::Arena &arena, std::string_view label, Properties props);
    Edge addEdge(Txn &tx, kj::Arena &arena, std::string_view label, Properties props, Id from, Id to);

    // Rewrites the node with `props` merged over its current properties and
    // moves its secondary index entries to the new values.
    Node updateNode(Txn &tx, kj::Arena &arena, const Node &node, const Properties &props);
    Edge updateEdge(Txn &tx, kj::Arena &arena, const Edge &edge, const Properties &props);
    // merges props into the stored vector metadata; the payload is untouched
    VectorWithoutData updateVector(Txn &tx, kj::Arena &arena, Id id, const Properties &props);

    void dropNode(Txn &tx, Id id);
    void dropEdge(Txn &tx, Id id);
    void dropVector(Txn &tx, Id id);

    // -------------------- vectors --------------------

    HVector getVector(const Txn &tx, kj::Arena &arena, Id id);
    VectorWithoutData getVectorWithoutData(const Txn &tx, kj::Arena &arena, Id id);

    // -------------------- secondary indices --------------------

    void createSecondaryIndex(const SecondaryIndexConfig &index);
    void dropSecondaryIndex(std::string_view name);
    std::optional<SecondaryIndex> secondaryIndex(std::string_view name) const;
    std::vector<std::string> secondaryIndexNames() const;

    // node ids stored under value in the named index
    std::vector<Id> lookupIndex(const Txn &tx, std::string_view name, const Value &value) const;

  private:
    void putIndexEntry(Txn &tx, const SecondaryIndex &idx, const Value &value, Id nodeId);
    // DuplicateKey when a unique index already maps value to another node
    void checkUniqueKey(const Txn &tx, const SecondaryIndex &idx, const Value &value, Id nodeId) const;
    void deleteIndexEntry(Txn &tx, const SecondaryIndex &idx, const Value &value, Id nodeId);
    void putNodeRecord(Txn &tx, const Node &node);
    void removeAdjacency(Txn &tx, DbHandle dbi, Id nodeId, uint32_t labelHash, Id edgeId, Id otherId);

    Env env_;
    Config config_;
    VersionInfo versionInfo_;
    VectorCore vectors_;

    mutable std::shared_mutex indicesMutex_;
    std::map<std::string, SecondaryIndex, std::less<>> indices_;
  };

} // namespace quasar
