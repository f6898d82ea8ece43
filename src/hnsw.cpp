#include "hnsw.hpp"
#include "codec.hpp"
#include "encode.hpp"
#include "id.hpp"
#include <lmdb.h>
#include <kj/debug.h>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <queue>
#include <random>
#include <unordered_map>
#include <unordered_set>

namespace quasar
{

  HnswConfig HnswConfig::make(size_t m, size_t efConstruction, size_t efSearch)
  {
    HnswConfig c{};
    c.m = std::max<size_t>(m, 2);
    c.mMax0 = c.m * 2;
    c.efConstruction = std::max(efConstruction, c.m);
    c.efSearch = std::max<size_t>(efSearch, 1);
    c.mL = 1.0 / std::log(double(c.m));
    return c;
  }

  static VectorError vectorError(VectorError::Code code, Id id, const char *what)
  {
    return VectorError(code, std::string(what) + " " + idToString(id));
  }

  // Payloads touched during one insert/search, loaded once into the arena.
  class VectorCore::SearchCache
  {
  public:
    SearchCache(VectorCore &core, const Txn &tx, kj::Arena &arena) : core_(core), tx_(tx), arena_(arena) {}

    kj::ArrayPtr<const double> payload(Id id)
    {
      auto it = cache_.find(id);
      if (it != cache_.end())
        return it->second;
      auto data = core_.getPayload(tx_, arena_, id);
      cache_.emplace(id, data);
      return data;
    }

    void remember(Id id, kj::ArrayPtr<const double> data) { cache_.emplace(id, data); }

    double distance(kj::ArrayPtr<const double> query, Id id) { return cosineDistance(query, payload(id)); }

  private:
    VectorCore &core_;
    const Txn &tx_;
    kj::Arena &arena_;
    std::unordered_map<Id, kj::ArrayPtr<const double>, IdHash> cache_;
  };

  VectorCore::VectorCore(const Env &env, HnswConfig config) : env_(env), config_(config) {}

  uint64_t VectorCore::randomLevel() const
  {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_real_distribution<double> dist(std::numeric_limits<double>::min(), 1.0);
    double level = std::floor(-std::log(dist(gen)) * config_.mL);
    return static_cast<uint64_t>(std::min(level, 32.0));
  }

  // -------------------- raw table access --------------------

  std::optional<Id> VectorCore::entryPoint(const Txn &tx) const
  {
    auto key = key_hnsw_entry_point();
    MDB_val k{key.size(), const_cast<char *>(key.data())}, v{};
    int rc = mdb_get(tx.get(), env_.hnswMeta(), &k, &v);
    if (rc == MDB_NOTFOUND)
      return std::nullopt;
    if (rc)
      throw MdbError(mdb_strerror(rc));
    if (v.mv_size != kIdSize)
      throw VectorError(VectorError::Code::Conversion, "corrupt hnsw entry point");
    return read_be128(static_cast<const unsigned char *>(v.mv_data));
  }

  void VectorCore::setEntryPoint(Txn &tx, Id id)
  {
    auto key = key_hnsw_entry_point();
    auto val = key_id_be(id);
    MDB_val k{key.size(), key.data()};
    MDB_val v{val.size(), val.data()};
    int rc = mdb_put(tx.get(), env_.hnswMeta(), &k, &v, 0);
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

  kj::ArrayPtr<const double> VectorCore::getPayload(const Txn &tx, kj::Arena &arena, Id id)
  {
    auto key = key_id_be(id);
    MDB_val k{key.size(), key.data()}, v{};
    int rc = mdb_get(tx.get(), env_.vectors(), &k, &v);
    if (rc == MDB_NOTFOUND)
      throw vectorError(VectorError::Code::VectorNotFound, id, "vector not found");
    if (rc)
      throw MdbError(mdb_strerror(rc));
    if (v.mv_size % sizeof(double) != 0)
      throw vectorError(VectorError::Code::InvalidVectorData, id, "corrupt vector payload");
    auto out = arena.allocateArray<double>(v.mv_size / sizeof(double));
    if (v.mv_size > 0)
      std::memcpy(out.begin(), v.mv_data, v.mv_size);
    return out;
  }

  VectorWithoutData VectorCore::getVectorProperties(const Txn &tx, kj::Arena &arena, Id id)
  {
    auto key = key_id_be(id);
    MDB_val k{key.size(), key.data()}, v{};
    int rc = mdb_get(tx.get(), env_.vectorProperties(), &k, &v);
    if (rc == MDB_NOTFOUND)
      throw vectorError(VectorError::Code::VectorNotFound, id, "vector not found");
    if (rc)
      throw MdbError(mdb_strerror(rc));
    return decodeVectorProperties(id, std::string_view(static_cast<const char *>(v.mv_data), v.mv_size), arena);
  }

  void VectorCore::putVectorProperties(Txn &tx, const VectorWithoutData &v)
  {
    auto key = key_id_be(v.id);
    auto val = encodeVectorProperties(v);
    MDB_val k{key.size(), key.data()};
    MDB_val d{val.size(), val.data()};
    int rc = mdb_put(tx.get(), env_.vectorProperties(), &k, &d, 0);
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

  HVector VectorCore::getFullVector(const Txn &tx, kj::Arena &arena, Id id)
  {
    VectorWithoutData meta = getVectorProperties(tx, arena, id);
    HVector v{};
    v.id = meta.id;
    v.label = meta.label;
    v.version = meta.version;
    v.level = meta.level;
    v.deleted = meta.deleted;
    v.properties = meta.properties;
    v.data = getPayload(tx, arena, id);
    return v;
  }

  std::vector<Id> VectorCore::neighbors(const Txn &tx, Id id, uint64_t level) const
  {
    std::vector<Id> out;
    auto prefix = key_hnsw_links_prefix_be(id, level);
    Cursor cur(tx, env_.hnswLinks());
    MDB_val k{}, v{};
    for (bool ok = cur.seekRange(prefix, k, v); ok; ok = cur.next(k, v))
    {
      if (k.mv_size != prefix.size() + kIdSize || std::memcmp(k.mv_data, prefix.data(), prefix.size()) != 0)
        break;
      out.push_back(read_be128(static_cast<const unsigned char *>(k.mv_data) + prefix.size()));
    }
    return out;
  }

  void VectorCore::putLink(Txn &tx, Id from, uint64_t level, Id to)
  {
    auto key = key_hnsw_link_be(from, level, to);
    MDB_val k{key.size(), key.data()};
    MDB_val v{0, nullptr};
    int rc = mdb_put(tx.get(), env_.hnswLinks(), &k, &v, 0);
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

  void VectorCore::replaceLinks(Txn &tx, Id id, uint64_t level, const std::vector<Candidate> &keep)
  {
    for (Id n : neighbors(tx, id, level))
    {
      auto key = key_hnsw_link_be(id, level, n);
      MDB_val k{key.size(), key.data()};
      int rc = mdb_del(tx.get(), env_.hnswLinks(), &k, nullptr);
      if (rc && rc != MDB_NOTFOUND)
        throw MdbError(mdb_strerror(rc));
    }
    for (const auto &c : keep)
      putLink(tx, id, level, c.id);
  }

  // -------------------- search primitives --------------------

  VectorCore::Candidate VectorCore::greedyClosest(const Txn &tx, SearchCache &cache, kj::ArrayPtr<const double> query,
                                                  Candidate entry, uint64_t fromLevel, uint64_t toLevel) const
  {
    Candidate cur = entry;
    for (uint64_t level = fromLevel; level > toLevel; --level)
    {
      bool changed = true;
      while (changed)
      {
        changed = false;
        for (Id n : neighbors(tx, cur.id, level))
        {
          double d = cache.distance(query, n);
          if (d < cur.distance)
          {
            cur = Candidate{d, n};
            changed = true;
          }
        }
      }
    }
    return cur;
  }

  std::vector<VectorCore::Candidate> VectorCore::searchLayer(const Txn &tx, SearchCache &cache,
                                                             kj::ArrayPtr<const double> query,
                                                             const std::vector<Candidate> &entries, size_t ef,
                                                             uint64_t level) const
  {
    auto nearer = [](const Candidate &a, const Candidate &b)
    { return a.distance > b.distance; };
    auto farther = [](const Candidate &a, const Candidate &b)
    { return a.distance < b.distance; };

    std::priority_queue<Candidate, std::vector<Candidate>, decltype(nearer)> candidates(nearer);
    std::priority_queue<Candidate, std::vector<Candidate>, decltype(farther)> results(farther);
    std::unordered_set<Id, IdHash> visited;

    for (const auto &e : entries)
    {
      if (!visited.insert(e.id).second)
        continue;
      candidates.push(e);
      results.push(e);
      if (results.size() > ef)
        results.pop();
    }

    while (!candidates.empty())
    {
      Candidate c = candidates.top();
      candidates.pop();
      if (results.size() >= ef && c.distance > results.top().distance)
        break;
      for (Id n : neighbors(tx, c.id, level))
      {
        if (!visited.insert(n).second)
          continue;
        double d = cache.distance(query, n);
        if (results.size() < ef || d < results.top().distance)
        {
          candidates.push(Candidate{d, n});
          results.push(Candidate{d, n});
          if (results.size() > ef)
            results.pop();
        }
      }
    }

    std::vector<Candidate> out;
    out.reserve(results.size());
    while (!results.empty())
    {
      out.push_back(results.top());
      results.pop();
    }
    std::reverse(out.begin(), out.end());
    return out;
  }

  // keep a candidate only if it is closer to the base than to every neighbor
  // kept so far; pad with the discarded ones up to the cap
  std::vector<VectorCore::Candidate> VectorCore::selectNeighbors(SearchCache &cache,
                                                                 const std::vector<Candidate> &sorted,
                                                                 size_t cap) const
  {
    std::vector<Candidate> selected;
    std::vector<Candidate> discarded;
    selected.reserve(cap);
    for (const auto &c : sorted)
    {
      if (selected.size() >= cap)
        break;
      bool diverse = true;
      auto cdata = cache.payload(c.id);
      for (const auto &s : selected)
      {
        if (cosineDistance(cdata, cache.payload(s.id)) < c.distance)
        {
          diverse = false;
          break;
        }
      }
      (diverse ? selected : discarded).push_back(c);
    }
    for (size_t i = 0; i < discarded.size() && selected.size() < cap; ++i)
      selected.push_back(discarded[i]);
    return selected;
  }

  // -------------------- public operations --------------------

  HVector VectorCore::insert(Txn &tx, kj::Arena &arena, kj::ArrayPtr<const double> data, std::string_view label,
                             const Properties *properties, uint8_t version)
  {
    if (data.size() == 0)
      throw VectorError(VectorError::Code::InvalidVectorData, "cannot insert an empty vector");

    HVector v{};
    v.id = newId();
    v.label = copyToArena(arena, label);
    v.version = version;
    v.level = randomLevel();
    v.properties = properties;
    auto copy = arena.allocateArray<double>(data.size());
    std::copy(data.begin(), data.end(), copy.begin());
    v.data = copy;

    SearchCache cache(*this, tx, arena);
    auto entry = entryPoint(tx);
    if (entry)
    {
      auto epData = cache.payload(*entry);
      if (epData.size() != data.size())
        throw VectorError(VectorError::Code::InvalidVectorLength,
                          "vector length " + std::to_string(data.size()) + " does not match index length " +
                              std::to_string(epData.size()));
    }

    {
      auto key = key_id_be(v.id);
      MDB_val k{key.size(), key.data()};
      MDB_val d{data.size() * sizeof(double), const_cast<double *>(data.begin())};
      int rc = mdb_put(tx.get(), env_.vectors(), &k, &d, MDB_NOOVERWRITE);
      if (rc)
        throw MdbError(mdb_strerror(rc));
    }
    putVectorProperties(tx, VectorWithoutData{v.id, v.label, v.version, v.level, false, v.properties});
    cache.remember(v.id, v.data);

    if (!entry)
    {
      setEntryPoint(tx, v.id);
      return v;
    }

    uint64_t topLevel = getVectorProperties(tx, arena, *entry).level;
    Candidate cur{cache.distance(v.data, *entry), *entry};
    if (topLevel > v.level)
      cur = greedyClosest(tx, cache, v.data, cur, topLevel, v.level);

    std::vector<Candidate> entries{cur};
    for (uint64_t level = std::min(v.level, topLevel) + 1; level-- > 0;)
    {
      auto found = searchLayer(tx, cache, v.data, entries, config_.efConstruction, level);
      size_t cap = level == 0 ? config_.mMax0 : config_.m;
      auto chosen = selectNeighbors(cache, found, cap);

      for (const auto &n : chosen)
      {
        putLink(tx, v.id, level, n.id);
        putLink(tx, n.id, level, v.id);

        auto links = neighbors(tx, n.id, level);
        if (links.size() <= cap)
          continue;
        auto base = cache.payload(n.id);
        std::vector<Candidate> pool;
        pool.reserve(links.size());
        for (Id l : links)
          pool.push_back(Candidate{cosineDistance(base, cache.payload(l)), l});
        std::sort(pool.begin(), pool.end(), [](const Candidate &a, const Candidate &b)
                  { return a.distance < b.distance; });
        replaceLinks(tx, n.id, level, selectNeighbors(cache, pool, cap));
      }
      entries = std::move(found);
    }

    if (v.level > topLevel)
      setEntryPoint(tx, v.id);
    return v;
  }

  std::vector<HVector> VectorCore::search(const Txn &tx, kj::Arena &arena, kj::ArrayPtr<const double> query,
                                          size_t k, std::string_view label, const VectorFilter *filter)
  {
    std::vector<HVector> out;
    if (query.size() == 0)
      throw VectorError(VectorError::Code::InvalidVectorData, "empty query vector");
    auto entry = entryPoint(tx);
    if (!entry)
      throw VectorError(VectorError::Code::EntryPointNotFound, "no entry point found for hnsw index");
    if (k == 0)
      return out;

    SearchCache cache(*this, tx, arena);
    auto epData = cache.payload(*entry);
    if (epData.size() != query.size())
      throw VectorError(VectorError::Code::InvalidVectorLength,
                        "query length " + std::to_string(query.size()) + " does not match index length " +
                            std::to_string(epData.size()));

    uint64_t topLevel = getVectorProperties(tx, arena, *entry).level;
    Candidate cur{cosineDistance(query, epData), *entry};
    cur = greedyClosest(tx, cache, query, cur, topLevel, 0);

    auto found = searchLayer(tx, cache, query, {cur}, std::max(config_.efSearch, k), 0);
    for (const auto &c : found)
    {
      if (out.size() >= k)
        break;
      VectorWithoutData meta = getVectorProperties(tx, arena, c.id);
      if (meta.deleted || meta.label != label)
        continue;
      HVector v{};
      v.id = meta.id;
      v.label = meta.label;
      v.version = meta.version;
      v.level = meta.level;
      v.deleted = false;
      v.properties = meta.properties;
      v.data = cache.payload(c.id);
      v.distance = c.distance;
      if (filter && *filter && !(*filter)(v, tx))
        continue;
      out.push_back(v);
    }
    return out;
  }

  void VectorCore::softDelete(Txn &tx, kj::Arena &arena, Id id)
  {
    VectorWithoutData meta = getVectorProperties(tx, arena, id);
    if (meta.deleted)
      throw vectorError(VectorError::Code::VectorAlreadyDeleted, id, "vector already deleted");
    meta.deleted = true;
    putVectorProperties(tx, meta);
  }

} // namespace quasar
