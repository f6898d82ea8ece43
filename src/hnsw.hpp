#pragma once
#include "env.hpp"
#include "vector.hpp"
#include <kj/arena.h>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace quasar
{

  struct HnswConfig
  {
    size_t m{16};
    size_t mMax0{32};
    size_t efConstruction{128};
    size_t efSearch{768};
    double mL{0.0};

    static HnswConfig make(size_t m, size_t efConstruction, size_t efSearch);
  };

  using VectorFilter = std::function<bool(const HVector &, const Txn &)>;

  // HNSW index over the vectors / vector_properties / hnsw_links tables.
  // Structural changes happen only inside write transactions, which LMDB
  // already serializes.
  class VectorCore
  {
  public:
    VectorCore(const Env &env, HnswConfig config);

    const HnswConfig &config() const { return config_; }

    HVector insert(Txn &tx, kj::Arena &arena, kj::ArrayPtr<const double> data, std::string_view label,
                   const Properties *properties, uint8_t version);

    // k closest non-deleted vectors with a matching label, ascending distance
    std::vector<HVector> search(const Txn &tx, kj::Arena &arena, kj::ArrayPtr<const double> query, size_t k,
                                std::string_view label, const VectorFilter *filter = nullptr);

    // sets the deleted flag; links and payload stay in place
    void softDelete(Txn &tx, kj::Arena &arena, Id id);

    HVector getFullVector(const Txn &tx, kj::Arena &arena, Id id);
    VectorWithoutData getVectorProperties(const Txn &tx, kj::Arena &arena, Id id);
    kj::ArrayPtr<const double> getPayload(const Txn &tx, kj::Arena &arena, Id id);
    void putVectorProperties(Txn &tx, const VectorWithoutData &v);

    std::optional<Id> entryPoint(const Txn &tx) const;
    std::vector<Id> neighbors(const Txn &tx, Id id, uint64_t level) const;

  private:
    struct Candidate
    {
      double distance;
      Id id;
    };

    class SearchCache;

    uint64_t randomLevel() const;
    void setEntryPoint(Txn &tx, Id id);
    void putLink(Txn &tx, Id from, uint64_t level, Id to);
    void replaceLinks(Txn &tx, Id id, uint64_t level, const std::vector<Candidate> &keep);

    Candidate greedyClosest(const Txn &tx, SearchCache &cache, kj::ArrayPtr<const double> query,
                            Candidate entry, uint64_t fromLevel, uint64_t toLevel) const;
    std::vector<Candidate> searchLayer(const Txn &tx, SearchCache &cache, kj::ArrayPtr<const double> query,
                                       const std::vector<Candidate> &entries, size_t ef, uint64_t level) const;
    std::vector<Candidate> selectNeighbors(SearchCache &cache, const std::vector<Candidate> &sorted,
                                           size_t cap) const;

    const Env &env_;
    HnswConfig config_;
  };

} // namespace quasar
