#pragma once
#include "hnsw.hpp"
#include "storage.hpp"
#include "traversal_value.hpp"
#include <kj/arena.h>
#include <kj/debug.h>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace quasar
{

  // Pull-based item source. Every pipeline step wraps its upstream stream.
  class ItemStream
  {
  public:
    virtual ~ItemStream() = default;
    virtual std::optional<Item> next() = 0;
  };

  using StreamPtr = std::unique_ptr<ItemStream>;

  template <typename F>
  class FnStream final : public ItemStream
  {
  public:
    explicit FnStream(F fn) : fn_(std::move(fn)) {}
    std::optional<Item> next() override { return fn_(); }

  private:
    F fn_;
  };

  template <typename F>
  StreamPtr makeStream(F fn)
  {
    return std::make_unique<FnStream<F>>(std::move(fn));
  }

  StreamPtr emptyStream();
  StreamPtr itemsStream(std::vector<Item> items);

  // One storage, one transaction, one arena per top-level operation. Streams
  // holding cursors must be destroyed before the transaction ends.
  struct TraversalContext
  {
    GraphStorage &storage;
    Txn &txn;
    kj::Arena &arena;
  };

  enum class PathAlgorithm
  {
    Bfs,
    Dijkstra,
  };

  using ItemPredicate = std::function<bool(const TraversalValue &, const Txn &)>;
  using MutPredicate = std::function<bool(TraversalValue &, Txn &)>;
  using ItemMapper = std::function<TraversalValue(TraversalValue, const Txn &)>;
  using SubTraversal = std::function<StreamPtr(StreamPtr)>;

  namespace ops
  {
    // sources
    StreamPtr nFromId(const TraversalContext &ctx, Id id);
    StreamPtr nFromType(const TraversalContext &ctx, std::string label);
    StreamPtr nFromIndex(const TraversalContext &ctx, std::string label, std::string index, Value value);
    StreamPtr eFromId(const TraversalContext &ctx, Id id);
    StreamPtr eFromType(const TraversalContext &ctx, std::string label);
    StreamPtr vFromId(const TraversalContext &ctx, Id id, bool withData);
    StreamPtr vFromType(const TraversalContext &ctx, std::string label, bool withData);
    StreamPtr addN(const TraversalContext &ctx, std::string label, Properties props);
    StreamPtr addE(const TraversalContext &ctx, std::string label, Properties props, Id from, Id to);

    // graph walk
    StreamPtr outE(const TraversalContext &ctx, StreamPtr up, std::string label);
    StreamPtr inE(const TraversalContext &ctx, StreamPtr up, std::string label);
    StreamPtr outNode(const TraversalContext &ctx, StreamPtr up, std::string label);
    StreamPtr inNode(const TraversalContext &ctx, StreamPtr up, std::string label);
    StreamPtr outVec(const TraversalContext &ctx, StreamPtr up, std::string label, bool withData);
    StreamPtr inVec(const TraversalContext &ctx, StreamPtr up, std::string label, bool withData);
    StreamPtr fromN(const TraversalContext &ctx, StreamPtr up);
    StreamPtr toN(const TraversalContext &ctx, StreamPtr up);
    StreamPtr fromV(const TraversalContext &ctx, StreamPtr up, bool withData);
    StreamPtr toV(const TraversalContext &ctx, StreamPtr up, bool withData);
    StreamPtr shortestPath(const TraversalContext &ctx, StreamPtr up, std::optional<std::string> label, Id to,
                           PathAlgorithm algorithm);
    StreamPtr shortestPathFrom(const TraversalContext &ctx, StreamPtr up, std::optional<std::string> label, Id from,
                               PathAlgorithm algorithm);

    // vectors
    StreamPtr searchV(const TraversalContext &ctx, std::vector<double> query, size_t k, std::string label,
                      VectorFilter filter);
    StreamPtr bruteForceSearchV(const TraversalContext &ctx, StreamPtr up, std::vector<double> query, size_t k);
    StreamPtr insertV(const TraversalContext &ctx, std::vector<double> query, std::string label, Properties props);

    // utility
    StreamPtr range(StreamPtr up, size_t start, size_t end);
    StreamPtr dedup(const TraversalContext &ctx, StreamPtr up);
    StreamPtr filterRef(const TraversalContext &ctx, StreamPtr up, ItemPredicate pred);
    StreamPtr filterMut(const TraversalContext &ctx, StreamPtr up, MutPredicate pred);
    StreamPtr map(const TraversalContext &ctx, StreamPtr up, ItemMapper fn);
    StreamPtr getProperty(StreamPtr up, std::string key);
    StreamPtr orderBy(StreamPtr up, std::string key, bool descending);
    StreamPtr intersect(StreamPtr up, SubTraversal sub);
    StreamPtr groupBy(const TraversalContext &ctx, StreamPtr up, std::vector<std::string> keys, bool countOnly,
                      bool keepItems);
    StreamPtr countToValue(StreamPtr up);
    StreamPtr update(const TraversalContext &ctx, StreamPtr up, Properties props);
    // update the first upstream item, or insert when upstream is empty
    StreamPtr upsertN(const TraversalContext &ctx, StreamPtr up, std::string label, Properties props);
    StreamPtr upsertE(const TraversalContext &ctx, StreamPtr up, std::string label, Properties props, Id from, Id to);
    StreamPtr upsertV(const TraversalContext &ctx, StreamPtr up, std::vector<double> query, std::string label,
                      Properties props);

    // terminals
    std::vector<TraversalValue> collect(StreamPtr up);
    std::vector<TraversalValue> collectOk(StreamPtr up);
    std::optional<TraversalValue> first(StreamPtr up);
    size_t count(StreamPtr up);
    bool exist(StreamPtr up);
    bool mapValueOr(StreamPtr up, bool fallback, const std::function<bool(const Value &)> &pred);
    void drop(const TraversalContext &ctx, StreamPtr up);
  } // namespace ops

  // Operators shared by both pipeline flavors. Every operator consumes the
  // traversal and returns the extended one.
  template <typename Self>
  class TraversalOps
  {
  public:
    Self nFromId(Id id) && { return wrap(ops::nFromId(ctx_, id)); }
    Self nFromType(std::string label) && { return wrap(ops::nFromType(ctx_, std::move(label))); }
    Self nFromIndex(std::string label, std::string index, Value value) &&
    {
      return wrap(ops::nFromIndex(ctx_, std::move(label), std::move(index), std::move(value)));
    }
    Self eFromId(Id id) && { return wrap(ops::eFromId(ctx_, id)); }
    Self eFromType(std::string label) && { return wrap(ops::eFromType(ctx_, std::move(label))); }
    Self vFromId(Id id, bool withData = true) && { return wrap(ops::vFromId(ctx_, id, withData)); }
    Self vFromType(std::string label, bool withData = true) &&
    {
      return wrap(ops::vFromType(ctx_, std::move(label), withData));
    }
    Self fromItems(std::vector<TraversalValue> values) &&
    {
      std::vector<Item> items;
      items.reserve(values.size());
      for (auto &v : values)
        items.emplace_back(std::move(v));
      return wrap(itemsStream(std::move(items)));
    }

    Self outE(std::string label) && { return wrap(ops::outE(ctx_, take(), std::move(label))); }
    Self inE(std::string label) && { return wrap(ops::inE(ctx_, take(), std::move(label))); }
    Self outNode(std::string label) && { return wrap(ops::outNode(ctx_, take(), std::move(label))); }
    Self inNode(std::string label) && { return wrap(ops::inNode(ctx_, take(), std::move(label))); }
    Self outVec(std::string label, bool withData = true) &&
    {
      return wrap(ops::outVec(ctx_, take(), std::move(label), withData));
    }
    Self inVec(std::string label, bool withData = true) &&
    {
      return wrap(ops::inVec(ctx_, take(), std::move(label), withData));
    }
    Self fromN() && { return wrap(ops::fromN(ctx_, take())); }
    Self toN() && { return wrap(ops::toN(ctx_, take())); }
    Self fromV(bool withData = true) && { return wrap(ops::fromV(ctx_, take(), withData)); }
    Self toV(bool withData = true) && { return wrap(ops::toV(ctx_, take(), withData)); }
    // upstream node -> to
    Self shortestPath(std::optional<std::string> label, Id to, PathAlgorithm algorithm = PathAlgorithm::Bfs) &&
    {
      return wrap(ops::shortestPath(ctx_, take(), std::move(label), to, algorithm));
    }
    // from -> upstream node
    Self shortestPathFrom(std::optional<std::string> label, Id from, PathAlgorithm algorithm = PathAlgorithm::Bfs) &&
    {
      return wrap(ops::shortestPathFrom(ctx_, take(), std::move(label), from, algorithm));
    }

    Self searchV(std::vector<double> query, size_t k, std::string label, VectorFilter filter = nullptr) &&
    {
      return wrap(ops::searchV(ctx_, std::move(query), k, std::move(label), std::move(filter)));
    }
    Self bruteForceSearchV(std::vector<double> query, size_t k) &&
    {
      return wrap(ops::bruteForceSearchV(ctx_, take(), std::move(query), k));
    }

    Self range(size_t start, size_t end) && { return wrap(ops::range(take(), start, end)); }
    Self dedup() && { return wrap(ops::dedup(ctx_, take())); }
    Self filterRef(ItemPredicate pred) && { return wrap(ops::filterRef(ctx_, take(), std::move(pred))); }
    Self map(ItemMapper fn) && { return wrap(ops::map(ctx_, take(), std::move(fn))); }
    Self getProperty(std::string key) && { return wrap(ops::getProperty(take(), std::move(key))); }
    Self orderByAsc(std::string key) && { return wrap(ops::orderBy(take(), std::move(key), false)); }
    Self orderByDesc(std::string key) && { return wrap(ops::orderBy(take(), std::move(key), true)); }
    Self groupBy(std::vector<std::string> keys, bool countOnly = false) &&
    {
      return wrap(ops::groupBy(ctx_, take(), std::move(keys), countOnly, false));
    }
    Self aggregateBy(std::vector<std::string> keys, bool countOnly = false) &&
    {
      return wrap(ops::groupBy(ctx_, take(), std::move(keys), countOnly, true));
    }
    Self countToValue() && { return wrap(ops::countToValue(take())); }

    // sub receives a traversal seeded with one upstream item
    Self intersect(std::function<Self(Self)> sub) &&
    {
      TraversalContext ctx = ctx_;
      return wrap(ops::intersect(take(), [ctx, sub = std::move(sub)](StreamPtr seed)
                                 { return sub(Self(ctx, std::move(seed))).release(); }));
    }

    std::vector<TraversalValue> collect() && { return ops::collect(take()); }
    std::vector<TraversalValue> collectOk() && { return ops::collectOk(take()); }
    std::optional<TraversalValue> first() && { return ops::first(take()); }
    size_t count() && { return ops::count(take()); }
    bool exist() && { return ops::exist(take()); }
    bool mapValueOr(bool fallback, const std::function<bool(const Value &)> &pred) &&
    {
      return ops::mapValueOr(take(), fallback, pred);
    }

    StreamPtr release() && { return take(); }
    const TraversalContext &context() const { return ctx_; }

  protected:
    TraversalOps(const TraversalContext &ctx, StreamPtr stream)
        : ctx_(ctx), stream_(stream ? std::move(stream) : emptyStream()) {}

    StreamPtr take() { return std::move(stream_); }
    Self wrap(StreamPtr s) { return Self(ctx_, std::move(s)); }

    TraversalContext ctx_;
    StreamPtr stream_;
  };

  // Read-only pipeline over a snapshot transaction.
  class RoTraversal : public TraversalOps<RoTraversal>
  {
  public:
    RoTraversal(GraphStorage &storage, Txn &txn, kj::Arena &arena) : TraversalOps({storage, txn, arena}, nullptr) {}
    RoTraversal(const TraversalContext &ctx, StreamPtr stream) : TraversalOps(ctx, std::move(stream)) {}
  };

  // Pipeline over the write transaction; adds the mutating operators.
  class RwTraversal : public TraversalOps<RwTraversal>
  {
  public:
    RwTraversal(GraphStorage &storage, Txn &txn, kj::Arena &arena) : TraversalOps({storage, txn, arena}, nullptr)
    {
      KJ_REQUIRE(txn.writable(), "RwTraversal needs a write transaction");
    }
    RwTraversal(const TraversalContext &ctx, StreamPtr stream) : TraversalOps(ctx, std::move(stream)) {}

    RwTraversal addN(std::string label, Properties props = {}) &&
    {
      return wrap(ops::addN(ctx_, std::move(label), std::move(props)));
    }
    RwTraversal addE(std::string label, Properties props, Id from, Id to) &&
    {
      return wrap(ops::addE(ctx_, std::move(label), std::move(props), from, to));
    }
    RwTraversal insertV(std::vector<double> query, std::string label, Properties props = {}) &&
    {
      return wrap(ops::insertV(ctx_, std::move(query), std::move(label), std::move(props)));
    }
    RwTraversal update(Properties props) && { return wrap(ops::update(ctx_, take(), std::move(props))); }
    RwTraversal filterMut(MutPredicate pred) && { return wrap(ops::filterMut(ctx_, take(), std::move(pred))); }
    RwTraversal upsertN(std::string label, Properties props) &&
    {
      return wrap(ops::upsertN(ctx_, take(), std::move(label), std::move(props)));
    }
    RwTraversal upsertE(std::string label, Properties props, Id from, Id to) &&
    {
      return wrap(ops::upsertE(ctx_, take(), std::move(label), std::move(props), from, to));
    }
    RwTraversal upsertV(std::vector<double> query, std::string label, Properties props = {}) &&
    {
      return wrap(ops::upsertV(ctx_, take(), std::move(query), std::move(label), std::move(props)));
    }

    // deletes every successful upstream item; failed items are skipped
    void drop() && { ops::drop(ctx_, take()); }
  };

} // namespace quasar
