#include "traversal_internal.hpp"
#include <lmdb.h>
#include <cstring>
#include <queue>
#include <unordered_map>

namespace quasar
{

  namespace ops
  {

    namespace detail
    {
      std::vector<AdjacencyEntry> adjacency(const Txn &tx, DbHandle dbi, Id nodeId, uint32_t labelHash)
      {
        std::vector<AdjacencyEntry> out;
        auto key = key_adjacency_be(nodeId, labelHash);
        Cursor cur(tx, dbi);
        MDB_val k{}, v{};
        for (bool ok = cur.seekKey(key, k, v); ok; ok = cur.nextDup(k, v))
        {
          if (v.mv_size != kAdjacencyValueSize)
            throw GraphError(GraphError::Code::Decode, "corrupt adjacency entry");
          out.push_back(unpack_adjacency_be(static_cast<const unsigned char *>(v.mv_data)));
        }
        return out;
      }
    } // namespace detail

    namespace
    {
      enum class Dir
      {
        Out,
        In
      };

      DbHandle adjacencyTable(const TraversalContext &ctx, Dir dir)
      {
        return dir == Dir::Out ? ctx.storage.env().outEdges() : ctx.storage.env().inEdges();
      }

      // every adjacency entry of nodeId regardless of label
      std::vector<AdjacencyEntry> adjacencyAllLabels(const Txn &tx, DbHandle dbi, Id nodeId)
      {
        std::vector<AdjacencyEntry> out;
        auto prefix = key_id_be(nodeId);
        Cursor cur(tx, dbi);
        MDB_val k{}, v{};
        for (bool ok = cur.seekRange(prefix, k, v); ok; ok = cur.next(k, v))
        {
          if (k.mv_size != kAdjacencyKeySize || std::memcmp(k.mv_data, prefix.data(), kIdSize) != 0)
            break;
          if (v.mv_size != kAdjacencyValueSize)
            throw GraphError(GraphError::Code::Decode, "corrupt adjacency entry");
          out.push_back(unpack_adjacency_be(static_cast<const unsigned char *>(v.mv_data)));
        }
        return out;
      }

      // walk from every upstream item with an id along label-matching adjacency
      // entries, emitting produce(entry) for each
      template <typename Produce>
      StreamPtr walk(const TraversalContext &ctx, StreamPtr up, std::string label, Dir dir, Produce produce)
      {
        uint32_t hash = hash_label(label);
        DbHandle dbi = adjacencyTable(ctx, dir);
        return detail::flatMap(std::move(up), [ctx, hash, dbi, produce = std::move(produce)](const TraversalValue &item, std::deque<Item> &out)
                               {
          auto id = item.id();
          if (!id)
            return;
          for (const auto &entry : detail::adjacency(ctx.txn, dbi, *id, hash))
          {
            out.push_back(detail::guarded([&]
                                          { return produce(entry); }));
            if (!out.back().ok())
              continue;
            if (out.back().value().isEmpty())
              out.pop_back();
          } });
      }

      template <typename Produce>
      StreamPtr endpoint(StreamPtr up, Produce produce)
      {
        return detail::flatMap(std::move(up), [produce = std::move(produce)](const TraversalValue &item, std::deque<Item> &out)
                               {
          const Edge *edge = std::get_if<Edge>(&item);
          if (!edge)
            throw GraphError(GraphError::Code::Conversion, "expected an edge item");
          out.push_back(detail::guarded([&]
                                        { return produce(*edge); })); });
      }

      TraversalValue loadVector(const TraversalContext &ctx, Id id, bool withData)
      {
        VectorWithoutData meta = ctx.storage.getVectorWithoutData(ctx.txn, ctx.arena, id);
        if (meta.deleted)
          return TraversalValue();
        if (!withData)
          return meta;
        return ctx.storage.getVector(ctx.txn, ctx.arena, id);
      }
    } // namespace

    StreamPtr outE(const TraversalContext &ctx, StreamPtr up, std::string label)
    {
      return walk(ctx, std::move(up), std::move(label), Dir::Out, [ctx](const AdjacencyEntry &e)
                  { return ctx.storage.getEdge(ctx.txn, ctx.arena, e.edgeId); });
    }

    StreamPtr inE(const TraversalContext &ctx, StreamPtr up, std::string label)
    {
      return walk(ctx, std::move(up), std::move(label), Dir::In, [ctx](const AdjacencyEntry &e)
                  { return ctx.storage.getEdge(ctx.txn, ctx.arena, e.edgeId); });
    }

    StreamPtr outNode(const TraversalContext &ctx, StreamPtr up, std::string label)
    {
      return walk(ctx, std::move(up), std::move(label), Dir::Out, [ctx](const AdjacencyEntry &e)
                  { return ctx.storage.getNode(ctx.txn, ctx.arena, e.otherId); });
    }

    StreamPtr inNode(const TraversalContext &ctx, StreamPtr up, std::string label)
    {
      return walk(ctx, std::move(up), std::move(label), Dir::In, [ctx](const AdjacencyEntry &e)
                  { return ctx.storage.getNode(ctx.txn, ctx.arena, e.otherId); });
    }

    StreamPtr outVec(const TraversalContext &ctx, StreamPtr up, std::string label, bool withData)
    {
      return walk(ctx, std::move(up), std::move(label), Dir::Out, [ctx, withData](const AdjacencyEntry &e)
                  { return loadVector(ctx, e.otherId, withData); });
    }

    StreamPtr inVec(const TraversalContext &ctx, StreamPtr up, std::string label, bool withData)
    {
      return walk(ctx, std::move(up), std::move(label), Dir::In, [ctx, withData](const AdjacencyEntry &e)
                  { return loadVector(ctx, e.otherId, withData); });
    }

    StreamPtr fromN(const TraversalContext &ctx, StreamPtr up)
    {
      return endpoint(std::move(up), [ctx](const Edge &e)
                      { return ctx.storage.getNode(ctx.txn, ctx.arena, e.fromNode); });
    }

    StreamPtr toN(const TraversalContext &ctx, StreamPtr up)
    {
      return endpoint(std::move(up), [ctx](const Edge &e)
                      { return ctx.storage.getNode(ctx.txn, ctx.arena, e.toNode); });
    }

    StreamPtr fromV(const TraversalContext &ctx, StreamPtr up, bool withData)
    {
      return endpoint(std::move(up), [ctx, withData](const Edge &e)
                      { return loadVector(ctx, e.fromNode, withData); });
    }

    StreamPtr toV(const TraversalContext &ctx, StreamPtr up, bool withData)
    {
      return endpoint(std::move(up), [ctx, withData](const Edge &e)
                      { return loadVector(ctx, e.toNode, withData); });
    }

    // -------------------- shortest path --------------------

    namespace
    {
      struct Hop
      {
        Id parent;
        Id edge;
      };

      using Parents = std::unordered_map<Id, Hop, IdHash>;

      std::vector<AdjacencyEntry> outgoing(const TraversalContext &ctx, const std::optional<std::string> &label, Id node)
      {
        DbHandle dbi = ctx.storage.env().outEdges();
        if (label)
          return detail::adjacency(ctx.txn, dbi, node, hash_label(*label));
        return adjacencyAllLabels(ctx.txn, dbi, node);
      }

      Path buildPath(const TraversalContext &ctx, const Parents &parents, Id from, Id to)
      {
        std::vector<Id> nodeIds{to};
        std::vector<Id> edgeIds;
        for (Id cur = to; cur != from;)
        {
          const Hop &hop = parents.at(cur);
          edgeIds.push_back(hop.edge);
          nodeIds.push_back(hop.parent);
          cur = hop.parent;
        }
        Path path;
        for (auto it = nodeIds.rbegin(); it != nodeIds.rend(); ++it)
          path.nodes.push_back(ctx.storage.getNode(ctx.txn, ctx.arena, *it));
        for (auto it = edgeIds.rbegin(); it != edgeIds.rend(); ++it)
          path.edges.push_back(ctx.storage.getEdge(ctx.txn, ctx.arena, *it));
        return path;
      }

      GraphError noPath(Id from, Id to)
      {
        return GraphError(GraphError::Code::ShortestPathNotFound,
                          "no path from " + idToString(from) + " to " + idToString(to));
      }

      Path bfs(const TraversalContext &ctx, const std::optional<std::string> &label, Id from, Id to)
      {
        Parents parents;
        std::deque<Id> queue{from};
        parents.emplace(from, Hop{from, 0});
        while (!queue.empty())
        {
          Id cur = queue.front();
          queue.pop_front();
          if (cur == to)
            return buildPath(ctx, parents, from, to);
          for (const auto &e : outgoing(ctx, label, cur))
          {
            if (parents.emplace(e.otherId, Hop{cur, e.edgeId}).second)
              queue.push_back(e.otherId);
          }
        }
        throw noPath(from, to);
      }

      double edgeWeight(const Edge &edge)
      {
        const Value *w = edge.get("weight");
        if (!w)
          return 1.0;
        double weight;
        if (auto d = std::get_if<double>(w))
          weight = *d;
        else if (auto i = std::get_if<int64_t>(w))
          weight = double(*i);
        else if (auto u = std::get_if<uint64_t>(w))
          weight = double(*u);
        else
          throw GraphError(GraphError::Code::Traversal, "edge weight is not numeric");
        if (weight < 0.0)
          throw GraphError(GraphError::Code::Traversal, "negative edge weight " + valueToString(*w));
        return weight;
      }

      Path dijkstra(const TraversalContext &ctx, const std::optional<std::string> &label, Id from, Id to)
      {
        struct Entry
        {
          double dist;
          Id node;
          bool operator>(const Entry &o) const { return dist > o.dist; }
        };
        std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> heap;
        std::unordered_map<Id, double, IdHash> dist{{from, 0.0}};
        Parents parents;
        parents.emplace(from, Hop{from, 0});
        heap.push(Entry{0.0, from});

        while (!heap.empty())
        {
          Entry cur = heap.top();
          heap.pop();
          if (cur.dist > dist[cur.node])
            continue;
          if (cur.node == to)
            return buildPath(ctx, parents, from, to);
          for (const auto &e : outgoing(ctx, label, cur.node))
          {
            double w = edgeWeight(ctx.storage.getEdge(ctx.txn, ctx.arena, e.edgeId));
            double next = cur.dist + w;
            auto it = dist.find(e.otherId);
            if (it == dist.end() || next < it->second)
            {
              dist[e.otherId] = next;
              parents[e.otherId] = Hop{cur.node, e.edgeId};
              heap.push(Entry{next, e.otherId});
            }
          }
        }
        throw noPath(from, to);
      }
    } // namespace

    namespace
    {
      // fixedIsSource: paths run from `fixed` to each upstream node
      StreamPtr pathsFor(const TraversalContext &ctx, StreamPtr up, std::optional<std::string> label, Id fixed,
                         bool fixedIsSource, PathAlgorithm algorithm)
      {
        return detail::flatMap(std::move(up), [ctx, label = std::move(label), fixed, fixedIsSource, algorithm](const TraversalValue &item, std::deque<Item> &out)
                               {
          auto node = item.id();
          if (!node)
            throw GraphError(GraphError::Code::Conversion, "shortest path needs a node item");
          Id from = fixedIsSource ? fixed : *node;
          Id to = fixedIsSource ? *node : fixed;
          out.push_back(detail::guarded([&]
                                        { return algorithm == PathAlgorithm::Bfs ? bfs(ctx, label, from, to)
                                                                                 : dijkstra(ctx, label, from, to); })); });
      }
    } // namespace

    StreamPtr shortestPath(const TraversalContext &ctx, StreamPtr up, std::optional<std::string> label, Id to,
                           PathAlgorithm algorithm)
    {
      return pathsFor(ctx, std::move(up), std::move(label), to, false, algorithm);
    }

    StreamPtr shortestPathFrom(const TraversalContext &ctx, StreamPtr up, std::optional<std::string> label, Id from,
                               PathAlgorithm algorithm)
    {
      return pathsFor(ctx, std::move(up), std::move(label), from, true, algorithm);
    }

  } // namespace ops

} // namespace quasar
