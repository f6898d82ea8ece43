#include "router.hpp"
#include "traversal.hpp"
#include "wire.hpp"
#include <algorithm>
#include <initializer_list>
#include <limits>

namespace quasar
{

  namespace
  {
    using Result = rpc::QueryResult::Builder;

    Properties without(const Properties &args, std::initializer_list<std::string_view> keys)
    {
      Properties out;
      for (const auto &entry : args)
      {
        if (std::find(keys.begin(), keys.end(), entry.first) == keys.end())
          out.push_back(entry);
      }
      return out;
    }

    // Runs build over a read snapshot and writes what it collects.
    template <typename Build>
    void readQuery(GraphStorage &storage, Result result, Build build)
    {
      kj::Arena arena;
      Txn tx = storage.readTxn();
      std::vector<TraversalValue> items = build(RoTraversal(storage, tx, arena));
      rpc::toRpcItems(result, items);
    }

    // Runs build in the write transaction; commits only if it succeeds.
    template <typename Build>
    void writeQuery(GraphStorage &storage, Result result, Build build)
    {
      kj::Arena arena;
      Txn tx = storage.writeTxn();
      std::vector<TraversalValue> items = build(RwTraversal(storage, tx, arena));
      tx.commit();
      rpc::toRpcItems(result, items);
    }

    std::optional<IoContinuation> addNode(GraphStorage &storage, const QueryRequest &req, Result result)
    {
      std::string label = rpc::textArg(req.args, "label");
      writeQuery(storage, result, [&](RwTraversal t)
                 { return std::move(t).addN(label, without(req.args, {"label"})).collect(); });
      return std::nullopt;
    }

    std::optional<IoContinuation> getNode(GraphStorage &storage, const QueryRequest &req, Result result)
    {
      Id id = rpc::idArg(req.args, "id");
      readQuery(storage, result, [&](RoTraversal t)
                { return std::move(t).nFromId(id).collect(); });
      return std::nullopt;
    }

    std::optional<IoContinuation> nodesByLabel(GraphStorage &storage, const QueryRequest &req, Result result)
    {
      std::string label = rpc::textArg(req.args, "label");
      uint64_t limit = rpc::countArg(req.args, "limit", std::numeric_limits<uint64_t>::max());
      readQuery(storage, result, [&](RoTraversal t)
                { return std::move(t).nFromType(label).range(0, limit).collect(); });
      return std::nullopt;
    }

    std::optional<IoContinuation> addEdge(GraphStorage &storage, const QueryRequest &req, Result result)
    {
      std::string label = rpc::textArg(req.args, "label");
      Id from = rpc::idArg(req.args, "from");
      Id to = rpc::idArg(req.args, "to");
      writeQuery(storage, result, [&](RwTraversal t)
                 { return std::move(t).addE(label, without(req.args, {"label", "from", "to"}), from, to).collect(); });
      return std::nullopt;
    }

    std::optional<IoContinuation> outNodes(GraphStorage &storage, const QueryRequest &req, Result result)
    {
      Id id = rpc::idArg(req.args, "id");
      std::string label = rpc::textArg(req.args, "label");
      readQuery(storage, result, [&](RoTraversal t)
                { return std::move(t).nFromId(id).outNode(label).collect(); });
      return std::nullopt;
    }

    std::optional<IoContinuation> dropNode(GraphStorage &storage, const QueryRequest &req, Result result)
    {
      Id id = rpc::idArg(req.args, "id");
      kj::Arena arena;
      Txn tx = storage.writeTxn();
      // drop() skips failed items, so a missing node is reported here
      storage.getNode(tx, arena, id);
      RwTraversal(storage, tx, arena).nFromId(id).drop();
      tx.commit();
      result.initItems(0);
      result.setCount(1);
      return std::nullopt;
    }

    std::optional<IoContinuation> insertVector(GraphStorage &storage, const QueryRequest &req, Result result)
    {
      std::string label = rpc::textArg(req.args, "label");
      writeQuery(storage, result, [&](RwTraversal t)
                 { return std::move(t).insertV(req.vector, label, without(req.args, {"label"})).collect(); });
      return std::nullopt;
    }

    std::optional<IoContinuation> searchVectors(GraphStorage &storage, const QueryRequest &req, Result result)
    {
      std::string label = rpc::textArg(req.args, "label");
      uint64_t k = rpc::countArg(req.args, "k", 10);
      readQuery(storage, result, [&](RoTraversal t)
                { return std::move(t).searchV(req.vector, k, label).collect(); });
      return std::nullopt;
    }

    std::optional<IoContinuation> findByIndex(GraphStorage &storage, const QueryRequest &req, Result result)
    {
      std::string label = rpc::textArg(req.args, "label");
      std::string index = rpc::textArg(req.args, "index");
      Value value = rpc::requireArg(req.args, "value");
      readQuery(storage, result, [&](RoTraversal t)
                { return std::move(t).nFromIndex(label, index, value).collect(); });
      return std::nullopt;
    }
  } // namespace

  void addBuiltinQueries(Router &router)
  {
    router.add("add_node", addNode);
    router.add("get_node", getNode);
    router.add("nodes_by_label", nodesByLabel);
    router.add("add_edge", addEdge);
    router.add("out_nodes", outNodes);
    router.add("drop_node", dropNode);
    router.add("insert_vector", insertVector);
    router.add("search_vectors", searchVectors);
    router.add("find_by_index", findByIndex);
  }

} // namespace quasar
