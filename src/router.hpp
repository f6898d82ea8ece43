#pragma once
#include "storage.hpp"
#include "schemas/engine.capnp.h"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quasar
{

  struct QueryRequest
  {
    std::string name;
    Properties args;
    std::vector<double> vector;
  };

  // Second half of a handler that had to wait on IO. Runs on a worker.
  using ResumeFn = std::function<void(GraphStorage &, rpc::QueryResult::Builder)>;

  // io runs off the worker pool (e.g. an embedding call) and returns what to
  // resume with once its result is in.
  struct IoContinuation
  {
    std::function<ResumeFn()> io;
  };

  // A handler either fills the result and returns nullopt, or hands back an
  // IoContinuation and leaves the result alone.
  using Handler = std::function<std::optional<IoContinuation>(GraphStorage &, const QueryRequest &,
                                                              rpc::QueryResult::Builder)>;

  class Router
  {
  public:
    void add(std::string name, Handler handler);
    const Handler *find(std::string_view name) const;
    std::vector<std::string> names() const;

  private:
    std::map<std::string, Handler, std::less<>> routes_;
  };

  // add_node, get_node, nodes_by_label, add_edge, out_nodes, drop_node,
  // insert_vector, search_vectors, find_by_index
  void addBuiltinQueries(Router &router);

} // namespace quasar
