#include "server.hpp"
#include "wire.hpp"
#include <capnp/serialize.h>
#include <kj/debug.h>

namespace quasar::rpc
{

  EngineImpl::EngineImpl(quasar::WorkerPool &pool) : pool_(pool) {}

  kj::Promise<void> EngineImpl::query(QueryContext ctx)
  {
    auto params = ctx.getParams();

    quasar::QueryRequest req;
    auto name = params.getName();
    req.name = std::string(name.cStr(), name.size());
    req.args = fromRpcProperties(params.getArgs());
    {
      auto vec = params.getVector();
      req.vector.reserve(vec.size());
      for (double x : vec)
        req.vector.push_back(x);
    }
    KJ_LOG(INFO, "query", req.name.c_str(), req.args.size());

    return pool_.submit(std::move(req)).then([KJ_CPCAP(ctx)](kj::Array<capnp::word> words) mutable
                                             {
      capnp::FlatArrayMessageReader reader(words);
      ctx.getResults().setResult(reader.getRoot<QueryResult>()); });
  }

} // namespace quasar::rpc
