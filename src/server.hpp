#pragma once
#include "worker_pool.hpp"
#include "schemas/engine.capnp.h"
#include <capnp/ez-rpc.h>
#include <kj/async-io.h>

namespace quasar::rpc
{

  // Engine RPC front end. Every call is routed through the worker pool; the
  // RPC thread only decodes arguments and copies the reply back.
  class EngineImpl final : public Engine::Server
  {
  public:
    explicit EngineImpl(quasar::WorkerPool &pool);

    kj::Promise<void> query(QueryContext ctx) override;

  private:
    quasar::WorkerPool &pool_;
  };

} // namespace quasar::rpc
