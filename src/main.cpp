#include "config.hpp"
#include "router.hpp"
#include "server.hpp"
#include "storage.hpp"
#include "worker_pool.hpp"
#include <capnp/ez-rpc.h>
#include <kj/async-io.h>
#include <kj/main.h>
#include <kj/debug.h>
#include <filesystem>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <unistd.h>

class QuasardApp
{
public:
  explicit QuasardApp(kj::ProcessContext &context) : context_(context) {}

  kj::MainFunc getMain()
  {
    return kj::MainBuilder(context_, "0.1", "Quasar graph/vector engine served over capnproto RPC")
        .addOption({'v'}, KJ_BIND_METHOD(*this, optVerbose),
                   "increase logging verbosity (INFO)")
        .addOptionWithArg({'b', "bind"}, KJ_BIND_METHOD(*this, optBind),
                          "bind", "bind address (e.g., unix:/tmp/quasar.sock or 0.0.0.0:0)")
        .addOptionWithArg({'d', "data"}, KJ_BIND_METHOD(*this, optData),
                          "dir", "data directory for LMDB (default: data)")
        .addOptionWithArg({"m"}, KJ_BIND_METHOD(*this, optM),
                          "count", "HNSW neighbors per node (default: 16)")
        .addOptionWithArg({"ef-construction"}, KJ_BIND_METHOD(*this, optEfConstruction),
                          "count", "HNSW candidate list size while inserting (default: 128)")
        .addOptionWithArg({"ef-search"}, KJ_BIND_METHOD(*this, optEfSearch),
                          "count", "HNSW candidate list size while searching (default: 768)")
        .addOptionWithArg({'i', "index"}, KJ_BIND_METHOD(*this, optIndex),
                          "name", "declare a secondary index on a node property; a trailing ! makes it unique")
        .addOptionWithArg({"max-size-gb"}, KJ_BIND_METHOD(*this, optMaxSize),
                          "gb", "maximum store size in GiB (default: 20)")
        .addOptionWithArg({'w', "workers"}, KJ_BIND_METHOD(*this, optWorkers),
                          "count", "worker threads (default: one per CPU)")
        .callAfterParsing(KJ_BIND_METHOD(*this, run))
        .build();
  }

private:
  kj::ProcessContext &context_;
  kj::String bind_ = kj::heapString("unix:/tmp/quasar.sock");
  kj::String dataDir_ = kj::heapString("data");
  quasar::Config config_;
  size_t workers_ = 0;

  static bool parseCount(kj::StringPtr value, size_t &out)
  {
    if (value.size() == 0)
      return false;
    char *end = nullptr;
    errno = 0;
    unsigned long long n = std::strtoull(value.cStr(), &end, 10);
    if (errno != 0 || *end != '\0' || value[0] == '-')
      return false;
    out = static_cast<size_t>(n);
    return true;
  }

  kj::MainBuilder::Validity optVerbose()
  {
    context_.increaseLoggingVerbosity();
    return true;
  }

  kj::MainBuilder::Validity optBind(kj::StringPtr value)
  {
    bind_ = kj::heapString(value);
    return true;
  }

  kj::MainBuilder::Validity optData(kj::StringPtr value)
  {
    dataDir_ = kj::heapString(value);
    return true;
  }

  kj::MainBuilder::Validity optM(kj::StringPtr value)
  {
    if (!parseCount(value, config_.m) || config_.m < 2)
      return "m must be an integer of at least 2";
    return true;
  }

  kj::MainBuilder::Validity optEfConstruction(kj::StringPtr value)
  {
    if (!parseCount(value, config_.efConstruction) || config_.efConstruction == 0)
      return "ef-construction must be a positive integer";
    return true;
  }

  kj::MainBuilder::Validity optEfSearch(kj::StringPtr value)
  {
    if (!parseCount(value, config_.efSearch) || config_.efSearch == 0)
      return "ef-search must be a positive integer";
    return true;
  }

  kj::MainBuilder::Validity optIndex(kj::StringPtr value)
  {
    std::string name(value.cStr(), value.size());
    bool unique = !name.empty() && name.back() == '!';
    if (unique)
      name.pop_back();
    if (name.empty())
      return "index name must not be empty";
    config_.secondaryIndices.push_back(quasar::SecondaryIndexConfig{std::move(name), unique});
    return true;
  }

  kj::MainBuilder::Validity optMaxSize(kj::StringPtr value)
  {
    if (!parseCount(value, config_.dbMaxSizeGb) || config_.dbMaxSizeGb == 0)
      return "max-size-gb must be a positive integer";
    return true;
  }

  kj::MainBuilder::Validity optWorkers(kj::StringPtr value)
  {
    if (!parseCount(value, workers_))
      return "workers must be a non-negative integer";
    return true;
  }

  kj::MainBuilder::Validity run()
  {
    try
    {
      std::filesystem::create_directories(std::filesystem::path(dataDir_.cStr()));

      quasar::GraphStorage storage(std::filesystem::path(dataDir_.cStr()), config_);
      quasar::Router router;
      quasar::addBuiltinQueries(router);
      quasar::WorkerPool pool(storage, router, workers_);

      const char *bindC = bind_.cStr();
      if (std::strncmp(bindC, "unix:", 5) == 0)
      {
        const char *path = bindC + 5;
        ::unlink(path);
      }

      capnp::EzRpcServer server(kj::heap<quasar::rpc::EngineImpl>(pool), bindC);
      auto &waitScope = server.getWaitScope();
      if (std::strncmp(bindC, "unix:", 5) == 0)
      {
        KJ_LOG(INFO, "quasard listening on ", bindC, pool.size());
      }
      else
      {
        auto port = server.getPort().wait(waitScope);
        KJ_LOG(INFO, "quasard listening on ", bindC, " (port ", port, ")", pool.size());
      }
      kj::NEVER_DONE.wait(waitScope);
    }
    catch (const quasar::GraphError &e)
    {
      KJ_LOG(ERROR, "fatal: ", quasar::codeName(e.code()), e.what());
      return kj::MainBuilder::Validity("fatal error");
    }
    catch (const std::exception &e)
    {
      KJ_LOG(ERROR, "fatal: ", e.what());
      return kj::MainBuilder::Validity("fatal error");
    }
    return true;
  }
};

KJ_MAIN(QuasardApp);
