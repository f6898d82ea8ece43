#include "schemas/engine.capnp.h"
#include "router.hpp"
#include "server.hpp"
#include "storage.hpp"
#include "test_support.hpp"
#include "wire.hpp"
#include "worker_pool.hpp"
#include <capnp/ez-rpc.h>
#include <gtest/gtest.h>
#include <kj/async-io.h>
#include <kj/debug.h>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <thread>
#include <unistd.h>

namespace
{

  using quasar::test::uniqueTempPath;

  // Full server stack on its own thread and event loop: storage, builtin
  // routes, worker pool and the Cap'n Proto front end on a unix socket.
  struct RpcServerThread
  {
    std::string dataDir;
    std::string bind;
    std::thread th;

    std::mutex mu;
    std::condition_variable cv;
    bool started = false;
    kj::Own<kj::CrossThreadPromiseFulfiller<void>> stop;

    explicit RpcServerThread(std::string dataDir_, std::string bind_)
        : dataDir(std::move(dataDir_)), bind(std::move(bind_))
    {
      th = std::thread([this]()
                       {
      try {
        std::filesystem::create_directories(std::filesystem::path(dataDir));
        quasar::Config config;
        config.dbMaxSizeGb = 1;
        config.secondaryIndices.push_back(quasar::SecondaryIndexConfig{"email", true});
        quasar::GraphStorage storage(std::filesystem::path(dataDir), config);
        quasar::Router router;
        quasar::addBuiltinQueries(router);
        quasar::WorkerPool pool(storage, router, 2);

        const char* bindC = bind.c_str();
        if (std::strncmp(bindC, "unix:", 5) == 0) {
          const char* path = bindC + 5;
          ::unlink(path);
        }

        capnp::EzRpcServer server(kj::heap<quasar::rpc::EngineImpl>(pool), bindC);
        auto& waitScope = server.getWaitScope();
        auto paf = kj::newPromiseAndCrossThreadFulfiller<void>();
        {
          std::lock_guard lock(mu);
          stop = kj::mv(paf.fulfiller);
          started = true;
        }
        cv.notify_all();
        paf.promise.wait(waitScope);
      } catch (kj::Exception& e) {
        KJ_LOG(ERROR, "rpc server thread failed", e);
      } catch (const std::exception& e) {
        KJ_LOG(ERROR, "rpc server thread failed", e.what());
      }
      std::lock_guard lock(mu);
      started = true;
      cv.notify_all(); });

      std::unique_lock lock(mu);
      cv.wait(lock, [this]
              { return started; });
    }

    ~RpcServerThread()
    {
      {
        std::lock_guard lock(mu);
        if (stop)
          stop->fulfill();
      }
      th.join();
      std::filesystem::remove_all(dataDir);
    }
  };

  void waitForUnixSocketReady(const std::string &path, int maxMs = 2000)
  {
    using namespace std::chrono_literals;
    for (int i = 0; i < maxMs / 10; ++i)
    {
      if (std::filesystem::exists(path))
        return;
      std::this_thread::sleep_for(10ms);
    }
  }

  quasar::Value idValue(quasar::Id id)
  {
    return quasar::Value(std::in_place_type<quasar::Id>, id);
  }

  std::string text(capnp::Text::Reader t)
  {
    return std::string(t.cStr(), t.size());
  }

} // namespace

class IntegrationRpc : public ::testing::Test
{
protected:
  static std::string sockPath;
  static std::string bind;
  static std::unique_ptr<RpcServerThread> server;
  static std::unique_ptr<capnp::EzRpcClient> client;
  static quasar::Id idA, idB, edge1, vec1;

  static void SetUpTestSuite()
  {
    sockPath = uniqueTempPath("quasar-test-sock-", ".sock");
    bind = std::string("unix:") + sockPath;
    server = std::make_unique<RpcServerThread>(uniqueTempPath("quasar-test-db-"), bind);
    waitForUnixSocketReady(sockPath);
    client = std::make_unique<capnp::EzRpcClient>(bind.c_str());
  }

  static void TearDownTestSuite()
  {
    client.reset();
    server.reset();
    std::filesystem::remove(sockPath);
  }

  static capnp::Response<quasar::rpc::Engine::QueryResults> call(const char *name, const quasar::Properties &args,
                                                                  const std::vector<double> &vector = {})
  {
    auto &ws = client->getWaitScope();
    auto cap = client->getMain<quasar::rpc::Engine>();
    auto req = cap.queryRequest();
    req.setName(name);
    auto list = req.initArgs(args.size());
    for (size_t i = 0; i < args.size(); ++i)
    {
      list[i].setKey(args[i].first.c_str());
      quasar::rpc::toRpcValue(list[i].initVal(), args[i].second);
    }
    auto vec = req.initVector(vector.size());
    for (size_t i = 0; i < vector.size(); ++i)
      vec.set(i, vector[i]);
    return req.send().wait(ws);
  }
};

std::string IntegrationRpc::sockPath;
std::string IntegrationRpc::bind;
std::unique_ptr<RpcServerThread> IntegrationRpc::server;
std::unique_ptr<capnp::EzRpcClient> IntegrationRpc::client;
quasar::Id IntegrationRpc::idA = 0;
quasar::Id IntegrationRpc::idB = 0;
quasar::Id IntegrationRpc::edge1 = 0;
quasar::Id IntegrationRpc::vec1 = 0;

TEST_F(IntegrationRpc, Step01_AddNodeA)
{
  auto resp = call("add_node", {{"label", std::string("person")},
                                {"name", std::string("ada")},
                                {"email", std::string("ada@example.com")},
                                {"age", int64_t{36}}});
  auto items = resp.getResult().getItems();
  ASSERT_EQ(items.size(), 1u);
  ASSERT_TRUE(items[0].isNode());
  auto node = items[0].getNode();
  EXPECT_EQ(text(node.getLabel()), "person");
  EXPECT_EQ(node.getProps().size(), 3u);
  idA = quasar::rpc::fromRpcId(node.getId());
  EXPECT_FALSE(idA == 0);
}

TEST_F(IntegrationRpc, Step02_AddNodeB)
{
  auto resp = call("add_node", {{"label", std::string("person")},
                                {"name", std::string("bob")},
                                {"email", std::string("bob@example.com")}});
  auto items = resp.getResult().getItems();
  ASSERT_EQ(items.size(), 1u);
  idB = quasar::rpc::fromRpcId(items[0].getNode().getId());
  EXPECT_FALSE(idB == idA);
}

TEST_F(IntegrationRpc, Step03_DuplicateUniqueKeyFails)
{
  EXPECT_THROW(call("add_node", {{"label", std::string("person")}, {"email", std::string("ada@example.com")}}),
               kj::Exception);

  auto all = call("nodes_by_label", {{"label", std::string("person")}});
  EXPECT_EQ(all.getResult().getItems().size(), 2u);
}

TEST_F(IntegrationRpc, Step04_AddEdge_A_to_B)
{
  auto resp = call("add_edge", {{"label", std::string("knows")},
                                {"from", idValue(idA)},
                                {"to", std::string(quasar::idToString(idB))},
                                {"since", int64_t{2020}}});
  auto items = resp.getResult().getItems();
  ASSERT_EQ(items.size(), 1u);
  ASSERT_TRUE(items[0].isEdge());
  auto e = items[0].getEdge();
  edge1 = quasar::rpc::fromRpcId(e.getId());
  EXPECT_TRUE(quasar::rpc::fromRpcId(e.getFromNode()) == idA);
  EXPECT_TRUE(quasar::rpc::fromRpcId(e.getToNode()) == idB);
  ASSERT_EQ(e.getProps().size(), 1u);
  EXPECT_EQ(e.getProps()[0].getVal().getI64(), 2020);
}

TEST_F(IntegrationRpc, Step05_OutNodesOfA_IncludeB)
{
  auto resp = call("out_nodes", {{"id", idValue(idA)}, {"label", std::string("knows")}});
  auto items = resp.getResult().getItems();
  ASSERT_EQ(items.size(), 1u);
  EXPECT_TRUE(quasar::rpc::fromRpcId(items[0].getNode().getId()) == idB);

  auto none = call("out_nodes", {{"id", idValue(idB)}, {"label", std::string("knows")}});
  EXPECT_EQ(none.getResult().getItems().size(), 0u);
}

TEST_F(IntegrationRpc, Step06_GetNodeA)
{
  auto resp = call("get_node", {{"id", idValue(idA)}});
  auto items = resp.getResult().getItems();
  ASSERT_EQ(items.size(), 1u);

  bool nameOk = false, ageOk = false;
  for (auto p : items[0].getNode().getProps())
  {
    const auto key = p.getKey().cStr();
    auto val = p.getVal();
    if (strcmp(key, "name") == 0)
    {
      EXPECT_EQ(val.which(), quasar::rpc::Value::TEXT);
      if (val.which() == quasar::rpc::Value::TEXT)
        nameOk = text(val.getText()) == "ada";
    }
    else if (strcmp(key, "age") == 0)
    {
      EXPECT_EQ(val.which(), quasar::rpc::Value::I64);
      if (val.which() == quasar::rpc::Value::I64)
        ageOk = val.getI64() == 36;
    }
  }
  EXPECT_TRUE(nameOk);
  EXPECT_TRUE(ageOk);
}

TEST_F(IntegrationRpc, Step07_FindByUniqueIndex)
{
  auto resp = call("find_by_index", {{"label", std::string("person")},
                                     {"index", std::string("email")},
                                     {"value", std::string("bob@example.com")}});
  auto items = resp.getResult().getItems();
  ASSERT_EQ(items.size(), 1u);
  EXPECT_TRUE(quasar::rpc::fromRpcId(items[0].getNode().getId()) == idB);

  EXPECT_THROW(call("find_by_index", {{"label", std::string("person")},
                                      {"index", std::string("phone")},
                                      {"value", std::string("555")}}),
               kj::Exception);
}

TEST_F(IntegrationRpc, Step08_NodesByLabelWithLimit)
{
  auto one = call("nodes_by_label", {{"label", std::string("person")}, {"limit", uint64_t{1}}});
  EXPECT_EQ(one.getResult().getItems().size(), 1u);
  EXPECT_EQ(one.getResult().getCount(), 1u);

  auto robots = call("nodes_by_label", {{"label", std::string("robot")}});
  EXPECT_EQ(robots.getResult().getItems().size(), 0u);
}

TEST_F(IntegrationRpc, Step09_InsertAndSearchVectors)
{
  {
    auto resp = call("insert_vector", {{"label", std::string("doc")}, {"title", std::string("first")}}, {1.0, 2.0, 3.0});
    auto items = resp.getResult().getItems();
    ASSERT_EQ(items.size(), 1u);
    ASSERT_TRUE(items[0].isVector());
    vec1 = quasar::rpc::fromRpcId(items[0].getVector().getId());
    EXPECT_EQ(items[0].getVector().getData().size(), 3u);
  }
  call("insert_vector", {{"label", std::string("doc")}}, {4.0, 5.0, 6.0});
  call("insert_vector", {{"label", std::string("doc")}}, {7.0, 8.0, 9.0});

  auto resp = call("search_vectors", {{"label", std::string("doc")}, {"k", uint64_t{2}}}, {1.0, 2.0, 3.0});
  auto items = resp.getResult().getItems();
  ASSERT_EQ(items.size(), 2u);
  auto best = items[0].getVector();
  EXPECT_TRUE(quasar::rpc::fromRpcId(best.getId()) == vec1);
  EXPECT_NEAR(best.getDistance(), 0.0, 1e-9);
  EXPECT_LT(best.getDistance(), items[1].getVector().getDistance());
  ASSERT_EQ(best.getProps().size(), 1u);
  EXPECT_EQ(text(best.getProps()[0].getVal().getText()), "first");

  // wrong dimension
  EXPECT_THROW(call("search_vectors", {{"label", std::string("doc")}}, {1.0, 2.0}), kj::Exception);
}

TEST_F(IntegrationRpc, Step10_DropNodeA)
{
  auto resp = call("drop_node", {{"id", idValue(idA)}});
  EXPECT_EQ(resp.getResult().getCount(), 1u);

  EXPECT_THROW(call("get_node", {{"id", idValue(idA)}}), kj::Exception);
  EXPECT_THROW(call("drop_node", {{"id", idValue(idA)}}), kj::Exception);
  auto in = call("nodes_by_label", {{"label", std::string("person")}});
  ASSERT_EQ(in.getResult().getItems().size(), 1u);
  EXPECT_TRUE(quasar::rpc::fromRpcId(in.getResult().getItems()[0].getNode().getId()) == idB);

  // the unique email is free again
  auto again = call("add_node", {{"label", std::string("person")}, {"email", std::string("ada@example.com")}});
  EXPECT_EQ(again.getResult().getItems().size(), 1u);
}

TEST_F(IntegrationRpc, Step11_UnknownQueryFails)
{
  try
  {
    call("no_such_query", {});
    FAIL() << "expected an rpc failure";
  }
  catch (const kj::Exception &e)
  {
    EXPECT_NE(std::string(e.getDescription().cStr()).find("unknown query"), std::string::npos);
  }
}
