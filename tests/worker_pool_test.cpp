#include "test_support.hpp"
#include "router.hpp"
#include "wire.hpp"
#include "worker_pool.hpp"
#include <capnp/serialize.h>
#include <kj/async-io.h>
#include <kj/debug.h>
#include <kj/vector.h>
#include <atomic>
#include <mutex>
#include <thread>

using namespace quasar;

namespace
{

  class WorkerPoolTest : public quasar::test::StorageTest
  {
  protected:
    void SetUp() override
    {
      StorageTest::SetUp();
      io_ = kj::heap<kj::AsyncIoContext>(kj::setupAsyncIo());
    }

    void TearDown() override
    {
      io_ = nullptr;
      StorageTest::TearDown();
    }

    kj::WaitScope &ws() { return io_->waitScope; }

    // runs the request and returns the reply's count field
    uint64_t countOf(WorkerPool &pool, QueryRequest request)
    {
      auto words = pool.submit(std::move(request)).wait(ws());
      capnp::FlatArrayMessageReader reader(words);
      return reader.getRoot<rpc::QueryResult>().getCount();
    }

    kj::Exception failureOf(WorkerPool &pool, QueryRequest request)
    {
      std::string name = request.name;
      try
      {
        pool.submit(std::move(request)).wait(ws());
      }
      catch (kj::Exception &e)
      {
        return kj::mv(e);
      }
      ADD_FAILURE() << "query " << name << " did not fail";
      return KJ_EXCEPTION(FAILED, "no failure");
    }

    kj::Own<kj::AsyncIoContext> io_;
    Router router_;
  };

  std::optional<IoContinuation> countArgs(GraphStorage &, const QueryRequest &req, rpc::QueryResult::Builder result)
  {
    result.setCount(req.args.size() + req.vector.size());
    return std::nullopt;
  }

} // namespace

TEST_F(WorkerPoolTest, RoutesByName)
{
  router_.add("count_args", countArgs);
  WorkerPool pool(storage(), router_, 2);
  EXPECT_EQ(pool.size(), 2u);

  QueryRequest req;
  req.name = "count_args";
  req.args = {{"a", int64_t{1}}, {"b", std::string("x")}};
  req.vector = {0.5};
  EXPECT_EQ(countOf(pool, std::move(req)), 3u);
}

TEST_F(WorkerPoolTest, DuplicateRoutesAreRejected)
{
  router_.add("count_args", countArgs);
  EXPECT_THROW(router_.add("count_args", countArgs), kj::Exception);
  EXPECT_THROW(router_.add("empty", nullptr), kj::Exception);
  EXPECT_EQ(router_.names(), std::vector<std::string>{"count_args"});
}

TEST_F(WorkerPoolTest, UnknownQueryFails)
{
  WorkerPool pool(storage(), router_, 1);
  kj::Exception e = failureOf(pool, QueryRequest{"nope", {}, {}});
  EXPECT_EQ(e.getType(), kj::Exception::Type::FAILED);
  EXPECT_NE(std::string(e.getDescription().cStr()).find("unknown query"), std::string::npos);
}

TEST_F(WorkerPoolTest, HandlerErrorsRejectTheReply)
{
  router_.add("boom", [](GraphStorage &, const QueryRequest &, rpc::QueryResult::Builder) -> std::optional<IoContinuation>
              { throw GraphError(GraphError::Code::NodeNotFound, "no such node"); });
  router_.add("missing_arg", [](GraphStorage &, const QueryRequest &req, rpc::QueryResult::Builder) -> std::optional<IoContinuation>
              {
                rpc::textArg(req.args, "label");
                return std::nullopt;
              });
  router_.add("count_args", countArgs);
  WorkerPool pool(storage(), router_, 1);

  kj::Exception boom = failureOf(pool, QueryRequest{"boom", {}, {}});
  EXPECT_EQ(boom.getType(), kj::Exception::Type::FAILED);
  EXPECT_NE(std::string(boom.getDescription().cStr()).find("no such node"), std::string::npos);

  kj::Exception missing = failureOf(pool, QueryRequest{"missing_arg", {}, {}});
  EXPECT_NE(std::string(missing.getDescription().cStr()).find("label"), std::string::npos);

  // the worker survives both
  EXPECT_EQ(countOf(pool, QueryRequest{"count_args", {}, {}}), 0u);
}

TEST_F(WorkerPoolTest, IoContinuationResumesOnAWorker)
{
  std::mutex mu;
  std::thread::id handlerThread, ioThread, resumeThread;

  router_.add("embed", [&](GraphStorage &, const QueryRequest &req, rpc::QueryResult::Builder) -> std::optional<IoContinuation>
              {
                {
                  std::lock_guard lock(mu);
                  handlerThread = std::this_thread::get_id();
                }
                std::string text = rpc::textArg(req.args, "text");
                return IoContinuation{[&, text]() -> ResumeFn
                                      {
                                        {
                                          std::lock_guard lock(mu);
                                          ioThread = std::this_thread::get_id();
                                        }
                                        uint64_t embedded = text.size();
                                        return [&, embedded](GraphStorage &, rpc::QueryResult::Builder result)
                                        {
                                          {
                                            std::lock_guard lock(mu);
                                            resumeThread = std::this_thread::get_id();
                                          }
                                          result.setCount(embedded);
                                        };
                                      }};
              });
  WorkerPool pool(storage(), router_, 1);

  EXPECT_EQ(countOf(pool, QueryRequest{"embed", {{"text", std::string("hello")}}, {}}), 5u);

  std::lock_guard lock(mu);
  EXPECT_EQ(handlerThread, resumeThread);
  EXPECT_NE(handlerThread, ioThread);
}

TEST_F(WorkerPoolTest, IoFailureRejectsTheReply)
{
  router_.add("embed", [](GraphStorage &, const QueryRequest &, rpc::QueryResult::Builder) -> std::optional<IoContinuation>
              {
                return IoContinuation{[]() -> ResumeFn
                                      { throw GraphError(GraphError::Code::Io, "embedding service down"); }};
              });
  WorkerPool pool(storage(), router_, 1);
  kj::Exception e = failureOf(pool, QueryRequest{"embed", {}, {}});
  EXPECT_NE(std::string(e.getDescription().cStr()).find("embedding service down"), std::string::npos);
}

TEST_F(WorkerPoolTest, FullQueueIsOverloaded)
{
  router_.add("count_args", countArgs);
  WorkerPool pool(storage(), router_, 1, 0);
  kj::Exception e = failureOf(pool, QueryRequest{"count_args", {}, {}});
  EXPECT_EQ(e.getType(), kj::Exception::Type::OVERLOADED);
}

TEST_F(WorkerPoolTest, ManyConcurrentQueries)
{
  std::atomic<int> served{0};
  router_.add("n", [&](GraphStorage &, const QueryRequest &req, rpc::QueryResult::Builder result) -> std::optional<IoContinuation>
              {
                ++served;
                result.setCount(rpc::countArg(req.args, "n", 0));
                return std::nullopt;
              });
  WorkerPool pool(storage(), router_, 4);

  kj::Vector<kj::Promise<uint64_t>> replies;
  for (uint64_t i = 0; i < 64; ++i)
  {
    replies.add(pool.submit(QueryRequest{"n", {{"n", i}}, {}})
                    .then([](kj::Array<capnp::word> words)
                          {
                            capnp::FlatArrayMessageReader reader(words);
                            return reader.getRoot<rpc::QueryResult>().getCount(); }));
  }
  auto counts = kj::joinPromises(replies.releaseAsArray()).wait(ws());
  ASSERT_EQ(counts.size(), 64u);
  for (uint64_t i = 0; i < counts.size(); ++i)
    EXPECT_EQ(counts[i], i);
  EXPECT_EQ(served.load(), 64);
}

TEST_F(WorkerPoolTest, BuiltinQueriesShareTheStore)
{
  addBuiltinQueries(router_);
  WorkerPool pool(storage(), router_, 2);

  auto added = pool.submit(QueryRequest{"add_node", {{"label", std::string("person")}, {"name", std::string("ada")}}, {}})
                   .wait(ws());
  capnp::FlatArrayMessageReader addReader(added);
  auto items = addReader.getRoot<rpc::QueryResult>().getItems();
  ASSERT_EQ(items.size(), 1u);
  ASSERT_TRUE(items[0].isNode());
  Id id = rpc::fromRpcId(items[0].getNode().getId());

  auto fetched = pool.submit(QueryRequest{"get_node", {{"id", Value(std::in_place_type<Id>, id)}}, {}}).wait(ws());
  capnp::FlatArrayMessageReader getReader(fetched);
  auto node = getReader.getRoot<rpc::QueryResult>().getItems()[0].getNode();
  EXPECT_EQ(std::string(node.getLabel().cStr()), "person");
  ASSERT_EQ(node.getProps().size(), 1u);
  EXPECT_EQ(std::string(node.getProps()[0].getVal().getText().cStr()), "ada");

  EXPECT_EQ(failureOf(pool, QueryRequest{"get_node", {{"id", std::string("not an id")}}, {}}).getType(),
            kj::Exception::Type::FAILED);
}
