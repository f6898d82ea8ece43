#pragma once
#include "router.hpp"
#include <capnp/message.h>
#include <kj/async.h>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

namespace quasar
{

  // Fixed set of pinned threads serving routed queries against one storage.
  // Replies travel back to the submitting thread's event loop as flat
  // Cap'n Proto messages holding a QueryResult.
  class WorkerPool
  {
  public:
    static constexpr size_t kDefaultQueueCapacity = 1000;

    // workers == 0 means one per hardware thread
    WorkerPool(GraphStorage &storage, const Router &router, size_t workers = 0,
               size_t queueCapacity = kDefaultQueueCapacity);
    ~WorkerPool() noexcept;

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    // Must be called from a thread with a running kj::EventLoop. Rejects
    // with OVERLOADED when the request queue is full.
    kj::Promise<kj::Array<capnp::word>> submit(QueryRequest request);

    size_t size() const { return threads_.size(); }

  private:
    using Reply = kj::Own<kj::CrossThreadPromiseFulfiller<kj::Array<capnp::word>>>;

    struct Job
    {
      QueryRequest request;
      Reply reply;
    };

    struct Continuation
    {
      std::string name;
      ResumeFn resume;
      Reply reply;
    };

    void run(size_t index);
    void handle(Job &job);
    void resume(Continuation &cont);
    void startIo(std::string name, IoContinuation cont, Reply reply);

    GraphStorage &storage_;
    const Router &router_;
    const size_t queueCapacity_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Job> requests_;
    std::deque<Continuation> continuations_;
    size_t pendingIo_{0};
    bool stopping_{false};

    std::vector<std::thread> threads_;
  };

} // namespace quasar
