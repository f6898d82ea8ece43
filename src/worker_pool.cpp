#include "worker_pool.hpp"
#include <capnp/serialize.h>
#include <kj/debug.h>
#include <pthread.h>
#include <sched.h>
#include <algorithm>
#include <optional>
#include <system_error>

namespace quasar
{

  namespace
  {
    void pinToCpu(std::thread &th, size_t cpu)
    {
      cpu_set_t set;
      CPU_ZERO(&set);
      CPU_SET(cpu, &set);
      int rc = pthread_setaffinity_np(th.native_handle(), sizeof(set), &set);
      if (rc != 0)
        KJ_LOG(WARNING, "could not pin worker thread", cpu, rc);
    }

    // Runs fn; on failure rejects reply with a descriptive exception and
    // returns false.
    template <typename Reply, typename F>
    bool replyOnError(Reply &reply, const std::string &name, F &&fn)
    {
      try
      {
        fn();
        return true;
      }
      catch (const GraphError &e)
      {
        KJ_LOG(WARNING, "query failed", name.c_str(), codeName(e.code()), e.what());
        reply->reject(KJ_EXCEPTION(FAILED, "query failed", name.c_str(), codeName(e.code()), e.what()));
      }
      catch (const VectorError &e)
      {
        KJ_LOG(WARNING, "query failed", name.c_str(), codeName(e.code()), e.what());
        reply->reject(KJ_EXCEPTION(FAILED, "query failed", name.c_str(), codeName(e.code()), e.what()));
      }
      catch (const MdbError &e)
      {
        KJ_LOG(ERROR, "storage failure", name.c_str(), e.what());
        reply->reject(KJ_EXCEPTION(FAILED, "storage error", name.c_str(), e.what()));
      }
      catch (kj::Exception &e)
      {
        KJ_LOG(ERROR, "query raised", name.c_str(), e);
        reply->reject(kj::mv(e));
      }
      catch (const std::exception &e)
      {
        KJ_LOG(ERROR, "query raised", name.c_str(), e.what());
        reply->reject(KJ_EXCEPTION(FAILED, "query failed", name.c_str(), e.what()));
      }
      return false;
    }
  } // namespace

  WorkerPool::WorkerPool(GraphStorage &storage, const Router &router, size_t workers, size_t queueCapacity)
      : storage_(storage), router_(router), queueCapacity_(queueCapacity)
  {
    size_t cpus = std::max<size_t>(1, std::thread::hardware_concurrency());
    if (workers == 0)
      workers = cpus;
    threads_.reserve(workers);
    for (size_t i = 0; i < workers; ++i)
    {
      threads_.emplace_back([this, i]
                            { run(i); });
      pinToCpu(threads_.back(), i % cpus);
    }
    KJ_LOG(INFO, "worker pool started", workers, queueCapacity);
  }

  WorkerPool::~WorkerPool() noexcept
  {
    {
      std::lock_guard lock(mutex_);
      stopping_ = true;
    }
    cv_.notify_all();
    for (auto &th : threads_)
      th.join();

    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this]
             { return pendingIo_ == 0; });
    for (auto &job : requests_)
      job.reply->reject(KJ_EXCEPTION(DISCONNECTED, "worker pool stopped", job.request.name.c_str()));
    for (auto &cont : continuations_)
      cont.reply->reject(KJ_EXCEPTION(DISCONNECTED, "worker pool stopped", cont.name.c_str()));
    requests_.clear();
    continuations_.clear();
    KJ_LOG(INFO, "worker pool stopped");
  }

  kj::Promise<kj::Array<capnp::word>> WorkerPool::submit(QueryRequest request)
  {
    auto paf = kj::newPromiseAndCrossThreadFulfiller<kj::Array<capnp::word>>();
    {
      std::lock_guard lock(mutex_);
      if (stopping_)
        return KJ_EXCEPTION(DISCONNECTED, "worker pool stopped", request.name.c_str());
      if (requests_.size() >= queueCapacity_)
        return KJ_EXCEPTION(OVERLOADED, "worker pool queue is full", request.name.c_str(), queueCapacity_);
      requests_.push_back(Job{std::move(request), kj::mv(paf.fulfiller)});
    }
    cv_.notify_one();
    return kj::mv(paf.promise);
  }

  void WorkerPool::run(size_t index)
  {
    bool preferContinuations = index % 2 == 1;
    for (;;)
    {
      std::optional<Job> job;
      std::optional<Continuation> cont;
      {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]
                 { return stopping_ || !requests_.empty() || !continuations_.empty(); });
        if (stopping_)
          return;
        bool takeContinuation = !continuations_.empty() && (preferContinuations || requests_.empty());
        preferContinuations = !preferContinuations;
        if (takeContinuation)
        {
          cont.emplace(std::move(continuations_.front()));
          continuations_.pop_front();
        }
        else
        {
          job.emplace(std::move(requests_.front()));
          requests_.pop_front();
        }
      }
      if (cont)
        resume(*cont);
      else
        handle(*job);
    }
  }

  void WorkerPool::handle(Job &job)
  {
    const std::string &name = job.request.name;
    const Handler *handler = router_.find(name);
    if (!handler)
    {
      KJ_LOG(WARNING, "unknown query", name.c_str());
      job.reply->reject(KJ_EXCEPTION(FAILED, "unknown query", name.c_str()));
      return;
    }

    std::optional<IoContinuation> io;
    bool ok = replyOnError(job.reply, name, [&]
                           {
      capnp::MallocMessageBuilder message;
      io = (*handler)(storage_, job.request, message.initRoot<rpc::QueryResult>());
      if (!io)
        job.reply->fulfill(capnp::messageToFlatArray(message)); });
    if (ok && io)
      startIo(name, std::move(*io), kj::mv(job.reply));
  }

  void WorkerPool::resume(Continuation &cont)
  {
    replyOnError(cont.reply, cont.name, [&]
                 {
      capnp::MallocMessageBuilder message;
      cont.resume(storage_, message.initRoot<rpc::QueryResult>());
      cont.reply->fulfill(capnp::messageToFlatArray(message)); });
  }

  void WorkerPool::startIo(std::string name, IoContinuation cont, Reply reply)
  {
    {
      std::lock_guard lock(mutex_);
      ++pendingIo_;
    }
    auto task = [this, name = std::move(name), io = std::move(cont.io), reply = kj::mv(reply)]() mutable
    {
      ResumeFn resume;
      bool ok = replyOnError(reply, name, [&]
                             {
        resume = io();
        KJ_REQUIRE(resume != nullptr, "io continuation returned no resume function"); });
      {
        std::lock_guard lock(mutex_);
        --pendingIo_;
        if (ok)
        {
          if (stopping_)
            reply->reject(KJ_EXCEPTION(DISCONNECTED, "worker pool stopped", name.c_str()));
          else
            continuations_.push_back(Continuation{std::move(name), std::move(resume), kj::mv(reply)});
        }
        // under the lock: the destructor may be waiting to tear down cv_
        cv_.notify_all();
      }
    };
    try
    {
      std::thread(std::move(task)).detach();
    }
    catch (const std::system_error &e)
    {
      // the task and its reply are gone; the dropped fulfiller rejects the caller
      KJ_LOG(ERROR, "could not start io thread", e.what());
      std::lock_guard lock(mutex_);
      --pendingIo_;
      cv_.notify_all();
    }
  }

} // namespace quasar
