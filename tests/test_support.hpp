#pragma once
#include "storage.hpp"
#include "traversal.hpp"
#include <gtest/gtest.h>
#include <kj/arena.h>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <unistd.h>

namespace quasar::test
{

  inline std::string uniqueTempPath(const std::string &stem, const std::string &ext = "")
  {
    auto base = std::filesystem::temp_directory_path() / (stem + std::to_string(::getpid()) + "-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    auto s = base.string() + ext;
    return s;
  }

  inline Id idOf(const TraversalValue &v)
  {
    auto id = v.id();
    EXPECT_TRUE(id.has_value());
    return id.value_or(0);
  }

  // Fresh store in its own temporary directory for every test.
  class StorageTest : public ::testing::Test
  {
  protected:
    void SetUp() override
    {
      dataDir_ = uniqueTempPath("quasar-test-db-");
      std::filesystem::create_directories(dataDir_);
      storage_ = std::make_unique<GraphStorage>(dataDir_, config());
    }

    void TearDown() override
    {
      storage_.reset();
      std::filesystem::remove_all(dataDir_);
    }

    virtual Config config() const
    {
      Config c;
      c.dbMaxSizeGb = 1;
      return c;
    }

    // reopen the same directory, e.g. with a different VersionInfo
    void reopen(VersionInfo versionInfo = {})
    {
      storage_.reset();
      storage_ = std::make_unique<GraphStorage>(dataDir_, config(), std::move(versionInfo));
    }

    GraphStorage &storage() { return *storage_; }

    // Adds one node in its own committed transaction.
    Id addNode(const std::string &label, Properties props = {})
    {
      kj::Arena arena;
      Txn tx = storage().writeTxn();
      Node n = storage().addNode(tx, arena, label, std::move(props));
      tx.commit();
      return n.id;
    }

    Id addEdge(const std::string &label, Id from, Id to, Properties props = {})
    {
      kj::Arena arena;
      Txn tx = storage().writeTxn();
      Edge e = storage().addEdge(tx, arena, label, std::move(props), from, to);
      tx.commit();
      return e.id;
    }

    Id addVector(const std::string &label, std::vector<double> data, Properties props = {})
    {
      kj::Arena arena;
      Txn tx = storage().writeTxn();
      auto out = RwTraversal(storage(), tx, arena).insertV(std::move(data), label, std::move(props)).collect();
      tx.commit();
      return idOf(out.at(0));
    }

    std::filesystem::path dataDir_;
    std::unique_ptr<GraphStorage> storage_;
  };

} // namespace quasar::test
