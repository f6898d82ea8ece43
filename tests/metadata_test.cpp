#include "encode.hpp"
#include "env.hpp"
#include "metadata.hpp"
#include "storage.hpp"
#include "test_support.hpp"
#include <lmdb.h>
#include <cstring>

using namespace quasar;

namespace
{

  class Metadata : public ::testing::Test
  {
  protected:
    void SetUp() override
    {
      dir_ = quasar::test::uniqueTempPath("quasar-meta-db-");
      std::filesystem::create_directories(dir_);
    }

    void TearDown() override { std::filesystem::remove_all(dir_); }

    static constexpr size_t kMapSize = size_t(1) << 30;

    // what a store written before the metadata table existed looks like
    void writeBigEndianVector(Env &env, Id id, const std::vector<double> &data)
    {
      std::string payload;
      for (double d : data)
      {
        uint64_t bits;
        std::memcpy(&bits, &d, 8);
        put_be64(payload, bits);
      }
      auto key = key_id_be(id);
      Txn tx(env.raw(), true);
      MDB_val k{key.size(), key.data()};
      MDB_val v{payload.size(), payload.data()};
      ASSERT_EQ(mdb_put(tx.get(), env.vectors(), &k, &v, 0), 0);
      tx.commit();
    }

    std::vector<double> readRaw(Env &env, Id id)
    {
      auto key = key_id_be(id);
      Txn tx(env.raw(), false);
      MDB_val k{key.size(), key.data()}, v{};
      EXPECT_EQ(mdb_get(tx.get(), env.vectors(), &k, &v), 0);
      std::vector<double> out(v.mv_size / sizeof(double));
      if (!out.empty())
        std::memcpy(out.data(), v.mv_data, v.mv_size);
      return out;
    }

    std::filesystem::path dir_;
  };

} // namespace

TEST_F(Metadata, FreshStoreIsStampedWithCurrentVersion)
{
  Env env(dir_, kMapSize);
  EXPECT_EQ(migrate(env), kCurrentStorageVersion);

  Txn tx(env.raw(), false);
  StorageMetadata md = StorageMetadata::read(tx, env);
  EXPECT_EQ(md.version, StorageVersion::VectorNativeEndianness);
  EXPECT_EQ(md.vectorEndianness, nativeEndianness());
}

TEST_F(Metadata, LegacyVectorsAreConvertedOnce)
{
  Id id = newId();
  std::vector<double> data{1.5, -2.25, 1e-300};
  {
    Env env(dir_, kMapSize);
    writeBigEndianVector(env, id, data);
    Txn tx(env.raw(), false);
    EXPECT_EQ(StorageMetadata::read(tx, env).version, StorageVersion::PreMetadata);
  }

  {
    Env env(dir_, kMapSize);
    EXPECT_EQ(migrate(env), StorageVersion::VectorNativeEndianness);
    EXPECT_EQ(readRaw(env, id), data);
  }

  // a second open leaves the now native payload alone
  {
    Env env(dir_, kMapSize);
    EXPECT_EQ(migrate(env), StorageVersion::VectorNativeEndianness);
    EXPECT_EQ(readRaw(env, id), data);
  }
}

TEST_F(Metadata, ConversionCountsEveryPayload)
{
  Env env(dir_, kMapSize);
  writeBigEndianVector(env, newId(), {1.0});
  writeBigEndianVector(env, newId(), {2.0, 3.0});

  Txn tx(env.raw(), true);
  EXPECT_EQ(convertVectorsToNativeEndianness(tx, env), 2u);
  tx.abort();
}

TEST_F(Metadata, RaggedPayloadFailsConversion)
{
  Env env(dir_, kMapSize);
  {
    auto key = key_id_be(newId());
    std::string junk("12345");
    Txn tx(env.raw(), true);
    MDB_val k{key.size(), key.data()};
    MDB_val v{junk.size(), junk.data()};
    ASSERT_EQ(mdb_put(tx.get(), env.vectors(), &k, &v, 0), 0);
    tx.commit();
  }
  try
  {
    migrate(env);
    FAIL() << "expected a decode error";
  }
  catch (const GraphError &e)
  {
    EXPECT_EQ(e.code(), GraphError::Code::Decode);
  }

  // nothing was stamped
  Txn tx(env.raw(), false);
  EXPECT_EQ(StorageMetadata::read(tx, env).version, StorageVersion::PreMetadata);
}

TEST_F(Metadata, NewerStoreIsRefused)
{
  {
    Env env(dir_, kMapSize);
    Txn tx(env.raw(), true);
    StorageMetadata md{static_cast<StorageVersion>(99), "little"};
    md.save(tx, env);
    tx.commit();
  }

  Config config;
  config.dbMaxSizeGb = 1;
  try
  {
    GraphStorage storage(dir_, config);
    FAIL() << "expected a storage error";
  }
  catch (const GraphError &e)
  {
    EXPECT_EQ(e.code(), GraphError::Code::Storage);
  }
}

TEST_F(Metadata, GraphStorageMigratesOnOpen)
{
  Id id = newId();
  {
    Env env(dir_, kMapSize);
    writeBigEndianVector(env, id, {0.5, 4.0});
  }

  Config config;
  config.dbMaxSizeGb = 1;
  GraphStorage storage(dir_, config);
  kj::Arena arena;
  Txn tx = storage.readTxn();
  auto payload = storage.vectors().getPayload(tx, arena, id);
  ASSERT_EQ(payload.size(), 2u);
  EXPECT_EQ(payload[0], 0.5);
  EXPECT_EQ(payload[1], 4.0);

  StorageMetadata md = StorageMetadata::read(tx, storage.env());
  EXPECT_EQ(md.version, kCurrentStorageVersion);
}
