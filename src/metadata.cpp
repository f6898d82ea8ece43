#include "metadata.hpp"
#include "encode.hpp"
#include <lmdb.h>
#include <kj/debug.h>
#include <bit>
#include <cstring>
#include <utility>
#include <vector>

namespace quasar
{

  const char *nativeEndianness()
  {
    return std::endian::native == std::endian::big ? "big" : "little";
  }

  static bool get_meta(const Txn &tx, const Env &env, const std::string &key, MDB_val &out)
  {
    MDB_val k{key.size(), const_cast<char *>(key.data())};
    int rc = mdb_get(tx.get(), env.metadata(), &k, &out);
    if (rc == MDB_NOTFOUND)
      return false;
    if (rc)
      throw MdbError(mdb_strerror(rc));
    return true;
  }

  static void put_meta(Txn &tx, const Env &env, const std::string &key, std::string_view value)
  {
    MDB_val k{key.size(), const_cast<char *>(key.data())};
    MDB_val v{value.size(), const_cast<char *>(value.data())};
    int rc = mdb_put(tx.get(), env.metadata(), &k, &v, 0);
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

  StorageMetadata StorageMetadata::read(const Txn &tx, const Env &env)
  {
    StorageMetadata md{};
    MDB_val v{};
    if (!get_meta(tx, env, key_meta_storage_version(), v))
      return md;
    if (v.mv_size != 8)
      throw GraphError(GraphError::Code::Decode, "corrupt storage_version record");
    md.version = static_cast<StorageVersion>(read_le64(static_cast<const unsigned char *>(v.mv_data)));
    if (get_meta(tx, env, key_meta_vector_endianness(), v))
      md.vectorEndianness.assign(static_cast<const char *>(v.mv_data), v.mv_size);
    return md;
  }

  void StorageMetadata::save(Txn &tx, const Env &env) const
  {
    std::string ver;
    put_le64(ver, static_cast<uint64_t>(version));
    put_meta(tx, env, key_meta_storage_version(), ver);
    if (!vectorEndianness.empty())
      put_meta(tx, env, key_meta_vector_endianness(), vectorEndianness);
  }

  size_t convertVectorsToNativeEndianness(Txn &tx, const Env &env)
  {
    std::vector<std::pair<std::string, std::string>> rewritten;
    {
      Cursor cur(tx, env.vectors());
      MDB_val k{}, v{};
      for (bool ok = cur.first(k, v); ok; ok = cur.next(k, v))
      {
        if (v.mv_size % sizeof(double) != 0)
          throw GraphError(GraphError::Code::Decode, "vector payload is not a whole number of f64 elements");
        const auto *src = static_cast<const unsigned char *>(v.mv_data);
        size_t n = v.mv_size / sizeof(double);
        std::string out(v.mv_size, '\0');
        for (size_t i = 0; i < n; ++i)
        {
          uint64_t bits = read_be64(src + i * 8);
          double d;
          std::memcpy(&d, &bits, 8);
          std::memcpy(out.data() + i * 8, &d, 8);
        }
        rewritten.emplace_back(std::string(static_cast<const char *>(k.mv_data), k.mv_size), std::move(out));
      }
    }
    for (auto &[key, value] : rewritten)
    {
      MDB_val k{key.size(), key.data()};
      MDB_val v{value.size(), value.data()};
      int rc = mdb_put(tx.get(), env.vectors(), &k, &v, 0);
      if (rc)
        throw MdbError(mdb_strerror(rc));
    }
    return rewritten.size();
  }

  StorageVersion migrate(Env &env)
  {
    StorageMetadata md;
    {
      Txn tx(env.raw(), false);
      md = StorageMetadata::read(tx, env);
    }
    if (static_cast<uint64_t>(md.version) > static_cast<uint64_t>(kCurrentStorageVersion))
      throw GraphError(GraphError::Code::Storage, "store was written by a newer storage version");

    while (md.version != kCurrentStorageVersion)
    {
      Txn tx(env.raw(), true);
      switch (md.version)
      {
      case StorageVersion::PreMetadata:
      {
        size_t n = convertVectorsToNativeEndianness(tx, env);
        KJ_LOG(INFO, "migrated vector payloads to native byte order", n);
        md.version = StorageVersion::VectorNativeEndianness;
        md.vectorEndianness = nativeEndianness();
        break;
      }
      case StorageVersion::VectorNativeEndianness:
        break;
      }
      md.save(tx, env);
      tx.commit();
    }
    return md.version;
  }

} // namespace quasar
