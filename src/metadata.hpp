#pragma once
#include "env.hpp"
#include <cstdint>
#include <string>

namespace quasar
{

  enum class StorageVersion : uint64_t
  {
    // no metadata record: vectors were written big-endian
    PreMetadata = 0,
    VectorNativeEndianness = 1,
  };

  constexpr StorageVersion kCurrentStorageVersion = StorageVersion::VectorNativeEndianness;

  const char *nativeEndianness();

  struct StorageMetadata
  {
    StorageVersion version{StorageVersion::PreMetadata};
    std::string vectorEndianness{};

    static StorageMetadata read(const Txn &tx, const Env &env);
    void save(Txn &tx, const Env &env) const;
  };

  // Brings an opened store up to kCurrentStorageVersion. Each step runs once,
  // in its own write transaction, and only ever moves forward.
  StorageVersion migrate(Env &env);

  // individual steps, exposed for tests
  size_t convertVectorsToNativeEndianness(Txn &tx, const Env &env);

} // namespace quasar
