#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace quasar
{

  using Id = unsigned __int128;

  struct IdHash
  {
    std::size_t operator()(Id id) const noexcept
    {
      uint64_t hi = static_cast<uint64_t>(id >> 64);
      uint64_t lo = static_cast<uint64_t>(id);
      return static_cast<std::size_t>(hi ^ (lo * 0x9e3779b97f4a7c15ull));
    }
  };

  // Time-ordered UUIDv6 style id, strictly increasing within the process.
  Id newId();

  std::string idToString(Id id);
  std::optional<Id> parseId(std::string_view text);

} // namespace quasar
