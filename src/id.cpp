#include "id.hpp"
#include <chrono>
#include <mutex>
#include <random>

namespace quasar
{

  namespace
  {
    // 100ns ticks between 1582-10-15 and 1970-01-01
    constexpr uint64_t kGregorianOffset = 0x01B21DD213814000ull;

    std::mutex gIdMutex;
    Id gLastId = 0;

    uint64_t nodeBits()
    {
      static const uint64_t bits = []
      {
        std::random_device rd;
        std::mt19937_64 gen((uint64_t(rd()) << 32) ^ rd());
        return gen();
      }();
      return bits;
    }

    Id composeV6(uint64_t ticks, uint16_t clockSeq)
    {
      ticks &= 0x0FFFFFFFFFFFFFFFull;
      uint64_t timeHigh = ticks >> 12;  // 48 bits
      uint64_t timeLow = ticks & 0x0FFF; // 12 bits
      uint64_t hi = (timeHigh << 16) | (0x6ull << 12) | timeLow;
      uint64_t lo = (0x2ull << 62) | (uint64_t(clockSeq & 0x3FFF) << 48) | (nodeBits() & 0xFFFFFFFFFFFFull);
      return (Id(hi) << 64) | Id(lo);
    }
  } // namespace

  Id newId()
  {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    uint64_t ticks = uint64_t(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count() / 100) + kGregorianOffset;

    std::lock_guard<std::mutex> lock(gIdMutex);
    Id candidate = composeV6(ticks, 0);
    if (candidate <= gLastId)
      candidate = gLastId + 1;
    gLastId = candidate;
    return candidate;
  }

  std::string idToString(Id id)
  {
    static const char *hex = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (int i = 31; i >= 0; --i)
    {
      out.push_back(hex[unsigned(id >> (i * 4)) & 0xF]);
      if (i == 24 || i == 20 || i == 16 || i == 12)
        out.push_back('-');
    }
    return out;
  }

  std::optional<Id> parseId(std::string_view text)
  {
    Id id = 0;
    int digits = 0;
    for (char c : text)
    {
      if (c == '-')
        continue;
      unsigned v;
      if (c >= '0' && c <= '9')
        v = unsigned(c - '0');
      else if (c >= 'a' && c <= 'f')
        v = unsigned(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F')
        v = unsigned(c - 'A' + 10);
      else
        return std::nullopt;
      id = (id << 4) | Id(v);
      if (++digits > 32)
        return std::nullopt;
    }
    if (digits != 32)
      return std::nullopt;
    return id;
  }

} // namespace quasar
