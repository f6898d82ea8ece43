#pragma once
#include "value.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace quasar
{

  struct SecondaryIndexConfig
  {
    std::string name;
    bool unique{false};
  };

  struct Config
  {
    size_t m{16};
    size_t efConstruction{128};
    size_t efSearch{768};
    std::vector<SecondaryIndexConfig> secondaryIndices{};
    size_t dbMaxSizeGb{20};

    size_t mapSizeBytes() const;
  };

  constexpr size_t kMaxDbSizeGb = 9998;

  // Per-label record versions. Records read with an older version byte are
  // upgraded in memory, one step at a time, up to the latest version.
  class VersionInfo
  {
  public:
    using Transition = std::function<void(Properties &)>;

    void setLatest(std::string_view label, uint8_t version);
    // transition from `from` to `from + 1`
    void addTransition(std::string_view label, uint8_t from, Transition fn);

    uint8_t latest(std::string_view label) const;
    // returns the version reached
    uint8_t upgrade(std::string_view label, uint8_t version, Properties &props) const;
    bool needsUpgrade(std::string_view label, uint8_t version) const;

  private:
    struct LabelVersions
    {
      uint8_t latest{1};
      std::map<uint8_t, Transition> transitions;
    };
    std::map<std::string, LabelVersions, std::less<>> labels_;
  };

} // namespace quasar
