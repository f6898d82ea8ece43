#include "config.hpp"
#include <algorithm>

namespace quasar
{

  size_t Config::mapSizeBytes() const
  {
    size_t gb = std::min(dbMaxSizeGb, kMaxDbSizeGb);
    if (gb == 0)
      gb = 1;
    return gb * (size_t(1) << 30);
  }

  void VersionInfo::setLatest(std::string_view label, uint8_t version)
  {
    auto it = labels_.find(label);
    if (it == labels_.end())
      it = labels_.emplace(std::string(label), LabelVersions{}).first;
    it->second.latest = version;
  }

  void VersionInfo::addTransition(std::string_view label, uint8_t from, Transition fn)
  {
    auto it = labels_.find(label);
    if (it == labels_.end())
      it = labels_.emplace(std::string(label), LabelVersions{}).first;
    it->second.transitions[from] = std::move(fn);
  }

  uint8_t VersionInfo::latest(std::string_view label) const
  {
    auto it = labels_.find(label);
    return it == labels_.end() ? uint8_t(1) : it->second.latest;
  }

  bool VersionInfo::needsUpgrade(std::string_view label, uint8_t version) const
  {
    auto it = labels_.find(label);
    return it != labels_.end() && version < it->second.latest;
  }

  uint8_t VersionInfo::upgrade(std::string_view label, uint8_t version, Properties &props) const
  {
    auto it = labels_.find(label);
    if (it == labels_.end())
      return version;
    const auto &lv = it->second;
    while (version < lv.latest)
    {
      auto t = lv.transitions.find(version);
      if (t != lv.transitions.end() && t->second)
        t->second(props);
      ++version;
    }
    return version;
  }

} // namespace quasar
