#include "router.hpp"
#include <kj/debug.h>

namespace quasar
{

  void Router::add(std::string name, Handler handler)
  {
    KJ_REQUIRE(handler != nullptr, "null handler", name.c_str());
    auto [it, inserted] = routes_.emplace(std::move(name), std::move(handler));
    KJ_REQUIRE(inserted, "duplicate route", it->first.c_str());
  }

  const Handler *Router::find(std::string_view name) const
  {
    auto it = routes_.find(name);
    return it == routes_.end() ? nullptr : &it->second;
  }

  std::vector<std::string> Router::names() const
  {
    std::vector<std::string> out;
    out.reserve(routes_.size());
    for (const auto &[name, _] : routes_)
      out.push_back(name);
    return out;
  }

} // namespace quasar
