#include "value.hpp"
#include <cmath>
#include <cstdio>

namespace quasar
{

  const Value *findProperty(const Properties &props, std::string_view key)
  {
    for (const auto &[k, v] : props)
    {
      if (k == key)
        return &v;
    }
    return nullptr;
  }

  void setProperty(Properties &props, std::string_view key, Value value)
  {
    for (auto &[k, v] : props)
    {
      if (k == key)
      {
        v = std::move(value);
        return;
      }
    }
    props.emplace_back(std::string(key), std::move(value));
  }

  static bool isNumeric(const Value &v)
  {
    return std::holds_alternative<int64_t>(v) || std::holds_alternative<uint64_t>(v) ||
           std::holds_alternative<double>(v);
  }

  static double asDouble(const Value &v)
  {
    if (auto p = std::get_if<int64_t>(&v))
      return static_cast<double>(*p);
    if (auto p = std::get_if<uint64_t>(&v))
      return static_cast<double>(*p);
    return std::get<double>(v);
  }

  template <typename T>
  static int cmp(const T &a, const T &b)
  {
    return a < b ? -1 : (b < a ? 1 : 0);
  }

  int compareValues(const Value &a, const Value &b)
  {
    if (isNumeric(a) && isNumeric(b))
    {
      // exact integer paths first so large i64/u64 keep their precision
      if (a.index() == b.index())
      {
        if (auto p = std::get_if<int64_t>(&a))
          return cmp(*p, std::get<int64_t>(b));
        if (auto p = std::get_if<uint64_t>(&a))
          return cmp(*p, std::get<uint64_t>(b));
      }
      return cmp(asDouble(a), asDouble(b));
    }
    if (a.index() != b.index())
      return cmp(a.index(), b.index());
    switch (a.index())
    {
    case 0:
      return 0;
    case 1:
      return cmp(std::get<std::string>(a), std::get<std::string>(b));
    case 5:
      return cmp(std::get<bool>(a), std::get<bool>(b));
    case 6:
      return cmp(std::get<Id>(a), std::get<Id>(b));
    default:
      return 0;
    }
  }

  bool valuesEqual(const Value &a, const Value &b)
  {
    return compareValues(a, b) == 0;
  }

  std::string valueToString(const Value &v)
  {
    switch (v.index())
    {
    case 0:
      return "null";
    case 1:
      return std::get<std::string>(v);
    case 2:
      return std::to_string(std::get<int64_t>(v));
    case 3:
      return std::to_string(std::get<uint64_t>(v));
    case 4:
    {
      double d = std::get<double>(v);
      if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 1e15)
        return std::to_string(static_cast<int64_t>(d));
      char buf[32];
      std::snprintf(buf, sizeof(buf), "%.17g", d);
      return buf;
    }
    case 5:
      return std::get<bool>(v) ? "true" : "false";
    case 6:
      return idToString(std::get<Id>(v));
    }
    return "null";
  }

  bool isEmpty(const Value &v)
  {
    return std::holds_alternative<std::monostate>(v);
  }

} // namespace quasar
