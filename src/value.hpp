#pragma once
#include "id.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace quasar
{

  // empty (monostate), string, i64, u64, f64, bool, id
  using Value = std::variant<std::monostate, std::string, int64_t, uint64_t, double, bool, Id>;

  using Properties = std::vector<std::pair<std::string, Value>>;

  const Value *findProperty(const Properties &props, std::string_view key);

  // Sets key to value, replacing an existing entry with the same key.
  void setProperty(Properties &props, std::string_view key, Value value);

  // <0, 0, >0. Numbers compare numerically across kinds; otherwise by kind.
  int compareValues(const Value &a, const Value &b);

  bool valuesEqual(const Value &a, const Value &b);

  std::string valueToString(const Value &v);

  bool isEmpty(const Value &v);

} // namespace quasar
