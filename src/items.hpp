#pragma once
#include "id.hpp"
#include "value.hpp"
#include <cstdint>
#include <string_view>

namespace quasar
{

  // Records produced inside a traversal borrow label and properties from the
  // operation's kj::Arena; they must not outlive it.

  struct Node
  {
    Id id{0};
    std::string_view label{};
    uint8_t version{1};
    const Properties *properties{nullptr};

    const Value *get(std::string_view key) const
    {
      return properties ? findProperty(*properties, key) : nullptr;
    }
  };

  struct Edge
  {
    Id id{0};
    std::string_view label{};
    uint8_t version{1};
    Id fromNode{0};
    Id toNode{0};
    const Properties *properties{nullptr};

    const Value *get(std::string_view key) const
    {
      return properties ? findProperty(*properties, key) : nullptr;
    }
  };

} // namespace quasar
