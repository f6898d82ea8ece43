#pragma once
#include "id.hpp"
#include "value.hpp"
#include <kj/common.h>
#include <cstdint>
#include <optional>
#include <string_view>

namespace quasar
{

  constexpr double kMinDistance = 0.0;
  constexpr double kOrthogonal = 1.0;
  constexpr double kMaxDistance = 2.0;

  // 1 - cosine similarity. Zero-norm inputs give kMaxDistance.
  // Mismatched lengths are a caller bug and fail a KJ precondition.
  double cosineDistance(kj::ArrayPtr<const double> a, kj::ArrayPtr<const double> b);

  struct HVector
  {
    Id id{0};
    std::string_view label{};
    uint8_t version{1};
    uint64_t level{0};
    bool deleted{false};
    std::optional<double> distance{};
    kj::ArrayPtr<const double> data{};
    const Properties *properties{nullptr};

    size_t len() const { return data.size(); }
    const Value *get(std::string_view key) const
    {
      return properties ? findProperty(*properties, key) : nullptr;
    }
  };

  // HVector metadata without the payload.
  struct VectorWithoutData
  {
    Id id{0};
    std::string_view label{};
    uint8_t version{1};
    uint64_t level{0};
    bool deleted{false};
    const Properties *properties{nullptr};

    const Value *get(std::string_view key) const
    {
      return properties ? findProperty(*properties, key) : nullptr;
    }
  };

} // namespace quasar
