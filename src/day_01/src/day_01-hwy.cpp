#include "northpole/day_01.hpp"

#include <cstddef>
#include <span>

#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "src/day_01-hwy.cpp"

// clang-format off
#include <hwy/foreach_target.h>
// clang-format on

#include <hwy/highway.h>

HWY_BEFORE_NAMESPACE();

namespace northpole {
  namespace HWY_NAMESPACE {
    namespace hn = hwy::HWY_NAMESPACE;

    uint64_t count_dial_zeros(std::span<int64_t const> positions) {
      static constexpr hn::ScalableTag<int64_t> tag{};
      size_t const lane_size = hn::Lanes(tag);

      auto const modulus = hn::Set(tag, dial_size);
      auto const zero = hn::Zero(tag);

      uint64_t total_zeros = 0;
      size_t idx = 0;

      for (; idx + lane_size <= positions.size(); idx += lane_size) {
        auto const vec = hn::LoadU(tag, positions.data() + idx);
        auto const eq = hn::Eq(hn::Mod(vec, modulus), zero);
        total_zeros += hn::CountTrue(tag, eq);
      }

      if (idx < positions.size()) {  // Lanes past the end are zero-filled, so mask them off.
        size_t const remaining = positions.size() - idx;
        auto const vec = hn::LoadN(tag, positions.data() + idx, remaining);
        auto const eq = hn::And(hn::Eq(hn::Mod(vec, modulus), zero), hn::FirstN(tag, remaining));
        total_zeros += hn::CountTrue(tag, eq);
      }

      return total_zeros;
    }

  }  // namespace HWY_NAMESPACE
}  // namespace northpole

HWY_AFTER_NAMESPACE();

#ifdef HWY_ONCE

namespace northpole {

  HWY_EXPORT(count_dial_zeros);

  uint64_t count_dial_zeros(std::span<int64_t const> positions) {
    return HWY_DYNAMIC_DISPATCH(count_dial_zeros)(positions);
  }

}  // namespace northpole

#endif
