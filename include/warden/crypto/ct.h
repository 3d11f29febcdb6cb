#pragma once
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>

namespace warden::crypto::ct {

// Runs over the longer of the two inputs so the loop count does not depend on
// where the first mismatch sits. Length mismatch still fails.
inline bool BytesEqual(std::span<const uint8_t> a, std::span<const uint8_t> b) noexcept {
  const size_t n = std::max(a.size(), b.size());
  volatile uint8_t diff = static_cast<uint8_t>(a.size() != b.size());
  for (size_t i = 0; i < n; ++i) {
    const uint8_t av = i < a.size() ? a[i] : 0;
    const uint8_t bv = i < b.size() ? b[i] : 0;
    diff |= static_cast<uint8_t>(av ^ bv);
  }
  std::atomic_signal_fence(std::memory_order_seq_cst);
  return diff == 0;
}

} // namespace warden::crypto::ct
