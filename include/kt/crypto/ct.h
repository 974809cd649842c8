#pragma once
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace kt::crypto::ct {

template <size_t N>
inline bool CompareEqual(const std::array<uint8_t, N>& a,
                         const std::array<uint8_t, N>& b) noexcept {
  volatile uint8_t diff = 0;
  for (size_t i = 0; i < N; ++i)
    diff |= (a[i] ^ b[i]);
  return diff == 0;
}

// Runtime-length comparison. Every byte of the longer input is visited so the
// loop length depends only on the input sizes, never on where they differ.
inline bool CompareEqual(std::span<const uint8_t> a, std::span<const uint8_t> b) noexcept {
  const size_t longest = a.size() > b.size() ? a.size() : b.size();
  volatile uint8_t diff = static_cast<uint8_t>(a.size() != b.size());
  for (size_t i = 0; i < longest; ++i) {
    const uint8_t av = i < a.size() ? a[i] : 0;
    const uint8_t bv = i < b.size() ? b[i] : 0;
    diff |= static_cast<uint8_t>(av ^ bv);
  }
  std::atomic_signal_fence(std::memory_order_seq_cst);
  return diff == 0;
}

inline bool StringCompare(std::string_view a, std::string_view b) noexcept {
  return CompareEqual(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(a.data()), a.size()),
                      std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(b.data()), b.size()));
}

} // namespace kt::crypto::ct
