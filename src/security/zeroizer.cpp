#include "kt/security/zeroizer.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <span>
#include <string>

namespace kt::security {
  namespace {

    inline void PortableZero(std::span<uint8_t> data) noexcept {
      if (data.empty()) {
        return;
      }

      volatile uint8_t* ptr = reinterpret_cast<volatile uint8_t*>(data.data());
      for (std::size_t i = 0; i < data.size(); ++i) {
        ptr[i] = 0;
      }
#if defined(__GNUC__) || defined(__clang__)
      __asm__ __volatile__("" ::: "memory");
#endif
      std::atomic_thread_fence(std::memory_order_seq_cst);
      volatile uint8_t verification = 0;
      const volatile uint8_t* verify_ptr =
          reinterpret_cast<const volatile uint8_t*>(data.data());
      for (std::size_t i = 0; i < data.size(); ++i) {
        verification |= verify_ptr[i];
      }

      if (verification != 0) {
        std::clog << "[zeroizer] warning: zeroization verification failed.\n";
      }
    }

  }  // namespace

  void Zeroizer::Wipe(std::span<uint8_t> data) noexcept { PortableZero(data); }

  void Zeroizer::WipeString(std::string& secret) noexcept {
    if (secret.capacity() == 0) {
      return;
    }
    const std::size_t length = secret.size();
    // Spare capacity may still hold earlier contents after a shrink.
    secret.resize(secret.capacity());
    PortableZero(std::span<uint8_t>(reinterpret_cast<uint8_t*>(secret.data()), secret.size()));
    secret.resize(length);
    secret.clear();
  }

} // namespace kt::security
