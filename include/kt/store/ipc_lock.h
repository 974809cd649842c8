#pragma once

#include <chrono>
#include <filesystem>

namespace kt::store {

// Exclusive advisory lock on `<state file>.lock`, shared by every process that
// reads or writes the same lockout or rate-limit state. The kernel drops the
// lock when the holding process exits, so a crashed `kt` never wedges the
// state. Waiting is bounded; a gate that could not be taken reports
// locked() == false.
class ScopedIpcLock {
public:
  static constexpr std::chrono::milliseconds kDefaultWait{5'000};

  ScopedIpcLock() = default;
  ScopedIpcLock(const ScopedIpcLock&) = delete;
  ScopedIpcLock& operator=(const ScopedIpcLock&) = delete;
  ScopedIpcLock(ScopedIpcLock&& other) noexcept;
  ScopedIpcLock& operator=(ScopedIpcLock&& other) noexcept;
  ~ScopedIpcLock();

  [[nodiscard]] static ScopedIpcLock ForPath(const std::filesystem::path& state_path,
                                             std::chrono::milliseconds wait = kDefaultWait);

  // Same as ForPath but throws kt::Error{IO, kIpcLockUnavailable} (transient)
  // when the gate cannot be taken within `wait`.
  [[nodiscard]] static ScopedIpcLock RequireForPath(const std::filesystem::path& state_path,
                                                    std::chrono::milliseconds wait = kDefaultWait);

  [[nodiscard]] static std::filesystem::path LockPathFor(const std::filesystem::path& state_path);

  [[nodiscard]] bool locked() const noexcept { return handle_ != kNoHandle; }
  explicit operator bool() const noexcept { return locked(); }

private:
#if defined(_WIN32)
  using Handle = void*;
  static constexpr Handle kNoHandle = nullptr;
#else
  using Handle = int;
  static constexpr Handle kNoHandle = -1;
#endif

  explicit ScopedIpcLock(Handle handle) noexcept : handle_(handle) {}
  void Release() noexcept;

  Handle handle_{kNoHandle};
};

}  // namespace kt::store
