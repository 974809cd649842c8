#include "kt/store/ipc_lock.h"

#include <iostream>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#if defined(_WIN32)
#define NOMINMAX
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#else
#include <cerrno>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

#include "kt/common.h"
#include "kt/error.h"
#include "kt/errors.h"

namespace kt::store {
namespace {

constexpr std::chrono::milliseconds kPollInterval{10};

#if defined(_WIN32)
using Handle = void*;

Handle OpenLockFile(const std::filesystem::path& lock_path) {
  HANDLE file = CreateFileW(lock_path.c_str(), GENERIC_READ | GENERIC_WRITE,
                            FILE_SHARE_READ | FILE_SHARE_WRITE, nullptr, OPEN_ALWAYS,
                            FILE_ATTRIBUTE_NORMAL, nullptr);
  return file == INVALID_HANDLE_VALUE ? nullptr : file;
}

bool TryLock(Handle handle, bool& failed) {
  OVERLAPPED overlapped{};
  if (LockFileEx(static_cast<HANDLE>(handle), LOCKFILE_EXCLUSIVE_LOCK | LOCKFILE_FAIL_IMMEDIATELY,
                 0, 1, 0, &overlapped)) {
    return true;
  }
  failed = GetLastError() != ERROR_LOCK_VIOLATION;
  return false;
}

void CloseLockFile(Handle handle) noexcept {
  OVERLAPPED overlapped{};
  UnlockFileEx(static_cast<HANDLE>(handle), 0, 1, 0, &overlapped);
  CloseHandle(static_cast<HANDLE>(handle));
}
#else
using Handle = int;

Handle OpenLockFile(const std::filesystem::path& lock_path) {
  int fd = -1;
  do {
    fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
  } while (fd < 0 && errno == EINTR);
  return fd;
}

bool TryLock(Handle fd, bool& failed) {
  while (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
    if (errno == EINTR) {
      continue;
    }
    failed = errno != EWOULDBLOCK && errno != EAGAIN;
    return false;
  }
  return true;
}

void CloseLockFile(Handle fd) noexcept {
  ::flock(fd, LOCK_UN);
  ::close(fd);
}
#endif

bool IsOpen(Handle handle) {
#if defined(_WIN32)
  return handle != nullptr;
#else
  return handle >= 0;
#endif
}

}  // namespace

ScopedIpcLock::ScopedIpcLock(ScopedIpcLock&& other) noexcept
    : handle_(std::exchange(other.handle_, kNoHandle)) {}

ScopedIpcLock& ScopedIpcLock::operator=(ScopedIpcLock&& other) noexcept {
  if (this != &other) {
    Release();
    handle_ = std::exchange(other.handle_, kNoHandle);
  }
  return *this;
}

ScopedIpcLock::~ScopedIpcLock() { Release(); }

std::filesystem::path ScopedIpcLock::LockPathFor(const std::filesystem::path& state_path) {
  auto lock_path = state_path;
  lock_path += ".lock";
  return lock_path;
}

ScopedIpcLock ScopedIpcLock::ForPath(const std::filesystem::path& state_path,
                                     std::chrono::milliseconds wait) {
  const auto lock_path = LockPathFor(state_path);
  if (lock_path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(lock_path.parent_path(), ec);
  }
  Handle handle = OpenLockFile(lock_path);
  if (!IsOpen(handle)) {
    std::clog << "[store] cannot open lock file " << kt::PathToUtf8String(lock_path) << std::endl;
    return {};
  }
  const auto deadline = std::chrono::steady_clock::now() + wait;
  while (true) {
    bool failed = false;
    if (TryLock(handle, failed)) {
      return ScopedIpcLock(handle);
    }
    if (failed || std::chrono::steady_clock::now() >= deadline) {
      std::clog << "[store] lock " << (failed ? "failed" : "wait timed out") << ": "
                << kt::PathToUtf8String(lock_path) << std::endl;
      CloseLockFile(handle);
      return {};
    }
    std::this_thread::sleep_for(kPollInterval);
  }
}

ScopedIpcLock ScopedIpcLock::RequireForPath(const std::filesystem::path& state_path,
                                            std::chrono::milliseconds wait) {
  auto gate = ForPath(state_path, wait);
  if (!gate.locked()) {
    throw kt::Error{kt::ErrorDomain::IO, kt::errors::io::kIpcLockUnavailable,
                    std::string(kt::errors::msg::kIpcLockUnavailable) + ": " +
                        kt::PathToUtf8String(state_path),
                    std::nullopt, kt::Retryability::kTransient};
  }
  return gate;
}

void ScopedIpcLock::Release() noexcept {
  if (handle_ == kNoHandle) {
    return;
  }
  CloseLockFile(handle_);
  handle_ = kNoHandle;
}

}  // namespace kt::store
