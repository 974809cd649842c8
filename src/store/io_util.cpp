#include "kt/store/io_util.h"

#include "kt/common.h"
#include "kt/crypto/random.h"
#include "kt/errors.h"

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <type_traits>
#include <vector>

#ifndef _WIN32
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#else
#ifndef NOMINMAX
#define NOMINMAX
#endif
#define WIN32_LEAN_AND_MEAN
#include <Windows.h>
#include <fcntl.h>
#include <io.h>
#include <sys/stat.h>
#endif

namespace kt::store {
namespace {

class ErrorContext { // nested call context for diagnostics
 public:
  void Push(std::string context) { context_stack_.push_back(std::move(context)); }
  void Pop() {
    if (!context_stack_.empty()) {
      context_stack_.pop_back();
    }
  }
  [[nodiscard]] std::vector<std::string> Stack() const { return context_stack_; }
  [[nodiscard]] std::string Format(std::string_view message) const {
    std::ostringstream oss;
    oss << message;
    for (auto it = context_stack_.rbegin(); it != context_stack_.rend(); ++it) {
      oss << "\n  while: " << *it;
    }
    return oss.str();
  }

 private:
  std::vector<std::string> context_stack_;
};

class ScopedErrorContext {
 public:
  ScopedErrorContext(ErrorContext& ctx, std::string description) : ctx_(ctx) {
    ctx_.Push(std::move(description));
  }
  ScopedErrorContext(const ScopedErrorContext&) = delete;
  ScopedErrorContext& operator=(const ScopedErrorContext&) = delete;
  ~ScopedErrorContext() { ctx_.Pop(); }

 private:
  ErrorContext& ctx_;
};

kt::Retryability ClassifyNativeError(int native) {
  switch (native) {
#if defined(EINTR)
    case EINTR:
#endif
#if defined(EAGAIN)
    case EAGAIN:
#endif
#if defined(EWOULDBLOCK) && EWOULDBLOCK != EAGAIN
    case EWOULDBLOCK:
#endif
      return kt::Retryability::kRetryable;
#if defined(EBUSY)
    case EBUSY:
      return kt::Retryability::kTransient;
#endif
#if defined(ETIMEDOUT)
    case ETIMEDOUT:
      return kt::Retryability::kTransient;
#endif
    default:
      break;
  }
  return kt::Retryability::kFatal;
}

[[noreturn]] void ThrowIoError(const ErrorContext& ctx, int native, std::string message) {
  throw Error{ErrorDomain::IO, kt::errors::io::kStateWriteFailed, ctx.Format(message),
              native == 0 ? std::nullopt : std::optional<int>(native), ClassifyNativeError(native),
              ctx.Stack()};
}

[[noreturn]] void ThrowValidationError(const ErrorContext& ctx, std::string message) {
  throw Error{ErrorDomain::Validation, 0, ctx.Format(message), std::nullopt,
              kt::Retryability::kFatal, ctx.Stack()};
}

Error AugmentError(const Error& err, const ErrorContext& ctx) {
  auto merged = err.context;
  auto stack = ctx.Stack();
  merged.insert(merged.end(), stack.begin(), stack.end());
  return Error{err.domain, err.code, ctx.Format(err.what()), err.native_code, err.retryability,
               std::move(merged)};
}

template <typename Func>
auto WithContext(ErrorContext& ctx, std::string description, Func&& fn)
    -> std::invoke_result_t<Func&> {
  ScopedErrorContext scoped(ctx, std::move(description));
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Func&>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const Error& err) {
    if (err.context.empty()) {
      throw AugmentError(err, ctx);
    }
    throw;
  } catch (const std::system_error& sys_err) {
    throw Error{ErrorDomain::IO, kt::errors::io::kStateWriteFailed, ctx.Format(sys_err.what()),
                sys_err.code().value(), ClassifyNativeError(sys_err.code().value()), ctx.Stack()};
  }
}

#ifdef _WIN32
int NativeOpen(const std::filesystem::path& path) {
  const std::wstring native = path.wstring();
  return _wopen(native.c_str(), _O_CREAT | _O_WRONLY | _O_TRUNC | _O_BINARY | _O_SEQUENTIAL,
                _S_IREAD | _S_IWRITE);
}

int NativeClose(int fd) { return _close(fd); }

// _commit flushes file contents; metadata durability relies on MoveFileEx
// with MOVEFILE_WRITE_THROUGH below.
int NativeFsync(int fd) { return _commit(fd); }

int NativeWrite(int fd, const uint8_t* data, size_t size) {
  return _write(fd, data, static_cast<unsigned int>(size));
}

bool NativeRename(const std::filesystem::path& from, const std::filesystem::path& to) {
  return ::MoveFileExW(from.wstring().c_str(), to.wstring().c_str(),
                       MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH) != 0;
}

void SyncDirectory(const std::filesystem::path&) {}

#else

int NativeOpen(const std::filesystem::path& path) {
  return ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0600);
}

int NativeClose(int fd) { return ::close(fd); }

int NativeFsync(int fd) { return ::fsync(fd); }

ssize_t NativeWrite(int fd, const uint8_t* data, size_t size) {
  return ::write(fd, data, size);
}

bool NativeRename(const std::filesystem::path& from, const std::filesystem::path& to) {
  return ::rename(from.c_str(), to.c_str()) == 0;
}

void SyncDirectory(const std::filesystem::path& dir) {
  int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (dir_fd < 0) {
    const int saved_errno = errno;
    throw Error{ErrorDomain::IO, kt::errors::io::kStateWriteFailed,
                std::string(kt::errors::msg::kAtomicReplaceFailed) + ": open directory failed",
                saved_errno, ClassifyNativeError(saved_errno)};
  }
  if (::fsync(dir_fd) != 0) {
    const int err = errno;
    ::close(dir_fd);
    throw Error{ErrorDomain::IO, kt::errors::io::kStateWriteFailed,
                std::string(kt::errors::msg::kAtomicReplaceFailed) + ": directory flush failed",
                err, ClassifyNativeError(err)};
  }
  ::close(dir_fd);
}

#endif

void SyncFileWithRetry(int fd, ErrorContext& ctx) {
  constexpr int kMaxRetries = 4;
  std::chrono::milliseconds backoff{5};
  for (int attempt = 0;; ++attempt) {
    if (NativeFsync(fd) == 0) {
      return;
    }
    const int saved_errno = errno;
    if (saved_errno == EINTR) {
      continue;
    }
    if (attempt >= kMaxRetries || ClassifyNativeError(saved_errno) == kt::Retryability::kFatal) {
      ThrowIoError(ctx, saved_errno, std::string(kt::errors::msg::kAtomicReplaceFailed) + ": fsync failed");
    }
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

void WriteAll(int fd, std::span<const uint8_t> payload, ErrorContext& ctx) {
  size_t written = 0;
  while (written < payload.size()) {
    auto chunk = NativeWrite(fd, payload.data() + written, payload.size() - written);
    if (chunk < 0) {
      const int saved_errno = errno;
      if (saved_errno == EINTR) {
        continue;
      }
      ThrowIoError(ctx, saved_errno, std::string(kt::errors::msg::kAtomicReplaceFailed) + ": write failed");
    }
    if (chunk == 0) {
      ThrowIoError(ctx, 0, std::string(kt::errors::msg::kAtomicReplaceFailed) + ": short write");
    }
    written += static_cast<size_t>(chunk);
  }
}

class TempFileGuard { // removes the staging file unless released
 public:
  explicit TempFileGuard(std::filesystem::path path) noexcept : path_(std::move(path)) {}
  TempFileGuard(const TempFileGuard&) = delete;
  TempFileGuard& operator=(const TempFileGuard&) = delete;
  ~TempFileGuard() noexcept {
    if (!path_.empty()) {
      std::error_code ec;
      if (!std::filesystem::remove(path_, ec) && ec) {
        std::cerr << "TempFileGuard cleanup failed for " << path_ << ": " << ec.message()
                  << '\n';
      }
    }
  }

  void Release() noexcept { path_.clear(); }

 private:
  std::filesystem::path path_;
};

std::filesystem::path MakeTempPath(const std::filesystem::path& dir,
                                   const std::filesystem::path& base) {
  std::array<uint8_t, 16> random{};
  kt::crypto::SystemRandomBytes(std::span<uint8_t>(random.data(), random.size()));
  std::filesystem::path temp_name = base.filename();
  temp_name += ".tmp.";
  temp_name += kt::HexEncode(std::span<const uint8_t>(random.data(), random.size()));
  return dir / temp_name;
}

}  // namespace

void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks) {
  ErrorContext ctx;
  const std::string target_utf8 = target.empty() ? std::string("<empty>") : kt::PathToUtf8String(target);
  ScopedErrorContext root(ctx, "atomic replace target=" + target_utf8);

  if (target.empty()) {
    ThrowValidationError(ctx, "Target path required");
  }

  auto dir = target.parent_path();
  if (dir.empty()) {
    dir = WithContext(ctx, "resolving current working directory", [] {
      return std::filesystem::current_path();
    });
  }

  WithContext(ctx, "creating parent directory", [&] {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
      ThrowIoError(ctx, ec.value(), std::string(kt::errors::msg::kAtomicReplaceFailed) + ": " + ec.message());
    }
  });

  auto temp_path = MakeTempPath(dir, target);
  TempFileGuard cleanup(temp_path);

  int fd = WithContext(ctx, "opening temporary payload file", [&]() {
    int handle = NativeOpen(temp_path);
    if (handle < 0) {
      ThrowIoError(ctx, errno, std::string(kt::errors::msg::kAtomicReplaceFailed) + ": open failed");
    }
    return handle;
  });

  try {
    WithContext(ctx, "writing payload", [&] { WriteAll(fd, payload, ctx); });
    WithContext(ctx, "syncing payload", [&] { SyncFileWithRetry(fd, ctx); });
  } catch (...) {
    NativeClose(fd);
    throw;
  }

  WithContext(ctx, "closing temporary payload file", [&] {
    if (NativeClose(fd) != 0) {
      ThrowIoError(ctx, errno, std::string(kt::errors::msg::kAtomicReplaceFailed) + ": close failed");
    }
  });

  if (hooks.before_rename) {
    WithContext(ctx, "executing before_rename hook", [&] { hooks.before_rename(temp_path, target); });
  }

  WithContext(ctx, "renaming temporary file into place", [&] {
    if (!NativeRename(temp_path, target)) {
      ThrowIoError(ctx, errno, std::string(kt::errors::msg::kAtomicReplaceFailed) + ": rename failed");
    }
  });
  cleanup.Release();

  WithContext(ctx, "syncing directory metadata", [&] { SyncDirectory(dir); });
}

std::optional<std::vector<uint8_t>> ReadFileBytes(const std::filesystem::path& path) {
  std::error_code ec;
  const bool exists = std::filesystem::exists(path, ec);
  if (ec) {
    throw Error{ErrorDomain::IO, kt::errors::io::kStateReadFailed,
                std::string(kt::errors::msg::kReadStateFailed) + ": " + kt::PathToUtf8String(path) +
                    ": " + ec.message(),
                ec.value(), ClassifyNativeError(ec.value())};
  }
  if (!exists) {
    return std::nullopt;
  }
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw Error{ErrorDomain::IO, kt::errors::io::kStateReadFailed,
                std::string(kt::errors::msg::kReadStateFailed) + ": " + kt::PathToUtf8String(path) +
                    ": not a regular file"};
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw Error{ErrorDomain::IO, kt::errors::io::kStateReadFailed,
                std::string(kt::errors::msg::kReadStateFailed) + ": " + kt::PathToUtf8String(path)};
  }
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw Error{ErrorDomain::IO, kt::errors::io::kStateReadFailed,
                std::string(kt::errors::msg::kReadStateFailed) + ": " + kt::PathToUtf8String(path)};
  }
  return bytes;
}

void RemoveFileIfExists(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    throw Error{ErrorDomain::IO, kt::errors::io::kStateWriteFailed,
                std::string(kt::errors::msg::kPersistStateFailed) + ": " + kt::PathToUtf8String(path) +
                    ": " + ec.message(),
                ec.value(), ClassifyNativeError(ec.value())};
  }
}

}  // namespace kt::store
