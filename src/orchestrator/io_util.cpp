#include "warden/orchestrator/io_util.h"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "warden/crypto/provider.h"

namespace warden::orchestrator {
namespace {

constexpr const char* kAtomicReplaceErrorMessage = "Atomic file replace failed";

class ErrorContext {
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

Retryability ClassifyNativeError(int native) {
  switch (native) {
    case EINTR:
    case EAGAIN:
      return Retryability::kRetryable;
    case EBUSY:
    case ETIMEDOUT:
      return Retryability::kTransient;
    default:
      break;
  }
  return Retryability::kFatal;
}

[[noreturn]] void ThrowIoError(const ErrorContext& ctx, int code, std::string message, int native) {
  throw Error{ErrorDomain::IO, code, ctx.Format(std::move(message)), native,
              ClassifyNativeError(native), ctx.Stack()};
}

void SyncFileWithRetry(int fd, ErrorContext& ctx) {
  constexpr int kMaxRetries = 4;
  std::chrono::milliseconds backoff{5};
  for (int attempt = 0;; ++attempt) {
    if (::fsync(fd) == 0) {
      return;
    }
    const int saved_errno = errno;
    if (saved_errno == EINTR) {
      continue;
    }
    if (attempt >= kMaxRetries || (saved_errno != EAGAIN && saved_errno != EBUSY)) {
      ThrowIoError(ctx, errors::io::kFileUnwritable,
                   std::string(kAtomicReplaceErrorMessage) + ": fsync failed", saved_errno);
    }
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

void WriteAll(int fd, std::span<const uint8_t> payload, ErrorContext& ctx) {
  size_t written = 0;
  while (written < payload.size()) {
    auto chunk = ::write(fd, payload.data() + written, payload.size() - written);
    if (chunk < 0) {
      const int saved_errno = errno;
      if (saved_errno == EINTR) {
        continue;
      }
      ThrowIoError(ctx, errors::io::kFileUnwritable,
                   std::string(kAtomicReplaceErrorMessage) + ": write failed", saved_errno);
    }
    if (chunk == 0) {
      ThrowIoError(ctx, errors::io::kFileUnwritable,
                   std::string(kAtomicReplaceErrorMessage) + ": short write", 0);
    }
    written += static_cast<size_t>(chunk);
  }
}

class TempFileGuard {
 public:
  explicit TempFileGuard(std::filesystem::path path) noexcept : path_(std::move(path)) {}
  TempFileGuard(const TempFileGuard&) = delete;
  TempFileGuard& operator=(const TempFileGuard&) = delete;
  ~TempFileGuard() noexcept {
    if (!path_.empty()) {
      std::error_code ec;
      if (!std::filesystem::remove(path_, ec) && ec) {
        std::cerr << "TempFileGuard cleanup failed for " << path_ << ": " << ec.message() << '\n';
      }
    }
  }

  void Release() noexcept { path_.clear(); }

 private:
  std::filesystem::path path_;
};

std::filesystem::path MakeTempPath(const std::filesystem::path& dir, const std::filesystem::path& base) {
  crypto::OpenSSLCryptoProvider provider;
  std::filesystem::path temp_name = base.filename();
  temp_name += ".tmp.";
  temp_name += crypto::RandomHex(provider, 8);
  return dir / temp_name;
}

}  // namespace

void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks) {
  ErrorContext ctx;
  ScopedErrorContext root(ctx, "atomic replace target=" + target.string());
  if (target.empty()) {
    throw Error{ErrorDomain::Validation, 0, ctx.Format("Target path required")};
  }

  auto dir = target.parent_path();
  if (dir.empty()) {
    dir = std::filesystem::current_path();
  }

  auto temp_path = MakeTempPath(dir, target);
  TempFileGuard cleanup(temp_path);

  int fd = ::open(temp_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC | O_EXCL, 0600);
  if (fd < 0) {
    const int saved_errno = errno;
    ThrowIoError(ctx, errors::io::kFileUnwritable,
                 std::string(kAtomicReplaceErrorMessage) + ": open failed: " + std::strerror(saved_errno),
                 saved_errno);
  }

  try {
    ScopedErrorContext write_ctx(ctx, "writing payload");
    WriteAll(fd, payload, ctx);
    SyncFileWithRetry(fd, ctx);
  } catch (const Error&) {
    ::close(fd);
    throw;
  }
  if (::close(fd) != 0) {
    const int saved_errno = errno;
    ThrowIoError(ctx, errors::io::kFileUnwritable,
                 std::string(kAtomicReplaceErrorMessage) + ": close failed", saved_errno);
  }

  if (hooks.before_rename) {
    hooks.before_rename(temp_path, target);
  }

  if (::rename(temp_path.c_str(), target.c_str()) != 0) {
    const int saved_errno = errno;
    ThrowIoError(ctx, errors::io::kFileUnwritable,
                 std::string(kAtomicReplaceErrorMessage) + ": rename failed", saved_errno);
  }
  cleanup.Release();

  int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dir_fd < 0) {
    const int saved_errno = errno;
    ThrowIoError(ctx, errors::io::kFileUnwritable,
                 std::string(kAtomicReplaceErrorMessage) + ": open directory failed", saved_errno);
  }
  if (::fsync(dir_fd) != 0) {
    const int saved_errno = errno;
    ::close(dir_fd);
    ThrowIoError(ctx, errors::io::kFileUnwritable,
                 std::string(kAtomicReplaceErrorMessage) + ": directory flush failed", saved_errno);
  }
  ::close(dir_fd);
}

std::string ReadTextFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    const int saved_errno = errno;
    throw Error{ErrorDomain::IO, errors::io::kFileUnreadable,
                "Failed to read " + path.string() + ": " + std::strerror(saved_errno), saved_errno};
  }
  std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw Error{ErrorDomain::IO, errors::io::kFileUnreadable, "Failed to read " + path.string()};
  }
  return text;
}

PrivateTempDir::PrivateTempDir(std::string_view prefix) {
  std::error_code ec;
  auto base = std::filesystem::temp_directory_path(ec);
  if (ec) {
    base = "/tmp";
  }
  std::string pattern = (base / (std::string(prefix) + "XXXXXX")).string();
  std::vector<char> buffer(pattern.begin(), pattern.end());
  buffer.push_back('\0');
  if (::mkdtemp(buffer.data()) == nullptr) {
    const int saved_errno = errno;
    throw Error{ErrorDomain::IO, errors::io::kTempDirFailed,
                "Failed to create private temporary directory: " + std::string(std::strerror(saved_errno)),
                saved_errno, ClassifyNativeError(saved_errno)};
  }
  path_ = buffer.data();
}

PrivateTempDir::~PrivateTempDir() {
  if (path_.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  if (ec) {
    std::cerr << "PrivateTempDir cleanup failed for " << path_ << ": " << ec.message() << '\n';
  }
}

}  // namespace warden::orchestrator
