#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace warden::sandbox {

class FileDescriptor {
 public:
  FileDescriptor() = default;
  explicit FileDescriptor(int fd) : fd_(fd) {}

  FileDescriptor(const FileDescriptor&) = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

  FileDescriptor& operator=(FileDescriptor&& other) noexcept {
    if (this != &other) {
      reset();
      fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
  }

  ~FileDescriptor() { reset(); }

  int get() const { return fd_; }
  explicit operator bool() const { return fd_ >= 0; }

  int Release() { return std::exchange(fd_, -1); }

  void reset(int new_fd = -1);

 private:
  int fd_{-1};
};

// Limits applied in the child between fork and exec. Zero means "leave as is".
struct ProcessLimits {
  uint64_t address_space_bytes{0};
  uint64_t cpu_seconds{0};
  uint64_t file_size_bytes{0};
  uint64_t open_files{0};
  uint64_t processes{0};
  bool deny_network{false};
  // Landlock: only the executable and its ELF interpreter may be executed.
  bool restrict_exec{false};
  // Landlock: no file may be created, written, removed or renamed.
  bool deny_filesystem_writes{false};
};

struct SpawnOptions {
  std::string executable;
  // argv[0] included.
  std::vector<std::string> argv;
  std::vector<std::string> environment;
  std::string stdin_data;
  // Exposes a pipe to the child as descriptor 3.
  bool result_channel{false};
  std::optional<ProcessLimits> limits;
  // Zero disables the wall-clock deadline.
  std::chrono::milliseconds timeout{0};
  size_t max_capture_bytes{1024 * 1024};
  size_t max_result_bytes{8 * 1024 * 1024};
  // Runs once after the process group was killed for exceeding the deadline.
  std::function<void()> on_timeout;
};

struct SpawnOutcome {
  bool timed_out{false};
  bool exited{false};
  int exit_code{0};
  int term_signal{0};
  // errno from a failed execve in the child, zero otherwise.
  int exec_errno{0};
  std::string stdout_data;
  std::string stderr_data;
  std::string result_data;
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  bool result_truncated{false};
  double elapsed_ms{0.0};
  double max_rss_mb{0.0};
  // User plus system CPU time of the reaped child.
  double cpu_seconds{0.0};

  // Shell-style status: exit code, or -signal when killed.
  int StatusCode() const { return exited ? exit_code : -term_signal; }
};

// Fork + execve with the child hardened as described by ProcessLimits.
// Throws warden::Error (IO domain) when pipes or fork cannot be created.
SpawnOutcome RunProcess(const SpawnOptions& options);

// Current environment minus loader and interpreter hijack variables.
std::vector<std::string> SanitizedEnvironment();
bool IsHijackVariable(std::string_view name);

std::optional<std::string> FindExecutable(std::string_view name);

// Landlock ABI version of the running kernel, 0 when unsupported.
int LandlockAbiVersion() noexcept;

// PT_INTERP of an ELF executable (the dynamic loader); empty for static or
// non-ELF files.
std::string ProgramInterpreter(const std::string& path);

// Configured path, then WARDEN_PYTHON, then python3 on PATH resolved through
// sys.executable (so wrapper shims are bypassed).
std::optional<std::string> ResolvePythonExecutable(std::string_view configured);

}  // namespace warden::sandbox
