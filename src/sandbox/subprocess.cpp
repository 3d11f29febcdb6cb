#include "warden/sandbox/subprocess.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstddef>
#include <cstdlib>
#include <cstring>

#include <elf.h>
#include <fcntl.h>
#include <limits.h>
#include <poll.h>
#include <pthread.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#if defined(__linux__)
#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/landlock.h>
#include <linux/seccomp.h>
#endif

#include "warden/common.h"
#include "warden/error.h"

extern char** environ;

namespace warden::sandbox {

void FileDescriptor::reset(int new_fd) {
  if (fd_ >= 0) {
    ::close(fd_);
  }
  fd_ = new_fd;
}

namespace {

constexpr auto kPollSlice = std::chrono::milliseconds(100);
constexpr int kChildExecFailure = 127;
constexpr int kHighDescriptorFloor = 10;

struct Pipe {
  FileDescriptor read;
  FileDescriptor write;
};

Pipe MakePipe(const char* purpose) {
  int fds[2] = {-1, -1};
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    const int saved_errno = errno;
    throw Error{ErrorDomain::IO, errors::io::kPipeFailed,
                std::string("pipe failed for ") + purpose + ": " + std::strerror(saved_errno), saved_errno,
                Retryability::kTransient};
  }
  return Pipe{FileDescriptor(fds[0]), FileDescriptor(fds[1])};
}

void SetNonBlocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL);
  if (flags >= 0) {
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

// Writing the request to a child that already exited raises SIGPIPE; keep it
// blocked on this thread and swallow a SIGPIPE generated while blocked.
class SigpipeGuard {
 public:
  SigpipeGuard() {
    sigset_t pending;
    sigemptyset(&pending);
    sigpending(&pending);
    was_pending_ = sigismember(&pending, SIGPIPE) == 1;
    sigset_t block;
    sigemptyset(&block);
    sigaddset(&block, SIGPIPE);
    blocked_ = pthread_sigmask(SIG_BLOCK, &block, &previous_) == 0;
  }

  ~SigpipeGuard() {
    if (!blocked_) {
      return;
    }
    if (!was_pending_) {
      sigset_t pipe_only;
      sigemptyset(&pipe_only);
      sigaddset(&pipe_only, SIGPIPE);
      const struct timespec zero {0, 0};
      while (sigtimedwait(&pipe_only, nullptr, &zero) == SIGPIPE) {
      }
    }
    pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
  }

  SigpipeGuard(const SigpipeGuard&) = delete;
  SigpipeGuard& operator=(const SigpipeGuard&) = delete;

 private:
  sigset_t previous_{};
  bool was_pending_{false};
  bool blocked_{false};
};

#if defined(__linux__)
std::vector<sock_filter> BuildNetworkDenyFilter() {
  std::vector<sock_filter> filter;
  filter.reserve(12);
  filter.push_back({static_cast<uint16_t>(BPF_LD | BPF_W | BPF_ABS), 0, 0,
                    static_cast<uint32_t>(offsetof(struct seccomp_data, arch))});
#if defined(__x86_64__)
  constexpr uint32_t kAuditArch = AUDIT_ARCH_X86_64;
#elif defined(__aarch64__)
  constexpr uint32_t kAuditArch = AUDIT_ARCH_AARCH64;
#elif defined(__arm__)
  constexpr uint32_t kAuditArch = AUDIT_ARCH_ARM;
#else
  constexpr uint32_t kAuditArch = 0;
#endif
  if constexpr (kAuditArch != 0) {
    filter.push_back({static_cast<uint16_t>(BPF_JMP | BPF_JEQ | BPF_K), 1, 0, kAuditArch});
    filter.push_back({static_cast<uint16_t>(BPF_RET | BPF_K), 0, 0, SECCOMP_RET_KILL_PROCESS});
  }
  filter.push_back({static_cast<uint16_t>(BPF_LD | BPF_W | BPF_ABS), 0, 0,
                    static_cast<uint32_t>(offsetof(struct seccomp_data, nr))});
#if defined(__x86_64__)
  // x32 syscalls carry bit 30; refuse them outright.
  filter.push_back({static_cast<uint16_t>(BPF_JMP | BPF_JGE | BPF_K), 0, 1, 0x40000000U});
  filter.push_back({static_cast<uint16_t>(BPF_RET | BPF_K), 0, 0, SECCOMP_RET_ERRNO | (EPERM & SECCOMP_RET_DATA)});
#endif
  filter.push_back({static_cast<uint16_t>(BPF_JMP | BPF_JEQ | BPF_K), 0, 1,
                    static_cast<uint32_t>(__NR_socket)});
  filter.push_back({static_cast<uint16_t>(BPF_RET | BPF_K), 0, 0, SECCOMP_RET_ERRNO | (EACCES & SECCOMP_RET_DATA)});
  filter.push_back({static_cast<uint16_t>(BPF_RET | BPF_K), 0, 0, SECCOMP_RET_ALLOW});
  return filter;
}
#endif

// Everything the child needs is prepared before fork; the child only issues
// async-signal-safe calls.
struct ChildPlan {
  const char* path{nullptr};
  char* const* argv{nullptr};
  char* const* envp{nullptr};
  int stdin_fd{-1};
  int stdout_fd{-1};
  int stderr_fd{-1};
  int result_fd{-1};
  int error_fd{-1};
  const ProcessLimits* limits{nullptr};
  // Paths granted execute rights when limits->restrict_exec is set.
  const char* const* exec_allow{nullptr};
  size_t exec_allow_count{0};
  long max_fd{1024};
  pid_t parent{0};
#if defined(__linux__)
  const sock_fprog* filter{nullptr};
#endif
};

[[noreturn]] void ChildFail(int error_fd, int err) noexcept {
  const auto* bytes = reinterpret_cast<const char*>(&err);
  size_t written = 0;
  while (written < sizeof(err)) {
    ssize_t rc = ::write(error_fd, bytes + written, sizeof(err) - written);
    if (rc < 0 && errno == EINTR) {
      continue;
    }
    if (rc <= 0) {
      break;
    }
    written += static_cast<size_t>(rc);
  }
  ::_exit(kChildExecFailure);
}

bool ApplyLimit(int resource, uint64_t value) noexcept {
  if (value == 0) {
    return true;
  }
  struct rlimit limit {
    static_cast<rlim_t>(value), static_cast<rlim_t>(value)
  };
  // The kernel sends SIGXCPU at the soft CPU limit and SIGKILL at the hard one;
  // leave a second between them so the breach is recognisable.
  if (resource == RLIMIT_CPU) {
    limit.rlim_max = static_cast<rlim_t>(value + 1);
  }
  return ::setrlimit(resource, &limit) == 0;
}

#if defined(__linux__) && defined(SYS_landlock_create_ruleset)
// Returns false with errno set on failure. A kernel without Landlock leaves
// the child unrestricted at this layer.
bool ApplyLandlock(const ProcessLimits& limits, const char* const* exec_allow, size_t exec_allow_count) noexcept {
  const int abi = LandlockAbiVersion();
  if (abi <= 0) {
    return true;
  }

  uint64_t handled = 0;
  if (limits.restrict_exec) {
    handled |= LANDLOCK_ACCESS_FS_EXECUTE;
  }
  if (limits.deny_filesystem_writes) {
    handled |= LANDLOCK_ACCESS_FS_WRITE_FILE | LANDLOCK_ACCESS_FS_REMOVE_DIR | LANDLOCK_ACCESS_FS_REMOVE_FILE |
               LANDLOCK_ACCESS_FS_MAKE_CHAR | LANDLOCK_ACCESS_FS_MAKE_DIR | LANDLOCK_ACCESS_FS_MAKE_REG |
               LANDLOCK_ACCESS_FS_MAKE_SOCK | LANDLOCK_ACCESS_FS_MAKE_FIFO | LANDLOCK_ACCESS_FS_MAKE_BLOCK |
               LANDLOCK_ACCESS_FS_MAKE_SYM;
#if defined(LANDLOCK_ACCESS_FS_REFER)
    if (abi >= 2) {
      handled |= LANDLOCK_ACCESS_FS_REFER;
    }
#endif
#if defined(LANDLOCK_ACCESS_FS_TRUNCATE)
    if (abi >= 3) {
      handled |= LANDLOCK_ACCESS_FS_TRUNCATE;
    }
#endif
  }
  if (handled == 0) {
    return true;
  }

  struct landlock_ruleset_attr attr {};
  attr.handled_access_fs = handled;
  const int ruleset = static_cast<int>(::syscall(SYS_landlock_create_ruleset, &attr, sizeof(attr), 0U));
  if (ruleset < 0) {
    return false;
  }
  if (limits.restrict_exec) {
    for (size_t i = 0; i < exec_allow_count; ++i) {
      struct landlock_path_beneath_attr rule {};
      rule.allowed_access = LANDLOCK_ACCESS_FS_EXECUTE;
      rule.parent_fd = ::open(exec_allow[i], O_PATH | O_CLOEXEC);
      if (rule.parent_fd < 0) {
        ::close(ruleset);
        return false;
      }
      const long added = ::syscall(SYS_landlock_add_rule, ruleset, LANDLOCK_RULE_PATH_BENEATH, &rule, 0U);
      const int saved_errno = errno;
      ::close(rule.parent_fd);
      if (added != 0) {
        ::close(ruleset);
        errno = saved_errno;
        return false;
      }
    }
  }
  const long restricted = ::syscall(SYS_landlock_restrict_self, ruleset, 0U);
  const int saved_errno = errno;
  ::close(ruleset);
  errno = saved_errno;
  return restricted == 0;
}
#endif

template <typename Ehdr, typename Phdr>
std::string ReadInterpreter(int fd) {
  Ehdr header{};
  if (::pread(fd, &header, sizeof(header), 0) != static_cast<ssize_t>(sizeof(header)) ||
      header.e_phentsize != sizeof(Phdr)) {
    return {};
  }
  for (unsigned i = 0; i < header.e_phnum; ++i) {
    Phdr program{};
    const auto offset = static_cast<off_t>(header.e_phoff + static_cast<uint64_t>(i) * sizeof(Phdr));
    if (::pread(fd, &program, sizeof(program), offset) != static_cast<ssize_t>(sizeof(program))) {
      return {};
    }
    if (program.p_type != PT_INTERP) {
      continue;
    }
    if (program.p_filesz == 0 || program.p_filesz > PATH_MAX) {
      return {};
    }
    std::string out(program.p_filesz, '\0');
    if (::pread(fd, out.data(), out.size(), static_cast<off_t>(program.p_offset)) !=
        static_cast<ssize_t>(out.size())) {
      return {};
    }
    out.resize(std::strlen(out.c_str()));
    return out;
  }
  return {};
}

void CloseRange(int first, int last, long max_fd) noexcept {
  if (first > last) {
    return;
  }
#if defined(SYS_close_range)
  if (::syscall(SYS_close_range, static_cast<unsigned>(first), static_cast<unsigned>(last), 0U) == 0) {
    return;
  }
#endif
  const long upper = std::min<long>(last, max_fd);
  for (long fd = first; fd <= upper; ++fd) {
    ::close(static_cast<int>(fd));
  }
}

[[noreturn]] void ChildExec(const ChildPlan& plan) noexcept {
  ::setpgid(0, 0);

#if defined(__linux__)
  ::prctl(PR_SET_PDEATHSIG, SIGKILL);
  if (::getppid() != plan.parent) {
    ::_exit(kChildExecFailure);
  }
#endif

  sigset_t empty;
  sigemptyset(&empty);
  ::sigprocmask(SIG_SETMASK, &empty, nullptr);
  ::signal(SIGPIPE, SIG_DFL);

  // Lift every inherited descriptor above the target slots before dup2 so a
  // source never aliases a destination.
  const int hi_stdin = ::fcntl(plan.stdin_fd, F_DUPFD_CLOEXEC, kHighDescriptorFloor);
  const int hi_stdout = ::fcntl(plan.stdout_fd, F_DUPFD_CLOEXEC, kHighDescriptorFloor);
  const int hi_stderr = ::fcntl(plan.stderr_fd, F_DUPFD_CLOEXEC, kHighDescriptorFloor);
  const int hi_result =
      plan.result_fd >= 0 ? ::fcntl(plan.result_fd, F_DUPFD_CLOEXEC, kHighDescriptorFloor) : -1;
  const int hi_error = ::fcntl(plan.error_fd, F_DUPFD_CLOEXEC, kHighDescriptorFloor);
  if (hi_error < 0) {
    ::_exit(kChildExecFailure);
  }
  if (hi_stdin < 0 || hi_stdout < 0 || hi_stderr < 0 || (plan.result_fd >= 0 && hi_result < 0)) {
    ChildFail(hi_error, errno);
  }
  if (::dup2(hi_stdin, STDIN_FILENO) < 0 || ::dup2(hi_stdout, STDOUT_FILENO) < 0 ||
      ::dup2(hi_stderr, STDERR_FILENO) < 0) {
    ChildFail(hi_error, errno);
  }
  int first_closed = 3;
  if (hi_result >= 0) {
    if (::dup2(hi_result, 3) < 0) {
      ChildFail(hi_error, errno);
    }
    first_closed = 4;
  }
  CloseRange(first_closed, hi_error - 1, plan.max_fd);
  CloseRange(hi_error + 1, static_cast<int>(~0U >> 1), plan.max_fd);

  if (plan.limits) {
    const auto& limits = *plan.limits;
    if (!ApplyLimit(RLIMIT_AS, limits.address_space_bytes) || !ApplyLimit(RLIMIT_CPU, limits.cpu_seconds) ||
        !ApplyLimit(RLIMIT_FSIZE, limits.file_size_bytes) || !ApplyLimit(RLIMIT_NOFILE, limits.open_files) ||
        !ApplyLimit(RLIMIT_NPROC, limits.processes)) {
      ChildFail(hi_error, errno);
    }
  }

#if defined(__linux__)
  if (::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
    ChildFail(hi_error, errno);
  }
#if defined(SYS_landlock_create_ruleset)
  if (plan.limits && (plan.limits->restrict_exec || plan.limits->deny_filesystem_writes) &&
      !ApplyLandlock(*plan.limits, plan.exec_allow, plan.exec_allow_count)) {
    ChildFail(hi_error, errno);
  }
#endif
  if (plan.filter && ::prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, plan.filter) != 0) {
    ChildFail(hi_error, errno);
  }
#endif

  ::execve(plan.path, plan.argv, plan.envp);
  ChildFail(hi_error, errno);
}

std::vector<char*> ToCStrings(const std::vector<std::string>& items) {
  std::vector<char*> out;
  out.reserve(items.size() + 1);
  for (const auto& item : items) {
    out.push_back(const_cast<char*>(item.c_str()));
  }
  out.push_back(nullptr);
  return out;
}

struct Stream {
  FileDescriptor fd;
  std::string* sink{nullptr};
  bool* truncated{nullptr};
  size_t limit{0};
};

// Returns false once the stream reached EOF or failed.
bool DrainReadable(Stream& stream) {
  char buffer[16384];
  while (true) {
    ssize_t rc = ::read(stream.fd.get(), buffer, sizeof(buffer));
    if (rc > 0) {
      const size_t room = stream.limit > stream.sink->size() ? stream.limit - stream.sink->size() : 0;
      const size_t take = std::min(room, static_cast<size_t>(rc));
      stream.sink->append(buffer, take);
      if (take < static_cast<size_t>(rc)) {
        *stream.truncated = true;
      }
      continue;
    }
    if (rc == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

// Only called before the child is reaped, so pid cannot have been recycled.
void KillProcessGroup(pid_t pid) noexcept {
  if (::kill(-pid, SIGKILL) != 0) {
    ::kill(pid, SIGKILL);
  }
}

}  // namespace

bool IsHijackVariable(std::string_view name) {
  return name.rfind("LD_", 0) == 0 || name.rfind("DYLD_", 0) == 0 || name.rfind("PYTHON", 0) == 0 ||
         name == "BASH_ENV" || name == "ENV";
}

std::vector<std::string> SanitizedEnvironment() {
  std::vector<std::string> out;
  for (char** entry = environ; entry && *entry; ++entry) {
    std::string_view item(*entry);
    auto eq = item.find('=');
    if (eq == std::string_view::npos) {
      continue;
    }
    if (IsHijackVariable(item.substr(0, eq))) {
      continue;
    }
    out.emplace_back(item);
  }
  return out;
}

std::optional<std::string> FindExecutable(std::string_view name) {
  if (name.empty()) {
    return std::nullopt;
  }
  if (name.find('/') != std::string_view::npos) {
    std::string candidate(name);
    if (::access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
    return std::nullopt;
  }
  const char* path_env = std::getenv("PATH");
  std::string search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
  for (const auto& dir : SplitList(search, ':')) {
    std::string candidate = dir + "/" + std::string(name);
    if (::access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
  }
  return std::nullopt;
}

int LandlockAbiVersion() noexcept {
#if defined(__linux__) && defined(SYS_landlock_create_ruleset)
  const long abi = ::syscall(SYS_landlock_create_ruleset, nullptr, 0, LANDLOCK_CREATE_RULESET_VERSION);
  return abi < 0 ? 0 : static_cast<int>(abi);
#else
  return 0;
#endif
}

std::string ProgramInterpreter(const std::string& path) {
  FileDescriptor fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (!fd) {
    return {};
  }
  unsigned char ident[EI_NIDENT] = {};
  if (::pread(fd.get(), ident, sizeof(ident), 0) != static_cast<ssize_t>(sizeof(ident)) ||
      std::memcmp(ident, ELFMAG, SELFMAG) != 0) {
    return {};
  }
  if (ident[EI_CLASS] == ELFCLASS64) {
    return ReadInterpreter<Elf64_Ehdr, Elf64_Phdr>(fd.get());
  }
  if (ident[EI_CLASS] == ELFCLASS32) {
    return ReadInterpreter<Elf32_Ehdr, Elf32_Phdr>(fd.get());
  }
  return {};
}

std::optional<std::string> ResolvePythonExecutable(std::string_view configured) {
  if (!configured.empty()) {
    return FindExecutable(configured);
  }
  if (const char* env = std::getenv("WARDEN_PYTHON"); env && *env) {
    return FindExecutable(env);
  }
  auto launcher = FindExecutable("python3");
  if (!launcher) {
    return std::nullopt;
  }
  SpawnOptions probe;
  probe.executable = *launcher;
  probe.argv = {*launcher, "-I", "-S", "-c", "import sys; sys.stdout.write(sys.executable or '')"};
  probe.environment = SanitizedEnvironment();
  probe.timeout = std::chrono::seconds(15);
  probe.max_capture_bytes = 4096;
  try {
    auto outcome = RunProcess(probe);
    if (outcome.exited && outcome.exit_code == 0) {
      auto resolved = std::string(Trim(outcome.stdout_data));
      if (!resolved.empty() && ::access(resolved.c_str(), X_OK) == 0) {
        return resolved;
      }
    }
  } catch (const Error&) {
    return launcher;
  }
  return launcher;
}

SpawnOutcome RunProcess(const SpawnOptions& options) {
  SpawnOutcome outcome;
  if (options.argv.empty() || options.executable.empty()) {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidArgument,
                "RunProcess requires an executable and argv"};
  }

  Pipe in_pipe = MakePipe("stdin");
  Pipe out_pipe = MakePipe("stdout");
  Pipe err_pipe = MakePipe("stderr");
  std::optional<Pipe> result_pipe;
  if (options.result_channel) {
    result_pipe.emplace(MakePipe("result"));
  }
  Pipe exec_pipe = MakePipe("exec status");

  auto argv = ToCStrings(options.argv);
  auto envp = ToCStrings(options.environment);

  ChildPlan plan;
  plan.path = options.executable.c_str();
  plan.argv = argv.data();
  plan.envp = envp.data();
  plan.stdin_fd = in_pipe.read.get();
  plan.stdout_fd = out_pipe.write.get();
  plan.stderr_fd = err_pipe.write.get();
  plan.result_fd = result_pipe ? result_pipe->write.get() : -1;
  plan.error_fd = exec_pipe.write.get();
  plan.limits = options.limits ? &*options.limits : nullptr;
  std::vector<std::string> exec_allow;
  std::vector<const char*> exec_allow_ptrs;
  if (options.limits && options.limits->restrict_exec) {
    exec_allow.push_back(options.executable);
    if (auto loader = ProgramInterpreter(options.executable); !loader.empty()) {
      exec_allow.push_back(std::move(loader));
    }
    for (const auto& path : exec_allow) {
      exec_allow_ptrs.push_back(path.c_str());
    }
    plan.exec_allow = exec_allow_ptrs.data();
    plan.exec_allow_count = exec_allow_ptrs.size();
  }
  plan.parent = ::getpid();
  const long open_max = ::sysconf(_SC_OPEN_MAX);
  plan.max_fd = open_max > 0 ? std::min<long>(open_max, 65536) : 1024;

#if defined(__linux__)
  std::vector<sock_filter> filter_program;
  sock_fprog filter{};
  if (options.limits && options.limits->deny_network) {
    filter_program = BuildNetworkDenyFilter();
    filter.len = static_cast<unsigned short>(filter_program.size());
    filter.filter = filter_program.data();
    plan.filter = &filter;
  }
#endif

  SigpipeGuard sigpipe_guard;
  const auto start = std::chrono::steady_clock::now();
  const std::optional<std::chrono::steady_clock::time_point> deadline =
      options.timeout.count() > 0 ? std::optional(start + options.timeout) : std::nullopt;

  pid_t pid = ::fork();
  if (pid < 0) {
    const int saved_errno = errno;
    throw Error{ErrorDomain::IO, errors::io::kForkFailed,
                std::string("fork failed: ") + std::strerror(saved_errno), saved_errno,
                Retryability::kTransient};
  }
  if (pid == 0) {
    ChildExec(plan);
  }

  in_pipe.read.reset();
  out_pipe.write.reset();
  err_pipe.write.reset();
  if (result_pipe) {
    result_pipe->write.reset();
  }
  exec_pipe.write.reset();

  // Blocks until execve closes the CLOEXEC status pipe or the child reports errno.
  int child_errno = 0;
  size_t got = 0;
  while (got < sizeof(child_errno)) {
    ssize_t rc = ::read(exec_pipe.read.get(), reinterpret_cast<char*>(&child_errno) + got,
                        sizeof(child_errno) - got);
    if (rc < 0 && errno == EINTR) {
      continue;
    }
    if (rc <= 0) {
      break;
    }
    got += static_cast<size_t>(rc);
  }
  exec_pipe.read.reset();

  int status = 0;
  struct rusage usage {};
  bool reaped = false;
  auto reap = [&](int flags) {
    while (true) {
      pid_t rc = ::wait4(pid, &status, flags, &usage);
      if (rc == pid) {
        reaped = true;
        return;
      }
      if (rc < 0 && errno == EINTR) {
        continue;
      }
      if (rc < 0) {
        reaped = true;
        status = 0;
      }
      return;
    }
  };

  if (got == sizeof(child_errno)) {
    reap(0);
    outcome.exec_errno = child_errno;
    outcome.exited = true;
    outcome.exit_code = kChildExecFailure;
    outcome.elapsed_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    return outcome;
  }

  FileDescriptor stdin_fd = std::move(in_pipe.write);
  size_t stdin_offset = 0;
  if (stdin_fd) {
    SetNonBlocking(stdin_fd.get());
    if (options.stdin_data.empty()) {
      stdin_fd.reset();
    }
  }

  std::vector<Stream> streams;
  streams.push_back({std::move(out_pipe.read), &outcome.stdout_data, &outcome.stdout_truncated,
                     options.max_capture_bytes});
  streams.push_back({std::move(err_pipe.read), &outcome.stderr_data, &outcome.stderr_truncated,
                     options.max_capture_bytes});
  if (result_pipe) {
    streams.push_back({std::move(result_pipe->read), &outcome.result_data, &outcome.result_truncated,
                       options.max_result_bytes});
  }
  for (auto& stream : streams) {
    SetNonBlocking(stream.fd.get());
  }

  while (!reaped) {
    const auto now = std::chrono::steady_clock::now();
    if (deadline && now >= *deadline) {
      outcome.timed_out = true;
      KillProcessGroup(pid);
      break;
    }

    std::vector<pollfd> fds;
    std::vector<Stream*> polled;
    for (auto& stream : streams) {
      if (stream.fd) {
        fds.push_back({stream.fd.get(), POLLIN, 0});
        polled.push_back(&stream);
      }
    }
    const bool writing = static_cast<bool>(stdin_fd);
    if (writing) {
      fds.push_back({stdin_fd.get(), POLLOUT, 0});
    }

    auto slice = kPollSlice;
    if (deadline) {
      slice = std::min(slice, std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - now) +
                                  std::chrono::milliseconds(1));
    }
    int rc = ::poll(fds.data(), fds.size(), static_cast<int>(slice.count()));
    const int poll_errno = errno;
    if (rc < 0 && poll_errno != EINTR) {
      KillProcessGroup(pid);
      reap(0);
      throw Error{ErrorDomain::IO, errors::io::kPipeFailed,
                  std::string("poll failed: ") + std::strerror(poll_errno), poll_errno};
    }
    if (rc > 0) {
      for (size_t i = 0; i < polled.size(); ++i) {
        if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL)) != 0) {
          if (!DrainReadable(*polled[i])) {
            polled[i]->fd.reset();
          }
        }
      }
      if (writing) {
        const auto& pfd = fds.back();
        if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
          stdin_fd.reset();
        } else if ((pfd.revents & POLLOUT) != 0) {
          ssize_t written = ::write(stdin_fd.get(), options.stdin_data.data() + stdin_offset,
                                    options.stdin_data.size() - stdin_offset);
          if (written > 0) {
            stdin_offset += static_cast<size_t>(written);
            if (stdin_offset >= options.stdin_data.size()) {
              stdin_fd.reset();
            }
          } else if (written < 0 && errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
            stdin_fd.reset();
          }
        }
      }
    }

    reap(WNOHANG);
    if (reaped) {
      for (auto& stream : streams) {
        if (stream.fd) {
          DrainReadable(stream);
          stream.fd.reset();
        }
      }
    }
  }

  if (outcome.timed_out) {
    // Partial output of a killed process is not reported.
    outcome.stdout_data.clear();
    outcome.stderr_data.clear();
    outcome.result_data.clear();
    for (auto& stream : streams) {
      stream.fd.reset();
    }
    stdin_fd.reset();
    if (options.on_timeout) {
      options.on_timeout();
    }
    reap(0);
  }

  outcome.elapsed_ms =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
  outcome.max_rss_mb = static_cast<double>(usage.ru_maxrss) / 1024.0;
  outcome.cpu_seconds = static_cast<double>(usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) +
                        static_cast<double>(usage.ru_utime.tv_usec + usage.ru_stime.tv_usec) / 1e6;
  if (WIFEXITED(status)) {
    outcome.exited = true;
    outcome.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    outcome.exited = false;
    outcome.term_signal = WTERMSIG(status);
  }
  return outcome;
}

}  // namespace warden::sandbox
