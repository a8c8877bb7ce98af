#include "energybench/process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <sstream>

extern char** environ;

namespace fs = std::filesystem;

namespace energybench {

namespace {

void append_limited(std::string& dst, const char* src, ssize_t n,
                    std::size_t limit, bool& truncated) {
  if (n <= 0) return;
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take = std::min<std::size_t>(static_cast<std::size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<std::size_t>(n)) truncated = true;
}

// Writes to a pipe whose reader exited must not kill the harness.
void ignore_sigpipe_once() {
  static std::once_flag flag;
  std::call_once(flag, [] {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = SIG_IGN;
    sigaction(SIGPIPE, &sa, nullptr);
  });
}

bool is_executable_file(const std::string& path) {
  struct stat st;
  if (::stat(path.c_str(), &st) != 0) return false;
  return S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

std::vector<std::string> split_path_list(const char* value) {
  std::vector<std::string> out;
  if (!value) return out;
  std::stringstream ss(value);
  std::string item;
  while (std::getline(ss, item, ':')) {
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

void close_pipe(int p[2]) {
  if (p[0] >= 0) ::close(p[0]);
  if (p[1] >= 0) ::close(p[1]);
  p[0] = p[1] = -1;
}

std::vector<std::string> build_environment(const ProcessSpec& spec) {
  std::map<std::string, std::string> merged;
  if (environ) {
    for (char** e = environ; *e; ++e) {
      const std::string kv(*e);
      const auto eq = kv.find('=');
      if (eq == std::string::npos) continue;
      merged[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
  }
  for (const auto& [k, v] : spec.env) merged[k] = v;
  std::vector<std::string> out;
  out.reserve(merged.size());
  for (const auto& [k, v] : merged) out.push_back(k + "=" + v);
  return out;
}

std::uint64_t elapsed_ns(std::chrono::steady_clock::time_point since) {
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::steady_clock::now() - since).count());
}

}  // namespace

std::optional<std::string> find_executable(const std::string& name) {
  if (name.empty()) return std::nullopt;
  if (name.find('/') != std::string::npos) {
    if (is_executable_file(name)) return name;
    return std::nullopt;
  }
  for (const auto& dir : split_path_list(std::getenv("PATH"))) {
    const std::string candidate = (fs::path(dir) / name).string();
    if (is_executable_file(candidate)) return candidate;
  }
  return std::nullopt;
}

std::optional<std::string> find_shared_library(const std::string& name) {
  std::vector<std::string> dirs = split_path_list(std::getenv("LD_LIBRARY_PATH"));
  for (const char* d : {"/usr/local/lib", "/usr/lib", "/lib", "/usr/lib64", "/lib64",
                        "/usr/lib/x86_64-linux-gnu", "/lib/x86_64-linux-gnu",
                        "/usr/lib/aarch64-linux-gnu"}) {
    dirs.emplace_back(d);
  }
  const std::string prefix = "lib" + name + ".so";
  for (const auto& dir : dirs) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) continue;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
      const std::string file = entry.path().filename().string();
      if (file.compare(0, prefix.size(), prefix) == 0) return entry.path().string();
    }
  }
  return std::nullopt;
}

ProcessResult run_process(const ProcessSpec& spec) {
  ProcessResult result;
  ignore_sigpipe_once();

  const auto resolved = find_executable(spec.command);
  if (!resolved) {
    result.exit_code = 127;
    result.error_message = "command not found: " + spec.command;
    return result;
  }

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (pipe(in_pipe) != 0 || pipe(out_pipe) != 0 || pipe(err_pipe) != 0) {
    close_pipe(in_pipe);
    close_pipe(out_pipe);
    close_pipe(err_pipe);
    result.exit_code = 127;
    result.error_message = std::string("spawn_failed: pipe: ") + std::strerror(errno);
    return result;
  }

  // Everything the child needs is prepared before fork(): only async-signal-safe
  // calls are allowed between fork() and execve().
  std::vector<std::string> all = {*resolved};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char*> argv;
  argv.reserve(all.size() + 1);
  for (auto& s : all) argv.push_back(s.data());
  argv.push_back(nullptr);

  std::vector<std::string> envs = build_environment(spec);
  std::vector<char*> envp;
  envp.reserve(envs.size() + 1);
  for (auto& e : envs) envp.push_back(e.data());
  envp.push_back(nullptr);

  const auto started = std::chrono::steady_clock::now();
  pid_t pid = fork();
  if (pid < 0) {
    close_pipe(in_pipe);
    close_pipe(out_pipe);
    close_pipe(err_pipe);
    result.exit_code = 127;
    result.error_message = std::string("spawn_failed: fork: ") + std::strerror(errno);
    return result;
  }

  if (pid == 0) {
    setsid();
    signal(SIGPIPE, SIG_DFL);
    dup2(in_pipe[0], STDIN_FILENO);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    close(in_pipe[0]);
    close(in_pipe[1]);
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);

    if (!spec.cwd.empty()) {
      if (chdir(spec.cwd.c_str()) != 0) _exit(127);
    }
    if (spec.niceness != 0 && setpriority(PRIO_PROCESS, 0, spec.niceness) != 0) {
      static const char msg[] = "energybench: cannot set niceness; running at inherited priority\n";
      const ssize_t w = write(STDERR_FILENO, msg, sizeof(msg) - 1);
      (void)w;
    }
    execve(argv[0], argv.data(), envp.data());
    _exit(127);
  }

  ::close(in_pipe[0]);
  ::close(out_pipe[1]);
  ::close(err_pipe[1]);
  int stdin_fd = in_pipe[1];
  int stdout_fd = out_pipe[0];
  int stderr_fd = err_pipe[0];
  fcntl(stdin_fd, F_SETFL, O_NONBLOCK);
  fcntl(stdout_fd, F_SETFL, O_NONBLOCK);
  fcntl(stderr_fd, F_SETFL, O_NONBLOCK);

  std::size_t stdin_written = 0;
  if (spec.stdin_text.empty()) {
    ::close(stdin_fd);
    stdin_fd = -1;
  }

  const auto deadline =
      started + std::chrono::milliseconds(std::min<std::uint64_t>(spec.timeout_ms, kMaxTimeoutMs));
  std::vector<char> buf(65536);
  int status = 0;
  bool exited = false;

  while (!exited) {
    if (stdin_fd >= 0) {
      const ssize_t n = ::write(stdin_fd, spec.stdin_text.data() + stdin_written,
                                spec.stdin_text.size() - stdin_written);
      if (n > 0) stdin_written += static_cast<std::size_t>(n);
      if ((n < 0 && errno != EAGAIN && errno != EINTR) ||
          stdin_written >= spec.stdin_text.size()) {
        ::close(stdin_fd);
        stdin_fd = -1;
      }
    }

    struct pollfd fds[2];
    nfds_t nfds = 0;
    if (stdout_fd >= 0) fds[nfds++] = {stdout_fd, POLLIN, 0};
    if (stderr_fd >= 0) fds[nfds++] = {stderr_fd, POLLIN, 0};
    if (nfds > 0) {
      ::poll(fds, nfds, 5);
    } else {
      ::usleep(2000);
    }

    if (stdout_fd >= 0) {
      const ssize_t n = ::read(stdout_fd, buf.data(), buf.size());
      if (n > 0) {
        append_limited(result.stdout_text, buf.data(), n, spec.max_output_bytes, result.stdout_truncated);
      } else if (n == 0) {
        ::close(stdout_fd);
        stdout_fd = -1;
      }
    }
    if (stderr_fd >= 0) {
      const ssize_t n = ::read(stderr_fd, buf.data(), buf.size());
      if (n > 0) {
        append_limited(result.stderr_text, buf.data(), n, spec.max_output_bytes, result.stderr_truncated);
      } else if (n == 0) {
        ::close(stderr_fd);
        stderr_fd = -1;
      }
    }

    const pid_t w = waitpid(pid, &status, WNOHANG);
    if (w == pid) {
      exited = true;
      break;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      kill(-pid, SIGKILL);
      kill(pid, SIGKILL);
      waitpid(pid, &status, 0);
      result.timed_out = true;
      exited = true;
      break;
    }
  }
  result.duration_ns = elapsed_ns(started);

  // Drain what the child left in the pipes. Grandchildren that kept the write
  // end open were killed with the group on timeout; otherwise EAGAIN ends it.
  for (int* fd : {&stdout_fd, &stderr_fd}) {
    if (*fd < 0) continue;
    const bool is_out = fd == &stdout_fd;
    while (true) {
      const ssize_t n = ::read(*fd, buf.data(), buf.size());
      if (n <= 0) break;
      if (is_out) {
        append_limited(result.stdout_text, buf.data(), n, spec.max_output_bytes, result.stdout_truncated);
      } else {
        append_limited(result.stderr_text, buf.data(), n, spec.max_output_bytes, result.stderr_truncated);
      }
    }
    ::close(*fd);
    *fd = -1;
  }
  if (stdin_fd >= 0) ::close(stdin_fd);

  if (result.timed_out) {
    result.exit_code = 124;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

}  // namespace energybench
