#include "sandbox/unix.hpp"

#include <fcntl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <climits>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <thread>

#include <kj/debug.h>

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

std::string ErrnoMessage(const char* prefix, int err) {
  char buf[1024] = {};
  return std::string(prefix) + ": " + mystrerror(err, buf, sizeof(buf));
}

const constexpr char* kDevNull = "/dev/null";
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;

bool Unix::ExecuteInternal(const ExecutionOptions& options, ExecutionInfo* info,
                           std::string* error_msg) {
  options_ = &options;
  if (!Setup(error_msg)) return false;
  if (!DoFork(error_msg)) return false;
  if (!Wait(info, error_msg)) return false;
  return true;
}

bool Unix::Setup(std::string* error_msg) {
  arg_storage_.clear();
  argv_.clear();
  auto add_arg = [this](const std::string& arg) {
    arg_storage_.emplace_back(arg.begin(), arg.end());
    arg_storage_.back().push_back('\0');
  };
  add_arg(options_->executable);
  for (const std::string& arg : options_->args) add_arg(arg);
  for (std::vector<char>& arg : arg_storage_) argv_.push_back(arg.data());
  argv_.push_back(nullptr);

  if (pipe2(pipe_fds_, O_CLOEXEC) == -1) {  // NOLINT
    *error_msg = ErrnoMessage("pipe2", errno);
    return false;
  }
  return true;
}

bool Unix::DoFork(std::string* error_msg) {
  pid_t fork_result = fork();
  if (fork_result == -1) {
    *error_msg = ErrnoMessage("fork", errno);
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
    return false;
  }
  if (fork_result != 0) {
    child_pid_ = fork_result;
    return true;
  }
  Child();
}

void Unix::Child() {
  close(pipe_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 3 + 1] = {};
    strncat(buf, prefix, 64);             // NOLINT
    strncat(buf, ": ", 3);                // NOLINT
    strncat(buf, err, kStrErrorBufSize);  // NOLINT
    ssize_t len = strlen(buf);            // NOLINT
    // Nothing sensible can be done if the parent cannot be notified.
    if (write(pipe_fds_[1], &len, sizeof(len)) == sizeof(len)) {
      (void)!write(pipe_fds_[1], buf, len);
    }
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));  // NOLINT
  };

  // Run in a new session, so that we do not receive Ctrl-Cs in the terminal
  // and the whole process group can be killed at once.
  if (setsid() == -1) die("setsid", errno);

  auto file_or_null = [](const std::string& file) {
    return file.empty() ? kDevNull : file.c_str();
  };
  int stdin_fd = open(file_or_null(options_->stdin_file), O_RDONLY | O_CLOEXEC);
  if (stdin_fd == -1) die("open", errno);
  int stdout_fd =
      open(file_or_null(options_->stdout_file),
           O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
  if (stdout_fd == -1) die("open", errno);
  int stderr_fd =
      open(file_or_null(options_->stderr_file),
           O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
  if (stderr_fd == -1) die("open", errno);

  if (chdir(options_->root.c_str()) == -1) {
    die("chdir", errno);
  }

  // Handle I/O redirection.
#define DUP(field, fd)                                      \
  if (field##_fd == fd) {                                   \
    if (fcntl(fd, F_SETFD, 0) == -1) die("fcntl", errno);   \
  } else if (dup2(field##_fd, fd) == -1) {                  \
    die("redir " #field, errno);                            \
  }
  DUP(stdin, STDIN_FILENO);
  DUP(stdout, STDOUT_FILENO);
  DUP(stderr, STDERR_FILENO);
#undef DUP

  // Set resource limits.
  struct rlimit rlim {};
#define SET_RLIM(res, value)                    \
  {                                             \
    rlim_t lim = value;                         \
    if (lim) {                                  \
      rlim.rlim_cur = lim;                      \
      rlim.rlim_max = lim;                      \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        die("setrlim " #res, errno);            \
      }                                         \
    }                                           \
  }

  SET_RLIM(AS, options_->memory_limit_kb * 1024);
  SET_RLIM(CPU, (options_->cpu_limit_millis + 999) / 1000);
  SET_RLIM(FSIZE, options_->max_file_size_kb * 1024);
  SET_RLIM(NOFILE, options_->max_files);
  SET_RLIM(NPROC, options_->max_procs);
#undef SET_RLIM
  rlim.rlim_cur = rlim.rlim_max = 0;
  if (setrlimit(RLIMIT_CORE, &rlim) < 0) die("setrlim CORE", errno);

  execv(options_->executable.c_str(), argv_.data());
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  close(pipe_fds_[1]);
  ssize_t error_len = 0;
  if (read(pipe_fds_[0], &error_len, sizeof(error_len)) == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    ssize_t to_read = std::min<ssize_t>(error_len, PIPE_BUF - 1);
    if (read(pipe_fds_[0], error, to_read) == -1) {
      *error_msg = ErrnoMessage("read", errno);
    } else {
      *error_msg = error;
    }
    close(pipe_fds_[0]);
    // The child exits right after reporting the error.
    waitpid(child_pid_, nullptr, 0);
    return false;
  }
  close(pipe_fds_[0]);

  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  int child_status = 0;
  bool has_exited = false;
  struct rusage rusage {};
  while (!options_->wall_limit_millis ||
         elapsed_millis() < options_->wall_limit_millis) {
    pid_t ret = wait4(child_pid_, &child_status, WNOHANG, &rusage);
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1) {
      *error_msg = ErrnoMessage("wait4", errno);
      kill(-child_pid_, SIGKILL);
      waitpid(child_pid_, nullptr, 0);
      return false;
    }
    if (ret == child_pid_) {
      has_exited = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  if (!has_exited) {
    info->wall_limit_exceeded = true;
    // Kill the whole session: the child is its leader.
    if (kill(-child_pid_, SIGKILL) == -1 && kill(child_pid_, SIGKILL) == -1) {
      *error_msg = ErrnoMessage("kill", errno);
      return false;
    }
    pid_t ret = 0;
    do {
      ret = wait4(child_pid_, &child_status, 0, &rusage);
    } while (ret == -1 && errno == EINTR);
    if (ret != child_pid_) {
      *error_msg = ErrnoMessage("wait4", errno);
      return false;
    }
  } else {
    // Processes started by the child may still be running in its session.
    // ESRCH is the usual result.
    kill(-child_pid_, SIGKILL);
  }
  info->memory_usage_kb = rusage.ru_maxrss;
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  // If the child received a KILL or XCPU signal, assume we killed it
  // because of memory or time limits.
  info->killed = info->signal == SIGKILL || info->signal == SIGXCPU;
  info->wall_time_millis = elapsed_millis();
  info->cpu_time_millis =
      rusage.ru_utime.tv_sec * 1000LL + rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis =
      rusage.ru_stime.tv_sec * 1000LL + rusage.ru_stime.tv_usec / 1000;
  if (info->wall_limit_exceeded) {
    info->message = "Wall time limit exceeded";
  } else if (info->signal != 0) {
    info->message = strsignal(info->signal);
  } else if (info->status_code != 0) {
    info->message = "Non-zero return code";
  }
  return true;
}

namespace {
Sandbox::Register<Unix> r;  // NOLINT
}  // namespace

}  // namespace sandbox
