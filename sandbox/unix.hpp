#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP
#include <sys/types.h>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Sandbox for UNIX-like systems: runs the command in a new session with
// resource limits set by setrlimit, and kills the whole session when the wall
// time limit is exceeded.
class Unix : public Sandbox {
 public:
  static Sandbox* Create() { return new Unix(); }
  static int Score() { return 2; }

 protected:
  Unix() = default;

  bool ExecuteInternal(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) override;

  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Creates a child process and saves its PID in child_pid_. The child process
  // executes Child and does not return.
  bool DoFork(std::string* error_msg);

  // Function that is executed in the child process.
  [[noreturn]] void Child();

  // Waits for the termination of the child, possibly killing it if it exceeds
  // the provided wall time limit. Processes left behind in the child's session
  // are killed in any case.
  bool Wait(ExecutionInfo* info, std::string* error_msg);

  int pipe_fds_[2] = {-1, -1};
  pid_t child_pid_ = 0;
  const ExecutionOptions* options_ = nullptr;
  // Prepared before fork, so that the child does not need to allocate.
  std::vector<std::vector<char>> arg_storage_;
  std::vector<char*> argv_;
};

}  // namespace sandbox
#endif
