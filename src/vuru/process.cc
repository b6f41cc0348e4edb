// SPDX-License-Identifier: MIT
#include "vuru/process.hh"

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"

namespace vuru {

namespace {

// Exit status used by the child when exec fails. The errno is reported
// separately over a close-on-exec pipe, so a program which itself exits with
// this value is not mistaken for a missing one.
constexpr int kExecFailed = 127;

absl::Status ReadAll(int fd, std::string* out) {
  char buf[4096];
  for (;;) {
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n == 0) {
      return absl::OkStatus();
    }
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return absl::InternalError(
          absl::StrCat("failed to read child output: ", strerror(errno)));
    }
    out->append(buf, n);
  }
}

absl::StatusOr<int> WaitForChild(pid_t pid, const std::string& name) {
  int wstatus;
  while (waitpid(pid, &wstatus, 0) < 0) {
    if (errno != EINTR) {
      return absl::InternalError(
          absl::StrCat("failed to wait for ", name, ": ", strerror(errno)));
    }
  }

  if (WIFSIGNALED(wstatus)) {
    return absl::InternalError(absl::StrCat(name, " terminated by signal ",
                                            WTERMSIG(wstatus)));
  }

  return WEXITSTATUS(wstatus);
}

}  // namespace

absl::StatusOr<int> RunProcess(const std::vector<std::string>& argv,
                               std::string* output) {
  if (argv.empty()) {
    return absl::InvalidArgumentError("empty command line");
  }
  const std::string& name = argv[0];

  int errpipe[2];
  if (pipe2(errpipe, O_CLOEXEC) < 0) {
    return absl::InternalError(
        absl::StrCat("failed to create pipe: ", strerror(errno)));
  }

  int outpipe[2] = {-1, -1};
  if (output != nullptr && pipe2(outpipe, O_CLOEXEC) < 0) {
    int saved_errno = errno;
    close(errpipe[0]);
    close(errpipe[1]);
    return absl::InternalError(
        absl::StrCat("failed to create pipe: ", strerror(saved_errno)));
  }

  std::vector<const char*> cmd;
  cmd.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    cmd.push_back(arg.c_str());
  }
  cmd.push_back(nullptr);

  // Whatever we printed so far has to appear before the child's output.
  fflush(nullptr);

  pid_t pid = fork();
  if (pid < 0) {
    int saved_errno = errno;
    close(errpipe[0]);
    close(errpipe[1]);
    if (output != nullptr) {
      close(outpipe[0]);
      close(outpipe[1]);
    }
    return absl::InternalError(absl::StrCat(
        "failed to fork new process for ", name, ": ", strerror(saved_errno)));
  }

  if (pid == 0) {
    if (output != nullptr) {
      dup2(outpipe[1], STDOUT_FILENO);
    }

    execvp(cmd[0], const_cast<char* const*>(cmd.data()));

    int exec_errno = errno;
    (void)!write(errpipe[1], &exec_errno, sizeof(exec_errno));
    _exit(kExecFailed);
  }

  close(errpipe[1]);

  absl::Status read_status;
  if (output != nullptr) {
    close(outpipe[1]);
    read_status = ReadAll(outpipe[0], output);
    close(outpipe[0]);
  }

  int exec_errno = 0;
  ssize_t n;
  do {
    n = read(errpipe[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  close(errpipe[0]);

  auto exit_status = WaitForChild(pid, name);

  if (n == sizeof(exec_errno)) {
    return absl::NotFoundError(
        absl::StrCat("failed to execute ", name, ": ", strerror(exec_errno)));
  }

  if (!read_status.ok()) {
    return read_status;
  }

  return exit_status;
}

absl::StatusOr<int> RunProcess(const std::vector<std::string>& argv) {
  return RunProcess(argv, nullptr);
}

}  // namespace vuru
