/*
 * Copyright (C) 2024 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#include "host/libs/sandbox/pidfd.h"

#include <dirent.h>
#include <fcntl.h>
#include <linux/sched.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>
#include <absl/types/span.h>

#include "host/libs/sandbox/unique_fd.h"

namespace shellbox::linux_sandbox {
namespace {

/* Written by the child to the report pipe when it fails before `execve`. */
struct ChildFailure {
  int step;
  int error;
};

enum ChildStep : int {
  kSetpgid,
  kPdeathsig,
  kDupFd,
  kCloseRange,
  kChdir,
  kExecve,
};

std::string_view ChildStepName(int step) {
  switch (step) {
    case kSetpgid:
      return "setpgid";
    case kPdeathsig:
      return "prctl(PR_SET_PDEATHSIG)";
    case kDupFd:
      return "dup2";
    case kCloseRange:
      return "close_range";
    case kChdir:
      return "chdir";
    case kExecve:
      return "execve";
  }
  return "unknown step";
}

/* Only async-signal-safe calls from here on, the parent may have threads. */
[[noreturn]] void ChildFail(int report_fd, ChildStep step) {
  ChildFailure failure = {.step = step, .error = errno};
  ssize_t written = write(report_fd, &failure, sizeof(failure));
  _exit(written == sizeof(failure) ? 127 : 126);
}

bool IsTarget(const std::vector<std::pair<int, int>>& mapping, int fd) {
  for (const auto& [backup, target] : mapping) {
    if (target == fd) {
      return true;
    }
  }
  return false;
}

/* Appends the pids listed in one `/proc/<pid>/task/<tid>/children` file. */
absl::Status AppendThreadChildren(const std::string& children_path,
                                  std::vector<pid_t>& pids) {
  std::ifstream children(children_path);
  if (!children) {
    return absl::InternalError(absl::StrCat("Can't read ", children_path));
  }
  pid_t child;
  while (children >> child) {
    pids.push_back(child);
  }
  if (!children.eof()) {
    return absl::InternalError(
        absl::StrCat("Malformed pid list in ", children_path));
  }
  return absl::OkStatus();
}

/* Direct children of every thread of `pid`. Only complete while `pid` neither
 * forks nor reaps, which holds once it is stopped. */
absl::StatusOr<std::vector<pid_t>> ChildPids(pid_t pid) {
  using DirPtr = std::unique_ptr<DIR, decltype(&closedir)>;

  std::vector<pid_t> pids;
  const std::string tasks = absl::StrCat("/proc/", pid, "/task");
  DirPtr dir(opendir(tasks.c_str()), &closedir);
  if (!dir) {
    if (errno == ENOENT) {
      return pids;  // Already reaped
    }
    return absl::ErrnoToStatus(errno,
                               absl::StrCat("`opendir(", tasks, ")` failed"));
  }
  for (dirent* task = readdir(dir.get()); task; task = readdir(dir.get())) {
    if (task->d_name[0] == '.') {
      continue;
    }
    std::string children_path =
        absl::StrCat(tasks, "/", task->d_name, "/children");
    if (absl::Status status = AppendThreadChildren(children_path, pids);
        !status.ok()) {
      return status;
    }
  }
  return pids;
}

/* Null terminated pointers into `strings`, which must outlive the result. */
std::vector<char*> CStringArray(std::vector<std::string>& strings) {
  std::vector<char*> pointers;
  pointers.reserve(strings.size() + 1);
  for (std::string& value : strings) {
    pointers.push_back(value.data());
  }
  pointers.push_back(nullptr);
  return pointers;
}

}  // namespace

absl::StatusOr<PidFd> PidFd::FromRunningProcess(pid_t pid) {
  int fd = syscall(SYS_pidfd_open, pid, 0);
  if (fd < 0) {
    return absl::ErrnoToStatus(errno,
                               absl::StrCat("`pidfd_open(", pid, ")` failed"));
  }
  return PidFd(UniqueFd(fd), pid);  // pidfds are always close-on-exec
}

absl::StatusOr<PidFd> PidFd::LaunchSubprocess(
    absl::Span<const std::string> argv,
    std::vector<std::pair<UniqueFd, int>> fds,
    absl::Span<const std::string> env, const std::string& cwd) {
  if (argv.empty()) {
    return absl::InvalidArgumentError("Empty argv");
  }
  std::string argv_str = absl::StrJoin(argv, "','");

  // Everything the child touches is allocated up front.
  std::vector<std::string> argv_storage(argv.begin(), argv.end());
  std::vector<char*> argv_cstr = CStringArray(argv_storage);
  std::vector<std::string> env_storage(env.begin(), env.end());
  std::vector<char*> env_cstr = CStringArray(env_storage);

  /* Sources are moved above every target number first, so a source that is
   * also some other entry's target is not clobbered by `dup2`. */
  int first_free_fd = 0;
  std::vector<std::pair<int, int>> backup_mapping;
  for (const auto& [source, target] : fds) {
    backup_mapping.emplace_back(source.Get(), target);
    first_free_fd = std::max(first_free_fd, target + 1);
  }

  absl::StatusOr<std::pair<UniqueFd, UniqueFd>> report = UniqueFd::Pipe();
  if (!report.ok()) {
    return report.status();
  }
  auto& [report_read, report_write] = *report;

  pid_t parent_pid = getpid();
  int pidfd = -1;
  clone_args args{
      .flags = CLONE_PIDFD,
      .pidfd = reinterpret_cast<std::uintptr_t>(&pidfd),
      .exit_signal = SIGCHLD,
  };

  pid_t pid = syscall(SYS_clone3, &args, sizeof(args));
  if (pid < 0) {
    auto error = absl::StrCat("`clone3` failed for ['", argv_str, "']");
    return absl::ErrnoToStatus(errno, error);
  } else if (pid > 0) {
    PidFd child(UniqueFd(pidfd), pid);
    report_write.Reset(-1);

    ChildFailure failure;
    ssize_t read_size;
    do {
      read_size = read(report_read.Get(), &failure, sizeof(failure));
    } while (read_size < 0 && errno == EINTR);
    if (read_size < 0) {
      return absl::ErrnoToStatus(errno, "`read` from child report failed");
    } else if (read_size == sizeof(failure)) {
      if (absl::StatusOr<siginfo_t> reaped = child.Wait(); !reaped.ok()) {
        LOG(ERROR) << "Failed to reap " << pid << ": " << reaped.status();
      }
      auto error = absl::StrFormat("`%s` failed in child: argv=['%s']",
                                   ChildStepName(failure.step), argv_str);
      return absl::ErrnoToStatus(failure.error, error);
    }
    VLOG(1) << pid << ": Running ['" << argv_str << "'] in '" << cwd << "'";
    return child;
  }

  int report_fd = report_write.Get();
  if (setpgid(0, 0) < 0) {
    ChildFail(report_fd, kSetpgid);
  }
  if (prctl(PR_SET_PDEATHSIG, SIGKILL) < 0) {  // Die when parent dies
    ChildFail(report_fd, kPdeathsig);
  }
  if (getppid() != parent_pid) {
    _exit(127);  // Parent died before `PR_SET_PDEATHSIG`
  }

  report_fd = fcntl(report_fd, F_DUPFD_CLOEXEC, first_free_fd);
  if (report_fd < 0) {
    ChildFail(report_write.Get(), kDupFd);
  }
  for (auto& [source, target] : backup_mapping) {
    source = fcntl(source, F_DUPFD_CLOEXEC, first_free_fd);
    if (source < 0) {
      ChildFail(report_fd, kDupFd);
    }
  }
  for (const auto& [backup, target] : backup_mapping) {
    if (dup2(backup, target) < 0) {  // Clears FD_CLOEXEC on `target`
      ChildFail(report_fd, kDupFd);
    }
  }
  for (int fd = 0; fd < first_free_fd; fd++) {
    if (!IsTarget(backup_mapping, fd)) {
      close(fd);
    }
  }
  // Leaves the report pipe open until `execve` succeeds.
  if (close_range(first_free_fd, ~0U, CLOSE_RANGE_CLOEXEC) < 0) {
    ChildFail(report_fd, kCloseRange);
  }

  sigset_t empty_set;
  sigemptyset(&empty_set);
  sigprocmask(SIG_SETMASK, &empty_set, nullptr);
  for (int sig = 1; sig < NSIG; sig++) {
    if (sig != SIGKILL && sig != SIGSTOP) {
      signal(sig, SIG_DFL);
    }
  }

  if (chdir(cwd.c_str()) < 0) {
    ChildFail(report_fd, kChdir);
  }

  execve(argv_cstr[0], argv_cstr.data(), env_cstr.data());

  ChildFail(report_fd, kExecve);
}

PidFd::PidFd(UniqueFd fd, pid_t pid) : fd_(std::move(fd)), pid_(pid) {}

int PidFd::Get() const { return fd_.Get(); }

pid_t PidFd::Pid() const { return pid_; }

absl::Status PidFd::HaltHierarchy() {
  // Stopped first, so the process cannot fork or reap while its descendants
  // are collected.
  absl::Status status = SendSignal(SIGSTOP);
  if (status.ok()) {
    status = HaltChildHierarchy();
  }
  if (status.ok()) {
    status = SendSignal(SIGKILL);
  }
  return status;
}

absl::Status PidFd::HaltChildHierarchy() {
  absl::StatusOr<std::vector<pid_t>> children = ChildPids(pid_);
  if (!children.ok()) {
    return children.status();
  }
  for (pid_t child_pid : *children) {
    absl::StatusOr<PidFd> child = FromRunningProcess(child_pid);
    if (absl::IsNotFound(child.status())) {
      continue;  // Exited and reaped in the meantime
    } else if (!child.ok()) {
      return child.status();
    }
    if (absl::Status halt = child->HaltHierarchy(); !halt.ok()) {
      return halt;
    }
  }
  return absl::OkStatus();
}

absl::StatusOr<siginfo_t> PidFd::Wait() {
  siginfo_t info = {};
  int res;
  do {
    res = waitid(P_PIDFD, fd_.Get(), &info, WEXITED);
  } while (res < 0 && errno == EINTR);
  if (res < 0) {
    return absl::ErrnoToStatus(errno, absl::StrCat("`waitid` failed: ", pid_));
  }
  return info;
}

absl::Status PidFd::SendSignal(int signal) {
  if (syscall(SYS_pidfd_send_signal, fd_.Get(), signal, nullptr, 0) == 0 ||
      errno == ESRCH) {  // ESRCH: already exited
    return absl::OkStatus();
  }
  return absl::ErrnoToStatus(
      errno, absl::StrCat("`pidfd_send_signal(", pid_, ", ", signal, ")`"));
}

}  // namespace shellbox::linux_sandbox
