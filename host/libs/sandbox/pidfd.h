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
#ifndef SHELLBOX_HOST_LIBS_SANDBOX_PIDFD_H
#define SHELLBOX_HOST_LIBS_SANDBOX_PIDFD_H

#include <signal.h>
#include <sys/types.h>

#include <string>
#include <utility>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/types/span.h>

#include "host/libs/sandbox/unique_fd.h"

namespace shellbox {
namespace linux_sandbox {

/* Owns a pidfd for one process, normally the command tree's leader. */
class PidFd {
 public:
  /** Opens a pidfd for `pid`. The caller must know `pid` has not been reaped
   * yet, or the pidfd may name a recycled pid. */
  static absl::StatusOr<PidFd> FromRunningProcess(pid_t pid);

  /** Starts `argv[0]` (an absolute path) in `cwd` as the leader of a new
   * process group.
   *
   * The child gets exactly the descriptors in `fds`, each at the number paired
   * with it. Returns an error without leaving a process behind when the child
   * could not reach `execve`. */
  static absl::StatusOr<PidFd> LaunchSubprocess(
      absl::Span<const std::string> argv,
      std::vector<std::pair<UniqueFd, int>> fds,
      absl::Span<const std::string> env, const std::string& cwd);

  int Get() const;
  pid_t Pid() const;

  /** SIGKILLs the process and every descendant still attached to it, stopping
   * each one before walking its children. */
  absl::Status HaltHierarchy();
  /** Like `HaltHierarchy` but leaves the process itself alone, so it must
   * already be stopped or otherwise unable to fork or reap. */
  absl::Status HaltChildHierarchy();

  /** Reaps the process, which must be a child of the caller. */
  absl::StatusOr<siginfo_t> Wait();

 private:
  PidFd(UniqueFd fd, pid_t pid);
  absl::Status SendSignal(int signal);

  UniqueFd fd_;
  pid_t pid_;
};

}  // namespace linux_sandbox
}  // namespace shellbox

#endif
