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
#ifndef SHELLBOX_HOST_LIBS_SANDBOX_OUTCOME_H
#define SHELLBOX_HOST_LIBS_SANDBOX_OUTCOME_H

#include <signal.h>

#include <absl/status/statusor.h>

#include "host/libs/sandbox/exec_error.h"

namespace shellbox {
namespace linux_sandbox {

enum class SandboxType {
  kNone,
  kLinuxSeccomp,
};

inline constexpr int kTimeoutExitCode = 124;
inline constexpr int kSignalExitCodeBase = 128;

/** `si_code` and `si_status` as reported by `waitid`. */
struct RawExitStatus {
  int code = CLD_EXITED;
  int status = 0;

  static RawExitStatus FromSiginfo(const siginfo_t& info);
  static RawExitStatus Exited(int exit_code);
  static RawExitStatus Killed(int signal);

  bool Signalled() const;
};

/** Maps how the process ended onto the error taxonomy.
 *
 * A non-zero exit code is not an error: a syscall refused by the seccomp
 * filter normally surfaces as EPERM inside the program, which reports it like
 * any other failure. Only a SIGSYS death under a sandbox is attributed to the
 * sandbox, since that is how the filter kills on foreign-architecture
 * syscalls. */
absl::StatusOr<ExecOutput> ClassifyOutcome(const RawExitStatus& raw,
                                           ExecOutput captured, bool timed_out,
                                           SandboxType sandbox_type);

}  // namespace linux_sandbox
}  // namespace shellbox

#endif
