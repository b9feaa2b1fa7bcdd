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
#include "host/libs/sandbox/outcome.h"

#include <signal.h>

#include <utility>

#include <absl/log/log.h>
#include <absl/status/statusor.h>

#include "host/libs/sandbox/exec_error.h"

namespace shellbox {
namespace linux_sandbox {

RawExitStatus RawExitStatus::FromSiginfo(const siginfo_t& info) {
  return RawExitStatus{.code = info.si_code, .status = info.si_status};
}

RawExitStatus RawExitStatus::Exited(int exit_code) {
  return RawExitStatus{.code = CLD_EXITED, .status = exit_code};
}

RawExitStatus RawExitStatus::Killed(int signal) {
  return RawExitStatus{.code = CLD_KILLED, .status = signal};
}

bool RawExitStatus::Signalled() const {
  return code == CLD_KILLED || code == CLD_DUMPED;
}

absl::StatusOr<ExecOutput> ClassifyOutcome(const RawExitStatus& raw,
                                           ExecOutput captured, bool timed_out,
                                           SandboxType sandbox_type) {
  if (timed_out) {
    captured.exit_code = kTimeoutExitCode;
    captured.timed_out = true;
    return TimeoutError(std::move(captured));
  }

  if (raw.Signalled()) {
    captured.exit_code = kSignalExitCodeBase + raw.status;
    if (raw.status == SIGSYS && sandbox_type != SandboxType::kNone) {
      return DeniedError(std::move(captured));
    }
    return captured;
  }
  if (raw.code != CLD_EXITED) {
    LOG(ERROR) << "Unexpected si_code: " << raw.code;
    captured.exit_code = -1;
    return captured;
  }
  captured.exit_code = raw.status;
  return captured;
}

}  // namespace linux_sandbox
}  // namespace shellbox
