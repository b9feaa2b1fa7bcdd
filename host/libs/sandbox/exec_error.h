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
#ifndef SHELLBOX_HOST_LIBS_SANDBOX_EXEC_ERROR_H
#define SHELLBOX_HOST_LIBS_SANDBOX_EXEC_ERROR_H

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/time/time.h>

namespace shellbox {
namespace linux_sandbox {

/** Result of a command that ran to completion, whatever its exit code. */
struct ExecOutput {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  absl::Duration duration;
  bool timed_out = false;

  bool operator==(const ExecOutput&) const = default;
};

std::ostream& operator<<(std::ostream& out, const ExecOutput& output);

enum class SandboxErrorKind {
  /** Not produced by the sandbox executor. */
  kOther,
  /** Positively attributable sandbox violation. */
  kDenied,
  /** The deadline elapsed and the process tree was killed. */
  kTimeout,
  /** The caller cancelled and the process tree was killed. */
  kCancelled,
  /** Helper missing or kernel facility unavailable. Nothing ran unconfined. */
  kSetupFailure,
};

std::string_view ErrorKindName(SandboxErrorKind kind);

absl::Status DeniedError(ExecOutput output);
absl::Status TimeoutError(ExecOutput output);
absl::Status CancelledError(ExecOutput output);
absl::Status SetupFailureError(std::string_view message);
/** Re-tags `cause` as a setup failure, keeping its message. */
absl::Status SetupFailureError(const absl::Status& cause);

SandboxErrorKind ErrorKindOf(const absl::Status& status);

/** Output captured before a kDenied, kTimeout or kCancelled error. */
std::optional<ExecOutput> CapturedOutput(const absl::Status& status);

}  // namespace linux_sandbox
}  // namespace shellbox

#endif
