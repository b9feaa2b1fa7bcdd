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
#ifndef SHELLBOX_HOST_LIBS_SANDBOX_EXECUTOR_H
#define SHELLBOX_HOST_LIBS_SANDBOX_EXECUTOR_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/time/time.h>

#include "host/libs/sandbox/exec_error.h"
#include "host/libs/sandbox/outcome.h"
#include "host/libs/sandbox/policy.h"
#include "host/libs/sandbox/unique_fd.h"

namespace shellbox {
namespace linux_sandbox {

/** Upper bound on reading leftover output once the command has exited, for
 * descendants that escaped the process group and still hold the pipes. */
inline constexpr absl::Duration kIoDrainTimeout = absl::Seconds(2);

inline constexpr std::size_t kDefaultMaxOutputBytes = 1024 * 1024;

/** Set to "1" in the environment of commands that may not use the network. */
inline constexpr char kNetworkDisabledEnvVar[] =
    "SHELLBOX_SANDBOX_NETWORK_DISABLED";

struct ExecParams {
  std::vector<std::string> command;
  std::string cwd;
  std::optional<std::uint64_t> timeout_ms;
  /** Complete environment of the command. */
  std::map<std::string, std::string> env;
  std::optional<bool> with_escalated_permissions;
  std::optional<std::string> justification;
  /** Per stream; anything beyond is dropped and replaced by a marker. */
  std::size_t max_output_bytes = kDefaultMaxOutputBytes;
};

/** The calling process's environment, in the form `ExecParams::env` takes. */
std::map<std::string, std::string> CurrentEnvironment();

/** Lets another thread cancel a running `ProcessExecToolCall`. */
class ExecControl {
 public:
  static absl::StatusOr<ExecControl> Create();

  /** Kills the command tree like a timeout would. A call made before the
   * command starts cancels it as soon as it does. Each request is consumed by
   * the `ProcessExecToolCall` it stops, so later calls run normally. */
  absl::Status Cancel() const;

  int Fd() const { return event_fd_.Get(); }

 private:
  explicit ExecControl(UniqueFd event_fd);

  UniqueFd event_fd_;
};

/** Runs `params.command` once and reports how it ended.
 *
 * With `SandboxType::kLinuxSeccomp` the command is started through the helper
 * at `linux_sandbox_exe` (by default next to the running executable), which
 * confines itself to `policy`, resolved against `sandbox_cwd`, before exec'ing
 * the command. With `SandboxType::kNone` the command runs unconfined.
 *
 * A non-zero exit is an `ExecOutput`, not an error. Errors carry a
 * `SandboxErrorKind`, see exec_error.h. */
absl::StatusOr<ExecOutput> ProcessExecToolCall(
    ExecParams params, SandboxType sandbox_type, const SandboxPolicy& policy,
    std::string_view sandbox_cwd, std::optional<std::string> linux_sandbox_exe,
    const ExecControl* control = nullptr);

/** Decodes `bytes` as UTF-8, replacing each maximal invalid subsequence with
 * U+FFFD. */
std::string DecodeUtf8Lossy(std::string_view bytes);

}  // namespace linux_sandbox
}  // namespace shellbox

#endif
